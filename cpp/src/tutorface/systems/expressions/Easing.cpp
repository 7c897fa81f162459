// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#include "tutorface/systems/expressions/Easing.h"

#include "robotick/api.h"

#include <cmath>

namespace tutorface
{
	float ease_bounce(float t)
	{
		constexpr float n1 = 7.5625f;
		constexpr float d1 = 2.75f;

		if (t < 1.0f / d1)
		{
			return n1 * t * t;
		}
		if (t < 2.0f / d1)
		{
			t -= 1.5f / d1;
			return n1 * t * t + 0.75f;
		}
		if (t < 2.5f / d1)
		{
			t -= 2.25f / d1;
			return n1 * t * t + 0.9375f;
		}
		t -= 2.625f / d1;
		return n1 * t * t + 0.984375f;
	}

	float ease_elastic(float t)
	{
		if (t <= 0.0f)
		{
			return 0.0f;
		}
		if (t >= 1.0f)
		{
			return 1.0f;
		}

		const float two_pi = 6.28318530717958647692f;
		const float c4 = two_pi / 3.0f;
		return std::pow(2.0f, -10.0f * t) * std::sin((t * 10.0f - 0.75f) * c4) + 1.0f;
	}

	float apply_easing(EasingFunction easing, float t)
	{
		t = robotick::clamp(t, 0.0f, 1.0f);

		switch (easing)
		{
		case EasingFunction::Linear:
			return t;
		case EasingFunction::EaseIn:
			return t * t;
		case EasingFunction::EaseOut:
			return 1.0f - (1.0f - t) * (1.0f - t);
		case EasingFunction::EaseInOut:
		{
			if (t < 0.5f)
			{
				return 2.0f * t * t;
			}
			const float u = -2.0f * t + 2.0f;
			return 1.0f - (u * u) / 2.0f;
		}
		case EasingFunction::Bounce:
			return ease_bounce(t);
		case EasingFunction::Elastic:
			return ease_elastic(t);
		}
		return t;
	}

} // namespace tutorface
