// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "tutorface/systems/expressions/ExpressionTypes.h"

namespace tutorface
{
	// Input is clamped to [0, 1]. Bounce and elastic may overshoot 1 mid-curve but end at exactly 1.
	float apply_easing(EasingFunction easing, float t);

	float ease_bounce(float t);	 // n1 = 7.5625, d1 = 2.75
	float ease_elastic(float t); // period c4 = 2*pi/3

	inline float lerp(float a, float b, float t)
	{
		return a + (b - a) * t;
	}

} // namespace tutorface
