// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "robotick/framework/containers/FixedVector.h"

#include <cstdint>

namespace tutorface
{
	/**
	 * @brief AudioBuffer4096 holds one analysis frame of mono float samples.
	 * Lip-sync frames default to 1024 samples; the extra room allows larger frame sizes.
	 */
	using AudioBuffer4096 = robotick::FixedVector<float, 4096>;

	struct AudioFrame
	{
		AudioBuffer4096 samples;
		double timestamp = 0.0; // seconds
		uint32_t sample_rate = 48000;
	};

} // namespace tutorface
