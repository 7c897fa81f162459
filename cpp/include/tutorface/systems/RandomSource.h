// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <random>

namespace tutorface
{
	class IRandomSource
	{
	  public:
		virtual ~IRandomSource() = default;

		// Uniform value in [0, 1).
		virtual float next_unit() = 0;
	};

	class DefaultRandomSource : public IRandomSource
	{
	  public:
		explicit DefaultRandomSource(uint32_t seed = std::mt19937::default_seed)
			: engine(seed)
		{
		}

		float next_unit() override { return distribution(engine); }

	  private:
		std::mt19937 engine;
		std::uniform_real_distribution<float> distribution{0.0f, 1.0f};
	};

} // namespace tutorface
