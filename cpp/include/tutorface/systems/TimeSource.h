// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "robotick/framework/time/Clock.h"

namespace tutorface
{
	/**
	 * @brief Monotonic millisecond clock shared by every windowed behaviour
	 * (cooldowns, repetition guards, expression memory, metric sampling, phoneme replay).
	 */
	class ITimeSource
	{
	  public:
		virtual ~ITimeSource() = default;
		virtual double now_ms() const = 0;
	};

	// Wall clock backed by the framework Clock. Zero is the moment of construction.
	class SteadyTimeSource : public ITimeSource
	{
	  public:
		SteadyTimeSource()
			: start_time(robotick::Clock::now())
		{
		}

		double now_ms() const override
		{
			const auto elapsed = robotick::Clock::now() - start_time;
			return static_cast<double>(robotick::Clock::to_nanoseconds(elapsed).count()) * 1e-6;
		}

	  private:
		decltype(robotick::Clock::now()) start_time;
	};

	// Externally driven clock: workloads feed it from TickInfo, tests step it by hand.
	class ManualTimeSource : public ITimeSource
	{
	  public:
		explicit ManualTimeSource(double start_ms = 0.0)
			: current_ms(start_ms)
		{
		}

		double now_ms() const override { return current_ms; }

		void set_now_ms(double value_ms)
		{
			// never step backwards; windows assume a monotonic clock
			if (value_ms > current_ms)
			{
				current_ms = value_ms;
			}
		}

		void advance_ms(double delta_ms)
		{
			if (delta_ms > 0.0)
			{
				current_ms += delta_ms;
			}
		}

	  private:
		double current_ms = 0.0;
	};

} // namespace tutorface
