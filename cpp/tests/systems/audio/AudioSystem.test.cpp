// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#include "tutorface/systems/audio/AudioSystem.h"

#include <catch2/catch_all.hpp>

namespace tutorface::test
{
	TEST_CASE("Unit/Systems/Audio/AudioSystem")
	{
		SECTION("Drop stats convert dropped bytes to milliseconds of speech")
		{
			AudioSystem::reset_backpressure_stats();
			AudioSystem::set_output_spec_for_test(48000, 2);

			// 20ms of stereo speech, then 5ms more
			AudioSystem::record_drop_for_test(960 * 2 * sizeof(float));
			AudioSystem::record_drop_for_test(240 * 2 * sizeof(float));

			const AudioBackpressureStats stats = AudioSystem::get_backpressure_stats();
			CHECK(stats.drop_events == 2);
			CHECK(stats.dropped_ms == Catch::Approx(25.0f).margin(0.01f));

			AudioSystem::reset_backpressure_stats();
			CHECK(AudioSystem::get_backpressure_stats().drop_events == 0);
			CHECK(AudioSystem::get_backpressure_stats().dropped_ms == 0.0f);
		}

		SECTION("Writes without an open device are rejected")
		{
			AudioSystem::shutdown();
			REQUIRE_FALSE(AudioSystem::is_initialized());

			const float voice[3] = {0.25f, -0.25f, 0.1f};
			CHECK(AudioSystem::write(voice, 3) == AudioQueueResult::Error);
			CHECK(AudioSystem::write(nullptr, 0) == AudioQueueResult::Error);
			CHECK(AudioSystem::get_queued_ms() == 0.0f);
			CHECK(AudioSystem::get_sample_rate() == 0);
		}

		SECTION("Backpressure strategy can be switched")
		{
			AudioSystem::set_backpressure_strategy(AudioBackpressureStrategy::DropOldest);
			CHECK(AudioSystem::get_backpressure_strategy() == AudioBackpressureStrategy::DropOldest);

			AudioSystem::set_backpressure_strategy(AudioBackpressureStrategy::DropNewest);
			CHECK(AudioSystem::get_backpressure_strategy() == AudioBackpressureStrategy::DropNewest);
		}
	}
} // namespace tutorface::test
