// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#include "tutorface/systems/config/AvatarConfig.h"

#include <catch2/catch_all.hpp>

#include <cstdio>
#include <fstream>

namespace tutorface::test
{
	TEST_CASE("Unit/Systems/Config/AvatarConfig")
	{
		AvatarConfig config;

		SECTION("Sections override only the keys they name")
		{
			const char* yaml = R"(
lip_sync:
  sample_rate: 44100
  frame_size: 512
expressions:
  transition_speed: 2.5
  default_easing: bounce
behavior:
  expression_cooldown_ms: 1000
  sentiment_threshold: 0.4
performance:
  target_frame_time_ms: 33.3
)";
			REQUIRE(AvatarConfigLoader::load_from_string(yaml, config));

			CHECK(config.lip_sync.sample_rate == 44100);
			CHECK(config.lip_sync.frame_size == 512);
			CHECK(config.lip_sync.intensity_multiplier == Catch::Approx(1.5f));
			CHECK(config.expressions.transition_speed == Catch::Approx(2.5f));
			CHECK(config.expressions.default_easing == EasingFunction::Bounce);
			CHECK(config.behavior.expression_cooldown_ms == Catch::Approx(1000.0));
			CHECK(config.behavior.sentiment_threshold == Catch::Approx(0.4f));
			CHECK(config.behavior.max_repetitions == 2);
			CHECK(config.contextual.expression_intensity == Catch::Approx(0.7f));
			CHECK(config.performance.target_frame_time_ms == Catch::Approx(33.3f));
		}

		SECTION("Malformed YAML keeps the defaults")
		{
			CHECK_FALSE(AvatarConfigLoader::load_from_string("lip_sync: [unclosed", config));
			CHECK(config.lip_sync.sample_rate == 48000);

			CHECK_FALSE(AvatarConfigLoader::load_from_string("- just\n- a list\n", config));
			CHECK(config.behavior.expression_cooldown_ms == Catch::Approx(2000.0));
		}

		SECTION("Wrong types and unknown names are skipped")
		{
			const char* yaml = R"(
lip_sync:
  sample_rate: fast
  smoothing_factor: 0.5
expressions:
  default_easing: wobbly
)";
			REQUIRE(AvatarConfigLoader::load_from_string(yaml, config));
			CHECK(config.lip_sync.sample_rate == 48000);
			CHECK(config.lip_sync.smoothing_factor == Catch::Approx(0.5f));
			CHECK(config.expressions.default_easing == EasingFunction::EaseInOut);
		}

		SECTION("Empty document is accepted")
		{
			CHECK(AvatarConfigLoader::load_from_string("", config));
			CHECK(config.performance.sample_interval_ms == Catch::Approx(1000.0));
		}

		SECTION("Loading from file")
		{
			const char* path = "tutorface_avatar_config_test.yaml";
			{
				std::ofstream file(path);
				file << "contextual:\n  context_sensitivity: 0.5\n";
			}

			REQUIRE(AvatarConfigLoader::load_from_file(path, config));
			CHECK(config.contextual.context_sensitivity == Catch::Approx(0.5f));
			std::remove(path);

			CHECK_FALSE(AvatarConfigLoader::load_from_file("does/not/exist.yaml", config));
		}
	}

} // namespace tutorface::test
