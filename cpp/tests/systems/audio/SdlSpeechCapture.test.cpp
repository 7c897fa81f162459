// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#include "tutorface/systems/audio/SdlSpeechCapture.h"

#include <catch2/catch_all.hpp>

#include <cstdlib>

namespace tutorface::test
{
	TEST_CASE("Unit/Systems/Audio/SdlSpeechCapture")
	{
		SECTION("Equal rates copy the input")
		{
			const std::vector<float> input = {0.1f, 0.2f, 0.3f};
			std::vector<float> output;
			SdlSpeechCapture::resample_linear(input, 48000, 48000, output);
			CHECK(output == input);
		}

		SECTION("Upsampling interpolates between neighbours")
		{
			const std::vector<float> input = {0.0f, 1.0f, 0.0f, -1.0f};
			std::vector<float> output;
			SdlSpeechCapture::resample_linear(input, 24000, 48000, output);

			REQUIRE(output.size() == 8);
			CHECK(output[0] == Catch::Approx(0.0f));
			CHECK(output[1] == Catch::Approx(0.5f));
			CHECK(output[2] == Catch::Approx(1.0f));
			CHECK(output[5] == Catch::Approx(-0.5f));
			CHECK(output[7] == Catch::Approx(-1.0f)); // last sample holds
		}

		SECTION("Downsampling shortens the signal")
		{
			const std::vector<float> input(480, 0.25f);
			std::vector<float> output;
			SdlSpeechCapture::resample_linear(input, 48000, 16000, output);

			REQUIRE(output.size() == 160);
			CHECK(output.front() == Catch::Approx(0.25f));
			CHECK(output.back() == Catch::Approx(0.25f));
		}

		SECTION("Unusable input produces nothing")
		{
			std::vector<float> output = {1.0f};
			SdlSpeechCapture::resample_linear({}, 48000, 44100, output);
			CHECK(output.empty());

			SdlSpeechCapture::resample_linear({0.5f}, 0, 44100, output);
			CHECK(output.empty());
		}

		SECTION("Start refuses to play before the device is open")
		{
			AudioSystem::shutdown();

			SdlSpeechCapture capture;
			SynthesizedSpeech speech;
			speech.samples.assign(4800, 0.1f);

			CHECK_FALSE(capture.start(speech, 1024, {}));
			CHECK_FALSE(capture.is_running());
			REQUIRE_NOTHROW(capture.pump());
			REQUIRE_NOTHROW(capture.stop());
		}

		SECTION("Stopping from inside the frame callback ends the pump")
		{
			::setenv("SDL_AUDIODRIVER", "dummy", 0);
			if (!AudioSystem::init())
			{
				WARN("no SDL audio driver available");
				return;
			}

			SdlSpeechCapture capture;
			SynthesizedSpeech speech;
			speech.sample_rate = AudioSystem::get_sample_rate();
			speech.samples.assign(4 * 256, 0.2f);

			int frames_seen = 0;
			REQUIRE(capture.start(speech, 256, [&](const AudioFrame&) {
				++frames_seen;
				capture.stop();
			}));

			// An empty device queue means every frame is due on the next pump.
			AudioSystem::clear_output();
			capture.pump();

			CHECK(frames_seen == 1);
			CHECK_FALSE(capture.is_running());

			REQUIRE_NOTHROW(capture.pump());
			CHECK(frames_seen == 1);

			AudioSystem::shutdown();
		}

		SECTION("Restarting from inside the frame callback plays the new speech")
		{
			::setenv("SDL_AUDIODRIVER", "dummy", 0);
			if (!AudioSystem::init())
			{
				WARN("no SDL audio driver available");
				return;
			}

			SdlSpeechCapture capture;
			SynthesizedSpeech first;
			first.sample_rate = AudioSystem::get_sample_rate();
			first.samples.assign(4 * 256, 0.2f);

			SynthesizedSpeech second = first;
			second.samples.assign(2 * 256, 0.4f);

			int first_frames = 0;
			bool restarted = false;
			REQUIRE(capture.start(first, 256, [&](const AudioFrame&) {
				++first_frames;
				restarted = capture.start(second, 256, {});
			}));

			AudioSystem::clear_output();
			capture.pump();

			CHECK(first_frames == 1);
			CHECK(restarted);
			CHECK(capture.is_running());

			capture.stop();
			AudioSystem::shutdown();
		}
	}

} // namespace tutorface::test
