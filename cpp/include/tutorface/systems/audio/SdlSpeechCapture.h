// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "tutorface/systems/audio/AudioSystem.h"
#include "tutorface/systems/lipsync/SpeechInterfaces.h"

#include <vector>

namespace tutorface
{
	/**
	 * @brief IAudioCapture that plays speech through AudioSystem and taps it for analysis.
	 *
	 * The whole utterance is queued on start(). Each pump() works out how much of it the
	 * device has consumed and emits the frames covering that span, so visemes follow what
	 * the listener actually hears.
	 */
	class SdlSpeechCapture : public IAudioCapture
	{
	  public:
		explicit SdlSpeechCapture(const AudioOutputSettings& settings = AudioOutputSettings{})
			: settings(settings)
		{
		}

		bool initialize() override;
		bool start(const SynthesizedSpeech& speech, uint16_t frame_size, AudioFrameCallback on_frame) override;
		void pump() override;
		void stop() override;
		bool is_running() const override { return running; }

		// Linear resample used when the provider's rate differs from the device rate.
		static void resample_linear(const std::vector<float>& input, uint32_t input_rate, uint32_t output_rate, std::vector<float>& output);

	  private:
		// Returns false if the callback stopped or restarted playback.
		bool emit_frame(size_t offset, size_t count);

		AudioOutputSettings settings{};
		AudioFrameCallback frame_callback;

		std::vector<float> playback_samples;
		uint32_t playback_rate = 0;
		uint16_t frame_size = 1024;
		size_t next_frame_offset = 0;
		float playback_ms = 0.0f;

		AudioFrame frame;
		uint32_t playback_session = 0;
		bool running = false;
	};

} // namespace tutorface
