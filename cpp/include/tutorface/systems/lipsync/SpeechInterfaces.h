// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "robotick/framework/utility/Function.h"
#include "tutorface/systems/audio/AudioFrame.h"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace tutorface
{
	struct PhonemeEvent
	{
		std::string phoneme; // ARPAbet symbol or "SIL"
		float onset_ms = 0.0f;
		float confidence = 1.0f;
	};

	using PhonemeTimeline = std::vector<PhonemeEvent>;

	struct SynthesizedSpeech
	{
		std::vector<float> samples; // mono
		uint32_t sample_rate = 48000;
		float duration_ms = 0.0f;
		PhonemeTimeline phonemes; // optional; empty when the provider has no alignment
	};

	// Thrown by a provider asked for something it cannot do (e.g. audio for lip sync).
	class UnsupportedOperationError : public std::runtime_error
	{
	  public:
		using std::runtime_error::runtime_error;
	};

	class ITextToSpeechProvider
	{
	  public:
		virtual ~ITextToSpeechProvider() = default;

		// Throws UnsupportedOperationError when the provider cannot synthesise audio for lip sync.
		virtual SynthesizedSpeech synthesize_for_lip_sync(const std::string& text) = 0;
	};

	using AudioFrameCallback = robotick::Function<void(const AudioFrame&)>;

	/**
	 * @brief Plays synthesised speech and hands back analysis frames at its own cadence.
	 *
	 * Frames are delivered from pump(), which the owner calls once per tick.
	 */
	class IAudioCapture
	{
	  public:
		virtual ~IAudioCapture() = default;

		// One-time bring-up. false means the audio subsystem is unavailable.
		virtual bool initialize() = 0;

		virtual bool start(const SynthesizedSpeech& speech, uint16_t frame_size, AudioFrameCallback on_frame) = 0;
		virtual void pump() = 0;
		virtual void stop() = 0;

		// True while speech is still playing.
		virtual bool is_running() const = 0;
	};

} // namespace tutorface
