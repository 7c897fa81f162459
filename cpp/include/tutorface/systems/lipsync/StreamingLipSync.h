// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "robotick/framework/utility/Function.h"
#include "tutorface/systems/MorphWeightBuffer.h"
#include "tutorface/systems/TimeSource.h"
#include "tutorface/systems/lipsync/AudioFeatureExtractor.h"
#include "tutorface/systems/lipsync/SpeechInterfaces.h"
#include "tutorface/systems/lipsync/TextPhonemizer.h"
#include "tutorface/systems/lipsync/VisemeClassifier.h"

#include <cstdint>
#include <string>

namespace tutorface
{
	class PerformanceGovernor;

	struct StreamingLipSyncConfig
	{
		uint32_t sample_rate = 48000;
		uint16_t frame_size = 1024;
		float smoothing_factor = 0.8f; // spectral smoothing across frames
		float intensity_multiplier = 1.5f;

		// When false, speech is animated from its phoneme timeline instead of live audio analysis.
		bool enable_real_time_processing = true;
	};

	using VisemeUpdateCallback = robotick::Function<void(const VisemeList&)>;

	/**
	 * @brief Drives the viseme channel of the morph buffer while the tutor speaks.
	 *
	 * Two sources are supported: live analysis of synthesised audio delivered by an
	 * IAudioCapture, and replay of a timestamped phoneme timeline against the time source.
	 * Both are advanced from update(), which the owner calls once per tick.
	 *
	 * If the capture cannot be initialised the driver becomes inert for the rest of the
	 * session: every call is a no-op that returns false.
	 */
	class StreamingLipSync
	{
	  public:
		StreamingLipSync(IAudioCapture& capture,
			const ITimeSource& time_source,
			MorphWeightBuffer& morph_buffer,
			const PerformanceGovernor* governor = nullptr,
			const StreamingLipSyncConfig& config = StreamingLipSyncConfig{});
		~StreamingLipSync();

		StreamingLipSync(const StreamingLipSync&) = delete;
		StreamingLipSync& operator=(const StreamingLipSync&) = delete;

		// Synthesise text and animate it. Falls back to a text-only timeline if the provider
		// cannot produce audio. Any running playback is stopped first.
		bool start_streaming_lip_sync(const std::string& text, ITextToSpeechProvider& tts_provider, VisemeUpdateCallback on_viseme_update);

		// Classify one frame and write it to the morph buffer. false if the frame was skipped.
		bool process_audio_frame(const AudioFrame& frame);

		// Replay a phoneme timeline; playback ends once every event is emitted and duration_ms has passed.
		bool process_phoneme_data(const PhonemeTimeline& phonemes, float duration_ms, VisemeUpdateCallback on_viseme_update);

		void update();

		// Idempotent. Stops capture and replay, then zeroes every viseme weight.
		void stop_streaming_lip_sync();
		void dispose();

		void update_config(const StreamingLipSyncConfig& new_config);
		const StreamingLipSyncConfig& get_config() const { return config; }

		bool is_active() const { return active; }
		bool is_inert() const { return inert || disposed; }

		const VisemeList& get_current_visemes() const { return current_visemes; }
		uint32_t get_skipped_frame_count() const { return skipped_frames; }

	  private:
		enum class PlaybackSource : uint8_t
		{
			None,
			LiveAudio,
			PhonemeReplay,
		};

		bool ensure_capture_initialized();
		bool start_text_fallback(const std::string& text, float duration_ms, VisemeUpdateCallback on_viseme_update);
		void emit_phoneme(const PhonemeEvent& event);
		void publish(const VisemeList& visemes);
		void finish_playback();

		IAudioCapture& capture;
		const ITimeSource& time_source;
		MorphWeightBuffer& morph_buffer;
		const PerformanceGovernor* governor = nullptr;

		StreamingLipSyncConfig config{};
		AudioFeatureExtractor feature_extractor;
		VisemeClassifier classifier;
		TextPhonemizer phonemizer;

		AudioAnalysisFrame analysis_frame;
		VisemeClassification classification;
		VisemeList current_visemes;
		VisemeUpdateCallback on_update;

		PlaybackSource source = PlaybackSource::None;
		uint32_t session = 0; // bumped on every stop, including the one that precedes a start
		bool active = false;
		bool capture_initialized = false;
		bool inert = false;
		bool disposed = false;

		PhonemeTimeline replay_timeline;
		size_t replay_next_event = 0;
		float replay_duration_ms = 0.0f;
		double replay_start_ms = 0.0;

		uint32_t low_mode_frame_counter = 0;
		uint32_t skipped_frames = 0;
	};

} // namespace tutorface
