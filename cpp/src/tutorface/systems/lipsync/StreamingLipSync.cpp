// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#include "tutorface/systems/lipsync/StreamingLipSync.h"

#include "robotick/api.h"
#include "tutorface/systems/performance/PerformanceGovernor.h"

namespace tutorface
{
	namespace
	{
		AudioFeatureExtractorConfig make_extractor_config(const StreamingLipSyncConfig& config)
		{
			AudioFeatureExtractorConfig extractor_config;
			extractor_config.sample_rate = config.sample_rate;
			extractor_config.frame_size = config.frame_size;
			extractor_config.spectral_smoothing = config.smoothing_factor;
			return extractor_config;
		}

		VisemeClassifierConfig make_classifier_config(const StreamingLipSyncConfig& config)
		{
			VisemeClassifierConfig classifier_config;
			classifier_config.intensity_multiplier = config.intensity_multiplier;
			return classifier_config;
		}
	} // namespace

	StreamingLipSync::StreamingLipSync(IAudioCapture& capture,
		const ITimeSource& time_source,
		MorphWeightBuffer& morph_buffer,
		const PerformanceGovernor* governor,
		const StreamingLipSyncConfig& config)
		: capture(capture)
		, time_source(time_source)
		, morph_buffer(morph_buffer)
		, governor(governor)
		, config(config)
		, feature_extractor(make_extractor_config(config))
		, classifier(make_classifier_config(config))
	{
	}

	StreamingLipSync::~StreamingLipSync()
	{
		if (active)
		{
			stop_streaming_lip_sync();
		}
	}

	bool StreamingLipSync::ensure_capture_initialized()
	{
		if (inert || disposed)
		{
			return false;
		}

		if (!capture_initialized)
		{
			capture_initialized = capture.initialize();
			if (!capture_initialized)
			{
				ROBOTICK_WARNING("StreamingLipSync - audio capture failed to initialise; lip sync disabled for this session");
				inert = true;
				return false;
			}
		}

		return true;
	}

	bool StreamingLipSync::start_streaming_lip_sync(
		const std::string& text, ITextToSpeechProvider& tts_provider, VisemeUpdateCallback on_viseme_update)
	{
		if (!ensure_capture_initialized())
		{
			return false;
		}

		stop_streaming_lip_sync();

		SynthesizedSpeech speech;
		try
		{
			speech = tts_provider.synthesize_for_lip_sync(text);
		}
		catch (const UnsupportedOperationError& error)
		{
			ROBOTICK_INFO("StreamingLipSync - provider cannot synthesise audio (%s); using text-only phonemes", error.what());
			return start_text_fallback(text, 0.0f, robotick::move(on_viseme_update));
		}

		if (speech.samples.empty() || !config.enable_real_time_processing)
		{
			if (!speech.phonemes.empty())
			{
				return process_phoneme_data(speech.phonemes, speech.duration_ms, robotick::move(on_viseme_update));
			}
			return start_text_fallback(text, speech.duration_ms, robotick::move(on_viseme_update));
		}

		feature_extractor.reset();
		low_mode_frame_counter = 0;
		on_update = robotick::move(on_viseme_update);

		const bool started = capture.start(speech, config.frame_size, [this](const AudioFrame& frame) { process_audio_frame(frame); });
		if (!started)
		{
			ROBOTICK_WARNING("StreamingLipSync - audio capture refused %.0fms of speech", speech.duration_ms);
			on_update = VisemeUpdateCallback();
			return false;
		}

		source = PlaybackSource::LiveAudio;
		active = true;
		ROBOTICK_INFO("StreamingLipSync - started live lip sync (%zu samples @ %uHz)", speech.samples.size(), static_cast<unsigned>(speech.sample_rate));
		return true;
	}

	bool StreamingLipSync::start_text_fallback(const std::string& text, float duration_ms, VisemeUpdateCallback on_viseme_update)
	{
		const float timeline_duration_ms = duration_ms > 0.0f ? duration_ms : phonemizer.estimate_duration_ms(text);
		const PhonemeTimeline timeline = phonemizer.phonemize(text, timeline_duration_ms);
		return process_phoneme_data(timeline, timeline_duration_ms, robotick::move(on_viseme_update));
	}

	bool StreamingLipSync::process_audio_frame(const AudioFrame& frame)
	{
		if (inert || disposed)
		{
			return false;
		}

		const QualityMode mode = governor ? governor->get_recommended_mode() : QualityMode::High;
		const VisemeClassifierConfig& classifier_config = classifier.get_config();

		if (mode == QualityMode::Off)
		{
			morph_buffer.decay(MorphChannel::Viseme, classifier_config.morph_decay);
			return false;
		}

		if (mode == QualityMode::Low && (low_mode_frame_counter++ % 2) != 0)
		{
			morph_buffer.decay(MorphChannel::Viseme, classifier_config.morph_decay);
			return false;
		}

		try
		{
			feature_extractor.extract(frame, analysis_frame);
		}
		catch (const AudioFeatureError& error)
		{
			++skipped_frames;
			ROBOTICK_WARNING("StreamingLipSync - skipping audio frame at %.3fs: %s", frame.timestamp, error.what());
			return false;
		}

		if (mode == QualityMode::Low)
		{
			VisemeClassifierConfig low_config = classifier_config;
			low_config.emit_secondary_viseme = false;
			VisemeClassifier(low_config).classify(analysis_frame, classification);
		}
		else
		{
			classifier.classify(analysis_frame, classification);
		}

		publish(classification.visemes);
		return true;
	}

	bool StreamingLipSync::process_phoneme_data(const PhonemeTimeline& phonemes, float duration_ms, VisemeUpdateCallback on_viseme_update)
	{
		if (inert || disposed)
		{
			return false;
		}

		stop_streaming_lip_sync();

		replay_timeline = phonemes;
		replay_next_event = 0;
		replay_duration_ms = robotick::max(duration_ms, 0.0f);
		replay_start_ms = time_source.now_ms();
		on_update = robotick::move(on_viseme_update);

		source = PlaybackSource::PhonemeReplay;
		active = true;
		ROBOTICK_INFO("StreamingLipSync - replaying %zu phonemes over %.0fms", replay_timeline.size(), replay_duration_ms);
		return true;
	}

	void StreamingLipSync::update()
	{
		if (!active)
		{
			return;
		}

		const uint32_t update_session = session;

		if (source == PlaybackSource::LiveAudio)
		{
			capture.pump();
			if (session == update_session && !capture.is_running())
			{
				finish_playback();
			}
			return;
		}

		const double elapsed_ms = time_source.now_ms() - replay_start_ms;

		while (replay_next_event < replay_timeline.size() && replay_timeline[replay_next_event].onset_ms <= elapsed_ms)
		{
			const PhonemeEvent event = replay_timeline[replay_next_event++];
			emit_phoneme(event);
			if (session != update_session)
			{
				return;
			}
		}

		if (replay_next_event >= replay_timeline.size() && elapsed_ms >= replay_duration_ms)
		{
			finish_playback();
		}
	}

	void StreamingLipSync::emit_phoneme(const PhonemeEvent& event)
	{
		const QualityMode mode = governor ? governor->get_recommended_mode() : QualityMode::High;
		if (mode == QualityMode::Off)
		{
			morph_buffer.decay(MorphChannel::Viseme, classifier.get_config().morph_decay);
			return;
		}

		VisemeList visemes;
		visemes.add(Viseme{phoneme_to_viseme(event.phoneme.c_str()), robotick::clamp(event.confidence, 0.0f, 1.0f)});
		publish(visemes);
	}

	void StreamingLipSync::publish(const VisemeList& visemes)
	{
		classifier.apply_to_morph_buffer(visemes, morph_buffer);
		current_visemes = visemes;

		if (!on_update)
		{
			return;
		}

		// The listener may stop or restart lip sync, so it runs from a local and is only
		// put back if the session it belongs to is still the current one.
		const uint32_t publishing_session = session;
		VisemeUpdateCallback callback(robotick::move(on_update));
		on_update = VisemeUpdateCallback();

		callback(current_visemes);

		if (session == publishing_session)
		{
			on_update = robotick::move(callback);
		}
	}

	void StreamingLipSync::finish_playback()
	{
		active = false;
		source = PlaybackSource::None;
		replay_timeline.clear();
		replay_next_event = 0;
		current_visemes.clear();
		morph_buffer.zero_channel(MorphChannel::Viseme);
		ROBOTICK_INFO("StreamingLipSync - playback complete");
	}

	void StreamingLipSync::stop_streaming_lip_sync()
	{
		if (source == PlaybackSource::LiveAudio)
		{
			capture.stop();
		}

		const bool was_active = active;

		++session;
		active = false;
		source = PlaybackSource::None;
		replay_timeline.clear();
		replay_next_event = 0;
		current_visemes.clear();
		on_update = VisemeUpdateCallback();

		morph_buffer.zero_channel(MorphChannel::Viseme);

		if (was_active)
		{
			ROBOTICK_INFO("StreamingLipSync - stopped");
		}
	}

	void StreamingLipSync::dispose()
	{
		stop_streaming_lip_sync();
		disposed = true;
	}

	void StreamingLipSync::update_config(const StreamingLipSyncConfig& new_config)
	{
		if (!feature_extractor.configure(make_extractor_config(new_config)))
		{
			ROBOTICK_WARNING("StreamingLipSync - rejected frame_size %u; keeping %u",
				static_cast<unsigned>(new_config.frame_size),
				static_cast<unsigned>(config.frame_size));

			StreamingLipSyncConfig kept_config = new_config;
			kept_config.frame_size = config.frame_size;
			if (feature_extractor.configure(make_extractor_config(kept_config)))
			{
				config = kept_config;
			}
		}
		else
		{
			config = new_config;
		}

		VisemeClassifierConfig classifier_config = classifier.get_config();
		classifier_config.intensity_multiplier = config.intensity_multiplier;
		classifier.configure(classifier_config);
	}

} // namespace tutorface
