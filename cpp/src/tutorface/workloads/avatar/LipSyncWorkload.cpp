// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#include "robotick/api.h"
#include "robotick/framework/containers/FixedVector.h"
#include "robotick/framework/strings/FixedString.h"
#include "tutorface/systems/MorphWeightBuffer.h"
#include "tutorface/systems/TimeSource.h"
#include "tutorface/systems/audio/AudioFrame.h"
#include "tutorface/systems/lipsync/StreamingLipSync.h"
#include "tutorface/systems/lipsync/Visemes.h"

#include <memory>

namespace tutorface
{
	// Frames arrive through the workload inputs, so there is nothing to play or capture here.
	class UpstreamAudioCapture : public IAudioCapture
	{
	  public:
		bool initialize() override { return true; }

		bool start(const SynthesizedSpeech&, uint16_t, AudioFrameCallback) override
		{
			ROBOTICK_WARNING("LipSyncWorkload - speech playback is handled upstream; start() ignored");
			return false;
		}

		void pump() override {}
		void stop() override {}
		bool is_running() const override { return false; }
	};

	struct LipSyncConfig
	{
		StreamingLipSyncConfig lip_sync;
	};

	struct LipSyncInputs
	{
		AudioFrame mono; // speech being played this tick
	};

	struct LipSyncOutputs
	{
		robotick::FixedString64 primary_viseme = "sil";
		float primary_intensity = 0.0f;
		robotick::FixedVector<float, viseme_count> viseme_weights; // indexed by VisemeId
		uint32_t skipped_frames = 0;
	};

	struct LipSyncState
	{
		ManualTimeSource time_source;
		MorphWeightBuffer morph_buffer;
		UpstreamAudioCapture capture;
		std::unique_ptr<StreamingLipSync> lip_sync;
	};

	struct LipSyncWorkload
	{
		LipSyncConfig config;
		LipSyncInputs inputs;
		LipSyncOutputs outputs;
		robotick::State<LipSyncState> state;

		void load()
		{
			state->lip_sync = std::make_unique<StreamingLipSync>(state->capture, state->time_source, state->morph_buffer, nullptr, config.lip_sync);
			outputs.viseme_weights.set_size(viseme_count);
			outputs.viseme_weights.fill(0.0f);
		}

		void tick(const robotick::TickInfo& tick_info)
		{
			if (!state->lip_sync)
			{
				return;
			}

			state->time_source.set_now_ms(static_cast<double>(tick_info.time_now) * 1000.0);

			const bool has_audio = !inputs.mono.samples.empty();
			if (has_audio)
			{
				state->lip_sync->process_audio_frame(inputs.mono);
			}
			else
			{
				// nothing playing: let the mouth relax
				state->morph_buffer.decay(MorphChannel::Viseme, VisemeClassifierConfig{}.morph_decay);
			}

			publish_outputs(has_audio);
		}

		void publish_outputs(const bool has_audio)
		{
			const VisemeList& visemes = state->lip_sync->get_current_visemes();
			if (!has_audio || visemes.empty())
			{
				outputs.primary_viseme = "sil";
				outputs.primary_intensity = 0.0f;
			}
			else
			{
				outputs.primary_viseme = viseme_name(visemes[0].id);
				outputs.primary_intensity = visemes[0].intensity;
			}

			for (uint8_t i = 0; i < viseme_count; ++i)
			{
				outputs.viseme_weights[i] = state->morph_buffer.get_weight(viseme_morph_key(static_cast<VisemeId>(i)));
			}

			outputs.skipped_frames = state->lip_sync->get_skipped_frame_count();
		}
	};

} // namespace tutorface
