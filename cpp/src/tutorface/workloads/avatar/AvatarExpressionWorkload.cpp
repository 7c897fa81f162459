// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#include "robotick/api.h"
#include "robotick/framework/containers/FixedVector.h"
#include "robotick/framework/strings/FixedString.h"
#include "robotick/framework/time/Clock.h"
#include "tutorface/systems/MorphWeightBuffer.h"
#include "tutorface/systems/RandomSource.h"
#include "tutorface/systems/TimeSource.h"
#include "tutorface/systems/config/AvatarConfig.h"
#include "tutorface/systems/expressions/AIAnalysisJson.h"
#include "tutorface/systems/expressions/BehaviorExpressionIntegrator.h"
#include "tutorface/systems/expressions/ContextualExpressionSystem.h"
#include "tutorface/systems/expressions/FacialExpressionEngine.h"
#include "tutorface/systems/performance/PerformanceGovernor.h"

#include <cstring>
#include <memory>

namespace tutorface
{
	// Order of AvatarExpressionOutputs::morph_weights.
	static constexpr const char* kExpressionMorphKeys[] = {
		"mouthSmile",
		"mouthFrown",
		"mouthOpen",
		"cheekPuff",
		"eyeSquintLeft",
		"eyeSquintRight",
		"eyeWideLeft",
		"eyeWideRight",
		"browDownLeft",
		"browDownRight",
		"browUpLeft",
		"browUpRight",
	};
	static constexpr size_t kExpressionMorphCount = sizeof(kExpressionMorphKeys) / sizeof(kExpressionMorphKeys[0]);

	struct AvatarExpressionConfig
	{
		robotick::FixedString256 config_file; // optional YAML, see AvatarConfigLoader
		robotick::FixedString64 cultural_region = "western";
	};

	struct AvatarExpressionInputs
	{
		robotick::FixedString512 tutor_text;
		robotick::FixedString1024 ai_analysis_json;		 // when set, takes priority over keyword analysis of tutor_text
		robotick::FixedString512 behavior_context_json;

		float gesture_intensity = 0.0f;
		float movement_intensity = 0.0f;
		float speech_intensity = 0.0f;
	};

	struct AvatarExpressionOutputs
	{
		robotick::FixedString64 expression_type = "neutral";
		float intensity = 0.0f;
		bool transitioning = false;
		float transition_progress = 0.0f;
		robotick::FixedVector<float, kExpressionMorphCount> morph_weights; // indexed as kExpressionMorphKeys

		robotick::FixedString64 last_decision;
		robotick::FixedString64 quality_mode = "high";
		float fps = 0.0f;
	};

	struct AvatarExpressionState
	{
		AvatarConfig avatar_config;

		ManualTimeSource time_source;
		DefaultRandomSource random_source;
		MorphWeightBuffer morph_buffer;

		std::unique_ptr<IMemoryProbe> memory_probe;
		std::unique_ptr<PerformanceGovernor> governor;
		std::unique_ptr<FacialExpressionEngine> engine;
		std::unique_ptr<ContextualExpressionSystem> contextual;
		std::unique_ptr<BehaviorExpressionIntegrator> integrator;

		robotick::FixedString512 last_text;
		robotick::FixedString1024 last_analysis_json;
		float last_behavior_total = 0.0f;
	};

	struct AvatarExpressionWorkload
	{
		AvatarExpressionConfig config;
		AvatarExpressionInputs inputs;
		AvatarExpressionOutputs outputs;
		robotick::State<AvatarExpressionState> state;

		void load()
		{
			AvatarConfig& avatar_config = state->avatar_config;
			if (!config.config_file.empty() && !AvatarConfigLoader::load_from_file(config.config_file.c_str(), avatar_config))
			{
				ROBOTICK_WARNING("AvatarExpressionWorkload - using default avatar settings (could not load '%s')", config.config_file.c_str());
			}

			state->memory_probe = create_process_memory_probe();
			state->governor = std::make_unique<PerformanceGovernor>(
				state->time_source, DeviceCapabilities::detect(), state->memory_probe.get(), avatar_config.performance);

			state->engine = std::make_unique<FacialExpressionEngine>(
				state->time_source, &state->morph_buffer, state->governor.get(), avatar_config.expressions);

			state->contextual = std::make_unique<ContextualExpressionSystem>(*state->engine, state->random_source, avatar_config.contextual);

			state->integrator = std::make_unique<BehaviorExpressionIntegrator>(
				*state->engine, *state->contextual, state->time_source, state->governor.get(), avatar_config.behavior);
		}

		void tick(const robotick::TickInfo& tick_info)
		{
			if (!state->engine)
			{
				return;
			}

			const auto work_start = robotick::Clock::now();
			state->time_source.set_now_ms(static_cast<double>(tick_info.time_now) * 1000.0);

			handle_new_content();
			handle_behavior_intensities();

			state->engine->update();
			publish_outputs();

			const auto work_time = robotick::Clock::now() - work_start;
			state->governor->record_frame(static_cast<float>(robotick::Clock::to_nanoseconds(work_time).count()) * 1e-6f);
		}

		void handle_new_content()
		{
			const bool analysis_changed = ::strcmp(inputs.ai_analysis_json.c_str(), state->last_analysis_json.c_str()) != 0;
			const bool text_changed = ::strcmp(inputs.tutor_text.c_str(), state->last_text.c_str()) != 0;

			state->last_analysis_json = inputs.ai_analysis_json;
			state->last_text = inputs.tutor_text;

			if (analysis_changed && !inputs.ai_analysis_json.empty())
			{
				AIContentAnalysis analysis;
				if (!parse_ai_content_analysis(inputs.ai_analysis_json.c_str(), analysis))
				{
					outputs.last_decision = "invalid_analysis";
					return;
				}

				BehaviorContext behavior_context;
				behavior_context.cultural_region = config.cultural_region.c_str();
				if (!inputs.behavior_context_json.empty() && !parse_behavior_context(inputs.behavior_context_json.c_str(), behavior_context))
				{
					ROBOTICK_WARNING("AvatarExpressionWorkload - behavior context ignored; using defaults");
				}

				const ExpressionDecision decision = state->integrator->process_ai_content_analysis(analysis, behavior_context, inputs.tutor_text.c_str());
				outputs.last_decision = to_string(decision);
				return;
			}

			if (text_changed && !inputs.tutor_text.empty())
			{
				if (state->governor->get_recommended_mode() == QualityMode::Off)
				{
					outputs.last_decision = to_string(ExpressionDecision::SuppressedByPerformance);
					return;
				}

				const bool applied = state->contextual->process_content(inputs.tutor_text.c_str(), config.cultural_region.c_str());
				outputs.last_decision = applied ? "contextual" : to_string(ExpressionDecision::RejectedDisabled);
			}
		}

		void handle_behavior_intensities()
		{
			const float total = inputs.gesture_intensity + inputs.movement_intensity + inputs.speech_intensity;
			if (total == state->last_behavior_total)
			{
				return;
			}

			state->last_behavior_total = total;
			state->integrator->coordinate_with_ai_behaviors(inputs.gesture_intensity, inputs.movement_intensity, inputs.speech_intensity);
		}

		void publish_outputs()
		{
			const CurrentExpressionState expression_state = state->integrator->get_current_expression_state();

			outputs.expression_type = expression_state.current_expression ? to_string(*expression_state.current_expression) : "neutral";
			outputs.intensity = expression_state.intensity;
			outputs.transitioning = expression_state.transitioning;
			outputs.transition_progress = state->engine->get_transition_progress();

			outputs.morph_weights.set_size(kExpressionMorphCount);
			for (size_t i = 0; i < kExpressionMorphCount; ++i)
			{
				outputs.morph_weights[i] = state->morph_buffer.get_weight(kExpressionMorphKeys[i]);
			}

			outputs.quality_mode = to_string(state->governor->get_recommended_mode());
			outputs.fps = state->governor->get_metrics().fps;
		}
	};

} // namespace tutorface
