// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#include "tutorface/systems/expressions/BehaviorExpressionIntegrator.h"

#include "robotick/api.h"
#include "tutorface/systems/expressions/ContextualExpressionSystem.h"
#include "tutorface/systems/expressions/FacialExpressionEngine.h"
#include "tutorface/systems/performance/PerformanceGovernor.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace tutorface
{
	namespace
	{
		struct RegionModifiers
		{
			const char* region;
			float joy;
			float concern;
			float excitement;
		};

		// focus and neutral are 1.0 in every region
		constexpr RegionModifiers region_modifiers[] = {
			{"western", 1.0f, 1.0f, 1.0f},
			{"eastern", 0.8f, 0.9f, 0.7f},
			{"mediterranean", 1.2f, 1.1f, 1.3f},
			{"nordic", 0.9f, 0.8f, 0.8f},
		};

		EmotionType map_sentiment_to_emotion(SentimentType sentiment)
		{
			switch (sentiment)
			{
			case SentimentType::Positive:
				return EmotionType::Joy;
			case SentimentType::Negative:
				return EmotionType::Concern;
			default:
				return EmotionType::Neutral;
			}
		}

		float sentiment_base_duration_ms(SentimentType sentiment)
		{
			switch (sentiment)
			{
			case SentimentType::Positive:
				return 2500.0f;
			case SentimentType::Negative:
				return 3500.0f;
			default:
				return 2000.0f;
			}
		}

		float emotion_base_duration_ms(EmotionType emotion)
		{
			switch (emotion)
			{
			case EmotionType::Joy:
				return 2500.0f;
			case EmotionType::Concern:
				return 3500.0f;
			case EmotionType::Excitement:
				return 2000.0f;
			case EmotionType::Focus:
				return 4000.0f;
			default:
				return 2000.0f;
			}
		}
	} // namespace

	const char* to_string(ExpressionDecision decision)
	{
		switch (decision)
		{
		case ExpressionDecision::Applied:
			return "applied";
		case ExpressionDecision::SubstitutedNeutral:
			return "substituted_neutral";
		case ExpressionDecision::RejectedDisabled:
			return "rejected_disabled";
		case ExpressionDecision::RejectedLowConfidence:
			return "rejected_low_confidence";
		case ExpressionDecision::RejectedCooldown:
			return "rejected_cooldown";
		case ExpressionDecision::SuppressedByPerformance:
			return "suppressed_by_performance";
		}
		return "unknown";
	}

	BehaviorExpressionIntegrator::BehaviorExpressionIntegrator(FacialExpressionEngine& engine,
		ContextualExpressionSystem& contextual_system,
		const ITimeSource& time_source,
		const PerformanceGovernor* governor,
		const ExpressionIntegrationConfig& config)
		: engine(engine)
		, contextual_system(contextual_system)
		, time_source(time_source)
		, governor(governor)
		, config(config)
	{
	}

	bool BehaviorExpressionIntegrator::performance_off() const
	{
		return governor != nullptr && governor->get_recommended_mode() == QualityMode::Off;
	}

	ExpressionDecision BehaviorExpressionIntegrator::process_ai_content_analysis(
		const AIContentAnalysis& analysis, const BehaviorContext& behavior_context, const std::string& text)
	{
		if (!config.enable_auto_expressions)
		{
			return ExpressionDecision::RejectedDisabled;
		}

		if (performance_off())
		{
			return ExpressionDecision::SuppressedByPerformance;
		}

		if (analysis.confidence < config.sentiment_threshold)
		{
			ROBOTICK_INFO("BehaviorExpressionIntegrator - analysis confidence %.2f below threshold %.2f", analysis.confidence, config.sentiment_threshold);
			return ExpressionDecision::RejectedLowConfidence;
		}

		const double now_ms = time_source.now_ms();
		if (last_expression_time_ms.has_value() && now_ms - *last_expression_time_ms < config.expression_cooldown_ms)
		{
			return ExpressionDecision::RejectedCooldown;
		}

		const EmotionalContext emotional_context = apply_cultural_adjustments(map_ai_analysis_to_emotion(analysis), behavior_context);
		const FacialExpression expression = engine.get_emotional_expression(emotional_context);

		const ExpressionDecision decision = apply_expression_with_context(expression, text);

		record_history(expression.type, now_ms);
		last_expression_time_ms = now_ms;

		ROBOTICK_INFO("BehaviorExpressionIntegrator - %s %s (intensity %.2f)", to_string(decision), to_string(expression.type), expression.intensity);
		return decision;
	}

	ExpressionDecision BehaviorExpressionIntegrator::apply_ai_sentiment_expression(
		SentimentType sentiment, float intensity, const std::string& cultural_region, const std::string& text)
	{
		if (performance_off())
		{
			return ExpressionDecision::SuppressedByPerformance;
		}

		EmotionalContext context;
		context.primary = map_sentiment_to_emotion(sentiment);
		context.intensity = intensity * config.expression_intensity_scale;
		context.cultural_modifier = get_cultural_modifier(cultural_region, context.primary) * config.cultural_sensitivity;
		context.duration_ms = sentiment_base_duration_ms(sentiment) * (0.5f + 0.5f * intensity);

		const FacialExpression expression = fit_to_speech(engine.get_emotional_expression(context), text);
		engine.apply_expression(expression);
		return ExpressionDecision::Applied;
	}

	ExpressionDecision BehaviorExpressionIntegrator::apply_contextual_expression(
		EmotionType emotion, float base_intensity, const BehaviorContext& behavior_context, const std::string& text)
	{
		if (performance_off())
		{
			return ExpressionDecision::SuppressedByPerformance;
		}

		float intensity = base_intensity * config.expression_intensity_scale;
		float duration_ms = emotion_base_duration_ms(emotion);

		switch (behavior_context.conversation_state)
		{
		case ConversationState::Greeting:
			intensity *= 1.2f;
			duration_ms *= 0.8f;
			break;
		case ConversationState::Teaching:
			intensity *= 0.9f;
			duration_ms *= 1.2f;
			break;
		case ConversationState::Farewell:
			intensity *= 1.1f;
			break;
		case ConversationState::Responding:
			break;
		}

		if (text.find('!') != std::string::npos)
		{
			intensity *= 1.3f;
		}
		if (text.find('?') != std::string::npos)
		{
			intensity *= 1.1f;
		}

		EmotionalContext context;
		context.primary = emotion;
		context.intensity = robotick::min(1.0f, intensity);
		context.cultural_modifier = get_cultural_modifier(behavior_context.cultural_region, emotion);
		context.duration_ms = duration_ms;

		return apply_expression_with_context(engine.get_emotional_expression(context), text);
	}

	EmotionalContext BehaviorExpressionIntegrator::map_ai_analysis_to_emotion(const AIContentAnalysis& analysis) const
	{
		EmotionalContext context;
		const bool positive = analysis.sentiment == SentimentType::Positive;

		switch (analysis.content_type)
		{
		case ContentType::Celebration:
			context.primary = EmotionType::Excitement;
			if (positive)
				context.secondary = EmotionType::Joy;
			break;
		case ContentType::Concern:
			context.primary = EmotionType::Concern;
			break;
		case ContentType::Question:
			context.primary = EmotionType::Focus;
			if (positive)
				context.secondary = EmotionType::Joy;
			break;
		case ContentType::Explanation:
		case ContentType::Instruction:
			context.primary = EmotionType::Focus;
			break;
		default:
			context.primary = map_sentiment_to_emotion(analysis.sentiment);
			break;
		}

		context.intensity = analysis.emotional_intensity * config.expression_intensity_scale;
		context.cultural_modifier = config.cultural_sensitivity;
		return context;
	}

	EmotionalContext BehaviorExpressionIntegrator::apply_cultural_adjustments(
		const EmotionalContext& context, const BehaviorContext& behavior_context) const
	{
		EmotionalContext adjusted = context;
		adjusted.intensity = robotick::min(1.0f, context.intensity * get_formality_adjustment(behavior_context.formality_level, context.primary));
		adjusted.cultural_modifier = get_cultural_modifier(behavior_context.cultural_region, context.primary) * config.cultural_sensitivity;
		return adjusted;
	}

	ExpressionDecision BehaviorExpressionIntegrator::apply_expression_with_context(const FacialExpression& expression, const std::string& text)
	{
		if (count_recent(expression.type) >= config.max_repetitions)
		{
			ROBOTICK_INFO("BehaviorExpressionIntegrator - %s shown too often; returning to neutral", to_string(expression.type));
			engine.reset_to_neutral();
			return ExpressionDecision::SubstitutedNeutral;
		}

		const FacialExpression fitted = fit_to_speech(expression, text);
		engine.apply_expression(fitted);
		return ExpressionDecision::Applied;
	}

	FacialExpression BehaviorExpressionIntegrator::fit_to_speech(const FacialExpression& expression, const std::string& text) const
	{
		if (!config.blend_with_speech)
		{
			return expression;
		}

		// coarse timing only on low quality
		if (governor != nullptr && governor->get_recommended_mode() == QualityMode::Low)
		{
			return expression;
		}

		const float speech_ms = estimate_speech_duration_ms(text);
		if (speech_ms <= 0.0f)
		{
			return expression;
		}

		FacialExpression fitted = expression;
		fitted.duration_ms = robotick::min(expression.duration_ms, speech_ms * 1.2f);
		return fitted;
	}

	CurrentExpressionState BehaviorExpressionIntegrator::get_current_expression_state() const
	{
		CurrentExpressionState expression_state;
		const FacialExpression* current = engine.get_current_expression();
		if (current != nullptr)
		{
			expression_state.current_expression = current->type;
			expression_state.intensity = current->intensity;
			expression_state.remaining_duration_ms = current->duration_ms;
		}
		expression_state.transitioning = engine.is_transitioning();
		return expression_state;
	}

	bool BehaviorExpressionIntegrator::coordinate_with_ai_behaviors(float gesture_intensity, float movement_intensity, float speech_intensity)
	{
		const float total_intensity = gesture_intensity + movement_intensity + speech_intensity;
		if (total_intensity <= 2.0f)
		{
			return false;
		}

		// The engine's target is what the face shows, or is heading to, whoever applied it.
		const FacialExpression* active = engine.get_target_expression();
		if (active == nullptr)
		{
			active = engine.get_current_expression();
		}
		if (active == nullptr || active->type == ExpressionType::Neutral)
		{
			return false;
		}

		FacialExpression damped = *active;
		damped.intensity = active->intensity * 0.7f;
		engine.apply_expression(damped);

		ROBOTICK_INFO("BehaviorExpressionIntegrator - damped %s for concurrent behaviours (total %.2f)", to_string(damped.type), total_intensity);
		return true;
	}

	void BehaviorExpressionIntegrator::update_integration_config(const ExpressionIntegrationConfig& new_config)
	{
		config = new_config;

		ContextualExpressionConfig contextual_config = contextual_system.get_config();
		contextual_config.enable_auto_expressions = config.enable_auto_expressions;
		contextual_config.expression_intensity = config.expression_intensity_scale;
		contextual_config.cultural_sensitivity = config.cultural_sensitivity;
		contextual_system.update_config(contextual_config);
	}

	void BehaviorExpressionIntegrator::reset()
	{
		engine.reset_to_neutral();
		contextual_system.reset_to_neutral();
		history.clear();
		last_expression_time_ms.reset();
	}

	void BehaviorExpressionIntegrator::dispose()
	{
		history.clear();
		last_expression_time_ms.reset();
	}

	void BehaviorExpressionIntegrator::record_history(ExpressionType type, double now_ms)
	{
		history.push_back(HistoryEntry{type, now_ms});
		evict_history(now_ms);
	}

	void BehaviorExpressionIntegrator::evict_history(double now_ms)
	{
		const double cutoff_ms = now_ms - config.history_window_ms;
		while (!history.empty() && history.front().timestamp_ms <= cutoff_ms)
		{
			history.pop_front();
		}
	}

	uint32_t BehaviorExpressionIntegrator::count_recent(ExpressionType type)
	{
		const double now_ms = time_source.now_ms();
		evict_history(now_ms);

		uint32_t count = 0;
		for (const HistoryEntry& entry : history)
		{
			if (entry.type == type && now_ms - entry.timestamp_ms < config.repetition_window_ms)
			{
				++count;
			}
		}
		return count;
	}

	float BehaviorExpressionIntegrator::get_cultural_modifier(const std::string& cultural_region, EmotionType emotion)
	{
		std::string region = cultural_region;
		std::transform(region.begin(), region.end(), region.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

		for (const RegionModifiers& modifiers : region_modifiers)
		{
			if (region != modifiers.region)
			{
				continue;
			}

			switch (emotion)
			{
			case EmotionType::Joy:
				return modifiers.joy;
			case EmotionType::Concern:
				return modifiers.concern;
			case EmotionType::Excitement:
				return modifiers.excitement;
			default:
				return 1.0f;
			}
		}

		return 1.0f;
	}

	float BehaviorExpressionIntegrator::get_formality_adjustment(FormalityLevel formality_level, EmotionType emotion)
	{
		float adjustment = 1.0f;
		switch (formality_level)
		{
		case FormalityLevel::Formal:
			adjustment = 0.7f;
			break;
		case FormalityLevel::Informal:
			adjustment = 1.0f;
			break;
		case FormalityLevel::Casual:
			adjustment = 1.2f;
			break;
		}

		if (emotion == EmotionType::Focus || emotion == EmotionType::Neutral)
		{
			adjustment = robotick::max(0.9f, adjustment);
		}
		return adjustment;
	}

	float BehaviorExpressionIntegrator::estimate_speech_duration_ms(const std::string& text)
	{
		std::istringstream stream(text);
		std::string word;
		size_t word_count = 0;
		while (stream >> word)
		{
			++word_count;
		}

		constexpr float words_per_minute = 150.0f;
		return static_cast<float>(word_count) / words_per_minute * 60.0f * 1000.0f;
	}

} // namespace tutorface
