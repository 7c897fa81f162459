// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#include "tutorface/systems/expressions/ContextualExpressionSystem.h"

#include "robotick/api.h"
#include "tutorface/systems/expressions/FacialExpressionEngine.h"

#include <algorithm>
#include <cctype>

namespace tutorface
{
	namespace
	{
		const char* const positive_words[] = {
			"great", "excellent", "wonderful", "amazing", "fantastic", "good", "happy", "joy", "success", "congratulations", "well done", "perfect"};

		const char* const negative_words[] = {
			"problem", "error", "wrong", "bad", "terrible", "awful", "sad", "worry", "concern", "difficult", "challenge", "issue"};

		const char* const excitement_words[] = {
			"exciting", "celebration", "party", "achievement", "victory", "win", "awesome", "incredible", "breakthrough", "milestone"};

		const char* const concern_words[] = {"serious", "important", "careful", "attention", "warning", "critical", "urgent", "significant", "major"};

		const char* const greeting_words[] = {"hello", "hi ", "welcome"};
		const char* const farewell_words[] = {"goodbye", "bye", "farewell"};
		const char* const instruction_words[] = {"learn", "understand", "explain"};

		template <size_t N> size_t collect_matches(const std::string& text, const char* const (&words)[N], std::vector<std::string>& out_matches)
		{
			size_t count = 0;
			for (const char* word : words)
			{
				if (text.find(word) != std::string::npos)
				{
					out_matches.emplace_back(word);
					++count;
				}
			}
			return count;
		}

		template <size_t N> bool contains_any(const std::string& text, const char* const (&words)[N])
		{
			for (const char* word : words)
			{
				if (text.find(word) != std::string::npos)
				{
					return true;
				}
			}
			return false;
		}

		std::string to_lower(const std::string& text)
		{
			std::string lowered = text;
			std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
			return lowered;
		}
	} // namespace

	ContextualExpressionSystem::ContextualExpressionSystem(
		FacialExpressionEngine& engine, IRandomSource& random_source, const ContextualExpressionConfig& config)
		: engine(engine)
		, random_source(random_source)
		, config(config)
	{
	}

	bool ContextualExpressionSystem::process_content(const std::string& text, const std::string& cultural_context)
	{
		if (!config.enable_auto_expressions)
		{
			return false;
		}

		current_context = analyze_content(text, cultural_context);

		const EmotionalContext emotional_context = map_content_to_emotion(*current_context);
		const FacialExpression expression = engine.get_emotional_expression(emotional_context);

		ROBOTICK_INFO("ContextualExpressionSystem - %s expression for %s content", to_string(expression.type), to_string(current_context->content_type));

		engine.apply_expression(expression);
		return true;
	}

	ContentAnalysisResult ContextualExpressionSystem::analyze_content(const std::string& text, const std::string& cultural_context) const
	{
		const std::string lowered = to_lower(text);

		ContentAnalysisResult result;
		result.cultural_context = cultural_context;

		const size_t positive_count = collect_matches(lowered, positive_words, result.key_phrases);
		const size_t negative_count = collect_matches(lowered, negative_words, result.key_phrases);
		const size_t excitement_count = collect_matches(lowered, excitement_words, result.key_phrases);
		const size_t concern_count = collect_matches(lowered, concern_words, result.key_phrases);
		const size_t matched_count = positive_count + negative_count + excitement_count + concern_count;

		if (excitement_count > 0 || positive_count > negative_count)
		{
			result.sentiment = SentimentType::Positive;
		}
		else if (negative_count > positive_count || concern_count > 0)
		{
			result.sentiment = SentimentType::Negative;
		}
		else
		{
			result.sentiment = SentimentType::Neutral;
		}

		result.emotional_intensity = robotick::min(1.0f, 0.5f + 0.1f * static_cast<float>(matched_count));
		result.confidence = robotick::min(1.0f, 0.3f + 0.2f * static_cast<float>(matched_count));

		if (lowered.find('?') != std::string::npos)
		{
			result.content_type = ContentType::Question;
		}
		else if (contains_any(lowered, greeting_words))
		{
			result.content_type = ContentType::Greeting;
		}
		else if (contains_any(lowered, farewell_words))
		{
			result.content_type = ContentType::Farewell;
		}
		else if (excitement_count > 0)
		{
			result.content_type = ContentType::Celebration;
		}
		else if (contains_any(lowered, instruction_words))
		{
			result.content_type = ContentType::Instruction;
		}
		else
		{
			result.content_type = ContentType::Explanation;
		}

		return result;
	}

	EmotionalContext ContextualExpressionSystem::map_content_to_emotion(const ContentAnalysisResult& analysis)
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
		case ContentType::Greeting:
			context.primary = EmotionType::Joy;
			break;
		case ContentType::Farewell:
			context.primary = EmotionType::Neutral;
			if (positive)
				context.secondary = EmotionType::Joy;
			break;
		case ContentType::Instruction:
			context.primary = EmotionType::Focus;
			break;
		case ContentType::Question:
			context.primary = EmotionType::Focus;
			if (positive)
				context.secondary = EmotionType::Joy;
			break;
		default:
			switch (analysis.sentiment)
			{
			case SentimentType::Positive:
				context.primary = EmotionType::Joy;
				break;
			case SentimentType::Negative:
				context.primary = EmotionType::Concern;
				break;
			default:
				context.primary = EmotionType::Neutral;
				break;
			}
			break;
		}

		const float adjusted_intensity =
			analysis.emotional_intensity * analysis.confidence * config.context_sensitivity * config.expression_intensity;

		context.intensity = robotick::min(1.0f, adjusted_intensity);
		context.cultural_modifier = config.cultural_sensitivity;
		context.duration_ms = jittered_duration_ms(base_duration_ms(analysis.content_type));
		return context;
	}

	float ContextualExpressionSystem::base_duration_ms(ContentType content_type)
	{
		switch (content_type)
		{
		case ContentType::Celebration:
			return 3000.0f;
		case ContentType::Excitement:
			return 2500.0f;
		case ContentType::Concern:
			return 4000.0f;
		case ContentType::Greeting:
			return 2000.0f;
		case ContentType::Farewell:
			return 2500.0f;
		case ContentType::Instruction:
			return 3500.0f;
		case ContentType::Question:
			return 2000.0f;
		case ContentType::Explanation:
			return 3000.0f;
		}
		return 2000.0f;
	}

	float ContextualExpressionSystem::base_duration_ms(ManualExpression kind)
	{
		switch (kind)
		{
		case ManualExpression::Positive:
			return 2500.0f;
		case ManualExpression::Concern:
			return 4000.0f;
		case ManualExpression::Excitement:
			return 2500.0f;
		case ManualExpression::Focus:
			return 3500.0f;
		}
		return 2000.0f;
	}

	float ContextualExpressionSystem::jittered_duration_ms(float base_ms)
	{
		const float variation = (random_source.next_unit() - 0.5f) * 0.4f;
		const float adjusted_ms = base_ms * (1.0f + variation);
		return robotick::max(config.min_expression_duration_ms, robotick::min(config.max_expression_duration_ms, adjusted_ms));
	}

	void ContextualExpressionSystem::apply_manual(ManualExpression kind, EmotionType emotion, float intensity)
	{
		EmotionalContext context;
		context.primary = emotion;
		context.intensity = intensity * config.expression_intensity;
		context.cultural_modifier = config.cultural_sensitivity;
		context.duration_ms = jittered_duration_ms(base_duration_ms(kind));

		engine.apply_expression(engine.get_emotional_expression(context));
	}

	void ContextualExpressionSystem::apply_positive_expression(float intensity)
	{
		apply_manual(ManualExpression::Positive, EmotionType::Joy, intensity);
	}

	void ContextualExpressionSystem::apply_concern_expression(float intensity)
	{
		apply_manual(ManualExpression::Concern, EmotionType::Concern, intensity);
	}

	void ContextualExpressionSystem::apply_excitement_expression(float intensity)
	{
		apply_manual(ManualExpression::Excitement, EmotionType::Excitement, intensity);
	}

	void ContextualExpressionSystem::apply_focus_expression(float intensity)
	{
		apply_manual(ManualExpression::Focus, EmotionType::Focus, intensity);
	}

	void ContextualExpressionSystem::update_config(const ContextualExpressionConfig& new_config)
	{
		config = new_config;
	}

	void ContextualExpressionSystem::reset_to_neutral()
	{
		engine.reset_to_neutral();
		current_context.reset();
	}

	void ContextualExpressionSystem::dispose()
	{
		current_context.reset();
	}

} // namespace tutorface
