// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#include "tutorface/systems/expressions/ExpressionTypes.h"

#include <cstring>

namespace tutorface
{
	namespace
	{
		constexpr const char* expression_type_names[expression_type_count] = {
			"smile", "concern", "excitement", "focus", "surprise", "neutral", "joy", "sadness", "anger", "fear", "disgust", "contempt"};

		constexpr const char* emotion_type_names[emotion_type_count] = {
			"joy", "concern", "excitement", "focus", "surprise", "neutral", "sadness", "anger", "fear", "disgust", "contempt"};

		constexpr const char* blend_mode_names[] = {"replace", "additive", "multiply", "linear", "smooth", "ease_in_out", "cultural_adaptive"};

		constexpr const char* easing_names[] = {"linear", "ease_in", "ease_out", "ease_in_out", "bounce", "elastic"};

		constexpr const char* sentiment_names[] = {"positive", "negative", "neutral"};

		constexpr const char* content_type_names[] = {
			"question", "explanation", "celebration", "instruction", "greeting", "farewell", "concern", "excitement"};

		// Indexed by EmotionType.
		constexpr ExpressionType emotion_to_expression[emotion_type_count] = {
			ExpressionType::Smile,		// joy
			ExpressionType::Concern,	// concern
			ExpressionType::Excitement, // excitement
			ExpressionType::Focus,		// focus
			ExpressionType::Surprise,	// surprise
			ExpressionType::Neutral,	// neutral
			ExpressionType::Concern,	// sadness
			ExpressionType::Concern,	// anger
			ExpressionType::Concern,	// fear
			ExpressionType::Concern,	// disgust
			ExpressionType::Concern,	// contempt
		};

		// Indexed by ExpressionType.
		constexpr EmotionType expression_to_emotion[expression_type_count] = {
			EmotionType::Joy,		 // smile
			EmotionType::Concern,	 // concern
			EmotionType::Excitement, // excitement
			EmotionType::Focus,		 // focus
			EmotionType::Surprise,	 // surprise
			EmotionType::Neutral,	 // neutral
			EmotionType::Joy,		 // joy
			EmotionType::Sadness,	 // sadness
			EmotionType::Anger,		 // anger
			EmotionType::Fear,		 // fear
			EmotionType::Disgust,	 // disgust
			EmotionType::Contempt,	 // contempt
		};

		template <typename EnumT, size_t N> const char* lookup_name(const char* const (&names)[N], EnumT value)
		{
			const size_t index = static_cast<size_t>(value);
			return index < N ? names[index] : "unknown";
		}

		template <typename EnumT, size_t N> bool lookup_value(const char* const (&names)[N], const std::string& name, EnumT& out_value)
		{
			for (size_t i = 0; i < N; ++i)
			{
				if (::strcmp(names[i], name.c_str()) == 0)
				{
					out_value = static_cast<EnumT>(i);
					return true;
				}
			}
			return false;
		}
	} // namespace

	bool EyeMovement::operator==(const EyeMovement& other) const
	{
		return look_direction == other.look_direction && blink_rate == other.blink_rate && widening == other.widening &&
			   squinting == other.squinting;
	}

	bool EyebrowPosition::operator==(const EyebrowPosition& other) const
	{
		return left_raise == other.left_raise && right_raise == other.right_raise && furrow == other.furrow;
	}

	bool FacialExpression::operator==(const FacialExpression& other) const
	{
		return type == other.type && intensity == other.intensity && duration_ms == other.duration_ms && morph_targets == other.morph_targets &&
			   eye_movement == other.eye_movement && eyebrow == other.eyebrow && blend_mode == other.blend_mode;
	}

	float FacialExpression::get_morph(const std::string& key) const
	{
		const auto it = morph_targets.find(key);
		return it != morph_targets.end() ? it->second : 0.0f;
	}

	const char* to_string(ExpressionType type)
	{
		return lookup_name(expression_type_names, type);
	}

	const char* to_string(EmotionType emotion)
	{
		return lookup_name(emotion_type_names, emotion);
	}

	const char* to_string(BlendMode mode)
	{
		return lookup_name(blend_mode_names, mode);
	}

	const char* to_string(EasingFunction easing)
	{
		return lookup_name(easing_names, easing);
	}

	const char* to_string(SentimentType sentiment)
	{
		return lookup_name(sentiment_names, sentiment);
	}

	const char* to_string(ContentType content_type)
	{
		return lookup_name(content_type_names, content_type);
	}

	bool parse_expression_type(const std::string& name, ExpressionType& out_type)
	{
		return lookup_value(expression_type_names, name, out_type);
	}

	bool parse_emotion_type(const std::string& name, EmotionType& out_emotion)
	{
		return lookup_value(emotion_type_names, name, out_emotion);
	}

	bool parse_easing_function(const std::string& name, EasingFunction& out_easing)
	{
		return lookup_value(easing_names, name, out_easing);
	}

	bool parse_sentiment_type(const std::string& name, SentimentType& out_sentiment)
	{
		return lookup_value(sentiment_names, name, out_sentiment);
	}

	bool parse_content_type(const std::string& name, ContentType& out_content_type)
	{
		return lookup_value(content_type_names, name, out_content_type);
	}

	ExpressionType map_emotion_to_expression(EmotionType emotion)
	{
		const size_t index = static_cast<size_t>(emotion);
		return index < emotion_type_count ? emotion_to_expression[index] : ExpressionType::Neutral;
	}

	EmotionType map_expression_to_emotion(ExpressionType type)
	{
		const size_t index = static_cast<size_t>(type);
		return index < expression_type_count ? expression_to_emotion[index] : EmotionType::Neutral;
	}

} // namespace tutorface
