// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tutorface
{
	enum class ExpressionType : uint8_t
	{
		Smile,
		Concern,
		Excitement,
		Focus,
		Surprise,
		Neutral,
		Joy,
		Sadness,
		Anger,
		Fear,
		Disgust,
		Contempt,
	};

	static constexpr uint8_t expression_type_count = 12;

	enum class EmotionType : uint8_t
	{
		Joy,
		Concern,
		Excitement,
		Focus,
		Surprise,
		Neutral,
		Sadness,
		Anger,
		Fear,
		Disgust,
		Contempt,
	};

	static constexpr uint8_t emotion_type_count = 11;

	enum class BlendMode : uint8_t
	{
		Replace,
		Additive,
		Multiply,
		Linear,
		Smooth,
		EaseInOut,
		CulturalAdaptive,
	};

	enum class EasingFunction : uint8_t
	{
		Linear,
		EaseIn,
		EaseOut,
		EaseInOut,
		Bounce,
		Elastic,
	};

	enum class SentimentType : uint8_t
	{
		Positive,
		Negative,
		Neutral,
	};

	enum class ContentType : uint8_t
	{
		Question,
		Explanation,
		Celebration,
		Instruction,
		Greeting,
		Farewell,
		Concern,
		Excitement,
	};

	struct Vector3
	{
		float x = 0.0f;
		float y = 0.0f;
		float z = 0.0f;

		bool operator==(const Vector3& other) const { return x == other.x && y == other.y && z == other.z; }
		bool operator!=(const Vector3& other) const { return !(*this == other); }
	};

	struct EyeMovement
	{
		Vector3 look_direction{0.0f, 0.0f, 1.0f};
		float blink_rate = 15.0f; // blinks per minute
		float widening = 0.0f;	  // 0..1
		float squinting = 0.0f;	  // 0..1

		bool operator==(const EyeMovement& other) const;
		bool operator!=(const EyeMovement& other) const { return !(*this == other); }
	};

	struct EyebrowPosition
	{
		float left_raise = 0.0f;  // -1 (lowered) .. 1 (raised)
		float right_raise = 0.0f; // -1 .. 1
		float furrow = 0.0f;	  // 0..1

		bool operator==(const EyebrowPosition& other) const;
		bool operator!=(const EyebrowPosition& other) const { return !(*this == other); }
	};

	using MorphTargetMap = std::map<std::string, float>;

	struct FacialExpression
	{
		ExpressionType type = ExpressionType::Neutral;
		float intensity = 0.0f; // 0..1
		float duration_ms = 1000.0f;
		MorphTargetMap morph_targets;
		EyeMovement eye_movement;
		EyebrowPosition eyebrow;
		BlendMode blend_mode = BlendMode::Replace;

		// Deep equality over every field, including the morph map.
		bool operator==(const FacialExpression& other) const;
		bool operator!=(const FacialExpression& other) const { return !(*this == other); }

		// Weight of a morph key, 0 when absent.
		float get_morph(const std::string& key) const;
	};

	struct EmotionalContext
	{
		EmotionType primary = EmotionType::Neutral;
		std::optional<EmotionType> secondary;
		float intensity = 0.0f;
		float cultural_modifier = 1.0f;
		std::optional<float> duration_ms; // overrides the template duration when set
	};

	struct ContentAnalysisResult
	{
		SentimentType sentiment = SentimentType::Neutral;
		float emotional_intensity = 0.5f;
		ContentType content_type = ContentType::Explanation;
		std::vector<std::string> key_phrases;
		std::string cultural_context = "western";
		float confidence = 0.0f;
	};

	// ---------- names ----------

	const char* to_string(ExpressionType type);
	const char* to_string(EmotionType emotion);
	const char* to_string(BlendMode mode);
	const char* to_string(EasingFunction easing);
	const char* to_string(SentimentType sentiment);
	const char* to_string(ContentType content_type);

	// Lower-case names as produced by to_string(). false for an unknown name.
	bool parse_expression_type(const std::string& name, ExpressionType& out_type);
	bool parse_emotion_type(const std::string& name, EmotionType& out_emotion);
	bool parse_easing_function(const std::string& name, EasingFunction& out_easing);
	bool parse_sentiment_type(const std::string& name, SentimentType& out_sentiment);
	bool parse_content_type(const std::string& name, ContentType& out_content_type);

	// ---------- emotion <-> expression tables ----------

	// joy -> smile; concern and the negative emotions -> concern; the rest map to themselves.
	ExpressionType map_emotion_to_expression(EmotionType emotion);
	EmotionType map_expression_to_emotion(ExpressionType type);

} // namespace tutorface
