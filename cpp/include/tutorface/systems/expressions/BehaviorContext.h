// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "tutorface/systems/expressions/ExpressionTypes.h"

#include <cstdint>
#include <string>
#include <vector>

namespace tutorface
{
	enum class FormalityLevel : uint8_t
	{
		Formal,
		Informal,
		Casual,
	};

	enum class ConversationState : uint8_t
	{
		Greeting,
		Teaching,
		Responding,
		Farewell,
	};

	// Per-call context from the AI pipeline.
	struct BehaviorContext
	{
		std::string cultural_region = "western";
		std::string language = "en";
		FormalityLevel formality_level = FormalityLevel::Informal;
		ConversationState conversation_state = ConversationState::Responding;
		std::vector<std::string> prior_expressions;
	};

	// Sentiment and content analysis of one tutor response.
	struct AIContentAnalysis
	{
		SentimentType sentiment = SentimentType::Neutral;
		float emotional_intensity = 0.5f;
		ContentType content_type = ContentType::Explanation;
		std::vector<std::string> key_phrases;
		float confidence = 0.0f;
	};

	const char* to_string(FormalityLevel level);
	const char* to_string(ConversationState state);

	bool parse_formality_level(const std::string& name, FormalityLevel& out_level);
	bool parse_conversation_state(const std::string& name, ConversationState& out_state);

} // namespace tutorface
