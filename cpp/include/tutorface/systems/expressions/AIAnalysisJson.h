// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "tutorface/systems/expressions/BehaviorContext.h"

#include <string>

namespace tutorface
{
	/**
	 * @brief Readers for the AI pipeline's JSON payloads.
	 *
	 * Keys follow the pipeline's camelCase names, e.g.
	 *   {"sentiment":"positive","emotionalIntensity":0.8,"contentType":"celebration",
	 *    "keyPhrases":["well done"],"confidence":0.9}
	 *   {"culturalRegion":"eastern","language":"ja","formalityLevel":"formal",
	 *    "conversationState":"teaching","previousExpressions":["smile"]}
	 *
	 * Malformed JSON (or a non-object root) returns false and leaves out untouched. Missing
	 * keys keep the values already in out; a key with the wrong type or an unknown enum name is skipped
	 * with a warning.
	 */
	bool parse_ai_content_analysis(const std::string& json_text, AIContentAnalysis& out_analysis);
	bool parse_behavior_context(const std::string& json_text, BehaviorContext& out_context);

} // namespace tutorface
