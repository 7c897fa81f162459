// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#include "tutorface/systems/expressions/AIAnalysisJson.h"

#include "robotick/api.h"

#include <nlohmann/json.hpp>

namespace tutorface
{
	namespace
	{
		bool parse_root(const std::string& json_text, const char* what, nlohmann::json& out_root)
		{
			try
			{
				out_root = nlohmann::json::parse(json_text);
			}
			catch (const nlohmann::json::parse_error& error)
			{
				ROBOTICK_WARNING("AIAnalysisJson - ignoring malformed %s: %s", what, error.what());
				return false;
			}

			if (!out_root.is_object())
			{
				ROBOTICK_WARNING("AIAnalysisJson - %s must be a JSON object", what);
				return false;
			}
			return true;
		}

		void read_float(const nlohmann::json& root, const char* key, float& out_value)
		{
			const auto it = root.find(key);
			if (it == root.end())
				return;

			if (!it->is_number())
			{
				ROBOTICK_WARNING("AIAnalysisJson - '%s' must be a number", key);
				return;
			}
			out_value = it->get<float>();
		}

		void read_string(const nlohmann::json& root, const char* key, std::string& out_value)
		{
			const auto it = root.find(key);
			if (it == root.end())
				return;

			if (!it->is_string())
			{
				ROBOTICK_WARNING("AIAnalysisJson - '%s' must be a string", key);
				return;
			}
			out_value = it->get<std::string>();
		}

		void read_string_list(const nlohmann::json& root, const char* key, std::vector<std::string>& out_values)
		{
			const auto it = root.find(key);
			if (it == root.end())
				return;

			if (!it->is_array())
			{
				ROBOTICK_WARNING("AIAnalysisJson - '%s' must be an array of strings", key);
				return;
			}

			out_values.clear();
			for (const nlohmann::json& item : *it)
			{
				if (item.is_string())
					out_values.push_back(item.get<std::string>());
			}
		}

		template <typename EnumT, typename ParseFn> void read_enum(const nlohmann::json& root, const char* key, ParseFn parse, EnumT& out_value)
		{
			std::string name;
			read_string(root, key, name);
			if (name.empty())
				return;

			if (!parse(name, out_value))
			{
				ROBOTICK_WARNING("AIAnalysisJson - unknown %s '%s'", key, name.c_str());
			}
		}
	} // namespace

	bool parse_ai_content_analysis(const std::string& json_text, AIContentAnalysis& out_analysis)
	{
		nlohmann::json root;
		if (!parse_root(json_text, "content analysis", root))
		{
			return false;
		}

		AIContentAnalysis analysis = out_analysis;
		read_enum(root, "sentiment", parse_sentiment_type, analysis.sentiment);
		read_float(root, "emotionalIntensity", analysis.emotional_intensity);
		read_enum(root, "contentType", parse_content_type, analysis.content_type);
		read_string_list(root, "keyPhrases", analysis.key_phrases);
		read_float(root, "confidence", analysis.confidence);

		out_analysis = analysis;
		return true;
	}

	bool parse_behavior_context(const std::string& json_text, BehaviorContext& out_context)
	{
		nlohmann::json root;
		if (!parse_root(json_text, "behavior context", root))
		{
			return false;
		}

		BehaviorContext context = out_context;
		read_string(root, "culturalRegion", context.cultural_region);
		read_string(root, "language", context.language);
		read_enum(root, "formalityLevel", parse_formality_level, context.formality_level);
		read_enum(root, "conversationState", parse_conversation_state, context.conversation_state);
		read_string_list(root, "previousExpressions", context.prior_expressions);

		out_context = context;
		return true;
	}

} // namespace tutorface
