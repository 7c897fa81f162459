// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#include "tutorface/systems/expressions/BehaviorContext.h"

namespace tutorface
{
	const char* to_string(FormalityLevel level)
	{
		switch (level)
		{
		case FormalityLevel::Formal:
			return "formal";
		case FormalityLevel::Informal:
			return "informal";
		case FormalityLevel::Casual:
			return "casual";
		}
		return "unknown";
	}

	const char* to_string(ConversationState state)
	{
		switch (state)
		{
		case ConversationState::Greeting:
			return "greeting";
		case ConversationState::Teaching:
			return "teaching";
		case ConversationState::Responding:
			return "responding";
		case ConversationState::Farewell:
			return "farewell";
		}
		return "unknown";
	}

	bool parse_formality_level(const std::string& name, FormalityLevel& out_level)
	{
		for (FormalityLevel level : {FormalityLevel::Formal, FormalityLevel::Informal, FormalityLevel::Casual})
		{
			if (name == to_string(level))
			{
				out_level = level;
				return true;
			}
		}
		return false;
	}

	bool parse_conversation_state(const std::string& name, ConversationState& out_state)
	{
		for (ConversationState state :
			{ConversationState::Greeting, ConversationState::Teaching, ConversationState::Responding, ConversationState::Farewell})
		{
			if (name == to_string(state))
			{
				out_state = state;
				return true;
			}
		}
		return false;
	}

} // namespace tutorface
