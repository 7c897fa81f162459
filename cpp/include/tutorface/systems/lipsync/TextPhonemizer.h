// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "tutorface/systems/lipsync/SpeechInterfaces.h"

#include <string>
#include <vector>

namespace tutorface
{
	struct TextPhonemizerConfig
	{
		float words_per_minute = 150.0f;
		float phoneme_confidence = 0.8f;

		// Share of each word's slot given to the trailing silence.
		float pause_fraction = 0.2f;
	};

	/**
	 * @brief Text-only phoneme timeline for speech that has no audio alignment.
	 *
	 * Common words come from a small pronunciation table, anything else is spelled
	 * letter by letter. Every word ends with a SIL event.
	 */
	class TextPhonemizer
	{
	  public:
		TextPhonemizer() = default;
		explicit TextPhonemizer(const TextPhonemizerConfig& config)
			: config(config)
		{
		}

		float estimate_duration_ms(const std::string& text) const;

		// Timeline spread evenly over duration_ms (estimated from the text when <= 0).
		PhonemeTimeline phonemize(const std::string& text, float duration_ms = 0.0f) const;

		static std::vector<std::string> split_words(const std::string& text);
		static std::vector<std::string> word_to_phonemes(const std::string& word);

	  private:
		TextPhonemizerConfig config{};
	};

} // namespace tutorface
