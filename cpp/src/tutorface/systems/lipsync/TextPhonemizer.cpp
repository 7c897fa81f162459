// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#include "tutorface/systems/lipsync/TextPhonemizer.h"

#include "robotick/api.h"

#include <cctype>

namespace tutorface
{
	namespace
	{
		struct WordPronunciation
		{
			const char* word;
			const char* phonemes; // space separated
		};

		constexpr WordPronunciation k_pronunciations[] = {
			{"hello", "HH EH L OW"},
			{"help", "HH EH L P"},
			{"how", "HH AW"},
			{"are", "AA R"},
			{"you", "Y UW"},
			{"today", "T AH D EY"},
			{"good", "G UH D"},
			{"great", "G R EY T"},
			{"step", "S T EH P"},
			{"click", "K L IH K"},
			{"button", "B AH T AH N"},
			{"the", "DH AH"},
			{"and", "AE N D"},
			{"with", "W IH TH"},
			{"this", "DH IH S"},
			{"that", "DH AE T"},
			{"will", "W IH L"},
			{"can", "K AE N"},
			{"now", "N AW"},
			{"see", "S IY"},
			{"get", "G EH T"},
			{"make", "M EY K"},
			{"go", "G OW"},
			{"know", "N OW"},
			{"take", "T EY K"},
			{"come", "K AH M"},
			{"think", "TH IH NG K"},
			{"look", "L UH K"},
			{"want", "W AA N T"},
			{"give", "G IH V"},
			{"use", "Y UW Z"},
			{"find", "F AY N D"},
			{"tell", "T EH L"},
			{"ask", "AE S K"},
			{"work", "W ER K"},
			{"seem", "S IY M"},
			{"feel", "F IY L"},
			{"try", "T R AY"},
			{"leave", "L IY V"},
			{"call", "K AO L"},
		};

		const char* letter_to_phoneme(char letter)
		{
			switch (letter)
			{
			case 'a':
				return "AA";
			case 'e':
				return "EH";
			case 'i':
				return "IH";
			case 'o':
				return "AO";
			case 'u':
				return "UH";
			case 'b':
				return "B";
			case 'c':
			case 'k':
			case 'q':
			case 'x':
				return "K";
			case 'd':
				return "D";
			case 'f':
				return "F";
			case 'g':
				return "G";
			case 'h':
				return "HH";
			case 'j':
				return "JH";
			case 'l':
				return "L";
			case 'm':
				return "M";
			case 'n':
				return "N";
			case 'p':
				return "P";
			case 'r':
				return "R";
			case 's':
				return "S";
			case 't':
				return "T";
			case 'v':
				return "V";
			case 'w':
				return "W";
			case 'y':
				return "Y";
			case 'z':
				return "Z";
			default:
				return nullptr;
			}
		}

		void split_phoneme_string(const char* text, std::vector<std::string>& out_phonemes)
		{
			std::string current;
			for (const char* c = text; *c != '\0'; ++c)
			{
				if (*c == ' ')
				{
					if (!current.empty())
					{
						out_phonemes.push_back(current);
						current.clear();
					}
					continue;
				}
				current.push_back(*c);
			}
			if (!current.empty())
			{
				out_phonemes.push_back(current);
			}
		}
	} // namespace

	std::vector<std::string> TextPhonemizer::split_words(const std::string& text)
	{
		std::vector<std::string> words;
		std::string current;

		for (const char raw : text)
		{
			const unsigned char c = static_cast<unsigned char>(raw);
			if (std::isalnum(c) || raw == '\'')
			{
				current.push_back(static_cast<char>(std::tolower(c)));
			}
			else if (std::isspace(c))
			{
				if (!current.empty())
				{
					words.push_back(current);
					current.clear();
				}
			}
		}

		if (!current.empty())
		{
			words.push_back(current);
		}
		return words;
	}

	std::vector<std::string> TextPhonemizer::word_to_phonemes(const std::string& word)
	{
		std::vector<std::string> phonemes;

		for (const WordPronunciation& entry : k_pronunciations)
		{
			if (word == entry.word)
			{
				split_phoneme_string(entry.phonemes, phonemes);
				return phonemes;
			}
		}

		for (const char letter : word)
		{
			if (const char* phoneme = letter_to_phoneme(letter))
			{
				phonemes.emplace_back(phoneme);
			}
		}

		if (phonemes.empty())
		{
			phonemes.emplace_back("SIL");
		}
		return phonemes;
	}

	float TextPhonemizer::estimate_duration_ms(const std::string& text) const
	{
		const size_t word_count = split_words(text).size();
		const float words_per_minute = robotick::max(config.words_per_minute, 1.0f);
		return static_cast<float>(word_count) / words_per_minute * 60000.0f;
	}

	PhonemeTimeline TextPhonemizer::phonemize(const std::string& text, float duration_ms) const
	{
		PhonemeTimeline timeline;

		const std::vector<std::string> words = split_words(text);
		if (words.empty())
		{
			return timeline;
		}

		const float total_ms = (duration_ms > 0.0f) ? duration_ms : estimate_duration_ms(text);
		const float time_per_word = total_ms / static_cast<float>(words.size());
		const float pause_fraction = robotick::clamp(config.pause_fraction, 0.0f, 0.9f);

		float current_ms = 0.0f;
		for (const std::string& word : words)
		{
			const std::vector<std::string> phonemes = word_to_phonemes(word);

			// n phonemes plus a pause worth pause_fraction of one phoneme fill the word slot
			const float time_per_phoneme = time_per_word / (static_cast<float>(phonemes.size()) + pause_fraction);

			for (const std::string& phoneme : phonemes)
			{
				timeline.push_back(PhonemeEvent{phoneme, current_ms, config.phoneme_confidence});
				current_ms += time_per_phoneme;
			}

			timeline.push_back(PhonemeEvent{"SIL", current_ms, 1.0f});
			current_ms += time_per_phoneme * pause_fraction;
		}

		return timeline;
	}

} // namespace tutorface
