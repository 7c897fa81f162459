// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#include "tutorface/systems/lipsync/TextPhonemizer.h"

#include <catch2/catch_all.hpp>

namespace tutorface::test
{
	TEST_CASE("Unit/Systems/LipSync/TextPhonemizer")
	{
		TextPhonemizer phonemizer;

		SECTION("Words are split on whitespace and lower-cased")
		{
			const std::vector<std::string> words = TextPhonemizer::split_words("  Hello, World!  it's\tfine ");
			REQUIRE(words.size() == 4);
			CHECK(words[0] == "hello");
			CHECK(words[1] == "world");
			CHECK(words[2] == "it's");
			CHECK(words[3] == "fine");
		}

		SECTION("Known words use the pronunciation table")
		{
			const std::vector<std::string> phonemes = TextPhonemizer::word_to_phonemes("hello");
			REQUIRE(phonemes.size() == 4);
			CHECK(phonemes[0] == "HH");
			CHECK(phonemes[3] == "OW");
		}

		SECTION("Other words are spelled out")
		{
			const std::vector<std::string> phonemes = TextPhonemizer::word_to_phonemes("cab");
			REQUIRE(phonemes.size() == 3);
			CHECK(phonemes[0] == "K");
			CHECK(phonemes[1] == "AA");
			CHECK(phonemes[2] == "B");

			const std::vector<std::string> numeric = TextPhonemizer::word_to_phonemes("42");
			REQUIRE(numeric.size() == 1);
			CHECK(numeric[0] == "SIL");
		}

		SECTION("Duration follows speaking rate")
		{
			CHECK(phonemizer.estimate_duration_ms("one two three") == Catch::Approx(1200.0f));
			CHECK(phonemizer.estimate_duration_ms("") == 0.0f);
		}

		SECTION("Timeline is ordered, fits the duration and ends each word in silence")
		{
			const PhonemeTimeline timeline = phonemizer.phonemize("hello there", 1000.0f);
			REQUIRE_FALSE(timeline.empty());

			CHECK(timeline.back().phoneme == "SIL");
			CHECK(timeline.front().onset_ms == 0.0f);

			for (size_t i = 1; i < timeline.size(); ++i)
			{
				CHECK(timeline[i].onset_ms >= timeline[i - 1].onset_ms);
				CHECK(timeline[i].onset_ms < 1000.0f);
			}

			size_t silences = 0;
			for (const PhonemeEvent& event : timeline)
			{
				if (event.phoneme == "SIL")
				{
					++silences;
				}
			}
			CHECK(silences == 2);
		}

		SECTION("Empty text gives an empty timeline")
		{
			CHECK(phonemizer.phonemize("   ").empty());
		}
	}

} // namespace tutorface::test
