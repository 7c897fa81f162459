// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#include "tutorface/systems/lipsync/Visemes.h"

#include <catch2/catch_all.hpp>

#include <cstring>

namespace tutorface::test
{
	TEST_CASE("Unit/Systems/LipSync/Visemes")
	{
		SECTION("ARPAbet symbols map onto their mouth shapes")
		{
			CHECK(phoneme_to_viseme("P") == VisemeId::PP);
			CHECK(phoneme_to_viseme("B") == VisemeId::PP);
			CHECK(phoneme_to_viseme("M") == VisemeId::PP);
			CHECK(phoneme_to_viseme("F") == VisemeId::FF);
			CHECK(phoneme_to_viseme("DH") == VisemeId::TH);
			CHECK(phoneme_to_viseme("T") == VisemeId::DD);
			CHECK(phoneme_to_viseme("G") == VisemeId::KK);
			CHECK(phoneme_to_viseme("JH") == VisemeId::CH);
			CHECK(phoneme_to_viseme("Z") == VisemeId::SS);
			CHECK(phoneme_to_viseme("NG") == VisemeId::NN);
			CHECK(phoneme_to_viseme("R") == VisemeId::RR);
			CHECK(phoneme_to_viseme("AE") == VisemeId::AA);
			CHECK(phoneme_to_viseme("EY") == VisemeId::E);
			CHECK(phoneme_to_viseme("IY") == VisemeId::I);
			CHECK(phoneme_to_viseme("OW") == VisemeId::O);
			CHECK(phoneme_to_viseme("UW") == VisemeId::U);
		}

		SECTION("Stress digits and case are ignored")
		{
			CHECK(phoneme_to_viseme("AH0") == VisemeId::AA);
			CHECK(phoneme_to_viseme("iy1") == VisemeId::I);
			CHECK(phoneme_to_viseme("sh") == VisemeId::CH);
		}

		SECTION("Unknown or empty input is silence")
		{
			CHECK(phoneme_to_viseme("") == VisemeId::Sil);
			CHECK(phoneme_to_viseme("XX") == VisemeId::Sil);
			CHECK(phoneme_to_viseme("SIL") == VisemeId::Sil);
			CHECK(phoneme_to_viseme(nullptr) == VisemeId::Sil);
		}

		SECTION("Lookup is pure")
		{
			const char* const phonemes[] = {"AA", "K", "S", "W", "ER", "TH"};
			for (const char* phoneme : phonemes)
			{
				CHECK(::strcmp(viseme_name(phoneme_to_viseme(phoneme)), viseme_name(phoneme_to_viseme(phoneme))) == 0);
			}
		}

		SECTION("Names and morph keys round-trip")
		{
			CHECK(::strcmp(viseme_name(VisemeId::Sil), "sil") == 0);
			CHECK(::strcmp(viseme_morph_key(VisemeId::AA), "viseme_aa") == 0);

			VisemeId id = VisemeId::Sil;
			REQUIRE(viseme_from_name("kk", id));
			CHECK(id == VisemeId::KK);
			CHECK_FALSE(viseme_from_name("zz", id));
		}
	}

} // namespace tutorface::test
