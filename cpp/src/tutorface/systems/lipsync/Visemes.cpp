// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#include "tutorface/systems/lipsync/Visemes.h"

#include <cctype>
#include <cstring>

namespace tutorface
{
	namespace
	{
		struct VisemeInfo
		{
			const char* name;
			const char* morph_key;
		};

		constexpr VisemeInfo k_visemes[viseme_count] = {
			{"sil", "viseme_sil"},
			{"PP", "viseme_PP"},
			{"FF", "viseme_FF"},
			{"TH", "viseme_TH"},
			{"DD", "viseme_DD"},
			{"kk", "viseme_kk"},
			{"CH", "viseme_CH"},
			{"SS", "viseme_SS"},
			{"nn", "viseme_nn"},
			{"RR", "viseme_RR"},
			{"aa", "viseme_aa"},
			{"E", "viseme_E"},
			{"I", "viseme_I"},
			{"O", "viseme_O"},
			{"U", "viseme_U"},
		};

		struct PhonemeMapping
		{
			const char* phoneme;
			VisemeId viseme;
		};

		// ARPAbet (CMU dictionary set) grouped by place of articulation.
		constexpr PhonemeMapping k_phoneme_table[] = {
			{"SIL", VisemeId::Sil},

			// bilabials
			{"P", VisemeId::PP},
			{"B", VisemeId::PP},
			{"M", VisemeId::PP},

			// labiodentals
			{"F", VisemeId::FF},
			{"V", VisemeId::FF},

			// dentals
			{"TH", VisemeId::TH},
			{"DH", VisemeId::TH},

			// alveolar stops
			{"T", VisemeId::DD},
			{"D", VisemeId::DD},

			// laterals and nasals
			{"N", VisemeId::NN},
			{"L", VisemeId::NN},
			{"NG", VisemeId::NN},

			// sibilants
			{"S", VisemeId::SS},
			{"Z", VisemeId::SS},

			// post-alveolars
			{"SH", VisemeId::CH},
			{"ZH", VisemeId::CH},
			{"CH", VisemeId::CH},
			{"JH", VisemeId::CH},

			// rhotic
			{"R", VisemeId::RR},

			// velars
			{"K", VisemeId::KK},
			{"G", VisemeId::KK},

			// open vowels (and the glottal HH, which takes the following vowel's open jaw)
			{"AA", VisemeId::AA},
			{"AE", VisemeId::AA},
			{"AH", VisemeId::AA},
			{"AW", VisemeId::AA},
			{"AY", VisemeId::AA},
			{"HH", VisemeId::AA},

			// mid vowels
			{"EH", VisemeId::E},
			{"ER", VisemeId::E},
			{"EY", VisemeId::E},

			// close front vowels and the palatal glide
			{"IH", VisemeId::I},
			{"IY", VisemeId::I},
			{"Y", VisemeId::I},

			// rounded back vowels
			{"AO", VisemeId::O},
			{"OW", VisemeId::O},
			{"OY", VisemeId::O},

			// close rounded vowels and the labial glide
			{"UH", VisemeId::U},
			{"UW", VisemeId::U},
			{"W", VisemeId::U},
		};

		constexpr size_t k_max_phoneme_length = 8;
	} // namespace

	const char* viseme_name(VisemeId id)
	{
		const uint8_t index = static_cast<uint8_t>(id);
		return (index < viseme_count) ? k_visemes[index].name : k_visemes[0].name;
	}

	const char* viseme_morph_key(VisemeId id)
	{
		const uint8_t index = static_cast<uint8_t>(id);
		return (index < viseme_count) ? k_visemes[index].morph_key : k_visemes[0].morph_key;
	}

	bool viseme_from_name(const char* name, VisemeId& out_id)
	{
		if (name == nullptr)
		{
			return false;
		}

		for (uint8_t index = 0; index < viseme_count; ++index)
		{
			if (::strcmp(k_visemes[index].name, name) == 0)
			{
				out_id = static_cast<VisemeId>(index);
				return true;
			}
		}
		return false;
	}

	VisemeId phoneme_to_viseme(const char* phoneme)
	{
		if (phoneme == nullptr || phoneme[0] == '\0')
		{
			return VisemeId::Sil;
		}

		// Normalise to upper case and strip stress markers.
		char symbol[k_max_phoneme_length + 1] = {};
		size_t length = 0;
		for (const char* c = phoneme; *c != '\0'; ++c)
		{
			if (std::isdigit(static_cast<unsigned char>(*c)))
			{
				continue;
			}
			if (length == k_max_phoneme_length)
			{
				return VisemeId::Sil;
			}
			symbol[length++] = static_cast<char>(std::toupper(static_cast<unsigned char>(*c)));
		}

		for (const PhonemeMapping& mapping : k_phoneme_table)
		{
			if (::strcmp(mapping.phoneme, symbol) == 0)
			{
				return mapping.viseme;
			}
		}

		return VisemeId::Sil;
	}

} // namespace tutorface
