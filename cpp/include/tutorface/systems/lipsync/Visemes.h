// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

namespace tutorface
{
	// The 15 mouth shapes, in index order.
	enum class VisemeId : uint8_t
	{
		Sil = 0,
		PP,
		FF,
		TH,
		DD,
		KK,
		CH,
		SS,
		NN,
		RR,
		AA,
		E,
		I,
		O,
		U,
	};

	static constexpr uint8_t viseme_count = 15;

	struct Viseme
	{
		VisemeId id = VisemeId::Sil;
		float intensity = 0.0f;

		uint8_t index() const { return static_cast<uint8_t>(id); }
	};

	// "sil", "PP", ... "U". Out-of-range ids return "sil".
	const char* viseme_name(VisemeId id);

	// Mesh morph key for the viseme, e.g. "viseme_aa".
	const char* viseme_morph_key(VisemeId id);

	// Reverse of viseme_name(). Returns false for an unknown name.
	bool viseme_from_name(const char* name, VisemeId& out_id);

	/**
	 * @brief Map an ARPAbet phoneme (39 symbols plus SIL) onto its viseme.
	 *
	 * Case-insensitive; lexical stress digits ("AH0", "IY1") are ignored.
	 * Unknown or empty symbols map to silence.
	 */
	VisemeId phoneme_to_viseme(const char* phoneme);

} // namespace tutorface
