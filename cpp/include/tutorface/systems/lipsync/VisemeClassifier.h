// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "robotick/framework/containers/FixedVector.h"
#include "tutorface/systems/MorphWeightBuffer.h"
#include "tutorface/systems/lipsync/AudioFeatureExtractor.h"
#include "tutorface/systems/lipsync/Visemes.h"

namespace tutorface
{
	struct VisemeClassifierConfig
	{
		float intensity_multiplier = 1.5f; // primary viseme intensity = amplitude * multiplier

		float silence_amplitude = 0.01f;
		float secondary_amplitude = 0.05f; // above this a secondary 'aa' opening is added
		float secondary_scale = 0.3f;

		float morph_decay = 0.9f; // applied to all viseme keys before each frame's weights are added

		bool emit_secondary_viseme = true;
	};

	// Primary viseme first, then the optional mouth-opening viseme.
	using VisemeList = robotick::FixedVector<Viseme, 2>;

	struct VisemeClassification
	{
		const char* phoneme = "SIL";
		VisemeList visemes;
	};

	class VisemeClassifier
	{
	  public:
		VisemeClassifier() = default;
		explicit VisemeClassifier(const VisemeClassifierConfig& config)
			: config(config)
		{
		}

		void configure(const VisemeClassifierConfig& new_config) { config = new_config; }
		const VisemeClassifierConfig& get_config() const { return config; }

		/**
		 * @brief Pick the phoneme class for one frame of features.
		 *
		 * Thresholds are checked in order: silence, sibilant, fricative, vowel, nasal, stop,
		 * then the neutral vowel AH. Ties inside a class are broken by a secondary feature.
		 */
		const char* classify_phoneme(const AudioAnalysisFrame& features) const;

		// classify_phoneme() plus viseme intensities.
		void classify(const AudioAnalysisFrame& features, VisemeClassification& out_classification) const;

		// Decay every viseme key in the buffer, then add the new weights (clamped to 1).
		void apply_to_morph_buffer(const VisemeList& visemes, MorphWeightBuffer& buffer) const;

	  private:
		VisemeClassifierConfig config{};
	};

} // namespace tutorface
