// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#include "tutorface/systems/lipsync/VisemeClassifier.h"

#include "robotick/api.h"

namespace tutorface
{
	const char* VisemeClassifier::classify_phoneme(const AudioAnalysisFrame& features) const
	{
		const float amplitude = features.amplitude;
		const float centroid = features.spectral_centroid;
		const float zcr = features.zero_crossing_rate;

		if (amplitude < config.silence_amplitude)
		{
			return "SIL";
		}

		// Sibilants: bright and noisy. The brightest go to S, the rest to SH.
		if (centroid > 0.7f && zcr > 0.1f)
		{
			return (centroid > 0.8f) ? "S" : "SH";
		}

		// Fricatives: bright with some energy. Noisier frames read as F, smoother as TH.
		if (centroid > 0.6f && amplitude > 0.05f)
		{
			return (zcr > 0.15f) ? "F" : "TH";
		}

		// Vowels: dark and loud, told apart by the shape of the low cepstrum.
		if (centroid < 0.4f && amplitude > 0.1f)
		{
			const float c1 = (features.cepstral.size() > 1) ? features.cepstral[1] : 0.0f;
			const float c2 = (features.cepstral.size() > 2) ? features.cepstral[2] : 0.0f;
			if (c1 > c2)
			{
				return "AA"; // open
			}
			if (c2 > c1)
			{
				return "IY"; // close
			}
			return "EH"; // mid
		}

		// Nasals: mid brightness, very few sign changes.
		if (centroid > 0.3f && centroid < 0.6f && zcr < 0.05f)
		{
			return "M";
		}

		// Stops: dark bursts. The darkest are bilabial.
		if (centroid < 0.3f)
		{
			return (centroid < 0.15f) ? "P" : "T";
		}

		return "AH";
	}

	void VisemeClassifier::classify(const AudioAnalysisFrame& features, VisemeClassification& out_classification) const
	{
		out_classification.visemes.clear();
		out_classification.phoneme = classify_phoneme(features);

		const VisemeId primary = phoneme_to_viseme(out_classification.phoneme);

		if (primary == VisemeId::Sil)
		{
			// Silence is a full-strength closed mouth regardless of the other features.
			out_classification.visemes.add(Viseme{VisemeId::Sil, 1.0f});
			return;
		}

		const float primary_intensity = robotick::clamp(features.amplitude * config.intensity_multiplier, 0.0f, 1.0f);
		out_classification.visemes.add(Viseme{primary, primary_intensity});

		if (config.emit_secondary_viseme && features.amplitude > config.secondary_amplitude)
		{
			const float opening = robotick::clamp(features.amplitude * config.secondary_scale, 0.0f, 1.0f);
			out_classification.visemes.add(Viseme{VisemeId::AA, opening});
		}
	}

	void VisemeClassifier::apply_to_morph_buffer(const VisemeList& visemes, MorphWeightBuffer& buffer) const
	{
		buffer.decay(MorphChannel::Viseme, config.morph_decay);

		for (const Viseme& viseme : visemes)
		{
			buffer.add_weight(MorphChannel::Viseme, viseme_morph_key(viseme.id), viseme.intensity);
		}
	}

} // namespace tutorface
