// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0
//
// AudioFeatureExtractor.h  (per-frame lip-sync features)

#pragma once

#include "robotick/api.h"
#include "robotick/framework/containers/FixedVector.h"
#include "tutorface/systems/audio/AudioFrame.h"

#include <cstdint>
#include <kissfft/kiss_fftr.h>
#include <stdexcept>

namespace tutorface
{
	struct AudioFeatureExtractorConfig
	{
		uint32_t sample_rate = 48000;

		// Samples per analysis frame. Must be even and fit in an AudioBuffer4096.
		uint16_t frame_size = 1024;

		// Temporal smoothing of the magnitude spectrum across frames, 0 (off) .. <1.
		float spectral_smoothing = 0.0f;
	};

	struct AudioAnalysisFrame
	{
		static constexpr size_t max_spectrum_bins = AudioBuffer4096::capacity() / 2 + 1;
		static constexpr size_t cepstral_count = 13;

		robotick::FixedVector<float, max_spectrum_bins> magnitude_spectrum;

		float amplitude = 0.0f;			 // mean |sample|, 0..1 for normalised audio
		float spectral_centroid = 0.0f;	 // magnitude-weighted bin index / bin count, 0..1
		float spectral_centroid_hz = 0.0f;
		float zero_crossing_rate = 0.0f; // sign changes per sample

		robotick::FixedVector<float, cepstral_count> cepstral;
	};

	// A frame that cannot be analysed (empty, oversized or containing NaN/Inf samples).
	class AudioFeatureError : public std::runtime_error
	{
	  public:
		using std::runtime_error::runtime_error;
	};

	class AudioFeatureExtractor
	{
	  public:
		AudioFeatureExtractor();
		explicit AudioFeatureExtractor(const AudioFeatureExtractorConfig& config);
		~AudioFeatureExtractor();

		AudioFeatureExtractor(const AudioFeatureExtractor&) = delete;
		AudioFeatureExtractor& operator=(const AudioFeatureExtractor&) = delete;

		// Rebuilds window and FFT plan. Returns false (and keeps the previous setup) for an invalid frame size.
		bool configure(const AudioFeatureExtractorConfig& config);
		const AudioFeatureExtractorConfig& get_config() const { return config; }

		// Forget the smoothed spectrum (start of a new utterance).
		void reset();

		// Analyse up to frame_size samples; shorter input is zero-padded. Throws AudioFeatureError.
		void extract(const float* samples, size_t num_samples, AudioAnalysisFrame& out_frame);
		void extract(const AudioFrame& frame, AudioAnalysisFrame& out_frame);

		// ---------- Feature helpers (exposed for unit tests) ----------
		static float compute_amplitude(const float* samples, size_t num_samples);
		static float compute_zero_crossing_rate(const float* samples, size_t num_samples);
		static float compute_spectral_centroid(const float* magnitudes, size_t num_bins);

		// Triangular filter i is centred on bin (i+1)*B/(n+1) with half-width B/n.
		static void compute_cepstral(const float* magnitudes, size_t num_bins, float* out_coefficients, size_t num_coefficients);

	  private:
		void build_window();
		bool plan_fft();
		void release_fft();

		AudioFeatureExtractorConfig config{};

		kiss_fftr_cfg kiss_config_fftr = nullptr;
		robotick::FixedVector<float, AudioBuffer4096::capacity()> window;
		robotick::FixedVector<float, AudioBuffer4096::capacity()> fft_input_time_domain;
		robotick::FixedVector<kiss_fft_cpx, AudioAnalysisFrame::max_spectrum_bins> fft_output_freq_domain;
		robotick::FixedVector<float, AudioAnalysisFrame::max_spectrum_bins> smoothed_magnitude;
		bool has_smoothed_magnitude = false;
		float magnitude_scale = 1.0f;
	};

} // namespace tutorface
