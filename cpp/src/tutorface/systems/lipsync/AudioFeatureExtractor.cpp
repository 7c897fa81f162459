// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0
//
// AudioFeatureExtractor.cpp

#include "tutorface/systems/lipsync/AudioFeatureExtractor.h"

#include <cmath>

namespace tutorface
{
	namespace
	{
		constexpr float k_log_floor = 1e-10f;

		bool is_valid_frame_size(uint16_t frame_size)
		{
			return frame_size >= 16 && (frame_size % 2) == 0 && frame_size <= AudioBuffer4096::capacity();
		}
	} // namespace

	AudioFeatureExtractor::AudioFeatureExtractor()
		: AudioFeatureExtractor(AudioFeatureExtractorConfig{})
	{
	}

	AudioFeatureExtractor::AudioFeatureExtractor(const AudioFeatureExtractorConfig& initial_config)
	{
		if (!configure(initial_config))
		{
			configure(AudioFeatureExtractorConfig{});
		}
	}

	AudioFeatureExtractor::~AudioFeatureExtractor()
	{
		release_fft();
	}

	bool AudioFeatureExtractor::configure(const AudioFeatureExtractorConfig& new_config)
	{
		if (!is_valid_frame_size(new_config.frame_size))
		{
			ROBOTICK_WARNING("AudioFeatureExtractor - frame_size %u must be even and within [16, %u]; keeping %u",
				static_cast<unsigned>(new_config.frame_size),
				static_cast<unsigned>(AudioBuffer4096::capacity()),
				static_cast<unsigned>(config.frame_size));
			return false;
		}

		config = new_config;
		config.spectral_smoothing = robotick::clamp(config.spectral_smoothing, 0.0f, 0.99f);
		build_window();
		reset();
		return plan_fft();
	}

	void AudioFeatureExtractor::reset()
	{
		smoothed_magnitude.set_size(config.frame_size / 2 + 1);
		smoothed_magnitude.fill(0.0f);
		has_smoothed_magnitude = false;
	}

	// ---------------- Window/FFT planning ----------------

	void AudioFeatureExtractor::build_window()
	{
		const size_t frame_size = config.frame_size;
		window.set_size(frame_size);

		double window_sum = 0.0;
		for (size_t sample_index = 0; sample_index < frame_size; ++sample_index)
		{
			// Hann window: w[n] = 0.5 * (1 - cos(2*pi*n/(N-1))).
			const float window_value =
				0.5f * (1.0f - std::cos(2.0f * static_cast<float>(M_PI) * static_cast<float>(sample_index) / static_cast<float>(frame_size - 1)));
			window[sample_index] = window_value;
			window_sum += window_value;
		}

		// Single-sided amplitude spectrum: a full-scale sine reads ~1.0 in its bin.
		magnitude_scale = (window_sum > 0.0) ? static_cast<float>(2.0 / window_sum) : 1.0f;
	}

	bool AudioFeatureExtractor::plan_fft()
	{
		release_fft();

		kiss_config_fftr = kiss_fftr_alloc(static_cast<int>(config.frame_size), 0, nullptr, nullptr);
		if (kiss_config_fftr == nullptr)
		{
			ROBOTICK_WARNING("AudioFeatureExtractor - kiss_fftr_alloc failed for frame_size %u", static_cast<unsigned>(config.frame_size));
			return false;
		}

		fft_input_time_domain.set_size(config.frame_size);
		fft_output_freq_domain.set_size(config.frame_size / 2 + 1);
		return true;
	}

	void AudioFeatureExtractor::release_fft()
	{
		if (kiss_config_fftr != nullptr)
		{
			kiss_fftr_free(kiss_config_fftr);
			kiss_config_fftr = nullptr;
		}
	}

	// ---------------- Feature helpers ----------------

	float AudioFeatureExtractor::compute_amplitude(const float* samples, size_t num_samples)
	{
		if (samples == nullptr || num_samples == 0)
		{
			return 0.0f;
		}

		double magnitude_sum = 0.0;
		for (size_t i = 0; i < num_samples; ++i)
		{
			magnitude_sum += std::fabs(samples[i]);
		}
		return static_cast<float>(magnitude_sum / static_cast<double>(num_samples));
	}

	float AudioFeatureExtractor::compute_zero_crossing_rate(const float* samples, size_t num_samples)
	{
		if (samples == nullptr || num_samples < 2)
		{
			return 0.0f;
		}

		size_t crossings = 0;
		for (size_t i = 1; i < num_samples; ++i)
		{
			if ((samples[i] >= 0.0f) != (samples[i - 1] >= 0.0f))
			{
				++crossings;
			}
		}
		return static_cast<float>(crossings) / static_cast<float>(num_samples);
	}

	float AudioFeatureExtractor::compute_spectral_centroid(const float* magnitudes, size_t num_bins)
	{
		if (magnitudes == nullptr || num_bins == 0)
		{
			return 0.0f;
		}

		double weighted_sum = 0.0;
		double magnitude_sum = 0.0;
		for (size_t bin = 0; bin < num_bins; ++bin)
		{
			weighted_sum += static_cast<double>(bin) * magnitudes[bin];
			magnitude_sum += magnitudes[bin];
		}

		if (magnitude_sum <= 0.0)
		{
			return 0.0f;
		}

		return static_cast<float>((weighted_sum / magnitude_sum) / static_cast<double>(num_bins));
	}

	void AudioFeatureExtractor::compute_cepstral(const float* magnitudes, size_t num_bins, float* out_coefficients, size_t num_coefficients)
	{
		if (out_coefficients == nullptr || num_coefficients == 0)
		{
			return;
		}

		const float bin_count = static_cast<float>(num_bins);
		const float filter_width = bin_count / static_cast<float>(num_coefficients);

		for (size_t filter_index = 0; filter_index < num_coefficients; ++filter_index)
		{
			const float center = static_cast<float>(filter_index + 1) * bin_count / static_cast<float>(num_coefficients + 1);

			double filtered_energy = 0.0;
			if (magnitudes != nullptr && filter_width > 0.0f)
			{
				for (size_t bin = 0; bin < num_bins; ++bin)
				{
					const float distance = std::fabs(static_cast<float>(bin) - center);
					if (distance < filter_width)
					{
						filtered_energy += magnitudes[bin] * (1.0f - distance / filter_width);
					}
				}
			}

			out_coefficients[filter_index] = std::log(robotick::max(static_cast<float>(filtered_energy), k_log_floor));
		}
	}

	// ---------------- Analysis ----------------

	void AudioFeatureExtractor::extract(const AudioFrame& frame, AudioAnalysisFrame& out_frame)
	{
		extract(frame.samples.data(), frame.samples.size(), out_frame);
	}

	void AudioFeatureExtractor::extract(const float* samples, size_t num_samples, AudioAnalysisFrame& out_frame)
	{
		if (samples == nullptr || num_samples == 0)
		{
			throw AudioFeatureError("empty audio frame");
		}

		if (num_samples > config.frame_size)
		{
			throw AudioFeatureError("audio frame larger than the configured frame_size");
		}

		if (kiss_config_fftr == nullptr)
		{
			throw AudioFeatureError("FFT plan unavailable");
		}

		for (size_t i = 0; i < num_samples; ++i)
		{
			if (!std::isfinite(samples[i]))
			{
				throw AudioFeatureError("audio frame contains non-finite samples");
			}
		}

		// Time-domain features use only the real samples.
		out_frame.amplitude = compute_amplitude(samples, num_samples);
		out_frame.zero_crossing_rate = compute_zero_crossing_rate(samples, num_samples);

		// Windowed, zero-padded FFT input.
		const size_t frame_size = config.frame_size;
		for (size_t i = 0; i < frame_size; ++i)
		{
			fft_input_time_domain[i] = (i < num_samples) ? samples[i] * window[i] : 0.0f;
		}

		kiss_fftr(kiss_config_fftr, fft_input_time_domain.data(), fft_output_freq_domain.data());

		const size_t num_bins = frame_size / 2 + 1;
		const float smoothing = has_smoothed_magnitude ? config.spectral_smoothing : 0.0f;
		out_frame.magnitude_spectrum.set_size(num_bins);
		for (size_t bin = 0; bin < num_bins; ++bin)
		{
			const kiss_fft_cpx& value = fft_output_freq_domain[bin];
			const float magnitude = std::sqrt(value.r * value.r + value.i * value.i) * magnitude_scale;

			// X[k] = s * X_prev[k] + (1 - s) * |X[k]|
			smoothed_magnitude[bin] = smoothing * smoothed_magnitude[bin] + (1.0f - smoothing) * magnitude;
			out_frame.magnitude_spectrum[bin] = smoothed_magnitude[bin];
		}
		has_smoothed_magnitude = true;

		out_frame.spectral_centroid = compute_spectral_centroid(out_frame.magnitude_spectrum.data(), num_bins);
		out_frame.spectral_centroid_hz = out_frame.spectral_centroid * 0.5f * static_cast<float>(config.sample_rate);

		out_frame.cepstral.set_size(AudioAnalysisFrame::cepstral_count);
		compute_cepstral(out_frame.magnitude_spectrum.data(), num_bins, out_frame.cepstral.data(), AudioAnalysisFrame::cepstral_count);
	}

} // namespace tutorface
