// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>

namespace tutorface
{
	enum class AudioBackpressureStrategy
	{
		DropNewest,
		DropOldest,
	};

	struct AudioBackpressureStats
	{
		uint32_t drop_events = 0;
		float dropped_ms = 0.0f;
	};

	enum class AudioQueueResult
	{
		Success,
		Dropped,
		Error,
	};

	struct AudioOutputSettings
	{
		uint32_t sample_rate = 48000;
		uint16_t device_buffer_frames = 512;

		// Whole utterances are queued at once, so the queue must hold a long sentence.
		float max_queue_seconds = 30.0f;
	};

	/**
	 * @brief Singleton speech-output wrapper for SDL2
	 *
	 * Mono float32 output in queue mode. write() never blocks; when the queue limit is
	 * reached the backpressure strategy decides what is dropped.
	 */
	class AudioSystem
	{
	  public:
		// Open the output device (idempotent). Returns false if SDL audio is unavailable.
		static bool init(const AudioOutputSettings& settings = AudioOutputSettings{});
		static bool is_initialized();

		static uint32_t get_sample_rate();
		static uint8_t get_output_channels();

		// Queue mono samples (duplicated across channels if the device is stereo).
		static AudioQueueResult write(const float* mono_samples, size_t frames);

		// Audio still waiting in the device queue.
		static float get_queued_ms();

		// Drop everything still queued (used when speech is cancelled).
		static void clear_output();

		// Close the device and release SDL audio if we initialised it.
		static void shutdown();

		// Queue-limit policy and drop accounting
		static void set_backpressure_strategy(AudioBackpressureStrategy strategy);
		static AudioBackpressureStrategy get_backpressure_strategy();
		static AudioBackpressureStats get_backpressure_stats();
		static void reset_backpressure_stats();
		static void record_drop_for_test(uint32_t bytes);
		static void set_output_spec_for_test(uint32_t sample_rate, uint8_t channels);
	};

} // namespace tutorface
