// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#if defined(ROBOTICK_PLATFORM_DESKTOP) || defined(ROBOTICK_PLATFORM_LINUX)

#include "tutorface/systems/audio/AudioSystem.h"

#include "robotick/api.h"
#include "robotick/framework/concurrency/Sync.h"
#include "robotick/framework/containers/HeapVector.h"

#include <SDL2/SDL.h>
#include <cstdint>

namespace tutorface
{
	namespace
	{
		// Interleaving happens in blocks so a long utterance never needs a second full-size copy.
		constexpr size_t kInterleaveBlockFrames = 2048;

		struct SpeechOutputFormat
		{
			uint32_t sample_rate = 0;
			uint8_t channels = 0;

			bool is_valid() const { return sample_rate != 0 && channels != 0; }
			uint32_t bytes_per_frame() const { return static_cast<uint32_t>(channels * sizeof(float)); }

			float bytes_to_ms(uint32_t num_bytes) const
			{
				if (!is_valid())
					return 0.0f;
				const float num_frames = static_cast<float>(num_bytes) / static_cast<float>(bytes_per_frame());
				return 1000.0f * num_frames / static_cast<float>(sample_rate);
			}

			uint32_t ms_to_bytes(float duration_ms) const
			{
				if (!is_valid() || duration_ms <= 0.0f)
					return 0;
				const double num_bytes = static_cast<double>(duration_ms) * 0.001 * sample_rate * bytes_per_frame();
				return num_bytes < static_cast<double>(UINT32_MAX) ? static_cast<uint32_t>(num_bytes) : 0;
			}
		};

		class SpeechOutputDevice
		{
		  public:
			bool is_open() const { return device_id != 0; }

			bool open(const AudioOutputSettings& settings)
			{
				if (is_open())
					return true;

				if (!acquire_sdl_audio())
					return false;

				SDL_AudioSpec wanted{};
				wanted.freq = static_cast<int>(settings.sample_rate);
				wanted.format = AUDIO_F32SYS;
				wanted.channels = 1;
				wanted.samples = settings.device_buffer_frames;
				wanted.callback = nullptr;

				SDL_AudioSpec granted{};
				device_id = SDL_OpenAudioDevice(nullptr, 0, &wanted, &granted, SDL_AUDIO_ALLOW_CHANNELS_CHANGE);
				if (device_id == 0)
				{
					ROBOTICK_WARNING("AudioSystem - no speech output device: %s", SDL_GetError());
					SDL_ClearError();
					release_sdl_audio();
					return false;
				}

				format.sample_rate = static_cast<uint32_t>(granted.freq);
				format.channels = granted.channels;
				queue_limit_bytes = format.ms_to_bytes(settings.max_queue_seconds * 1000.0f);

				if (interleave_block.size() == 0)
					interleave_block.initialize(kInterleaveBlockFrames * 2);

				SDL_PauseAudioDevice(device_id, 0);
				ROBOTICK_INFO("AudioSystem - speech output open (%u Hz, %u channel(s))", format.sample_rate, static_cast<unsigned>(format.channels));
				return true;
			}

			void close()
			{
				if (is_open())
				{
					SDL_ClearQueuedAudio(device_id);
					SDL_CloseAudioDevice(device_id);
					device_id = 0;
				}
				format = SpeechOutputFormat{};
				queue_limit_bytes = 0;
				release_sdl_audio();
			}

			AudioQueueResult enqueue_mono(const float* mono, size_t num_frames)
			{
				if (!is_open() || mono == nullptr || num_frames == 0)
					return AudioQueueResult::Error;

				if (format.channels == 1)
					return enqueue_bytes(mono, static_cast<uint32_t>(num_frames * sizeof(float)));

				// Device handed back more channels than requested: copy the mono voice into each.
				const uint8_t channels = format.channels;
				const size_t block_frames = interleave_block.size() / channels;
				size_t frames_done = 0;
				while (frames_done < num_frames)
				{
					const size_t block = robotick::min(block_frames, num_frames - frames_done);
					float* out = interleave_block.data();
					for (size_t frame = 0; frame < block; ++frame)
					{
						for (uint8_t channel = 0; channel < channels; ++channel)
							*out++ = mono[frames_done + frame];
					}

					const AudioQueueResult result = enqueue_bytes(interleave_block.data(), static_cast<uint32_t>(block * format.bytes_per_frame()));
					if (result != AudioQueueResult::Success)
						return result;

					frames_done += block;
				}
				return AudioQueueResult::Success;
			}

			float pending_ms() const { return is_open() ? format.bytes_to_ms(SDL_GetQueuedAudioSize(device_id)) : 0.0f; }

			void flush()
			{
				if (is_open())
					SDL_ClearQueuedAudio(device_id);
			}

			void count_drop(uint32_t num_bytes)
			{
				drop_stats.drop_events++;
				drop_stats.dropped_ms += format.bytes_to_ms(num_bytes);
			}

			SpeechOutputFormat format;
			AudioBackpressureStrategy policy = AudioBackpressureStrategy::DropNewest;
			AudioBackpressureStats drop_stats{};

		  private:
			bool acquire_sdl_audio()
			{
				if (SDL_WasInit(SDL_INIT_AUDIO) & SDL_INIT_AUDIO)
					return true;

				if (SDL_InitSubSystem(SDL_INIT_AUDIO) < 0)
				{
					ROBOTICK_WARNING("AudioSystem - SDL audio unavailable: %s", SDL_GetError());
					SDL_ClearError();
					return false;
				}
				started_sdl_audio = true;
				return true;
			}

			void release_sdl_audio()
			{
				if (!started_sdl_audio)
					return;
				SDL_QuitSubSystem(SDL_INIT_AUDIO);
				started_sdl_audio = false;
			}

			// Returns true if the incoming block may be queued.
			bool make_room_for(uint32_t incoming_bytes)
			{
				if (queue_limit_bytes == 0)
					return true;

				const uint32_t pending_bytes = SDL_GetQueuedAudioSize(device_id);
				if (pending_bytes + incoming_bytes <= queue_limit_bytes)
					return true;

				if (policy == AudioBackpressureStrategy::DropNewest || pending_bytes == 0)
				{
					ROBOTICK_WARNING("AudioSystem - speech queue full (%.0fms pending), discarding %.0fms of new speech",
						format.bytes_to_ms(pending_bytes),
						format.bytes_to_ms(incoming_bytes));
					count_drop(incoming_bytes);
					return false;
				}

				ROBOTICK_WARNING("AudioSystem - speech queue full, discarding %.0fms of pending speech", format.bytes_to_ms(pending_bytes));
				SDL_ClearQueuedAudio(device_id);
				count_drop(pending_bytes);

				if (incoming_bytes > queue_limit_bytes)
				{
					count_drop(incoming_bytes);
					return false;
				}
				return true;
			}

			AudioQueueResult enqueue_bytes(const float* samples, uint32_t num_bytes)
			{
				if (!make_room_for(num_bytes))
					return AudioQueueResult::Dropped;

				if (SDL_QueueAudio(device_id, samples, num_bytes) != 0)
				{
					ROBOTICK_WARNING("AudioSystem - SDL_QueueAudio rejected speech: %s", SDL_GetError());
					SDL_ClearError();
					return AudioQueueResult::Error;
				}
				return AudioQueueResult::Success;
			}

			SDL_AudioDeviceID device_id = 0;
			bool started_sdl_audio = false;
			uint32_t queue_limit_bytes = 0;
			robotick::HeapVector<float> interleave_block;
		};

		SpeechOutputDevice& speech_output()
		{
			static SpeechOutputDevice device;
			return device;
		}

		robotick::Mutex& speech_output_mutex()
		{
			static robotick::Mutex mutex;
			return mutex;
		}
	} // namespace

	bool AudioSystem::init(const AudioOutputSettings& settings)
	{
		robotick::LockGuard lock(speech_output_mutex());
		return speech_output().open(settings);
	}

	bool AudioSystem::is_initialized()
	{
		robotick::LockGuard lock(speech_output_mutex());
		return speech_output().is_open();
	}

	uint32_t AudioSystem::get_sample_rate()
	{
		robotick::LockGuard lock(speech_output_mutex());
		return speech_output().format.sample_rate;
	}

	uint8_t AudioSystem::get_output_channels()
	{
		robotick::LockGuard lock(speech_output_mutex());
		return speech_output().format.channels;
	}

	AudioQueueResult AudioSystem::write(const float* mono_samples, size_t frames)
	{
		robotick::LockGuard lock(speech_output_mutex());
		return speech_output().enqueue_mono(mono_samples, frames);
	}

	float AudioSystem::get_queued_ms()
	{
		robotick::LockGuard lock(speech_output_mutex());
		return speech_output().pending_ms();
	}

	void AudioSystem::clear_output()
	{
		robotick::LockGuard lock(speech_output_mutex());
		speech_output().flush();
	}

	void AudioSystem::shutdown()
	{
		robotick::LockGuard lock(speech_output_mutex());
		speech_output().close();
	}

	void AudioSystem::set_backpressure_strategy(AudioBackpressureStrategy strategy)
	{
		robotick::LockGuard lock(speech_output_mutex());
		speech_output().policy = strategy;
	}

	AudioBackpressureStrategy AudioSystem::get_backpressure_strategy()
	{
		robotick::LockGuard lock(speech_output_mutex());
		return speech_output().policy;
	}

	AudioBackpressureStats AudioSystem::get_backpressure_stats()
	{
		robotick::LockGuard lock(speech_output_mutex());
		return speech_output().drop_stats;
	}

	void AudioSystem::reset_backpressure_stats()
	{
		robotick::LockGuard lock(speech_output_mutex());
		speech_output().drop_stats = AudioBackpressureStats{};
	}

	void AudioSystem::record_drop_for_test(uint32_t bytes)
	{
		robotick::LockGuard lock(speech_output_mutex());
		speech_output().count_drop(bytes);
	}

	void AudioSystem::set_output_spec_for_test(uint32_t sample_rate, uint8_t channels)
	{
		robotick::LockGuard lock(speech_output_mutex());
		speech_output().format.sample_rate = sample_rate;
		speech_output().format.channels = channels;
	}

} // namespace tutorface

#endif // ROBOTICK_PLATFORM_DESKTOP || ROBOTICK_PLATFORM_LINUX
