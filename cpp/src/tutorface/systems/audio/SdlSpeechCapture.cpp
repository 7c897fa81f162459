// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#include "tutorface/systems/audio/SdlSpeechCapture.h"

#include "robotick/api.h"

#include <cmath>

namespace tutorface
{
	bool SdlSpeechCapture::initialize()
	{
		return AudioSystem::init(settings);
	}

	void SdlSpeechCapture::resample_linear(const std::vector<float>& input, uint32_t input_rate, uint32_t output_rate, std::vector<float>& output)
	{
		output.clear();
		if (input.empty() || input_rate == 0 || output_rate == 0)
		{
			return;
		}

		if (input_rate == output_rate)
		{
			output = input;
			return;
		}

		const double step = static_cast<double>(input_rate) / static_cast<double>(output_rate);
		const size_t output_count = static_cast<size_t>(std::floor(static_cast<double>(input.size()) / step));
		output.resize(output_count);

		for (size_t i = 0; i < output_count; ++i)
		{
			const double position = static_cast<double>(i) * step;
			const size_t index = static_cast<size_t>(position);
			const size_t next = robotick::min(index + 1, input.size() - 1);
			const float frac = static_cast<float>(position - static_cast<double>(index));
			output[i] = input[index] + (input[next] - input[index]) * frac;
		}
	}

	bool SdlSpeechCapture::start(const SynthesizedSpeech& speech, uint16_t requested_frame_size, AudioFrameCallback on_frame)
	{
		stop();

		if (!AudioSystem::is_initialized())
		{
			ROBOTICK_WARNING("SdlSpeechCapture - start() called before the audio device was opened");
			return false;
		}

		if (speech.samples.empty() || requested_frame_size == 0)
		{
			return false;
		}

		playback_rate = AudioSystem::get_sample_rate();
		resample_linear(speech.samples, speech.sample_rate, playback_rate, playback_samples);
		if (playback_samples.empty())
		{
			return false;
		}

		const AudioQueueResult result = AudioSystem::write(playback_samples.data(), playback_samples.size());
		if (result == AudioQueueResult::Error)
		{
			ROBOTICK_WARNING("SdlSpeechCapture - failed to queue speech for playback");
			return false;
		}
		if (result == AudioQueueResult::Dropped)
		{
			ROBOTICK_WARNING("SdlSpeechCapture - speech exceeded the output queue; some audio was dropped");
		}

		++playback_session;
		frame_size = static_cast<uint16_t>(robotick::min<size_t>(requested_frame_size, AudioBuffer4096::capacity()));
		frame_callback = robotick::move(on_frame);
		next_frame_offset = 0;
		playback_ms = static_cast<float>(playback_samples.size()) * 1000.0f / static_cast<float>(playback_rate);
		running = true;
		return true;
	}

	void SdlSpeechCapture::pump()
	{
		if (!running)
		{
			return;
		}

		const float queued_ms = AudioSystem::get_queued_ms();
		const float played_ms = robotick::clamp(playback_ms - queued_ms, 0.0f, playback_ms);

		size_t played_samples = static_cast<size_t>(played_ms * 0.001f * static_cast<float>(playback_rate));
		if (queued_ms <= 0.0f)
		{
			played_samples = playback_samples.size();
		}

		// The frame callback may stop or restart playback; bail out as soon as it does.
		while (next_frame_offset + frame_size <= played_samples)
		{
			const size_t offset = next_frame_offset;
			next_frame_offset += frame_size;
			if (!emit_frame(offset, frame_size))
			{
				return;
			}
		}

		if (queued_ms <= 0.0f)
		{
			const size_t offset = next_frame_offset;
			next_frame_offset = playback_samples.size();
			if (offset < playback_samples.size() && !emit_frame(offset, playback_samples.size() - offset))
			{
				return;
			}
			running = false;
		}
	}

	bool SdlSpeechCapture::emit_frame(size_t offset, size_t count)
	{
		frame.samples.set_size(count);
		for (size_t i = 0; i < count; ++i)
		{
			frame.samples[i] = playback_samples[offset + i];
		}
		frame.sample_rate = playback_rate;
		frame.timestamp = static_cast<double>(offset) / static_cast<double>(playback_rate);

		if (!frame_callback)
		{
			return true;
		}

		// Run the callback from a local so stop() inside it cannot destroy it mid-call.
		const uint32_t emitting_session = playback_session;
		AudioFrameCallback callback(robotick::move(frame_callback));
		frame_callback = AudioFrameCallback();

		callback(frame);

		if (!running || playback_session != emitting_session)
		{
			return false;
		}

		frame_callback = robotick::move(callback);
		return true;
	}

	void SdlSpeechCapture::stop()
	{
		if (!running)
		{
			return;
		}

		AudioSystem::clear_output();
		++playback_session;
		running = false;
		next_frame_offset = 0;
		playback_samples.clear();
		frame_callback = AudioFrameCallback();
	}

} // namespace tutorface
