// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#include "tutorface/systems/performance/PerformanceGovernor.h"

#include "robotick/api.h"
#include "robotick/framework/concurrency/Thread.h"

#include <cmath>

#if defined(ROBOTICK_PLATFORM_LINUX)
#include <cstdio>
#include <sys/sysinfo.h>
#include <unistd.h>
#endif

namespace tutorface
{
	const char* to_string(QualityMode mode)
	{
		switch (mode)
		{
		case QualityMode::Off:
			return "off";
		case QualityMode::Low:
			return "low";
		case QualityMode::Medium:
			return "medium";
		case QualityMode::High:
			return "high";
		}
		return "unknown";
	}

#if defined(ROBOTICK_PLATFORM_LINUX)
	namespace
	{
		class ProcessMemoryProbe : public IMemoryProbe
		{
		  public:
			bool sample_memory_usage_pct(float& out_pct) override
			{
				struct sysinfo info
				{
				};
				if (::sysinfo(&info) != 0 || info.totalram == 0)
				{
					return false;
				}

				FILE* statm = ::fopen("/proc/self/statm", "r");
				if (statm == nullptr)
				{
					return false;
				}

				unsigned long total_pages = 0;
				unsigned long resident_pages = 0;
				const int fields_read = ::fscanf(statm, "%lu %lu", &total_pages, &resident_pages);
				::fclose(statm);
				if (fields_read != 2)
				{
					return false;
				}

				const double page_size = static_cast<double>(::sysconf(_SC_PAGESIZE));
				const double resident_bytes = static_cast<double>(resident_pages) * page_size;
				const double total_bytes = static_cast<double>(info.totalram) * static_cast<double>(info.mem_unit);

				out_pct = static_cast<float>(robotick::min(100.0, resident_bytes / total_bytes * 100.0));
				return true;
			}
		};
	} // namespace

	std::unique_ptr<IMemoryProbe> create_process_memory_probe()
	{
		return std::make_unique<ProcessMemoryProbe>();
	}

	DeviceCapabilities DeviceCapabilities::detect()
	{
		DeviceCapabilities capabilities;

		const int concurrency = robotick::Thread::get_hardware_concurrency();
		if (concurrency > 0)
		{
			capabilities.hardware_concurrency = static_cast<uint32_t>(concurrency);
		}

		struct sysinfo info
		{
		};
		if (::sysinfo(&info) == 0 && info.totalram > 0)
		{
			const double total_bytes = static_cast<double>(info.totalram) * static_cast<double>(info.mem_unit);
			capabilities.device_memory_gb = static_cast<float>(total_bytes / (1024.0 * 1024.0 * 1024.0));
		}

		return capabilities;
	}
#else
	std::unique_ptr<IMemoryProbe> create_process_memory_probe()
	{
		return nullptr;
	}

	DeviceCapabilities DeviceCapabilities::detect()
	{
		DeviceCapabilities capabilities;

		const int concurrency = robotick::Thread::get_hardware_concurrency();
		if (concurrency > 0)
		{
			capabilities.hardware_concurrency = static_cast<uint32_t>(concurrency);
		}

		return capabilities;
	}
#endif

	PerformanceGovernor::PerformanceGovernor(
		const ITimeSource& time_source, const DeviceCapabilities& capabilities, IMemoryProbe* memory_probe, const PerformanceGovernorConfig& config)
		: time_source(time_source)
		, capabilities(capabilities)
		, memory_probe(memory_probe)
		, config(config)
	{
		this->config.max_render_samples = robotick::clamp<uint32_t>(config.max_render_samples, 1u, render_window_capacity);
		reset();
	}

	void PerformanceGovernor::start_frame()
	{
		frame_start_ms = time_source.now_ms();
	}

	void PerformanceGovernor::end_frame()
	{
		const double now_ms = time_source.now_ms();
		push_render_time(static_cast<float>(now_ms - frame_start_ms));

		++frame_count;
		if (now_ms - last_metrics_update_ms > config.sample_interval_ms)
		{
			update_metrics(now_ms);
			last_metrics_update_ms = now_ms;
		}
	}

	void PerformanceGovernor::record_frame(float render_time_ms)
	{
		const double now_ms = time_source.now_ms();
		push_render_time(render_time_ms);

		++frame_count;
		if (now_ms - last_metrics_update_ms > config.sample_interval_ms)
		{
			update_metrics(now_ms);
			last_metrics_update_ms = now_ms;
		}
	}

	void PerformanceGovernor::push_render_time(float render_time_ms)
	{
		const float sample = robotick::max(render_time_ms, 0.0f);

		if (render_times.size() < config.max_render_samples)
		{
			render_times.add(sample);
		}
		else
		{
			render_times[render_write_index] = sample;
		}
		render_write_index = (render_write_index + 1) % config.max_render_samples;

		metrics.render_time_ms = sample;
	}

	void PerformanceGovernor::update_metrics(double now_ms)
	{
		const double elapsed_ms = now_ms - last_fps_time_ms;
		if (elapsed_ms > 0.0)
		{
			metrics.fps = static_cast<float>(std::round(static_cast<double>(frame_count) * 1000.0 / elapsed_ms));
		}
		frame_count = 0;
		last_fps_time_ms = now_ms;

		if (!render_times.empty())
		{
			float total_ms = 0.0f;
			for (float render_time_ms : render_times)
			{
				total_ms += render_time_ms;
			}
			const float average_ms = total_ms / static_cast<float>(render_times.size());
			metrics.cpu_usage_pct = robotick::min(100.0f, average_ms / config.target_frame_time_ms * 100.0f);
		}

		metrics.memory_usage_pct = estimate_memory_usage_pct();
	}

	float PerformanceGovernor::estimate_memory_usage_pct()
	{
		float probed_pct = 0.0f;
		if (memory_probe != nullptr && memory_probe->sample_memory_usage_pct(probed_pct))
		{
			return robotick::clamp(probed_pct, 0.0f, 100.0f);
		}

		// Frame-complexity proxy: 2% per over-budget frame in the window.
		uint32_t slow_frames = 0;
		for (float render_time_ms : render_times)
		{
			if (render_time_ms > config.target_frame_time_ms)
			{
				++slow_frames;
			}
		}
		return robotick::min(100.0f, static_cast<float>(slow_frames) * 2.0f);
	}

	QualityMode PerformanceGovernor::recommend_mode(const PerformanceMetrics& metrics, const DeviceCapabilities& capabilities)
	{
		if (metrics.fps < 15.0f || metrics.cpu_usage_pct > 90.0f || metrics.memory_usage_pct > 85.0f)
		{
			return QualityMode::Off;
		}

		if (metrics.fps < 25.0f || metrics.cpu_usage_pct > 70.0f || metrics.memory_usage_pct > 70.0f)
		{
			return QualityMode::Low;
		}

		if (metrics.fps < 45.0f || metrics.cpu_usage_pct > 50.0f || metrics.memory_usage_pct > 50.0f)
		{
			return QualityMode::Medium;
		}

		const bool low_memory_device = capabilities.device_memory_gb.has_value() && *capabilities.device_memory_gb < 4.0f;
		const bool small_textures = capabilities.max_texture_size.has_value() && *capabilities.max_texture_size < 2048;
		if (capabilities.hardware_concurrency < 4 || low_memory_device || small_textures)
		{
			return QualityMode::Medium;
		}

		return QualityMode::High;
	}

	bool PerformanceGovernor::is_performance_degrading() const
	{
		return metrics.fps < 20.0f || metrics.cpu_usage_pct > 80.0f || metrics.memory_usage_pct > 80.0f;
	}

	std::vector<std::string> PerformanceGovernor::get_optimization_suggestions() const
	{
		std::vector<std::string> suggestions;

		if (metrics.fps < 30.0f)
		{
			suggestions.emplace_back("Consider reducing avatar quality or disabling lip sync");
		}
		if (metrics.cpu_usage_pct > 70.0f)
		{
			suggestions.emplace_back("High CPU usage detected - try lowering the update rate");
		}
		if (metrics.memory_usage_pct > 70.0f)
		{
			suggestions.emplace_back("High memory usage - consider restarting the avatar system");
		}
		if (metrics.render_time_ms > 20.0f)
		{
			suggestions.emplace_back("Slow rendering detected - try reducing visual effects");
		}
		if (metrics.audio_latency_ms > 100.0f)
		{
			suggestions.emplace_back("High audio latency - check audio system settings");
		}

		return suggestions;
	}

	void PerformanceGovernor::reset()
	{
		metrics = PerformanceMetrics{};
		render_times.clear();
		render_write_index = 0;
		frame_count = 0;

		const double now_ms = time_source.now_ms();
		frame_start_ms = now_ms;
		last_fps_time_ms = now_ms;
		last_metrics_update_ms = now_ms;
	}

} // namespace tutorface
