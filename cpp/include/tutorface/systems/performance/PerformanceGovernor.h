// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "robotick/framework/containers/FixedVector.h"
#include "tutorface/systems/TimeSource.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tutorface
{
	// Quality tier, lowest first. Consumers coarsen or skip work below High.
	enum class QualityMode : uint8_t
	{
		Off,
		Low,
		Medium,
		High,
	};

	const char* to_string(QualityMode mode);

	struct PerformanceMetrics
	{
		float fps = 60.0f;
		float cpu_usage_pct = 0.0f;
		float memory_usage_pct = 0.0f;
		float render_time_ms = 0.0f; // most recent frame
		float audio_latency_ms = 0.0f;
	};

	struct DeviceCapabilities
	{
		uint32_t hardware_concurrency = 4;
		std::optional<float> device_memory_gb;
		std::optional<uint32_t> max_texture_size; // reported by the renderer, if any

		// Concurrency from the framework, memory from the OS where available.
		static DeviceCapabilities detect();
	};

	class IMemoryProbe
	{
	  public:
		virtual ~IMemoryProbe() = default;

		// Process memory use as a percentage of what is available. false if unknown.
		virtual bool sample_memory_usage_pct(float& out_pct) = 0;
	};

	// Resident set size over physical RAM. nullptr on platforms without /proc.
	std::unique_ptr<IMemoryProbe> create_process_memory_probe();

	struct PerformanceGovernorConfig
	{
		double sample_interval_ms = 1000.0;
		uint32_t max_render_samples = 60;
		float target_frame_time_ms = 16.67f; // 60 fps budget
	};

	/**
	 * @brief Rolling frame-time monitor that recommends a quality tier.
	 *
	 * The host brackets each rendered frame with start_frame()/end_frame(). Metrics are
	 * recomputed at most once per sample interval from a window of recent render times.
	 * The recommendation is advisory; consumers poll get_recommended_mode().
	 */
	class PerformanceGovernor
	{
	  public:
		static constexpr uint32_t render_window_capacity = 60;

		explicit PerformanceGovernor(const ITimeSource& time_source,
			const DeviceCapabilities& capabilities = DeviceCapabilities{},
			IMemoryProbe* memory_probe = nullptr,
			const PerformanceGovernorConfig& config = PerformanceGovernorConfig{});

		void start_frame();
		void end_frame();

		// Equivalent to a start_frame()/end_frame() pair that took render_time_ms.
		void record_frame(float render_time_ms);

		void set_audio_latency(float latency_ms) { metrics.audio_latency_ms = latency_ms; }

		const PerformanceMetrics& get_metrics() const { return metrics; }
		const DeviceCapabilities& get_device_capabilities() const { return capabilities; }

		QualityMode get_recommended_mode() const { return recommend_mode(metrics, capabilities); }
		static QualityMode recommend_mode(const PerformanceMetrics& metrics, const DeviceCapabilities& capabilities);

		bool is_performance_degrading() const;
		std::vector<std::string> get_optimization_suggestions() const;

		void reset();

	  private:
		void push_render_time(float render_time_ms);
		void update_metrics(double now_ms);
		float estimate_memory_usage_pct();

		const ITimeSource& time_source;
		DeviceCapabilities capabilities;
		IMemoryProbe* memory_probe = nullptr;
		PerformanceGovernorConfig config{};

		PerformanceMetrics metrics{};

		robotick::FixedVector<float, render_window_capacity> render_times;
		size_t render_write_index = 0;

		uint32_t frame_count = 0;
		double frame_start_ms = 0.0;
		double last_fps_time_ms = 0.0;
		double last_metrics_update_ms = 0.0;
	};

} // namespace tutorface
