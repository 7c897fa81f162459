// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#include "tutorface/systems/performance/PerformanceGovernor.h"

#include <catch2/catch_all.hpp>

namespace tutorface::test
{
	namespace
	{
		class FixedMemoryProbe : public IMemoryProbe
		{
		  public:
			bool sample_memory_usage_pct(float& out_pct) override
			{
				if (!available)
				{
					return false;
				}
				out_pct = value_pct;
				return true;
			}

			bool available = true;
			float value_pct = 0.0f;
		};

		// Frames every frame_interval_ms until just past the first sample interval.
		void run_frames(ManualTimeSource& time_source, PerformanceGovernor& governor, double frame_interval_ms, float render_time_ms)
		{
			const double end_ms = time_source.now_ms() + 1000.0 + frame_interval_ms;
			while (time_source.now_ms() < end_ms)
			{
				time_source.advance_ms(frame_interval_ms);
				governor.record_frame(render_time_ms);
			}
		}

		DeviceCapabilities capable_device()
		{
			DeviceCapabilities capabilities;
			capabilities.hardware_concurrency = 8;
			capabilities.device_memory_gb = 16.0f;
			capabilities.max_texture_size = 8192;
			return capabilities;
		}
	} // namespace

	TEST_CASE("Unit/Systems/Performance/PerformanceGovernor")
	{
		ManualTimeSource time_source;

		SECTION("Mode thresholds")
		{
			const DeviceCapabilities device = capable_device();

			PerformanceMetrics metrics;
			metrics.fps = 10.0f;
			CHECK(PerformanceGovernor::recommend_mode(metrics, device) == QualityMode::Off);

			metrics = PerformanceMetrics{};
			metrics.fps = 30.0f;
			metrics.cpu_usage_pct = 40.0f;
			metrics.memory_usage_pct = 40.0f;
			CHECK(PerformanceGovernor::recommend_mode(metrics, device) >= QualityMode::Medium);

			metrics = PerformanceMetrics{};
			metrics.cpu_usage_pct = 75.0f;
			CHECK(PerformanceGovernor::recommend_mode(metrics, device) == QualityMode::Low);

			metrics = PerformanceMetrics{};
			metrics.memory_usage_pct = 90.0f;
			CHECK(PerformanceGovernor::recommend_mode(metrics, device) == QualityMode::Off);

			CHECK(PerformanceGovernor::recommend_mode(PerformanceMetrics{}, device) == QualityMode::High);
		}

		SECTION("Weak devices are capped at medium")
		{
			const PerformanceMetrics healthy;

			DeviceCapabilities few_cores = capable_device();
			few_cores.hardware_concurrency = 2;
			CHECK(PerformanceGovernor::recommend_mode(healthy, few_cores) == QualityMode::Medium);

			DeviceCapabilities small_memory = capable_device();
			small_memory.device_memory_gb = 2.0f;
			CHECK(PerformanceGovernor::recommend_mode(healthy, small_memory) == QualityMode::Medium);

			DeviceCapabilities small_textures = capable_device();
			small_textures.max_texture_size = 1024;
			CHECK(PerformanceGovernor::recommend_mode(healthy, small_textures) == QualityMode::Medium);

			DeviceCapabilities unknown = capable_device();
			unknown.device_memory_gb.reset();
			unknown.max_texture_size.reset();
			CHECK(PerformanceGovernor::recommend_mode(healthy, unknown) == QualityMode::High);
		}

		SECTION("Ten frames a second turns everything off")
		{
			PerformanceGovernor governor(time_source, capable_device());
			run_frames(time_source, governor, 100.0, 5.0f);

			CHECK(governor.get_metrics().fps == Catch::Approx(10.0f));
			CHECK(governor.get_recommended_mode() == QualityMode::Off);
			CHECK(governor.is_performance_degrading());
		}

		SECTION("Metrics only refresh once per interval")
		{
			PerformanceGovernor governor(time_source, capable_device());

			for (int frame = 0; frame < 30; ++frame)
			{
				time_source.advance_ms(10.0);
				governor.record_frame(100.0f);
			}

			CHECK(governor.get_metrics().fps == Catch::Approx(60.0f));
			CHECK(governor.get_metrics().cpu_usage_pct == 0.0f);
			CHECK(governor.get_metrics().render_time_ms == Catch::Approx(100.0f));
		}

		SECTION("CPU estimate is average render time over the frame budget")
		{
			FixedMemoryProbe probe;
			probe.value_pct = 10.0f;
			PerformanceGovernor governor(time_source, capable_device(), &probe);

			run_frames(time_source, governor, 1000.0 / 60.0, 5.0f);

			CHECK(governor.get_metrics().fps >= 59.0f);
			CHECK(governor.get_metrics().cpu_usage_pct == Catch::Approx(5.0f / 16.67f * 100.0f));
			CHECK(governor.get_metrics().memory_usage_pct == Catch::Approx(10.0f));
			CHECK(governor.get_recommended_mode() == QualityMode::High);
		}

		SECTION("CPU estimate saturates at 100")
		{
			PerformanceGovernor governor(time_source, capable_device());
			run_frames(time_source, governor, 1000.0 / 60.0, 50.0f);
			CHECK(governor.get_metrics().cpu_usage_pct == Catch::Approx(100.0f));
		}

		SECTION("Without a probe memory tracks slow frames")
		{
			FixedMemoryProbe probe;
			probe.available = false;
			PerformanceGovernor governor(time_source, capable_device(), &probe);

			for (int frame = 0; frame < 20; ++frame)
			{
				time_source.advance_ms(20.0);
				governor.record_frame(frame < 10 ? 30.0f : 5.0f);
			}
			time_source.advance_ms(1000.0);
			governor.record_frame(5.0f);

			CHECK(governor.get_metrics().memory_usage_pct == Catch::Approx(20.0f));
		}

		SECTION("Render window keeps the most recent samples")
		{
			PerformanceGovernorConfig config;
			config.max_render_samples = 4;
			PerformanceGovernor governor(time_source, capable_device(), nullptr, config);

			for (int frame = 0; frame < 10; ++frame)
			{
				time_source.advance_ms(10.0);
				governor.record_frame(frame < 6 ? 100.0f : 1.667f);
			}
			time_source.advance_ms(1000.0);
			governor.record_frame(1.667f);

			CHECK(governor.get_metrics().cpu_usage_pct == Catch::Approx(10.0f).margin(0.01));
		}

		SECTION("Frame brackets measure render time from the clock")
		{
			PerformanceGovernor governor(time_source, capable_device());
			governor.start_frame();
			time_source.advance_ms(12.0);
			governor.end_frame();

			CHECK(governor.get_metrics().render_time_ms == Catch::Approx(12.0f));
		}

		SECTION("Suggestions follow the metrics")
		{
			FixedMemoryProbe probe;
			probe.value_pct = 80.0f;
			PerformanceGovernor governor(time_source, capable_device(), &probe);
			CHECK(governor.get_optimization_suggestions().empty());

			governor.set_audio_latency(150.0f);
			REQUIRE(governor.get_optimization_suggestions().size() == 1);
			CHECK(governor.get_optimization_suggestions()[0] == "High audio latency - check audio system settings");

			run_frames(time_source, governor, 100.0, 25.0f);
			CHECK(governor.get_optimization_suggestions().size() == 5);
		}

		SECTION("Reset restores defaults")
		{
			PerformanceGovernor governor(time_source, capable_device());
			run_frames(time_source, governor, 100.0, 5.0f);
			REQUIRE(governor.get_recommended_mode() == QualityMode::Off);

			governor.reset();
			CHECK(governor.get_metrics().fps == Catch::Approx(60.0f));
			CHECK(governor.get_recommended_mode() == QualityMode::High);
		}

		SECTION("Detected capabilities are plausible")
		{
			const DeviceCapabilities detected = DeviceCapabilities::detect();
			CHECK(detected.hardware_concurrency >= 1);
			if (detected.device_memory_gb.has_value())
			{
				CHECK(*detected.device_memory_gb > 0.0f);
			}
		}
	}

} // namespace tutorface::test
