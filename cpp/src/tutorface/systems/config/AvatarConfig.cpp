// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#include "tutorface/systems/config/AvatarConfig.h"

#include "robotick/api.h"

#if defined(ROBOTICK_PLATFORM_LINUX)
#include <yaml-cpp/yaml.h>
#endif

namespace tutorface
{
#if defined(ROBOTICK_PLATFORM_LINUX)
	namespace
	{
		template <typename T> void read_value(const YAML::Node& section, const char* section_name, const char* key, T& out_value)
		{
			const YAML::Node node = section[key];
			if (!node)
				return;

			try
			{
				out_value = node.as<T>();
			}
			catch (const YAML::BadConversion&)
			{
				ROBOTICK_WARNING("AvatarConfigLoader - %s.%s has the wrong type; keeping default", section_name, key);
			}
		}

		void read_easing(const YAML::Node& section, const char* section_name, const char* key, EasingFunction& out_easing)
		{
			std::string name;
			read_value(section, section_name, key, name);
			if (name.empty())
				return;

			if (!parse_easing_function(name, out_easing))
			{
				ROBOTICK_WARNING("AvatarConfigLoader - unknown easing '%s' for %s.%s; keeping default", name.c_str(), section_name, key);
			}
		}

		void read_lip_sync(const YAML::Node& node, StreamingLipSyncConfig& config)
		{
			read_value(node, "lip_sync", "sample_rate", config.sample_rate);
			read_value(node, "lip_sync", "frame_size", config.frame_size);
			read_value(node, "lip_sync", "smoothing_factor", config.smoothing_factor);
			read_value(node, "lip_sync", "intensity_multiplier", config.intensity_multiplier);
			read_value(node, "lip_sync", "enable_real_time_processing", config.enable_real_time_processing);
		}

		void read_expressions(const YAML::Node& node, ExpressionEngineConfig& config)
		{
			read_value(node, "expressions", "default_intensity", config.default_intensity);
			read_value(node, "expressions", "transition_speed", config.transition_speed);
			read_value(node, "expressions", "cultural_sensitivity", config.cultural_sensitivity);
			read_value(node, "expressions", "enable_micro_expressions", config.enable_micro_expressions);
			read_value(node, "expressions", "expression_memory_ms", config.expression_memory_ms);
			read_value(node, "expressions", "blending_enabled", config.blending_enabled);
			read_value(node, "expressions", "update_rate_hz", config.update_rate_hz);
			read_easing(node, "expressions", "default_easing", config.default_easing);
		}

		void read_contextual(const YAML::Node& node, ContextualExpressionConfig& config)
		{
			read_value(node, "contextual", "enable_auto_expressions", config.enable_auto_expressions);
			read_value(node, "contextual", "expression_intensity", config.expression_intensity);
			read_value(node, "contextual", "cultural_sensitivity", config.cultural_sensitivity);
			read_value(node, "contextual", "context_sensitivity", config.context_sensitivity);
			read_value(node, "contextual", "min_expression_duration_ms", config.min_expression_duration_ms);
			read_value(node, "contextual", "max_expression_duration_ms", config.max_expression_duration_ms);
		}

		void read_behavior(const YAML::Node& node, ExpressionIntegrationConfig& config)
		{
			read_value(node, "behavior", "enable_auto_expressions", config.enable_auto_expressions);
			read_value(node, "behavior", "expression_intensity_scale", config.expression_intensity_scale);
			read_value(node, "behavior", "cultural_sensitivity", config.cultural_sensitivity);
			read_value(node, "behavior", "sentiment_threshold", config.sentiment_threshold);
			read_value(node, "behavior", "expression_cooldown_ms", config.expression_cooldown_ms);
			read_value(node, "behavior", "blend_with_speech", config.blend_with_speech);
			read_value(node, "behavior", "repetition_window_ms", config.repetition_window_ms);
			read_value(node, "behavior", "max_repetitions", config.max_repetitions);
			read_value(node, "behavior", "history_window_ms", config.history_window_ms);
		}

		void read_performance(const YAML::Node& node, PerformanceGovernorConfig& config)
		{
			read_value(node, "performance", "sample_interval_ms", config.sample_interval_ms);
			read_value(node, "performance", "max_render_samples", config.max_render_samples);
			read_value(node, "performance", "target_frame_time_ms", config.target_frame_time_ms);
		}

		bool apply_document(const YAML::Node& root, AvatarConfig& out_config)
		{
			if (!root || root.IsNull())
			{
				// empty document: nothing to override
				return true;
			}

			if (!root.IsMap())
			{
				ROBOTICK_WARNING("AvatarConfigLoader - top level must be a map of sections");
				return false;
			}

			AvatarConfig config = out_config;

			if (const YAML::Node node = root["lip_sync"])
				read_lip_sync(node, config.lip_sync);
			if (const YAML::Node node = root["expressions"])
				read_expressions(node, config.expressions);
			if (const YAML::Node node = root["contextual"])
				read_contextual(node, config.contextual);
			if (const YAML::Node node = root["behavior"])
				read_behavior(node, config.behavior);
			if (const YAML::Node node = root["performance"])
				read_performance(node, config.performance);

			out_config = config;
			return true;
		}
	} // namespace

	bool AvatarConfigLoader::load_from_file(const char* path, AvatarConfig& out_config)
	{
		YAML::Node root;
		try
		{
			root = YAML::LoadFile(path);
		}
		catch (const YAML::BadFile&)
		{
			ROBOTICK_WARNING("AvatarConfigLoader - unable to open '%s'", path);
			return false;
		}
		catch (const YAML::ParserException& error)
		{
			ROBOTICK_WARNING("AvatarConfigLoader - malformed YAML in '%s': %s", path, error.what());
			return false;
		}

		return apply_document(root, out_config);
	}

	bool AvatarConfigLoader::load_from_string(const std::string& yaml_text, AvatarConfig& out_config)
	{
		YAML::Node root;
		try
		{
			root = YAML::Load(yaml_text);
		}
		catch (const YAML::ParserException& error)
		{
			ROBOTICK_WARNING("AvatarConfigLoader - malformed YAML: %s", error.what());
			return false;
		}

		return apply_document(root, out_config);
	}
#else
	bool AvatarConfigLoader::load_from_file(const char* path, AvatarConfig&)
	{
		ROBOTICK_WARNING("AvatarConfigLoader::load_from_file(%s) is not supported on this platform (yaml-cpp unavailable).", path);
		return false;
	}

	bool AvatarConfigLoader::load_from_string(const std::string&, AvatarConfig&)
	{
		ROBOTICK_WARNING("AvatarConfigLoader::load_from_string is not supported on this platform (yaml-cpp unavailable).");
		return false;
	}
#endif

} // namespace tutorface
