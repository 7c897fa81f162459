// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "tutorface/systems/expressions/BehaviorExpressionIntegrator.h"
#include "tutorface/systems/expressions/ContextualExpressionSystem.h"
#include "tutorface/systems/expressions/FacialExpressionEngine.h"
#include "tutorface/systems/lipsync/StreamingLipSync.h"
#include "tutorface/systems/performance/PerformanceGovernor.h"

#include <string>

namespace tutorface
{
	// Construction-time settings for every avatar component.
	struct AvatarConfig
	{
		StreamingLipSyncConfig lip_sync;
		ExpressionEngineConfig expressions;
		ContextualExpressionConfig contextual;
		ExpressionIntegrationConfig behavior;
		PerformanceGovernorConfig performance;
	};

	/**
	 * @brief Fills an AvatarConfig from YAML.
	 *
	 * Sections: lip_sync, expressions, contextual, behavior, performance. Keys left out keep
	 * the values already in out_config; unknown keys are ignored; a key of the wrong type
	 * logs a warning and keeps its value. Unreadable or malformed documents return false
	 * and leave out_config untouched.
	 */
	class AvatarConfigLoader
	{
	  public:
		static bool load_from_file(const char* path, AvatarConfig& out_config);
		static bool load_from_string(const std::string& yaml_text, AvatarConfig& out_config);
	};

} // namespace tutorface
