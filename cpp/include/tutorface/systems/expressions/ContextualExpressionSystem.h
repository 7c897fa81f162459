// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "tutorface/systems/RandomSource.h"
#include "tutorface/systems/expressions/ExpressionTypes.h"

#include <optional>
#include <string>

namespace tutorface
{
	class FacialExpressionEngine;

	struct ContextualExpressionConfig
	{
		bool enable_auto_expressions = true;
		float expression_intensity = 0.7f;
		float cultural_sensitivity = 0.8f;
		float context_sensitivity = 0.9f;
		float min_expression_duration_ms = 1000.0f;
		float max_expression_duration_ms = 5000.0f;
	};

	// Manual trigger kinds, each with its own base duration.
	enum class ManualExpression : uint8_t
	{
		Positive,
		Concern,
		Excitement,
		Focus,
	};

	/**
	 * @brief Keyword-driven text analysis that picks an expression for tutor speech.
	 *
	 * Expressions go straight to the engine; cooldown and repetition are handled by the
	 * behavior integrator one layer up.
	 */
	class ContextualExpressionSystem
	{
	  public:
		ContextualExpressionSystem(
			FacialExpressionEngine& engine, IRandomSource& random_source, const ContextualExpressionConfig& config = ContextualExpressionConfig{});

		// Analyse text and apply the matching expression. false when auto expressions are disabled.
		bool process_content(const std::string& text, const std::string& cultural_context = "western");

		ContentAnalysisResult analyze_content(const std::string& text, const std::string& cultural_context) const;
		EmotionalContext map_content_to_emotion(const ContentAnalysisResult& analysis);

		void apply_positive_expression(float intensity = 0.8f);
		void apply_concern_expression(float intensity = 0.7f);
		void apply_excitement_expression(float intensity = 0.9f);
		void apply_focus_expression(float intensity = 0.6f);

		const std::optional<ContentAnalysisResult>& get_current_context() const { return current_context; }

		void update_config(const ContextualExpressionConfig& new_config);
		const ContextualExpressionConfig& get_config() const { return config; }

		void reset_to_neutral();
		void dispose();

		static float base_duration_ms(ContentType content_type);
		static float base_duration_ms(ManualExpression kind);

		// base_ms with +/-20% jitter, clamped to the configured duration range.
		float jittered_duration_ms(float base_ms);

	  private:
		void apply_manual(ManualExpression kind, EmotionType emotion, float intensity);

		FacialExpressionEngine& engine;
		IRandomSource& random_source;
		ContextualExpressionConfig config{};

		std::optional<ContentAnalysisResult> current_context;
	};

} // namespace tutorface
