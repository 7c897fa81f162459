// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "tutorface/systems/TimeSource.h"
#include "tutorface/systems/expressions/BehaviorContext.h"
#include "tutorface/systems/expressions/ExpressionTypes.h"

#include <cstdint>
#include <deque>
#include <optional>
#include <string>

namespace tutorface
{
	class ContextualExpressionSystem;
	class FacialExpressionEngine;
	class PerformanceGovernor;

	enum class ExpressionDecision : uint8_t
	{
		Applied,
		SubstitutedNeutral, // same type already shown too often in the repetition window
		RejectedDisabled,
		RejectedLowConfidence,
		RejectedCooldown,
		SuppressedByPerformance,
	};

	const char* to_string(ExpressionDecision decision);

	struct ExpressionIntegrationConfig
	{
		bool enable_auto_expressions = true;
		float expression_intensity_scale = 1.0f; // 0..2
		float cultural_sensitivity = 0.8f;
		float sentiment_threshold = 0.6f; // minimum analysis confidence
		double expression_cooldown_ms = 2000.0;
		bool blend_with_speech = true;

		double repetition_window_ms = 10000.0;
		uint32_t max_repetitions = 2; // a type seen this often in the window is replaced by neutral
		double history_window_ms = 30000.0;
	};

	struct CurrentExpressionState
	{
		std::optional<ExpressionType> current_expression;
		bool transitioning = false;
		float intensity = 0.0f;
		float remaining_duration_ms = 0.0f;
	};

	/**
	 * @brief Arbitrates AI-triggered expressions: confidence gate, cooldown, cultural and
	 * formality scaling, repetition guard and speech-length timing.
	 */
	class BehaviorExpressionIntegrator
	{
	  public:
		BehaviorExpressionIntegrator(FacialExpressionEngine& engine,
			ContextualExpressionSystem& contextual_system,
			const ITimeSource& time_source,
			const PerformanceGovernor* governor = nullptr,
			const ExpressionIntegrationConfig& config = ExpressionIntegrationConfig{});

		ExpressionDecision process_ai_content_analysis(const AIContentAnalysis& analysis, const BehaviorContext& behavior_context, const std::string& text);

		// Sentiment shortcut: no gating, duration scales with intensity.
		ExpressionDecision apply_ai_sentiment_expression(
			SentimentType sentiment, float intensity, const std::string& cultural_region, const std::string& text);

		// Emotion chosen by the caller, scaled by conversation state and punctuation.
		ExpressionDecision apply_contextual_expression(
			EmotionType emotion, float base_intensity, const BehaviorContext& behavior_context, const std::string& text);

		CurrentExpressionState get_current_expression_state() const;

		// Damp the active expression when gestures, movement and speech together exceed 2.0.
		bool coordinate_with_ai_behaviors(float gesture_intensity, float movement_intensity, float speech_intensity);

		void update_integration_config(const ExpressionIntegrationConfig& new_config);
		const ExpressionIntegrationConfig& get_config() const { return config; }

		void reset();
		void dispose();

		// Occurrences of type within the repetition window.
		uint32_t count_recent(ExpressionType type);
		size_t get_history_size() const { return history.size(); }

		static float get_cultural_modifier(const std::string& cultural_region, EmotionType emotion);
		static float get_formality_adjustment(FormalityLevel formality_level, EmotionType emotion);
		static float estimate_speech_duration_ms(const std::string& text);

	  private:
		struct HistoryEntry
		{
			ExpressionType type = ExpressionType::Neutral;
			double timestamp_ms = 0.0;
		};

		EmotionalContext map_ai_analysis_to_emotion(const AIContentAnalysis& analysis) const;
		EmotionalContext apply_cultural_adjustments(const EmotionalContext& context, const BehaviorContext& behavior_context) const;
		ExpressionDecision apply_expression_with_context(const FacialExpression& expression, const std::string& text);
		FacialExpression fit_to_speech(const FacialExpression& expression, const std::string& text) const;
		void record_history(ExpressionType type, double now_ms);
		void evict_history(double now_ms);
		bool performance_off() const;

		FacialExpressionEngine& engine;
		ContextualExpressionSystem& contextual_system;
		const ITimeSource& time_source;
		const PerformanceGovernor* governor = nullptr;
		ExpressionIntegrationConfig config{};

		std::optional<double> last_expression_time_ms;
		std::deque<HistoryEntry> history;
	};

} // namespace tutorface
