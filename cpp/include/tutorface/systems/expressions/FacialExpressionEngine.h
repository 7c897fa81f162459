// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "tutorface/systems/MorphWeightBuffer.h"
#include "tutorface/systems/TimeSource.h"
#include "tutorface/systems/expressions/ExpressionLibrary.h"
#include "tutorface/systems/expressions/ExpressionTypes.h"

#include <deque>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tutorface
{
	class PerformanceGovernor;

	struct ExpressionEngineConfig
	{
		float default_intensity = 0.7f;
		float transition_speed = 1.0f; // default transition lasts 1000 / transition_speed ms
		float cultural_sensitivity = 0.8f;
		bool enable_micro_expressions = true;
		double expression_memory_ms = 5000.0; // history window
		bool blending_enabled = true;
		float update_rate_hz = 60.0f; // rate the host is expected to call update()
		EasingFunction default_easing = EasingFunction::EaseInOut;
	};

	struct ExpressionTransition
	{
		FacialExpression from;
		FacialExpression to;
		float progress = 0.0f; // linear, 0..1
		float duration_ms = 1000.0f;
		EasingFunction easing = EasingFunction::EaseInOut;
		double start_time_ms = 0.0;
	};

	struct ExpressionHistoryEntry
	{
		FacialExpression expression;
		double timestamp_ms = 0.0;
		float duration_ms = 0.0f;
		EmotionalContext context;
	};

	struct ExpressionState
	{
		std::optional<FacialExpression> current;
		std::optional<FacialExpression> target;
		bool transitioning = false;
		float progress = 0.0f;
		std::deque<ExpressionHistoryEntry> history;
	};

	/**
	 * @brief Expression blend and transition engine.
	 *
	 * Holds the current and target expression, runs at most one transition at a time and
	 * writes the current expression's morph targets to the expression channel of the morph
	 * buffer on every processed update(). A new apply supersedes any running transition.
	 */
	class FacialExpressionEngine
	{
	  public:
		explicit FacialExpressionEngine(const ITimeSource& time_source,
			MorphWeightBuffer* morph_buffer = nullptr,
			const PerformanceGovernor* governor = nullptr,
			const ExpressionEngineConfig& config = ExpressionEngineConfig{});

		// Becomes current immediately if nothing is showing, otherwise transitions to it.
		void apply_expression(const FacialExpression& expression);

		FacialExpression get_emotional_expression(const EmotionalContext& context) const;

		// Equal-weight average of every morph key, eye and brow field and intensity.
		FacialExpression blend_expressions(const std::vector<FacialExpression>& expressions) const;

		void transition_to_expression(const FacialExpression& target, std::optional<float> duration_ms = std::nullopt);
		void reset_to_neutral();

		// Animation tick. No-op after dispose().
		void update();

		void dispose();
		bool is_disposed() const { return disposed; }

		const FacialExpression* get_current_expression() const { return state.current ? &*state.current : nullptr; }
		const FacialExpression* get_target_expression() const { return state.target ? &*state.target : nullptr; }
		bool is_transitioning() const { return state.transitioning; }
		float get_transition_progress() const { return state.progress; }
		const std::optional<ExpressionTransition>& get_active_transition() const { return active_transition; }

		// Entries older than expression_memory_ms are dropped before returning.
		const std::deque<ExpressionHistoryEntry>& get_history();

		const ExpressionLibrary& get_library() const { return library; }
		const FacialExpression* get_library_expression(ExpressionType type) const { return library.find(type); }

		void update_config(const ExpressionEngineConfig& new_config) { config = new_config; }
		const ExpressionEngineConfig& get_config() const { return config; }

		static FacialExpression interpolate_expressions(const FacialExpression& from, const FacialExpression& to, float t);

	  private:
		void start_transition(const FacialExpression& from, const FacialExpression& to, std::optional<float> duration_ms);
		void advance_transition(double now_ms, bool snap);
		void add_to_history(const FacialExpression& expression);
		void evict_history(double now_ms);
		void write_morph_weights();

		const ITimeSource& time_source;
		MorphWeightBuffer* morph_buffer = nullptr;
		const PerformanceGovernor* governor = nullptr;
		ExpressionEngineConfig config{};

		ExpressionLibrary library;
		ExpressionState state;
		std::optional<ExpressionTransition> active_transition;

		std::set<std::string> written_morph_keys;
		uint32_t tick_count = 0;
		bool disposed = false;
	};

} // namespace tutorface
