// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#include "tutorface/systems/expressions/FacialExpressionEngine.h"

#include "robotick/api.h"
#include "tutorface/systems/expressions/Easing.h"
#include "tutorface/systems/performance/PerformanceGovernor.h"

#include <utility>

namespace tutorface
{
	FacialExpressionEngine::FacialExpressionEngine(
		const ITimeSource& time_source, MorphWeightBuffer* morph_buffer, const PerformanceGovernor* governor, const ExpressionEngineConfig& config)
		: time_source(time_source)
		, morph_buffer(morph_buffer)
		, governor(governor)
		, config(config)
	{
	}

	void FacialExpressionEngine::apply_expression(const FacialExpression& expression)
	{
		if (disposed)
		{
			return;
		}

		ROBOTICK_INFO("FacialExpressionEngine - applying %s (intensity %.2f)", to_string(expression.type), expression.intensity);

		state.target = expression;

		if (state.current)
		{
			start_transition(*state.current, expression, std::nullopt);
		}
		else
		{
			state.current = expression;
			state.transitioning = false;
		}

		add_to_history(expression);
	}

	FacialExpression FacialExpressionEngine::get_emotional_expression(const EmotionalContext& context) const
	{
		const FacialExpression* base = library.find(map_emotion_to_expression(context.primary));
		if (base == nullptr)
		{
			ROBOTICK_WARNING("FacialExpressionEngine - no template for emotion '%s'; using neutral", to_string(context.primary));
			return library.neutral();
		}

		FacialExpression expression = *base;
		expression.intensity = robotick::clamp(base->intensity * context.intensity * context.cultural_modifier, 0.0f, 1.0f);

		if (context.duration_ms.has_value() && *context.duration_ms > 0.0f)
		{
			expression.duration_ms = *context.duration_ms;
		}

		for (auto& morph : expression.morph_targets)
		{
			morph.second *= expression.intensity;
		}

		return expression;
	}

	FacialExpression FacialExpressionEngine::blend_expressions(const std::vector<FacialExpression>& expressions) const
	{
		if (expressions.empty())
		{
			return library.neutral();
		}

		if (expressions.size() == 1)
		{
			return expressions.front();
		}

		FacialExpression blended;
		blended.type = ExpressionType::Neutral;
		blended.intensity = 0.0f;
		blended.duration_ms = 0.0f;
		blended.eye_movement = EyeMovement{{0.0f, 0.0f, 0.0f}, 0.0f, 0.0f, 0.0f};
		blended.eyebrow = EyebrowPosition{0.0f, 0.0f, 0.0f};
		blended.blend_mode = BlendMode::Linear;

		const float weight = 1.0f / static_cast<float>(expressions.size());

		for (const FacialExpression& expression : expressions)
		{
			blended.duration_ms = robotick::max(blended.duration_ms, expression.duration_ms);

			for (const auto& morph : expression.morph_targets)
			{
				blended.morph_targets[morph.first] += morph.second * weight;
			}

			const EyeMovement& eyes = expression.eye_movement;
			blended.eye_movement.look_direction.x += eyes.look_direction.x * weight;
			blended.eye_movement.look_direction.y += eyes.look_direction.y * weight;
			blended.eye_movement.look_direction.z += eyes.look_direction.z * weight;
			blended.eye_movement.blink_rate += eyes.blink_rate * weight;
			blended.eye_movement.widening += eyes.widening * weight;
			blended.eye_movement.squinting += eyes.squinting * weight;

			blended.eyebrow.left_raise += expression.eyebrow.left_raise * weight;
			blended.eyebrow.right_raise += expression.eyebrow.right_raise * weight;
			blended.eyebrow.furrow += expression.eyebrow.furrow * weight;

			blended.intensity += expression.intensity * weight;
		}

		blended.intensity = robotick::clamp(blended.intensity, 0.0f, 1.0f);
		return blended;
	}

	void FacialExpressionEngine::transition_to_expression(const FacialExpression& target, std::optional<float> duration_ms)
	{
		if (disposed)
		{
			return;
		}

		if (!state.current)
		{
			apply_expression(target);
			return;
		}

		start_transition(*state.current, target, duration_ms);
	}

	void FacialExpressionEngine::reset_to_neutral()
	{
		transition_to_expression(library.neutral(), 1000.0f);
	}

	void FacialExpressionEngine::start_transition(const FacialExpression& from, const FacialExpression& to, std::optional<float> duration_ms)
	{
		float transition_ms = 1000.0f;
		if (duration_ms.has_value() && *duration_ms > 0.0f)
		{
			transition_ms = *duration_ms;
		}
		else if (config.transition_speed > 0.0f)
		{
			transition_ms = 1000.0f / config.transition_speed;
		}

		ExpressionTransition transition;
		transition.from = from;
		transition.to = to;
		transition.progress = 0.0f;
		transition.duration_ms = transition_ms;
		transition.easing = config.default_easing;
		transition.start_time_ms = time_source.now_ms();
		active_transition = transition;

		state.transitioning = true;
		state.progress = 0.0f;
		state.target = to;
	}

	void FacialExpressionEngine::update()
	{
		if (disposed)
		{
			return;
		}

		const double now_ms = time_source.now_ms();
		const uint32_t tick_index = tick_count++;

		evict_history(now_ms);

		const QualityMode mode = governor ? governor->get_recommended_mode() : QualityMode::High;

		if (mode == QualityMode::Off)
		{
			if (active_transition)
			{
				advance_transition(now_ms, true);
			}
			write_morph_weights();
			return;
		}

		const uint32_t stride = (mode == QualityMode::Low) ? 4 : (mode == QualityMode::Medium) ? 2 : 1;
		if (tick_index % stride != 0)
		{
			return;
		}

		if (active_transition)
		{
			advance_transition(now_ms, false);
		}
		write_morph_weights();
	}

	void FacialExpressionEngine::advance_transition(double now_ms, bool snap)
	{
		ExpressionTransition& transition = *active_transition;

		float progress = 1.0f;
		if (!snap && transition.duration_ms > 0.0f)
		{
			const double elapsed_ms = now_ms - transition.start_time_ms;
			progress = static_cast<float>(robotick::clamp(elapsed_ms / static_cast<double>(transition.duration_ms), 0.0, 1.0));
		}

		// progress reported to callers is linear; easing only shapes the interpolation
		progress = robotick::max(progress, transition.progress);
		transition.progress = progress;
		state.progress = progress;

		if (progress >= 1.0f)
		{
			state.current = transition.to;
			state.transitioning = false;
			state.progress = 1.0f;
			ROBOTICK_INFO("FacialExpressionEngine - transition complete: %s", to_string(transition.to.type));
			active_transition.reset();
			return;
		}

		state.current = interpolate_expressions(transition.from, transition.to, apply_easing(transition.easing, progress));
	}

	FacialExpression FacialExpressionEngine::interpolate_expressions(const FacialExpression& from, const FacialExpression& to, float t)
	{
		FacialExpression result;
		result.type = t < 0.5f ? from.type : to.type;
		result.intensity = robotick::clamp(lerp(from.intensity, to.intensity, t), 0.0f, 1.0f);
		result.duration_ms = to.duration_ms;
		result.blend_mode = to.blend_mode;

		const EyeMovement& a = from.eye_movement;
		const EyeMovement& b = to.eye_movement;
		result.eye_movement.look_direction.x = lerp(a.look_direction.x, b.look_direction.x, t);
		result.eye_movement.look_direction.y = lerp(a.look_direction.y, b.look_direction.y, t);
		result.eye_movement.look_direction.z = lerp(a.look_direction.z, b.look_direction.z, t);
		result.eye_movement.blink_rate = lerp(a.blink_rate, b.blink_rate, t);
		result.eye_movement.widening = lerp(a.widening, b.widening, t);
		result.eye_movement.squinting = lerp(a.squinting, b.squinting, t);

		result.eyebrow.left_raise = lerp(from.eyebrow.left_raise, to.eyebrow.left_raise, t);
		result.eyebrow.right_raise = lerp(from.eyebrow.right_raise, to.eyebrow.right_raise, t);
		result.eyebrow.furrow = lerp(from.eyebrow.furrow, to.eyebrow.furrow, t);

		// union of keys; a key missing on one side counts as 0
		for (const auto& morph : from.morph_targets)
		{
			result.morph_targets[morph.first] = robotick::max(0.0f, lerp(morph.second, to.get_morph(morph.first), t));
		}
		for (const auto& morph : to.morph_targets)
		{
			if (result.morph_targets.count(morph.first) == 0)
			{
				result.morph_targets[morph.first] = robotick::max(0.0f, lerp(0.0f, morph.second, t));
			}
		}

		return result;
	}

	void FacialExpressionEngine::write_morph_weights()
	{
		if (morph_buffer == nullptr || !state.current)
		{
			return;
		}

		std::set<std::string> written_now;
		for (const auto& morph : state.current->morph_targets)
		{
			if (morph_buffer->set_weight(MorphChannel::Expression, morph.first, morph.second))
			{
				written_now.insert(morph.first);
			}
		}

		for (const std::string& key : written_morph_keys)
		{
			if (written_now.count(key) == 0 && !morph_buffer->set_weight(MorphChannel::Expression, key, 0.0f))
			{
				ROBOTICK_WARNING("FacialExpressionEngine - could not clear morph key '%s'", key.c_str());
			}
		}

		written_morph_keys = std::move(written_now);
	}

	void FacialExpressionEngine::add_to_history(const FacialExpression& expression)
	{
		ExpressionHistoryEntry entry;
		entry.expression = expression;
		entry.timestamp_ms = time_source.now_ms();
		entry.duration_ms = expression.duration_ms;
		entry.context.primary = map_expression_to_emotion(expression.type);
		entry.context.intensity = expression.intensity;
		entry.context.cultural_modifier = config.cultural_sensitivity;

		state.history.push_back(entry);
	}

	void FacialExpressionEngine::evict_history(double now_ms)
	{
		const double cutoff_ms = now_ms - config.expression_memory_ms;
		while (!state.history.empty() && state.history.front().timestamp_ms <= cutoff_ms)
		{
			state.history.pop_front();
		}
	}

	const std::deque<ExpressionHistoryEntry>& FacialExpressionEngine::get_history()
	{
		evict_history(time_source.now_ms());
		return state.history;
	}

	void FacialExpressionEngine::dispose()
	{
		disposed = true;
		active_transition.reset();
		state.transitioning = false;
		state.history.clear();

		if (morph_buffer != nullptr)
		{
			morph_buffer->zero_channel(MorphChannel::Expression);
		}
		written_morph_keys.clear();
	}

} // namespace tutorface
