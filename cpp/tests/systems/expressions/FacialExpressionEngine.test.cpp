// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#include "tutorface/systems/expressions/FacialExpressionEngine.h"

#include "tutorface/systems/performance/PerformanceGovernor.h"

#include <catch2/catch_all.hpp>

namespace tutorface::test
{
	namespace
	{
		FacialExpression make_expression(ExpressionType type, float intensity, const char* morph_key, float morph_weight)
		{
			FacialExpression expression;
			expression.type = type;
			expression.intensity = intensity;
			expression.morph_targets[morph_key] = morph_weight;
			return expression;
		}
	} // namespace

	TEST_CASE("Unit/Systems/Expressions/FacialExpressionEngine")
	{
		ManualTimeSource time_source;
		MorphWeightBuffer morph_buffer;
		FacialExpressionEngine engine(time_source, &morph_buffer);

		SECTION("Emotional expression intensity stays in [0, 1]")
		{
			EmotionalContext context;
			context.primary = EmotionType::Joy;

			context.intensity = 0.5f;
			context.cultural_modifier = 1.0f;
			FacialExpression expression = engine.get_emotional_expression(context);
			CHECK(expression.type == ExpressionType::Smile);
			CHECK(expression.intensity == Catch::Approx(0.4f));
			CHECK(expression.get_morph("mouthSmile") == Catch::Approx(0.32f));

			context.intensity = 2.0f;
			context.cultural_modifier = 3.0f;
			CHECK(engine.get_emotional_expression(context).intensity == Catch::Approx(1.0f));

			context.intensity = -1.0f;
			CHECK(engine.get_emotional_expression(context).intensity == 0.0f);
		}

		SECTION("Context duration overrides the template")
		{
			EmotionalContext context;
			context.primary = EmotionType::Concern;
			context.intensity = 1.0f;
			CHECK(engine.get_emotional_expression(context).duration_ms == Catch::Approx(3000.0f));

			context.duration_ms = 1234.0f;
			CHECK(engine.get_emotional_expression(context).duration_ms == Catch::Approx(1234.0f));
		}

		SECTION("Blending averages every field")
		{
			CHECK(engine.blend_expressions({}) == engine.get_library().neutral());

			const FacialExpression e1 = make_expression(ExpressionType::Smile, 0.8f, "mouthSmile", 0.8f);
			const FacialExpression e2 = make_expression(ExpressionType::Concern, 0.6f, "browDownLeft", 0.6f);

			CHECK(engine.blend_expressions({e1}) == e1);

			const FacialExpression blended = engine.blend_expressions({e1, e2});
			CHECK(blended.get_morph("mouthSmile") == Catch::Approx(0.4f));
			CHECK(blended.get_morph("browDownLeft") == Catch::Approx(0.3f));
			CHECK(blended.intensity == Catch::Approx(0.7f));
			CHECK(blended.blend_mode == BlendMode::Linear);
			CHECK(blended.eye_movement.blink_rate == Catch::Approx(15.0f));
		}

		SECTION("First expression shows immediately")
		{
			const FacialExpression smile = *engine.get_library_expression(ExpressionType::Smile);
			engine.apply_expression(smile);

			REQUIRE(engine.get_current_expression() != nullptr);
			CHECK(*engine.get_current_expression() == smile);
			CHECK_FALSE(engine.is_transitioning());

			engine.update();
			CHECK(morph_buffer.get_weight("mouthSmile") == Catch::Approx(0.8f));
		}

		SECTION("Transition progress is monotonic and lands exactly on the target")
		{
			engine.apply_expression(engine.get_library().neutral());

			const FacialExpression target = *engine.get_library_expression(ExpressionType::Excitement);
			engine.transition_to_expression(target, 500.0f);
			REQUIRE(engine.is_transitioning());

			float previous_progress = 0.0f;
			for (int step = 0; step < 12; ++step)
			{
				time_source.advance_ms(50.0);
				engine.update();

				const float progress = engine.get_transition_progress();
				CHECK(progress >= previous_progress);
				CHECK(progress <= 1.0f);
				previous_progress = progress;
			}

			CHECK(engine.get_transition_progress() == 1.0f);
			CHECK_FALSE(engine.is_transitioning());
			REQUIRE(engine.get_current_expression() != nullptr);
			CHECK(*engine.get_current_expression() == target);
		}

		SECTION("Default transition length follows transition speed")
		{
			ExpressionEngineConfig config;
			config.transition_speed = 4.0f;
			engine.update_config(config);

			engine.apply_expression(engine.get_library().neutral());
			engine.apply_expression(*engine.get_library_expression(ExpressionType::Focus));
			REQUIRE(engine.get_active_transition().has_value());
			CHECK(engine.get_active_transition()->duration_ms == Catch::Approx(250.0f));
		}

		SECTION("Morph keys dropped by a new expression are zeroed")
		{
			engine.apply_expression(*engine.get_library_expression(ExpressionType::Smile));
			engine.update();
			REQUIRE(morph_buffer.get_weight("mouthSmile") > 0.0f);

			engine.transition_to_expression(*engine.get_library_expression(ExpressionType::Concern), 100.0f);
			time_source.advance_ms(100.0);
			engine.update();

			CHECK(morph_buffer.get_weight("mouthSmile") == 0.0f);
			CHECK(morph_buffer.get_weight("browDownLeft") == Catch::Approx(0.6f));
		}

		SECTION("Viseme-owned keys are left alone")
		{
			morph_buffer.set_weight(MorphChannel::Viseme, "mouthSmile", 0.1f);
			engine.apply_expression(*engine.get_library_expression(ExpressionType::Smile));
			engine.update();

			CHECK(morph_buffer.get_weight("mouthSmile") == Catch::Approx(0.1f));
			CHECK(morph_buffer.get_weight("cheekPuff") == Catch::Approx(0.3f));
		}

		SECTION("Interpolation covers the union of morph keys")
		{
			const FacialExpression from = make_expression(ExpressionType::Smile, 0.8f, "mouthSmile", 0.8f);
			const FacialExpression to = make_expression(ExpressionType::Concern, 0.4f, "browDownLeft", 0.6f);

			const FacialExpression halfway = FacialExpressionEngine::interpolate_expressions(from, to, 0.5f);
			CHECK(halfway.get_morph("mouthSmile") == Catch::Approx(0.4f));
			CHECK(halfway.get_morph("browDownLeft") == Catch::Approx(0.3f));
			CHECK(halfway.intensity == Catch::Approx(0.6f));
			CHECK(halfway.type == ExpressionType::Concern);

			CHECK(FacialExpressionEngine::interpolate_expressions(from, to, 0.2f).type == ExpressionType::Smile);
		}

		SECTION("History forgets entries older than the memory window")
		{
			engine.apply_expression(*engine.get_library_expression(ExpressionType::Smile));
			CHECK(engine.get_history().size() == 1);

			time_source.advance_ms(6000.0);
			CHECK(engine.get_history().empty());
		}

		SECTION("Reset to neutral transitions over one second")
		{
			engine.apply_expression(*engine.get_library_expression(ExpressionType::Surprise));
			engine.reset_to_neutral();

			REQUIRE(engine.get_target_expression() != nullptr);
			CHECK(engine.get_target_expression()->type == ExpressionType::Neutral);
			CHECK(engine.get_active_transition()->duration_ms == Catch::Approx(1000.0f));
		}

		SECTION("Off mode snaps transitions to their end")
		{
			PerformanceGovernor governor(time_source);
			for (int frame = 0; frame < 11; ++frame)
			{
				time_source.advance_ms(100.0);
				governor.record_frame(5.0f);
			}
			REQUIRE(governor.get_recommended_mode() == QualityMode::Off);

			FacialExpressionEngine throttled(time_source, nullptr, &governor);
			throttled.apply_expression(throttled.get_library().neutral());
			throttled.transition_to_expression(*throttled.get_library_expression(ExpressionType::Smile), 5000.0f);

			throttled.update();
			CHECK_FALSE(throttled.is_transitioning());
			CHECK(throttled.get_current_expression()->type == ExpressionType::Smile);
		}

		SECTION("Disposed engine ignores updates")
		{
			engine.apply_expression(engine.get_library().neutral());
			engine.transition_to_expression(*engine.get_library_expression(ExpressionType::Smile), 100.0f);
			engine.dispose();

			time_source.advance_ms(200.0);
			engine.update();
			CHECK(engine.is_disposed());
			CHECK(engine.get_current_expression()->type == ExpressionType::Neutral);
			CHECK(engine.get_history().empty());
		}

		SECTION("Dispose clears the face and later requests are ignored")
		{
			engine.apply_expression(*engine.get_library_expression(ExpressionType::Smile));
			engine.update();
			REQUIRE(morph_buffer.get_weight("mouthSmile") > 0.0f);

			engine.dispose();

			size_t expression_keys = 0;
			for (const auto& entry : morph_buffer.entries())
			{
				if (entry.second.owner == MorphChannel::Expression)
				{
					++expression_keys;
					CHECK(entry.second.weight == 0.0f);
				}
			}
			CHECK(expression_keys > 0);

			engine.apply_expression(*engine.get_library_expression(ExpressionType::Surprise));
			engine.transition_to_expression(*engine.get_library_expression(ExpressionType::Concern), 100.0f);
			engine.reset_to_neutral();
			CHECK(engine.get_current_expression()->type == ExpressionType::Smile);
			CHECK_FALSE(engine.is_transitioning());
			CHECK(engine.get_history().empty());

			time_source.advance_ms(200.0);
			engine.update();
			CHECK(morph_buffer.get_weight("mouthSmile") == 0.0f);
			CHECK(morph_buffer.get_weight("eyeWideLeft") == 0.0f);
		}
	}

} // namespace tutorface::test
