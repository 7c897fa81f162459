// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#include "tutorface/systems/expressions/ContextualExpressionSystem.h"

#include "tutorface/systems/expressions/FacialExpressionEngine.h"

#include <catch2/catch_all.hpp>

namespace tutorface::test
{
	namespace
	{
		class FixedRandomSource : public IRandomSource
		{
		  public:
			explicit FixedRandomSource(float value)
				: value(value)
			{
			}

			float next_unit() override { return value; }

			float value = 0.5f;
		};
	} // namespace

	TEST_CASE("Unit/Systems/Expressions/ContextualExpressionSystem")
	{
		ManualTimeSource time_source;
		FacialExpressionEngine engine(time_source);
		FixedRandomSource random_source(0.5f); // no duration jitter
		ContextualExpressionSystem contextual(engine, random_source);

		SECTION("Positive keywords")
		{
			const ContentAnalysisResult result = contextual.analyze_content("This is a GREAT and wonderful success", "western");

			CHECK(result.sentiment == SentimentType::Positive);
			CHECK(result.key_phrases.size() == 3);
			CHECK(result.emotional_intensity == Catch::Approx(0.8f));
			CHECK(result.confidence == Catch::Approx(0.9f));
			CHECK(result.content_type == ContentType::Explanation);
			CHECK(result.cultural_context == "western");
		}

		SECTION("Negative and concern keywords")
		{
			const ContentAnalysisResult result = contextual.analyze_content("We have a serious problem here", "nordic");
			CHECK(result.sentiment == SentimentType::Negative);
			CHECK(result.key_phrases.size() == 2);
		}

		SECTION("No keywords is neutral with low confidence")
		{
			const ContentAnalysisResult result = contextual.analyze_content("The sum of two numbers", "western");
			CHECK(result.sentiment == SentimentType::Neutral);
			CHECK(result.emotional_intensity == Catch::Approx(0.5f));
			CHECK(result.confidence == Catch::Approx(0.3f));
		}

		SECTION("Content type priority")
		{
			CHECK(contextual.analyze_content("Hello, can you explain this?", "western").content_type == ContentType::Question);
			CHECK(contextual.analyze_content("Hello and welcome", "western").content_type == ContentType::Greeting);
			CHECK(contextual.analyze_content("Goodbye for now", "western").content_type == ContentType::Farewell);
			CHECK(contextual.analyze_content("What an incredible achievement", "western").content_type == ContentType::Celebration);
			CHECK(contextual.analyze_content("Let us learn fractions", "western").content_type == ContentType::Instruction);
		}

		SECTION("Processed content drives the engine")
		{
			REQUIRE(contextual.process_content("This is a great and wonderful success"));

			const FacialExpression* current = engine.get_current_expression();
			REQUIRE(current != nullptr);
			CHECK(current->type == ExpressionType::Smile);

			// 0.8 * 0.9 * 0.9 * 0.7 scaled by the smile template (0.8) and cultural sensitivity (0.8)
			CHECK(current->intensity == Catch::Approx(0.8f * 0.9f * 0.9f * 0.7f * 0.8f * 0.8f));
			CHECK(current->duration_ms == Catch::Approx(3000.0f));

			REQUIRE(contextual.get_current_context().has_value());
			CHECK(contextual.get_current_context()->sentiment == SentimentType::Positive);
		}

		SECTION("Celebration maps to excitement")
		{
			REQUIRE(contextual.process_content("What an incredible achievement"));
			CHECK(engine.get_current_expression()->type == ExpressionType::Excitement);
		}

		SECTION("Disabled auto expressions leave the engine alone")
		{
			ContextualExpressionConfig config;
			config.enable_auto_expressions = false;
			contextual.update_config(config);

			CHECK_FALSE(contextual.process_content("Fantastic work"));
			CHECK(engine.get_current_expression() == nullptr);
			CHECK_FALSE(contextual.get_current_context().has_value());
		}

		SECTION("Manual triggers bypass analysis")
		{
			contextual.apply_concern_expression();

			const FacialExpression* current = engine.get_current_expression();
			REQUIRE(current != nullptr);
			CHECK(current->type == ExpressionType::Concern);
			CHECK(current->intensity == Catch::Approx(0.7f * 0.7f * 0.7f * 0.8f));
			CHECK(current->duration_ms == Catch::Approx(4000.0f));
			CHECK_FALSE(contextual.get_current_context().has_value());
		}

		SECTION("Durations are jittered within the configured range")
		{
			random_source.value = 0.0f;
			CHECK(contextual.jittered_duration_ms(2000.0f) == Catch::Approx(1600.0f));
			CHECK(contextual.jittered_duration_ms(1000.0f) == Catch::Approx(1000.0f));

			random_source.value = 1.0f;
			CHECK(contextual.jittered_duration_ms(2000.0f) == Catch::Approx(2400.0f));
			CHECK(contextual.jittered_duration_ms(4500.0f) == Catch::Approx(5000.0f));
		}

		SECTION("Reset clears the analysed context")
		{
			REQUIRE(contextual.process_content("Great job"));
			contextual.reset_to_neutral();
			CHECK_FALSE(contextual.get_current_context().has_value());
			CHECK(engine.get_target_expression()->type == ExpressionType::Neutral);
		}
	}

} // namespace tutorface::test
