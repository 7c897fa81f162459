// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#include "tutorface/systems/expressions/ExpressionLibrary.h"

#include <utility>

namespace tutorface
{
	namespace
	{
		FacialExpression make_expression(ExpressionType type,
			float intensity,
			float duration_ms,
			MorphTargetMap morph_targets,
			EyeMovement eye_movement,
			EyebrowPosition eyebrow,
			BlendMode blend_mode)
		{
			FacialExpression expression;
			expression.type = type;
			expression.intensity = intensity;
			expression.duration_ms = duration_ms;
			expression.morph_targets = std::move(morph_targets);
			expression.eye_movement = eye_movement;
			expression.eyebrow = eyebrow;
			expression.blend_mode = blend_mode;
			return expression;
		}
	} // namespace

	ExpressionLibrary::ExpressionLibrary()
	{
		add(make_expression(ExpressionType::Neutral,
			0.0f,
			1000.0f,
			{},
			EyeMovement{{0.0f, 0.0f, 1.0f}, 15.0f, 0.0f, 0.0f},
			EyebrowPosition{0.0f, 0.0f, 0.0f},
			BlendMode::Replace));

		add(make_expression(ExpressionType::Smile,
			0.8f,
			2000.0f,
			{{"mouthSmile", 0.8f}, {"cheekPuff", 0.3f}, {"eyeSquintLeft", 0.2f}, {"eyeSquintRight", 0.2f}},
			EyeMovement{{0.0f, 0.0f, 1.0f}, 12.0f, 0.1f, 0.2f},
			EyebrowPosition{0.1f, 0.1f, 0.0f},
			BlendMode::Additive));

		add(make_expression(ExpressionType::Concern,
			0.7f,
			3000.0f,
			{{"browDownLeft", 0.6f}, {"browDownRight", 0.6f}, {"mouthFrown", 0.4f}, {"eyeSquintLeft", 0.3f}, {"eyeSquintRight", 0.3f}},
			EyeMovement{{0.0f, -0.1f, 1.0f}, 18.0f, 0.0f, 0.3f},
			EyebrowPosition{-0.4f, -0.4f, 0.6f},
			BlendMode::Additive));

		add(make_expression(ExpressionType::Excitement,
			0.9f,
			1500.0f,
			{{"mouthSmile", 1.0f},
				{"eyeWideLeft", 0.7f},
				{"eyeWideRight", 0.7f},
				{"browUpLeft", 0.5f},
				{"browUpRight", 0.5f},
				{"cheekPuff", 0.4f}},
			EyeMovement{{0.0f, 0.1f, 1.0f}, 8.0f, 0.7f, 0.0f},
			EyebrowPosition{0.5f, 0.5f, 0.0f},
			BlendMode::Additive));

		add(make_expression(ExpressionType::Focus,
			0.6f,
			4000.0f,
			{{"eyeSquintLeft", 0.2f}, {"eyeSquintRight", 0.2f}, {"browDownLeft", 0.3f}, {"browDownRight", 0.3f}},
			EyeMovement{{0.0f, 0.0f, 1.0f}, 10.0f, 0.0f, 0.2f},
			EyebrowPosition{-0.2f, -0.2f, 0.3f},
			BlendMode::Additive));

		add(make_expression(ExpressionType::Surprise,
			0.8f,
			1000.0f,
			{{"eyeWideLeft", 0.9f}, {"eyeWideRight", 0.9f}, {"browUpLeft", 0.8f}, {"browUpRight", 0.8f}, {"mouthOpen", 0.5f}},
			EyeMovement{{0.0f, 0.2f, 1.0f}, 5.0f, 0.9f, 0.0f},
			EyebrowPosition{0.8f, 0.8f, 0.0f},
			BlendMode::Additive));
	}

	void ExpressionLibrary::add(const FacialExpression& expression)
	{
		templates[static_cast<size_t>(expression.type)] = expression;
	}

	const FacialExpression* ExpressionLibrary::find(ExpressionType type) const
	{
		const size_t index = static_cast<size_t>(type);
		if (index >= templates.size() || !templates[index].has_value())
		{
			return nullptr;
		}
		return &*templates[index];
	}

	size_t ExpressionLibrary::size() const
	{
		size_t count = 0;
		for (const auto& entry : templates)
		{
			if (entry.has_value())
			{
				++count;
			}
		}
		return count;
	}

} // namespace tutorface
