// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "tutorface/systems/expressions/ExpressionTypes.h"

#include <array>
#include <optional>

namespace tutorface
{
	/**
	 * @brief Fixed catalogue of expression templates.
	 *
	 * Templates exist for neutral, smile, concern, excitement, focus and surprise. The
	 * other expression types are reachable only through blending or interpolation.
	 */
	class ExpressionLibrary
	{
	  public:
		ExpressionLibrary();

		// nullptr when the type has no template.
		const FacialExpression* find(ExpressionType type) const;

		const FacialExpression& neutral() const { return *templates[static_cast<size_t>(ExpressionType::Neutral)]; }

		size_t size() const;

	  private:
		void add(const FacialExpression& expression);

		std::array<std::optional<FacialExpression>, expression_type_count> templates;
	};

} // namespace tutorface
