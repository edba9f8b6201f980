// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#ifndef __RCOMP_QC_EXPRESSION_HPP__
#define __RCOMP_QC_EXPRESSION_HPP__

#include "rcompdefinitions.h"
#include <cinttypes>
#include <optional>
#include <string>
#include <string_view>

namespace rcomp::qc {
	class VariableEnvironment;
	enum class ComparisonOperator : uint8_t { Equal = 0, NotEqual, GreaterOrEqual, LessOrEqual, Greater, Less, Count };

	DLLRCOMP std::optional<double> parse_number(std::string_view str);
	DLLRCOMP std::string format_number(double value);
	// Empty, "0" and "false" are false, everything else is true
	DLLRCOMP bool is_truthy(std::string_view value);

	// Evaluates an $if / $elif expression. Supports "||" groups of "&&" terms without parentheses;
	// a term is either a single operand or a comparison between two operands.
	// Operands that can not be resolved make their term false.
	DLLRCOMP bool evaluate_condition(std::string_view expr, const VariableEnvironment &variables);

	// +, -, *, /, % and parentheses on numbers. Returns an empty optional if the expression is not purely arithmetic.
	DLLRCOMP std::optional<double> evaluate_arithmetic(std::string_view expr);
	// Value of a $definevariable expression after substitution: quoted strings lose their quotes,
	// arithmetic is computed, anything else is kept as literal text.
	DLLRCOMP std::string evaluate_value_expression(std::string_view expr);
};

#endif
