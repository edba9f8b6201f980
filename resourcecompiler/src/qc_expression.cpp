// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#include "qc_expression.hpp"
#include "variable_environment.hpp"
#include <sharedutils/util.h>
#include <sharedutils/util_string.h>
#include <mathutil/umath.h>
#include <array>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <vector>

using namespace rcomp::qc;

static std::string trim(std::string_view str)
{
	std::string result {str};
	ustring::remove_whitespace(result);
	return result;
}

// Optional sign, digits with at most one decimal point
static bool is_number_literal(std::string_view str)
{
	if(str.empty() == false && (str.front() == '-' || str.front() == '+'))
		str.remove_prefix(1);
	auto hasDigit = false;
	auto hasPoint = false;
	for(auto c : str) {
		if(c == '.') {
			if(hasPoint)
				return false;
			hasPoint = true;
			continue;
		}
		if(std::isdigit(static_cast<unsigned char>(c)) == 0)
			return false;
		hasDigit = true;
	}
	return hasDigit;
}

static bool is_quoted(std::string_view str) { return str.length() >= 2 && str.front() == '"' && str.back() == '"'; }

// Splits at every occurrence of a two-character separator outside of quotes
static std::vector<std::string_view> split_outside_quotes(std::string_view str, std::string_view separator)
{
	std::vector<std::string_view> parts;
	auto inQuotes = false;
	size_t start = 0;
	for(size_t i = 0; i < str.length(); ++i) {
		if(str[i] == '"') {
			inQuotes = !inQuotes;
			continue;
		}
		if(inQuotes || str.substr(i, separator.length()) != separator)
			continue;
		parts.push_back(str.substr(start, i - start));
		i += separator.length() - 1;
		start = i + 1;
	}
	parts.push_back(str.substr(start));
	return parts;
}

std::optional<double> rcomp::qc::parse_number(std::string_view str)
{
	auto value = trim(str);
	if(is_number_literal(value) == false)
		return {};
	return static_cast<double>(util::to_float(value));
}

std::string rcomp::qc::format_number(double value)
{
	if(std::floor(value) == value && std::abs(value) < 1e15)
		return std::to_string(static_cast<int64_t>(value));
	std::stringstream ss;
	ss << std::setprecision(7) << value;
	return ss.str();
}

bool rcomp::qc::is_truthy(std::string_view value)
{
	if(value.empty() || value == "0")
		return false;
	return ustring::compare<std::string>(std::string {value}, "false", false) == false;
}

static std::optional<std::string> resolve_operand(std::string_view operand, const VariableEnvironment &variables)
{
	auto token = trim(operand);
	if(token.empty())
		return {};
	if(is_quoted(token))
		return variables.Substitute(std::string_view {token}.substr(1, token.length() - 2));
	if(token.length() > 2 && token.front() == VARIABLE_MARKER && token.back() == VARIABLE_MARKER)
		return variables.Substitute(token);
	auto *value = variables.Find(token);
	if(value)
		return *value;
	if(parse_number(token).has_value())
		return token;
	return {};
}

static bool compare(const std::string &a, const std::string &b, ComparisonOperator op)
{
	auto na = parse_number(a);
	auto nb = parse_number(b);
	if(na.has_value() && nb.has_value()) {
		switch(op) {
		case ComparisonOperator::Equal:
			return *na == *nb;
		case ComparisonOperator::NotEqual:
			return *na != *nb;
		case ComparisonOperator::GreaterOrEqual:
			return *na >= *nb;
		case ComparisonOperator::LessOrEqual:
			return *na <= *nb;
		case ComparisonOperator::Greater:
			return *na > *nb;
		case ComparisonOperator::Less:
			return *na < *nb;
		default:
			return false;
		}
	}
	switch(op) {
	case ComparisonOperator::Equal:
		return a == b;
	case ComparisonOperator::NotEqual:
		return a != b;
	default:
		return false;
	}
}

static bool evaluate_term(std::string_view term, const VariableEnvironment &variables)
{
	// Order is important! Two-character operators have to be checked before '>' and '<'
	constexpr std::array<std::string_view, umath::to_integral(ComparisonOperator::Count)> operators = {"==", "!=", ">=", "<=", ">", "<"};
	auto inQuotes = false;
	for(size_t i = 0; i < term.length(); ++i) {
		if(term[i] == '"') {
			inQuotes = !inQuotes;
			continue;
		}
		if(inQuotes)
			continue;
		for(size_t opIdx = 0; opIdx < operators.size(); ++opIdx) {
			auto &op = operators[opIdx];
			if(term.substr(i, op.length()) != op)
				continue;
			auto lhs = resolve_operand(term.substr(0, i), variables);
			auto rhs = resolve_operand(term.substr(i + op.length()), variables);
			if(lhs.has_value() == false || rhs.has_value() == false)
				return false;
			return compare(*lhs, *rhs, static_cast<ComparisonOperator>(opIdx));
		}
	}
	auto value = resolve_operand(term, variables);
	return value.has_value() && is_truthy(*value);
}

bool rcomp::qc::evaluate_condition(std::string_view expr, const VariableEnvironment &variables)
{
	for(auto orGroup : split_outside_quotes(expr, "||")) {
		auto result = true;
		for(auto term : split_outside_quotes(orGroup, "&&")) {
			if(evaluate_term(trim(term), variables) == false) {
				result = false;
				break;
			}
		}
		if(result)
			return true;
	}
	return false;
}

namespace {
	class ArithmeticParser {
	  public:
		ArithmeticParser(std::string_view expr) : m_expr {expr} {}
		std::optional<double> Parse()
		{
			auto value = ParseSum();
			SkipWhitespace();
			if(value.has_value() == false || m_pos != m_expr.length())
				return {};
			return value;
		}
	  private:
		void SkipWhitespace()
		{
			while(m_pos < m_expr.length() && (m_expr[m_pos] == ' ' || m_expr[m_pos] == '\t'))
				++m_pos;
		}
		bool Accept(char c)
		{
			SkipWhitespace();
			if(m_pos < m_expr.length() && m_expr[m_pos] == c) {
				++m_pos;
				return true;
			}
			return false;
		}
		std::optional<double> ParseSum()
		{
			auto value = ParseProduct();
			while(value.has_value()) {
				if(Accept('+')) {
					auto rhs = ParseProduct();
					if(rhs.has_value() == false)
						return {};
					*value += *rhs;
				}
				else if(Accept('-')) {
					auto rhs = ParseProduct();
					if(rhs.has_value() == false)
						return {};
					*value -= *rhs;
				}
				else
					break;
			}
			return value;
		}
		std::optional<double> ParseProduct()
		{
			auto value = ParseUnary();
			while(value.has_value()) {
				char op = 0;
				if(Accept('*'))
					op = '*';
				else if(Accept('/'))
					op = '/';
				else if(Accept('%'))
					op = '%';
				else
					break;
				auto rhs = ParseUnary();
				if(rhs.has_value() == false)
					return {};
				if(op == '*')
					*value *= *rhs;
				else if(*rhs == 0.0)
					return {};
				else if(op == '/')
					*value /= *rhs;
				else
					*value = std::fmod(*value, *rhs);
			}
			return value;
		}
		std::optional<double> ParseUnary()
		{
			if(Accept('-')) {
				auto value = ParseUnary();
				if(value.has_value())
					*value = -*value;
				return value;
			}
			if(Accept('+'))
				return ParseUnary();
			if(Accept('(')) {
				auto value = ParseSum();
				if(value.has_value() == false || Accept(')') == false)
					return {};
				return value;
			}
			SkipWhitespace();
			auto start = m_pos;
			while(m_pos < m_expr.length() && (std::isdigit(static_cast<unsigned char>(m_expr[m_pos])) != 0 || m_expr[m_pos] == '.'))
				++m_pos;
			if(start == m_pos)
				return {};
			return parse_number(m_expr.substr(start, m_pos - start));
		}
		std::string_view m_expr;
		size_t m_pos = 0;
	};
};

std::optional<double> rcomp::qc::evaluate_arithmetic(std::string_view expr)
{
	auto trimmed = trim(expr);
	if(trimmed.empty())
		return {};
	return ArithmeticParser {trimmed}.Parse();
}

std::string rcomp::qc::evaluate_value_expression(std::string_view expr)
{
	auto trimmed = trim(expr);
	if(is_quoted(trimmed) && trimmed.find('"', 1) == trimmed.length() - 1)
		return trimmed.substr(1, trimmed.length() - 2);
	// Plain number literals are kept verbatim (e.g. "007" or "1.50")
	if(parse_number(trimmed).has_value())
		return trimmed;
	auto value = evaluate_arithmetic(trimmed);
	if(value.has_value())
		return format_number(*value);
	return trimmed;
}
