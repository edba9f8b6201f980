// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#include "variable_environment.hpp"
#include <cctype>

using namespace rcomp::qc;

bool rcomp::qc::is_valid_variable_name(std::string_view name)
{
	if(name.empty())
		return false;
	for(auto c : name) {
		if(std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '_')
			return false;
	}
	return true;
}

std::string_view rcomp::qc::to_string(VariableEnvironment::DefineResult result)
{
	switch(result) {
	case VariableEnvironment::DefineResult::Success:
		return "success";
	case VariableEnvironment::DefineResult::AlreadyDefined:
		return "variable is already defined";
	case VariableEnvironment::DefineResult::NotDefined:
		return "variable is not defined";
	case VariableEnvironment::DefineResult::ShadowedByMacroArgument:
		return "name is a macro argument";
	case VariableEnvironment::DefineResult::InvalidName:
		return "invalid variable name";
	}
	return "unknown";
}

VariableEnvironment::VariableEnvironment(Map variables) : m_variables {std::move(variables)} {}

VariableEnvironment::DefineResult VariableEnvironment::Define(const std::string &name, const std::string &value)
{
	if(is_valid_variable_name(name) == false)
		return DefineResult::InvalidName;
	if(IsMacroArgument(name))
		return DefineResult::ShadowedByMacroArgument;
	if(m_variables.find(name) != m_variables.end())
		return DefineResult::AlreadyDefined;
	m_variables[name] = value;
	return DefineResult::Success;
}

VariableEnvironment::DefineResult VariableEnvironment::Redefine(const std::string &name, const std::string &value)
{
	if(IsMacroArgument(name))
		return DefineResult::ShadowedByMacroArgument;
	auto it = m_variables.find(name);
	if(it == m_variables.end())
		return DefineResult::NotDefined;
	it->second = value;
	return DefineResult::Success;
}

void VariableEnvironment::Set(const std::string &name, const std::string &value) { m_variables[name] = value; }
void VariableEnvironment::SetMacroArgument(const std::string &name, const std::string &value) { m_macroArguments[name] = value; }

bool VariableEnvironment::IsDefined(const std::string &name) const { return Find(name) != nullptr; }
bool VariableEnvironment::IsMacroArgument(const std::string &name) const { return m_macroArguments.find(name) != m_macroArguments.end(); }

const std::string *VariableEnvironment::Find(const std::string &name) const
{
	auto it = m_macroArguments.find(name);
	if(it != m_macroArguments.end())
		return &it->second;
	it = m_variables.find(name);
	if(it != m_variables.end())
		return &it->second;
	return nullptr;
}

std::optional<std::string> VariableEnvironment::Substitute(std::string_view text, std::string *optOutUndefined) const
{
	std::string result;
	result.reserve(text.length());
	size_t pos = 0;
	for(;;) {
		auto start = text.find(VARIABLE_MARKER, pos);
		if(start == std::string_view::npos)
			break;
		auto end = text.find(VARIABLE_MARKER, start + 1);
		if(end == std::string_view::npos)
			break;
		auto name = text.substr(start + 1, end - start - 1);
		if(is_valid_variable_name(name) == false) {
			// Not a reference (e.g. "$body $name$"), retry from the second marker
			result += text.substr(pos, end - pos);
			pos = end;
			continue;
		}
		auto *value = Find(std::string {name});
		if(value == nullptr) {
			if(optOutUndefined)
				*optOutUndefined = std::string {name};
			return {};
		}
		result += text.substr(pos, start - pos);
		result += *value;
		pos = end + 1;
	}
	result += text.substr(pos);
	return result;
}
