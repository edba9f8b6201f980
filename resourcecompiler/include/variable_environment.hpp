// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#ifndef __RCOMP_VARIABLE_ENVIRONMENT_HPP__
#define __RCOMP_VARIABLE_ENVIRONMENT_HPP__

#include "rcompdefinitions.h"
#include <cinttypes>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#pragma warning(push)
#pragma warning(disable : 4251)
namespace rcomp::qc {
	static constexpr char VARIABLE_MARKER = '$';

	// Named string values with a second tier of macro-argument overrides.
	// Overrides shadow defined variables and can not be (re)defined while active.
	class DLLRCOMP VariableEnvironment {
	  public:
		enum class DefineResult : uint8_t { Success = 0, AlreadyDefined, NotDefined, ShadowedByMacroArgument, InvalidName };
		using Map = std::unordered_map<std::string, std::string>;

		VariableEnvironment() = default;
		VariableEnvironment(Map variables);

		DefineResult Define(const std::string &name, const std::string &value);
		DefineResult Redefine(const std::string &name, const std::string &value);
		// Overwrites unconditionally; used for seeding from configuration
		void Set(const std::string &name, const std::string &value);
		void SetMacroArgument(const std::string &name, const std::string &value);

		bool IsDefined(const std::string &name) const;
		bool IsMacroArgument(const std::string &name) const;
		const std::string *Find(const std::string &name) const;

		// Replaces every $name$ reference. Returns an empty optional if a referenced name is
		// undefined, in which case optOutUndefined receives the name.
		std::optional<std::string> Substitute(std::string_view text, std::string *optOutUndefined = nullptr) const;

		const Map &GetVariables() const { return m_variables; }
		const Map &GetMacroArguments() const { return m_macroArguments; }
	  private:
		Map m_variables;
		Map m_macroArguments;
	};

	DLLRCOMP bool is_valid_variable_name(std::string_view name);
	DLLRCOMP std::string_view to_string(VariableEnvironment::DefineResult result);
};
#pragma warning(pop)

#endif
