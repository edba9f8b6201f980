// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#ifndef __RCOMP_QC_PREPROCESSOR_HPP__
#define __RCOMP_QC_PREPROCESSOR_HPP__

#include "rcompdefinitions.h"
#include "rcomp_log.hpp"
#include "variable_environment.hpp"
#include <cinttypes>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#pragma warning(push)
#pragma warning(disable : 4251)
namespace rcomp::qc {
	enum class Directive : uint8_t {
		None = 0,
		If,
		IfDef,
		IfNDef,
		ElIf,
		Else,
		EndIf,
		DefineVariable,
		RedefineVariable,
		DefineMacro,
		EndMacro,
		Include,
		Commentable, // $echo, $print, $message

		Count
	};
	// Keyword has to include the leading '$'; matching is case-insensitive
	DLLRCOMP Directive find_directive(std::string_view keyword);

	struct DLLRCOMP MacroDefinition {
		std::string name;
		std::vector<std::string> parameters;
		std::vector<std::string> body;
		std::string sourceFile;
	};
	// Keys are lower-case macro names
	using MacroTable = std::unordered_map<std::string, std::shared_ptr<const MacroDefinition>>;

	// Canonical paths of all files currently being expanded
	class DLLRCOMP IncludeStack {
	  public:
		bool Push(const std::string &path);
		void Pop(const std::string &path);
		bool Contains(const std::string &path) const;
		size_t GetDepth() const { return m_paths.size(); }
		const std::vector<std::string> &GetPaths() const { return m_paths; }
	  private:
		std::vector<std::string> m_paths;
	};

	struct DLLRCOMP Diagnostic {
		LogSeverity severity = LogSeverity::Warning;
		std::string file;
		uint32_t line = 0;
		std::string message;
	};

	class DLLRCOMP Preprocessor {
	  public:
		Preprocessor(VariableEnvironment &variables, MacroTable &macros, IncludeStack &includeStack, std::vector<std::string> searchDirs, std::string rootDir);
		void SetLogHandler(const LogHandler &logHandler) { m_logHandler = logHandler; }

		// Returns the flattened text, or an empty optional if an include could not be resolved
		std::optional<std::string> Flatten(const std::string &rootFile, std::string &outErr);
		std::optional<std::string> FlattenText(const std::string &text, const std::string &virtualFilePath, std::string &outErr);
		const std::vector<Diagnostic> &GetDiagnostics() const { return *m_diagnostics; }
	  private:
		struct ConditionalFrame {
			bool isActive = true;
			bool branchAlreadyTaken = false;
		};
		struct SourceContext {
			std::string file;
			std::string directory;
		};
		bool ProcessFile(const std::string &path, std::vector<std::string> &outLines, std::string &outErr);
		bool ProcessLines(const std::vector<std::string> &lines, const SourceContext &ctx, std::vector<std::string> &outLines, std::string &outErr);
		bool ProcessInclude(std::string_view args, std::string_view indentation, const SourceContext &ctx, uint32_t lineNumber, std::vector<std::string> &outLines, std::string &outErr);
		bool ExpandMacro(const MacroDefinition &macro, std::string_view args, std::string_view indentation, const SourceContext &ctx, uint32_t lineNumber, std::vector<std::string> &outLines, std::string &outErr);
		size_t CaptureMacro(const std::vector<std::string> &lines, size_t headerIdx, std::string_view args, const SourceContext &ctx, std::vector<std::string> &outLines);
		void DefineVariable(Directive directive, std::string_view args, std::string_view indentation, const SourceContext &ctx, uint32_t lineNumber, std::vector<std::string> &outLines);
		std::optional<std::string> ResolveInclude(const std::string &includePath, const std::string &currentDir) const;
		void AddDiagnostic(const std::string &msg, std::string_view indentation, const SourceContext &ctx, uint32_t lineNumber, std::vector<std::string> &outLines, LogSeverity severity = LogSeverity::Warning);

		VariableEnvironment &m_variables;
		MacroTable &m_macros;
		IncludeStack &m_includeStack;
		std::vector<std::string> m_searchDirs;
		std::string m_rootDir;
		LogHandler m_logHandler;
		std::shared_ptr<std::vector<Diagnostic>> m_diagnostics;
		std::shared_ptr<std::vector<std::string>> m_macroStack;
	};

	DLLRCOMP std::optional<std::string> flatten(const std::string &rootFile, VariableEnvironment &variables, MacroTable &macros, IncludeStack &includeStack, const std::vector<std::string> &searchDirs, const std::string &rootDir, std::string &outErr,
	  const LogHandler &logHandler = nullptr);
};
#pragma warning(pop)

#endif
