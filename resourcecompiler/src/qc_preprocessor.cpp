// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#include "qc_preprocessor.hpp"
#include "qc_expression.hpp"
#include "file_util.hpp"
#include <sharedutils/util_string.h>
#include <mathutil/umath.h>
#include <algorithm>
#include <array>
#include <filesystem>
#include <utility>

using namespace rcomp::qc;

static std::string trim(std::string_view str)
{
	std::string result {str};
	ustring::remove_whitespace(result);
	return result;
}

static std::string to_lower(std::string_view str)
{
	std::string result {str};
	ustring::to_lower(result);
	return result;
}

Directive rcomp::qc::find_directive(std::string_view keyword)
{
	static const std::array<std::pair<std::string_view, Directive>, 14> directives = {{
	  {"$if", Directive::If},
	  {"$ifdef", Directive::IfDef},
	  {"$ifndef", Directive::IfNDef},
	  {"$elif", Directive::ElIf},
	  {"$else", Directive::Else},
	  {"$endif", Directive::EndIf},
	  {"$definevariable", Directive::DefineVariable},
	  {"$redefinevariable", Directive::RedefineVariable},
	  {"$definemacro", Directive::DefineMacro},
	  {"$endmacro", Directive::EndMacro},
	  {"$include", Directive::Include},
	  {"$echo", Directive::Commentable},
	  {"$print", Directive::Commentable},
	  {"$message", Directive::Commentable},
	}};
	auto lower = to_lower(keyword);
	for(auto &[name, directive] : directives) {
		if(lower == name)
			return directive;
	}
	return Directive::None;
}

bool IncludeStack::Push(const std::string &path)
{
	if(Contains(path))
		return false;
	m_paths.push_back(path);
	return true;
}

void IncludeStack::Pop(const std::string &path)
{
	auto it = std::find(m_paths.rbegin(), m_paths.rend(), path);
	if(it != m_paths.rend())
		m_paths.erase(std::next(it).base());
}

bool IncludeStack::Contains(const std::string &path) const { return std::find(m_paths.begin(), m_paths.end(), path) != m_paths.end(); }

static std::string get_canonical_path(const std::string &path)
{
	std::error_code ec;
	auto canonical = std::filesystem::weakly_canonical(std::filesystem::path {path}, ec);
	if(ec)
		return std::filesystem::absolute(std::filesystem::path {path}, ec).lexically_normal().generic_string();
	return canonical.generic_string();
}

Preprocessor::Preprocessor(VariableEnvironment &variables, MacroTable &macros, IncludeStack &includeStack, std::vector<std::string> searchDirs, std::string rootDir)
    : m_variables {variables}, m_macros {macros}, m_includeStack {includeStack}, m_searchDirs {std::move(searchDirs)}, m_rootDir {std::move(rootDir)}, m_diagnostics {std::make_shared<std::vector<Diagnostic>>()},
      m_macroStack {std::make_shared<std::vector<std::string>>()}
{
}

void Preprocessor::AddDiagnostic(const std::string &msg, std::string_view indentation, const SourceContext &ctx, uint32_t lineNumber, std::vector<std::string> &outLines, LogSeverity severity)
{
	m_diagnostics->push_back({severity, ctx.file, lineNumber, msg});
	outLines.push_back(std::string {indentation} + "// " + std::string {rcomp::get_severity_prefix(severity)} + ": " + msg);
	rcomp::log(m_logHandler, ctx.file + "(" + std::to_string(lineNumber) + "): " + msg, severity);
}

std::optional<std::string> Preprocessor::ResolveInclude(const std::string &includePath, const std::string &currentDir) const
{
	std::filesystem::path path {includePath};
	if(path.is_absolute())
		return rcomp::is_system_file(path.string()) ? std::optional<std::string> {path.string()} : std::optional<std::string> {};

	std::vector<std::filesystem::path> candidates;
	if(m_rootDir.empty() == false)
		candidates.push_back(std::filesystem::path {m_rootDir} / path);
	if(currentDir.empty() == false)
		candidates.push_back(std::filesystem::path {currentDir} / path);
	for(auto &dir : m_searchDirs)
		candidates.push_back(std::filesystem::path {dir} / path);
	for(auto &candidate : candidates) {
		if(rcomp::is_system_file(candidate.string()))
			return candidate.string();
	}
	return {};
}

std::optional<std::string> Preprocessor::Flatten(const std::string &rootFile, std::string &outErr)
{
	if(rcomp::is_system_file(rootFile) == false) {
		outErr = "QC file '" + rootFile + "' does not exist!";
		return {};
	}
	std::vector<std::string> lines;
	if(ProcessFile(get_canonical_path(rootFile), lines, outErr) == false)
		return {};
	return rcomp::join_lines(lines);
}

std::optional<std::string> Preprocessor::FlattenText(const std::string &text, const std::string &virtualFilePath, std::string &outErr)
{
	auto canonical = get_canonical_path(virtualFilePath);
	SourceContext ctx {canonical, std::filesystem::path {canonical}.parent_path().generic_string()};
	std::vector<std::string> lines;
	auto pushed = m_includeStack.Push(canonical);
	auto result = ProcessLines(rcomp::split_lines(text), ctx, lines, outErr);
	if(pushed)
		m_includeStack.Pop(canonical);
	if(result == false)
		return {};
	return rcomp::join_lines(lines);
}

bool Preprocessor::ProcessFile(const std::string &path, std::vector<std::string> &outLines, std::string &outErr)
{
	auto text = rcomp::read_text_file(path);
	if(text.has_value() == false) {
		outErr = "Unable to read QC file '" + path + "'!";
		return false;
	}
	SourceContext ctx {path, std::filesystem::path {path}.parent_path().generic_string()};
	m_includeStack.Push(path);
	auto result = ProcessLines(rcomp::split_lines(*text), ctx, outLines, outErr);
	m_includeStack.Pop(path);
	return result;
}

bool Preprocessor::ProcessInclude(std::string_view args, std::string_view indentation, const SourceContext &ctx, uint32_t lineNumber, std::vector<std::string> &outLines, std::string &outErr)
{
	std::string undefinedName;
	auto substituted = m_variables.Substitute(args, &undefinedName);
	if(substituted.has_value() == false) {
		AddDiagnostic("Undefined variable '" + undefinedName + "' in $include, directive skipped", indentation, ctx, lineNumber, outLines);
		return true;
	}
	auto tokens = rcomp::tokenize_line(*substituted);
	if(tokens.empty()) {
		AddDiagnostic("$include without a file path", indentation, ctx, lineNumber, outLines);
		return true;
	}
	auto &includePath = tokens.front();
	auto resolved = ResolveInclude(rcomp::normalize_slashes(includePath), ctx.directory);
	if(resolved.has_value() == false) {
		outErr = "Unable to resolve include '" + includePath + "' in " + ctx.file + "(" + std::to_string(lineNumber) + ")!";
		return false;
	}
	auto canonical = get_canonical_path(*resolved);
	if(m_includeStack.Contains(canonical)) {
		AddDiagnostic("Circular include of '" + includePath + "' skipped", indentation, ctx, lineNumber, outLines);
		return true;
	}
	std::vector<std::string> includedLines;
	if(ProcessFile(canonical, includedLines, outErr) == false)
		return false;
	outLines.reserve(outLines.size() + includedLines.size());
	for(auto &line : includedLines)
		outLines.push_back(std::string {indentation} + line);
	return true;
}

size_t Preprocessor::CaptureMacro(const std::vector<std::string> &lines, size_t headerIdx, std::string_view args, const SourceContext &ctx, std::vector<std::string> &outLines)
{
	auto indentation = rcomp::get_leading_whitespace(lines[headerIdx]);
	auto lineNumber = static_cast<uint32_t>(headerIdx + 1);
	auto tokens = rcomp::tokenize_line(args);
	auto continuation = (tokens.empty() == false && tokens.back() == "\\\\");
	if(continuation)
		tokens.pop_back();

	auto macro = std::make_shared<MacroDefinition>();
	macro->sourceFile = ctx.file;
	auto idx = headerIdx + 1;
	if(continuation) {
		// Every body line but the last one ends with "\\"
		for(; idx < lines.size(); ++idx) {
			auto line = std::string_view {lines[idx]};
			auto end = line.find_last_not_of(" \t\r");
			auto continued = (end != std::string_view::npos && end >= 1 && line.substr(end - 1, 2) == "\\\\");
			if(continued == false) {
				if(trim(line).empty() == false)
					macro->body.push_back(std::string {line});
				break;
			}
			macro->body.push_back(std::string {line.substr(0, end - 1)});
		}
	}
	else {
		auto terminated = false;
		for(; idx < lines.size(); ++idx) {
			auto trimmed = trim(lines[idx]);
			auto keyword = std::string_view {trimmed}.substr(0, trimmed.find_first_of(" \t"));
			if(find_directive(keyword) == Directive::EndMacro) {
				terminated = true;
				break;
			}
			macro->body.push_back(lines[idx]);
		}
		if(terminated == false)
			AddDiagnostic("Macro definition is missing $endmacro", indentation, ctx, lineNumber, outLines);
	}

	if(tokens.empty()) {
		AddDiagnostic("$definemacro without a macro name", indentation, ctx, lineNumber, outLines);
		return idx;
	}
	macro->name = tokens.front();
	macro->parameters.assign(tokens.begin() + 1, tokens.end());
	auto key = to_lower(macro->name);
	if(m_macros.find(key) != m_macros.end()) {
		AddDiagnostic("Macro '" + macro->name + "' is already defined, new definition ignored", indentation, ctx, lineNumber, outLines);
		return idx;
	}
	m_macros[key] = macro;
	return idx;
}

bool Preprocessor::ExpandMacro(const MacroDefinition &macro, std::string_view args, std::string_view indentation, const SourceContext &ctx, uint32_t lineNumber, std::vector<std::string> &outLines, std::string &outErr)
{
	auto key = to_lower(macro.name);
	if(std::find(m_macroStack->begin(), m_macroStack->end(), key) != m_macroStack->end()) {
		AddDiagnostic("Recursive invocation of macro '" + macro.name + "' skipped", indentation, ctx, lineNumber, outLines);
		return true;
	}
	std::string undefinedName;
	auto substituted = m_variables.Substitute(args, &undefinedName);
	if(substituted.has_value() == false) {
		AddDiagnostic("Undefined variable '" + undefinedName + "' in call to macro '" + macro.name + "', call skipped", indentation, ctx, lineNumber, outLines);
		return true;
	}
	auto values = rcomp::tokenize_line(*substituted);

	auto scopedVariables = m_variables;
	for(size_t i = 0; i < macro.parameters.size(); ++i) {
		if(i < values.size()) {
			scopedVariables.SetMacroArgument(macro.parameters[i], values[i]);
			continue;
		}
		AddDiagnostic("Missing argument '" + macro.parameters[i] + "' in call to macro '" + macro.name + "'", indentation, ctx, lineNumber, outLines);
		scopedVariables.SetMacroArgument(macro.parameters[i], "");
	}
	if(values.size() > macro.parameters.size())
		AddDiagnostic("Too many arguments in call to macro '" + macro.name + "'", indentation, ctx, lineNumber, outLines);

	Preprocessor nested {scopedVariables, m_macros, m_includeStack, m_searchDirs, m_rootDir};
	nested.m_logHandler = m_logHandler;
	nested.m_diagnostics = m_diagnostics;
	nested.m_macroStack = m_macroStack;

	m_macroStack->push_back(key);
	std::vector<std::string> expanded;
	auto result = nested.ProcessLines(macro.body, ctx, expanded, outErr);
	m_macroStack->pop_back();
	if(result == false)
		return false;
	for(auto &line : expanded)
		outLines.push_back(std::string {indentation} + line);
	return true;
}

void Preprocessor::DefineVariable(Directive directive, std::string_view args, std::string_view indentation, const SourceContext &ctx, uint32_t lineNumber, std::vector<std::string> &outLines)
{
	auto nameEnd = args.find_first_of(" \t");
	auto name = std::string {args.substr(0, nameEnd)};
	auto expr = (nameEnd == std::string_view::npos) ? std::string {} : trim(args.substr(nameEnd));
	auto directiveName = (directive == Directive::DefineVariable) ? "$definevariable" : "$redefinevariable";
	if(name.empty()) {
		AddDiagnostic(std::string {directiveName} + " without a variable name", indentation, ctx, lineNumber, outLines);
		return;
	}
	std::string undefinedName;
	auto substituted = m_variables.Substitute(expr, &undefinedName);
	if(substituted.has_value() == false) {
		AddDiagnostic("Undefined variable '" + undefinedName + "' in " + directiveName + " " + name + ", directive skipped", indentation, ctx, lineNumber, outLines);
		return;
	}
	auto value = evaluate_value_expression(*substituted);
	auto result = (directive == Directive::DefineVariable) ? m_variables.Define(name, value) : m_variables.Redefine(name, value);
	if(result != VariableEnvironment::DefineResult::Success)
		AddDiagnostic(std::string {directiveName} + " " + name + " rejected: " + std::string {to_string(result)}, indentation, ctx, lineNumber, outLines);
}

bool Preprocessor::ProcessLines(const std::vector<std::string> &lines, const SourceContext &ctx, std::vector<std::string> &outLines, std::string &outErr)
{
	std::vector<ConditionalFrame> conditionals;
	auto isActive = [&conditionals]() { return conditionals.empty() || conditionals.back().isActive; };
	auto isParentActive = [&conditionals]() { return conditionals.size() < 2 || conditionals[conditionals.size() - 2].isActive; };
	for(size_t i = 0; i < lines.size(); ++i) {
		auto &line = lines[i];
		auto lineNumber = static_cast<uint32_t>(i + 1);
		auto indentation = rcomp::get_leading_whitespace(line);
		auto trimmed = trim(line);
		if(trimmed.empty() || rcomp::is_comment_line(trimmed)) {
			if(isActive())
				outLines.push_back(line);
			continue;
		}
		auto keywordEnd = trimmed.find_first_of(" \t");
		auto keyword = std::string_view {trimmed}.substr(0, keywordEnd);
		auto args = (keywordEnd == std::string::npos) ? std::string {} : trim(std::string_view {trimmed}.substr(keywordEnd));
		auto directive = find_directive(keyword);

		switch(directive) {
		case Directive::If:
		case Directive::IfDef:
		case Directive::IfNDef:
			{
				if(isActive() == false) {
					// Never evaluated inside of a dead branch
					conditionals.push_back({false, true});
					continue;
				}
				bool condition;
				if(directive == Directive::If)
					condition = evaluate_condition(args, m_variables);
				else {
					auto tokens = rcomp::tokenize_line(args);
					auto defined = (tokens.empty() == false && m_variables.IsDefined(tokens.front()));
					condition = (directive == Directive::IfDef) ? defined : !defined;
				}
				conditionals.push_back({condition, condition});
				continue;
			}
		case Directive::ElIf:
			{
				if(conditionals.empty()) {
					AddDiagnostic("$elif without matching $if", indentation, ctx, lineNumber, outLines);
					continue;
				}
				auto &frame = conditionals.back();
				if(isParentActive() == false || frame.branchAlreadyTaken) {
					frame.isActive = false;
					continue;
				}
				frame.isActive = evaluate_condition(args, m_variables);
				frame.branchAlreadyTaken = frame.isActive;
				continue;
			}
		case Directive::Else:
			{
				if(conditionals.empty()) {
					AddDiagnostic("$else without matching $if", indentation, ctx, lineNumber, outLines);
					continue;
				}
				auto &frame = conditionals.back();
				frame.isActive = isParentActive() && !frame.branchAlreadyTaken;
				frame.branchAlreadyTaken = true;
				continue;
			}
		case Directive::EndIf:
			if(conditionals.empty()) {
				AddDiagnostic("$endif without matching $if", indentation, ctx, lineNumber, outLines);
				continue;
			}
			conditionals.pop_back();
			continue;
		default:
			break;
		}

		if(isActive() == false)
			continue;

		switch(directive) {
		case Directive::DefineVariable:
		case Directive::RedefineVariable:
			DefineVariable(directive, args, indentation, ctx, lineNumber, outLines);
			break;
		case Directive::DefineMacro:
			i = CaptureMacro(lines, i, args, ctx, outLines);
			break;
		case Directive::EndMacro:
			AddDiagnostic("$endmacro without matching $definemacro", indentation, ctx, lineNumber, outLines);
			break;
		case Directive::Include:
			if(ProcessInclude(args, indentation, ctx, lineNumber, outLines, outErr) == false)
				return false;
			break;
		case Directive::Commentable:
			{
				std::string undefinedName;
				auto substituted = m_variables.Substitute(trimmed, &undefinedName);
				if(substituted.has_value() == false)
					AddDiagnostic("Undefined variable '" + undefinedName + "' in " + std::string {keyword}, indentation, ctx, lineNumber, outLines);
				outLines.push_back(std::string {indentation} + "// " + (substituted.has_value() ? *substituted : std::string {trimmed}));
				break;
			}
		default:
			{
				if(keyword.length() > 1 && keyword.front() == VARIABLE_MARKER) {
					auto it = m_macros.find(to_lower(keyword.substr(1)));
					if(it != m_macros.end()) {
						// Keep the definition alive in case the body redefines the macro table
						auto macro = it->second;
						if(ExpandMacro(*macro, args, indentation, ctx, lineNumber, outLines, outErr) == false)
							return false;
						break;
					}
				}
				std::string undefinedName;
				auto substituted = m_variables.Substitute(line, &undefinedName);
				if(substituted.has_value() == false) {
					AddDiagnostic("Undefined variable '" + undefinedName + "', line removed: " + std::string {trimmed}, indentation, ctx, lineNumber, outLines);
					break;
				}
				outLines.push_back(std::move(*substituted));
				break;
			}
		}
	}
	if(conditionals.empty() == false) {
		auto lineNumber = static_cast<uint32_t>(lines.size());
		AddDiagnostic("Missing $endif for " + std::to_string(conditionals.size()) + " conditional block(s)", "", ctx, lineNumber, outLines);
	}
	return true;
}

std::optional<std::string> rcomp::qc::flatten(const std::string &rootFile, VariableEnvironment &variables, MacroTable &macros, IncludeStack &includeStack, const std::vector<std::string> &searchDirs, const std::string &rootDir, std::string &outErr,
  const LogHandler &logHandler)
{
	Preprocessor preprocessor {variables, macros, includeStack, searchDirs, rootDir};
	preprocessor.SetLogHandler(logHandler);
	return preprocessor.Flatten(rootFile, outErr);
}
