// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#include "qc_material_scanner.hpp"
#include "variable_environment.hpp"
#include "file_util.hpp"
#include <sharedutils/util_string.h>
#include <algorithm>
#include <filesystem>
#include <functional>
#include <unordered_set>

static bool starts_with_keyword(std::string_view trimmedLine, std::string_view keyword)
{
	if(trimmedLine.length() < keyword.length())
		return false;
	if(ustring::compare(trimmedLine.data(), keyword.data(), false, keyword.length()) == false)
		return false;
	return trimmedLine.length() == keyword.length() || trimmedLine[keyword.length()] == ' ' || trimmedLine[keyword.length()] == '\t' || trimmedLine[keyword.length()] == '"';
}

static std::string_view trim_left(std::string_view str)
{
	auto pos = str.find_first_not_of(" \t");
	return (pos == std::string_view::npos) ? std::string_view {} : str.substr(pos);
}

std::vector<std::string> rcomp::qc::read_includes(const std::string &qcFile)
{
	std::vector<std::string> files;
	std::unordered_set<std::string> visited;
	std::function<void(const std::filesystem::path &)> scan = nullptr;
	scan = [&scan, &files, &visited](const std::filesystem::path &path) {
		std::error_code ec;
		auto canonical = std::filesystem::weakly_canonical(path, ec);
		if(ec || rcomp::is_system_file(canonical.string()) == false)
			return;
		auto key = canonical.generic_string();
		if(visited.insert(key).second == false)
			return;
		files.push_back(key);
		auto text = rcomp::read_text_file(key);
		if(text.has_value() == false)
			return;
		for(auto &line : rcomp::split_lines(*text)) {
			auto trimmed = trim_left(line);
			if(starts_with_keyword(trimmed, "$include") == false)
				continue;
			auto tokens = rcomp::tokenize_line(trimmed);
			if(tokens.size() < 2)
				continue;
			scan(canonical.parent_path() / rcomp::normalize_slashes(tokens[1]));
		}
	};
	scan(qcFile);
	return files;
}

void rcomp::qc::scan_materials(const std::string &text, QcMaterialInfo &info, const VariableEnvironment *variables)
{
	auto normalize = [variables](std::string value) {
		if(variables) {
			auto substituted = variables->Substitute(value);
			if(substituted.has_value())
				value = std::move(*substituted);
		}
		return rcomp::normalize_slashes(std::move(value));
	};
	auto lines = rcomp::split_lines(text);
	for(size_t i = 0; i < lines.size(); ++i) {
		auto trimmed = trim_left(lines[i]);
		if(starts_with_keyword(trimmed, "$renamematerial")) {
			auto tokens = rcomp::tokenize_line(trimmed);
			if(tokens.size() == 3)
				info.renamedMaterials[normalize(tokens[1])] = normalize(tokens[2]);
			continue;
		}
		if(starts_with_keyword(trimmed, "$cdmaterials")) {
			auto tokens = rcomp::tokenize_line(trimmed);
			for(auto it = tokens.begin() + 1; it != tokens.end(); ++it) {
				auto dir = normalize(*it);
				while(dir.empty() == false && dir.back() == '/')
					dir.pop_back();
				info.cdMaterials.push_back(dir);
			}
			continue;
		}
		if(starts_with_keyword(trimmed, "$texturegroup") == false)
			continue;
		std::string lower {trimmed};
		ustring::to_lower(lower);
		if(lower.find("skinfamilies") == std::string::npos)
			continue;
		// Quoted names between the outermost braces
		auto depth = 0;
		auto started = false;
		auto headerOffset = (lines[i].length() - trimmed.length()) + lower.find("skinfamilies") + std::string_view {"skinfamilies"}.length();
		for(; i < lines.size(); ++i) {
			auto row = std::string_view {lines[i]};
			if(headerOffset > 0) {
				row = row.substr(std::min(headerOffset, row.length()));
				headerOffset = 0;
			}
			auto inQuotes = false;
			std::string name;
			for(auto c : row) {
				if(c == '"') {
					if(inQuotes && name.empty() == false)
						info.skinFamilyMaterials.push_back(normalize(name));
					name.clear();
					inQuotes = !inQuotes;
					continue;
				}
				if(inQuotes) {
					name += c;
					continue;
				}
				if(c == '{') {
					++depth;
					started = true;
				}
				else if(c == '}')
					--depth;
			}
			if(started && depth <= 0)
				break;
		}
	}
}

std::vector<std::string> rcomp::qc::read_materials(const std::string &qcFile, const std::vector<std::string> &dumpedMaterials, const VariableEnvironment *variables, const LogHandler &logHandler)
{
	QcMaterialInfo info {};
	for(auto &file : read_includes(qcFile)) {
		auto text = rcomp::read_text_file(file);
		if(text.has_value() == false) {
			rcomp::log(logHandler, "Unable to read QC file '" + file + "'!", LogSeverity::Warning);
			continue;
		}
		scan_materials(*text, info, variables);
	}
	auto rename = [&info](const std::string &name) {
		auto it = info.renamedMaterials.find(name);
		return (it != info.renamedMaterials.end()) ? it->second : name;
	};
	std::vector<std::string> materials;
	for(auto &name : dumpedMaterials)
		materials.push_back(rename(rcomp::normalize_slashes(name)));
	std::vector<std::string> combined = materials;
	for(auto &name : info.skinFamilyMaterials)
		materials.push_back(rename(name));
	if(info.cdMaterials.empty())
		combined.insert(combined.end(), materials.begin(), materials.end());
	else {
		for(auto &dir : info.cdMaterials) {
			for(auto &name : materials)
				combined.push_back(dir.empty() ? name : (dir + '/' + name));
		}
	}
	std::sort(combined.begin(), combined.end());
	combined.erase(std::unique(combined.begin(), combined.end()), combined.end());
	return combined;
}
