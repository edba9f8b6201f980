// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#include "vmt_creator.hpp"
#include "file_util.hpp"
#include "shader_graph_resolver.hpp"
#include <sharedutils/util_string.h>
#include <filesystem>

std::string rcomp::VmtCreator::GetTextureReference(const std::string &vtfPath, const std::string &compileRoot)
{
	std::error_code ec;
	auto sharedRoot = std::filesystem::absolute(std::filesystem::path {compileRoot} / SHARED_ASSET_DIRECTORY, ec).lexically_normal();
	auto vtf = std::filesystem::absolute(vtfPath, ec).lexically_normal();
	auto rel = vtf.lexically_relative(sharedRoot);
	if(rel.empty() || *rel.begin() == "..")
		return vtf.stem().string();
	auto ref = rel.replace_extension().generic_string();
	std::string prefix = std::string {MATERIALS_DIRECTORY} + "/";
	if(ustring::compare(ref.c_str(), prefix.c_str(), false, prefix.length()))
		ref = ref.substr(prefix.length());
	return ref;
}

std::string rcomp::VmtCreator::ProcessTemplate(const std::string &content, const std::string &texturePath)
{
	auto lines = split_lines(content);
	for(auto &line : lines) {
		auto indent = get_leading_whitespace(line);
		if(line.compare(indent.length(), 2, "\"$") == 0) {
			auto sep = line.find_first_of(" \t", indent.length());
			if(sep == std::string::npos)
				continue;
			auto key = line.substr(0, sep);
			ustring::replace(key, "\"", "");
			line = key + line.substr(sep);
		}
		std::string trimmed = line;
		ustring::remove_whitespace(trimmed);
		if(ustring::compare(trimmed.c_str(), "$basetexture", false, 12) && (trimmed.length() == 12 || trimmed[12] == ' ' || trimmed[12] == '\t' || trimmed[12] == '"'))
			line = std::string {get_leading_whitespace(line)} + "$basetexture \"" + texturePath + "\"";
	}
	return join_lines(lines);
}

bool rcomp::VmtCreator::CreateFromTemplate(const std::string &templatePath, const std::string &vtfPath, const std::string &compileRoot, std::string &outErr, const LogHandler &logHandler)
{
	auto content = read_text_file(templatePath);
	if(!content) {
		outErr = "VMT template not found: '" + templatePath + "'";
		return false;
	}
	auto vmtPath = std::filesystem::path {vtfPath}.replace_extension(".vmt").string();
	if(write_text_file(vmtPath, ProcessTemplate(*content, GetTextureReference(vtfPath, compileRoot)), outErr) == false)
		return false;
	rcomp::log(logHandler, "VMT created: " + vmtPath, LogSeverity::Info);
	return true;
}
