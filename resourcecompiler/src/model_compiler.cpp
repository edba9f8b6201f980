// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#include "model_compiler.hpp"
#include "file_util.hpp"
#include <sharedutils/util_string.h>
#include <sharedutils/util_file.h>
#include <algorithm>
#include <filesystem>
#include <set>

rcomp::ModelCompiler::ModelCompiler(std::string studiomdlPath, std::shared_ptr<IProcessRunner> processRunner) : m_studiomdlPath {std::move(studiomdlPath)}, m_processRunner {std::move(processRunner)}
{
	if(m_processRunner == nullptr)
		m_processRunner = std::make_shared<SystemProcessRunner>();
}

std::vector<std::string> rcomp::ModelCompiler::BuildArguments(const std::string &qcFile, const std::optional<std::string> &gameDir) const
{
	std::vector<std::string> args {m_studiomdlPath, "-nop4", "-verbose", "-dumpmaterials"};
	if(gameDir) {
		args.push_back("-game");
		args.push_back(*gameDir);
	}
	args.push_back(qcFile);
	return args;
}

std::vector<std::string> rcomp::ModelCompiler::ParseMaterials(const std::string &output)
{
	std::set<std::string> materials;
	for(auto &line : rcomp::split_lines(output)) {
		std::string trimmed = line;
		ustring::remove_whitespace(trimmed);
		if(ustring::compare(trimmed.c_str(), "material", false, 8) == false)
			continue;
		// material <index> <flags> <name>, the name is the remainder of the line
		size_t pos = 0;
		for(auto i = 0; i < 3 && pos != std::string::npos; ++i) {
			pos = trimmed.find_first_of(" \t", pos);
			if(pos != std::string::npos)
				pos = trimmed.find_first_not_of(" \t", pos);
		}
		if(pos == std::string::npos)
			continue;
		auto name = rcomp::strip_quotes(trimmed.substr(pos));
		ustring::remove_whitespace(name);
		if(name.empty() == false)
			materials.insert(rcomp::normalize_slashes(name));
	}
	return {materials.begin(), materials.end()};
}

std::vector<std::string> rcomp::ModelCompiler::ParseWrittenModels(const std::string &output)
{
	// "writing <path>.mdl", studiomdl may append further text after the path
	std::vector<std::string> files;
	for(auto &line : rcomp::split_lines(output)) {
		std::string lower = line;
		ustring::to_lower(lower);
		auto pos = lower.find("writing ");
		if(pos == std::string::npos)
			continue;
		auto end = lower.rfind(".mdl");
		if(end == std::string::npos || end < pos + 8)
			continue;
		auto path = line.substr(pos + 8, end + 4 - (pos + 8));
		ustring::remove_whitespace(path);
		if(path.empty() == false && path.front() == '"')
			path.erase(path.begin());
		if(path.empty() == false)
			files.push_back(path);
	}
	return files;
}

void rcomp::ModelCompiler::LogCompilerOutput(const std::string &output) const
{
	for(auto &line : rcomp::split_lines(output)) {
		std::string trimmed = line;
		ustring::remove_whitespace(trimmed);
		if(trimmed.empty())
			continue;
		std::string lower = trimmed;
		ustring::to_lower(lower);
		if(lower.find("error") != std::string::npos || lower.find("failed") != std::string::npos || lower.find("cannot") != std::string::npos || lower.find("missing") != std::string::npos
		  || lower.find("aborted") != std::string::npos)
			rcomp::log(m_logHandler, "studiomdl: " + trimmed, LogSeverity::Error);
		else if(lower.find("warn") != std::string::npos)
			rcomp::log(m_logHandler, "studiomdl: " + trimmed, LogSeverity::Warning);
		else if(trimmed.front() == '$')
			rcomp::log(m_logHandler, "studiomdl: " + trimmed, LogSeverity::Info);
		else
			rcomp::log(m_logHandler, "studiomdl: " + trimmed, LogSeverity::Debug);
	}
}

std::vector<std::string> rcomp::ModelCompiler::MoveCompiledFiles(const std::vector<std::string> &mdlFiles, const std::string &outputDir)
{
	std::vector<std::string> movedFiles;
	std::set<std::filesystem::path> sourceDirs;
	for(auto &mdlFile : mdlFiles) {
		std::error_code ec;
		std::filesystem::path mdlPath {mdlFile};
		if(rcomp::is_system_file(mdlFile) == false) {
			rcomp::log(m_logHandler, "Expected output file missing: '" + mdlFile + "'", LogSeverity::Warning);
			continue;
		}
		auto baseName = mdlPath.stem().string();
		auto folder = mdlPath.parent_path();
		std::vector<std::filesystem::path> candidates {mdlPath};
		for(auto *ext : {".vvd", ".ani", ".phy"})
			candidates.push_back(folder / (baseName + ext));
		for(auto &entry : std::filesystem::directory_iterator {folder, ec}) {
			auto fileName = entry.path().filename().string();
			if(entry.is_regular_file() && fileName.rfind(baseName, 0) == 0 && ustring::compare<std::string>(entry.path().extension().string(), ".vtx", false))
				candidates.push_back(entry.path());
		}

		for(auto &src : candidates) {
			if(rcomp::is_system_file(src.string()) == false)
				continue;
			std::filesystem::path relPath = src.filename();
			auto it = std::find_if(src.begin(), src.end(), [](const std::filesystem::path &part) { return ustring::compare<std::string>(part.string(), "models", false); });
			if(it != src.end()) {
				relPath.clear();
				for(; it != src.end(); ++it)
					relPath /= *it;
			}
			auto dst = std::filesystem::path {outputDir} / relPath;
			if(rcomp::create_system_path(dst.parent_path().string()) == false) {
				rcomp::log(m_logHandler, "Unable to create directory '" + dst.parent_path().string() + "'", LogSeverity::Warning);
				continue;
			}
			std::filesystem::remove(dst, ec);
			std::filesystem::rename(src, dst, ec);
			if(ec) {
				// Different volume
				std::string err;
				if(rcomp::copy_file(src.string(), dst.string(), err) == false) {
					rcomp::log(m_logHandler, "Unable to move '" + src.string() + "' to '" + dst.string() + "': " + err, LogSeverity::Warning);
					continue;
				}
				std::filesystem::remove(src, ec);
			}
			movedFiles.push_back(dst.generic_string());
			sourceDirs.insert(src.parent_path());
			rcomp::log(m_logHandler, "Moved '" + src.string() + "' -> '" + dst.string() + "'", LogSeverity::Debug);
		}
	}

	// Remove folders left empty, but never the "models" folder itself
	for(auto it = sourceDirs.rbegin(); it != sourceDirs.rend(); ++it) {
		std::error_code ec;
		auto folder = *it;
		while(folder.has_parent_path() && ustring::compare<std::string>(folder.filename().string(), "models", false) == false && std::filesystem::is_directory(folder, ec) && std::filesystem::is_empty(folder, ec)) {
			if(std::filesystem::remove(folder, ec) == false)
				break;
			rcomp::log(m_logHandler, "Removed empty folder '" + folder.string() + "'", LogSeverity::Debug);
			folder = folder.parent_path();
		}
	}
	return movedFiles;
}

rcomp::ModelCompileResult rcomp::ModelCompiler::Compile(const std::string &qcFile, const std::optional<std::string> &outputDir, const std::optional<std::string> &gameDir)
{
	ModelCompileResult result {};
	std::string ext;
	if(ufile::get_extension(qcFile, &ext) == false || ustring::compare<std::string>(ext, "qc", false) == false) {
		rcomp::log(m_logHandler, "Only .qc files can be compiled: '" + qcFile + "'", LogSeverity::Error);
		return result;
	}
	ProcessResult processResult {};
	std::string err;
	if(m_processRunner->Run(BuildArguments(qcFile, gameDir), processResult, err) == false) {
		rcomp::log(m_logHandler, "Failed to run studiomdl: " + err, LogSeverity::Error);
		return result;
	}
	result.output = processResult.output;
	LogCompilerOutput(processResult.output);
	if(processResult.Succeeded() == false) {
		rcomp::log(m_logHandler, "Failed to compile '" + std::filesystem::path {qcFile}.filename().string() + "' (exit code " + std::to_string(processResult.exitCode) + ")", LogSeverity::Error);
		return result;
	}
	auto writtenModels = ParseWrittenModels(processResult.output);
	if(outputDir)
		result.producedFiles = MoveCompiledFiles(writtenModels, *outputDir);
	else
		result.producedFiles = writtenModels;
	result.materials = ParseMaterials(processResult.output);
	rcomp::log(m_logHandler, "Found " + std::to_string(result.materials.size()) + " unique materials.", LogSeverity::Debug);
	result.success = true;
	return result;
}
