// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#include "texture_pipeline.hpp"
#include "texture_encoder.hpp"
#include "file_util.hpp"
#include <algorithm>
#include <filesystem>
#include <regex>

rcomp::TexturePipeline::TexturePipeline(std::shared_ptr<TextureEncoder> encoder, std::string rootDir, const TexturePipelineOptions &options) : m_encoder {std::move(encoder)}, m_rootDir {std::move(rootDir)}, m_options {options} {}

std::vector<std::string> rcomp::TexturePipeline::FindMatchingFiles(const std::string &pattern) const
{
	std::vector<std::string> files;
	std::error_code ec;
	auto literalPath = std::filesystem::path {m_rootDir} / pattern;
	if(rcomp::is_system_file(literalPath.string())) {
		files.push_back(literalPath.lexically_normal().generic_string());
		return files;
	}

	std::regex regex;
	try {
		regex = std::regex {pattern};
	}
	catch(const std::regex_error &e) {
		rcomp::log(m_logHandler, "Invalid input pattern '" + pattern + "': " + e.what(), LogSeverity::Warning);
		return files;
	}
	auto addIfMatching = [&files, &regex](const std::filesystem::directory_entry &entry) {
		if(entry.is_regular_file() && std::regex_search(entry.path().filename().string(), regex))
			files.push_back(entry.path().lexically_normal().generic_string());
	};
	if(m_options.recursive) {
		for(auto &entry : std::filesystem::recursive_directory_iterator {m_rootDir, ec})
			addIfMatching(entry);
	}
	else {
		for(auto &entry : std::filesystem::directory_iterator {m_rootDir, ec})
			addIfMatching(entry);
	}
	std::sort(files.begin(), files.end());
	return files;
}

std::string rcomp::TexturePipeline::ResolveOutputPath(const std::string &srcFile, const std::optional<std::string> &output) const
{
	auto fileName = std::filesystem::path {srcFile}.stem().string() + ".vtf";
	if(!output || output->empty())
		return (std::filesystem::path {m_rootDir} / fileName).lexically_normal().generic_string();
	std::filesystem::path outputPath {*output};
	if(outputPath.is_relative())
		outputPath = std::filesystem::path {m_rootDir} / outputPath;
	if(outputPath.has_extension() == false)
		return (outputPath / fileName).lexically_normal().generic_string();
	return outputPath.replace_extension(".vtf").lexically_normal().generic_string();
}

bool rcomp::TexturePipeline::IsUpToDate(const std::string &srcFile, const std::string &dstFile) const
{
	if(rcomp::is_system_file(dstFile) == false)
		return false;
	std::error_code ec;
	auto srcTime = std::filesystem::last_write_time(srcFile, ec);
	if(ec)
		return false;
	auto dstTime = std::filesystem::last_write_time(dstFile, ec);
	if(ec)
		return false;
	return dstTime >= srcTime;
}

bool rcomp::TexturePipeline::ProcessFile(const std::string &srcFile, const TextureGroup &group)
{
	std::error_code ec;
	auto key = std::filesystem::weakly_canonical(srcFile, ec).generic_string();
	auto fileName = std::filesystem::path {srcFile}.filename().string();
	if(!m_options.allowReprocess && m_processedFiles.find(key) != m_processedFiles.end()) {
		rcomp::log(m_logHandler, "Skipping " + fileName + ", already processed", LogSeverity::Info);
		return true;
	}
	auto outputPath = ResolveOutputPath(srcFile, group.output);
	if(!m_options.forceUpdate && IsUpToDate(srcFile, outputPath)) {
		rcomp::log(m_logHandler, "Skipping " + fileName + " (already up-to-date)", LogSeverity::Info);
		m_processedFiles.insert(key);
		return true;
	}

	rcomp::log(m_logHandler, "Converting: " + fileName + " -> " + std::filesystem::path {outputPath}.filename().string(), LogSeverity::Info);
	std::string err;
	if(m_encoder->Encode(srcFile, outputPath, group.options, err) == false) {
		rcomp::log(m_logHandler, "Failed to export '" + srcFile + "' -> '" + outputPath + "': " + err, LogSeverity::Error);
		return false;
	}
	m_processedFiles.insert(key);
	++m_numConverted;

	std::filesystem::last_write_time(outputPath, std::filesystem::last_write_time(srcFile, ec), ec);
	if(ec)
		rcomp::log(m_logHandler, "Unable to update timestamp of '" + outputPath + "': " + ec.message(), LogSeverity::Warning);
	else
		rcomp::log(m_logHandler, "Finished VTF: " + outputPath + " (mtime synced to source)", LogSeverity::Debug);
	return true;
}

uint32_t rcomp::TexturePipeline::ProcessGroup(const TextureGroup &group)
{
	rcomp::log(m_logHandler, "Processing texture group: " + group.name, LogSeverity::Info);
	if(group.input.empty()) {
		rcomp::log(m_logHandler, "Skipped " + group.name + ", missing 'input'", LogSeverity::Warning);
		return 0;
	}
	auto files = FindMatchingFiles(group.input);
	if(files.empty()) {
		rcomp::log(m_logHandler, "No matching file(s) found for pattern: " + group.input, LogSeverity::Warning);
		return 0;
	}
	uint32_t numFailed = 0;
	for(auto &file : files) {
		if(!ProcessFile(file, group))
			++numFailed;
	}
	return numFailed;
}

uint32_t rcomp::TexturePipeline::Execute(const std::vector<TextureGroup> &groups)
{
	if(groups.empty()) {
		rcomp::log(m_logHandler, "No 'vtf' section found in config, nothing to process", LogSeverity::Warning);
		return 0;
	}
	uint32_t numFailed = 0;
	for(auto &group : groups)
		numFailed += ProcessGroup(group);
	return numFailed;
}
