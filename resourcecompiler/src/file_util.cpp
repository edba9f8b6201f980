// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#include "file_util.hpp"
#include <fsys/filesystem.h>
#include <fsys/ifile.hpp>
#include <sharedutils/util_string.h>
#include <sharedutils/util_file.h>
#include <filesystem>

bool rcomp::is_system_file(const std::string &path) { return FileManager::IsSystemFile(path); }
bool rcomp::is_system_dir(const std::string &path) { return FileManager::IsSystemDir(path); }

bool rcomp::create_system_path(const std::string &dir)
{
	if(dir.empty() || is_system_dir(dir))
		return true;
	std::error_code ec;
	auto absPath = std::filesystem::absolute(std::filesystem::path {dir}, ec).lexically_normal();
	if(ec)
		return false;
	return FileManager::CreateSystemPath(absPath.root_path().generic_string(), absPath.relative_path().generic_string().c_str());
}

std::optional<std::string> rcomp::read_text_file(const std::string &path)
{
	auto fp = filemanager::open_system_file(path, filemanager::FileMode::Read | filemanager::FileMode::Binary);
	if(fp == nullptr)
		return {};
	auto size = fp->GetSize();
	std::string data;
	data.resize(size);
	if(size > 0 && fp->Read(data.data(), size) != size)
		return {};
	return data;
}

bool rcomp::write_text_file(const std::string &path, const std::string &text, std::string &outErr)
{
	auto dir = ufile::get_path_from_filename(path);
	if(create_system_path(dir) == false) {
		outErr = "Unable to create directory '" + dir + "'!";
		return false;
	}
	auto fp = filemanager::open_system_file(path, filemanager::FileMode::Write | filemanager::FileMode::Binary);
	if(fp == nullptr) {
		outErr = "Unable to open file '" + path + "' for writing!";
		return false;
	}
	if(text.empty() == false && fp->Write(text.data(), text.size()) != text.size()) {
		outErr = "Unable to write to file '" + path + "'!";
		return false;
	}
	return true;
}

static std::string get_canonical_path(const std::string &path)
{
	std::error_code ec;
	auto canonical = std::filesystem::weakly_canonical(std::filesystem::path {path}, ec);
	return ec ? std::filesystem::path {path}.lexically_normal().generic_string() : canonical.generic_string();
}

bool rcomp::copy_file(const std::string &src, const std::string &dst, std::string &outErr)
{
	if(is_system_file(src) == false) {
		outErr = "Unable to copy '" + src + "': File does not exist!";
		return false;
	}
	if(get_canonical_path(src) == get_canonical_path(dst))
		return true;
	auto data = read_text_file(src);
	if(!data) {
		outErr = "Unable to copy '" + src + "' to '" + dst + "': Source could not be read!";
		return false;
	}
	std::string err;
	if(write_text_file(dst, *data, err) == false) {
		outErr = "Unable to copy '" + src + "' to '" + dst + "': " + err;
		return false;
	}
	return true;
}

std::vector<std::string> rcomp::split_lines(const std::string &text)
{
	std::vector<std::string> lines;
	size_t start = 0;
	while(start <= text.length()) {
		auto end = text.find('\n', start);
		if(end == std::string::npos) {
			if(start < text.length())
				lines.push_back(text.substr(start));
			break;
		}
		auto line = text.substr(start, end - start);
		if(line.empty() == false && line.back() == '\r')
			line.pop_back();
		lines.push_back(std::move(line));
		start = end + 1;
	}
	if(lines.empty() == false && lines.back().empty() == false && lines.back().back() == '\r')
		lines.back().pop_back();
	return lines;
}

std::string rcomp::join_lines(const std::vector<std::string> &lines)
{
	std::string result;
	for(auto &line : lines) {
		result += line;
		result += '\n';
	}
	return result;
}

std::string_view rcomp::get_leading_whitespace(std::string_view line)
{
	auto pos = line.find_first_not_of(" \t");
	if(pos == std::string_view::npos)
		return line;
	return line.substr(0, pos);
}

std::string rcomp::normalize_slashes(std::string path)
{
	ustring::replace(path, "\\", "/");
	return path;
}

bool rcomp::is_comment_line(std::string_view line)
{
	auto pos = line.find_first_not_of(" \t");
	if(pos == std::string_view::npos)
		return false;
	return line.substr(pos, 2) == "//";
}

// Position of a "//" comment outside of quotes
static size_t find_line_comment(std::string_view line)
{
	auto inQuotes = false;
	for(size_t i = 0; i < line.length(); ++i) {
		if(line[i] == '"')
			inQuotes = !inQuotes;
		else if(inQuotes == false && line.substr(i, 2) == "//")
			return i;
	}
	return std::string_view::npos;
}

std::vector<std::string> rcomp::tokenize_line(std::string_view line)
{
	std::string content {line.substr(0, find_line_comment(line))};
	std::vector<std::string> tokens;
	ustring::explode_whitespace(content, tokens);
	for(auto &token : tokens)
		token = strip_quotes(token);
	return tokens;
}

std::string rcomp::strip_quotes(std::string_view str)
{
	if(str.length() >= 2 && str.front() == '"' && str.back() == '"')
		return std::string {str.substr(1, str.length() - 2)};
	return std::string {str};
}
