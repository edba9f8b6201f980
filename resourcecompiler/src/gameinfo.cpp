// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#include "gameinfo.hpp"
#include "file_util.hpp"
#include <sharedutils/util_string.h>
#include <algorithm>
#include <filesystem>

static constexpr std::string_view GAMEINFO_PATH_TOKEN = "|gameinfo_path|";
static constexpr std::string_view ALL_SOURCE_ENGINE_PATHS_TOKEN = "|all_source_engine_paths|";

static bool has_game_path_id(const std::string &key)
{
	std::vector<std::string> ids;
	ustring::explode(key, "+", ids);
	return std::any_of(ids.begin(), ids.end(), [](const std::string &id) { return ustring::compare<std::string>(id, "game", false); });
}

static void add_search_path(const std::filesystem::path &path, std::vector<std::string> &paths)
{
	if(rcomp::is_system_dir(path.string()) == false)
		return;
	std::error_code ec;
	auto canonical = std::filesystem::weakly_canonical(path, ec).generic_string();
	if(ec || std::find(paths.begin(), paths.end(), canonical) != paths.end())
		return;
	paths.push_back(canonical);
}

std::optional<std::vector<std::string>> rcomp::get_game_search_paths(const std::string &gameinfoFile, std::string &outErr)
{
	auto content = read_text_file(gameinfoFile);
	if(!content) {
		outErr = "Unable to open gameinfo file '" + gameinfoFile + "'";
		return {};
	}
	std::error_code ec;
	auto gameinfoDir = std::filesystem::absolute(gameinfoFile, ec).parent_path();
	auto baseDir = gameinfoDir.parent_path();

	std::vector<std::string> paths;
	auto lines = split_lines(*content);
	// The block is read line by line, the same path id may occur several times
	auto foundBlock = false;
	auto depth = 0;
	for(auto &line : lines) {
		auto tokens = tokenize_line(line);
		if(!foundBlock) {
			if(!tokens.empty() && ustring::compare<std::string>(tokens.front(), "SearchPaths", false)) {
				foundBlock = true;
				if(line.find('{') != std::string::npos)
					depth = 1;
			}
			continue;
		}
		std::string trimmed = line;
		ustring::remove_whitespace(trimmed);
		if(trimmed == "{") {
			++depth;
			continue;
		}
		if(trimmed == "}") {
			if(--depth <= 0)
				break;
			continue;
		}
		if(depth != 1 || tokens.size() < 2 || has_game_path_id(tokens[0]) == false)
			continue;

		auto value = normalize_slashes(tokens[1]);
		std::filesystem::path path;
		if(ustring::compare(value.c_str(), GAMEINFO_PATH_TOKEN.data(), false, GAMEINFO_PATH_TOKEN.length()))
			path = gameinfoDir / value.substr(GAMEINFO_PATH_TOKEN.length());
		else if(ustring::compare(value.c_str(), ALL_SOURCE_ENGINE_PATHS_TOKEN.data(), false, ALL_SOURCE_ENGINE_PATHS_TOKEN.length()))
			path = baseDir / value.substr(ALL_SOURCE_ENGINE_PATHS_TOKEN.length());
		else
			path = baseDir / value;

		auto strPath = path.generic_string();
		if(strPath.size() >= 2 && strPath.compare(strPath.size() - 2, 2, "/*") == 0) {
			auto parent = std::filesystem::path {strPath.substr(0, strPath.size() - 2)};
			std::vector<std::filesystem::path> subDirs;
			for(auto &entry : std::filesystem::directory_iterator {parent, ec}) {
				if(entry.is_directory())
					subDirs.push_back(entry.path());
			}
			std::sort(subDirs.begin(), subDirs.end());
			for(auto &subDir : subDirs)
				add_search_path(subDir, paths);
			continue;
		}
		add_search_path(path, paths);
	}
	if(!foundBlock)
		add_search_path(baseDir, paths);
	return paths;
}
