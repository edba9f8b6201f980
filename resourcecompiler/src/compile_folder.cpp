// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#include "compile_folder.hpp"
#include "file_util.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

std::string rcomp::get_archive_timestamp()
{
	auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
	std::tm tm {};
#ifdef _WIN32
	localtime_s(&tm, &t);
#else
	localtime_r(&t, &tm);
#endif
	std::stringstream ss;
	ss << std::put_time(&tm, "%Y-%m-%d_%H-%M-%S");
	return ss.str();
}

bool rcomp::clean_compile_folder(const std::string &compileRoot, bool archive, std::string &outErr, const LogHandler &logHandler)
{
	std::error_code ec;
	std::filesystem::path root {compileRoot};
	if(rcomp::is_system_dir(compileRoot) == false || std::filesystem::is_empty(root, ec))
		return true;

	if(archive) {
		auto absRoot = std::filesystem::absolute(root, ec);
		if(!absRoot.has_filename())
			absRoot = absRoot.parent_path();
		auto archiveDir = absRoot.parent_path() / ARCHIVE_DIRECTORY;
		if(rcomp::create_system_path(archiveDir.string()) == false) {
			outErr = "Unable to create archive directory '" + archiveDir.string() + "'";
			return false;
		}
		auto dst = archiveDir / (absRoot.filename().string() + "_" + get_archive_timestamp());
		std::filesystem::rename(absRoot, dst, ec);
		if(ec) {
			outErr = "Unable to archive '" + absRoot.string() + "': " + ec.message();
			return false;
		}
		rcomp::log(logHandler, "Archived previous build to '" + dst.string() + "'", LogSeverity::Info);
		return true;
	}

	rcomp::log(logHandler, "Cleaning existing compile folder...", LogSeverity::Info);
	auto success = true;
	for(auto &entry : std::filesystem::directory_iterator {root, ec}) {
		std::error_code removeEc;
		std::filesystem::remove_all(entry.path(), removeEc);
		if(removeEc) {
			rcomp::log(logHandler, "Failed to remove '" + entry.path().string() + "': " + removeEc.message(), LogSeverity::Warning);
			success = false;
			continue;
		}
		rcomp::log(logHandler, "Removed '" + entry.path().filename().string() + "'", LogSeverity::Debug);
	}
	if(ec) {
		outErr = "Unable to iterate '" + root.string() + "': " + ec.message();
		return false;
	}
	if(!success)
		outErr = "Some items in '" + root.string() + "' could not be removed";
	return success;
}
