// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#ifndef __RCOMP_COMPILE_FOLDER_HPP__
#define __RCOMP_COMPILE_FOLDER_HPP__

#include "rcompdefinitions.h"
#include "rcomp_log.hpp"
#include <string>

namespace rcomp {
	static constexpr std::string_view ARCHIVE_DIRECTORY = "_archive";

	// Prepares the export directory for a new build.
	// With archive enabled, the old folder is moved to <parent>/_archive/<name>_<timestamp>, otherwise its contents are removed.
	DLLRCOMP bool clean_compile_folder(const std::string &compileRoot, bool archive, std::string &outErr, const LogHandler &logHandler = nullptr);
	// YYYY-MM-DD_HH-MM-SS
	DLLRCOMP std::string get_archive_timestamp();
};

#endif
