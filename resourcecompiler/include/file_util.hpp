// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#ifndef __RCOMP_FILE_UTIL_HPP__
#define __RCOMP_FILE_UTIL_HPP__

#include "rcompdefinitions.h"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rcomp {
	// Absolute or working-directory relative paths
	DLLRCOMP bool is_system_file(const std::string &path);
	DLLRCOMP bool is_system_dir(const std::string &path);
	// Creates the directory and all of its parents
	DLLRCOMP bool create_system_path(const std::string &dir);

	DLLRCOMP std::optional<std::string> read_text_file(const std::string &path);
	DLLRCOMP bool write_text_file(const std::string &path, const std::string &text, std::string &outErr);
	// Copies a file, creating the destination directory and overwriting any existing file
	DLLRCOMP bool copy_file(const std::string &src, const std::string &dst, std::string &outErr);

	DLLRCOMP std::vector<std::string> split_lines(const std::string &text);
	DLLRCOMP std::string join_lines(const std::vector<std::string> &lines);
	DLLRCOMP std::string_view get_leading_whitespace(std::string_view line);
	DLLRCOMP std::string normalize_slashes(std::string path);
	DLLRCOMP bool is_comment_line(std::string_view line);

	// Splits a line at whitespace; double-quoted sections form a single token with the quotes removed.
	// Tokenizing stops at a "//" comment outside of quotes.
	DLLRCOMP std::vector<std::string> tokenize_line(std::string_view line);
	DLLRCOMP std::string strip_quotes(std::string_view str);
};

#endif
