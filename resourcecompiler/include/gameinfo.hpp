// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#ifndef __RCOMP_GAMEINFO_HPP__
#define __RCOMP_GAMEINFO_HPP__

#include "rcompdefinitions.h"
#include <optional>
#include <string>
#include <vector>

namespace rcomp {
	// Returns the content directories listed as "game" search paths in a gameinfo.txt, in file order.
	// If the file has no SearchPaths block, the parent of the gameinfo directory is returned.
	DLLRCOMP std::optional<std::vector<std::string>> get_game_search_paths(const std::string &gameinfoFile, std::string &outErr);
};

#endif
