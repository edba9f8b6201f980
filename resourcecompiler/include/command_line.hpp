// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#ifndef __RCOMP_COMMAND_LINE_HPP__
#define __RCOMP_COMMAND_LINE_HPP__

#include "rcompdefinitions.h"
#include "build_orchestrator.hpp"
#include <optional>
#include <string>
#include <vector>

#pragma warning(push)
#pragma warning(disable : 4251)
namespace rcomp {
	struct DLLRCOMP CommandLineOptions {
		std::string configPath;
		BuildOptions buildOptions {};
		std::optional<std::string> logFile {};
		bool showHelp = false;
	};

	// args excludes the program name. Single-dash long options ("-verbose") are accepted as aliases.
	DLLRCOMP std::optional<CommandLineOptions> parse_command_line(const std::vector<std::string> &args, std::string &outErr);
	DLLRCOMP std::string get_usage(const std::string &programName);
};
#pragma warning(pop)

#endif
