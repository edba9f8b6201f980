// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#include "command_line.hpp"
#include "qc_expression.hpp"
#include <sharedutils/util.h>
#include <filesystem>
#include <functional>
#include <unordered_map>

static std::string normalize_option(const std::string &arg)
{
	if(arg.size() > 2 && arg[0] == '-' && arg[1] != '-' && !rcomp::qc::parse_number(arg))
		return "-" + arg;
	return arg;
}

std::string rcomp::get_usage(const std::string &programName)
{
	return "Usage: " + programName
	  + " <config> [options]\n"
	    "\n"
	    "General:\n"
	    "  --verbose              Print debug output\n"
	    "  --log <file>           Mirror all output into a log file\n"
	    "  --basedir <dir>        Override the input/output root (default: config directory)\n"
	    "\n"
	    "ValveModel:\n"
	    "  --exportdir <dir>      Root folder for compiled output\n"
	    "  --game [dir]           Compile models directly to the game directory, optionally with a\n"
	    "                         directory containing a gameinfo.txt that overrides the config\n"
	    "  --mat-mode <0|1|2>     Material mode: 0=skip, 1=raw-local, 2=shared (default)\n"
	    "  --no-mat-local         Disable material localization\n"
	    "  --package-files        Package each export subfolder into a VPK\n"
	    "  --archive-old-ver      Archive the previous export instead of deleting it\n"
	    "  --qc-mode <1|2>        QC mode: 1=raw QC, 2=flattened QC (default)\n"
	    "  --keep-flat-qc         Keep flattened QC files after compilation\n"
	    "\n"
	    "ValveTexture:\n"
	    "  --forceupdate          Reconvert textures that are up to date\n"
	    "  --allow-reprocess      Allow the same file to be converted more than once\n"
	    "  --recursive            Search for input files in subfolders\n";
}

std::optional<rcomp::CommandLineOptions> rcomp::parse_command_line(const std::vector<std::string> &args, std::string &outErr)
{
	CommandLineOptions options {};
	auto &build = options.buildOptions;
	size_t i = 0;
	auto nextValue = [&args, &i, &outErr](const std::string &option) -> std::optional<std::string> {
		if(i + 1 >= args.size()) {
			outErr = "Missing value for option '" + option + "'";
			return {};
		}
		return args[++i];
	};

	using FlagHandler = std::function<void()>;
	std::unordered_map<std::string, FlagHandler> flags {
	  {"--verbose", [&build]() { build.verbose = true; }},
	  {"--no-mat-local", [&build]() { build.localizeMaterials = false; }},
	  {"--package-files", [&build]() { build.packageFiles = true; }},
	  {"--archive-old-ver", [&build]() { build.archiveOldVersion = true; }},
	  {"--keep-flat-qc", [&build]() { build.keepFlatQc = true; }},
	  {"--forceupdate", [&build]() { build.textureOptions.forceUpdate = true; }},
	  {"--allow-reprocess", [&build]() { build.textureOptions.allowReprocess = true; }},
	  {"--allow_reprocess", [&build]() { build.textureOptions.allowReprocess = true; }},
	  {"--recursive", [&build]() { build.textureOptions.recursive = true; }},
	  {"--help", [&options]() { options.showHelp = true; }},
	  {"-h", [&options]() { options.showHelp = true; }},
	};

	for(; i < args.size(); ++i) {
		auto arg = normalize_option(args[i]);
		auto itFlag = flags.find(arg);
		if(itFlag != flags.end()) {
			itFlag->second();
			continue;
		}
		if(arg == "--game") {
			build.gameMode = true;
			// The directory is optional; only an existing directory is consumed
			std::error_code ec;
			if(i + 1 < args.size() && !args[i + 1].empty() && args[i + 1].front() != '-' && std::filesystem::is_directory(args[i + 1], ec))
				build.gameDir = args[++i];
			continue;
		}
		if(arg == "--exportdir" || arg == "--basedir" || arg == "--log" || arg == "--mat-mode" || arg == "--qc-mode") {
			auto value = nextValue(arg);
			if(!value)
				return {};
			if(arg == "--exportdir")
				build.exportDir = *value;
			else if(arg == "--basedir")
				build.baseDir = *value;
			else if(arg == "--log")
				options.logFile = *value;
			else if(arg == "--mat-mode") {
				auto mode = util::to_int(*value);
				if(*value != "0" && *value != "1" && *value != "2") {
					outErr = "Invalid material mode '" + *value + "', expected 0, 1 or 2";
					return {};
				}
				build.materialMode = static_cast<MaterialMode>(mode);
			}
			else {
				if(*value != "1" && *value != "2") {
					outErr = "Invalid QC mode '" + *value + "', expected 1 or 2";
					return {};
				}
				build.qcMode = static_cast<QcMode>(util::to_int(*value));
			}
			continue;
		}
		if(!arg.empty() && arg.front() == '-') {
			outErr = "Unknown option '" + args[i] + "'";
			return {};
		}
		if(!options.configPath.empty()) {
			outErr = "Unexpected argument '" + arg + "'";
			return {};
		}
		options.configPath = arg;
	}
	if(options.configPath.empty() && !options.showHelp) {
		outErr = "No config file specified";
		return {};
	}
	return options;
}
