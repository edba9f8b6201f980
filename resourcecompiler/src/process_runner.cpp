// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#include "process_runner.hpp"
#include <array>
#include <cstdio>
#ifndef _WIN32
#include <sys/wait.h>
#endif

std::string rcomp::quote_argument(const std::string &arg)
{
#ifdef _WIN32
	if(arg.empty() == false && arg.find_first_of(" \t\"") == std::string::npos)
		return arg;
	std::string quoted = "\"";
	for(auto c : arg) {
		if(c == '"')
			quoted += '\\';
		quoted += c;
	}
	return quoted + '"';
#else
	if(arg.empty() == false && arg.find_first_not_of("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_-+=./:,@") == std::string::npos)
		return arg;
	std::string quoted = "'";
	for(auto c : arg) {
		if(c == '\'')
			quoted += "'\\''";
		else
			quoted += c;
	}
	return quoted + '\'';
#endif
}

std::string rcomp::build_command_line(const std::vector<std::string> &args)
{
	std::string cmd;
	for(auto &arg : args) {
		if(cmd.empty() == false)
			cmd += ' ';
		cmd += quote_argument(arg);
	}
	return cmd;
}

bool rcomp::SystemProcessRunner::Run(const std::vector<std::string> &args, ProcessResult &outResult, std::string &outErr)
{
	if(args.empty()) {
		outErr = "No executable specified!";
		return false;
	}
	auto cmd = build_command_line(args) + " 2>&1";
#ifdef _WIN32
	// cmd.exe strips the outer quotes of the whole command line
	cmd = "\"" + cmd + "\"";
	auto *pipe = _popen(cmd.c_str(), "r");
#else
	auto *pipe = popen(cmd.c_str(), "r");
#endif
	if(pipe == nullptr) {
		outErr = "Unable to start process '" + args.front() + "'!";
		return false;
	}
	std::array<char, 4096> buffer {};
	outResult.output.clear();
	size_t n;
	while((n = fread(buffer.data(), 1, buffer.size(), pipe)) > 0)
		outResult.output.append(buffer.data(), n);
#ifdef _WIN32
	outResult.exitCode = _pclose(pipe);
#else
	auto status = pclose(pipe);
	if(status == -1) {
		outErr = "Unable to retrieve exit status of process '" + args.front() + "'!";
		return false;
	}
	outResult.exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
#endif
	return true;
}
