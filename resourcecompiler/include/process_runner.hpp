// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#ifndef __RCOMP_PROCESS_RUNNER_HPP__
#define __RCOMP_PROCESS_RUNNER_HPP__

#include "rcompdefinitions.h"
#include <optional>
#include <string>
#include <vector>

namespace rcomp {
	struct DLLRCOMP ProcessResult {
		int exitCode = -1;
		std::string output;
		bool Succeeded() const { return exitCode == 0; }
	};

	class DLLRCOMP IProcessRunner {
	  public:
		virtual ~IProcessRunner() = default;
		// args[0] is the executable. Returns false if the process could not be started.
		virtual bool Run(const std::vector<std::string> &args, ProcessResult &outResult, std::string &outErr) = 0;
	};

	// Runs the process through the system shell and captures stdout and stderr
	class DLLRCOMP SystemProcessRunner : public IProcessRunner {
	  public:
		virtual bool Run(const std::vector<std::string> &args, ProcessResult &outResult, std::string &outErr) override;
	};

	DLLRCOMP std::string quote_argument(const std::string &arg);
	DLLRCOMP std::string build_command_line(const std::vector<std::string> &args);
};

#endif
