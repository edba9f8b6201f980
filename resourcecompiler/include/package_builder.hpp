// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#ifndef __RCOMP_PACKAGE_BUILDER_HPP__
#define __RCOMP_PACKAGE_BUILDER_HPP__

#include "rcompdefinitions.h"
#include "rcomp_log.hpp"
#include "process_runner.hpp"
#include <memory>
#include <string>

#pragma warning(push)
#pragma warning(disable : 4251)
namespace rcomp {
	// Packs a folder into <folder>.vpk via the vpk tool
	class DLLRCOMP PackageBuilder {
	  public:
		PackageBuilder(std::string vpkPath, std::shared_ptr<IProcessRunner> processRunner = nullptr);
		void SetLogHandler(const LogHandler &logHandler) { m_logHandler = logHandler; }
		void SetVerbose(bool verbose) { m_verbose = verbose; }
		bool Package(const std::string &folder, std::string &outErr);
	  private:
		std::string m_vpkPath;
		std::shared_ptr<IProcessRunner> m_processRunner;
		LogHandler m_logHandler;
		bool m_verbose = false;
	};
};
#pragma warning(pop)

#endif
