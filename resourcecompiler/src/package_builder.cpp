// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#include "package_builder.hpp"
#include "file_util.hpp"
#include <filesystem>

rcomp::PackageBuilder::PackageBuilder(std::string vpkPath, std::shared_ptr<IProcessRunner> processRunner) : m_vpkPath {std::move(vpkPath)}, m_processRunner {std::move(processRunner)}
{
	if(m_processRunner == nullptr)
		m_processRunner = std::make_shared<SystemProcessRunner>();
}

bool rcomp::PackageBuilder::Package(const std::string &folder, std::string &outErr)
{
	std::error_code ec;
	auto absFolder = std::filesystem::absolute(folder, ec);
	if(ec || rcomp::is_system_dir(absFolder.string()) == false) {
		outErr = "Folder not found: '" + folder + "'";
		return false;
	}
	rcomp::log(m_logHandler, "Packaging folder: " + absFolder.string(), LogSeverity::Info);
	ProcessResult result {};
	if(m_processRunner->Run({m_vpkPath, absFolder.string()}, result, outErr) == false)
		return false;
	if(m_verbose && !result.output.empty())
		rcomp::log(m_logHandler, result.output, LogSeverity::Debug);
	if(result.Succeeded() == false) {
		outErr = "vpk exited with code " + std::to_string(result.exitCode);
		return false;
	}
	rcomp::log(m_logHandler, "Packaged folder into VPK: " + absFolder.string(), LogSeverity::Info);
	return true;
}
