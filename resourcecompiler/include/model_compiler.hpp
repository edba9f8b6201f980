// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#ifndef __RCOMP_MODEL_COMPILER_HPP__
#define __RCOMP_MODEL_COMPILER_HPP__

#include "rcompdefinitions.h"
#include "rcomp_log.hpp"
#include "process_runner.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

#pragma warning(push)
#pragma warning(disable : 4251)
namespace rcomp {
	struct DLLRCOMP ModelCompileResult {
		bool success = false;
		std::vector<std::string> producedFiles;
		// Material names reported by the compiler, sorted and without duplicates
		std::vector<std::string> materials;
		std::string output;
	};

	// Drives studiomdl
	class DLLRCOMP ModelCompiler {
	  public:
		ModelCompiler(std::string studiomdlPath, std::shared_ptr<IProcessRunner> processRunner = nullptr);
		void SetLogHandler(const LogHandler &logHandler) { m_logHandler = logHandler; }

		// Compiled files are moved into outputDir (keeping their path below "models/") if one is specified
		ModelCompileResult Compile(const std::string &qcFile, const std::optional<std::string> &outputDir = {}, const std::optional<std::string> &gameDir = {});

		static std::vector<std::string> ParseMaterials(const std::string &output);
		static std::vector<std::string> ParseWrittenModels(const std::string &output);
		std::vector<std::string> BuildArguments(const std::string &qcFile, const std::optional<std::string> &gameDir) const;
	  private:
		std::vector<std::string> MoveCompiledFiles(const std::vector<std::string> &mdlFiles, const std::string &outputDir);
		void LogCompilerOutput(const std::string &output) const;
		std::string m_studiomdlPath;
		std::shared_ptr<IProcessRunner> m_processRunner;
		LogHandler m_logHandler;
	};
};
#pragma warning(pop)

#endif
