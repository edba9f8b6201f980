// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#ifndef __RCOMP_BUILD_ORCHESTRATOR_HPP__
#define __RCOMP_BUILD_ORCHESTRATOR_HPP__

#include "rcompdefinitions.h"
#include "rcomp_log.hpp"
#include "build_settings.hpp"
#include "texture_pipeline.hpp"
#include <cinttypes>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#pragma warning(push)
#pragma warning(disable : 4251)
namespace rcomp {
	class IProcessRunner;
	class TextureEncoder;
	namespace qc {
		class VariableEnvironment;
	};

	static constexpr std::string_view DEFAULT_COMPILE_ROOT = "compile";

	enum class MaterialMode : uint8_t { Skip = 0, Local, Shared };
	enum class QcMode : uint8_t { Raw = 1, Flattened };

	struct DLLRCOMP BuildOptions {
		std::optional<std::string> exportDir {};
		std::optional<std::string> baseDir {};
		bool gameMode = false;
		// Directory containing a gameinfo.txt, overrides the configured one
		std::optional<std::string> gameDir {};
		MaterialMode materialMode = MaterialMode::Shared;
		bool localizeMaterials = true;
		bool packageFiles = false;
		bool archiveOldVersion = false;
		QcMode qcMode = QcMode::Flattened;
		bool keepFlatQc = false;
		bool verbose = false;
		TexturePipelineOptions textureOptions {};
	};

	struct DLLRCOMP BuildSummary {
		uint32_t modelsBuilt = 0;
		uint32_t modelsFailed = 0;
		uint32_t modelsSkipped = 0;
		uint32_t materialFilesCopied = 0;
		uint32_t dataItemsFailed = 0;
		uint32_t texturesConverted = 0;
		uint32_t texturesFailed = 0;
		uint32_t packagesBuilt = 0;
	};

	class DLLRCOMP BuildOrchestrator {
	  public:
		BuildOrchestrator(BuildSettings settings, BuildOptions options, Logger &logger);
		// Used for all external tools; defaults to SystemProcessRunner
		void SetProcessRunner(const std::shared_ptr<IProcessRunner> &processRunner) { m_processRunner = processRunner; }

		// Runs the pipeline selected by the config header. Returns false if the pipeline could not run at all,
		// individual model or texture failures are reported in the summary.
		bool Execute();
		bool ExecuteModelPipeline();
		bool ExecuteTexturePipeline();
		bool CompileModel(const ModelSettings &model);

		const BuildSummary &GetSummary() const { return m_summary; }
		const std::string &GetCompileRoot() const { return m_compileRoot; }
		const std::vector<std::string> &GetSearchPaths() const { return m_searchPaths; }
		std::string GetInputRoot() const;
	  private:
		struct QcCompileResult {
			bool success = false;
			std::vector<std::string> materials;
		};
		std::unique_ptr<qc::VariableEnvironment> CreateVariables(const ModelSettings &model, const std::string &target) const;
		QcCompileResult CompileQc(const std::string &qcPath, const std::string &baseName, const qc::VariableEnvironment &variables, const std::optional<std::string> &outputDir, const LogHandler &logHandler);
		void CompileSubmodels(const ModelSettings &model, const std::string &qcPath, const std::optional<std::string> &outputDir, std::set<std::string> &materials, const LogHandler &logHandler);
		void ProcessModelMaterials(const ModelSettings &model, const std::string &qcPath, const std::set<std::string> &dumpedMaterials, const std::string &outputDir);
		void ProcessMaterialSets();
		void ProcessDataSections();
		void PackageFiles();
		void PrintSummary();
		std::shared_ptr<TextureEncoder> CreateEncoder() const;
		bool ResolveGameInfo();

		BuildSettings m_settings;
		BuildOptions m_options;
		Logger &m_logger;
		std::shared_ptr<IProcessRunner> m_processRunner;
		std::string m_compileRoot;
		std::optional<std::string> m_gameinfoPath {};
		std::optional<std::string> m_gameinfoDir {};
		std::vector<std::string> m_searchPaths;
		BuildSummary m_summary {};
	};
};
#pragma warning(pop)

#endif
