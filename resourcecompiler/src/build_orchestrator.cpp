// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#include "build_orchestrator.hpp"
#include "compile_folder.hpp"
#include "data_processor.hpp"
#include "file_util.hpp"
#include "gameinfo.hpp"
#include "model_compiler.hpp"
#include "package_builder.hpp"
#include "qc_material_scanner.hpp"
#include "qc_preprocessor.hpp"
#include "shader_graph_resolver.hpp"
#include "texture_encoder.hpp"
#include "variable_environment.hpp"
#include "vmt_creator.hpp"
#include <algorithm>
#include <filesystem>

static constexpr std::string_view GAMEINFO_FILE_NAME = "gameinfo.txt";
static constexpr std::string_view MAIN_QC_TARGET = "qc";

rcomp::BuildOrchestrator::BuildOrchestrator(BuildSettings settings, BuildOptions options, Logger &logger) : m_settings {std::move(settings)}, m_options {std::move(options)}, m_logger {logger}, m_processRunner {std::make_shared<SystemProcessRunner>()} {}

std::string rcomp::BuildOrchestrator::GetInputRoot() const
{
	if(!m_options.baseDir)
		return m_settings.configDir;
	std::error_code ec;
	return std::filesystem::absolute(*m_options.baseDir, ec).lexically_normal().generic_string();
}

static std::string resolve_against(const std::string &root, const std::string &path)
{
	std::filesystem::path p {path};
	if(p.is_absolute())
		return p.lexically_normal().generic_string();
	return (std::filesystem::path {root} / p).lexically_normal().generic_string();
}

bool rcomp::BuildOrchestrator::Execute()
{
	switch(m_settings.type) {
	case PipelineType::ValveModel:
		return ExecuteModelPipeline();
	case PipelineType::ValveTexture:
		return ExecuteTexturePipeline();
	default:
		break;
	}
	m_logger.Error("Unknown pipeline type");
	return false;
}

std::shared_ptr<rcomp::TextureEncoder> rcomp::BuildOrchestrator::CreateEncoder() const
{
	if(!m_settings.vtfcmd)
		return nullptr;
	return std::make_shared<TextureEncoder>(*m_settings.vtfcmd, m_processRunner);
}

bool rcomp::BuildOrchestrator::ResolveGameInfo()
{
	m_gameinfoPath = m_settings.gameinfo;
	if(m_options.gameDir) {
		auto overridePath = std::filesystem::path {*m_options.gameDir} / GAMEINFO_FILE_NAME;
		if(rcomp::is_system_file(overridePath.string())) {
			m_gameinfoPath = overridePath.generic_string();
			m_logger.Info("--game override: Using gameinfo.txt from " + *m_options.gameDir);
		}
		else
			m_logger.Warn("--game path '" + *m_options.gameDir + "' provided, but no gameinfo.txt found. Ignoring path.");
	}
	if(m_gameinfoPath && rcomp::is_system_file(*m_gameinfoPath) == false) {
		m_logger.Warn("gameinfo file '" + *m_gameinfoPath + "' does not exist");
		m_gameinfoPath = {};
	}
	if(m_options.gameMode && !m_gameinfoPath) {
		m_logger.Error("--game mode requires a valid 'gameinfo' path from config or --game argument.");
		return false;
	}
	if(!m_gameinfoPath) {
		m_logger.Warn("No gameinfo provided. Shared materials and material collection will be limited.");
		return true;
	}
	std::error_code ec;
	m_gameinfoDir = std::filesystem::absolute(*m_gameinfoPath, ec).parent_path().generic_string();
	std::string err;
	auto searchPaths = get_game_search_paths(*m_gameinfoPath, err);
	if(!searchPaths) {
		m_logger.Warn(err);
		return true;
	}
	m_searchPaths = std::move(*searchPaths);
	return true;
}

bool rcomp::BuildOrchestrator::ExecuteModelPipeline()
{
	if(!m_settings.studiomdl) {
		m_logger.Error("Config missing required field: studiomdl");
		return false;
	}
	if(ResolveGameInfo() == false)
		return false;

	std::error_code ec;
	m_compileRoot = std::filesystem::absolute(std::string {m_options.exportDir.value_or(std::string {DEFAULT_COMPILE_ROOT})}, ec).lexically_normal().generic_string();
	if(!m_options.exportDir)
		m_logger.Warn("--exportdir not provided, using default: " + m_compileRoot);

	if(m_options.gameMode) {
		m_logger.Info("--game mode enabled: Compiling models directly to game directory");
		m_logger.Info("Game directory: " + *m_gameinfoDir);
		m_logger.Info("Materials, data sections, and VPK packaging will be skipped");
	}
	else {
		std::string err;
		if(clean_compile_folder(m_compileRoot, m_options.archiveOldVersion, err, m_logger.CreateContext("OS")) == false)
			m_logger.Warn(err);
	}

	if(!m_searchPaths.empty()) {
		m_logger.Info("Game search paths:");
		for(auto &path : m_searchPaths)
			m_logger.Info("\t" + path);
	}
	if(m_settings.vtfcmd)
		m_logger.Info("VTF conversion enabled: " + *m_settings.vtfcmd);

	for(auto &model : m_settings.models)
		CompileModel(model);

	if(!m_options.gameMode) {
		ProcessMaterialSets();
		ProcessDataSections();
		if(m_options.packageFiles)
			PackageFiles();
	}
	PrintSummary();
	return true;
}

std::unique_ptr<rcomp::qc::VariableEnvironment> rcomp::BuildOrchestrator::CreateVariables(const ModelSettings &model, const std::string &target) const
{
	auto variables = std::make_unique<qc::VariableEnvironment>();
	for(auto &[name, value] : m_settings.globalDefines)
		variables->Set(name, value);
	for(auto &[name, value] : model.GetDefines(target))
		variables->Set(name, value);
	return variables;
}

rcomp::BuildOrchestrator::QcCompileResult rcomp::BuildOrchestrator::CompileQc(const std::string &qcPath, const std::string &baseName, const qc::VariableEnvironment &variables, const std::optional<std::string> &outputDir, const LogHandler &logHandler)
{
	QcCompileResult result {};
	auto compileFile = qcPath;
	std::optional<std::string> tempQc {};
	if(m_options.qcMode == QcMode::Raw)
		rcomp::log(logHandler, "QC mode 1: Using original QC file directly.", LogSeverity::Info);
	else {
		auto qcDir = std::filesystem::path {qcPath}.parent_path();
		auto flatVariables = variables;
		qc::MacroTable macros;
		qc::IncludeStack includeStack;
		std::string err;
		auto flat = qc::flatten(qcPath, flatVariables, macros, includeStack, {}, qcDir.generic_string(), err, m_logger.CreateContext("QC"));
		if(!flat) {
			rcomp::log(logHandler, "Failed to flatten '" + qcPath + "': " + err, LogSeverity::Error);
			return result;
		}
		tempQc = (qcDir / ("temp_" + baseName + ".qc")).generic_string();
		if(write_text_file(*tempQc, *flat, err) == false) {
			rcomp::log(logHandler, err, LogSeverity::Error);
			return result;
		}
		rcomp::log(logHandler, "QC mode 2: Flattened QC " + std::filesystem::path {qcPath}.filename().string() + " to " + std::filesystem::path {*tempQc}.filename().string(), LogSeverity::Info);
		compileFile = *tempQc;
	}

	ModelCompiler compiler {*m_settings.studiomdl, m_processRunner};
	compiler.SetLogHandler(logHandler);
	auto compileResult = compiler.Compile(compileFile, outputDir, m_gameinfoDir);

	if(tempQc && !m_options.keepFlatQc) {
		std::error_code ec;
		std::filesystem::remove(*tempQc, ec);
	}
	result.success = compileResult.success;
	result.materials = std::move(compileResult.materials);
	return result;
}

void rcomp::BuildOrchestrator::CompileSubmodels(const ModelSettings &model, const std::string &qcPath, const std::optional<std::string> &outputDir, std::set<std::string> &materials, const LogHandler &logHandler)
{
	auto qcDir = std::filesystem::path {qcPath}.parent_path().generic_string();
	for(auto &[subName, subQc] : model.submodels) {
		auto subQcPath = resolve_against(qcDir, subQc);
		if(rcomp::is_system_file(subQcPath) == false) {
			rcomp::log(logHandler, "Sub-QC not found: " + subQcPath, LogSeverity::Error);
			continue;
		}
		rcomp::log(logHandler, "Compiling sub-QC: " + std::filesystem::path {subQcPath}.filename().string() + " for submodel '" + subName + "'", LogSeverity::Info);
		auto variables = CreateVariables(model, subName);
		auto result = CompileQc(subQcPath, model.name + "_" + subName, *variables, outputDir, logHandler);
		if(!result.success)
			continue;
		materials.insert(result.materials.begin(), result.materials.end());
		rcomp::log(logHandler, "Compiled " + std::filesystem::path {subQcPath}.filename().string() + " (" + std::to_string(result.materials.size()) + " materials)", LogSeverity::Info);
	}
}

bool rcomp::BuildOrchestrator::CompileModel(const ModelSettings &model)
{
	auto logHandler = m_logger.CreateContext("MODEL");
	if(!model.compile) {
		rcomp::log(logHandler, "Skipping model " + model.name + " (compile=false)", LogSeverity::Warning);
		++m_summary.modelsSkipped;
		return true;
	}
	rcomp::log(logHandler, "Compiling model: " + model.name, LogSeverity::Info);

	auto qcPath = resolve_against(GetInputRoot(), model.qc);
	if(rcomp::is_system_file(qcPath) == false) {
		rcomp::log(logHandler, "QC file not found: " + qcPath, LogSeverity::Error);
		++m_summary.modelsFailed;
		return false;
	}

	std::optional<std::string> outputDir {};
	if(m_options.gameMode)
		rcomp::log(logHandler, "Compiling model " + std::filesystem::path {qcPath}.filename().string() + " directly to game directory", LogSeverity::Info);
	else {
		auto dir = std::filesystem::path {m_compileRoot} / model.name;
		outputDir = dir.generic_string();
		if(rcomp::create_system_path(*outputDir) == false)
			rcomp::log(logHandler, "Unable to create output directory '" + *outputDir + "'", LogSeverity::Warning);
	}

	auto variables = CreateVariables(model, std::string {MAIN_QC_TARGET});
	auto result = CompileQc(qcPath, model.name, *variables, outputDir, logHandler);
	if(!result.success) {
		rcomp::log(logHandler, "Main QC compilation failed.", LogSeverity::Error);
		++m_summary.modelsFailed;
		return false;
	}
	std::set<std::string> materials {result.materials.begin(), result.materials.end()};
	rcomp::log(logHandler, "Compiled " + std::filesystem::path {qcPath}.filename().string() + " (" + std::to_string(materials.size()) + " materials)", LogSeverity::Info);

	CompileSubmodels(model, qcPath, outputDir, materials, logHandler);
	++m_summary.modelsBuilt;
	if(m_options.gameMode)
		return true;

	ProcessModelMaterials(model, qcPath, materials, *outputDir);
	if(!model.subdata.empty()) {
		DataProcessor processor {m_compileRoot, GetInputRoot(), CreateEncoder()};
		auto dataLogHandler = m_logger.CreateContext("DATA");
		processor.SetLogHandler(dataLogHandler);
		if(auto *encoder = processor.GetEncoder())
			encoder->SetLogHandler(dataLogHandler);
		m_summary.dataItemsFailed += processor.ProcessItems(model.subdata, *outputDir);
	}
	return true;
}

void rcomp::BuildOrchestrator::ProcessModelMaterials(const ModelSettings &model, const std::string &qcPath, const std::set<std::string> &dumpedMaterials, const std::string &outputDir)
{
	auto logHandler = m_logger.CreateContext("MATERIAL");
	std::string copyTarget;
	auto localize = true;
	switch(m_options.materialMode) {
	case MaterialMode::Skip:
		rcomp::log(logHandler, "Skipping model material copying (mat-mode: 0)", LogSeverity::Warning);
		return;
	case MaterialMode::Local:
		copyTarget = outputDir;
		localize = false;
		rcomp::log(logHandler, "Material mode 'raw-local': copying to model folder without localization.", LogSeverity::Info);
		break;
	case MaterialMode::Shared:
		copyTarget = (std::filesystem::path {m_compileRoot} / SHARED_ASSET_DIRECTORY).generic_string();
		localize = m_options.localizeMaterials;
		rcomp::log(logHandler, std::string {"Material mode 'shared': copying to shared folder (localization: "} + (localize ? "on" : "off") + ").", LogSeverity::Info);
		break;
	}
	if(rcomp::create_system_path(copyTarget) == false)
		rcomp::log(logHandler, "Unable to create material directory '" + copyTarget + "'", LogSeverity::Warning);

	auto variables = CreateVariables(model, std::string {MAIN_QC_TARGET});
	std::vector<std::string> dumped {dumpedMaterials.begin(), dumpedMaterials.end()};
	auto materials = qc::read_materials(qcPath, dumped, variables.get(), logHandler);
	rcomp::log(logHandler, "Found " + std::to_string(materials.size()) + " material paths", LogSeverity::Info);
	for(auto &mat : materials)
		rcomp::log(logHandler, mat, LogSeverity::Debug);
	if(m_searchPaths.empty())
		rcomp::log(logHandler, "No search paths available, materials can not be located", LogSeverity::Warning);

	rcomp::log(logHandler, "Copying materials to " + copyTarget + "...", LogSeverity::Info);
	auto copiedFiles = resolve_and_copy(materials, m_searchPaths, copyTarget, localize, logHandler);
	m_summary.materialFilesCopied += static_cast<uint32_t>(copiedFiles.size());
	rcomp::log(logHandler, "Material copy complete (" + std::to_string(copiedFiles.size()) + " files).", LogSeverity::Info);
}

void rcomp::BuildOrchestrator::ProcessMaterialSets()
{
	auto logHandler = m_logger.CreateContext("MATERIAL");
	for(auto &set : m_settings.materialSets) {
		if(set.materials.empty()) {
			rcomp::log(logHandler, "[" + set.name + "] No materials listed, skipping.", LogSeverity::Warning);
			continue;
		}
		rcomp::log(logHandler, "[" + set.name + "] Copying material set...", LogSeverity::Info);
		auto outputDir = (std::filesystem::path {m_compileRoot} / set.name).generic_string();
		if(rcomp::create_system_path(outputDir) == false)
			rcomp::log(logHandler, "[" + set.name + "] Unable to create directory '" + outputDir + "'", LogSeverity::Warning);
		auto copiedFiles = resolve_and_copy(set.materials, m_searchPaths, outputDir, true, logHandler);
		m_summary.materialFilesCopied += static_cast<uint32_t>(copiedFiles.size());
		rcomp::log(logHandler, "Material-only copy complete (" + std::to_string(copiedFiles.size()) + " files).", LogSeverity::Info);
	}
}

void rcomp::BuildOrchestrator::ProcessDataSections()
{
	if(m_settings.dataSections.empty())
		return;
	auto logHandler = m_logger.CreateContext("DATA");
	DataProcessor processor {m_compileRoot, GetInputRoot(), CreateEncoder()};
	processor.SetLogHandler(logHandler);
	if(auto *encoder = processor.GetEncoder())
		encoder->SetLogHandler(logHandler);
	for(auto &section : m_settings.dataSections)
		m_summary.dataItemsFailed += processor.ProcessItems(section.items, (std::filesystem::path {m_compileRoot} / section.folder).generic_string());
}

void rcomp::BuildOrchestrator::PackageFiles()
{
	auto logHandler = m_logger.CreateContext("VPK");
	if(!m_settings.vpk) {
		rcomp::log(logHandler, "vpk not found or missing in config, skipping VPK packaging", LogSeverity::Warning);
		return;
	}
	PackageBuilder builder {*m_settings.vpk, m_processRunner};
	builder.SetLogHandler(logHandler);
	builder.SetVerbose(m_options.verbose);

	std::vector<std::filesystem::path> folders;
	std::error_code ec;
	for(auto &entry : std::filesystem::directory_iterator {m_compileRoot, ec}) {
		if(entry.is_directory())
			folders.push_back(entry.path());
	}
	std::sort(folders.begin(), folders.end());
	for(auto &folder : folders) {
		std::string err;
		if(builder.Package(folder.generic_string(), err) == false) {
			rcomp::log(logHandler, "VPK packaging failed: " + err, LogSeverity::Error);
			continue;
		}
		++m_summary.packagesBuilt;
	}
}

bool rcomp::BuildOrchestrator::ExecuteTexturePipeline()
{
	if(!m_settings.vtfcmd) {
		m_logger.Error("vtfcmd not found in config");
		return false;
	}
	auto rootDir = GetInputRoot();
	if(m_options.baseDir)
		m_logger.Info("Overriding input/output root with --basedir: " + rootDir);

	auto logHandler = m_logger.CreateContext("VTF");
	auto encoder = CreateEncoder();
	encoder->SetLogHandler(logHandler);
	TexturePipeline pipeline {encoder, rootDir, m_options.textureOptions};
	pipeline.SetLogHandler(logHandler);
	m_summary.texturesFailed = pipeline.Execute(m_settings.textureGroups);
	m_summary.texturesConverted = pipeline.GetConvertedCount();
	PrintSummary();
	return true;
}

void rcomp::BuildOrchestrator::PrintSummary()
{
	if(m_settings.type == PipelineType::ValveModel) {
		m_logger.Info("Models built: " + std::to_string(m_summary.modelsBuilt) + ", failed: " + std::to_string(m_summary.modelsFailed) + ", skipped: " + std::to_string(m_summary.modelsSkipped));
		m_logger.Info("Material files copied: " + std::to_string(m_summary.materialFilesCopied));
		if(m_summary.dataItemsFailed > 0)
			m_logger.Info("Data items failed: " + std::to_string(m_summary.dataItemsFailed));
		if(m_options.packageFiles)
			m_logger.Info("Packages built: " + std::to_string(m_summary.packagesBuilt));
	}
	else
		m_logger.Info("Textures converted: " + std::to_string(m_summary.texturesConverted) + ", failed: " + std::to_string(m_summary.texturesFailed));
	m_logger.PrintSummary();
}
