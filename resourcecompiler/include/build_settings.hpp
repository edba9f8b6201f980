// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#ifndef __RCOMP_BUILD_SETTINGS_HPP__
#define __RCOMP_BUILD_SETTINGS_HPP__

#include "rcompdefinitions.h"
#include "rcomp_log.hpp"
#include "texture_encoder.hpp"
#include <cinttypes>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#pragma warning(push)
#pragma warning(disable : 4251)
namespace rcomp {
	enum class PipelineType : uint8_t { ValveModel = 0, ValveTexture, Count };
	DLLRCOMP std::string_view get_pipeline_name(PipelineType type);

	using StringPairList = std::vector<std::pair<std::string, std::string>>;

	struct DLLRCOMP DataItem {
		std::string name;
		std::string input;
		std::string output;
		StringPairList replace;
		std::optional<TextureEncodeOptions> vtf {};
		std::optional<std::string> vmtTemplate {};
	};

	struct DLLRCOMP TargetedDefine {
		std::string name;
		std::string value;
		std::vector<std::string> targets;
	};

	struct DLLRCOMP ModelSettings {
		std::string name;
		std::string qc;
		bool compile = true;
		StringPairList defines;
		std::vector<TargetedDefine> targetedDefines;
		// Submodel name -> qc path relative to the main qc
		StringPairList submodels;
		std::vector<DataItem> subdata;

		// Model-wide defines first, then the ones targeted at the specified target ("qc" for the main qc)
		StringPairList GetDefines(const std::string &target) const;
	};

	struct DLLRCOMP MaterialSet {
		std::string name;
		std::vector<std::string> materials;
	};

	struct DLLRCOMP DataSection {
		std::string folder;
		std::vector<DataItem> items;
	};

	struct DLLRCOMP TextureGroup {
		std::string name;
		std::string input;
		std::optional<std::string> output {};
		TextureEncodeOptions options {};
	};

	// Build configuration (KeyValues). Blocks which list several entries are ordered by key name.
	struct DLLRCOMP BuildSettings {
		static std::optional<BuildSettings> Load(const std::string &path, std::string &outErr, const LogHandler &logHandler = nullptr);
		static std::optional<BuildSettings> Parse(const std::string &content, const std::string &configPath, std::string &outErr, const LogHandler &logHandler = nullptr);

		// Relative paths are resolved against the directory of the config file
		std::string ResolvePath(const std::string &path) const;

		PipelineType type = PipelineType::ValveModel;
		std::string configPath;
		std::string configDir;

		std::optional<std::string> studiomdl {};
		std::optional<std::string> gameinfo {};
		std::optional<std::string> vtfcmd {};
		std::optional<std::string> vpk {};

		StringPairList globalDefines;
		std::vector<ModelSettings> models;
		std::vector<MaterialSet> materialSets;
		std::vector<DataSection> dataSections;
		std::vector<TextureGroup> textureGroups;
	};
};
#pragma warning(pop)

#endif
