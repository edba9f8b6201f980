// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#ifndef __RCOMP_QC_MATERIAL_SCANNER_HPP__
#define __RCOMP_QC_MATERIAL_SCANNER_HPP__

#include "rcompdefinitions.h"
#include "rcomp_log.hpp"
#include <string>
#include <unordered_map>
#include <vector>

#pragma warning(push)
#pragma warning(disable : 4251)
namespace rcomp::qc {
	class VariableEnvironment;
	struct DLLRCOMP QcMaterialInfo {
		std::unordered_map<std::string, std::string> renamedMaterials;
		std::vector<std::string> cdMaterials;
		std::vector<std::string> skinFamilyMaterials;
	};

	// All files reachable through $include, starting with the root file itself.
	// Include paths are relative to the including file.
	DLLRCOMP std::vector<std::string> read_includes(const std::string &qcFile);
	// Collects $renamematerial, $cdmaterials and $texturegroup skinfamilies entries of a single file.
	// If variables are specified, $name$ references in values are substituted where possible.
	DLLRCOMP void scan_materials(const std::string &text, QcMaterialInfo &info, const VariableEnvironment *variables = nullptr);
	// Material names referenced by the QC tree, combined with the names reported by the model compiler.
	// Every material is combined with every $cdmaterials directory. The result is sorted and contains no duplicates.
	DLLRCOMP std::vector<std::string> read_materials(const std::string &qcFile, const std::vector<std::string> &dumpedMaterials, const VariableEnvironment *variables = nullptr, const LogHandler &logHandler = nullptr);
};
#pragma warning(pop)

#endif
