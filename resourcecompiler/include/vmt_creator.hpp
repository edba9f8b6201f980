// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#ifndef __RCOMP_VMT_CREATOR_HPP__
#define __RCOMP_VMT_CREATOR_HPP__

#include "rcompdefinitions.h"
#include "rcomp_log.hpp"
#include <string>

namespace rcomp {
	static constexpr std::string_view SHARED_ASSET_DIRECTORY = "Assetshared";

	// Writes a .vmt next to an exported .vtf, based on a template file
	class DLLRCOMP VmtCreator {
	  public:
		static bool CreateFromTemplate(const std::string &templatePath, const std::string &vtfPath, const std::string &compileRoot, std::string &outErr, const LogHandler &logHandler = nullptr);
		// $basetexture receives texturePath, quoted "$key" tokens lose their quotes
		static std::string ProcessTemplate(const std::string &content, const std::string &texturePath);
		// Path of the texture relative to <compileRoot>/Assetshared/materials, without extension.
		// Falls back to the file name if the texture is located elsewhere.
		static std::string GetTextureReference(const std::string &vtfPath, const std::string &compileRoot);
	};
};

#endif
