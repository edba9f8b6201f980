// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#ifndef __RCOMP_SHADER_DESCRIPTOR_HPP__
#define __RCOMP_SHADER_DESCRIPTOR_HPP__

#include "rcompdefinitions.h"
#include "rcomp_log.hpp"
#include "texture_key.hpp"
#include <optional>
#include <string>

#pragma warning(push)
#pragma warning(disable : 4251)
namespace rcomp {
	// Texture references of a single .vmt file. Patch shaders only fill includeTarget, replaceTextures and insertTextures.
	struct DLLRCOMP ShaderDescriptor {
		static std::optional<ShaderDescriptor> Load(const std::string &path, std::string &outErr);
		static std::optional<ShaderDescriptor> Parse(const std::string &content, const std::string &sourcePath, std::string &outErr);
		static void SetLogHandler(const LogHandler &logHandler);

		std::string sourcePath;
		std::string shader;
		bool isPatch = false;
		std::optional<std::string> includeTarget;
		TextureMap textures;
		TextureMap replaceTextures;
		TextureMap insertTextures;
	};
};
#pragma warning(pop)

#endif
