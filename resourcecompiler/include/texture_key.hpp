// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#ifndef __RCOMP_TEXTURE_KEY_HPP__
#define __RCOMP_TEXTURE_KEY_HPP__

#include "rcompdefinitions.h"
#include <cinttypes>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace rcomp {
	// Shader parameters which reference a texture file
	enum class TextureKey : uint8_t {
		BaseTexture = 0,
		BaseTexture2,
		BumpMap,
		BumpMap2,
		NormalMap,
		Detail,
		EnvMap,
		EnvMapMask,
		SelfIllumMask,
		LightWarpTexture,
		PhongExponentTexture,
		PhongWarpTexture,
		BlendModulateTexture,
		AmbientOcclTexture,
		TintMaskTexture,
		Iris,
		CorneaTexture,
		EmissiveBlendTexture,
		EmissiveBlendBaseTexture,
		EmissiveBlendFlowTexture,

		Count
	};
	using TextureMap = std::map<TextureKey, std::string>;

	DLLRCOMP std::string_view get_texture_key_name(TextureKey key);
	// Case-insensitive, the name has to include the leading '$'
	DLLRCOMP std::optional<TextureKey> find_texture_key(std::string_view name);
};

#endif
