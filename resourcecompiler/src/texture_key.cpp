// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#include "texture_key.hpp"
#include <sharedutils/util_string.h>
#include <mathutil/umath.h>
#include <array>

static constexpr std::array<std::string_view, umath::to_integral(rcomp::TextureKey::Count)> g_textureKeyNames = {
  "$basetexture",
  "$basetexture2",
  "$bumpmap",
  "$bumpmap2",
  "$normalmap",
  "$detail",
  "$envmap",
  "$envmapmask",
  "$selfillummask",
  "$lightwarptexture",
  "$phongexponenttexture",
  "$phongwarptexture",
  "$blendmodulatetexture",
  "$ambientoccltexture",
  "$tintmasktexture",
  "$iris",
  "$corneatexture",
  "$emissiveblendtexture",
  "$emissiveblendbasetexture",
  "$emissiveblendflowtexture",
};

std::string_view rcomp::get_texture_key_name(TextureKey key)
{
	auto idx = umath::to_integral(key);
	if(idx >= g_textureKeyNames.size())
		return {};
	return g_textureKeyNames[idx];
}

std::optional<rcomp::TextureKey> rcomp::find_texture_key(std::string_view name)
{
	std::string lower {name};
	ustring::to_lower(lower);
	for(size_t i = 0; i < g_textureKeyNames.size(); ++i) {
		if(g_textureKeyNames[i] == lower)
			return static_cast<TextureKey>(i);
	}
	return {};
}
