// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#ifndef __RCOMP_SHADER_GRAPH_RESOLVER_HPP__
#define __RCOMP_SHADER_GRAPH_RESOLVER_HPP__

#include "rcompdefinitions.h"
#include "rcomp_log.hpp"
#include "shader_descriptor.hpp"
#include "texture_key.hpp"
#include <cinttypes>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#pragma warning(push)
#pragma warning(disable : 4251)
namespace rcomp {
	static constexpr std::string_view MATERIALS_DIRECTORY = "materials";
	static constexpr std::string_view SHARED_DIRECTORY = "shared";

	enum class ResolveResult : uint8_t { Success = 0, NotFound };

	struct DLLRCOMP ResolvedTexture {
		std::string relativePath; // Relative to materials/, without extension
		std::string sourcePath;
	};

	struct DLLRCOMP ResolvedMaterial {
		std::string name;
		std::string sourcePath;
		std::string relativePath; // Relative to materials/, including extension
		std::string destinationPath;
		std::shared_ptr<const ShaderDescriptor> descriptor;
		std::optional<std::string> includeDestinationPath;
		// Included textures, then inserted, then replaced (patch shaders) or the shader's own textures
		std::map<TextureKey, ResolvedTexture> textures;
	};

	// State of a single resolver run
	struct DLLRCOMP CopyLedger {
		// Keyed by canonical source path
		std::unordered_map<std::string, std::shared_ptr<ResolvedMaterial>> processedShaders;
		// Keyed by lower-case relative texture path; empty optional for textures which could not be found
		std::unordered_map<std::string, std::optional<std::string>> textureCache;
		// Destination path -> source path
		std::unordered_map<std::string, std::string> destinations;
		// Texture destination path -> texture source path, reserved before copying
		std::unordered_map<std::string, std::string> textureDestinations;
		std::vector<std::string> copiedFiles;
	};

	class DLLRCOMP ShaderGraphResolver {
	  public:
		struct ShaderLocation {
			std::string sourcePath;
			std::string relativePath;
		};

		ShaderGraphResolver(std::vector<std::string> searchRoots, std::string destinationRoot, bool localize);
		void SetLogHandler(const LogHandler &logHandler) { m_logHandler = logHandler; }

		ResolveResult Resolve(const std::string &materialName, std::shared_ptr<const ResolvedMaterial> *optOutMaterial = nullptr);
		// Resolves all materials; returns every file copied during this run
		const std::vector<std::string> &ResolveAndCopy(const std::vector<std::string> &materialNames);

		std::optional<ShaderLocation> FindShader(const std::string &materialName) const;
		std::optional<ShaderLocation> FindIncludedShader(const std::string &includePath) const;
		std::optional<std::string> FindTexture(const std::string &relativePath);

		const CopyLedger &GetLedger() const { return m_ledger; }
		const std::vector<std::string> &GetSearchRoots() const { return m_searchRoots; }
		const std::string &GetDestinationRoot() const { return m_destinationRoot; }
		bool IsLocalizationEnabled() const { return m_localize; }
	  private:
		// Textures are placed relative to the shader that owns them
		struct PlacementAnchor {
			std::string sourceFolder; // Relative to materials/, lower-case
			std::string destinationFolder;
		};
		std::shared_ptr<ResolvedMaterial> ProcessShader(const ShaderLocation &location, const std::optional<std::string> &destinationOverride, const PlacementAnchor *anchor, bool copyTextures);
		void ResolveTextures(const TextureMap &textures, const ResolvedMaterial &material, std::map<TextureKey, ResolvedTexture> &outTextures);
		std::string GetTextureDestination(const std::string &relativePath, const PlacementAnchor &anchor) const;
		// Falls back to the texture's source sub-path below the shared folder if the destination belongs to another texture
		std::string ReserveTextureDestination(const ResolvedTexture &texture, const PlacementAnchor &anchor);
		std::string GetMirroredDestination(const std::string &relativePath) const;
		std::string ToMaterialReference(const std::string &destinationPath) const;
		bool CopyToDestination(const std::string &src, const std::string &dst);
		bool WriteToDestination(const std::string &src, const std::string &dst, const std::string &content);

		std::vector<std::string> m_searchRoots;
		std::string m_destinationRoot;
		bool m_localize = true;
		CopyLedger m_ledger;
		LogHandler m_logHandler;
	};

	// Rewrites include and texture parameter lines of a .vmt file.
	// textureReferences maps lower-case relative texture paths (without extension) to their new relative paths.
	DLLRCOMP std::string rewrite_vmt_references(const std::string &content, const std::unordered_map<std::string, std::string> &textureReferences, const std::optional<std::string> &includeReference);
	// Lower-case, forward slashes, no ".vtf" extension
	DLLRCOMP std::string normalize_texture_path(const std::string &path);

	DLLRCOMP std::vector<std::string> resolve_and_copy(const std::vector<std::string> &materialNames, const std::vector<std::string> &searchRoots, const std::string &destinationRoot, bool localize, const LogHandler &logHandler = nullptr);
};
#pragma warning(pop)

#endif
