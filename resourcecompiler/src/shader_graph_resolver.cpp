// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#include "shader_graph_resolver.hpp"
#include "file_util.hpp"
#include <sharedutils/util_string.h>
#include <sharedutils/util_file.h>
#include <filesystem>

using namespace rcomp;

static std::string to_lower(std::string str)
{
	ustring::to_lower(str);
	return str;
}

static bool is_file(const std::filesystem::path &path) { return rcomp::is_system_file(path.string()); }

static std::string get_canonical_path(const std::string &path)
{
	std::error_code ec;
	auto canonical = std::filesystem::weakly_canonical(std::filesystem::path {path}, ec);
	return ec ? std::filesystem::path {path}.lexically_normal().generic_string() : canonical.generic_string();
}

static std::string get_parent_folder(const std::string &path) { return std::filesystem::path {path}.parent_path().generic_string(); }

// "materials/models/x" -> "models/x"
static std::string strip_materials_prefix(std::string path)
{
	auto prefix = std::string {MATERIALS_DIRECTORY} + '/';
	while(path.empty() == false && path.front() == '/')
		path.erase(path.begin());
	if(path.length() > prefix.length() && ustring::compare(path.c_str(), prefix.c_str(), false, prefix.length()))
		path = path.substr(prefix.length());
	return path;
}

static std::string get_shared_folder(const std::string &folder)
{
	std::filesystem::path path {folder};
	if(ustring::compare<std::string>(path.filename().string(), std::string {SHARED_DIRECTORY}, false))
		return path.generic_string();
	return (path / SHARED_DIRECTORY).generic_string();
}

std::string rcomp::normalize_texture_path(const std::string &path)
{
	auto normalized = strip_materials_prefix(rcomp::normalize_slashes(path));
	ustring::to_lower(normalized);
	std::string ext;
	if(ufile::get_extension(normalized, &ext) && ext == "vtf")
		ufile::remove_extension_from_filename(normalized);
	return normalized;
}

// Key token as written in the source line, including quotes
static std::string_view get_raw_key(std::string_view line)
{
	auto start = line.find_first_not_of(" \t");
	if(start == std::string_view::npos)
		return {};
	if(line[start] == '"') {
		auto end = line.find('"', start + 1);
		return (end == std::string_view::npos) ? line.substr(start) : line.substr(start, end - start + 1);
	}
	auto end = line.find_first_of(" \t\"", start);
	return line.substr(start, (end == std::string_view::npos) ? std::string_view::npos : end - start);
}

std::string rcomp::rewrite_vmt_references(const std::string &content, const std::unordered_map<std::string, std::string> &textureReferences, const std::optional<std::string> &includeReference)
{
	auto lines = rcomp::split_lines(content);
	for(auto &line : lines) {
		if(rcomp::is_comment_line(line))
			continue;
		auto tokens = rcomp::tokenize_line(line);
		if(tokens.size() < 2)
			continue;
		auto &key = tokens[0];
		std::optional<std::string> newValue {};
		if(ustring::compare<std::string>(key, "include", false))
			newValue = includeReference;
		else if(find_texture_key(key).has_value()) {
			auto it = textureReferences.find(normalize_texture_path(tokens[1]));
			if(it != textureReferences.end())
				newValue = it->second;
		}
		if(!newValue)
			continue;
		auto indentation = rcomp::get_leading_whitespace(line);
		line = std::string {indentation} + std::string {get_raw_key(line)} + " \"" + *newValue + "\"";
	}
	auto result = rcomp::join_lines(lines);
	if(content.empty() == false && content.back() != '\n' && result.empty() == false)
		result.pop_back();
	return result;
}

// Removes lines of the "insert" block whose texture parameter is also set by the "replace" block
static std::string drop_superseded_insert_entries(const std::string &content, const TextureMap &replaceTextures)
{
	if(replaceTextures.empty())
		return content;
	auto lines = rcomp::split_lines(content);
	std::vector<std::string> kept;
	kept.reserve(lines.size());
	int32_t depth = 0;
	int32_t insertDepth = -1;
	auto insertPending = false;
	for(auto &line : lines) {
		auto drop = false;
		if(rcomp::is_comment_line(line) == false) {
			auto tokens = rcomp::tokenize_line(line);
			if(insertDepth != -1 && depth >= insertDepth) {
				if(tokens.size() >= 2) {
					auto key = find_texture_key(tokens[0]);
					drop = key.has_value() && replaceTextures.find(*key) != replaceTextures.end();
				}
			}
			else if(tokens.empty() == false && ustring::compare<std::string>(tokens[0], "insert", false))
				insertPending = true;
		}
		auto inQuotes = false;
		for(auto i = decltype(line.length()) {0}; i < line.length(); ++i) {
			auto c = line[i];
			if(c == '"')
				inQuotes = !inQuotes;
			if(inQuotes)
				continue;
			if(c == '/' && i + 1 < line.length() && line[i + 1] == '/')
				break;
			if(c == '{') {
				++depth;
				if(insertPending) {
					insertDepth = depth;
					insertPending = false;
				}
			}
			else if(c == '}') {
				if(depth == insertDepth)
					insertDepth = -1;
				--depth;
			}
		}
		if(drop == false)
			kept.push_back(std::move(line));
	}
	auto result = rcomp::join_lines(kept);
	if(content.empty() == false && content.back() != '\n' && result.empty() == false)
		result.pop_back();
	return result;
}

ShaderGraphResolver::ShaderGraphResolver(std::vector<std::string> searchRoots, std::string destinationRoot, bool localize) : m_searchRoots {std::move(searchRoots)}, m_destinationRoot {std::move(destinationRoot)}, m_localize {localize} {}

std::optional<ShaderGraphResolver::ShaderLocation> ShaderGraphResolver::FindShader(const std::string &materialName) const
{
	auto relativePath = strip_materials_prefix(rcomp::normalize_slashes(materialName));
	std::string ext;
	if(ufile::get_extension(relativePath, &ext) == false || ustring::compare<std::string>(ext, "vmt", false) == false)
		relativePath += ".vmt";
	for(auto &root : m_searchRoots) {
		auto candidate = std::filesystem::path {root} / MATERIALS_DIRECTORY / relativePath;
		if(is_file(candidate))
			return ShaderLocation {candidate.generic_string(), relativePath};
	}
	return {};
}

std::optional<ShaderGraphResolver::ShaderLocation> ShaderGraphResolver::FindIncludedShader(const std::string &includePath) const
{
	auto path = rcomp::normalize_slashes(includePath);
	std::string ext;
	if(ufile::get_extension(path, &ext) == false || ustring::compare<std::string>(ext, "vmt", false) == false)
		path += ".vmt";
	auto relativePath = strip_materials_prefix(path);
	// Includes are relative to the game root, e.g. "materials/models/x/base.vmt"
	for(auto &root : m_searchRoots) {
		for(auto &candidate : {std::filesystem::path {root} / path, std::filesystem::path {root} / MATERIALS_DIRECTORY / relativePath}) {
			if(is_file(candidate))
				return ShaderLocation {candidate.generic_string(), relativePath};
		}
	}
	return {};
}

std::optional<std::string> ShaderGraphResolver::FindTexture(const std::string &relativePath)
{
	auto key = normalize_texture_path(relativePath);
	auto it = m_ledger.textureCache.find(key);
	if(it != m_ledger.textureCache.end())
		return it->second;
	auto fileName = strip_materials_prefix(rcomp::normalize_slashes(relativePath));
	std::string ext;
	if(ufile::get_extension(fileName, &ext) == false || ustring::compare<std::string>(ext, "vtf", false) == false)
		fileName += ".vtf";
	std::optional<std::string> result {};
	for(auto &root : m_searchRoots) {
		auto candidate = std::filesystem::path {root} / MATERIALS_DIRECTORY / fileName;
		if(is_file(candidate)) {
			result = candidate.generic_string();
			break;
		}
	}
	m_ledger.textureCache[key] = result;
	return result;
}

std::string ShaderGraphResolver::GetMirroredDestination(const std::string &relativePath) const { return (std::filesystem::path {m_destinationRoot} / MATERIALS_DIRECTORY / relativePath).generic_string(); }

std::string ShaderGraphResolver::GetTextureDestination(const std::string &relativePath, const PlacementAnchor &anchor) const
{
	auto fileName = std::filesystem::path {relativePath}.filename().string() + ".vtf";
	if(m_localize == false)
		return GetMirroredDestination(relativePath + ".vtf");
	auto sourceFolder = to_lower(get_parent_folder(relativePath));
	if(sourceFolder == anchor.sourceFolder)
		return (std::filesystem::path {anchor.destinationFolder} / fileName).generic_string();
	return (std::filesystem::path {get_shared_folder(anchor.destinationFolder)} / fileName).generic_string();
}

std::string ShaderGraphResolver::ReserveTextureDestination(const ResolvedTexture &texture, const PlacementAnchor &anchor)
{
	auto destination = GetTextureDestination(texture.relativePath, anchor);
	auto it = m_ledger.textureDestinations.find(destination);
	if(it != m_ledger.textureDestinations.end() && it->second != texture.sourcePath) {
		// Same file name from a different folder, keep its source sub-path below the shared folder
		auto alternative = (std::filesystem::path {get_shared_folder(anchor.destinationFolder)} / (texture.relativePath + ".vtf")).generic_string();
		auto itAlt = m_ledger.textureDestinations.find(alternative);
		if(itAlt == m_ledger.textureDestinations.end())
			rcomp::log(m_logHandler, "'" + destination + "' is already occupied by '" + it->second + "', placing '" + texture.sourcePath + "' at '" + alternative + "' instead.", LogSeverity::Warning);
		destination = std::move(alternative);
		it = itAlt;
	}
	if(it == m_ledger.textureDestinations.end())
		m_ledger.textureDestinations[destination] = texture.sourcePath;
	return destination;
}

// Destination path relative to <destination>/materials, without extension
std::string ShaderGraphResolver::ToMaterialReference(const std::string &destinationPath) const
{
	auto materialsRoot = std::filesystem::path {m_destinationRoot} / MATERIALS_DIRECTORY;
	auto relative = std::filesystem::path {destinationPath}.lexically_relative(materialsRoot);
	relative.replace_extension("");
	return relative.generic_string();
}

bool ShaderGraphResolver::CopyToDestination(const std::string &src, const std::string &dst)
{
	auto it = m_ledger.destinations.find(dst);
	if(it != m_ledger.destinations.end()) {
		if(it->second != src)
			rcomp::log(m_logHandler, "'" + src + "' not copied, '" + dst + "' is already occupied by '" + it->second + "'.", LogSeverity::Warning);
		return true;
	}
	std::string err;
	if(rcomp::copy_file(src, dst, err) == false) {
		rcomp::log(m_logHandler, err, LogSeverity::Warning);
		return false;
	}
	m_ledger.destinations[dst] = src;
	m_ledger.copiedFiles.push_back(dst);
	rcomp::log(m_logHandler, "Copied '" + src + "' -> '" + dst + "'", LogSeverity::Debug);
	return true;
}

bool ShaderGraphResolver::WriteToDestination(const std::string &src, const std::string &dst, const std::string &content)
{
	if(m_ledger.destinations.find(dst) != m_ledger.destinations.end())
		return true;
	std::string err;
	if(rcomp::write_text_file(dst, content, err) == false) {
		rcomp::log(m_logHandler, err, LogSeverity::Warning);
		return false;
	}
	m_ledger.destinations[dst] = src;
	m_ledger.copiedFiles.push_back(dst);
	rcomp::log(m_logHandler, "Wrote '" + dst + "'", LogSeverity::Debug);
	return true;
}

void ShaderGraphResolver::ResolveTextures(const TextureMap &textures, const ResolvedMaterial &material, std::map<TextureKey, ResolvedTexture> &outTextures)
{
	for(auto &[key, path] : textures) {
		auto sourcePath = FindTexture(path);
		if(!sourcePath) {
			rcomp::log(m_logHandler, "Texture not found: '" + path + "' (" + std::string {get_texture_key_name(key)} + " in '" + material.relativePath + "')", LogSeverity::Warning);
			continue;
		}
		auto relativePath = strip_materials_prefix(rcomp::normalize_slashes(path));
		std::string ext;
		if(ufile::get_extension(relativePath, &ext) && ustring::compare<std::string>(ext, "vtf", false))
			ufile::remove_extension_from_filename(relativePath);
		outTextures[key] = {relativePath, *sourcePath};
	}
}

std::shared_ptr<ResolvedMaterial> ShaderGraphResolver::ProcessShader(const ShaderLocation &location, const std::optional<std::string> &destinationOverride, const PlacementAnchor *anchor, bool copyTextures)
{
	auto key = get_canonical_path(location.sourcePath);
	auto it = m_ledger.processedShaders.find(key);
	if(it != m_ledger.processedShaders.end())
		return it->second;

	auto material = std::make_shared<ResolvedMaterial>();
	material->sourcePath = location.sourcePath;
	material->relativePath = location.relativePath;
	material->name = location.relativePath;
	ufile::remove_extension_from_filename(material->name);
	material->destinationPath = destinationOverride ? *destinationOverride : GetMirroredDestination(location.relativePath);
	// Marked before the include is followed, which also stops self-referencing include chains
	m_ledger.processedShaders[key] = material;

	auto content = rcomp::read_text_file(location.sourcePath);
	if(!content) {
		rcomp::log(m_logHandler, "Unable to read shader '" + location.sourcePath + "'!", LogSeverity::Warning);
		return material;
	}
	std::string err;
	auto descriptor = ShaderDescriptor::Parse(*content, location.sourcePath, err);
	if(!descriptor) {
		rcomp::log(m_logHandler, err + " Copying it without resolving its textures.", LogSeverity::Warning);
		CopyToDestination(location.sourcePath, material->destinationPath);
		return material;
	}
	material->descriptor = std::make_shared<const ShaderDescriptor>(std::move(*descriptor));
	auto &desc = *material->descriptor;

	PlacementAnchor selfAnchor {to_lower(get_parent_folder(location.relativePath)), get_parent_folder(material->destinationPath)};
	auto &placementAnchor = anchor ? *anchor : selfAnchor;

	if(desc.isPatch) {
		if(desc.includeTarget) {
			auto includeLocation = FindIncludedShader(*desc.includeTarget);
			if(!includeLocation)
				rcomp::log(m_logHandler, "Included shader not found: '" + *desc.includeTarget + "' (included by '" + location.relativePath + "')", LogSeverity::Warning);
			else {
				std::optional<std::string> includeDestination {};
				if(m_localize)
					includeDestination = (std::filesystem::path {get_shared_folder(placementAnchor.destinationFolder)} / std::filesystem::path {includeLocation->relativePath}.filename()).generic_string();
				auto included = ProcessShader(*includeLocation, includeDestination, &placementAnchor, false);
				material->textures = included->textures;
				material->includeDestinationPath = included->destinationPath;
			}
		}
		else
			rcomp::log(m_logHandler, "Patch shader '" + location.relativePath + "' has no include target.", LogSeverity::Warning);
		ResolveTextures(desc.insertTextures, *material, material->textures);
		ResolveTextures(desc.replaceTextures, *material, material->textures);
	}
	else
		ResolveTextures(desc.textures, *material, material->textures);

	std::unordered_map<std::string, std::string> textureReferences;
	for(auto &[texKey, texture] : material->textures) {
		auto destination = ReserveTextureDestination(texture, placementAnchor);
		textureReferences[normalize_texture_path(texture.relativePath)] = ToMaterialReference(destination);
		if(copyTextures)
			CopyToDestination(texture.sourcePath, destination);
	}

	if(m_localize == false) {
		CopyToDestination(location.sourcePath, material->destinationPath);
		return material;
	}
	std::optional<std::string> includeReference {};
	if(material->includeDestinationPath)
		includeReference = std::filesystem::path {*material->includeDestinationPath}.lexically_relative(m_destinationRoot).generic_string();
	auto output = desc.isPatch ? drop_superseded_insert_entries(*content, desc.replaceTextures) : *content;
	WriteToDestination(location.sourcePath, material->destinationPath, rewrite_vmt_references(output, textureReferences, includeReference));
	return material;
}

ResolveResult ShaderGraphResolver::Resolve(const std::string &materialName, std::shared_ptr<const ResolvedMaterial> *optOutMaterial)
{
	auto location = FindShader(materialName);
	if(!location) {
		rcomp::log(m_logHandler, "Material not found: '" + materialName + "'", LogSeverity::Warning);
		return ResolveResult::NotFound;
	}
	auto material = ProcessShader(*location, {}, nullptr, true);
	if(optOutMaterial)
		*optOutMaterial = material;
	return ResolveResult::Success;
}

const std::vector<std::string> &ShaderGraphResolver::ResolveAndCopy(const std::vector<std::string> &materialNames)
{
	for(auto &name : materialNames)
		Resolve(name);
	return m_ledger.copiedFiles;
}

std::vector<std::string> rcomp::resolve_and_copy(const std::vector<std::string> &materialNames, const std::vector<std::string> &searchRoots, const std::string &destinationRoot, bool localize, const LogHandler &logHandler)
{
	ShaderGraphResolver resolver {searchRoots, destinationRoot, localize};
	resolver.SetLogHandler(logHandler);
	return resolver.ResolveAndCopy(materialNames);
}
