// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#include "shader_descriptor.hpp"
#include "file_util.hpp"
#include <sharedutils/util_string.h>
#include <VKVParser/library.h>
#include <functional>

static std::optional<rcomp::LogSeverity> to_rcomp_severity(ValveKeyValueFormat::LogLevel severity)
{
	switch(severity) {
	case ValveKeyValueFormat::LogLevel::ALL:
		return rcomp::LogSeverity::Info;
	case ValveKeyValueFormat::LogLevel::TRACE:
	case ValveKeyValueFormat::LogLevel::DEBUG:
		return rcomp::LogSeverity::Debug;
	case ValveKeyValueFormat::LogLevel::WARN:
		return rcomp::LogSeverity::Warning;
	case ValveKeyValueFormat::LogLevel::ERR:
		return rcomp::LogSeverity::Error;
	}
	return {};
}

void rcomp::ShaderDescriptor::SetLogHandler(const LogHandler &logHandler)
{
	ValveKeyValueFormat::setLogCallback([logHandler](const std::string &message, ValveKeyValueFormat::LogLevel severity) {
		auto rcompSeverity = to_rcomp_severity(severity);
		if(!rcompSeverity)
			return;
		rcomp::log(logHandler, message, *rcompSeverity);
	});
}

static bool is_key(const std::string &key, const char *name) { return ustring::compare<std::string>(key, name, false); }

static void add_texture(rcomp::TextureMap &textures, const std::string &key, const ValveKeyValueFormat::KVNode &node)
{
	if(node.get_type() != ValveKeyValueFormat::KVNodeType::LEAF)
		return;
	auto textureKey = rcomp::find_texture_key(key);
	if(!textureKey)
		return;
	auto value = rcomp::normalize_slashes(std::string {static_cast<const ValveKeyValueFormat::KVLeaf &>(node).value});
	ustring::remove_whitespace(value);
	// Built-in cubemap, not a file
	if(value.empty() || is_key(value, "env_cubemap"))
		return;
	textures[*textureKey] = value;
}

// Leaves of the block itself, nested blocks are not visited
static void collect_block_textures(const ValveKeyValueFormat::KVNode &block, rcomp::TextureMap &textures)
{
	if(block.get_type() != ValveKeyValueFormat::KVNodeType::BRANCH)
		return;
	for(auto &pair : static_cast<const ValveKeyValueFormat::KVBranch &>(block).branches)
		add_texture(textures, std::string {pair.first}, *pair.second);
}

std::optional<rcomp::ShaderDescriptor> rcomp::ShaderDescriptor::Parse(const std::string &content, const std::string &sourcePath, std::string &outErr)
{
	auto kvNode = ValveKeyValueFormat::parseKVBuffer(content);
	if(!kvNode) {
		outErr = "Failed to parse VMT file data for file '" + sourcePath + "'!";
		return {};
	}
	ShaderDescriptor descriptor {};
	descriptor.sourcePath = sourcePath;
	descriptor.shader = std::string {kvNode->get_key()};
	descriptor.isPatch = is_key(descriptor.shader, "patch");
	if(kvNode->get_type() != ValveKeyValueFormat::KVNodeType::BRANCH)
		return descriptor;
	auto &root = static_cast<const ValveKeyValueFormat::KVBranch &>(*kvNode);

	if(descriptor.isPatch) {
		for(auto &pair : root.branches) {
			std::string key {pair.first};
			auto &child = *pair.second;
			if(is_key(key, "include")) {
				if(child.get_type() == ValveKeyValueFormat::KVNodeType::LEAF)
					descriptor.includeTarget = rcomp::normalize_slashes(std::string {static_cast<const ValveKeyValueFormat::KVLeaf &>(child).value});
			}
			else if(is_key(key, "replace"))
				collect_block_textures(child, descriptor.replaceTextures);
			else if(is_key(key, "insert"))
				collect_block_textures(child, descriptor.insertTextures);
		}
		return descriptor;
	}

	// Texture parameters may also be located in fallback or dx-level blocks
	std::function<void(const ValveKeyValueFormat::KVBranch &)> collect = nullptr;
	collect = [&collect, &descriptor](const ValveKeyValueFormat::KVBranch &branch) {
		for(auto &pair : branch.branches) {
			std::string key {pair.first};
			auto &child = *pair.second;
			if(child.get_type() == ValveKeyValueFormat::KVNodeType::BRANCH) {
				if(is_key(key, "proxies") == false)
					collect(static_cast<const ValveKeyValueFormat::KVBranch &>(child));
				continue;
			}
			add_texture(descriptor.textures, key, child);
		}
	};
	collect(root);
	return descriptor;
}

std::optional<rcomp::ShaderDescriptor> rcomp::ShaderDescriptor::Load(const std::string &path, std::string &outErr)
{
	auto content = rcomp::read_text_file(path);
	if(!content) {
		outErr = "Unable to open VMT file '" + path + "'!";
		return {};
	}
	return Parse(*content, path, outErr);
}
