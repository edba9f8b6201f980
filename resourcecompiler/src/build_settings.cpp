// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#include "build_settings.hpp"
#include "file_util.hpp"
#include "qc_expression.hpp"
#include <sharedutils/util.h>
#include <sharedutils/util_string.h>
#include <mathutil/umath.h>
#include <VKVParser/library.h>
#include <algorithm>
#include <array>
#include <filesystem>

using KVNode = ValveKeyValueFormat::KVNode;
using KVBranch = ValveKeyValueFormat::KVBranch;
using KVLeaf = ValveKeyValueFormat::KVLeaf;
using KVChildren = std::vector<std::pair<std::string, const KVNode *>>;

static constexpr std::array<std::string_view, umath::to_integral(rcomp::PipelineType::Count)> g_pipelineNames = {"ValveModel", "ValveTexture"};
std::string_view rcomp::get_pipeline_name(PipelineType type) { return g_pipelineNames[umath::to_integral(type)]; }

static bool is_key(const std::string &key, const char *name) { return ustring::compare<std::string>(key, name, false); }

static const KVBranch *get_branch(const KVNode &node)
{
	if(node.get_type() != ValveKeyValueFormat::KVNodeType::BRANCH)
		return nullptr;
	return &static_cast<const KVBranch &>(node);
}

static std::optional<std::string> get_leaf_value(const KVNode &node)
{
	if(node.get_type() != ValveKeyValueFormat::KVNodeType::LEAF)
		return {};
	return std::string {static_cast<const KVLeaf &>(node).value};
}

static KVChildren get_children(const KVBranch &branch)
{
	KVChildren children;
	children.reserve(branch.branches.size());
	for(auto &pair : branch.branches)
		children.push_back({std::string {pair.first}, pair.second.get()});
	std::sort(children.begin(), children.end(), [](const KVChildren::value_type &a, const KVChildren::value_type &b) { return a.first < b.first; });
	return children;
}

static const KVNode *find_child(const KVBranch &branch, const char *name)
{
	for(auto &pair : branch.branches) {
		if(is_key(std::string {pair.first}, name))
			return pair.second.get();
	}
	return nullptr;
}

static std::optional<std::string> find_leaf_value(const KVBranch &branch, const char *name)
{
	auto *child = find_child(branch, name);
	if(!child)
		return {};
	return get_leaf_value(*child);
}

static std::vector<std::string> split_list(const std::string &value)
{
	std::vector<std::string> list;
	ustring::explode_whitespace(value, list);
	return list;
}

// A list is either a whitespace-separated leaf, or a block whose leaves hold the entries.
// Leaves without a value contribute their key.
static std::vector<std::string> read_list(const KVNode &node)
{
	if(auto value = get_leaf_value(node))
		return split_list(*value);
	std::vector<std::string> list;
	auto *branch = get_branch(node);
	if(!branch)
		return list;
	for(auto &[key, child] : get_children(*branch)) {
		auto value = get_leaf_value(*child);
		if(!value)
			continue;
		list.push_back(value->empty() ? key : *value);
	}
	return list;
}

static rcomp::StringPairList read_string_pairs(const KVNode &node)
{
	rcomp::StringPairList pairs;
	auto *branch = get_branch(node);
	if(!branch)
		return pairs;
	for(auto &[key, child] : get_children(*branch)) {
		if(auto value = get_leaf_value(*child))
			pairs.push_back({key, *value});
	}
	return pairs;
}

static bool to_bool(const std::string &value)
{
	std::string trimmed = value;
	ustring::remove_whitespace(trimmed);
	return !(trimmed.empty() || trimmed == "0" || is_key(trimmed, "false") || is_key(trimmed, "no"));
}

static rcomp::TextureEncodeOptions read_encode_options(const KVBranch &branch)
{
	rcomp::TextureEncodeOptions options {};
	for(auto &[key, child] : get_children(branch)) {
		if(is_key(key, "normal")) {
			auto *normalBranch = get_branch(*child);
			rcomp::TextureEncodeOptions::NormalMapOptions normal {};
			if(normalBranch) {
				normal.kernel = find_leaf_value(*normalBranch, "kernel");
				normal.height = find_leaf_value(*normalBranch, "height");
				normal.alpha = find_leaf_value(*normalBranch, "alpha");
				if(auto scale = find_leaf_value(*normalBranch, "scale"))
					normal.scale = rcomp::qc::parse_number(*scale);
				options.normalMap = normal;
			}
			else if(auto value = get_leaf_value(*child); value && to_bool(*value))
				options.normalMap = normal;
			continue;
		}
		auto value = get_leaf_value(*child);
		if(!value)
			continue;
		if(is_key(key, "flags"))
			options.flags = read_list(*child);
		else if(is_key(key, "encoder_args"))
			options.extraArgs = read_list(*child);
		else if(is_key(key, "format"))
			options.format = *value;
		else if(is_key(key, "alphaformat"))
			options.alphaFormat = *value;
		else if(is_key(key, "version"))
			options.version = *value;
		else if(is_key(key, "resize")) {
			auto size = split_list(*value);
			if(size.size() == 2)
				options.resize = rcomp::TextureEncodeOptions::Resolution {static_cast<uint32_t>(util::to_int(size[0])), static_cast<uint32_t>(util::to_int(size[1]))};
		}
		else if(is_key(key, "rmethod"))
			options.resizeMethod = *value;
		else if(is_key(key, "rfilter"))
			options.resizeFilter = *value;
		else if(is_key(key, "rsharpen"))
			options.sharpenFilter = *value;
		else if(is_key(key, "nomipmaps"))
			options.generateMipmaps = !to_bool(*value);
		else if(is_key(key, "gamma"))
			options.gammaCorrection = rcomp::qc::parse_number(*value);
		else if(is_key(key, "silent"))
			options.silent = to_bool(*value);
	}
	return options;
}

static std::optional<rcomp::DataItem> read_data_item(const std::string &name, const KVNode &node, const rcomp::LogHandler &logHandler)
{
	auto *branch = get_branch(node);
	if(!branch)
		return {};
	rcomp::DataItem item {};
	item.name = name;
	auto input = find_leaf_value(*branch, "input");
	auto output = find_leaf_value(*branch, "output");
	if(!input || !output) {
		rcomp::log(logHandler, "Data item '" + name + "' requires both 'input' and 'output', skipping", rcomp::LogSeverity::Warning);
		return {};
	}
	item.input = rcomp::normalize_slashes(*input);
	item.output = rcomp::normalize_slashes(*output);
	if(auto *replace = find_child(*branch, "replace"))
		item.replace = read_string_pairs(*replace);
	if(auto *vtf = find_child(*branch, "vtf")) {
		if(auto *vtfBranch = get_branch(*vtf)) {
			item.vtf = read_encode_options(*vtfBranch);
			item.vmtTemplate = find_leaf_value(*vtfBranch, "vmt");
		}
	}
	return item;
}

static std::vector<rcomp::DataItem> read_data_items(const KVNode &node, const rcomp::LogHandler &logHandler)
{
	std::vector<rcomp::DataItem> items;
	auto *branch = get_branch(node);
	if(!branch)
		return items;
	for(auto &[key, child] : get_children(*branch)) {
		auto item = read_data_item(key, *child, logHandler);
		if(item)
			items.push_back(std::move(*item));
	}
	return items;
}

static void read_defines(const KVNode &node, rcomp::StringPairList &outDefines, std::vector<rcomp::TargetedDefine> *optOutTargeted)
{
	auto *branch = get_branch(node);
	if(!branch)
		return;
	for(auto &[key, child] : get_children(*branch)) {
		if(auto value = get_leaf_value(*child)) {
			outDefines.push_back({key, *value});
			continue;
		}
		auto *defBranch = get_branch(*child);
		if(!defBranch)
			continue;
		auto value = find_leaf_value(*defBranch, "value");
		if(!value)
			continue;
		auto *targets = find_child(*defBranch, "targets");
		if(targets && optOutTargeted) {
			optOutTargeted->push_back({key, *value, read_list(*targets)});
			continue;
		}
		outDefines.push_back({key, *value});
	}
}

static std::optional<rcomp::ModelSettings> read_model(const std::string &name, const KVNode &node, const rcomp::LogHandler &logHandler)
{
	auto *branch = get_branch(node);
	if(!branch)
		return {};
	rcomp::ModelSettings model {};
	model.name = name;
	auto qc = find_leaf_value(*branch, "qc");
	if(!qc) {
		rcomp::log(logHandler, "Model '" + name + "' has no 'qc' entry, skipping", rcomp::LogSeverity::Warning);
		return {};
	}
	model.qc = rcomp::normalize_slashes(*qc);
	if(auto compile = find_leaf_value(*branch, "compile"))
		model.compile = to_bool(*compile);
	if(auto *defines = find_child(*branch, "definevariable"))
		read_defines(*defines, model.defines, &model.targetedDefines);
	if(auto *submodels = find_child(*branch, "submodels"))
		model.submodels = read_string_pairs(*submodels);
	if(auto *subdata = find_child(*branch, "subdata"))
		model.subdata = read_data_items(*subdata, logHandler);
	return model;
}

rcomp::StringPairList rcomp::ModelSettings::GetDefines(const std::string &target) const
{
	auto result = defines;
	for(auto &def : targetedDefines) {
		if(std::find(def.targets.begin(), def.targets.end(), target) != def.targets.end())
			result.push_back({def.name, def.value});
	}
	return result;
}

std::string rcomp::BuildSettings::ResolvePath(const std::string &path) const
{
	std::filesystem::path p {path};
	if(p.is_absolute())
		return p.lexically_normal().generic_string();
	return (std::filesystem::path {configDir} / p).lexically_normal().generic_string();
}

std::optional<rcomp::BuildSettings> rcomp::BuildSettings::Parse(const std::string &content, const std::string &configPath, std::string &outErr, const LogHandler &logHandler)
{
	auto kvNode = ValveKeyValueFormat::parseKVBuffer(content);
	if(!kvNode) {
		outErr = "Failed to parse config file '" + configPath + "'!";
		return {};
	}
	BuildSettings settings {};
	settings.configPath = configPath;
	std::error_code ec;
	settings.configDir = std::filesystem::absolute(configPath, ec).parent_path().generic_string();

	std::string header {kvNode->get_key()};
	auto it = std::find_if(g_pipelineNames.begin(), g_pipelineNames.end(), [&header](std::string_view name) { return is_key(header, std::string {name}.c_str()); });
	if(it == g_pipelineNames.end()) {
		outErr = "Unknown config header '" + header + "', expected 'ValveModel' or 'ValveTexture'";
		return {};
	}
	settings.type = static_cast<PipelineType>(it - g_pipelineNames.begin());
	auto *root = get_branch(*kvNode);
	if(!root)
		return settings;

	auto readToolPath = [&settings, root](const char *key) -> std::optional<std::string> {
		auto value = find_leaf_value(*root, key);
		if(!value || value->empty())
			return {};
		return settings.ResolvePath(*value);
	};
	settings.studiomdl = readToolPath("studiomdl");
	settings.gameinfo = readToolPath("gameinfo");
	settings.vtfcmd = readToolPath("vtfcmd");
	settings.vpk = readToolPath("vpk");

	if(auto *defines = find_child(*root, "definevariable"))
		read_defines(*defines, settings.globalDefines, nullptr);

	if(auto *models = find_child(*root, "model"); models && get_branch(*models)) {
		for(auto &[key, child] : get_children(*get_branch(*models))) {
			auto model = read_model(key, *child, logHandler);
			if(model)
				settings.models.push_back(std::move(*model));
		}
	}

	if(auto *materials = find_child(*root, "material"); materials && get_branch(*materials)) {
		for(auto &[key, child] : get_children(*get_branch(*materials))) {
			MaterialSet set {};
			set.name = key;
			if(auto *setBranch = get_branch(*child)) {
				if(auto *list = find_child(*setBranch, "materials"))
					set.materials = read_list(*list);
			}
			settings.materialSets.push_back(std::move(set));
		}
	}

	if(auto *data = find_child(*root, "data"); data && get_branch(*data)) {
		for(auto &[key, child] : get_children(*get_branch(*data)))
			settings.dataSections.push_back({key, read_data_items(*child, logHandler)});
	}

	if(auto *vtf = find_child(*root, "vtf"); vtf && get_branch(*vtf)) {
		for(auto &[key, child] : get_children(*get_branch(*vtf))) {
			auto *groupBranch = get_branch(*child);
			if(!groupBranch)
				continue;
			TextureGroup group {};
			group.name = key;
			group.input = find_leaf_value(*groupBranch, "input").value_or("");
			group.output = find_leaf_value(*groupBranch, "output");
			if(auto *options = find_child(*groupBranch, "vtf"); options && get_branch(*options))
				group.options = read_encode_options(*get_branch(*options));
			settings.textureGroups.push_back(std::move(group));
		}
	}
	return settings;
}

std::optional<rcomp::BuildSettings> rcomp::BuildSettings::Load(const std::string &path, std::string &outErr, const LogHandler &logHandler)
{
	auto content = read_text_file(path);
	if(!content) {
		outErr = "Unable to open config file '" + path + "'!";
		return {};
	}
	return Parse(*content, path, outErr, logHandler);
}
