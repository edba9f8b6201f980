// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#include "data_processor.hpp"
#include "file_util.hpp"
#include "texture_encoder.hpp"
#include "vmt_creator.hpp"
#include <sharedutils/util_string.h>
#include <sharedutils/util_file.h>
#include <algorithm>
#include <array>
#include <filesystem>

static constexpr std::array<std::string_view, 5> g_textFormats = {"txt", "vmt", "qc", "cfg", "res"};
static constexpr std::array<std::string_view, 6> g_imageFormats = {"png", "tga", "psd", "jpg", "jpeg", "bmp"};

template<size_t N>
static bool has_extension(const std::string &path, const std::array<std::string_view, N> &extensions)
{
	std::string ext;
	if(ufile::get_extension(path, &ext) == false)
		return false;
	ustring::to_lower(ext);
	return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

static bool is_vtf(const std::string &path)
{
	std::string ext;
	return ufile::get_extension(path, &ext) && ustring::compare<std::string>(ext, "vtf", false);
}

bool rcomp::is_supported_text_format(const std::string &path) { return has_extension(path, g_textFormats); }
bool rcomp::is_supported_image_format(const std::string &path) { return has_extension(path, g_imageFormats); }

static std::string get_file_name(const std::string &path) { return std::filesystem::path {path}.filename().string(); }

bool rcomp::TextReplaceHandler::CanHandle(const DataItemContext &context) const { return is_supported_text_format(context.item.input) && is_supported_text_format(context.item.output) && !context.item.replace.empty(); }

bool rcomp::TextReplaceHandler::Process(DataProcessor &processor, const DataItemContext &context, std::string &outErr)
{
	auto text = read_text_file(context.inputPath);
	if(!text) {
		outErr = "Unable to read '" + context.inputPath + "'";
		return false;
	}
	for(auto &[from, to] : context.item.replace)
		ustring::replace(*text, from, to);
	if(write_text_file(context.outputPath, *text, outErr) == false)
		return false;
	rcomp::log(processor.GetLogHandler(), "Replaced strings: " + get_file_name(context.inputPath) + " -> " + get_file_name(context.outputPath), LogSeverity::Info);
	return true;
}

bool rcomp::VtfExportHandler::CanHandle(const DataItemContext &context) const { return (is_supported_image_format(context.item.input) || is_vtf(context.item.input)) && is_vtf(context.item.output); }

bool rcomp::VtfExportHandler::Process(DataProcessor &processor, const DataItemContext &context, std::string &outErr)
{
	auto *encoder = processor.GetEncoder();
	if(is_vtf(context.inputPath)) {
		if(copy_file(context.inputPath, context.outputPath, outErr) == false)
			return false;
	}
	else if(encoder) {
		if(encoder->Encode(context.inputPath, context.outputPath, context.item.vtf.value_or(TextureEncodeOptions {}), outErr) == false)
			return false;
		rcomp::log(processor.GetLogHandler(), "VTF export: " + get_file_name(context.inputPath) + " -> " + get_file_name(context.outputPath), LogSeverity::Info);
	}
	else
		rcomp::log(processor.GetLogHandler(), "vtfcmd is not configured, unable to export '" + get_file_name(context.inputPath) + "'", LogSeverity::Warning);

	if(context.item.vmtTemplate) {
		std::string err;
		if(VmtCreator::CreateFromTemplate(processor.ResolveInputPath(*context.item.vmtTemplate), context.outputPath, processor.GetCompileRoot(), err, processor.GetLogHandler()) == false)
			rcomp::log(processor.GetLogHandler(), err + ", skipping", LogSeverity::Warning);
	}
	return true;
}

bool rcomp::CopyHandler::Process(DataProcessor &processor, const DataItemContext &context, std::string &outErr)
{
	if(copy_file(context.inputPath, context.outputPath, outErr) == false)
		return false;
	rcomp::log(processor.GetLogHandler(), "Copied file: " + get_file_name(context.inputPath) + " -> " + get_file_name(context.outputPath), LogSeverity::Info);
	return true;
}

rcomp::DataProcessor::DataProcessor(std::string compileRoot, std::string inputRoot, std::shared_ptr<TextureEncoder> encoder) : m_compileRoot {std::move(compileRoot)}, m_inputRoot {std::move(inputRoot)}, m_encoder {std::move(encoder)}
{
	AddHandler(std::make_unique<TextReplaceHandler>());
	AddHandler(std::make_unique<VtfExportHandler>());
	AddHandler(std::make_unique<CopyHandler>());
}

void rcomp::DataProcessor::AddHandler(std::unique_ptr<IDataItemHandler> &&handler) { m_handlers.push_back(std::move(handler)); }

std::string rcomp::DataProcessor::ResolveInputPath(const std::string &path) const
{
	// Leading slashes do not denote the file system root
	auto p = path;
	while(!p.empty() && (p.front() == '/' || p.front() == '\\'))
		p.erase(p.begin());
	std::filesystem::path fsPath {p};
	if(fsPath.is_absolute())
		return fsPath.lexically_normal().generic_string();
	return (std::filesystem::path {m_inputRoot} / fsPath).lexically_normal().generic_string();
}

rcomp::IDataItemHandler *rcomp::DataProcessor::FindHandler(const DataItemContext &context) const
{
	auto it = std::find_if(m_handlers.begin(), m_handlers.end(), [&context](const std::unique_ptr<IDataItemHandler> &handler) { return handler->CanHandle(context); });
	return (it != m_handlers.end()) ? it->get() : nullptr;
}

bool rcomp::DataProcessor::ProcessItem(const DataItem &item, const std::string &baseOutput, std::string &outErr)
{
	DataItemContext context {item, ResolveInputPath(item.input), (std::filesystem::path {baseOutput} / item.output).lexically_normal().generic_string()};
	auto *handler = FindHandler(context);
	if(!handler) {
		outErr = "No handler for '" + item.input + "'";
		return false;
	}
	rcomp::log(m_logHandler, "Processing '" + item.input + "' (" + std::string {handler->GetName()} + ")", LogSeverity::Debug);
	return handler->Process(*this, context, outErr);
}

uint32_t rcomp::DataProcessor::ProcessItems(const std::vector<DataItem> &items, const std::string &baseOutput)
{
	uint32_t numFailed = 0;
	for(auto &item : items) {
		std::string err;
		if(ProcessItem(item, baseOutput, err))
			continue;
		rcomp::log(m_logHandler, "Failed to process item '" + item.name + "': " + err, LogSeverity::Error);
		++numFailed;
	}
	return numFailed;
}
