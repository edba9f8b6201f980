// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#include "texture_encoder.hpp"
#include "qc_expression.hpp"
#include "file_util.hpp"
#include <sharedutils/util_string.h>
#include <filesystem>

rcomp::TextureEncoder::TextureEncoder(std::string vtfcmdPath, std::shared_ptr<IProcessRunner> processRunner) : m_vtfcmdPath {std::move(vtfcmdPath)}, m_processRunner {std::move(processRunner)}
{
	if(m_processRunner == nullptr)
		m_processRunner = std::make_shared<SystemProcessRunner>();
}

static std::string to_upper(std::string str)
{
	ustring::to_upper(str);
	return str;
}

std::vector<std::string> rcomp::TextureEncoder::BuildArguments(const std::string &srcPath, const std::string &outputDir, const TextureEncodeOptions &options) const
{
	std::vector<std::string> args {m_vtfcmdPath, "-file", srcPath, "-output", outputDir, "-format", options.format, "-version", options.version, "-resize"};
	if(options.resize) {
		args.insert(args.end(), {"-rwidth", std::to_string(options.resize->width), "-rheight", std::to_string(options.resize->height)});
	}
	if(options.resizeMethod)
		args.insert(args.end(), {"-rmethod", to_upper(*options.resizeMethod)});
	if(options.resizeFilter)
		args.insert(args.end(), {"-rfilter", to_upper(*options.resizeFilter)});
	if(options.sharpenFilter)
		args.insert(args.end(), {"-rsharpen", to_upper(*options.sharpenFilter)});
	args.insert(args.end(), {"-alphaformat", options.alphaFormat.value_or(options.format)});
	if(options.silent)
		args.push_back("-silent");

	auto generateMipmaps = options.generateMipmaps;
	for(auto flag : options.flags) {
		ustring::remove_whitespace(flag);
		if(flag.empty())
			continue;
		flag = to_upper(flag);
		args.insert(args.end(), {"-flag", flag});
		if(flag == "NOMIP")
			generateMipmaps = false;
	}
	if(!generateMipmaps)
		args.push_back("-nomipmaps");

	if(options.normalMap) {
		auto &normal = *options.normalMap;
		args.push_back("-normal");
		if(normal.kernel)
			args.insert(args.end(), {"-nkernel", *normal.kernel});
		if(normal.height)
			args.insert(args.end(), {"-nheight", *normal.height});
		if(normal.alpha)
			args.insert(args.end(), {"-nalpha", *normal.alpha});
		if(normal.scale)
			args.insert(args.end(), {"-nscale", qc::format_number(*normal.scale)});
	}
	if(options.gammaCorrection)
		args.insert(args.end(), {"-gamma", "-gcorrection", qc::format_number(*options.gammaCorrection)});
	args.insert(args.end(), options.extraArgs.begin(), options.extraArgs.end());
	return args;
}

bool rcomp::TextureEncoder::Encode(const std::string &srcPath, const std::string &dstPath, const TextureEncodeOptions &options, std::string &outErr)
{
	std::error_code ec;
	auto src = std::filesystem::absolute(srcPath, ec);
	auto dst = std::filesystem::absolute(dstPath, ec);
	if(rcomp::create_system_path(dst.parent_path().string()) == false) {
		outErr = "Unable to create directory '" + dst.parent_path().string() + "'";
		return false;
	}

	if(ustring::compare<std::string>(src.extension().string(), ".vtf", false)) {
		return rcomp::copy_file(src.string(), dst.string(), outErr);
	}

	ProcessResult result {};
	if(m_processRunner->Run(BuildArguments(src.string(), dst.parent_path().string(), options), result, outErr) == false)
		return false;
	if(!options.silent || result.Succeeded() == false)
		rcomp::log(m_logHandler, result.output, result.Succeeded() ? LogSeverity::Debug : LogSeverity::Error);
	if(result.Succeeded() == false) {
		outErr = "VTF conversion failed: '" + src.string() + "' -> '" + dst.string() + "' (exit code " + std::to_string(result.exitCode) + ")";
		return false;
	}

	auto converted = dst.parent_path() / (src.stem().string() + ".vtf");
	if(converted != dst) {
		std::filesystem::remove(dst, ec);
		std::filesystem::rename(converted, dst, ec);
		if(ec) {
			outErr = "Unable to rename '" + converted.string() + "' to '" + dst.string() + "': " + ec.message();
			return false;
		}
	}
	return true;
}
