// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#ifndef __RCOMP_TEXTURE_PIPELINE_HPP__
#define __RCOMP_TEXTURE_PIPELINE_HPP__

#include "rcompdefinitions.h"
#include "rcomp_log.hpp"
#include "build_settings.hpp"
#include <cinttypes>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#pragma warning(push)
#pragma warning(disable : 4251)
namespace rcomp {
	class TextureEncoder;

	struct DLLRCOMP TexturePipelineOptions {
		bool forceUpdate = false;
		bool allowReprocess = false;
		bool recursive = false;
	};

	// Batch conversion of loose images to vtf (ValveTexture configs)
	class DLLRCOMP TexturePipeline {
	  public:
		TexturePipeline(std::shared_ptr<TextureEncoder> encoder, std::string rootDir, const TexturePipelineOptions &options = {});
		void SetLogHandler(const LogHandler &logHandler) { m_logHandler = logHandler; }

		// Returns the number of textures that failed to convert
		uint32_t Execute(const std::vector<TextureGroup> &groups);
		uint32_t ProcessGroup(const TextureGroup &group);

		// A pattern that names an existing file is used as-is, otherwise it is treated as a regular expression for file names
		std::vector<std::string> FindMatchingFiles(const std::string &pattern) const;
		std::string ResolveOutputPath(const std::string &srcFile, const std::optional<std::string> &output) const;
		// The output is up to date if it is at least as new as the source
		bool IsUpToDate(const std::string &srcFile, const std::string &dstFile) const;

		const std::unordered_set<std::string> &GetProcessedFiles() const { return m_processedFiles; }
		uint32_t GetConvertedCount() const { return m_numConverted; }
	  private:
		bool ProcessFile(const std::string &srcFile, const TextureGroup &group);
		std::shared_ptr<TextureEncoder> m_encoder;
		std::string m_rootDir;
		TexturePipelineOptions m_options;
		std::unordered_set<std::string> m_processedFiles;
		uint32_t m_numConverted = 0;
		LogHandler m_logHandler;
	};
};
#pragma warning(pop)

#endif
