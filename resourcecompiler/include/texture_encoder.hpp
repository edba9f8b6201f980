// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#ifndef __RCOMP_TEXTURE_ENCODER_HPP__
#define __RCOMP_TEXTURE_ENCODER_HPP__

#include "rcompdefinitions.h"
#include "rcomp_log.hpp"
#include "process_runner.hpp"
#include <cinttypes>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#pragma warning(push)
#pragma warning(disable : 4251)
namespace rcomp {
	struct DLLRCOMP TextureEncodeOptions {
		struct NormalMapOptions {
			std::optional<std::string> kernel;
			std::optional<std::string> height;
			std::optional<std::string> alpha;
			std::optional<double> scale;
		};
		struct Resolution {
			uint32_t width = 0;
			uint32_t height = 0;
		};
		std::string format = "DXT5";
		std::optional<std::string> alphaFormat {}; // Same as format if not set
		std::string version = "7.4";
		std::vector<std::string> flags;
		std::optional<Resolution> resize {};
		std::optional<std::string> resizeMethod {};
		std::optional<std::string> resizeFilter {};
		std::optional<std::string> sharpenFilter {};
		bool generateMipmaps = true;
		std::optional<NormalMapOptions> normalMap {};
		std::optional<double> gammaCorrection {};
		std::vector<std::string> extraArgs;
		bool silent = true;
	};

	// Converts images to vtf via vtfcmd
	class DLLRCOMP TextureEncoder {
	  public:
		TextureEncoder(std::string vtfcmdPath, std::shared_ptr<IProcessRunner> processRunner = nullptr);
		void SetLogHandler(const LogHandler &logHandler) { m_logHandler = logHandler; }

		bool Encode(const std::string &srcPath, const std::string &dstPath, const TextureEncodeOptions &options, std::string &outErr);
		std::vector<std::string> BuildArguments(const std::string &srcPath, const std::string &outputDir, const TextureEncodeOptions &options) const;
		const std::string &GetToolPath() const { return m_vtfcmdPath; }
	  private:
		std::string m_vtfcmdPath;
		std::shared_ptr<IProcessRunner> m_processRunner;
		LogHandler m_logHandler;
	};
};
#pragma warning(pop)

#endif
