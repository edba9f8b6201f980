// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#ifndef __RCOMP_DATA_PROCESSOR_HPP__
#define __RCOMP_DATA_PROCESSOR_HPP__

#include "rcompdefinitions.h"
#include "rcomp_log.hpp"
#include "build_settings.hpp"
#include <cinttypes>
#include <memory>
#include <string>
#include <vector>

#pragma warning(push)
#pragma warning(disable : 4251)
namespace rcomp {
	class TextureEncoder;
	class DataProcessor;

	struct DLLRCOMP DataItemContext {
		const DataItem &item;
		std::string inputPath;
		std::string outputPath;
	};

	class DLLRCOMP IDataItemHandler {
	  public:
		virtual ~IDataItemHandler() = default;
		virtual std::string_view GetName() const = 0;
		virtual bool CanHandle(const DataItemContext &context) const = 0;
		virtual bool Process(DataProcessor &processor, const DataItemContext &context, std::string &outErr) = 0;
	};

	// Text files with a replace map
	class DLLRCOMP TextReplaceHandler : public IDataItemHandler {
	  public:
		virtual std::string_view GetName() const override { return "text replace"; }
		virtual bool CanHandle(const DataItemContext &context) const override;
		virtual bool Process(DataProcessor &processor, const DataItemContext &context, std::string &outErr) override;
	};

	// Images or vtf files with a vtf output
	class DLLRCOMP VtfExportHandler : public IDataItemHandler {
	  public:
		virtual std::string_view GetName() const override { return "vtf export"; }
		virtual bool CanHandle(const DataItemContext &context) const override;
		virtual bool Process(DataProcessor &processor, const DataItemContext &context, std::string &outErr) override;
	};

	class DLLRCOMP CopyHandler : public IDataItemHandler {
	  public:
		virtual std::string_view GetName() const override { return "copy"; }
		virtual bool CanHandle(const DataItemContext &context) const override { return true; }
		virtual bool Process(DataProcessor &processor, const DataItemContext &context, std::string &outErr) override;
	};

	class DLLRCOMP DataProcessor {
	  public:
		// Input paths are relative to inputRoot. encoder may be null, in which case images are not converted.
		DataProcessor(std::string compileRoot, std::string inputRoot, std::shared_ptr<TextureEncoder> encoder = nullptr);
		void SetLogHandler(const LogHandler &logHandler) { m_logHandler = logHandler; }

		// Handlers are tried in order of registration, the first one that accepts an item processes it
		void AddHandler(std::unique_ptr<IDataItemHandler> &&handler);
		const std::vector<std::unique_ptr<IDataItemHandler>> &GetHandlers() const { return m_handlers; }

		// Returns the number of items that failed
		uint32_t ProcessItems(const std::vector<DataItem> &items, const std::string &baseOutput);
		bool ProcessItem(const DataItem &item, const std::string &baseOutput, std::string &outErr);
		IDataItemHandler *FindHandler(const DataItemContext &context) const;

		std::string ResolveInputPath(const std::string &path) const;
		const std::string &GetCompileRoot() const { return m_compileRoot; }
		TextureEncoder *GetEncoder() const { return m_encoder.get(); }
		const LogHandler &GetLogHandler() const { return m_logHandler; }
	  private:
		std::string m_compileRoot;
		std::string m_inputRoot;
		std::shared_ptr<TextureEncoder> m_encoder;
		std::vector<std::unique_ptr<IDataItemHandler>> m_handlers;
		LogHandler m_logHandler;
	};

	DLLRCOMP bool is_supported_text_format(const std::string &path);
	DLLRCOMP bool is_supported_image_format(const std::string &path);
};
#pragma warning(pop)

#endif
