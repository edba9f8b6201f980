// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#ifndef __RCOMP_LOG_HPP__
#define __RCOMP_LOG_HPP__

#include "rcompdefinitions.h"
#include <fsys/filesystem.h>
#include <array>
#include <cinttypes>
#include <functional>
#include <iostream>
#include <string>
#include <string_view>

#pragma warning(push)
#pragma warning(disable : 4251)
namespace rcomp {
	enum class LogSeverity : uint8_t { Debug = 0, Info, Warning, Error, Count };
	using LogHandler = std::function<void(const std::string &, LogSeverity)>;

	DLLRCOMP std::string_view get_severity_prefix(LogSeverity severity);
	// Forwards to the handler if one is set
	DLLRCOMP void log(const LogHandler &handler, const std::string &msg, LogSeverity severity = LogSeverity::Info);

	class DLLRCOMP Logger {
	  public:
		Logger(bool verbose = false, std::ostream &out = std::cout);
		Logger(const Logger &) = delete;
		Logger &operator=(const Logger &) = delete;

		bool OpenLogFile(const std::string &path, std::string &outErr);
		void Log(const std::string &msg, LogSeverity severity = LogSeverity::Info);
		void Info(const std::string &msg) { Log(msg, LogSeverity::Info); }
		void Warn(const std::string &msg) { Log(msg, LogSeverity::Warning); }
		void Error(const std::string &msg) { Log(msg, LogSeverity::Error); }
		void Debug(const std::string &msg) { Log(msg, LogSeverity::Debug); }

		LogHandler GetHandler();
		// Handler which prefixes every message with "[context] "
		LogHandler CreateContext(const std::string &context);

		uint32_t GetCount(LogSeverity severity) const;
		void PrintSummary();
		void SetVerbose(bool verbose) { m_verbose = verbose; }
		bool IsVerbose() const { return m_verbose; }
	  private:
		void WriteLine(const std::string &line);
		bool m_verbose = false;
		std::ostream &m_out;
		std::array<uint32_t, static_cast<size_t>(LogSeverity::Count)> m_counts {};
		VFilePtrReal m_logFile = nullptr;
	};
};
#pragma warning(pop)

#endif
