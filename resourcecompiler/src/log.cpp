// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#include "rcomp_log.hpp"
#include <fsys/ifile.hpp>
#include <mathutil/umath.h>

std::string_view rcomp::get_severity_prefix(LogSeverity severity)
{
	switch(severity) {
	case LogSeverity::Debug:
		return "DEBUG";
	case LogSeverity::Info:
		return "INFO";
	case LogSeverity::Warning:
		return "WARNING";
	case LogSeverity::Error:
		return "ERROR";
	}
	return "INFO";
}

void rcomp::log(const LogHandler &handler, const std::string &msg, LogSeverity severity)
{
	if(handler)
		handler(msg, severity);
}

rcomp::Logger::Logger(bool verbose, std::ostream &out) : m_verbose {verbose}, m_out {out} {}

bool rcomp::Logger::OpenLogFile(const std::string &path, std::string &outErr)
{
	m_logFile = filemanager::open_system_file(path, filemanager::FileMode::Write);
	if(m_logFile == nullptr) {
		outErr = "Unable to open log file '" + path + "'!";
		return false;
	}
	return true;
}

void rcomp::Logger::WriteLine(const std::string &line)
{
	m_out << line << std::endl;
	if(m_logFile == nullptr)
		return;
	m_logFile->Write(line.data(), line.size());
	m_logFile->Write("\n", 1);
}

void rcomp::Logger::Log(const std::string &msg, LogSeverity severity)
{
	if(severity >= LogSeverity::Count)
		severity = LogSeverity::Info;
	++m_counts[umath::to_integral(severity)];
	if(severity == LogSeverity::Debug && m_verbose == false)
		return;
	if(msg.empty()) {
		WriteLine("");
		return;
	}
	WriteLine(std::string {get_severity_prefix(severity)} + ": " + msg);
}

rcomp::LogHandler rcomp::Logger::GetHandler()
{
	return [this](const std::string &msg, LogSeverity severity) { Log(msg, severity); };
}

rcomp::LogHandler rcomp::Logger::CreateContext(const std::string &context)
{
	return [this, context](const std::string &msg, LogSeverity severity) { Log("[" + context + "] " + msg, severity); };
}

uint32_t rcomp::Logger::GetCount(LogSeverity severity) const
{
	if(severity >= LogSeverity::Count)
		return 0;
	return m_counts[umath::to_integral(severity)];
}

void rcomp::Logger::PrintSummary()
{
	WriteLine("");
	WriteLine("Build finished with " + std::to_string(GetCount(LogSeverity::Warning)) + " warning(s) and " + std::to_string(GetCount(LogSeverity::Error)) + " error(s).");
}
