// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#include <build_orchestrator.hpp>
#include <build_settings.hpp>
#include <command_line.hpp>
#include <rcomp_log.hpp>
#include <shader_descriptor.hpp>
#include <chrono>
#include <cstdlib>
#include <iostream>

int main(int argc, char *argv[])
{
	std::vector<std::string> args;
	for(auto i = 1; i < argc; ++i)
		args.push_back(argv[i]);

	std::string err;
	auto options = rcomp::parse_command_line(args, err);
	if(!options) {
		std::cerr << "ERROR: " << err << "\n\n" << rcomp::get_usage("rcompcli");
		return EXIT_FAILURE;
	}
	if(options->showHelp) {
		std::cout << rcomp::get_usage("rcompcli");
		return EXIT_SUCCESS;
	}

	auto tStart = std::chrono::steady_clock::now();
	rcomp::Logger logger {options->buildOptions.verbose};
	if(options->logFile) {
		if(logger.OpenLogFile(*options->logFile, err) == false)
			logger.Warn(err);
		else
			logger.Info("Logging enabled: " + *options->logFile);
	}
	rcomp::ShaderDescriptor::SetLogHandler(logger.CreateContext("VKV"));

	auto settings = rcomp::BuildSettings::Load(options->configPath, err, logger.GetHandler());
	if(!settings) {
		logger.Error(err);
		return EXIT_FAILURE;
	}
	logger.Info("Pipeline: " + std::string {rcomp::get_pipeline_name(settings->type)});

	rcomp::BuildOrchestrator orchestrator {std::move(*settings), options->buildOptions, logger};
	auto success = orchestrator.Execute();

	auto dt = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - tStart).count();
	logger.Info("Finished in " + std::to_string(dt / 1000.0) + "s");
	if(!success || logger.GetCount(rcomp::LogSeverity::Error) > 0)
		return EXIT_FAILURE;
	return EXIT_SUCCESS;
}
