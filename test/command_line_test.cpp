// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#include "rcomp_test_util.hpp"
#include <command_line.hpp>
#include <filesystem>

using namespace rcomp;

class CommandLineTest : public rcomp::test::ScratchTest {};

TEST(CommandLine, Defaults)
{
	std::string err;
	auto options = parse_command_line({"build.txt"}, err);
	ASSERT_TRUE(options.has_value()) << err;
	EXPECT_EQ(options->configPath, "build.txt");
	auto &build = options->buildOptions;
	EXPECT_EQ(build.materialMode, MaterialMode::Shared);
	EXPECT_EQ(build.qcMode, QcMode::Flattened);
	EXPECT_TRUE(build.localizeMaterials);
	EXPECT_FALSE(build.gameMode);
	EXPECT_FALSE(build.verbose);
	EXPECT_FALSE(options->logFile.has_value());
}

TEST(CommandLine, ModelOptions)
{
	std::string err;
	auto options = parse_command_line({"-verbose", "build.txt", "--exportdir", "out", "--mat-mode", "1", "--no-mat-local", "-qc-mode", "1", "--keep-flat-qc", "--package-files", "--archive-old-ver", "--log", "build.log"}, err);
	ASSERT_TRUE(options.has_value()) << err;
	auto &build = options->buildOptions;
	EXPECT_TRUE(build.verbose);
	EXPECT_EQ(build.exportDir, std::string {"out"});
	EXPECT_EQ(build.materialMode, MaterialMode::Local);
	EXPECT_FALSE(build.localizeMaterials);
	EXPECT_EQ(build.qcMode, QcMode::Raw);
	EXPECT_TRUE(build.keepFlatQc);
	EXPECT_TRUE(build.packageFiles);
	EXPECT_TRUE(build.archiveOldVersion);
	EXPECT_EQ(options->logFile, std::string {"build.log"});
}

TEST(CommandLine, TextureOptions)
{
	std::string err;
	auto options = parse_command_line({"textures.txt", "--forceupdate", "--allow_reprocess", "--recursive"}, err);
	ASSERT_TRUE(options.has_value()) << err;
	auto &textureOptions = options->buildOptions.textureOptions;
	EXPECT_TRUE(textureOptions.forceUpdate);
	EXPECT_TRUE(textureOptions.allowReprocess);
	EXPECT_TRUE(textureOptions.recursive);
}

TEST_F(CommandLineTest, GameDirectoryIsOptional)
{
	std::filesystem::create_directories(m_root / "game");
	std::string err;
	auto options = parse_command_line({"--game", Path("game"), "build.txt"}, err);
	ASSERT_TRUE(options.has_value()) << err;
	EXPECT_TRUE(options->buildOptions.gameMode);
	EXPECT_EQ(options->buildOptions.gameDir, Path("game"));
	EXPECT_EQ(options->configPath, "build.txt");

	options = parse_command_line({"--game", "build.txt"}, err);
	ASSERT_TRUE(options.has_value()) << err;
	EXPECT_TRUE(options->buildOptions.gameMode);
	EXPECT_FALSE(options->buildOptions.gameDir.has_value());
	EXPECT_EQ(options->configPath, "build.txt");
}

TEST(CommandLine, Errors)
{
	std::string err;
	EXPECT_FALSE(parse_command_line({}, err).has_value());
	EXPECT_FALSE(parse_command_line({"build.txt", "--mat-mode", "3"}, err).has_value());
	EXPECT_NE(err.find("material mode"), std::string::npos);
	EXPECT_FALSE(parse_command_line({"build.txt", "--qc-mode", "0"}, err).has_value());
	EXPECT_FALSE(parse_command_line({"build.txt", "--exportdir"}, err).has_value());
	EXPECT_NE(err.find("--exportdir"), std::string::npos);
	EXPECT_FALSE(parse_command_line({"build.txt", "--unknown"}, err).has_value());
	EXPECT_NE(err.find("--unknown"), std::string::npos);
	EXPECT_FALSE(parse_command_line({"a.txt", "b.txt"}, err).has_value());
}

TEST(CommandLine, Help)
{
	std::string err;
	auto options = parse_command_line({"-h"}, err);
	ASSERT_TRUE(options.has_value()) << err;
	EXPECT_TRUE(options->showHelp);
	auto usage = get_usage("rcompcli");
	EXPECT_EQ(usage.rfind("Usage: rcompcli", 0), 0);
	EXPECT_NE(usage.find("--mat-mode"), std::string::npos);
}
