// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#include "rcomp_test_util.hpp"
#include <texture_encoder.hpp>
#include <package_builder.hpp>
#include <algorithm>
#include <filesystem>

using namespace rcomp;
using rcomp::test::FakeProcessRunner;

class TextureEncoderTest : public rcomp::test::ScratchTest {};

static bool has_sequence(const std::vector<std::string> &args, const std::vector<std::string> &sequence) { return std::search(args.begin(), args.end(), sequence.begin(), sequence.end()) != args.end(); }

TEST(TextureEncoder, DefaultArguments)
{
	TextureEncoder encoder {"vtfcmd", std::make_shared<FakeProcessRunner>()};
	auto args = encoder.BuildArguments("in.png", "outdir", {});
	EXPECT_EQ(args, (std::vector<std::string> {"vtfcmd", "-file", "in.png", "-output", "outdir", "-format", "DXT5", "-version", "7.4", "-resize", "-alphaformat", "DXT5", "-silent"}));
}

TEST(TextureEncoder, FullArguments)
{
	TextureEncodeOptions options {};
	options.format = "BGR888";
	options.alphaFormat = "BGRA8888";
	options.resize = TextureEncodeOptions::Resolution {512, 256};
	options.resizeMethod = "nearest";
	options.resizeFilter = "triangle";
	options.flags = {"clamps", " nomip "};
	options.normalMap = TextureEncodeOptions::NormalMapOptions {std::string {"3x3"}, std::string {"average"}, {}, 2.5};
	options.gammaCorrection = 1.8;
	options.extraArgs = {"-nothumbnail"};
	options.silent = false;

	TextureEncoder encoder {"vtfcmd", std::make_shared<FakeProcessRunner>()};
	auto args = encoder.BuildArguments("in.tga", "out", options);
	EXPECT_TRUE(has_sequence(args, {"-format", "BGR888"}));
	EXPECT_TRUE(has_sequence(args, {"-resize", "-rwidth", "512", "-rheight", "256", "-rmethod", "NEAREST", "-rfilter", "TRIANGLE"}));
	EXPECT_TRUE(has_sequence(args, {"-alphaformat", "BGRA8888"}));
	EXPECT_TRUE(has_sequence(args, {"-flag", "CLAMPS", "-flag", "NOMIP", "-nomipmaps"}));
	EXPECT_TRUE(has_sequence(args, {"-normal", "-nkernel", "3x3", "-nheight", "average", "-nscale", "2.5"}));
	EXPECT_TRUE(has_sequence(args, {"-gamma", "-gcorrection", "1.8"}));
	EXPECT_EQ(args.back(), "-nothumbnail");
	EXPECT_EQ(std::count(args.begin(), args.end(), "-silent"), 0);
	EXPECT_EQ(std::count(args.begin(), args.end(), "-nalpha"), 0);
}

TEST(TextureEncoder, MipmapsCanBeDisabled)
{
	TextureEncodeOptions options {};
	options.generateMipmaps = false;
	TextureEncoder encoder {"vtfcmd", std::make_shared<FakeProcessRunner>()};
	auto args = encoder.BuildArguments("in.png", "out", options);
	EXPECT_EQ(std::count(args.begin(), args.end(), "-nomipmaps"), 1);
}

TEST_F(TextureEncoderTest, VtfSourceIsCopied)
{
	auto runner = std::make_shared<FakeProcessRunner>();
	TextureEncoder encoder {"vtfcmd", runner};
	auto src = WriteFile("src/wall.vtf", "VTF");
	std::string err;
	ASSERT_TRUE(encoder.Encode(src, Path("out/materials/wall.vtf"), {}, err)) << err;
	EXPECT_TRUE(runner->invocations.empty());
	EXPECT_EQ(ReadFile("out/materials/wall.vtf"), "VTF");
}

TEST_F(TextureEncoderTest, ConvertedFileIsRenamed)
{
	auto runner = std::make_shared<FakeProcessRunner>([](const std::vector<std::string> &args) -> ProcessResult {
		auto it = std::find(args.begin(), args.end(), "-output");
		std::ofstream f {std::filesystem::path {*(it + 1)} / "wall_diffuse.vtf", std::ios::binary};
		f << "converted";
		return {0, ""};
	});
	TextureEncoder encoder {"vtfcmd", runner};
	auto src = WriteFile("src/wall_diffuse.png", "PNG");
	std::string err;
	ASSERT_TRUE(encoder.Encode(src, Path("out/wall.vtf"), {}, err)) << err;
	ASSERT_EQ(runner->invocations.size(), 1);
	EXPECT_EQ(ReadFile("out/wall.vtf"), "converted");
	EXPECT_FALSE(Exists("out/wall_diffuse.vtf"));
}

TEST_F(TextureEncoderTest, FailedConversion)
{
	auto runner = std::make_shared<FakeProcessRunner>([](const std::vector<std::string> &) -> ProcessResult { return {3, "Error loading image"}; });
	rcomp::test::LogCapture log;
	TextureEncoder encoder {"vtfcmd", runner};
	encoder.SetLogHandler(log.GetHandler());
	auto src = WriteFile("src/wall.png", "PNG");
	std::string err;
	EXPECT_FALSE(encoder.Encode(src, Path("out/wall.vtf"), {}, err));
	EXPECT_NE(err.find("exit code 3"), std::string::npos);
	EXPECT_TRUE(log.Contains("Error loading image"));
}

TEST_F(TextureEncoderTest, PackageFolder)
{
	auto runner = std::make_shared<FakeProcessRunner>();
	PackageBuilder builder {"vpk", runner};
	std::filesystem::create_directories(m_root / "compile" / "props");
	std::string err;
	ASSERT_TRUE(builder.Package(Path("compile/props"), err)) << err;
	ASSERT_EQ(runner->invocations.size(), 1);
	EXPECT_EQ(runner->invocations.front().front(), "vpk");
	EXPECT_EQ(std::filesystem::path {runner->invocations.front().back()}, std::filesystem::path {Path("compile/props")});

	EXPECT_FALSE(builder.Package(Path("compile/missing"), err));
	EXPECT_NE(err.find("Folder not found"), std::string::npos);
}

TEST_F(TextureEncoderTest, PackageFailure)
{
	auto runner = std::make_shared<FakeProcessRunner>([](const std::vector<std::string> &) -> ProcessResult { return {1, ""}; });
	PackageBuilder builder {"vpk", runner};
	std::filesystem::create_directories(m_root / "compile");
	std::string err;
	EXPECT_FALSE(builder.Package(Path("compile"), err));
	EXPECT_NE(err.find("code 1"), std::string::npos);
}
