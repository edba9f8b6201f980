// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#include "rcomp_test_util.hpp"
#include <texture_pipeline.hpp>
#include <texture_encoder.hpp>
#include <algorithm>
#include <filesystem>

using namespace rcomp;
using rcomp::test::FakeProcessRunner;

class TexturePipelineTest : public rcomp::test::ScratchTest {
  protected:
	void SetUp() override
	{
		ScratchTest::SetUp();
		// Writes <output>/<stem>.vtf the way vtfcmd does
		m_runner = std::make_shared<FakeProcessRunner>([](const std::vector<std::string> &args) -> ProcessResult {
			auto itFile = std::find(args.begin(), args.end(), "-file");
			auto itOutput = std::find(args.begin(), args.end(), "-output");
			auto stem = std::filesystem::path {*(itFile + 1)}.stem().string();
			std::ofstream f {std::filesystem::path {*(itOutput + 1)} / (stem + ".vtf"), std::ios::binary};
			f << "VTF";
			return {0, ""};
		});
		m_encoder = std::make_shared<TextureEncoder>("vtfcmd", m_runner);
	}
	TexturePipeline CreatePipeline(const TexturePipelineOptions &options = {})
	{
		TexturePipeline pipeline {m_encoder, m_root.generic_string(), options};
		pipeline.SetLogHandler(m_log.GetHandler());
		return pipeline;
	}
	static TextureGroup CreateGroup(const std::string &input, const std::optional<std::string> &output = {})
	{
		TextureGroup group {};
		group.name = input;
		group.input = input;
		group.output = output;
		return group;
	}
	std::shared_ptr<FakeProcessRunner> m_runner;
	std::shared_ptr<TextureEncoder> m_encoder;
	rcomp::test::LogCapture m_log;
};

TEST_F(TexturePipelineTest, FindMatchingFiles)
{
	WriteFile("b_n.png", "");
	WriteFile("a_n.png", "");
	WriteFile("c_d.png", "");
	WriteFile("sub/d_n.png", "");
	auto pipeline = CreatePipeline();
	EXPECT_EQ(pipeline.FindMatchingFiles("_n\\.png$"), (std::vector<std::string> {Path("a_n.png"), Path("b_n.png")}));
	EXPECT_EQ(pipeline.FindMatchingFiles("sub/d_n.png"), (std::vector<std::string> {Path("sub/d_n.png")}));

	auto recursive = CreatePipeline({false, false, true});
	EXPECT_EQ(recursive.FindMatchingFiles("_n\\.png$").size(), 3);

	EXPECT_TRUE(pipeline.FindMatchingFiles("([").empty());
	EXPECT_TRUE(m_log.Contains("Invalid input pattern"));
}

TEST_F(TexturePipelineTest, ResolveOutputPath)
{
	auto pipeline = CreatePipeline();
	EXPECT_EQ(pipeline.ResolveOutputPath(Path("src/wall.png"), {}), Path("wall.vtf"));
	EXPECT_EQ(pipeline.ResolveOutputPath(Path("src/wall.png"), std::string {"materials/walls"}), Path("materials/walls/wall.vtf"));
	EXPECT_EQ(pipeline.ResolveOutputPath(Path("src/wall.png"), std::string {"materials/brick.tga"}), Path("materials/brick.vtf"));
	EXPECT_EQ(pipeline.ResolveOutputPath(Path("src/wall.png"), std::string {"/abs/out"}), "/abs/out/wall.vtf");
}

TEST_F(TexturePipelineTest, ConvertsAndSkipsUpToDate)
{
	WriteFile("wall.png", "PNG");
	WriteFile("floor.png", "PNG");
	auto pipeline = CreatePipeline();
	EXPECT_EQ(pipeline.Execute({CreateGroup("\\.png$", std::string {"materials"})}), 0);
	EXPECT_EQ(pipeline.GetConvertedCount(), 2);
	EXPECT_TRUE(Exists("materials/wall.vtf"));
	EXPECT_TRUE(Exists("materials/floor.vtf"));
	EXPECT_EQ(std::filesystem::last_write_time(m_root / "materials/wall.vtf"), std::filesystem::last_write_time(m_root / "wall.png"));

	// Second run finds everything up to date
	auto second = CreatePipeline();
	EXPECT_EQ(second.Execute({CreateGroup("\\.png$", std::string {"materials"})}), 0);
	EXPECT_EQ(second.GetConvertedCount(), 0);
	EXPECT_EQ(m_runner->invocations.size(), 2);
	EXPECT_TRUE(m_log.Contains("already up-to-date"));

	auto forced = CreatePipeline({true, false, false});
	forced.Execute({CreateGroup("wall.png", std::string {"materials"})});
	EXPECT_EQ(forced.GetConvertedCount(), 1);
}

TEST_F(TexturePipelineTest, FilesAreProcessedOnce)
{
	WriteFile("wall.png", "PNG");
	auto pipeline = CreatePipeline();
	pipeline.Execute({CreateGroup("wall.png", std::string {"a"}), CreateGroup("wall\\.png", std::string {"b"})});
	EXPECT_EQ(pipeline.GetConvertedCount(), 1);
	EXPECT_FALSE(Exists("b/wall.vtf"));
	EXPECT_TRUE(m_log.Contains("already processed"));

	auto reprocess = CreatePipeline({false, true, false});
	reprocess.Execute({CreateGroup("wall.png", std::string {"c"}), CreateGroup("wall\\.png", std::string {"d"})});
	EXPECT_EQ(reprocess.GetConvertedCount(), 2);
	EXPECT_TRUE(Exists("d/wall.vtf"));
}

TEST_F(TexturePipelineTest, GroupWarnings)
{
	auto pipeline = CreatePipeline();
	EXPECT_EQ(pipeline.Execute({}), 0);
	EXPECT_EQ(pipeline.Execute({CreateGroup(""), CreateGroup("nothing\\.png")}), 0);
	EXPECT_EQ(m_log.Count(LogSeverity::Warning), 3);
}

TEST_F(TexturePipelineTest, FailedConversionIsCounted)
{
	WriteFile("wall.png", "PNG");
	auto runner = std::make_shared<FakeProcessRunner>([](const std::vector<std::string> &) -> ProcessResult { return {1, "bad image"}; });
	TexturePipeline pipeline {std::make_shared<TextureEncoder>("vtfcmd", runner), m_root.generic_string()};
	pipeline.SetLogHandler(m_log.GetHandler());
	EXPECT_EQ(pipeline.Execute({CreateGroup("wall.png")}), 1);
	EXPECT_EQ(pipeline.GetConvertedCount(), 0);
	EXPECT_GE(m_log.Count(LogSeverity::Error), 1);
}
