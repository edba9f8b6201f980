// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#include "rcomp_test_util.hpp"
#include <build_settings.hpp>
#include <filesystem>

using namespace rcomp;

class BuildSettingsTest : public rcomp::test::ScratchTest {};

static const char *g_modelConfig = R"("ValveModel"
{
	"studiomdl" "bin/studiomdl.exe"
	"gameinfo" "/games/mod/gameinfo.txt"
	"vpk" ""
	"definevariable"
	{
		"quality" "high"
		"skins" "2"
	}
	"model"
	{
		"crate"
		{
			"qc" "src/crate/crate.qc"
			"definevariable"
			{
				"size" "64"
				"lod"
				{
					"value" "1"
					"targets" "qc lod1"
				}
			}
			"submodels"
			{
				"lod1" "crate_lod1.qc"
			}
			"subdata"
			{
				"skin"
				{
					"input" "textures/crate.png"
					"output" "materials/models/crate/crate.vtf"
					"vtf"
					{
						"flags" "clamps nomip"
						"vmt" "templates/model.vmt"
					}
				}
			}
		}
		"barrel"
		{
			"qc" "src/barrel.qc"
			"compile" "0"
		}
		"broken"
		{
			"compile" "1"
		}
	}
	"material"
	{
		"props"
		{
			"materials"
			{
				"a" "models/props/crate"
				"b" "models/props/barrel"
			}
		}
	}
	"data"
	{
		"scripts"
		{
			"config"
			{
				"input" "cfg/game.cfg"
				"output" "cfg/game.cfg"
				"replace"
				{
					"%NAME%" "Crate"
				}
			}
			"incomplete"
			{
				"input" "a.txt"
			}
		}
	}
}
)";

TEST_F(BuildSettingsTest, ModelPipeline)
{
	rcomp::test::LogCapture log;
	std::string err;
	auto settings = BuildSettings::Parse(g_modelConfig, Path("project/build.txt"), err, log.GetHandler());
	ASSERT_TRUE(settings.has_value()) << err;
	EXPECT_EQ(settings->type, PipelineType::ValveModel);
	EXPECT_EQ(settings->configDir, Path("project"));
	EXPECT_EQ(settings->studiomdl, Path("project/bin/studiomdl.exe"));
	EXPECT_EQ(settings->gameinfo, std::string {"/games/mod/gameinfo.txt"});
	EXPECT_FALSE(settings->vpk.has_value());
	EXPECT_FALSE(settings->vtfcmd.has_value());
	EXPECT_EQ(settings->globalDefines, (StringPairList {{"quality", "high"}, {"skins", "2"}}));

	// Ordered by key, entries without a qc are dropped
	ASSERT_EQ(settings->models.size(), 2);
	auto &barrel = settings->models[0];
	EXPECT_EQ(barrel.name, "barrel");
	EXPECT_FALSE(barrel.compile);
	auto &crate = settings->models[1];
	EXPECT_EQ(crate.qc, "src/crate/crate.qc");
	EXPECT_TRUE(crate.compile);
	EXPECT_EQ(crate.defines, (StringPairList {{"size", "64"}}));
	ASSERT_EQ(crate.targetedDefines.size(), 1);
	EXPECT_EQ(crate.targetedDefines[0].targets, (std::vector<std::string> {"qc", "lod1"}));
	EXPECT_EQ(crate.GetDefines("qc"), (StringPairList {{"size", "64"}, {"lod", "1"}}));
	EXPECT_EQ(crate.GetDefines("lod2"), (StringPairList {{"size", "64"}}));
	EXPECT_EQ(crate.submodels, (StringPairList {{"lod1", "crate_lod1.qc"}}));
	ASSERT_EQ(crate.subdata.size(), 1);
	ASSERT_TRUE(crate.subdata[0].vtf.has_value());
	EXPECT_EQ(crate.subdata[0].vtf->flags, (std::vector<std::string> {"clamps", "nomip"}));
	EXPECT_EQ(crate.subdata[0].vmtTemplate, std::string {"templates/model.vmt"});
	EXPECT_TRUE(log.Contains("'broken'"));

	ASSERT_EQ(settings->materialSets.size(), 1);
	EXPECT_EQ(settings->materialSets[0].materials, (std::vector<std::string> {"models/props/crate", "models/props/barrel"}));

	ASSERT_EQ(settings->dataSections.size(), 1);
	EXPECT_EQ(settings->dataSections[0].folder, "scripts");
	ASSERT_EQ(settings->dataSections[0].items.size(), 1);
	auto &item = settings->dataSections[0].items[0];
	EXPECT_EQ(item.name, "config");
	EXPECT_EQ(item.replace, (StringPairList {{"%NAME%", "Crate"}}));
	EXPECT_FALSE(item.vtf.has_value());
	EXPECT_TRUE(log.Contains("'incomplete'"));
}

TEST_F(BuildSettingsTest, TexturePipeline)
{
	std::string err;
	auto settings = BuildSettings::Parse(R"("ValveTexture"
{
	"vtfcmd" "tools/vtfcmd.exe"
	"vtf"
	{
		"normals"
		{
			"input" "[a-z]+_n[.]png"
			"output" "materials/normals"
			"vtf"
			{
				"format" "BGR888"
				"flags" "normal"
				"encoder_args" "-nothumbnail -noreflectivity"
				"resize" "512 256"
				"nomipmaps" "1"
				"gamma" "2.2"
				"normal"
				{
					"kernel" "3x3"
					"scale" "1.5"
				}
			}
		}
	}
}
)",
	  Path("build.txt"), err);
	ASSERT_TRUE(settings.has_value()) << err;
	EXPECT_EQ(settings->type, PipelineType::ValveTexture);
	EXPECT_EQ(settings->vtfcmd, Path("tools/vtfcmd.exe"));
	ASSERT_EQ(settings->textureGroups.size(), 1);
	auto &group = settings->textureGroups[0];
	EXPECT_EQ(group.name, "normals");
	EXPECT_EQ(group.output, std::string {"materials/normals"});
	auto &options = group.options;
	EXPECT_EQ(options.format, "BGR888");
	EXPECT_EQ(options.extraArgs, (std::vector<std::string> {"-nothumbnail", "-noreflectivity"}));
	ASSERT_TRUE(options.resize.has_value());
	EXPECT_EQ(options.resize->width, 512);
	EXPECT_EQ(options.resize->height, 256);
	EXPECT_FALSE(options.generateMipmaps);
	EXPECT_EQ(options.gammaCorrection, 2.2);
	ASSERT_TRUE(options.normalMap.has_value());
	EXPECT_EQ(options.normalMap->kernel, std::string {"3x3"});
	EXPECT_EQ(options.normalMap->scale, 1.5);
	EXPECT_FALSE(options.normalMap->height.has_value());
}

TEST_F(BuildSettingsTest, UnknownHeader)
{
	std::string err;
	EXPECT_FALSE(BuildSettings::Parse("\"Pipeline\"\n{\n}\n", Path("build.txt"), err).has_value());
	EXPECT_NE(err.find("Pipeline"), std::string::npos);
}

TEST_F(BuildSettingsTest, LoadFromFile)
{
	auto path = WriteFile("cfg/build.txt", "\"valvetexture\"\n{\n\t\"vtfcmd\" \"/opt/vtfcmd\"\n}\n");
	std::string err;
	auto settings = BuildSettings::Load(path, err);
	ASSERT_TRUE(settings.has_value()) << err;
	EXPECT_EQ(settings->type, PipelineType::ValveTexture);
	EXPECT_EQ(settings->vtfcmd, std::string {"/opt/vtfcmd"});
	EXPECT_EQ(settings->ResolvePath("../src/./a.qc"), Path("src/a.qc"));

	EXPECT_FALSE(BuildSettings::Load(Path("missing.txt"), err).has_value());
}

TEST(PipelineType, Names)
{
	EXPECT_EQ(get_pipeline_name(PipelineType::ValveModel), "ValveModel");
	EXPECT_EQ(get_pipeline_name(PipelineType::ValveTexture), "ValveTexture");
}
