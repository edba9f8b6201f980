// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#include "rcomp_test_util.hpp"
#include <data_processor.hpp>
#include <texture_encoder.hpp>
#include <vmt_creator.hpp>
#include <algorithm>
#include <filesystem>

using namespace rcomp;
using rcomp::test::FakeProcessRunner;

class DataProcessorTest : public rcomp::test::ScratchTest {
  protected:
	static DataItem CreateItem(const std::string &input, const std::string &output)
	{
		DataItem item {};
		item.name = input;
		item.input = input;
		item.output = output;
		return item;
	}
};

TEST(DataProcessor, SupportedFormats)
{
	EXPECT_TRUE(is_supported_text_format("scripts/game.CFG"));
	EXPECT_TRUE(is_supported_text_format("a.qc"));
	EXPECT_FALSE(is_supported_text_format("a.vtf"));
	EXPECT_TRUE(is_supported_image_format("a.PNG"));
	EXPECT_TRUE(is_supported_image_format("a.jpeg"));
	EXPECT_FALSE(is_supported_image_format("a.vtf"));
	EXPECT_FALSE(is_supported_image_format("noextension"));
}

TEST_F(DataProcessorTest, HandlerSelection)
{
	DataProcessor processor {Path("compile"), m_root.generic_string()};
	auto handlerName = [&processor](const DataItem &item) -> std::string {
		DataItemContext context {item, item.input, item.output};
		auto *handler = processor.FindHandler(context);
		return handler ? std::string {handler->GetName()} : std::string {};
	};
	auto text = CreateItem("a.txt", "b.txt");
	EXPECT_EQ(handlerName(text), "copy");
	text.replace = {{"x", "y"}};
	EXPECT_EQ(handlerName(text), "text replace");
	EXPECT_EQ(handlerName(CreateItem("a.txt", "b.bin")), "copy");
	EXPECT_EQ(handlerName(CreateItem("a.png", "b.vtf")), "vtf export");
	EXPECT_EQ(handlerName(CreateItem("a.vtf", "b.vtf")), "vtf export");
	EXPECT_EQ(handlerName(CreateItem("a.png", "b.png")), "copy");
	EXPECT_EQ(processor.GetHandlers().size(), 3);
}

TEST_F(DataProcessorTest, ResolveInputPath)
{
	DataProcessor processor {Path("compile"), Path("project")};
	EXPECT_EQ(processor.ResolveInputPath("/textures/a.png"), Path("project/textures/a.png"));
	EXPECT_EQ(processor.ResolveInputPath("textures/../b.png"), Path("project/b.png"));
}

TEST_F(DataProcessorTest, ReplaceAndCopy)
{
	WriteFile("project/cfg/game.cfg", "name=%NAME%\nversion=%VERSION%\n");
	WriteFile("project/readme.txt", "%NAME%");
	auto replaceItem = CreateItem("cfg/game.cfg", "cfg/game.cfg");
	replaceItem.replace = {{"%NAME%", "Crate"}, {"%VERSION%", "2"}};
	auto copyItem = CreateItem("readme.txt", "docs/readme.txt");
	auto missingItem = CreateItem("missing.txt", "missing.txt");

	rcomp::test::LogCapture log;
	DataProcessor processor {Path("compile"), Path("project")};
	processor.SetLogHandler(log.GetHandler());
	auto numFailed = processor.ProcessItems({replaceItem, copyItem, missingItem}, Path("compile/scripts"));
	EXPECT_EQ(numFailed, 1);
	EXPECT_EQ(ReadFile("compile/scripts/cfg/game.cfg"), "name=Crate\nversion=2\n");
	EXPECT_EQ(ReadFile("compile/scripts/docs/readme.txt"), "%NAME%");
	EXPECT_EQ(ReadFile("project/cfg/game.cfg"), "name=%NAME%\nversion=%VERSION%\n");
	EXPECT_TRUE(log.Contains("'missing.txt'"));
}

TEST_F(DataProcessorTest, VtfExportWithTemplate)
{
	WriteFile("project/textures/crate.png", "PNG");
	WriteFile("project/templates/model.vmt", "\"VertexLitGeneric\"\n{\n\t\"$basetexture\" \"placeholder\"\n\t\"$surfaceprop\" \"wood\"\n}\n");
	auto runner = std::make_shared<FakeProcessRunner>([](const std::vector<std::string> &args) -> ProcessResult {
		auto it = std::find(args.begin(), args.end(), "-output");
		std::ofstream f {std::filesystem::path {*(it + 1)} / "crate.vtf", std::ios::binary};
		f << "VTF";
		return {0, ""};
	});
	auto encoder = std::make_shared<TextureEncoder>("vtfcmd", runner);

	auto item = CreateItem("textures/crate.png", "materials/models/props/crate.vtf");
	item.vtf = TextureEncodeOptions {};
	item.vtf->flags = {"clamps"};
	item.vmtTemplate = "templates/model.vmt";

	DataProcessor processor {Path("compile"), Path("project"), encoder};
	std::string err;
	ASSERT_TRUE(processor.ProcessItem(item, Path("compile/Assetshared"), err)) << err;
	ASSERT_EQ(runner->invocations.size(), 1);
	EXPECT_EQ(std::count(runner->invocations.front().begin(), runner->invocations.front().end(), "CLAMPS"), 1);
	EXPECT_EQ(ReadFile("compile/Assetshared/materials/models/props/crate.vtf"), "VTF");
	auto vmt = ReadFile("compile/Assetshared/materials/models/props/crate.vmt");
	EXPECT_NE(vmt.find("\t$basetexture \"models/props/crate\"\n"), std::string::npos);
	EXPECT_NE(vmt.find("\t$surfaceprop \"wood\""), std::string::npos);
}

TEST_F(DataProcessorTest, VtfExportWithoutEncoder)
{
	WriteFile("project/crate.png", "PNG");
	rcomp::test::LogCapture log;
	DataProcessor processor {Path("compile"), Path("project")};
	processor.SetLogHandler(log.GetHandler());
	std::string err;
	EXPECT_TRUE(processor.ProcessItem(CreateItem("crate.png", "crate.vtf"), Path("compile"), err));
	EXPECT_FALSE(Exists("compile/crate.vtf"));
	EXPECT_EQ(log.Count(LogSeverity::Warning), 1);
}

TEST_F(DataProcessorTest, CustomHandlersComeLast)
{
	class NullHandler : public IDataItemHandler {
	  public:
		virtual std::string_view GetName() const override { return "null"; }
		virtual bool CanHandle(const DataItemContext &context) const override { return true; }
		virtual bool Process(DataProcessor &processor, const DataItemContext &context, std::string &outErr) override { return true; }
	};
	DataProcessor processor {Path("compile"), Path("project")};
	processor.AddHandler(std::make_unique<NullHandler>());
	auto item = CreateItem("a.bin", "b.bin");
	DataItemContext context {item, item.input, item.output};
	EXPECT_EQ(processor.FindHandler(context)->GetName(), "copy");
}

TEST(VmtCreator, TextureReference)
{
	EXPECT_EQ(VmtCreator::GetTextureReference("/build/compile/Assetshared/materials/models/crate.vtf", "/build/compile"), "models/crate");
	EXPECT_EQ(VmtCreator::GetTextureReference("/build/compile/Assetshared/textures/crate.vtf", "/build/compile"), "textures/crate");
	EXPECT_EQ(VmtCreator::GetTextureReference("/elsewhere/crate.vtf", "/build/compile"), "crate");
}

TEST(VmtCreator, ProcessTemplate)
{
	auto result = VmtCreator::ProcessTemplate("\"LightmappedGeneric\"\n{\n  $basetexture \"old\"\n\t\"$translucent\" 1\n\t\"$basetexture2\" \"keep\"\n}", "new/path");
	EXPECT_EQ(result, "\"LightmappedGeneric\"\n{\n  $basetexture \"new/path\"\n\t$translucent 1\n\t$basetexture2 \"keep\"\n}\n");
}

TEST_F(DataProcessorTest, MissingTemplate)
{
	std::string err;
	EXPECT_FALSE(VmtCreator::CreateFromTemplate(Path("missing.vmt"), Path("out/a.vtf"), Path("compile"), err));
	EXPECT_NE(err.find("missing.vmt"), std::string::npos);
}
