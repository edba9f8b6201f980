// SPDX-FileCopyrightText: (c) 2021 Silverlan <opensource@pragma-engine.com>
// SPDX-License-Identifier: MIT

#include "rcomp_test_util.hpp"
#include <shader_graph_resolver.hpp>

using namespace rcomp;

class ShaderGraphResolverTest : public rcomp::test::ScratchTest {
  protected:
	ShaderGraphResolver CreateResolver(bool localize)
	{
		ShaderGraphResolver resolver {{Path("game1"), Path("game2")}, Path("out"), localize};
		resolver.SetLogHandler(m_log.GetHandler());
		return resolver;
	}
	static bool Contains(const std::string &text, const std::string &sub) { return text.find(sub) != std::string::npos; }
	rcomp::test::LogCapture m_log;
};

TEST(ShaderGraphResolver, NormalizeTexturePath)
{
	EXPECT_EQ(normalize_texture_path("Materials\\Models\\Crate_D.vtf"), "models/crate_d");
	EXPECT_EQ(normalize_texture_path("/materials/models/crate_d"), "models/crate_d");
	EXPECT_EQ(normalize_texture_path("models/crate_d.png"), "models/crate_d.png");
}

TEST(ShaderGraphResolver, RewriteReferences)
{
	std::string vmt = "\"VertexLitGeneric\"\n{\n\t\"$basetexture\" \"Models\\X\\Cloth_D\"\n\t$bumpmap models/x/cloth_n\n\t// \"$detail\" \"models/x/cloth_d\"\n\t\"$surfaceprop\" \"cloth\"\n}";
	auto result = rewrite_vmt_references(vmt, {{"models/x/cloth_d", "models/y/cloth_d"}, {"models/x/cloth_n", "models/y/cloth_n"}}, {});
	EXPECT_TRUE(Contains(result, "\t\"$basetexture\" \"models/y/cloth_d\"\n"));
	EXPECT_TRUE(Contains(result, "\t$bumpmap \"models/y/cloth_n\"\n"));
	EXPECT_TRUE(Contains(result, "// \"$detail\" \"models/x/cloth_d\""));
	EXPECT_TRUE(Contains(result, "\"$surfaceprop\" \"cloth\""));
	EXPECT_EQ(result.back(), '}');
}

TEST(ShaderGraphResolver, RewriteIncludeReference)
{
	auto result = rewrite_vmt_references("patch\n{\n\tinclude \"materials/a/base.vmt\"\n}\n", {}, std::string {"materials/b/shared/base.vmt"});
	EXPECT_TRUE(Contains(result, "\tinclude \"materials/b/shared/base.vmt\"\n"));
	EXPECT_EQ(result.back(), '\n');
}

TEST_F(ShaderGraphResolverTest, LocalizedTexturesFromOtherRoot)
{
	WriteFile("game1/materials/models/characters/cloth1.vmt", "\"VertexLitGeneric\"\n{\n\t\"$basetexture\" \"models/x/cloth1_d\"\n\t\"$envmap\" \"env_cubemap\"\n}\n");
	WriteFile("game2/materials/models/x/cloth1_d.vtf", "VTF");

	auto resolver = CreateResolver(true);
	std::shared_ptr<const ResolvedMaterial> material;
	ASSERT_EQ(resolver.Resolve("models/characters/cloth1", &material), ResolveResult::Success);
	ASSERT_NE(material, nullptr);
	EXPECT_EQ(material->textures.size(), 1);

	EXPECT_TRUE(Exists("out/materials/models/characters/cloth1.vmt"));
	EXPECT_TRUE(Exists("out/materials/models/characters/shared/cloth1_d.vtf"));
	EXPECT_FALSE(Exists("out/materials/models/x/cloth1_d.vtf"));
	auto vmt = ReadFile("out/materials/models/characters/cloth1.vmt");
	EXPECT_TRUE(Contains(vmt, "\"$basetexture\" \"models/characters/shared/cloth1_d\""));
	EXPECT_TRUE(Contains(vmt, "\"$envmap\" \"env_cubemap\""));
	EXPECT_EQ(resolver.GetLedger().copiedFiles.size(), 2);
}

TEST_F(ShaderGraphResolverTest, TextureNextToShaderStaysInPlace)
{
	WriteFile("game1/materials/models/props/crate.vmt", "\"VertexLitGeneric\"\n{\n\t\"$basetexture\" \"models/props/crate_d\"\n}\n");
	WriteFile("game1/materials/models/props/crate_d.vtf", "VTF");

	auto resolver = CreateResolver(true);
	ASSERT_EQ(resolver.Resolve("materials/models/props/crate.vmt"), ResolveResult::Success);
	EXPECT_TRUE(Exists("out/materials/models/props/crate_d.vtf"));
	EXPECT_TRUE(Contains(ReadFile("out/materials/models/props/crate.vmt"), "\"models/props/crate_d\""));
}

TEST_F(ShaderGraphResolverTest, MirroredCopyWithoutLocalization)
{
	std::string vmt = "\"VertexLitGeneric\"\n{\n\t\"$basetexture\" \"models/x/cloth1_d\"\n}\n";
	WriteFile("game1/materials/models/characters/cloth1.vmt", vmt);
	WriteFile("game2/materials/models/x/cloth1_d.vtf", "VTF");

	auto resolver = CreateResolver(false);
	ASSERT_EQ(resolver.Resolve("models/characters/cloth1"), ResolveResult::Success);
	EXPECT_EQ(ReadFile("out/materials/models/characters/cloth1.vmt"), vmt);
	EXPECT_TRUE(Exists("out/materials/models/x/cloth1_d.vtf"));
}

TEST_F(ShaderGraphResolverTest, SearchRootOrder)
{
	WriteFile("game1/materials/models/a.vmt", "\"UnlitGeneric\"\n{\n\t\"$basetexture\" \"models/a\"\n}\n");
	WriteFile("game1/materials/models/a.vtf", "first");
	WriteFile("game2/materials/models/a.vtf", "second");

	auto resolver = CreateResolver(true);
	resolver.Resolve("models/a");
	EXPECT_EQ(ReadFile("out/materials/models/a.vtf"), "first");
}

TEST_F(ShaderGraphResolverTest, MissingMaterialAndTexture)
{
	WriteFile("game1/materials/models/a.vmt", "\"UnlitGeneric\"\n{\n\t\"$basetexture\" \"models/missing\"\n}\n");

	auto resolver = CreateResolver(true);
	EXPECT_EQ(resolver.Resolve("models/nothing"), ResolveResult::NotFound);
	EXPECT_TRUE(m_log.Contains("Material not found"));

	EXPECT_EQ(resolver.Resolve("models/a"), ResolveResult::Success);
	EXPECT_TRUE(m_log.Contains("Texture not found: 'models/missing'"));
	EXPECT_TRUE(Exists("out/materials/models/a.vmt"));
	auto &cache = resolver.GetLedger().textureCache;
	auto it = cache.find("models/missing");
	ASSERT_NE(it, cache.end());
	EXPECT_FALSE(it->second.has_value());
}

TEST_F(ShaderGraphResolverTest, RepeatedNamesAreProcessedOnce)
{
	WriteFile("game1/materials/models/props/crate.vmt", "\"VertexLitGeneric\"\n{\n\t\"$basetexture\" \"models/props/crate_d\"\n}\n");
	WriteFile("game1/materials/models/props/crate_d.vtf", "VTF");

	auto resolver = CreateResolver(true);
	auto &copied = resolver.ResolveAndCopy({"models/props/crate", "materials/models/props/crate", "models/props/crate.vmt"});
	EXPECT_EQ(copied.size(), 2);
	EXPECT_EQ(resolver.GetLedger().processedShaders.size(), 1);
}

TEST_F(ShaderGraphResolverTest, PatchShaderPrecedence)
{
	WriteFile("game2/materials/models/base/base.vmt", "\"VertexLitGeneric\"\n{\n\t\"$basetexture\" \"models/base/base_d\"\n\t\"$bumpmap\" \"models/base/base_n\"\n\t\"$detail\" \"models/base/detail\"\n}\n");
	WriteFile("game2/materials/models/base/base_d.vtf", "base_d");
	WriteFile("game2/materials/models/base/base_n.vtf", "base_n");
	WriteFile("game2/materials/models/base/detail.vtf", "detail");
	WriteFile("game1/materials/models/hero/skin.vmt", R"("patch"
{
	"include" "materials/models/base/base.vmt"
	"insert"
	{
		"$detail" "models/hero/detail_insert"
		"$basetexture" "models/hero/insert_d"
	}
	"replace"
	{
		"$basetexture" "models/hero/skin_d"
	}
}
)");
	WriteFile("game1/materials/models/hero/skin_d.vtf", "skin_d");
	WriteFile("game1/materials/models/hero/insert_d.vtf", "insert_d");
	WriteFile("game1/materials/models/hero/detail_insert.vtf", "detail_insert");

	auto resolver = CreateResolver(true);
	std::shared_ptr<const ResolvedMaterial> material;
	ASSERT_EQ(resolver.Resolve("models/hero/skin", &material), ResolveResult::Success);
	ASSERT_NE(material, nullptr);
	EXPECT_EQ(material->textures.at(TextureKey::BaseTexture).relativePath, "models/hero/skin_d");
	EXPECT_EQ(material->textures.at(TextureKey::Detail).relativePath, "models/hero/detail_insert");
	EXPECT_EQ(material->textures.at(TextureKey::BumpMap).relativePath, "models/base/base_n");

	EXPECT_TRUE(Exists("out/materials/models/hero/skin.vmt"));
	EXPECT_TRUE(Exists("out/materials/models/hero/shared/base.vmt"));
	EXPECT_TRUE(Exists("out/materials/models/hero/skin_d.vtf"));
	EXPECT_TRUE(Exists("out/materials/models/hero/shared/base_n.vtf"));
	EXPECT_FALSE(Exists("out/materials/models/hero/shared/base_d.vtf"));

	auto patch = ReadFile("out/materials/models/hero/skin.vmt");
	EXPECT_TRUE(Contains(patch, "\"include\" \"materials/models/hero/shared/base.vmt\""));
	// The inserted $basetexture is overridden by the replace block
	EXPECT_FALSE(Contains(patch, "models/hero/insert_d"));
	EXPECT_TRUE(Contains(patch, "\"$detail\" \"models/hero/detail_insert\""));
	EXPECT_TRUE(Contains(patch, "\"$basetexture\" \"models/hero/skin_d\""));
	EXPECT_FALSE(Exists("out/materials/models/hero/insert_d.vtf"));
	auto base = ReadFile("out/materials/models/hero/shared/base.vmt");
	EXPECT_TRUE(Contains(base, "\"$bumpmap\" \"models/hero/shared/base_n\""));
}

TEST_F(ShaderGraphResolverTest, SelfIncludingPatchTerminates)
{
	WriteFile("game1/materials/models/loop.vmt", "\"patch\"\n{\n\t\"include\" \"materials/models/loop.vmt\"\n}\n");
	auto resolver = CreateResolver(true);
	EXPECT_EQ(resolver.Resolve("models/loop"), ResolveResult::Success);
	EXPECT_EQ(resolver.GetLedger().processedShaders.size(), 1);
}

TEST_F(ShaderGraphResolverTest, TexturesWithSameNameGetDistinctDestinations)
{
	WriteFile("game1/materials/models/a/first.vmt", "\"UnlitGeneric\"\n{\n\t\"$basetexture\" \"models/x/tex\"\n}\n");
	WriteFile("game1/materials/models/a/second.vmt", "\"UnlitGeneric\"\n{\n\t\"$basetexture\" \"models/y/tex\"\n}\n");
	WriteFile("game1/materials/models/x/tex.vtf", "x");
	WriteFile("game1/materials/models/y/tex.vtf", "y");

	auto resolver = CreateResolver(true);
	resolver.ResolveAndCopy({"models/a/first", "models/a/second"});
	EXPECT_EQ(ReadFile("out/materials/models/a/shared/tex.vtf"), "x");
	EXPECT_EQ(ReadFile("out/materials/models/a/shared/models/y/tex.vtf"), "y");
	EXPECT_TRUE(m_log.Contains("already occupied"));

	auto first = ReadFile("out/materials/models/a/first.vmt");
	EXPECT_TRUE(Contains(first, "\"$basetexture\" \"models/a/shared/tex\""));
	auto second = ReadFile("out/materials/models/a/second.vmt");
	EXPECT_TRUE(Contains(second, "\"$basetexture\" \"models/a/shared/models/y/tex\""));
	EXPECT_FALSE(Contains(second, "\"models/a/shared/tex\""));

	// Referencing the same texture again reuses its destination
	WriteFile("game1/materials/models/a/third.vmt", "\"UnlitGeneric\"\n{\n\t\"$basetexture\" \"models/y/tex\"\n}\n");
	resolver.Resolve("models/a/third");
	EXPECT_TRUE(Contains(ReadFile("out/materials/models/a/third.vmt"), "\"$basetexture\" \"models/a/shared/models/y/tex\""));
	EXPECT_EQ(m_log.Count(LogSeverity::Warning), 1);
}

TEST_F(ShaderGraphResolverTest, ShaderInSharedFolderKeepsTexturesBesideIt)
{
	WriteFile("game1/materials/models/a/shared/skin.vmt", "\"VertexLitGeneric\"\n{\n\t\"$basetexture\" \"models/x/tex\"\n}\n");
	WriteFile("game1/materials/models/x/tex.vtf", "x");

	auto resolver = CreateResolver(true);
	ASSERT_EQ(resolver.Resolve("models/a/shared/skin"), ResolveResult::Success);
	EXPECT_EQ(ReadFile("out/materials/models/a/shared/tex.vtf"), "x");
	EXPECT_FALSE(Exists("out/materials/models/a/shared/shared/tex.vtf"));
	EXPECT_TRUE(Contains(ReadFile("out/materials/models/a/shared/skin.vmt"), "\"$basetexture\" \"models/a/shared/tex\""));
}

TEST_F(ShaderGraphResolverTest, ResolveAndCopyFunction)
{
	WriteFile("game1/materials/models/a.vmt", "\"UnlitGeneric\"\n{\n}\n");
	auto copied = resolve_and_copy({"models/a", "models/b"}, {Path("game1")}, Path("out"), true);
	ASSERT_EQ(copied.size(), 1);
	EXPECT_TRUE(Exists("out/materials/models/a.vmt"));
}
