#include <gtest/gtest.h>

#include "pack/component_registry.hpp"
#include "testing.hpp"

#include <nlohmann/json.hpp>

namespace packsmith {
namespace {

const char* kRegistry = R"({
  "nx-themes": {
    "name": "NXThemes Installer",
    "category": "Homebrew",
    "repo": "exelix11/SwitchThemeInjector",
    "asset_pattern": "NXThemesInstaller*.nro",
    "processing_steps": [
      {"action": "copy_to_derived_folder", "target_path": "/switch"}
    ],
    "asset_info": {
      "version": "v2.7.1",
      "download_url": "https://example.invalid/NXThemesInstaller.nro",
      "filename": "NXThemesInstaller.nro"
    },
    "maintainer_note": "kept verbatim"
  },
  "hekate-ipl": {
    "source_type": "direct_url",
    "url": "https://example.invalid/hekate_ipl.ini",
    "processing_steps": [
      {"action": "copy_file", "target_path": "/bootloader"}
    ]
  },
  "atmosphere": {
    "repo": "Atmosphere-NX/Atmosphere",
    "asset_pattern": "atmosphere-*.zip",
    "pinned_version": "1.7.1"
  }
})";

TEST(ComponentRegistryTest, LoadsDefinitionsInFileOrderWithDefaults) {
    ComponentRegistry reg;
    auto res = ComponentRegistry::LoadJson(nlohmann::ordered_json::parse(kRegistry), reg);
    ASSERT_TRUE(res.is_ok()) << res.msg;

    ASSERT_EQ(reg.All().size(), 3u);
    EXPECT_EQ(reg.All()[0].id, "nx-themes");
    EXPECT_EQ(reg.All()[1].id, "hekate-ipl");
    EXPECT_EQ(reg.All()[2].id, "atmosphere");

    const auto* themes = reg.Find("nx-themes");
    ASSERT_NE(themes, nullptr);
    EXPECT_EQ(themes->name, "NXThemes Installer");
    EXPECT_EQ(themes->category, "Homebrew");
    const auto& rel = std::get<ReleaseSource>(themes->source);
    EXPECT_EQ(rel.owner, "exelix11");
    EXPECT_EQ(rel.repo, "SwitchThemeInjector");
    ASSERT_TRUE(themes->resolved.has_value());
    EXPECT_EQ(themes->resolved->version, "v2.7.1");

    const auto* hekate = reg.Find("hekate-ipl");
    ASSERT_NE(hekate, nullptr);
    EXPECT_EQ(hekate->name, "hekate-ipl");
    EXPECT_EQ(hekate->category, "Uncategorized");
    EXPECT_EQ(std::get<DirectSource>(hekate->source).url, "https://example.invalid/hekate_ipl.ini");
    EXPECT_FALSE(hekate->resolved.has_value());
    ASSERT_EQ(hekate->steps.size(), 1u);
    EXPECT_EQ(StepActionName(hekate->steps[0]), "copy_single_file");

    const auto* ams = reg.Find("atmosphere");
    ASSERT_NE(ams, nullptr);
    EXPECT_EQ(ams->pinned_version, "1.7.1");
    ASSERT_EQ(ams->steps.size(), 1u);
    EXPECT_EQ(StepActionName(ams->steps[0]), "extract_all_to_root");

    EXPECT_EQ(reg.Find("missing"), nullptr);
}

TEST(ComponentRegistryTest, InvalidDefinitionFailsTheLoad) {
    ComponentRegistry reg;

    auto res = ComponentRegistry::LoadJson(nlohmann::ordered_json::parse(R"({
        "bad": {"repo": "no-slash", "asset_pattern": "*.zip"}
    })"), reg);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::DefinitionInvalid);
    EXPECT_NE(res.msg.find("bad"), std::string::npos);

    res = ComponentRegistry::LoadJson(nlohmann::ordered_json::parse(R"({
        "tool": {"repo": "a/b", "asset_pattern": "*.zip",
                 "processing_steps": [{"action": "chmod", "path": "/x"}]}
    })"), reg);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::UnsupportedAction);

    res = ComponentRegistry::LoadJson(nlohmann::ordered_json::parse(R"({
        "has space": {"url": "https://example.invalid/x.zip"}
    })"), reg);
    EXPECT_EQ(res.kind, ErrorKind::DefinitionInvalid);

    res = ComponentRegistry::LoadJson(nlohmann::ordered_json::parse(R"({
        "tool": {"repo": "a/b"}
    })"), reg);
    EXPECT_EQ(res.kind, ErrorKind::DefinitionInvalid);
}

TEST(ComponentRegistryTest, AssetPatternsGiveEachAssetItsOwnSteps) {
    ComponentRegistry reg;
    auto res = ComponentRegistry::LoadJson(nlohmann::ordered_json::parse(R"({
        "atmosphere": {
            "repo": "Atmosphere-NX/Atmosphere",
            "asset_patterns": [
                {"pattern": "atmosphere-*.zip"},
                {"pattern": "fusee.bin",
                 "processing_steps": [{"action": "copy_single_file", "target_path": "/bootloader/payloads"}]}
            ]
        }
    })"), reg);
    ASSERT_TRUE(res.is_ok()) << res.msg;

    const auto* ams = reg.Find("atmosphere");
    ASSERT_NE(ams, nullptr);
    EXPECT_EQ(std::get<ReleaseSource>(ams->source).asset_pattern, "atmosphere-*.zip");

    const auto recipes = AssetRecipes(*ams);
    ASSERT_EQ(recipes.size(), 2u);
    EXPECT_EQ(recipes[0].pattern, "atmosphere-*.zip");
    ASSERT_EQ(recipes[0].steps.size(), 1u);
    EXPECT_EQ(StepActionName(recipes[0].steps[0]), "extract_all_to_root");
    EXPECT_EQ(recipes[1].pattern, "fusee.bin");
    ASSERT_EQ(recipes[1].steps.size(), 1u);
    EXPECT_EQ(StepActionName(recipes[1].steps[0]), "copy_single_file");

    res = ComponentRegistry::LoadJson(nlohmann::ordered_json::parse(R"({
        "tool": {"url": "https://example.invalid/x.zip", "asset_patterns": [{"pattern": "*.zip"}]}
    })"), reg);
    EXPECT_EQ(res.kind, ErrorKind::DefinitionInvalid);

    res = ComponentRegistry::LoadJson(nlohmann::ordered_json::parse(R"({
        "tool": {"repo": "a/b", "asset_patterns": [{"processing_steps": []}]}
    })"), reg);
    EXPECT_EQ(res.kind, ErrorKind::DefinitionInvalid);
}

TEST(ComponentRegistryTest, SingleAssetComponentHasOneRecipe) {
    ComponentRegistry reg;
    ASSERT_TRUE(ComponentRegistry::LoadJson(nlohmann::ordered_json::parse(kRegistry), reg).is_ok());
    const auto recipes = AssetRecipes(*reg.Find("nx-themes"));
    ASSERT_EQ(recipes.size(), 1u);
    EXPECT_EQ(recipes[0].pattern, "NXThemesInstaller*.nro");
    EXPECT_EQ(StepActionName(recipes[0].steps[0]), "copy_to_derived_folder");
}

TEST(ComponentRegistryTest, SavePreservesUnknownKeysAndUpdatesCache) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Path() + "/components.json";
    ASSERT_TRUE(testutil::WriteTextFile(path, kRegistry));

    ComponentRegistry reg;
    auto res = ComponentRegistry::LoadFile(path, reg);
    ASSERT_TRUE(res.is_ok()) << res.msg;

    reg.UpdateResolved("atmosphere", ResolvedAsset{"https://example.invalid/atmosphere-1.7.1.zip", "1.7.1",
                                                   "atmosphere-1.7.1.zip"});
    res = reg.SaveFile(path);
    ASSERT_TRUE(res.is_ok()) << res.msg;

    const auto saved = nlohmann::ordered_json::parse(testutil::ReadFile(path));
    EXPECT_EQ(saved.begin().key(), "nx-themes");
    EXPECT_EQ(saved["nx-themes"]["maintainer_note"], "kept verbatim");
    EXPECT_EQ(saved["hekate-ipl"]["processing_steps"][0]["action"], "copy_file");
    EXPECT_EQ(saved["atmosphere"]["asset_info"]["filename"], "atmosphere-1.7.1.zip");

    ComponentRegistry reloaded;
    res = ComponentRegistry::LoadFile(path, reloaded);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    ASSERT_TRUE(reloaded.Find("atmosphere")->resolved.has_value());
    EXPECT_EQ(reloaded.Find("atmosphere")->resolved->version, "1.7.1");
}

TEST(ComponentRegistryTest, MalformedFileIsDefinitionInvalid) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Path() + "/components.json";
    ASSERT_TRUE(testutil::WriteTextFile(path, "{ not json"));

    ComponentRegistry reg;
    auto res = ComponentRegistry::LoadFile(path, reg);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::DefinitionInvalid);
}

} // namespace
} // namespace packsmith
