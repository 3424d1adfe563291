#include "errors.hpp"
#include "fs_utils.hpp"
#include "manifest.hpp"
#include "strings.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <gtest/gtest.h>

namespace fs = std::filesystem;
using TestHelpers::TempDir;
using TestHelpers::WriteFile;

namespace {
    std::vector<std::string> Paths(const Manifest& manifest) {
        std::vector<std::string> out;
        for (const auto& entry : manifest.Entries()) {
            out.emplace_back(entry.relative_path.generic_string());
        }
        return out;
    }
}

TEST(ManifestTest, DefaultListsKnownFiles) {
    auto paths = Paths(Manifest::Default());
    EXPECT_NE(std::find(paths.begin(), paths.end(), "nvmp_launcher.exe"), paths.end());
    EXPECT_NE(std::find(paths.begin(), paths.end(), "nvmp_storyserver.exe"), paths.end());
    EXPECT_NE(std::find(paths.begin(), paths.end(), "Data/nvse/plugins/nvmp"), paths.end());
    for (const auto& entry : Manifest::Default().Entries()) {
        EXPECT_FALSE(entry.from_scan);
    }
}

TEST(ManifestTest, SignatureMatchesNvmpNames) {
    EXPECT_TRUE(Manifest::IsSignatureMatch("nvmp_launcher.exe"));
    EXPECT_TRUE(Manifest::IsSignatureMatch("NVMP_Launcher_Last_Error.log"));
    EXPECT_TRUE(Manifest::IsSignatureMatch("NVMP.dll"));
    EXPECT_TRUE(Manifest::IsSignatureMatch("NewVegasMP.esp"));
    EXPECT_TRUE(Manifest::IsSignatureMatch("New Vegas MP"));
    EXPECT_TRUE(Manifest::IsSignatureMatch("New Vegas Multiplayer"));
}

TEST(ManifestTest, SignatureLeavesOtherModsAlone) {
    EXPECT_FALSE(Manifest::IsSignatureMatch("Caravan.esp"));
    EXPECT_FALSE(Manifest::IsSignatureMatch("nvse_loader.exe"));
    EXPECT_FALSE(Manifest::IsSignatureMatch("nvmpx.dll"));
    EXPECT_FALSE(Manifest::IsSignatureMatch("FalloutNV.esm"));
}

TEST(ManifestTest, RejectsPathsOutsideTheInstallation) {
    Manifest manifest;
    EXPECT_THROW(manifest.Add("/etc/passwd"), ConfigError);
    EXPECT_THROW(manifest.Add("../outside.dll"), ConfigError);
    EXPECT_THROW(manifest.Add("mods/../../outside.dll"), ConfigError);
    EXPECT_THROW(manifest.Add(""), ConfigError);
    EXPECT_TRUE(manifest.Empty());
}

TEST(ManifestTest, KeepsOrderAndNormalizes) {
    Manifest manifest { "mods/nvmp/client.dll", "./mods/nvmp/config.ini" };
    EXPECT_EQ(Paths(manifest), (std::vector<std::string> { "mods/nvmp/client.dll", "mods/nvmp/config.ini" }));
}

TEST(ManifestTest, CollapsesEntriesCoveredByADirectory) {
    Manifest child_first { "mods/nvmp/client.dll", "mods/nvmp/config.ini", "mods/nvmp" };
    EXPECT_EQ(Paths(child_first), (std::vector<std::string> { "mods/nvmp" }));

    Manifest parent_first { "NVMP", "nvmp/client.dll" };
    EXPECT_EQ(Paths(parent_first), (std::vector<std::string> { "NVMP" }));

    Manifest siblings { "mods/nvmp", "mods/nvmp2" };
    EXPECT_EQ(siblings.Size(), 2u);
}

TEST(ManifestTest, ScanFindsSignatureMatches) {
    TempDir root;
    WriteFile(root / "nvmp_launcher.exe", "exe");
    WriteFile(root / "Data/NVMP/nvmp_core.dll", "core");
    WriteFile(root / "Data/NVMP/assets.bsa", "bsa");
    WriteFile(root / "Data/nvse/plugins/nvmp_client.dll", "client");
    WriteFile(root / "Data/Caravan.esp", "caravan");
    WriteFile(root / "FalloutNV.exe", "game");

    Manifest manifest;
    EXPECT_EQ(manifest.Scan(root.Path()), 3u);
    EXPECT_EQ(Paths(manifest), (std::vector<std::string> {
        "Data/NVMP",
        "Data/nvse/plugins/nvmp_client.dll",
        "nvmp_launcher.exe"
    }));
    for (const auto& entry : manifest.Entries()) {
        EXPECT_TRUE(entry.from_scan);
    }
}

TEST(ManifestTest, ScanDoesNotDuplicateFixedEntries) {
    TempDir root;
    WriteFile(root / "nvmp_launcher.exe", "exe");
    WriteFile(root / "nvmp.log", "log");

    auto manifest = Manifest::Default();
    auto size = manifest.Size();
    EXPECT_EQ(manifest.Scan(root.Path()), 0u);
    EXPECT_EQ(manifest.Size(), size);
}

TEST(ManifestTest, ScanStopsAtMaxMatches) {
    TempDir root;
    WriteFile(root / "nvmp_a.dll", "a");
    WriteFile(root / "nvmp_b.dll", "b");
    WriteFile(root / "nvmp_c.dll", "c");

    Manifest manifest;
    EXPECT_EQ(manifest.Scan(root.Path(), 1), 1u);
    EXPECT_EQ(manifest.Size(), 1u);
}

TEST(ManifestTest, ScanOfMissingRootFindsNothing) {
    TempDir root;
    Manifest manifest;
    EXPECT_EQ(manifest.Scan(root / "does-not-exist"), 0u);
    EXPECT_TRUE(manifest.Empty());
}

TEST(ManifestTest, AnyPresent) {
    TempDir root;
    Manifest manifest { "mods/nvmp/client.dll", "mods/nvmp/config.ini" };
    EXPECT_FALSE(manifest.AnyPresent(root.Path()));

    WriteFile(root / "mods/nvmp/config.ini", "[nvmp]");
    EXPECT_TRUE(manifest.AnyPresent(root.Path()));
}

TEST(ManifestTest, ScanKeepsOnDiskSpellingOfKnownEntries) {
    TempDir root;
    WriteFile(root / "Data/NVSE/Plugins/nvmp/nvmp.dll", "plugin");

    auto manifest = Manifest::Default();
    auto size = manifest.Size();
    manifest.Scan(root.Path());

    EXPECT_EQ(manifest.Size(), size);
    auto plugin = std::find_if(manifest.Entries().begin(), manifest.Entries().end(), [](const Manifest::Entry& entry) {
        return Strings::ToLower(entry.relative_path.generic_string()) == "data/nvse/plugins/nvmp";
    });
    ASSERT_NE(plugin, manifest.Entries().end());
    EXPECT_TRUE(FsUtils::Exists(root / plugin->relative_path));
    EXPECT_TRUE(manifest.AnyPresent(root.Path()));
}
