#include "config.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using TestHelpers::TempDir;
using TestHelpers::WriteFile;

class ConfigTest : public ::testing::Test {
protected:
    Config* config = Config::GetInstance();
    TempDir dir;

    void SetUp() override {
        config->ResetToDefaults();
    }

    void TearDown() override {
        config->ResetToDefaults();
    }
};

TEST_F(ConfigTest, MissingFileKeepsDefaults) {
    config->Load(dir / "config.json");
    EXPECT_FALSE(config->do_backup);
    EXPECT_TRUE(config->scan_signatures);
    EXPECT_TRUE(config->clean_load_lists);
    EXPECT_EQ(config->max_matches, Manifest::DEFAULT_MAX_MATCHES);
}

TEST_F(ConfigTest, UnparsableFileKeepsDefaults) {
    WriteFile(dir / "config.json", "{ not json");
    EXPECT_NO_THROW(config->Load(dir / "config.json"));
    EXPECT_FALSE(config->do_backup);
}

TEST_F(ConfigTest, LoadsPartialFile) {
    WriteFile(dir / "config.json", R"({ "do_backup": true, "backup_destination": "/backups", "max_matches": 50 })");
    config->Load(dir / "config.json");
    EXPECT_TRUE(config->do_backup);
    EXPECT_EQ(config->backup_destination, "/backups");
    EXPECT_EQ(config->max_matches, 50u);
    EXPECT_FALSE(config->dry_run);
}

TEST_F(ConfigTest, WrongTypeThrows) {
    WriteFile(dir / "config.json", R"({ "do_backup": "yes" })");
    EXPECT_THROW(config->Load(dir / "config.json"), ConfigError);
}

TEST_F(ConfigTest, SavedSettingsLoadBack) {
    config->game_directory = "/games/FNV";
    config->timestamped_backup = true;
    config->Save(dir / "config.json");

    config->ResetToDefaults();
    config->Load(dir / "config.json");
    EXPECT_EQ(config->game_directory, "/games/FNV");
    EXPECT_TRUE(config->timestamped_backup);
}

TEST_F(ConfigTest, ValidateRequiresBackupDestination) {
    config->do_backup = true;
    EXPECT_THROW(config->Validate(), ConfigError);

    config->backup_destination = "/backups";
    EXPECT_NO_THROW(config->Validate());

    config->max_matches = 0;
    EXPECT_THROW(config->Validate(), ConfigError);
}

TEST_F(ConfigTest, ToOptions) {
    auto options = config->ToOptions();
    EXPECT_FALSE(options.game_directory.has_value());
    EXPECT_FALSE(options.mo2_directory.has_value());
    EXPECT_FALSE(options.vortex_directory.has_value());

    config->game_directory = "/games/FNV";
    config->mo2_directory = "/games/Mod Organizer 2";
    config->dry_run = true;
    options = config->ToOptions();
    ASSERT_TRUE(options.game_directory.has_value());
    EXPECT_EQ(*options.game_directory, std::filesystem::path("/games/FNV"));
    ASSERT_TRUE(options.mo2_directory.has_value());
    EXPECT_EQ(*options.mo2_directory, std::filesystem::path("/games/Mod Organizer 2"));
    EXPECT_TRUE(options.dry_run);
    EXPECT_TRUE(options.backup_stamp.empty());
}
