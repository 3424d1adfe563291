#include "cli.hpp"
#include "errors.hpp"

#include <format>
#include <gtest/gtest.h>

class CliTest : public ::testing::Test {
protected:
    Config* config = Config::GetInstance();

    void SetUp() override {
        config->ResetToDefaults();
    }

    void TearDown() override {
        config->ResetToDefaults();
    }
};

TEST_F(CliTest, AppliesOptionsToConfig) {
    auto arguments = Cli::Parse({ "--game", "/games/FNV", "--backup-dir=/backups", "--dry-run", "--max-matches", "5", "--no-text", "-y" }, *config);

    EXPECT_TRUE(arguments.assume_yes);
    EXPECT_FALSE(arguments.show_help);
    EXPECT_EQ(config->game_directory, "/games/FNV");
    EXPECT_TRUE(config->do_backup);
    EXPECT_EQ(config->backup_destination, "/backups");
    EXPECT_TRUE(config->dry_run);
    EXPECT_EQ(config->max_matches, 5u);
    EXPECT_FALSE(config->clean_load_lists);
    EXPECT_TRUE(config->scan_signatures);
}

TEST_F(CliTest, ModManagerFolders) {
    Cli::Parse({ "--mo2", "/games/MO2", "--vortex=/vortex/mods" }, *config);
    EXPECT_EQ(config->mo2_directory, "/games/MO2");
    EXPECT_EQ(config->vortex_directory, "/vortex/mods");
    EXPECT_THROW(Cli::Parse({ "--mo2" }, *config), ConfigError);
}

TEST_F(CliTest, NoBackupOverridesEarlierBackup) {
    Cli::Parse({ "--backup-dir", "/backups", "--no-backup" }, *config);
    EXPECT_FALSE(config->do_backup);
}

TEST_F(CliTest, BackupWithoutDestinationFailsValidation) {
    Cli::Parse({ "--backup" }, *config);
    EXPECT_THROW(config->Validate(), ConfigError);
}

TEST_F(CliTest, RejectsBadInput) {
    EXPECT_THROW(Cli::Parse({ "--frobnicate" }, *config), ConfigError);
    EXPECT_THROW(Cli::Parse({ "--game" }, *config), ConfigError);
    EXPECT_THROW(Cli::Parse({ "--max-matches", "lots" }, *config), ConfigError);
    EXPECT_THROW(Cli::Parse({ "--max-matches=-1" }, *config), ConfigError);
}

TEST_F(CliTest, FindsConfigPath) {
    EXPECT_FALSE(Cli::FindConfigPath({ "--dry-run" }).has_value());
    EXPECT_EQ(Cli::FindConfigPath({ "--dry-run", "--config", "my.json" }), std::filesystem::path("my.json"));
    EXPECT_EQ(Cli::FindConfigPath({ "--config=other.json" }), std::filesystem::path("other.json"));
}

TEST_F(CliTest, HelpAndUsage) {
    EXPECT_TRUE(Cli::Parse({ "--help" }, *config).show_help);
    auto usage = Cli::Usage("nvmp-remover");
    EXPECT_NE(usage.find("--backup-dir"), std::string::npos);
    EXPECT_NE(usage.find("nvmp-remover"), std::string::npos);
    EXPECT_NE(usage.find(std::format("default {}", Manifest::DEFAULT_MAX_MATCHES)), std::string::npos);
}
