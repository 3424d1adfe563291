#pragma once

#include "uninstaller.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

class Config {
public:
    std::string game_directory;
    bool do_backup;
    std::string backup_destination;
    bool timestamped_backup;
    bool dry_run;
    bool scan_signatures;
    bool clean_load_lists;
    size_t max_matches;
    std::string mo2_directory;
    std::string vortex_directory;
    bool debug_mode;

    // A missing or unparsable file keeps the defaults; a value of the wrong type throws ConfigError
    void Load(const std::filesystem::path& path);
    void Save(const std::filesystem::path& path);
    void ResetToDefaults();

    // Throws ConfigError on an invalid combination
    void Validate() const;
    RunOptions ToOptions() const;

    static Config* GetInstance();
private:
    Config();
};
