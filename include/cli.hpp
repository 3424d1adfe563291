#pragma once

#include "config.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Cli {
    struct Arguments {
        bool show_help = false;
        bool assume_yes = false;
        bool save_config = false;
        std::optional<std::filesystem::path> config_path;
    };

    // Only looks for --config, so the file can be loaded before the other options override it
    std::optional<std::filesystem::path> FindConfigPath(const std::vector<std::string>& args);

    // Applies the options to `config`. Throws ConfigError on unknown options or bad values.
    Arguments Parse(const std::vector<std::string>& args, Config& config);

    std::string Usage(const std::string& program);
}
