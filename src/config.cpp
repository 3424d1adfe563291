#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <fstream>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
    template<typename T>
    void Read(const json& j, const char* key, T& out) {
        if (!j.contains(key) || j[key].is_null()) return;
        try {
            out = j[key].get<T>();
        } catch (const json::exception& ex) {
            throw ConfigError(std::format("Config value \"{}\" has the wrong type: {}", key, ex.what()));
        }
    }
}

Config::Config() {
    ResetToDefaults();
}

Config* Config::GetInstance() {
    static Config config;
    return &config;
}

void Config::ResetToDefaults() {
    this->game_directory = "";
    this->do_backup = false;
    this->backup_destination = "";
    this->timestamped_backup = false;
    this->dry_run = false;
    this->scan_signatures = true;
    this->clean_load_lists = true;
    this->max_matches = Manifest::DEFAULT_MAX_MATCHES;
    this->mo2_directory = "";
    this->vortex_directory = "";
    this->debug_mode = false;
}

void Config::Load(const std::filesystem::path& path) {
    std::ifstream stream(path);
    if (!stream.is_open()) {
        Log::Debug("Config::Load", "No config at {}. Using defaults", path.string());
        return;
    }

    json j;
    try {
        j = json::parse(stream);
    } catch (const json::parse_error& ex) {
        Log::Error("Config::Load", "Failed to parse config ({}). Using defaults", ex.what());
        return;
    }
    if (!j.is_object()) {
        Log::Error("Config::Load", "Config root is not an object. Using defaults");
        return;
    }

    Read(j, "game_directory", this->game_directory);
    Read(j, "do_backup", this->do_backup);
    Read(j, "backup_destination", this->backup_destination);
    Read(j, "timestamped_backup", this->timestamped_backup);
    Read(j, "dry_run", this->dry_run);
    Read(j, "scan_signatures", this->scan_signatures);
    Read(j, "clean_load_lists", this->clean_load_lists);
    Read(j, "max_matches", this->max_matches);
    Read(j, "mo2_directory", this->mo2_directory);
    Read(j, "vortex_directory", this->vortex_directory);
    Read(j, "debug_mode", this->debug_mode);
}

void Config::Save(const std::filesystem::path& path) {
    std::ofstream stream(path);

    json j;
    j["game_directory"] = this->game_directory;
    j["do_backup"] = this->do_backup;
    j["backup_destination"] = this->backup_destination;
    j["timestamped_backup"] = this->timestamped_backup;
    j["dry_run"] = this->dry_run;
    j["scan_signatures"] = this->scan_signatures;
    j["clean_load_lists"] = this->clean_load_lists;
    j["max_matches"] = this->max_matches;
    j["mo2_directory"] = this->mo2_directory;
    j["vortex_directory"] = this->vortex_directory;
    j["debug_mode"] = this->debug_mode;

    std::string s = j.dump(4);
    stream.write(s.data(), s.size());
    if (!stream) {
        throw IOError("Failed to write config", path, std::make_error_code(std::errc::io_error));
    }
}

void Config::Validate() const {
    ToOptions().Validate();
}

RunOptions Config::ToOptions() const {
    RunOptions options;
    options.do_backup = this->do_backup;
    options.backup_destination = this->backup_destination;
    options.dry_run = this->dry_run;
    if (!this->game_directory.empty())
        options.game_directory = std::filesystem::path(this->game_directory);
    options.timestamped_backup = this->timestamped_backup;
    options.scan_signatures = this->scan_signatures;
    options.clean_load_lists = this->clean_load_lists;
    options.max_matches = this->max_matches;
    if (!this->mo2_directory.empty())
        options.mo2_directory = std::filesystem::path(this->mo2_directory);
    if (!this->vortex_directory.empty())
        options.vortex_directory = std::filesystem::path(this->vortex_directory);
    return options;
}
