#include "game.hpp"
#include "fs_utils.hpp"
#include "log.hpp"
#include "paths.hpp"
#include "strings.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <regex>
#include <set>
#include <string>
#include <system_error>

#ifdef _WIN32
#include "winhelpers.hpp"
#endif

namespace fs = std::filesystem;

namespace Game {
    const char* EXECUTABLE_NAME = "FalloutNV.exe";
    const char* FOLDER_NAME = "Fallout New Vegas";
    const char* STEAM_APP_ID = "22380";

    namespace {
        std::string GetEnv(const char* name) {
            const char* value = std::getenv(name);
            return value != nullptr ? std::string(value) : std::string();
        }

        bool IsDirectory(const fs::path& path) {
            std::error_code ec;
            return fs::is_directory(path, ec);
        }

        // Steam installations known on this platform
        std::vector<fs::path> SteamRoots() {
            std::vector<fs::path> roots;
#ifdef _WIN32
            if (auto pf86 = GetEnv("ProgramFiles(x86)"); !pf86.empty())
                roots.emplace_back(fs::path(pf86) / "Steam");
            if (auto pf = GetEnv("ProgramFiles"); !pf.empty())
                roots.emplace_back(fs::path(pf) / "Steam");
#else
            auto home = Paths::HomeDirectory();
            if (!home.empty()) {
                roots.emplace_back(home / ".steam" / "steam");
                roots.emplace_back(home / ".local" / "share" / "Steam");
                roots.emplace_back(home / ".var" / "app" / "com.valvesoftware.Steam" / ".local" / "share" / "Steam");
            }
#endif
            return roots;
        }

        // Steam libraries: every Steam root plus the libraries its libraryfolders.vdf lists
        std::vector<fs::path> SteamLibraries() {
            std::vector<fs::path> libraries;
            for (const auto& root : SteamRoots()) {
                if (!IsDirectory(root)) continue;
                libraries.emplace_back(root);

                auto vdf_path = root / "steamapps" / "libraryfolders.vdf";
                std::ifstream stream(vdf_path);
                if (!stream.is_open()) continue;

                std::string text {
                    std::istreambuf_iterator<char>(stream),
                    std::istreambuf_iterator<char>()
                };
                for (auto& library : ParseLibraryFolders(text)) {
                    libraries.emplace_back(std::move(library));
                }
            }
            return libraries;
        }

        void AppendUnique(std::vector<fs::path>& out, std::set<std::string>& seen, const fs::path& candidate) {
            if (!IsDirectory(candidate)) return;

            std::error_code ec;
            auto canonical = fs::weakly_canonical(candidate, ec);
            if (ec) canonical = candidate;

            if (seen.insert(Strings::ToLower(canonical.generic_string())).second)
                out.emplace_back(canonical);
        }
    }

    std::vector<fs::path> ParseLibraryFolders(const std::string& vdf) {
        static const std::regex path_pattern(R"rx("\s*path\s*"\s*"([^"]+)")rx", std::regex::icase);

        std::vector<fs::path> libraries;
        for (auto it = std::sregex_iterator(vdf.begin(), vdf.end(), path_pattern); it != std::sregex_iterator(); ++it) {
            std::string raw = (*it)[1].str();

            // VDF escapes backslashes
            std::string unescaped;
            for (size_t i = 0; i < raw.size(); i++) {
                if (raw[i] == '\\' && i + 1 < raw.size() && raw[i + 1] == '\\') i++;
                unescaped.push_back(raw[i]);
            }
            libraries.emplace_back(unescaped);
        }
        return libraries;
    }

    std::vector<fs::path> DetectFromRegistry() {
        std::vector<fs::path> found;
#ifdef _WIN32
        const wchar_t* keys[] = {
            L"SOFTWARE\\WOW6432Node\\Bethesda Softworks\\FalloutNV",
            L"SOFTWARE\\Bethesda Softworks\\FalloutNV"
        };
        for (const wchar_t* key : keys) {
            auto value = WinHelpers::ReadRegistryString(HKEY_LOCAL_MACHINE, key, L"Installed Path");
            if (!value) continue;

            fs::path path(*value);
            Log::Debug("Game::DetectFromRegistry", "Registry points to {}", path.string());
            if (IsDirectory(path))
                found.emplace_back(path);
        }
#endif
        return found;
    }

    std::vector<fs::path> DetectFromSteamLibraries() {
        std::vector<fs::path> found;
        for (const auto& library : SteamLibraries()) {
            auto candidate = library / "steamapps" / "common" / FOLDER_NAME;
            if (IsDirectory(candidate)) {
                Log::Debug("Game::DetectFromSteamLibraries", "Found game folder in Steam library {}", library.string());
                found.emplace_back(candidate);
            }
        }
        return found;
    }

    std::vector<fs::path> DetectCommonLocations() {
        std::vector<fs::path> candidates;
#ifdef _WIN32
        for (const char* variable : { "ProgramFiles(x86)", "ProgramFiles" }) {
            auto base = GetEnv(variable);
            if (base.empty()) continue;
            candidates.emplace_back(fs::path(base) / "Steam" / "steamapps" / "common" / FOLDER_NAME);
            candidates.emplace_back(fs::path(base) / "GOG Galaxy" / "Games" / FOLDER_NAME);
        }
#else
        auto home = Paths::HomeDirectory();
        if (!home.empty()) {
            candidates.emplace_back(home / "GOG Games" / FOLDER_NAME);
            candidates.emplace_back(home / "Games" / FOLDER_NAME);
        }
#endif

        std::vector<fs::path> found;
        for (const auto& candidate : candidates) {
            if (IsDirectory(candidate))
                found.emplace_back(candidate);
        }
        return found;
    }

    std::vector<fs::path> DefaultInstallRoots() {
        std::vector<fs::path> roots;
        std::set<std::string> seen;

        for (const auto& source : { DetectFromRegistry(), DetectFromSteamLibraries(), DetectCommonLocations() }) {
            for (const auto& candidate : source) {
                AppendUnique(roots, seen, candidate);
            }
        }

        Log::Debug("Game::DefaultInstallRoots", "{} candidate install root(s)", roots.size());
        return roots;
    }

    std::vector<fs::path> UserDataDirectories() {
        std::vector<fs::path> candidates;
#ifdef _WIN32
        if (auto profile = GetEnv("USERPROFILE"); !profile.empty()) {
            candidates.emplace_back(fs::path(profile) / "Documents" / "My Games" / "FalloutNV");
            candidates.emplace_back(fs::path(profile) / "Documents" / "My Games" / "Fallout New Vegas");
        }
        if (auto local = GetEnv("LOCALAPPDATA"); !local.empty()) {
            candidates.emplace_back(fs::path(local) / "FalloutNV");
            candidates.emplace_back(fs::path(local) / "Fallout New Vegas");
            candidates.emplace_back(fs::path(local) / "Bethesda Softworks" / "FalloutNV");
        }
#else
        // Proton prefix of the Steam release
        for (const auto& library : SteamLibraries()) {
            auto user = library / "steamapps" / "compatdata" / STEAM_APP_ID / "pfx" / "drive_c" / "users" / "steamuser";
            candidates.emplace_back(user / "Documents" / "My Games" / "FalloutNV");
            candidates.emplace_back(user / "AppData" / "Local" / "FalloutNV");
        }
#endif

        std::vector<fs::path> dirs;
        std::set<std::string> seen;
        for (const auto& candidate : candidates) {
            AppendUnique(dirs, seen, candidate);
        }
        return dirs;
    }

    std::vector<fs::path> DetectModOrganizerDirectories(const fs::path& game_directory) {
        std::vector<fs::path> found;
        std::set<std::string> seen;
        auto parent = game_directory.parent_path();
        for (const auto& base : { parent, parent.parent_path() }) {
            if (base.empty()) continue;
            AppendUnique(found, seen, base / "Mod Organizer 2");
        }
        for (const auto& dir : found) {
            Log::Debug("Game::DetectModOrganizerDirectories", "Found Mod Organizer 2 at {}", dir.string());
        }
        return found;
    }

    std::vector<fs::path> DetectVortexDirectories() {
        std::vector<fs::path> found;
        auto roaming = GetEnv("APPDATA");
        if (roaming.empty()) return found;

        std::set<std::string> seen;
        for (const char* game : { "falloutnv", "fallout new vegas" }) {
            AppendUnique(found, seen, fs::path(roaming) / "Vortex" / game / "mods");
        }
        return found;
    }

    bool LooksLikeGameDirectory(const fs::path& path) {
        return FsUtils::Exists(path / EXECUTABLE_NAME);
    }
}
