#include "paths.hpp"
#include "errors.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

#ifdef _WIN32
#include <Windows.h>
#include <ShlObj_core.h>
#include <knownfolders.h>
#include <shtypes.h>
#endif

std::filesystem::path Paths::RootDirectory;
std::filesystem::path Paths::LogFile;
std::filesystem::path Paths::ConfigFile;

std::filesystem::path Paths::HomeDirectory() {
#ifdef _WIN32
    if (const char* profile = std::getenv("USERPROFILE"); profile != nullptr && *profile)
        return profile;
#else
    if (const char* home = std::getenv("HOME"); home != nullptr && *home)
        return home;
#endif
    return {};
}

void Paths::InitPaths() {
#ifdef _WIN32
    PWSTR local_app_data;

    if (SUCCEEDED(SHGetKnownFolderPath(FOLDERID_LocalAppData, NULL, NULL, &local_app_data))) {
        RootDirectory = std::filesystem::path(local_app_data) / "nvmp-remover";
        CoTaskMemFree(local_app_data);
    } else {
        throw NotFoundError("Failed to find local appdata path");
    }
#else
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg != nullptr && *xdg) {
        RootDirectory = std::filesystem::path(xdg) / "nvmp-remover";
    } else {
        auto home = HomeDirectory();
        if (home.empty())
            throw NotFoundError("Failed to find home directory (HOME is not set)");
        RootDirectory = home / ".local" / "share" / "nvmp-remover";
    }
#endif
    LogFile = RootDirectory / "latest.log";
    ConfigFile = RootDirectory / "config.json";

    // Create directories
    std::error_code ec;
    std::filesystem::create_directories(RootDirectory, ec);
    if (ec)
        throw IOError("Failed to create data directory", RootDirectory, ec);
}
