#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace Game {
    extern const char* EXECUTABLE_NAME;
    extern const char* FOLDER_NAME;
    extern const char* STEAM_APP_ID;

    // Library paths listed in a Steam libraryfolders.vdf
    std::vector<std::filesystem::path> ParseLibraryFolders(const std::string& vdf);

    std::vector<std::filesystem::path> DetectFromRegistry();
    std::vector<std::filesystem::path> DetectFromSteamLibraries();
    std::vector<std::filesystem::path> DetectCommonLocations();

    // Existing candidate game directories, most specific source first, without duplicates
    std::vector<std::filesystem::path> DefaultInstallRoots();

    // Existing per-user directories holding the game's INI files and load lists
    std::vector<std::filesystem::path> UserDataDirectories();

    // "Mod Organizer 2" folders next to the game directory or one level up
    std::vector<std::filesystem::path> DetectModOrganizerDirectories(const std::filesystem::path& game_directory);
    // Vortex mod staging folders under %APPDATA%\Vortex
    std::vector<std::filesystem::path> DetectVortexDirectories();

    bool LooksLikeGameDirectory(const std::filesystem::path& path);
}
