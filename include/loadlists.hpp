#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Plugin load lists and INI files where NV:MP leaves lines behind
namespace LoadLists {
    extern const std::vector<std::string> TARGET_FILENAMES;
    // Appended to the file name while a cleaned copy is written
    extern const char* TEMP_SUFFIX;

    struct TextEditResult {
        std::filesystem::path path;
        size_t lines_removed = 0;
        bool edited = false;
        std::filesystem::path backup_path;
        std::string error;
    };

    std::vector<std::filesystem::path> FindTargets(const std::vector<std::filesystem::path>& roots);

    // Lines matching the NV:MP signature, in file order
    std::vector<std::string> MatchingLines(const std::string& content);

    // Removes matching lines. With a backup directory the original is copied
    // to <backup_dir>/_edited/... first and the edit is skipped if that copy
    // can't be confirmed. A dry run only counts lines.
    TextEditResult Strip(const std::filesystem::path& path, const std::optional<std::filesystem::path>& backup_dir, bool dry_run);
}
