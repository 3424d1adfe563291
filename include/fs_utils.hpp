#pragma once

#include <cstddef>
#include <filesystem>
#include <system_error>
#include <vector>

namespace FsUtils {
    // Does not follow symlinks, so a dangling link still counts as present
    bool Exists(const std::filesystem::path& path);

    // Copies a file, symlink or directory tree to `to`, overwriting existing
    // copies and creating missing parents. Returns the first error.
    std::error_code CopyEntry(const std::filesystem::path& from, const std::filesystem::path& to);

    // Regular files under `root` (or `root` itself), relative to `root`
    std::vector<std::filesystem::path> ListFilesRecursive(const std::filesystem::path& root, std::error_code& ec);

    // Removes a file or directory tree. `removed` counts deleted file system objects.
    std::error_code RemoveEntry(const std::filesystem::path& path, std::size_t& removed);

    // Turns an absolute path into something that can live below another directory
    std::filesystem::path SanitizeForBackup(const std::filesystem::path& path);
}
