#pragma once

#include <cstddef>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <vector>

// Files and directories that belong to NV:MP, relative to the game directory.
// The default list is fixed at build time; Scan() can extend it with entries
// found by name signature.
class Manifest {
public:
    struct Entry {
        std::filesystem::path relative_path;
        bool from_scan = false;
    };

    static constexpr size_t DEFAULT_MAX_MATCHES = 10000;

    Manifest() = default;
    Manifest(std::initializer_list<std::string> entries);

    static Manifest Default();
    static bool IsSignatureMatch(const std::string& name);

    // Throws ConfigError for absolute paths or paths escaping the root.
    // Entries covered by an existing directory entry are dropped, entries
    // covered by the new one are replaced by it.
    void Add(const std::filesystem::path& relative_path, bool from_scan = false);

    // Returns the number of entries added. A hit that differs from an entry
    // only by case replaces it when the entry's own spelling is missing on disk.
    size_t Scan(const std::filesystem::path& root, size_t max_matches = DEFAULT_MAX_MATCHES);

    bool AnyPresent(const std::filesystem::path& root) const;

    const std::vector<Entry>& Entries() const { return entries; }
    size_t Size() const { return entries.size(); }
    bool Empty() const { return entries.empty(); }
private:
    std::vector<Entry> entries;

    bool MergeScanHit(const std::filesystem::path& root, const std::filesystem::path& hit);
};
