#include "manifest.hpp"
#include "errors.hpp"
#include "fs_utils.hpp"
#include "log.hpp"
#include "strings.hpp"

#include <algorithm>
#include <array>
#include <regex>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace {
    const std::array<const char*, 5> KNOWN_FILENAMES = {
        "nvmp_launcher.exe",
        "nvmp_start.exe",
        "nvmp_storyserver.exe",
        "nvmp.log",
        "nvmp_launcher_last_error.log"
    };

    // Kept conservative so other mods are never matched
    const std::vector<std::regex>& NamePatterns() {
        static const std::vector<std::regex> patterns = {
            std::regex(R"(\bnvmp\b)", std::regex::icase),
            std::regex(R"(nvmp_)", std::regex::icase),
            std::regex(R"(new\s*vegas\s*mp)", std::regex::icase),
            std::regex(R"(newvegasmp)", std::regex::icase),
            std::regex(R"(new\s*vegas\s*multiplayer)", std::regex::icase)
        };
        return patterns;
    }

    std::string Key(const fs::path& path) {
        return Strings::ToLower(path.generic_string());
    }

    // True if `child` is `parent` or lies below it
    bool IsCoveredBy(const fs::path& child, const fs::path& parent) {
        auto c = child.begin();
        for (auto p = parent.begin(); p != parent.end(); ++p, ++c) {
            if (c == child.end() || Strings::ToLower(c->string()) != Strings::ToLower(p->string()))
                return false;
        }
        return true;
    }
}

Manifest::Manifest(std::initializer_list<std::string> entries) {
    for (const auto& entry : entries) {
        Add(entry);
    }
}

Manifest Manifest::Default() {
    Manifest manifest;
    for (const char* name : KNOWN_FILENAMES) {
        manifest.Add(name);
    }
    manifest.Add("nvmp");
    manifest.Add("Data/nvse/plugins/nvmp");
    return manifest;
}

bool Manifest::IsSignatureMatch(const std::string& name) {
    auto lower = Strings::ToLower(name);
    for (const char* known : KNOWN_FILENAMES) {
        if (lower == known) return true;
    }
    return std::any_of(NamePatterns().begin(), NamePatterns().end(), [&](const std::regex& pattern) {
        return std::regex_search(name, pattern);
    });
}

void Manifest::Add(const fs::path& relative_path, bool from_scan) {
    auto normalized = relative_path.lexically_normal();
    if (normalized.empty() || normalized == ".")
        throw ConfigError("Manifest entry is empty");
    if (normalized.is_absolute() || normalized.has_root_name() || normalized.has_root_directory())
        throw ConfigError(std::format("Manifest entry {} must be relative", relative_path.string()));
    if (*normalized.begin() == "..")
        throw ConfigError(std::format("Manifest entry {} escapes the installation directory", relative_path.string()));

    // "nvmp/" normalizes to a path with an empty filename
    if (normalized.filename().empty())
        normalized = normalized.parent_path();

    for (const auto& entry : this->entries) {
        if (IsCoveredBy(normalized, entry.relative_path)) {
            Log::Debug("Manifest::Add", "{} is already covered by {}", normalized.generic_string(), entry.relative_path.generic_string());
            return;
        }
    }

    std::erase_if(this->entries, [&](const Entry& entry) {
        return IsCoveredBy(entry.relative_path, normalized);
    });
    this->entries.emplace_back(Entry {
        .relative_path = normalized,
        .from_scan = from_scan
    });
}

size_t Manifest::Scan(const fs::path& root, size_t max_matches) {
    std::vector<fs::path> matches;
    std::error_code ec;

    auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        Log::Warning("Manifest::Scan", "Cannot scan {}: {}", root.string(), ec.message());
        return 0;
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            Log::Warning("Manifest::Scan", "Error while scanning {}: {}", root.string(), ec.message());
            break;
        }

        const auto& entry = *it;
        if (!IsSignatureMatch(entry.path().filename().string()))
            continue;

        matches.emplace_back(entry.path().lexically_relative(root));

        // A matched directory is removed as a whole
        if (entry.is_directory(ec) && !entry.is_symlink(ec))
            it.disable_recursion_pending();

        if (matches.size() >= max_matches) {
            Log::Warning("Manifest::Scan", "Reached the limit of {} matches, stopping scan", max_matches);
            break;
        }
    }

    std::sort(matches.begin(), matches.end(), [](const fs::path& a, const fs::path& b) {
        return Key(a) < Key(b);
    });

    auto count_scanned = [this] {
        return std::count_if(this->entries.begin(), this->entries.end(), [](const Entry& e) { return e.from_scan; });
    };
    auto scanned_before = count_scanned();
    for (const auto& match : matches) {
        if (MergeScanHit(root, match))
            continue;
        Add(match, true);
        Log::Debug("Manifest::Scan", "Signature match: {}", match.generic_string());
    }
    return static_cast<size_t>(count_scanned() - scanned_before);
}

// Resolves a hit that an existing entry covers when compared case-insensitively.
// Returns false if no entry covers it.
bool Manifest::MergeScanHit(const fs::path& root, const fs::path& hit) {
    for (auto& entry : this->entries) {
        if (!IsCoveredBy(hit, entry.relative_path))
            continue;

        // The entry spelled the way it is on disk
        fs::path prefix;
        auto component = hit.begin();
        for (auto n = std::distance(entry.relative_path.begin(), entry.relative_path.end()); n > 0; --n, ++component) {
            prefix /= *component;
        }

        if (prefix == entry.relative_path)
            return true;

        if (!FsUtils::Exists(root / entry.relative_path)) {
            Log::Debug("Manifest::Scan", "Using on-disk spelling {} for {}", prefix.generic_string(), entry.relative_path.generic_string());
            entry.relative_path = prefix;
            return true;
        }

        std::error_code ec;
        if (fs::equivalent(root / prefix, root / entry.relative_path, ec) && !ec)
            return true;

        // Both spellings exist side by side on a case-sensitive file system
        Log::Debug("Manifest::Scan", "Signature match: {}", hit.generic_string());
        this->entries.emplace_back(Entry {
            .relative_path = hit,
            .from_scan = true
        });
        return true;
    }
    return false;
}

bool Manifest::AnyPresent(const fs::path& root) const {
    return std::any_of(this->entries.begin(), this->entries.end(), [&](const Entry& entry) {
        return FsUtils::Exists(root / entry.relative_path);
    });
}
