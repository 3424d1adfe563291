#include "loadlists.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "fs_utils.hpp"
#include "log.hpp"
#include "manifest.hpp"
#include "strings.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <set>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace LoadLists {
    const std::vector<std::string> TARGET_FILENAMES = {
        "plugins.txt",
        "loadorder.txt",
        "Fallout.ini",
        "FalloutPrefs.ini",
        "nvse_config.ini",
        "nvse.ini"
    };

    const char* TEMP_SUFFIX = ".nvmp-remover.tmp";

    namespace {
        bool IsTargetName(const std::string& name) {
            auto lower = Strings::ToLower(name);
            return std::any_of(TARGET_FILENAMES.begin(), TARGET_FILENAMES.end(), [&](const std::string& target) {
                return Strings::ToLower(target) == lower;
            });
        }

        // Splits keeping line endings so the rewritten file keeps its format
        std::vector<std::string> SplitLines(const std::string& content) {
            std::vector<std::string> lines;
            size_t start = 0;
            while (start < content.size()) {
                size_t end = content.find('\n', start);
                if (end == std::string::npos) {
                    lines.emplace_back(content.substr(start));
                    break;
                }
                lines.emplace_back(content.substr(start, end - start + 1));
                start = end + 1;
            }
            return lines;
        }

        bool IsMatchingLine(const std::string& line) {
            auto trimmed = Strings::Trim(line);
            return !trimmed.empty() && Manifest::IsSignatureMatch(trimmed);
        }
    }

    std::vector<fs::path> FindTargets(const std::vector<fs::path>& roots) {
        std::vector<fs::path> targets;
        std::set<std::string> seen;

        for (const auto& root : roots) {
            std::error_code ec;
            auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied, ec);
            if (ec) {
                Log::Debug("LoadLists::FindTargets", "Skipping {}: {}", root.string(), ec.message());
                continue;
            }

            for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
                if (ec) {
                    Log::Warning("LoadLists::FindTargets", "Error while scanning {}: {}", root.string(), ec.message());
                    break;
                }
                if (!it->is_regular_file(ec) || !IsTargetName(it->path().filename().string()))
                    continue;

                auto path = fs::weakly_canonical(it->path(), ec);
                if (ec) path = it->path();
                if (seen.insert(Strings::ToLower(path.generic_string())).second)
                    targets.emplace_back(path);
            }
        }

        std::sort(targets.begin(), targets.end(), [](const fs::path& a, const fs::path& b) {
            return Strings::ToLower(a.generic_string()) < Strings::ToLower(b.generic_string());
        });
        return targets;
    }

    std::vector<std::string> MatchingLines(const std::string& content) {
        std::vector<std::string> matching;
        for (const auto& line : SplitLines(content)) {
            if (IsMatchingLine(line))
                matching.emplace_back(Strings::Trim(line));
        }
        return matching;
    }

    TextEditResult Strip(const fs::path& path, const std::optional<fs::path>& backup_dir, bool dry_run) {
        TextEditResult result { .path = path };

        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) {
            result.error = "cannot open file for reading";
            return result;
        }
        std::vector<char> original {
            std::istreambuf_iterator<char>(in),
            std::istreambuf_iterator<char>()
        };
        in.close();

        std::string kept;
        for (const auto& line : SplitLines(std::string(original.begin(), original.end()))) {
            if (IsMatchingLine(line)) {
                result.lines_removed++;
            } else {
                kept += line;
            }
        }

        if (result.lines_removed == 0 || dry_run)
            return result;

        if (backup_dir) {
            std::error_code ec;
            auto absolute = fs::absolute(path, ec);
            result.backup_path = *backup_dir / "_edited" / FsUtils::SanitizeForBackup(ec ? path : absolute);

            if (auto copy_ec = FsUtils::CopyEntry(path, result.backup_path); copy_ec) {
                result.error = std::format("backup failed: {}", copy_ec.message());
                return result;
            }
            try {
                if (Crypto::ComputeFileSHA256(result.backup_path) != Crypto::ComputeSHA256(original)) {
                    result.error = "backup verification failed";
                    return result;
                }
            } catch (const IOError& ex) {
                result.error = std::format("backup verification failed: {}", ex.what());
                return result;
            }
        }

        // A failed write must leave the original intact
        auto temp_path = path;
        temp_path += TEMP_SUFFIX;
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            result.error = std::format("cannot create {}", temp_path.string());
            return result;
        }
        out.write(kept.data(), kept.size());
        out.close();

        std::error_code ec;
        if (out.fail()) {
            fs::remove(temp_path, ec);
            result.error = "cannot write file";
            return result;
        }
        fs::rename(temp_path, path, ec);
        if (ec) {
            std::error_code remove_ec;
            fs::remove(temp_path, remove_ec);
            result.error = std::format("cannot replace file: {}", ec.message());
            return result;
        }

        result.edited = true;
        Log::Info("LoadLists::Strip", "Removed {} NV:MP line(s) from {}", result.lines_removed, path.string());
        return result;
    }
}
