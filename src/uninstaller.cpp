#include "uninstaller.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "fs_utils.hpp"
#include "game.hpp"
#include "log.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <utility>

#ifdef _WIN32
#include <Windows.h>
#endif

namespace fs = std::filesystem;

namespace {
    bool IsFileInUse(const std::error_code& ec) {
#ifdef _WIN32
        if (ec.category() == std::system_category() && (ec.value() == ERROR_SHARING_VIOLATION || ec.value() == ERROR_LOCK_VIOLATION))
            return true;
#endif
        return ec == std::errc::device_or_resource_busy || ec == std::errc::text_file_busy;
    }

    // Checked before the permission codes: a sharing violation also compares
    // equal to errc::permission_denied on Windows
    std::string DescribeError(const std::error_code& ec) {
        if (IsFileInUse(ec))
            return "file in use (close the game and launcher first)";
        if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted)
            return "permission denied (run as Administrator or check file ownership)";
        return ec.message();
    }

    // Permission problems are per entry; anything else (busy files, read-only
    // or failing media) stops the removal.
    bool IsRecoverable(const std::error_code& ec) {
        if (IsFileInUse(ec))
            return false;
        return ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted;
    }

    fs::path Normalize(const fs::path& path) {
        std::error_code ec;
        auto canonical = fs::weakly_canonical(fs::absolute(path, ec), ec);
        return ec ? path.lexically_normal() : canonical;
    }

    bool IsInside(const fs::path& child, const fs::path& parent) {
        auto rel = Normalize(child).lexically_relative(Normalize(parent));
        return !rel.empty() && *rel.begin() != "..";
    }

    fs::path Resolve(const fs::path& root, const fs::path& relative) {
        return relative == "." ? root : root / relative;
    }

    // Every source file must be in the copy with the same SHA-256. Files the
    // copy holds from earlier runs are kept and ignored. Returns a reason on mismatch.
    std::optional<std::string> VerifyCopy(const fs::path& from, const fs::path& to) {
        std::error_code ec;
        auto source_files = FsUtils::ListFilesRecursive(from, ec);
        if (ec) return std::format("cannot list source: {}", ec.message());
        auto copied_files = FsUtils::ListFilesRecursive(to, ec);
        if (ec) return std::format("cannot list copy: {}", ec.message());

        for (const auto& file : source_files) {
            if (!std::binary_search(copied_files.begin(), copied_files.end(), file))
                return std::format("copy is missing {}", Resolve(to, file).string());
        }

        try {
            for (const auto& file : source_files) {
                if (Crypto::ComputeFileSHA256(Resolve(from, file)) != Crypto::ComputeFileSHA256(Resolve(to, file)))
                    return std::format("checksum mismatch for {}", Resolve(to, file).string());
            }
        } catch (const IOError& ex) {
            return std::format("{}: {}", ex.what(), ex.path.string());
        }
        return std::nullopt;
    }

    struct Target {
        fs::path label;
        fs::path source;
        fs::path backup;
    };

    // Installation entries are labelled relative to the installation, external ones absolute
    std::vector<Target> Targets(const fs::path& installation, const Manifest& manifest, const std::vector<Uninstaller::ExternalRoot>& external, const fs::path& destination) {
        std::vector<Target> targets;
        for (const auto& entry : manifest.Entries()) {
            targets.emplace_back(Target { entry.relative_path, installation / entry.relative_path, destination / entry.relative_path });
        }
        for (const auto& external_root : external) {
            auto backup_root = destination / "_external" / FsUtils::SanitizeForBackup(external_root.root);
            for (const auto& entry : external_root.manifest.Entries()) {
                auto source = external_root.root / entry.relative_path;
                targets.emplace_back(Target { source, source, backup_root / entry.relative_path });
            }
        }
        return targets;
    }
}

std::string NewBackupStamp() {
    return std::format("{:%Y%m%d_%H%M%S}", std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now()));
}

void RunOptions::Validate() const {
    if (this->do_backup && this->backup_destination.empty())
        throw ConfigError("A backup destination is required when backing up");
    if (this->max_matches == 0)
        throw ConfigError("max_matches must be greater than zero");
    if (this->game_directory && this->game_directory->empty())
        throw ConfigError("The game directory must not be empty");
}

int Outcome::ExitCode() const {
    switch (this->status) {
    case Success: return 0;
    case PartialFailure: return 1;
    case NotFound: return 2;
    case InvalidConfig: return 3;
    }
    return 1;
}

std::error_code FileOperations::Copy(const fs::path& from, const fs::path& to) {
    return FsUtils::CopyEntry(from, to);
}

std::error_code FileOperations::Remove(const fs::path& path, size_t& removed) {
    return FsUtils::RemoveEntry(path, removed);
}

Uninstaller::Uninstaller(Manifest manifest, std::shared_ptr<FileOperations> file_ops)
    : manifest(std::move(manifest)), file_ops(std::move(file_ops)) {}

void Uninstaller::SetStatusCallback(std::function<void(StatusUpdate)> callback) {
    this->status_callback = std::move(callback);
}

void Uninstaller::SetDefaultRoots(std::vector<fs::path> roots) {
    this->default_roots = std::move(roots);
}

void Uninstaller::SetUserDataRoots(std::vector<fs::path> roots) {
    this->user_data_roots = std::move(roots);
}

void Uninstaller::SetStage(Stage stage, size_t current, size_t max) {
    this->stage = stage;
    if (this->status_callback)
        this->status_callback(StatusUpdate { stage, current, max });
}

size_t Uninstaller::TotalEntries() const {
    size_t total = this->manifest.Size();
    for (const auto& external : this->external_roots) {
        total += external.manifest.Size();
    }
    return total;
}

fs::path Uninstaller::LocateInstallation(const std::optional<fs::path>& user_path, bool scan_signatures, size_t max_matches) {
    if (user_path || this->default_roots)
        return LocateInstallation(user_path, this->default_roots.value_or(std::vector<fs::path> {}), scan_signatures, max_matches);
    return LocateInstallation(user_path, Game::DefaultInstallRoots(), scan_signatures, max_matches);
}

fs::path Uninstaller::LocateInstallation(const std::optional<fs::path>& user_path, const std::vector<fs::path>& default_roots, bool scan_signatures, size_t max_matches) {
    std::vector<fs::path> candidates;
    if (user_path) {
        std::error_code ec;
        if (!fs::is_directory(*user_path, ec))
            throw NotFoundError(std::format("Installation directory {} does not exist", user_path->string()));
        candidates.emplace_back(*user_path);
    } else {
        candidates = default_roots;
    }

    for (const auto& candidate : candidates) {
        Manifest resolved = this->manifest;
        if (scan_signatures) {
            auto added = resolved.Scan(candidate, max_matches);
            Log::Debug("Uninstaller::LocateInstallation", "Signature scan of {} found {} entr(y/ies)", candidate.string(), added);
        }

        if (resolved.AnyPresent(candidate)) {
            Log::Info("Uninstaller::LocateInstallation", "Found NV:MP files in {}", candidate.string());
            this->manifest = std::move(resolved);
            return candidate;
        }
        Log::Debug("Uninstaller::LocateInstallation", "No NV:MP files in {}", candidate.string());
    }

    if (user_path)
        throw NotFoundError(std::format("No NV:MP files found in {}", user_path->string()));
    if (candidates.empty())
        throw NotFoundError("Could not detect the Fallout New Vegas folder. Pass it with --game");
    throw NotFoundError(std::format("No NV:MP files found in {} detected install location(s)", candidates.size()));
}

BackupResult Uninstaller::Backup(const fs::path& path, const fs::path& destination) {
    BackupResult result;
    auto targets = Targets(path, this->manifest, this->external_roots, destination);

    for (size_t i = 0; i < targets.size(); i++) {
        const auto& target = targets[i];

        if (!FsUtils::Exists(target.source)) {
            Log::Debug("Uninstaller::Backup", "Skipped {} - not present", target.label.generic_string());
            result.skipped.emplace_back(target.label);
        } else if (auto ec = this->file_ops->Copy(target.source, target.backup); ec) {
            Log::Error("Uninstaller::Backup", "Failed to back up {}: {}", target.source.string(), DescribeError(ec));
            result.failures.emplace_back(EntryFailure { target.label, DescribeError(ec), ec });
        } else if (auto mismatch = VerifyCopy(target.source, target.backup); mismatch) {
            Log::Error("Uninstaller::Backup", "Backup of {} could not be confirmed: {}", target.source.string(), *mismatch);
            result.failures.emplace_back(EntryFailure { target.label, *mismatch, std::make_error_code(std::errc::io_error) });
        } else {
            Log::Debug("Uninstaller::Backup", "Backed up {}", target.label.generic_string());
            result.copied++;
        }

        SetStage(BackingUp, i + 1, targets.size());
    }

    Log::Info("Uninstaller::Backup", "Backed up {} entr(y/ies) to {} ({} absent, {} failed)", result.copied, destination.string(), result.skipped.size(), result.failures.size());
    return result;
}

RemovalResult Uninstaller::Remove(const fs::path& path) {
    RemovalResult result;
    auto targets = Targets(path, this->manifest, this->external_roots, {});

    for (size_t i = 0; i < targets.size(); i++) {
        const auto& target = targets[i];

        if (!FsUtils::Exists(target.source)) {
            Log::Debug("Uninstaller::Remove", "Skipped {} - already absent", target.label.generic_string());
            result.skipped.emplace_back(target.label);
            SetStage(Removing, i + 1, targets.size());
            continue;
        }

        size_t objects = 0;
        if (auto ec = this->file_ops->Remove(target.source, objects); ec) {
            result.failures.emplace_back(EntryFailure { target.label, DescribeError(ec), ec });

            if (!IsRecoverable(ec)) {
                Log::Error("Uninstaller::Remove", "Failed to remove {}: {}. Stopping", target.source.string(), DescribeError(ec));
                for (size_t j = i + 1; j < targets.size(); j++) {
                    result.not_attempted.emplace_back(targets[j].label);
                }
                result.aborted = true;
                break;
            }
            Log::Error("Uninstaller::Remove", "Failed to remove {}: {}", target.source.string(), DescribeError(ec));
        } else {
            Log::Debug("Uninstaller::Remove", "Removed {} ({} object(s))", target.label.generic_string(), objects);
            result.removed++;
            result.removed_entries.emplace_back(target.label);
        }

        SetStage(Removing, i + 1, targets.size());
    }

    Log::Info("Uninstaller::Remove", "Removed {} entr(y/ies) ({} already absent, {} failed)", result.removed, result.skipped.size(), result.failures.size());
    return result;
}

std::vector<fs::path> Uninstaller::ExternalRootCandidates(const fs::path& installation, const RunOptions& options) const {
    std::vector<fs::path> candidates;
    if (this->user_data_roots) {
        candidates = *this->user_data_roots;
    } else {
        candidates = Game::UserDataDirectories();
        if (!options.mo2_directory) {
            for (auto& dir : Game::DetectModOrganizerDirectories(installation)) {
                candidates.emplace_back(std::move(dir));
            }
        }
        if (!options.vortex_directory) {
            for (auto& dir : Game::DetectVortexDirectories()) {
                candidates.emplace_back(std::move(dir));
            }
        }
    }

    for (const auto& dir : { options.mo2_directory, options.vortex_directory }) {
        if (!dir) continue;
        std::error_code ec;
        if (!fs::is_directory(*dir, ec)) {
            Log::Warning("Uninstaller::Run", "Mod manager folder {} does not exist, skipping it", dir->string());
            continue;
        }
        candidates.emplace_back(*dir);
    }

    // Folders overlapping the installation or an earlier folder are left out
    std::vector<fs::path> roots;
    for (const auto& candidate : candidates) {
        auto normalized = Normalize(candidate);
        bool overlaps = IsInside(normalized, installation) || IsInside(installation, normalized);
        for (const auto& root : roots) {
            overlaps = overlaps || IsInside(normalized, root) || IsInside(root, normalized);
        }
        if (overlaps) {
            Log::Debug("Uninstaller::Run", "Skipping {}: overlaps another scanned folder", normalized.string());
            continue;
        }
        roots.emplace_back(normalized);
    }
    return roots;
}

void Uninstaller::ScanExternalRoots(const std::vector<fs::path>& roots, size_t max_matches) {
    this->external_roots.clear();
    for (const auto& root : roots) {
        ExternalRoot external { root, Manifest() };
        auto found = external.manifest.Scan(root, max_matches);
        Log::Debug("Uninstaller::Run", "Signature scan of {} found {} entr(y/ies)", root.string(), found);
        if (found > 0)
            this->external_roots.emplace_back(std::move(external));
    }
}

std::vector<PlannedAction> Uninstaller::Plan(const fs::path& installation, const std::optional<fs::path>& destination, const std::vector<fs::path>& text_targets) const {
    std::vector<PlannedAction> plan;
    for (const auto& target : Targets(installation, this->manifest, this->external_roots, destination.value_or(fs::path()))) {
        if (!FsUtils::Exists(target.source)) continue;

        if (destination)
            plan.emplace_back(PlannedAction { PlannedAction::Backup, target.source, target.backup });
        plan.emplace_back(PlannedAction { PlannedAction::Remove, target.source, {} });
    }

    for (const auto& target : text_targets) {
        auto preview = LoadLists::Strip(target, std::nullopt, true);
        if (preview.lines_removed > 0)
            plan.emplace_back(PlannedAction { PlannedAction::EditText, target, {} });
    }
    return plan;
}

Outcome Uninstaller::Run(const RunOptions& options) {
    Outcome outcome;
    this->external_roots.clear();
    SetStage(Discovering);

    try {
        options.Validate();
        outcome.installation = LocateInstallation(options.game_directory, options.scan_signatures, options.max_matches);
    } catch (const ConfigError& ex) {
        Log::Error("Uninstaller::Run", "{}", ex.what());
        outcome.status = Outcome::InvalidConfig;
        outcome.error = ex.what();
        SetStage(Failed);
        return outcome;
    } catch (const NotFoundError& ex) {
        Log::Error("Uninstaller::Run", "{}", ex.what());
        outcome.status = Outcome::NotFound;
        outcome.error = ex.what();
        SetStage(Failed);
        return outcome;
    }

    if (!Game::LooksLikeGameDirectory(outcome.installation))
        Log::Warning("Uninstaller::Run", "{} has no {}; continuing anyway", outcome.installation.string(), Game::EXECUTABLE_NAME);

    outcome.external_roots = ExternalRootCandidates(outcome.installation, options);

    std::optional<fs::path> destination;
    if (options.do_backup) {
        destination = options.backup_destination;
        if (options.timestamped_backup)
            *destination /= std::format("NVMP_Removed_{}", options.backup_stamp.empty() ? NewBackupStamp() : options.backup_stamp);

        std::optional<fs::path> scanned_parent;
        if (IsInside(*destination, outcome.installation))
            scanned_parent = outcome.installation;
        for (const auto& root : outcome.external_roots) {
            if (!scanned_parent && IsInside(*destination, root))
                scanned_parent = root;
        }
        if (scanned_parent) {
            outcome.status = Outcome::InvalidConfig;
            outcome.error = std::format("Backup destination {} is inside {}, which is scanned for NV:MP files", destination->string(), scanned_parent->string());
            Log::Error("Uninstaller::Run", "{}", outcome.error);
            SetStage(Failed);
            return outcome;
        }
        outcome.backup_directory = *destination;
    }

    if (options.scan_signatures)
        ScanExternalRoots(outcome.external_roots, options.max_matches);

    std::vector<fs::path> text_targets;
    if (options.clean_load_lists) {
        std::vector<fs::path> text_roots { outcome.installation };
        text_roots.insert(text_roots.end(), outcome.external_roots.begin(), outcome.external_roots.end());
        text_targets = LoadLists::FindTargets(text_roots);
    }

    outcome.plan = Plan(outcome.installation, destination, text_targets);

    if (options.dry_run) {
        Log::Info("Uninstaller::Run", "Dry run: {} planned action(s), nothing changed", outcome.plan.size());
        SetStage(Done);
        return outcome;
    }

    if (destination) {
        SetStage(BackingUp, 0, TotalEntries());
        outcome.backup = Backup(outcome.installation, *destination);
        if (!outcome.backup->Complete()) {
            outcome.status = Outcome::PartialFailure;
            outcome.error = "Backup incomplete; nothing was removed";
            Log::Error("Uninstaller::Run", "{}", outcome.error);
            SetStage(Failed);
            return outcome;
        }
    }

    SetStage(Removing, 0, TotalEntries());
    outcome.removal = Remove(outcome.installation);

    bool failed = !outcome.removal->failures.empty();
    if (!outcome.removal->aborted) {
        for (const auto& target : text_targets) {
            if (!FsUtils::Exists(target)) continue;

            auto edit = LoadLists::Strip(target, destination, false);
            if (!edit.error.empty()) {
                Log::Error("Uninstaller::Run", "Failed to clean {}: {}", target.string(), edit.error);
                failed = true;
            }
            if (edit.lines_removed > 0)
                outcome.text_edits.emplace_back(std::move(edit));
        }
    }

    if (failed) {
        outcome.status = Outcome::PartialFailure;
        SetStage(Failed);
    } else {
        SetStage(Done);
    }
    return outcome;
}
