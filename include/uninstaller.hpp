#pragma once

#include "loadlists.hpp"
#include "manifest.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

struct RunOptions {
    bool do_backup = false;
    std::filesystem::path backup_destination;
    bool dry_run = false;

    std::optional<std::filesystem::path> game_directory;
    bool timestamped_backup = false;
    bool scan_signatures = true;
    bool clean_load_lists = true;
    size_t max_matches = Manifest::DEFAULT_MAX_MATCHES;

    // Mod manager folders scanned in addition to the installation
    std::optional<std::filesystem::path> mo2_directory;
    std::optional<std::filesystem::path> vortex_directory;

    // Stamp of the timestamped backup folder, taken from the clock when empty
    std::string backup_stamp;

    // Throws ConfigError on an invalid combination
    void Validate() const;
};

// UTC date and time for a NVMP_Removed_<stamp> backup folder
std::string NewBackupStamp();

struct EntryFailure {
    std::filesystem::path entry;
    std::string reason;
    std::error_code code;
};

struct BackupResult {
    size_t copied = 0;
    std::vector<std::filesystem::path> skipped;
    std::vector<EntryFailure> failures;

    // Every present entry was copied and confirmed
    bool Complete() const { return failures.empty(); }
};

struct RemovalResult {
    size_t removed = 0;
    std::vector<std::filesystem::path> removed_entries;
    std::vector<std::filesystem::path> skipped;
    std::vector<EntryFailure> failures;
    std::vector<std::filesystem::path> not_attempted;
    bool aborted = false;
};

struct PlannedAction {
    enum Kind { Backup, Remove, EditText } kind;
    std::filesystem::path path;
    std::filesystem::path target;
};

struct Outcome {
    enum Status { Success, PartialFailure, NotFound, InvalidConfig } status = Success;

    std::filesystem::path installation;
    std::vector<std::filesystem::path> external_roots;
    std::filesystem::path backup_directory;
    std::vector<PlannedAction> plan;
    std::optional<BackupResult> backup;
    std::optional<RemovalResult> removal;
    std::vector<LoadLists::TextEditResult> text_edits;
    std::string error;

    int ExitCode() const;
};

// Seam for the file system mutations, so tests can simulate locked files
class FileOperations {
public:
    virtual ~FileOperations() = default;
    virtual std::error_code Copy(const std::filesystem::path& from, const std::filesystem::path& to);
    virtual std::error_code Remove(const std::filesystem::path& path, size_t& removed);
};

class Uninstaller {
public:
    // Signature matches in a folder outside the installation (mod managers, user data)
    struct ExternalRoot {
        std::filesystem::path root;
        Manifest manifest;
    };

    enum Stage { Idle, Discovering, BackingUp, Removing, Done, Failed };

    struct StatusUpdate {
        Stage stage = Idle;
        size_t progress_current = 0;
        size_t progress_max = 0;
    };

    Uninstaller(Manifest manifest, std::shared_ptr<FileOperations> file_ops = std::make_shared<FileOperations>());

    // Tries the user path alone if given, otherwise the default install roots.
    // Throws NotFoundError when no candidate holds a manifest entry. With
    // scan_signatures the manifest is extended by a scan of the chosen directory.
    std::filesystem::path LocateInstallation(const std::optional<std::filesystem::path>& user_path, bool scan_signatures = false, size_t max_matches = Manifest::DEFAULT_MAX_MATCHES);
    std::filesystem::path LocateInstallation(const std::optional<std::filesystem::path>& user_path, const std::vector<std::filesystem::path>& default_roots, bool scan_signatures = false, size_t max_matches = Manifest::DEFAULT_MAX_MATCHES);

    // Both also cover the external roots resolved by the last Run. Their entries
    // are backed up below <destination>/_external and reported with absolute paths.
    BackupResult Backup(const std::filesystem::path& path, const std::filesystem::path& destination);
    RemovalResult Remove(const std::filesystem::path& path);
    Outcome Run(const RunOptions& options);

    void SetStatusCallback(std::function<void(StatusUpdate)> callback);
    void SetDefaultRoots(std::vector<std::filesystem::path> roots);
    // Replaces the detected user data and mod manager folders
    void SetUserDataRoots(std::vector<std::filesystem::path> roots);

    Stage GetStage() const { return stage; }
    const Manifest& GetManifest() const { return manifest; }
    const std::vector<ExternalRoot>& GetExternalRoots() const { return external_roots; }
private:
    Manifest manifest;
    std::shared_ptr<FileOperations> file_ops;
    std::function<void(StatusUpdate)> status_callback;
    std::optional<std::vector<std::filesystem::path>> default_roots;
    std::optional<std::vector<std::filesystem::path>> user_data_roots;
    std::vector<ExternalRoot> external_roots;
    Stage stage = Idle;

    void SetStage(Stage stage, size_t current = 0, size_t max = 0);
    size_t TotalEntries() const;
    std::vector<std::filesystem::path> ExternalRootCandidates(const std::filesystem::path& installation, const RunOptions& options) const;
    void ScanExternalRoots(const std::vector<std::filesystem::path>& roots, size_t max_matches);
    std::vector<PlannedAction> Plan(const std::filesystem::path& installation, const std::optional<std::filesystem::path>& destination, const std::vector<std::filesystem::path>& text_targets) const;
};
