#include "cli.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "manifest.hpp"
#include "paths.hpp"
#include "uninstaller.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>
#include <iostream>
#include <string>
#include <vector>

namespace {
    const int EXIT_CANCELLED = 4;
    const int EXIT_INVALID_CONFIG = 3;

    const char* StageName(Uninstaller::Stage stage) {
        switch (stage) {
        case Uninstaller::Idle: return "idle";
        case Uninstaller::Discovering: return "discovering";
        case Uninstaller::BackingUp: return "backing up";
        case Uninstaller::Removing: return "removing";
        case Uninstaller::Done: return "done";
        case Uninstaller::Failed: return "failed";
        }
        return "unknown";
    }

    void PrintPlan(const Outcome& outcome) {
        std::cout << std::format("Installation: {}\n", outcome.installation.string());
        if (!outcome.backup_directory.empty())
            std::cout << std::format("Backup folder: {}\n", outcome.backup_directory.string());
        for (const auto& root : outcome.external_roots) {
            std::cout << std::format("Also scanning: {}\n", root.string());
        }

        for (const auto& action : outcome.plan) {
            switch (action.kind) {
            case PlannedAction::Backup:
                std::cout << std::format("  back up  {} -> {}\n", action.path.string(), action.target.string());
                break;
            case PlannedAction::Remove:
                std::cout << std::format("  remove   {}\n", action.path.string());
                break;
            case PlannedAction::EditText:
                std::cout << std::format("  clean    {}\n", action.path.string());
                break;
            }
        }
    }

    void PrintSummary(const Outcome& outcome) {
        if (outcome.status == Outcome::NotFound || outcome.status == Outcome::InvalidConfig) {
            std::cout << std::format("ERROR: {}\n", outcome.error);
            return;
        }

        if (outcome.backup) {
            std::cout << std::format("Backed up {} entr(y/ies) to {}\n", outcome.backup->copied, outcome.backup_directory.string());
            for (const auto& failure : outcome.backup->failures) {
                std::cout << std::format("  FAILED   {}: {}\n", failure.entry.string(), failure.reason);
            }
        }

        if (outcome.removal) {
            const auto& removal = *outcome.removal;
            for (const auto& entry : removal.removed_entries) {
                std::cout << std::format("  REMOVED  {}\n", entry.string());
            }
            for (const auto& entry : removal.skipped) {
                std::cout << std::format("  SKIPPED  {} (not present)\n", entry.string());
            }
            for (const auto& failure : removal.failures) {
                std::cout << std::format("  FAILED   {}: {}\n", failure.entry.string(), failure.reason);
            }
            for (const auto& entry : removal.not_attempted) {
                std::cout << std::format("  PENDING  {} (not attempted)\n", entry.string());
            }
        }

        for (const auto& edit : outcome.text_edits) {
            if (edit.error.empty())
                std::cout << std::format("  EDITED   {} (removed {} line(s))\n", edit.path.string(), edit.lines_removed);
            else
                std::cout << std::format("  FAILED   {}: {}\n", edit.path.string(), edit.error);
        }

        if (outcome.status == Outcome::PartialFailure) {
            if (!outcome.error.empty())
                std::cout << std::format("ERROR: {}\n", outcome.error);
            std::cout << "Some entries could not be processed. Fix the problems above and run again.\n";
        } else {
            std::cout << "DONE.\n";
        }
        if (!outcome.backup_directory.empty() && outcome.backup)
            std::cout << std::format("If you need to restore, your removed files are here:\n  {}\n", outcome.backup_directory.string());
    }

    bool Confirm() {
        std::cout << "Proceed? [y/N] " << std::flush;
        std::string answer;
        if (!std::getline(std::cin, answer))
            return false;
        std::transform(answer.begin(), answer.end(), answer.begin(), [](unsigned char c) {
            return std::tolower(c);
        });
        return answer == "y" || answer == "yes";
    }
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string program = argc > 0 ? std::filesystem::path(argv[0]).filename().string() : "nvmp-remover";

    // Ensure paths are set and directories are created
    bool have_paths = true;
    try {
        Paths::InitPaths();
        Log::OpenLogFile(Paths::LogFile);
    } catch (const RemoverError& ex) {
        Log::Warning("MAIN", "{}. Running without config and log file", ex.what());
        have_paths = false;
    }

    auto config = Config::GetInstance();
    Cli::Arguments arguments;
    std::filesystem::path config_path;
    try {
        auto explicit_config = Cli::FindConfigPath(args);
        if (explicit_config)
            config_path = *explicit_config;
        else if (have_paths)
            config_path = Paths::ConfigFile;

        if (!config_path.empty())
            config->Load(config_path);
        arguments = Cli::Parse(args, *config);
    } catch (const ConfigError& ex) {
        std::cerr << std::format("ERROR: {}\n{}", ex.what(), Cli::Usage(program));
        return EXIT_INVALID_CONFIG;
    }

    if (arguments.show_help) {
        std::cout << Cli::Usage(program);
        return 0;
    }

    if (config->debug_mode) {
        Log::SetLevel(Log::LEVEL_DEBUG);
        Log::Info("MAIN", "Started in debug mode");
    }

    try {
        config->Validate();
        if (arguments.save_config && !config_path.empty()) {
            config->Save(config_path);
            Log::Info("MAIN", "Saved settings to {}", config_path.string());
        }
    } catch (const ConfigError& ex) {
        std::cerr << std::format("ERROR: {}\n", ex.what());
        return EXIT_INVALID_CONFIG;
    } catch (const IOError& ex) {
        Log::Error("MAIN", "{} ({})", ex.what(), ex.path.string());
    }

    Uninstaller uninstaller(Manifest::Default());
    uninstaller.SetStatusCallback([](Uninstaller::StatusUpdate update) {
        if (update.progress_max == 0)
            Log::Debug("MAIN", "Stage: {}", StageName(update.stage));
        else
            Log::Debug("MAIN", "Stage: {} ({}/{})", StageName(update.stage), update.progress_current, update.progress_max);
    });

    auto options = config->ToOptions();
    // The preview and the real run share one backup folder
    if (options.timestamped_backup)
        options.backup_stamp = NewBackupStamp();

    std::cout << "NVMP REMOVER\n";
    if (!options.dry_run && !arguments.assume_yes) {
        auto preview_options = options;
        preview_options.dry_run = true;
        auto preview = uninstaller.Run(preview_options);
        if (preview.status != Outcome::Success) {
            PrintSummary(preview);
            Log::FreeLogFile();
            return preview.ExitCode();
        }

        if (preview.plan.empty()) {
            std::cout << "No NV:MP artifacts found. Nothing to do.\n";
            Log::FreeLogFile();
            return 0;
        }

        PrintPlan(preview);
        if (!Confirm()) {
            std::cout << "Cancelled. Nothing was changed.\n";
            Log::FreeLogFile();
            return EXIT_CANCELLED;
        }

        // Stick to the directory the user just confirmed
        options.game_directory = preview.installation;
    }

    auto outcome = uninstaller.Run(options);
    if (options.dry_run) {
        if (outcome.status == Outcome::Success) {
            PrintPlan(outcome);
            std::cout << "Dry run: nothing was changed.\n";
        } else {
            PrintSummary(outcome);
        }
    } else {
        PrintSummary(outcome);
    }

    Log::FreeLogFile();
    return outcome.ExitCode();
}
