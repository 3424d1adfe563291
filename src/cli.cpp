#include "cli.hpp"
#include "errors.hpp"

#include <charconv>
#include <format>

namespace Cli {

    namespace {
        struct Option {
            std::string name;
            std::optional<std::string> inline_value;
        };

        Option SplitOption(const std::string& arg) {
            auto pos = arg.find('=');
            if (pos == std::string::npos)
                return Option { arg, std::nullopt };
            return Option { arg.substr(0, pos), arg.substr(pos + 1) };
        }

        std::string TakeValue(const Option& option, const std::vector<std::string>& args, size_t& i) {
            if (option.inline_value)
                return *option.inline_value;
            if (i + 1 >= args.size())
                throw ConfigError(std::format("Option {} requires a value", option.name));
            return args[++i];
        }

        size_t ParseCount(const std::string& name, const std::string& value) {
            size_t result = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
            if (ec != std::errc() || ptr != value.data() + value.size())
                throw ConfigError(std::format("Option {} expects a number, got \"{}\"", name, value));
            return result;
        }
    }

    std::optional<std::filesystem::path> FindConfigPath(const std::vector<std::string>& args) {
        for (size_t i = 0; i < args.size(); i++) {
            auto option = SplitOption(args[i]);
            if (option.name == "--config")
                return std::filesystem::path(TakeValue(option, args, i));
        }
        return std::nullopt;
    }

    Arguments Parse(const std::vector<std::string>& args, Config& config) {
        Arguments result;

        for (size_t i = 0; i < args.size(); i++) {
            auto option = SplitOption(args[i]);
            const auto& name = option.name;

            if (name == "-h" || name == "--help") {
                result.show_help = true;
            } else if (name == "-y" || name == "--yes") {
                result.assume_yes = true;
            } else if (name == "--game") {
                config.game_directory = TakeValue(option, args, i);
            } else if (name == "--backup") {
                config.do_backup = true;
            } else if (name == "--no-backup") {
                config.do_backup = false;
            } else if (name == "--backup-dir") {
                config.backup_destination = TakeValue(option, args, i);
                config.do_backup = true;
            } else if (name == "--timestamped") {
                config.timestamped_backup = true;
            } else if (name == "--dry-run") {
                config.dry_run = true;
            } else if (name == "--no-scan") {
                config.scan_signatures = false;
            } else if (name == "--no-text") {
                config.clean_load_lists = false;
            } else if (name == "--max-matches") {
                config.max_matches = ParseCount(name, TakeValue(option, args, i));
            } else if (name == "--mo2") {
                config.mo2_directory = TakeValue(option, args, i);
            } else if (name == "--vortex") {
                config.vortex_directory = TakeValue(option, args, i);
            } else if (name == "--debug") {
                config.debug_mode = true;
            } else if (name == "--config") {
                result.config_path = std::filesystem::path(TakeValue(option, args, i));
            } else if (name == "--save-config") {
                result.save_config = true;
            } else {
                throw ConfigError(std::format("Unknown option {}", args[i]));
            }
        }

        return result;
    }

    std::string Usage(const std::string& program) {
        return std::format(
            "Usage: {} [options]\n"
            "Removes NV:MP (Fallout: New Vegas Multiplayer) files from a Fallout New Vegas installation.\n"
            "\n"
            "  --game <dir>          Fallout New Vegas folder (auto-detected when omitted)\n"
            "  --backup              Back up files before removing them (needs --backup-dir)\n"
            "  --no-backup           Remove without a backup\n"
            "  --backup-dir <dir>    Backup destination, implies --backup\n"
            "  --timestamped         Back up into <dir>/NVMP_Removed_<date>_<time>\n"
            "  --dry-run             Show what would be done without changing anything\n"
            "  --no-scan             Only remove the known NV:MP files, skip the name scan\n"
            "  --no-text             Leave plugins.txt, loadorder.txt and INI files alone\n"
            "  --max-matches <n>     Stop the name scan after n matches (default {})\n"
            "  --mo2 <dir>           Mod Organizer 2 folder to scan as well (detected next to the game otherwise)\n"
            "  --vortex <dir>        Vortex mods folder to scan as well (detected under %APPDATA% otherwise)\n"
            "  -y, --yes             Don't ask for confirmation\n"
            "  --config <file>       Read settings from <file>\n"
            "  --save-config         Store the effective settings in the config file\n"
            "  --debug               Verbose logging\n"
            "  -h, --help            Show this help\n"
            "\n"
            "Exit codes: 0 success, 1 partial failure, 2 installation not found,\n"
            "3 invalid configuration, 4 cancelled.\n",
            program, Manifest::DEFAULT_MAX_MATCHES);
    }

}
