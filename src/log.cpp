#include "log.hpp"
#include <fstream>
#include <memory>

std::unique_ptr<std::ofstream> Log::log_file = nullptr;
int Log::log_level = Log::LEVEL_WARNING;

void Log::OpenLogFile(const std::filesystem::path& path) {
    auto file = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!file->is_open()) {
        Log::Warning("Log::OpenLogFile", "Could not open log file {}", path.string());
        return;
    }
    log_file = std::move(file);
}

void Log::FreeLogFile() {
    if (log_file == nullptr) return;
    log_file->flush();
    log_file->close();
    log_file.reset();
}
