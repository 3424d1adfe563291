#pragma once

#include <exception>
#include <filesystem>
#include <string>
#include <system_error>

class RemoverError : public std::exception {
public:
    RemoverError(std::string msg) : message(msg) {}

    std::string message;

    const char* what() const noexcept override {
        return message.c_str();
    }
};

// Installation directory (or a required file) could not be found
class NotFoundError : public RemoverError {
public:
    NotFoundError(std::string msg) : RemoverError(msg) {}
};

class IOError : public RemoverError {
public:
    IOError(std::string msg, std::filesystem::path path, std::error_code code)
        : RemoverError(msg), path(path), code(code) {}

    std::filesystem::path path;
    std::error_code code;
};

// Invalid option value or combination
class ConfigError : public RemoverError {
public:
    ConfigError(std::string msg) : RemoverError(msg) {}
};
