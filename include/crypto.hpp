#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace Crypto {
    std::string ComputeSHA256(const std::vector<char>& bytes);

    // Streams the file through the digest; throws IOError if it can't be read
    std::string ComputeFileSHA256(const std::filesystem::path& path);
}
