#pragma once

#include <string>

namespace Strings {
    std::string ToLower(std::string string);
    std::string Trim(const std::string& string);
}
