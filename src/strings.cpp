#include "strings.hpp"

#include <algorithm>
#include <cctype>

namespace Strings {

    std::string ToLower(std::string string) {
        std::transform(string.begin(), string.end(), string.begin(), [](unsigned char c) {
            return std::tolower(c);
        });
        return string;
    }

    std::string Trim(const std::string& string) {
        auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
        auto begin = std::find_if_not(string.begin(), string.end(), is_space);
        auto end = std::find_if_not(string.rbegin(), string.rend(), is_space).base();
        if (begin >= end) return "";
        return std::string(begin, end);
    }

}
