#pragma once
#include <string>

namespace conductor::core::text {

    // Strips leading and trailing spaces, tabs, CR and LF.
    inline std::string trim(const std::string& value) {
        const auto first = value.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) {
            return "";
        }
        const auto last = value.find_last_not_of(" \t\r\n");
        return value.substr(first, last - first + 1);
    }

} // namespace conductor::core::text
