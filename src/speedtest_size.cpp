#include "speedtest_size.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

std::optional<uint64_t> parse_size(const std::string& str) {
    std::size_t i = 0;

    // Extract numeric part
    while (i < str.size() && (std::isdigit(static_cast<unsigned char>(str[i])) || str[i] == '.')) {
        ++i;
    }
    if (i == 0) return std::nullopt;

    double value = 0;
    try {
        std::size_t used = 0;
        value = std::stod(str.substr(0, i), &used);
        if (used != i) return std::nullopt; // e.g. "1.2.3"
    } catch (const std::exception&) {
        return std::nullopt;
    }

    std::string unit = str.substr(i);
    std::transform(unit.begin(), unit.end(), unit.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    double mult = 0;
    if (unit.empty() || unit == "B")
        mult = 1;
    else if (unit == "KB" || unit == "K" || unit == "KIB")
        mult = 1024.0;
    else if (unit == "MB" || unit == "M" || unit == "MIB")
        mult = 1024.0 * 1024.0;
    else if (unit == "GB" || unit == "G" || unit == "GIB")
        mult = 1024.0 * 1024.0 * 1024.0;
    else if (unit == "TB" || unit == "T" || unit == "TIB")
        mult = 1024.0 * 1024.0 * 1024.0 * 1024.0;
    else
        return std::nullopt;

    double bytes = std::floor(value * mult);
    if (!std::isfinite(bytes) || bytes >= static_cast<double>(std::numeric_limits<uint64_t>::max())) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(bytes);
}
