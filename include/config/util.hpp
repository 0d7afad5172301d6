#pragma once

#include <cctype>
#include <cstdint>
#include <string>
#include <stdexcept>

namespace dt::config {

inline bool endsWithUnit(const std::string& str, const std::string& upper) {
    if (str.size() <= upper.size()) return false;
    const auto tail = str.substr(str.size() - upper.size());
    for (size_t i = 0; i < upper.size(); ++i)
        if (std::toupper(static_cast<unsigned char>(tail[i])) != upper[i]) return false;
    return true;
}

inline uintmax_t parseSizeToBytes(const std::string& str) {
    if (str.empty()) throw std::invalid_argument("Size string cannot be empty");

    const auto scaled = [&](const size_t suffixLen, const uintmax_t factor) {
        return std::stoull(str.substr(0, str.size() - suffixLen)) * factor;
    };

    if (endsWithUnit(str, "GB")) return scaled(2, 1024ull * 1024 * 1024);
    if (endsWithUnit(str, "G")) return scaled(1, 1024ull * 1024 * 1024);
    if (endsWithUnit(str, "MB")) return scaled(2, 1024ull * 1024);
    if (endsWithUnit(str, "M")) return scaled(1, 1024ull * 1024);
    if (endsWithUnit(str, "KB")) return scaled(2, 1024ull);
    if (endsWithUnit(str, "K")) return scaled(1, 1024ull);

    // Assume bytes if no suffix
    return std::stoull(str);
}

inline std::string bytesToSizeStr(const uintmax_t bytes) {
    if (bytes != 0 && bytes % (1024ull * 1024 * 1024) == 0) return std::to_string(bytes / (1024ull * 1024 * 1024)) + "GB";
    if (bytes != 0 && bytes % (1024ull * 1024) == 0) return std::to_string(bytes / (1024ull * 1024)) + "MB";
    if (bytes != 0 && bytes % 1024ull == 0) return std::to_string(bytes / 1024ull) + "KB";
    return std::to_string(bytes);
}

}
