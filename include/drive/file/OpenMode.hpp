#pragma once

#include <cstdint>
#include <string>

namespace dt::drive::file {

enum class OpenMode : uint8_t {
    Read   = 1 << 0,
    Write  = 1 << 1,
    Create = 1 << 2,   // with Write: upload a new file when the path does not exist
};

constexpr OpenMode operator|(const OpenMode a, const OpenMode b) {
    return static_cast<OpenMode>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

constexpr bool has(const OpenMode set, const OpenMode flag) {
    return (static_cast<uint8_t>(set) & static_cast<uint8_t>(flag)) != 0;
}

inline std::string to_string(const OpenMode mode) {
    std::string out;
    if (has(mode, OpenMode::Read)) out += "r";
    if (has(mode, OpenMode::Write)) out += "w";
    if (has(mode, OpenMode::Create)) out += "c";
    return out.empty() ? "-" : out;
}

}
