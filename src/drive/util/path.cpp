#include "drive/util/path.hpp"

namespace dt::drive::util {

std::vector<std::string> splitPath(const std::string_view path) {
    std::vector<std::string> parts;
    size_t start = 0;
    for (size_t i = 0; i <= path.size(); ++i) {
        if (i < path.size() && !isPathSeparator(path[i])) continue;
        if (i > start) parts.emplace_back(path.substr(start, i - start));
        start = i + 1;
    }
    return parts;
}

std::string joinPath(const std::span<const std::string> parts) {
    std::string out;
    for (const auto& part : parts) {
        if (part.empty()) continue;
        if (!out.empty()) out += '/';
        out += part;
    }
    return out;
}

std::string joinPath(const std::string_view base, const std::string_view child) {
    const auto parts = splitPath(std::string(base) + '/' + std::string(child));
    return joinPath(parts);
}

std::string sanitizeName(const std::string_view name) {
    std::string out(name);
    for (auto& c : out)
        if (isPathSeparator(c) || c == '\'') c = '-';
    return out;
}

}
