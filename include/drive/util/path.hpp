#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dt::drive::util {

[[nodiscard]] constexpr bool isPathSeparator(const char c) { return c == '/' || c == '\\'; }

// Splits on separators and drops empty segments: "/a//b/", "a/b" and "a\\b" all yield {"a", "b"}
std::vector<std::string> splitPath(std::string_view path);

std::string joinPath(std::span<const std::string> parts);
std::string joinPath(std::string_view base, std::string_view child);

// Replaces separators and the store query quote with '-'
std::string sanitizeName(std::string_view name);

}
