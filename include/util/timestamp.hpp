#pragma once

#include <cctype>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace dt::util {

// Parses RFC 3339 ("2019-03-29T12:34:56.789Z", "2019-03-29T14:34:56+02:00") into UTC seconds.
inline std::optional<std::time_t> parseRfc3339(const std::string& ts) {
    if (ts.size() < 20) return std::nullopt;

    std::tm tm = {};
    std::istringstream ss(ts.substr(0, 19));
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) return std::nullopt;

    size_t pos = 19;
    if (ts[pos] == '.') {
        ++pos;
        const size_t digitsStart = pos;
        while (pos < ts.size() && std::isdigit(static_cast<unsigned char>(ts[pos]))) ++pos;
        if (pos == digitsStart) return std::nullopt;
    }

    if (pos >= ts.size()) return std::nullopt;

    long offsetSeconds = 0;
    if (ts[pos] == 'Z' || ts[pos] == 'z') {
        if (pos + 1 != ts.size()) return std::nullopt;
    } else if (ts[pos] == '+' || ts[pos] == '-') {
        if (ts.size() != pos + 6 || ts[pos + 3] != ':') return std::nullopt;
        for (const size_t i : {pos + 1, pos + 2, pos + 4, pos + 5})
            if (!std::isdigit(static_cast<unsigned char>(ts[i]))) return std::nullopt;
        const int hours = std::stoi(ts.substr(pos + 1, 2));
        const int minutes = std::stoi(ts.substr(pos + 4, 2));
        offsetSeconds = (hours * 3600L + minutes * 60L) * (ts[pos] == '-' ? -1 : 1);
    } else return std::nullopt;

    return timegm(&tm) - offsetSeconds;
}

inline std::string timestampToString(const std::time_t ts) {
    std::tm tm = {};
    gmtime_r(&ts, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

} // namespace dt::util
