#include "util/curlWrappers.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <mutex>

namespace dt::util {

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t writeToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string urlEscape(const std::string_view value) {
    ensureCurlGlobalInit();
    CurlEasy h;
    const std::unique_ptr<char, decltype(&curl_free)> escaped(
        curl_easy_escape(h, value.data(), static_cast<int>(value.size())), &curl_free);
    if (!escaped) throw std::runtime_error("curl_easy_escape failed");
    return escaped.get();
}

std::optional<std::string> HttpResponse::header(const std::string_view name) const {
    const auto iequals = [](const std::string_view a, const std::string_view b) {
        return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](const char x, const char y) {
            return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
        });
    };

    std::optional<std::string> found;
    size_t start = 0;
    while (start < hdr.size()) {
        auto end = hdr.find('\n', start);
        if (end == std::string::npos) end = hdr.size();
        std::string_view line(hdr.data() + start, end - start);
        start = end + 1;

        while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.remove_suffix(1);
        const auto colon = line.find(':');
        if (colon == std::string_view::npos || !iequals(line.substr(0, colon), name)) continue;

        auto value = line.substr(colon + 1);
        while (!value.empty() && value.front() == ' ') value.remove_prefix(1);
        found = std::string(value);
    }
    return found;
}

}
