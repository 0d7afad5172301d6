#include "io/Reader.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <stdexcept>

namespace dt::io {

size_t StringReader::read(char* buf, const size_t len) {
    const size_t n = std::min(len, data_.size() - offset_);
    if (n) std::memcpy(buf, data_.data() + offset_, n);
    offset_ += n;
    return n;
}

size_t IStreamReader::read(char* buf, const size_t len) {
    if (!len || in_.eof()) return 0;
    in_.read(buf, static_cast<std::streamsize>(len));
    if (in_.bad()) throw std::runtime_error("failed to read from input stream");
    return static_cast<size_t>(in_.gcount());
}

std::string readAll(Reader& reader) {
    std::string out;
    std::array<char, 64 * 1024> buf{};
    while (const size_t n = reader.read(buf.data(), buf.size())) out.append(buf.data(), n);
    return out;
}

size_t readFull(Reader& reader, char* buf, const size_t len) {
    size_t total = 0;
    while (total < len) {
        const size_t n = reader.read(buf + total, len - total);
        if (!n) break;
        total += n;
    }
    return total;
}

}
