#pragma once

#include <cstddef>
#include <istream>
#include <memory>
#include <string>
#include <utility>

namespace dt::io {

// Pull-based byte source. read() returns 0 only at end of stream and throws on failure.
class Reader {
public:
    virtual ~Reader() = default;

    virtual size_t read(char* buf, size_t len) = 0;

    // Releases the source early; reading after close is a usage error for implementations that care
    virtual void close() {}
};

class StringReader final : public Reader {
public:
    explicit StringReader(std::string data) : data_(std::move(data)) {}

    size_t read(char* buf, size_t len) override;

private:
    std::string data_;
    size_t offset_ = 0;
};

class IStreamReader final : public Reader {
public:
    explicit IStreamReader(std::istream& in) : in_(in) {}

    size_t read(char* buf, size_t len) override;

private:
    std::istream& in_;
};

std::string readAll(Reader& reader);

// Reads until len bytes are gathered or the stream ends; returns the count gathered
size_t readFull(Reader& reader, char* buf, size_t len);

}
