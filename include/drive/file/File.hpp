#pragma once

#include "drive/model/Node.hpp"

#include <cstddef>
#include <optional>

namespace dt::drive::file {

// Open handle on a remote file. A handle is opened for either reading or writing; calling the
// other direction throws UsageError without touching the store.
class File {
public:
    virtual ~File() = default;

    // Metadata of the underlying node; empty for a new file until close() has uploaded it
    [[nodiscard]] virtual std::optional<model::Node> info() const = 0;

    virtual size_t read(char* buf, size_t len) = 0;
    virtual size_t write(const char* data, size_t len) = 0;

    // Idempotent. Surfaces any deferred transfer error.
    virtual void close() = 0;
};

}
