#pragma once

#include "drive/file/File.hpp"
#include "concurrency/OnceGuard.hpp"

#include <memory>
#include <mutex>

namespace dt::io {
class Reader;
}

namespace dt::drive::store {
class Store;
}

namespace dt::drive::file {

// Streams a file's content. The download is requested on the first read() or close(), never at open.
class ReadFile final : public File {
public:
    ReadFile(std::shared_ptr<store::Store> store, model::Node node);
    ~ReadFile() override;

    [[nodiscard]] std::optional<model::Node> info() const override { return node_; }

    size_t read(char* buf, size_t len) override;
    size_t write(const char* data, size_t len) override;
    void close() override;

private:
    std::shared_ptr<store::Store> store_;
    model::Node node_;

    concurrency::OnceGuard opened_;
    std::unique_ptr<io::Reader> reader_;

    std::mutex closeMutex_;
    bool closed_ = false;

    io::Reader& stream();
};

}
