#pragma once

#include "drive/file/File.hpp"
#include "concurrency/OnceGuard.hpp"

#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace dt::io {
class Pipe;
}

namespace dt::concurrency {
struct UploadTask;
}

namespace dt::drive {
class TreeMutator;
}

namespace dt::drive::file {

/**
 * Producer side of an upload. The first write() (or a close() with no writes) opens a bounded
 * pipe and starts one background upload that drains it: a fresh putFile when the handle was
 * opened on a missing path, an in-place content replace otherwise. write() blocks only while the
 * pipe is full. close() waits for writes already in progress, ends the stream, joins the upload
 * and rethrows its error, if any. Writes that begin after close() fail.
 *
 * Destroying a handle that was never closed aborts the upload.
 */
class WriteFile final : public File {
public:
    // Creates path under root on upload
    WriteFile(std::shared_ptr<const TreeMutator> mutator, model::Node root, std::string path, size_t pipeCapacity);

    // Replaces the content of an existing file
    WriteFile(std::shared_ptr<const TreeMutator> mutator, model::Node existing, size_t pipeCapacity);

    ~WriteFile() override;

    [[nodiscard]] std::optional<model::Node> info() const override;

    size_t read(char* buf, size_t len) override;
    size_t write(const char* data, size_t len) override;
    void close() override;

private:
    std::shared_ptr<const TreeMutator> mutator_;
    model::Node root_;
    std::string path_;
    size_t pipeCapacity_;

    mutable std::mutex mutex_;
    std::optional<model::Node> node_;
    bool closed_ = false;
    size_t writesInFlight_ = 0;
    std::condition_variable writesDone_;

    concurrency::OnceGuard started_;
    std::shared_ptr<io::Pipe> pipe_;
    std::future<model::Node> result_;
    std::thread worker_;

    void start();
    void finishWrite();
};

}
