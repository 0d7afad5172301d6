#pragma once

#include "io/Reader.hpp"

#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <vector>

namespace dt::io {

/**
 * Bounded in-process byte pipe connecting one producer thread to one consumer thread.
 *
 * write() blocks while the buffer is full, read() blocks while it is empty. Either side can close
 * with an error, which the other side observes as a thrown exception on its next call. Closing the
 * write end without an error is end of stream for the reader.
 */
class Pipe {
public:
    explicit Pipe(size_t capacity);

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    // Blocks until every byte is buffered; throws once the read end is closed
    void write(const char* data, size_t len);

    // Blocks until at least one byte is available; 0 means the write end closed cleanly
    size_t read(char* buf, size_t len);

    void closeWrite(std::exception_ptr err = nullptr);
    void closeRead(std::exception_ptr err = nullptr);

    [[nodiscard]] size_t capacity() const noexcept { return buf_.size(); }
    [[nodiscard]] size_t buffered() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable readable_, writable_;

    std::vector<char> buf_;
    size_t head_ = 0, size_ = 0;

    bool writeClosed_ = false, readClosed_ = false;
    std::exception_ptr writeErr_, readErr_;
};

// Consumer end of a Pipe, usable wherever a Reader is expected
class PipeReader final : public Reader {
public:
    explicit PipeReader(std::shared_ptr<Pipe> pipe) : pipe_(std::move(pipe)) {}
    ~PipeReader() override;

    size_t read(char* buf, size_t len) override { return pipe_->read(buf, len); }
    void close() override;

private:
    std::shared_ptr<Pipe> pipe_;
    bool closed_ = false;
};

}
