#include "io/Pipe.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

using namespace dt::io;

Pipe::Pipe(const size_t capacity) : buf_(std::max<size_t>(capacity, 1)) {}

void Pipe::write(const char* data, size_t len) {
    std::unique_lock lock(mutex_);
    if (writeClosed_) throw std::runtime_error("write on closed pipe");

    while (len) {
        writable_.wait(lock, [&] { return readClosed_ || size_ < buf_.size(); });
        if (readClosed_) {
            if (readErr_) std::rethrow_exception(readErr_);
            throw std::runtime_error("write on closed pipe");
        }

        const size_t tail = (head_ + size_) % buf_.size();
        const size_t contiguous = tail >= head_ ? buf_.size() - tail : head_ - tail;
        const size_t n = std::min({len, buf_.size() - size_, contiguous});

        std::memcpy(buf_.data() + tail, data, n);
        size_ += n;
        data += n;
        len -= n;
        readable_.notify_one();
    }
}

size_t Pipe::read(char* buf, const size_t len) {
    if (!len) return 0;

    std::unique_lock lock(mutex_);
    if (readClosed_) throw std::runtime_error("read on closed pipe");

    readable_.wait(lock, [&] { return size_ > 0 || writeClosed_; });
    if (!size_) {
        if (writeErr_) std::rethrow_exception(writeErr_);
        return 0;
    }

    const size_t n = std::min({len, size_, buf_.size() - head_});
    std::memcpy(buf, buf_.data() + head_, n);
    head_ = (head_ + n) % buf_.size();
    size_ -= n;
    if (!size_) head_ = 0;
    writable_.notify_one();
    return n;
}

void Pipe::closeWrite(std::exception_ptr err) {
    {
        std::lock_guard lock(mutex_);
        if (writeClosed_) return;
        writeClosed_ = true;
        writeErr_ = std::move(err);
    }
    readable_.notify_all();
}

void Pipe::closeRead(std::exception_ptr err) {
    {
        std::lock_guard lock(mutex_);
        if (readClosed_) return;
        readClosed_ = true;
        readErr_ = std::move(err);
        size_ = 0;
        head_ = 0;
    }
    writable_.notify_all();
}

size_t Pipe::buffered() const {
    std::lock_guard lock(mutex_);
    return size_;
}

PipeReader::~PipeReader() {
    if (!closed_) pipe_->closeRead();
}

void PipeReader::close() {
    if (closed_) return;
    closed_ = true;
    pipe_->closeRead();
    log::Registry::io()->trace("[PipeReader] Closed read end");
}
