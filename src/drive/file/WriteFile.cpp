#include "drive/file/WriteFile.hpp"
#include "drive/TreeMutator.hpp"
#include "drive/errors.hpp"
#include "concurrency/UploadTask.hpp"
#include "io/Pipe.hpp"
#include "log/Registry.hpp"

using namespace dt::drive::file;
using namespace dt::drive;
using namespace dt::concurrency;
using namespace dt::io;
using namespace dt::log;

WriteFile::WriteFile(std::shared_ptr<const TreeMutator> mutator, model::Node root, std::string path,
                     const size_t pipeCapacity)
    : mutator_(std::move(mutator)), root_(std::move(root)), path_(std::move(path)), pipeCapacity_(pipeCapacity) {}

WriteFile::WriteFile(std::shared_ptr<const TreeMutator> mutator, model::Node existing, const size_t pipeCapacity)
    : mutator_(std::move(mutator)), path_(existing.path()), pipeCapacity_(pipeCapacity), node_(std::move(existing)) {}

WriteFile::~WriteFile() {
    if (!worker_.joinable()) return;

    Registry::io()->warn("[WriteFile] {} destroyed before close, aborting upload", path_);
    pipe_->closeWrite(std::make_exception_ptr(UsageError(fmt::format("write to `{}' was aborted", path_))));
    worker_.join();
}

void WriteFile::start() {
    started_.run([this] {
        pipe_ = std::make_shared<Pipe>(pipeCapacity_);

        UploadTask::UploadFn upload;
        if (const auto existing = info()) {
            upload = [mutator = mutator_, node = *existing](Reader& in) {
                return mutator->replaceContents(node, in);
            };
        } else {
            upload = [mutator = mutator_, root = root_, path = path_](Reader& in) {
                return mutator->putFile(root, path, in);
            };
        }

        auto task = std::make_shared<UploadTask>(pipe_, std::move(upload), path_);
        result_ = task->getFuture();
        worker_ = std::thread([task] { (*task)(); });
        Registry::io()->debug("[WriteFile] Started upload of {}", path_);
    });
}

std::optional<model::Node> WriteFile::info() const {
    std::lock_guard lock(mutex_);
    return node_;
}

size_t WriteFile::read(char*, size_t) {
    throw UsageError("open the file with OpenMode::Read for reading");
}

size_t WriteFile::write(const char* data, const size_t len) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) throw UsageError(fmt::format("`{}' is closed", path_));
        ++writesInFlight_;
    }

    try {
        start();
        pipe_->write(data, len);
    } catch (...) {
        finishWrite();
        throw;
    }
    finishWrite();
    return len;
}

void WriteFile::finishWrite() {
    {
        std::lock_guard lock(mutex_);
        --writesInFlight_;
    }
    writesDone_.notify_all();
}

void WriteFile::close() {
    {
        std::unique_lock lock(mutex_);
        if (closed_) return;
        closed_ = true;
        writesDone_.wait(lock, [this] { return writesInFlight_ == 0; });
    }

    start();
    pipe_->closeWrite();
    worker_.join();

    auto node = result_.get();
    std::lock_guard lock(mutex_);
    node_ = std::move(node);
}
