#pragma once

#include "concurrency/Task.hpp"
#include "drive/model/Node.hpp"

#include <functional>
#include <memory>
#include <string>

namespace dt::io {
class Pipe;
class Reader;
}

namespace dt::concurrency {

// Drains the consumer end of a pipe into a store upload. The resulting node, or the upload error,
// is delivered through the promise; on failure the pipe's read end is closed with the same error
// so a blocked producer wakes up and sees it.
struct UploadTask final : PromisedTask<drive::model::Node> {
    using UploadFn = std::function<drive::model::Node(io::Reader&)>;

    std::shared_ptr<io::Pipe> pipe;
    UploadFn upload;
    std::string path;

    UploadTask(std::shared_ptr<io::Pipe> p, UploadFn fn, std::string path);

    void operator()() override;
};

}
