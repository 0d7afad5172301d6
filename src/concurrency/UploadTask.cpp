#include "concurrency/UploadTask.hpp"
#include "io/Pipe.hpp"
#include "log/Registry.hpp"

using namespace dt::concurrency;
using namespace dt::io;
using namespace dt::log;

UploadTask::UploadTask(std::shared_ptr<Pipe> p, UploadFn fn, std::string path)
    : pipe(std::move(p)), upload(std::move(fn)), path(std::move(path)) {}

void UploadTask::operator()() {
    PipeReader reader(pipe);
    try {
        auto node = upload(reader);
        reader.close();
        Registry::io()->debug("[UploadTask] Uploaded {} (id={})", path, node.id);
        promise.set_value(std::move(node));
    } catch (const std::exception& e) {
        Registry::io()->error("[UploadTask] Upload of {} failed: {}", path, e.what());
        pipe->closeRead(std::current_exception());
        promise.set_exception(std::current_exception());
    } catch (...) {
        Registry::io()->error("[UploadTask] Upload of {} failed with a non-standard exception", path);
        pipe->closeRead(std::current_exception());
        promise.set_exception(std::current_exception());
    }
}
