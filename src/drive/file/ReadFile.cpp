#include "drive/file/ReadFile.hpp"
#include "drive/store/Store.hpp"
#include "drive/errors.hpp"
#include "io/Reader.hpp"
#include "log/Registry.hpp"

using namespace dt::drive::file;
using namespace dt::drive;
using namespace dt::log;

ReadFile::ReadFile(std::shared_ptr<store::Store> store, model::Node node)
    : store_(std::move(store)), node_(std::move(node)) {}

ReadFile::~ReadFile() = default;

dt::io::Reader& ReadFile::stream() {
    opened_.run([this] {
        Registry::io()->debug("[ReadFile] Opening download stream for {} (id={})", node_.path(), node_.id);
        reader_ = store_->download(node_.id);
    });
    return *reader_;
}

size_t ReadFile::read(char* buf, const size_t len) {
    {
        std::lock_guard lock(closeMutex_);
        if (closed_) throw UsageError(fmt::format("`{}' is closed", node_.path()));
    }
    return stream().read(buf, len);
}

size_t ReadFile::write(const char*, size_t) {
    throw UsageError("open the file with OpenMode::Write for writing");
}

void ReadFile::close() {
    std::lock_guard lock(closeMutex_);
    if (closed_) return;
    auto& in = stream();
    closed_ = true;
    in.close();
}
