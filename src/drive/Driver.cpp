#include "drive/Driver.hpp"
#include "drive/store/Store.hpp"
#include "drive/file/ReadFile.hpp"
#include "drive/file/WriteFile.hpp"
#include "drive/util/path.hpp"
#include "io/Reader.hpp"
#include "drive/errors.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace dt::drive;
using namespace dt::drive::model;
using namespace dt::drive::file;
using namespace dt::drive::util;
using namespace dt::log;

namespace {

std::string normalized(const std::string_view path) {
    auto parts = splitPath(path);
    for (auto& part : parts) part = sanitizeName(part);
    return joinPath(parts);
}

}

Driver::Driver(std::shared_ptr<store::Store> store, const config::DriverConfig& driverConfig,
               const config::IOConfig& ioConfig)
    : store_(std::move(store)), pipeCapacity_(ioConfig.pipe_buffer_size) {
    if (!store_) throw std::invalid_argument("Driver requires a store");
    mutator_ = std::make_shared<TreeMutator>(store_);
    setRootDirectory(driverConfig.root_directory);
}

Node Driver::setRootDirectory(const std::string_view path) {
    auto storeRoot = store_->root(fields::INFO);
    storeRoot.is_root = true;

    auto node = mutator_->resolver().resolve(storeRoot, path, fields::INFO);
    if (!node.isDirectory()) throw NotADirectoryError(normalized(path));

    node.parent_path.clear();
    node.is_root = true;

    {
        std::lock_guard lock(rootMutex_);
        root_ = std::make_shared<const Node>(node);
    }

    Registry::drive()->debug("[Driver] Root directory set to `{}' (id={})", normalized(path), node.id);
    return node;
}

std::shared_ptr<const Node> Driver::snapshot() const {
    std::lock_guard lock(rootMutex_);
    return root_;
}

Node Driver::root() const { return *snapshot(); }

Node Driver::stat(const std::string_view path) const {
    return mutator_->resolver().resolve(*snapshot(), path, fields::INFO);
}

void Driver::list(const std::string_view path, const Visitor& visit) const {
    mutator_->list(*snapshot(), path, visit);
}

Node Driver::makeDirectory(const std::string_view path) {
    return mutator_->makeDirectory(*snapshot(), path);
}

void Driver::remove(const std::string_view path) {
    mutator_->remove(*snapshot(), path);
}

void Driver::removeDirectory(const std::string_view path) {
    mutator_->removeDirectory(*snapshot(), path);
}

FileContents Driver::get(const std::string_view path) const {
    auto node = mutator_->resolver().resolve(*snapshot(), path, fields::INFO);
    if (node.isDirectory()) throw IsADirectoryError(normalized(path));

    auto reader = store_->download(node.id);
    return {std::move(node), std::move(reader)};
}

std::pair<Node, std::string> Driver::getHash(const std::string_view path, const HashMethod method) const {
    if (method != HashMethod::MD5)
        throw InvalidArgumentError(fmt::format("unknown hash method {}", static_cast<int>(method)));

    auto node = mutator_->resolver().resolve(*snapshot(), path, fields::HASH);
    if (node.isDirectory()) throw IsADirectoryError(normalized(path));
    if (!node.md5_checksum)
        throw BackingStoreError(0, fmt::format("no md5 checksum reported for `{}'", normalized(path)));

    auto digest = *node.md5_checksum;
    return {std::move(node), std::move(digest)};
}

Node Driver::put(const std::string_view path, io::Reader& content, const PutMode mode) {
    return mutator_->putFile(*snapshot(), path, content, mode);
}

Node Driver::rename(const std::string_view path, const std::string_view newName) {
    return mutator_->rename(*snapshot(), path, newName);
}

Node Driver::move(const std::string_view oldPath, const std::string_view newPath) {
    return mutator_->move(*snapshot(), oldPath, newPath);
}

void Driver::trash(const std::string_view path) {
    mutator_->trash(*snapshot(), path);
}

Node Driver::restore(const std::string_view path) {
    return mutator_->restore(*snapshot(), path);
}

void Driver::listTrash(const std::string_view scopePath, const Visitor& visit) const {
    mutator_->listTrash(*snapshot(), scopePath, visit);
}

std::unique_ptr<File> Driver::open(const std::string_view path, const OpenMode mode) {
    const bool reading = has(mode, OpenMode::Read), writing = has(mode, OpenMode::Write);
    if (reading == writing)
        throw InvalidArgumentError(fmt::format("open mode `{}' must include exactly one of read or write", to_string(mode)));

    const auto root = snapshot();

    if (reading) {
        auto node = mutator_->resolver().resolve(*root, path, fields::INFO);
        if (node.isDirectory()) throw IsADirectoryError(normalized(path));
        Registry::io()->debug("[Driver] Opened {} for reading", node.path());
        return std::make_unique<ReadFile>(store_, std::move(node));
    }

    std::optional<Node> existing;
    try {
        existing = mutator_->resolver().resolve(*root, path, fields::INFO);
    } catch (const NotFoundError&) {
        if (!has(mode, OpenMode::Create)) throw;
    }

    if (!existing) {
        Registry::io()->debug("[Driver] Opened {} for writing (create)", normalized(path));
        return std::make_unique<WriteFile>(mutator_, *root, std::string(path), pipeCapacity_);
    }

    if (existing->isDirectory()) throw IsADirectoryError(normalized(path));
    Registry::io()->debug("[Driver] Opened {} for writing (replace)", existing->path());
    return std::make_unique<WriteFile>(mutator_, std::move(*existing), pipeCapacity_);
}
