#include "MemoryStore.hpp"
#include "drive/errors.hpp"
#include "io/Reader.hpp"
#include "util/hash.hpp"

#include <algorithm>
#include <array>

using namespace dt::test;
using namespace dt::drive;
using namespace dt::drive::model;
using namespace dt::drive::store;

MemoryStore::MemoryStore() {
    Entry root;
    root.id = rootId_ = "root-0";
    root.name = "My Drive";
    root.mime_type = FOLDER_MIME_TYPE;
    root.created_at = root.modified_at = clock_;
    nodes_.emplace(root.id, std::move(root));
}

void MemoryStore::record(const std::string& op, const std::optional<Fields> fields) const {
    ++calls_[op];
    if (fields) fields_[op].push_back(*fields);
}

const MemoryStore::Entry& MemoryStore::entry(const std::string& id) const {
    const auto it = nodes_.find(id);
    if (it == nodes_.end()) throw BackingStoreError(404, "File not found: " + id);
    return it->second;
}

MemoryStore::Entry& MemoryStore::entry(const std::string& id) {
    const auto it = nodes_.find(id);
    if (it == nodes_.end()) throw BackingStoreError(404, "File not found: " + id);
    return it->second;
}

std::string MemoryStore::newId() {
    return "node-" + std::to_string(nextId_++);
}

Node MemoryStore::project(const Entry& e, const Fields fields) {
    Node n;
    n.id = e.id;
    const bool dir = e.mime_type == FOLDER_MIME_TYPE;
    if (fields.has(Field::Name)) n.name = e.name;
    if (fields.has(Field::Kind)) n.mime_type = e.mime_type;
    if (fields.has(Field::Size) && !dir) n.size = e.content.size();
    if (fields.has(Field::Times)) {
        n.created_at = e.created_at;
        n.modified_at = e.modified_at;
    }
    if (fields.has(Field::Parents)) n.parents = e.parents;
    if (fields.has(Field::Checksum) && !dir) n.md5_checksum = util::md5Hex(e.content);
    if (fields.has(Field::Trashed)) n.trashed = e.trashed;
    return n;
}

std::string MemoryStore::readContent(io::Reader& content) {
    std::optional<size_t> failAfter;
    {
        std::lock_guard lock(mutex_);
        failAfter.swap(failUploadAfter_);
    }

    std::string out;
    std::array<char, 4096> buf{};
    while (const size_t n = content.read(buf.data(), buf.size())) {
        out.append(buf.data(), n);
        if (failAfter && out.size() >= *failAfter) break;
    }
    if (failAfter) throw BackingStoreError(503, "injected upload failure");
    return out;
}

Node MemoryStore::root(const Fields fields) {
    std::lock_guard lock(mutex_);
    record("root", fields);
    return project(entry(rootId_), fields);
}

Node MemoryStore::get(const std::string& id, const Fields fields) {
    std::lock_guard lock(mutex_);
    record("get", fields);
    return project(entry(id == "root" ? rootId_ : id), fields);
}

std::vector<Node> MemoryStore::lookup(const std::string& parentId, const std::string& name, const Fields fields) {
    std::lock_guard lock(mutex_);
    record("lookup", fields);

    std::vector<const Entry*> hits;
    for (const auto& [_, e] : nodes_)
        if (!e.trashed && e.name == name && std::ranges::find(e.parents, parentId) != e.parents.end())
            hits.push_back(&e);
    std::ranges::sort(hits, {}, &Entry::seq);

    std::vector<Node> out;
    for (const auto* e : hits) out.push_back(project(*e, fields));
    return out;
}

std::vector<Node> MemoryStore::list(const std::string& parentId, const Fields fields) {
    std::lock_guard lock(mutex_);
    record("list", fields);

    std::vector<const Entry*> hits;
    for (const auto& [_, e] : nodes_)
        if (!e.trashed && std::ranges::find(e.parents, parentId) != e.parents.end()) hits.push_back(&e);
    std::ranges::sort(hits, {}, &Entry::seq);

    std::vector<Node> out;
    for (const auto* e : hits) out.push_back(project(*e, fields));
    return out;
}

std::vector<Node> MemoryStore::listTrashed(const Fields fields) {
    std::lock_guard lock(mutex_);
    record("listTrashed", fields);

    std::vector<const Entry*> hits;
    for (const auto& [_, e] : nodes_) if (e.trashed) hits.push_back(&e);
    std::ranges::sort(hits, {}, &Entry::seq);
    if (reverseTrash_) std::ranges::reverse(hits);

    std::vector<Node> out;
    for (const auto* e : hits) out.push_back(project(*e, fields));
    return out;
}

Node MemoryStore::create(const std::string& parentId, const std::string& name, const NodeKind kind,
                         const Fields fields) {
    std::lock_guard lock(mutex_);
    record("create", fields);
    (void)entry(parentId);

    Entry e;
    e.id = newId();
    e.name = name;
    e.mime_type = kind == NodeKind::Directory ? FOLDER_MIME_TYPE : FILE_MIME_TYPE;
    e.parents = {parentId};
    e.created_at = e.modified_at = ++clock_;
    e.seq = nextId_;
    const auto id = e.id;
    nodes_.emplace(id, std::move(e));
    return project(nodes_.at(id), fields);
}

Node MemoryStore::upload(const std::string& parentId, const std::string& name, io::Reader& content,
                         const Fields fields) {
    {
        std::unique_lock lock(mutex_);
        record("upload", fields);
        (void)entry(parentId);
        uploadGate_.wait(lock, [this] { return !holdUploads_; });
    }

    auto data = readContent(content);

    std::lock_guard lock(mutex_);
    Entry e;
    e.id = newId();
    e.name = name;
    e.mime_type = FILE_MIME_TYPE;
    e.parents = {parentId};
    e.content = std::move(data);
    e.created_at = e.modified_at = ++clock_;
    e.seq = nextId_;
    const auto id = e.id;
    nodes_.emplace(id, std::move(e));
    return project(nodes_.at(id), fields);
}

Node MemoryStore::updateContents(const std::string& id, io::Reader& content, const Fields fields) {
    {
        std::unique_lock lock(mutex_);
        record("updateContents", fields);
        (void)entry(id);
        uploadGate_.wait(lock, [this] { return !holdUploads_; });
    }

    auto data = readContent(content);

    std::lock_guard lock(mutex_);
    auto& e = entry(id);
    e.content = std::move(data);
    e.modified_at = ++clock_;
    return project(e, fields);
}

Node MemoryStore::update(const std::string& id, const Patch& patch, const Fields fields) {
    std::lock_guard lock(mutex_);
    record("update", fields);

    auto& e = entry(id);
    for (const auto& p : patch.add_parents) (void)entry(p);
    for (const auto& p : patch.remove_parents)
        if (std::ranges::find(e.parents, p) == e.parents.end())
            throw BackingStoreError(400, "parent " + p + " is not a parent of " + id);

    if (patch.name) e.name = *patch.name;
    if (patch.trashed) e.trashed = *patch.trashed;
    std::erase_if(e.parents, [&](const std::string& p) {
        return std::ranges::find(patch.remove_parents, p) != patch.remove_parents.end();
    });
    for (const auto& p : patch.add_parents)
        if (std::ranges::find(e.parents, p) == e.parents.end()) e.parents.push_back(p);
    e.modified_at = ++clock_;
    return project(e, fields);
}

void MemoryStore::remove(const std::string& id) {
    std::lock_guard lock(mutex_);
    record("remove");
    if (id == rootId_) throw BackingStoreError(403, "The root folder cannot be deleted");
    (void)entry(id);

    std::vector<std::string> pending{id};
    while (!pending.empty()) {
        const auto current = pending.back();
        pending.pop_back();
        nodes_.erase(current);
        for (const auto& [childId, e] : nodes_)
            if (std::ranges::find(e.parents, current) != e.parents.end()) pending.push_back(childId);
    }
}

std::unique_ptr<dt::io::Reader> MemoryStore::download(const std::string& id) {
    std::lock_guard lock(mutex_);
    record("download");
    const auto& e = entry(id);
    if (e.mime_type == FOLDER_MIME_TYPE) throw BackingStoreError(403, "Only files with binary content can be downloaded");
    return std::make_unique<io::StringReader>(e.content);
}

std::string MemoryStore::insert(const std::string& name, const NodeKind kind, std::vector<std::string> parents,
                                std::string content) {
    std::lock_guard lock(mutex_);
    Entry e;
    e.id = newId();
    e.name = name;
    e.mime_type = kind == NodeKind::Directory ? FOLDER_MIME_TYPE : FILE_MIME_TYPE;
    e.parents = std::move(parents);
    e.content = std::move(content);
    e.created_at = e.modified_at = ++clock_;
    e.seq = nextId_;
    const auto id = e.id;
    nodes_.emplace(id, std::move(e));
    return id;
}

void MemoryStore::addParent(const std::string& id, const std::string& parentId) {
    std::lock_guard lock(mutex_);
    entry(id).parents.push_back(parentId);
}

size_t MemoryStore::calls(const std::string& op) const {
    std::lock_guard lock(mutex_);
    const auto it = calls_.find(op);
    return it == calls_.end() ? 0 : it->second;
}

size_t MemoryStore::totalCalls() const {
    std::lock_guard lock(mutex_);
    size_t total = 0;
    for (const auto& [_, n] : calls_) total += n;
    return total;
}

void MemoryStore::resetCalls() {
    std::lock_guard lock(mutex_);
    calls_.clear();
    fields_.clear();
}

std::vector<Fields> MemoryStore::requestedFields(const std::string& op) const {
    std::lock_guard lock(mutex_);
    const auto it = fields_.find(op);
    return it == fields_.end() ? std::vector<Fields>{} : it->second;
}

std::string MemoryStore::contentOf(const std::string& id) const {
    std::lock_guard lock(mutex_);
    return entry(id).content;
}

bool MemoryStore::exists(const std::string& id) const {
    std::lock_guard lock(mutex_);
    return nodes_.contains(id);
}

size_t MemoryStore::nodeCount() const {
    std::lock_guard lock(mutex_);
    return nodes_.size();
}

void MemoryStore::holdUploads(const bool hold) {
    {
        std::lock_guard lock(mutex_);
        holdUploads_ = hold;
    }
    uploadGate_.notify_all();
}

void MemoryStore::failNextUpload(const size_t failAfterBytes) {
    std::lock_guard lock(mutex_);
    failUploadAfter_ = failAfterBytes;
}
