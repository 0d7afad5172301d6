#include "drive/TreeMutator.hpp"
#include "drive/store/Store.hpp"
#include "drive/util/path.hpp"
#include "drive/errors.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <exception>
#include <unordered_set>
#include <vector>

using namespace dt::drive;
using namespace dt::drive::model;
using namespace dt::drive::store;
using namespace dt::drive::util;
using namespace dt::log;

namespace {

std::vector<std::string> sanitizedParts(const std::string_view path) {
    auto parts = splitPath(path);
    for (auto& part : parts) part = sanitizeName(part);
    return parts;
}

void rejectRoot(const Node& root, const Node& target, const char* verb) {
    if (target.id == root.id) throw RootMutationError(verb);
}

// Follows the single logical parent of each node upward. Extra store-level parents are ignored.
std::optional<std::string> walkParents(Store& store, const std::string& ancestorId, const Node& node) {
    std::unordered_set<std::string> seen;
    std::string path;
    auto parentId = node.parent();

    while (parentId) {
        if (*parentId == ancestorId) return path;
        if (!seen.insert(*parentId).second) return std::nullopt;

        const auto parent = store.get(*parentId, fields::ANCESTRY);
        path = joinPath(parent.displayName(), path);
        parentId = parent.parent();
    }
    return std::nullopt;
}

}

TreeMutator::TreeMutator(std::shared_ptr<Store> store)
    : store_(std::move(store)), resolver_(store_) {}

void TreeMutator::visitGuarded(const Visitor& visit, const Node& node) {
    try {
        visit(node);
    } catch (const std::exception& e) {
        std::throw_with_nested(CallbackError(e.what()));
    } catch (...) {
        std::throw_with_nested(CallbackError("unknown exception"));
    }
}

Node TreeMutator::makeDirectoryByParts(const Node& root, const std::span<const std::string> parts) const {
    Node current = root;
    std::string currentPath = root.path();

    for (size_t i = 0; i < parts.size(); ++i) {
        const auto fields = i + 1 == parts.size() ? fields::INFO : fields::KIND;

        if (auto child = resolver_.lookupChild(current, currentPath, parts[i], fields)) current = std::move(*child);
        else {
            if (!current.isDirectory()) throw NotADirectoryError(currentPath, fmt::format(
                "unable to create directory in `{}': `{}' is not a directory", currentPath, current.displayName()));

            current = store_->create(current.id, sanitizeName(parts[i]), NodeKind::Directory, fields)
                          .withParentPath(currentPath);
            Registry::drive()->debug("[TreeMutator] Created directory {} (id={})", current.path(), current.id);
        }

        currentPath = joinPath(currentPath, sanitizeName(parts[i]));
    }

    return current;
}

Node TreeMutator::makeDirectory(const Node& root, const std::string_view path) const {
    const auto parts = splitPath(path);
    auto dir = makeDirectoryByParts(root, parts);
    if (!dir.isDirectory()) throw NotADirectoryError(joinPath(sanitizedParts(path)));
    return dir;
}

Node TreeMutator::putFile(const Node& root, const std::string_view path, io::Reader& content, const PutMode mode) const {
    const auto parts = splitPath(path);
    if (parts.empty()) throw InvalidArgumentError("path cannot be empty");

    const std::span<const std::string> dirParts(parts.data(), parts.size() - 1);
    Node parent = root;
    if (!dirParts.empty()) {
        parent = makeDirectoryByParts(root, dirParts);
        if (!parent.isDirectory()) throw NotADirectoryError(parent.path(), fmt::format(
            "unable to create file in `{}': `{}' is not a directory", parent.path(), parent.displayName()));
    }

    const auto leaf = sanitizeName(parts.back());

    if (mode == PutMode::ReplaceExisting) {
        const auto filePath = joinPath(parent.path(), leaf);
        const auto existing = store_->lookup(parent.id, leaf, fields::KIND);
        if (existing.size() > 1) throw AmbiguousEntryError(filePath);
        if (existing.size() == 1) {
            if (existing.front().isDirectory()) throw IsADirectoryError(filePath);
            Registry::drive()->debug("[TreeMutator] Replacing contents of {} (id={})", filePath, existing.front().id);
            return replaceContents(existing.front().withParentPath(parent.path()), content);
        }
    }

    auto node = store_->upload(parent.id, leaf, content, fields::INFO).withParentPath(parent.path());
    Registry::drive()->debug("[TreeMutator] Uploaded {} (id={})", node.path(), node.id);
    return node;
}

Node TreeMutator::replaceContents(const Node& file, io::Reader& content) const {
    if (file.isDirectory()) throw IsADirectoryError(file.path());
    return store_->updateContents(file.id, content, fields::INFO).withParentPath(file.parent_path);
}

void TreeMutator::remove(const Node& root, const std::string_view path) const {
    const auto node = resolver_.resolve(root, path);
    rejectRoot(root, node, "deleted");
    store_->remove(node.id);
    Registry::drive()->debug("[TreeMutator] Deleted {} (id={})", path, node.id);
}

void TreeMutator::removeDirectory(const Node& root, const std::string_view path) const {
    const auto node = resolver_.resolve(root, path, fields::KIND);
    if (!node.isDirectory()) throw NotADirectoryError(joinPath(sanitizedParts(path)));
    rejectRoot(root, node, "deleted");
    store_->remove(node.id);
    Registry::drive()->debug("[TreeMutator] Deleted directory {} (id={})", path, node.id);
}

Node TreeMutator::rename(const Node& root, const std::string_view path, const std::string_view newName) const {
    const auto nameParts = splitPath(newName);
    if (nameParts.empty()) throw InvalidArgumentError("new name cannot be empty");

    const auto node = resolver_.resolve(root, path);
    rejectRoot(root, node, "renamed");

    if (nameParts.size() > 1)
        Registry::drive()->warn("[TreeMutator] Rename target `{}' has several segments, using `{}'",
                                newName, nameParts.back());

    Patch patch;
    patch.name = sanitizeName(nameParts.back());
    auto renamed = store_->update(node.id, patch, fields::INFO).withParentPath(node.parent_path);
    Registry::drive()->debug("[TreeMutator] Renamed {} to {}", path, renamed.path());
    return renamed;
}

Node TreeMutator::move(const Node& root, const std::string_view oldPath, const std::string_view newPath) const {
    const auto destParts = sanitizedParts(newPath);
    if (destParts.empty()) throw InvalidArgumentError("new path cannot be empty");

    const auto source = resolver_.resolve(root, oldPath, Field::Kind | Field::Parents);
    rejectRoot(root, source, "moved");

    const std::span<const std::string> dirParts(destParts.data(), destParts.size() - 1);
    const auto sourcePath = joinPath(sanitizedParts(oldPath));
    const auto destDir = joinPath(dirParts);
    if (source.isDirectory() && (destDir == sourcePath || destDir.starts_with(sourcePath + '/')))
        throw InvalidArgumentError(fmt::format("cannot move `{}' into itself (`{}')", sourcePath, joinPath(destParts)));

    Node parent = root;
    if (!dirParts.empty()) {
        parent = makeDirectoryByParts(root, dirParts);
        if (!parent.isDirectory()) throw NotADirectoryError(parent.path(), fmt::format(
            "unable to create file in `{}': `{}' is not a directory", parent.path(), parent.displayName()));
    }

    Patch patch;
    patch.name = destParts.back();
    if (std::find(source.parents.begin(), source.parents.end(), parent.id) == source.parents.end())
        patch.add_parents.push_back(parent.id);
    for (const auto& id : source.parents)
        if (id != parent.id) patch.remove_parents.push_back(id);

    auto moved = store_->update(source.id, patch, fields::INFO).withParentPath(parent.path());
    Registry::drive()->debug("[TreeMutator] Moved {} to {} (id={})", sourcePath, moved.path(), moved.id);
    return moved;
}

void TreeMutator::trash(const Node& root, const std::string_view path) const {
    const auto node = resolver_.resolve(root, path);
    rejectRoot(root, node, "trashed");

    Patch patch;
    patch.trashed = true;
    (void)store_->update(node.id, patch, fields::ID);
    Registry::drive()->debug("[TreeMutator] Trashed {} (id={})", path, node.id);
}

Node TreeMutator::restore(const Node& root, const std::string_view path) const {
    const auto parts = sanitizedParts(path);
    if (parts.empty()) throw InvalidArgumentError("path cannot be empty");
    const auto target = joinPath(parts);

    std::vector<Node> matches;
    for (auto& node : store_->listTrashed(fields::INFO_WITH_PARENTS)) {
        if (node.displayName() != parts.back()) continue;
        const auto parentPath = isInRoot(root.id, node);
        if (!parentPath || joinPath(root.path(), *parentPath) != joinPath(std::span(parts.data(), parts.size() - 1)))
            continue;
        matches.push_back(node.withParentPath(joinPath(root.path(), *parentPath)));
    }

    if (matches.empty()) throw NotFoundError(target);
    if (matches.size() > 1) throw AmbiguousEntryError(target);

    const auto& node = matches.front();
    if (const auto parentId = node.parent(); parentId && !store_->lookup(*parentId, node.name, fields::ID).empty())
        throw AlreadyExistsError(target);

    Patch patch;
    patch.trashed = false;
    auto restored = store_->update(node.id, patch, fields::INFO).withParentPath(node.parent_path);
    Registry::drive()->debug("[TreeMutator] Restored {} (id={})", target, restored.id);
    return restored;
}

void TreeMutator::list(const Node& root, const std::string_view path, const Visitor& visit) const {
    const auto dir = resolver_.resolve(root, path, fields::KIND);
    if (!dir.isDirectory()) throw NotADirectoryError(joinPath(sanitizedParts(path)));

    const auto dirPath = dir.path();
    for (const auto& child : store_->list(dir.id, fields::INFO))
        visitGuarded(visit, child.withParentPath(dirPath));
}

void TreeMutator::listTrash(const Node& root, const std::string_view scopePath, const Visitor& visit) const {
    const auto scope = resolver_.resolve(root, scopePath, fields::KIND);
    const auto scopeDir = scope.path();

    for (const auto& node : store_->listTrashed(fields::INFO_WITH_PARENTS | Field::Trashed)) {
        const auto parentPath = isInRoot(scope.id, node);
        if (!parentPath) continue;
        visitGuarded(visit, node.withParentPath(joinPath(scopeDir, *parentPath)));
    }
}

std::optional<std::string> TreeMutator::isInRoot(const std::string& ancestorId, const Node& node) const {
    return walkParents(*store_, ancestorId, node);
}
