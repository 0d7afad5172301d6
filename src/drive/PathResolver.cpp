#include "drive/PathResolver.hpp"
#include "drive/store/Store.hpp"
#include "drive/util/path.hpp"
#include "drive/errors.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace dt::drive;
using namespace dt::drive::model;
using namespace dt::drive::util;
using namespace dt::log;

PathResolver::PathResolver(std::shared_ptr<store::Store> store) : store_(std::move(store)) {
    if (!store_) throw std::invalid_argument("PathResolver requires a store");
}

Node PathResolver::resolve(const Node& base, const std::string_view path, const Fields fields) const {
    const auto parts = splitPath(path);
    return resolveParts(base, parts, fields);
}

Node PathResolver::resolveParts(const Node& base, const std::span<const std::string> parts, const Fields fields) const {
    if (parts.empty()) return base;

    Node current = base;
    std::string currentPath = base.path();

    for (size_t i = 0; i < parts.size(); ++i) {
        const bool last = i + 1 == parts.size();
        const auto childPath = joinPath(currentPath, sanitizeName(parts[i]));

        // path() is derived from the name, so the last segment always carries it
        auto child = lookupChild(current, currentPath, parts[i], last ? fields | Field::Name : fields::ID);
        if (!child) {
            Registry::drive()->debug("[PathResolver] Segment {} of {} missing: {}", i + 1, parts.size(), childPath);
            throw NotFoundError(childPath);
        }

        current = std::move(*child);
        currentPath = childPath;
    }

    return current;
}

std::optional<Node> PathResolver::lookupChild(const Node& parent, const std::string& parentPath,
                                              const std::string& segment, const Fields fields) const {
    const auto name = sanitizeName(segment);
    const auto path = joinPath(parentPath, name);
    auto matches = store_->lookup(parent.id, name, fields);
    if (matches.empty()) return std::nullopt;

    if (matches.size() > 1) {
        Registry::drive()->warn("[PathResolver] {} entries share the name of {} (parent id={})",
                                matches.size(), path, parent.id);
        throw AmbiguousEntryError(path);
    }

    return matches.front().withParentPath(parentPath);
}
