#pragma once

#include "drive/model/Fields.hpp"
#include "drive/model/Node.hpp"

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace dt::drive::store {
class Store;
}

namespace dt::drive {

/**
 * Translates slash separated paths into nodes by walking them one segment at a time.
 *
 * Every segment costs exactly one store lookup. Intermediate segments fetch only the id; the
 * requested fields apply to the final segment. An empty path resolves to the base node itself
 * without touching the store. A missing segment throws NotFoundError naming the prefix up to and
 * including it, and several same-named siblings throw AmbiguousEntryError.
 */
class PathResolver {
public:
    explicit PathResolver(std::shared_ptr<store::Store> store);

    [[nodiscard]] model::Node resolve(const model::Node& base, std::string_view path,
                                      model::Fields fields = model::fields::ID) const;

    [[nodiscard]] model::Node resolveParts(const model::Node& base, std::span<const std::string> parts,
                                           model::Fields fields = model::fields::ID) const;

    // The unique live child of parent named segment (sanitized), or nullopt when there is none.
    // parentPath is the parent's path relative to the root; it becomes the child's parent_path.
    [[nodiscard]] std::optional<model::Node> lookupChild(const model::Node& parent, const std::string& parentPath,
                                                         const std::string& segment, model::Fields fields) const;

    [[nodiscard]] const std::shared_ptr<store::Store>& store() const { return store_; }

private:
    std::shared_ptr<store::Store> store_;
};

}
