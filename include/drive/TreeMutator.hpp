#pragma once

#include "drive/PathResolver.hpp"
#include "drive/model/Node.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace dt::io {
class Reader;
}

namespace dt::drive {

enum class PutMode {
    CreateNew,          // always upload a new object, even if the name is taken
    ReplaceExisting     // overwrite the single live file of that name in place, if there is one
};

using Visitor = std::function<void(const model::Node&)>;

/**
 * Structural changes to the remote tree, expressed in paths relative to a root node.
 *
 * Each call takes the root snapshot it operates under, so a concurrent root change never splits
 * one operation across two roots. Operations aimed at the root itself are rejected with
 * RootMutationError. Visitor exceptions abort the walk and surface as a CallbackError with the
 * original exception nested.
 */
class TreeMutator {
public:
    explicit TreeMutator(std::shared_ptr<store::Store> store);

    // Walks parts from root, creating every missing directory. Existing segments are reused, so
    // calling it twice is a no-op the second time. The returned node may be a file if the last
    // segment already existed as one.
    [[nodiscard]] model::Node makeDirectoryByParts(const model::Node& root, std::span<const std::string> parts) const;

    [[nodiscard]] model::Node makeDirectory(const model::Node& root, std::string_view path) const;

    [[nodiscard]] model::Node putFile(const model::Node& root, std::string_view path, io::Reader& content,
                                      PutMode mode = PutMode::CreateNew) const;

    [[nodiscard]] model::Node replaceContents(const model::Node& file, io::Reader& content) const;

    void remove(const model::Node& root, std::string_view path) const;
    void removeDirectory(const model::Node& root, std::string_view path) const;

    // Changes the name only; a path-like newName keeps just its last segment
    [[nodiscard]] model::Node rename(const model::Node& root, std::string_view path, std::string_view newName) const;

    [[nodiscard]] model::Node move(const model::Node& root, std::string_view oldPath, std::string_view newPath) const;

    void trash(const model::Node& root, std::string_view path) const;
    [[nodiscard]] model::Node restore(const model::Node& root, std::string_view path) const;

    void list(const model::Node& root, std::string_view path, const Visitor& visit) const;
    void listTrash(const model::Node& root, std::string_view scopePath, const Visitor& visit) const;

    // If node descends from ancestorId, the path from that ancestor down to node's parent
    // ("" when ancestorId is a direct parent). Every parent link is followed.
    [[nodiscard]] std::optional<std::string> isInRoot(const std::string& ancestorId, const model::Node& node) const;

    [[nodiscard]] const PathResolver& resolver() const { return resolver_; }

private:
    std::shared_ptr<store::Store> store_;
    PathResolver resolver_;

    static void visitGuarded(const Visitor& visit, const model::Node& node);
};

}
