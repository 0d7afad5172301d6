#pragma once

#include "drive/model/Fields.hpp"
#include "drive/model/Node.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dt::io {
class Reader;
}

namespace dt::drive::store {

// Partial update applied by Store::update; unset members are left untouched
struct Patch {
    std::optional<std::string> name{};
    std::optional<bool> trashed{};
    std::vector<std::string> add_parents{}, remove_parents{};

    [[nodiscard]] bool empty() const {
        return !name && !trashed && add_parents.empty() && remove_parents.empty();
    }
};

/**
 * Remote object store the drive engine runs on. Nodes are connected by (possibly several) parent
 * ids and names are not unique within a parent. Implementations own transport, authentication,
 * pagination and retries; every failure they surface is a BackingStoreError.
 *
 * Nodes returned here carry no parent_path: path context is attached by the resolver.
 * Only the metadata named in `fields` is guaranteed to be populated.
 */
class Store {
public:
    virtual ~Store() = default;

    // The store's own top-level folder
    virtual model::Node root(model::Fields fields) = 0;

    virtual model::Node get(const std::string& id, model::Fields fields) = 0;

    // Live (untrashed) children of parentId whose name equals name exactly
    virtual std::vector<model::Node> lookup(const std::string& parentId, const std::string& name,
                                            model::Fields fields) = 0;

    // Live direct children of parentId
    virtual std::vector<model::Node> list(const std::string& parentId, model::Fields fields) = 0;

    // Every trashed node in the store, in no particular order
    virtual std::vector<model::Node> listTrashed(model::Fields fields) = 0;

    virtual model::Node create(const std::string& parentId, const std::string& name,
                               model::NodeKind kind, model::Fields fields) = 0;

    // Creates a new file under parentId, reading its content until end of stream
    virtual model::Node upload(const std::string& parentId, const std::string& name,
                               io::Reader& content, model::Fields fields) = 0;

    // Replaces the content of an existing file in place, keeping its id
    virtual model::Node updateContents(const std::string& id, io::Reader& content, model::Fields fields) = 0;

    virtual model::Node update(const std::string& id, const Patch& patch, model::Fields fields) = 0;

    // Permanently deletes a node together with its descendants
    virtual void remove(const std::string& id) = 0;

    virtual std::unique_ptr<io::Reader> download(const std::string& id) = 0;
};

}
