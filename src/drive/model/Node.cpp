#include "drive/model/Node.hpp"
#include "drive/util/path.hpp"
#include "drive/errors.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

using namespace dt::drive::model;
using namespace dt::drive::util;
using namespace dt::util;

namespace {

std::optional<std::time_t> parseTimeField(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    const auto raw = j.at(key).get<std::string>();
    const auto parsed = parseRfc3339(raw);
    if (!parsed) throw dt::drive::InvariantViolation(
        fmt::format("unable to parse {} (`{}') as RFC 3339", key, raw));
    return parsed;
}

std::optional<uintmax_t> parseSizeField(const nlohmann::json& j) {
    if (!j.contains("size") || j.at("size").is_null()) return std::nullopt;
    const auto& v = j.at("size");
    if (v.is_number_unsigned()) return v.get<uintmax_t>();
    if (v.is_number_integer()) {
        const auto signedSize = v.get<int64_t>();
        if (signedSize < 0) throw dt::drive::InvariantViolation(fmt::format("negative size ({})", signedSize));
        return static_cast<uintmax_t>(signedSize);
    }
    if (v.is_string()) {
        const auto s = v.get<std::string>();
        try {
            return std::stoull(s);
        } catch (const std::exception&) {
            throw dt::drive::InvariantViolation("unable to parse size (`" + s + "')");
        }
    }
    throw dt::drive::InvariantViolation("unexpected size field type: " + std::string(v.type_name()));
}

}

namespace dt::drive::model {

std::string_view to_string(const NodeKind kind) {
    return kind == NodeKind::Directory ? "directory" : "file";
}

Node::Node(const nlohmann::json& j, std::string parentPath) {
    from_json(j, *this);
    parent_path = std::move(parentPath);
}

NodeKind Node::kind() const {
    return mime_type == FOLDER_MIME_TYPE ? NodeKind::Directory : NodeKind::File;
}

std::string Node::displayName() const { return sanitizeName(name); }

std::string Node::path() const {
    if (is_root) return {};
    return joinPath(parent_path, displayName());
}

std::optional<std::string> Node::parent() const {
    if (parents.empty()) return std::nullopt;
    return parents.front();
}

Node Node::withParentPath(std::string parentPath) const {
    Node copy = *this;
    copy.parent_path = std::move(parentPath);
    copy.is_root = false;
    return copy;
}

void to_json(nlohmann::json& j, const Node& node) {
    j = {
        {"id", node.id},
        {"name", node.name},
        {"path", node.path()},
        {"kind", to_string(node.kind())},
        {"mimeType", node.mime_type},
        {"trashed", node.trashed}
    };

    if (node.size) j["size"] = *node.size;
    if (node.created_at) j["createdTime"] = timestampToString(*node.created_at);
    if (node.modified_at) j["modifiedTime"] = timestampToString(*node.modified_at);
    if (!node.parents.empty()) j["parents"] = node.parents;
    if (node.md5_checksum) j["md5Checksum"] = *node.md5_checksum;
}

void from_json(const nlohmann::json& j, Node& node) {
    node.id = j.at("id").get<std::string>();
    node.name = j.value("name", "");
    node.mime_type = j.value("mimeType", "");
    node.size = parseSizeField(j);
    node.created_at = parseTimeField(j, "createdTime");
    node.modified_at = parseTimeField(j, "modifiedTime");
    node.parents = j.value("parents", std::vector<std::string>{});
    if (j.contains("md5Checksum") && j.at("md5Checksum").is_string())
        node.md5_checksum = j.at("md5Checksum").get<std::string>();
    node.trashed = j.value("trashed", false);
}

}
