#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace dt::drive::model {

inline constexpr std::string_view FOLDER_MIME_TYPE = "application/vnd.google-apps.folder";
inline constexpr std::string_view FILE_MIME_TYPE = "application/octet-stream";

enum class NodeKind { File, Directory };

std::string_view to_string(NodeKind kind);

/// Snapshot of one remote entry. parent_path is attached by whoever resolved the node and is
/// relative to the configured root; it is never stored remotely.
struct Node {
    std::string id{}, name{}, mime_type{};
    std::optional<uintmax_t> size{};
    std::optional<std::time_t> created_at{}, modified_at{};
    std::vector<std::string> parents{};
    std::optional<std::string> md5_checksum{};
    bool trashed{false};
    std::string parent_path{};
    bool is_root{false};   // the configured root: its path is always ""

    Node() = default;
    Node(const nlohmann::json& j, std::string parentPath);

    [[nodiscard]] NodeKind kind() const;
    [[nodiscard]] bool isDirectory() const { return kind() == NodeKind::Directory; }

    // Name as it appears in paths: sanitized
    [[nodiscard]] std::string displayName() const;

    // join(parent_path, displayName()); empty for the configured root
    [[nodiscard]] std::string path() const;

    // The single logical parent; extra parents are ignored
    [[nodiscard]] std::optional<std::string> parent() const;

    [[nodiscard]] Node withParentPath(std::string parentPath) const;

    [[nodiscard]] bool operator==(const Node& other) const { return id == other.id; }
};

void to_json(nlohmann::json& j, const Node& node);
void from_json(const nlohmann::json& j, Node& node);

}
