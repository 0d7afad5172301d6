#include <gtest/gtest.h>
#include "drive/model/Node.hpp"
#include "drive/errors.hpp"

#include <nlohmann/json.hpp>

using namespace dt::drive;
using namespace dt::drive::model;
using json = nlohmann::json;

class NodeTest : public ::testing::Test {
protected:
    json file = {
        {"id", "abc123"},
        {"name", "report.txt"},
        {"mimeType", "text/plain"},
        {"size", "2048"},
        {"createdTime", "2019-03-29T12:34:56.789Z"},
        {"modifiedTime", "2019-03-29T14:34:56+02:00"},
        {"parents", {"p1", "p2"}},
        {"md5Checksum", "d41d8cd98f00b204e9800998ecf8427e"}
    };
};

TEST_F(NodeTest, DecodesStoreResource) {
    const Node n(file, "docs");
    EXPECT_EQ(n.id, "abc123");
    EXPECT_EQ(n.name, "report.txt");
    EXPECT_EQ(n.kind(), NodeKind::File);
    ASSERT_TRUE(n.size.has_value());
    EXPECT_EQ(*n.size, 2048u);
    ASSERT_TRUE(n.created_at && n.modified_at);
    EXPECT_EQ(*n.created_at, 1553862896);
    EXPECT_EQ(*n.modified_at, 1553862896);
    EXPECT_EQ(n.parents, (std::vector<std::string>{"p1", "p2"}));
    EXPECT_EQ(n.parent(), "p1");
    EXPECT_EQ(n.md5_checksum, "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_FALSE(n.trashed);
    EXPECT_EQ(n.path(), "docs/report.txt");
}

TEST_F(NodeTest, NumericSizeAccepted) {
    file["size"] = 12;
    const Node n(file, "");
    EXPECT_EQ(n.size, 12u);
}

TEST_F(NodeTest, SignedIntegerSizeAccepted) {
    const Node n(json{{"id", "x"}, {"size", 12}}, "");
    ASSERT_TRUE(n.size.has_value());
    EXPECT_EQ(*n.size, 12u);

    const Node big(json{{"id", "y"}, {"size", static_cast<int64_t>(5) << 40}}, "");
    EXPECT_EQ(big.size, uintmax_t{5} << 40);
}

TEST_F(NodeTest, NegativeSizeIsInvariantViolation) {
    EXPECT_THROW(Node(json({{"id", "x"}, {"size", -1}}), ""), InvariantViolation);
}

TEST_F(NodeTest, MissingOptionalFieldsStayEmpty) {
    const Node n(json{{"id", "x"}, {"mimeType", std::string(FOLDER_MIME_TYPE)}}, "");
    EXPECT_TRUE(n.isDirectory());
    EXPECT_FALSE(n.size);
    EXPECT_FALSE(n.created_at);
    EXPECT_FALSE(n.md5_checksum);
    EXPECT_FALSE(n.parent());
}

TEST_F(NodeTest, BadTimestampIsInvariantViolation) {
    file["modifiedTime"] = "yesterday";
    EXPECT_THROW(Node(file, ""), InvariantViolation);
}

TEST_F(NodeTest, BadSizeIsInvariantViolation) {
    file["size"] = "lots";
    EXPECT_THROW(Node(file, ""), InvariantViolation);
}

TEST_F(NodeTest, PathUsesSanitizedName) {
    file["name"] = "a/b's";
    const Node n(file, "Folder1");
    EXPECT_EQ(n.displayName(), "a-b-s");
    EXPECT_EQ(n.path(), "Folder1/a-b-s");
}

TEST_F(NodeTest, RootPathIsEmpty) {
    Node root(file, "");
    root.is_root = true;
    EXPECT_EQ(root.path(), "");

    const auto child = root.withParentPath("x");
    EXPECT_FALSE(child.is_root);
    EXPECT_EQ(child.path(), "x/report.txt");
}

TEST_F(NodeTest, EncodesPathAndKind) {
    const Node n(file, "docs");
    const json j = n;
    EXPECT_EQ(j.at("path"), "docs/report.txt");
    EXPECT_EQ(j.at("kind"), "file");
    EXPECT_EQ(j.at("size"), 2048);
    EXPECT_EQ(j.at("modifiedTime"), "2019-03-29T12:34:56Z");
}
