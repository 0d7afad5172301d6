#include "shell/commands.hpp"
#include "shell/Router.hpp"
#include "shell/util/argsHelpers.hpp"
#include "drive/Driver.hpp"
#include "io/Reader.hpp"
#include "util/timestamp.hpp"

#include <fmt/format.h>
#include <array>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using namespace dt::shell;
using namespace dt::drive;
using namespace dt::drive::model;

namespace {

std::string formatNode(const Node& node) {
    return fmt::format("{} {:>12} {:<20} {}",
                       node.isDirectory() ? 'd' : '-',
                       node.size ? std::to_string(*node.size) : "-",
                       node.modified_at ? dt::util::timestampToString(*node.modified_at) : "-",
                       node.path().empty() ? "/" : node.path());
}

CommandResult nodeResult(const Node& node, const bool asJson) {
    CommandResult r = ok(asJson ? nlohmann::json(node).dump(2) + "\n" : formatNode(node) + "\n");
    r.data = node;
    r.has_data = true;
    return r;
}

// Collects visited nodes into text lines or a JSON array
class Listing {
public:
    explicit Listing(const bool asJson) : asJson_(asJson) {}

    void add(const Node& node) {
        if (asJson_) json_.push_back(node);
        else text_ += formatNode(node) + "\n";
    }

    CommandResult result() {
        CommandResult r = ok(asJson_ ? json_.dump(2) + "\n" : std::move(text_));
        r.data = std::move(json_);
        r.has_data = asJson_;
        return r;
    }

private:
    bool asJson_;
    std::string text_;
    nlohmann::json json_ = nlohmann::json::array();
};

void copyStream(dt::io::Reader& in, std::ostream& out) {
    std::array<char, 64 * 1024> buf{};
    while (const size_t n = in.read(buf.data(), buf.size())) {
        out.write(buf.data(), static_cast<std::streamsize>(n));
        if (!out) throw std::runtime_error("failed to write output");
    }
}

}

namespace dt::shell {

void registerDriveCommands(Router& r, const std::shared_ptr<Session>& session) {
    r.registerCommand({"stat", {"info"}, "stat <path> [--json]", "Show metadata of a file or directory", 1, 1},
        [session](const CommandCall& call) {
            return nodeResult(session->driver()->stat(call.positionals[0]), hasFlag(call, "json"));
        });

    r.registerCommand({"ls", {"list", "dir"}, "ls [path] [--json]", "List the direct children of a directory", 0, 1},
        [session](const CommandCall& call) {
            Listing listing(hasFlag(call, "json"));
            session->driver()->list(positionalOr(call, 0), [&](const Node& n) { listing.add(n); });
            return listing.result();
        });

    r.registerCommand({"mkdir", {}, "mkdir <path>", "Create a directory and any missing parents", 1, 1},
        [session](const CommandCall& call) {
            return nodeResult(session->driver()->makeDirectory(call.positionals[0]), hasFlag(call, "json"));
        });

    r.registerCommand({"rm", {"del", "delete"}, "rm <path>", "Permanently delete a file or directory tree", 1, 1},
        [session](const CommandCall& call) {
            session->driver()->remove(call.positionals[0]);
            return ok("");
        });

    r.registerCommand({"rmdir", {}, "rmdir <path>", "Permanently delete a directory tree", 1, 1},
        [session](const CommandCall& call) {
            session->driver()->removeDirectory(call.positionals[0]);
            return ok("");
        });

    r.registerCommand({"get", {"cat", "download"}, "get <path> [local-file]",
                       "Download a file to local-file, or to stdout", 1, 2},
        [session](const CommandCall& call) {
            auto [node, reader] = session->driver()->get(call.positionals[0]);

            if (call.positionals.size() == 2 && call.positionals[1] != "-") {
                std::ofstream out(call.positionals[1], std::ios::binary | std::ios::trunc);
                if (!out) return failed("unable to open " + call.positionals[1] + " for writing");
                copyStream(*reader, out);
                reader->close();
                return ok(fmt::format("{} -> {}\n", node.path(), call.positionals[1]));
            }

            copyStream(*reader, session->out ? *session->out : std::cout);
            reader->close();
            return ok("");
        });

    r.registerCommand({"put", {"upload"}, "put <path> [local-file] [--replace] [--json]",
                       "Upload local-file (or stdin) to path, creating missing directories", 1, 2},
        [session](const CommandCall& call) {
            const auto mode = hasFlag(call, "replace") ? PutMode::ReplaceExisting : PutMode::CreateNew;

            if (call.positionals.size() == 2 && call.positionals[1] != "-") {
                std::ifstream in(call.positionals[1], std::ios::binary);
                if (!in) return failed("unable to open " + call.positionals[1] + " for reading");
                io::IStreamReader reader(in);
                return nodeResult(session->driver()->put(call.positionals[0], reader, mode), hasFlag(call, "json"));
            }

            io::IStreamReader reader(session->in ? *session->in : std::cin);
            return nodeResult(session->driver()->put(call.positionals[0], reader, mode), hasFlag(call, "json"));
        });

    r.registerCommand({"hash", {"md5"}, "hash <path>", "Print the MD5 digest the store reports for a file", 1, 1},
        [session](const CommandCall& call) {
            const auto [node, digest] = session->driver()->getHash(call.positionals[0], HashMethod::MD5);
            return ok(fmt::format("{}  {}\n", digest, node.path()));
        });

    r.registerCommand({"mv", {"move"}, "mv <old-path> <new-path>",
                       "Move and/or rename, creating missing destination directories", 2, 2},
        [session](const CommandCall& call) {
            return nodeResult(session->driver()->move(call.positionals[0], call.positionals[1]), hasFlag(call, "json"));
        });

    r.registerCommand({"rename", {}, "rename <path> <new-name>", "Rename in place", 2, 2},
        [session](const CommandCall& call) {
            return nodeResult(session->driver()->rename(call.positionals[0], call.positionals[1]), hasFlag(call, "json"));
        });

    r.registerCommand({"trash", {}, "trash <path>", "Move a file or directory to the trash", 1, 1},
        [session](const CommandCall& call) {
            session->driver()->trash(call.positionals[0]);
            return ok("");
        });

    r.registerCommand({"trash-ls", {"trash-list", "lstrash"}, "trash-ls [path] [--json]",
                       "List trashed entries below path", 0, 1},
        [session](const CommandCall& call) {
            Listing listing(hasFlag(call, "json"));
            session->driver()->listTrash(positionalOr(call, 0), [&](const Node& n) { listing.add(n); });
            return listing.result();
        });

    r.registerCommand({"restore", {"untrash"}, "restore <path> [--json]", "Restore a trashed entry to its path", 1, 1},
        [session](const CommandCall& call) {
            return nodeResult(session->driver()->restore(call.positionals[0]), hasFlag(call, "json"));
        });
}

}
