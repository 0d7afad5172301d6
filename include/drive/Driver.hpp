#pragma once

#include "config/Config.hpp"
#include "drive/TreeMutator.hpp"
#include "drive/file/OpenMode.hpp"
#include "drive/model/Node.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace dt::io {
class Reader;
}

namespace dt::drive::store {
class Store;
}

namespace dt::drive::file {
class File;
}

namespace dt::drive {

enum class HashMethod { MD5 = 0 };

struct FileContents {
    model::Node node;
    std::unique_ptr<io::Reader> reader;
};

/**
 * Path based access to a remote drive, rooted at a configurable directory.
 *
 * Every path is relative to the current root; "" and "/" are the root itself. The root is the
 * only state the driver keeps. It is swapped as a whole by setRootDirectory() and each operation
 * works on the snapshot it read when it started. Operations are otherwise independent and may be
 * called concurrently.
 */
class Driver {
public:
    // Resolves driverConfig.root_directory from the store's top-level folder
    explicit Driver(std::shared_ptr<store::Store> store,
                    const config::DriverConfig& driverConfig = {},
                    const config::IOConfig& ioConfig = {});

    // path is absolute, from the store's top-level folder, and must name a directory
    model::Node setRootDirectory(std::string_view path);

    [[nodiscard]] model::Node root() const;

    [[nodiscard]] model::Node stat(std::string_view path) const;

    void list(std::string_view path, const Visitor& visit) const;

    // Creates every missing directory along path
    model::Node makeDirectory(std::string_view path);

    // Deletes a file or a directory with its descendants
    void remove(std::string_view path);
    void removeDirectory(std::string_view path);

    [[nodiscard]] FileContents get(std::string_view path) const;

    // Node plus the lowercase hex digest the store reports
    [[nodiscard]] std::pair<model::Node, std::string> getHash(std::string_view path, HashMethod method) const;

    model::Node put(std::string_view path, io::Reader& content, PutMode mode = PutMode::CreateNew);

    model::Node rename(std::string_view path, std::string_view newName);

    // Reparents and renames to newPath's last segment, creating missing directories
    model::Node move(std::string_view oldPath, std::string_view newPath);

    void trash(std::string_view path);
    model::Node restore(std::string_view path);

    // Trashed descendants of scopePath, wherever they sit below it
    void listTrash(std::string_view scopePath, const Visitor& visit) const;

    [[nodiscard]] std::unique_ptr<file::File> open(std::string_view path, file::OpenMode mode);

    [[nodiscard]] const TreeMutator& mutator() const { return *mutator_; }

private:
    std::shared_ptr<store::Store> store_;
    std::shared_ptr<TreeMutator> mutator_;
    size_t pipeCapacity_;

    mutable std::mutex rootMutex_;
    std::shared_ptr<const model::Node> root_;

    [[nodiscard]] std::shared_ptr<const model::Node> snapshot() const;
};

}
