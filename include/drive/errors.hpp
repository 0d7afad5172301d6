#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <fmt/format.h>

namespace dt::drive {

class DriveError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class NotFoundError : public DriveError {
public:
    explicit NotFoundError(std::string path)
        : DriveError(fmt::format("`{}' does not exist", path)), path_(std::move(path)) {}

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

class AlreadyExistsError : public DriveError {
public:
    explicit AlreadyExistsError(std::string path)
        : DriveError(fmt::format("`{}' already exists", path)), path_(std::move(path)) {}

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

class AmbiguousEntryError : public DriveError {
public:
    explicit AmbiguousEntryError(std::string path)
        : DriveError(fmt::format("multiple entries found for `{}'", path)), path_(std::move(path)) {}

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

class NotADirectoryError : public DriveError {
public:
    explicit NotADirectoryError(std::string path)
        : DriveError(fmt::format("`{}' is not a directory", path)), path_(std::move(path)) {}

    // path names the offending node, message carries the operation context
    NotADirectoryError(std::string path, const std::string& message)
        : DriveError(message), path_(std::move(path)) {}

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

class IsADirectoryError : public DriveError {
public:
    explicit IsADirectoryError(std::string path)
        : DriveError(fmt::format("`{}' is a directory", path)), path_(std::move(path)) {}

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

class InvalidArgumentError : public DriveError {
public:
    using DriveError::DriveError;
};

class RootMutationError : public InvalidArgumentError {
public:
    // verb: "deleted", "renamed", "moved", "trashed"
    explicit RootMutationError(const std::string& verb)
        : InvalidArgumentError("root cannot be " + verb) {}
};

class UsageError : public DriveError {
public:
    using DriveError::DriveError;
};

// Thrown with the visitor's exception nested (std::throw_with_nested)
class CallbackError : public DriveError {
public:
    explicit CallbackError(const std::string& nested)
        : DriveError("callback threw an error: " + nested) {}
};

class BackingStoreError : public DriveError {
public:
    BackingStoreError(const long status, const std::string& message)
        : DriveError(status ? fmt::format("backing store error (HTTP {}): {}", status, message)
                            : "backing store error: " + message),
          status_(status) {}

    [[nodiscard]] long status() const noexcept { return status_; }

private:
    long status_;
};

// Store response broke an assumption the engine cannot recover from
class InvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

}
