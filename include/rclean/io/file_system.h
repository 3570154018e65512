// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <rclean/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace rclean::io {

enum class EntryType { File, Directory, Symlink, Other };

constexpr const char* entryTypeName(EntryType type) {
    switch (type) {
        case EntryType::File:
            return "file";
        case EntryType::Directory:
            return "directory";
        case EntryType::Symlink:
            return "symlink";
        case EntryType::Other:
            return "other";
    }
    return "unknown";
}

// lstat-style snapshot of a single path. Symlinks are never followed except to
// check whether their target exists.
struct EntryStat {
    EntryType type = EntryType::Other;
    uint64_t size = 0;
    TimePoint modified{};
    std::optional<std::filesystem::path> symlinkTarget;
    bool symlinkTargetExists = false;
};

/**
 * Minimal filesystem surface used by the walker and executor.
 *
 * All operations report failures through Result; NotFound is reserved for
 * paths that do not exist (callers treat it as a benign race).
 */
class IFileSystem {
public:
    virtual ~IFileSystem() = default;

    virtual Result<EntryStat> stat(const std::filesystem::path& path) const = 0;

    // Absolute path with symlinks and dot segments resolved. The path must exist.
    virtual Result<std::filesystem::path> canonical(const std::filesystem::path& path) const = 0;

    // Names of the direct children of a directory, in unspecified order.
    virtual Result<std::vector<std::string>> list(const std::filesystem::path& dir) const = 0;

    // Unlink a file, symlink or other non-directory entry.
    virtual Result<void> removeFile(const std::filesystem::path& path) = 0;

    // Remove an empty directory.
    virtual Result<void> removeDirectory(const std::filesystem::path& path) = 0;
};

std::shared_ptr<IFileSystem> makeLocalFileSystem();

/**
 * Decorator that bounds every call on `inner` by `timeout`, measured from the
 * moment the call starts. Each call runs on its own detached thread; a call
 * that does not finish in time yields ErrorCode::Timeout and is abandoned.
 * An abandoned call keeps `inner` alive until it returns, so destroying the
 * decorator never waits on a hung call.
 */
std::shared_ptr<IFileSystem> makeTimedFileSystem(std::shared_ptr<IFileSystem> inner,
                                                 Duration timeout);

// Map an errno value or std::error_code from operation `op` on `path` onto an Error.
Error errorFromErrno(int err, const std::filesystem::path& path, const char* op);
Error errorFromCode(const std::error_code& ec, const std::filesystem::path& path, const char* op);

} // namespace rclean::io
