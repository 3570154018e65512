// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <rclean/core/types.h>
#include <rclean/io/file_system.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace rclean::walk {

using io::EntryType;

/**
 * One filesystem object discovered by a single walker pass.
 *
 * A read-only snapshot: it goes stale if the tree changes afterwards. Entries
 * carrying an accessError are the walker's error-entries; every other field
 * except path, relativePath, depth, walkId and ordinal is then unspecified.
 */
struct Entry {
    std::filesystem::path path;   // absolute
    std::string relativePath;     // '/'-separated, relative to the walk root
    std::size_t depth = 0;        // 1 for direct children of the root
    EntryType type = EntryType::Other;
    uint64_t size = 0;            // bytes, regular files only
    TimePoint modified{};
    std::optional<std::filesystem::path> symlinkTarget;
    bool symlinkTargetExists = false;
    std::size_t childCount = 0;   // directories only
    WalkId walkId = 0;
    std::size_t ordinal = 0;      // position in walk order
    std::optional<Error> accessError;

    [[nodiscard]] bool accessible() const noexcept { return !accessError.has_value(); }

    [[nodiscard]] std::string name() const { return path.filename().string(); }

    // Absolute, lexically normalized symlink target (relative targets resolve
    // against the link's parent directory).
    [[nodiscard]] std::optional<std::filesystem::path> resolvedTarget() const {
        if (!symlinkTarget)
            return std::nullopt;
        if (symlinkTarget->is_absolute())
            return symlinkTarget->lexically_normal();
        return (path.parent_path() / *symlinkTarget).lexically_normal();
    }

    // Root directory of the walk this entry came from.
    [[nodiscard]] std::filesystem::path walkRoot() const {
        auto root = path;
        for (std::size_t i = 0; i < depth; ++i) {
            root = root.parent_path();
        }
        return root;
    }
};

} // namespace rclean::walk
