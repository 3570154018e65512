// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <rclean/core/types.h>
#include <rclean/io/file_system.h>
#include <rclean/walk/entry.h>

#include <cstddef>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <variant>
#include <vector>

namespace boost::asio {
class thread_pool;
}

namespace rclean::walk {

struct WalkOptions {
    // 0 stats entries inline; N > 0 prefetches sibling stats on N workers.
    std::size_t workers = 0;
    std::stop_token stopToken;
};

/**
 * One lazy traversal of a root directory.
 *
 * Depth-first pre-order with siblings in byte-wise name order. Symlinks are
 * leaves. Entries that cannot be stat'd or listed are returned with an
 * accessError instead of ending the walk.
 */
class Walk {
public:
    Walk(Walk&&) noexcept;
    Walk& operator=(Walk&&) noexcept;
    ~Walk();

    Walk(const Walk&) = delete;
    Walk& operator=(const Walk&) = delete;

    // Next entry in walk order, or nullopt when exhausted or cancelled.
    std::optional<Entry> next();

    [[nodiscard]] WalkId id() const noexcept { return id_; }
    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }
    [[nodiscard]] bool cancelled() const noexcept { return cancelled_; }
    [[nodiscard]] std::size_t emitted() const noexcept { return emitted_; }
    [[nodiscard]] std::size_t errorCount() const noexcept { return errors_; }

private:
    friend class TreeWalker;

    struct Pending {
        std::filesystem::path path;
        std::string relativePath;
        std::size_t depth = 0;
        std::variant<std::monostate, std::future<Result<io::EntryStat>>> prefetched;
    };

    Walk(std::shared_ptr<io::IFileSystem> fs, std::filesystem::path root, WalkOptions options);

    void expand(const std::filesystem::path& dir, const std::string& relativeDir,
                std::size_t depth, std::vector<std::string> names);
    Result<io::EntryStat> resolve(Pending& pending);

    std::shared_ptr<io::IFileSystem> fs_;
    std::filesystem::path root_;
    WalkOptions options_;
    WalkId id_ = 0;
    std::vector<Pending> stack_;
    std::unique_ptr<boost::asio::thread_pool> pool_;
    std::size_t emitted_ = 0;
    std::size_t errors_ = 0;
    bool cancelled_ = false;
};

class TreeWalker {
public:
    explicit TreeWalker(std::shared_ptr<io::IFileSystem> fs, WalkOptions options = {});

    /**
     * Begin a fresh traversal of `root`. Fails with InvalidRoot when the root
     * does not exist, is not a directory, or cannot be listed. The root
     * itself is not part of the sequence.
     */
    Result<Walk> walk(const std::filesystem::path& root) const;

    // Drain a complete walk into a vector.
    Result<std::vector<Entry>> collect(const std::filesystem::path& root) const;

private:
    std::shared_ptr<io::IFileSystem> fs_;
    WalkOptions options_;
};

} // namespace rclean::walk
