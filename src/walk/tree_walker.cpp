// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <rclean/walk/tree_walker.h>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>

namespace fs = std::filesystem;

namespace rclean::walk {

namespace {

std::atomic<WalkId> g_nextWalkId{1};

} // namespace

// -----------------------------------------------------------------------------
// Walk
// -----------------------------------------------------------------------------

Walk::Walk(std::shared_ptr<io::IFileSystem> fs, fs::path root, WalkOptions options)
    : fs_(std::move(fs)), root_(std::move(root)), options_(std::move(options)),
      id_(g_nextWalkId.fetch_add(1, std::memory_order_relaxed)) {
    if (options_.workers > 0) {
        pool_ = std::make_unique<boost::asio::thread_pool>(options_.workers);
    }
}

Walk::Walk(Walk&&) noexcept = default;
Walk& Walk::operator=(Walk&&) noexcept = default;

Walk::~Walk() {
    // Drop outstanding prefetches before the pool goes away.
    stack_.clear();
    if (pool_) {
        pool_->stop();
        pool_->join();
    }
}

void Walk::expand(const fs::path& dir, const std::string& relativeDir, std::size_t depth,
                  std::vector<std::string> names) {
    std::sort(names.begin(), names.end());

    std::vector<Pending> children;
    children.reserve(names.size());
    for (auto& name : names) {
        Pending child;
        child.path = dir / name;
        child.relativePath = relativeDir.empty() ? name : relativeDir + "/" + name;
        child.depth = depth + 1;
        if (pool_) {
            auto task = std::make_shared<std::packaged_task<Result<io::EntryStat>()>>(
                [fs = fs_, path = child.path] { return fs->stat(path); });
            child.prefetched = task->get_future();
            boost::asio::post(*pool_, [task] { (*task)(); });
        }
        children.push_back(std::move(child));
    }

    // LIFO stack: push in reverse so the first name is visited first.
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
        stack_.push_back(std::move(*it));
    }
}

Result<io::EntryStat> Walk::resolve(Pending& pending) {
    if (auto* future = std::get_if<std::future<Result<io::EntryStat>>>(&pending.prefetched)) {
        return future->get();
    }
    return fs_->stat(pending.path);
}

std::optional<Entry> Walk::next() {
    if (stack_.empty()) {
        return std::nullopt;
    }
    if (options_.stopToken.stop_requested()) {
        if (!cancelled_) {
            spdlog::debug("walk {} cancelled after {} entries", id_, emitted_);
        }
        cancelled_ = true;
        stack_.clear();
        return std::nullopt;
    }

    Pending pending = std::move(stack_.back());
    stack_.pop_back();

    Entry entry;
    entry.path = pending.path;
    entry.relativePath = pending.relativePath;
    entry.depth = pending.depth;
    entry.walkId = id_;
    entry.ordinal = emitted_++;

    auto st = resolve(pending);
    if (!st) {
        spdlog::warn("Skipping {}: {}", entry.path.string(), st.error().message);
        entry.accessError = st.error();
        ++errors_;
        return entry;
    }

    const auto& info = st.value();
    entry.type = info.type;
    entry.size = info.size;
    entry.modified = info.modified;
    entry.symlinkTarget = info.symlinkTarget;
    entry.symlinkTargetExists = info.symlinkTargetExists;

    if (entry.type == EntryType::Directory) {
        auto names = fs_->list(entry.path);
        if (!names) {
            spdlog::warn("Cannot list {}: {}", entry.path.string(), names.error().message);
            entry.accessError = names.error();
            ++errors_;
            return entry;
        }
        entry.childCount = names.value().size();
        expand(entry.path, entry.relativePath, entry.depth, std::move(names).value());
    }

    return entry;
}

// -----------------------------------------------------------------------------
// TreeWalker
// -----------------------------------------------------------------------------

TreeWalker::TreeWalker(std::shared_ptr<io::IFileSystem> fs, WalkOptions options)
    : fs_(std::move(fs)), options_(std::move(options)) {
    if (!fs_) {
        throw std::invalid_argument("TreeWalker: filesystem cannot be null");
    }
}

Result<Walk> TreeWalker::walk(const fs::path& root) const {
    auto resolved = fs_->canonical(root);
    if (!resolved) {
        return Error{ErrorCode::InvalidRoot, fmt::format("Invalid root '{}': {}", root.string(),
                                                         resolved.error().message)};
    }
    const fs::path canonicalRoot = std::move(resolved).value();

    auto st = fs_->stat(canonicalRoot);
    if (!st) {
        return Error{ErrorCode::InvalidRoot, st.error().message};
    }
    if (st.value().type != EntryType::Directory) {
        return Error{ErrorCode::InvalidRoot,
                     fmt::format("Root is not a directory: {}", canonicalRoot.string())};
    }

    auto names = fs_->list(canonicalRoot);
    if (!names) {
        return Error{ErrorCode::InvalidRoot, names.error().message};
    }

    Walk walk(fs_, canonicalRoot, options_);
    walk.expand(canonicalRoot, "", 0, std::move(names).value());
    spdlog::debug("walk {} started at {}", walk.id(), canonicalRoot.string());
    return walk;
}

Result<std::vector<Entry>> TreeWalker::collect(const fs::path& root) const {
    auto walk = this->walk(root);
    if (!walk) {
        return walk.error();
    }
    auto& w = walk.value();

    std::vector<Entry> entries;
    while (auto entry = w.next()) {
        entries.push_back(std::move(*entry));
    }
    if (w.cancelled()) {
        return Error{ErrorCode::OperationCancelled,
                     fmt::format("Walk of {} cancelled", w.root().string())};
    }
    return entries;
}

} // namespace rclean::walk
