// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <rclean/common/units.h>
#include <rclean/exec/executor.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <stdexcept>

namespace fs = std::filesystem;

namespace rclean::exec {

using classify::Disposition;

namespace {

// True when `path` lies strictly below `root` after lexical normalization.
bool isStrictlyUnder(const fs::path& root, const fs::path& path) {
    if (root.empty() || !path.is_absolute())
        return false;
    auto rel = path.lexically_normal().lexically_relative(root.lexically_normal());
    if (rel.empty() || rel == ".")
        return false;
    return *rel.begin() != "..";
}

std::string reasonFor(const Error& error) {
    switch (error.code) {
        case ErrorCode::NotFound:
            return std::string(kReasonNotFound);
        case ErrorCode::Timeout:
            return "timed out";
        case ErrorCode::NotEmpty:
            return "directory not empty";
        default:
            return error.message;
    }
}

ActionResult finish(const fs::path& path, const Result<void>& removal, uint64_t bytes) {
    ActionResult r{path, Outcome::Deleted, {}, bytes};
    if (!removal) {
        const auto& err = removal.error();
        r.outcome = err.code == ErrorCode::NotFound ? Outcome::Skipped : Outcome::Failed;
        r.reason = reasonFor(err);
    }
    return r;
}

} // namespace

Executor::Executor(std::shared_ptr<io::IFileSystem> fs) : fs_(std::move(fs)) {
    if (!fs_) {
        throw std::invalid_argument("Executor: filesystem cannot be null");
    }
}

ExecutionResult Executor::execute(const plan::Plan& plan, const ConfirmFn& confirm,
                                  const ExecuteOptions& options) {
    auto start = std::chrono::steady_clock::now();
    ExecutionResult result;
    result.actions.reserve(plan.actions().size());

    for (const auto& action : plan.actions()) {
        if (options.stopToken.stop_requested()) {
            spdlog::info("Clean cancelled after {} of {} actions", result.actions.size(),
                         plan.actions().size());
            result.cancelled = true;
            break;
        }

        auto r = apply(plan, action, confirm);
        switch (r.outcome) {
            case Outcome::Deleted:
                ++result.deleted;
                spdlog::debug("Deleted {}", r.path.string());
                break;
            case Outcome::Skipped:
                ++result.skipped;
                spdlog::debug("Skipped {}: {}", r.path.string(), r.reason);
                break;
            case Outcome::Failed:
                ++result.failed;
                spdlog::warn("Failed to delete {}: {}", r.path.string(), r.reason);
                break;
        }
        result.bytesFreed += r.bytes;
        result.actions.push_back(std::move(r));
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    spdlog::info("Clean finished in {}ms: {} deleted, {} skipped, {} failed, {} freed",
                 elapsed.count(), result.deleted, result.skipped, result.failed,
                 common::formatSize(result.bytesFreed));
    return result;
}

ActionResult Executor::apply(const plan::Plan& plan, const classify::Verdict& action,
                             const ConfirmFn& confirm) {
    const auto& entry = action.entry;
    const auto& path = entry.path;

    if (!isStrictlyUnder(plan.root(), path)) {
        return {path, Outcome::Failed, "outside plan root", 0};
    }

    auto st = fs_->stat(path);
    if (!st) {
        if (st.error().code == ErrorCode::NotFound) {
            return {path, Outcome::Skipped, std::string(kReasonNotFound), 0};
        }
        return {path, Outcome::Failed, reasonFor(st.error()), 0};
    }
    const auto& current = st.value();
    if (current.type != entry.type) {
        return {path, Outcome::Failed,
                fmt::format("entry type changed ({} -> {})", io::entryTypeName(entry.type),
                            io::entryTypeName(current.type)),
                0};
    }

    if (action.disposition == Disposition::NeedsConfirmation) {
        if (!confirm || !confirm(entry)) {
            return {path, Outcome::Skipped, std::string(kReasonUnconfirmed), 0};
        }
    }

    if (current.type != io::EntryType::Directory) {
        const uint64_t bytes = current.type == io::EntryType::File ? current.size : 0;
        auto removed = fs_->removeFile(path);
        return finish(path, removed, removed ? bytes : 0);
    }

    if (action.disposition == Disposition::DeleteIfEmpty) {
        return finish(path, fs_->removeDirectory(path), 0);
    }

    uint64_t bytes = 0;
    auto removed = removeTree(path, bytes);
    return finish(path, removed, bytes);
}

Result<void> Executor::removeTree(const fs::path& dir, uint64_t& bytes) {
    struct Frame {
        fs::path path;
        bool expanded = false;
    };

    std::vector<Frame> stack;
    stack.push_back({dir, false});

    while (!stack.empty()) {
        if (stack.back().expanded) {
            auto path = std::move(stack.back().path);
            stack.pop_back();
            auto removed = fs_->removeDirectory(path);
            if (!removed && (removed.error().code != ErrorCode::NotFound || path == dir)) {
                return removed;
            }
            continue;
        }

        stack.back().expanded = true;
        const fs::path current = stack.back().path;

        auto names = fs_->list(current);
        if (!names) {
            if (names.error().code == ErrorCode::NotFound && current != dir) {
                stack.pop_back();
                continue;
            }
            return names.error();
        }

        for (const auto& name : names.value()) {
            auto child = current / name;
            auto st = fs_->stat(child);
            if (!st) {
                if (st.error().code == ErrorCode::NotFound)
                    continue;
                return st.error();
            }
            if (st.value().type == io::EntryType::Directory) {
                stack.push_back({child, false});
                continue;
            }
            auto removed = fs_->removeFile(child);
            if (!removed) {
                if (removed.error().code == ErrorCode::NotFound)
                    continue;
                return removed;
            }
            if (st.value().type == io::EntryType::File) {
                bytes += st.value().size;
            }
        }
    }
    return {};
}

} // namespace rclean::exec
