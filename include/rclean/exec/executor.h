// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <rclean/core/types.h>
#include <rclean/io/file_system.h>
#include <rclean/plan/plan.h>
#include <rclean/walk/entry.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace rclean::exec {

enum class Outcome { Deleted, Skipped, Failed };

constexpr const char* outcomeName(Outcome outcome) {
    switch (outcome) {
        case Outcome::Deleted:
            return "deleted";
        case Outcome::Skipped:
            return "skipped";
        case Outcome::Failed:
            return "failed";
    }
    return "unknown";
}

inline constexpr std::string_view kReasonUnconfirmed = "unconfirmed";
inline constexpr std::string_view kReasonNotFound = "not found";

struct ActionResult {
    std::filesystem::path path;
    Outcome outcome = Outcome::Skipped;
    std::string reason; // empty for Deleted
    uint64_t bytes = 0; // file bytes actually removed
};

struct ExecutionResult {
    std::vector<ActionResult> actions; // plan order; shorter than the plan when cancelled
    std::size_t deleted = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;
    uint64_t bytesFreed = 0;
    bool cancelled = false;

    [[nodiscard]] bool hasFailures() const noexcept { return failed > 0; }
};

// Asked once per NeedsConfirmation action; an empty function declines.
using ConfirmFn = std::function<bool(const walk::Entry&)>;

struct ExecuteOptions {
    std::stop_token stopToken;
};

/**
 * Applies a Plan to the filesystem in plan order.
 *
 * Each action ends Deleted, Skipped or Failed and is never retried; a failure
 * is recorded and execution moves on. Nothing outside the plan root, and never
 * the root itself, is removed.
 */
class Executor {
public:
    explicit Executor(std::shared_ptr<io::IFileSystem> fs);

    ExecutionResult execute(const plan::Plan& plan, const ConfirmFn& confirm = {},
                            const ExecuteOptions& options = {});

private:
    ActionResult apply(const plan::Plan& plan, const classify::Verdict& action,
                       const ConfirmFn& confirm);

    // Post-order removal of a directory and everything below it. `bytes`
    // accumulates the sizes of removed files even when the removal fails.
    Result<void> removeTree(const std::filesystem::path& dir, uint64_t& bytes);

    std::shared_ptr<io::IFileSystem> fs_;
};

} // namespace rclean::exec
