// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <rclean/classify/classifier.h>
#include <rclean/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace rclean::plan {

enum class ConflictKind {
    TargetScheduled,                // symlink and its target are both scheduled
    TargetInsideScheduledDirectory, // symlink target lives under a scheduled directory
    SymlinkCycle                    // ordering constraints formed a cycle
};

constexpr const char* conflictKindName(ConflictKind kind) {
    switch (kind) {
        case ConflictKind::TargetScheduled:
            return "target-scheduled";
        case ConflictKind::TargetInsideScheduledDirectory:
            return "target-inside-scheduled-directory";
        case ConflictKind::SymlinkCycle:
            return "symlink-cycle";
    }
    return "unknown";
}

struct PlanConflict {
    ConflictKind kind;
    std::filesystem::path symlink;
    std::filesystem::path target;
    std::string detail;
};

struct AccessIssue {
    std::filesystem::path path;
    Error error;
};

struct Exclusion {
    std::filesystem::path path;
    std::string reason;
};

class PlanBuilder;

/**
 * @brief Ordered, immutable set of deletion actions from one walk
 *
 * Actions are the non-Keep verdicts in execution order. Only PlanBuilder
 * constructs non-empty plans.
 */
class Plan {
public:
    Plan() = default;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }
    [[nodiscard]] WalkId walkId() const noexcept { return walkId_; }
    [[nodiscard]] const std::vector<classify::Verdict>& actions() const noexcept {
        return actions_;
    }
    [[nodiscard]] uint64_t totalBytes() const noexcept { return totalBytes_; }
    // Number of entries the walk produced, scheduled or not.
    [[nodiscard]] std::size_t entryCount() const noexcept { return entryCount_; }
    [[nodiscard]] const std::vector<PlanConflict>& conflicts() const noexcept {
        return conflicts_;
    }
    [[nodiscard]] const std::vector<AccessIssue>& accessErrors() const noexcept {
        return accessErrors_;
    }
    [[nodiscard]] const std::vector<Exclusion>& exclusions() const noexcept {
        return exclusions_;
    }
    [[nodiscard]] bool empty() const noexcept { return actions_.empty(); }

private:
    friend class PlanBuilder;

    std::filesystem::path root_;
    WalkId walkId_ = 0;
    std::vector<classify::Verdict> actions_;
    uint64_t totalBytes_ = 0;
    std::size_t entryCount_ = 0;
    std::vector<PlanConflict> conflicts_;
    std::vector<AccessIssue> accessErrors_;
    std::vector<Exclusion> exclusions_;
};

} // namespace rclean::plan
