// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <rclean/exec/executor.h>
#include <rclean/plan/plan.h>
#include <rclean/rules/rule.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace rclean::report {

struct Bucket {
    std::size_t count = 0;
    uint64_t bytes = 0;
};

/**
 * @brief Aggregates over a plan's actions
 *
 * Bytes follow the plan estimate: only File actions with disposition Delete
 * or DeleteIfEmpty contribute. `byPattern` is keyed "<kind>:<pattern>".
 * Symlinks promoted because their target is scheduled carry no rule; they
 * are counted in `promotedLinks` and under the "(symlink target)" pattern,
 * never in `byCategory`.
 */
struct PlanStats {
    Bucket total;
    Bucket needsConfirmation;
    Bucket promotedLinks;
    std::map<rules::Category, Bucket> byCategory;
    std::map<std::string, Bucket> byPattern;
};

PlanStats computeStats(const plan::Plan& plan);

// Human-readable dry-run listing: actions in order, then conflicts, access
// errors and exclusions, then totals.
std::string formatPlan(const plan::Plan& plan);

std::string formatExecution(const exec::ExecutionResult& result);

nlohmann::json toJson(const plan::Plan& plan);
nlohmann::json toJson(const exec::ExecutionResult& result);

} // namespace rclean::report
