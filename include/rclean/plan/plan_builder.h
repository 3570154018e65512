// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <rclean/classify/classifier.h>
#include <rclean/core/types.h>
#include <rclean/plan/plan.h>

#include <cstdint>
#include <vector>

namespace rclean::plan {

struct PlanOptions {
    // Schedule kept symlinks whose target is being deleted.
    bool removeDanglingSymlinks = true;
};

/**
 * Turns one walk's verdicts into an ordered Plan.
 *
 * Ordering constraints: a symlink goes before its target and before the
 * target's nearest scheduled ancestor; directory contents go before the
 * directory. Ties are broken by walk order.
 */
class PlanBuilder {
public:
    explicit PlanBuilder(PlanOptions options = {}) : options_(options) {}

    // Fails with InvalidArgument when verdicts come from more than one walk.
    Result<Plan> build(std::vector<classify::Verdict> verdicts) const;

    // Bytes held by File actions with disposition Delete or DeleteIfEmpty.
    static uint64_t estimateBytes(const Plan& plan);

private:
    PlanOptions options_;
};

} // namespace rclean::plan
