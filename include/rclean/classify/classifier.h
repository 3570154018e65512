// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <rclean/core/types.h>
#include <rclean/rules/rule.h>
#include <rclean/rules/rule_set.h>
#include <rclean/walk/entry.h>

#include <optional>
#include <string>
#include <vector>

namespace rclean::classify {

enum class Disposition { Keep, Delete, DeleteIfEmpty, NeedsConfirmation };

constexpr const char* dispositionName(Disposition d) {
    switch (d) {
        case Disposition::Keep:
            return "keep";
        case Disposition::Delete:
            return "delete";
        case Disposition::DeleteIfEmpty:
            return "delete-if-empty";
        case Disposition::NeedsConfirmation:
            return "needs-confirmation";
    }
    return "unknown";
}

/**
 * @brief Classifier decision for one entry
 *
 * `rule` is the first matching rule, if any. `note` explains a Keep or a
 * NeedsConfirmation in words ("newer than 30d", "directory not empty").
 */
struct Verdict {
    walk::Entry entry;
    std::optional<rules::Rule> rule;
    Disposition disposition = Disposition::Keep;
    std::string note;
    bool excluded = false;

    [[nodiscard]] bool scheduled() const noexcept { return disposition != Disposition::Keep; }
};

// Inputs that would otherwise be read from the environment.
struct ClassifyContext {
    TimePoint now{};
};

/**
 * Decide what to do with `entry`. Deterministic: identical inputs give an
 * identical verdict, and nothing is read from the clock or filesystem.
 */
Verdict classify(const walk::Entry& entry, const rules::RuleSet& ruleSet,
                 const ClassifyContext& context);

std::vector<Verdict> classifyAll(const std::vector<walk::Entry>& entries,
                                 const rules::RuleSet& ruleSet, const ClassifyContext& context);

} // namespace rclean::classify
