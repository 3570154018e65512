// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <rclean/core/types.h>
#include <rclean/rules/rule.h>

#include <chrono>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace rclean::rules {

// common, python, node, rust, java, c, go, all
std::span<const std::string_view> presetNames();

/**
 * Rule definitions for a named preset, in declaration order.
 *
 * "all" is the union of every other preset with duplicates removed (first
 * occurrence wins). With `olderThan`, rules whose policy is "always" become
 * "older-than" with that threshold. Unknown names fail with ConfigError.
 */
Result<std::vector<RuleDefinition>>
presetRules(std::string_view name, std::optional<std::chrono::seconds> olderThan = std::nullopt);

// "common" followed by "python", de-duplicated, with the same `olderThan` handling.
std::vector<RuleDefinition>
defaultRules(std::optional<std::chrono::seconds> olderThan = std::nullopt);

// Append `extra` to `base`, skipping definitions whose (kind, pattern) already appear.
void appendUnique(std::vector<RuleDefinition>& base, const std::vector<RuleDefinition>& extra);

} // namespace rclean::rules
