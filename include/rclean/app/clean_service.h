// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <rclean/config/config_loader.h>
#include <rclean/core/types.h>
#include <rclean/exec/executor.h>
#include <rclean/io/file_system.h>
#include <rclean/plan/plan.h>
#include <rclean/plan/plan_builder.h>
#include <rclean/rules/rule_set.h>
#include <rclean/walk/tree_walker.h>

#include <filesystem>
#include <memory>
#include <optional>

namespace rclean::app {

struct ScanOptions {
    walk::WalkOptions walk;
    plan::PlanOptions plan;
    // Reference time for age policies; the system clock when unset.
    std::optional<TimePoint> now;
};

/**
 * @brief Dry-run and clean entry points for an embedding CLI
 *
 * scan() walks, classifies and plans without touching the tree; clean()
 * executes a plan. The same filesystem is used for both.
 */
class CleanService {
public:
    explicit CleanService(std::shared_ptr<io::IFileSystem> fs);

    Result<plan::Plan> scan(const std::filesystem::path& root, const rules::RuleSet& ruleSet,
                            const ScanOptions& options = {}) const;

    exec::ExecutionResult clean(const plan::Plan& plan, const exec::ConfirmFn& confirm = {},
                                const exec::ExecuteOptions& options = {}) const;

private:
    std::shared_ptr<io::IFileSystem> fs_;
};

// Local filesystem, wrapped in the timed decorator when settings.timeout > 0.
std::shared_ptr<io::IFileSystem> makeFileSystem(const config::EngineSettings& settings);

// Scan options carrying the engine settings (worker count, symlink handling).
ScanOptions makeScanOptions(const config::EngineSettings& settings);

} // namespace rclean::app
