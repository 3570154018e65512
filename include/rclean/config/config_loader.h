// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <rclean/core/types.h>
#include <rclean/rules/rule.h>
#include <rclean/rules/rule_set.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rclean::config {

struct EngineSettings {
    std::size_t workers = 0; // stat prefetch workers, 0 = inline
    Duration timeout{0};     // per filesystem call, 0 = unbounded
    bool removeDanglingSymlinks = true;
};

struct LoggingSettings {
    std::string level = "info"; // trace | debug | info | warn | error | critical | off
    std::filesystem::path file; // rotating log file, empty = default sink only
};

/**
 * @brief Parsed rclean config file
 *
 * Example:
 * @code
 * version = 1
 * presets = ["python", "node"]
 * exclude = ["vendor/**"]
 * older_than = "7d"
 *
 * [engine]
 * workers = 4
 * timeout_ms = 2000
 *
 * [[rule]]
 * pattern = ".log"
 * kind = "suffix"
 * category = "logs"
 * policy = "older-than"
 * older_than = "30d"
 * @endcode
 */
struct CleanConfig {
    uint32_t version = rules::kRuleSchemaVersion;
    std::vector<std::string> presets;
    std::vector<std::string> excludes;
    std::optional<std::chrono::seconds> olderThan; // applied to preset rules only
    std::vector<rules::RuleDefinition> rules;
    EngineSettings engine;
    LoggingSettings logging;
    std::filesystem::path source;
};

// Parse config text. Errors are ConfigError prefixed with "<source>:<line>:".
Result<CleanConfig> parseConfig(std::string_view text, const std::filesystem::path& source = {});

Result<CleanConfig> loadConfigFile(const std::filesystem::path& path);

/**
 * Custom rules first, in file order, then each preset in listed order with
 * definitions already present skipped. With neither rules nor presets the
 * defaults (common + python) are used.
 */
Result<rules::RuleSet> buildRuleSet(const CleanConfig& config);

// Apply level and optional rotating file sink to the default spdlog logger.
Result<void> configureLogging(const LoggingSettings& settings);

} // namespace rclean::config
