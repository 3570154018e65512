// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace rclean::rules {

enum class RuleKind {
    ExactName,    // basename equals pattern
    Suffix,       // basename ends with pattern
    DirName,      // directory basename equals pattern
    Glob,         // path glob relative to the walk root
    BrokenSymlink // symlink whose target does not exist
};

/**
 * @brief Detritus categories used for reporting and statistics
 */
enum class Category {
    Cache,        // tool and interpreter caches (__pycache__, .mypy_cache)
    Logs,         // .log, pip-log.txt
    BuildObject,  // .o, .obj, .pyc, .class
    BuildLibrary, // .a, .so, .dylib, .dll
    BuildOutput,  // dist/, build/, target/
    Dependencies, // node_modules/, vendor/
    Coverage,     // .coverage, coverage/, .nyc_output
    History,      // shell and REPL history files
    Temp,         // editor swap and backup files
    Ide,          // IDE project metadata
    System,       // OS droppings (.DS_Store, Thumbs.db)
    BrokenLink,   // dangling symlinks
    Other
};

enum class PolicyKind {
    Always,   // delete whenever matched
    IfEmpty,  // delete only empty directories/files; confirm otherwise
    OlderThan // delete when last modified at least `threshold` ago
};

struct Policy {
    PolicyKind kind = PolicyKind::Always;
    std::chrono::seconds threshold{0};

    bool operator==(const Policy&) const = default;
};

struct Rule {
    std::string pattern;
    RuleKind kind = RuleKind::ExactName;
    Category category = Category::Other;
    Policy policy;

    bool operator==(const Rule&) const = default;
};

// Uncompiled rule as read from a config file or preset table.
struct RuleDefinition {
    std::string pattern;
    std::string kind;     // exact | suffix | dirname | glob | broken-symlink
    std::string category; // see categoryName()
    std::string policy;   // always | if-empty | older-than
    std::string olderThan; // duration, required for older-than ("30d")
};

constexpr const char* ruleKindName(RuleKind kind) {
    switch (kind) {
        case RuleKind::ExactName:
            return "exact";
        case RuleKind::Suffix:
            return "suffix";
        case RuleKind::DirName:
            return "dirname";
        case RuleKind::Glob:
            return "glob";
        case RuleKind::BrokenSymlink:
            return "broken-symlink";
    }
    return "unknown";
}

constexpr const char* categoryName(Category cat) {
    switch (cat) {
        case Category::Cache:
            return "cache";
        case Category::Logs:
            return "logs";
        case Category::BuildObject:
            return "build-object";
        case Category::BuildLibrary:
            return "build-library";
        case Category::BuildOutput:
            return "build-output";
        case Category::Dependencies:
            return "dependencies";
        case Category::Coverage:
            return "coverage";
        case Category::History:
            return "history";
        case Category::Temp:
            return "temp";
        case Category::Ide:
            return "ide";
        case Category::System:
            return "system";
        case Category::BrokenLink:
            return "broken-link";
        case Category::Other:
            return "other";
    }
    return "unknown";
}

constexpr const char* policyKindName(PolicyKind kind) {
    switch (kind) {
        case PolicyKind::Always:
            return "always";
        case PolicyKind::IfEmpty:
            return "if-empty";
        case PolicyKind::OlderThan:
            return "older-than";
    }
    return "unknown";
}

std::optional<RuleKind> parseRuleKind(std::string_view name);
std::optional<Category> parseCategory(std::string_view name);
std::optional<PolicyKind> parsePolicyKind(std::string_view name);

} // namespace rclean::rules
