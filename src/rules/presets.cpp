// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <rclean/common/units.h>
#include <rclean/rules/presets.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

#include <algorithm>
#include <array>

namespace rclean::rules {

namespace {

struct PresetRule {
    std::string_view pattern;
    std::string_view kind;
    std::string_view category;
    std::string_view policy;
};

// Output directories that may hold hand-made content are "if-empty": the
// executor asks before removing them when they are not empty.
constexpr std::array kCommon = {
    PresetRule{".DS_Store", "exact", "system", "always"},
    PresetRule{"Thumbs.db", "exact", "system", "always"},
    PresetRule{".bash_history", "exact", "history", "always"},
    PresetRule{".python_history", "exact", "history", "always"},
    PresetRule{".swp", "suffix", "temp", "always"},
    PresetRule{".swo", "suffix", "temp", "always"},
    PresetRule{"~", "suffix", "temp", "always"},
};

constexpr std::array kPython = {
    PresetRule{"__pycache__", "dirname", "cache", "always"},
    PresetRule{".coverage", "exact", "coverage", "always"},
    PresetRule{".mypy_cache", "dirname", "cache", "always"},
    PresetRule{".pylint_cache", "dirname", "cache", "always"},
    PresetRule{".pytest_cache", "dirname", "cache", "always"},
    PresetRule{".ruff_cache", "dirname", "cache", "always"},
    PresetRule{".rumdl_cache", "dirname", "cache", "always"},
    PresetRule{".pyscn", "dirname", "cache", "always"},
    PresetRule{".ropeproject", "dirname", "ide", "always"},
    PresetRule{".python_history", "exact", "history", "always"},
    PresetRule{"pip-log.txt", "exact", "logs", "always"},
    PresetRule{".pyc", "suffix", "build-object", "always"},
    PresetRule{".pyo", "suffix", "build-object", "always"},
    PresetRule{".egg-info", "suffix", "build-output", "always"},
    PresetRule{"dist", "dirname", "build-output", "if-empty"},
};

constexpr std::array kNode = {
    PresetRule{"node_modules", "dirname", "dependencies", "if-empty"},
    PresetRule{".next", "dirname", "build-output", "always"},
    PresetRule{".nuxt", "dirname", "build-output", "always"},
    PresetRule{".cache", "dirname", "cache", "always"},
    PresetRule{"dist", "dirname", "build-output", "if-empty"},
    PresetRule{".parcel-cache", "dirname", "cache", "always"},
    PresetRule{".turbo", "dirname", "cache", "always"},
    PresetRule{".eslintcache", "exact", "cache", "always"},
    PresetRule{"coverage", "dirname", "coverage", "if-empty"},
    PresetRule{".nyc_output", "dirname", "coverage", "always"},
};

constexpr std::array kRust = {
    PresetRule{"target", "dirname", "build-output", "if-empty"},
};

constexpr std::array kJava = {
    PresetRule{".class", "suffix", "build-object", "always"},
    PresetRule{"target", "dirname", "build-output", "if-empty"},
    PresetRule{".gradle", "dirname", "cache", "always"},
    PresetRule{"build", "dirname", "build-output", "if-empty"},
    PresetRule{".settings", "dirname", "ide", "always"},
    PresetRule{".classpath", "exact", "ide", "always"},
    PresetRule{".project", "exact", "ide", "always"},
};

constexpr std::array kC = {
    PresetRule{".o", "suffix", "build-object", "always"},
    PresetRule{".obj", "suffix", "build-object", "always"},
    PresetRule{".a", "suffix", "build-library", "always"},
    PresetRule{".lib", "suffix", "build-library", "always"},
    PresetRule{".so", "suffix", "build-library", "always"},
    PresetRule{".dylib", "suffix", "build-library", "always"},
    PresetRule{".dll", "suffix", "build-library", "always"},
};

constexpr std::array kGo = {
    PresetRule{"vendor", "dirname", "dependencies", "if-empty"},
};

constexpr std::array<std::string_view, 8> kPresetNames = {"common", "python", "node", "rust",
                                                          "java",   "c",      "go",   "all"};

template <std::size_t N>
std::vector<RuleDefinition> toDefinitions(const std::array<PresetRule, N>& table) {
    std::vector<RuleDefinition> out;
    out.reserve(N);
    for (const auto& r : table) {
        out.push_back(RuleDefinition{std::string(r.pattern), std::string(r.kind),
                                     std::string(r.category), std::string(r.policy), ""});
    }
    return out;
}

std::vector<RuleDefinition> dedupe(const std::vector<RuleDefinition>& defs) {
    std::vector<RuleDefinition> out;
    appendUnique(out, defs);
    return out;
}

std::optional<std::vector<RuleDefinition>> lookup(std::string_view name) {
    if (name == "common")
        return toDefinitions(kCommon);
    if (name == "python")
        return dedupe(toDefinitions(kPython));
    if (name == "node")
        return toDefinitions(kNode);
    if (name == "rust")
        return toDefinitions(kRust);
    if (name == "java")
        return toDefinitions(kJava);
    if (name == "c")
        return toDefinitions(kC);
    if (name == "go")
        return toDefinitions(kGo);
    if (name == "all") {
        std::vector<RuleDefinition> all;
        for (auto preset : kPresetNames) {
            if (preset == "all")
                continue;
            appendUnique(all, *lookup(preset));
        }
        return all;
    }
    return std::nullopt;
}

} // namespace

std::span<const std::string_view> presetNames() {
    return kPresetNames;
}

void appendUnique(std::vector<RuleDefinition>& base, const std::vector<RuleDefinition>& extra) {
    for (const auto& def : extra) {
        bool present = std::any_of(base.begin(), base.end(), [&](const RuleDefinition& existing) {
            return existing.kind == def.kind && existing.pattern == def.pattern;
        });
        if (!present) {
            base.push_back(def);
        }
    }
}

Result<std::vector<RuleDefinition>> presetRules(std::string_view name,
                                                std::optional<std::chrono::seconds> olderThan) {
    auto defs = lookup(name);
    if (!defs) {
        return Error{ErrorCode::ConfigError,
                     fmt::format("Unknown preset '{}'. Available: {}", name,
                                 fmt::join(kPresetNames, ", "))};
    }
    if (olderThan) {
        for (auto& def : *defs) {
            if (def.policy == "always") {
                def.policy = "older-than";
                def.olderThan = common::formatDuration(*olderThan);
            }
        }
    }
    return std::move(*defs);
}

std::vector<RuleDefinition> defaultRules(std::optional<std::chrono::seconds> olderThan) {
    auto rules = std::move(presetRules("common", olderThan)).value();
    appendUnique(rules, presetRules("python", olderThan).value());
    return rules;
}

} // namespace rclean::rules
