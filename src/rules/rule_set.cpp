// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <rclean/common/pattern_utils.h>
#include <rclean/common/units.h>
#include <rclean/rules/rule_set.h>

#include <spdlog/spdlog.h>

#include <array>
#include <functional>
#include <set>
#include <utility>

namespace rclean::rules {

// -----------------------------------------------------------------------------
// Name tables
// -----------------------------------------------------------------------------

std::optional<RuleKind> parseRuleKind(std::string_view name) {
    static constexpr std::array kinds = {RuleKind::ExactName, RuleKind::Suffix, RuleKind::DirName,
                                         RuleKind::Glob, RuleKind::BrokenSymlink};
    for (auto kind : kinds) {
        if (name == ruleKindName(kind))
            return kind;
    }
    return std::nullopt;
}

std::optional<Category> parseCategory(std::string_view name) {
    static constexpr std::array categories = {
        Category::Cache,        Category::Logs,     Category::BuildObject, Category::BuildLibrary,
        Category::BuildOutput,  Category::Dependencies, Category::Coverage, Category::History,
        Category::Temp,         Category::Ide,      Category::System,      Category::BrokenLink,
        Category::Other};
    for (auto cat : categories) {
        if (name == categoryName(cat))
            return cat;
    }
    return std::nullopt;
}

std::optional<PolicyKind> parsePolicyKind(std::string_view name) {
    static constexpr std::array kinds = {PolicyKind::Always, PolicyKind::IfEmpty,
                                         PolicyKind::OlderThan};
    for (auto kind : kinds) {
        if (name == policyKindName(kind))
            return kind;
    }
    return std::nullopt;
}

// -----------------------------------------------------------------------------
// Matchers
// -----------------------------------------------------------------------------

bool ExactNameMatcher::matches(const walk::Entry& entry) const {
    return entry.name() == name;
}

bool SuffixMatcher::matches(const walk::Entry& entry) const {
    const auto base = entry.name();
    return base.size() >= suffix.size() &&
           base.compare(base.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool DirNameMatcher::matches(const walk::Entry& entry) const {
    return entry.type == walk::EntryType::Directory && entry.name() == name;
}

bool GlobMatcher::matches(const walk::Entry& entry) const {
    return common::glob_match_path(entry.relativePath, glob);
}

bool BrokenSymlinkMatcher::matches(const walk::Entry& entry) const {
    return entry.type == walk::EntryType::Symlink && !entry.symlinkTargetExists;
}

Matcher makeMatcher(const Rule& rule) {
    switch (rule.kind) {
        case RuleKind::ExactName:
            return ExactNameMatcher{rule.pattern};
        case RuleKind::Suffix:
            return SuffixMatcher{rule.pattern};
        case RuleKind::DirName:
            return DirNameMatcher{rule.pattern};
        case RuleKind::Glob:
            return GlobMatcher{rule.pattern};
        case RuleKind::BrokenSymlink:
            return BrokenSymlinkMatcher{};
    }
    return BrokenSymlinkMatcher{};
}

// -----------------------------------------------------------------------------
// Validation
// -----------------------------------------------------------------------------

namespace {

Result<void> validateRule(const Rule& rule, std::size_t index) {
    auto fail = [&](std::string_view why) {
        return Error{ErrorCode::ConfigError,
                     fmt::format("rule #{} ('{}'): {}", index + 1, rule.pattern, why)};
    };

    if (rule.kind != RuleKind::BrokenSymlink && rule.pattern.empty()) {
        return fail("pattern cannot be empty");
    }
    switch (rule.kind) {
        case RuleKind::ExactName:
        case RuleKind::Suffix:
        case RuleKind::DirName:
            if (rule.pattern.find('/') != std::string::npos) {
                return fail("name patterns cannot contain '/'");
            }
            if (rule.pattern == "." || rule.pattern == "..") {
                return fail("'.' and '..' are not valid names");
            }
            break;
        case RuleKind::Glob:
            if (!common::is_valid_glob(rule.pattern)) {
                return fail("malformed glob");
            }
            if (rule.pattern.front() == '/') {
                return fail("globs are relative to the walk root");
            }
            break;
        case RuleKind::BrokenSymlink:
            break;
    }
    if (rule.policy.kind == PolicyKind::OlderThan && rule.policy.threshold.count() <= 0) {
        return fail("older-than policy requires a positive threshold");
    }
    return {};
}

// FNV-1a over the canonical rule text.
uint64_t fingerprintOf(const std::vector<Rule>& rules, const std::vector<std::string>& excludes,
                       uint32_t version) {
    uint64_t hash = 1469598103934665603ULL;
    auto mix = [&hash](std::string_view s) {
        for (unsigned char c : s) {
            hash ^= c;
            hash *= 1099511628211ULL;
        }
        hash ^= 0xff;
        hash *= 1099511628211ULL;
    };
    mix(std::to_string(version));
    for (const auto& r : rules) {
        mix(ruleKindName(r.kind));
        mix(r.pattern);
        mix(categoryName(r.category));
        mix(policyKindName(r.policy.kind));
        mix(std::to_string(r.policy.threshold.count()));
    }
    for (const auto& e : excludes) {
        mix("exclude");
        mix(e);
    }
    return hash;
}

} // namespace

Result<Rule> parseRuleDefinition(const RuleDefinition& def) {
    Rule rule;
    rule.pattern = std::string(common::trim(def.pattern));

    auto kind = parseRuleKind(common::trim(def.kind));
    if (!kind) {
        return Error{ErrorCode::ConfigError,
                     fmt::format("rule '{}': unknown kind '{}'", def.pattern, def.kind)};
    }
    rule.kind = *kind;

    if (def.category.empty()) {
        rule.category = Category::Other;
    } else if (auto cat = parseCategory(common::trim(def.category))) {
        rule.category = *cat;
    } else {
        return Error{ErrorCode::ConfigError,
                     fmt::format("rule '{}': unknown category '{}'", def.pattern, def.category)};
    }

    auto policyName = common::trim(def.policy);
    if (policyName.empty()) {
        // A bare older_than implies the older-than policy.
        rule.policy.kind = def.olderThan.empty() ? PolicyKind::Always : PolicyKind::OlderThan;
    } else if (auto policy = parsePolicyKind(policyName)) {
        rule.policy.kind = *policy;
    } else {
        return Error{ErrorCode::ConfigError,
                     fmt::format("rule '{}': unknown policy '{}'", def.pattern, def.policy)};
    }

    if (rule.policy.kind == PolicyKind::OlderThan) {
        if (def.olderThan.empty()) {
            return Error{ErrorCode::ConfigError,
                         fmt::format("rule '{}': older-than policy requires older_than",
                                     def.pattern)};
        }
        auto threshold = common::parseDuration(def.olderThan);
        if (!threshold) {
            return Error{ErrorCode::ConfigError,
                         fmt::format("rule '{}': {}", def.pattern, threshold.error().message)};
        }
        rule.policy.threshold = threshold.value();
    } else if (!def.olderThan.empty()) {
        return Error{ErrorCode::ConfigError,
                     fmt::format("rule '{}': older_than is only valid with policy older-than",
                                 def.pattern)};
    }
    return rule;
}

// -----------------------------------------------------------------------------
// RuleSet
// -----------------------------------------------------------------------------

Result<RuleSet> RuleSet::load(std::span<const RuleDefinition> definitions,
                              std::vector<std::string> excludes, uint32_t version) {
    std::vector<Rule> rules;
    rules.reserve(definitions.size());
    for (std::size_t i = 0; i < definitions.size(); ++i) {
        auto rule = parseRuleDefinition(definitions[i]);
        if (!rule) {
            return Error{ErrorCode::ConfigError,
                         fmt::format("rule #{}: {}", i + 1, rule.error().message)};
        }
        rules.push_back(std::move(rule).value());
    }
    return create(std::move(rules), std::move(excludes), version);
}

Result<RuleSet> RuleSet::create(std::vector<Rule> rules, std::vector<std::string> excludes,
                                uint32_t version) {
    if (version == 0 || version > kRuleSchemaVersion) {
        return Error{ErrorCode::ConfigError,
                     fmt::format("Unsupported rule schema version {} (supported: 1..{})", version,
                                 kRuleSchemaVersion)};
    }

    std::set<std::pair<RuleKind, std::string>> seen;
    for (std::size_t i = 0; i < rules.size(); ++i) {
        if (auto ok = validateRule(rules[i], i); !ok) {
            return ok.error();
        }
        if (!seen.emplace(rules[i].kind, rules[i].pattern).second) {
            return Error{ErrorCode::ConfigError,
                         fmt::format("rule #{}: duplicate {} pattern '{}'", i + 1,
                                     ruleKindName(rules[i].kind), rules[i].pattern)};
        }
    }

    std::set<std::string> seenExcludes;
    for (const auto& ex : excludes) {
        if (!common::is_valid_glob(ex)) {
            return Error{ErrorCode::ConfigError, fmt::format("malformed exclude glob '{}'", ex)};
        }
        if (!seenExcludes.insert(ex).second) {
            return Error{ErrorCode::ConfigError, fmt::format("duplicate exclude '{}'", ex)};
        }
    }

    RuleSet set;
    set.matchers_.reserve(rules.size());
    for (const auto& rule : rules) {
        set.matchers_.push_back(makeMatcher(rule));
    }
    set.fingerprint_ = fingerprintOf(rules, excludes, version);
    set.rules_ = std::move(rules);
    set.excludes_ = std::move(excludes);
    set.version_ = version;

    spdlog::debug("Loaded rule set v{} with {} rules, {} excludes (fingerprint {:016x})",
                  set.version_, set.rules_.size(), set.excludes_.size(), set.fingerprint_);
    return set;
}

const Rule* RuleSet::match(const walk::Entry& entry) const {
    for (std::size_t i = 0; i < matchers_.size(); ++i) {
        if (rules::matches(matchers_[i], entry)) {
            return &rules_[i];
        }
    }
    return nullptr;
}

const std::string* RuleSet::excludedBy(const walk::Entry& entry) const {
    for (const auto& ex : excludes_) {
        if (common::glob_match_path(entry.relativePath, ex)) {
            return &ex;
        }
    }
    return nullptr;
}

} // namespace rclean::rules
