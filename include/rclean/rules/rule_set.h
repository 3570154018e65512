// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <rclean/core/types.h>
#include <rclean/rules/rule.h>
#include <rclean/walk/entry.h>

#include <cstdint>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace rclean::rules {

inline constexpr uint32_t kRuleSchemaVersion = 1;

// Matchers for each rule kind; dispatched through matches() below.
struct ExactNameMatcher {
    std::string name;
    bool matches(const walk::Entry& entry) const;
};

struct SuffixMatcher {
    std::string suffix;
    bool matches(const walk::Entry& entry) const;
};

struct DirNameMatcher {
    std::string name;
    bool matches(const walk::Entry& entry) const;
};

struct GlobMatcher {
    std::string glob;
    bool matches(const walk::Entry& entry) const;
};

struct BrokenSymlinkMatcher {
    bool matches(const walk::Entry& entry) const;
};

using Matcher = std::variant<ExactNameMatcher, SuffixMatcher, DirNameMatcher, GlobMatcher,
                             BrokenSymlinkMatcher>;

[[nodiscard]] inline bool matches(const Matcher& matcher, const walk::Entry& entry) {
    return std::visit([&](const auto& m) { return m.matches(entry); }, matcher);
}

Matcher makeMatcher(const Rule& rule);

/**
 * Immutable, ordered rule catalog. First match in declared order wins.
 */
class RuleSet {
public:
    RuleSet() = default;

    /**
     * Validate and compile rule definitions. Fails with ConfigError on a
     * malformed definition or a duplicate (kind, pattern) pair.
     */
    static Result<RuleSet> load(std::span<const RuleDefinition> definitions,
                                std::vector<std::string> excludes = {},
                                uint32_t version = kRuleSchemaVersion);

    // Same validation for already-typed rules.
    static Result<RuleSet> create(std::vector<Rule> rules, std::vector<std::string> excludes = {},
                                  uint32_t version = kRuleSchemaVersion);

    // First matching rule, or nullptr.
    [[nodiscard]] const Rule* match(const walk::Entry& entry) const;

    // First matching exclude glob, or nullptr.
    [[nodiscard]] const std::string* excludedBy(const walk::Entry& entry) const;

    [[nodiscard]] const std::vector<Rule>& rules() const noexcept { return rules_; }
    [[nodiscard]] const std::vector<std::string>& excludes() const noexcept { return excludes_; }
    [[nodiscard]] uint32_t version() const noexcept { return version_; }
    [[nodiscard]] uint64_t fingerprint() const noexcept { return fingerprint_; }
    [[nodiscard]] std::size_t size() const noexcept { return rules_.size(); }
    [[nodiscard]] bool empty() const noexcept { return rules_.empty(); }

private:
    std::vector<Rule> rules_;
    std::vector<Matcher> matchers_;
    std::vector<std::string> excludes_;
    uint32_t version_ = kRuleSchemaVersion;
    uint64_t fingerprint_ = 0;
};

// Parse one definition into a typed rule (ConfigError on failure).
Result<Rule> parseRuleDefinition(const RuleDefinition& definition);

} // namespace rclean::rules
