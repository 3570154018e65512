// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <gtest/gtest.h>

#include <rclean/rules/presets.h>
#include <rclean/rules/rule_set.h>

#include <algorithm>
#include <set>

using namespace rclean;
using namespace rclean::rules;

namespace {

bool contains(const std::vector<RuleDefinition>& defs, std::string_view kind,
              std::string_view pattern) {
    return std::any_of(defs.begin(), defs.end(), [&](const RuleDefinition& d) {
        return d.kind == kind && d.pattern == pattern;
    });
}

} // namespace

TEST(PresetsTest, EveryPresetLoadsAsRuleSet) {
    for (auto name : presetNames()) {
        auto defs = presetRules(name);
        ASSERT_TRUE(defs) << name;
        EXPECT_FALSE(defs.value().empty()) << name;
        auto rs = RuleSet::load(defs.value());
        EXPECT_TRUE(rs) << name << ": " << (rs ? "" : rs.error().message);
    }
}

TEST(PresetsTest, PythonPresetCarriesCachesAndBytecode) {
    auto defs = presetRules("python").value();
    EXPECT_TRUE(contains(defs, "dirname", "__pycache__"));
    EXPECT_TRUE(contains(defs, "suffix", ".pyc"));
    EXPECT_TRUE(contains(defs, "dirname", ".pytest_cache"));
}

TEST(PresetsTest, AllIsDeduplicatedUnion) {
    auto all = presetRules("all").value();
    std::set<std::pair<std::string, std::string>> seen;
    for (const auto& d : all) {
        EXPECT_TRUE(seen.emplace(d.kind, d.pattern).second) << d.kind << " " << d.pattern;
    }
    for (auto name : presetNames()) {
        if (name == "all")
            continue;
        auto defs = presetRules(name).value();
        for (const auto& d : defs) {
            EXPECT_TRUE(contains(all, d.kind, d.pattern)) << name << ": " << d.pattern;
        }
    }
    // Declaration order is kept: common comes first.
    ASSERT_FALSE(all.empty());
    EXPECT_EQ(all.front().pattern, presetRules("common").value().front().pattern);
}

TEST(PresetsTest, UnknownPresetIsConfigError) {
    auto r = presetRules("cobol");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ConfigError);
    EXPECT_NE(r.error().message.find("python"), std::string::npos);
}

TEST(PresetsTest, OlderThanConvertsAlwaysRules) {
    auto defs = presetRules("node", std::chrono::seconds(7 * 86400)).value();
    for (const auto& d : defs) {
        if (d.pattern == "node_modules") {
            EXPECT_EQ(d.policy, "if-empty");
            EXPECT_TRUE(d.olderThan.empty());
        } else if (d.pattern == ".next") {
            EXPECT_EQ(d.policy, "older-than");
            EXPECT_EQ(d.olderThan, "1w");
        }
    }
    EXPECT_TRUE(RuleSet::load(defs));
}

TEST(PresetsTest, DefaultsAreCommonThenPython) {
    auto defaults = defaultRules();
    auto common = presetRules("common").value();
    ASSERT_GE(defaults.size(), common.size());
    for (std::size_t i = 0; i < common.size(); ++i) {
        EXPECT_EQ(defaults[i].pattern, common[i].pattern);
    }
    EXPECT_TRUE(contains(defaults, "dirname", "__pycache__"));
    // .python_history appears in both presets but only once here.
    EXPECT_EQ(std::count_if(defaults.begin(), defaults.end(),
                            [](const RuleDefinition& d) { return d.pattern == ".python_history"; }),
              1);
}

TEST(PresetsTest, AppendUniqueSkipsExistingPairs) {
    std::vector<RuleDefinition> base = {{".log", "suffix", "logs", "always", ""}};
    appendUnique(base, {{".log", "suffix", "temp", "if-empty", ""},
                        {".log", "exact", "temp", "always", ""}});
    ASSERT_EQ(base.size(), 2u);
    EXPECT_EQ(base[0].category, "logs");
    EXPECT_EQ(base[1].kind, "exact");
}
