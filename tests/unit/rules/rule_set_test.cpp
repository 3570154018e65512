// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <gtest/gtest.h>

#include <rclean/rules/rule_set.h>

#include "common/test_helpers.h"

using namespace rclean;
using namespace rclean::rules;
using rclean::tests::make_entry;
using walk::EntryType;

namespace {

const std::filesystem::path kRoot{"/work"};

RuleSet mustLoad(const std::vector<RuleDefinition>& defs, std::vector<std::string> excludes = {}) {
    auto rs = RuleSet::load(defs, std::move(excludes));
    EXPECT_TRUE(rs) << (rs ? "" : rs.error().message);
    return rs ? std::move(rs).value() : RuleSet{};
}

} // namespace

TEST(RuleSetTest, FirstMatchInDeclaredOrderWins) {
    auto rs = mustLoad({
        {".log", "suffix", "logs", "always", ""},
        {"debug.log", "exact", "temp", "always", ""},
    });
    auto e = make_entry(kRoot, "debug.log", EntryType::File, 0);
    const Rule* r = rs.match(e);
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->kind, RuleKind::Suffix);
    EXPECT_EQ(r->category, Category::Logs);
}

TEST(RuleSetTest, ExactAndSuffixApplyToBasenameCaseSensitively) {
    auto rs = mustLoad({
        {".DS_Store", "exact", "system", "always", ""},
        {".pyc", "suffix", "build-object", "always", ""},
    });
    EXPECT_NE(rs.match(make_entry(kRoot, "a/b/.DS_Store", EntryType::File, 0)), nullptr);
    EXPECT_EQ(rs.match(make_entry(kRoot, "a/.ds_store", EntryType::File, 1)), nullptr);
    EXPECT_NE(rs.match(make_entry(kRoot, "pkg/mod.pyc", EntryType::File, 2)), nullptr);
    EXPECT_EQ(rs.match(make_entry(kRoot, "pkg/MOD.PYC", EntryType::File, 3)), nullptr);
    // The suffix is compared against the name, not the directory part.
    EXPECT_EQ(rs.match(make_entry(kRoot, "x.pyc/readme", EntryType::File, 4)), nullptr);
}

TEST(RuleSetTest, DirNameMatchesDirectoriesOnly) {
    auto rs = mustLoad({{"__pycache__", "dirname", "cache", "always", ""}});
    EXPECT_NE(rs.match(make_entry(kRoot, "pkg/__pycache__", EntryType::Directory, 0)), nullptr);
    EXPECT_EQ(rs.match(make_entry(kRoot, "pkg/__pycache__", EntryType::File, 1)), nullptr);
    EXPECT_EQ(rs.match(make_entry(kRoot, "pkg/__pycache__x", EntryType::Directory, 2)), nullptr);
}

TEST(RuleSetTest, GlobMatchesRootRelativePath) {
    auto rs = mustLoad({{"build/**/*.o", "glob", "build-object", "always", ""}});
    EXPECT_NE(rs.match(make_entry(kRoot, "build/x/y/a.o", EntryType::File, 0)), nullptr);
    EXPECT_NE(rs.match(make_entry(kRoot, "build/a.o", EntryType::File, 1)), nullptr);
    EXPECT_EQ(rs.match(make_entry(kRoot, "src/build/a.o", EntryType::File, 2)), nullptr);
}

TEST(RuleSetTest, BrokenSymlinkMatchesOnlyDanglingLinks) {
    auto rs = mustLoad({{"", "broken-symlink", "broken-link", "always", ""}});
    auto dangling = make_entry(kRoot, "link", EntryType::Symlink, 0);
    dangling.symlinkTarget = "missing";
    dangling.symlinkTargetExists = false;
    auto live = make_entry(kRoot, "ok", EntryType::Symlink, 1);
    live.symlinkTarget = "file";
    live.symlinkTargetExists = true;
    EXPECT_NE(rs.match(dangling), nullptr);
    EXPECT_EQ(rs.match(live), nullptr);
    EXPECT_EQ(rs.match(make_entry(kRoot, "file", EntryType::File, 2)), nullptr);
}

TEST(RuleSetTest, RejectsDuplicateKindAndPattern) {
    std::vector<RuleDefinition> defs = {
        {".log", "suffix", "logs", "always", ""},
        {".log", "suffix", "temp", "if-empty", ""},
    };
    auto rs = RuleSet::load(defs);
    ASSERT_FALSE(rs);
    EXPECT_EQ(rs.error().code, ErrorCode::ConfigError);
    EXPECT_NE(rs.error().message.find("duplicate"), std::string::npos);
}

TEST(RuleSetTest, SamePatternWithDifferentKindIsAllowed) {
    std::vector<RuleDefinition> defs = {
        {"build", "dirname", "build-output", "if-empty", ""},
        {"build", "exact", "temp", "always", ""},
    };
    EXPECT_TRUE(RuleSet::load(defs));
}

TEST(RuleSetTest, RejectsMalformedDefinitions) {
    const std::vector<RuleDefinition> bad = {
        {"", "exact", "temp", "always", ""},
        {"a/b", "exact", "temp", "always", ""},
        {"x/.pyc", "suffix", "temp", "always", ""},
        {"..", "dirname", "temp", "always", ""},
        {"x", "regex", "temp", "always", ""},
        {"x", "exact", "junk", "always", ""},
        {"x", "exact", "temp", "sometimes", ""},
        {"x", "exact", "temp", "older-than", ""},
        {"x", "exact", "temp", "older-than", "soon"},
        {"x", "exact", "temp", "always", "30d"},
        {"x", "exact", "temp", "older-than", "0s"},
        {"/abs/*.log", "glob", "temp", "always", ""},
        {"a//b", "glob", "temp", "always", ""},
    };
    for (const auto& def : bad) {
        std::vector<RuleDefinition> defs{def};
        auto rs = RuleSet::load(defs);
        ASSERT_FALSE(rs) << "accepted pattern '" << def.pattern << "' kind " << def.kind
                         << " policy " << def.policy;
        EXPECT_EQ(rs.error().code, ErrorCode::ConfigError);
    }
}

TEST(RuleSetTest, OlderThanImpliedByThreshold) {
    auto rs = mustLoad({{".log", "suffix", "logs", "", "30d"}});
    ASSERT_EQ(rs.size(), 1u);
    EXPECT_EQ(rs.rules()[0].policy.kind, PolicyKind::OlderThan);
    EXPECT_EQ(rs.rules()[0].policy.threshold, std::chrono::seconds(30 * 86400));
}

TEST(RuleSetTest, MissingCategoryDefaultsToOther) {
    auto rs = mustLoad({{"scratch", "dirname", "", "always", ""}});
    EXPECT_EQ(rs.rules()[0].category, Category::Other);
}

TEST(RuleSetTest, RejectsUnsupportedVersion) {
    std::vector<RuleDefinition> defs = {{".log", "suffix", "logs", "always", ""}};
    auto rs = RuleSet::load(defs, {}, kRuleSchemaVersion + 1);
    ASSERT_FALSE(rs);
    EXPECT_EQ(rs.error().code, ErrorCode::ConfigError);
    EXPECT_FALSE(RuleSet::load(defs, {}, 0));
}

TEST(RuleSetTest, ExcludesAreValidatedAndMatched) {
    auto rs = mustLoad({{".log", "suffix", "logs", "always", ""}}, {"keep/**", "*.keep.log"});
    auto kept = make_entry(kRoot, "keep/deep/a.log", EntryType::File, 0);
    const std::string* by = rs.excludedBy(kept);
    ASSERT_NE(by, nullptr);
    EXPECT_EQ(*by, "keep/**");
    EXPECT_NE(rs.excludedBy(make_entry(kRoot, "x/b.keep.log", EntryType::File, 1)), nullptr);
    EXPECT_EQ(rs.excludedBy(make_entry(kRoot, "x/b.log", EntryType::File, 2)), nullptr);

    std::vector<RuleDefinition> defs = {{".log", "suffix", "logs", "always", ""}};
    EXPECT_FALSE(RuleSet::load(defs, {"a", "a"}));
    EXPECT_FALSE(RuleSet::load(defs, {"a//b"}));
}

TEST(RuleSetTest, FingerprintTracksContentAndOrder) {
    std::vector<RuleDefinition> ab = {{".a", "suffix", "temp", "always", ""},
                                      {".b", "suffix", "temp", "always", ""}};
    std::vector<RuleDefinition> ba = {ab[1], ab[0]};
    auto first = mustLoad(ab);
    auto again = mustLoad(ab);
    auto swapped = mustLoad(ba);
    EXPECT_EQ(first.fingerprint(), again.fingerprint());
    EXPECT_NE(first.fingerprint(), swapped.fingerprint());
    EXPECT_EQ(first.version(), kRuleSchemaVersion);
}

TEST(RuleSetTest, CreateValidatesTypedRules) {
    using rclean::tests::make_rule;
    auto ok = RuleSet::create({make_rule(".o", RuleKind::Suffix),
                               make_rule("dist", RuleKind::DirName, PolicyKind::IfEmpty)});
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value().size(), 2u);

    auto dup =
        RuleSet::create({make_rule(".o", RuleKind::Suffix), make_rule(".o", RuleKind::Suffix)});
    EXPECT_FALSE(dup);

    auto zero = RuleSet::create({make_rule(".o", RuleKind::Suffix, PolicyKind::OlderThan)});
    EXPECT_FALSE(zero);
}

TEST(RuleSetTest, NamesRoundTrip) {
    EXPECT_EQ(parseRuleKind("dirname"), RuleKind::DirName);
    EXPECT_EQ(parseRuleKind("broken-symlink"), RuleKind::BrokenSymlink);
    EXPECT_FALSE(parseRuleKind("Dirname"));
    EXPECT_EQ(parseCategory("build-output"), Category::BuildOutput);
    EXPECT_EQ(parsePolicyKind("older-than"), PolicyKind::OlderThan);
    EXPECT_STREQ(ruleKindName(RuleKind::Suffix), "suffix");
}
