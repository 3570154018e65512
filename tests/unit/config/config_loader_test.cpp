// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <gtest/gtest.h>

#include <rclean/config/config_helpers.h>
#include <rclean/config/config_loader.h>
#include <rclean/rules/presets.h>

#include <spdlog/spdlog.h>

#include "common/test_helpers.h"

#include <cstdlib>

using namespace rclean;
using namespace rclean::config;
using rclean::tests::TempTree;

namespace {

// Sets an environment variable for the lifetime of the guard.
class EnvGuard {
public:
    EnvGuard(const char* name, const std::string& value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            old_ = old;
        }
        ::setenv(name, value.c_str(), 1);
    }
    ~EnvGuard() {
        if (old_) {
            ::setenv(name_, old_->c_str(), 1);
        } else {
            ::unsetenv(name_);
        }
    }

private:
    const char* name_;
    std::optional<std::string> old_;
};

} // namespace

TEST(ConfigHelpersTest, StripCommentRespectsQuotes) {
    EXPECT_EQ(strip_comment("workers = 4 # four"), "workers = 4");
    EXPECT_EQ(strip_comment("pattern = \"#tmp#\""), "pattern = \"#tmp#\"");
    EXPECT_EQ(strip_comment("# whole line"), "");
}

TEST(ConfigHelpersTest, ParseStringArray) {
    auto items = parse_string_array(R"(["python", 'node' , "a,b"])");
    ASSERT_TRUE(items);
    EXPECT_EQ(items.value(), (std::vector<std::string>{"python", "node", "a,b"}));

    auto empty = parse_string_array("[]");
    ASSERT_TRUE(empty);
    EXPECT_TRUE(empty.value().empty());

    EXPECT_FALSE(parse_string_array(R"(["open)"));
    EXPECT_FALSE(parse_string_array(R"(["a")"));
}

TEST(ConfigHelpersTest, UnquoteAndTilde) {
    EXPECT_EQ(unquote("  \"x\" "), "x");
    EXPECT_EQ(unquote("'y'"), "y");
    EXPECT_EQ(unquote("bare"), "bare");

    EnvGuard home("HOME", "/home/tester");
    EXPECT_EQ(expand_tilde("~/logs/rclean.log"), std::filesystem::path("/home/tester/logs/rclean.log"));
    EXPECT_EQ(expand_tilde("~"), std::filesystem::path("/home/tester"));
    EXPECT_EQ(expand_tilde("~other/x"), std::filesystem::path("~other/x"));
}

TEST(ConfigLoaderTest, ParsesFullConfig) {
    constexpr std::string_view text = R"(# rclean settings
version = 1
presets = ["python",
           "node"]
exclude = ["vendor/**"]   # never touch vendored code
older_than = "7d"

[engine]
workers = 4
timeout_ms = 2000
remove_dangling_symlinks = false

[logging]
level = "debug"

[[rule]]
pattern = ".log"
kind = "suffix"
category = "logs"
policy = "older-than"
older_than = "30d"

[[rule]]
pattern = "scratch"
kind = "dirname"
policy = "if-empty"
)";

    auto cfg = parseConfig(text, "proj/.rclean.toml");
    ASSERT_TRUE(cfg) << cfg.error().message;
    const auto& c = cfg.value();
    EXPECT_EQ(c.version, 1u);
    EXPECT_EQ(c.presets, (std::vector<std::string>{"python", "node"}));
    EXPECT_EQ(c.excludes, (std::vector<std::string>{"vendor/**"}));
    ASSERT_TRUE(c.olderThan.has_value());
    EXPECT_EQ(*c.olderThan, std::chrono::seconds(7 * 86400));
    EXPECT_EQ(c.engine.workers, 4u);
    EXPECT_EQ(c.engine.timeout, Duration(2000));
    EXPECT_FALSE(c.engine.removeDanglingSymlinks);
    EXPECT_EQ(c.logging.level, "debug");
    ASSERT_EQ(c.rules.size(), 2u);
    EXPECT_EQ(c.rules[0].pattern, ".log");
    EXPECT_EQ(c.rules[0].olderThan, "30d");
    EXPECT_EQ(c.rules[1].kind, "dirname");
    EXPECT_EQ(c.source, std::filesystem::path("proj/.rclean.toml"));
}

TEST(ConfigLoaderTest, EmptyConfigUsesDefaults) {
    auto cfg = parseConfig("");
    ASSERT_TRUE(cfg);
    EXPECT_TRUE(cfg.value().rules.empty());
    EXPECT_EQ(cfg.value().engine.workers, 0u);
    EXPECT_TRUE(cfg.value().engine.removeDanglingSymlinks);
    EXPECT_EQ(cfg.value().logging.level, "info");
}

TEST(ConfigLoaderTest, ErrorsCarrySourceAndLine) {
    struct Case {
        std::string text;
        std::string expected;
    };
    const std::vector<Case> cases = {
        {"version = 1\nbogus = 2\n", "cfg.toml:2: unknown key 'bogus'"},
        {"[engine]\nworkers = -1\n", "cfg.toml:2: 'workers' must be a non-negative integer"},
        {"[engine]\nworkers = 1\nworkers = 2\n", "cfg.toml:3: duplicate key 'workers'"},
        {"[engine]\n[engine]\n", "cfg.toml:2: section [engine] defined twice"},
        {"[network]\n", "cfg.toml:1: unknown section [network]"},
        {"[[exclude]]\n", "cfg.toml:1: unknown table array [[exclude]]"},
        {"\n\nversion\n", "cfg.toml:3: expected key = value"},
        {"presets = [\"python\",\n", "cfg.toml:1: unterminated array"},
        {"older_than = \"soon\"\n", "cfg.toml:1: "},
        {"version = 9\n", "cfg.toml:1: unsupported version 9"},
        {"[logging]\nlevel = \"loud\"\n", "cfg.toml:2: unknown log level 'loud'"},
        {"[engine]\nremove_dangling_symlinks = yes\n", "cfg.toml:2: 'remove_dangling_symlinks'"},
        {"[[rule]]\ncolour = \"red\"\n", "cfg.toml:2: unknown key 'rule.colour'"},
    };
    for (const auto& c : cases) {
        auto cfg = parseConfig(c.text, "cfg.toml");
        ASSERT_FALSE(cfg) << c.text;
        EXPECT_EQ(cfg.error().code, ErrorCode::ConfigError) << c.text;
        EXPECT_EQ(cfg.error().message.rfind(c.expected, 0), 0u)
            << "got: " << cfg.error().message;
    }
}

TEST(ConfigLoaderTest, DuplicateKeysAllowedAcrossRuleTables) {
    auto cfg = parseConfig(
        "[[rule]]\npattern = \".o\"\nkind = \"suffix\"\n[[rule]]\npattern = \".a\"\nkind = \"suffix\"\n");
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg.value().rules.size(), 2u);
}

TEST(ConfigLoaderTest, LoadConfigFileReportsMissingFile) {
    TempTree tree;
    auto r = loadConfigFile(tree / "absent.toml");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ConfigError);

    auto path = tree.file("ok.toml", "presets = [\"node\"]\n");
    auto ok = loadConfigFile(path);
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value().source, path);
}

TEST(ConfigLoaderTest, CustomRulesPrecedePresets) {
    CleanConfig cfg;
    cfg.rules.push_back({"node_modules", "dirname", "temp", "always", ""});
    cfg.presets = {"node"};
    auto rs = buildRuleSet(cfg);
    ASSERT_TRUE(rs) << rs.error().message;
    const auto& rules = rs.value().rules();
    ASSERT_FALSE(rules.empty());
    EXPECT_EQ(rules[0].pattern, "node_modules");
    EXPECT_EQ(rules[0].category, rules::Category::Temp);
    // The preset's own node_modules rule was skipped.
    auto count = std::count_if(rules.begin(), rules.end(), [](const rules::Rule& r) {
        return r.pattern == "node_modules" && r.kind == rules::RuleKind::DirName;
    });
    EXPECT_EQ(count, 1);
}

TEST(ConfigLoaderTest, NoRulesOrPresetsFallsBackToDefaults) {
    auto rs = buildRuleSet(CleanConfig{});
    ASSERT_TRUE(rs);
    EXPECT_EQ(rs.value().size(), rules::defaultRules().size());
}

TEST(ConfigLoaderTest, BuildRuleSetPropagatesErrors) {
    CleanConfig unknownPreset;
    unknownPreset.presets = {"fortran"};
    EXPECT_FALSE(buildRuleSet(unknownPreset));

    CleanConfig badExclude;
    badExclude.excludes = {"a//b"};
    auto rs = buildRuleSet(badExclude);
    ASSERT_FALSE(rs);
    EXPECT_EQ(rs.error().code, ErrorCode::ConfigError);
}

TEST(ConfigLoaderTest, DiscoverPrefersEnvironmentThenProjectFile) {
    TempTree tree;
    tree.file(".rclean.toml", "version = 1\n");
    auto nested = tree.dir("a/b/c");
    EnvGuard xdg("XDG_CONFIG_HOME", (tree / "xdg").string());

    {
        EnvGuard env(kConfigEnvVar, "/etc/rclean/custom.toml");
        auto found = discover_config(nested);
        ASSERT_TRUE(found.has_value());
        EXPECT_EQ(*found, std::filesystem::path("/etc/rclean/custom.toml"));
    }

    ::unsetenv(kConfigEnvVar);
    auto found = discover_config(nested);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, tree / ".rclean.toml");
}

TEST(ConfigLoaderTest, DiscoverFallsBackToUserConfig) {
    TempTree tree;
    auto user = tree.file("xdg/rclean/config.toml", "");
    auto project = tree.dir("project");
    EnvGuard xdg("XDG_CONFIG_HOME", (tree / "xdg").string());
    ::unsetenv(kConfigEnvVar);

    EXPECT_EQ(get_config_path(), user);
    auto found = discover_config(project);
    // An ancestor of the temp dir could carry its own .rclean.toml.
    if (found && found->filename() == ".rclean.toml")
        GTEST_SKIP() << "ambient project config at " << *found;
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, user);
}

TEST(ConfigLoaderTest, ConfigureLogging) {
    LoggingSettings bad;
    bad.level = "chatty";
    auto r = configureLogging(bad);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ConfigError);

    auto previous = spdlog::default_logger();
    TempTree tree;
    LoggingSettings settings;
    settings.level = "warn";
    settings.file = tree / "logs" / "rclean.log";
    ASSERT_TRUE(configureLogging(settings));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
    spdlog::warn("written to file");
    spdlog::default_logger()->flush();
    EXPECT_TRUE(std::filesystem::exists(settings.file));

    spdlog::set_default_logger(previous);
    spdlog::set_level(spdlog::level::info);
}
