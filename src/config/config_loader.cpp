// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <rclean/common/units.h>
#include <rclean/config/config_helpers.h>
#include <rclean/config/config_loader.h>
#include <rclean/rules/presets.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <fstream>
#include <set>
#include <sstream>

namespace rclean::config {

namespace {

constexpr std::size_t kLogMaxSize = 5 * 1024 * 1024; // 5MB per file
constexpr std::size_t kLogMaxFiles = 3;

constexpr std::array<std::string_view, 7> kLogLevels = {"trace", "debug", "info",    "warn",
                                                         "error", "critical", "off"};

std::optional<spdlog::level::level_enum> toSpdlogLevel(std::string_view name) {
    if (name == "trace")
        return spdlog::level::trace;
    if (name == "debug")
        return spdlog::level::debug;
    if (name == "info")
        return spdlog::level::info;
    if (name == "warn")
        return spdlog::level::warn;
    if (name == "error")
        return spdlog::level::err;
    if (name == "critical")
        return spdlog::level::critical;
    if (name == "off")
        return spdlog::level::off;
    return std::nullopt;
}

class ConfigParser {
public:
    ConfigParser(std::string_view text, std::filesystem::path source)
        : input_(std::string(text)), source_(std::move(source)) {
        config_.source = source_;
    }

    Result<CleanConfig> parse() {
        std::string line;
        while (nextLine(line)) {
            if (line.empty())
                continue;

            if (line.rfind("[[", 0) == 0) {
                if (line.size() < 4 || line.compare(line.size() - 2, 2, "]]") != 0) {
                    return fail("malformed table array header");
                }
                std::string name = line.substr(2, line.size() - 4);
                trim(name);
                if (name != "rule") {
                    return fail(fmt::format("unknown table array [[{}]]", name));
                }
                config_.rules.emplace_back();
                section_ = "rule";
                seenKeys_.clear();
                continue;
            }

            if (line.front() == '[') {
                if (line.back() != ']') {
                    return fail("malformed section header");
                }
                std::string name = line.substr(1, line.size() - 2);
                trim(name);
                if (name != "engine" && name != "logging") {
                    return fail(fmt::format("unknown section [{}]", name));
                }
                if (!seenSections_.insert(name).second) {
                    return fail(fmt::format("section [{}] defined twice", name));
                }
                section_ = name;
                seenKeys_.clear();
                continue;
            }

            auto eq = line.find('=');
            if (eq == std::string::npos) {
                return fail("expected key = value");
            }
            std::string key = line.substr(0, eq);
            std::string value = line.substr(eq + 1);
            trim(key);
            trim(value);
            if (key.empty()) {
                return fail("missing key");
            }
            if (!seenKeys_.insert(key).second) {
                return fail(fmt::format("duplicate key '{}'", key));
            }
            if (auto joined = continueArray(value); !joined) {
                return joined.error();
            }

            auto applied = apply(key, value);
            if (!applied) {
                return fail(applied.error().message);
            }
        }
        return std::move(config_);
    }

private:
    bool nextLine(std::string& out) {
        std::string raw;
        if (!std::getline(input_, raw))
            return false;
        ++lineNo_;
        out = strip_comment(raw);
        trim(out);
        return true;
    }

    // Arrays may span lines until the closing bracket.
    Result<void> continueArray(std::string& value) {
        if (value.empty() || value.front() != '[')
            return {};
        const std::size_t startLine = lineNo_;
        std::string more;
        while (value.back() != ']') {
            if (!nextLine(more)) {
                lineNo_ = startLine;
                return fail("unterminated array");
            }
            value += more.empty() || value.back() == '[' ? more : " " + more;
        }
        return {};
    }

    Error fail(std::string_view message) const {
        return Error{ErrorCode::ConfigError,
                     fmt::format("{}:{}: {}", source_.empty() ? "<config>" : source_.string(),
                                 lineNo_, message)};
    }

    static Result<uint64_t> toUnsigned(std::string_view key, const std::string& raw) {
        auto text = unquote(raw);
        uint64_t number = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), number);
        if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
            return Error{ErrorCode::ConfigError,
                         fmt::format("'{}' must be a non-negative integer, got '{}'", key, raw)};
        }
        return number;
    }

    static Result<bool> toBool(std::string_view key, const std::string& raw) {
        auto text = unquote(raw);
        if (text == "true")
            return true;
        if (text == "false")
            return false;
        return Error{ErrorCode::ConfigError,
                     fmt::format("'{}' must be true or false, got '{}'", key, raw)};
    }

    Result<void> apply(const std::string& key, const std::string& value) {
        if (section_.empty())
            return applyTopLevel(key, value);
        if (section_ == "engine")
            return applyEngine(key, value);
        if (section_ == "logging")
            return applyLogging(key, value);
        return applyRule(key, value);
    }

    Result<void> applyTopLevel(const std::string& key, const std::string& value) {
        if (key == "version") {
            auto v = toUnsigned(key, value);
            if (!v)
                return v.error();
            if (v.value() == 0 || v.value() > rules::kRuleSchemaVersion) {
                return Error{ErrorCode::ConfigError,
                             fmt::format("unsupported version {} (supported: 1..{})", v.value(),
                                         rules::kRuleSchemaVersion)};
            }
            config_.version = static_cast<uint32_t>(v.value());
        } else if (key == "presets") {
            auto items = parse_string_array(value);
            if (!items)
                return items.error();
            config_.presets = std::move(items).value();
        } else if (key == "exclude") {
            auto items = parse_string_array(value);
            if (!items)
                return items.error();
            config_.excludes = std::move(items).value();
        } else if (key == "older_than") {
            auto d = common::parseDuration(unquote(value));
            if (!d)
                return d.error();
            config_.olderThan = d.value();
        } else {
            return Error{ErrorCode::ConfigError, fmt::format("unknown key '{}'", key)};
        }
        return {};
    }

    Result<void> applyEngine(const std::string& key, const std::string& value) {
        if (key == "workers") {
            auto v = toUnsigned(key, value);
            if (!v)
                return v.error();
            config_.engine.workers = static_cast<std::size_t>(v.value());
        } else if (key == "timeout_ms") {
            auto v = toUnsigned(key, value);
            if (!v)
                return v.error();
            config_.engine.timeout = Duration(static_cast<Duration::rep>(v.value()));
        } else if (key == "remove_dangling_symlinks") {
            auto v = toBool(key, value);
            if (!v)
                return v.error();
            config_.engine.removeDanglingSymlinks = v.value();
        } else {
            return Error{ErrorCode::ConfigError, fmt::format("unknown key 'engine.{}'", key)};
        }
        return {};
    }

    Result<void> applyLogging(const std::string& key, const std::string& value) {
        if (key == "level") {
            auto level = unquote(value);
            if (std::find(kLogLevels.begin(), kLogLevels.end(), level) == kLogLevels.end()) {
                return Error{ErrorCode::ConfigError, fmt::format("unknown log level '{}'", level)};
            }
            config_.logging.level = level;
        } else if (key == "file") {
            config_.logging.file = expand_tilde(unquote(value));
        } else {
            return Error{ErrorCode::ConfigError, fmt::format("unknown key 'logging.{}'", key)};
        }
        return {};
    }

    Result<void> applyRule(const std::string& key, const std::string& value) {
        auto& def = config_.rules.back();
        auto text = unquote(value);
        if (key == "pattern") {
            def.pattern = text;
        } else if (key == "kind") {
            def.kind = text;
        } else if (key == "category") {
            def.category = text;
        } else if (key == "policy") {
            def.policy = text;
        } else if (key == "older_than") {
            def.olderThan = text;
        } else {
            return Error{ErrorCode::ConfigError, fmt::format("unknown key 'rule.{}'", key)};
        }
        return {};
    }

    std::istringstream input_;
    std::filesystem::path source_;
    CleanConfig config_;
    std::string section_;
    std::set<std::string> seenSections_;
    std::set<std::string> seenKeys_;
    std::size_t lineNo_ = 0;
};

} // namespace

Result<CleanConfig> parseConfig(std::string_view text, const std::filesystem::path& source) {
    return ConfigParser(text, source).parse();
}

Result<CleanConfig> loadConfigFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::ConfigError, "Cannot open config file: " + path.string()};
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    auto config = parseConfig(buffer.str(), path);
    if (config) {
        spdlog::debug("Loaded config {} ({} rules, {} presets)", path.string(),
                      config.value().rules.size(), config.value().presets.size());
    }
    return config;
}

Result<rules::RuleSet> buildRuleSet(const CleanConfig& config) {
    std::vector<rules::RuleDefinition> definitions = config.rules;

    if (config.rules.empty() && config.presets.empty()) {
        definitions = rules::defaultRules(config.olderThan);
    }
    for (const auto& name : config.presets) {
        auto preset = rules::presetRules(name, config.olderThan);
        if (!preset) {
            return preset.error();
        }
        rules::appendUnique(definitions, preset.value());
    }

    return rules::RuleSet::load(definitions, config.excludes, config.version);
}

Result<void> configureLogging(const LoggingSettings& settings) {
    auto level = toSpdlogLevel(settings.level);
    if (!level) {
        return Error{ErrorCode::ConfigError,
                     fmt::format("unknown log level '{}'", settings.level)};
    }

    if (!settings.file.empty()) {
        std::error_code ec;
        if (settings.file.has_parent_path()) {
            std::filesystem::create_directories(settings.file.parent_path(), ec);
        }
        try {
            auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                settings.file.string(), kLogMaxSize, kLogMaxFiles);
            auto logger = std::make_shared<spdlog::logger>("rclean", sink);
            spdlog::set_default_logger(logger);
            spdlog::flush_on(spdlog::level::warn);
        } catch (const spdlog::spdlog_ex& ex) {
            return Error{ErrorCode::IoError, fmt::format("Cannot open log file {}: {}",
                                                         settings.file.string(), ex.what())};
        }
    }

    spdlog::set_level(*level);
    return {};
}

} // namespace rclean::config
