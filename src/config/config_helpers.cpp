// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <rclean/config/config_helpers.h>

#include <spdlog/fmt/fmt.h>

namespace rclean::config {

std::string strip_comment(const std::string& line) {
    char quote = 0;
    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote) {
            if (c == '\\' && quote == '"' && i + 1 < line.size()) {
                ++i;
            } else if (c == quote) {
                quote = 0;
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            std::string out = line.substr(0, i);
            rtrim(out);
            return out;
        }
    }
    return line;
}

Result<std::vector<std::string>> parse_string_array(const std::string& raw) {
    std::string body = raw;
    trim(body);
    if (!body.empty() && body.front() == '[') {
        if (body.back() != ']') {
            return Error{ErrorCode::ConfigError, fmt::format("Unterminated array: {}", raw)};
        }
        body = body.substr(1, body.size() - 2);
    }

    std::vector<std::string> items;
    std::string current;
    char quote = 0;
    bool sawItem = false;
    for (char c : body) {
        if (quote) {
            if (c == quote) {
                quote = 0;
            } else {
                current.push_back(c);
            }
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
            sawItem = true;
        } else if (c == ',') {
            trim(current);
            if (!current.empty() || sawItem) {
                items.push_back(current);
            }
            current.clear();
            sawItem = false;
        } else {
            current.push_back(c);
        }
    }
    if (quote) {
        return Error{ErrorCode::ConfigError, fmt::format("Unterminated string in: {}", raw)};
    }
    trim(current);
    if (!current.empty() || sawItem) {
        items.push_back(current);
    }
    return items;
}

std::filesystem::path get_config_dir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "rclean";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "rclean";
    }
    return std::filesystem::path("~/.config") / "rclean";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    return get_config_dir() / "config.toml";
}

std::optional<std::filesystem::path> find_config_upward(const std::filesystem::path& start,
                                                        std::string_view name) {
    std::error_code ec;
    auto dir = std::filesystem::absolute(start, ec);
    if (ec) {
        return std::nullopt;
    }
    dir = dir.lexically_normal();
    while (true) {
        auto candidate = dir / name;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate;
        }
        auto parent = dir.parent_path();
        if (parent == dir || parent.empty()) {
            break;
        }
        dir = parent;
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> discover_config(const std::filesystem::path& start) {
    if (const char* env = std::getenv(kConfigEnvVar); env && *env) {
        return expand_tilde(env);
    }
    if (auto project = find_config_upward(start)) {
        return project;
    }
    std::error_code ec;
    auto user = get_config_path();
    if (std::filesystem::is_regular_file(user, ec)) {
        return user;
    }
    return std::nullopt;
}

} // namespace rclean::config
