// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <rclean/core/types.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rclean::config {

inline constexpr std::string_view kProjectConfigName = ".rclean.toml";
inline constexpr const char* kConfigEnvVar = "RCLEAN_CONFIG";

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion ("~" and "~/...")
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~' && (path.size() == 1 || path[1] == '/')) {
        if (const char* home = std::getenv("HOME")) {
            return path.size() <= 2 ? std::filesystem::path(home)
                                    : std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Remove a trailing '#' comment that is not inside a quoted string.
std::string strip_comment(const std::string& line);

// Split `["a", "b"]` (or a bare `a, b` list) into unquoted items.
Result<std::vector<std::string>> parse_string_array(const std::string& raw);

/// Returns the user config directory: $XDG_CONFIG_HOME/rclean or ~/.config/rclean
std::filesystem::path get_config_dir();

// User-level config file, or `override_path` when non-empty.
std::filesystem::path get_config_path(const std::string& override_path = "");

// Nearest `name` in `start` or one of its ancestors.
std::optional<std::filesystem::path> find_config_upward(const std::filesystem::path& start,
                                                        std::string_view name = kProjectConfigName);

/**
 * Resolve the config file for a run started in `start`:
 *   1. $RCLEAN_CONFIG (returned even if it does not exist)
 *   2. .rclean.toml in `start` or the nearest ancestor
 *   3. get_config_path(), when present
 */
std::optional<std::filesystem::path> discover_config(const std::filesystem::path& start);

} // namespace rclean::config
