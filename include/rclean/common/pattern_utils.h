// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace rclean::common {

/**
 * constexpr, allocation-free wildcard match supporting:
 *  - '?' matches any single character
 *  - '*' matches any sequence of characters (including empty)
 *
 * Case-sensitive. Iterative (no recursion, no backtracking explosion).
 * Used for single path segments, so callers never pass a '/'.
 */
[[nodiscard]] inline constexpr bool wildcard_match(std::string_view text,
                                                   std::string_view pattern) noexcept {
    size_t t = 0;
    size_t p = 0;
    size_t starPos = std::string_view::npos;
    size_t matchPos = 0;

    const size_t tlen = text.size();
    const size_t plen = pattern.size();

    while (t < tlen) {
        if (p < plen && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++t;
            ++p;
        } else if (p < plen && pattern[p] == '*') {
            starPos = p++;
            matchPos = t;
        } else if (starPos != std::string_view::npos) {
            p = starPos + 1;
            ++matchPos;
            t = matchPos;
        } else {
            return false;
        }
    }

    while (p < plen && pattern[p] == '*') {
        ++p;
    }

    return p == plen;
}

[[nodiscard]] inline constexpr bool has_wildcards(std::string_view pattern) noexcept {
    for (char c : pattern) {
        if (c == '*' || c == '?')
            return true;
    }
    return false;
}

[[nodiscard]] inline std::string_view ltrim(std::string_view s) noexcept {
    size_t i = 0;
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\n' || s[i] == '\r'))
        ++i;
    return s.substr(i);
}

[[nodiscard]] inline std::string_view rtrim(std::string_view s) noexcept {
    size_t i = s.size();
    while (i > 0 && (s[i - 1] == ' ' || s[i - 1] == '\t' || s[i - 1] == '\n' || s[i - 1] == '\r'))
        --i;
    return s.substr(0, i);
}

[[nodiscard]] inline std::string_view trim(std::string_view s) noexcept {
    return rtrim(ltrim(s));
}

/**
 * Split a '/'-separated path into its non-empty segments.
 */
[[nodiscard]] inline std::vector<std::string_view> split_segments(std::string_view path) {
    std::vector<std::string_view> out;
    size_t start = 0;
    while (start <= path.size()) {
        size_t pos = path.find('/', start);
        auto seg = (pos == std::string_view::npos) ? path.substr(start)
                                                   : path.substr(start, pos - start);
        if (!seg.empty()) {
            out.push_back(seg);
        }
        if (pos == std::string_view::npos)
            break;
        start = pos + 1;
    }
    return out;
}

/**
 * Path-aware glob match against a root-relative, '/'-separated path.
 *  - a segment of exactly "**" matches zero or more whole segments
 *  - other segments use wildcard_match and never cross a '/'
 *  - a pattern without any '/' is matched against the last segment only
 */
[[nodiscard]] inline bool glob_match_path(std::string_view relativePath,
                                          std::string_view pattern) {
    auto text = split_segments(relativePath);
    if (pattern.find('/') == std::string_view::npos) {
        return !text.empty() && wildcard_match(text.back(), pattern);
    }
    auto pat = split_segments(pattern);

    // Iterative matcher over segments with a single "**" backtrack point,
    // mirroring wildcard_match one level up.
    size_t t = 0;
    size_t p = 0;
    size_t starPos = std::string_view::npos;
    size_t matchPos = 0;
    while (t < text.size()) {
        if (p < pat.size() && pat[p] != "**" && wildcard_match(text[t], pat[p])) {
            ++t;
            ++p;
        } else if (p < pat.size() && pat[p] == "**") {
            starPos = p++;
            matchPos = t;
        } else if (starPos != std::string_view::npos) {
            p = starPos + 1;
            ++matchPos;
            t = matchPos;
        } else {
            return false;
        }
    }
    while (p < pat.size() && pat[p] == "**") {
        ++p;
    }
    return p == pat.size();
}

/**
 * Lightweight syntax check for glob patterns: rejects empty patterns,
 * empty segments ("a//b") and "**" glued to other characters ("a**").
 */
[[nodiscard]] inline bool is_valid_glob(std::string_view pattern) {
    if (pattern.empty())
        return false;
    if (pattern.find("//") != std::string_view::npos)
        return false;
    for (auto seg : split_segments(pattern)) {
        if (seg.find("**") != std::string_view::npos && seg != "**")
            return false;
    }
    return true;
}

} // namespace rclean::common
