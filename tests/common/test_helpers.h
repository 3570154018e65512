// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

// Shared helpers for building small directory trees in tests
#pragma once

#include <rclean/core/types.h>
#include <rclean/rules/rule.h>
#include <rclean/walk/entry.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <unistd.h>

namespace rclean::tests {

inline std::filesystem::path make_temp_dir(const std::string& prefix = "rclean_test_") {
    auto base = std::filesystem::temp_directory_path();
    for (int i = 0; i < 1000; ++i) {
        auto p = base / (prefix + std::to_string(::getpid()) + "_" + std::to_string(i));
        if (std::filesystem::create_directories(p))
            return std::filesystem::canonical(p);
    }
    return base;
}

inline std::filesystem::path write_file(const std::filesystem::path& p, const std::string& data) {
    std::filesystem::create_directories(p.parent_path());
    std::ofstream ofs(p, std::ios::binary);
    ofs << data;
    return p;
}

inline std::filesystem::path make_dir(const std::filesystem::path& p) {
    std::filesystem::create_directories(p);
    return p;
}

inline std::filesystem::path make_symlink(const std::filesystem::path& target,
                                          const std::filesystem::path& link) {
    std::filesystem::create_symlink(target, link);
    return link;
}

inline void set_mtime(const std::filesystem::path& p, TimePoint when) {
    std::filesystem::last_write_time(p, std::chrono::file_clock::from_sys(when));
}

// Temporary directory removed when the fixture goes out of scope.
class TempTree {
public:
    explicit TempTree(const std::string& prefix = "rclean_test_") : root_(make_temp_dir(prefix)) {}
    ~TempTree() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    TempTree(const TempTree&) = delete;
    TempTree& operator=(const TempTree&) = delete;

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path operator/(const std::string& rel) const { return root_ / rel; }

    std::filesystem::path file(const std::string& rel, const std::string& data = "") const {
        return write_file(root_ / rel, data);
    }
    std::filesystem::path dir(const std::string& rel) const { return make_dir(root_ / rel); }
    std::filesystem::path link(const std::string& rel, const std::filesystem::path& target) const {
        return make_symlink(target, root_ / rel);
    }

private:
    std::filesystem::path root_;
};

// Hand-built entry for classifier and planner tests that do not touch disk.
inline walk::Entry make_entry(const std::filesystem::path& root, const std::string& rel,
                              walk::EntryType type, std::size_t ordinal, WalkId walkId = 1,
                              uint64_t size = 0) {
    walk::Entry e;
    e.path = root / rel;
    e.relativePath = rel;
    e.depth = static_cast<std::size_t>(std::count(rel.begin(), rel.end(), '/') + 1);
    e.type = type;
    e.size = size;
    e.walkId = walkId;
    e.ordinal = ordinal;
    return e;
}

inline rules::Rule make_rule(std::string pattern, rules::RuleKind kind,
                             rules::PolicyKind policy = rules::PolicyKind::Always,
                             std::chrono::seconds threshold = std::chrono::seconds{0},
                             rules::Category category = rules::Category::Other) {
    rules::Rule r;
    r.pattern = std::move(pattern);
    r.kind = kind;
    r.category = category;
    r.policy = rules::Policy{policy, threshold};
    return r;
}

} // namespace rclean::tests
