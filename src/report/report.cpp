// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <rclean/common/units.h>
#include <rclean/report/report.h>

#include <spdlog/fmt/fmt.h>

#include <sstream>

namespace rclean::report {

using json = nlohmann::json;
using classify::Disposition;

namespace {

constexpr const char* kTargetPattern = "(symlink target)";

bool countsBytes(const classify::Verdict& v) {
    return v.entry.type == walk::EntryType::File &&
           (v.disposition == Disposition::Delete || v.disposition == Disposition::DeleteIfEmpty);
}

std::string displayPattern(const rules::Rule& rule) {
    if (rule.kind == rules::RuleKind::BrokenSymlink)
        return "(broken symlink)";
    return rule.pattern;
}

// Rules may share pattern text across kinds, so the kind is part of the key.
std::string patternKey(const classify::Verdict& v) {
    if (!v.rule)
        return kTargetPattern;
    return fmt::format("{}:{}", rules::ruleKindName(v.rule->kind), displayPattern(*v.rule));
}

std::string displayPath(const classify::Verdict& v) {
    if (v.entry.type == walk::EntryType::Directory)
        return v.entry.relativePath + "/";
    return v.entry.relativePath;
}

void add(Bucket& bucket, uint64_t bytes) {
    ++bucket.count;
    bucket.bytes += bytes;
}

json ruleToJson(const rules::Rule& rule) {
    json j;
    j["pattern"] = rule.pattern;
    j["kind"] = rules::ruleKindName(rule.kind);
    j["category"] = rules::categoryName(rule.category);
    j["policy"] = rules::policyKindName(rule.policy.kind);
    if (rule.policy.kind == rules::PolicyKind::OlderThan) {
        j["older_than"] = common::formatDuration(rule.policy.threshold);
    }
    return j;
}

json bucketToJson(const Bucket& b) {
    return json{{"count", b.count}, {"bytes", b.bytes}};
}

} // namespace

PlanStats computeStats(const plan::Plan& plan) {
    PlanStats stats;
    for (const auto& action : plan.actions()) {
        const uint64_t bytes = countsBytes(action) ? action.entry.size : 0;
        add(stats.total, bytes);
        if (action.disposition == Disposition::NeedsConfirmation) {
            add(stats.needsConfirmation,
                action.entry.type == walk::EntryType::File ? action.entry.size : 0);
        }
        if (action.rule) {
            add(stats.byCategory[action.rule->category], bytes);
        } else {
            add(stats.promotedLinks, bytes);
        }
        add(stats.byPattern[patternKey(action)], bytes);
    }
    return stats;
}

std::string formatPlan(const plan::Plan& plan) {
    std::ostringstream oss;
    oss << fmt::format("Plan for {} (walk {}): {} actions, {} entries scanned\n",
                       plan.root().string(), plan.walkId(), plan.actions().size(),
                       plan.entryCount());

    for (const auto& action : plan.actions()) {
        std::string size =
            action.entry.type == walk::EntryType::File ? common::formatSize(action.entry.size) : "-";
        std::string origin = action.rule ? fmt::format("{} {}, {}",
                                                       rules::ruleKindName(action.rule->kind),
                                                       displayPattern(*action.rule),
                                                       rules::categoryName(action.rule->category))
                                         : action.note;
        oss << fmt::format("  {:<18} {:>10}  {}  [{}]", classify::dispositionName(action.disposition),
                           size, displayPath(action), origin);
        if (action.rule && !action.note.empty()) {
            oss << " (" << action.note << ")";
        }
        oss << '\n';
    }

    if (!plan.conflicts().empty()) {
        oss << "Conflicts:\n";
        for (const auto& c : plan.conflicts()) {
            oss << fmt::format("  {} {} -> {}: {}\n", plan::conflictKindName(c.kind),
                               c.symlink.string(), c.target.string(), c.detail);
        }
    }
    if (!plan.accessErrors().empty()) {
        oss << "Skipped (not accessible):\n";
        for (const auto& issue : plan.accessErrors()) {
            oss << fmt::format("  {}: {}\n", issue.path.string(), issue.error.message);
        }
    }
    if (!plan.exclusions().empty()) {
        oss << "Excluded:\n";
        for (const auto& ex : plan.exclusions()) {
            oss << fmt::format("  {}: {}\n", ex.path.string(), ex.reason);
        }
    }

    auto stats = computeStats(plan);
    oss << fmt::format("Reclaimable: {}", common::formatSize(plan.totalBytes()));
    if (stats.needsConfirmation.count > 0) {
        oss << fmt::format(" ({} action{} need confirmation)", stats.needsConfirmation.count,
                           stats.needsConfirmation.count == 1 ? "" : "s");
    }
    oss << '\n';
    return oss.str();
}

std::string formatExecution(const exec::ExecutionResult& result) {
    std::ostringstream oss;
    for (const auto& a : result.actions) {
        if (a.outcome == exec::Outcome::Deleted)
            continue;
        oss << fmt::format("  {:<8} {}: {}\n", exec::outcomeName(a.outcome), a.path.string(),
                           a.reason);
    }
    oss << fmt::format("{} deleted, {} skipped, {} failed, {} freed{}\n", result.deleted,
                       result.skipped, result.failed, common::formatSize(result.bytesFreed),
                       result.cancelled ? " (cancelled)" : "");
    return oss.str();
}

json toJson(const plan::Plan& plan) {
    json j;
    j["root"] = plan.root().string();
    j["walk_id"] = plan.walkId();
    j["entry_count"] = plan.entryCount();
    j["total_bytes"] = plan.totalBytes();
    j["total_size"] = common::formatSize(plan.totalBytes());

    j["actions"] = json::array();
    for (const auto& action : plan.actions()) {
        json a;
        a["path"] = action.entry.path.string();
        a["relative_path"] = action.entry.relativePath;
        a["type"] = io::entryTypeName(action.entry.type);
        a["disposition"] = classify::dispositionName(action.disposition);
        a["size"] = action.entry.size;
        a["rule"] = action.rule ? ruleToJson(*action.rule) : json(nullptr);
        if (!action.note.empty()) {
            a["note"] = action.note;
        }
        j["actions"].push_back(std::move(a));
    }

    j["conflicts"] = json::array();
    for (const auto& c : plan.conflicts()) {
        j["conflicts"].push_back(json{{"kind", plan::conflictKindName(c.kind)},
                                  {"symlink", c.symlink.string()},
                                  {"target", c.target.string()},
                                  {"detail", c.detail}});
    }

    j["access_errors"] = json::array();
    for (const auto& issue : plan.accessErrors()) {
        j["access_errors"].push_back(json{{"path", issue.path.string()},
                                      {"error", errorToString(issue.error.code)},
                                      {"message", issue.error.message}});
    }

    j["exclusions"] = json::array();
    for (const auto& ex : plan.exclusions()) {
        j["exclusions"].push_back(json{{"path", ex.path.string()}, {"reason", ex.reason}});
    }

    auto stats = computeStats(plan);
    json byCategory = json::object();
    for (const auto& [category, bucket] : stats.byCategory) {
        byCategory[rules::categoryName(category)] = bucketToJson(bucket);
    }
    json byPattern = json::object();
    for (const auto& [pattern, bucket] : stats.byPattern) {
        byPattern[pattern] = bucketToJson(bucket);
    }
    j["stats"] = {{"by_category", std::move(byCategory)},
                  {"by_pattern", std::move(byPattern)},
                  {"promoted_links", bucketToJson(stats.promotedLinks)},
                  {"needs_confirmation", bucketToJson(stats.needsConfirmation)}};
    return j;
}

json toJson(const exec::ExecutionResult& result) {
    json j;
    j["deleted"] = result.deleted;
    j["skipped"] = result.skipped;
    j["failed"] = result.failed;
    j["bytes_freed"] = result.bytesFreed;
    j["cancelled"] = result.cancelled;
    j["actions"] = json::array();
    for (const auto& a : result.actions) {
        json item{{"path", a.path.string()}, {"outcome", exec::outcomeName(a.outcome)}};
        if (!a.reason.empty()) {
            item["reason"] = a.reason;
        }
        if (a.bytes > 0) {
            item["bytes"] = a.bytes;
        }
        j["actions"].push_back(std::move(item));
    }
    return j;
}

} // namespace rclean::report
