// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <rclean/plan/plan_builder.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <optional>
#include <queue>
#include <unordered_map>

namespace fs = std::filesystem;

namespace rclean::plan {

using classify::Disposition;
using classify::Verdict;

namespace {

fs::path normalized(fs::path p) {
    p = p.lexically_normal();
    if (p.has_relative_path() && p.filename().empty()) {
        p = p.parent_path();
    }
    return p;
}

class PathIndex {
public:
    explicit PathIndex(fs::path root) : root_(std::move(root)) {}

    void add(const fs::path& path, std::size_t index) { index_.emplace(path.string(), index); }

    std::optional<std::size_t> find(const fs::path& path) const {
        auto it = index_.find(path.string());
        if (it == index_.end())
            return std::nullopt;
        return it->second;
    }

    // Closest proper ancestor of `path` below the root that satisfies `pred`.
    template <typename Pred>
    std::optional<std::size_t> nearestAncestor(const fs::path& path, Pred&& pred) const {
        auto current = path.parent_path();
        while (current != root_ && current != current.parent_path()) {
            if (auto idx = find(current); idx && pred(*idx)) {
                return idx;
            }
            current = current.parent_path();
        }
        return std::nullopt;
    }

private:
    fs::path root_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace

Result<Plan> PlanBuilder::build(std::vector<Verdict> verdicts) const {
    Plan plan;
    if (verdicts.empty()) {
        return plan;
    }

    const WalkId walkId = verdicts.front().entry.walkId;
    for (const auto& v : verdicts) {
        if (v.entry.walkId != walkId) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Verdicts span more than one walk ({} and {})", walkId,
                                     v.entry.walkId)};
        }
    }

    std::sort(verdicts.begin(), verdicts.end(), [](const Verdict& a, const Verdict& b) {
        return a.entry.ordinal < b.entry.ordinal;
    });

    plan.root_ = verdicts.front().entry.walkRoot();
    plan.walkId_ = walkId;
    plan.entryCount_ = verdicts.size();

    PathIndex byPath(plan.root_);
    for (std::size_t i = 0; i < verdicts.size(); ++i) {
        const auto& v = verdicts[i];
        byPath.add(v.entry.path, i);
        if (!v.entry.accessible()) {
            plan.accessErrors_.push_back({v.entry.path, *v.entry.accessError});
        } else if (v.excluded) {
            plan.exclusions_.push_back({v.entry.path, v.note});
        }
    }

    auto isScheduled = [&](std::size_t i) { return verdicts[i].scheduled(); };

    // Target itself when scheduled, else the target's nearest scheduled ancestor.
    auto scheduledTargetOf = [&](const Verdict& v) -> std::optional<std::size_t> {
        auto target = v.entry.resolvedTarget();
        if (!target)
            return std::nullopt;
        auto t = normalized(*target);
        if (t == v.entry.path)
            return std::nullopt;
        if (auto idx = byPath.find(t); idx && isScheduled(*idx)) {
            return idx;
        }
        return byPath.nearestAncestor(t, isScheduled);
    };

    if (options_.removeDanglingSymlinks) {
        bool changed = true;
        while (changed) {
            changed = false;
            for (auto& v : verdicts) {
                if (v.scheduled() || v.excluded || !v.entry.accessible() ||
                    v.entry.type != walk::EntryType::Symlink) {
                    continue;
                }
                auto idx = scheduledTargetOf(v);
                if (!idx)
                    continue;
                const auto& target = verdicts[*idx];
                v.disposition = target.disposition == Disposition::NeedsConfirmation
                                    ? Disposition::NeedsConfirmation
                                    : Disposition::Delete;
                v.note = fmt::format("target {} is scheduled", target.entry.relativePath);
                changed = true;
            }
        }
    }

    // Graph over scheduled verdicts: node i must run before every node in succ[i].
    std::vector<std::size_t> nodes;
    std::unordered_map<std::size_t, std::size_t> nodeOf;
    for (std::size_t i = 0; i < verdicts.size(); ++i) {
        if (verdicts[i].scheduled()) {
            nodeOf.emplace(i, nodes.size());
            nodes.push_back(i);
        }
    }

    std::vector<std::vector<std::size_t>> succ(nodes.size());
    std::vector<std::size_t> indegree(nodes.size(), 0);
    auto addEdge = [&](std::size_t from, std::size_t to) {
        if (from == to)
            return;
        auto& out = succ[from];
        if (std::find(out.begin(), out.end(), to) != out.end())
            return;
        out.push_back(to);
        ++indegree[to];
    };

    for (std::size_t n = 0; n < nodes.size(); ++n) {
        const auto& v = verdicts[nodes[n]];
        if (auto parent = byPath.nearestAncestor(v.entry.path, isScheduled)) {
            addEdge(n, nodeOf.at(*parent));
        }
        if (v.entry.type != walk::EntryType::Symlink) {
            continue;
        }
        auto idx = scheduledTargetOf(v);
        if (!idx)
            continue;
        const auto& target = verdicts[*idx];
        auto resolved = normalized(*v.entry.resolvedTarget());
        if (target.entry.path == resolved) {
            plan.conflicts_.push_back({ConflictKind::TargetScheduled, v.entry.path, resolved,
                                       fmt::format("target is scheduled for {}",
                                                   classify::dispositionName(target.disposition))});
        } else {
            plan.conflicts_.push_back(
                {ConflictKind::TargetInsideScheduledDirectory, v.entry.path, resolved,
                 fmt::format("target is inside {}", target.entry.relativePath)});
        }
        addEdge(n, nodeOf.at(*idx));
    }

    // Kahn's algorithm; ties go to the earliest entry in walk order.
    std::priority_queue<std::size_t, std::vector<std::size_t>, std::greater<>> ready;
    for (std::size_t n = 0; n < nodes.size(); ++n) {
        if (indegree[n] == 0)
            ready.push(n);
    }

    std::vector<bool> emitted(nodes.size(), false);
    std::vector<std::size_t> order;
    order.reserve(nodes.size());
    auto emit = [&](std::size_t n) {
        emitted[n] = true;
        order.push_back(n);
        for (auto next : succ[n]) {
            if (emitted[next])
                continue;
            if (--indegree[next] == 0) {
                ready.push(next);
            }
        }
    };

    while (order.size() < nodes.size()) {
        if (ready.empty()) {
            // Only a cycle of symlinks can stall the queue; release its
            // earliest link and never a directory.
            std::size_t pick = nodes.size();
            for (std::size_t n = 0; n < nodes.size(); ++n) {
                if (emitted[n])
                    continue;
                if (pick == nodes.size())
                    pick = n;
                if (verdicts[nodes[n]].entry.type == walk::EntryType::Symlink) {
                    pick = n;
                    break;
                }
            }
            const auto& v = verdicts[nodes[pick]];
            spdlog::warn("Symlink cycle at {}; breaking in walk order", v.entry.path.string());
            plan.conflicts_.push_back({ConflictKind::SymlinkCycle, v.entry.path,
                                       v.entry.resolvedTarget().value_or(fs::path{}),
                                       "ordering cycle broken in walk order"});
            indegree[pick] = 0;
            emit(pick);
            continue;
        }
        auto n = ready.top();
        ready.pop();
        emit(n);
    }

    plan.actions_.reserve(order.size());
    for (auto n : order) {
        plan.actions_.push_back(std::move(verdicts[nodes[n]]));
    }
    plan.totalBytes_ = estimateBytes(plan);

    spdlog::debug("Plan for walk {}: {} actions, {} conflicts, {} bytes", plan.walkId_,
                  plan.actions_.size(), plan.conflicts_.size(), plan.totalBytes_);
    return plan;
}

uint64_t PlanBuilder::estimateBytes(const Plan& plan) {
    uint64_t total = 0;
    for (const auto& action : plan.actions()) {
        if (action.entry.type != walk::EntryType::File)
            continue;
        if (action.disposition == Disposition::Delete ||
            action.disposition == Disposition::DeleteIfEmpty) {
            total += action.entry.size;
        }
    }
    return total;
}

} // namespace rclean::plan
