// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <rclean/classify/classifier.h>
#include <rclean/common/units.h>

#include <spdlog/fmt/fmt.h>

namespace rclean::classify {

namespace {

Verdict keep(const walk::Entry& entry, std::string note) {
    Verdict v;
    v.entry = entry;
    v.disposition = Disposition::Keep;
    v.note = std::move(note);
    return v;
}

void applyIfEmpty(Verdict& v) {
    const auto& e = v.entry;
    switch (e.type) {
        case walk::EntryType::Directory:
            if (e.childCount == 0) {
                v.disposition = Disposition::DeleteIfEmpty;
            } else {
                v.disposition = Disposition::NeedsConfirmation;
                v.note = fmt::format("directory not empty ({} entries)", e.childCount);
            }
            break;
        case walk::EntryType::File:
            if (e.size == 0) {
                v.disposition = Disposition::DeleteIfEmpty;
            } else {
                v.disposition = Disposition::NeedsConfirmation;
                v.note = fmt::format("file not empty ({})", common::formatSize(e.size));
            }
            break;
        case walk::EntryType::Symlink:
            v.disposition = Disposition::DeleteIfEmpty;
            break;
        case walk::EntryType::Other:
            v.disposition = Disposition::Keep;
            break;
    }
}

void applyOlderThan(Verdict& v, const rules::Policy& policy, const ClassifyContext& context) {
    const auto age = context.now - v.entry.modified;
    if (age >= policy.threshold) {
        v.disposition = Disposition::Delete;
    } else {
        v.disposition = Disposition::Keep;
        v.note = fmt::format("newer than {}", common::formatDuration(policy.threshold));
    }
}

} // namespace

Verdict classify(const walk::Entry& entry, const rules::RuleSet& ruleSet,
                 const ClassifyContext& context) {
    if (!entry.accessible()) {
        return keep(entry, entry.accessError->message);
    }
    if (entry.type == walk::EntryType::Other) {
        return keep(entry, "special file");
    }
    if (const auto* pattern = ruleSet.excludedBy(entry)) {
        Verdict v = keep(entry, fmt::format("excluded by '{}'", *pattern));
        v.excluded = true;
        return v;
    }

    const auto* rule = ruleSet.match(entry);
    if (!rule) {
        return keep(entry, {});
    }

    Verdict v;
    v.entry = entry;
    v.rule = *rule;
    switch (rule->policy.kind) {
        case rules::PolicyKind::Always:
            v.disposition = Disposition::Delete;
            break;
        case rules::PolicyKind::IfEmpty:
            applyIfEmpty(v);
            break;
        case rules::PolicyKind::OlderThan:
            applyOlderThan(v, rule->policy, context);
            break;
    }
    return v;
}

std::vector<Verdict> classifyAll(const std::vector<walk::Entry>& entries,
                                 const rules::RuleSet& ruleSet, const ClassifyContext& context) {
    std::vector<Verdict> verdicts;
    verdicts.reserve(entries.size());
    for (const auto& entry : entries) {
        verdicts.push_back(classify(entry, ruleSet, context));
    }
    return verdicts;
}

} // namespace rclean::classify
