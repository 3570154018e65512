// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <rclean/app/clean_service.h>
#include <rclean/classify/classifier.h>
#include <rclean/common/units.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <stdexcept>

namespace rclean::app {

namespace {

long long millisSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                 start)
        .count();
}

} // namespace

CleanService::CleanService(std::shared_ptr<io::IFileSystem> fs) : fs_(std::move(fs)) {
    if (!fs_) {
        throw std::invalid_argument("CleanService: filesystem cannot be null");
    }
}

Result<plan::Plan> CleanService::scan(const std::filesystem::path& root,
                                      const rules::RuleSet& ruleSet,
                                      const ScanOptions& options) const {
    const auto start = std::chrono::steady_clock::now();
    const classify::ClassifyContext context{options.now.value_or(std::chrono::system_clock::now())};

    walk::TreeWalker walker(fs_, options.walk);
    auto walk = walker.walk(root);
    if (!walk) {
        return walk.error();
    }
    auto& w = walk.value();

    std::vector<classify::Verdict> verdicts;
    while (auto entry = w.next()) {
        verdicts.push_back(classify::classify(*entry, ruleSet, context));
    }
    if (w.cancelled()) {
        return Error{ErrorCode::OperationCancelled,
                     fmt::format("Scan of {} cancelled after {} entries", w.root().string(),
                                 w.emitted())};
    }
    spdlog::debug("Walked and classified {} entries under {} in {}ms ({} access errors)",
                  verdicts.size(), w.root().string(), millisSince(start), w.errorCount());

    const auto planStart = std::chrono::steady_clock::now();
    auto built = plan::PlanBuilder(options.plan).build(std::move(verdicts));
    if (!built) {
        return built.error();
    }
    spdlog::debug("Built plan in {}ms", millisSince(planStart));
    spdlog::info("Scan of {}: {} of {} entries scheduled, {} reclaimable", w.root().string(),
                 built.value().actions().size(), built.value().entryCount(),
                 common::formatSize(built.value().totalBytes()));
    return built;
}

exec::ExecutionResult CleanService::clean(const plan::Plan& plan, const exec::ConfirmFn& confirm,
                                          const exec::ExecuteOptions& options) const {
    const auto start = std::chrono::steady_clock::now();
    exec::Executor executor(fs_);
    auto result = executor.execute(plan, confirm, options);
    spdlog::debug("Executed plan for walk {} in {}ms", plan.walkId(), millisSince(start));
    return result;
}

std::shared_ptr<io::IFileSystem> makeFileSystem(const config::EngineSettings& settings) {
    auto fs = io::makeLocalFileSystem();
    if (settings.timeout.count() > 0) {
        return io::makeTimedFileSystem(std::move(fs), settings.timeout);
    }
    return fs;
}

ScanOptions makeScanOptions(const config::EngineSettings& settings) {
    ScanOptions options;
    options.walk.workers = settings.workers;
    options.plan.removeDanglingSymlinks = settings.removeDanglingSymlinks;
    return options;
}

} // namespace rclean::app
