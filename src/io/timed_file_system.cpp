// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <rclean/io/file_system.h>

#include <spdlog/spdlog.h>

#include <future>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace rclean::io {

namespace {

class TimedFileSystem final : public IFileSystem {
public:
    TimedFileSystem(std::shared_ptr<IFileSystem> inner, Duration timeout)
        : inner_(std::move(inner)), timeout_(timeout) {}

    Result<EntryStat> stat(const fs::path& path) const override {
        return run<EntryStat>(path, "stat",
                              [inner = inner_, path] { return inner->stat(path); });
    }

    Result<fs::path> canonical(const fs::path& path) const override {
        return run<fs::path>(path, "canonical",
                             [inner = inner_, path] { return inner->canonical(path); });
    }

    Result<std::vector<std::string>> list(const fs::path& dir) const override {
        return run<std::vector<std::string>>(dir, "list",
                                             [inner = inner_, dir] { return inner->list(dir); });
    }

    Result<void> removeFile(const fs::path& path) override {
        return run<void>(path, "unlink", [inner = inner_, path] { return inner->removeFile(path); });
    }

    Result<void> removeDirectory(const fs::path& path) override {
        return run<void>(path, "rmdir",
                         [inner = inner_, path] { return inner->removeDirectory(path); });
    }

private:
    // The call owns its thread and shared state, so a hung call never delays
    // a later one and is simply abandoned on timeout.
    template <typename T, typename Fn>
    Result<T> run(const fs::path& path, const char* op, Fn&& fn) const {
        std::packaged_task<Result<T>()> task(std::forward<Fn>(fn));
        auto future = task.get_future();
        try {
            std::thread(std::move(task)).detach();
        } catch (const std::system_error& e) {
            return Error{ErrorCode::InternalError,
                         fmt::format("{} {}: cannot start worker: {}", op, path.string(), e.what())};
        }

        if (future.wait_for(timeout_) != std::future_status::ready) {
            spdlog::warn("{} {} timed out after {}ms", op, path.string(), timeout_.count());
            return Error{ErrorCode::Timeout, fmt::format("{} {}: timed out after {}ms", op,
                                                         path.string(), timeout_.count())};
        }
        return future.get();
    }

    std::shared_ptr<IFileSystem> inner_;
    Duration timeout_;
};

} // namespace

std::shared_ptr<IFileSystem> makeTimedFileSystem(std::shared_ptr<IFileSystem> inner,
                                                 Duration timeout) {
    if (!inner) {
        inner = makeLocalFileSystem();
    }
    if (timeout.count() <= 0) {
        return inner;
    }
    return std::make_shared<TimedFileSystem>(std::move(inner), timeout);
}

} // namespace rclean::io
