// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <rclean/io/file_system.h>

#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace rclean::io {

namespace {

TimePoint mtimeOf(const struct stat& st) {
#ifdef __APPLE__
    const auto& ts = st.st_mtimespec;
#else
    const auto& ts = st.st_mtim;
#endif
    auto since = std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(since));
}

EntryType typeOf(mode_t mode) {
    if (S_ISLNK(mode))
        return EntryType::Symlink;
    if (S_ISDIR(mode))
        return EntryType::Directory;
    if (S_ISREG(mode))
        return EntryType::File;
    return EntryType::Other;
}

class LocalFileSystem final : public IFileSystem {
public:
    Result<EntryStat> stat(const fs::path& path) const override {
        struct stat st {};
        if (::lstat(path.c_str(), &st) != 0) {
            return errorFromErrno(errno, path, "stat");
        }

        EntryStat out;
        out.type = typeOf(st.st_mode);
        out.modified = mtimeOf(st);
        if (out.type == EntryType::File) {
            out.size = static_cast<uint64_t>(st.st_size);
        }

        if (out.type == EntryType::Symlink) {
            std::error_code ec;
            auto target = fs::read_symlink(path, ec);
            if (ec) {
                return errorFromCode(ec, path, "readlink");
            }
            out.symlinkTarget = std::move(target);
            struct stat targetSt {};
            out.symlinkTargetExists = ::stat(path.c_str(), &targetSt) == 0;
        }
        return out;
    }

    Result<fs::path> canonical(const fs::path& path) const override {
        std::error_code ec;
        auto resolved = fs::canonical(path, ec);
        if (ec) {
            return errorFromCode(ec, path, "canonical");
        }
        return resolved;
    }

    Result<std::vector<std::string>> list(const fs::path& dir) const override {
        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            return errorFromCode(ec, dir, "list");
        }

        std::vector<std::string> names;
        for (fs::directory_iterator end; it != end; it.increment(ec)) {
            if (ec) {
                return errorFromCode(ec, dir, "list");
            }
            names.push_back(it->path().filename().string());
        }
        if (ec) {
            return errorFromCode(ec, dir, "list");
        }
        return names;
    }

    Result<void> removeFile(const fs::path& path) override {
        if (::unlink(path.c_str()) != 0) {
            return errorFromErrno(errno, path, "unlink");
        }
        return {};
    }

    Result<void> removeDirectory(const fs::path& path) override {
        if (::rmdir(path.c_str()) != 0) {
            return errorFromErrno(errno, path, "rmdir");
        }
        return {};
    }
};

} // namespace

Error errorFromErrno(int err, const fs::path& path, const char* op) {
    return errorFromCode(std::error_code(err, std::generic_category()), path, op);
}

Error errorFromCode(const std::error_code& ec, const fs::path& path, const char* op) {
    ErrorCode code = ErrorCode::IoError;
    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
        code = ErrorCode::NotFound;
    } else if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        code = ErrorCode::AccessDenied;
    } else if (ec == std::errc::directory_not_empty || ec == std::errc::file_exists) {
        code = ErrorCode::NotEmpty;
    } else if (ec == std::errc::timed_out) {
        code = ErrorCode::Timeout;
    }
    return Error{code, fmt::format("{} {}: {}", op, path.string(), ec.message())};
}

std::shared_ptr<IFileSystem> makeLocalFileSystem() {
    return std::make_shared<LocalFileSystem>();
}

} // namespace rclean::io
