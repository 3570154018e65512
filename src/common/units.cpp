// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <rclean/common/pattern_utils.h>
#include <rclean/common/units.h>

#include <spdlog/fmt/fmt.h>

#include <charconv>
#include <limits>

namespace rclean::common {

Result<std::chrono::seconds> parseDuration(std::string_view text) {
    auto duration = trim(text);
    if (duration.empty()) {
        return Error{ErrorCode::ConfigError, "Duration cannot be empty"};
    }
    if (duration.size() < 2) {
        return Error{ErrorCode::ConfigError,
                     fmt::format("Invalid duration '{}': must be a number followed by a unit "
                                 "(s, m, h, d, w)",
                                 duration)};
    }

    auto numPart = duration.substr(0, duration.size() - 1);
    char unit = duration.back();

    uint64_t number = 0;
    auto [ptr, ec] = std::from_chars(numPart.data(), numPart.data() + numPart.size(), number);
    if (ec != std::errc{} || ptr != numPart.data() + numPart.size()) {
        return Error{ErrorCode::ConfigError,
                     fmt::format("Invalid number in duration: {}", numPart)};
    }

    uint64_t multiplier = 0;
    switch (unit) {
        case 's':
            multiplier = 1;
            break;
        case 'm':
            multiplier = 60;
            break;
        case 'h':
            multiplier = 3600;
            break;
        case 'd':
            multiplier = 86400;
            break;
        case 'w':
            multiplier = 604800;
            break;
        default:
            return Error{ErrorCode::ConfigError,
                         fmt::format("Invalid duration unit '{}'. Use 's', 'm', 'h', 'd', or 'w'",
                                     unit)};
    }

    if (number > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) / multiplier) {
        return Error{ErrorCode::ConfigError, fmt::format("Duration out of range: {}", duration)};
    }
    return std::chrono::seconds(static_cast<int64_t>(number * multiplier));
}

std::string formatSize(uint64_t bytes) {
    constexpr double KIB = 1024.0;
    constexpr double MIB = KIB * 1024.0;
    constexpr double GIB = MIB * 1024.0;
    constexpr double TIB = GIB * 1024.0;

    const auto size = static_cast<double>(bytes);
    if (size >= TIB)
        return fmt::format("{:.2f} TiB", size / TIB);
    if (size >= GIB)
        return fmt::format("{:.2f} GiB", size / GIB);
    if (size >= MIB)
        return fmt::format("{:.2f} MiB", size / MIB);
    if (size >= KIB)
        return fmt::format("{:.2f} KiB", size / KIB);
    return fmt::format("{} B", bytes);
}

std::string formatDuration(std::chrono::seconds duration) {
    const auto secs = duration.count();
    if (secs > 0 && secs % 604800 == 0)
        return fmt::format("{}w", secs / 604800);
    if (secs > 0 && secs % 86400 == 0)
        return fmt::format("{}d", secs / 86400);
    if (secs > 0 && secs % 3600 == 0)
        return fmt::format("{}h", secs / 3600);
    if (secs > 0 && secs % 60 == 0)
        return fmt::format("{}m", secs / 60);
    return fmt::format("{}s", secs);
}

} // namespace rclean::common
