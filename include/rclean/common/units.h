// Copyright (c) 2026 rclean Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <rclean/core/types.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace rclean::common {

/**
 * Parse a duration such as "30d", "24h" or "3600s".
 *
 * Units: s (seconds), m (minutes), h (hours), d (days), w (weeks). Surrounding
 * whitespace is ignored. Fails with ConfigError otherwise.
 */
Result<std::chrono::seconds> parseDuration(std::string_view text);

// Human-readable size using IEC binary units ("512 B", "1.50 KiB", "2.00 GiB").
std::string formatSize(uint64_t bytes);

// Inverse of parseDuration for display ("30d" when exact, else seconds).
std::string formatDuration(std::chrono::seconds duration);

} // namespace rclean::common
