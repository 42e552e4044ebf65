// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tubeq/core/progress.hpp>
#include <tubeq/core/numeric.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <format>

namespace tubeq::core {

namespace {

std::string clock_text(std::int64_t total_seconds) {
    const auto h = total_seconds / 3600;
    const auto m = (total_seconds % 3600) / 60;
    const auto s = total_seconds % 60;
    if (h > 0) {
        return std::format("{}:{:02}:{:02}", h, m, s);
    }
    return std::format("{}:{:02}", m, s);
}

} // namespace

std::string format_speed(std::optional<double> bytes_per_sec) {
    if (!bytes_per_sec || !std::isfinite(*bytes_per_sec) || *bytes_per_sec <= 0.0) {
        return std::string(UNKNOWN_VALUE);
    }

    constexpr std::array<std::string_view, 5> units{"B/s", "KiB/s", "MiB/s", "GiB/s", "TiB/s"};
    double value = *bytes_per_sec;
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < units.size()) {
        value /= 1024.0;
        ++unit;
    }
    if (unit == 0) {
        return std::format("{:.0f} {}", value, units[unit]);
    }
    return std::format("{:.2f} {}", value, units[unit]);
}

std::string format_eta(std::optional<double> seconds) {
    if (!seconds || !std::isfinite(*seconds)) {
        return std::string(UNKNOWN_VALUE);
    }
    return clock_text(saturate_cast<std::int64_t>(std::max(0.0, *seconds)));
}

std::string format_duration(std::chrono::seconds elapsed) {
    return clock_text(std::max<std::int64_t>(0, elapsed.count()));
}

bool ProgressThrottle::admit(const ProgressEvent& event, Clock::time_point now) noexcept {
    if (!std::holds_alternative<Downloading>(event)) {
        return true;
    }
    if (last_ && now - *last_ < interval_) {
        return false;
    }
    last_ = now;
    return true;
}

} // namespace tubeq::core
