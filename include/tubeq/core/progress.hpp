// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tubeq/core/config.hpp>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace tubeq::core {

//=============================================================================
// Progress events emitted by the download backend
//=============================================================================

struct Downloading {
    std::optional<double> percent;   // Unknown while the total size is unknown
    std::string speed;               // Already formatted, "1.50 MiB/s"
    std::string eta;                 // "1:05"

    bool operator==(const Downloading&) const = default;
};

// A new playlist entry or queue item started
struct ItemStarted {
    std::string label;

    bool operator==(const ItemStarted&) const = default;
};

// Transfer done, post-processing may follow
struct Finished {
    bool operator==(const Finished&) const = default;
};

struct Cancelled {
    bool operator==(const Cancelled&) const = default;
};

using ProgressEvent = std::variant<Downloading, ItemStarted, Finished, Cancelled>;

// Called from worker threads
using ProgressSink = std::function<void(ProgressEvent)>;

constexpr std::string_view UNKNOWN_VALUE = "--";

[[nodiscard]] std::string format_speed(std::optional<double> bytes_per_sec);
[[nodiscard]] std::string format_eta(std::optional<double> seconds);
[[nodiscard]] std::string format_duration(std::chrono::seconds elapsed);

// Rate-limits Downloading events; every other event passes through
class ProgressThrottle {
public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressThrottle(std::chrono::milliseconds interval = PROGRESS_INTERVAL) noexcept
        : interval_(interval) {}

    [[nodiscard]] bool admit(const ProgressEvent& event, Clock::time_point now) noexcept;

    void reset() noexcept { last_.reset(); }

private:
    std::chrono::milliseconds interval_;
    std::optional<Clock::time_point> last_;
};

} // namespace tubeq::core
