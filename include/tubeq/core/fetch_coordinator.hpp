// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tubeq/core/backend.hpp>
#include <tubeq/core/config.hpp>
#include <tubeq/core/format.hpp>
#include <tubeq/core/format_cache.hpp>
#include <tubeq/core/launcher.hpp>
#include <tubeq/core/mailbox.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace tubeq::core {

enum class FetchStatus : std::uint8_t {
    idle,
    fetching,
    loaded,
    no_formats,
    failed,
};

// Posted by a fetch worker. No collection means the fetch failed.
struct FetchCompleted {
    std::uint64_t sequence{0};
    std::string url;
    std::optional<FormatCollection> collection;
    std::string error;
};

// Debounced, cache-first metadata fetching for the URL currently shown.
// Only the most recently issued request may change visible state; older
// results are dropped when they arrive. Control-thread only, except for the
// workers it launches, which only post to the mailbox.
class FetchCoordinator {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    struct Settings {
        std::chrono::milliseconds debounce{FETCH_DEBOUNCE};
        std::size_t cache_capacity{FORMAT_CACHE_MAX_ENTRIES};
        std::size_t max_events_per_tick{MAX_EVENTS_PER_TICK};
    };

    struct Listener {
        std::function<void(const FormatCollection&)> applied;
        std::function<void()> cleared;
        std::function<void(FetchStatus, std::string_view)> status;
    };

    FetchCoordinator(MetadataSource& source, Launcher& launcher);
    FetchCoordinator(MetadataSource& source, Launcher& launcher,
                     Settings settings, TimeSource now = &Clock::now);

    FetchCoordinator(const FetchCoordinator&) = delete;
    FetchCoordinator& operator=(const FetchCoordinator&) = delete;

    void listener(Listener l) { listener_ = std::move(l); }

    // Text box edit: restart the quiet window and forget what was shown
    void on_url_changed(std::string_view url, bool suppress_fetch = false);

    // Explicit fetch. Without `force` nothing happens once the URL resolved.
    void on_fetch_formats(bool force);

    // Cache first, otherwise start a worker for the current URL
    void fetch_now();

    // Fire a due debounce deadline, then drain one bounded batch of results.
    // Returns the number of results processed.
    std::size_t tick();

    // Results still waiting after the last tick
    [[nodiscard]] bool has_pending() const { return !mailbox_->empty(); }

    // Suspend fetching while a download runs
    void hold(bool held) noexcept;

    [[nodiscard]] const std::string& current_url() const noexcept { return url_; }
    [[nodiscard]] const FormatCollection& visible() const noexcept { return visible_; }
    [[nodiscard]] bool has_formats() const noexcept { return loaded_ && !visible_.empty(); }
    [[nodiscard]] bool is_loaded() const noexcept { return loaded_; }
    [[nodiscard]] bool is_fetching() const noexcept { return fetching_; }
    [[nodiscard]] bool last_fetch_failed() const noexcept { return last_failed_; }
    [[nodiscard]] FetchStatus status() const noexcept { return status_; }
    [[nodiscard]] std::optional<std::uint64_t> active_sequence() const noexcept { return active_; }
    [[nodiscard]] std::uint64_t issued_requests() const noexcept { return counter_; }
    [[nodiscard]] std::optional<Clock::time_point> debounce_deadline() const noexcept { return deadline_; }
    [[nodiscard]] const FormatCache& cache() const noexcept { return cache_; }

private:
    void deliver(FetchCompleted result);
    void apply(const FormatCollection& collection);
    void clear_visible();
    void set_status(FetchStatus status, std::string_view message);

    MetadataSource& source_;
    Launcher& launcher_;
    Settings settings_;
    TimeSource now_;
    Listener listener_;

    // Shared with workers that may outlive a superseded request
    std::shared_ptr<Mailbox<FetchCompleted>> mailbox_;
    FormatCache cache_;

    std::uint64_t counter_{0};
    std::optional<std::uint64_t> active_;
    std::optional<Clock::time_point> deadline_;

    std::string url_;
    FormatCollection visible_;
    bool loaded_{false};
    bool fetching_{false};
    bool last_failed_{false};
    bool held_{false};
    FetchStatus status_{FetchStatus::idle};
};

} // namespace tubeq::core
