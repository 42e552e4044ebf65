// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tubeq/core/app_config.hpp>
#include <tubeq/core/backend.hpp>
#include <tubeq/core/download_worker.hpp>
#include <tubeq/core/error.hpp>
#include <tubeq/core/fetch_coordinator.hpp>
#include <tubeq/core/format.hpp>
#include <tubeq/core/launcher.hpp>
#include <tubeq/core/options.hpp>
#include <tubeq/core/queue_engine.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace tubeq::core {

// Single control-thread facade over fetching, the current selection, single
// downloads and the queue. Every method must be called from the thread that
// calls tick().
class Controller {
public:
    struct Listener {
        std::function<void(std::string_view)> status;
        std::function<void(const ProgressEvent&)> progress;
        // Terminal outcome of a single download or a queue run
        std::function<void(Outcome)> finished;
        std::function<void()> formats_changed;
        std::function<void()> queue_changed;
    };

    Controller(MetadataSource& metadata, DownloadBackend& backend, Launcher& launcher,
               const AppConfig& config,
               FetchCoordinator::TimeSource now = &FetchCoordinator::Clock::now);

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;

    void listener(Listener l) { listener_ = std::move(l); }

    //=========================================================================
    // URL and formats
    //=========================================================================

    void on_url_changed(std::string_view url, bool suppress_fetch = false);
    void on_fetch_formats(bool force = false);

    // Recompute the offered labels; keeps the chosen label if still offered
    void apply_mode_formats(Mode mode, std::string_view container, std::string_view codec);

    // Errc::formats_unavailable when the label is not offered
    [[nodiscard]] std::error_code select_format(std::string_view label);

    //=========================================================================
    // Options
    //=========================================================================

    void set_convert_to_mp4(bool value) noexcept { convert_to_mp4_ = value; }
    void set_output_dir(std::string dir) { output_dir_ = std::move(dir); }
    void set_playlist_enabled(bool value) noexcept { playlist_requested_ = value; }
    void set_playlist_items(std::string items) { playlist_items_ = std::move(items); }
    void set_options(RawOptions options) { options_ = std::move(options); }

    //=========================================================================
    // Downloads
    //=========================================================================

    // Errc::download_in_progress / missing_url / formats_unavailable /
    // selection_incomplete / output_dir_unavailable
    [[nodiscard]] std::error_code start_single();

    // QueueIssue codes on rejection, Errc::queue_locked while a run is active
    [[nodiscard]] std::error_code add_to_queue();

    [[nodiscard]] std::expected<QueueStartStatus, QueueValidationError> start_queue();

    void cancel() noexcept;

    // Drain fetch results and worker messages; returns messages handled
    std::size_t tick();

    [[nodiscard]] bool has_pending() const;

    //=========================================================================
    // State
    //=========================================================================

    [[nodiscard]] const std::string& url() const noexcept { return fetch_.current_url(); }
    [[nodiscard]] bool playlist_mode() const noexcept { return playlist_mode_; }
    [[nodiscard]] bool downloading() const noexcept { return single_active_ || queue_.active(); }
    [[nodiscard]] bool single_active() const noexcept { return single_active_; }
    [[nodiscard]] Mode mode() const noexcept { return mode_; }
    [[nodiscard]] const std::string& container() const noexcept { return container_; }
    [[nodiscard]] const std::string& codec() const noexcept { return codec_; }
    [[nodiscard]] const FormatList& formats() const noexcept { return formats_; }
    [[nodiscard]] const std::string& selected_label() const noexcept { return selected_label_; }
    [[nodiscard]] bool codec_fallback_used() const noexcept { return codec_fallback_used_; }

    // Snapshot of the current selection as it would be queued
    [[nodiscard]] QueueSettings capture_settings() const;

    [[nodiscard]] FetchCoordinator& fetcher() noexcept { return fetch_; }
    [[nodiscard]] const FetchCoordinator& fetcher() const noexcept { return fetch_; }
    [[nodiscard]] QueueEngine& queue() noexcept { return queue_; }
    [[nodiscard]] const QueueEngine& queue() const noexcept { return queue_; }

private:
    void on_formats_applied(const FormatCollection& collection);
    void on_formats_cleared();
    void refresh_formats();
    void single_done(Outcome outcome, const std::string& detail);
    void route(JobMessage message);
    void report(std::string_view text);

    DownloadBackend& backend_;
    AppConfig config_;
    Listener listener_;

    FetchCoordinator fetch_;
    DownloadWorker worker_;
    QueueEngine queue_;

    bool playlist_mode_{false};
    bool playlist_requested_{true};
    bool single_active_{false};

    Mode mode_{Mode::none};
    std::string container_;
    std::string codec_;
    FormatList formats_;
    std::string selected_label_;
    bool codec_fallback_used_{false};

    bool convert_to_mp4_{false};
    std::string output_dir_;
    std::string playlist_items_;
    RawOptions options_;
};

} // namespace tubeq::core
