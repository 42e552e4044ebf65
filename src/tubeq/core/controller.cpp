// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tubeq/core/controller.hpp>
#include <tubeq/core/download_request.hpp>
#include <tubeq/core/format_catalog.hpp>
#include <tubeq/core/format_selector.hpp>
#include <tubeq/core/url.hpp>
#include <spdlog/spdlog.h>
#include <format>

namespace tubeq::core {

Controller::Controller(MetadataSource& metadata, DownloadBackend& backend, Launcher& launcher,
                       const AppConfig& config, FetchCoordinator::TimeSource now)
    : backend_(backend)
    , config_(config)
    , fetch_(metadata, launcher,
             FetchCoordinator::Settings{config.fetch_debounce, config.format_cache_capacity,
                                        config.max_events_per_tick},
             std::move(now))
    , worker_(launcher, config.progress_interval)
    , queue_(worker_, metadata, backend)
    , output_dir_(config.output_dir) {
    queue_.defaults(config_.network, config_.output_dir);

    fetch_.listener({
        .applied = [this](const FormatCollection& c) { on_formats_applied(c); },
        .cleared = [this] { on_formats_cleared(); },
        .status = [this](FetchStatus, std::string_view text) { report(text); },
    });

    queue_.listener({
        .item_started = [this](std::size_t index, std::size_t total, const std::string& url) {
            report(std::format("Queue item {}/{}: {}", index, total, url));
            if (listener_.queue_changed) listener_.queue_changed();
        },
        .progress = [this](const ProgressEvent& event) {
            if (listener_.progress) listener_.progress(event);
        },
        .finished = [this](const QueueRunSummary& summary) {
            fetch_.hold(false);
            switch (summary.outcome) {
                case Outcome::cancelled: report("Queue cancelled"); break;
                case Outcome::failed:
                    report(std::format("Queue finished with {} failed item(s)", summary.failed_items));
                    break;
                case Outcome::success: report("Queue finished"); break;
            }
            if (listener_.queue_changed) listener_.queue_changed();
            if (listener_.finished) listener_.finished(summary.outcome);
        },
    });
}

//=============================================================================
// URL and formats
//=============================================================================

void Controller::on_url_changed(std::string_view url, bool suppress_fetch) {
    auto cleaned = strip_url_whitespace(url);
    if (is_mixed_url(cleaned)) {
        cleaned = config_.prefer_playlist ? to_playlist_url(cleaned) : strip_list_param(cleaned);
        spdlog::info("[fetch] mixed video/playlist URL resolved to {}", cleaned);
    }
    playlist_mode_ = is_playlist_url(cleaned);
    fetch_.on_url_changed(cleaned, suppress_fetch);
}

void Controller::on_fetch_formats(bool force) {
    if (downloading()) return;
    fetch_.on_fetch_formats(force);
}

void Controller::on_formats_applied(const FormatCollection& collection) {
    if (collection.is_playlist) {
        playlist_mode_ = true;
    }
    refresh_formats();
}

void Controller::on_formats_cleared() {
    formats_.clear();
    selected_label_.clear();
    codec_fallback_used_ = false;
    if (listener_.formats_changed) listener_.formats_changed();
}

void Controller::apply_mode_formats(Mode mode, std::string_view container, std::string_view codec) {
    mode_ = mode;
    container_ = std::string(container);
    codec_ = std::string(codec);
    refresh_formats();
}

void Controller::refresh_formats() {
    auto selection = select_mode_formats(mode_, container_, codec_, fetch_.visible());
    if (!fetch_.is_loaded()) {
        selection = {};
    }
    formats_ = std::move(selection.formats);
    codec_fallback_used_ = selection.codec_fallback_used;

    if (codec_fallback_used_) {
        spdlog::info("[fetch] no {} formats in {}; showing any codec", codec_, container_);
    }

    if (find_format(formats_, selected_label_) == nullptr) {
        selected_label_ = formats_.empty() ? std::string{} : formats_.front().label;
    }
    if (listener_.formats_changed) listener_.formats_changed();
}

std::error_code Controller::select_format(std::string_view label) {
    if (find_format(formats_, label) == nullptr) {
        return make_error_code(Errc::formats_unavailable);
    }
    selected_label_ = std::string(label);
    return {};
}

QueueSettings Controller::capture_settings() const {
    QueueSettings settings;
    settings.mode = mode_;
    settings.container = container_;
    settings.codec = codec_;
    settings.convert_to_mp4 = convert_to_mp4_;
    settings.format_label = selected_label_;
    settings.output_dir = output_dir_;
    settings.playlist_items = playlist_items_;
    settings.options = options_;
    if (const auto* format = find_format(formats_, selected_label_)) {
        settings.estimated_size = humanize_bytes(estimate_filesize_bytes(*format));
    }
    return settings;
}

//=============================================================================
// Downloads
//=============================================================================

std::error_code Controller::start_single() {
    if (downloading() || worker_.busy()) {
        return make_error_code(Errc::download_in_progress);
    }
    const auto& url = fetch_.current_url();
    if (url.empty()) {
        return make_error_code(Errc::missing_url);
    }
    if (!fetch_.has_formats()) {
        return make_error_code(Errc::formats_unavailable);
    }

    const auto settings = capture_settings();
    const auto* format = find_format(formats_, settings.format_label);
    if (format == nullptr || queue_settings_issue(settings) != QueueIssue::none) {
        return make_error_code(Errc::selection_incomplete);
    }

    const bool playlist_enabled = playlist_mode_ && playlist_requested_;
    auto request = build_single_request(url, settings, LabeledFormat{settings.format_label, *format},
                                        playlist_enabled, config_.network, config_.output_dir);
    request.title = fetch_.visible().preview_title;
    if (auto ec = ensure_output_dir(request.output_dir)) {
        return ec;
    }
    if (request.playlist_enabled) {
        spdlog::info("[download] playlist items={}", request.playlist_items.value_or("all"));
    }

    auto job = worker_.start([&backend = backend_, request = std::move(request)]
                             (std::stop_token stop, const ProgressSink& progress) {
        return backend.run_download(request, stop, progress);
    });
    if (!job) {
        return job.error();
    }

    single_active_ = true;
    fetch_.hold(true);
    report("Downloading...");
    return {};
}

std::error_code Controller::add_to_queue() {
    if (queue_.active()) {
        return make_error_code(Errc::queue_locked);
    }
    const auto& url = fetch_.current_url();
    if (url.empty()) {
        return make_error_code(QueueIssue::missing_url);
    }
    if (playlist_mode_) {
        return make_error_code(QueueIssue::playlist);
    }
    if (!fetch_.has_formats()) {
        return make_error_code(QueueIssue::formats);
    }

    auto settings = capture_settings();
    if (auto issue = queue_settings_issue(settings); issue != QueueIssue::none) {
        spdlog::info("[queue] cannot add: {}", make_error_code(issue).message());
        return make_error_code(issue);
    }

    if (auto ec = queue_.add(QueueItem{url, std::move(settings)})) {
        return ec;
    }
    spdlog::info("[queue] added {} ({} item(s))", url, queue_.items().size());
    if (listener_.queue_changed) listener_.queue_changed();
    return {};
}

std::expected<QueueStartStatus, QueueValidationError> Controller::start_queue() {
    if (single_active_) {
        return QueueStartStatus::busy;
    }
    auto status = queue_.start();
    if (!status) {
        report(std::format("Queue item {} is incomplete: {}",
                           status.error().index, status.error().code().message()));
        return status;
    }
    // A queue of blank items finishes inside start() and has already released the hold
    if (*status == QueueStartStatus::started && queue_.active()) {
        fetch_.hold(true);
        if (listener_.queue_changed) listener_.queue_changed();
    }
    return status;
}

void Controller::cancel() noexcept {
    if (single_active_) {
        if (worker_.cancel_requested()) return;
        worker_.cancel();
        spdlog::info("[download] cancellation requested");
    } else if (queue_.active()) {
        if (queue_.cancel_requested()) return;
        queue_.cancel();
        spdlog::info("[queue] cancellation requested");
    }
}

//=============================================================================
// Control-thread pump
//=============================================================================

std::size_t Controller::tick() {
    auto handled = fetch_.tick();
    handled += worker_.drain(config_.max_events_per_tick,
                             [this](JobMessage message) { route(std::move(message)); });
    return handled;
}

bool Controller::has_pending() const {
    return fetch_.has_pending() || worker_.has_pending();
}

void Controller::route(JobMessage message) {
    if (queue_.active()) {
        queue_.handle(message);
        return;
    }
    if (!single_active_) return;

    if (auto* progress = std::get_if<JobProgress>(&message)) {
        if (listener_.progress) listener_.progress(progress->event);
        return;
    }
    auto& done = std::get<JobFinished>(message);
    single_done(done.outcome, done.detail);
}

void Controller::single_done(Outcome outcome, const std::string& detail) {
    single_active_ = false;
    fetch_.hold(false);

    switch (outcome) {
        case Outcome::success:
            report("Download complete");
            break;
        case Outcome::failed:
            if (!detail.empty()) spdlog::error("[download] {}", detail);
            report("Download finished with errors");
            break;
        case Outcome::cancelled:
            report("Download cancelled");
            break;
    }
    if (listener_.finished) listener_.finished(outcome);
}

void Controller::report(std::string_view text) {
    if (listener_.status) listener_.status(text);
}

} // namespace tubeq::core
