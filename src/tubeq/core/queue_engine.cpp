// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tubeq/core/queue_engine.hpp>
#include <tubeq/core/download_request.hpp>
#include <tubeq/core/format_selector.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <format>

namespace tubeq::core {

namespace {

bool is_blank(const std::string& s) noexcept {
    return std::ranges::all_of(s, [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

std::string trimmed(const std::string& s) {
    auto first = std::ranges::find_if_not(s, [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
    auto last = std::find_if_not(s.rbegin(), s.rend(), [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
    if (first == s.end()) return {};
    return std::string(first, last.base());
}

} // namespace

//=============================================================================
// Validation helpers
//=============================================================================

QueueIssue queue_settings_issue(const QueueSettings& settings) noexcept {
    if (settings.mode == Mode::none) {
        return QueueIssue::mode;
    }
    if (settings.mode == Mode::video && settings.codec.empty()) {
        return QueueIssue::codec;
    }
    const bool container_ok = settings.mode == Mode::video
        ? is_video_container(settings.container)
        : is_audio_container(settings.container);
    if (!container_ok) {
        return QueueIssue::container;
    }
    if (settings.format_label.empty()) {
        return QueueIssue::format;
    }
    return QueueIssue::none;
}

std::optional<QueueValidationError> first_invalid_queue_item(const std::vector<QueueItem>& items) noexcept {
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (auto issue = queue_settings_issue(items[i].settings); issue != QueueIssue::none) {
            return QueueValidationError{i + 1, issue};
        }
    }
    return std::nullopt;
}

std::optional<std::size_t> next_non_empty_index(const std::vector<QueueItem>& items,
                                                std::size_t start) noexcept {
    for (auto i = start; i < items.size(); ++i) {
        if (!is_blank(items[i].url)) return i;
    }
    return std::nullopt;
}

Outcome finish_outcome(bool cancelled, std::size_t failed_items) noexcept {
    if (cancelled) return Outcome::cancelled;
    if (failed_items > 0) return Outcome::failed;
    return Outcome::success;
}

//=============================================================================
// QueueEngine
//=============================================================================

QueueEngine::QueueEngine(DownloadWorker& worker, MetadataSource& metadata, DownloadBackend& backend)
    : worker_(worker)
    , metadata_(metadata)
    , backend_(backend) {}

std::error_code QueueEngine::add(QueueItem item) {
    if (active()) return make_error_code(Errc::queue_locked);
    items_.push_back(std::move(item));
    return {};
}

std::error_code QueueEngine::remove(std::size_t index) {
    if (active()) return make_error_code(Errc::queue_locked);
    if (index >= items_.size()) return std::make_error_code(std::errc::result_out_of_range);
    items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(index));
    return {};
}

std::error_code QueueEngine::move_up(std::size_t index) {
    if (active()) return make_error_code(Errc::queue_locked);
    if (index == 0 || index >= items_.size()) return std::make_error_code(std::errc::result_out_of_range);
    std::swap(items_[index - 1], items_[index]);
    return {};
}

std::error_code QueueEngine::move_down(std::size_t index) {
    if (active()) return make_error_code(Errc::queue_locked);
    if (index + 1 >= items_.size()) return std::make_error_code(std::errc::result_out_of_range);
    std::swap(items_[index], items_[index + 1]);
    return {};
}

std::error_code QueueEngine::clear() {
    if (active()) return make_error_code(Errc::queue_locked);
    items_.clear();
    return {};
}

std::error_code QueueEngine::replace(std::vector<QueueItem> items) {
    if (active()) return make_error_code(Errc::queue_locked);
    items_ = std::move(items);
    return {};
}

std::optional<std::size_t> QueueEngine::current_index() const noexcept {
    if (state_ != QueueState::running) return std::nullopt;
    return index_;
}

std::expected<QueueStartStatus, QueueValidationError> QueueEngine::start() {
    if (active()) return QueueStartStatus::already_active;
    if (items_.empty()) return QueueStartStatus::empty;
    if (worker_.busy()) return QueueStartStatus::busy;

    if (auto invalid = first_invalid_queue_item(items_)) {
        spdlog::warn("[queue] item {} is missing {}", invalid->index, to_string(invalid->issue));
        return std::unexpected(*invalid);
    }

    state_ = QueueState::running;
    index_ = 0;
    failed_items_ = 0;
    cancel_requested_ = false;
    job_.reset();
    spdlog::info("[queue] starting {} item(s)", items_.size());

    run_current();
    return QueueStartStatus::started;
}

void QueueEngine::run_current() {
    if (state_ != QueueState::running) return;

    auto next = next_non_empty_index(items_, index_);
    if (!next) {
        finish(false);
        return;
    }
    index_ = *next;

    const auto& item = items_[index_];
    const auto total = items_.size();
    const auto url = trimmed(item.url);
    spdlog::info("[queue] item {}/{} {}", index_ + 1, total, url);
    if (listener_.item_started) listener_.item_started(index_ + 1, total, url);

    auto job = worker_.start(item_job(item, index_ + 1));
    if (!job) {
        spdlog::error("[queue] item {} could not start: {}", index_ + 1, job.error().message());
        item_done(Outcome::failed);
        return;
    }
    job_ = *job;
}

void QueueEngine::handle(const JobMessage& message) {
    if (state_ != QueueState::running) return;

    if (const auto* progress = std::get_if<JobProgress>(&message)) {
        if (job_ && progress->job == *job_ && listener_.progress) {
            listener_.progress(progress->event);
        }
        return;
    }

    const auto& done = std::get<JobFinished>(message);
    if (!job_ || done.job != *job_) return;
    job_.reset();
    if (!done.detail.empty()) {
        spdlog::error("[queue] failed: {}", done.detail);
    }
    item_done(done.outcome);
}

void QueueEngine::cancel() noexcept {
    if (state_ != QueueState::running) return;
    cancel_requested_ = true;
    worker_.cancel();
}

void QueueEngine::item_done(Outcome outcome) {
    if (outcome == Outcome::failed) {
        ++failed_items_;
    }
    if (outcome == Outcome::cancelled) {
        cancel_requested_ = true;
    }
    if (cancel_requested_) {
        spdlog::info("[queue] cancelled");
        finish(true);
        return;
    }

    ++index_;
    if (index_ >= items_.size()) {
        finish(false);
        return;
    }
    run_current();
}

void QueueEngine::finish(bool cancelled) {
    state_ = QueueState::finishing;

    const QueueRunSummary summary{finish_outcome(cancelled, failed_items_), failed_items_, items_.size()};
    switch (summary.outcome) {
        case Outcome::cancelled:
            spdlog::info("[queue] stopped by cancellation");
            break;
        case Outcome::failed:
            spdlog::warn("[queue] finished with {} failed item(s)", summary.failed_items);
            break;
        case Outcome::success:
            spdlog::info("[queue] finished successfully");
            break;
    }

    index_ = 0;
    failed_items_ = 0;
    cancel_requested_ = false;
    job_.reset();
    state_ = QueueState::idle;

    if (listener_.finished) listener_.finished(summary);
}

DownloadWorker::JobBody QueueEngine::item_job(const QueueItem& item, std::size_t position) const {
    return [&metadata = metadata_, &backend = backend_,
            url = trimmed(item.url), settings = item.settings,
            position, total = items_.size(),
            network = network_defaults_, output_dir = default_output_dir_]
           (std::stop_token stop, const ProgressSink& progress) -> Outcome {
        auto info = metadata.fetch_metadata(url);
        if (!info) {
            spdlog::error("[queue] failed: {}", info.error().detail.empty()
                ? info.error().code.message() : info.error().detail);
            return Outcome::failed;
        }
        if (stop.stop_requested()) return Outcome::cancelled;

        auto resolved = resolve_format_for_metadata(*info, settings);
        if (!resolved) {
            spdlog::error("[queue] failed: {}", resolved.error().message());
            return Outcome::failed;
        }

        const auto& title = resolved->title.empty() ? url : resolved->title;
        progress(ItemStarted{std::format("{}/{} {}", position, total, title)});

        auto request = build_queue_request(url, settings, *resolved, network, output_dir);
        if (auto ec = ensure_output_dir(request.output_dir)) {
            return Outcome::failed;
        }
        return backend.run_download(request, stop, progress);
    };
}

} // namespace tubeq::core
