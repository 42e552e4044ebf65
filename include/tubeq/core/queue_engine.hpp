// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tubeq/core/backend.hpp>
#include <tubeq/core/download_worker.hpp>
#include <tubeq/core/error.hpp>
#include <tubeq/core/options.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tubeq::core {

struct QueueItem {
    std::string url;
    QueueSettings settings;

    bool operator==(const QueueItem&) const = default;
};

enum class QueueState : std::uint8_t {
    idle,
    running,
    finishing,
};

enum class QueueStartStatus : std::uint8_t {
    started,
    already_active,  // No-op
    empty,           // No-op
    busy,            // A single download holds the worker
};

struct QueueRunSummary {
    Outcome outcome{Outcome::success};
    std::size_t failed_items{0};
    std::size_t total{0};
};

//=============================================================================
// Validation helpers
//=============================================================================

// First missing field of a captured selection, QueueIssue::none when complete
[[nodiscard]] QueueIssue queue_settings_issue(const QueueSettings& settings) noexcept;

[[nodiscard]] std::optional<QueueValidationError>
first_invalid_queue_item(const std::vector<QueueItem>& items) noexcept;

// Index of the first item at or after `start` with a non-blank URL
[[nodiscard]] std::optional<std::size_t>
next_non_empty_index(const std::vector<QueueItem>& items, std::size_t start) noexcept;

// cancelled > failed > success
[[nodiscard]] Outcome finish_outcome(bool cancelled, std::size_t failed_items) noexcept;

//=============================================================================
// QueueEngine
//=============================================================================

// Runs queued items one after another on the shared DownloadWorker.
// Each item re-fetches metadata and re-resolves its format before download.
// A failed item is counted and skipped; cancellation stops the run.
class QueueEngine {
public:
    struct Listener {
        // 1-based index, total list size including blank items
        std::function<void(std::size_t, std::size_t, const std::string&)> item_started;
        std::function<void(const ProgressEvent&)> progress;
        std::function<void(const QueueRunSummary&)> finished;
    };

    QueueEngine(DownloadWorker& worker, MetadataSource& metadata, DownloadBackend& backend);

    QueueEngine(const QueueEngine&) = delete;
    QueueEngine& operator=(const QueueEngine&) = delete;

    void listener(Listener l) { listener_ = std::move(l); }

    void defaults(const NetworkPolicy& network, std::string output_dir) {
        network_defaults_ = network;
        default_output_dir_ = std::move(output_dir);
    }

    // List edits; Errc::queue_locked while a run is active
    [[nodiscard]] std::error_code add(QueueItem item);
    [[nodiscard]] std::error_code remove(std::size_t index);
    [[nodiscard]] std::error_code move_up(std::size_t index);
    [[nodiscard]] std::error_code move_down(std::size_t index);
    [[nodiscard]] std::error_code clear();
    [[nodiscard]] std::error_code replace(std::vector<QueueItem> items);

    // Validates every item before touching any state
    [[nodiscard]] std::expected<QueueStartStatus, QueueValidationError> start();

    // Launch the current item, skipping blank URLs
    void run_current();

    // Messages drained from the worker while a run is active
    void handle(const JobMessage& message);

    void cancel() noexcept;

    [[nodiscard]] const std::vector<QueueItem>& items() const noexcept { return items_; }
    [[nodiscard]] QueueState state() const noexcept { return state_; }
    [[nodiscard]] bool active() const noexcept { return state_ != QueueState::idle; }
    [[nodiscard]] std::optional<std::size_t> current_index() const noexcept;
    [[nodiscard]] std::size_t failed_items() const noexcept { return failed_items_; }
    [[nodiscard]] bool cancel_requested() const noexcept { return cancel_requested_; }

private:
    void item_done(Outcome outcome);
    void finish(bool cancelled);
    [[nodiscard]] DownloadWorker::JobBody item_job(const QueueItem& item, std::size_t position) const;

    DownloadWorker& worker_;
    MetadataSource& metadata_;
    DownloadBackend& backend_;
    Listener listener_;

    NetworkPolicy network_defaults_;
    std::string default_output_dir_{DEFAULT_OUTPUT_DIR};

    std::vector<QueueItem> items_;
    QueueState state_{QueueState::idle};
    std::size_t index_{0};
    std::size_t failed_items_{0};
    bool cancel_requested_{false};
    std::optional<JobId> job_;
};

} // namespace tubeq::core
