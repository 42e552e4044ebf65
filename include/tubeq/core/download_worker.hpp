// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tubeq/core/backend.hpp>
#include <tubeq/core/config.hpp>
#include <tubeq/core/error.hpp>
#include <tubeq/core/launcher.hpp>
#include <tubeq/core/mailbox.hpp>
#include <tubeq/core/progress.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <variant>

namespace tubeq::core {

using JobId = std::uint64_t;

struct JobProgress {
    JobId job{0};
    ProgressEvent event;
};

struct JobFinished {
    JobId job{0};
    Outcome outcome{Outcome::failed};
    std::string detail;
};

using JobMessage = std::variant<JobProgress, JobFinished>;

// Runs at most one download job at a time on a background worker.
// The job body gets a stop token and a throttled progress sink; everything it
// reports comes back to the control thread through drain().
class DownloadWorker {
public:
    using JobBody = std::function<Outcome(std::stop_token, const ProgressSink&)>;
    using Handler = std::function<void(JobMessage)>;

    explicit DownloadWorker(Launcher& launcher,
                            std::chrono::milliseconds progress_interval = PROGRESS_INTERVAL);

    DownloadWorker(const DownloadWorker&) = delete;
    DownloadWorker& operator=(const DownloadWorker&) = delete;

    // Errc::download_in_progress while a job is running
    [[nodiscard]] std::expected<JobId, std::error_code> start(JobBody body);

    // Cooperative; the body observes it through its stop token
    void cancel() noexcept;

    // Deliver at most `max` messages. The worker becomes idle as soon as the
    // final message of the running job is handed out.
    std::size_t drain(std::size_t max, const Handler& handler);

    [[nodiscard]] bool busy() const noexcept { return job_.has_value(); }
    [[nodiscard]] bool cancel_requested() const noexcept;
    [[nodiscard]] std::optional<JobId> current_job() const noexcept { return job_; }
    [[nodiscard]] bool has_pending() const { return !mailbox_->empty(); }

private:
    Launcher& launcher_;
    std::chrono::milliseconds progress_interval_;
    std::shared_ptr<Mailbox<JobMessage>> mailbox_;
    std::optional<std::stop_source> stop_;
    std::optional<JobId> job_;
    JobId next_job_{0};
};

} // namespace tubeq::core
