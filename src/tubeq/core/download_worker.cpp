// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tubeq/core/download_worker.hpp>
#include <spdlog/spdlog.h>
#include <exception>

namespace tubeq::core {

DownloadWorker::DownloadWorker(Launcher& launcher, std::chrono::milliseconds progress_interval)
    : launcher_(launcher)
    , progress_interval_(progress_interval)
    , mailbox_(std::make_shared<Mailbox<JobMessage>>()) {}

std::expected<JobId, std::error_code> DownloadWorker::start(JobBody body) {
    if (job_) {
        return std::unexpected(make_error_code(Errc::download_in_progress));
    }

    const JobId job = ++next_job_;
    stop_.emplace();
    job_ = job;

    launcher_.launch([mailbox = mailbox_, body = std::move(body),
                      token = stop_->get_token(), job, interval = progress_interval_]() {
        auto throttle = std::make_shared<ProgressThrottle>(interval);
        const ProgressSink sink = [mailbox, throttle, job](ProgressEvent event) {
            if (!throttle->admit(event, ProgressThrottle::Clock::now())) return;
            mailbox->post(JobProgress{job, std::move(event)});
        };

        JobFinished finished{job, Outcome::failed, {}};
        try {
            finished.outcome = body(token, sink);
        } catch (const std::exception& e) {
            spdlog::error("[download] job {} failed: {}", job, e.what());
            finished.outcome = Outcome::failed;
            finished.detail = e.what();
        }
        mailbox->post(std::move(finished));
    });
    return job;
}

void DownloadWorker::cancel() noexcept {
    if (stop_) {
        stop_->request_stop();
    }
}

bool DownloadWorker::cancel_requested() const noexcept {
    return stop_ && stop_->stop_requested();
}

std::size_t DownloadWorker::drain(std::size_t max, const Handler& handler) {
    return mailbox_->drain(max, [&](JobMessage message) {
        if (const auto* done = std::get_if<JobFinished>(&message); done && job_ && done->job == *job_) {
            job_.reset();
            stop_.reset();
        }
        handler(std::move(message));
    });
}

} // namespace tubeq::core
