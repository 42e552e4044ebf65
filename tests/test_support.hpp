// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tubeq/core/backend.hpp>
#include <tubeq/core/download_request.hpp>
#include <tubeq/core/launcher.hpp>
#include <tubeq/core/raw_info.hpp>
#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace tubeq::test {

// Holds launched tasks until the test runs them, in any order
class ManualLauncher final : public core::Launcher {
public:
    void launch(Task task) override { tasks_.push_back(std::move(task)); }

    [[nodiscard]] std::size_t pending() const noexcept { return tasks_.size(); }

    void run(std::size_t index) {
        auto task = std::move(tasks_.at(index));
        tasks_.erase(tasks_.begin() + static_cast<std::ptrdiff_t>(index));
        task();
    }

    void run_next() { run(0); }
    void run_last() { run(tasks_.size() - 1); }

    void run_all() {
        while (!tasks_.empty()) run_next();
    }

private:
    std::deque<Task> tasks_;
};

// Advanced by hand; plugs into FetchCoordinator's time source
class ManualClock {
public:
    using Clock = std::chrono::steady_clock;

    [[nodiscard]] Clock::time_point now() const noexcept { return now_; }
    void advance(std::chrono::milliseconds ms) noexcept { now_ += ms; }

    [[nodiscard]] std::function<Clock::time_point()> source() {
        return [this] { return now_; };
    }

private:
    Clock::time_point now_{std::chrono::seconds{1000}};
};

//=============================================================================
// Metadata fixtures
//=============================================================================

inline nlohmann::json video_format(std::string id, std::string ext, std::string vcodec,
                                   int height, double tbr, std::string acodec = "none") {
    return {
        {"format_id", std::move(id)},
        {"ext", std::move(ext)},
        {"vcodec", std::move(vcodec)},
        {"acodec", std::move(acodec)},
        {"height", height},
        {"width", height * 16 / 9},
        {"tbr", tbr},
    };
}

inline nlohmann::json audio_format(std::string id, std::string ext, std::string acodec,
                                   double abr, std::string language = {}) {
    nlohmann::json j{
        {"format_id", std::move(id)},
        {"ext", std::move(ext)},
        {"vcodec", "none"},
        {"acodec", std::move(acodec)},
        {"abr", abr},
    };
    if (!language.empty()) j["language"] = std::move(language);
    return j;
}

// Typical single video: mp4/avc1 and webm/vp9 ladders plus two audio tracks
inline core::RawInfo sample_info(std::string title = "Sample Clip") {
    return {
        {"title", std::move(title)},
        {"formats", {
            video_format("137", "mp4", "avc1.640028", 1080, 4400.0),
            video_format("136", "mp4", "avc1.4d401f", 720, 2300.0),
            video_format("248", "webm", "vp9", 1080, 3000.0),
            video_format("160", "mp4", "avc1.4d400c", 144, 100.0),
            audio_format("140", "m4a", "mp4a.40.2", 129.0, "en"),
            audio_format("251", "webm", "opus", 160.0, "en"),
        }},
    };
}

inline core::RawInfo playlist_info() {
    return {
        {"_type", "playlist"},
        {"title", "Some Playlist"},
        {"entries", {sample_info("First Entry")}},
    };
}

//=============================================================================
// Collaborator doubles
//=============================================================================

// Answers from a per-URL script; unknown URLs fail
class ScriptedMetadataSource final : public core::MetadataSource {
public:
    using Result = std::expected<core::RawInfo, core::FetchError>;

    void set(const std::string& url, core::RawInfo info) {
        std::lock_guard lock(mutex_);
        script_[url] = std::move(info);
    }

    void fail(const std::string& url, std::string detail = "network down") {
        std::lock_guard lock(mutex_);
        script_[url] = std::unexpected(core::FetchError{
            make_error_code(core::Errc::fetch_failed), std::move(detail)});
    }

    Result fetch_metadata(const std::string& url) override {
        std::lock_guard lock(mutex_);
        calls_.push_back(url);
        auto it = script_.find(url);
        if (it == script_.end()) {
            return std::unexpected(core::FetchError{
                make_error_code(core::Errc::fetch_failed), "unknown url " + url});
        }
        return it->second;
    }

    [[nodiscard]] std::vector<std::string> calls() const {
        std::lock_guard lock(mutex_);
        return calls_;
    }

    [[nodiscard]] std::size_t call_count(const std::string& url) const {
        std::lock_guard lock(mutex_);
        std::size_t n = 0;
        for (const auto& c : calls_) {
            if (c == url) ++n;
        }
        return n;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, Result> script_;
    std::vector<std::string> calls_;
};

// Records every request; outcomes come from a per-URL script (default success)
class ScriptedBackend final : public core::DownloadBackend {
public:
    using Behavior = std::function<core::Outcome(const core::DownloadRequest&, std::stop_token,
                                                 const core::ProgressSink&)>;

    void outcome(const std::string& url, core::Outcome o) {
        std::lock_guard lock(mutex_);
        behaviors_[url] = [o](const core::DownloadRequest&, std::stop_token,
                              const core::ProgressSink&) { return o; };
    }

    void behavior(const std::string& url, Behavior b) {
        std::lock_guard lock(mutex_);
        behaviors_[url] = std::move(b);
    }

    core::Outcome run_download(const core::DownloadRequest& request, std::stop_token stop,
                               const core::ProgressSink& progress) override {
        Behavior behavior;
        {
            std::lock_guard lock(mutex_);
            requests_.push_back(request);
            if (auto it = behaviors_.find(request.url); it != behaviors_.end()) {
                behavior = it->second;
            }
        }
        if (stop.stop_requested()) return core::Outcome::cancelled;
        if (behavior) return behavior(request, stop, progress);
        progress(core::Downloading{50.0, "1.00 MiB/s", "0:05"});
        progress(core::Finished{});
        return core::Outcome::success;
    }

    [[nodiscard]] std::vector<core::DownloadRequest> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, Behavior> behaviors_;
    std::vector<core::DownloadRequest> requests_;
};

} // namespace tubeq::test
