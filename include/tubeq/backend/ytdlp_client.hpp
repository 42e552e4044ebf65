// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tubeq/core/backend.hpp>
#include <tubeq/core/config.hpp>
#include <tubeq/core/download_request.hpp>
#include <chrono>
#include <string>

namespace tubeq::backend {

// Both collaborator interfaces backed by the yt-dlp executable. Each call
// spawns its own QProcess on the calling worker thread and blocks on it.
class YtDlpClient final : public core::MetadataSource, public core::DownloadBackend {
public:
    struct Settings {
        std::string program{core::DEFAULT_YTDLP_PATH};
        std::chrono::milliseconds start_timeout{5000};
        std::chrono::milliseconds metadata_timeout{120'000};
        std::chrono::milliseconds poll_interval{100};    // Stop token polling
        std::chrono::milliseconds terminate_grace{2000};
    };

    YtDlpClient() = default;
    explicit YtDlpClient(Settings settings) : settings_(std::move(settings)) {}

    [[nodiscard]] std::expected<core::RawInfo, core::FetchError>
    fetch_metadata(const std::string& url) override;

    [[nodiscard]] core::Outcome run_download(const core::DownloadRequest& request,
                                             std::stop_token stop,
                                             const core::ProgressSink& progress) override;

    // `yt-dlp --version`, empty when the program cannot be run
    [[nodiscard]] std::string version() const;

private:
    Settings settings_;
};

} // namespace tubeq::backend
