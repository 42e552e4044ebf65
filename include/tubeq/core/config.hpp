// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <chrono>
#include <string_view>

namespace tubeq::core {

constexpr std::chrono::milliseconds FETCH_DEBOUNCE{600};            // Quiet window after URL edits
constexpr std::chrono::milliseconds MAILBOX_POLL_INTERVAL{40};
constexpr std::chrono::milliseconds PROGRESS_INTERVAL{800};         // Throttle for downloading events
constexpr std::size_t MAX_EVENTS_PER_TICK = 50;
constexpr std::size_t FORMAT_CACHE_MAX_ENTRIES = 100;

constexpr std::uint32_t VIDEO_MIN_HEIGHT = 480;
constexpr double AUDIO_MIN_ABR_KBPS = 128.0;

// Network policy, seconds
constexpr int DEFAULT_NETWORK_TIMEOUT_S = 20;
constexpr int MIN_NETWORK_TIMEOUT_S = 1;
constexpr int MAX_NETWORK_TIMEOUT_S = 300;
constexpr int DEFAULT_NETWORK_RETRIES = 1;
constexpr int MIN_NETWORK_RETRIES = 0;
constexpr int MAX_NETWORK_RETRIES = 10;
constexpr double DEFAULT_RETRY_BACKOFF_S = 1.5;
constexpr double MIN_RETRY_BACKOFF_S = 0.0;
constexpr double MAX_RETRY_BACKOFF_S = 30.0;

constexpr std::size_t CUSTOM_FILENAME_MAX = 160;

constexpr std::array<std::string_view, 2> VIDEO_CONTAINERS{"mp4", "webm"};
constexpr std::array<std::string_view, 5> AUDIO_CONTAINERS{"m4a", "mp3", "opus", "wav", "flac"};
constexpr std::array<std::string_view, 2> VIDEO_CODECS{"avc1", "av01"};

constexpr std::string_view BEST_VIDEO_LABEL = "Best available";
constexpr std::string_view BEST_VIDEO_SELECTOR = "bestvideo+bestaudio/best";
constexpr std::string_view BEST_AUDIO_LABEL = "Best audio only";
constexpr std::string_view BEST_AUDIO_SELECTOR = "bestaudio/best";

constexpr std::string_view DEFAULT_OUTPUT_DIR = "~/Downloads";
constexpr std::string_view DEFAULT_YTDLP_PATH = "yt-dlp";

} // namespace tubeq::core
