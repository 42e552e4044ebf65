// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tubeq/core/config.hpp>
#include <tubeq/core/error.hpp>
#include <tubeq/core/options.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>

namespace tubeq::core {

// Runtime settings read from a JSON file. Every key is optional; numbers may
// also be given as strings and are clamped to sane ranges.
struct AppConfig {
    std::chrono::milliseconds fetch_debounce{FETCH_DEBOUNCE};
    std::size_t format_cache_capacity{FORMAT_CACHE_MAX_ENTRIES};
    std::chrono::milliseconds poll_interval{MAILBOX_POLL_INTERVAL};
    std::size_t max_events_per_tick{MAX_EVENTS_PER_TICK};
    std::chrono::milliseconds progress_interval{PROGRESS_INTERVAL};
    std::string output_dir{DEFAULT_OUTPUT_DIR};
    NetworkPolicy network;
    std::string ytdlp_path{DEFAULT_YTDLP_PATH};
    std::string log_level{"info"};
    std::string log_file;
    bool prefer_playlist{false};      // Mixed watch+list URLs resolve to the playlist

    [[nodiscard]] static AppConfig from_json(const nlohmann::json& j);
    [[nodiscard]] nlohmann::json to_json() const;

    // Errc::file_not_found / Errc::config_parse_error
    [[nodiscard]] static std::expected<AppConfig, std::error_code>
    load(const std::filesystem::path& path) noexcept;

    [[nodiscard]] std::error_code save(const std::filesystem::path& path) const noexcept;

    // $XDG_CONFIG_HOME/tubeq/config.json or ~/.config/tubeq/config.json
    [[nodiscard]] static std::filesystem::path default_path();
};

} // namespace tubeq::core
