// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tubeq/core/config.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tubeq::core {

enum class Mode : std::uint8_t {
    none,
    video,
    audio,
};

[[nodiscard]] constexpr std::string_view to_string(Mode mode) noexcept {
    switch (mode) {
        case Mode::video: return "video";
        case Mode::audio: return "audio";
        case Mode::none:  return "";
    }
    return "";
}

[[nodiscard]] Mode parse_mode(std::string_view text) noexcept;

// Clamped network settings handed to the extractor
struct NetworkPolicy {
    int timeout_s{DEFAULT_NETWORK_TIMEOUT_S};
    int retries{DEFAULT_NETWORK_RETRIES};
    double backoff_s{DEFAULT_RETRY_BACKOFF_S};

    bool operator==(const NetworkPolicy&) const = default;
};

// Option fields exactly as the user typed them
struct RawOptions {
    std::string network_timeout;
    std::string network_retries;
    std::string retry_backoff;
    std::string subtitle_languages;   // "en, de"
    bool write_subtitles{false};
    bool embed_subtitles{false};
    std::string audio_language;       // "" or "any" = no preference
    std::string custom_filename;

    bool operator==(const RawOptions&) const = default;
};

// Parsed and bounds-checked options
struct DownloadOptions {
    NetworkPolicy network;
    std::vector<std::string> subtitle_languages;
    bool write_subtitles{false};
    bool embed_subtitles{false};
    std::string audio_language;
    std::string custom_filename;

    bool operator==(const DownloadOptions&) const = default;
};

// Snapshot of the selection state taken when an item is queued
struct QueueSettings {
    Mode mode{Mode::none};
    std::string container;
    std::string codec;
    bool convert_to_mp4{false};
    std::string format_label;
    std::string estimated_size;
    std::string output_dir;
    std::string playlist_items;
    RawOptions options;

    bool operator==(const QueueSettings&) const = default;
};

//=============================================================================
// Free-text parsing; never throws, falls back to defaults
//=============================================================================

// Decimal text, fractions truncated, clamped to [minimum, maximum].
// Unparsable or non-finite text yields `fallback`.
[[nodiscard]] int parse_int_setting(std::string_view text, int fallback,
                                    int minimum, int maximum) noexcept;

[[nodiscard]] double parse_float_setting(std::string_view text, double fallback,
                                         double minimum, double maximum) noexcept;

// Comma-separated, trimmed, lowercased, first occurrence kept
[[nodiscard]] std::vector<std::string> parse_subtitle_languages(std::string_view text);

// Empty result means "use default naming"
[[nodiscard]] std::string sanitize_custom_filename(std::string_view text);

[[nodiscard]] NetworkPolicy parse_network_policy(const RawOptions& raw,
                                                 const NetworkPolicy& defaults) noexcept;

// Subtitles are only written in video mode and only embedded when written
[[nodiscard]] DownloadOptions build_download_options(const RawOptions& raw, Mode mode,
                                                     const NetworkPolicy& defaults);

[[nodiscard]] bool is_video_container(std::string_view container) noexcept;
[[nodiscard]] bool is_audio_container(std::string_view container) noexcept;
[[nodiscard]] bool is_video_codec(std::string_view codec) noexcept;

} // namespace tubeq::core
