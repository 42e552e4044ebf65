// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tubeq/core/error.hpp>
#include <tubeq/core/format.hpp>
#include <tubeq/core/format_selector.hpp>
#include <tubeq/core/options.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tubeq::core {

// Fully resolved job handed to the download backend. Built fresh per job.
struct DownloadRequest {
    std::string url;
    std::filesystem::path output_dir;
    MediaFormatDescriptor format;          // Synthetic entries carry a selector
    std::string format_label;
    Mode mode{Mode::none};
    std::string container;
    std::string codec;
    bool convert_to_mp4{false};
    bool playlist_enabled{false};
    std::optional<std::string> playlist_items;
    NetworkPolicy network;
    std::vector<std::string> subtitle_languages;
    bool write_subtitles{false};
    bool embed_subtitles{false};
    std::string audio_language;
    std::string custom_filename;
    std::string title;
};

struct NormalizedPlaylistItems {
    std::optional<std::string> value;  // nullopt when nothing remains
    bool changed{false};
};

// Strip all whitespace from a playlist range selection
[[nodiscard]] NormalizedPlaylistItems normalize_playlist_items(std::string_view text);

// "~" and "~/..." expand to $HOME
[[nodiscard]] std::filesystem::path expand_user(std::string_view path);

// Single-item path: the format comes straight from the visible selection
[[nodiscard]] DownloadRequest build_single_request(std::string_view url,
                                                   const QueueSettings& settings,
                                                   const LabeledFormat& chosen,
                                                   bool playlist_enabled,
                                                   const NetworkPolicy& defaults,
                                                   std::string_view default_output_dir);

// Queue path: the format was re-resolved against fresh metadata
[[nodiscard]] DownloadRequest build_queue_request(std::string_view url,
                                                  const QueueSettings& settings,
                                                  const ResolvedFormat& resolved,
                                                  const NetworkPolicy& defaults,
                                                  std::string_view default_output_dir);

// Create the directory if missing
[[nodiscard]] std::error_code ensure_output_dir(const std::filesystem::path& dir);

} // namespace tubeq::core
