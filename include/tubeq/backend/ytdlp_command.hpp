// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tubeq/core/download_request.hpp>
#include <tubeq/core/playlist_range.hpp>
#include <tubeq/core/progress.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tubeq::backend {

// Line prefixes written by our own --progress-template / --print directives
constexpr std::string_view PROGRESS_MARKER = "[tubeq-progress]";
constexpr std::string_view ITEM_MARKER = "[tubeq-item]";

constexpr std::string_view DEFAULT_OUTPUT_TEMPLATE = "%(title)s.%(ext)s";
constexpr std::string_view FASTSTART_ARGS = "VideoConvertor:-movflags +faststart";

//=============================================================================
// Argument construction
//=============================================================================

// Single JSON document for the first entry only
[[nodiscard]] std::vector<std::string> metadata_arguments(std::string_view url);

// "-f" directive. Synthetic entries use their selector, video-only ids get
// best audio merged in, and an audio language narrows every bestaudio pick.
[[nodiscard]] std::string format_directive(const core::DownloadRequest& request);

// Custom filename when given and not a playlist, else the title template
[[nodiscard]] std::string output_template(const core::DownloadRequest& request);

[[nodiscard]] std::vector<std::string> download_arguments(const core::DownloadRequest& request);

//=============================================================================
// Output parsing
//=============================================================================

// Progress or item marker lines become events; anything else is log output.
// `ranges` maps the extractor's playlist index to a "k of N" position.
[[nodiscard]] std::optional<core::ProgressEvent>
parse_output_line(std::string_view line, const core::PlaylistRangeSet& ranges);

} // namespace tubeq::backend
