// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tubeq/core/format.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tubeq::core {

using FormatVector = std::vector<MediaFormatDescriptor>;

// Split into (video, audio) and drop entries below the quality floor.
// The floor only applies when something better than it exists.
[[nodiscard]] std::pair<FormatVector, FormatVector>
split_and_filter_formats(const FormatVector& formats);

// Keep the highest-bitrate entry per (kind, ext, codec, height, fps)
[[nodiscard]] FormatVector collapse_formats(const FormatVector& formats);

// Video before audio, mp4 first, avc first, then height and bitrate descending
[[nodiscard]] FormatVector sort_formats(FormatVector formats);

[[nodiscard]] std::string label_format(const MediaFormatDescriptor& format);

// Collapse + sort + label; entries without a format id are skipped
[[nodiscard]] FormatList build_labeled_formats(const FormatVector& formats);

[[nodiscard]] std::vector<std::string> extract_audio_languages(const FormatVector& formats);

[[nodiscard]] std::optional<std::uint64_t>
estimate_filesize_bytes(const MediaFormatDescriptor& format) noexcept;

// "512 B", "3 KiB", "1.5 MiB"; empty for zero / unknown
[[nodiscard]] std::string humanize_bytes(std::optional<std::uint64_t> size);

[[nodiscard]] FormatCollection build_format_collection(const FormatVector& formats,
                                                       std::string preview_title = {},
                                                       bool is_playlist = false);

} // namespace tubeq::core
