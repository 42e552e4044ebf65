// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tubeq/core/config.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tubeq::core {

// One downloadable rendition as reported by the extractor
struct MediaFormatDescriptor {
    std::string format_id;
    std::string ext;
    std::string vcodec;              // "none" for audio-only streams
    std::string acodec;              // "none" for video-only streams
    std::uint32_t height{0};         // 0 = unknown
    std::uint32_t width{0};
    double fps{0.0};
    double tbr{0.0};                 // Total bitrate, kbps
    double abr{0.0};                 // Audio bitrate, kbps
    std::optional<std::uint64_t> filesize;
    std::string language;
    std::string format_note;

    // Synthetic entries are not in the catalog; `selector` is passed to the
    // extractor verbatim instead of a format id
    bool synthetic{false};
    std::string selector;

    [[nodiscard]] bool is_audio() const noexcept { return vcodec == "none"; }
    [[nodiscard]] bool has_video_only() const noexcept {
        return !is_audio() && (acodec.empty() || acodec == "none");
    }

    // Bitrate used when collapsing duplicates
    [[nodiscard]] double total_bitrate() const noexcept { return tbr > 0.0 ? tbr : abr; }
    // Bitrate used for ordering and audio quality floors
    [[nodiscard]] double audio_bitrate() const noexcept { return abr > 0.0 ? abr : tbr; }

    [[nodiscard]] static MediaFormatDescriptor best_video() {
        MediaFormatDescriptor f;
        f.synthetic = true;
        f.selector = std::string(BEST_VIDEO_SELECTOR);
        return f;
    }

    [[nodiscard]] static MediaFormatDescriptor best_audio() {
        MediaFormatDescriptor f;
        f.vcodec = "none";
        f.synthetic = true;
        f.selector = std::string(BEST_AUDIO_SELECTOR);
        return f;
    }

    bool operator==(const MediaFormatDescriptor&) const = default;
};

struct LabeledFormat {
    std::string label;
    MediaFormatDescriptor format;

    bool operator==(const LabeledFormat&) const = default;
};

// Ordered label -> descriptor mapping; labels are unique within one list
using FormatList = std::vector<LabeledFormat>;

[[nodiscard]] const MediaFormatDescriptor* find_format(const FormatList& list,
                                                       std::string_view label) noexcept;

[[nodiscard]] std::vector<std::string> labels_of(const FormatList& list);

// Everything known about one fetched URL
struct FormatCollection {
    FormatList video;
    FormatList audio;
    std::vector<std::string> audio_languages;  // Sorted, unique
    std::string preview_title;
    bool is_playlist{false};

    [[nodiscard]] bool empty() const noexcept { return video.empty() && audio.empty(); }

    bool operator==(const FormatCollection&) const = default;
};

} // namespace tubeq::core
