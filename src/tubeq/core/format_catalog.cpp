// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tubeq/core/format_catalog.hpp>
#include <tubeq/core/config.hpp>
#include <tubeq/core/numeric.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <map>
#include <set>
#include <tuple>

namespace tubeq::core {

namespace {

using Signature = std::tuple<bool, std::string, std::string, std::uint32_t, double>;

Signature signature_of(const MediaFormatDescriptor& f) {
    const bool audio = f.is_audio();
    return {
        audio,
        f.ext,
        audio ? f.acodec : f.vcodec,
        audio ? 0u : f.height,
        audio ? 0.0 : f.fps,
    };
}

std::string upper(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string trim_lower(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    std::string out(s);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

constexpr std::array<std::string_view, 5> UNKNOWN_LANGUAGES{"none", "und", "unknown", "n/a", "na"};

} // namespace

//=============================================================================
// FormatList
//=============================================================================

const MediaFormatDescriptor* find_format(const FormatList& list, std::string_view label) noexcept {
    for (const auto& entry : list) {
        if (entry.label == label) return &entry.format;
    }
    return nullptr;
}

std::vector<std::string> labels_of(const FormatList& list) {
    std::vector<std::string> labels;
    labels.reserve(list.size());
    for (const auto& entry : list) {
        labels.push_back(entry.label);
    }
    return labels;
}

//=============================================================================
// Catalog pipeline
//=============================================================================

std::pair<FormatVector, FormatVector> split_and_filter_formats(const FormatVector& formats) {
    std::uint32_t max_height = 0;
    double max_audio_br = 0.0;
    for (const auto& f : formats) {
        if (f.is_audio()) {
            max_audio_br = std::max(max_audio_br, f.audio_bitrate());
        } else {
            max_height = std::max(max_height, f.height);
        }
    }

    const std::uint32_t min_height = max_height > VIDEO_MIN_HEIGHT ? VIDEO_MIN_HEIGHT : 0;
    const double min_abr = max_audio_br > AUDIO_MIN_ABR_KBPS ? AUDIO_MIN_ABR_KBPS : 0.0;

    FormatVector video;
    FormatVector audio;
    for (const auto& f : formats) {
        if (!f.is_audio()) {
            // Unknown height is kept
            if (f.height != 0 && f.height < min_height) continue;
            video.push_back(f);
        } else {
            const double br = f.audio_bitrate();
            if (br > 0.0 && br < min_abr) continue;
            audio.push_back(f);
        }
    }
    return {std::move(video), std::move(audio)};
}

FormatVector collapse_formats(const FormatVector& formats) {
    FormatVector result;
    std::map<Signature, std::size_t> slots;

    for (const auto& f : formats) {
        auto sig = signature_of(f);
        auto it = slots.find(sig);
        if (it == slots.end()) {
            slots.emplace(std::move(sig), result.size());
            result.push_back(f);
            continue;
        }
        auto& current = result[it->second];
        if (f.total_bitrate() > current.total_bitrate()) {
            current = f;
        }
    }
    return result;
}

FormatVector sort_formats(FormatVector formats) {
    auto key = [](const MediaFormatDescriptor& f) {
        return std::make_tuple(
            f.is_audio() ? 1 : 0,
            f.ext == "mp4" ? 0 : 1,
            f.vcodec.find("avc") != std::string::npos ? 0 : 1,
            -static_cast<std::int64_t>(f.height),
            -f.audio_bitrate());
    };
    std::ranges::stable_sort(formats, [&](const auto& a, const auto& b) {
        return key(a) < key(b);
    });
    return formats;
}

std::string label_format(const MediaFormatDescriptor& f) {
    const auto ext = upper(f.ext);
    const auto size_text = humanize_bytes(estimate_filesize_bytes(f));

    if (f.is_audio()) {
        const double br = f.audio_bitrate();
        std::string label = "Audio " + ext + " ";
        label += br > 0.0 ? std::format("{}k", saturate_cast<std::int64_t>(br)) : "Audio";
        label += std::format(" ({})", f.acodec.empty() ? "audio" : f.acodec);
        if (!size_text.empty()) {
            label += " ~" + size_text;
        }
        return label;
    }

    std::vector<std::string> parts;
    if (f.height != 0 && f.width != 0) {
        parts.push_back(std::format("{}p {}x{}", f.height, f.width, f.height));
    } else if (f.height != 0) {
        parts.push_back(std::format("{}p", f.height));
    } else {
        parts.emplace_back("Video");
    }
    if (!ext.empty()) parts.push_back(ext);
    if (f.fps > 0.0) parts.push_back(std::format("{}fps", f.fps));
    if (!f.format_note.empty()) parts.push_back("[" + f.format_note + "]");
    if (!size_text.empty()) parts.push_back("~" + size_text);

    std::string codecs;
    for (const auto* c : {&f.vcodec, &f.acodec}) {
        if (c->empty() || *c == "none") continue;
        if (!codecs.empty()) codecs += " + ";
        codecs += *c;
    }
    if (!codecs.empty()) parts.push_back("(" + codecs + ")");

    std::string label;
    for (const auto& p : parts) {
        if (!label.empty()) label += ' ';
        label += p;
    }
    return label;
}

FormatList build_labeled_formats(const FormatVector& formats) {
    FormatList labeled;
    std::set<std::string> seen;

    for (auto& f : sort_formats(collapse_formats(formats))) {
        if (f.format_id.empty()) continue;

        auto label = label_format(f);
        if (seen.contains(label)) {
            label += " [" + f.format_id + "]";
            // Identical ids in one listing; number the duplicates
            const auto base = label;
            for (int n = 2; seen.contains(label); ++n) {
                label = std::format("{} #{}", base, n);
            }
        }
        seen.insert(label);
        labeled.push_back({std::move(label), std::move(f)});
    }
    return labeled;
}

std::vector<std::string> extract_audio_languages(const FormatVector& formats) {
    std::set<std::string> languages;
    for (const auto& f : formats) {
        if (!f.is_audio()) continue;
        auto lang = trim_lower(f.language);
        if (lang.empty()) continue;
        if (std::ranges::find(UNKNOWN_LANGUAGES, lang) != UNKNOWN_LANGUAGES.end()) continue;
        languages.insert(std::move(lang));
    }
    return {languages.begin(), languages.end()};
}

std::optional<std::uint64_t> estimate_filesize_bytes(const MediaFormatDescriptor& format) noexcept {
    if (format.filesize && *format.filesize > 0) {
        return format.filesize;
    }
    return std::nullopt;
}

std::string humanize_bytes(std::optional<std::uint64_t> size) {
    if (!size || *size == 0) return {};
    if (*size < 1024) return std::format("{} B", *size);

    constexpr std::array<std::string_view, 4> units{"KiB", "MiB", "GiB", "TiB"};
    auto value = static_cast<double>(*size);
    std::size_t unit = 0;
    value /= 1024.0;
    while (value >= 1024.0 && unit + 1 < units.size()) {
        value /= 1024.0;
        ++unit;
    }
    if (unit == 0) {
        return std::format("{:.0f} {}", value, units[unit]);
    }
    return std::format("{:.1f} {}", value, units[unit]);
}

FormatCollection build_format_collection(const FormatVector& formats,
                                         std::string preview_title,
                                         bool is_playlist) {
    auto [video, audio] = split_and_filter_formats(formats);

    FormatCollection collection;
    collection.video = build_labeled_formats(video);
    collection.audio = build_labeled_formats(audio);
    collection.audio_languages = extract_audio_languages(formats);
    collection.preview_title = std::move(preview_title);
    collection.is_playlist = is_playlist;
    return collection;
}

} // namespace tubeq::core
