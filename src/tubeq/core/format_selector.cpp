// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tubeq/core/format_selector.hpp>
#include <tubeq/core/config.hpp>
#include <spdlog/spdlog.h>
#include <cctype>
#include <format>

namespace tubeq::core {

namespace {

std::string normalized(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    std::string out(s);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

FormatList filter_video(const FormatList& video, std::string_view container,
                        std::string_view codec, bool any_codec) {
    FormatList result;
    for (const auto& entry : video) {
        if (entry.format.synthetic) {
            result.push_back(entry);
            continue;
        }
        if (normalized(entry.format.ext) != container) continue;
        if (!any_codec && !codec_matches_preference(entry.format.vcodec, codec)) continue;
        result.push_back(entry);
    }
    return result;
}

} // namespace

bool codec_matches_preference(std::string_view vcodec, std::string_view preference) {
    const auto codec = normalized(vcodec);
    const auto pref = normalized(preference);

    if (pref.empty() || pref == "any") return true;
    auto has = [&](std::string_view needle) { return codec.find(needle) != std::string::npos; };
    if (pref.starts_with("avc1")) return has("avc1") || has("h264");
    if (pref.starts_with("av01")) return has("av01") || has("av1");
    return has(pref);
}

ModeSelection select_mode_formats(Mode mode, std::string_view container,
                                  std::string_view codec, const FormatCollection& catalog) {
    ModeSelection selection;

    if (mode == Mode::audio) {
        selection.formats = catalog.audio;
        if (selection.formats.empty()) {
            selection.formats.push_back({std::string(BEST_AUDIO_LABEL),
                                         MediaFormatDescriptor::best_audio()});
        }
        return selection;
    }

    if (mode != Mode::video) return selection;
    if (!is_video_container(container) || !is_video_codec(codec)) return selection;

    selection.formats = filter_video(catalog.video, container, codec, false);
    if (selection.formats.empty()) {
        selection.formats = filter_video(catalog.video, container, codec, true);
        selection.codec_fallback_used = !selection.formats.empty();
    }
    if (selection.formats.empty()) {
        selection.formats.push_back({std::string(BEST_VIDEO_LABEL),
                                     MediaFormatDescriptor::best_video()});
    }
    return selection;
}

std::expected<ResolvedFormat, std::error_code>
resolve_format(const FormatCollection& catalog, const QueueSettings& settings) {
    auto selection = select_mode_formats(settings.mode, settings.container,
                                         settings.codec, catalog);
    if (selection.empty()) {
        return std::unexpected(make_error_code(Errc::selection_incomplete));
    }

    ResolvedFormat resolved;
    resolved.container = settings.container;
    resolved.codec_fallback_used = selection.codec_fallback_used;
    resolved.is_playlist = catalog.is_playlist;
    resolved.title = catalog.preview_title;

    if (selection.codec_fallback_used) {
        resolved.notes.push_back("[queue] chosen codec not available; using any codec for container");
    }

    const auto& wanted = settings.format_label;
    if (const auto* match = find_format(selection.formats, wanted)) {
        resolved.label = wanted;
        resolved.format = *match;
    } else {
        auto& first = selection.formats.front();
        if (!wanted.empty()) {
            resolved.notes.push_back(
                std::format("[queue] format '{}' missing; using '{}'", wanted, first.label));
        }
        resolved.label = std::move(first.label);
        resolved.format = std::move(first.format);
    }

    for (const auto& note : resolved.notes) {
        spdlog::info("{}", note);
    }
    return resolved;
}

std::expected<ResolvedFormat, std::error_code>
resolve_format_for_metadata(const RawInfo& info, const QueueSettings& settings) {
    return resolve_format(collection_from_info(info), settings);
}

} // namespace tubeq::core
