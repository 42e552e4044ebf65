// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tubeq/core/download_request.hpp>
#include <spdlog/spdlog.h>
#include <cctype>
#include <cstdlib>

namespace tubeq::core {

namespace {

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::filesystem::path resolve_output_dir(std::string_view chosen, std::string_view fallback) {
    auto dir = trim(chosen);
    if (dir.empty()) dir = trim(fallback);
    if (dir.empty()) dir = DEFAULT_OUTPUT_DIR;
    return expand_user(dir);
}

// Fields shared by both request shapes
DownloadRequest base_request(std::string_view url, const QueueSettings& settings,
                             const NetworkPolicy& defaults, std::string_view default_output_dir) {
    auto options = build_download_options(settings.options, settings.mode, defaults);

    DownloadRequest request;
    request.url = std::string(trim(url));
    request.output_dir = resolve_output_dir(settings.output_dir, default_output_dir);
    request.mode = settings.mode;
    request.container = settings.container;
    request.codec = settings.codec;
    request.convert_to_mp4 = settings.convert_to_mp4;
    request.network = options.network;
    request.subtitle_languages = std::move(options.subtitle_languages);
    request.write_subtitles = options.write_subtitles;
    request.embed_subtitles = options.embed_subtitles;
    request.audio_language = std::move(options.audio_language);
    request.custom_filename = std::move(options.custom_filename);
    return request;
}

std::optional<std::string> playlist_items_for(const QueueSettings& settings, bool enabled) {
    if (!enabled) return std::nullopt;
    auto items = normalize_playlist_items(settings.playlist_items);
    if (items.changed) {
        spdlog::debug("[download] playlist items normalized to '{}'", items.value.value_or(""));
    }
    return items.value;
}

} // namespace

NormalizedPlaylistItems normalize_playlist_items(std::string_view text) {
    NormalizedPlaylistItems result;
    std::string normalized;
    normalized.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            normalized += c;
        }
    }
    result.changed = !text.empty() && normalized != text;
    if (!normalized.empty()) {
        result.value = std::move(normalized);
    }
    return result;
}

std::filesystem::path expand_user(std::string_view path) {
    if (path.empty() || path.front() != '~') return std::filesystem::path(path);
    if (path.size() > 1 && path[1] != '/' && path[1] != '\\') {
        // ~user is left alone
        return std::filesystem::path(path);
    }

    const char* home = std::getenv("HOME");
#ifdef _WIN32
    if (home == nullptr) home = std::getenv("USERPROFILE");
#endif
    if (home == nullptr || *home == '\0') return std::filesystem::path(path);

    std::filesystem::path expanded(home);
    if (path.size() > 2) {
        expanded /= std::filesystem::path(path.substr(2));
    }
    return expanded;
}

DownloadRequest build_single_request(std::string_view url,
                                     const QueueSettings& settings,
                                     const LabeledFormat& chosen,
                                     bool playlist_enabled,
                                     const NetworkPolicy& defaults,
                                     std::string_view default_output_dir) {
    auto request = base_request(url, settings, defaults, default_output_dir);
    request.format = chosen.format;
    request.format_label = chosen.label;
    request.playlist_enabled = playlist_enabled;
    request.playlist_items = playlist_items_for(settings, playlist_enabled);
    return request;
}

DownloadRequest build_queue_request(std::string_view url,
                                    const QueueSettings& settings,
                                    const ResolvedFormat& resolved,
                                    const NetworkPolicy& defaults,
                                    std::string_view default_output_dir) {
    auto request = base_request(url, settings, defaults, default_output_dir);
    request.format = resolved.format;
    request.format_label = resolved.label;
    request.container = resolved.container;
    request.playlist_enabled = resolved.is_playlist;
    request.playlist_items = playlist_items_for(settings, resolved.is_playlist);
    request.title = resolved.title;
    return request;
}

std::error_code ensure_output_dir(const std::filesystem::path& dir) {
    std::error_code ec;
    if (dir.empty()) {
        return make_error_code(Errc::output_dir_unavailable);
    }
    if (std::filesystem::is_directory(dir, ec)) {
        return {};
    }
    std::filesystem::create_directories(dir, ec);
    if (ec || !std::filesystem::is_directory(dir, ec)) {
        spdlog::error("[download] cannot create output folder {}: {}",
                      dir.string(), ec ? ec.message() : "not a directory");
        return make_error_code(Errc::output_dir_unavailable);
    }
    return {};
}

} // namespace tubeq::core
