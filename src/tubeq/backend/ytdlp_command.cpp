// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tubeq/backend/ytdlp_command.hpp>
#include <tubeq/core/numeric.hpp>
#include <tubeq/core/options.hpp>
#include <algorithm>
#include <charconv>
#include <cmath>
#include <format>

namespace tubeq::backend {

namespace {

std::optional<double> parse_number(std::string_view token) noexcept {
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec != std::errc{} || ptr != token.data() + token.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

// Split off the next space-delimited token
std::string_view next_token(std::string_view& rest) noexcept {
    auto start = rest.find_first_not_of(' ');
    if (start == std::string_view::npos) {
        rest = {};
        return {};
    }
    rest.remove_prefix(start);
    auto end = rest.find(' ');
    auto token = rest.substr(0, end);
    rest = end == std::string_view::npos ? std::string_view{} : rest.substr(end + 1);
    return token;
}

std::string language_audio(std::string_view language) {
    return std::format("bestaudio[language={}]", language);
}

std::string with_fallback(std::string_view preferred, std::string_view fallback) {
    return std::format("{}/{}", preferred, fallback);
}

bool wants_mp4_output(const core::DownloadRequest& request) noexcept {
    const auto& target = request.container.empty() ? request.format.ext : request.container;
    return target == "mp4" || (target == "webm" && request.convert_to_mp4);
}

} // namespace

std::vector<std::string> metadata_arguments(std::string_view url) {
    return {
        "-J",
        "--no-warnings",
        "--skip-download",
        "--playlist-items", "1",
        "--", std::string(url),
    };
}

std::string format_directive(const core::DownloadRequest& request) {
    const auto& format = request.format;
    const auto& language = request.audio_language;

    if (format.synthetic) {
        if (language.empty()) {
            return format.selector;
        }
        if (format.selector == core::BEST_AUDIO_SELECTOR) {
            return with_fallback(language_audio(language), format.selector);
        }
        return with_fallback(std::format("bestvideo+{}", language_audio(language)), format.selector);
    }

    if (format.has_video_only()) {
        const auto plain = std::format("{}+bestaudio/best", format.format_id);
        if (language.empty()) {
            return plain;
        }
        return with_fallback(std::format("{}+{}", format.format_id, language_audio(language)), plain);
    }
    return format.format_id;
}

std::string output_template(const core::DownloadRequest& request) {
    if (!request.custom_filename.empty() && !request.playlist_enabled) {
        return request.custom_filename + ".%(ext)s";
    }
    return std::string(DEFAULT_OUTPUT_TEMPLATE);
}

std::vector<std::string> download_arguments(const core::DownloadRequest& request) {
    std::vector<std::string> args;
    args.reserve(48);

    args.insert(args.end(), {"-f", format_directive(request)});
    args.insert(args.end(), {"-P", request.output_dir.string()});
    args.insert(args.end(), {"-o", output_template(request)});

    const bool audio_only = request.mode == core::Mode::audio || request.format.is_audio();
    if (audio_only) {
        const auto codec = core::is_audio_container(request.container) ? request.container : "m4a";
        args.insert(args.end(), {"-x", "--audio-format", codec});
    } else if (wants_mp4_output(request)) {
        args.insert(args.end(), {"--merge-output-format", "mp4"});
        args.insert(args.end(), {"--recode-video", "mp4"});
        args.insert(args.end(), {"--postprocessor-args", std::string(FASTSTART_ARGS)});
    } else if (request.container == "webm") {
        args.insert(args.end(), {"--merge-output-format", "webm"});
    }

    if (request.playlist_enabled) {
        args.emplace_back("--yes-playlist");
        if (request.playlist_items) {
            args.insert(args.end(), {"--playlist-items", *request.playlist_items});
        }
    } else {
        args.emplace_back("--no-playlist");
    }

    args.insert(args.end(), {"--socket-timeout", std::to_string(request.network.timeout_s)});
    args.insert(args.end(), {"--retries", std::to_string(request.network.retries)});
    args.insert(args.end(), {"--retry-sleep", std::format("{}", request.network.backoff_s)});

    if (request.write_subtitles) {
        args.emplace_back("--write-subs");
        if (!request.subtitle_languages.empty()) {
            std::string langs;
            for (const auto& lang : request.subtitle_languages) {
                if (!langs.empty()) langs += ',';
                langs += lang;
            }
            args.insert(args.end(), {"--sub-langs", langs});
        }
        if (request.embed_subtitles) {
            args.emplace_back("--embed-subs");
        }
    }

    // --print implies --quiet --simulate; undo both
    args.insert(args.end(), {"--newline", "--progress", "--no-simulate"});
    args.insert(args.end(), {
        "--progress-template",
        std::format("download:{} %(progress.status)s %(progress.downloaded_bytes)s "
                    "%(progress.total_bytes)s %(progress.total_bytes_estimate)s "
                    "%(progress.speed)s %(progress.eta)s", PROGRESS_MARKER),
    });
    args.insert(args.end(), {
        "--print",
        std::format("before_dl:{} %(playlist_index)s %(n_entries)s %(title)s", ITEM_MARKER),
    });

    args.insert(args.end(), {"--", request.url});
    return args;
}

std::optional<core::ProgressEvent>
parse_output_line(std::string_view line, const core::PlaylistRangeSet& ranges) {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    if (line.starts_with(PROGRESS_MARKER)) {
        auto rest = line.substr(PROGRESS_MARKER.size());
        const auto status = next_token(rest);
        if (status == "finished") {
            return core::Finished{};
        }
        if (status != "downloading") {
            return std::nullopt;
        }

        const auto downloaded = parse_number(next_token(rest));
        const auto total = parse_number(next_token(rest));
        const auto estimate = parse_number(next_token(rest));
        const auto speed = parse_number(next_token(rest));
        const auto eta = parse_number(next_token(rest));

        core::Downloading event;
        const auto size = total ? total : estimate;
        if (downloaded && size && *size > 0.0) {
            event.percent = std::clamp(*downloaded / *size * 100.0, 0.0, 100.0);
        }
        event.speed = core::format_speed(speed);
        event.eta = core::format_eta(eta);
        return event;
    }

    if (line.starts_with(ITEM_MARKER)) {
        auto rest = line.substr(ITEM_MARKER.size());
        const auto index = parse_number(next_token(rest));
        const auto entries = parse_number(next_token(rest));
        if (!index || *index < 1.0) {
            return std::nullopt;
        }

        std::optional<std::uint64_t> reported;
        if (entries && *entries >= 1.0) {
            reported = core::saturate_cast<std::uint64_t>(*entries);
        }
        auto label = core::playlist_progress_label(ranges, core::saturate_cast<std::uint64_t>(*index), reported);
        auto title = rest.substr(std::min(rest.find_first_not_of(' '), rest.size()));
        if (!title.empty() && title != "NA") {
            label = std::format("{}: {}", label, title);
        }
        return core::ItemStarted{std::move(label)};
    }

    return std::nullopt;
}

} // namespace tubeq::backend
