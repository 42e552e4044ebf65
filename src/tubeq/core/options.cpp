// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tubeq/core/options.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <optional>

namespace tubeq::core {

namespace {

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::string lower(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::optional<double> parse_number(std::string_view text) noexcept {
    text = trim(text);
    if (text.starts_with('+')) text.remove_prefix(1);
    if (text.empty()) return std::nullopt;

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

bool is_forbidden_filename_char(unsigned char c) noexcept {
    switch (c) {
        case '\\': case '/': case ':': case '*': case '?':
        case '"': case '<': case '>': case '|':
            return true;
        default:
            return c < 0x20 || c == 0x7f;
    }
}

std::string collapse_whitespace(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;
    for (char c : trim(s)) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = true;
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += c;
    }
    return out;
}

// Back off to a code point boundary so a multi-byte sequence is never split
std::size_t utf8_safe_length(std::string_view s, std::size_t limit) noexcept {
    if (s.size() <= limit) return s.size();
    std::size_t n = limit;
    while (n > 0 && (static_cast<unsigned char>(s[n]) & 0xC0) == 0x80) {
        --n;
    }
    return n;
}

} // namespace

Mode parse_mode(std::string_view text) noexcept {
    const auto t = trim(text);
    if (t.size() == 5) {
        std::string l = lower(t);
        if (l == "video") return Mode::video;
        if (l == "audio") return Mode::audio;
    }
    return Mode::none;
}

int parse_int_setting(std::string_view text, int fallback, int minimum, int maximum) noexcept {
    auto value = parse_number(text);
    if (!value) return fallback;

    const double truncated = std::trunc(*value);
    if (truncated < static_cast<double>(std::numeric_limits<int>::min())
        || truncated > static_cast<double>(std::numeric_limits<int>::max())) {
        return truncated < 0 ? minimum : maximum;
    }
    return std::clamp(static_cast<int>(truncated), minimum, maximum);
}

double parse_float_setting(std::string_view text, double fallback,
                           double minimum, double maximum) noexcept {
    auto value = parse_number(text);
    if (!value) return fallback;
    return std::clamp(*value, minimum, maximum);
}

std::vector<std::string> parse_subtitle_languages(std::string_view text) {
    std::vector<std::string> languages;
    while (true) {
        auto comma = text.find(',');
        auto token = lower(trim(text.substr(0, comma)));
        if (!token.empty() && std::ranges::find(languages, token) == languages.end()) {
            languages.push_back(std::move(token));
        }
        if (comma == std::string_view::npos) break;
        text.remove_prefix(comma + 1);
    }
    return languages;
}

std::string sanitize_custom_filename(std::string_view text) {
    auto stem = collapse_whitespace(text);

    // Runs of forbidden characters become one space
    std::string replaced;
    replaced.reserve(stem.size());
    bool in_run = false;
    for (char c : stem) {
        if (is_forbidden_filename_char(static_cast<unsigned char>(c))) {
            if (!in_run) replaced += ' ';
            in_run = true;
            continue;
        }
        in_run = false;
        replaced += c;
    }

    std::string_view view = trim(replaced);
    while (!view.empty() && view.front() == '.') view.remove_prefix(1);
    while (!view.empty() && view.back() == '.') view.remove_suffix(1);
    stem = collapse_whitespace(view);

    // Trailing ".ext" of 1-5 alphanumerics
    auto dot = stem.rfind('.');
    if (dot != std::string::npos) {
        const auto suffix = std::string_view(stem).substr(dot + 1);
        const bool ext_like = !suffix.empty() && suffix.size() <= 5
            && std::ranges::all_of(suffix, [](char c) {
                   return std::isalnum(static_cast<unsigned char>(c)) != 0;
               });
        if (ext_like) {
            stem = std::string(trim(std::string_view(stem).substr(0, dot)));
        }
    }

    if (stem.empty() || stem == "." || stem == "..") {
        return {};
    }
    stem.resize(utf8_safe_length(stem, CUSTOM_FILENAME_MAX));
    return stem;
}

NetworkPolicy parse_network_policy(const RawOptions& raw, const NetworkPolicy& defaults) noexcept {
    NetworkPolicy policy;
    policy.timeout_s = parse_int_setting(raw.network_timeout, defaults.timeout_s,
                                         MIN_NETWORK_TIMEOUT_S, MAX_NETWORK_TIMEOUT_S);
    policy.retries = parse_int_setting(raw.network_retries, defaults.retries,
                                       MIN_NETWORK_RETRIES, MAX_NETWORK_RETRIES);
    policy.backoff_s = parse_float_setting(raw.retry_backoff, defaults.backoff_s,
                                           MIN_RETRY_BACKOFF_S, MAX_RETRY_BACKOFF_S);
    return policy;
}

DownloadOptions build_download_options(const RawOptions& raw, Mode mode,
                                       const NetworkPolicy& defaults) {
    DownloadOptions options;
    options.network = parse_network_policy(raw, defaults);
    options.subtitle_languages = parse_subtitle_languages(raw.subtitle_languages);
    options.write_subtitles = raw.write_subtitles && mode == Mode::video;
    options.embed_subtitles = options.write_subtitles && raw.embed_subtitles;

    auto language = lower(trim(raw.audio_language));
    options.audio_language = language == "any" ? std::string{} : std::move(language);
    options.custom_filename = sanitize_custom_filename(raw.custom_filename);
    return options;
}

bool is_video_container(std::string_view container) noexcept {
    return std::ranges::find(VIDEO_CONTAINERS, container) != VIDEO_CONTAINERS.end();
}

bool is_audio_container(std::string_view container) noexcept {
    return std::ranges::find(AUDIO_CONTAINERS, container) != AUDIO_CONTAINERS.end();
}

bool is_video_codec(std::string_view codec) noexcept {
    return std::ranges::find(VIDEO_CODECS, codec) != VIDEO_CODECS.end();
}

} // namespace tubeq::core
