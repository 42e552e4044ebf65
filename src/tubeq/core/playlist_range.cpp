// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tubeq/core/playlist_range.hpp>
#include <cctype>
#include <charconv>
#include <format>

namespace tubeq::core {

namespace {

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

// Strictly positive decimal integer
std::optional<std::uint64_t> parse_index(std::string_view text) noexcept {
    text = trim(text);
    if (text.empty()) return std::nullopt;

    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0) {
        return std::nullopt;
    }
    return value;
}

std::optional<PlaylistRange> parse_token(std::string_view token) noexcept {
    token = trim(token);
    if (token.empty()) return std::nullopt;

    auto dash = token.find('-');
    if (dash == std::string_view::npos) {
        auto index = parse_index(token);
        if (!index) return std::nullopt;
        return PlaylistRange{*index, *index};
    }

    auto start = parse_index(token.substr(0, dash));
    if (!start) return std::nullopt;

    auto rest = trim(token.substr(dash + 1));
    if (rest.empty()) {
        return PlaylistRange{*start, std::nullopt};
    }
    auto end = parse_index(rest);
    if (!end || *end < *start) return std::nullopt;
    return PlaylistRange{*start, *end};
}

} // namespace

PlaylistRangeSet PlaylistRangeSet::parse(std::string_view items) {
    PlaylistRangeSet set;
    while (!items.empty()) {
        auto comma = items.find(',');
        if (auto range = parse_token(items.substr(0, comma))) {
            set.ranges_.push_back(*range);
        }
        if (comma == std::string_view::npos) break;
        items.remove_prefix(comma + 1);
    }
    return set;
}

std::optional<std::uint64_t> PlaylistRangeSet::total_count() const noexcept {
    std::uint64_t total = 0;
    for (const auto& r : ranges_) {
        auto len = r.length();
        if (!len) return std::nullopt;
        total += *len;
    }
    return total;
}

std::optional<std::uint64_t> PlaylistRangeSet::position_of(std::uint64_t index) const noexcept {
    std::uint64_t before = 0;
    for (const auto& r : ranges_) {
        if (r.contains(index)) {
            return before + (index - r.start) + 1;
        }
        auto len = r.length();
        if (!len) return std::nullopt;
        before += *len;
    }
    return std::nullopt;
}

bool PlaylistRangeSet::contains(std::uint64_t index) const noexcept {
    for (const auto& r : ranges_) {
        if (r.contains(index)) return true;
    }
    return false;
}

std::string playlist_progress_label(const PlaylistRangeSet& ranges,
                                    std::uint64_t index,
                                    std::optional<std::uint64_t> reported_total) {
    std::optional<std::uint64_t> position;
    std::optional<std::uint64_t> total = reported_total;
    if (!ranges.empty()) {
        position = ranges.position_of(index);
        if (auto count = ranges.total_count()) {
            total = count;
        }
    }

    const auto shown = position.value_or(index);
    if (total && *total >= shown) {
        return std::format("{} of {}", shown, *total);
    }
    return std::to_string(shown);
}

} // namespace tubeq::core
