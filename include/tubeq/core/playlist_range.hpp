// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tubeq::core {

// Inclusive 1-based playlist index range; no end means open-ended ("7-")
struct PlaylistRange {
    std::uint64_t start{1};
    std::optional<std::uint64_t> end;

    [[nodiscard]] bool contains(std::uint64_t index) const noexcept {
        return index >= start && (!end || index <= *end);
    }

    [[nodiscard]] std::optional<std::uint64_t> length() const noexcept {
        if (!end) return std::nullopt;
        return *end - start + 1;
    }

    bool operator==(const PlaylistRange&) const = default;
};

// Parsed "1-3,7,10-" selection. Used for "k of N" display only; the extractor
// applies the same selection to decide which entries are downloaded.
class PlaylistRangeSet {
public:
    PlaylistRangeSet() = default;

    // Malformed, reversed and zero tokens are dropped silently
    [[nodiscard]] static PlaylistRangeSet parse(std::string_view items);

    // Sum of range lengths; nullopt if any range is open-ended
    [[nodiscard]] std::optional<std::uint64_t> total_count() const noexcept;

    // 1-based position of `index` within the selection
    [[nodiscard]] std::optional<std::uint64_t> position_of(std::uint64_t index) const noexcept;

    [[nodiscard]] bool contains(std::uint64_t index) const noexcept;

    [[nodiscard]] bool empty() const noexcept { return ranges_.empty(); }
    [[nodiscard]] const std::vector<PlaylistRange>& ranges() const noexcept { return ranges_; }

private:
    std::vector<PlaylistRange> ranges_;
};

// "k of N" for an item reported by the extractor. Falls back to the raw
// index and the extractor's own total when the selection cannot map it.
[[nodiscard]] std::string playlist_progress_label(const PlaylistRangeSet& ranges,
                                                  std::uint64_t index,
                                                  std::optional<std::uint64_t> reported_total);

} // namespace tubeq::core
