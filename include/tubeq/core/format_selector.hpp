// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tubeq/core/error.hpp>
#include <tubeq/core/format.hpp>
#include <tubeq/core/options.hpp>
#include <tubeq/core/raw_info.hpp>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace tubeq::core {

// Labels offered for a mode/container/codec choice
struct ModeSelection {
    FormatList formats;
    bool codec_fallback_used{false};  // Container-only tier produced the result

    [[nodiscard]] bool empty() const noexcept { return formats.empty(); }
};

// Concrete format picked for one job
struct ResolvedFormat {
    std::string label;
    MediaFormatDescriptor format;
    std::string container;
    bool codec_fallback_used{false};
    bool is_playlist{false};
    std::string title;
    std::vector<std::string> notes;  // Substitutions made while resolving
};

// Case-insensitive; avc1 also matches h264, av01 also matches av1.
// Empty or "any" matches everything.
[[nodiscard]] bool codec_matches_preference(std::string_view vcodec,
                                            std::string_view preference);

// Audio: every audio entry, or a synthetic best-audio entry.
// Video: exact container+codec, then container only, then synthetic best.
// Video without a valid container/codec pair, or no mode, yields nothing.
[[nodiscard]] ModeSelection select_mode_formats(Mode mode,
                                                std::string_view container,
                                                std::string_view codec,
                                                const FormatCollection& catalog);

// Re-apply a captured selection to a freshly built catalog. The captured label
// is kept when still offered, otherwise the first label is substituted and a
// note recorded. Fails only when the settings cannot select anything.
[[nodiscard]] std::expected<ResolvedFormat, std::error_code>
resolve_format(const FormatCollection& catalog, const QueueSettings& settings);

[[nodiscard]] std::expected<ResolvedFormat, std::error_code>
resolve_format_for_metadata(const RawInfo& info, const QueueSettings& settings);

} // namespace tubeq::core
