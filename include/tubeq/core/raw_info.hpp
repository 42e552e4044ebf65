// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tubeq/core/format.hpp>
#include <tubeq/core/format_catalog.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace tubeq::core {

// Extractor metadata document (yt-dlp -J output), kept as parsed JSON
using RawInfo = nlohmann::json;

// Missing or null keys map to defaults; filesize falls back to filesize_approx
[[nodiscard]] MediaFormatDescriptor descriptor_from_json(const nlohmann::json& j);

// Formats of the document, or of the first entry when it is a playlist
[[nodiscard]] FormatVector formats_from_info(const RawInfo& info);

// Whitespace-normalized title, falling back to the first playlist entry
[[nodiscard]] std::string preview_title_from_info(const RawInfo& info);

[[nodiscard]] bool is_playlist_info(const RawInfo& info) noexcept;

[[nodiscard]] FormatCollection collection_from_info(const RawInfo& info);

} // namespace tubeq::core
