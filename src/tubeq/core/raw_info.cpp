// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tubeq/core/raw_info.hpp>
#include <tubeq/core/numeric.hpp>
#include <cctype>
#include <cmath>
#include <sstream>

namespace tubeq::core {

namespace {

std::string string_field(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

double number_field(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return 0.0;
    const auto v = it->get<double>();
    return std::isfinite(v) && v > 0.0 ? v : 0.0;
}

std::string normalize_title(std::string_view raw) {
    std::istringstream words{std::string(raw)};
    std::string word;
    std::string out;
    while (words >> word) {
        if (!out.empty()) out += ' ';
        out += word;
    }
    return out;
}

const nlohmann::json* first_entry(const RawInfo& info) {
    auto it = info.find("entries");
    if (it == info.end() || !it->is_array() || it->empty()) return nullptr;
    const auto& first = it->front();
    return first.is_object() ? &first : nullptr;
}

} // namespace

MediaFormatDescriptor descriptor_from_json(const nlohmann::json& j) {
    MediaFormatDescriptor f;
    if (!j.is_object()) return f;

    f.format_id = string_field(j, "format_id");
    f.ext = string_field(j, "ext");
    f.vcodec = string_field(j, "vcodec");
    f.acodec = string_field(j, "acodec");
    f.height = saturate_cast<std::uint32_t>(number_field(j, "height"));
    f.width = saturate_cast<std::uint32_t>(number_field(j, "width"));
    f.fps = number_field(j, "fps");
    f.tbr = number_field(j, "tbr");
    f.abr = number_field(j, "abr");
    f.language = string_field(j, "language");
    f.format_note = string_field(j, "format_note");

    auto size = number_field(j, "filesize");
    if (size <= 0.0) {
        size = number_field(j, "filesize_approx");
    }
    if (size > 0.0) {
        f.filesize = saturate_cast<std::uint64_t>(size);
    }
    return f;
}

FormatVector formats_from_info(const RawInfo& info) {
    if (!info.is_object()) return {};

    const nlohmann::json* entry = &info;
    if (string_field(info, "_type") == "playlist") {
        if (const auto* first = first_entry(info)) {
            entry = first;
        }
    }

    FormatVector formats;
    auto it = entry->find("formats");
    if (it == entry->end() || !it->is_array()) return formats;

    formats.reserve(it->size());
    for (const auto& item : *it) {
        if (!item.is_object()) continue;
        formats.push_back(descriptor_from_json(item));
    }
    return formats;
}

std::string preview_title_from_info(const RawInfo& info) {
    if (!info.is_object()) return {};

    auto title = normalize_title(string_field(info, "title"));
    if (!title.empty()) return title;

    if (const auto* first = first_entry(info)) {
        return normalize_title(string_field(*first, "title"));
    }
    return {};
}

bool is_playlist_info(const RawInfo& info) noexcept {
    if (!info.is_object()) return false;
    auto type = info.find("_type");
    if (type != info.end() && type->is_string() && type->get_ref<const std::string&>() == "playlist") {
        return true;
    }
    auto entries = info.find("entries");
    return entries != info.end() && !entries->is_null();
}

FormatCollection collection_from_info(const RawInfo& info) {
    return build_format_collection(formats_from_info(info),
                                   preview_title_from_info(info),
                                   is_playlist_info(info));
}

} // namespace tubeq::core
