// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tubeq/core/queue_file.hpp>
#include <spdlog/spdlog.h>
#include <fstream>

namespace tubeq::core {

namespace {

std::string text_of(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return {};
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number()) return it->dump();
    return {};
}

bool flag_of(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    return it != j.end() && it->is_boolean() && it->get<bool>();
}

} // namespace

nlohmann::json queue_item_to_json(const QueueItem& item) {
    const auto& s = item.settings;
    const auto& o = s.options;
    return {
        {"url", item.url},
        {"settings", {
            {"mode", to_string(s.mode)},
            {"container", s.container},
            {"codec", s.codec},
            {"convert_to_mp4", s.convert_to_mp4},
            {"format_label", s.format_label},
            {"estimated_size", s.estimated_size},
            {"output_dir", s.output_dir},
            {"playlist_items", s.playlist_items},
            {"network_timeout", o.network_timeout},
            {"network_retries", o.network_retries},
            {"retry_backoff", o.retry_backoff},
            {"subtitle_languages", o.subtitle_languages},
            {"write_subtitles", o.write_subtitles},
            {"embed_subtitles", o.embed_subtitles},
            {"audio_language", o.audio_language},
            {"custom_filename", o.custom_filename},
        }},
    };
}

QueueItem queue_item_from_json(const nlohmann::json& j) {
    QueueItem item;
    if (!j.is_object()) return item;

    item.url = text_of(j, "url");

    auto it = j.find("settings");
    if (it == j.end() || !it->is_object()) return item;
    const auto& s = *it;

    item.settings.mode = parse_mode(text_of(s, "mode"));
    item.settings.container = text_of(s, "container");
    item.settings.codec = text_of(s, "codec");
    item.settings.convert_to_mp4 = flag_of(s, "convert_to_mp4");
    item.settings.format_label = text_of(s, "format_label");
    item.settings.estimated_size = text_of(s, "estimated_size");
    item.settings.output_dir = text_of(s, "output_dir");
    item.settings.playlist_items = text_of(s, "playlist_items");

    auto& o = item.settings.options;
    o.network_timeout = text_of(s, "network_timeout");
    o.network_retries = text_of(s, "network_retries");
    o.retry_backoff = text_of(s, "retry_backoff");
    o.subtitle_languages = text_of(s, "subtitle_languages");
    o.write_subtitles = flag_of(s, "write_subtitles");
    o.embed_subtitles = flag_of(s, "embed_subtitles");
    o.audio_language = text_of(s, "audio_language");
    o.custom_filename = text_of(s, "custom_filename");
    return item;
}

std::expected<std::vector<QueueItem>, std::error_code>
load_queue_file(const std::filesystem::path& path) noexcept {
    try {
        std::ifstream file(path);
        if (!file) {
            return std::unexpected(make_error_code(Errc::file_not_found));
        }
        auto j = nlohmann::json::parse(file);
        if (!j.is_array()) {
            spdlog::warn("[queue] {}: expected a JSON array", path.string());
            return std::unexpected(make_error_code(Errc::config_parse_error));
        }

        std::vector<QueueItem> items;
        items.reserve(j.size());
        for (const auto& entry : j) {
            items.push_back(queue_item_from_json(entry));
        }
        spdlog::debug("[queue] loaded {} item(s) from {}", items.size(), path.string());
        return items;
    } catch (const std::exception& e) {
        spdlog::warn("[queue] {}: {}", path.string(), e.what());
        return std::unexpected(make_error_code(Errc::config_parse_error));
    }
}

std::error_code save_queue_file(const std::filesystem::path& path,
                                const std::vector<QueueItem>& items) noexcept {
    try {
        auto j = nlohmann::json::array();
        for (const auto& item : items) {
            j.push_back(queue_item_to_json(item));
        }

        std::ofstream file(path, std::ios::trunc);
        if (!file) {
            return make_error_code(Errc::write_error);
        }
        file << j.dump(2) << '\n';
        return file ? std::error_code{} : make_error_code(Errc::write_error);
    } catch (const std::exception& e) {
        spdlog::warn("[queue] cannot write {}: {}", path.string(), e.what());
        return make_error_code(Errc::write_error);
    }
}

} // namespace tubeq::core
