// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tubeq/core/app_config.hpp>
#include <tubeq/core/download_request.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <fstream>

namespace tubeq::core {

namespace {

// Number or numeric string; anything else keeps the fallback
std::string numeric_text(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return {};
    if (it->is_number()) return it->dump();
    if (it->is_string()) return it->get<std::string>();
    return {};
}

int int_field(const nlohmann::json& j, const char* key, int fallback, int minimum, int maximum) {
    return parse_int_setting(numeric_text(j, key), fallback, minimum, maximum);
}

double float_field(const nlohmann::json& j, const char* key, double fallback,
                   double minimum, double maximum) {
    return parse_float_setting(numeric_text(j, key), fallback, minimum, maximum);
}

std::string string_field(const nlohmann::json& j, const char* key, std::string fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

} // namespace

AppConfig AppConfig::from_json(const nlohmann::json& j) {
    AppConfig cfg;
    if (!j.is_object()) return cfg;

    cfg.fetch_debounce = std::chrono::milliseconds{
        int_field(j, "fetch_debounce_ms", static_cast<int>(FETCH_DEBOUNCE.count()), 0, 10'000)};
    cfg.format_cache_capacity = static_cast<std::size_t>(
        int_field(j, "format_cache_capacity", static_cast<int>(FORMAT_CACHE_MAX_ENTRIES), 1, 10'000));
    cfg.poll_interval = std::chrono::milliseconds{
        int_field(j, "poll_interval_ms", static_cast<int>(MAILBOX_POLL_INTERVAL.count()), 5, 1'000)};
    cfg.max_events_per_tick = static_cast<std::size_t>(
        int_field(j, "max_events_per_tick", static_cast<int>(MAX_EVENTS_PER_TICK), 1, 10'000));
    cfg.progress_interval = std::chrono::milliseconds{
        int_field(j, "progress_interval_ms", static_cast<int>(PROGRESS_INTERVAL.count()), 0, 10'000)};

    cfg.output_dir = string_field(j, "output_dir", cfg.output_dir);
    cfg.network.timeout_s = int_field(j, "network_timeout_s", DEFAULT_NETWORK_TIMEOUT_S,
                                      MIN_NETWORK_TIMEOUT_S, MAX_NETWORK_TIMEOUT_S);
    cfg.network.retries = int_field(j, "network_retries", DEFAULT_NETWORK_RETRIES,
                                    MIN_NETWORK_RETRIES, MAX_NETWORK_RETRIES);
    cfg.network.backoff_s = float_field(j, "retry_backoff_s", DEFAULT_RETRY_BACKOFF_S,
                                        MIN_RETRY_BACKOFF_S, MAX_RETRY_BACKOFF_S);

    cfg.ytdlp_path = string_field(j, "ytdlp_path", cfg.ytdlp_path);
    cfg.log_level = string_field(j, "log_level", cfg.log_level);
    cfg.log_file = string_field(j, "log_file", cfg.log_file);

    if (auto it = j.find("prefer_playlist"); it != j.end() && it->is_boolean()) {
        cfg.prefer_playlist = it->get<bool>();
    }
    return cfg;
}

nlohmann::json AppConfig::to_json() const {
    return {
        {"fetch_debounce_ms", fetch_debounce.count()},
        {"format_cache_capacity", format_cache_capacity},
        {"poll_interval_ms", poll_interval.count()},
        {"max_events_per_tick", max_events_per_tick},
        {"progress_interval_ms", progress_interval.count()},
        {"output_dir", output_dir},
        {"network_timeout_s", network.timeout_s},
        {"network_retries", network.retries},
        {"retry_backoff_s", network.backoff_s},
        {"ytdlp_path", ytdlp_path},
        {"log_level", log_level},
        {"log_file", log_file},
        {"prefer_playlist", prefer_playlist},
    };
}

std::expected<AppConfig, std::error_code> AppConfig::load(const std::filesystem::path& path) noexcept {
    try {
        std::ifstream file(path);
        if (!file) {
            return std::unexpected(make_error_code(Errc::file_not_found));
        }
        auto j = nlohmann::json::parse(file);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(Errc::config_parse_error));
        }
        return from_json(j);
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("[config] {}: {}", path.string(), e.what());
        return std::unexpected(make_error_code(Errc::config_parse_error));
    } catch (const std::exception& e) {
        spdlog::warn("[config] {}: {}", path.string(), e.what());
        return std::unexpected(make_error_code(Errc::config_parse_error));
    }
}

std::error_code AppConfig::save(const std::filesystem::path& path) const noexcept {
    try {
        if (path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
        }
        std::ofstream file(path, std::ios::trunc);
        if (!file) {
            return make_error_code(Errc::write_error);
        }
        file << to_json().dump(2) << '\n';
        return file ? std::error_code{} : make_error_code(Errc::write_error);
    } catch (const std::exception&) {
        return make_error_code(Errc::write_error);
    }
}

std::filesystem::path AppConfig::default_path() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0') {
        return std::filesystem::path(xdg) / "tubeq" / "config.json";
    }
    return expand_user("~/.config/tubeq/config.json");
}

} // namespace tubeq::core
