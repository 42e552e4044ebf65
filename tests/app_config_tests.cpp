// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <tubeq/core/app_config.hpp>
#include <filesystem>
#include <fstream>

using namespace tubeq::core;
using namespace std::chrono_literals;
using Catch::Approx;

namespace {

std::filesystem::path scratch_file(const char* name) {
    auto dir = std::filesystem::temp_directory_path() / "tubeq_config_tests";
    std::filesystem::create_directories(dir);
    return dir / name;
}

void write_text(const std::filesystem::path& path, std::string_view text) {
    std::ofstream(path, std::ios::trunc) << text;
}

} // namespace

TEST_CASE("AppConfig defaults", "[config]") {
    AppConfig config;
    CHECK(config.fetch_debounce == FETCH_DEBOUNCE);
    CHECK(config.format_cache_capacity == FORMAT_CACHE_MAX_ENTRIES);
    CHECK(config.max_events_per_tick == MAX_EVENTS_PER_TICK);
    CHECK(config.network == NetworkPolicy{});
    CHECK(config.ytdlp_path == "yt-dlp");
    CHECK(config.log_level == "info");
    CHECK(!config.prefer_playlist);

    SECTION("Non-object JSON keeps the defaults") {
        auto parsed = AppConfig::from_json(nlohmann::json::array());
        CHECK(parsed.to_json() == config.to_json());
    }
}

TEST_CASE("AppConfig::from_json", "[config]") {
    SECTION("Values are read") {
        auto config = AppConfig::from_json({
            {"fetch_debounce_ms", 250},
            {"format_cache_capacity", 8},
            {"output_dir", "/srv/media"},
            {"network_timeout_s", 60},
            {"network_retries", 4},
            {"retry_backoff_s", 0.5},
            {"ytdlp_path", "/opt/yt-dlp"},
            {"log_level", "debug"},
            {"prefer_playlist", true},
        });
        CHECK(config.fetch_debounce == 250ms);
        CHECK(config.format_cache_capacity == 8);
        CHECK(config.output_dir == "/srv/media");
        CHECK(config.network.timeout_s == 60);
        CHECK(config.network.retries == 4);
        CHECK(config.network.backoff_s == Approx(0.5));
        CHECK(config.ytdlp_path == "/opt/yt-dlp");
        CHECK(config.log_level == "debug");
        CHECK(config.prefer_playlist);
    }

    SECTION("Numbers may be strings") {
        auto config = AppConfig::from_json({
            {"network_timeout_s", " 90 "},
            {"retry_backoff_s", "2.5"},
        });
        CHECK(config.network.timeout_s == 90);
        CHECK(config.network.backoff_s == Approx(2.5));
    }

    SECTION("Out of range values are clamped") {
        auto config = AppConfig::from_json({
            {"fetch_debounce_ms", -5},
            {"format_cache_capacity", 0},
            {"poll_interval_ms", 1},
            {"network_timeout_s", 100000},
            {"network_retries", -2},
            {"retry_backoff_s", 99},
        });
        CHECK(config.fetch_debounce == 0ms);
        CHECK(config.format_cache_capacity == 1);
        CHECK(config.poll_interval == 5ms);
        CHECK(config.network.timeout_s == MAX_NETWORK_TIMEOUT_S);
        CHECK(config.network.retries == MIN_NETWORK_RETRIES);
        CHECK(config.network.backoff_s == Approx(MAX_RETRY_BACKOFF_S));
    }

    SECTION("Wrong types fall back") {
        auto config = AppConfig::from_json({
            {"network_retries", "many"},
            {"output_dir", 42},
            {"prefer_playlist", "yes"},
        });
        CHECK(config.network.retries == DEFAULT_NETWORK_RETRIES);
        CHECK(config.output_dir == DEFAULT_OUTPUT_DIR);
        CHECK(!config.prefer_playlist);
    }
}

TEST_CASE("AppConfig load and save", "[config]") {
    SECTION("Missing file") {
        auto result = AppConfig::load(scratch_file("does_not_exist.json"));
        REQUIRE(!result.has_value());
        CHECK(result.error() == Errc::file_not_found);
    }

    SECTION("Malformed JSON") {
        const auto path = scratch_file("broken.json");
        write_text(path, "{ \"log_level\": ");
        auto result = AppConfig::load(path);
        REQUIRE(!result.has_value());
        CHECK(result.error() == Errc::config_parse_error);
    }

    SECTION("Top level must be an object") {
        const auto path = scratch_file("array.json");
        write_text(path, "[1, 2]");
        CHECK(AppConfig::load(path).error() == Errc::config_parse_error);
    }

    SECTION("Saved settings load back") {
        const auto path = scratch_file("nested/config.json");
        AppConfig config;
        config.output_dir = "/data/videos";
        config.network.retries = 7;
        config.prefer_playlist = true;
        REQUIRE(!config.save(path));

        auto loaded = AppConfig::load(path);
        REQUIRE(loaded.has_value());
        CHECK(loaded->output_dir == "/data/videos");
        CHECK(loaded->network.retries == 7);
        CHECK(loaded->prefer_playlist);
    }
}

TEST_CASE("AppConfig::default_path", "[config]") {
    const auto path = AppConfig::default_path();
    CHECK(path.filename() == "config.json");
    CHECK(path.parent_path().filename() == "tubeq");
}
