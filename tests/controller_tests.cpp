// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <tubeq/core/controller.hpp>
#include "test_support.hpp"
#include <algorithm>
#include <filesystem>

using namespace tubeq::core;
using namespace std::chrono_literals;
using tubeq::test::ManualClock;
using tubeq::test::ManualLauncher;
using tubeq::test::ScriptedBackend;
using tubeq::test::ScriptedMetadataSource;

namespace {

constexpr auto URL_A = "https://www.youtube.com/watch?v=aaa";
constexpr auto URL_B = "https://www.youtube.com/watch?v=bbb";
constexpr auto PLAYLIST = "https://www.youtube.com/playlist?list=PL1";

AppConfig test_config() {
    AppConfig config;
    config.fetch_debounce = 600ms;
    config.progress_interval = 0ms;
    config.output_dir = (std::filesystem::temp_directory_path() / "tubeq_controller_tests").string();
    return config;
}

struct Fixture {
    ScriptedMetadataSource source;
    ScriptedBackend backend;
    ManualLauncher launcher;
    ManualClock clock;
    Controller controller{source, backend, launcher, test_config(), clock.source()};

    std::vector<std::string> statuses;
    std::vector<Outcome> outcomes;
    int formats_changed = 0;

    Fixture() {
        source.set(URL_A, tubeq::test::sample_info("Clip A"));
        source.set(URL_B, tubeq::test::sample_info("Clip B"));
        source.set(PLAYLIST, tubeq::test::playlist_info());
        controller.listener({
            .status = [this](std::string_view s) { statuses.emplace_back(s); },
            .progress = {},
            .finished = [this](Outcome o) { outcomes.push_back(o); },
            .formats_changed = [this] { ++formats_changed; },
            .queue_changed = {},
        });
    }

    void pump() {
        while (launcher.pending() > 0 || controller.has_pending()) {
            launcher.run_all();
            controller.tick();
        }
    }

    void load(const char* url) {
        controller.on_url_changed(url);
        clock.advance(600ms);
        controller.tick();
        pump();
    }

    void load_video(const char* url) {
        load(url);
        controller.apply_mode_formats(Mode::video, "mp4", "avc1");
    }

    [[nodiscard]] bool saw(std::string_view status) const {
        return std::ranges::find(statuses, status) != statuses.end();
    }
};

} // namespace

TEST_CASE("Controller offers formats for the chosen mode", "[controller]") {
    Fixture f;
    f.load(URL_A);
    CHECK(f.controller.fetcher().has_formats());
    CHECK(f.controller.formats().empty());  // No mode chosen yet

    f.controller.apply_mode_formats(Mode::video, "mp4", "avc1");
    REQUIRE(f.controller.formats().size() == 2);
    CHECK(f.controller.selected_label() == "1080p 1920x1080 MP4 (avc1.640028)");
    CHECK(!f.controller.codec_fallback_used());

    SECTION("A chosen label survives a refresh that still offers it") {
        REQUIRE(!f.controller.select_format("720p 1280x720 MP4 (avc1.4d401f)"));
        f.controller.apply_mode_formats(Mode::video, "mp4", "av01");
        CHECK(f.controller.codec_fallback_used());
        CHECK(f.controller.selected_label() == "720p 1280x720 MP4 (avc1.4d401f)");
    }

    SECTION("A label no longer offered falls back to the first") {
        f.controller.apply_mode_formats(Mode::audio, "m4a", "");
        CHECK(f.controller.selected_label() == "Audio WEBM 160k (opus)");
    }

    SECTION("Unknown labels are rejected") {
        CHECK(f.controller.select_format("8K HDR") == Errc::formats_unavailable);
        CHECK(f.controller.selected_label() == "1080p 1920x1080 MP4 (avc1.640028)");
    }

    SECTION("Editing the URL clears the offer") {
        f.controller.on_url_changed(URL_B);
        CHECK(f.controller.formats().empty());
        CHECK(f.controller.selected_label().empty());
    }
}

TEST_CASE("Controller resolves mixed URLs", "[controller]") {
    Fixture f;
    f.controller.on_url_changed("https://www.youtube.com/watch?v=aaa&list=PL1&index=2");
    CHECK(f.controller.url() == URL_A);
    CHECK(!f.controller.playlist_mode());

    f.controller.on_url_changed(PLAYLIST);
    CHECK(f.controller.playlist_mode());

    SECTION("Playlist preference") {
        ScriptedMetadataSource source;
        ScriptedBackend backend;
        ManualLauncher launcher;
        auto config = test_config();
        config.prefer_playlist = true;
        Controller controller{source, backend, launcher, config};
        controller.on_url_changed("https://www.youtube.com/watch?v=aaa&list=PL1");
        CHECK(controller.url() == PLAYLIST);
        CHECK(controller.playlist_mode());
    }
}

TEST_CASE("Controller single download", "[controller]") {
    Fixture f;

    SECTION("Preconditions") {
        CHECK(f.controller.start_single() == Errc::missing_url);
        f.controller.on_url_changed(URL_A);
        CHECK(f.controller.start_single() == Errc::formats_unavailable);
        f.clock.advance(600ms);
        f.controller.tick();
        f.pump();
        CHECK(f.controller.start_single() == Errc::selection_incomplete);
    }

    SECTION("Runs to completion") {
        f.load_video(URL_A);
        REQUIRE(!f.controller.select_format("720p 1280x720 MP4 (avc1.4d401f)"));
        REQUIRE(!f.controller.start_single());
        CHECK(f.controller.downloading());
        CHECK(f.saw("Downloading..."));

        f.pump();
        CHECK(!f.controller.downloading());
        CHECK(f.outcomes == std::vector<Outcome>{Outcome::success});
        CHECK(f.saw("Download complete"));

        const auto requests = f.backend.requests();
        REQUIRE(requests.size() == 1);
        CHECK(requests[0].url == URL_A);
        CHECK(requests[0].format.format_id == "136");
        CHECK(requests[0].title == "Clip A");
        CHECK(!requests[0].playlist_enabled);
    }

    SECTION("Only one download at a time") {
        f.load_video(URL_A);
        REQUIRE(!f.controller.start_single());
        CHECK(f.controller.start_single() == Errc::download_in_progress);
        auto queue_status = f.controller.start_queue();
        REQUIRE(queue_status.has_value());
        CHECK(*queue_status == QueueStartStatus::busy);
        f.pump();
        CHECK(f.backend.requests().size() == 1);
    }

    SECTION("Fetching is held while downloading") {
        f.load_video(URL_A);
        REQUIRE(!f.controller.start_single());
        f.controller.on_fetch_formats(true);
        CHECK(f.launcher.pending() == 1);  // Only the download job
        f.pump();
    }

    SECTION("Failure and cancellation are reported") {
        f.load_video(URL_A);
        f.backend.outcome(URL_A, Outcome::failed);
        REQUIRE(!f.controller.start_single());
        f.pump();
        CHECK(f.saw("Download finished with errors"));

        REQUIRE(!f.controller.start_single());
        f.controller.cancel();
        f.pump();
        CHECK(f.saw("Download cancelled"));
        CHECK(f.outcomes == std::vector<Outcome>{Outcome::failed, Outcome::cancelled});
    }

    SECTION("Playlist downloads carry the item range") {
        f.load_video(PLAYLIST);
        f.controller.set_playlist_items(" 1-2, 4 ");
        REQUIRE(!f.controller.start_single());
        f.pump();
        const auto requests = f.backend.requests();
        REQUIRE(requests.size() == 1);
        CHECK(requests[0].playlist_enabled);
        CHECK(requests[0].playlist_items == "1-2,4");

        f.controller.set_playlist_enabled(false);
        REQUIRE(!f.controller.start_single());
        f.pump();
        CHECK(!f.backend.requests().back().playlist_enabled);
    }
}

TEST_CASE("Controller add_to_queue checks", "[controller]") {
    Fixture f;

    CHECK(f.controller.add_to_queue() == QueueIssue::missing_url);

    f.controller.on_url_changed(PLAYLIST);
    CHECK(f.controller.add_to_queue() == QueueIssue::playlist);

    f.controller.on_url_changed(URL_A);
    CHECK(f.controller.add_to_queue() == QueueIssue::formats);

    f.clock.advance(600ms);
    f.controller.tick();
    f.pump();
    CHECK(f.controller.add_to_queue() == QueueIssue::mode);

    f.controller.apply_mode_formats(Mode::video, "mp4", "");
    CHECK(f.controller.add_to_queue() == QueueIssue::codec);

    f.controller.apply_mode_formats(Mode::video, "mp4", "avc1");
    CHECK(!f.controller.add_to_queue());
    REQUIRE(f.controller.queue().items().size() == 1);
    CHECK(f.controller.queue().items()[0].settings.format_label
          == "1080p 1920x1080 MP4 (avc1.640028)");
}

TEST_CASE("Controller queue run", "[controller]") {
    Fixture f;
    f.load_video(URL_A);
    REQUIRE(!f.controller.add_to_queue());
    f.load_video(URL_B);
    REQUIRE(!f.controller.add_to_queue());

    auto status = f.controller.start_queue();
    REQUIRE(status.has_value());
    REQUIRE(*status == QueueStartStatus::started);
    CHECK(f.controller.downloading());
    CHECK(f.controller.add_to_queue() == Errc::queue_locked);
    CHECK(f.controller.start_single() == Errc::download_in_progress);

    f.pump();
    CHECK(!f.controller.downloading());
    CHECK(f.outcomes == std::vector<Outcome>{Outcome::success});
    CHECK(f.saw("Queue finished"));
    CHECK(f.backend.requests().size() == 2);

    SECTION("Invalid items are reported") {
        auto items = f.controller.queue().items();
        items[1].settings.format_label.clear();
        REQUIRE(!f.controller.queue().replace(items));
        auto rejected = f.controller.start_queue();
        REQUIRE(!rejected.has_value());
        CHECK(rejected.error() == QueueValidationError{2, QueueIssue::format});
        CHECK(f.saw("Queue item 2 is incomplete: Choose a format"));
    }
}

TEST_CASE("Controller queue of blank items releases fetching", "[controller]") {
    Fixture f;
    f.load_video(URL_A);
    REQUIRE(!f.controller.add_to_queue());
    auto items = f.controller.queue().items();
    items[0].url = "   ";
    REQUIRE(!f.controller.queue().replace(items));

    auto status = f.controller.start_queue();
    REQUIRE(status.has_value());
    CHECK(*status == QueueStartStatus::started);
    CHECK(!f.controller.downloading());
    CHECK(f.outcomes == std::vector<Outcome>{Outcome::success});
    CHECK(f.backend.requests().empty());

    f.controller.on_url_changed(URL_B);
    CHECK(f.controller.fetcher().debounce_deadline().has_value());
    f.clock.advance(600ms);
    f.controller.tick();
    CHECK(f.launcher.pending() == 1);
    f.pump();
    CHECK(f.controller.fetcher().has_formats());
}
