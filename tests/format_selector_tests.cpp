// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <tubeq/core/format_selector.hpp>
#include "test_support.hpp"

using namespace tubeq::core;
using tubeq::test::sample_info;

TEST_CASE("codec_matches_preference", "[selector]") {
    SECTION("Aliases") {
        CHECK(codec_matches_preference("avc1.640028", "avc1"));
        CHECK(codec_matches_preference("H264", "avc1"));
        CHECK(codec_matches_preference("av01.0.08M.08", "av01"));
        CHECK(codec_matches_preference("AV1", "av01"));
    }

    SECTION("No preference matches anything") {
        CHECK(codec_matches_preference("vp9", ""));
        CHECK(codec_matches_preference("vp9", " ANY "));
    }

    SECTION("Mismatches") {
        CHECK(!codec_matches_preference("vp9", "avc1"));
        CHECK(!codec_matches_preference("avc1", "av01"));
        CHECK(!codec_matches_preference("", "avc1"));
    }

    SECTION("Other preferences are substring matches") {
        CHECK(codec_matches_preference("vp09.00.40.08", "vp09"));
    }

    SECTION("Allocating predicate is not noexcept") {
        STATIC_REQUIRE(!noexcept(codec_matches_preference("", "")));
    }
}

TEST_CASE("select_mode_formats - video tiers", "[selector]") {
    const auto catalog = collection_from_info(sample_info());

    SECTION("Exact container and codec") {
        auto selection = select_mode_formats(Mode::video, "mp4", "avc1", catalog);
        REQUIRE(selection.formats.size() == 2);
        CHECK(selection.formats[0].format.format_id == "137");
        CHECK(selection.formats[1].format.format_id == "136");
        CHECK(!selection.codec_fallback_used);
    }

    SECTION("Container-only fallback") {
        auto selection = select_mode_formats(Mode::video, "webm", "av01", catalog);
        REQUIRE(selection.formats.size() == 1);
        CHECK(selection.formats[0].format.format_id == "248");
        CHECK(selection.codec_fallback_used);

        auto mp4 = select_mode_formats(Mode::video, "mp4", "av01", catalog);
        CHECK(mp4.formats.size() == 2);
        CHECK(mp4.codec_fallback_used);
    }

    SECTION("Synthetic best when nothing matches the container") {
        FormatCollection webm_only;
        webm_only.video = build_labeled_formats({descriptor_from_json(
            tubeq::test::video_format("1", "webm", "vp9", 720, 1000.0))});

        auto selection = select_mode_formats(Mode::video, "mp4", "avc1", webm_only);
        REQUIRE(selection.formats.size() == 1);
        CHECK(selection.formats[0].label == BEST_VIDEO_LABEL);
        CHECK(selection.formats[0].format.synthetic);
        CHECK(selection.formats[0].format.selector == BEST_VIDEO_SELECTOR);
        CHECK(!selection.codec_fallback_used);
    }

    SECTION("Invalid container or codec yields nothing") {
        CHECK(select_mode_formats(Mode::video, "mkv", "avc1", catalog).empty());
        CHECK(select_mode_formats(Mode::video, "mp4", "vp9", catalog).empty());
        CHECK(select_mode_formats(Mode::video, "", "", catalog).empty());
        CHECK(select_mode_formats(Mode::none, "mp4", "avc1", catalog).empty());
    }
}

TEST_CASE("select_mode_formats - audio", "[selector]") {
    SECTION("All audio entries regardless of container") {
        auto selection = select_mode_formats(Mode::audio, "mp3", "",
                                             collection_from_info(sample_info()));
        CHECK(labels_of(selection.formats) == std::vector<std::string>{
            "Audio WEBM 160k (opus)",
            "Audio M4A 129k (mp4a.40.2)",
        });
    }

    SECTION("Synthetic entry for an empty list") {
        auto selection = select_mode_formats(Mode::audio, "m4a", "", FormatCollection{});
        REQUIRE(selection.formats.size() == 1);
        CHECK(selection.formats[0].label == BEST_AUDIO_LABEL);
        CHECK(selection.formats[0].format.is_audio());
        CHECK(selection.formats[0].format.selector == BEST_AUDIO_SELECTOR);
    }
}

TEST_CASE("resolve_format", "[selector]") {
    QueueSettings settings;
    settings.mode = Mode::video;
    settings.container = "mp4";
    settings.codec = "avc1";

    SECTION("Captured label still offered") {
        settings.format_label = "720p 1280x720 MP4 (avc1.4d401f)";
        auto resolved = resolve_format_for_metadata(sample_info(), settings);
        REQUIRE(resolved.has_value());
        CHECK(resolved->format.format_id == "136");
        CHECK(resolved->label == settings.format_label);
        CHECK(resolved->notes.empty());
        CHECK(resolved->title == "Sample Clip");
        CHECK(resolved->container == "mp4");
    }

    SECTION("Missing label falls back to the first entry with a note") {
        settings.format_label = "4320p something";
        auto resolved = resolve_format_for_metadata(sample_info(), settings);
        REQUIRE(resolved.has_value());
        CHECK(resolved->format.format_id == "137");
        REQUIRE(resolved->notes.size() == 1);
        CHECK(resolved->notes[0].find("4320p something") != std::string::npos);
    }

    SECTION("Codec fallback is noted") {
        settings.container = "webm";
        settings.codec = "av01";
        auto resolved = resolve_format_for_metadata(sample_info(), settings);
        REQUIRE(resolved.has_value());
        CHECK(resolved->codec_fallback_used);
        CHECK(resolved->format.format_id == "248");
        CHECK(resolved->notes.size() == 1);
    }

    SECTION("Empty metadata resolves to the synthetic entry") {
        auto resolved = resolve_format_for_metadata(RawInfo::object(), settings);
        REQUIRE(resolved.has_value());
        CHECK(resolved->format.synthetic);
        CHECK(resolved->label == BEST_VIDEO_LABEL);
    }

    SECTION("Playlist metadata resolves against the first entry") {
        auto resolved = resolve_format_for_metadata(tubeq::test::playlist_info(), settings);
        REQUIRE(resolved.has_value());
        CHECK(resolved->is_playlist);
        CHECK(resolved->title == "Some Playlist");
        CHECK(resolved->format.format_id == "137");
    }

    SECTION("Incomplete settings") {
        settings.codec.clear();
        auto resolved = resolve_format_for_metadata(sample_info(), settings);
        REQUIRE(!resolved.has_value());
        CHECK(resolved.error() == Errc::selection_incomplete);

        settings.codec = "avc1";
        settings.mode = Mode::none;
        CHECK(!resolve_format_for_metadata(sample_info(), settings).has_value());
    }
}
