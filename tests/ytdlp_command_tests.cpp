// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <tubeq/backend/ytdlp_command.hpp>
#include <algorithm>

using namespace tubeq::backend;
using namespace tubeq::core;
using Catch::Approx;

namespace {

DownloadRequest video_request() {
    DownloadRequest r;
    r.url = "https://www.youtube.com/watch?v=aaa";
    r.output_dir = "/tmp/out";
    r.mode = Mode::video;
    r.container = "mp4";
    r.codec = "avc1";
    r.format.format_id = "137";
    r.format.ext = "mp4";
    r.format.vcodec = "avc1.640028";
    r.format.acodec = "none";
    return r;
}

bool has_arg(const std::vector<std::string>& args, std::string_view arg) {
    return std::ranges::find(args, arg) != args.end();
}

// Value following `flag`, empty when absent
std::string arg_after(const std::vector<std::string>& args, std::string_view flag) {
    auto it = std::ranges::find(args, flag);
    if (it == args.end() || std::next(it) == args.end()) return {};
    return *std::next(it);
}

} // namespace

TEST_CASE("metadata_arguments", "[ytdlp]") {
    auto args = metadata_arguments("https://youtu.be/x");
    CHECK(args.front() == "-J");
    CHECK(arg_after(args, "--playlist-items") == "1");
    CHECK(has_arg(args, "--skip-download"));
    CHECK(args.back() == "https://youtu.be/x");
    CHECK(args[args.size() - 2] == "--");
}

TEST_CASE("format_directive", "[ytdlp]") {
    auto r = video_request();

    SECTION("Video-only stream gets best audio merged in") {
        CHECK(format_directive(r) == "137+bestaudio/best");
    }

    SECTION("Audio language narrows the merge") {
        r.audio_language = "de";
        CHECK(format_directive(r) == "137+bestaudio[language=de]/137+bestaudio/best");
    }

    SECTION("Muxed stream is used as is") {
        r.format.acodec = "mp4a.40.2";
        CHECK(format_directive(r) == "137");
    }

    SECTION("Synthetic entries pass their selector") {
        r.format = MediaFormatDescriptor::best_video();
        CHECK(format_directive(r) == "bestvideo+bestaudio/best");
        r.audio_language = "en";
        CHECK(format_directive(r) == "bestvideo+bestaudio[language=en]/bestvideo+bestaudio/best");

        r.format = MediaFormatDescriptor::best_audio();
        CHECK(format_directive(r) == "bestaudio[language=en]/bestaudio/best");
    }

    SECTION("Audio-only stream") {
        r.format.vcodec = "none";
        r.format.acodec = "opus";
        r.format.format_id = "251";
        r.audio_language = "en";
        CHECK(format_directive(r) == "251");
    }
}

TEST_CASE("output_template", "[ytdlp]") {
    auto r = video_request();
    CHECK(output_template(r) == DEFAULT_OUTPUT_TEMPLATE);

    r.custom_filename = "My Clip";
    CHECK(output_template(r) == "My Clip.%(ext)s");

    r.playlist_enabled = true;
    CHECK(output_template(r) == DEFAULT_OUTPUT_TEMPLATE);
}

TEST_CASE("download_arguments", "[ytdlp]") {
    auto r = video_request();

    SECTION("Video to mp4") {
        auto args = download_arguments(r);
        CHECK(args[0] == "-f");
        CHECK(args[1] == "137+bestaudio/best");
        CHECK(arg_after(args, "-P") == "/tmp/out");
        CHECK(arg_after(args, "-o") == "%(title)s.%(ext)s");
        CHECK(arg_after(args, "--merge-output-format") == "mp4");
        CHECK(arg_after(args, "--recode-video") == "mp4");
        CHECK(arg_after(args, "--postprocessor-args") == FASTSTART_ARGS);
        CHECK(has_arg(args, "--no-playlist"));
        CHECK(!has_arg(args, "--write-subs"));
        CHECK(arg_after(args, "--socket-timeout") == "20");
        CHECK(arg_after(args, "--retries") == "1");
        CHECK(arg_after(args, "--retry-sleep") == "1.5");
        CHECK(has_arg(args, "--no-simulate"));
        CHECK(arg_after(args, "--progress-template").starts_with("download:[tubeq-progress] "));
        CHECK(arg_after(args, "--print").starts_with("before_dl:[tubeq-item] "));
        CHECK(args.back() == r.url);
    }

    SECTION("Webm stays webm unless conversion is asked for") {
        r.container = "webm";
        auto args = download_arguments(r);
        CHECK(arg_after(args, "--merge-output-format") == "webm");
        CHECK(!has_arg(args, "--recode-video"));

        r.convert_to_mp4 = true;
        args = download_arguments(r);
        CHECK(arg_after(args, "--merge-output-format") == "mp4");
        CHECK(arg_after(args, "--recode-video") == "mp4");
    }

    SECTION("Audio extraction") {
        r.mode = Mode::audio;
        r.container = "mp3";
        r.format = MediaFormatDescriptor::best_audio();
        auto args = download_arguments(r);
        CHECK(has_arg(args, "-x"));
        CHECK(arg_after(args, "--audio-format") == "mp3");
        CHECK(!has_arg(args, "--merge-output-format"));

        r.container = "ogg";
        CHECK(arg_after(download_arguments(r), "--audio-format") == "m4a");
    }

    SECTION("Playlist range") {
        r.playlist_enabled = true;
        r.playlist_items = "1-3,7";
        auto args = download_arguments(r);
        CHECK(has_arg(args, "--yes-playlist"));
        CHECK(arg_after(args, "--playlist-items") == "1-3,7");
        CHECK(!has_arg(args, "--no-playlist"));
    }

    SECTION("Subtitles") {
        r.write_subtitles = true;
        r.embed_subtitles = true;
        r.subtitle_languages = {"en", "de"};
        auto args = download_arguments(r);
        CHECK(has_arg(args, "--write-subs"));
        CHECK(arg_after(args, "--sub-langs") == "en,de");
        CHECK(has_arg(args, "--embed-subs"));
    }

    SECTION("Network policy") {
        r.network = {45, 3, 2.0};
        auto args = download_arguments(r);
        CHECK(arg_after(args, "--socket-timeout") == "45");
        CHECK(arg_after(args, "--retries") == "3");
        CHECK(arg_after(args, "--retry-sleep") == "2");
    }
}

TEST_CASE("parse_output_line - progress", "[ytdlp]") {
    const PlaylistRangeSet none;

    SECTION("Downloading with a known total") {
        auto event = parse_output_line("[tubeq-progress] downloading 524288 1048576 NA 1048576 65\r\n", none);
        REQUIRE(event.has_value());
        const auto* d = std::get_if<Downloading>(&*event);
        REQUIRE(d != nullptr);
        REQUIRE(d->percent.has_value());
        CHECK(*d->percent == Approx(50.0));
        CHECK(d->speed == "1.00 MiB/s");
        CHECK(d->eta == "1:05");
    }

    SECTION("Estimated total is used when the exact one is missing") {
        auto event = parse_output_line("[tubeq-progress] downloading 250 NA 1000 NA NA", none);
        REQUIRE(event.has_value());
        const auto& d = std::get<Downloading>(*event);
        CHECK(*d.percent == Approx(25.0));
        CHECK(d.speed == UNKNOWN_VALUE);
        CHECK(d.eta == UNKNOWN_VALUE);
    }

    SECTION("Unknown size leaves the percentage empty") {
        auto event = parse_output_line("[tubeq-progress] downloading 250 NA NA 10 NA", none);
        REQUIRE(event.has_value());
        CHECK(!std::get<Downloading>(*event).percent.has_value());
    }

    SECTION("Finished") {
        auto event = parse_output_line("[tubeq-progress] finished 1000 1000 NA NA NA", none);
        REQUIRE(event.has_value());
        CHECK(std::holds_alternative<Finished>(*event));
    }

    SECTION("Other statuses and plain output are ignored") {
        CHECK(!parse_output_line("[tubeq-progress] error 1 2 3 4 5", none).has_value());
        CHECK(!parse_output_line("[youtube] aaa: Downloading webpage", none).has_value());
        CHECK(!parse_output_line("", none).has_value());
    }
}

TEST_CASE("parse_output_line - playlist items", "[ytdlp]") {
    SECTION("Raw index with the extractor's total") {
        auto event = parse_output_line("[tubeq-item] 3 10 Third Video", PlaylistRangeSet{});
        REQUIRE(event.has_value());
        CHECK(std::get<ItemStarted>(*event).label == "3 of 10: Third Video");
    }

    SECTION("Index mapped through the selected ranges") {
        auto ranges = PlaylistRangeSet::parse("1-3,7,10-11");
        auto event = parse_output_line("[tubeq-item] 7 40 Seventh", ranges);
        REQUIRE(event.has_value());
        CHECK(std::get<ItemStarted>(*event).label == "4 of 6: Seventh");
    }

    SECTION("Missing title") {
        auto event = parse_output_line("[tubeq-item] 2 NA NA", PlaylistRangeSet{});
        REQUIRE(event.has_value());
        CHECK(std::get<ItemStarted>(*event).label == "2");
    }

    SECTION("Absurd indexes saturate") {
        auto event = parse_output_line("[tubeq-item] 1e300 1e300 Huge", PlaylistRangeSet{});
        REQUIRE(event.has_value());
        CHECK(std::get<ItemStarted>(*event).label
              == "18446744073709551615 of 18446744073709551615: Huge");
    }

    SECTION("Single videos report no index") {
        CHECK(!parse_output_line("[tubeq-item] NA NA Some Video", PlaylistRangeSet{}).has_value());
        CHECK(!parse_output_line("[tubeq-item] 0 5 Zero", PlaylistRangeSet{}).has_value());
    }
}
