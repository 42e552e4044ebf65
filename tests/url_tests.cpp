// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <tubeq/core/url.hpp>

using namespace tubeq::core;

TEST_CASE("Url::parse - valid URLs", "[url]") {
    SECTION("Watch URL") {
        auto result = Url::parse("https://www.youtube.com/watch?v=abc123");
        REQUIRE(result.has_value());
        auto url = *result;
        CHECK(url.scheme() == "https");
        CHECK(url.host() == "www.youtube.com");
        CHECK(url.path() == "/watch");
        CHECK(url.query() == "v=abc123");
        CHECK(url.is_secure());
    }

    SECTION("Host without path") {
        auto result = Url::parse("https://youtu.be");
        REQUIRE(result.has_value());
        CHECK(result->path() == "/");
        CHECK(result->full() == "https://youtu.be/");
    }

    SECTION("Port and fragment survive a round trip") {
        auto result = Url::parse("http://example.com:8080/v/1?t=10#c");
        REQUIRE(result.has_value());
        CHECK(result->port() == "8080");
        CHECK(result->fragment() == "c");
        CHECK(result->full() == "http://example.com:8080/v/1?t=10#c");
        CHECK(!result->is_secure());
    }
}

TEST_CASE("Url::parse - invalid URLs", "[url]") {
    CHECK(!Url::parse("youtube.com/watch?v=1").has_value());
    CHECK(!Url::parse("").has_value());
    CHECK(!Url::parse("https:///path").has_value());
    CHECK(Url::parse("nope").error() == Errc::invalid_url);
}

TEST_CASE("Url::query_param", "[url]") {
    auto url = Url::parse("https://www.youtube.com/watch?v=abc&list=PL1&empty=&flag");
    REQUIRE(url.has_value());
    CHECK(url->query_param("v") == "abc");
    CHECK(url->query_param("list") == "PL1");
    CHECK(!url->query_param("empty").has_value());
    CHECK(!url->query_param("flag").has_value());
    CHECK(url->query_items().size() == 2);
}

TEST_CASE("strip_url_whitespace", "[url]") {
    CHECK(strip_url_whitespace("  https://youtu.be/\n abc \t") == "https://youtu.be/abc");
    CHECK(strip_url_whitespace("   ").empty());
}

TEST_CASE("Playlist URL detection", "[url]") {
    SECTION("Playlist page") {
        CHECK(is_playlist_url("https://www.youtube.com/playlist?list=PL123"));
        CHECK(!is_mixed_url("https://www.youtube.com/playlist?list=PL123"));
    }

    SECTION("Watch URL with a list id is mixed, not a playlist") {
        const auto url = "https://www.youtube.com/watch?v=abc&list=PL123&index=3";
        CHECK(is_mixed_url(url));
        CHECK(!is_playlist_url(url));
    }

    SECTION("List id without a video id") {
        CHECK(is_playlist_url("https://www.youtube.com/watch?list=PL123"));
    }

    SECTION("Plain video") {
        CHECK(!is_playlist_url("https://www.youtube.com/watch?v=abc"));
        CHECK(!is_mixed_url("https://www.youtube.com/watch?v=abc"));
        CHECK(!is_playlist_url("not a url"));
    }
}

TEST_CASE("Mixed URL rewriting", "[url]") {
    const auto mixed = "https://www.youtube.com/watch?v=abc&list=PL123&index=3&t=9";

    SECTION("Strip the playlist part") {
        CHECK(strip_list_param(mixed) == "https://www.youtube.com/watch?v=abc&t=9");
    }

    SECTION("Rewrite to the playlist page") {
        CHECK(to_playlist_url(mixed) == "https://www.youtube.com/playlist?list=PL123");
    }

    SECTION("Unparsable input is returned unchanged") {
        CHECK(strip_list_param("garbage") == "garbage");
        CHECK(to_playlist_url("https://youtu.be/abc") == "https://youtu.be/abc");
    }
}
