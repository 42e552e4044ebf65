// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <tubeq/core/format_cache.hpp>

using namespace tubeq::core;

namespace {

FormatCollection titled(std::string title) {
    FormatCollection c;
    c.preview_title = std::move(title);
    return c;
}

} // namespace

TEST_CASE("FormatCache basic operations", "[cache]") {
    FormatCache cache{3};

    SECTION("Miss") {
        CHECK(!cache.get("a").has_value());
        CHECK(!cache.touch("a"));
        CHECK(!cache.erase("a"));
    }

    SECTION("Insert and get") {
        cache.insert("a", titled("A"));
        REQUIRE(cache.contains("a"));
        auto hit = cache.get("a");
        REQUIRE(hit.has_value());
        CHECK(hit->preview_title == "A");
    }

    SECTION("Replacing keeps one entry") {
        cache.insert("a", titled("A"));
        cache.insert("a", titled("A2"));
        CHECK(cache.size() == 1);
        CHECK(cache.get("a")->preview_title == "A2");
    }

    SECTION("Returned copies are independent") {
        cache.insert("a", titled("A"));
        auto copy = cache.get("a");
        copy->preview_title = "changed";
        CHECK(cache.get("a")->preview_title == "A");
    }

    SECTION("Erase and clear") {
        cache.insert("a", titled("A"));
        cache.insert("b", titled("B"));
        CHECK(cache.erase("a"));
        CHECK(cache.keys() == std::vector<std::string>{"b"});
        cache.clear();
        CHECK(cache.size() == 0);
    }
}

TEST_CASE("FormatCache LRU eviction", "[cache]") {
    FormatCache cache{3};
    cache.insert("a", titled("A"));
    cache.insert("b", titled("B"));
    cache.insert("c", titled("C"));

    SECTION("Oldest entry is evicted") {
        cache.insert("d", titled("D"));
        CHECK(cache.size() == 3);
        CHECK(!cache.contains("a"));
        CHECK(cache.keys() == std::vector<std::string>{"b", "c", "d"});
    }

    SECTION("get promotes") {
        (void)cache.get("a");
        cache.insert("d", titled("D"));
        CHECK(cache.contains("a"));
        CHECK(!cache.contains("b"));
    }

    SECTION("touch promotes") {
        CHECK(cache.touch("a"));
        CHECK(cache.keys() == std::vector<std::string>{"b", "c", "a"});
    }

    SECTION("Re-insert promotes") {
        cache.insert("a", titled("A"));
        cache.insert("d", titled("D"));
        CHECK(cache.keys() == std::vector<std::string>{"c", "a", "d"});
    }
}

TEST_CASE("FormatCache zero capacity holds one entry", "[cache]") {
    FormatCache cache{0};
    CHECK(cache.capacity() == 1);
    cache.insert("a", titled("A"));
    cache.insert("b", titled("B"));
    CHECK(cache.keys() == std::vector<std::string>{"b"});
}
