#include "util/Slugify.hpp"

#include <doctest/doctest.h>

using namespace GB;

TEST_SUITE("util.slugify") {
    TEST_CASE("slugify lowercases and dashes separators") {
        CHECK(slugify("Awesome") == "awesome");
        CHECK(slugify("Latest News") == "latest-news");
        CHECK(slugify("  Latest   News!  ") == "latest-news");
        CHECK(slugify("C#") == "c");
        CHECK(slugify("c") == "c");
        CHECK(slugify("snake_case 2024") == "snake_case-2024");
        CHECK(slugify("#").empty());
        CHECK(slugify("").empty());
    }

    TEST_CASE("slugify keeps non-ASCII text") {
        CHECK(slugify("café") == "café");
        CHECK(slugify("Café Crème") == "café-crème");
        CHECK(slugify("日本") == "日本");
        CHECK(slugify("中文") == "中文");
        CHECK(slugify("日本") != slugify("中文"));
        CHECK(slugify("  über!  ") == "über");
    }

    TEST_CASE("slugify is stable") {
        for (auto const* raw : {"Hello World", "a/b/c", "über", "x--y"}) {
            auto once = slugify(raw);
            CHECK(slugify(once) == once);
        }
    }

    TEST_CASE("split_strip drops empty items") {
        CHECK(split_strip("Latest News,Awesome", ",") == std::vector<std::string>{"Latest News", "Awesome"});
        CHECK(split_strip(" a , , b ,", ",") == std::vector<std::string>{"a", "b"});
        CHECK(split_strip("one", "") == std::vector<std::string>{"one"});
        CHECK(split_strip("a::b", "::") == std::vector<std::string>{"a", "b"});
        CHECK(strip("\t x \n") == "x");
    }
}
