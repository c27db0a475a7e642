#include <catch2/catch.hpp>

#include "match/TextUtil.hpp"

TEST_CASE("normalize_key trims, lowercases and collapses whitespace", "[text]")
{
    REQUIRE(textutil::normalize_key("  Python ") == "python");
    REQUIRE(textutil::normalize_key("Machine \t  Learning") == "machine learning");
    REQUIRE(textutil::normalize_key("C++") == "c++");
    REQUIRE(textutil::normalize_key("   ").empty());
    REQUIRE(textutil::normalize_key("").empty());
}

TEST_CASE("normalize_set drops empties and duplicates", "[text]")
{
    const auto s = textutil::normalize_set({"SQL", " sql ", "", "  ", "Python"});
    REQUIRE(s.size() == 2);
    REQUIRE(s.count("sql") == 1);
    REQUIRE(s.count("python") == 1);
}

TEST_CASE("edit_distance is Levenshtein", "[text][fuzzy]")
{
    REQUIRE(textutil::edit_distance("kitten", "sitting") == 3);
    REQUIRE(textutil::edit_distance("", "abc") == 3);
    REQUIRE(textutil::edit_distance("abc", "") == 3);
    REQUIRE(textutil::edit_distance("same", "same") == 0);
    REQUIRE(textutil::edit_distance("flaw", "lawn") == 2);
}

TEST_CASE("similarity is normalized by the longer string", "[text][fuzzy]")
{
    REQUIRE(textutil::similarity("python", "python") == Approx(1.0));
    REQUIRE(textutil::similarity("", "") == Approx(1.0));
    REQUIRE(textutil::similarity("abc", "") == Approx(0.0));
    REQUIRE(textutil::similarity("javascript", "java script") == Approx(1.0 - 1.0 / 11.0));
    REQUIRE(textutil::similarity("react", "python") < 0.5);

    // symmetric
    REQUIRE(textutil::similarity("kitten", "sitting") == Approx(textutil::similarity("sitting", "kitten")));
}
