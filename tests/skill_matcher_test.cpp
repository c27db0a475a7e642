#include <catch2/catch.hpp>

#include "match/SkillMatcher.hpp"

namespace
{
    using namespace match;
    using Skills = std::set<std::string>;
}

TEST_CASE("empty requirement is a vacuous match", "[skill]")
{
    REQUIRE(skill_match_score(Skills{"python"}, Skills{}) == Approx(1.0));
    REQUIRE(skill_match_score(Skills{}, Skills{}) == Approx(1.0));
    REQUIRE(match_skills(Skills{}, Skills{}).evidence.empty());
}

TEST_CASE("identical skill sets score 1.0", "[skill]")
{
    const Skills s{"python", "machine learning", "sql"};
    REQUIRE(skill_match_score(s, s) == Approx(1.0));
}

TEST_CASE("python/javascript against python/react averages to 0.5", "[skill]")
{
    const auto res = match_skills(Skills{"python", "javascript"}, Skills{"python", "react"});
    REQUIRE(res.score == Approx(0.5));

    REQUIRE(res.evidence.size() == 2);
    // evidence follows required-skill order (sorted set)
    REQUIRE(res.evidence[0].required == "python");
    REQUIRE(res.evidence[0].type == SkillMatchType::Exact);
    REQUIRE(res.evidence[0].credit == Approx(1.0));
    REQUIRE(res.evidence[1].required == "react");
    REQUIRE(res.evidence[1].type == SkillMatchType::Missing);
    REQUIRE(res.evidence[1].credit == Approx(0.0));
}

TEST_CASE("near-miss spellings earn partial credit", "[skill][fuzzy]")
{
    SECTION("similar enough")
    {
        const auto res = match_skills(Skills{"java script"}, Skills{"javascript"});
        REQUIRE(res.score == Approx(0.5));
        REQUIRE(res.evidence[0].type == SkillMatchType::Fuzzy);
        REQUIRE(res.evidence[0].matched == "java script");
    }

    SECTION("below threshold")
    {
        const auto res = match_skills(Skills{"reactjs"}, Skills{"react"});
        REQUIRE(res.score == Approx(0.0));
        REQUIRE(res.evidence[0].type == SkillMatchType::Missing);
        REQUIRE(res.evidence[0].matched == "reactjs");
    }

    SECTION("threshold and credit are configurable")
    {
        SkillMatchConfig cfg;
        cfg.fuzzy_threshold = 0.7;
        cfg.partial_credit = 0.25;
        REQUIRE(skill_match_score(Skills{"reactjs"}, Skills{"react"}, cfg) == Approx(0.25));
    }

    SECTION("exact beats fuzzy")
    {
        const auto res = match_skills(Skills{"sql", "sqll"}, Skills{"sql"});
        REQUIRE(res.score == Approx(1.0));
        REQUIRE(res.evidence[0].type == SkillMatchType::Exact);
    }
}

TEST_CASE("candidate without skills scores zero against a requirement", "[skill]")
{
    const auto res = match_skills(Skills{}, Skills{"excel", "accounting"});
    REQUIRE(res.score == Approx(0.0));
    REQUIRE(res.evidence.size() == 2);
    REQUIRE(res.evidence[0].matched.empty());
}

TEST_CASE("mixed exact, fuzzy and missing are averaged", "[skill]")
{
    // excel exact (1.0), power bi ~ powerbi fuzzy (0.5), accounting missing (0.0)
    const auto score = skill_match_score(Skills{"excel", "power bi"}, Skills{"excel", "powerbi", "accounting"});
    REQUIRE(score == Approx(0.5));
}
