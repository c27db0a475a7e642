#include <catch2/catch.hpp>

#include "match/FactorScorers.hpp"

#include "tests/common/fixtures.hpp"

namespace
{
    using namespace match;
    using namespace match::test;
}

TEST_CASE("location scoring policy", "[location]")
{
    Candidate c = MakeCandidate("c", {"python"});
    Internship it = MakeInternship("i", {"python"});

    SECTION("exact match is case-insensitive via normalization")
    {
        CandidateFields f;
        f.id = "c2";
        f.name = "x";
        f.education_level = "Bachelor";
        f.location = "  MUMBAI";
        REQUIRE(location_score(make_candidate(f), it) == Approx(1.0));
    }

    SECTION("rural preference satisfied elsewhere")
    {
        it.location = "nagpur";
        it.rural_friendly = true;
        c.prefers_rural = true;
        REQUIRE(location_score(c, it) == Approx(0.8));
    }

    SECTION("rural-friendly alone is not enough")
    {
        it.location = "nagpur";
        it.rural_friendly = true;
        c.prefers_rural = false;
        REQUIRE(location_score(c, it) == Approx(0.2));
    }

    SECTION("mismatch falls back to the baseline")
    {
        it.location = "delhi";
        REQUIRE(location_score(c, it) == Approx(0.2));
    }
}

TEST_CASE("education scoring policy", "[education]")
{
    const EducationLevel all[] = {
        EducationLevel::Diploma, EducationLevel::Bachelor, EducationLevel::Master, EducationLevel::PhD};

    for (auto have : all) {
        for (auto need : all) {
            const double s = education_score(have, need);
            if (have == need) REQUIRE(s == Approx(1.0));
            else if (have > need) REQUIRE(s == Approx(0.8));
            else REQUIRE(s == Approx(0.0));
        }
    }
}

TEST_CASE("sector scoring is binary", "[sector]")
{
    Candidate c = MakeCandidate("c", {});
    Internship it = MakeInternship("i", {});

    REQUIRE(sector_score(c, it) == Approx(1.0));

    it.sector = "finance";
    REQUIRE(sector_score(c, it) == Approx(0.0));

    c.sector_interests.clear();
    REQUIRE(sector_score(c, it) == Approx(0.0));
}

TEST_CASE("diversity bonus components", "[diversity]")
{
    Candidate c = MakeCandidate("c", {});
    Internship it = MakeInternship("i", {});

    SECTION("no flags, no bonus")
    {
        REQUIRE(diversity_score(c, it) == Approx(0.0));
    }

    SECTION("rural bonus needs a rural-friendly internship")
    {
        c.from_rural_area = true;
        REQUIRE(diversity_score(c, it) == Approx(0.0));
        it.rural_friendly = true;
        REQUIRE(diversity_score(c, it) == Approx(0.4));
    }

    SECTION("category and first-generation bonuses need a diversity-focused internship")
    {
        c.social_category = SocialCategory::SC;
        c.first_generation_graduate = true;
        REQUIRE(diversity_score(c, it) == Approx(0.0));
        it.diversity_focused = true;
        REQUIRE(diversity_score(c, it) == Approx(0.6));
    }

    SECTION("general category earns no category bonus")
    {
        it.diversity_focused = true;
        c.social_category = SocialCategory::General;
        REQUIRE(diversity_score(c, it) == Approx(0.0));
    }

    SECTION("all bonuses together are clamped to 1.0")
    {
        c.from_rural_area = true;
        c.social_category = SocialCategory::ST;
        c.first_generation_graduate = true;
        it.rural_friendly = true;
        it.diversity_focused = true;
        const double s = diversity_score(c, it);
        REQUIRE(s == Approx(1.0));
        REQUIRE(s <= 1.0);
    }
}
