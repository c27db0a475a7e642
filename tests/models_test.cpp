#include <catch2/catch.hpp>

#include "match/Errors.hpp"
#include "match/Models.hpp"

namespace
{
    using namespace match;

    CandidateFields BaseCandidate()
    {
        CandidateFields f;
        f.id = "c1";
        f.name = "Asha";
        f.education_level = "Master";
        f.skills = {" Python ", "Machine   Learning", "python"};
        f.location = "  Pune ";
        f.sector_interests = {"Data Science", ""};
        f.social_category = "obc";
        return f;
    }

    InternshipFields BaseInternship()
    {
        InternshipFields f;
        f.id = "i1";
        f.title = "Analyst Intern";
        f.sector = "Finance";
        f.location = "Chennai";
        f.skills_required = {"Excel"};
        f.education_level = "bachelor";
        f.capacity = 2;
        return f;
    }
}

TEST_CASE("make_candidate normalizes sets and parses enumerations", "[models]")
{
    const Candidate c = make_candidate(BaseCandidate());

    REQUIRE(c.skills == std::set<std::string>{"machine learning", "python"});
    REQUIRE(c.sector_interests == std::set<std::string>{"data science"});
    REQUIRE(c.location == "pune");
    REQUIRE(c.education_level == EducationLevel::Master);
    REQUIRE(c.social_category == SocialCategory::OBC);
    REQUIRE_NOTHROW(validate_candidate(c));
}

TEST_CASE("make_candidate rejects malformed input", "[models][validation]")
{
    SECTION("unknown education level")
    {
        auto f = BaseCandidate();
        f.education_level = "Masters";
        REQUIRE_THROWS_AS(make_candidate(f), ValidationError);
    }

    SECTION("unknown social category")
    {
        auto f = BaseCandidate();
        f.social_category = "EWS";
        REQUIRE_THROWS_AS(make_candidate(f), ValidationError);
    }

    SECTION("missing id or name")
    {
        auto f = BaseCandidate();
        f.id.clear();
        REQUIRE_THROWS_AS(make_candidate(f), ValidationError);

        auto g = BaseCandidate();
        g.name.clear();
        REQUIRE_THROWS_AS(make_candidate(g), ValidationError);
    }

    SECTION("empty skill and sector lists are allowed")
    {
        auto f = BaseCandidate();
        f.skills.clear();
        f.sector_interests.clear();
        const Candidate c = make_candidate(f);
        REQUIRE(c.skills.empty());
        REQUIRE(c.sector_interests.empty());
    }
}

TEST_CASE("social category parsing", "[models]")
{
    REQUIRE(parse_social_category("") == SocialCategory::General);
    REQUIRE(parse_social_category("General") == SocialCategory::General);
    REQUIRE(parse_social_category("SC") == SocialCategory::SC);
    REQUIRE(parse_social_category("st") == SocialCategory::ST);
    REQUIRE(is_reserved_category(SocialCategory::OBC));
    REQUIRE_FALSE(is_reserved_category(SocialCategory::General));
}

TEST_CASE("education hierarchy is totally ordered", "[models]")
{
    REQUIRE(EducationLevel::Diploma < EducationLevel::Bachelor);
    REQUIRE(EducationLevel::Bachelor < EducationLevel::Master);
    REQUIRE(EducationLevel::Master < EducationLevel::PhD);
    REQUIRE(parse_education_level(" PhD ") == EducationLevel::PhD);
    REQUIRE(std::string(to_string(EducationLevel::Diploma)) == "Diploma");
}

TEST_CASE("make_internship validates capacity and normalizes", "[models][validation]")
{
    const Internship it = make_internship(BaseInternship());
    REQUIRE(it.sector == "finance");
    REQUIRE(it.location == "chennai");
    REQUIRE(it.skills_required == std::set<std::string>{"excel"});
    REQUIRE(it.education_level == EducationLevel::Bachelor);

    auto f = BaseInternship();
    f.capacity = -1;
    REQUIRE_THROWS_AS(make_internship(f), ValidationError);

    auto g = BaseInternship();
    g.title.clear();
    REQUIRE_THROWS_AS(make_internship(g), ValidationError);

    auto h = BaseInternship();
    h.education_level = "High School";
    REQUIRE_THROWS_AS(make_internship(h), ValidationError);

    auto blank = BaseInternship();
    blank.location = "   ";
    REQUIRE_THROWS_AS(make_internship(blank), ValidationError);

    Internship built = make_internship(BaseInternship());
    built.location.clear();
    REQUIRE_THROWS_AS(validate_internship(built), ValidationError);
}

TEST_CASE("validate_* rejects hand-built records that skipped normalization", "[models][validation]")
{
    Candidate c = make_candidate(BaseCandidate());
    c.skills.insert("Rust");
    REQUIRE_THROWS_AS(validate_candidate(c), ValidationError);

    Internship it = make_internship(BaseInternship());
    it.location = "Chennai ";
    REQUIRE_THROWS_AS(validate_internship(it), ValidationError);

    Internship neg = make_internship(BaseInternship());
    neg.capacity = -3;
    REQUIRE_THROWS_AS(validate_internship(neg), ValidationError);
}
