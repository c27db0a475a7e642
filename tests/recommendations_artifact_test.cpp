#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>

#include "match/RecommendationsArtifact.hpp"
#include "match/SampleData.hpp"

namespace
{
    using namespace match;
    namespace fs = std::filesystem;

    RecommendationsArtifact SampleArtifact()
    {
        const auto candidates = sample_candidates();
        RecommendationsArtifact a;
        a.candidate_id = candidates[1].id;
        a.ranker_cfg.top_k = 3;
        a.recommendations = rank(candidates[1], sample_internships(), a.score_cfg, a.ranker_cfg);
        return a;
    }
}

TEST_CASE("artifact has the response shape", "[artifact]")
{
    const RecommendationsArtifact a = SampleArtifact();
    const nlohmann::json j = a.to_json();

    REQUIRE(j.at("candidate_id") == "c2");
    REQUIRE(j.at("top_k") == 3);
    REQUIRE(j.at("filtered") == true);
    REQUIRE(j.at("weights").at("skill").get<double>() == Approx(0.30));

    const auto& recs = j.at("recommendations");
    REQUIRE(recs.size() == 3);

    const auto& first = recs.at(0);
    REQUIRE(first.at("rank") == 1);
    REQUIRE(first.contains("internship"));
    REQUIRE(first.at("internship").contains("title"));
    REQUIRE(first.at("match_reasons").is_array());

    const auto& scores = first.at("scores");
    for (const char* key : {"overall", "skill_match", "location_match", "education_match", "sector_match", "diversity_bonus"}) {
        REQUIRE(scores.contains(key));
        const double v = scores.at(key).get<double>();
        REQUIRE(v >= 0.0);
        REQUIRE(v <= 1.0);
    }
}

TEST_CASE("scores are rounded to three decimals in JSON only", "[artifact]")
{
    Recommendation r;
    r.rank = 1;
    r.internship.id = "x";
    r.internship.title = "X";
    r.overall = 0.123456;
    r.breakdown.skill_match = 2.0 / 3.0;

    const nlohmann::json j = recommendation_to_json(r);
    REQUIRE(j.at("scores").at("overall").get<double>() == Approx(0.123));
    REQUIRE(j.at("scores").at("skill_match").get<double>() == Approx(0.667));
    REQUIRE(r.overall == Approx(0.123456));
}

TEST_CASE("write_to creates the output directory", "[artifact][files]")
{
    const fs::path dir = fs::temp_directory_path() / "internmatch_artifact_test" / "nested";
    fs::remove_all(dir.parent_path());

    const fs::path out = dir / "recommendations.json";
    SampleArtifact().write_to(out);

    REQUIRE(fs::exists(out));
    std::ifstream in(out);
    nlohmann::json j;
    in >> j;
    REQUIRE(j.at("recommendations").size() == 3);
}
