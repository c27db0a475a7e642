#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "match/Aggregator.hpp"
#include "match/Ranker.hpp"

namespace match {

struct RecommendationsArtifact {
    std::string candidate_id;
    std::string candidate_path;
    std::string internships_path;

    bool filtered = true;  // false for the unfiltered admin query
    RankerConfig ranker_cfg;
    ScoreConfig score_cfg;

    std::vector<Recommendation> recommendations;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

nlohmann::json internship_to_json(const Internship& it);

// {internship, scores:{overall, skill_match, ...}, match_reasons, ...}
nlohmann::json recommendation_to_json(const Recommendation& r);

}  // namespace match
