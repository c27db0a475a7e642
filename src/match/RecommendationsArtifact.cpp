#include "match/RecommendationsArtifact.hpp"

#include <cmath>
#include <fstream>
#include <stdexcept>

namespace match {

static double round3(double x) {
    return std::round(x * 1000.0) / 1000.0;
}

static const char* skill_match_type_str(SkillMatchType t) {
    switch (t) {
        case SkillMatchType::Exact: return "exact";
        case SkillMatchType::Fuzzy: return "fuzzy";
        case SkillMatchType::Missing: return "missing";
        default: return "unknown";
    }
}

nlohmann::json internship_to_json(const Internship& it) {
    nlohmann::json j;
    j["id"] = it.id;
    j["title"] = it.title;
    j["company"] = it.company;
    j["sector"] = it.sector;
    j["location"] = it.location;
    j["skills_required"] = it.skills_required;
    j["education_level"] = to_string(it.education_level);
    j["capacity"] = it.capacity;
    j["duration_months"] = it.duration_months;
    j["stipend"] = it.stipend;
    j["rural_friendly"] = it.rural_friendly;
    j["diversity_focused"] = it.diversity_focused;
    return j;
}

nlohmann::json recommendation_to_json(const Recommendation& r) {
    nlohmann::json j;

    j["rank"] = r.rank;
    j["internship"] = internship_to_json(r.internship);

    j["scores"] = {
        {"overall", round3(r.overall)},
        {"skill_match", round3(r.breakdown.skill_match)},
        {"location_match", round3(r.breakdown.location_match)},
        {"education_match", round3(r.breakdown.education_match)},
        {"sector_match", round3(r.breakdown.sector_match)},
        {"diversity_bonus", round3(r.breakdown.diversity_bonus)},
    };

    j["match_reasons"] = r.reasons;

    nlohmann::json evidence = nlohmann::json::array();
    for (const auto& ev : r.skill_evidence) {
        evidence.push_back({
            {"type", skill_match_type_str(ev.type)},
            {"required", ev.required},
            {"matched", ev.matched},
            {"similarity", round3(ev.similarity)},
            {"credit", ev.credit}
        });
    }
    j["skill_evidence"] = evidence;

    j["remaining_capacity"] = r.remaining_capacity;
    return j;
}

nlohmann::json RecommendationsArtifact::to_json() const {
    nlohmann::json j;

    j["candidate_id"] = candidate_id;
    j["candidate_path"] = candidate_path;
    j["internships_path"] = internships_path;
    j["filtered"] = filtered;
    j["top_k"] = ranker_cfg.top_k;

    j["weights"] = {
        {"skill", score_cfg.weights.skill},
        {"location", score_cfg.weights.location},
        {"education", score_cfg.weights.education},
        {"sector", score_cfg.weights.sector},
        {"diversity", score_cfg.weights.diversity}
    };

    j["skill_config"] = {
        {"partial_credit", score_cfg.skill.partial_credit},
        {"fuzzy_threshold", score_cfg.skill.fuzzy_threshold}
    };

    nlohmann::json recs = nlohmann::json::array();
    for (const auto& r : recommendations) recs.push_back(recommendation_to_json(r));
    j["recommendations"] = recs;

    return j;
}

void RecommendationsArtifact::write_to(const std::filesystem::path& out_path) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << to_json().dump(2) << "\n";
}

}  // namespace match
