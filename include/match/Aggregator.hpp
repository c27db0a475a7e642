#pragma once

#include <string>
#include <vector>

#include "match/Models.hpp"
#include "match/SkillMatcher.hpp"

namespace match {

struct WeightConfig {
    double skill = 0.30;
    double location = 0.20;
    double education = 0.20;
    double sector = 0.15;
    double diversity = 0.15;

    double sum() const { return skill + location + education + sector + diversity; }
};

constexpr double kWeightSumTolerance = 1e-6;

struct ScoreConfig {
    WeightConfig weights;
    SkillMatchConfig skill;
};

struct ScoreBreakdown {
    double skill_match = 0.0;
    double location_match = 0.0;
    double education_match = 0.0;
    double sector_match = 0.0;
    double diversity_bonus = 0.0;
};

struct PairScore {
    double overall = 0.0;
    ScoreBreakdown breakdown;
    std::vector<std::string> reasons;
    std::vector<SkillEvidence> skill_evidence;
};

// Throws ValidationError if a weight is negative / non-finite or the sum is not 1.0.
void validate_weights(const WeightConfig& w);

// Scale five non-negative raw weights of any scale (e.g. 30/20/20/15/15) so they sum to 1.0.
WeightConfig normalize_weights(double skill, double location, double education, double sector, double diversity);

// Weighted sum of clamped sub-scores, clamped to [0,1]. Weights are not re-validated here.
double combine(const ScoreBreakdown& b, const WeightConfig& w);

// Threshold rules in fixed order: skill, location, education, sector, diversity.
std::vector<std::string> match_reasons(const ScoreBreakdown& b);

// Runs all five scorers for one (candidate, internship) pair.
PairScore score_pair(const Candidate& c, const Internship& it, const ScoreConfig& cfg = {});

}  // namespace match
