#pragma once

#include <string>
#include <vector>

#include "match/Aggregator.hpp"
#include "match/Models.hpp"

namespace match {

class CapacityTracker;

struct RankerConfig {
    int top_k = 5;
};

struct Recommendation {
    std::string candidate_id;
    Internship internship;

    double overall = 0.0;
    ScoreBreakdown breakdown;
    std::vector<std::string> reasons;
    std::vector<SkillEvidence> skill_evidence;

    int rank = 0;                // 1..K
    int remaining_capacity = 0;  // at ranking time
};

// Throws ValidationError for a malformed candidate/internship, duplicate internship ids,
// top_k < 1 or invalid weights. Runs before anything is scored.
void validate_request(
    const Candidate& candidate,
    const std::vector<Internship>& internships,
    const ScoreConfig& cfg,
    const RankerConfig& rcfg
);

// Candidate-facing top-K. Internships with no remaining capacity are excluded.
// Remaining capacity comes from the tracker when it tracks the id, else from Internship::capacity.
std::vector<Recommendation> rank(
    const Candidate& candidate,
    const std::vector<Internship>& internships,
    const ScoreConfig& cfg = {},
    const RankerConfig& rcfg = {},
    const CapacityTracker* tracker = nullptr
);

// Admin / analytics variant: same ordering and truncation, zero-capacity internships kept.
std::vector<Recommendation> rank_unfiltered(
    const Candidate& candidate,
    const std::vector<Internship>& internships,
    const ScoreConfig& cfg = {},
    const RankerConfig& rcfg = {},
    const CapacityTracker* tracker = nullptr
);

}  // namespace match
