#pragma once

#include <map>
#include <string>
#include <vector>

#include "match/Models.hpp"

namespace match {

class CapacityTracker;

struct AnalyticsSummary {
    int total_candidates = 0;
    int total_internships = 0;

    // % of candidates who are rural, in a reserved category, or first-generation (1 decimal)
    double diversity_rate = 0.0;

    std::map<std::string, int> sector_distribution;     // over internships
    std::map<std::string, int> location_distribution;   // over candidates
    std::map<std::string, int> education_distribution;  // over candidates

    int total_capacity = 0;      // initial capacity from the records
    int remaining_capacity = 0;  // from the tracker when given, else the records
};

bool is_diversity_candidate(const Candidate& c);

AnalyticsSummary summarize(
    const std::vector<Candidate>& candidates,
    const std::vector<Internship>& internships,
    const CapacityTracker* tracker = nullptr
);

}  // namespace match
