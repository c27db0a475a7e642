#include "match/Analytics.hpp"

#include <cmath>

#include "match/CapacityTracker.hpp"

namespace match {

bool is_diversity_candidate(const Candidate& c) {
    return c.from_rural_area || is_reserved_category(c.social_category) || c.first_generation_graduate;
}

AnalyticsSummary summarize(
    const std::vector<Candidate>& candidates,
    const std::vector<Internship>& internships,
    const CapacityTracker* tracker
) {
    AnalyticsSummary s;
    s.total_candidates = static_cast<int>(candidates.size());
    s.total_internships = static_cast<int>(internships.size());

    int diverse = 0;
    for (const auto& c : candidates) {
        if (is_diversity_candidate(c)) ++diverse;
        s.location_distribution[c.location]++;
        s.education_distribution[to_string(c.education_level)]++;
    }

    if (s.total_candidates > 0) {
        const double pct = 100.0 * static_cast<double>(diverse) / static_cast<double>(s.total_candidates);
        s.diversity_rate = std::round(pct * 10.0) / 10.0;
    }

    for (const auto& it : internships) {
        s.sector_distribution[it.sector]++;
        s.total_capacity += it.capacity;

        int left = it.capacity;
        if (tracker) {
            if (auto r = tracker->remaining(it.id)) left = *r;
        }
        s.remaining_capacity += left;
    }

    return s;
}

}  // namespace match
