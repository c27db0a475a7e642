#include "match/Ranker.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

#include "match/CapacityTracker.hpp"
#include "match/Errors.hpp"

namespace match {

static int remaining_for(const Internship& it, const CapacityTracker* tracker) {
    if (tracker) {
        if (auto r = tracker->remaining(it.id)) return *r;
    }
    return it.capacity;
}

static std::vector<Recommendation> rank_impl(
    const Candidate& candidate,
    const std::vector<Internship>& internships,
    const ScoreConfig& cfg,
    const RankerConfig& rcfg,
    const CapacityTracker* tracker,
    bool exclude_exhausted
) {
    validate_request(candidate, internships, cfg, rcfg);

    std::vector<Recommendation> recs;
    recs.reserve(internships.size());

    for (const auto& it : internships) {
        const int remaining = remaining_for(it, tracker);
        if (exclude_exhausted && remaining <= 0) continue;

        PairScore ps = score_pair(candidate, it, cfg);

        Recommendation r;
        r.candidate_id = candidate.id;
        r.internship = it;
        r.overall = ps.overall;
        r.breakdown = ps.breakdown;
        r.reasons = std::move(ps.reasons);
        r.skill_evidence = std::move(ps.skill_evidence);
        r.remaining_capacity = remaining;
        recs.push_back(std::move(r));
    }

    std::sort(recs.begin(), recs.end(),
              [](const Recommendation& a, const Recommendation& b) {
                  if (a.overall != b.overall) return a.overall > b.overall;
                  if (a.breakdown.skill_match != b.breakdown.skill_match) {
                      return a.breakdown.skill_match > b.breakdown.skill_match;
                  }
                  return a.internship.id < b.internship.id;
              });

    if (recs.size() > static_cast<size_t>(rcfg.top_k)) recs.resize(static_cast<size_t>(rcfg.top_k));

    for (size_t i = 0; i < recs.size(); ++i) recs[i].rank = static_cast<int>(i + 1);
    return recs;
}

void validate_request(
    const Candidate& candidate,
    const std::vector<Internship>& internships,
    const ScoreConfig& cfg,
    const RankerConfig& rcfg
) {
    if (rcfg.top_k < 1) throw ValidationError("top_k must be >= 1");

    validate_weights(cfg.weights);

    if (!std::isfinite(cfg.skill.fuzzy_threshold) || cfg.skill.fuzzy_threshold < 0.0 || cfg.skill.fuzzy_threshold > 1.0) {
        throw ValidationError("skill.fuzzy_threshold must be in [0,1]");
    }
    if (!std::isfinite(cfg.skill.partial_credit) || cfg.skill.partial_credit < 0.0 || cfg.skill.partial_credit > 1.0) {
        throw ValidationError("skill.partial_credit must be in [0,1]");
    }

    validate_candidate(candidate);

    std::unordered_set<std::string> seen;
    seen.reserve(internships.size() * 2 + 8);
    for (const auto& it : internships) {
        validate_internship(it);
        if (!seen.insert(it.id).second) {
            throw ValidationError("duplicate internship id: " + it.id);
        }
    }
}

std::vector<Recommendation> rank(
    const Candidate& candidate,
    const std::vector<Internship>& internships,
    const ScoreConfig& cfg,
    const RankerConfig& rcfg,
    const CapacityTracker* tracker
) {
    return rank_impl(candidate, internships, cfg, rcfg, tracker, true);
}

std::vector<Recommendation> rank_unfiltered(
    const Candidate& candidate,
    const std::vector<Internship>& internships,
    const ScoreConfig& cfg,
    const RankerConfig& rcfg,
    const CapacityTracker* tracker
) {
    return rank_impl(candidate, internships, cfg, rcfg, tracker, false);
}

}  // namespace match
