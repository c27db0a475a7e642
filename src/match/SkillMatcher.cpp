#include "match/SkillMatcher.hpp"

#include "match/TextUtil.hpp"

namespace match {

static double clamp01(double x) {
    if (!(x > 0.0)) return 0.0;  // NaN lands here too
    if (x > 1.0) return 1.0;
    return x;
}

static SkillEvidence best_evidence_for(
    const std::string& required,
    const std::set<std::string>& candidate_skills,
    const SkillMatchConfig& cfg
) {
    SkillEvidence ev;
    ev.required = required;

    // 1) Exact match
    if (candidate_skills.find(required) != candidate_skills.end()) {
        ev.type = SkillMatchType::Exact;
        ev.matched = required;
        ev.similarity = 1.0;
        ev.credit = 1.0;
        return ev;
    }

    // 2) Best fuzzy candidate. Set order makes ties resolve to the smallest key.
    for (const auto& have : candidate_skills) {
        const double sim = textutil::similarity(required, have);
        if (sim > ev.similarity || ev.matched.empty()) {
            ev.similarity = sim;
            ev.matched = have;
        }
    }

    if (!ev.matched.empty() && ev.similarity >= cfg.fuzzy_threshold) {
        ev.type = SkillMatchType::Fuzzy;
        ev.credit = clamp01(cfg.partial_credit);
    }
    return ev;
}

SkillMatchResult match_skills(
    const std::set<std::string>& candidate_skills,
    const std::set<std::string>& required_skills,
    const SkillMatchConfig& cfg
) {
    SkillMatchResult res;

    // nothing required: nothing can be missing
    if (required_skills.empty()) {
        res.score = 1.0;
        return res;
    }

    res.evidence.reserve(required_skills.size());

    double sum = 0.0;
    for (const auto& req : required_skills) {
        SkillEvidence ev = best_evidence_for(req, candidate_skills, cfg);
        sum += ev.credit;
        res.evidence.push_back(std::move(ev));
    }

    res.score = clamp01(sum / static_cast<double>(required_skills.size()));
    return res;
}

}  // namespace match
