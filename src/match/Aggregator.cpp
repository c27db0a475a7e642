#include "match/Aggregator.hpp"

#include <cmath>
#include <sstream>

#include "match/Errors.hpp"
#include "match/FactorScorers.hpp"

namespace match {

static double clamp01(double x) {
    if (!(x > 0.0)) return 0.0;  // NaN lands here too
    if (x > 1.0) return 1.0;
    return x;
}

static void require_weight(double v, const char* name) {
    if (!std::isfinite(v) || v < 0.0) {
        std::ostringstream oss;
        oss << "weight '" << name << "' must be a non-negative number, got " << v;
        throw ValidationError(oss.str());
    }
}

void validate_weights(const WeightConfig& w) {
    require_weight(w.skill, "skill");
    require_weight(w.location, "location");
    require_weight(w.education, "education");
    require_weight(w.sector, "sector");
    require_weight(w.diversity, "diversity");

    const double total = w.sum();
    if (std::fabs(total - 1.0) > kWeightSumTolerance) {
        std::ostringstream oss;
        oss << "weights must sum to 1.0, got " << total;
        throw ValidationError(oss.str());
    }
}

WeightConfig normalize_weights(double skill, double location, double education, double sector, double diversity) {
    require_weight(skill, "skill");
    require_weight(location, "location");
    require_weight(education, "education");
    require_weight(sector, "sector");
    require_weight(diversity, "diversity");

    const double total = skill + location + education + sector + diversity;
    if (total <= 0.0) throw ValidationError("weights must not all be zero");

    WeightConfig w;
    w.skill = skill / total;
    w.location = location / total;
    w.education = education / total;
    w.sector = sector / total;
    w.diversity = diversity / total;
    return w;
}

double combine(const ScoreBreakdown& b, const WeightConfig& w) {
    const double overall =
        w.skill * clamp01(b.skill_match) +
        w.location * clamp01(b.location_match) +
        w.education * clamp01(b.education_match) +
        w.sector * clamp01(b.sector_match) +
        w.diversity * clamp01(b.diversity_bonus);
    return clamp01(overall);
}

std::vector<std::string> match_reasons(const ScoreBreakdown& b) {
    std::vector<std::string> reasons;
    if (b.skill_match >= 0.7) reasons.push_back("Strong skill alignment");
    if (b.location_match == 1.0) reasons.push_back("Perfect location match");
    if (b.education_match == 1.0) reasons.push_back("Education level matches requirement");
    if (b.sector_match == 1.0) reasons.push_back("Sector interest aligned");
    if (b.diversity_bonus > 0.0) reasons.push_back("Eligible for affirmative-action consideration");
    return reasons;
}

PairScore score_pair(const Candidate& c, const Internship& it, const ScoreConfig& cfg) {
    PairScore ps;

    SkillMatchResult skills = match_skills(c.skills, it.skills_required, cfg.skill);

    ps.breakdown.skill_match = clamp01(skills.score);
    ps.breakdown.location_match = clamp01(location_score(c, it));
    ps.breakdown.education_match = clamp01(education_score(c.education_level, it.education_level));
    ps.breakdown.sector_match = clamp01(sector_score(c, it));
    ps.breakdown.diversity_bonus = clamp01(diversity_score(c, it));

    ps.overall = combine(ps.breakdown, cfg.weights);
    ps.reasons = match_reasons(ps.breakdown);
    ps.skill_evidence = std::move(skills.evidence);
    return ps;
}

}  // namespace match
