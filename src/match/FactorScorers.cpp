#include "match/FactorScorers.hpp"

#include <algorithm>

namespace match {

double location_score(const Candidate& c, const Internship& it) {
    // both sides are normalized at construction and internship locations are never empty
    if (!c.location.empty() && c.location == it.location) return kLocationExact;
    if (it.rural_friendly && c.prefers_rural) return kLocationRuralPreference;
    return kLocationBaseline;
}

double education_score(EducationLevel candidate, EducationLevel required) {
    const int have = static_cast<int>(candidate);
    const int need = static_cast<int>(required);
    if (have == need) return kEducationExact;
    if (have > need) return kEducationOverqualified;
    return kEducationBelow;
}

double sector_score(const Candidate& c, const Internship& it) {
    if (it.sector.empty()) return 0.0;
    return c.sector_interests.find(it.sector) != c.sector_interests.end() ? 1.0 : 0.0;
}

double diversity_score(const Candidate& c, const Internship& it) {
    double score = 0.0;

    if (c.from_rural_area && it.rural_friendly) score += kRuralBonus;

    if (it.diversity_focused) {
        if (is_reserved_category(c.social_category)) score += kCategoryBonus;
        if (c.first_generation_graduate) score += kFirstGenerationBonus;
    }

    return std::min(1.0, std::max(0.0, score));
}

}  // namespace match
