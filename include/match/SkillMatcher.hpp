#pragma once

#include <set>
#include <string>
#include <vector>

namespace match {

struct SkillMatchConfig {
    // credit for a required skill that only fuzzily matches a candidate skill
    double partial_credit = 0.5;

    // accept a fuzzy match if textutil::similarity >= threshold
    double fuzzy_threshold = 0.8;
};

enum class SkillMatchType {
    Exact,
    Fuzzy,
    Missing
};

struct SkillEvidence {
    SkillMatchType type = SkillMatchType::Missing;

    // required skill on the internship side (normalized)
    std::string required;

    // best candidate skill seen for it; empty when the candidate has no skills
    std::string matched;

    // similarity of `matched` to `required`. 1.0 for exact matches
    double similarity = 0.0;

    // credit this required skill contributed before averaging
    double credit = 0.0;
};

struct SkillMatchResult {
    double score = 0.0;
    std::vector<SkillEvidence> evidence;  // one per required skill, in required-skill order
};

// Mean per-required-skill credit. An empty requirement set scores 1.0.
SkillMatchResult match_skills(
    const std::set<std::string>& candidate_skills,
    const std::set<std::string>& required_skills,
    const SkillMatchConfig& cfg = {}
);

inline double skill_match_score(
    const std::set<std::string>& candidate_skills,
    const std::set<std::string>& required_skills,
    const SkillMatchConfig& cfg = {}
) {
    return match_skills(candidate_skills, required_skills, cfg).score;
}

}  // namespace match
