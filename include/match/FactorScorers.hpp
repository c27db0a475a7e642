#pragma once

#include "match/Models.hpp"

namespace match {

// Location policy values.
constexpr double kLocationExact = 1.0;
constexpr double kLocationRuralPreference = 0.8;
constexpr double kLocationBaseline = 0.2;

// Education policy values.
constexpr double kEducationExact = 1.0;
constexpr double kEducationOverqualified = 0.8;
constexpr double kEducationBelow = 0.0;

// Diversity bonus components. They can co-occur; the sum is clamped to 1.0.
constexpr double kRuralBonus = 0.4;
constexpr double kCategoryBonus = 0.4;
constexpr double kFirstGenerationBonus = 0.2;

// Exact (normalized) location -> 1.0; rural preference satisfied -> 0.8; else 0.2.
// No partial-region table yet.
double location_score(const Candidate& c, const Internship& it);

// Equal -> 1.0; overqualified -> 0.8; below the requirement -> 0.0.
double education_score(EducationLevel candidate, EducationLevel required);

// Binary: internship sector in the candidate's interests.
double sector_score(const Candidate& c, const Internship& it);

double diversity_score(const Candidate& c, const Internship& it);

}  // namespace match
