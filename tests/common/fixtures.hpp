#pragma once

#include <string>
#include <vector>

#include "match/Models.hpp"

namespace match::test {

// Candidate with no diversity flags, Bachelor, in "mumbai", interested in "technology".
inline Candidate MakeCandidate(const std::string& id, std::vector<std::string> skills) {
    CandidateFields f;
    f.id = id;
    f.name = "Candidate " + id;
    f.education_level = "Bachelor";
    f.skills = std::move(skills);
    f.location = "Mumbai";
    f.sector_interests = {"Technology"};
    return make_candidate(f);
}

// Internship requiring Bachelor, in "mumbai", sector "technology", no inclusiveness flags.
inline Internship MakeInternship(const std::string& id, std::vector<std::string> skills, int capacity = 3) {
    InternshipFields f;
    f.id = id;
    f.title = "Internship " + id;
    f.company = "Company " + id;
    f.sector = "Technology";
    f.location = "Mumbai";
    f.skills_required = std::move(skills);
    f.education_level = "Bachelor";
    f.capacity = capacity;
    f.duration_months = 3;
    f.stipend = 10000;
    return make_internship(f);
}

}  // namespace match::test
