#pragma once

#include <vector>

#include "match/Models.hpp"

namespace match {

// Built-in fallback data used by `intern-match demo`.
std::vector<Internship> sample_internships();
std::vector<Candidate> sample_candidates();

}  // namespace match
