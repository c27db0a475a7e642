#pragma once
#include <set>
#include <string>
#include <vector>

namespace match {

// Ordered: comparisons follow the hierarchy.
enum class EducationLevel {
    Diploma = 1,
    Bachelor = 2,
    Master = 3,
    PhD = 4
};

enum class SocialCategory {
    General,
    SC,
    ST,
    OBC
};

struct Candidate {
    std::string id;
    std::string name;
    std::string email;                       // optional, display only
    EducationLevel education_level = EducationLevel::Bachelor;
    std::set<std::string> skills;            // normalized
    std::string location;                    // normalized
    std::set<std::string> sector_interests;  // normalized
    SocialCategory social_category = SocialCategory::General;
    bool from_rural_area = false;
    bool prefers_rural = false;
    bool first_generation_graduate = false;
};

struct Internship {
    std::string id;
    std::string title;
    std::string company;
    std::string sector;                      // normalized
    std::string location;                    // normalized
    std::set<std::string> skills_required;   // normalized
    EducationLevel education_level = EducationLevel::Bachelor;  // minimum requirement
    int capacity = 0;                        // remaining open slots
    int duration_months = 0;
    int stipend = 0;
    bool rural_friendly = false;
    bool diversity_focused = false;
};

// Raw, un-normalized field values as they arrive from the data layer.
struct CandidateFields {
    std::string id;
    std::string name;
    std::string email;
    std::string education_level;
    std::vector<std::string> skills;
    std::string location;
    std::vector<std::string> sector_interests;
    std::string social_category;
    bool from_rural_area = false;
    bool prefers_rural = false;
    bool first_generation_graduate = false;
};

struct InternshipFields {
    std::string id;
    std::string title;
    std::string company;
    std::string sector;
    std::string location;
    std::vector<std::string> skills_required;
    std::string education_level;
    int capacity = 0;
    int duration_months = 0;
    int stipend = 0;
    bool rural_friendly = false;
    bool diversity_focused = false;
};

// Both throw ValidationError on malformed enumerations or missing required fields.
EducationLevel parse_education_level(const std::string& s);
SocialCategory parse_social_category(const std::string& s);

const char* to_string(EducationLevel e);
const char* to_string(SocialCategory c);

// SC / ST / OBC
bool is_reserved_category(SocialCategory c);

// Validating constructors: normalize skill/sector/location strings and reject bad input.
Candidate make_candidate(const CandidateFields& f);
Internship make_internship(const InternshipFields& f);

// Re-checks an already-built record (callers may assemble records by hand).
void validate_candidate(const Candidate& c);
void validate_internship(const Internship& it);

}  // namespace match
