#include "match/Models.hpp"

#include "match/Errors.hpp"
#include "match/TextUtil.hpp"

namespace match {

static void require_non_empty(const std::string& v, const char* field, const std::string& where) {
    if (v.empty()) {
        throw ValidationError(where + " missing required field: " + field);
    }
}

static void require_normalized(const std::string& v, const char* field, const std::string& where) {
    if (textutil::normalize_key(v) != v) {
        throw ValidationError(where + "." + field + " is not normalized: '" + v + "'");
    }
}

static void require_normalized_set(const std::set<std::string>& s, const char* field, const std::string& where) {
    for (const auto& v : s) {
        if (v.empty()) throw ValidationError(where + "." + field + " contains an empty entry");
        require_normalized(v, field, where);
    }
}

EducationLevel parse_education_level(const std::string& s) {
    const std::string k = textutil::normalize_key(s);
    if (k == "diploma") return EducationLevel::Diploma;
    if (k == "bachelor") return EducationLevel::Bachelor;
    if (k == "master") return EducationLevel::Master;
    if (k == "phd") return EducationLevel::PhD;
    throw ValidationError("unknown education_level: '" + s + "'");
}

SocialCategory parse_social_category(const std::string& s) {
    const std::string k = textutil::normalize_key(s);
    // data layer stores "" for "not stated"
    if (k.empty() || k == "general") return SocialCategory::General;
    if (k == "sc") return SocialCategory::SC;
    if (k == "st") return SocialCategory::ST;
    if (k == "obc") return SocialCategory::OBC;
    throw ValidationError("unknown social_category: '" + s + "'");
}

const char* to_string(EducationLevel e) {
    switch (e) {
        case EducationLevel::Diploma: return "Diploma";
        case EducationLevel::Bachelor: return "Bachelor";
        case EducationLevel::Master: return "Master";
        case EducationLevel::PhD: return "PhD";
        default: return "unknown";
    }
}

const char* to_string(SocialCategory c) {
    switch (c) {
        case SocialCategory::General: return "General";
        case SocialCategory::SC: return "SC";
        case SocialCategory::ST: return "ST";
        case SocialCategory::OBC: return "OBC";
        default: return "unknown";
    }
}

bool is_reserved_category(SocialCategory c) {
    return c == SocialCategory::SC || c == SocialCategory::ST || c == SocialCategory::OBC;
}

Candidate make_candidate(const CandidateFields& f) {
    const std::string where = f.id.empty() ? std::string("candidate") : "candidate[" + f.id + "]";
    require_non_empty(f.id, "id", where);
    require_non_empty(f.name, "name", where);
    require_non_empty(f.education_level, "education_level", where);

    Candidate c;
    c.id = f.id;
    c.name = f.name;
    c.email = f.email;
    c.education_level = parse_education_level(f.education_level);
    c.skills = textutil::normalize_set(f.skills);
    c.location = textutil::normalize_key(f.location);
    c.sector_interests = textutil::normalize_set(f.sector_interests);
    c.social_category = parse_social_category(f.social_category);
    c.from_rural_area = f.from_rural_area;
    c.prefers_rural = f.prefers_rural;
    c.first_generation_graduate = f.first_generation_graduate;
    return c;
}

Internship make_internship(const InternshipFields& f) {
    const std::string where = f.id.empty() ? std::string("internship") : "internship[" + f.id + "]";
    require_non_empty(f.id, "id", where);
    require_non_empty(f.title, "title", where);
    require_non_empty(f.education_level, "education_level", where);

    if (f.capacity < 0) throw ValidationError(where + ".capacity must be >= 0");
    if (f.duration_months < 0) throw ValidationError(where + ".duration_months must be >= 0");
    if (f.stipend < 0) throw ValidationError(where + ".stipend must be >= 0");

    const std::string location = textutil::normalize_key(f.location);
    require_non_empty(location, "location", where);

    Internship it;
    it.id = f.id;
    it.title = f.title;
    it.company = f.company;
    it.sector = textutil::normalize_key(f.sector);
    it.location = location;
    it.skills_required = textutil::normalize_set(f.skills_required);
    it.education_level = parse_education_level(f.education_level);
    it.capacity = f.capacity;
    it.duration_months = f.duration_months;
    it.stipend = f.stipend;
    it.rural_friendly = f.rural_friendly;
    it.diversity_focused = f.diversity_focused;
    return it;
}

void validate_candidate(const Candidate& c) {
    const std::string where = c.id.empty() ? std::string("candidate") : "candidate[" + c.id + "]";
    require_non_empty(c.id, "id", where);
    require_non_empty(c.name, "name", where);
    require_normalized(c.location, "location", where);
    require_normalized_set(c.skills, "skills", where);
    require_normalized_set(c.sector_interests, "sector_interests", where);
}

void validate_internship(const Internship& it) {
    const std::string where = it.id.empty() ? std::string("internship") : "internship[" + it.id + "]";
    require_non_empty(it.id, "id", where);
    require_non_empty(it.title, "title", where);
    require_non_empty(it.location, "location", where);
    if (it.capacity < 0) throw ValidationError(where + ".capacity must be >= 0");
    require_normalized(it.sector, "sector", where);
    require_normalized(it.location, "location", where);
    require_normalized_set(it.skills_required, "skills_required", where);
}

}  // namespace match
