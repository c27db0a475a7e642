#include "io/JsonIO.hpp"

#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "match/Errors.hpp"

using json = nlohmann::json;
using match::ValidationError;

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw ValidationError(where + " must be an object");
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw ValidationError(where + " must be an array");
    }
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw ValidationError(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw ValidationError(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static std::string optional_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return "";
    if (!j.at(key).is_string()) {
        throw ValidationError(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

// ids arrive as strings or as integer primary keys
static std::string require_id(const json& j, const std::string& where) {
    if (!j.contains("id")) {
        throw ValidationError(where + " missing required field: id");
    }
    const json& v = j.at("id");
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    throw ValidationError(where + ".id must be a string or an integer");
}

static bool optional_bool(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return false;
    if (!j.at(key).is_boolean()) {
        throw ValidationError(where + "." + std::string(key) + " must be a boolean");
    }
    return j.at(key).get<bool>();
}

static int optional_int(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return 0;
    if (!j.at(key).is_number_integer()) {
        throw ValidationError(where + "." + std::string(key) + " must be an integer");
    }
    const json& v = j.at(key);
    const bool in_range = v.is_number_unsigned()
        ? v.get<unsigned long long>() <= static_cast<unsigned long long>(std::numeric_limits<int>::max())
        : v.get<long long>() >= std::numeric_limits<int>::min() && v.get<long long>() <= std::numeric_limits<int>::max();
    if (!in_range) {
        throw ValidationError(where + "." + std::string(key) + " is out of range: " + v.dump());
    }
    return static_cast<int>(v.get<long long>());
}

static int require_int(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw ValidationError(where + " missing required field: " + std::string(key));
    }
    return optional_int(j, key, where);
}

static double require_number(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw ValidationError(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_number()) {
        throw ValidationError(where + "." + std::string(key) + " must be a number");
    }
    return j.at(key).get<double>();
}

// Missing list -> empty. A bare string is accepted as a one-element list.
static std::vector<std::string> optional_string_list(const json& j, const char* key, const std::string& where) {
    std::vector<std::string> out;
    if (!j.contains(key) || j.at(key).is_null()) return out;

    const json& arr = j.at(key);
    if (arr.is_string()) {
        out.push_back(arr.get<std::string>());
        return out;
    }
    if (!arr.is_array()) {
        throw ValidationError(where + "." + std::string(key) + " must be an array");
    }

    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_string()) {
            std::ostringstream oss;
            oss << where << "." << key << "[" << i << "] must be a string";
            throw ValidationError(oss.str());
        }
        out.push_back(arr.at(i).get<std::string>());
    }
    return out;
}

static const json& unwrap_list(const json& j, const char* key, const std::string& where) {
    if (j.is_object() && j.contains(key)) {
        const json& inner = j.at(key);
        require_array(inner, where + "." + key);
        return inner;
    }
    require_array(j, where);
    return j;
}

match::Candidate parseCandidate(const json& j, const std::string& where) {
    require_object(j, where);

    match::CandidateFields f;
    f.id                        = require_id(j, where);
    f.name                      = require_string(j, "name", where);
    f.email                     = optional_string(j, "email", where);
    f.education_level           = require_string(j, "education_level", where);
    f.skills                    = optional_string_list(j, "skills", where);
    f.location                  = optional_string(j, "location", where);
    f.sector_interests          = optional_string_list(j, "sector_interests", where);
    f.social_category           = optional_string(j, "social_category", where);
    f.from_rural_area           = optional_bool(j, "from_rural_area", where);
    f.prefers_rural             = optional_bool(j, "prefers_rural", where);
    f.first_generation_graduate = optional_bool(j, "first_generation_graduate", where);

    return match::make_candidate(f);
}

match::Internship parseInternship(const json& j, const std::string& where) {
    require_object(j, where);

    match::InternshipFields f;
    f.id                = require_id(j, where);
    f.title             = require_string(j, "title", where);
    f.company           = optional_string(j, "company", where);
    f.sector            = require_string(j, "sector", where);
    f.location          = require_string(j, "location", where);
    f.skills_required   = optional_string_list(j, "skills_required", where);
    f.education_level   = require_string(j, "education_level", where);
    f.capacity          = require_int(j, "capacity", where);
    f.duration_months   = optional_int(j, "duration_months", where);
    f.stipend           = optional_int(j, "stipend", where);
    f.rural_friendly    = optional_bool(j, "rural_friendly", where);
    f.diversity_focused = optional_bool(j, "diversity_focused", where);

    return match::make_internship(f);
}

std::vector<match::Internship> parseInternships(const json& j) {
    const json& arr = unwrap_list(j, "internships", "root");

    std::vector<match::Internship> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        std::ostringstream oss;
        oss << "root.internships[" << i << "]";
        out.push_back(parseInternship(arr.at(i), oss.str()));
    }
    return out;
}

std::vector<match::Candidate> parseCandidates(const json& j) {
    const json& arr = unwrap_list(j, "candidates", "root");

    std::vector<match::Candidate> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        std::ostringstream oss;
        oss << "root.candidates[" << i << "]";
        out.push_back(parseCandidate(arr.at(i), oss.str()));
    }
    return out;
}

match::WeightConfig parseWeights(const json& j) {
    require_object(j, "weights");

    const double skill     = require_number(j, "skill", "weights");
    const double location  = require_number(j, "location", "weights");
    const double education = require_number(j, "education", "weights");
    const double sector    = require_number(j, "sector", "weights");
    const double diversity = require_number(j, "diversity", "weights");

    if (optional_bool(j, "normalize", "weights")) {
        return match::normalize_weights(skill, location, education, sector, diversity);
    }

    match::WeightConfig w;
    w.skill = skill;
    w.location = location;
    w.education = education;
    w.sector = sector;
    w.diversity = diversity;
    match::validate_weights(w);
    return w;
}

std::vector<AllocationRequest> parseAllocationRequests(const json& j) {
    const json& arr = unwrap_list(j, "requests", "root");

    std::vector<AllocationRequest> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        std::ostringstream oss;
        oss << "root.requests[" << i << "]";
        const std::string where = oss.str();

        const json& rj = arr.at(i);
        require_object(rj, where);

        AllocationRequest r;
        r.op            = require_string(rj, "op", where);
        r.internship_id = rj.contains("internship_id") && rj.at("internship_id").is_number_integer()
                              ? std::to_string(rj.at("internship_id").get<long long>())
                              : require_string(rj, "internship_id", where);
        r.allocation_id = require_string(rj, "allocation_id", where);

        if (r.op != "allocate" && r.op != "release") {
            throw ValidationError(where + ".op must be \"allocate\" or \"release\"");
        }
        out.push_back(std::move(r));
    }
    return out;
}

json readJsonFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open JSON file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error("failed to parse JSON (" + path + "): " + e.what());
    }
    return j;
}

match::Candidate loadCandidate(const std::string& path) {
    return parseCandidate(readJsonFile(path), "root");
}

std::vector<match::Candidate> loadCandidates(const std::string& path) {
    return parseCandidates(readJsonFile(path));
}

std::vector<match::Internship> loadInternships(const std::string& path) {
    return parseInternships(readJsonFile(path));
}

match::WeightConfig loadWeights(const std::string& path) {
    return parseWeights(readJsonFile(path));
}

std::vector<AllocationRequest> loadAllocationRequests(const std::string& path) {
    return parseAllocationRequests(readJsonFile(path));
}
