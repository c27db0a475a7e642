#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "match/Aggregator.hpp"
#include "match/Models.hpp"

// One line of an allocation replay file.
struct AllocationRequest {
    std::string op;             // "allocate" | "release"
    std::string internship_id;
    std::string allocation_id;
};

// Parsers throw match::ValidationError with a json-path style location ("root.internships[2]").
match::Candidate parseCandidate(const nlohmann::json& j, const std::string& where);
match::Internship parseInternship(const nlohmann::json& j, const std::string& where);

// Accepts a bare array or {"internships": [...]}.
std::vector<match::Internship> parseInternships(const nlohmann::json& j);

// Accepts a bare array or {"candidates": [...]}.
std::vector<match::Candidate> parseCandidates(const nlohmann::json& j);

// {"skill":..,"location":..,"education":..,"sector":..,"diversity":.., "normalize": bool}
// Without "normalize": true the weights must already sum to 1.0.
match::WeightConfig parseWeights(const nlohmann::json& j);

// Bare array or {"requests": [...]}.
std::vector<AllocationRequest> parseAllocationRequests(const nlohmann::json& j);

// File loaders: std::runtime_error on I/O or JSON syntax errors.
nlohmann::json readJsonFile(const std::string& path);
match::Candidate loadCandidate(const std::string& path);
std::vector<match::Candidate> loadCandidates(const std::string& path);
std::vector<match::Internship> loadInternships(const std::string& path);
match::WeightConfig loadWeights(const std::string& path);
std::vector<AllocationRequest> loadAllocationRequests(const std::string& path);
