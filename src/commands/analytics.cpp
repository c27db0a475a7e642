#include "commands/analytics.hpp"

#include "commands/Args.hpp"

#include "io/JsonIO.hpp"
#include "match/Analytics.hpp"
#include "match/Errors.hpp"

#include "nlohmann/json.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

static int analytics_usage() {
    std::cerr
        << "usage:\n"
        << "  intern-match analytics --candidates <path> --internships <path> [--out <path>]\n"
        << "  --out <path>                 default: out/analytics.json\n";
    return 2;
}

static nlohmann::json summary_to_json(const match::AnalyticsSummary& s) {
    nlohmann::json j;
    j["total_candidates"] = s.total_candidates;
    j["total_internships"] = s.total_internships;
    j["diversity_rate"] = s.diversity_rate;
    j["sector_distribution"] = s.sector_distribution;
    j["location_distribution"] = s.location_distribution;
    j["education_distribution"] = s.education_distribution;
    j["total_capacity"] = s.total_capacity;
    j["remaining_capacity"] = s.remaining_capacity;
    return j;
}

int cmd_analytics(int argc, char** argv) {
    if (has_flag(argc, argv, "--help")) return analytics_usage();

    const std::string candidates_path = get_arg(argc, argv, "--candidates", "");
    const std::string internships_path = get_arg(argc, argv, "--internships", "");
    const fs::path out_path = get_arg(argc, argv, "--out", "out/analytics.json");

    if (candidates_path.empty() || internships_path.empty()) {
        std::cerr << "error: --candidates and --internships are required\n";
        return analytics_usage();
    }

    try {
        const auto candidates = loadCandidates(candidates_path);
        const auto internships = loadInternships(internships_path);

        const match::AnalyticsSummary s = match::summarize(candidates, internships);
        const nlohmann::json j = summary_to_json(s);

        if (out_path.has_parent_path()) fs::create_directories(out_path.parent_path());
        std::ofstream out(out_path);
        if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());
        out << j.dump(2) << "\n";

        std::cout << "CANDIDATES: " << s.total_candidates << "\n";
        std::cout << "INTERNSHIPS: " << s.total_internships << "\n";
        std::cout << "DIVERSITY_RATE: " << s.diversity_rate << "%\n";
        std::cout << "CAPACITY: " << s.remaining_capacity << "/" << s.total_capacity << "\n";
        std::cout << "OUT_ANALYTICS: " << out_path.string() << "\n";
        return 0;
    } catch (const match::ValidationError& e) {
        std::cerr << "validation error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "analytics failed: " << e.what() << "\n";
        return 2;
    }
}
