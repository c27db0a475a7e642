#include "commands/recommend.hpp"

#include "commands/Args.hpp"

#include "io/JsonIO.hpp"
#include "match/Errors.hpp"
#include "match/Ranker.hpp"
#include "match/RecommendationsArtifact.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

static int recommend_usage(const char* cmd) {
    std::cerr
        << "usage:\n"
        << "  intern-match " << cmd << " --candidate <path> --internships <path> [options]\n"
        << "\n"
        << "options:\n"
        << "  --weights <path>             JSON weight settings (default 0.30/0.20/0.20/0.15/0.15)\n"
        << "  --topk <n>                   default: 5\n"
        << "  --fuzzy_threshold <f>        default: 0.8\n"
        << "  --partial_credit <f>         default: 0.5\n"
        << "  --out <path>                 default: out/recommendations.json\n";
    return 2;
}

static void print_recommendations(const std::vector<match::Recommendation>& recs) {
    std::cout << std::fixed << std::setprecision(3);
    for (const auto& r : recs) {
        std::cout << "  " << r.rank << ". [" << r.internship.id << "] " << r.internship.title;
        if (!r.internship.company.empty()) std::cout << " at " << r.internship.company;
        std::cout << "\n";
        std::cout << "     overall=" << r.overall
                  << " skill=" << r.breakdown.skill_match
                  << " location=" << r.breakdown.location_match
                  << " education=" << r.breakdown.education_match
                  << " sector=" << r.breakdown.sector_match
                  << " diversity=" << r.breakdown.diversity_bonus
                  << " remaining=" << r.remaining_capacity << "\n";
        for (const auto& reason : r.reasons) std::cout << "     - " << reason << "\n";
    }
    std::cout.unsetf(std::ios::floatfield);
}

static int run_ranking(int argc, char** argv, const char* cmd, bool filtered) {
    if (has_flag(argc, argv, "--help")) return recommend_usage(cmd);

    const std::string candidate_path = get_arg(argc, argv, "--candidate", "");
    const std::string internships_path = get_arg(argc, argv, "--internships", "");
    const std::string weights_path = get_arg(argc, argv, "--weights", "");
    const std::string default_out = filtered ? "out/recommendations.json" : "out/report.json";
    const fs::path out_path = get_arg(argc, argv, "--out", default_out);

    if (candidate_path.empty()) {
        std::cerr << "error: missing --candidate\n";
        return recommend_usage(cmd);
    }
    if (internships_path.empty()) {
        std::cerr << "error: missing --internships\n";
        return recommend_usage(cmd);
    }

    try {
        match::ScoreConfig score_cfg;
        if (!weights_path.empty()) score_cfg.weights = loadWeights(weights_path);
        score_cfg.skill.fuzzy_threshold = get_arg_double(argc, argv, "--fuzzy_threshold", score_cfg.skill.fuzzy_threshold);
        score_cfg.skill.partial_credit = get_arg_double(argc, argv, "--partial_credit", score_cfg.skill.partial_credit);

        match::RankerConfig rank_cfg;
        rank_cfg.top_k = get_arg_int(argc, argv, "--topk", rank_cfg.top_k);

        const match::Candidate candidate = loadCandidate(candidate_path);
        const std::vector<match::Internship> internships = loadInternships(internships_path);

        const auto recs = filtered
            ? match::rank(candidate, internships, score_cfg, rank_cfg)
            : match::rank_unfiltered(candidate, internships, score_cfg, rank_cfg);

        match::RecommendationsArtifact artifact;
        artifact.candidate_id = candidate.id;
        artifact.candidate_path = candidate_path;
        artifact.internships_path = internships_path;
        artifact.filtered = filtered;
        artifact.ranker_cfg = rank_cfg;
        artifact.score_cfg = score_cfg;
        artifact.recommendations = recs;
        artifact.write_to(out_path);

        std::cout << "CANDIDATE: " << candidate.id << " (" << candidate.name << ")\n";
        std::cout << "INTERNSHIPS: " << internships.size() << "\n";
        std::cout << "FILTERED: " << (filtered ? "yes" : "no") << "\n";
        std::cout << "TOPK: " << rank_cfg.top_k << "\n";
        std::cout << "RETURNED: " << recs.size() << "\n";
        print_recommendations(recs);
        std::cout << (filtered ? "OUT_RECOMMENDATIONS: " : "OUT_REPORT: ") << out_path.string() << "\n";
        return 0;
    } catch (const match::ValidationError& e) {
        std::cerr << "validation error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << cmd << " failed: " << e.what() << "\n";
        return 2;
    }
}

int cmd_recommend(int argc, char** argv) {
    return run_ranking(argc, argv, "recommend", true);
}

int cmd_report(int argc, char** argv) {
    return run_ranking(argc, argv, "report", false);
}
