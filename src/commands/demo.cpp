#include "commands/demo.hpp"

#include "commands/Args.hpp"

#include "match/CapacityTracker.hpp"
#include "match/Errors.hpp"
#include "match/Ranker.hpp"
#include "match/SampleData.hpp"

#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

int cmd_demo(int argc, char** argv) {
    try {
        match::RankerConfig rank_cfg;
        rank_cfg.top_k = get_arg_int(argc, argv, "--topk", rank_cfg.top_k);

        const auto internships = match::sample_internships();
        const auto candidates = match::sample_candidates();
        match::CapacityTracker tracker(internships);

        std::cout << "INTERNSHIPS: " << internships.size() << "\n";
        std::cout << "CANDIDATES: " << candidates.size() << "\n\n";

        std::cout << std::fixed << std::setprecision(1);
        for (const auto& c : candidates) {
            std::cout << c.name << " (" << match::to_string(c.education_level) << ", " << c.location << ")\n";

            const auto recs = match::rank(c, internships, match::ScoreConfig{}, rank_cfg, &tracker);
            for (const auto& r : recs) {
                std::cout << "  " << r.rank << ". " << r.internship.title << " at " << r.internship.company
                          << " | " << r.internship.location
                          << " | match " << (r.overall * 100.0) << "%\n";
                for (const auto& reason : r.reasons) std::cout << "     - " << reason << "\n";
            }

            // confirm the top pick so later candidates see the reduced capacity
            if (!recs.empty()) {
                const auto res = tracker.allocate(recs.front().internship.id, "demo-" + c.id);
                std::cout << "  allocated " << recs.front().internship.id << ": "
                          << match::to_string(res.status) << " (remaining " << res.remaining << ")\n";
            }
            std::cout << "\n";
        }
        std::cout.unsetf(std::ios::floatfield);
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "demo failed: " << e.what() << "\n";
        return 1;
    }
}
