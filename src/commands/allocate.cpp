#include "commands/allocate.hpp"

#include "commands/Args.hpp"

#include "io/JsonIO.hpp"
#include "match/CapacityTracker.hpp"
#include "match/Errors.hpp"

#include "nlohmann/json.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

static int allocate_usage() {
    std::cerr
        << "usage:\n"
        << "  intern-match allocate --internships <path> --requests <path> [--out <path>]\n"
        << "\n"
        << "requests file: [{\"op\": \"allocate\"|\"release\", \"internship_id\": .., \"allocation_id\": ..}, ...]\n"
        << "  --out <path>                 default: out/allocation_ledger.json\n";
    return 2;
}

static void write_json(const fs::path& path, const nlohmann::json& j) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open output file: " + path.string());
    out << j.dump(2) << "\n";
}

int cmd_allocate(int argc, char** argv) {
    if (has_flag(argc, argv, "--help")) return allocate_usage();

    const std::string internships_path = get_arg(argc, argv, "--internships", "");
    const std::string requests_path = get_arg(argc, argv, "--requests", "");
    const fs::path out_path = get_arg(argc, argv, "--out", "out/allocation_ledger.json");

    if (internships_path.empty()) {
        std::cerr << "error: missing --internships\n";
        return allocate_usage();
    }
    if (requests_path.empty()) {
        std::cerr << "error: missing --requests\n";
        return allocate_usage();
    }

    try {
        const auto internships = loadInternships(internships_path);
        const auto requests = loadAllocationRequests(requests_path);

        match::CapacityTracker tracker(internships);

        nlohmann::json ledger = nlohmann::json::array();
        int failures = 0;

        for (const auto& req : requests) {
            const match::AllocationResult r = (req.op == "allocate")
                ? tracker.allocate(req.internship_id, req.allocation_id)
                : tracker.release(req.internship_id, req.allocation_id);

            if (!r.ok()) {
                ++failures;
                std::cerr << "- " << req.op << " " << req.internship_id << "/" << req.allocation_id
                          << ": " << match::to_string(r.status) << "\n";
            }

            ledger.push_back({
                {"op", req.op},
                {"internship_id", r.internship_id},
                {"allocation_id", r.allocation_id},
                {"status", match::to_string(r.status)},
                {"ok", r.ok()},
                {"remaining", r.remaining}
            });
        }

        nlohmann::json j;
        j["internships_path"] = internships_path;
        j["requests_path"] = requests_path;
        j["ledger"] = ledger;
        j["remaining"] = tracker.snapshot();
        write_json(out_path, j);

        std::cout << "REQUESTS: " << requests.size() << "\n";
        std::cout << "FAILED: " << failures << "\n";
        std::cout << "OUT_LEDGER: " << out_path.string() << "\n";
        return 0;
    } catch (const match::ValidationError& e) {
        std::cerr << "validation error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "allocate failed: " << e.what() << "\n";
        return 2;
    }
}
