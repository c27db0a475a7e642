#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "match/Models.hpp"

namespace match {

enum class AllocationStatus {
    Committed,          // allocate: slot taken
    AlreadyCommitted,   // allocate: retry of a committed allocation_id, nothing changed
    Released,           // release: slot returned
    CapacityExhausted,  // allocate: no slot left, nothing changed
    UnknownAllocation,  // release: allocation_id was never committed here
    UnknownInternship   // internship id not tracked
};

struct AllocationResult {
    AllocationStatus status = AllocationStatus::UnknownInternship;
    std::string internship_id;
    std::string allocation_id;
    int remaining = 0;  // slots left after the call (0 for unknown internships)

    bool ok() const {
        return status == AllocationStatus::Committed ||
               status == AllocationStatus::AlreadyCommitted ||
               status == AllocationStatus::Released;
    }
};

const char* to_string(AllocationStatus s);

// Throws CapacityError when !r.ok().
void require_ok(const AllocationResult& r);

// Remaining-slot counts per internship id. The only mutable state of the engine.
// allocate/release are serialized per internship id; different ids never contend.
class CapacityTracker {
public:
    CapacityTracker() = default;

    // Throws ValidationError on duplicate ids or negative capacity.
    explicit CapacityTracker(const std::vector<Internship>& internships);

    // Idempotent with respect to allocation_id. Throws ValidationError on an empty allocation_id.
    AllocationResult allocate(const std::string& internship_id, const std::string& allocation_id);

    // Throws ValidationError on an empty allocation_id.
    AllocationResult release(const std::string& internship_id, const std::string& allocation_id);

    bool is_tracked(const std::string& internship_id) const;
    std::optional<int> remaining(const std::string& internship_id) const;
    bool is_committed(const std::string& internship_id, const std::string& allocation_id) const;

    // Consistent per id, not across ids.
    std::map<std::string, int> snapshot() const;

    size_t size() const { return m_slots.size(); }

private:
    struct Slot {
        mutable std::mutex mu;
        int remaining = 0;
        std::unordered_set<std::string> committed;
    };

    Slot* find_slot(const std::string& internship_id) const;

    // Built once in the constructor; only Slot contents change afterwards.
    std::unordered_map<std::string, std::unique_ptr<Slot>> m_slots;
};

}  // namespace match
