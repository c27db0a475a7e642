#include "match/CapacityTracker.hpp"

#include "match/Errors.hpp"

namespace match {

const char* to_string(AllocationStatus s) {
    switch (s) {
        case AllocationStatus::Committed: return "committed";
        case AllocationStatus::AlreadyCommitted: return "already_committed";
        case AllocationStatus::Released: return "released";
        case AllocationStatus::CapacityExhausted: return "capacity_exhausted";
        case AllocationStatus::UnknownAllocation: return "unknown_allocation";
        case AllocationStatus::UnknownInternship: return "unknown_internship";
        default: return "unknown";
    }
}

void require_ok(const AllocationResult& r) {
    if (r.ok()) return;
    throw CapacityError(std::string(to_string(r.status)) +
                        ": internship_id=" + r.internship_id +
                        " allocation_id=" + r.allocation_id);
}

CapacityTracker::CapacityTracker(const std::vector<Internship>& internships) {
    m_slots.reserve(internships.size() * 2 + 8);

    for (const auto& it : internships) {
        if (it.id.empty()) throw ValidationError("capacity: internship with empty id");
        if (it.capacity < 0) throw ValidationError("capacity: internship[" + it.id + "] has negative capacity");

        auto slot = std::make_unique<Slot>();
        slot->remaining = it.capacity;
        if (!m_slots.emplace(it.id, std::move(slot)).second) {
            throw ValidationError("capacity: duplicate internship id: " + it.id);
        }
    }
}

CapacityTracker::Slot* CapacityTracker::find_slot(const std::string& internship_id) const {
    auto it = m_slots.find(internship_id);
    if (it == m_slots.end()) return nullptr;
    return it->second.get();
}

AllocationResult CapacityTracker::allocate(const std::string& internship_id, const std::string& allocation_id) {
    if (allocation_id.empty()) throw ValidationError("allocate: empty allocation_id");

    AllocationResult r;
    r.internship_id = internship_id;
    r.allocation_id = allocation_id;

    Slot* slot = find_slot(internship_id);
    if (!slot) {
        r.status = AllocationStatus::UnknownInternship;
        return r;
    }

    std::lock_guard<std::mutex> lock(slot->mu);

    if (slot->committed.find(allocation_id) != slot->committed.end()) {
        r.status = AllocationStatus::AlreadyCommitted;
    } else if (slot->remaining > 0) {
        slot->remaining -= 1;
        slot->committed.insert(allocation_id);
        r.status = AllocationStatus::Committed;
    } else {
        r.status = AllocationStatus::CapacityExhausted;
    }

    r.remaining = slot->remaining;
    return r;
}

AllocationResult CapacityTracker::release(const std::string& internship_id, const std::string& allocation_id) {
    if (allocation_id.empty()) throw ValidationError("release: empty allocation_id");

    AllocationResult r;
    r.internship_id = internship_id;
    r.allocation_id = allocation_id;

    Slot* slot = find_slot(internship_id);
    if (!slot) {
        r.status = AllocationStatus::UnknownInternship;
        return r;
    }

    std::lock_guard<std::mutex> lock(slot->mu);

    auto cit = slot->committed.find(allocation_id);
    if (cit == slot->committed.end()) {
        r.status = AllocationStatus::UnknownAllocation;
    } else {
        slot->committed.erase(cit);
        slot->remaining += 1;
        r.status = AllocationStatus::Released;
    }

    r.remaining = slot->remaining;
    return r;
}

bool CapacityTracker::is_tracked(const std::string& internship_id) const {
    return find_slot(internship_id) != nullptr;
}

std::optional<int> CapacityTracker::remaining(const std::string& internship_id) const {
    Slot* slot = find_slot(internship_id);
    if (!slot) return std::nullopt;

    std::lock_guard<std::mutex> lock(slot->mu);
    return slot->remaining;
}

bool CapacityTracker::is_committed(const std::string& internship_id, const std::string& allocation_id) const {
    Slot* slot = find_slot(internship_id);
    if (!slot) return false;

    std::lock_guard<std::mutex> lock(slot->mu);
    return slot->committed.find(allocation_id) != slot->committed.end();
}

std::map<std::string, int> CapacityTracker::snapshot() const {
    std::map<std::string, int> out;
    for (const auto& kv : m_slots) {
        std::lock_guard<std::mutex> lock(kv.second->mu);
        out[kv.first] = kv.second->remaining;
    }
    return out;
}

}  // namespace match
