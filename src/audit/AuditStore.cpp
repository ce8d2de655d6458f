#include "audit/AuditStore.hpp"
#include "audit/LedgerErrors.hpp"

#include <algorithm>

using namespace tribunal;

void MemoryAuditStore::append_event(const AuditEvent& e) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (event_index_.count(e.event_id)) throw DuplicateRecord(e.event_id);

    event_index_[e.event_id] = events_.size();
    events_.push_back(e);
}

void MemoryAuditStore::append_override(const AuditOverride& o) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (override_index_.count(o.override_id)) throw DuplicateRecord(o.override_id);

    override_index_[o.override_id] = overrides_.size();
    overrides_by_event_[o.original_event_id].push_back(overrides_.size());
    overrides_.push_back(o);
}

std::optional<AuditEvent> MemoryAuditStore::find_event(const std::string& event_id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = event_index_.find(event_id);
    if (it == event_index_.end()) return std::nullopt;
    return events_[it->second];
}

bool MemoryAuditStore::has_event(const std::string& event_id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return event_index_.count(event_id) != 0;
}

bool MemoryAuditStore::has_override(const std::string& override_id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return override_index_.count(override_id) != 0;
}

std::vector<AuditEvent> MemoryAuditStore::query_events(const EventFilter& filter,
                                                       std::size_t limit,
                                                       std::size_t offset) const {
    std::vector<const AuditEvent*> hits;
    std::vector<AuditEvent> out;

    std::lock_guard<std::mutex> lock(mtx_);

    // Walk newest-appended first so the stable sort keeps that order on ties.
    for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
        if (filter.matches(*it)) hits.push_back(&*it);
    }
    std::stable_sort(hits.begin(), hits.end(),
                     [](const AuditEvent* a, const AuditEvent* b) {
                         return a->timestamp > b->timestamp;
                     });

    if (offset >= hits.size()) return out;
    std::size_t end = std::min(hits.size(), offset + limit);
    out.reserve(end - offset);
    for (std::size_t i = offset; i < end; ++i) out.push_back(*hits[i]);
    return out;
}

std::vector<AuditOverride> MemoryAuditStore::overrides_for(const std::string& event_id) const {
    std::vector<AuditOverride> out;

    std::lock_guard<std::mutex> lock(mtx_);
    auto it = overrides_by_event_.find(event_id);
    if (it == overrides_by_event_.end()) return out;

    for (std::size_t idx : it->second) out.push_back(overrides_[idx]);
    std::stable_sort(out.begin(), out.end(),
                     [](const AuditOverride& a, const AuditOverride& b) {
                         return a.timestamp < b.timestamp;
                     });
    return out;
}

DecisionCounts MemoryAuditStore::decision_counts() const {
    std::lock_guard<std::mutex> lock(mtx_);
    DecisionCounts c;
    c.total = events_.size();
    for (const auto& e : events_) {
        switch (e.decision) {
            case Decision::BLOCK: ++c.blocked; break;
            case Decision::FLAG:  ++c.flagged; break;
            case Decision::ALLOW: ++c.allowed; break;
        }
    }
    return c;
}
