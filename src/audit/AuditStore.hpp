#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "audit/AuditRecord.hpp"

namespace tribunal {

// ---------------------------------------------------------------------------
// AuditStore - ordered, queryable, append-only storage for the ledger.
//
// Two logical tables: audit_events keyed by event_id, audit_overrides keyed
// by override_id with a secondary index on original_event_id. Inserts only.
// A row becomes visible to readers only once its append has fully succeeded.
//
// Errors: DuplicateRecord on a primary-key collision, LedgerWriteFailure when
// the backing medium refuses the write.
// ---------------------------------------------------------------------------
class AuditStore {
public:
    virtual ~AuditStore() = default;

    virtual void append_event(const AuditEvent& e) = 0;
    virtual void append_override(const AuditOverride& o) = 0;

    virtual std::optional<AuditEvent> find_event(const std::string& event_id) const = 0;

    // Newest first by timestamp; ties newest-appended first.
    virtual std::vector<AuditEvent> query_events(const EventFilter& filter,
                                                 std::size_t limit,
                                                 std::size_t offset) const = 0;

    // Oldest first by timestamp; ties in append order.
    virtual std::vector<AuditOverride> overrides_for(const std::string& event_id) const = 0;

    virtual DecisionCounts decision_counts() const = 0;
};

// ---------------------------------------------------------------------------
// MemoryAuditStore - process-local store. Also the read index behind
// JournalAuditStore.
// ---------------------------------------------------------------------------
class MemoryAuditStore : public AuditStore {
public:
    MemoryAuditStore() = default;

    void append_event(const AuditEvent& e) override;
    void append_override(const AuditOverride& o) override;

    std::optional<AuditEvent> find_event(const std::string& event_id) const override;
    std::vector<AuditEvent>   query_events(const EventFilter& filter,
                                           std::size_t limit,
                                           std::size_t offset) const override;
    std::vector<AuditOverride> overrides_for(const std::string& event_id) const override;
    DecisionCounts             decision_counts() const override;

    bool has_event(const std::string& event_id) const;
    bool has_override(const std::string& override_id) const;

private:
    mutable std::mutex mtx_;

    std::vector<AuditEvent>                               events_;
    std::unordered_map<std::string, std::size_t>          event_index_;
    std::vector<AuditOverride>                            overrides_;
    std::unordered_map<std::string, std::size_t>          override_index_;
    std::unordered_map<std::string, std::vector<std::size_t>> overrides_by_event_;
};

} // namespace tribunal
