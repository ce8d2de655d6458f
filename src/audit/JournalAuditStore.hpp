#pragma once

#include <fstream>
#include <mutex>
#include <string>

#include "audit/AuditStore.hpp"

namespace tribunal {

// ---------------------------------------------------------------------------
// JournalAuditStore - durable append-only store on a JSON-lines file.
//
// One line per row:  {"table":"audit_events","row":{...}}
//                    {"table":"audit_overrides","row":{...}}
//
// The file is opened in append mode and never rewritten. Each row is written
// and flushed before it enters the in-memory index, so readers never observe
// a row that is not on disk. On open the whole journal is replayed into the
// index; a newline-terminated line that does not decode aborts the open with
// IntegrityViolation (a ledger with an unreadable row is not silently
// truncated). A final line without its newline is a write that never
// completed: it is logged and cut off before the file is reopened for append.
//
// Threading: writes serialize on mtx_; reads go to the index's own lock.
// ---------------------------------------------------------------------------
class JournalAuditStore : public AuditStore {
public:
    static constexpr const char* EVENTS_TABLE    = "audit_events";
    static constexpr const char* OVERRIDES_TABLE = "audit_overrides";

    // Throws LedgerWriteFailure if the journal cannot be opened for append,
    // IntegrityViolation if an existing line is malformed.
    explicit JournalAuditStore(const std::string& path);

    void append_event(const AuditEvent& e) override;
    void append_override(const AuditOverride& o) override;

    std::optional<AuditEvent> find_event(const std::string& event_id) const override;
    std::vector<AuditEvent>   query_events(const EventFilter& filter,
                                           std::size_t limit,
                                           std::size_t offset) const override;
    std::vector<AuditOverride> overrides_for(const std::string& event_id) const override;
    DecisionCounts             decision_counts() const override;

    const std::string& path() const { return path_; }

private:
    void replay();
    void write_line(const std::string& line);

    std::string      path_;
    std::ofstream    file_;
    std::mutex       mtx_;
    MemoryAuditStore index_;
};

} // namespace tribunal
