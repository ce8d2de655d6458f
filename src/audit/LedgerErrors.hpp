#pragma once

#include <stdexcept>
#include <string>

namespace tribunal {

// ---------------------------------------------------------------------------
// Core error taxonomy. Everything a collaborator throws is translated into
// one of these before it leaves the core.
//
// SignalProducerFailure and EvidenceStorageFailure are deliberately absent:
// both are recovered locally (ERROR outcome, evidence-ref sentinel).
// ---------------------------------------------------------------------------

// Referenced event/override does not exist. Client error, never retried.
class NotFound : public std::runtime_error {
public:
    explicit NotFound(const std::string& id)
        : std::runtime_error("not found: " + id), id_(id) {}
    const std::string& id() const { return id_; }
private:
    std::string id_;
};

// A stored signature no longer verifies, or a stored row cannot be decoded.
class IntegrityViolation : public std::runtime_error {
public:
    IntegrityViolation(const std::string& record_id, const std::string& detail)
        : std::runtime_error("integrity violation on " + record_id + ": " + detail),
          record_id_(record_id) {}
    const std::string& record_id() const { return record_id_; }
private:
    std::string record_id_;
};

// Empty reason, unknown decision, negative duration. Rejected before any write.
class InvalidOverrideRequest : public std::runtime_error {
public:
    explicit InvalidOverrideRequest(const std::string& what)
        : std::runtime_error("invalid override request: " + what) {}
};

// The append-only store refused or failed the write. The decision was NOT recorded.
class LedgerWriteFailure : public std::runtime_error {
public:
    explicit LedgerWriteFailure(const std::string& what)
        : std::runtime_error("decision could not be recorded: " + what) {}
};

// Primary-key collision in the store (identifier reuse).
class DuplicateRecord : public std::runtime_error {
public:
    explicit DuplicateRecord(const std::string& id)
        : std::runtime_error("duplicate record id: " + id) {}
};

} // namespace tribunal
