#include "audit/JournalAuditStore.hpp"
#include "audit/LedgerErrors.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>

using namespace tribunal;
using json = nlohmann::json;
namespace fs = std::filesystem;

JournalAuditStore::JournalAuditStore(const std::string& path)
    : path_(path) {
    replay();

    // Append only. Past replay the journal is never truncated or rewritten.
    file_.open(path_, std::ios::out | std::ios::app);
    if (!file_.is_open()) throw LedgerWriteFailure("cannot open journal " + path_);

    DecisionCounts c = index_.decision_counts();
    std::cout << "[JOURNAL] Opened " << path_ << " events=" << c.total << "\n";
}

void JournalAuditStore::replay() {
    std::ifstream in(path_, std::ios::in | std::ios::binary);
    if (!in.is_open()) return;   // fresh journal

    std::string line;
    std::size_t line_no   = 0;
    std::uintmax_t committed = 0;   // bytes up to and including the last '\n'

    while (std::getline(in, line)) {
        ++line_no;

        // A row is committed once its newline is on disk. A final line
        // without one is a write that died half way; it is dropped below.
        if (in.eof()) {
            std::cerr << "[JOURNAL] Dropping uncommitted tail of " << line.size()
                      << " bytes at " << path_ << ":" << line_no << "\n";
            break;
        }
        committed += line.size() + 1;
        if (line.empty()) continue;

        const std::string where = path_ + ":" + std::to_string(line_no);
        try {
            json entry = json::parse(line);
            const std::string table = entry.at("table").get<std::string>();
            const json& row = entry.at("row");

            if (table == EVENTS_TABLE) {
                index_.append_event(auditEventFromJson(row));
            } else if (table == OVERRIDES_TABLE) {
                index_.append_override(auditOverrideFromJson(row));
            } else {
                throw std::invalid_argument("unknown table '" + table + "'");
            }
        } catch (const DuplicateRecord& e) {
            throw IntegrityViolation(where, e.what());
        } catch (const std::exception& e) {
            throw IntegrityViolation(where, std::string("unreadable journal line: ") + e.what());
        }
    }
    in.close();

    std::error_code ec;
    std::uintmax_t size = fs::file_size(path_, ec);
    if (ec) throw LedgerWriteFailure("cannot stat journal " + path_ + ": " + ec.message());
    if (size > committed) {
        fs::resize_file(path_, committed, ec);
        if (ec) throw LedgerWriteFailure("cannot drop torn journal tail " + path_ + ": " + ec.message());
    }
}

// ---------------------------------------------------------------------------
// Caller holds mtx_. The row is on disk (flushed) when this returns.
// ---------------------------------------------------------------------------
void JournalAuditStore::write_line(const std::string& line) {
    file_ << line << "\n";
    file_.flush();
    if (!file_.good()) {
        file_.clear();
        throw LedgerWriteFailure("journal write failed: " + path_);
    }
}

void JournalAuditStore::append_event(const AuditEvent& e) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (index_.has_event(e.event_id)) throw DuplicateRecord(e.event_id);

    std::string line;
    try {
        line = json{{"table", EVENTS_TABLE}, {"row", auditEventToJson(e)}}.dump();
    } catch (const json::exception& ex) {
        throw LedgerWriteFailure(std::string("row encode failed: ") + ex.what());
    }
    write_line(line);
    index_.append_event(e);
}

void JournalAuditStore::append_override(const AuditOverride& o) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (index_.has_override(o.override_id)) throw DuplicateRecord(o.override_id);

    std::string line;
    try {
        line = json{{"table", OVERRIDES_TABLE}, {"row", auditOverrideToJson(o)}}.dump();
    } catch (const json::exception& ex) {
        throw LedgerWriteFailure(std::string("row encode failed: ") + ex.what());
    }
    write_line(line);
    index_.append_override(o);
}

std::optional<AuditEvent> JournalAuditStore::find_event(const std::string& event_id) const {
    return index_.find_event(event_id);
}

std::vector<AuditEvent> JournalAuditStore::query_events(const EventFilter& filter,
                                                        std::size_t limit,
                                                        std::size_t offset) const {
    return index_.query_events(filter, limit, offset);
}

std::vector<AuditOverride> JournalAuditStore::overrides_for(const std::string& event_id) const {
    return index_.overrides_for(event_id);
}

DecisionCounts JournalAuditStore::decision_counts() const {
    return index_.decision_counts();
}
