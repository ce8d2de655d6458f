// =============================================================================
// src/journal_store_test.cpp - Journal Store + File Evidence Tests
// =============================================================================
// Works in a scratch directory under the system temp dir; removed on exit.
// =============================================================================

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#include "audit/AuditLedger.hpp"
#include "audit/EvidenceStore.hpp"
#include "audit/JournalAuditStore.hpp"
#include "audit/LedgerErrors.hpp"
#include "testing/TestSuite.hpp"

using namespace tribunal;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

fs::path make_scratch_dir() {
    std::random_device rd;
    std::ostringstream name;
    name << "tribunal_journal_test_" << std::hex << rd() << rd();
    fs::path p = fs::temp_directory_path() / name.str();
    fs::create_directories(p);
    return p;
}

std::vector<std::string> read_lines(const fs::path& p) {
    std::vector<std::string> out;
    std::ifstream in(p);
    std::string line;
    while (std::getline(in, line)) out.push_back(line);
    return out;
}

void write_lines(const fs::path& p, const std::vector<std::string>& lines) {
    std::ofstream out(p, std::ios::trunc);
    for (const auto& l : lines) out << l << "\n";
}

PolicyDecision block_decision() {
    PolicyDecision d;
    d.decision         = Decision::BLOCK;
    d.risk_level       = RiskLevel::UNACCEPTABLE;
    d.policy_tags      = {"SocialScoring"};
    d.confidence_score = 90;
    d.explanation      = "Detected SocialScoring";
    d.policy_version   = "v3";
    return d;
}

} // namespace

class JournalStoreTest : public testing::TestSuite {
public:
    JournalStoreTest()
        : TestSuite("JOURNAL STORE + FILE EVIDENCE - UNIT TESTS"),
          dir_(make_scratch_dir()),
          signer_(SignerConfig{"journal-test-secret"}) {}

    ~JournalStoreTest() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void run_all_tests() {
        print_banner();

        test_replay();
        test_append_only_layout();
        test_tampered_row();
        test_malformed_line();
        test_duplicate_line();
        test_torn_tail();
        test_file_evidence();

        print_summary();
    }

private:
    fs::path dir_;
    Signer   signer_;

    void test_replay() {
        std::cout << "Testing Replay Across Reopen...\n";

        fs::path path = dir_ / "replay.jsonl";
        MemoryEvidenceStore evidence;
        std::string event_id, sig;

        {
            JournalAuditStore store(path.string());
            AuditLedger ledger(store, evidence, signer_);
            AuditEvent e = ledger.record(block_decision(), "input", "alice", "c1", "text", {});
            ledger.override_event(e.event_id, "officer", "appeal granted", "allow", 60);
            event_id = e.event_id;
            sig = e.signature;
        }

        JournalAuditStore reopened(path.string());
        AuditLedger ledger(reopened, evidence, signer_);
        AuditEvent e = ledger.get(event_id);
        CHECK(e.signature == sig, "event survives reopen byte-for-byte");
        CHECK(e.decision == Decision::BLOCK && e.policy_version == "v3", "fields survive reopen");

        ExportBundle b = ledger.export_bundle(event_id);
        CHECK(b.overrides.size() == 1 && b.overrides[0].duration == 60, "override survives reopen");
        CHECK(reopened.decision_counts().total == 1, "index rebuilt");

        ledger.record(block_decision(), "more", "bob", "c1", "text", {});
        CHECK(read_lines(path).size() == 3, "new rows append after replayed ones");
        std::cout << "\n";
    }

    void test_append_only_layout() {
        std::cout << "Testing Journal Line Layout...\n";

        fs::path path = dir_ / "layout.jsonl";
        MemoryEvidenceStore evidence;
        JournalAuditStore store(path.string());
        AuditLedger ledger(store, evidence, signer_);

        AuditEvent e = ledger.record(block_decision(), "never stored", "alice", "c1", "text", {});
        ledger.override_event(e.event_id, "officer", "reason", "flag");

        auto lines = read_lines(path);
        CHECK(lines.size() == 2, "one line per row");
        json first  = json::parse(lines.at(0));
        json second = json::parse(lines.at(1));
        CHECK(first["table"] == "audit_events" && first["row"]["event_id"] == e.event_id, "event row");
        CHECK(second["table"] == "audit_overrides" && second["row"]["original_event_id"] == e.event_id,
              "override row");
        CHECK(lines[0].find("never stored") == std::string::npos, "raw input absent from journal");
        std::cout << "\n";
    }

    void test_tampered_row() {
        std::cout << "Testing Tampered Journal Row...\n";

        fs::path path = dir_ / "tamper.jsonl";
        MemoryEvidenceStore evidence;
        std::string event_id;
        {
            JournalAuditStore store(path.string());
            AuditLedger ledger(store, evidence, signer_);
            event_id = ledger.record(block_decision(), "x", "alice", "c1", "text", {}).event_id;
        }

        auto lines = read_lines(path);
        json row = json::parse(lines.at(0));
        row["row"]["decision"] = "allow";
        lines[0] = row.dump();
        write_lines(path, lines);

        JournalAuditStore store(path.string());
        AuditLedger ledger(store, evidence, signer_);
        CHECK_THROWS(ledger.get(event_id), IntegrityViolation, "edited decision fails get");
        CHECK_THROWS(ledger.export_bundle(event_id), IntegrityViolation, "edited decision fails export");
        CHECK_THROWS(ledger.get("evt-20250101-missing0"), NotFound, "absent id still NotFound");
        std::cout << "\n";
    }

    void test_malformed_line() {
        std::cout << "Testing Malformed Journal Line...\n";

        fs::path path = dir_ / "malformed.jsonl";
        write_lines(path, {"{\"table\":\"audit_events\",\"row\":{\"event_id\":\"evt-x\"}}"});
        CHECK_THROWS(JournalAuditStore(path.string()), IntegrityViolation, "incomplete row refuses open");

        write_lines(path, {"not json at all"});
        CHECK_THROWS(JournalAuditStore(path.string()), IntegrityViolation, "garbage refuses open");

        write_lines(path, {"{\"table\":\"audit_somethingelse\",\"row\":{}}"});
        CHECK_THROWS(JournalAuditStore(path.string()), IntegrityViolation, "unknown table refuses open");
        std::cout << "\n";
    }

    void test_duplicate_line() {
        std::cout << "Testing Duplicate Journal Row...\n";

        fs::path path = dir_ / "dup.jsonl";
        MemoryEvidenceStore evidence;
        {
            JournalAuditStore store(path.string());
            AuditLedger ledger(store, evidence, signer_);
            ledger.record(block_decision(), "x", "alice", "c1", "text", {});
        }
        auto lines = read_lines(path);
        lines.push_back(lines.at(0));
        write_lines(path, lines);

        CHECK_THROWS(JournalAuditStore(path.string()), IntegrityViolation, "duplicate id refuses open");
        std::cout << "\n";
    }

    void test_torn_tail() {
        std::cout << "Testing Torn Final Line...\n";

        fs::path path = dir_ / "torn.jsonl";
        MemoryEvidenceStore evidence;
        std::string event_id;
        {
            JournalAuditStore store(path.string());
            AuditLedger ledger(store, evidence, signer_);
            event_id = ledger.record(block_decision(), "x", "alice", "c1", "text", {}).event_id;
        }
        const auto committed = fs::file_size(path);
        {
            std::ofstream out(path, std::ios::app | std::ios::binary);
            out << "{\"table\":\"audit_events\",\"row\":{\"event_id\":\"evt-2025";
        }

        bool opened = true;
        try {
            JournalAuditStore store(path.string());
            AuditLedger ledger(store, evidence, signer_);
            CHECK(ledger.get(event_id).event_id == event_id, "committed row survives");
            CHECK(fs::file_size(path) == committed, "torn tail cut off");

            ledger.record(block_decision(), "y", "bob", "c1", "text", {});
        } catch (const std::exception& e) {
            opened = false;
            std::cout << "  reopen failed: " << e.what() << "\n";
        }
        CHECK(opened, "journal reopens after an interrupted write");

        auto lines = read_lines(path);
        bool all_rows = lines.size() == 2;
        for (const auto& l : lines) all_rows = all_rows && json::parse(l).contains("row");
        CHECK(all_rows, "new row starts on a clean line");

        JournalAuditStore again(path.string());
        CHECK(again.decision_counts().total == 2, "both rows replay");

        std::vector<std::string> bad = {lines.at(0), "{\"table\":\"audit_events\",\"row\":{\"event_id\":\"evt-x"};
        write_lines(path, bad);
        CHECK_THROWS(JournalAuditStore(path.string()), IntegrityViolation, "terminated garbage still refuses open");
        std::cout << "\n";
    }

    void test_file_evidence() {
        std::cout << "Testing File Evidence Store...\n";

        FileEvidenceStore store(dir_ / "evidence");
        const std::string key = "evidence/evt-20250128-AbCdEf12/pattern.json";

        CHECK(store.put(key, "{\"a\":1}", std::chrono::milliseconds(100)), "put succeeds");
        CHECK(store.get(key) == std::optional<std::string>("{\"a\":1}"), "get returns payload");
        CHECK(store.put(key, "{\"a\":2}", std::chrono::milliseconds(100)), "overwrite succeeds");
        CHECK(store.get(key) == std::optional<std::string>("{\"a\":2}"), "overwrite is idempotent");
        CHECK(fs::exists(dir_ / "evidence" / key), "key maps to a relative path");

        bool no_temp_left = true;
        for (const auto& entry : fs::directory_iterator((dir_ / "evidence" / key).parent_path())) {
            if (entry.path().filename().string().find(".tmp.") != std::string::npos) no_temp_left = false;
        }
        CHECK(no_temp_left, "temp file renamed away");

        CHECK(!store.put("../escape.json", "x", std::chrono::milliseconds(100)), "parent traversal refused");
        CHECK(!store.put("/abs.json", "x", std::chrono::milliseconds(100)), "absolute key refused");
        CHECK(!store.get("evidence/none/pattern.json").has_value(), "missing key → nullopt");
        std::cout << "\n";
    }
};

int main() {
    JournalStoreTest tester;
    tester.run_all_tests();
    return tester.exit_code();
}
