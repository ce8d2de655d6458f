#pragma once

#include <memory>

#include "audit/AuditLedger.hpp"
#include "audit/AuditStore.hpp"
#include "audit/EvidenceStore.hpp"
#include "crypto/Signer.hpp"
#include "policy/PolicyPack.hpp"
#include "runtime/ComplianceService.hpp"
#include "runtime/ConfigLoader.hpp"
#include "signal/SignalCollector.hpp"
#include "signal/VisionProducer.hpp"

namespace tribunal {

// Single authoritative owner of the engine's components.
// No globals. Everything is built here from one immutable EngineConfig and
// injected by reference. Constructed once in main().
//
// Construction order matters: stores and signer before the ledger, producers
// before the collector, all of them before the service. Members are declared
// in that order so destruction runs the other way (the collector's pool is
// joined before the registry its pattern producer reads goes away).
struct Context {
    const EngineConfig cfg;

    Signer         signer;
    PolicyRegistry registry;

    std::unique_ptr<AuditStore>    store;       // journal, or memory when journal_path is empty
    std::unique_ptr<EvidenceStore> evidence;    // directory, or memory when evidence.dir is empty

    std::unique_ptr<SignalCollector>   collector;
    std::unique_ptr<AuditLedger>       ledger;
    std::unique_ptr<ComplianceService> service;

    // `faces` may be null: the vision producer is then not configured and
    // every evaluation reports it as skipped.
    // Throws ConfigError / LedgerWriteFailure / IntegrityViolation on a bad setup.
    explicit Context(EngineConfig config, std::shared_ptr<FaceDetector> faces = nullptr);
};

} // namespace tribunal
