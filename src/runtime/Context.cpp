#include "runtime/Context.hpp"
#include "audit/JournalAuditStore.hpp"
#include "signal/HttpClassifier.hpp"
#include "signal/PatternDetector.hpp"

#include <iostream>

using namespace tribunal;

Context::Context(EngineConfig config, std::shared_ptr<FaceDetector> faces)
    : cfg(std::move(config)),
      signer(cfg.signing) {

    // ---------------------------------------------------------------------------
    // Policy packs. A missing file is not fatal: evaluations stamp "fallback".
    // ---------------------------------------------------------------------------
    if (!cfg.policy_pack_file.empty() && !registry.load_file(cfg.policy_pack_file)) {
        std::cerr << "[POLICY] No packs loaded from " << cfg.policy_pack_file
                  << ", running with policy_version=" << PolicyRegistry::FALLBACK_VERSION << "\n";
    }

    // ---------------------------------------------------------------------------
    // Storage
    // ---------------------------------------------------------------------------
    if (cfg.journal_path.empty()) {
        std::cout << "[LEDGER] In-memory store (nothing survives exit)\n";
        store = std::make_unique<MemoryAuditStore>();
    } else {
        store = std::make_unique<JournalAuditStore>(cfg.journal_path);
    }

    if (cfg.evidence_dir.empty()) {
        evidence = std::make_unique<MemoryEvidenceStore>();
    } else {
        evidence = std::make_unique<FileEvidenceStore>(cfg.evidence_dir);
    }

    // ---------------------------------------------------------------------------
    // Producers
    // ---------------------------------------------------------------------------
    CollectorProducers producers;
    producers.pattern = std::make_shared<PatternDetector>(registry);
    if (faces) producers.vision = std::make_shared<VisionProducer>(std::move(faces));
    if (cfg.classifier_enabled) producers.classifier = std::make_shared<HttpClassifier>(cfg.classifier);

    collector = std::make_unique<SignalCollector>(std::move(producers), cfg.producer_threads);
    ledger    = std::make_unique<AuditLedger>(*store, *evidence, signer, cfg.ledger);
    service   = std::make_unique<ComplianceService>(registry, *collector, *ledger, cfg.timeouts);

    std::cout << "[SERVICE] Ready policy_version=" << registry.active_version() << "\n";
}
