#pragma once

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace tribunal {

// ---------------------------------------------------------------------------
// EvidenceStore - best-effort blob sideband for raw producer evidence.
//
// put() has idempotent overwrite semantics and reports failure by returning
// false; it must not block past `timeout`. get() returns nullopt for a
// missing or unreadable key. Neither throws.
// ---------------------------------------------------------------------------
class EvidenceStore {
public:
    virtual ~EvidenceStore() = default;

    virtual bool put(const std::string& key, const std::string& payload,
                     std::chrono::milliseconds timeout) = 0;

    virtual std::optional<std::string> get(const std::string& key) const = 0;
};

class MemoryEvidenceStore : public EvidenceStore {
public:
    bool put(const std::string& key, const std::string& payload,
             std::chrono::milliseconds timeout) override;
    std::optional<std::string> get(const std::string& key) const override;

    std::size_t size() const;

private:
    mutable std::mutex                           mtx_;
    std::unordered_map<std::string, std::string> blobs_;
};

// ---------------------------------------------------------------------------
// FileEvidenceStore - keys map to relative paths under a root directory.
// Writes land in a temp file that is renamed into place, so a reader never
// sees a half-written blob. Keys containing ".." or starting with '/' are
// refused.
// ---------------------------------------------------------------------------
class FileEvidenceStore : public EvidenceStore {
public:
    explicit FileEvidenceStore(std::filesystem::path root);

    bool put(const std::string& key, const std::string& payload,
             std::chrono::milliseconds timeout) override;
    std::optional<std::string> get(const std::string& key) const override;

    const std::filesystem::path& root() const { return root_; }

private:
    std::optional<std::filesystem::path> resolve(const std::string& key) const;

    std::filesystem::path root_;
};

} // namespace tribunal
