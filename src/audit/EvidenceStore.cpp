#include "audit/EvidenceStore.hpp"

#include <atomic>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <thread>

using namespace tribunal;
namespace fs = std::filesystem;

// ============================================================
bool MemoryEvidenceStore::put(const std::string& key, const std::string& payload,
                              std::chrono::milliseconds /*timeout*/) {
    std::lock_guard<std::mutex> lock(mtx_);
    blobs_[key] = payload;
    return true;
}

std::optional<std::string> MemoryEvidenceStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = blobs_.find(key);
    if (it == blobs_.end()) return std::nullopt;
    return it->second;
}

std::size_t MemoryEvidenceStore::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return blobs_.size();
}

// ============================================================
FileEvidenceStore::FileEvidenceStore(fs::path root)
    : root_(std::move(root)) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        // Not fatal: every put() will fail and the ledger records the sentinel.
        std::cerr << "[EVIDENCE] Cannot create root " << root_ << ": " << ec.message() << "\n";
    }
}

std::optional<fs::path> FileEvidenceStore::resolve(const std::string& key) const {
    if (key.empty() || key.front() == '/') return std::nullopt;
    fs::path rel(key);
    for (const auto& part : rel) {
        if (part == "..") return std::nullopt;
    }
    return root_ / rel;
}

bool FileEvidenceStore::put(const std::string& key, const std::string& payload,
                            std::chrono::milliseconds /*timeout*/) {
    auto target = resolve(key);
    if (!target) {
        std::cerr << "[EVIDENCE] Refusing key " << key << "\n";
        return false;
    }

    std::error_code ec;
    fs::create_directories(target->parent_path(), ec);
    if (ec) {
        std::cerr << "[EVIDENCE] mkdir failed for " << key << ": " << ec.message() << "\n";
        return false;
    }

    // Unique temp name per writer so concurrent puts of one key never share a file.
    static std::atomic<uint64_t> seq{0};
    std::ostringstream tmp_name;
    tmp_name << target->filename().string() << ".tmp."
             << std::hash<std::thread::id>{}(std::this_thread::get_id()) << "." << seq.fetch_add(1);
    fs::path tmp = target->parent_path() / tmp_name.str();

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            std::cerr << "[EVIDENCE] open failed for " << key << "\n";
            return false;
        }
        out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        out.flush();
        if (!out.good()) {
            out.close();
            fs::remove(tmp, ec);
            std::cerr << "[EVIDENCE] write failed for " << key << "\n";
            return false;
        }
    }

    fs::rename(tmp, *target, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        std::cerr << "[EVIDENCE] rename failed for " << key << ": " << ec.message() << "\n";
        return false;
    }
    return true;
}

std::optional<std::string> FileEvidenceStore::get(const std::string& key) const {
    auto target = resolve(key);
    if (!target) return std::nullopt;

    std::ifstream in(*target, std::ios::binary);
    if (!in.is_open()) return std::nullopt;

    std::ostringstream buf;
    buf << in.rdbuf();
    return buf.str();
}
