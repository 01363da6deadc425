#pragma once

#include "config.hpp"
#include "logger.hpp"
#include "util.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct StoredArchive {
    std::string collection;
    std::string filename;
    uint64_t size_bytes = 0;
    fs::path stored_path;
    Clock::time_point received_at;
    uint64_t sequence = 0;
};

struct CollectionStats {
    std::string name;
    size_t count = 0;
    uint64_t total_size_bytes = 0;
    uint64_t max_size_bytes = 0;
    double max_size_gb = 0;
    std::vector<StoredArchive> newest;   // newest first
};

struct IngestResult {
    StoredArchive archive;
    std::vector<StoredArchive> evicted;
    bool replaced = false;
};

// Immutable name -> collection lookup, built once at startup.
class CollectionRegistry {
public:
    explicit CollectionRegistry(std::vector<CollectionConfig> collections);

    const CollectionConfig* find(const std::string& name) const;
    const std::vector<CollectionConfig>& all() const { return collections_; }

private:
    std::vector<CollectionConfig> collections_;
    std::map<std::string, size_t> index_;
};

// Stored archives per collection plus the size-bounded FIFO retention over them.
// Each collection has its own lock; rename, registration, eviction and the
// ledger rewrite happen under it.
class ArchiveStore {
public:
    static constexpr const char* kLedgerName = ".archive-ledger";
    static constexpr const char* kTempPrefix = ".upload-";
    static constexpr size_t kNewestInStats = 10;

    ArchiveStore(const CollectionRegistry& registry, Logger& log,
                 std::function<Clock::time_point()> clock = &Clock::now);

    // Creates archive roots, drops stale temp files, rebuilds bookkeeping from
    // the ledger and the directory listing, and applies retention.
    // Throws StorageError.
    void open();

    // Throws ValidationError (nothing written) or StorageError.
    IngestResult ingest(const std::string& collection, const std::string& filename,
                        std::string_view payload,
                        const std::optional<std::string>& sha256_hex = std::nullopt);

    std::optional<CollectionStats> stats(const std::string& collection) const;
    std::vector<CollectionStats> all_stats() const;

    // Oldest first.
    std::vector<StoredArchive> archives(const std::string& collection) const;

    const CollectionRegistry& registry() const { return registry_; }

private:
    struct Collection {
        const CollectionConfig* cfg = nullptr;
        mutable std::mutex mtx;
        std::deque<StoredArchive> archives;
        uint64_t total = 0;
        uint64_t next_seq = 1;
    };

    Collection& collection_for(const std::string& name) const;
    void rebuild(Collection& c);
    std::vector<StoredArchive> enforce_retention(Collection& c);
    void write_ledger(const Collection& c);
    void register_archive(Collection& c, StoredArchive a);
    CollectionStats stats_locked(const Collection& c) const;

    const CollectionRegistry& registry_;
    Logger& log_;
    std::function<Clock::time_point()> clock_;
    std::map<std::string, std::unique_ptr<Collection>> collections_;
    std::atomic<uint64_t> temp_counter_{0};
};

// Final path component with either separator; empty if unusable.
std::string sanitize_archive_name(const std::string& name);
