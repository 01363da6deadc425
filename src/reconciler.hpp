#pragma once

#include "tracking_store.hpp"
#include "util.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

struct FileObservation {
    std::string path;
    uint64_t size = 0;
    int64_t modified_ns = 0;
};

struct ReconcileStats {
    size_t added = 0;
    size_t removed = 0;
    size_t changed = 0;
    size_t became_stable = 0;
};

bool has_backup_extension(const std::string& name, const std::vector<std::string>& extensions);

// Regular files directly inside dir whose name ends with one of extensions.
// Dotfiles are skipped. Throws StorageError if the directory cannot be read.
std::vector<FileObservation> scan_watch_dir(const fs::path& dir,
                                            const std::vector<std::string>& extensions);

// Advances one tracked entry through the stability gate for one observation.
// Returns true if the entry became Stable.
bool observe(TrackedFile& tf, const FileObservation& obs, Clock::time_point now,
             std::chrono::nanoseconds window);

// Brings the store in line with listing. The new map is built aside and
// swapped in at the end.
ReconcileStats reconcile(TrackingStore& store, const std::vector<FileObservation>& listing,
                         Clock::time_point now, std::chrono::nanoseconds window);
