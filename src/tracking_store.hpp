#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

enum class FileStatus {
    Discovered,
    Pending,    // waiting for the stability window
    Stable,     // eligible for upload
    Sent,
    Failed      // last attempt errored; retried next cycle
};

const char* to_string(FileStatus s);
std::optional<FileStatus> file_status_from_string(const std::string& s);

struct TrackedFile {
    std::string path;
    uint64_t size = 0;
    int64_t modified_ns = 0;
    FileStatus status = FileStatus::Discovered;
    int64_t last_checked_ns = 0;
    int64_t stable_observed_ns = 0;  // 0: stability clock not running
    uint32_t attempts = 0;

    bool operator==(const TrackedFile& o) const;
    bool operator!=(const TrackedFile& o) const { return !(*this == o); }
};

// Durable path -> TrackedFile map. The whole map is rewritten atomically on
// every save, so a crash leaves either the old or the new file on disk.
class TrackingStore {
public:
    using Map = std::map<std::string, TrackedFile>;

    explicit TrackingStore(std::filesystem::path state_file);

    // Missing file means an empty store. Throws StorageError on a malformed file.
    void load();
    // Throws StorageError.
    void save() const;

    const Map& files() const { return files_; }
    Map& files() { return files_; }
    void replace(Map files) { files_ = std::move(files); }

    TrackedFile* find(const std::string& path);
    const TrackedFile* find(const std::string& path) const;

    const std::filesystem::path& state_file() const { return state_file_; }

private:
    std::filesystem::path state_file_;
    Map files_;
};
