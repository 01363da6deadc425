#include "reconciler.hpp"
#include "errors.hpp"

#include <algorithm>

bool has_backup_extension(const std::string& name, const std::vector<std::string>& extensions) {
    return std::any_of(extensions.begin(), extensions.end(),
                       [&](const std::string& ext) { return ends_with(name, ext); });
}

std::vector<FileObservation> scan_watch_dir(const fs::path& dir,
                                            const std::vector<std::string>& extensions) {
    std::vector<FileObservation> out;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) throw StorageError("cannot read " + dir.string() + ": " + ec.message());

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        const auto& e = *it;
        const auto name = e.path().filename().string();
        if (name.empty() || name[0] == '.') continue;
        if (!has_backup_extension(name, extensions)) continue;

        std::error_code sec;
        if (!e.is_regular_file(sec)) continue;

        FileObservation obs;
        auto abs = fs::absolute(e.path(), sec);
        if (sec) continue;
        obs.path = abs.lexically_normal().string();
        obs.size = static_cast<uint64_t>(fs::file_size(e.path(), sec));
        if (sec) continue;  // vanished between readdir and stat
        auto mtime = fs::last_write_time(e.path(), sec);
        if (sec) continue;
        obs.modified_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                              mtime.time_since_epoch()).count();
        out.push_back(std::move(obs));
    }
    if (ec) throw StorageError("cannot read " + dir.string() + ": " + ec.message());
    return out;
}

bool observe(TrackedFile& tf, const FileObservation& obs, Clock::time_point now,
             std::chrono::nanoseconds window) {
    const int64_t now_ns = to_unix_ns(now);
    tf.last_checked_ns = now_ns;

    if (tf.status == FileStatus::Sent) return false;

    if (tf.size != obs.size || tf.modified_ns != obs.modified_ns) {
        tf.size = obs.size;
        tf.modified_ns = obs.modified_ns;
        tf.status = FileStatus::Pending;
        tf.stable_observed_ns = 0;
        return false;
    }

    // Failed and Stable stay eligible while unchanged.
    if (tf.status == FileStatus::Failed || tf.status == FileStatus::Stable) return false;

    if (tf.stable_observed_ns == 0) {
        tf.stable_observed_ns = now_ns;
        tf.status = FileStatus::Pending;
        return false;
    }

    if (now_ns - tf.stable_observed_ns >= window.count()) {
        tf.status = FileStatus::Stable;
        return true;
    }
    tf.status = FileStatus::Pending;
    return false;
}

ReconcileStats reconcile(TrackingStore& store, const std::vector<FileObservation>& listing,
                         Clock::time_point now, std::chrono::nanoseconds window) {
    ReconcileStats stats;
    TrackingStore::Map next;

    for (const auto& obs : listing) {
        const TrackedFile* prev = store.find(obs.path);
        if (!prev) {
            TrackedFile tf;
            tf.path = obs.path;
            tf.size = obs.size;
            tf.modified_ns = obs.modified_ns;
            tf.status = FileStatus::Discovered;
            tf.last_checked_ns = to_unix_ns(now);
            next[obs.path] = tf;
            stats.added++;
            continue;
        }

        TrackedFile tf = *prev;
        if (tf.status != FileStatus::Sent &&
            (tf.size != obs.size || tf.modified_ns != obs.modified_ns)) {
            stats.changed++;
        }
        if (observe(tf, obs, now, window)) stats.became_stable++;
        next[obs.path] = tf;
    }

    for (const auto& kv : store.files()) {
        if (next.find(kv.first) == next.end()) stats.removed++;
    }

    store.replace(std::move(next));
    return stats;
}
