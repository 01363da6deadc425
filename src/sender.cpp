#include "sender.hpp"
#include "errors.hpp"

#include <cstdio>
#include <vector>

static std::string size_mb(uint64_t bytes) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", static_cast<double>(bytes) / (1024.0 * 1024.0));
    return buf;
}

Sender::Sender(const SenderConfig& cfg, TrackingStore& store, ArchiveTransport& transport, Logger& log)
    : cfg_(cfg), store_(store), transport_(transport), log_(log) {
}

std::optional<CycleReport> Sender::run_cycle() {
    return run_cycle(Clock::now());
}

void Sender::persist(const char* where) {
    try {
        store_.save();
    } catch (const StorageError& e) {
        log_.error(where, e.what(), {{"state_file", store_.state_file().string()}});
        throw;
    }
}

std::optional<CycleReport> Sender::run_cycle(Clock::time_point now) {
    std::unique_lock<std::mutex> guard(cycle_mutex_, std::try_to_lock);
    if (!guard.owns_lock()) {
        log_.event("CYCLE_SKIPPED", {{"game_name", cfg_.game_name}, {"reason", "previous cycle still running"}});
        return std::nullopt;
    }

    CycleReport report;

    std::vector<FileObservation> listing;
    try {
        listing = scan_watch_dir(cfg_.watch_dir, cfg_.extensions);
    } catch (const StorageError& e) {
        log_.error("reconcile", e.what(), {{"watch_dir", cfg_.watch_dir.string()}});
        report.scan_failed = true;
        return report;
    }

    report.reconcile = reconcile(store_, listing, now, std::chrono::seconds(cfg_.stable_sec));
    log_.event("RECONCILED", {
        {"game_name", cfg_.game_name},
        {"tracked", std::to_string(store_.files().size())},
        {"added", std::to_string(report.reconcile.added)},
        {"removed", std::to_string(report.reconcile.removed)},
        {"changed", std::to_string(report.reconcile.changed)},
        {"became_stable", std::to_string(report.reconcile.became_stable)},
    });

    // Without a durable reconciliation a Sent mark could not be persisted either.
    try {
        persist("reconcile");
    } catch (const StorageError&) {
        report.persist_failed = true;
        return report;
    }

    std::vector<std::string> eligible;
    for (const auto& kv : store_.files()) {
        if (kv.second.status == FileStatus::Stable || kv.second.status == FileStatus::Failed) {
            eligible.push_back(kv.first);
        }
    }

    for (const auto& path : eligible) {
        TrackedFile* tf = store_.find(path);
        if (!tf) continue;

        switch (upload_one(*tf)) {
            case Outcome::Sent:     report.sent++; break;
            case Outcome::Failed:   report.failed++; break;
            case Outcome::Deferred: report.deferred++; break;
        }

        // An outcome that is not on disk must not be followed by another upload.
        try {
            persist("upload");
        } catch (const StorageError&) {
            report.persist_failed = true;
            break;
        }
    }

    if (report.sent || report.failed || report.deferred) {
        log_.event("CYCLE_DONE", {
            {"game_name", cfg_.game_name},
            {"sent", std::to_string(report.sent)},
            {"failed", std::to_string(report.failed)},
            {"deferred", std::to_string(report.deferred)},
        });
    }
    return report;
}

Sender::Outcome Sender::upload_one(TrackedFile& tf) {
    const fs::path p = tf.path;

    std::error_code ec;
    uint64_t size = static_cast<uint64_t>(fs::file_size(p, ec));
    if (ec) {
        tf.status = FileStatus::Pending;
        tf.stable_observed_ns = 0;
        log_.event("UPLOAD_DEFERRED", {{"path", tf.path}, {"reason", "file vanished: " + ec.message()}});
        return Outcome::Deferred;
    }
    auto mtime = fs::last_write_time(p, ec);
    if (ec) {
        tf.status = FileStatus::Pending;
        tf.stable_observed_ns = 0;
        log_.event("UPLOAD_DEFERRED", {{"path", tf.path}, {"reason", "stat failed: " + ec.message()}});
        return Outcome::Deferred;
    }
    int64_t mtime_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(mtime.time_since_epoch()).count();
    if (size != tf.size || mtime_ns != tf.modified_ns) {
        tf.size = size;
        tf.modified_ns = mtime_ns;
        tf.status = FileStatus::Pending;
        tf.stable_observed_ns = 0;
        log_.event("UPLOAD_DEFERRED", {{"path", tf.path}, {"reason", "file changed after it was marked stable"}});
        return Outcome::Deferred;
    }

    UploadRequest req;
    req.path = p;
    req.filename = p.filename().string();
    req.game_name = cfg_.game_name;
    req.size = tf.size;

    tf.attempts++;
    log_.event("UPLOAD_START", {
        {"path", tf.path},
        {"size_mb", size_mb(tf.size)},
        {"attempt", std::to_string(tf.attempts)},
        {"receiver", cfg_.receiver_url},
    });

    try {
        auto hr = sha256_file(p);
        if (hr.size != tf.size) {
            throw StorageError("file size changed while hashing");
        }
        req.sha256_hex = hr.sha256_hex;

        UploadResponse res = transport_.upload(req);
        if (res.status < 200 || res.status >= 300) {
            throw TransportError("receiver answered " + std::to_string(res.status) + ": " + res.body);
        }
        if (res.acked_size && *res.acked_size != tf.size) {
            throw TransportError("receiver acknowledged " + std::to_string(*res.acked_size) +
                                 " bytes, sent " + std::to_string(tf.size));
        }
    } catch (const std::exception& e) {
        tf.status = FileStatus::Failed;
        log_.error("upload", e.what(), {{"path", tf.path}, {"attempt", std::to_string(tf.attempts)}});
        return Outcome::Failed;
    }

    tf.status = FileStatus::Sent;
    log_.event("UPLOAD_OK", {{"path", tf.path}, {"size", std::to_string(tf.size)}});
    return Outcome::Sent;
}
