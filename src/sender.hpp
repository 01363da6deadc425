#pragma once

#include "config.hpp"
#include "logger.hpp"
#include "reconciler.hpp"
#include "tracking_store.hpp"
#include "uploader.hpp"

#include <mutex>
#include <optional>

struct CycleReport {
    bool scan_failed = false;
    bool persist_failed = false;  // the cycle stopped at the first failed save
    ReconcileStats reconcile;
    size_t sent = 0;
    size_t failed = 0;
    size_t deferred = 0;   // changed or vanished between reconcile and upload
};

// One reconcile + upload pass per call. Only one pass may be active at a time.
class Sender {
public:
    Sender(const SenderConfig& cfg, TrackingStore& store, ArchiveTransport& transport, Logger& log);

    // nullopt when another cycle is already running.
    std::optional<CycleReport> run_cycle();
    std::optional<CycleReport> run_cycle(Clock::time_point now);

private:
    enum class Outcome { Sent, Failed, Deferred };

    Outcome upload_one(TrackedFile& tf);
    void persist(const char* where);

    SenderConfig cfg_;
    TrackingStore& store_;
    ArchiveTransport& transport_;
    Logger& log_;
    std::mutex cycle_mutex_;
};
