#include "archive_store.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "receiver.hpp"
#include "sender.hpp"
#include "ticker.hpp"
#include "tracking_store.hpp"
#include "uploader.hpp"
#include "util.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

static Ticker* g_ticker = nullptr;

static void on_stop_signal(int) {
    if (g_ticker) g_ticker->stop();
}

static void usage() {
    std::cerr <<
R"(archive_relay (C++17)
  --mode sender|receiver

Sender:
  --game-name NAME                 (GAME_NAME)
  --watch-dir DIR                  (WATCH_DIR)
  --receiver-url http://host:port  (RECEIVER_URL)
  [--extensions .tar.gz,.zip,.tar] (BACKUP_EXTENSIONS)
  [--state-file PATH]              (STATE_FILE, default <watch-dir>/.archive_relay.state)
  [--interval-sec 900]             (INTERVAL_SEC)
  [--stable-sec 6]                 (STABLE_SEC)
  [--timeout-sec 600]              (UPLOAD_TIMEOUT_SEC)
  [--once 1|0]                     (ONCE)

Receiver:
  [--bind 0.0.0.0]                 (RECEIVER_BIND)
  [--port 8080]                    (RECEIVER_PORT)
  --collection NAME=PATH:MAX_GB    (COLLECTIONS, ';'-separated; repeatable flag)
  [--spool-dir DIR]                (SPOOL_DIR)
  [--max-upload-gb 64]             (MAX_UPLOAD_GB)

Both:
  [--log-file /path/to/log]        (LOG_FILE)
  [--log-dir /path/to/dir]         (LOG_DIR, writes <mode>.log)

Sender:
  - Every interval, reconcile the watch dir against the tracking state and
    upload files whose size and mtime held still for --stable-sec.
Receiver:
  - POST /backup stores an archive under its collection and trims the
    collection to MAX_GB, oldest first. GET /stats and GET /health.
)";
}

static void open_log(Logger& log, const std::string& log_file, const fs::path& log_dir, const std::string& mode) {
    if (!log_file.empty()) {
        log.set_file(log_file);
    } else if (!log_dir.empty()) {
        log.set_file(log_dir / (mode + ".log"));
    }
}

static int run_sender(const std::vector<std::string>& args) {
    SenderConfig cfg = load_sender_config(args);

    Logger log;
    open_log(log, cfg.log_file, cfg.log_dir, "sender");

    try {
        fs::create_directories(cfg.watch_dir);
    } catch (const std::exception& e) {
        std::cerr << "Failed to create watch directory: " << e.what() << "\n";
        return 2;
    }

    TrackingStore store(cfg.state_file);
    store.load();

    HttpUploader uploader(parse_receiver_url(cfg.receiver_url), std::chrono::seconds(cfg.timeout_sec));
    Sender sender(cfg, store, uploader, log);

    log.event("SERVICE_START", {
        {"mode", "sender"},
        {"game_name", cfg.game_name},
        {"watch_dir", cfg.watch_dir.string()},
        {"receiver_url", cfg.receiver_url},
        {"state_file", cfg.state_file.string()},
        {"tracked", std::to_string(store.files().size())},
    });

    if (cfg.once) {
        auto report = sender.run_cycle();
        return (report && !report->scan_failed && !report->persist_failed) ? 0 : 1;
    }

    Ticker ticker(std::chrono::seconds(cfg.interval_sec));
    g_ticker = &ticker;
    std::signal(SIGINT, on_stop_signal);
    std::signal(SIGTERM, on_stop_signal);

    ticker.run([&] { sender.run_cycle(); });

    g_ticker = nullptr;
    log.event("SERVICE_STOP", {
        {"mode", "sender"},
        {"ticks", std::to_string(ticker.ticks())},
        {"dropped_ticks", std::to_string(ticker.dropped())},
    });
    return 0;
}

static int run_receiver(const std::vector<std::string>& args) {
    ReceiverConfig cfg = load_receiver_config(args);

    Logger log;
    open_log(log, cfg.log_file, cfg.log_dir, "receiver");

    CollectionRegistry registry(cfg.collections);
    ArchiveStore store(registry, log);
    store.open();

    ReceiverService service(store, log);
    ReceiverServer server(cfg, service, log);

    for (const auto& c : registry.all()) {
        log.event("COLLECTION", {
            {"game_name", c.name},
            {"archive_path", c.archive_path.string()},
            {"max_size_bytes", std::to_string(c.max_size_bytes)},
        });
    }
    log.event("SERVICE_START", {
        {"mode", "receiver"},
        {"bind", cfg.bind},
        {"port", std::to_string(server.port())},
        {"spool_dir", cfg.spool_dir.string()},
    });

    boost::asio::io_context signal_ioc;
    boost::asio::signal_set signals(signal_ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int sig) {
        if (ec) return;
        log.event("SIGNAL", {{"signal", std::to_string(sig)}});
        server.stop();
    });
    std::thread signal_thread([&] { signal_ioc.run(); });

    try {
        server.run();
    } catch (...) {
        signal_ioc.stop();
        signal_thread.join();
        throw;
    }

    signal_ioc.stop();
    signal_thread.join();
    log.event("SERVICE_STOP", {{"mode", "receiver"}});
    return 0;
}

int main(int argc, char** argv) {
    std::string mode;
    std::vector<std::string> args(argv + 1, argv + argc);

    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--help" || args[i] == "-h") { usage(); return 0; }
        if (args[i] == "--mode" && i + 1 < args.size()) mode = args[i + 1];
    }

    if (mode != "sender" && mode != "receiver") {
        std::cerr << "Invalid or missing --mode\n";
        usage();
        return 2;
    }

    try {
        return mode == "sender" ? run_sender(args) : run_receiver(args);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        usage();
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << "\n";
        return 1;
    }
}
