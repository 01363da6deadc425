#pragma once

#include "archive_store.hpp"
#include "config.hpp"
#include "logger.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

struct HttpReply {
    unsigned status = 200;
    std::string body;
};

// Routes one request to the archive store. Knows nothing about sockets.
class ReceiverService {
public:
    ReceiverService(ArchiveStore& store, Logger& log);

    HttpReply handle(const std::string& method, const std::string& target,
                     const std::string& content_type, std::string_view body);

    HttpReply upload(const std::string& content_type, std::string_view body);
    HttpReply stats(const std::map<std::string, std::string>& query) const;
    HttpReply health() const;

private:
    ArchiveStore& store_;
    Logger& log_;
};

std::string url_decode(const std::string& s);
std::map<std::string, std::string> parse_query(const std::string& query);
std::string error_body(const std::string& detail);

// HTTP/1.1 front end: async accept loop on run()'s thread, one thread per
// connection. Request bodies are spooled to disk and memory-mapped.
class ReceiverServer {
public:
    ReceiverServer(const ReceiverConfig& cfg, ReceiverService& service, Logger& log);
    ~ReceiverServer();

    ReceiverServer(const ReceiverServer&) = delete;
    ReceiverServer& operator=(const ReceiverServer&) = delete;

    unsigned short port() const { return port_; }

    // Blocks until stop().
    void run();
    // Thread-safe.
    void stop();

private:
    void do_accept();
    void session(boost::asio::ip::tcp::socket socket);
    void session_done();

    ReceiverConfig cfg_;
    ReceiverService& service_;
    Logger& log_;
    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    unsigned short port_ = 0;
    std::atomic<uint64_t> spool_counter_{0};

    std::mutex sessions_mtx_;
    std::condition_variable sessions_cv_;
    size_t active_sessions_ = 0;
};
