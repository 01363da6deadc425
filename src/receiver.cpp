#include "receiver.hpp"
#include "errors.hpp"
#include "multipart.hpp"
#include "util.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <cctype>
#include <memory>
#include <optional>
#include <sstream>
#include <system_error>
#include <thread>

#include <unistd.h>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

static constexpr std::chrono::seconds kIdleTimeout{120};
static const char* kSpoolPrefix = "body-";

std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] == '+') {
            out += ' ';
        } else if (s[i] == '%' && i + 2 < s.size() &&
                   std::isxdigit((unsigned char)s[i + 1]) && std::isxdigit((unsigned char)s[i + 2])) {
            out += static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += s[i];
        }
    }
    return out;
}

std::map<std::string, std::string> parse_query(const std::string& query) {
    std::map<std::string, std::string> out;
    for (const auto& kv : split(query, '&')) {
        if (kv.empty()) continue;
        auto eq = kv.find('=');
        if (eq == std::string::npos) out[url_decode(kv)] = "";
        else out[url_decode(kv.substr(0, eq))] = url_decode(kv.substr(eq + 1));
    }
    return out;
}

std::string error_body(const std::string& detail) {
    return "{\"detail\":\"" + json_escape(detail) + "\"}";
}

static std::string stats_json(const CollectionStats& s) {
    std::ostringstream o;
    o << "{\"count\":" << s.count
      << ",\"total_size_bytes\":" << s.total_size_bytes
      << ",\"max_size_bytes\":" << s.max_size_bytes
      << ",\"max_size_gb\":" << s.max_size_gb
      << ",\"backups\":[";
    for (size_t i = 0; i < s.newest.size(); i++) {
        const auto& a = s.newest[i];
        if (i) o << ",";
        o << "{\"filename\":\"" << json_escape(a.filename) << "\""
          << ",\"size_bytes\":" << a.size_bytes
          << ",\"received_at\":\"" << format_rfc3339_utc(a.received_at) << "\"}";
    }
    o << "]}";
    return o.str();
}

ReceiverService::ReceiverService(ArchiveStore& store, Logger& log)
    : store_(store), log_(log) {
}

HttpReply ReceiverService::handle(const std::string& method, const std::string& target,
                                  const std::string& content_type, std::string_view body) {
    auto q = target.find('?');
    const std::string path = target.substr(0, q);
    const std::string query = (q == std::string::npos) ? "" : target.substr(q + 1);

    if (path == "/backup") {
        if (method != "POST") return {405, error_body("Method Not Allowed")};
        return upload(content_type, body);
    }
    if (path == "/stats") {
        if (method != "GET") return {405, error_body("Method Not Allowed")};
        return stats(parse_query(query));
    }
    if (path == "/health") {
        if (method != "GET") return {405, error_body("Method Not Allowed")};
        return health();
    }
    return {404, error_body("Not Found")};
}

HttpReply ReceiverService::upload(const std::string& content_type, std::string_view body) {
    auto boundary = multipart_boundary(content_type);
    if (!boundary) return {400, error_body("expected multipart/form-data")};

    std::string game_name;
    std::string filename;
    try {
        auto parts = parse_multipart(body, *boundary);
        const MultipartPart* game = find_part(parts, "game_name");
        const MultipartPart* file = find_part(parts, "file");
        const MultipartPart* digest = find_part(parts, "sha256");
        if (!game) throw ValidationError("missing field: game_name");
        if (!file || !file->filename) throw ValidationError("missing field: file");

        game_name = trim(std::string(game->data));
        filename = *file->filename;
        std::optional<std::string> sha256;
        if (digest) {
            std::string d = trim(std::string(digest->data));
            if (!d.empty()) sha256 = d;
        }

        log_.event("RECEIVING", {
            {"game_name", game_name},
            {"filename", filename},
            {"size", std::to_string(file->data.size())},
        });

        IngestResult r = store_.ingest(game_name, filename, file->data, sha256);

        std::ostringstream o;
        o << "{\"status\":\"success\""
          << ",\"message\":\"Backup received: " << json_escape(r.archive.filename) << "\""
          << ",\"game_name\":\"" << json_escape(game_name) << "\""
          << ",\"filename\":\"" << json_escape(r.archive.filename) << "\""
          << ",\"size_bytes\":" << r.archive.size_bytes
          << ",\"evicted\":" << r.evicted.size()
          << "}";
        return {200, o.str()};
    } catch (const ValidationError& e) {
        log_.event("UPLOAD_REJECTED", {{"game_name", game_name}, {"filename", filename}, {"reason", e.what()}});
        return {400, error_body(e.what())};
    } catch (const StorageError& e) {
        log_.error("ingest", e.what(), {{"game_name", game_name}, {"filename", filename}});
        return {500, error_body(std::string("Failed to save backup: ") + e.what())};
    }
}

HttpReply ReceiverService::stats(const std::map<std::string, std::string>& query) const {
    auto it = query.find("game_name");
    if (it != query.end() && !it->second.empty()) {
        auto s = store_.stats(it->second);
        if (!s) return {404, error_body("Unknown game: " + it->second)};
        return {200, "{\"" + json_escape(s->name) + "\":" + stats_json(*s) + "}"};
    }

    std::string out = "{";
    bool first = true;
    for (const auto& s : store_.all_stats()) {
        if (!first) out += ",";
        first = false;
        out += "\"" + json_escape(s.name) + "\":" + stats_json(s);
    }
    out += "}";
    return {200, out};
}

HttpReply ReceiverService::health() const {
    return {200, "{\"status\":\"healthy\",\"timestamp\":\"" + now_rfc3339_utc() + "\"}"};
}

ReceiverServer::ReceiverServer(const ReceiverConfig& cfg, ReceiverService& service, Logger& log)
    : cfg_(cfg), service_(service), log_(log), acceptor_(ioc_) {
    std::error_code fec;
    fs::create_directories(cfg_.spool_dir, fec);
    if (fec) throw StorageError("cannot create spool dir " + cfg_.spool_dir.string() + ": " + fec.message());
    for (fs::directory_iterator it(cfg_.spool_dir, fec), end; !fec && it != end; it.increment(fec)) {
        if (it->path().filename().string().rfind(kSpoolPrefix, 0) != 0) continue;
        std::error_code rec;
        fs::remove(it->path(), rec);
    }

    beast::error_code ec;
    auto address = asio::ip::make_address(cfg_.bind, ec);
    if (ec) throw ConfigError("bad bind address '" + cfg_.bind + "': " + ec.message());

    tcp::endpoint ep{address, cfg_.port};
    acceptor_.open(ep.protocol());
    acceptor_.set_option(asio::socket_base::reuse_address(true));
    acceptor_.bind(ep);
    acceptor_.listen(asio::socket_base::max_listen_connections);
    port_ = acceptor_.local_endpoint().port();
}

ReceiverServer::~ReceiverServer() {
    stop();
    std::unique_lock<std::mutex> lock(sessions_mtx_);
    sessions_cv_.wait(lock, [this] { return active_sessions_ == 0; });
}

void ReceiverServer::run() {
    do_accept();
    ioc_.run();
}

void ReceiverServer::stop() {
    ioc_.stop();
}

void ReceiverServer::do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec == asio::error::operation_aborted || !acceptor_.is_open()) return;
            log_.error("accept", ec.message());
        } else {
            {
                std::lock_guard<std::mutex> lock(sessions_mtx_);
                active_sessions_++;
            }
            auto holder = std::make_unique<tcp::socket>(std::move(socket));
            try {
                std::thread([this, h = std::move(holder)]() mutable {
                    session(std::move(*h));
                    h.reset();
                    session_done();
                }).detach();
            } catch (const std::system_error& e) {
                session_done();
                log_.error("accept", std::string("cannot start session thread: ") + e.what());
            }
        }
        do_accept();
    });
}

void ReceiverServer::session_done() {
    std::lock_guard<std::mutex> lock(sessions_mtx_);
    active_sessions_--;
    sessions_cv_.notify_all();
}

struct SpoolFile {
    fs::path path;
    void remove() {
        if (path.empty()) return;
        std::error_code ec;
        fs::remove(path, ec);
        path.clear();
    }
    ~SpoolFile() { remove(); }
};

void ReceiverServer::session(tcp::socket accepted) {
    // Each connection runs its own io_context so every step can carry a timeout.
    asio::io_context sioc;
    beast::tcp_stream stream(sioc);
    beast::error_code ec;

    std::string peer = "?";
    auto remote = accepted.remote_endpoint(ec);
    if (!ec) peer = remote.address().to_string() + ":" + std::to_string(remote.port());
    const auto protocol = accepted.local_endpoint(ec).protocol();
    if (ec) return;
    auto native = accepted.release(ec);
    if (ec) {
        log_.error("session", "socket release failed: " + ec.message(), {{"peer", peer}});
        return;
    }
    stream.socket().assign(protocol, native, ec);
    if (ec) {
        ::close(native);
        log_.error("session", "socket assign failed: " + ec.message(), {{"peer", peer}});
        return;
    }

    auto wait = [&]() {
        sioc.run();
        sioc.restart();
    };
    auto on_done = [&](beast::error_code e, std::size_t) { ec = e; };

    auto write_reply = [&](HttpReply reply, unsigned version, bool keep_alive) {
        http::response<http::string_body> res{static_cast<http::status>(reply.status), version};
        res.set(http::field::server, "archive_relay");
        res.set(http::field::content_type, "application/json");
        res.keep_alive(keep_alive);
        res.body() = std::move(reply.body);
        res.prepare_payload();

        stream.expires_after(kIdleTimeout);
        http::async_write(stream, res, on_done);
        wait();
    };

    beast::flat_buffer buffer;
    for (;;) {
        http::request_parser<http::file_body> parser;
        parser.body_limit(cfg_.max_upload_bytes);

        stream.expires_after(kIdleTimeout);
        http::async_read_header(stream, buffer, parser, on_done);
        wait();
        if (ec == http::error::end_of_stream || ec == beast::error::timeout) break;
        if (ec == http::error::body_limit) {
            // Content-Length alone is over the limit.
            write_reply(HttpReply{413, error_body("upload exceeds the configured limit")}, 11, false);
            break;
        }
        if (ec) {
            log_.error("session", "read header failed: " + ec.message(), {{"peer", peer}});
            break;
        }

        auto& req = parser.get();
        bool keep_alive = req.keep_alive();
        const unsigned version = req.version();
        const std::string method(req.method_string());
        const std::string target(req.target());
        const std::string content_type(req[http::field::content_type]);

        SpoolFile spool;
        std::optional<HttpReply> reply;
        if (req.method() == http::verb::post) {
            spool.path = cfg_.spool_dir / (std::string(kSpoolPrefix) + std::to_string(::getpid()) + "-" +
                                           std::to_string(++spool_counter_));
            req.body().open(spool.path.c_str(), beast::file_mode::write, ec);
            if (ec) {
                log_.error("session", "cannot open spool file: " + ec.message(), {{"path", spool.path.string()}});
                reply = HttpReply{500, error_body("cannot spool request body")};
                keep_alive = false;
            } else if (beast::iequals(req[http::field::expect], "100-continue")) {
                http::response<http::empty_body> cont{http::status::continue_, version};
                stream.expires_after(kIdleTimeout);
                http::async_write(stream, cont, on_done);
                wait();
                if (ec) break;
            }
        } else if (!parser.is_done()) {
            // Only uploads are spooled; any other body is read and discarded.
            req.body().open("/dev/null", beast::file_mode::write_existing, ec);
            if (ec) {
                log_.error("session", "cannot open /dev/null: " + ec.message(), {{"peer", peer}});
                break;
            }
        }

        if (!reply) {
            while (!parser.is_done()) {
                stream.expires_after(kIdleTimeout);
                http::async_read_some(stream, buffer, parser, on_done);
                wait();
                if (ec) break;
            }
            if (ec == http::error::body_limit) {
                reply = HttpReply{413, error_body("upload exceeds the configured limit")};
                keep_alive = false;
            } else if (ec) {
                log_.error("session", "read body failed: " + ec.message(), {{"peer", peer}, {"target", target}});
                break;
            }
        }

        if (!reply) {
            if (req.body().is_open()) req.body().close();
            try {
                std::optional<MappedFile> mapped;
                std::string_view body;
                if (!spool.path.empty()) {
                    mapped.emplace(spool.path);
                    body = mapped->view();
                }
                reply = service_.handle(method, target, content_type, body);
            } catch (const std::exception& e) {
                log_.error("request", e.what(), {{"peer", peer}, {"target", target}});
                reply = HttpReply{500, error_body(e.what())};
            }
        }

        log_.event("REQUEST", {
            {"peer", peer},
            {"method", method},
            {"target", target},
            {"status", std::to_string(reply->status)},
        });

        if (req.body().is_open()) req.body().close();
        spool.remove();
        write_reply(std::move(*reply), version, keep_alive);
        if (ec || !keep_alive) break;
    }

    beast::error_code shutdown_ec;
    stream.socket().shutdown(tcp::socket::shutdown_send, shutdown_ec);
    // not_connected after a peer reset; nothing to report.
}
