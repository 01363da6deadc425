#include "uploader.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <array>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <vector>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

std::string make_multipart_boundary() {
    std::array<unsigned char, 12> bytes{};
    bool ok = false;
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (urandom) {
        urandom.read(reinterpret_cast<char*>(bytes.data()), bytes.size());
        ok = (urandom.gcount() == static_cast<std::streamsize>(bytes.size()));
    }
    if (!ok) {
        std::random_device rd;
        for (auto& b : bytes) b = static_cast<unsigned char>(rd());
    }

    std::ostringstream o;
    o << "----archive_relay-" << std::hex << std::setfill('0');
    for (unsigned char b : bytes) o << std::setw(2) << static_cast<int>(b);
    return o.str();
}

static std::string quote_filename(const std::string& name) {
    std::string out;
    for (char c : name) {
        if (c == '"') out += "%22";
        else if (c == '\r' || c == '\n') out += ' ';
        else out += c;
    }
    return out;
}

HttpUploader::HttpUploader(ReceiverUrl url, std::chrono::seconds timeout)
    : url_(std::move(url)), timeout_(timeout) {
}

UploadResponse HttpUploader::upload(const UploadRequest& req) {
    std::ifstream in(req.path, std::ios::binary);
    if (!in) throw StorageError("open failed: " + req.path.string());

    const std::string boundary = make_multipart_boundary();
    std::string head =
        "--" + boundary + "\r\n"
        "Content-Disposition: form-data; name=\"game_name\"\r\n\r\n" +
        req.game_name + "\r\n"
        "--" + boundary + "\r\n"
        "Content-Disposition: form-data; name=\"sha256\"\r\n\r\n" +
        req.sha256_hex + "\r\n"
        "--" + boundary + "\r\n"
        "Content-Disposition: form-data; name=\"file\"; filename=\"" + quote_filename(req.filename) + "\"\r\n"
        "Content-Type: application/octet-stream\r\n\r\n";
    const std::string tail = "\r\n--" + boundary + "--\r\n";

    asio::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    beast::error_code ec;

    // Each step is issued async so tcp_stream's expiry applies, then run to completion.
    auto run = [&](const char* what) {
        ioc.run();
        ioc.restart();
        if (ec) throw TransportError(std::string(what) + " failed: " + ec.message());
    };

    auto results = resolver.resolve(url_.host, url_.port, ec);
    if (ec) throw TransportError("resolve " + url_.host + " failed: " + ec.message());

    stream.expires_after(timeout_);
    stream.async_connect(results, [&](beast::error_code e, const tcp::endpoint&) { ec = e; });
    run("connect");

    http::request<http::empty_body> hreq{http::verb::post, url_.target, 11};
    hreq.set(http::field::host, url_.host + ":" + url_.port);
    hreq.set(http::field::user_agent, "archive_relay");
    hreq.set(http::field::content_type, "multipart/form-data; boundary=" + boundary);
    hreq.keep_alive(false);
    hreq.content_length(head.size() + req.size + tail.size());

    http::request_serializer<http::empty_body> sr{hreq};
    stream.expires_after(timeout_);
    http::async_write_header(stream, sr, [&](beast::error_code e, std::size_t) { ec = e; });
    run("write header");

    auto write_raw = [&](const char* data, size_t n) {
        stream.expires_after(timeout_);
        asio::async_write(stream, asio::buffer(data, n),
                          [&](beast::error_code e, std::size_t) { ec = e; });
        run("write body");
    };

    write_raw(head.data(), head.size());
    std::vector<char> buf(1 << 20); // 1 MiB
    uint64_t sent = 0;
    while (sent < req.size) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(buf.size(), req.size - sent));
        in.read(buf.data(), static_cast<std::streamsize>(want));
        std::streamsize n = in.gcount();
        if (n <= 0) throw StorageError("file shrank during upload: " + req.path.string());
        write_raw(buf.data(), static_cast<size_t>(n));
        sent += static_cast<uint64_t>(n);
    }
    write_raw(tail.data(), tail.size());

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    stream.expires_after(timeout_);
    http::async_read(stream, buffer, res, [&](beast::error_code e, std::size_t) { ec = e; });
    run("read response");

    beast::error_code shutdown_ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);
    // not_connected happens when the peer closed first; nothing to report.

    UploadResponse out;
    out.status = res.result_int();
    out.body = res.body();
    out.acked_size = json_get_u64_field(out.body, "size_bytes");
    return out;
}
