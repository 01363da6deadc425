#pragma once

#include "config.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

struct UploadRequest {
    std::filesystem::path path;
    std::string filename;
    std::string game_name;
    std::string sha256_hex;
    uint64_t size = 0;
};

struct UploadResponse {
    unsigned status = 0;
    std::string body;
    std::optional<uint64_t> acked_size;
};

// Moves one file to the receiver. Throws TransportError when no response
// could be obtained; a non-2xx response is returned, not thrown.
class ArchiveTransport {
public:
    virtual ~ArchiveTransport() = default;
    virtual UploadResponse upload(const UploadRequest& req) = 0;
};

// multipart/form-data POST over HTTP/1.1 (Boost.Beast).
class HttpUploader final : public ArchiveTransport {
public:
    HttpUploader(ReceiverUrl url, std::chrono::seconds timeout);
    UploadResponse upload(const UploadRequest& req) override;

private:
    ReceiverUrl url_;
    std::chrono::seconds timeout_;
};

std::string make_multipart_boundary();
