#pragma once

#include <openssl/evp.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

using Clock = std::chrono::system_clock;

std::optional<std::string> getenv_string(const char* key);
std::optional<int> getenv_int(const char* key);
std::optional<double> getenv_double(const char* key);
std::optional<bool> getenv_bool(const char* key);

std::string now_rfc3339_utc();
std::string format_rfc3339_utc(Clock::time_point tp);

int64_t to_unix_ns(Clock::time_point tp);
Clock::time_point from_unix_ns(int64_t ns);

std::string json_escape(const std::string& s);

// Minimal JSON "parse": flat objects only, first match wins.
std::optional<std::string> json_get_string_field(const std::string& json, const std::string& key);
std::optional<uint64_t> json_get_u64_field(const std::string& json, const std::string& key);

bool ends_with(const std::string& s, const std::string& suf);
std::vector<std::string> split(const std::string& s, char sep);
std::string trim(const std::string& s);

// Backslash escaping of tab, newline, carriage return and backslash.
std::string escape_tsv_field(const std::string& s);
std::optional<std::string> unescape_tsv_field(const std::string& s);

bool hex_equal_case_insensitive(const std::string& a, const std::string& b);

// Writes content to <path>.tmp, fsyncs it and renames it over path.
// Throws StorageError.
void atomic_write_text(const fs::path& path, const std::string& content);

// Incremental SHA-256 over OpenSSL EVP.
class Sha256 {
public:
    Sha256();
    void update(const void* data, size_t len);
    std::string hex_digest();

private:
    struct EvpMdCtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };
    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx_;
};

struct HashResult {
    std::string sha256_hex;
    uint64_t size = 0;
};

HashResult sha256_file(const fs::path& p);
