#include "util.hpp"
#include "errors.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

std::optional<std::string> getenv_string(const char* key) {
    const char* v = std::getenv(key);
    if (!v || *v == '\0') return std::nullopt;
    return std::string(v);
}

std::optional<int> getenv_int(const char* key) {
    auto v = getenv_string(key);
    if (!v) return std::nullopt;
    try {
        return std::stoi(*v);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<double> getenv_double(const char* key) {
    auto v = getenv_string(key);
    if (!v) return std::nullopt;
    try {
        return std::stod(*v);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<bool> getenv_bool(const char* key) {
    auto v = getenv_string(key);
    if (!v) return std::nullopt;
    return (*v != "0");
}

std::string format_rfc3339_utc(Clock::time_point tp) {
    std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
    return std::string(buf);
}

std::string now_rfc3339_utc() {
    return format_rfc3339_utc(Clock::now());
}

int64_t to_unix_ns(Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

Clock::time_point from_unix_ns(int64_t ns) {
    return Clock::time_point(std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(ns)));
}

std::string json_escape(const std::string& s) {
    std::ostringstream o;
    for (char c : s) {
        switch (c) {
            case '\\': o << "\\\\"; break;
            case '"':  o << "\\\""; break;
            case '\b': o << "\\b";  break;
            case '\f': o << "\\f";  break;
            case '\n': o << "\\n";  break;
            case '\r': o << "\\r";  break;
            case '\t': o << "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char esc[8];
                    std::snprintf(esc, sizeof(esc), "\\u%04x", static_cast<unsigned>(c));
                    o << esc;
                } else {
                    o << c;
                }
        }
    }
    return o.str();
}

std::optional<std::string> json_get_string_field(const std::string& json, const std::string& key) {
    auto k = "\"" + key + "\"";
    auto pos = json.find(k);
    if (pos == std::string::npos) return std::nullopt;
    pos = json.find(':', pos + k.size());
    if (pos == std::string::npos) return std::nullopt;
    pos++;
    while (pos < json.size() && std::isspace((unsigned char)json[pos])) pos++;
    if (pos >= json.size() || json[pos] != '"') return std::nullopt;
    std::string out;
    for (size_t i = pos + 1; i < json.size(); i++) {
        char c = json[i];
        if (c == '"') return out;
        if (c == '\\' && i + 1 < json.size()) {
            char n = json[++i];
            switch (n) {
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                default:  out += n;    break;
            }
            continue;
        }
        out += c;
    }
    return std::nullopt;
}

std::optional<uint64_t> json_get_u64_field(const std::string& json, const std::string& key) {
    auto k = "\"" + key + "\"";
    auto pos = json.find(k);
    if (pos == std::string::npos) return std::nullopt;
    pos = json.find(':', pos + k.size());
    if (pos == std::string::npos) return std::nullopt;
    pos++; // after :
    while (pos < json.size() && std::isspace((unsigned char)json[pos])) pos++;
    size_t end = pos;
    while (end < json.size() && (std::isdigit((unsigned char)json[end]))) end++;
    if (end == pos) return std::nullopt;
    try {
        return (uint64_t)std::stoull(json.substr(pos, end - pos));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool ends_with(const std::string& s, const std::string& suf) {
    if (s.size() < suf.size()) return false;
    return s.compare(s.size() - suf.size(), suf.size(), suf) == 0;
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == sep) {
            out.push_back(cur);
            cur.clear();
        } else {
            cur += c;
        }
    }
    out.push_back(cur);
    return out;
}

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) b++;
    while (e > b && std::isspace((unsigned char)s[e - 1])) e--;
    return s.substr(b, e - b);
}

std::string escape_tsv_field(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\t': out += "\\t";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            default:   out += c;
        }
    }
    return out;
}

std::optional<std::string> unescape_tsv_field(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] != '\\') {
            out += s[i];
            continue;
        }
        if (i + 1 >= s.size()) return std::nullopt;
        switch (s[++i]) {
            case '\\': out += '\\'; break;
            case 't':  out += '\t'; break;
            case 'n':  out += '\n'; break;
            case 'r':  out += '\r'; break;
            default:   return std::nullopt;
        }
    }
    return out;
}

bool hex_equal_case_insensitive(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        char ca = a[i];
        char cb = b[i];
        if (ca >= 'A' && ca <= 'F') ca = static_cast<char>(ca - 'A' + 'a');
        if (cb >= 'A' && cb <= 'F') cb = static_cast<char>(cb - 'A' + 'a');
        if (ca != cb) return false;
    }
    return true;
}

void atomic_write_text(const fs::path& path, const std::string& content) {
    fs::path tmp = path;
    tmp += ".tmp";

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw StorageError("open failed: " + tmp.string() + ": " + std::strerror(errno));
    }
    size_t off = 0;
    while (off < content.size()) {
        ssize_t n = ::write(fd, content.data() + off, content.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            throw StorageError("write failed: " + tmp.string() + ": " + std::strerror(err));
        }
        off += static_cast<size_t>(n);
    }
    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        throw StorageError("fsync failed: " + tmp.string() + ": " + std::strerror(err));
    }
    ::close(fd);

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        throw StorageError("rename failed: " + tmp.string() + " -> " + path.string() + ": " + ec.message());
    }
}

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
}

void Sha256::update(const void* data, size_t len) {
    if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

std::string Sha256::hex_digest() {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), out, &out_len) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }

    std::string hex;
    hex.reserve(out_len * 2);
    for (unsigned int i = 0; i < out_len; i++) {
        hex += "0123456789abcdef"[out[i] >> 4];
        hex += "0123456789abcdef"[out[i] & 0x0F];
    }
    return hex;
}

HashResult sha256_file(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) throw StorageError("open failed: " + p.string());

    Sha256 h;
    std::vector<char> buf(1 << 20); // 1 MiB
    uint64_t total = 0;
    while (f) {
        f.read(buf.data(), buf.size());
        std::streamsize n = f.gcount();
        if (n > 0) {
            h.update(buf.data(), (size_t)n);
            total += (uint64_t)n;
        }
    }
    if (f.bad()) throw StorageError("read failed: " + p.string());

    return { h.hex_digest(), total };
}
