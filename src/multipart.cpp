#include "multipart.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <functional>
#include <map>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

static std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower((unsigned char)c));
    return s;
}

// key=value / key="quoted value" pairs after the first ';'. Keys are lowercased.
static std::map<std::string, std::string> header_params(const std::string& value) {
    std::map<std::string, std::string> out;
    size_t i = value.find(';');
    while (i != std::string::npos && i < value.size()) {
        i++;
        while (i < value.size() && std::isspace((unsigned char)value[i])) i++;
        size_t eq = value.find('=', i);
        if (eq == std::string::npos) break;
        std::string key = lower(trim(value.substr(i, eq - i)));
        i = eq + 1;
        while (i < value.size() && std::isspace((unsigned char)value[i])) i++;

        std::string v;
        if (i < value.size() && value[i] == '"') {
            i++;
            while (i < value.size() && value[i] != '"') {
                if (value[i] == '\\' && i + 1 < value.size()) i++;
                v += value[i++];
            }
            if (i < value.size()) i++;  // closing quote
            i = value.find(';', i);
        } else {
            size_t end = value.find(';', i);
            v = trim(value.substr(i, end == std::string::npos ? std::string::npos : end - i));
            i = end;
        }
        out[key] = v;
    }
    return out;
}

std::optional<std::string> multipart_boundary(const std::string& content_type) {
    auto semi = content_type.find(';');
    if (lower(trim(content_type.substr(0, semi))) != "multipart/form-data") return std::nullopt;
    auto params = header_params(content_type);
    auto it = params.find("boundary");
    if (it == params.end() || it->second.empty() || it->second.size() > 200) return std::nullopt;
    return it->second;
}

static size_t search(std::string_view hay, size_t from, const std::string& needle) {
    if (from > hay.size()) return std::string_view::npos;
    auto it = std::search(hay.begin() + from, hay.end(),
                          std::boyer_moore_horspool_searcher(needle.begin(), needle.end()));
    if (it == hay.end()) return std::string_view::npos;
    return static_cast<size_t>(it - hay.begin());
}

std::vector<MultipartPart> parse_multipart(std::string_view body, const std::string& boundary) {
    if (boundary.empty()) throw ValidationError("empty multipart boundary");
    const std::string delim = "--" + boundary;
    const std::string next_delim = "\r\n" + delim;

    std::vector<MultipartPart> parts;
    size_t pos = search(body, 0, delim);
    if (pos == std::string_view::npos) throw ValidationError("multipart boundary not found");
    pos += delim.size();

    for (;;) {
        if (body.substr(pos, 2) == "--") break;
        while (pos < body.size() && (body[pos] == ' ' || body[pos] == '\t')) pos++;
        if (body.substr(pos, 2) != "\r\n") throw ValidationError("malformed multipart delimiter");
        pos += 2;

        std::string_view headers;
        if (body.substr(pos, 2) == "\r\n") {
            pos += 2;
        } else {
            size_t hdr_end = body.find("\r\n\r\n", pos);
            if (hdr_end == std::string_view::npos) throw ValidationError("unterminated multipart headers");
            headers = body.substr(pos, hdr_end - pos);
            pos = hdr_end + 4;
        }

        size_t end = search(body, pos, next_delim);
        if (end == std::string_view::npos) throw ValidationError("unterminated multipart part");

        MultipartPart part;
        part.data = body.substr(pos, end - pos);

        size_t h = 0;
        while (h < headers.size()) {
            size_t eol = headers.find("\r\n", h);
            std::string line(headers.substr(h, eol == std::string_view::npos ? std::string_view::npos : eol - h));
            h = (eol == std::string_view::npos) ? headers.size() : eol + 2;

            auto colon = line.find(':');
            if (colon == std::string::npos) continue;
            std::string key = lower(trim(line.substr(0, colon)));
            std::string value = trim(line.substr(colon + 1));
            if (key == "content-disposition") {
                auto params = header_params(value);
                auto n = params.find("name");
                if (n != params.end()) part.name = n->second;
                auto f = params.find("filename");
                if (f != params.end()) part.filename = f->second;
            } else if (key == "content-type") {
                part.content_type = value;
            }
        }
        parts.push_back(std::move(part));

        pos = end + next_delim.size();
    }
    return parts;
}

const MultipartPart* find_part(const std::vector<MultipartPart>& parts, const std::string& name) {
    for (const auto& p : parts) {
        if (p.name == name) return &p;
    }
    return nullptr;
}

MappedFile::MappedFile(const std::filesystem::path& p) {
    int fd = ::open(p.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) throw StorageError("open failed: " + p.string() + ": " + std::strerror(errno));

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        int err = errno;
        ::close(fd);
        throw StorageError("fstat failed: " + p.string() + ": " + std::strerror(err));
    }
    size_ = static_cast<size_t>(st.st_size);
    if (size_ > 0) {
        void* a = ::mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd, 0);
        if (a == MAP_FAILED) {
            int err = errno;
            ::close(fd);
            throw StorageError("mmap failed: " + p.string() + ": " + std::strerror(err));
        }
        addr_ = a;
    }
    ::close(fd);
}

MappedFile::~MappedFile() {
    if (addr_) ::munmap(addr_, size_);
}
