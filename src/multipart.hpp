#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct MultipartPart {
    std::string name;
    std::optional<std::string> filename;
    std::string content_type;
    std::string_view data;   // points into the parsed body
};

// Boundary parameter of a multipart/form-data content type, if any.
std::optional<std::string> multipart_boundary(const std::string& content_type);

// Splits a multipart/form-data body. Throws ValidationError on malformed input.
std::vector<MultipartPart> parse_multipart(std::string_view body, const std::string& boundary);

const MultipartPart* find_part(const std::vector<MultipartPart>& parts, const std::string& name);

// Read-only mmap of a whole file. Throws StorageError.
class MappedFile {
public:
    explicit MappedFile(const std::filesystem::path& p);
    ~MappedFile();

    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;

    std::string_view view() const {
        return std::string_view(static_cast<const char*>(addr_), size_);
    }

private:
    void* addr_ = nullptr;
    size_t size_ = 0;
};
