#include "errors.hpp"
#include "multipart.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

namespace {

std::string form(const std::string& boundary, const std::string& game, const std::string& filename,
                 const std::string& payload) {
    return "--" + boundary + "\r\n"
           "Content-Disposition: form-data; name=\"game_name\"\r\n\r\n" + game + "\r\n"
           "--" + boundary + "\r\n"
           "Content-Disposition: form-data; name=\"file\"; filename=\"" + filename + "\"\r\n"
           "Content-Type: application/gzip\r\n\r\n" + payload + "\r\n"
           "--" + boundary + "--\r\n";
}

} // namespace

TEST(MultipartBoundary, ParsesQuotedAndBareForms) {
    EXPECT_EQ(multipart_boundary("multipart/form-data; boundary=abc123"), std::optional<std::string>("abc123"));
    EXPECT_EQ(multipart_boundary("Multipart/Form-Data; charset=utf-8; boundary=\"a b;c\""),
              std::optional<std::string>("a b;c"));
    EXPECT_FALSE(multipart_boundary("application/json").has_value());
    EXPECT_FALSE(multipart_boundary("multipart/form-data").has_value());
}

TEST(ParseMultipart, SplitsFieldsAndFile) {
    const std::string payload("\x1f\x8b\r\n--not-the-boundary\r\n\0tail", 29);
    const std::string body = form("XyZ", "valheim", "world.tar.gz", payload);

    auto parts = parse_multipart(body, "XyZ");
    ASSERT_EQ(parts.size(), 2u);

    const MultipartPart* game = find_part(parts, "game_name");
    ASSERT_NE(game, nullptr);
    EXPECT_EQ(game->data, "valheim");
    EXPECT_FALSE(game->filename.has_value());

    const MultipartPart* file = find_part(parts, "file");
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(file->filename, std::optional<std::string>("world.tar.gz"));
    EXPECT_EQ(file->content_type, "application/gzip");
    EXPECT_EQ(std::string(file->data), payload);

    EXPECT_EQ(find_part(parts, "sha256"), nullptr);
}

TEST(ParseMultipart, EmptyFilePartIsKept) {
    auto parts = parse_multipart(form("b", "g", "empty.zip", ""), "b");
    const MultipartPart* file = find_part(parts, "file");
    ASSERT_NE(file, nullptr);
    EXPECT_TRUE(file->data.empty());
}

TEST(ParseMultipart, MalformedBodiesAreValidationErrors) {
    EXPECT_THROW(parse_multipart("no boundary here", "b"), ValidationError);
    EXPECT_THROW(parse_multipart("--b\r\nContent-Disposition: form-data; name=\"x\"\r\n\r\nunterminated", "b"),
                 ValidationError);
    EXPECT_THROW(parse_multipart("--b\r\nContent-Disposition: form-data; name=\"x\"", "b"), ValidationError);
    EXPECT_THROW(parse_multipart("--bgarbage", "b"), ValidationError);
    EXPECT_THROW(parse_multipart("--b--", ""), ValidationError);
}

TEST(MappedFile, MapsWholeFile) {
    TempDir dir;
    write_file(dir / "body", "0123456789");
    MappedFile m(dir / "body");
    EXPECT_EQ(m.view(), "0123456789");

    write_file(dir / "empty", "");
    MappedFile e(dir / "empty");
    EXPECT_TRUE(e.view().empty());

    EXPECT_THROW(MappedFile(dir / "missing"), StorageError);
}
