#include "errors.hpp"
#include "util.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

TEST(JsonEscape, EscapesQuotesAndControlCharacters) {
    EXPECT_EQ(json_escape("a\"b\\c"), "a\\\"b\\\\c");
    EXPECT_EQ(json_escape("line\nnext\t"), "line\\nnext\\t");
    EXPECT_EQ(json_escape(std::string("\x01", 1)), "\\u0001");
}

TEST(JsonFields, ReadsFlatObject) {
    const std::string body = R"({"status":"success","message":"Backup received: \"x\"","size_bytes": 1024})";
    EXPECT_EQ(json_get_string_field(body, "status"), std::optional<std::string>("success"));
    EXPECT_EQ(json_get_string_field(body, "message"), std::optional<std::string>("Backup received: \"x\""));
    EXPECT_EQ(json_get_u64_field(body, "size_bytes"), std::optional<uint64_t>(1024));
    EXPECT_FALSE(json_get_u64_field(body, "status").has_value());
    EXPECT_FALSE(json_get_string_field(body, "missing").has_value());
}

TEST(TsvField, EscapeIsReversible) {
    const std::string nasty = "dir\\with\ttab\nand\rreturn";
    auto escaped = escape_tsv_field(nasty);
    EXPECT_EQ(escaped.find('\t'), std::string::npos);
    EXPECT_EQ(escaped.find('\n'), std::string::npos);
    EXPECT_EQ(unescape_tsv_field(escaped), std::optional<std::string>(nasty));
}

TEST(TsvField, RejectsDanglingOrUnknownEscape) {
    EXPECT_FALSE(unescape_tsv_field("abc\\").has_value());
    EXPECT_FALSE(unescape_tsv_field("a\\qb").has_value());
}

TEST(Strings, SplitKeepsEmptyFields) {
    auto parts = split("a,,b,", ',');
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(parts[3], "");
    EXPECT_EQ(trim("  x y \n"), "x y");
    EXPECT_TRUE(ends_with("db.tar.gz", ".tar.gz"));
    EXPECT_FALSE(ends_with("gz", ".tar.gz"));
}

TEST(Time, UnixNanosecondsRoundTrip) {
    const int64_t ns = 1700000000123456789LL;
    EXPECT_EQ(to_unix_ns(from_unix_ns(ns)), ns);
    EXPECT_EQ(format_rfc3339_utc(from_unix_ns(0)), "1970-01-01T00:00:00Z");
}

TEST(Sha256, KnownDigest) {
    Sha256 h;
    h.update("ab", 2);
    h.update("c", 1);
    EXPECT_EQ(h.hex_digest(), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_TRUE(hex_equal_case_insensitive("BA7816BF", "ba7816bf"));
    EXPECT_FALSE(hex_equal_case_insensitive("ba7816bf", "ba7816be"));
}

TEST(Sha256, HashesFileAndReportsSize) {
    TempDir dir;
    write_file(dir / "abc.tar", "abc");
    auto r = sha256_file(dir / "abc.tar");
    EXPECT_EQ(r.size, 3u);
    EXPECT_EQ(r.sha256_hex, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(AtomicWrite, ReplacesContentAndLeavesNoTemp) {
    TempDir dir;
    const fs::path p = dir / "state";
    atomic_write_text(p, "first\n");
    atomic_write_text(p, "second\n");
    EXPECT_EQ(read_file(p), "second\n");
    EXPECT_FALSE(fs::exists(dir / "state.tmp"));
}

TEST(AtomicWrite, MissingDirectoryIsStorageError) {
    TempDir dir;
    EXPECT_THROW(atomic_write_text(dir / "no" / "such" / "state", "x"), StorageError);
}
