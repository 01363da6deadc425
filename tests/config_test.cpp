#include "config.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

TEST(ReceiverUrl, DefaultsPortAndPath) {
    auto u = parse_receiver_url("http://backup-host");
    EXPECT_EQ(u.host, "backup-host");
    EXPECT_EQ(u.port, "80");
    EXPECT_EQ(u.target, "/backup");

    u = parse_receiver_url("http://10.0.0.5:8080/ingest/backup");
    EXPECT_EQ(u.host, "10.0.0.5");
    EXPECT_EQ(u.port, "8080");
    EXPECT_EQ(u.target, "/ingest/backup");
}

TEST(ReceiverUrl, RejectsUnsupportedForms) {
    EXPECT_THROW(parse_receiver_url("https://host"), ConfigError);
    EXPECT_THROW(parse_receiver_url("http://:8080"), ConfigError);
    EXPECT_THROW(parse_receiver_url("http://host:abc"), ConfigError);
}

TEST(CollectionSpec, SplitsOnLastColon) {
    auto c = parse_collection_spec("valheim=/srv/backups/valheim:2");
    EXPECT_EQ(c.name, "valheim");
    EXPECT_EQ(c.archive_path.string(), "/srv/backups/valheim");
    EXPECT_DOUBLE_EQ(c.max_size_gb, 2.0);
    EXPECT_EQ(c.max_size_bytes, 2ull * 1024 * 1024 * 1024);

    c = parse_collection_spec("rust=/mnt/a:b/rust:0.5");
    EXPECT_EQ(c.archive_path.string(), "/mnt/a:b/rust");
    EXPECT_EQ(c.max_size_bytes, 512ull * 1024 * 1024);
}

TEST(CollectionSpec, NonPositiveBudgetDisablesRetention) {
    EXPECT_EQ(parse_collection_spec("x=/tmp/x:0").max_size_bytes, 0u);
    EXPECT_EQ(parse_collection_spec("x=/tmp/x:-1").max_size_bytes, 0u);
}

TEST(CollectionSpec, RejectsMalformed) {
    EXPECT_THROW(parse_collection_spec("no-equals:2"), ConfigError);
    EXPECT_THROW(parse_collection_spec("x=/tmp/x"), ConfigError);
    EXPECT_THROW(parse_collection_spec("x=/tmp/x:lots"), ConfigError);
    EXPECT_THROW(parse_collection_spec("bad name=/tmp/x:1"), ConfigError);
    EXPECT_THROW(parse_collection_spec("x=:1"), ConfigError);
    EXPECT_THROW(parse_collection_spec("x=/tmp/x:inf"), ConfigError);
    EXPECT_THROW(parse_collection_spec("x=/tmp/x:nan"), ConfigError);
    EXPECT_THROW(parse_collection_spec("x=/tmp/x:1e300"), ConfigError);
}

TEST(Collections, DuplicatesAndSharedRootsAreFatal) {
    EXPECT_THROW(validate_collections({}), ConfigError);
    EXPECT_THROW(validate_collections({parse_collection_spec("a=/srv/a:1"), parse_collection_spec("a=/srv/b:1")}),
                 ConfigError);
    EXPECT_THROW(validate_collections({parse_collection_spec("a=/srv/a:1"), parse_collection_spec("b=/srv/a/:1")}),
                 ConfigError);
    EXPECT_NO_THROW(validate_collections({parse_collection_spec("a=/srv/a:1"), parse_collection_spec("b=/srv/b:1")}));
}

TEST(SenderConfig, FlagsAndDefaults) {
    auto cfg = load_sender_config({"--mode", "sender", "--game-name", "valheim", "--watch-dir", "/data/backups",
                                   "--receiver-url", "http://recv:8080", "--stable-sec", "10"});
    EXPECT_EQ(cfg.game_name, "valheim");
    EXPECT_EQ(cfg.stable_sec, 10);
    EXPECT_EQ(cfg.interval_sec, 900);
    EXPECT_EQ(cfg.state_file.string(), "/data/backups/.archive_relay.state");
    ASSERT_EQ(cfg.extensions.size(), 3u);
    EXPECT_EQ(cfg.extensions[0], ".tar.gz");
}

TEST(SenderConfig, MissingRequiredFieldIsConfigError) {
    EXPECT_THROW(load_sender_config({"--game-name", "x", "--watch-dir", "/d"}), ConfigError);
    EXPECT_THROW(load_sender_config({"--game-name", "x", "--receiver-url", "http://r"}), ConfigError);
    EXPECT_THROW(load_sender_config({"--game-name"}), ConfigError);
    EXPECT_THROW(load_sender_config({"--game-name", "x", "--watch-dir", "/d", "--receiver-url", "http://r",
                                     "--bogus", "1"}),
                 ConfigError);
}

TEST(SenderConfig, ExtensionListIsTrimmed) {
    auto cfg = load_sender_config({"--game-name", "x", "--watch-dir", "/d", "--receiver-url", "http://r",
                                   "--extensions", " .zip , .7z ,"});
    ASSERT_EQ(cfg.extensions.size(), 2u);
    EXPECT_EQ(cfg.extensions[0], ".zip");
    EXPECT_EQ(cfg.extensions[1], ".7z");
}

TEST(ReceiverConfig, CollectionFlagsReplaceEnvironment) {
    ::setenv("COLLECTIONS", "env=/srv/env:1;other=/srv/other:2", 1);
    auto from_env = load_receiver_config({});
    EXPECT_EQ(from_env.collections.size(), 2u);

    auto cfg = load_receiver_config({"--collection", "a=/srv/a:1", "--collection", "b=/srv/b:3",
                                     "--port", "9090", "--max-upload-gb", "1"});
    ::unsetenv("COLLECTIONS");

    ASSERT_EQ(cfg.collections.size(), 2u);
    EXPECT_EQ(cfg.collections[0].name, "a");
    EXPECT_EQ(cfg.collections[1].name, "b");
    EXPECT_EQ(cfg.port, 9090);
    EXPECT_EQ(cfg.max_upload_bytes, 1024ull * 1024 * 1024);
    EXPECT_FALSE(cfg.spool_dir.empty());
}

TEST(ReceiverConfig, NoCollectionsIsConfigError) {
    ::unsetenv("COLLECTIONS");
    EXPECT_THROW(load_receiver_config({"--port", "8080"}), ConfigError);
    EXPECT_THROW(load_receiver_config({"--collection", "a=/srv/a:1", "--port", "70000"}), ConfigError);
}

TEST(ReceiverConfig, NonFiniteUploadLimitIsConfigError) {
    ::unsetenv("COLLECTIONS");
    EXPECT_THROW(load_receiver_config({"--collection", "a=/srv/a:1", "--max-upload-gb", "inf"}), ConfigError);
    EXPECT_THROW(load_receiver_config({"--collection", "a=/srv/a:1", "--max-upload-gb", "nan"}), ConfigError);

    ::setenv("MAX_UPLOAD_GB", "inf", 1);
    EXPECT_THROW(load_receiver_config({"--collection", "a=/srv/a:1"}), ConfigError);
    ::unsetenv("MAX_UPLOAD_GB");
}

TEST(ReceiverConfig, PortFromEnvironmentIsRangeChecked) {
    ::unsetenv("COLLECTIONS");
    ::setenv("RECEIVER_PORT", "70000", 1);
    EXPECT_THROW(load_receiver_config({"--collection", "a=/srv/a:1"}), ConfigError);
    ::setenv("RECEIVER_PORT", "9191", 1);
    EXPECT_EQ(load_receiver_config({"--collection", "a=/srv/a:1"}).port, 9191);
    ::unsetenv("RECEIVER_PORT");
}
