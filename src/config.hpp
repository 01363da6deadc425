#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

struct SenderConfig {
    std::string game_name;
    fs::path watch_dir;
    std::string receiver_url;
    std::vector<std::string> extensions{".tar.gz", ".zip", ".tar"};
    fs::path state_file;        // defaults to <watch_dir>/.archive_relay.state
    int interval_sec = 900;
    int stable_sec = 6;
    int timeout_sec = 600;
    bool once = false;
    std::string log_file;
    fs::path log_dir;
};

struct CollectionConfig {
    std::string name;
    fs::path archive_path;
    double max_size_gb = 0;
    uint64_t max_size_bytes = 0;  // 0 disables retention
};

struct ReceiverConfig {
    std::string bind = "0.0.0.0";
    unsigned short port = 8080;
    std::vector<CollectionConfig> collections;
    fs::path spool_dir;
    uint64_t max_upload_bytes = 0;
    std::string log_file;
    fs::path log_dir;
};

struct ReceiverUrl {
    std::string host;
    std::string port = "80";
    std::string target = "/backup";
};

uint64_t gb_to_bytes(double gb);

// http://host[:port][/path]. Throws ConfigError.
ReceiverUrl parse_receiver_url(const std::string& url);

// NAME=PATH:MAX_GB, split on the last ':'. Throws ConfigError.
CollectionConfig parse_collection_spec(const std::string& spec);

// Duplicate names and shared archive roots are rejected. Throws ConfigError.
void validate_collections(const std::vector<CollectionConfig>& collections);

// Environment first, then flags. Throws ConfigError.
SenderConfig load_sender_config(const std::vector<std::string>& args);
ReceiverConfig load_receiver_config(const std::vector<std::string>& args);
