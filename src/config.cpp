#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <cctype>
#include <cmath>
#include <set>

// Largest budget that still converts to a byte count without overflow.
static constexpr double kMaxGb = 1024.0 * 1024.0 * 1024.0;

uint64_t gb_to_bytes(double gb) {
    if (!(gb > 0)) return 0;
    if (gb > kMaxGb) gb = kMaxGb;
    return static_cast<uint64_t>(std::llround(gb * 1024.0 * 1024.0 * 1024.0));
}

ReceiverUrl parse_receiver_url(const std::string& url) {
    const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        throw ConfigError("receiver_url must start with http:// : " + url);
    }
    std::string rest = url.substr(scheme.size());

    ReceiverUrl out;
    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) out.target = rest.substr(slash);
    if (out.target.empty() || out.target == "/") out.target = "/backup";

    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        out.host = authority.substr(0, colon);
        out.port = authority.substr(colon + 1);
        if (out.port.empty()) throw ConfigError("empty port in receiver_url: " + url);
        for (char c : out.port) {
            if (!std::isdigit((unsigned char)c)) throw ConfigError("bad port in receiver_url: " + url);
        }
    } else {
        out.host = authority;
    }
    if (out.host.empty()) throw ConfigError("missing host in receiver_url: " + url);
    return out;
}

static bool is_valid_collection_name(const std::string& name) {
    if (name.empty()) return false;
    for (char c : name) {
        if (!std::isalnum((unsigned char)c) && c != '_' && c != '-' && c != '.') return false;
    }
    return true;
}

CollectionConfig parse_collection_spec(const std::string& spec) {
    auto eq = spec.find('=');
    if (eq == std::string::npos) throw ConfigError("collection spec needs NAME=PATH:MAX_GB: " + spec);
    auto colon = spec.rfind(':');
    if (colon == std::string::npos || colon < eq) {
        throw ConfigError("collection spec needs NAME=PATH:MAX_GB: " + spec);
    }

    CollectionConfig c;
    c.name = trim(spec.substr(0, eq));
    c.archive_path = trim(spec.substr(eq + 1, colon - eq - 1));
    std::string gb = trim(spec.substr(colon + 1));

    if (!is_valid_collection_name(c.name)) throw ConfigError("invalid collection name: '" + c.name + "'");
    if (c.archive_path.empty()) throw ConfigError("missing archive path for collection " + c.name);
    try {
        size_t used = 0;
        c.max_size_gb = std::stod(gb, &used);
        if (used != gb.size() || !std::isfinite(c.max_size_gb) || c.max_size_gb > kMaxGb) {
            throw ConfigError("bad max_size_gb for collection " + c.name + ": " + gb);
        }
    } catch (const std::logic_error&) {
        throw ConfigError("bad max_size_gb for collection " + c.name + ": " + gb);
    }
    c.max_size_bytes = gb_to_bytes(c.max_size_gb);
    return c;
}

void validate_collections(const std::vector<CollectionConfig>& collections) {
    if (collections.empty()) throw ConfigError("no collections configured");
    std::set<std::string> names;
    std::set<std::string> roots;
    for (const auto& c : collections) {
        if (!names.insert(c.name).second) throw ConfigError("duplicate collection: " + c.name);
        auto root = fs::absolute(c.archive_path).lexically_normal().string();
        if (!root.empty() && root.back() == '/' && root.size() > 1) root.pop_back();
        if (!roots.insert(root).second) {
            throw ConfigError("archive path shared by more than one collection: " + root);
        }
    }
}

static int parse_int_flag(const std::string& flag, const std::string& v) {
    try {
        return std::stoi(v);
    } catch (const std::logic_error&) {
        throw ConfigError("bad value for " + flag + ": " + v);
    }
}

static double parse_double_flag(const std::string& flag, const std::string& v) {
    double d = 0;
    try {
        d = std::stod(v);
    } catch (const std::logic_error&) {
        throw ConfigError("bad value for " + flag + ": " + v);
    }
    if (!std::isfinite(d)) throw ConfigError("bad value for " + flag + ": " + v);
    return d;
}

static unsigned short checked_port(int port) {
    if (port < 0 || port > 65535) throw ConfigError("port out of range: " + std::to_string(port));
    return static_cast<unsigned short>(port);
}

static std::vector<std::string> parse_extensions(const std::string& v) {
    std::vector<std::string> out;
    for (auto& e : split(v, ',')) {
        auto t = trim(e);
        if (!t.empty()) out.push_back(t);
    }
    return out;
}

SenderConfig load_sender_config(const std::vector<std::string>& args) {
    SenderConfig cfg;

    if (auto v = getenv_string("GAME_NAME")) cfg.game_name = *v;
    if (auto v = getenv_string("WATCH_DIR")) cfg.watch_dir = *v;
    if (auto v = getenv_string("RECEIVER_URL")) cfg.receiver_url = *v;
    if (auto v = getenv_string("BACKUP_EXTENSIONS")) cfg.extensions = parse_extensions(*v);
    if (auto v = getenv_string("STATE_FILE")) cfg.state_file = *v;
    if (auto v = getenv_int("INTERVAL_SEC")) cfg.interval_sec = *v;
    if (auto v = getenv_int("STABLE_SEC")) cfg.stable_sec = *v;
    if (auto v = getenv_int("UPLOAD_TIMEOUT_SEC")) cfg.timeout_sec = *v;
    if (auto v = getenv_bool("ONCE")) cfg.once = *v;
    if (auto v = getenv_string("LOG_FILE")) cfg.log_file = *v;
    if (auto v = getenv_string("LOG_DIR")) cfg.log_dir = *v;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& a = args[i];
        auto need = [&](const char* flag) -> std::string {
            if (i + 1 >= args.size()) throw ConfigError(std::string("missing value for ") + flag);
            return args[++i];
        };
        if (a == "--mode") need("--mode");
        else if (a == "--game-name") cfg.game_name = need("--game-name");
        else if (a == "--watch-dir") cfg.watch_dir = need("--watch-dir");
        else if (a == "--receiver-url") cfg.receiver_url = need("--receiver-url");
        else if (a == "--extensions") cfg.extensions = parse_extensions(need("--extensions"));
        else if (a == "--state-file") cfg.state_file = need("--state-file");
        else if (a == "--interval-sec") cfg.interval_sec = parse_int_flag(a, need("--interval-sec"));
        else if (a == "--stable-sec") cfg.stable_sec = parse_int_flag(a, need("--stable-sec"));
        else if (a == "--timeout-sec") cfg.timeout_sec = parse_int_flag(a, need("--timeout-sec"));
        else if (a == "--once") cfg.once = (need("--once") != "0");
        else if (a == "--log-file") cfg.log_file = need("--log-file");
        else if (a == "--log-dir") cfg.log_dir = need("--log-dir");
        else throw ConfigError("unknown arg: " + a);
    }

    if (cfg.game_name.empty()) throw ConfigError("missing required field: game_name");
    if (cfg.watch_dir.empty()) throw ConfigError("missing required field: watch_directory");
    if (cfg.receiver_url.empty()) throw ConfigError("missing required field: receiver_url");
    if (cfg.extensions.empty()) throw ConfigError("backup_extensions is empty");
    if (cfg.interval_sec <= 0) throw ConfigError("interval_sec must be positive");
    if (cfg.stable_sec < 0) throw ConfigError("stable_sec must not be negative");
    if (cfg.timeout_sec <= 0) throw ConfigError("timeout_sec must be positive");
    parse_receiver_url(cfg.receiver_url);

    if (cfg.state_file.empty()) cfg.state_file = cfg.watch_dir / ".archive_relay.state";
    return cfg;
}

ReceiverConfig load_receiver_config(const std::vector<std::string>& args) {
    ReceiverConfig cfg;
    double max_upload_gb = 64;

    if (auto v = getenv_string("RECEIVER_BIND")) cfg.bind = *v;
    if (auto v = getenv_int("RECEIVER_PORT")) cfg.port = checked_port(*v);
    if (auto v = getenv_string("COLLECTIONS")) {
        for (auto& spec : split(*v, ';')) {
            if (!trim(spec).empty()) cfg.collections.push_back(parse_collection_spec(spec));
        }
    }
    if (auto v = getenv_string("SPOOL_DIR")) cfg.spool_dir = *v;
    if (auto v = getenv_double("MAX_UPLOAD_GB")) max_upload_gb = *v;
    if (auto v = getenv_string("LOG_FILE")) cfg.log_file = *v;
    if (auto v = getenv_string("LOG_DIR")) cfg.log_dir = *v;

    bool flag_collections = false;
    for (size_t i = 0; i < args.size(); i++) {
        const std::string& a = args[i];
        auto need = [&](const char* flag) -> std::string {
            if (i + 1 >= args.size()) throw ConfigError(std::string("missing value for ") + flag);
            return args[++i];
        };
        if (a == "--mode") need("--mode");
        else if (a == "--bind") cfg.bind = need("--bind");
        else if (a == "--port") cfg.port = checked_port(parse_int_flag(a, need("--port")));
        else if (a == "--collection") {
            // Flags replace the COLLECTIONS environment list.
            if (!flag_collections) cfg.collections.clear();
            flag_collections = true;
            cfg.collections.push_back(parse_collection_spec(need("--collection")));
        }
        else if (a == "--spool-dir") cfg.spool_dir = need("--spool-dir");
        else if (a == "--max-upload-gb") max_upload_gb = parse_double_flag(a, need("--max-upload-gb"));
        else if (a == "--log-file") cfg.log_file = need("--log-file");
        else if (a == "--log-dir") cfg.log_dir = need("--log-dir");
        else throw ConfigError("unknown arg: " + a);
    }

    validate_collections(cfg.collections);
    if (!(max_upload_gb > 0) || !std::isfinite(max_upload_gb) || max_upload_gb > kMaxGb) {
        throw ConfigError("max_upload_gb must be a positive number");
    }
    cfg.max_upload_bytes = gb_to_bytes(max_upload_gb);
    if (cfg.spool_dir.empty()) cfg.spool_dir = fs::temp_directory_path() / "archive_relay-spool";
    return cfg;
}
