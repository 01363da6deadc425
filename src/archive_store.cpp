#include "archive_store.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <set>
#include <sstream>
#include <tuple>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

// Removes the file on scope exit unless released.
struct TempFile {
    fs::path path;
    bool keep = false;
    ~TempFile() {
        if (keep) return;
        std::error_code ec;
        fs::remove(path, ec);
    }
};

static void write_payload(const fs::path& p, std::string_view payload, Sha256& h) {
    int fd = ::open(p.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) throw StorageError("open failed: " + p.string() + ": " + std::strerror(errno));

    const size_t chunk = 8 << 20;
    size_t off = 0;
    while (off < payload.size()) {
        size_t want = std::min(chunk, payload.size() - off);
        ssize_t n = ::write(fd, payload.data() + off, want);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            throw StorageError("write failed: " + p.string() + ": " + std::strerror(err));
        }
        h.update(payload.data() + off, static_cast<size_t>(n));
        off += static_cast<size_t>(n);
    }
    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        throw StorageError("fsync failed: " + p.string() + ": " + std::strerror(err));
    }
    if (::close(fd) != 0) {
        throw StorageError("close failed: " + p.string() + ": " + std::strerror(errno));
    }
}

static std::string fsync_dir(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) return std::strerror(errno);
    std::string err;
    if (::fsync(fd) != 0) err = std::strerror(errno);
    ::close(fd);
    return err;
}

static std::string gb_string(uint64_t bytes) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0));
    return buf;
}

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::string sanitize_archive_name(const std::string& name) {
    auto cut = name.find_last_of("/\\");
    std::string base = (cut == std::string::npos) ? name : name.substr(cut + 1);
    base = trim(base);
    if (base.empty() || base[0] == '.') return "";
    for (char c : base) {
        if (static_cast<unsigned char>(c) < 0x20) return "";
    }
    return base;
}

CollectionRegistry::CollectionRegistry(std::vector<CollectionConfig> collections)
    : collections_(std::move(collections)) {
    for (size_t i = 0; i < collections_.size(); i++) {
        if (!index_.emplace(collections_[i].name, i).second) {
            throw ConfigError("duplicate collection: " + collections_[i].name);
        }
    }
}

const CollectionConfig* CollectionRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    return it == index_.end() ? nullptr : &collections_[it->second];
}

ArchiveStore::ArchiveStore(const CollectionRegistry& registry, Logger& log,
                           std::function<Clock::time_point()> clock)
    : registry_(registry), log_(log), clock_(std::move(clock)) {
    for (const auto& cfg : registry_.all()) {
        auto c = std::make_unique<Collection>();
        c->cfg = &cfg;
        collections_.emplace(cfg.name, std::move(c));
    }
}

ArchiveStore::Collection& ArchiveStore::collection_for(const std::string& name) const {
    auto it = collections_.find(name);
    if (it == collections_.end()) throw ValidationError("Unknown game: " + name);
    return *it->second;
}

void ArchiveStore::open() {
    for (auto& kv : collections_) {
        Collection& c = *kv.second;
        std::lock_guard<std::mutex> lock(c.mtx);
        rebuild(c);
    }
}

void ArchiveStore::rebuild(Collection& c) {
    const fs::path root = c.cfg->archive_path;
    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) throw StorageError("cannot create " + root.string() + ": " + ec.message());

    struct OnDisk {
        uint64_t size = 0;
        int64_t mtime_ns = 0;
    };
    std::map<std::string, OnDisk> disk;

    fs::directory_iterator it(root, ec);
    if (ec) throw StorageError("cannot read " + root.string() + ": " + ec.message());
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        const fs::path p = it->path();
        const std::string name = p.filename().string();
        if (starts_with(name, kTempPrefix)) {
            std::error_code rec;
            fs::remove(p, rec);
            if (rec) log_.error("rebuild", "cannot remove stale upload: " + rec.message(), {{"path", p.string()}});
            else log_.event("STALE_UPLOAD_REMOVED", {{"game_name", c.cfg->name}, {"path", p.string()}});
            continue;
        }
        if (name.empty() || name[0] == '.') continue;

        struct stat st{};
        if (::stat(p.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) continue;
        OnDisk d;
        d.size = static_cast<uint64_t>(st.st_size);
        d.mtime_ns = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL + st.st_mtim.tv_nsec;
        disk[name] = d;
    }
    if (ec) throw StorageError("cannot read " + root.string() + ": " + ec.message());

    // seq, received_ns, name
    std::vector<std::tuple<uint64_t, int64_t, std::string>> ledger;
    const fs::path ledger_path = root / kLedgerName;
    std::ifstream in(ledger_path);
    if (in) {
        std::string line;
        size_t lineno = 0;
        while (std::getline(in, line)) {
            lineno++;
            if (line.empty() || line[0] == '#') continue;
            auto cols = split(line, '\t');
            std::optional<std::string> name;
            if (cols.size() == 4) name = unescape_tsv_field(cols[3]);
            try {
                if (!name) throw std::invalid_argument("bad columns");
                ledger.emplace_back(std::stoull(cols[0]), std::stoll(cols[1]), *name);
            } catch (const std::logic_error&) {
                log_.error("rebuild", "ledger line " + std::to_string(lineno) + " unreadable, using file times",
                           {{"ledger", ledger_path.string()}});
                ledger.clear();
                break;
            }
        }
    }
    std::sort(ledger.begin(), ledger.end());

    c.archives.clear();
    c.total = 0;
    c.next_seq = 1;

    std::set<std::string> placed;
    for (const auto& e : ledger) {
        const std::string& name = std::get<2>(e);
        auto d = disk.find(name);
        if (d == disk.end() || placed.count(name)) continue;
        StoredArchive a;
        a.collection = c.cfg->name;
        a.filename = name;
        a.size_bytes = d->second.size;
        a.stored_path = root / name;
        a.received_at = from_unix_ns(std::get<1>(e));
        a.sequence = std::get<0>(e);
        if (!c.archives.empty() && a.received_at < c.archives.back().received_at) {
            a.received_at = c.archives.back().received_at;
        }
        c.next_seq = std::max(c.next_seq, a.sequence + 1);
        c.total += a.size_bytes;
        c.archives.push_back(std::move(a));
        placed.insert(name);
    }

    // Files the ledger does not know about, in modification order.
    std::vector<std::pair<int64_t, std::string>> unknown;
    for (const auto& kv : disk) {
        if (!placed.count(kv.first)) unknown.emplace_back(kv.second.mtime_ns, kv.first);
    }
    std::sort(unknown.begin(), unknown.end());
    for (const auto& u : unknown) {
        StoredArchive a;
        a.collection = c.cfg->name;
        a.filename = u.second;
        a.size_bytes = disk[u.second].size;
        a.stored_path = root / u.second;
        a.received_at = from_unix_ns(u.first);
        register_archive(c, std::move(a));
    }

    enforce_retention(c);
    try {
        write_ledger(c);
    } catch (const StorageError& e) {
        log_.error("rebuild", e.what(), {{"game_name", c.cfg->name}});
    }

    log_.event("COLLECTION_LOADED", {
        {"game_name", c.cfg->name},
        {"archive_path", root.string()},
        {"count", std::to_string(c.archives.size())},
        {"total_gb", gb_string(c.total)},
        {"max_size_gb", c.cfg->max_size_bytes ? gb_string(c.cfg->max_size_bytes) : "unlimited"},
    });
}

void ArchiveStore::register_archive(Collection& c, StoredArchive a) {
    if (!c.archives.empty() && a.received_at < c.archives.back().received_at) {
        a.received_at = c.archives.back().received_at;
    }
    a.sequence = c.next_seq++;
    c.total += a.size_bytes;
    c.archives.push_back(std::move(a));
}

std::vector<StoredArchive> ArchiveStore::enforce_retention(Collection& c) {
    std::vector<StoredArchive> evicted;
    const uint64_t max = c.cfg->max_size_bytes;
    if (max == 0) return evicted;

    // The newest archive always stays, even when it alone exceeds the budget.
    while (c.total > max && c.archives.size() > 1) {
        StoredArchive oldest = c.archives.front();
        c.archives.pop_front();
        c.total -= oldest.size_bytes;

        std::error_code ec;
        bool removed = fs::remove(oldest.stored_path, ec);
        if (ec) {
            log_.error("retention", "delete failed: " + ec.message(),
                       {{"game_name", c.cfg->name}, {"path", oldest.stored_path.string()}});
        } else {
            log_.event("EVICTED", {
                {"game_name", c.cfg->name},
                {"filename", oldest.filename},
                {"size", std::to_string(oldest.size_bytes)},
                {"received_at", format_rfc3339_utc(oldest.received_at)},
                {"file_was_present", removed ? "1" : "0"},
            });
        }
        evicted.push_back(std::move(oldest));
    }

    if (!evicted.empty()) {
        log_.event("RETENTION", {
            {"game_name", c.cfg->name},
            {"removed", std::to_string(evicted.size())},
            {"total_gb", gb_string(c.total)},
            {"max_size_gb", gb_string(max)},
        });
    }
    return evicted;
}

void ArchiveStore::write_ledger(const Collection& c) {
    std::ostringstream o;
    o << "# archive_relay ledger v1\n";
    for (const auto& a : c.archives) {
        o << a.sequence << '\t' << to_unix_ns(a.received_at) << '\t' << a.size_bytes << '\t'
          << escape_tsv_field(a.filename) << '\n';
    }
    atomic_write_text(fs::path(c.cfg->archive_path) / kLedgerName, o.str());
}

IngestResult ArchiveStore::ingest(const std::string& collection, const std::string& filename,
                                  std::string_view payload,
                                  const std::optional<std::string>& sha256_hex) {
    if (!registry_.find(collection)) throw ValidationError("Unknown game: " + collection);
    if (payload.empty()) throw ValidationError("empty file");
    const std::string name = sanitize_archive_name(filename);
    if (name.empty()) throw ValidationError("invalid file name: '" + filename + "'");

    Collection& c = collection_for(collection);
    const fs::path root = c.cfg->archive_path;

    TempFile tmp;
    tmp.path = root / (std::string(kTempPrefix) + std::to_string(::getpid()) + "-" +
                       std::to_string(++temp_counter_) + ".partial");
    Sha256 h;
    write_payload(tmp.path, payload, h);
    const std::string digest = h.hex_digest();
    if (sha256_hex && !hex_equal_case_insensitive(*sha256_hex, digest)) {
        throw ValidationError("sha256 mismatch: expected " + *sha256_hex + ", received " + digest);
    }

    const fs::path final_path = root / name;
    IngestResult result;

    std::lock_guard<std::mutex> lock(c.mtx);
    std::error_code ec;
    fs::rename(tmp.path, final_path, ec);
    if (ec) throw StorageError("rename failed: " + tmp.path.string() + " -> " + final_path.string() + ": " + ec.message());
    tmp.keep = true;

    auto err = fsync_dir(root);
    if (!err.empty()) log_.error("ingest", "directory fsync failed: " + err, {{"path", root.string()}});

    auto same = std::find_if(c.archives.begin(), c.archives.end(),
                             [&](const StoredArchive& a) { return a.filename == name; });
    if (same != c.archives.end()) {
        c.total -= same->size_bytes;
        c.archives.erase(same);
        result.replaced = true;
    }

    StoredArchive a;
    a.collection = collection;
    a.filename = name;
    a.size_bytes = payload.size();
    a.stored_path = final_path;
    a.received_at = clock_();
    register_archive(c, std::move(a));
    result.archive = c.archives.back();

    result.evicted = enforce_retention(c);
    try {
        write_ledger(c);
    } catch (const StorageError& e) {
        log_.error("ledger", e.what(), {{"game_name", collection}});
    }

    log_.event("INGESTED", {
        {"game_name", collection},
        {"filename", name},
        {"size", std::to_string(result.archive.size_bytes)},
        {"sequence", std::to_string(result.archive.sequence)},
        {"replaced", result.replaced ? "1" : "0"},
        {"archive_count", std::to_string(c.archives.size())},
        {"total_gb", gb_string(c.total)},
    });
    return result;
}

CollectionStats ArchiveStore::stats_locked(const Collection& c) const {
    CollectionStats s;
    s.name = c.cfg->name;
    s.count = c.archives.size();
    s.total_size_bytes = c.total;
    s.max_size_bytes = c.cfg->max_size_bytes;
    s.max_size_gb = c.cfg->max_size_gb;
    for (auto it = c.archives.rbegin(); it != c.archives.rend() && s.newest.size() < kNewestInStats; ++it) {
        s.newest.push_back(*it);
    }
    return s;
}

std::optional<CollectionStats> ArchiveStore::stats(const std::string& collection) const {
    auto it = collections_.find(collection);
    if (it == collections_.end()) return std::nullopt;
    std::lock_guard<std::mutex> lock(it->second->mtx);
    return stats_locked(*it->second);
}

std::vector<CollectionStats> ArchiveStore::all_stats() const {
    std::vector<CollectionStats> out;
    for (const auto& kv : collections_) {
        std::lock_guard<std::mutex> lock(kv.second->mtx);
        out.push_back(stats_locked(*kv.second));
    }
    return out;
}

std::vector<StoredArchive> ArchiveStore::archives(const std::string& collection) const {
    auto it = collections_.find(collection);
    if (it == collections_.end()) return {};
    std::lock_guard<std::mutex> lock(it->second->mtx);
    return std::vector<StoredArchive>(it->second->archives.begin(), it->second->archives.end());
}
