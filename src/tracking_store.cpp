#include "tracking_store.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <fstream>
#include <sstream>

static const char* kHeader = "# archive_relay tracking v1";

const char* to_string(FileStatus s) {
    switch (s) {
        case FileStatus::Discovered: return "Discovered";
        case FileStatus::Pending:    return "Pending";
        case FileStatus::Stable:     return "Stable";
        case FileStatus::Sent:       return "Sent";
        case FileStatus::Failed:     return "Failed";
    }
    return "Unknown";
}

std::optional<FileStatus> file_status_from_string(const std::string& s) {
    if (s == "Discovered") return FileStatus::Discovered;
    if (s == "Pending") return FileStatus::Pending;
    if (s == "Stable") return FileStatus::Stable;
    if (s == "Sent") return FileStatus::Sent;
    if (s == "Failed") return FileStatus::Failed;
    return std::nullopt;
}

bool TrackedFile::operator==(const TrackedFile& o) const {
    return path == o.path && size == o.size && modified_ns == o.modified_ns &&
           status == o.status && last_checked_ns == o.last_checked_ns &&
           stable_observed_ns == o.stable_observed_ns && attempts == o.attempts;
}

TrackingStore::TrackingStore(std::filesystem::path state_file)
    : state_file_(std::move(state_file)) {
}

TrackedFile* TrackingStore::find(const std::string& path) {
    auto it = files_.find(path);
    return it == files_.end() ? nullptr : &it->second;
}

const TrackedFile* TrackingStore::find(const std::string& path) const {
    auto it = files_.find(path);
    return it == files_.end() ? nullptr : &it->second;
}

void TrackingStore::load() {
    files_.clear();
    std::error_code ec;
    if (!std::filesystem::exists(state_file_, ec)) {
        if (ec) throw StorageError("cannot stat " + state_file_.string() + ": " + ec.message());
        return;
    }

    std::ifstream in(state_file_, std::ios::binary);
    if (!in) throw StorageError("open failed: " + state_file_.string());

    std::string line;
    size_t lineno = 0;
    Map loaded;
    while (std::getline(in, line)) {
        lineno++;
        if (line.empty()) continue;
        if (line[0] == '#') {
            if (lineno == 1 && line != kHeader) {
                throw StorageError("unsupported tracking file version: " + line);
            }
            continue;
        }

        auto bad = [&](const std::string& why) {
            return StorageError(state_file_.string() + ":" + std::to_string(lineno) + ": " + why);
        };

        auto cols = split(line, '\t');
        if (cols.size() != 7) throw bad("expected 7 columns");

        auto path = unescape_tsv_field(cols[0]);
        auto status = file_status_from_string(cols[3]);
        if (!path || path->empty()) throw bad("bad path");
        if (!status) throw bad("bad status '" + cols[3] + "'");

        TrackedFile tf;
        tf.path = *path;
        tf.status = *status;
        try {
            tf.size = std::stoull(cols[1]);
            tf.modified_ns = std::stoll(cols[2]);
            tf.last_checked_ns = std::stoll(cols[4]);
            tf.stable_observed_ns = std::stoll(cols[5]);
            tf.attempts = static_cast<uint32_t>(std::stoul(cols[6]));
        } catch (const std::logic_error&) {
            throw bad("bad number");
        }
        loaded[tf.path] = tf;
    }
    if (in.bad()) throw StorageError("read failed: " + state_file_.string());
    files_ = std::move(loaded);
}

void TrackingStore::save() const {
    std::ostringstream o;
    o << kHeader << "\n";
    for (const auto& kv : files_) {
        const TrackedFile& tf = kv.second;
        o << escape_tsv_field(tf.path) << '\t'
          << tf.size << '\t'
          << tf.modified_ns << '\t'
          << to_string(tf.status) << '\t'
          << tf.last_checked_ns << '\t'
          << tf.stable_observed_ns << '\t'
          << tf.attempts << '\n';
    }
    auto parent = state_file_.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) throw StorageError("cannot create " + parent.string() + ": " + ec.message());
    }
    atomic_write_text(state_file_, o.str());
}
