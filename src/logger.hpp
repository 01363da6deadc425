#pragma once

#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

// One JSON object per line on stdout, mirrored to an optional log file.
struct Logger {
    using Field = std::pair<const char*, std::string>;

    void set_file(const std::filesystem::path& p);

    void log_line(const std::string& line);

    // {"event":"<event>","k":"v",...}
    void event(const std::string& name, std::initializer_list<Field> fields);

    // {"event":"ERROR","where":"<where>",...,"err":"<err>"}
    void error(const std::string& where, const std::string& err, std::initializer_list<Field> fields = {});

    void set_quiet(bool q) { quiet = q; }

    std::optional<std::ofstream> file;
    bool quiet = false;
    std::mutex mtx;
};
