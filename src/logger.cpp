#include "logger.hpp"
#include "util.hpp"

#include <iostream>

void Logger::set_file(const std::filesystem::path& p) {
    if (p.empty()) return;
    std::error_code ec;
    auto parent = p.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            std::cerr << "cannot create log directory " << parent.string() << ": " << ec.message() << "\n";
            return;
        }
    }
    std::lock_guard<std::mutex> lock(mtx);
    file.emplace(p, std::ios::app);
    if (!file->is_open()) {
        std::cerr << "cannot open log file " << p.string() << "\n";
        file.reset();
    }
}

void Logger::log_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(mtx);
    if (!quiet) {
        std::cout << line << "\n";
        std::cout.flush();
    }
    if (file.has_value() && file->is_open()) {
        (*file) << line << "\n";
        file->flush();
    }
}

void Logger::event(const std::string& name, std::initializer_list<Field> fields) {
    std::string line = "{\"ts\":\"" + now_rfc3339_utc() + "\",\"event\":\"" + json_escape(name) + "\"";
    for (const auto& f : fields) {
        line += ",\"";
        line += f.first;
        line += "\":\"" + json_escape(f.second) + "\"";
    }
    line += "}";
    log_line(line);
}

void Logger::error(const std::string& where, const std::string& err, std::initializer_list<Field> fields) {
    std::string line = "{\"ts\":\"" + now_rfc3339_utc() + "\",\"event\":\"ERROR\",\"where\":\"" +
                       json_escape(where) + "\"";
    for (const auto& f : fields) {
        line += ",\"";
        line += f.first;
        line += "\":\"" + json_escape(f.second) + "\"";
    }
    line += ",\"err\":\"" + json_escape(err) + "\"}";
    log_line(line);
}
