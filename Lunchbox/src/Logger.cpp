// Lunchbox/src/Logger.cpp
#include "Logger.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace {
namespace fs = std::filesystem;

// Resolve the base directory for logs.
//
// Priority:
//   1) env LB_LOG_DIR
//   2) <PROJECT_SOURCE_DIR>/data/raw
//   3) ./data/raw
//
// If env RUN_ID is set it is appended, so each run gets its own folder,
// e.g. data/raw/basil_0719/LiveDisplay.csv
fs::path resolve_base_dir() {
    fs::path base;
    const char* env = std::getenv("LB_LOG_DIR");
    if (env && *env) {
        base = fs::path(env);
    } else {
#ifdef PROJECT_SOURCE_DIR
        base = fs::path(PROJECT_SOURCE_DIR) / "data" / "raw";
#else
        base = fs::current_path() / "data" / "raw";
#endif
    }

    if (const char* run = std::getenv("RUN_ID")) {
        if (*run) base /= run;
    }
    return base;
}

// Get or open the per-subsystem CSV file, writing the header on first open.
//   tall: tick,time_s,key,value
//   wide: tick,time_s,<columns...>
std::ofstream& get_stream_for_subsystem(
    const std::string& subsystem,
    std::map<std::string, std::ofstream>& per_node,
    const std::vector<std::string>* wide_cols
) {
    auto it = per_node.find(subsystem);
    if (it != per_node.end()) {
        return it->second;
    }

    fs::path base_dir = resolve_base_dir();
    std::error_code ec;
    fs::create_directories(base_dir, ec);
    if (ec) {
        throw std::runtime_error(
            "Logger: failed to create log directory " + base_dir.string() +
            " : " + ec.message()
        );
    }

    fs::path csv_path = base_dir / (subsystem + ".csv");
    std::ofstream out(csv_path, std::ios::out | std::ios::trunc);
    if (!out) {
        throw std::runtime_error(
            "Logger: failed to open log file " + csv_path.string()
        );
    }
    out.precision(10);

    if (wide_cols) {
        out << "tick,time_s";
        for (const auto& c : *wide_cols) {
            out << ',' << c;
        }
        out << '\n';
    } else {
        out << "tick,time_s,key,value\n";
    }
    out.flush();

    auto [new_it, _] = per_node.emplace(subsystem, std::move(out));
    return new_it->second;
}

} // anonymous namespace

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::~Logger() {
    close_all();
}

void Logger::close_all() {
    std::lock_guard<std::mutex> lock(mtx_);
    for (auto& kv : per_node_) {
        if (kv.second.is_open()) kv.second.close();
    }
    per_node_.clear();
}

void Logger::log(const std::string& subsystem,
                 int tick, double time,
                 const std::map<std::string, double>& values) {
    std::lock_guard<std::mutex> lock(mtx_);

    std::ofstream& out = get_stream_for_subsystem(subsystem, per_node_, nullptr);

    for (const auto& kv : values) {
        out << tick << ',' << time << ','
            << kv.first << ',' << kv.second << '\n';
    }
    out.flush();
}

void Logger::log_wide(const std::string& subsystem,
                      int tick, double time,
                      const std::vector<std::string>& cols,
                      const std::vector<double>& vals) {
    std::lock_guard<std::mutex> lock(mtx_);

    std::ofstream& out = get_stream_for_subsystem(subsystem, per_node_, &cols);

    out << tick << ',' << time;
    for (std::size_t i = 0; i < cols.size(); ++i) {
        double v = (i < vals.size() ? vals[i] : 0.0);
        out << ',' << v;
    }
    out << '\n';
    out.flush();
}

void Logger::log_wide_optional(const std::string& subsystem,
                               int tick, double time,
                               const std::vector<std::string>& cols,
                               const std::vector<std::optional<double>>& vals) {
    std::lock_guard<std::mutex> lock(mtx_);

    std::ofstream& out = get_stream_for_subsystem(subsystem, per_node_, &cols);

    out << tick << ',' << time;
    for (std::size_t i = 0; i < cols.size(); ++i) {
        out << ',';
        if (i < vals.size() && vals[i]) out << *vals[i];
    }
    out << '\n';
    out.flush();
}
