#pragma once
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <fstream>
#include <vector>

// Run-message sink ("[info] ...", "[warn] ..."), supplied by main.cpp.
using LogFn = std::function<void(const std::string&)>;

// Structured CSV logging, one file per subsystem under the log directory:
//   $LB_LOG_DIR[/$RUN_ID], else <PROJECT_SOURCE_DIR>/data/raw[/$RUN_ID],
//   else ./data/raw[/$RUN_ID].
class Logger {
public:
    static Logger& instance();
    ~Logger();

    // Tall/long format: one row per key
    void log(const std::string& subsystem,
             int tick, double time,
             const std::map<std::string, double>& values);

    // Wide format: one row per call with multiple columns
    void log_wide(const std::string& subsystem,
                  int tick, double time,
                  const std::vector<std::string>& columns,
                  const std::vector<double>& values);

    // Wide format where a value may be undefined; written as an empty cell.
    void log_wide_optional(const std::string& subsystem,
                           int tick, double time,
                           const std::vector<std::string>& columns,
                           const std::vector<std::optional<double>>& values);

    // Close every open CSV. The next row for a subsystem re-creates its file
    // (and header) under the then-current log directory.
    void close_all();

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::mutex mtx_;
    std::map<std::string, std::ofstream> per_node_;
};
