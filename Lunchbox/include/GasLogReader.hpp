#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "FluxSample.hpp"

// Reader for the CO2 datalogger CSV:
//
//   # comment lines are ignored
//   Timestamp UTC [Unix],Timestamp Local [yyyy-MM-dd hh:mm:ss],<port> CO2 [ppm]
//   1752946561,2025-07-19 18:36:01,415
//
// The first non-comment line is the header. Column 1 is a numeric timestamp,
// column 2 the local date-time, column 3 the CO2 concentration.

struct GasLog {
    std::vector<GasSample> samples;       // sorted by local time when parseable
    std::size_t dropped_rows         = 0; // non-numeric timestamp or CO2
    bool        sorted_by_local_time = false;
};

// Returns std::nullopt if the file cannot be opened.
std::optional<GasLog> read_gas_log_csv(const std::filesystem::path& file);

// True for blank lines and '#' comments.
bool is_skippable_line(const std::string& line);

// Parse one data row. std::nullopt if it has fewer than three columns or a
// non-numeric (or non-finite) timestamp / CO2 value.
std::optional<GasSample> parse_gas_log_row(const std::string& line);

// "yyyy-MM-dd hh:mm:ss" (or with a 'T' separator) to seconds since
// 1970-01-01, with the wall-clock fields taken as-is. Only used for ordering.
std::optional<double> parse_local_time(const std::string& text);
