#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include "GasExchange.hpp"
#include "Geometry.hpp"
#include "Logger.hpp"
#include "SlopeEstimator.hpp"

namespace LunchboxHelpers {

// ---------------------------
// CLI arguments / config
// ---------------------------
struct Args {
  std::string mode   = "live";              // "live", "batch" or "soil"
  std::string file;                         // explicit log file; else newest match
  std::string logDir = "~/Desktop";         // where the datalogger writes
  std::string prefix = "PAS_CO2_datalog_";
  bool showHelp      = false;

  // enclosure (rectangular box) and pot (frustum), cm
  double boxWidth  = 17.5;
  double boxHeight = 5.0;
  double boxLength = 12.0;
  bool   usePot    = true;
  double potTop    = 5.0;
  double potBase   = 3.4;
  double potHeight = 5.3;

  // physical conditions
  double tempC      = 25.0;
  double tempK      = -1.0;                 // > 0 overrides tempC
  double pressurePa = GasExchange::SEA_LEVEL_PRESSURE_PA;

  // live window and fit
  double windowMin    = 10.0;               // display span and buffer length
  double interval     = 1.0;                // seconds per acquisition tick
  int    fitWindow    = 41;                 // readings per slope fit
  bool   smoothing    = true;               // median -> Savitzky-Golay -> low-pass
  bool   robustFit    = false;              // Huber IRLS instead of least squares
  bool   autoYlim     = true;               // false: fixed [-5, 8] y axis
  bool   realtime     = false;              // pace ticks at interval seconds
  int    nticks       = 0;                  // 0 = until the source runs out
  int    readoutEvery = 10;                 // ticks between text readouts

  // reporting basis
  bool   areaBasis = true;
  double leafArea  = 25.0;                  // cm^2
  double soilResp  = 0.0;                   // umol m-2 s-1

  // baseline drift from an empty-box run (ppm/s); --zero-run wins
  std::string zeroRunFile;
  double      zeroRunSeconds = 30.0;
  double      zeroSlope      = 0.0;

  // soil respiration mode
  double soilTopWidth     = 5.0;            // cm
  double soilTopLength    = 5.0;            // cm
  double ignoreInitialMin = 0.5;
};

// Everything derived from Args once at session start.
struct SessionConfig {
  explicit SessionConfig(const Geometry::EnclosureGeometry& box) : enclosure(box) {}

  Geometry::EnclosureGeometry                enclosure;
  std::optional<Geometry::EnclosureGeometry> pot;

  double enclosure_l = 0.0;
  double pot_l       = 0.0;
  double volume_l    = 0.0;                 // headspace used for flux
  double temp_k      = 0.0;
  double pressure_pa = GasExchange::SEA_LEVEL_PRESSURE_PA;

  double      window_min = 10.0;
  double      interval_s = 1.0;
  std::size_t capacity   = 600;
  std::size_t fit_window = 41;
  bool        smoothing  = true;
  FitMethod   fit_method = FitMethod::LeastSquares;
  bool        auto_ylim  = true;

  double baseline_slope = 0.0;              // ppm/s subtracted from every fit

  GasExchange::ReportingBasis basis;
};

// Argument helpers
Args parse_args(int argc, char** argv);
void print_usage();

// Geometry and basis checks happen here, before any acquisition.
// Throws LunchboxError(InvalidDimension / NegativeVolume). With --zero-run
// the baseline slope is fitted from that log; SourceUnavailable if it cannot
// be read, InvalidMeasurement if it holds fewer than three samples.
SessionConfig make_session_config(const Args& args);

// Dump the resolved configuration to SessionConfig.csv and the run log.
void log_session_config(const SessionConfig& cfg, const LogFn& log_fn);

// "~/x" -> "$HOME/x"
std::filesystem::path expand_home(const std::string& path);

// Newest regular file in dir named <prefix>*.csv, by modification time.
std::optional<std::filesystem::path> find_latest_log(const std::filesystem::path& dir,
                                                     const std::string& prefix);

// --file if given, else the newest matching log.
// Throws LunchboxError(SourceUnavailable) if neither exists.
std::filesystem::path resolve_input_file(const Args& args);

} // namespace LunchboxHelpers
