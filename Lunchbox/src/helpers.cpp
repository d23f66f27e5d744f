#include "helpers.hpp"
#include "GasLogReader.hpp"
#include "LiveBuffer.hpp"
#include "LunchboxError.hpp"
#include "ReplayDriver.hpp"

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace LunchboxHelpers {

// ---------------------------
// Tiny CLI helpers (no deps)
// ---------------------------
static bool arg_eq(const char* a, const char* b) {
  return std::strcmp(a, b) == 0;
}

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    if (arg_eq(argv[i], "--mode") && i + 1 < argc)                 a.mode = argv[++i];
    else if (arg_eq(argv[i], "--file") && i + 1 < argc)            a.file = argv[++i];
    else if (arg_eq(argv[i], "--log-dir-in") && i + 1 < argc)      a.logDir = argv[++i];
    else if (arg_eq(argv[i], "--prefix") && i + 1 < argc)          a.prefix = argv[++i];
    else if (arg_eq(argv[i], "--box") && i + 3 < argc) {
      a.boxWidth  = std::atof(argv[++i]);
      a.boxHeight = std::atof(argv[++i]);
      a.boxLength = std::atof(argv[++i]);
    }
    else if (arg_eq(argv[i], "--pot") && i + 3 < argc) {
      a.usePot    = true;
      a.potTop    = std::atof(argv[++i]);
      a.potBase   = std::atof(argv[++i]);
      a.potHeight = std::atof(argv[++i]);
    }
    else if (arg_eq(argv[i], "--no-pot"))                          a.usePot = false;
    else if (arg_eq(argv[i], "--temp-c") && i + 1 < argc)          a.tempC = std::atof(argv[++i]);
    else if (arg_eq(argv[i], "--temp-k") && i + 1 < argc)          a.tempK = std::atof(argv[++i]);
    else if (arg_eq(argv[i], "--pressure") && i + 1 < argc)        a.pressurePa = std::atof(argv[++i]);
    else if (arg_eq(argv[i], "--window-min") && i + 1 < argc)      a.windowMin = std::atof(argv[++i]);
    else if (arg_eq(argv[i], "--interval") && i + 1 < argc)        a.interval = std::atof(argv[++i]);
    else if (arg_eq(argv[i], "--fit-window") && i + 1 < argc)      a.fitWindow = std::atoi(argv[++i]);
    else if (arg_eq(argv[i], "--smoothing"))                       a.smoothing = true;
    else if (arg_eq(argv[i], "--no-smoothing"))                    a.smoothing = false;
    else if (arg_eq(argv[i], "--robust"))                          a.robustFit = true;
    else if (arg_eq(argv[i], "--auto-ylim"))                       a.autoYlim = true;
    else if (arg_eq(argv[i], "--fixed-ylim"))                      a.autoYlim = false;
    else if (arg_eq(argv[i], "--zero-run") && i + 1 < argc)        a.zeroRunFile = argv[++i];
    else if (arg_eq(argv[i], "--zero-run-seconds") && i + 1 < argc) a.zeroRunSeconds = std::atof(argv[++i]);
    else if (arg_eq(argv[i], "--zero-slope") && i + 1 < argc)      a.zeroSlope = std::atof(argv[++i]);
    else if (arg_eq(argv[i], "--realtime"))                        a.realtime = true;
    else if (arg_eq(argv[i], "--nticks") && i + 1 < argc)          a.nticks = std::atoi(argv[++i]);
    else if (arg_eq(argv[i], "--readout-every") && i + 1 < argc)   a.readoutEvery = std::atoi(argv[++i]);
    else if (arg_eq(argv[i], "--per-box"))                         a.areaBasis = false;
    else if (arg_eq(argv[i], "--leaf-area") && i + 1 < argc)       a.leafArea = std::atof(argv[++i]);
    else if (arg_eq(argv[i], "--soil-resp") && i + 1 < argc)       a.soilResp = std::atof(argv[++i]);
    else if (arg_eq(argv[i], "--soil-top") && i + 2 < argc) {
      a.soilTopWidth  = std::atof(argv[++i]);
      a.soilTopLength = std::atof(argv[++i]);
    }
    else if (arg_eq(argv[i], "--ignore-initial-min") && i + 1 < argc) a.ignoreInitialMin = std::atof(argv[++i]);
    else if (arg_eq(argv[i], "--help"))                            a.showHelp = true;
  }
  return a;
}

void print_usage() {
  std::cout <<
    "Usage: lunchbox [--mode live|batch|soil]\n"
    "                [--file LOG.csv | --log-dir-in DIR --prefix NAME_]\n"
    "                [--box W H L] [--pot TOP BASE H | --no-pot]\n"
    "                [--temp-c C | --temp-k K] [--pressure PA]\n"
    "                [--window-min M] [--interval S] [--fit-window N]\n"
    "                [--no-smoothing] [--robust] [--fixed-ylim | --auto-ylim]\n"
    "                [--zero-run EMPTY.csv [--zero-run-seconds S] | --zero-slope PPM_S]\n"
    "                [--realtime] [--nticks N] [--readout-every N]\n"
    "                [--per-box | --leaf-area CM2] [--soil-resp UMOL_M2_S]\n"
    "                [--soil-top W L] [--ignore-initial-min M]\n"
    "\n"
    "Modes:\n"
    "  live   - replay a datalogger CSV one row per tick through the rolling\n"
    "           slope fit, keep the last --window-min minutes and log a display\n"
    "           frame per tick (LiveDisplay.csv)\n"
    "  batch  - difference the whole CSV and write BatchFlux.csv\n"
    "  soil   - replay a no-plant log and estimate the soil respiration\n"
    "           correction for --soil-resp\n"
    "\n"
    "Smoothing (median, Savitzky-Golay, 0.1 Hz low-pass) is on by default and\n"
    "always on in soil mode. --zero-run fits the drift of an empty sealed box\n"
    "over its first --zero-run-seconds and subtracts it from every live slope.\n"
    "\n"
    "Without --file the newest <prefix>*.csv in --log-dir-in is used.\n"
    "CSV output goes to $LB_LOG_DIR (or data/raw), per-run with $RUN_ID.\n";
}

SessionConfig make_session_config(const Args& args) {
  SessionConfig cfg(Geometry::EnclosureGeometry(
      Geometry::Shape::Rectangular, {args.boxWidth, args.boxHeight, args.boxLength}));

  cfg.enclosure_l = cfg.enclosure.volumeLitres();
  if (args.usePot) {
    cfg.pot = Geometry::EnclosureGeometry(
        Geometry::Shape::Frustum, {args.potTop, args.potBase, args.potHeight});
    cfg.pot_l    = cfg.pot->volumeLitres();
    cfg.volume_l = Geometry::netVolumeLitres(cfg.enclosure_l, cfg.pot_l);
  } else {
    cfg.pot_l    = 0.0;
    cfg.volume_l = cfg.enclosure_l;
  }

  cfg.temp_k      = (args.tempK > 0.0) ? args.tempK : args.tempC + GasExchange::ZERO_CELSIUS_K;
  cfg.pressure_pa = args.pressurePa;
  GasExchange::validateConditions(cfg.volume_l, cfg.temp_k, cfg.pressure_pa);

  cfg.window_min = args.windowMin;
  cfg.interval_s = args.interval;
  cfg.capacity   = LiveBuffer::capacityFor(args.windowMin, args.interval);
  cfg.fit_window = static_cast<std::size_t>(args.fitWindow > 0 ? args.fitWindow : 0);
  cfg.smoothing  = args.smoothing;
  cfg.fit_method = args.robustFit ? FitMethod::Huber : FitMethod::LeastSquares;
  cfg.auto_ylim  = args.autoYlim;

  cfg.basis.area_basis           = args.areaBasis;
  cfg.basis.leaf_area_cm2        = args.leafArea;
  cfg.basis.soil_resp_correction = args.soilResp;
  GasExchange::validateBasis(cfg.basis);

  if (!args.zeroRunFile.empty()) {
    const fs::path zero_path = expand_home(args.zeroRunFile);
    auto zero_log = read_gas_log_csv(zero_path);
    if (!zero_log) {
      throw LunchboxError(ErrorKind::SourceUnavailable,
                          "cannot read zero run " + zero_path.string());
    }
    auto slope = zero_run_slope(zero_log->samples, args.zeroRunSeconds);
    if (!slope) {
      throw LunchboxError(ErrorKind::InvalidMeasurement,
                          "zero run " + zero_path.string() + " has fewer than 3 usable samples");
    }
    cfg.baseline_slope = *slope;
  } else {
    if (!std::isfinite(args.zeroSlope)) {
      throw LunchboxError(ErrorKind::InvalidMeasurement, "zero slope is not finite");
    }
    cfg.baseline_slope = args.zeroSlope;
  }

  return cfg;
}

void log_session_config(const SessionConfig& cfg, const LogFn& log_fn) {
  Logger::instance().log(
      "SessionConfig", 0, 0.0,
      {
        {"enclosure_l",          cfg.enclosure_l},
        {"pot_l",                cfg.pot_l},
        {"volume_l",             cfg.volume_l},
        {"temp_k",               cfg.temp_k},
        {"pressure_pa",          cfg.pressure_pa},
        {"window_min",           cfg.window_min},
        {"interval_s",           cfg.interval_s},
        {"capacity",             static_cast<double>(cfg.capacity)},
        {"fit_window",           static_cast<double>(cfg.fit_window)},
        {"smoothing",            cfg.smoothing ? 1.0 : 0.0},
        {"robust_fit",           cfg.fit_method == FitMethod::Huber ? 1.0 : 0.0},
        {"auto_ylim",            cfg.auto_ylim ? 1.0 : 0.0},
        {"baseline_slope_ppm_s", cfg.baseline_slope},
        {"area_basis",           cfg.basis.area_basis ? 1.0 : 0.0},
        {"leaf_area_cm2",        cfg.basis.leaf_area_cm2},
        {"soil_resp_correction", cfg.basis.soil_resp_correction}
      });

  if (log_fn) {
    std::ostringstream oss;
    oss << "[info] enclosure=" << cfg.enclosure_l << " L"
        << " pot=" << cfg.pot_l << " L"
        << " headspace=" << cfg.volume_l << " L"
        << " T=" << cfg.temp_k << " K"
        << " p=" << cfg.pressure_pa << " Pa\n";
    oss << "[info] window=" << cfg.window_min << " min"
        << " interval=" << cfg.interval_s << " s"
        << " capacity=" << cfg.capacity
        << " fit_window=" << cfg.fit_window
        << (cfg.smoothing ? " smoothed" : " raw")
        << (cfg.fit_method == FitMethod::Huber ? " huber" : " ols")
        << " baseline=" << cfg.baseline_slope << " ppm/s\n";
    oss << "[info] A_net in " << GasExchange::anetUnits(cfg.basis);
    if (cfg.basis.area_basis) oss << " (leaf area " << cfg.basis.leaf_area_cm2 << " cm2)";
    oss << ", soil correction " << cfg.basis.soil_resp_correction << "\n";
    log_fn(oss.str());
  }
}

fs::path expand_home(const std::string& path) {
  if (!path.empty() && path[0] == '~') {
    const char* home = std::getenv("HOME");
    if (home && *home) {
      return fs::path(home) / path.substr(path.size() > 1 && path[1] == '/' ? 2 : 1);
    }
  }
  return fs::path(path);
}

std::optional<fs::path> find_latest_log(const fs::path& dir, const std::string& prefix) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return std::nullopt;

  std::optional<fs::path> best;
  fs::file_time_type best_time{};

  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code fec;
    if (!it->is_regular_file(fec)) continue;

    const std::string name = it->path().filename().string();
    if (name.size() < prefix.size() + 4) continue;
    if (name.compare(0, prefix.size(), prefix) != 0) continue;
    if (name.compare(name.size() - 4, 4, ".csv") != 0) continue;

    const auto mtime = it->last_write_time(fec);
    if (fec) continue;
    if (!best || mtime > best_time) {
      best      = it->path();
      best_time = mtime;
    }
  }
  return best;
}

fs::path resolve_input_file(const Args& args) {
  if (!args.file.empty()) {
    fs::path p = expand_home(args.file);
    std::error_code ec;
    if (!fs::is_regular_file(p, ec)) {
      throw LunchboxError(ErrorKind::SourceUnavailable, "no such log file " + p.string());
    }
    return p;
  }

  const fs::path dir = expand_home(args.logDir);
  auto latest = find_latest_log(dir, args.prefix);
  if (!latest) {
    throw LunchboxError(ErrorKind::SourceUnavailable,
                        "no " + args.prefix + "*.csv found in " + dir.string());
  }
  return *latest;
}

} // namespace LunchboxHelpers
