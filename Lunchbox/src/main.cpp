// Lunchbox/src/main.cpp
/**
Build (from repo root):
  cmake -S . -B build -DCMAKE_BUILD_TYPE=Release
  cmake --build build -j

Run (from build/):
  ./lunchbox --mode batch --file ~/Desktop/PAS_CO2_datalog_20250719-183601.csv --no-pot
  ./lunchbox --mode live  --leaf-area 25 --window-min 10            // newest log on ~/Desktop
  ./lunchbox --mode live  --realtime --interval 1                   // paced at 1 tick/s
  ./lunchbox --mode soil  --per-box --temp-c 20 --soil-top 5 5      // soil respiration estimate

  RUN_ID=basil_0719 LB_LOG_DIR=/tmp/lb ./lunchbox --mode live ...   // CSVs in /tmp/lb/basil_0719
*/

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

#include "BatchDifferencer.hpp"
#include "GasLogReader.hpp"
#include "LiveDisplay.hpp"
#include "LiveSession.hpp"
#include "Logger.hpp"
#include "LunchboxError.hpp"
#include "ReplayDriver.hpp"
#include "SessionEngine.hpp"
#include "SoilRespirationMonitor.hpp"
#include "helpers.hpp"

using LunchboxHelpers::Args;
using LunchboxHelpers::SessionConfig;
using LunchboxHelpers::parse_args;
using LunchboxHelpers::print_usage;
using LunchboxHelpers::make_session_config;
using LunchboxHelpers::log_session_config;
using LunchboxHelpers::resolve_input_file;

namespace {

constexpr int EXIT_NO_DATA = 2;

volatile std::sig_atomic_t g_stop_requested = 0;

extern "C" void on_stop_signal(int) {
  g_stop_requested = 1;
}

// ---------------------------------------------------------------------------
// Tick the engine until the source runs out, the tick limit is hit or the
// user interrupts. With realtime on, ticks are paced at dt seconds.
// ---------------------------------------------------------------------------
void run_session_loop(SessionEngine& engine, const Args& args, double dt, const LogFn& log_msg) {
  using clock = std::chrono::steady_clock;
  const auto period = std::chrono::duration_cast<clock::duration>(
      std::chrono::duration<double>(dt));
  auto next = clock::now() + period;

  while (!g_stop_requested && !engine.finished()) {
    if (args.nticks > 0 && engine.tickCount() > args.nticks) break;

    engine.tick();

    if (args.realtime) {
      std::this_thread::sleep_until(next);
      next += period;
    }
  }

  std::ostringstream oss;
  oss << "[info] session loop stopped after " << (engine.tickCount() - 1) << " tick(s)";
  if (g_stop_requested)      oss << " (interrupted)";
  else if (engine.finished()) oss << " (source exhausted)";
  oss << "\n";
  log_msg(oss.str());
}

int run_batch(const Args& args, const SessionConfig& cfg, const LogFn& log_msg) {
  const std::filesystem::path input = resolve_input_file(args);
  log_msg("[info] batch input: " + input.string() + "\n");

  auto gas_log = read_gas_log_csv(input);
  if (!gas_log) {
    throw LunchboxError(ErrorKind::SourceUnavailable, "cannot read " + input.string());
  }

  {
    std::ostringstream oss;
    oss << "[info] read " << gas_log->samples.size() << " row(s)";
    if (gas_log->dropped_rows > 0) oss << ", dropped " << gas_log->dropped_rows << " malformed";
    oss << (gas_log->sorted_by_local_time ? ", sorted by local time\n"
                                          : ", local time not parseable, file order kept\n");
    log_msg(oss.str());
  }

  BatchDifferencer differencer(cfg.volume_l, cfg.temp_k, cfg.pressure_pa);
  const FluxSeries series = differencer.process(gas_log->samples);
  log_flux_series(series, cfg.basis);

  const SeriesSummary sum = summarize(series);
  std::ostringstream oss;
  oss << "[info] batch: " << sum.total << " sample(s), " << sum.with_flux << " with flux, "
      << sum.degenerate << " degenerate interval(s), " << sum.invalid << " invalid\n";
  log_msg(oss.str());

  if (sum.total > 1 && sum.with_flux == 0) {
    log_msg("[warn] no data: no interval produced a flux value.\n");
    return EXIT_NO_DATA;
  }

  for (auto it = series.rbegin(); it != series.rend(); ++it) {
    if (!it->flux) continue;
    const double anet = GasExchange::reportedAnet(*it->flux, cfg.basis);
    log_msg("[info] last " + LiveDisplay::formatCo2(it->concentration_ppm) + " | " +
            LiveDisplay::formatAnet(anet, cfg.basis) + "\n");
    break;
  }
  return EXIT_SUCCESS;
}

int run_replay(const Args& args, SessionConfig cfg, bool soil_mode, const LogFn& log_msg) {
  if (soil_mode) {
    // Soil respiration is measured per box with no correction applied.
    cfg.basis.area_basis           = false;
    cfg.basis.soil_resp_correction = 0.0;
    cfg.smoothing                  = true;
  }
  const double top_area_m2 = soil_mode
      ? SoilRespirationMonitor::topAreaM2(args.soilTopWidth, args.soilTopLength)
      : 0.0;

  const std::filesystem::path input = resolve_input_file(args);
  log_msg("[info] replay input: " + input.string() + "\n");

  ReplayOptions ro;
  ro.fit_window        = cfg.fit_window;
  ro.smoothing         = cfg.smoothing;
  ro.fit_method        = cfg.fit_method;
  ro.sample_interval_s = cfg.interval_s;
  ro.baseline_slope    = cfg.baseline_slope;
  ro.volume_litres     = cfg.volume_l;
  ro.temperature_k     = cfg.temp_k;
  ro.pressure_pa       = cfg.pressure_pa;
  ro.basis             = cfg.basis;

  ReplayDriver           driver(input, ro);
  LiveSession            session(driver, cfg.capacity, log_msg);
  LiveDisplay            display(session, cfg.window_min, cfg.basis, log_msg, args.readoutEvery,
                                 cfg.auto_ylim);
  SoilRespirationMonitor soil(&session, args.ignoreInitialMin, log_msg);

  SessionEngine engine;
  engine.addSubsystem(&session);      // 1) acquisition -> buffer
  if (soil_mode) {
    engine.addSubsystem(&soil);       // 2) collect soil respiration
  } else {
    engine.addSubsystem(&display);    // 2) render from snapshot
  }

  engine.setTickStep(cfg.interval_s);
  engine.initialize();

  run_session_loop(engine, args, cfg.interval_s, log_msg);

  engine.shutdown();

  if (!soil_mode) {
    if (session.state().samples_appended == 0) {
      log_msg("[warn] no data: the source never produced a full fit window.\n");
      return EXIT_NO_DATA;
    }
    return EXIT_SUCCESS;
  }

  auto correction = soil.estimate(top_area_m2);
  if (!correction) {
    log_msg("[warn] no negative soil respiration values found to estimate soil respiration.\n");
    return EXIT_NO_DATA;
  }
  std::ostringstream oss;
  oss << "[info] estimated soil respiration correction: " << *correction
      << " umol m-2 s-1 (from " << soil.count() << " value(s), top area "
      << top_area_m2 << " m2)\n";
  log_msg(oss.str());
  return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv) {
  Args args = parse_args(argc, argv);

  // ------------------------------------------------------------------------
  // Run log: mirrors messages to stderr and lunchbox_<RUN_ID>_<mode>.log
  // ------------------------------------------------------------------------
  std::ofstream runLog;
  LogFn log_msg = [&](const std::string& s) {
    std::cerr << s;
    if (runLog.is_open()) {
      runLog << s;
      runLog.flush();
    }
  };

  if (args.showHelp) {
    print_usage();
    return 0;
  }

  {
    const char* env_run_id = std::getenv("RUN_ID");
    std::string run_id     = env_run_id ? env_run_id : "norunid";
    std::string mode_tag   = args.mode.empty() ? "nomode" : args.mode;

    std::string filename = "lunchbox_" + run_id + "_" + mode_tag + ".log";
    runLog.open(filename, std::ios::out | std::ios::app);
    if (!runLog) {
      std::cerr << "[warn] Failed to open " << filename << " for writing.\n";
    } else {
      runLog << "============================================================\n";
      runLog << "New run started (mode=" << args.mode << ", RUN_ID=" << run_id << ")\n";
      runLog << "============================================================\n";
      runLog.flush();
    }
  }

  // ------------------------------------------------------------------------
  // Sanity clamps so bad CLI values cannot stall the session loop.
  // ------------------------------------------------------------------------
  if (!(args.interval > 0.0)) {
    log_msg("[warn] interval <= 0; defaulting to 1 s.\n");
    args.interval = 1.0;
  }
  if (!(args.windowMin > 0.0)) {
    log_msg("[warn] window-min <= 0; defaulting to 10 min.\n");
    args.windowMin = 10.0;
  }
  if (args.fitWindow < 3) {
    log_msg("[warn] fit-window < 3; defaulting to 41.\n");
    args.fitWindow = 41;
  }
  if (args.nticks < 0) {
    log_msg("[warn] nticks < 0; running until the source is exhausted.\n");
    args.nticks = 0;
  }

  std::signal(SIGINT,  on_stop_signal);
  std::signal(SIGTERM, on_stop_signal);

  try {
    const SessionConfig cfg = make_session_config(args);
    log_session_config(cfg, log_msg);

    if (args.mode == "batch") return run_batch(args, cfg, log_msg);
    if (args.mode == "live")  return run_replay(args, cfg, /*soil_mode=*/false, log_msg);
    if (args.mode == "soil")  return run_replay(args, cfg, /*soil_mode=*/true, log_msg);

    std::ostringstream oss;
    oss << "[fatal] Unknown mode '" << args.mode
        << "'. Expected 'live', 'batch' or 'soil'.\n";
    log_msg(oss.str());
    print_usage();
    return EXIT_FAILURE;
  }
  catch (const LunchboxError& e) {
    log_msg(std::string("[fatal] ") + e.what() + "\n");
    return EXIT_FAILURE;
  }
  catch (const std::exception& e) {
    log_msg(std::string("[fatal] std::exception: ") + e.what() + "\n");
    return EXIT_FAILURE;
  }
}
