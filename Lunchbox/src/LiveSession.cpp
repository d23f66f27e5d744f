#include "LiveSession.hpp"
#include "LunchboxError.hpp"

#include <cmath>
#include <sstream>
#include <utility>

namespace {
// status column of LiveSession.csv
constexpr double ROW_APPENDED = 1.0;
constexpr double ROW_NO_DATA  = 0.0;
constexpr double ROW_FAILED   = -1.0;
constexpr double ROW_REJECTED = -2.0;
}

LiveSession::LiveSession(AcquisitionDriver& driver, std::size_t capacity, LogFn log_fn)
    : Subsystem("LiveSession"),
      driver_(driver),
      state_(capacity),
      log_fn_(std::move(log_fn)) {}

void LiveSession::initialize() {
    reset();
    state_.ticks_seen           = 0;
    state_.samples_appended     = 0;
    state_.ticks_without_data   = 0;
    state_.acquisition_failures = 0;
    state_.rejected_records     = 0;

    driver_.open();
}

void LiveSession::reset() {
    state_.buffer.clear();
    state_.co2_latest.reset();
    state_.anet_latest.reset();
}

void LiveSession::tick(const TickContext& ctx) {
    ++state_.ticks_seen;

    std::optional<TickRecord> rec;
    try {
        rec = driver_.read(ctx);
    } catch (const LunchboxError& e) {
        if (e.kind() != ErrorKind::AcquisitionFailure) throw;
        ++state_.acquisition_failures;
        if (log_fn_) {
            std::ostringstream oss;
            oss << "[warn] tick=" << ctx.tick_index << " skipped: " << e.what() << "\n";
            log_fn_(oss.str());
        }
        logRow_(ctx, ROW_FAILED, nullptr);
        return;
    }

    if (!rec) {
        ++state_.ticks_without_data;
        logRow_(ctx, ROW_NO_DATA, nullptr);
        return;
    }

    if (!std::isfinite(rec->elapsed_min) || !std::isfinite(rec->anet) ||
        !std::isfinite(rec->anet_lower) || !std::isfinite(rec->anet_upper)) {
        ++state_.rejected_records;
        logRow_(ctx, ROW_REJECTED, nullptr);
        return;
    }

    FluxSample s;
    s.elapsed           = rec->elapsed_min;
    s.concentration_ppm = rec->co2_ppm;
    s.flux              = rec->anet;
    s.flux_lower        = rec->anet_lower;
    s.flux_upper        = rec->anet_upper;

    state_.buffer.append(s);
    ++state_.samples_appended;
    state_.co2_latest  = rec->co2_ppm;
    state_.anet_latest = rec->anet;

    logRow_(ctx, ROW_APPENDED, &*rec);
}

void LiveSession::shutdown() {
    driver_.close();
    if (log_fn_) {
        std::ostringstream oss;
        oss << "[info] live session: ticks=" << state_.ticks_seen
            << " appended=" << state_.samples_appended
            << " no_data=" << state_.ticks_without_data
            << " failures=" << state_.acquisition_failures
            << " rejected=" << state_.rejected_records
            << " buffered=" << state_.buffer.size() << "\n";
        log_fn_(oss.str());
    }
}

void LiveSession::logRow_(const TickContext& ctx, double status, const TickRecord* rec) {
    static const std::vector<std::string> cols = {
        "status", "elapsed_min", "co2_ppm", "anet", "anet_lower", "anet_upper", "buffered"
    };

    std::vector<std::optional<double>> vals(cols.size());
    vals[0] = status;
    if (rec) {
        vals[1] = rec->elapsed_min;
        vals[2] = rec->co2_ppm;
        vals[3] = rec->anet;
        vals[4] = rec->anet_lower;
        vals[5] = rec->anet_upper;
    }
    vals[6] = static_cast<double>(state_.buffer.size());

    Logger::instance().log_wide_optional(name_, ctx.tick_index, ctx.time, cols, vals);
}
