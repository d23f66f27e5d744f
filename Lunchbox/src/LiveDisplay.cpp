#include "LiveDisplay.hpp"
#include "LiveSession.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

LiveDisplay::LiveDisplay(const LiveSession& session,
                         double span_minutes,
                         GasExchange::ReportingBasis basis,
                         LogFn log_fn,
                         int readout_every,
                         bool auto_ylim)
    : Subsystem("LiveDisplay"),
      session_(session),
      span_min_(span_minutes),
      basis_(basis),
      log_fn_(std::move(log_fn)),
      readout_every_(readout_every > 0 ? readout_every : 1),
      auto_ylim_(auto_ylim) {}

void LiveDisplay::initialize() {
    last_frame_.reset();
}

std::optional<LiveFrame> LiveDisplay::render() const {
    const SessionState& st = session_.state();
    const std::vector<FluxSample> snap = st.buffer.snapshot();

    auto window = Display::computeWindow(snap, span_min_, auto_ylim_);
    if (!window) return std::nullopt;

    LiveFrame frame;
    frame.window      = *window;
    frame.samples     = Display::samplesInWindow(snap, *window);
    frame.co2_latest  = st.co2_latest;
    frame.anet_latest = st.anet_latest;
    return frame;
}

void LiveDisplay::tick(const TickContext& ctx) {
    last_frame_ = render();

    static const std::vector<std::string> cols = {
        "status", "x_lo", "x_hi", "y_lo", "y_hi", "n_in_window", "co2_ppm", "anet"
    };

    std::vector<std::optional<double>> vals(cols.size());
    vals[0] = last_frame_ ? 1.0 : 0.0;
    if (last_frame_) {
        const DisplayWindow& w = last_frame_->window;
        vals[1] = w.x.lo;
        vals[2] = w.x.hi;
        vals[3] = w.y.lo;
        vals[4] = w.y.hi;
        vals[5] = static_cast<double>(w.samples_in_window);
        vals[6] = last_frame_->co2_latest;
        vals[7] = last_frame_->anet_latest;
    }
    Logger::instance().log_wide_optional(name_, ctx.tick_index, ctx.time, cols, vals);

    if (log_fn_ && ctx.tick_index % readout_every_ == 0) {
        const SessionState& st = session_.state();
        std::ostringstream oss;
        oss << "[live] t=" << ctx.time << " s | " << formatCo2(st.co2_latest);
        const std::string anet = formatAnet(st.anet_latest, basis_);
        if (!anet.empty()) oss << " | " << anet;
        if (last_frame_) {
            oss << " | y=[" << last_frame_->window.y.lo << ", "
                << last_frame_->window.y.hi << "]";
        }
        oss << "\n";
        log_fn_(oss.str());
    }
}

void LiveDisplay::shutdown() {}

std::string LiveDisplay::formatCo2(const std::optional<double>& co2) {
    if (!co2 || !std::isfinite(*co2)) return "Waiting for CO2 data...";
    std::ostringstream oss;
    oss << "CO2 = " << std::llround(*co2) << " ppm";
    return oss.str();
}

std::string LiveDisplay::formatAnet(const std::optional<double>& anet,
                                    const GasExchange::ReportingBasis& basis) {
    if (!anet || !std::isfinite(*anet)) return "";
    std::ostringstream oss;
    oss << "A_net = " << std::showpos << std::fixed << std::setprecision(2) << *anet
        << std::noshowpos << ' ' << GasExchange::anetUnits(basis);
    return oss.str();
}
