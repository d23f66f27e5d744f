#pragma once
#include <optional>
#include <string>
#include <vector>

#include "DisplayWindow.hpp"
#include "GasExchange.hpp"
#include "Logger.hpp"
#include "Subsystem.hpp"

class LiveSession;

// Everything a plotting front end needs for one refresh.
struct LiveFrame {
    DisplayWindow           window;
    std::vector<FluxSample> samples;      // samples inside window.x, in order
    std::optional<double>   co2_latest;
    std::optional<double>   anet_latest;
};

// Read side of the live pipeline. Each tick it renders a frame from the
// session's buffer snapshot and logs it to LiveDisplay.csv; every
// readout_every ticks the text readouts go to the run log.
class LiveDisplay : public Subsystem {
public:
    LiveDisplay(const LiveSession& session,
                double span_minutes,
                GasExchange::ReportingBasis basis,
                LogFn log_fn = nullptr,
                int readout_every = 10,
                bool auto_ylim = true);

    void initialize() override;
    void tick(const TickContext& ctx) override;
    void shutdown() override;

    // Pure read of the session's committed state. std::nullopt until the
    // first sample arrives.
    std::optional<LiveFrame> render() const;

    const std::optional<LiveFrame>& lastFrame() const { return last_frame_; }

    // "CO2 = 412 ppm" / "Waiting for CO2 data..."
    static std::string formatCo2(const std::optional<double>& co2);
    // "A_net = +1.23 umol m-2 s-1" / ""
    static std::string formatAnet(const std::optional<double>& anet,
                                  const GasExchange::ReportingBasis& basis);

private:
    const LiveSession&          session_;
    double                      span_min_;
    GasExchange::ReportingBasis basis_;
    LogFn                       log_fn_;
    int                         readout_every_;
    bool                        auto_ylim_;

    std::optional<LiveFrame> last_frame_;
};
