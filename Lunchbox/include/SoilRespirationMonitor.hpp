#pragma once
#include <cstddef>
#include <optional>
#include <vector>

#include "Logger.hpp"
#include "Subsystem.hpp"

class LiveSession;

// Estimates the soil respiration correction from a pot with no plant.
//
// Every new per-box A_net reading after the warm-up period that is negative
// (net release) is kept. The estimate discards values below mean - 3 sd,
// averages the rest and divides by the soil surface area, giving the
// correction in umol m^-2 s^-1 to feed back as --soil-resp.
class SoilRespirationMonitor : public Subsystem {
public:
    explicit SoilRespirationMonitor(const LiveSession* session = nullptr,
                                    double ignore_initial_min = 0.5,
                                    LogFn log_fn = nullptr);

    // Soil surface of a square/rectangular pot top, cm -> m^2.
    // Throws LunchboxError(InvalidDimension) for non-positive sides.
    static double topAreaM2(double width_cm, double length_cm);

    // Offer one per-box A_net reading (uptake positive).
    void add(double elapsed_min, double anet_per_box);

    std::size_t count() const { return values_.size(); }

    // std::nullopt if no negative value was collected.
    // Throws LunchboxError(InvalidDimension) for a non-positive area.
    std::optional<double> estimate(double top_area_m2) const;

    void initialize() override;
    void tick(const TickContext& ctx) override;
    void shutdown() override {}

private:
    const LiveSession*  session_;
    double              ignore_initial_min_;
    LogFn               log_fn_;
    int                 last_seen_appended_ = 0;
    std::vector<double> values_;
};
