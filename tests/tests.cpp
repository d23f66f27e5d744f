#include "BatchDifferencer.hpp"
#include "DisplayWindow.hpp"
#include "GasExchange.hpp"
#include "GasLogReader.hpp"
#include "Geometry.hpp"
#include "LiveBuffer.hpp"
#include "LiveDisplay.hpp"
#include "LiveSession.hpp"
#include "Logger.hpp"
#include "LunchboxError.hpp"
#include "ReplayDriver.hpp"
#include "SessionEngine.hpp"
#include "SignalFilters.hpp"
#include "SlopeEstimator.hpp"
#include "SoilRespirationMonitor.hpp"
#include "helpers.hpp"

#include <array>
#include <cassert>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

static fs::path g_tmp;

static bool near(double a, double b, double tol = 1e-9) {
    return std::fabs(a - b) <= tol;
}

// Kind of the LunchboxError thrown by f, or std::nullopt if it returned.
template <typename F>
static std::optional<ErrorKind> thrown_kind(F&& f) {
    try {
        f();
    } catch (const LunchboxError& e) {
        return e.kind();
    }
    return std::nullopt;
}

static fs::path write_file(const std::string& name, const std::string& text) {
    fs::path p = g_tmp / name;
    std::ofstream out(p, std::ios::out | std::ios::trunc);
    out << text;
    return p;
}

static FluxSample live_point(double elapsed_min, double anet) {
    FluxSample s;
    s.elapsed = elapsed_min;
    s.flux    = anet;
    return s;
}

// Acquisition driver that plays back a fixed list of outcomes, one per tick.
class ScriptedDriver : public AcquisitionDriver {
public:
    enum class Step { Record, NoData, Fail, NonFinite, Fatal };

    explicit ScriptedDriver(std::vector<Step> steps) : steps_(std::move(steps)) {}

    void open() override { opened = true; }
    void close() override { closed = true; }
    bool exhausted() const override { return next_ >= steps_.size(); }

    std::optional<TickRecord> read(const TickContext& ctx) override {
        if (next_ >= steps_.size()) return std::nullopt;

        TickRecord r;
        r.elapsed_min = ctx.time / 60.0;
        r.co2_ppm     = 410.0 + ctx.tick_index;
        r.anet        = 1.5;
        r.anet_lower  = 1.0;
        r.anet_upper  = 2.0;

        switch (steps_[next_++]) {
            case Step::Record:    return r;
            case Step::NoData:    return std::nullopt;
            case Step::Fail:      throw LunchboxError(ErrorKind::AcquisitionFailure, "short frame");
            case Step::NonFinite: r.anet = std::numeric_limits<double>::quiet_NaN(); return r;
            case Step::Fatal:     throw LunchboxError(ErrorKind::SourceUnavailable, "port closed");
        }
        return std::nullopt;
    }

    bool opened = false;
    bool closed = false;

private:
    std::vector<Step> steps_;
    std::size_t       next_ = 0;
};

// ✅ Test 1: enclosure volumes
void test_geometry_volumes() {
    const double v = Geometry::rectangularVolumeLitres(10.0, 20.0, 30.0);
    assert(near(v, 6.0));

    // strictly increasing in each argument
    assert(Geometry::rectangularVolumeLitres(11.0, 20.0, 30.0) > v);
    assert(Geometry::rectangularVolumeLitres(10.0, 21.0, 30.0) > v);
    assert(Geometry::rectangularVolumeLitres(10.0, 20.0, 31.0) > v);

    // degree-3 scaling
    assert(near(Geometry::rectangularVolumeLitres(20.0, 40.0, 60.0), 8.0 * v, 1e-12));
    assert(near(Geometry::rectangularVolumeLitres(1.75, 0.5, 1.2) * 1000.0,
                Geometry::rectangularVolumeLitres(17.5, 5.0, 12.0), 1e-9));

    const double pot = Geometry::frustumVolumeLitres(5.0, 3.4, 5.3);
    assert(near(pot, (5.3 / 3.0) * (25.0 + 17.0 + 3.4 * 3.4) / 1000.0, 1e-12));

    Geometry::EnclosureGeometry box(Geometry::Shape::Rectangular, {17.5, 5.0, 12.0});
    assert(near(box.volumeLitres(), 1.05));
    assert(box.shape() == Geometry::Shape::Rectangular);

    std::cout << "[PASS] Rectangular and frustum volumes.\n";
}

// ✅ Test 2: bad dimensions and pots that do not fit
void test_geometry_errors() {
    assert(thrown_kind([] { Geometry::rectangularVolumeLitres(0.0, 1.0, 1.0); })
           == ErrorKind::InvalidDimension);
    assert(thrown_kind([] { Geometry::rectangularVolumeLitres(1.0, -2.0, 1.0); })
           == ErrorKind::InvalidDimension);
    assert(thrown_kind([] { Geometry::frustumVolumeLitres(5.0, 3.4, std::nan("")); })
           == ErrorKind::InvalidDimension);
    assert(thrown_kind([] { Geometry::EnclosureGeometry flat(Geometry::Shape::Frustum, {5.0, 0.0, 5.0}); })
           == ErrorKind::InvalidDimension);

    assert(thrown_kind([] { Geometry::netVolumeLitres(1.0, 1.0); }) == ErrorKind::NegativeVolume);
    assert(thrown_kind([] { Geometry::netVolumeLitres(1.0, 1.5); }) == ErrorKind::NegativeVolume);
    assert(near(Geometry::netVolumeLitres(2.5, 0.5), 2.0));
    assert(near(Geometry::netVolumeLitres(1.05, 0.0946), 1.05 - 0.0946));

    std::cout << "[PASS] Invalid dimensions and oversize pots rejected.\n";
}

// ✅ Test 3: ideal gas conversion
void test_net_assimilation() {
    for (double V : {0.5, 1.0, 2.75}) {
        for (double T : {273.15, 295.15, 310.0}) {
            assert(GasExchange::netAssimilation(0.0, V, T) == 0.0);
        }
    }

    const double f = GasExchange::netAssimilation(0.5, 1.0, 295.15);
    assert(near(f, 0.5 * 101325.0 * 0.001 / (8.314 * 295.15), 1e-15));
    assert(near(f, 0.02064, 1e-5));
    assert(GasExchange::netAssimilation(-0.5, 1.0, 295.15) < 0.0);

    assert(thrown_kind([] { GasExchange::netAssimilation(std::nan(""), 1.0, 295.15); })
           == ErrorKind::InvalidMeasurement);
    assert(thrown_kind([] {
               GasExchange::netAssimilation(std::numeric_limits<double>::infinity(), 1.0, 295.15);
           }) == ErrorKind::InvalidMeasurement);
    assert(thrown_kind([] { GasExchange::netAssimilation(0.5, 0.0, 295.15); })
           == ErrorKind::InvalidDimension);
    assert(thrown_kind([] { GasExchange::netAssimilation(0.5, 1.0, -1.0); })
           == ErrorKind::InvalidDimension);

    assert(!thrown_kind([] { GasExchange::validateConditions(1.0, 295.15); }));
    assert(thrown_kind([] { GasExchange::validateConditions(0.0, 295.15); })
           == ErrorKind::InvalidDimension);
    assert(thrown_kind([] { GasExchange::validateConditions(1.0, std::nan("")); })
           == ErrorKind::InvalidDimension);
    assert(thrown_kind([] { GasExchange::validateConditions(1.0, 295.15, -101325.0); })
           == ErrorKind::InvalidDimension);
    assert(thrown_kind([] { BatchDifferencer thin(1.0, 295.15, 0.0); })
           == ErrorKind::InvalidDimension);

    std::cout << "[PASS] Flux conversion and its error kinds.\n";
}

// ✅ Test 4: reporting basis
void test_reported_anet() {
    GasExchange::ReportingBasis area;          // 25 cm^2 leaf
    assert(near(GasExchange::reportedAnet(-0.001, area), 0.4));
    assert(near(GasExchange::reportedAnet(0.001, area), -0.4));

    area.soil_resp_correction = 0.1;
    assert(near(GasExchange::reportedAnet(0.001, area), -0.3));   // correction applied
    assert(near(GasExchange::reportedAnet(-0.001, area), 0.4));   // uptake untouched

    GasExchange::ReportingBasis box;
    box.area_basis = false;
    assert(near(GasExchange::reportedAnet(0.002, box), -0.002));

    const GasExchange::AnetBand band = GasExchange::reportedBand(-0.001, -0.0015, -0.0005, box);
    assert(near(band.anet, 0.001));
    assert(near(band.lower, 0.0005));
    assert(near(band.upper, 0.0015));
    assert(band.lower <= band.anet && band.anet <= band.upper);

    box.soil_resp_correction = 0.0005;
    const GasExchange::AnetBand corr = GasExchange::reportedBand(0.001, 0.0008, 0.0012, box);
    assert(near(corr.anet, -0.0005));
    assert(near(corr.lower, -0.0007));
    assert(near(corr.upper, -0.0003));

    assert(std::string(GasExchange::anetUnits(area)) == "umol m-2 s-1");
    assert(std::string(GasExchange::anetUnits(box)) == "umol box-1 s-1");

    GasExchange::ReportingBasis bad;
    bad.leaf_area_cm2 = 0.0;
    assert(thrown_kind([&] { GasExchange::validateBasis(bad); }) == ErrorKind::InvalidDimension);
    bad.area_basis = false;                    // leaf area unused per box
    assert(!thrown_kind([&] { GasExchange::validateBasis(bad); }));

    std::cout << "[PASS] A_net basis, sign and soil correction.\n";
}

// ✅ Test 5: constant rate recovered by first differences
void test_batch_constant_rate() {
    const double r = 0.3;
    std::vector<GasSample> samples;
    for (int i = 0; i < 10; ++i) {
        GasSample g;
        g.timestamp_s       = 1752946560.0 + 5.0 * i;
        g.concentration_ppm = 400.0 + r * 5.0 * i;
        samples.push_back(g);
    }

    BatchDifferencer diff(0.955, 298.15);
    const FluxSeries series = diff.process(samples);
    assert(series.size() == samples.size());

    assert(series[0].status == SampleStatus::Initial);
    assert(!series[0].flux);
    assert(series[0].elapsed == 0.0);

    const double expected = GasExchange::netAssimilation(r, 0.955, 298.15);
    for (std::size_t i = 1; i < series.size(); ++i) {
        assert(series[i].status == SampleStatus::Ok);
        assert(near(*series[i].rate_ppm_s, r, 1e-9));
        assert(near(*series[i].flux, expected, 1e-12));
        assert(near(series[i].elapsed, 5.0 * i));
    }

    const SeriesSummary sum = summarize(series);
    assert(sum.total == 10 && sum.with_flux == 9 && sum.degenerate == 0 && sum.invalid == 0);

    std::cout << "[PASS] Constant rate recovered for every interval.\n";
}

// ✅ Test 6: duplicate timestamps and unsorted input
void test_batch_degenerate_and_unsorted() {
    std::vector<GasSample> dup = {
        {0.0, "", 400.0}, {10.0, "", 405.0}, {10.0, "", 406.0}, {20.0, "", 410.0}
    };
    const FluxSeries s = BatchDifferencer(1.0, 295.15).process(dup);
    assert(s.size() == 4);
    assert(s[0].status == SampleStatus::Initial);
    assert(s[1].status == SampleStatus::Ok);
    assert(s[2].status == SampleStatus::DegenerateInterval);
    assert(!s[2].flux);
    assert(s[3].status == SampleStatus::Ok);
    assert(near(*s[3].rate_ppm_s, 0.4));

    const SeriesSummary sum = summarize(s);
    assert(sum.with_flux == 2 && sum.degenerate == 1);

    std::vector<GasSample> shuffled = {
        {20.0, "", 415.0}, {0.0, "", 400.0}, {10.0, "", 405.0}
    };
    const FluxSeries o = BatchDifferencer(1.0, 295.15).process(shuffled);
    assert(o[0].timestamp_s == 0.0 && o[1].timestamp_s == 10.0 && o[2].timestamp_s == 20.0);
    assert(near(*o[1].rate_ppm_s, 0.5) && near(*o[2].rate_ppm_s, 1.0));

    assert(BatchDifferencer(1.0, 295.15).process({}).empty());
    assert(thrown_kind([] { BatchDifferencer cold(1.0, 0.0); }) == ErrorKind::InvalidDimension);

    std::cout << "[PASS] Degenerate intervals flagged, processing continues.\n";
}

// ✅ Test 6b: a non-finite reading invalidates both intervals that touch it
void test_batch_invalid_measurement() {
    std::vector<GasSample> gap = {
        {0.0, "", 400.0}, {10.0, "", std::nan("")}, {20.0, "", 410.0}, {30.0, "", 415.0}
    };
    const FluxSeries s = BatchDifferencer(1.0, 295.15).process(gap);
    assert(s.size() == 4);
    assert(s[0].status == SampleStatus::Initial);
    assert(s[1].status == SampleStatus::InvalidMeasurement);
    assert(s[2].status == SampleStatus::InvalidMeasurement);
    assert(s[3].status == SampleStatus::Ok);
    assert(!s[1].flux && !s[2].flux);
    assert(!s[1].delta_ppm && !s[2].delta_ppm);
    assert(near(*s[3].rate_ppm_s, 0.5));
    assert(near(*s[3].flux, GasExchange::netAssimilation(0.5, 1.0, 295.15), 1e-12));

    const SeriesSummary sum = summarize(s);
    assert(sum.total == 4 && sum.with_flux == 1 && sum.degenerate == 0 && sum.invalid == 2);

    std::cout << "[PASS] Non-finite reading flagged, later intervals recover.\n";
}

// ✅ Test 7: the three-row log from file to flux
void test_batch_end_to_end_csv() {
    const fs::path p = write_file("three_rows.csv",
        "Timestamp UTC [Unix],Timestamp Local [yyyy-MM-dd hh:mm:ss],P1 CO2 [ppm]\n"
        "0,1970-01-01 00:00:00,400\n"
        "10,1970-01-01 00:00:10,405\n"
        "20,1970-01-01 00:00:20,415\n");

    auto gas_log = read_gas_log_csv(p);
    assert(gas_log);
    assert(gas_log->samples.size() == 3);

    const FluxSeries series = BatchDifferencer(1.0, 295.15).process(gas_log->samples);
    assert(!series[0].flux);
    assert(near(*series[1].rate_ppm_s, 0.5));
    assert(near(*series[1].flux, 0.5 * 101325.0 * 0.001 / (8.314 * 295.15), 1e-12));
    assert(near(*series[1].flux, 0.02064, 1e-4));
    assert(near(*series[2].rate_ppm_s, 1.0));
    assert(near(*series[2].flux, 1.0 * 101325.0 * 0.001 / (8.314 * 295.15), 1e-12));
    assert(near(*series[2].flux, 0.04128, 1e-4));
    assert(near(*series[2].flux, 2.0 * *series[1].flux, 1e-12));

    GasExchange::ReportingBasis basis;
    log_flux_series(series, basis);

    std::ifstream in(g_tmp / "logs" / "BatchFlux.csv");
    std::string header;
    std::getline(in, header);
    assert(header.rfind("tick,time_s,elapsed_s,co2_ppm", 0) == 0);

    std::cout << "[PASS] Three-row log gives 0.02064 then 0.04128.\n";
}

// ✅ Test 8: datalogger CSV parsing
void test_gas_log_reader() {
    const fs::path p = write_file("messy.csv",
        "# PAS CO2 datalog\n"
        "# port 1\n"
        "\n"
        "Timestamp UTC [Unix],Timestamp Local [yyyy-MM-dd hh:mm:ss],P1 CO2 [ppm]\n"
        "20,2025-07-19 18:36:20,415\n"
        "0,2025-07-19 18:36:00,400\n"
        "bad,2025-07-19 18:36:05,401\n"
        "10,\"2025-07-19 18:36:10\",405\n"
        "5,2025-07-19 18:36:05\n");

    auto gas_log = read_gas_log_csv(p);
    assert(gas_log);
    assert(gas_log->dropped_rows == 2);
    assert(gas_log->sorted_by_local_time);
    assert(gas_log->samples.size() == 3);
    assert(gas_log->samples[0].timestamp_s == 0.0);
    assert(gas_log->samples[1].timestamp_s == 10.0);
    assert(gas_log->samples[2].timestamp_s == 20.0);
    assert(gas_log->samples[1].local_time == "2025-07-19 18:36:10");

    assert(!read_gas_log_csv(g_tmp / "does_not_exist.csv"));

    assert(is_skippable_line("   # note"));
    assert(is_skippable_line("  "));
    assert(!is_skippable_line("1,2,3"));

    assert(!parse_gas_log_row("1,2025-07-19 18:36:00,nan"));
    assert(!parse_gas_log_row("1,2025-07-19 18:36:00"));
    assert(!parse_gas_log_row("1x,2025-07-19 18:36:00,400"));
    auto row = parse_gas_log_row(" 1752946561 , 2025-07-19 18:36:01 , 415.5 ");
    assert(row && row->timestamp_s == 1752946561.0 && row->concentration_ppm == 415.5);

    assert(parse_local_time("1970-01-01 00:01:00") == 60.0);
    assert(parse_local_time("1970-01-02T00:00:00") == 86400.0);
    assert(!parse_local_time("19/07/2025 18:36"));
    assert(!parse_local_time("2025-13-01 00:00:00"));
    assert(*parse_local_time("2025-07-19 18:36:00") < *parse_local_time("2025-07-20 00:00:00"));

    std::cout << "[PASS] Comments, header and malformed rows handled.\n";
}

// ✅ Test 9: bounded FIFO
void test_live_buffer() {
    LiveBuffer buf(5);
    assert(buf.empty() && !buf.latest());

    for (int i = 0; i < 8; ++i) buf.append(live_point(i, i * 0.1));
    assert(buf.size() == 5);

    const std::vector<FluxSample> snap = buf.snapshot();
    for (std::size_t i = 0; i < snap.size(); ++i) {
        assert(snap[i].elapsed == static_cast<double>(i + 3));
    }
    assert(buf.latest()->elapsed == 7.0);

    buf.clear();
    assert(buf.empty() && buf.capacity() == 5);

    assert(LiveBuffer::capacityFor(10.0, 1.0) == 600);
    assert(LiveBuffer::capacityFor(0.5, 0.7) == 42);
    assert(LiveBuffer::capacityFor(0.0, 1.0) == 1);
    assert(LiveBuffer::capacityFor(10.0, 0.0) == 1);
    assert(LiveBuffer(0).capacity() == 1);
    assert(LiveBuffer::capacityFor(1e9, 1e-9) == LiveBuffer::MAX_CAPACITY);
    assert(LiveBuffer::capacityFor(std::numeric_limits<double>::max(), 1.0) == LiveBuffer::MAX_CAPACITY);
    assert(LiveBuffer::capacityFor(1.0, std::numeric_limits<double>::denorm_min())
           == LiveBuffer::MAX_CAPACITY);
    assert(LiveBuffer::capacityFor(0.001, 10.0) == 1);

    std::cout << "[PASS] LiveBuffer keeps the newest capacity samples in order.\n";
}

// ✅ Test 10: axis ranges
void test_display_window() {
    std::vector<FluxSample> flat;
    for (int i = 0; i < 5; ++i) flat.push_back(live_point(i, 5.0));
    auto w = Display::computeWindow(flat, 10.0);
    assert(w);
    assert(near(w->x.lo, 0.0) && near(w->x.hi, 10.0));
    assert(near(w->y.lo, 4.0) && near(w->y.hi, 6.0));
    assert(w->samples_in_window == 5);

    std::vector<FluxSample> spread = {live_point(0, 0.0), live_point(1, 10.0), live_point(2, 20.0)};
    w = Display::computeWindow(spread, 10.0);
    assert(near(w->y.lo, -2.0) && near(w->y.hi, 22.0));

    std::vector<FluxSample> low = {live_point(0, -9.5), live_point(1, 20.0)};
    w = Display::computeWindow(low, 10.0);
    assert(w->y.lo == Display::Y_FLOOR);
    assert(near(w->y.hi, 22.95));

    std::vector<FluxSample> longer;
    for (int i = 0; i <= 15; ++i) longer.push_back(live_point(i, i));
    w = Display::computeWindow(longer, 10.0);
    assert(near(w->x.lo, 5.0) && near(w->x.hi, 15.0));
    assert(w->samples_in_window == 11);
    assert(near(w->y.lo, 4.0) && near(w->y.hi, 16.0));
    assert(Display::samplesInWindow(longer, *w).size() == 11);
    assert(Display::samplesInWindow(longer, *w).front().elapsed == 5.0);

    // band from the bounds when present
    FluxSample banded = live_point(0, 2.0);
    banded.flux_lower = -3.0;
    banded.flux_upper = 7.0;
    w = Display::computeWindow({banded}, 10.0);
    assert(near(w->y.lo, -4.0) && near(w->y.hi, 8.0));

    assert(!Display::computeWindow({}, 10.0));

    FluxSample empty_point;
    empty_point.elapsed = 1.0;
    w = Display::computeWindow({empty_point}, 10.0);
    assert(w && w->y.lo == -1.0 && w->y.hi == 1.0);

    // fixed y range ignores the data, x still follows it
    w = Display::computeWindow(longer, 10.0, false);
    assert(w && w->y.lo == Display::FIXED_Y_LO && w->y.hi == Display::FIXED_Y_HI);
    assert(w->y.lo == -5.0 && w->y.hi == 8.0);
    assert(near(w->x.lo, 5.0) && near(w->x.hi, 15.0));
    assert(w->samples_in_window == 11);

    std::cout << "[PASS] Display window ranges, padding and floor.\n";
}

// ✅ Test 11: rolling least squares
void test_slope_estimator() {
    SlopeEstimator est(5, false);
    for (int t = 0; t < 4; ++t) est.push(t, 400.0 + 2.0 * t);
    assert(!est.ready() && !est.fit());

    est.push(4.0, 408.0);
    auto f = est.fit();
    assert(f);
    assert(f->n == 5);
    assert(near(f->slope, 2.0, 1e-9));
    assert(f->std_err < 1e-9);
    assert(near(f->lower, 2.0, 1e-8) && near(f->upper, 2.0, 1e-8));

    for (int t = 5; t < 10; ++t) est.push(t, 400.0 + 2.0 * t + ((t % 2) ? 1.0 : -1.0));
    assert(est.size() == 5);
    f = est.fit();
    assert(f && f->std_err > 0.0);
    assert(f->lower < f->slope && f->slope < f->upper);
    assert(near(f->upper - f->slope, SlopeEstimator::Z_95 * f->std_err));

    SlopeEstimator same_time(3, false);
    for (int i = 0; i < 3; ++i) same_time.push(100.0, 400.0 + i);
    assert(!same_time.fit());

    assert(SlopeEstimator(1).windowSize() == 3);
    assert(SlopeEstimator().method() == FitMethod::LeastSquares);

    // smoothing leaves a clean ramp alone, whatever the window length
    for (std::size_t n : {5u, 11u, 19u, 41u}) {
        SlopeEstimator smooth(n);
        for (std::size_t t = 0; t < n; ++t) smooth.push(t, 400.0 + 0.5 * t);
        auto s = smooth.fit();
        assert(s && near(s->slope, 0.5, 1e-9));
    }

    // ... and tightens the band on alternating jitter
    SlopeEstimator raw(41, false);
    SlopeEstimator smooth(41, true);
    for (int t = 0; t < 41; ++t) {
        const double c = 400.0 + 0.5 * t + ((t % 2) ? 1.0 : -1.0);
        raw.push(t, c);
        smooth.push(t, c);
    }
    auto r = raw.fit();
    auto s = smooth.fit();
    assert(r && s);
    assert(near(r->slope, 0.5, 1e-9));
    assert(near(s->slope, 0.5, 1e-4));
    assert(s->std_err < 0.1 * r->std_err);

    std::cout << "[PASS] Slope, standard error and smoothing.\n";
}

// ✅ Test 11b: median, Savitzky-Golay and Butterworth stages
void test_signal_filters() {
    const std::vector<double> m = Filters::medianFilter({1.0, 100.0, 3.0, 4.0, 5.0}, 5);
    assert((m == std::vector<double>{1.0, 100.0, 4.0, 4.0, 5.0}));

    const std::vector<double> spike = {1.0, 2.0, 100.0, 4.0, 5.0, 6.0, 7.0};
    assert((Filters::medianFilter(spike, 5) == std::vector<double>{1.0, 2.0, 4.0, 5.0, 6.0, 6.0, 7.0}));
    assert(Filters::medianFilter(spike, 4) == Filters::medianFilter(spike, 5));
    assert(Filters::medianFilter({3.0, 1.0}, 5).size() == 2);

    std::vector<double> ramp;
    std::vector<double> quad;
    for (int i = 0; i < 30; ++i) {
        ramp.push_back(400.0 + 0.5 * i);
        quad.push_back(0.1 * i * i - i + 3.0);
    }
    assert(Filters::medianFilter(ramp, 5) == ramp);

    const std::vector<double> sg = Filters::savitzkyGolay(quad, 19, 2);
    for (std::size_t i = 0; i < quad.size(); ++i) assert(near(sg[i], quad[i], 1e-8));
    const std::vector<double> few = {1.0, 4.0, 9.0, 16.0};   // window shrinks to 3
    const std::vector<double> sg_few = Filters::savitzkyGolay(few, 19, 2);
    for (std::size_t i = 0; i < few.size(); ++i) assert(near(sg_few[i], few[i], 1e-9));
    assert(Filters::savitzkyGolay({1.0, 2.0}, 19, 2).size() == 2);

    const Filters::LowpassFilter lp = Filters::butterworthLowpass(5, 0.1, 1.0);
    assert(lp.order == 5 && lp.sections.size() == 3);
    for (const auto& sec : lp.sections) {
        assert(near((sec.b0 + sec.b1 + sec.b2) / (1.0 + sec.a1 + sec.a2), 1.0, 1e-12));
    }
    assert(Filters::butterworthLowpass(5, 0.1, 0.2).sections.empty());
    assert(Filters::butterworthLowpass(4, 0.1, 1.0).sections.size() == 2);

    const std::vector<double> ff = Filters::filtfilt(lp, ramp);
    for (std::size_t i = 0; i < ramp.size(); ++i) assert(near(ff[i], ramp[i], 1e-9));

    std::vector<double> alt;
    for (int i = 0; i < 120; ++i) alt.push_back(400.0 + ((i % 2) ? -1.0 : 1.0));
    const std::vector<double> calm = Filters::filtfilt(lp, alt);
    assert(calm.size() == alt.size());
    for (std::size_t i = 40; i < 80; ++i) assert(near(calm[i], 400.0, 0.01));

    const std::vector<double> sm = Filters::smoothCo2(ramp, 1.0);
    for (std::size_t i = 0; i < ramp.size(); ++i) assert(near(sm[i], ramp[i], 1e-8));
    assert(Filters::smoothCo2({}, 1.0).empty());

    std::cout << "[PASS] Filter stages keep ramps and remove jitter.\n";
}

// ✅ Test 11c: Huber fit shrugs off a single outlier
void test_huber_fit() {
    std::vector<double> x;
    std::vector<double> y;
    for (int t = 0; t <= 20; ++t) {
        x.push_back(t);
        y.push_back(400.0 + 0.5 * t + ((t % 2) ? 0.2 : -0.2));
    }
    y[20] += 50.0;

    auto ols = SlopeEstimator::fitLeastSquares(x, y);
    auto hub = SlopeEstimator::fitHuber(x, y);
    assert(ols && hub);
    assert(std::fabs(ols->slope - 0.5) > 0.5);
    assert(std::fabs(hub->slope - 0.5) < 0.05);
    assert(hub->std_err > 0.0 && hub->std_err < ols->std_err);
    assert(hub->lower < hub->slope && hub->slope < hub->upper);

    // exact line: scale collapses to zero, band too
    std::vector<double> clean(x.size());
    for (std::size_t i = 0; i < x.size(); ++i) clean[i] = 400.0 + 0.5 * x[i];
    auto exact = SlopeEstimator::fitHuber(x, clean);
    assert(exact && near(exact->slope, 0.5, 1e-12) && exact->std_err == 0.0);

    assert(!SlopeEstimator::fitHuber({1.0, 2.0}, {1.0, 2.0}));
    assert(!SlopeEstimator::fitHuber({3.0, 3.0, 3.0}, {1.0, 2.0, 3.0}));

    SlopeEstimator rolling(21, false, FitMethod::Huber);
    for (std::size_t i = 0; i < x.size(); ++i) rolling.push(x[i], y[i]);
    auto f = rolling.fit();
    assert(f && near(f->slope, hub->slope, 1e-9));

    std::cout << "[PASS] Huber fit down-weights an outlier.\n";
}

// ✅ Test 12: session survives per-tick driver problems
void test_live_session_scripted() {
    using Step = ScriptedDriver::Step;
    ScriptedDriver driver({Step::Record, Step::Fail, Step::NoData, Step::NonFinite, Step::Record});
    LiveSession session(driver, 100);

    SessionEngine engine;
    engine.addSubsystem(&session);
    engine.setTickStep(1.0);
    engine.initialize();
    assert(driver.opened);

    int guard = 0;
    while (!engine.finished()) {
        engine.tick();
        assert(++guard < 100);
    }
    engine.shutdown();
    assert(driver.closed);
    assert(engine.tickCount() == 6);

    const SessionState& st = session.state();
    assert(st.ticks_seen == 5);
    assert(st.samples_appended == 2);
    assert(st.acquisition_failures == 1);
    assert(st.ticks_without_data == 1);
    assert(st.rejected_records == 1);
    assert(st.buffer.size() == 2);
    assert(st.anet_latest && *st.anet_latest == 1.5);
    assert(st.co2_latest && *st.co2_latest == 415.0);

    session.reset();
    assert(session.state().buffer.empty() && !session.state().co2_latest);

    ScriptedDriver fatal({Step::Fatal});
    LiveSession doomed(fatal, 10);
    doomed.initialize();
    assert(thrown_kind([&] { doomed.tick(TickContext{1, 1.0, 1.0}); })
           == ErrorKind::SourceUnavailable);

    std::cout << "[PASS] Acquisition failures skip a tick, fatal errors propagate.\n";
}

// ✅ Test 13: replay a log through the live pipeline
void test_replay_live_pipeline() {
    std::string csv =
        "# replay\n"
        "Timestamp UTC [Unix],Timestamp Local [yyyy-MM-dd hh:mm:ss],P1 CO2 [ppm]\n";
    for (int t = 0; t < 10; ++t) {
        if (t == 6) csv += "oops,1970-01-01 00:00:06,garbage\n";
        csv += std::to_string(1000 + t) + ",1970-01-01 00:00:0" + std::to_string(t) + "," +
               std::to_string(400.0 + 0.5 * t) + "\n";
    }
    const fs::path p = write_file("replay.csv", csv);

    ReplayOptions ro;
    ro.fit_window       = 3;
    ro.volume_litres    = 1.0;
    ro.temperature_k    = 295.15;
    ro.basis.area_basis = false;

    ReplayDriver driver(p, ro);
    LiveSession  session(driver, LiveBuffer::capacityFor(10.0, 1.0));
    LiveDisplay  display(session, 10.0, ro.basis);

    SessionEngine engine;
    engine.addSubsystem(&session);
    engine.addSubsystem(&display);
    engine.setTickStep(1.0);
    engine.initialize();

    int guard = 0;
    while (!engine.finished()) {
        engine.tick();
        assert(++guard < 100);
    }
    engine.shutdown();

    const SessionState& st = session.state();
    assert(driver.rowsRead() == 10);
    assert(st.samples_appended == 8);
    assert(st.acquisition_failures == 1);
    assert(st.ticks_without_data == 3);     // two while filling, one at EOF
    assert(st.buffer.size() == 8);

    const double release = GasExchange::netAssimilation(0.5, 1.0, 295.15);
    assert(near(*st.anet_latest, -release, 1e-9));
    assert(near(*st.co2_latest, 404.5));
    assert(near(st.buffer.latest()->elapsed, 9.0 / 60.0));

    const auto& frame = display.lastFrame();
    assert(frame);
    assert(frame->samples.size() == 8);
    assert(frame->window.y.lo < *st.anet_latest && *st.anet_latest < frame->window.y.hi);
    assert(display.render());

    ReplayDriver missing(g_tmp / "no_such_replay.csv", ro);
    assert(thrown_kind([&] { missing.open(); }) == ErrorKind::SourceUnavailable);

    ReplayOptions bad = ro;
    bad.volume_litres = -1.0;
    assert(thrown_kind([&] { ReplayDriver rejected(p, bad); }) == ErrorKind::InvalidDimension);

    std::cout << "[PASS] Replayed log reaches the buffer and display.\n";
}

static std::string ramp_log(double slope_ppm_s, int rows, double step_s = 1.0) {
    std::string csv = "Timestamp UTC [Unix],Timestamp Local [yyyy-MM-dd hh:mm:ss],P1 CO2 [ppm]\n";
    for (int i = 0; i < rows; ++i) {
        csv += std::to_string(1000.0 + step_s * i) + ",," +
               std::to_string(400.0 + slope_ppm_s * step_s * i) + "\n";
    }
    return csv;
}

// ✅ Test 13b: empty-box drift subtracted from live slopes
void test_zero_run_baseline() {
    std::vector<GasSample> empty_box;
    for (int t = 0; t <= 30; t += 5) empty_box.push_back({static_cast<double>(t), "", 400.0 + 0.05 * t});
    empty_box.push_back({35.0, "", 500.0});     // lid opened, outside the zero run
    std::swap(empty_box[0], empty_box[3]);      // order does not matter
    auto zero = zero_run_slope(empty_box);
    assert(zero && near(*zero, 0.05, 1e-12));
    assert(!zero_run_slope({{0.0, "", 400.0}, {1.0, "", 401.0}}));
    assert(!zero_run_slope({}));
    assert(*zero_run_slope(empty_box, 1000.0) > 0.05);

    const fs::path p = write_file("drifting.csv", ramp_log(0.5, 12));

    ReplayOptions ro;
    ro.fit_window       = 5;
    ro.volume_litres    = 1.0;
    ro.temperature_k    = 295.15;
    ro.basis.area_basis = false;
    ro.baseline_slope   = 0.1;

    ReplayDriver driver(p, ro);
    LiveSession  session(driver, 100);
    SessionEngine engine;
    engine.addSubsystem(&session);
    engine.setTickStep(1.0);
    engine.initialize();
    int guard = 0;
    while (!engine.finished()) {
        engine.tick();
        assert(++guard < 100);
    }
    engine.shutdown();

    const double corrected = GasExchange::netAssimilation(0.5 - 0.1, 1.0, 295.15);
    assert(session.state().samples_appended == 8);
    assert(near(*session.state().anet_latest, -corrected, 1e-9));

    ReplayOptions bad = ro;
    bad.baseline_slope = std::nan("");
    assert(thrown_kind([&] { ReplayDriver rejected(p, bad); }) == ErrorKind::InvalidMeasurement);

    std::cout << "[PASS] Zero-run drift fitted and subtracted.\n";
}

// ✅ Test 14: readout strings
void test_display_readouts() {
    GasExchange::ReportingBasis area;
    GasExchange::ReportingBasis box;
    box.area_basis = false;

    assert(LiveDisplay::formatCo2(std::nullopt) == "Waiting for CO2 data...");
    assert(LiveDisplay::formatCo2(412.4) == "CO2 = 412 ppm");
    assert(LiveDisplay::formatAnet(1.234, area) == "A_net = +1.23 umol m-2 s-1");
    assert(LiveDisplay::formatAnet(-0.5, box) == "A_net = -0.50 umol box-1 s-1");
    assert(LiveDisplay::formatAnet(std::nullopt, area).empty());

    std::cout << "[PASS] CO2 and A_net readouts.\n";
}

// ✅ Test 15: soil respiration estimate
void test_soil_respiration() {
    const double area = SoilRespirationMonitor::topAreaM2(5.0, 5.0);
    assert(near(area, 0.0025));
    assert(thrown_kind([] { SoilRespirationMonitor::topAreaM2(0.0, 5.0); })
           == ErrorKind::InvalidDimension);

    SoilRespirationMonitor soil;
    assert(!soil.estimate(area));
    assert(thrown_kind([&] { soil.estimate(0.0); }) == ErrorKind::InvalidDimension);

    soil.add(0.2, -1.0);                       // still warming up
    soil.add(1.0, 0.5);                        // uptake, not respiration
    soil.add(1.0, std::nan(""));
    assert(soil.count() == 0);

    for (int i = 0; i < 3; ++i) soil.add(1.0 + i, -0.002);
    assert(soil.count() == 3);
    assert(near(*soil.estimate(area), -0.8, 1e-9));

    for (int i = 0; i < 17; ++i) soil.add(5.0 + i, -0.002);
    soil.add(30.0, -1.0);                      // > 3 sd below the mean
    assert(soil.count() == 21);
    assert(near(*soil.estimate(area), -0.8, 1e-9));

    std::cout << "[PASS] Soil respiration outliers trimmed and averaged.\n";
}

// ✅ Test 16: configuration and input discovery
void test_session_config_and_files() {
    LunchboxHelpers::Args args;
    LunchboxHelpers::SessionConfig cfg = LunchboxHelpers::make_session_config(args);
    assert(near(cfg.enclosure_l, 1.05));
    assert(cfg.enclosure.shape() == Geometry::Shape::Rectangular);
    assert((cfg.enclosure.dimensionsCm() == std::array<double, 3>{17.5, 5.0, 12.0}));
    assert(cfg.pot && cfg.pot->shape() == Geometry::Shape::Frustum);
    assert(near(cfg.pot->volumeLitres(), cfg.pot_l));
    assert(near(cfg.pot_l, Geometry::frustumVolumeLitres(5.0, 3.4, 5.3)));
    assert(cfg.smoothing && cfg.auto_ylim && cfg.fit_method == FitMethod::LeastSquares);
    assert(cfg.baseline_slope == 0.0);
    assert(near(cfg.volume_l, cfg.enclosure_l - cfg.pot_l));
    assert(near(cfg.temp_k, 298.15));
    assert(cfg.capacity == 600);

    std::vector<std::string> argv_s = {"lunchbox", "--mode", "batch", "--no-pot",
                                       "--temp-k", "300", "--per-box", "--window-min", "2",
                                       "--interval", "0.5", "--soil-top", "4", "6"};
    std::vector<char*> argv;
    for (auto& s : argv_s) argv.push_back(&s[0]);
    LunchboxHelpers::Args parsed =
        LunchboxHelpers::parse_args(static_cast<int>(argv.size()), argv.data());
    assert(parsed.mode == "batch" && !parsed.usePot && !parsed.areaBasis);
    assert(parsed.soilTopWidth == 4.0 && parsed.soilTopLength == 6.0);
    cfg = LunchboxHelpers::make_session_config(parsed);
    assert(near(cfg.volume_l, 1.05) && cfg.temp_k == 300.0 && cfg.capacity == 240);
    assert(!cfg.pot && cfg.pot_l == 0.0);

    std::vector<std::string> fit_s = {"lunchbox", "--no-smoothing", "--robust", "--fixed-ylim",
                                      "--zero-slope", "0.02"};
    std::vector<char*> fit_argv;
    for (auto& s : fit_s) fit_argv.push_back(&s[0]);
    LunchboxHelpers::Args fit_args =
        LunchboxHelpers::parse_args(static_cast<int>(fit_argv.size()), fit_argv.data());
    assert(!fit_args.smoothing && fit_args.robustFit && !fit_args.autoYlim);
    cfg = LunchboxHelpers::make_session_config(fit_args);
    assert(!cfg.smoothing && cfg.fit_method == FitMethod::Huber && !cfg.auto_ylim);
    assert(cfg.baseline_slope == 0.02);

    LunchboxHelpers::Args zero_args;
    zero_args.zeroRunFile = write_file("empty_box.csv", ramp_log(0.04, 40)).string();
    zero_args.zeroSlope   = 9.0;                 // --zero-run wins
    cfg = LunchboxHelpers::make_session_config(zero_args);
    assert(near(cfg.baseline_slope, 0.04, 1e-9));
    zero_args.zeroRunSeconds = 1.0;              // two samples only
    assert(thrown_kind([&] { LunchboxHelpers::make_session_config(zero_args); })
           == ErrorKind::InvalidMeasurement);
    zero_args.zeroRunFile = (g_tmp / "no_zero_run.csv").string();
    assert(thrown_kind([&] { LunchboxHelpers::make_session_config(zero_args); })
           == ErrorKind::SourceUnavailable);

    LunchboxHelpers::Args tiny;
    tiny.boxWidth = tiny.boxHeight = tiny.boxLength = 1.0;
    assert(thrown_kind([&] { LunchboxHelpers::make_session_config(tiny); })
           == ErrorKind::NegativeVolume);
    tiny.boxWidth = 0.0;
    assert(thrown_kind([&] { LunchboxHelpers::make_session_config(tiny); })
           == ErrorKind::InvalidDimension);

    const fs::path dir = g_tmp / "desktop";
    fs::create_directories(dir);
    assert(!LunchboxHelpers::find_latest_log(dir, "PAS_CO2_datalog_"));
    assert(!LunchboxHelpers::find_latest_log(g_tmp / "nowhere", "PAS_CO2_datalog_"));

    const fs::path older = dir / "PAS_CO2_datalog_20250719-120000.csv";
    const fs::path newer = dir / "PAS_CO2_datalog_20250719-183601.csv";
    for (const fs::path& p : {older, newer, dir / "other.csv", dir / "PAS_CO2_datalog_x.txt"}) {
        std::ofstream out(p);
        out << "Timestamp UTC,Timestamp Local,CO2\n";
    }
    const auto now = fs::file_time_type::clock::now();
    fs::last_write_time(older, now - std::chrono::hours(2));
    fs::last_write_time(newer, now - std::chrono::hours(1));
    fs::last_write_time(dir / "other.csv", now);

    auto latest = LunchboxHelpers::find_latest_log(dir, "PAS_CO2_datalog_");
    assert(latest && latest->filename() == newer.filename());

    LunchboxHelpers::Args in;
    in.logDir = dir.string();
    assert(LunchboxHelpers::resolve_input_file(in).filename() == newer.filename());
    in.file = (dir / "missing.csv").string();
    assert(thrown_kind([&] { LunchboxHelpers::resolve_input_file(in); })
           == ErrorKind::SourceUnavailable);

    std::cout << "[PASS] Session config and newest-log discovery.\n";
}

int main() {
    g_tmp = fs::temp_directory_path() / "lunchbox_tests";
    fs::remove_all(g_tmp);
    fs::create_directories(g_tmp);
    setenv("LB_LOG_DIR", (g_tmp / "logs").c_str(), 1);
    unsetenv("RUN_ID");

    test_geometry_volumes();
    test_geometry_errors();
    test_net_assimilation();
    test_reported_anet();
    test_batch_constant_rate();
    test_batch_degenerate_and_unsorted();
    test_batch_invalid_measurement();
    test_batch_end_to_end_csv();
    test_gas_log_reader();
    test_live_buffer();
    test_display_window();
    test_slope_estimator();
    test_signal_filters();
    test_huber_fit();
    test_live_session_scripted();
    test_replay_live_pipeline();
    test_zero_run_baseline();
    test_display_readouts();
    test_soil_respiration();
    test_session_config_and_files();

    Logger::instance().close_all();
    std::cout << "✅ All tests passed.\n";
    return 0;
}
