#pragma once
#include <cstddef>
#include <optional>

#include "AcquisitionDriver.hpp"
#include "LiveBuffer.hpp"
#include "Logger.hpp"
#include "Subsystem.hpp"

// Everything the live plot needs, owned by LiveSession and written only from
// its tick().
struct SessionState {
    explicit SessionState(std::size_t capacity) : buffer(capacity) {}

    LiveBuffer            buffer;
    std::optional<double> co2_latest;
    std::optional<double> anet_latest;

    int ticks_seen           = 0;
    int samples_appended     = 0;
    int ticks_without_data   = 0;  // driver had nothing yet
    int acquisition_failures = 0;  // driver read/parse errors
    int rejected_records     = 0;  // record with non-finite values
};

// Pulls one record from the acquisition driver per tick and appends it to
// the live buffer. Driver failures cost one tick, never the session.
class LiveSession : public Subsystem {
public:
    LiveSession(AcquisitionDriver& driver, std::size_t capacity, LogFn log_fn = nullptr);

    void initialize() override;
    void tick(const TickContext& ctx) override;
    void shutdown() override;
    bool finished() const override { return driver_.exhausted(); }

    // Drop buffered samples and readouts, keep the driver open.
    void reset();

    const SessionState& state() const { return state_; }

private:
    void logRow_(const TickContext& ctx, double status, const TickRecord* rec);

    AcquisitionDriver& driver_;
    SessionState       state_;
    LogFn              log_fn_;
};
