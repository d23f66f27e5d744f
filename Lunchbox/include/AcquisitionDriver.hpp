#pragma once
#include <optional>

#include "TickContext.hpp"

// What an acquisition source hands the live session once per tick.
struct TickRecord {
    double elapsed_min = 0.0;
    double co2_ppm     = 0.0;
    double anet        = 0.0;  // reported A_net (uptake positive)
    double anet_lower  = 0.0;
    double anet_upper  = 0.0;
};

// Source of live tick records (sensor port, log replay, test fakes).
class AcquisitionDriver {
public:
    virtual ~AcquisitionDriver() = default;

    // Throws LunchboxError(SourceUnavailable) if the source cannot be opened.
    virtual void open() {}

    // std::nullopt means "no data this tick" (not an error). A read or parse
    // problem is reported as LunchboxError(AcquisitionFailure); the session
    // skips that tick and keeps going.
    virtual std::optional<TickRecord> read(const TickContext& ctx) = 0;

    // True once the source will never produce another record.
    virtual bool exhausted() const { return false; }

    virtual void close() {}
};
