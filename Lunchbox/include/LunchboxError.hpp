#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
    InvalidDimension,    // non-positive geometry / physical constant (config time)
    NegativeVolume,      // pot does not fit in the enclosure (config time)
    InvalidMeasurement,  // non-finite concentration, rate or flux (per sample)
    DegenerateInterval,  // zero or negative elapsed time (per sample)
    AcquisitionFailure,  // driver could not read/parse a frame (per tick)
    SourceUnavailable    // no log file / port for this session (fatal)
};

const char* errorKindName(ErrorKind kind);

class LunchboxError : public std::runtime_error {
public:
    LunchboxError(ErrorKind kind, const std::string& what);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};
