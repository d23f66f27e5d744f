#include "LunchboxError.hpp"

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidDimension:   return "InvalidDimension";
        case ErrorKind::NegativeVolume:     return "NegativeVolume";
        case ErrorKind::InvalidMeasurement: return "InvalidMeasurement";
        case ErrorKind::DegenerateInterval: return "DegenerateInterval";
        case ErrorKind::AcquisitionFailure: return "AcquisitionFailure";
        case ErrorKind::SourceUnavailable:  return "SourceUnavailable";
    }
    return "Unknown";
}

LunchboxError::LunchboxError(ErrorKind kind, const std::string& what)
    : std::runtime_error(std::string(errorKindName(kind)) + ": " + what),
      kind_(kind) {}
