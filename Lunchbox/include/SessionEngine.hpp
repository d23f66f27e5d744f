#pragma once
#include <vector>
#include "Subsystem.hpp"
#include "Logger.hpp"

class LiveSession;

// Ticks registered subsystems in registration order, strictly one tick at a
// time. Registration order is the data-flow order: acquisition first, then
// anything that reads the session state.
class SessionEngine {
public:
    void addSubsystem(Subsystem* subsystem);
    void initialize();
    void tick();
    void setTickStep(double dt);
    void shutdown();

    // True once any subsystem reports it is done.
    bool finished() const;

    int    tickCount() const   { return tick_count_; }
    double sessionTime() const { return session_time_; }

private:
    std::vector<Subsystem*> subsystems_;

    LiveSession* session_ = nullptr;

    int    tick_count_   = 0;
    double session_time_ = 0.0;
    double tick_step_    = 1.0;   // seconds per tick (acquisition interval)

    // helper to emit one wide row for the engine snapshot
    void logRow_(int tick, double time);
};
