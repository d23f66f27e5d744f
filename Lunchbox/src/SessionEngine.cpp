#include "SessionEngine.hpp"
#include "LiveSession.hpp"
#include "Logger.hpp"

void SessionEngine::addSubsystem(Subsystem* subsystem) {
    subsystems_.push_back(subsystem);
}

void SessionEngine::initialize() {
    session_ = nullptr;
    for (auto* s : subsystems_) {
        if (auto* ls = dynamic_cast<LiveSession*>(s)) session_ = ls;
    }

    for (auto* s : subsystems_) s->initialize();

    logRow_(/*tick*/0, /*time*/0.0);

    tick_count_   = 1;
    session_time_ = tick_step_;
}

void SessionEngine::tick() {
    const TickContext ctx{ tick_count_, session_time_, tick_step_ };

    for (auto* s : subsystems_) s->tick(ctx);

    logRow_(tick_count_, session_time_);

    tick_count_   += 1;
    session_time_ += tick_step_;
}

void SessionEngine::setTickStep(double dt) {
    tick_step_ = dt;
}

bool SessionEngine::finished() const {
    for (const auto* s : subsystems_) {
        if (s->finished()) return true;
    }
    return false;
}

void SessionEngine::shutdown() {
    for (auto* s : subsystems_) s->shutdown();
}

void SessionEngine::logRow_(int tick, double time) {
    double buffered  = 0.0;
    double capacity  = 0.0;
    double appended  = 0.0;
    double no_data   = 0.0;
    double failures  = 0.0;

    if (session_) {
        const SessionState& st = session_->state();
        buffered = static_cast<double>(st.buffer.size());
        capacity = static_cast<double>(st.buffer.capacity());
        appended = st.samples_appended;
        no_data  = st.ticks_without_data;
        failures = st.acquisition_failures;
    }

    Logger::instance().log_wide(
        "SessionEngine",
        tick,
        time,
        {"status","subsystems","buffered","capacity","appended","no_data","failures"},
        {1.0, static_cast<double>(subsystems_.size()),
         buffered, capacity, appended, no_data, failures}
    );
}
