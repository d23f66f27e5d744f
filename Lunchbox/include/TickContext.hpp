#pragma once

// Per-tick timing handed to every Subsystem::tick().
struct TickContext {
    int    tick_index = 0;   // 1-based once the session loop is running
    double time       = 0.0; // seconds since session start
    double dt         = 1.0; // seconds per tick (acquisition interval)
};
