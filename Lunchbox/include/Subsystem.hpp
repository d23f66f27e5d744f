#pragma once
#include <string>
#include "TickContext.hpp"

// A unit of work driven by SessionEngine, one tick() per acquisition interval.
class Subsystem {
public:
    explicit Subsystem(const std::string& name) : name_(name) {}
    virtual ~Subsystem() = default;

    // lifecycle
    virtual void initialize() = 0;
    virtual void tick(const TickContext& ctx) = 0;
    virtual void shutdown() = 0;

    // True once this subsystem has nothing more to contribute (e.g. replay
    // source exhausted). The engine stops the loop when any subsystem is done.
    virtual bool finished() const { return false; }

    std::string getName() const { return name_; }

protected:
    std::string name_;
};
