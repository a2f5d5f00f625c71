#pragma once
#include <chrono>
#include <cstddef>
#include <vector>

#include "csv_log.hpp"
#include "sensor_state.hpp"
#include "shutdown.hpp"

// --------------------------------------------------
// Time source for the sampler (swapped out in tests)
// --------------------------------------------------

class TickClock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual time_point now() = 0;

    // Blocks until deadline or stop. True if the deadline was reached.
    virtual bool sleep_until(time_point deadline, ShutdownSignal& stop) = 0;

    virtual std::chrono::system_clock::time_point wall_now() = 0;

    virtual ~TickClock() {}
};

class SteadyTickClock : public TickClock {
public:
    time_point now() override;
    bool sleep_until(time_point deadline, ShutdownSignal& stop) override;
    std::chrono::system_clock::time_point wall_now() override;
};

// --------------------------------------------------
// Periodic snapshot -> row
// --------------------------------------------------

class SamplingLogger
{
public:
    SamplingLogger(
        const SensorState& state,
        RowSink& sink,
        ShutdownSignal& stop,
        std::chrono::nanoseconds period,
        TickClock& clock);

    // Runs until the stop signal, then writes one last row with the latest
    // values. LogWriteError propagates to the caller.
    void run();

    size_t ticks() const { return tick_count; }
    size_t late_ticks() const { return late_count; }

private:
    void sample();

    const SensorState& state;
    RowSink& sink;
    ShutdownSignal& stop;
    std::chrono::nanoseconds period;
    TickClock& clock;

    std::vector<double> scratch;
    size_t tick_count = 0;
    size_t late_count = 0;
};

std::chrono::nanoseconds period_from_hz(double hz);
