#include "sampler.hpp"

#include <cmath>

// --------------------------------------------------
// SteadyTickClock
// --------------------------------------------------

TickClock::time_point SteadyTickClock::now()
{
    return std::chrono::steady_clock::now();
}

bool SteadyTickClock::sleep_until(time_point deadline, ShutdownSignal& stop)
{
    return stop.wait_until(deadline);
}

std::chrono::system_clock::time_point SteadyTickClock::wall_now()
{
    return std::chrono::system_clock::now();
}

std::chrono::nanoseconds period_from_hz(double hz)
{
    return std::chrono::nanoseconds(
        static_cast<long long>(std::llround(1e9 / hz)));
}

// --------------------------------------------------
// SamplingLogger
// --------------------------------------------------

SamplingLogger::SamplingLogger(
    const SensorState& state_,
    RowSink& sink_,
    ShutdownSignal& stop_,
    std::chrono::nanoseconds period_,
    TickClock& clock_)
    : state(state_), sink(sink_), stop(stop_), period(period_), clock(clock_)
{
}

void SamplingLogger::sample()
{
    state.snapshot(scratch);
    sink.write_row(clock.wall_now(), scratch);
}

void SamplingLogger::run()
{
    auto next = clock.now();

    while (!stop.triggered())
    {
        next += period;

        if (!clock.sleep_until(next, stop))
            break;

        sample();
        ++tick_count;

        // More than a full period behind: re-anchor instead of bursting.
        const auto now = clock.now();
        if (now - next > period)
        {
            ++late_count;
            next = now;
        }
    }

    // Drain: the last values seen before the stop.
    sample();
}
