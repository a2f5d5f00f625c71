#include "errors.hpp"
#include "sampler.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <thread>
#include <vector>

using namespace std::chrono;

namespace {

// Simulated time: sleeping jumps straight to the deadline plus a fixed
// jitter. After `limit` wakeups the next sleep fires the stop signal.
class ManualClock : public TickClock {
public:
    explicit ManualClock(int limit, milliseconds jitter = milliseconds(0))
        : limit(limit), jitter(jitter) {}

    time_point now() override { return t; }

    bool sleep_until(time_point deadline, ShutdownSignal& stop) override
    {
        if (stop.triggered())
            return false;
        if (wakeups == limit) {
            stop.trigger("tick limit");
            return false;
        }
        if (deadline > t)
            t = deadline;
        t += jitter;
        ++wakeups;
        return true;
    }

    system_clock::time_point wall_now() override
    {
        return system_clock::time_point(duration_cast<system_clock::duration>(t - origin));
    }

    void advance(nanoseconds d) { t += d; }

    const time_point origin{};
    time_point t{};
    int limit;
    milliseconds jitter;
    int wakeups = 0;
};

struct RecordingSink : RowSink {
    void write_row(system_clock::time_point when, const std::vector<double>& v) override
    {
        times.push_back(when);
        rows.push_back(v);
        if (clock && slow_write.count() > 0)
            clock->advance(slow_write);
        if (fail_after >= 0 && (int)rows.size() > fail_after)
            throw LogWriteError("disk full");
    }

    std::vector<system_clock::time_point> times;
    std::vector<std::vector<double>> rows;
    ManualClock* clock = nullptr;
    nanoseconds slow_write{0};
    int fail_after = -1;
};

}  // namespace

TEST(SamplingLogger, NTicksGiveNRowsOnePeriodApart)
{
    SensorState state(4);
    ShutdownSignal stop;
    ManualClock clock(5);
    RecordingSink sink;

    SamplingLogger logger(state, sink, stop, milliseconds(100), clock);
    logger.run();

    EXPECT_EQ(logger.ticks(), 5u);
    ASSERT_EQ(sink.rows.size(), 6u);  // 5 ticks + drain row

    for (size_t i = 1; i < 5; ++i)
        EXPECT_EQ(sink.times[i] - sink.times[i - 1], milliseconds(100)) << i;
    EXPECT_EQ(sink.times[0] - system_clock::time_point{}, milliseconds(100));
}

TEST(SamplingLogger, JitterDoesNotCompound)
{
    SensorState state(2);
    ShutdownSignal stop;
    ManualClock clock(10, milliseconds(7));
    RecordingSink sink;

    SamplingLogger logger(state, sink, stop, milliseconds(100), clock);
    logger.run();

    ASSERT_GE(sink.rows.size(), 10u);
    // tick k lands at k*100ms + 7ms, never k*107ms
    for (size_t i = 0; i < 10; ++i)
    {
        auto at = duration_cast<milliseconds>(sink.times[i] - system_clock::time_point{});
        EXPECT_EQ(at.count(), (long long)(i + 1) * 100 + 7) << i;
    }
    EXPECT_EQ(logger.late_ticks(), 0u);
}

TEST(SamplingLogger, FallingBehindReanchorsInsteadOfBursting)
{
    SensorState state(2);
    ShutdownSignal stop;
    ManualClock clock(4);
    RecordingSink sink;
    sink.clock = &clock;
    sink.slow_write = milliseconds(350);

    SamplingLogger logger(state, sink, stop, milliseconds(100), clock);
    logger.run();

    EXPECT_GE(logger.late_ticks(), 1u);
    ASSERT_GE(sink.rows.size(), 4u);
    // After a slow write the next row comes one period after the write
    // finished, not immediately.
    for (size_t i = 1; i < 4; ++i)
        EXPECT_GE(sink.times[i] - sink.times[i - 1], milliseconds(100)) << i;
}

TEST(SamplingLogger, RowsCarryCurrentSnapshot)
{
    SensorState state(4);
    state.set(0, 1.5);
    state.set(3, -2.25);
    ShutdownSignal stop;
    ManualClock clock(1);
    RecordingSink sink;

    SamplingLogger logger(state, sink, stop, milliseconds(100), clock);
    logger.run();

    ASSERT_FALSE(sink.rows.empty());
    EXPECT_EQ(sink.rows[0], (std::vector<double>{1.5, 0.0, 0.0, -2.25}));
}

TEST(SamplingLogger, StopBeforeStartWritesOnlyDrainRow)
{
    SensorState state(2);
    state.set(1, 4.0);
    ShutdownSignal stop;
    stop.trigger("already stopped");
    ManualClock clock(100);
    RecordingSink sink;

    SamplingLogger logger(state, sink, stop, milliseconds(100), clock);
    logger.run();

    EXPECT_EQ(logger.ticks(), 0u);
    ASSERT_EQ(sink.rows.size(), 1u);
    EXPECT_EQ(sink.rows[0][1], 4.0);
}

TEST(SamplingLogger, WriteFailurePropagates)
{
    SensorState state(2);
    ShutdownSignal stop;
    ManualClock clock(100);
    RecordingSink sink;
    sink.fail_after = 2;

    SamplingLogger logger(state, sink, stop, milliseconds(100), clock);
    EXPECT_THROW(logger.run(), LogWriteError);
    EXPECT_EQ(sink.rows.size(), 3u);
}

TEST(SamplingLogger, RealClockStopsPromptly)
{
    SensorState state(1);
    ShutdownSignal stop;
    SteadyTickClock clock;
    RecordingSink sink;

    SamplingLogger logger(state, sink, stop, milliseconds(20), clock);

    auto start = steady_clock::now();
    std::thread t([&] { logger.run(); });
    std::this_thread::sleep_for(milliseconds(110));
    stop.trigger("test");
    t.join();
    auto took = steady_clock::now() - start;

    EXPECT_GE(sink.rows.size(), 3u);
    EXPECT_LT(took, milliseconds(1000));
}

TEST(SamplingLogger, PeriodFromHz)
{
    EXPECT_EQ(period_from_hz(10.0), milliseconds(100));
    EXPECT_EQ(period_from_hz(1000.0), milliseconds(1));
    EXPECT_EQ(period_from_hz(3.0), nanoseconds(333333333));
}
