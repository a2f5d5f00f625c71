#include "sensor_state.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cmath>
#include <thread>
#include <vector>

TEST(SensorState, StartsAtZero)
{
    SensorState s(4);

    ASSERT_EQ(s.size(), 4u);
    EXPECT_EQ(s.snapshot(), (std::vector<double>{0.0, 0.0, 0.0, 0.0}));
}

TEST(SensorState, LastWriteWinsPerSlot)
{
    SensorState s(4);

    s.set(1, 10.0);
    s.set(1, 11.0);
    s.set(3, -5.5);
    s.set(1, 12.0);

    EXPECT_EQ(s.get(1), 12.0);
    EXPECT_EQ(s.snapshot(), (std::vector<double>{0.0, 12.0, 0.0, -5.5}));
}

TEST(SensorState, OutOfRangeIsIgnored)
{
    SensorState s(2);

    s.set(2, 99.0);
    s.set(1000, 99.0);

    EXPECT_EQ(s.get(2), 0.0);
    EXPECT_EQ(s.snapshot(), (std::vector<double>{0.0, 0.0}));
}

// One writer and one reader hammer the table concurrently. Every value the
// reader observes must be one the writer actually stored, per-slot values
// never go backwards, and the final snapshot holds the last writes.
TEST(SensorState, ConcurrentReaderSeesOnlyWholeValues)
{
    const size_t slots = 4;
    const int writes = 20000;
    SensorState s(slots);
    std::atomic<bool> done{false};

    // Large, distinct bit patterns so a torn read would not be an integer.
    auto value_for = [](size_t slot, int i) {
        return 1e12 * (double)(slot + 1) + (double)i;
    };

    std::thread writer([&] {
        for (int i = 1; i <= writes; ++i)
            for (size_t k = 0; k < slots; ++k)
                s.set(k, value_for(k, i));
        done.store(true);
    });

    std::vector<double> last(slots, 0.0);
    std::vector<double> snap;
    bool consistent = true;

    while (!done.load())
    {
        s.snapshot(snap);
        for (size_t k = 0; k < slots; ++k)
        {
            double v = snap[k];
            if (v == 0.0)
                continue;
            double i = v - 1e12 * (double)(k + 1);
            if (i < 1 || i > writes || std::floor(i) != i || v < last[k])
                consistent = false;
            last[k] = v;
        }
    }
    writer.join();

    EXPECT_TRUE(consistent);
    for (size_t k = 0; k < slots; ++k)
        EXPECT_EQ(s.get(k), value_for(k, writes));
}
