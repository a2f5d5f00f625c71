#include "config.hpp"
#include "protocol.hpp"
#include "ring_buffer.hpp"
#include "transport.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <set>
#include <thread>
#include <utility>
#include <vector>

namespace {

struct CollectingHandler : ReadingHandler {
    void on_reading(const Reading& r) override { seen.push_back(r); }
    std::vector<Reading> seen;
};

}  // namespace

TEST(SimTransport, StreamsConfiguredSlotsThenCloses)
{
    SimConfig sim;
    sim.record_rate_hz = 5000.0;
    sim.max_records = 40;

    SimTransport t(Config::default_channels(), sim);
    ASSERT_TRUE(t.open());

    ByteRing ring(4096);
    CollectingHandler h;
    uint8_t buf[64];
    size_t total = 0;
    int n;
    bool saw_partial = false;

    while ((n = t.read(buf, sizeof(buf))) > 0)
    {
        total += (size_t)n;
        if (n % (int)RECORD_SIZE != 0)
            saw_partial = true;
        ring.push(buf, (size_t)n);
        parse_from_ring(ring, h);
    }

    EXPECT_EQ(n, 0);
    EXPECT_EQ(total, 40 * RECORD_SIZE);
    EXPECT_TRUE(saw_partial);
    ASSERT_EQ(h.seen.size(), 40u);

    std::set<std::pair<int, int>> slots;
    for (const auto& r : h.seen)
    {
        slots.insert({r.channel, r.sensor});
        EXPECT_GT(r.value, 1534.0);
        EXPECT_LT(r.value, 1550.0);
    }
    EXPECT_EQ(slots, (std::set<std::pair<int, int>>{{1, 0}, {1, 1}, {2, 0}, {2, 1}}));

    t.close();
}

TEST(SimTransport, CloseUnblocksReader)
{
    SimConfig sim;
    sim.record_rate_hz = 1.0;   // first record right away, then nothing for a second

    SimTransport t(Config::default_channels(), sim);
    ASSERT_TRUE(t.open());

    uint8_t buf[RECORD_SIZE];
    int got = 0;
    while (got < (int)RECORD_SIZE)
    {
        int n = t.read(buf, (int)RECORD_SIZE - got);
        ASSERT_GT(n, 0);
        got += n;
    }

    std::thread closer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        t.close();
    });

    EXPECT_EQ(t.read(buf, sizeof(buf)), -1);
    closer.join();

    EXPECT_NO_THROW(t.close());
    EXPECT_FALSE(t.open());
}
