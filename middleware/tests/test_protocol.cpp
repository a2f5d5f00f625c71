#include "errors.hpp"
#include "protocol.hpp"
#include "ring_buffer.hpp"
#include "test_support.hpp"

#include <cmath>
#include <cstring>
#include <limits>
#include <vector>

namespace {

struct CollectingHandler : ReadingHandler {
    void on_reading(const Reading& r) override { seen.push_back(r); }
    std::vector<Reading> seen;
};

uint64_t bits_of(double v)
{
    uint64_t b;
    std::memcpy(&b, &v, sizeof(b));
    return b;
}

}  // namespace

TEST(Protocol, DecodesKnownLittleEndianRecord)
{
    // 1.0 == 0x3FF0000000000000
    const uint8_t wire[RECORD_SIZE] = {
        2, 7, 1, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xF0, 0x3F};

    Reading r = decode_record(wire, sizeof(wire));

    EXPECT_EQ(r.channel, 2);
    EXPECT_EQ(r.fiber, 7);
    EXPECT_EQ(r.sensor, 1);
    EXPECT_EQ(r.value, 1.0);
}

TEST(Protocol, EncodeWritesValueLittleEndian)
{
    RecordBytes rec = make_record(1, 0, 1, -2.0);  // 0xC000000000000000

    EXPECT_EQ(rec[0], 1);
    EXPECT_EQ(rec[1], 0);
    EXPECT_EQ(rec[2], 1);
    for (size_t i = 3; i < 10; ++i)
        EXPECT_EQ(rec[i], 0x00) << "byte " << i;
    EXPECT_EQ(rec[10], 0xC0);
}

TEST(Protocol, RoundTripIsBitExact)
{
    const double values[] = {
        0.0, -0.0, 1534.63, 1549.65, -1e-300,
        std::numeric_limits<double>::denorm_min(),
        std::numeric_limits<double>::max(),
        std::numeric_limits<double>::infinity(),
        std::numeric_limits<double>::quiet_NaN(),
    };

    for (double v : values)
    {
        RecordBytes rec = make_record(255, 3, 200, v);
        Reading back = decode_record(rec.data(), rec.size());

        EXPECT_EQ(back.channel, 255);
        EXPECT_EQ(back.fiber, 3);
        EXPECT_EQ(back.sensor, 200);
        EXPECT_EQ(bits_of(back.value), bits_of(v)) << v;
    }
}

TEST(Protocol, ShortBufferIsMalformed)
{
    RecordBytes rec = make_record(1, 0, 0, 3.0);

    EXPECT_THROW(decode_record(rec.data(), RECORD_SIZE - 1), MalformedPacketError);
    EXPECT_THROW(decode_record(rec.data(), 0), MalformedPacketError);
    EXPECT_THROW(decode_record(nullptr, RECORD_SIZE), MalformedPacketError);
}

TEST(Protocol, ExtraBytesAreIgnored)
{
    RecordBytes rec = make_record(1, 0, 1, 42.5);
    std::vector<uint8_t> longer(rec.begin(), rec.end());
    longer.push_back(0xAA);
    longer.push_back(0xBB);

    Reading r = decode_record(longer.data(), longer.size());
    EXPECT_EQ(r.value, 42.5);
}

TEST(Protocol, ParseFromRingKeepsPartialRecord)
{
    ByteRing ring(256);
    CollectingHandler h;

    RecordBytes a = make_record(1, 0, 0, 1.25);
    RecordBytes b = make_record(2, 0, 1, 2.5);

    ring.push(a.data(), a.size());
    ring.push(b.data(), 6);

    EXPECT_EQ(parse_from_ring(ring, h), 1u);
    ASSERT_EQ(h.seen.size(), 1u);
    EXPECT_EQ(h.seen[0].value, 1.25);
    EXPECT_EQ(ring.size(), 6u);

    ring.push(b.data() + 6, b.size() - 6);
    EXPECT_EQ(parse_from_ring(ring, h), 1u);
    ASSERT_EQ(h.seen.size(), 2u);
    EXPECT_EQ(h.seen[1].channel, 2);
    EXPECT_EQ(h.seen[1].sensor, 1);
    EXPECT_EQ(h.seen[1].value, 2.5);
    EXPECT_TRUE(ring.empty());
}
