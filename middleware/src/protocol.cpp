#include "protocol.hpp"
#include "errors.hpp"

#include <cstring>
#include <string>

// ---------------- value codec ----------------

static double load_le_double(const uint8_t* p)
{
    uint64_t bits = 0;
    for (int i = 7; i >= 0; --i)
        bits = (bits << 8) | p[i];

    double v;
    std::memcpy(&v, &bits, sizeof(v));
    return v;
}

static void store_le_double(uint8_t* p, double v)
{
    uint64_t bits;
    std::memcpy(&bits, &v, sizeof(bits));

    for (int i = 0; i < 8; ++i)
    {
        p[i] = static_cast<uint8_t>(bits & 0xFF);
        bits >>= 8;
    }
}

// ---------------- decoder ----------------

Reading decode_record(const uint8_t* data, size_t len)
{
    if (data == nullptr || len < RECORD_SIZE)
        throw MalformedPacketError(
            "record needs " + std::to_string(RECORD_SIZE) +
            " bytes, got " + std::to_string(data ? len : 0));

    Reading r;
    r.channel = data[0];
    r.fiber   = data[1];
    r.sensor  = data[2];
    r.value   = load_le_double(data + RECORD_VALUE_OFFSET);
    return r;
}

// ---------------- builder ----------------

RecordBytes encode_record(const Reading& r)
{
    RecordBytes out{};
    out[0] = r.channel;
    out[1] = r.fiber;
    out[2] = r.sensor;
    store_le_double(out.data() + RECORD_VALUE_OFFSET, r.value);
    return out;
}

// ---------------- parser ----------------

size_t parse_from_ring(ByteRing& ring, ReadingHandler& handler)
{
    uint8_t rec[RECORD_SIZE];
    size_t delivered = 0;

    while (ring.size() >= RECORD_SIZE)
    {
        ring.read(rec, RECORD_SIZE);
        handler.on_reading(decode_record(rec, RECORD_SIZE));
        ++delivered;
    }

    return delivered;
}
