#include "ingest.hpp"
#include "errors.hpp"

#include <cstdio>
#include <string>

// --------------------------------------------------
// SlotRouter
// --------------------------------------------------

SlotRouter::SlotRouter(const SlotTable& table_, SensorState& state_, bool echo_)
    : table(table_), state(state_), echo(echo_)
{
}

void SlotRouter::on_reading(const Reading& r)
{
    ++n_decoded;

    if (echo)
        std::printf("%u:: Sensor ID: %u, Channel: %u, FBGs: %.15g nm\n",
            (unsigned)r.fiber, (unsigned)r.sensor, (unsigned)r.channel, r.value);

    int slot = table.find(r.channel, r.sensor);
    if (slot == SlotTable::NO_SLOT)
    {
        // first one, then every 1000th
        uint64_t n = ++n_unrecognized;
        if (n == 1 || n % 1000 == 0)
            std::fprintf(stderr,
                "[INGEST] warning: unrecognized slot channel=%u sensor=%u "
                "(fiber=%u value=%g), dropped (%llu so far)\n",
                (unsigned)r.channel, (unsigned)r.sensor, (unsigned)r.fiber,
                r.value, (unsigned long long)n);
        return;
    }

    state.set((size_t)slot, r.value);
    ++n_routed;
}

// --------------------------------------------------
// IngestLoop
// --------------------------------------------------

const size_t IngestLoop::READ_CHUNK;
const size_t IngestLoop::RING_CAPACITY;

IngestLoop::IngestLoop(ITransport& transport_, ReadingHandler& handler_,
                       ShutdownSignal& stop_)
    : transport(transport_), handler(handler_), stop(stop_), ring(RING_CAPACITY)
{
}

void IngestLoop::run()
{
    uint8_t buf[READ_CHUNK];

    while (!stop.triggered())
    {
        int n = transport.read(buf, (int)sizeof(buf));

        if (n <= 0)
        {
            if (stop.triggered())
                break;

            if (n == 0)
                throw ConnectionClosedError("connection closed by peer");
            throw ConnectionClosedError("receive failed: " + transport.last_error());
        }

        ring.push(buf, (size_t)n);

        try {
            parse_from_ring(ring, handler);
        } catch (const MalformedPacketError& e) {
            std::fprintf(stderr, "[INGEST] skipped record: %s\n", e.what());
        }
    }
}
