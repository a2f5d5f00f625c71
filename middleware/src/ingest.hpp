#pragma once
#include <atomic>
#include <cstdint>

#include "config.hpp"
#include "protocol.hpp"
#include "ring_buffer.hpp"
#include "sensor_state.hpp"
#include "shutdown.hpp"
#include "transport.hpp"

// --------------------------------------------------
// Decoded reading -> state slot
// --------------------------------------------------

class SlotRouter : public ReadingHandler
{
public:
    SlotRouter(const SlotTable& table, SensorState& state, bool echo = false);

    // Readings with no configured slot are reported and dropped.
    void on_reading(const Reading& r) override;

    uint64_t decoded() const { return n_decoded.load(); }
    uint64_t routed() const { return n_routed.load(); }
    uint64_t unrecognized() const { return n_unrecognized.load(); }

private:
    const SlotTable& table;
    SensorState& state;
    bool echo;

    std::atomic<uint64_t> n_decoded{0};
    std::atomic<uint64_t> n_routed{0};
    std::atomic<uint64_t> n_unrecognized{0};
};

// --------------------------------------------------
// Framed read loop
// --------------------------------------------------

class IngestLoop
{
public:
    static const size_t READ_CHUNK = 1024;
    static const size_t RING_CAPACITY = 8192;

    IngestLoop(ITransport& transport, ReadingHandler& handler, ShutdownSignal& stop);

    // Returns when the stop signal is observed. Throws ConnectionClosedError
    // on peer close or a failed read.
    void run();

    size_t buffered() const { return ring.size(); }

private:
    ITransport& transport;
    ReadingHandler& handler;
    ShutdownSignal& stop;
    ByteRing ring;
};
