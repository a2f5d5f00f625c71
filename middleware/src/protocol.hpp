#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include "ring_buffer.hpp"

// ---------------- constants ----------------

// One FBG record on the wire:
//   [0] channel  [1] fiber  [2] sensor  [3..10] value (IEEE754 double, LE)
constexpr size_t RECORD_SIZE = 11;
constexpr size_t RECORD_VALUE_OFFSET = 3;

struct Reading {
    uint8_t channel = 0;
    uint8_t fiber = 0;
    uint8_t sensor = 0;
    double  value = 0.0;
};

using RecordBytes = std::array<uint8_t, RECORD_SIZE>;

// ---------------- callbacks ----------------

struct ReadingHandler {
    virtual void on_reading(const Reading& r) = 0;

    virtual ~ReadingHandler() = default;
};

// ---------------- API ----------------

// Throws MalformedPacketError if len < RECORD_SIZE. Extra bytes are ignored.
Reading decode_record(const uint8_t* data, size_t len);

RecordBytes encode_record(const Reading& r);

// Decodes every complete record in the ring, leaving any trailing partial
// record in place. Returns the number of records delivered.
size_t parse_from_ring(ByteRing& ring, ReadingHandler& handler);
