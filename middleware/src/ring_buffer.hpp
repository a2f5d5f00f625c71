#pragma once
#include <vector>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <algorithm>

// Fixed-capacity byte FIFO used to reassemble records that arrive split
// across several reads. When full, push() overwrites the oldest bytes.
class ByteRing
{
public:
    explicit ByteRing(size_t capacity)
        : buf(capacity), head(0), tail(0), count(0) {}

    size_t capacity() const { return buf.size(); }

    size_t size() const { return count; }

    size_t free_space() const { return buf.size() - count; }

    bool empty() const { return count == 0; }

    // Returns the number of old bytes that had to be dropped.
    size_t push(const uint8_t* data, size_t len)
    {
        const size_t cap = buf.size();
        size_t dropped = 0;

        if (len >= cap)
        {
            dropped = count + (len - cap);
            data += len - cap;
            len = cap;
            head = 0;
            tail = 0;
            count = 0;
        }
        else if (len > free_space())
        {
            dropped = len - free_space();
            consume(dropped);
        }

        size_t first = std::min(len, cap - head);
        std::memcpy(buf.data() + head, data, first);
        std::memcpy(buf.data(), data + first, len - first);

        head = (head + len) % cap;
        count += len;
        return dropped;
    }

    bool peek(uint8_t* out, size_t len) const
    {
        if (count < len) return false;

        size_t first = std::min(len, buf.size() - tail);
        std::memcpy(out, buf.data() + tail, first);
        std::memcpy(out + first, buf.data(), len - first);
        return true;
    }

    bool read(uint8_t* out, size_t len)
    {
        if (!peek(out, len)) return false;
        consume(len);
        return true;
    }

    void consume(size_t len)
    {
        len = std::min(len, count);
        tail = (tail + len) % buf.size();
        count -= len;
    }

    void clear()
    {
        head = tail = count = 0;
    }

private:
    std::vector<uint8_t> buf;
    size_t head;
    size_t tail;
    size_t count;
};
