#pragma once
#include <cstddef>
#include <mutex>
#include <vector>

// Latest value per configured slot. One writer (ingest), one reader
// (sampler); every access goes through the lock.
class SensorState
{
public:
    explicit SensorState(size_t slots);

    size_t size() const { return values.size(); }

    // Out-of-range indexes are ignored by set() and read as 0.0 by get().
    void set(size_t slot, double value);
    double get(size_t slot) const;

    std::vector<double> snapshot() const;
    void snapshot(std::vector<double>& out) const;

private:
    mutable std::mutex m;
    std::vector<double> values;
};
