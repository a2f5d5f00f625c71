#include "sensor_state.hpp"

SensorState::SensorState(size_t slots)
    : values(slots, 0.0)
{
}

void SensorState::set(size_t slot, double value)
{
    std::lock_guard<std::mutex> lk(m);
    if (slot < values.size())
        values[slot] = value;
}

double SensorState::get(size_t slot) const
{
    std::lock_guard<std::mutex> lk(m);
    return slot < values.size() ? values[slot] : 0.0;
}

std::vector<double> SensorState::snapshot() const
{
    std::vector<double> out;
    snapshot(out);
    return out;
}

void SensorState::snapshot(std::vector<double>& out) const
{
    std::lock_guard<std::mutex> lk(m);
    out.assign(values.begin(), values.end());
}
