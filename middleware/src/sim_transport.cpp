#include "transport.hpp"
#include "protocol.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <random>
#include <thread>
#include <vector>

static const double PI = 3.14159265358979323846;

// Rest wavelengths [nm] of the two gratings on each fiber.
static const double BASE_WAVELENGTH_NM[SENSORS_PER_CHANNEL] = {1534.63, 1549.65};

// Delivered chunk sizes are drawn from [1, MAX_CHUNK] so that record
// boundaries land inside chunks.
static const int MAX_CHUNK = 2 * (int)RECORD_SIZE + 7;

class SimTransport::Impl {
public:
    Impl(std::vector<ChannelConfig> chans, SimConfig c)
        : channels(std::move(chans)), cfg(c) {}

    std::vector<ChannelConfig> channels;
    SimConfig cfg;

    std::thread worker;

    std::mutex m;
    std::condition_variable cv;
    std::vector<uint8_t> buffer;
    bool running = false;
    bool finished = false;   // generator hit max_records
    bool closed = false;
    uint64_t generated = 0;

    std::mt19937 chunk_rng{12345};

    Reading make_reading(uint64_t n, double t) const
    {
        const size_t slots = channels.size() * SENSORS_PER_CHANNEL;
        const size_t slot = (size_t)(n % slots);
        const auto& ch = channels[slot / SENSORS_PER_CHANNEL];
        const size_t s = slot % SENSORS_PER_CHANNEL;

        Reading r;
        r.channel = ch.id;
        r.fiber = 0;
        r.sensor = ch.sensors[s];
        r.value = BASE_WAVELENGTH_NM[s] +
                  0.05 * std::sin(2.0 * PI * 0.5 * t + 0.7 * (double)slot);
        return r;
    }

    void generate_loop()
    {
        using clock = std::chrono::steady_clock;
        const auto start = clock::now();

        std::unique_lock<std::mutex> lk(m);

        while (running)
        {
            const double t =
                std::chrono::duration<double>(clock::now() - start).count();
            uint64_t due = (uint64_t)(t * cfg.record_rate_hz) + 1;
            if (cfg.max_records > 0)
                due = std::min<uint64_t>(due, cfg.max_records);

            bool fresh = generated < due;
            while (generated < due)
            {
                auto rec = encode_record(make_reading(generated, t));
                buffer.insert(buffer.end(), rec.begin(), rec.end());
                ++generated;
            }

            if (cfg.max_records > 0 && generated >= cfg.max_records)
            {
                finished = true;
                cv.notify_all();
                break;
            }

            if (fresh)
                cv.notify_all();

            cv.wait_for(lk, std::chrono::milliseconds(1),
                        [&]{ return !running; });
        }
    }

    int read(uint8_t* out, int maxlen)
    {
        std::unique_lock<std::mutex> lk(m);
        cv.wait(lk, [&]{ return closed || finished || !buffer.empty(); });

        if (closed)
            return -1;

        if (buffer.empty())
            return 0;   // finished and drained

        std::uniform_int_distribution<int> pick(1, MAX_CHUNK);
        int n = std::min<int>(std::min(maxlen, pick(chunk_rng)),
                              (int)buffer.size());

        std::memcpy(out, buffer.data(), (size_t)n);
        buffer.erase(buffer.begin(), buffer.begin() + n);
        return n;
    }
};

SimTransport::SimTransport(std::vector<ChannelConfig> channels, SimConfig sim)
    : impl(std::make_unique<Impl>(std::move(channels), sim))
{}

SimTransport::~SimTransport() { close(); }

bool SimTransport::open()
{
    std::lock_guard<std::mutex> lk(impl->m);
    if (impl->closed || impl->running || impl->channels.empty())
        return false;

    impl->running = true;
    impl->worker = std::thread(&SimTransport::Impl::generate_loop, impl.get());
    std::printf("[SIM] generating %.0f records/s for %zu slots\n",
        impl->cfg.record_rate_hz,
        impl->channels.size() * SENSORS_PER_CHANNEL);
    return true;
}

int SimTransport::read(uint8_t* out, int maxlen)
{
    return impl->read(out, maxlen);
}

void SimTransport::close()
{
    {
        std::lock_guard<std::mutex> lk(impl->m);
        if (impl->closed)
            return;
        impl->closed = true;
        impl->running = false;
    }
    impl->cv.notify_all();

    if (impl->worker.joinable())
        impl->worker.join();
}

std::string SimTransport::describe() const
{
    return "simulated interrogator";
}

std::string SimTransport::last_error() const
{
    std::lock_guard<std::mutex> lk(impl->m);
    return impl->closed ? "closed locally" : "";
}
