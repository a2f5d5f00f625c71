#include "controller.hpp"
#include "errors.hpp"

#include <cstdio>
#include <functional>
#include <thread>

const char* to_string(LifecycleState s)
{
    switch (s)
    {
        case LifecycleState::Idle:               return "idle";
        case LifecycleState::AwaitingConnection: return "awaiting-connection";
        case LifecycleState::Running:            return "running";
        case LifecycleState::Draining:           return "draining";
        case LifecycleState::Stopped:            return "stopped";
    }
    return "?";
}

// --------------------------------------------------
// Runtime
// --------------------------------------------------

Runtime::Runtime(Config c, std::unique_ptr<ITransport> t, RowSink* row_sink)
    : cfg(std::move(c)),
      transport(std::move(t)),
      slots(cfg.channels),
      state(slots.size()),
      router(slots, state, cfg.echo_readings),
      log(cfg.log_path, cfg.channels),
      rows(row_sink ? row_sink : &log)
{
}

void Runtime::shutdown(const std::string& why, bool error)
{
    if (stop.trigger(why))
    {
        if (error)
            failed.store(true);
        std::printf("[CTRL] shutting down: %s\n", why.c_str());
    }

    LifecycleState expected = LifecycleState::Running;
    phase.compare_exchange_strong(expected, LifecycleState::Draining);

    transport->close();
}

// --------------------------------------------------
// Ingest thread
// --------------------------------------------------

void ingest_thread_fn(Runtime& rt)
{
    IngestLoop loop(*rt.transport, rt.router, rt.stop);

    try {
        loop.run();
    } catch (const ConnectionClosedError& e) {
        rt.shutdown(e.what());
    } catch (const std::exception& e) {
        rt.shutdown(std::string("ingest failed: ") + e.what(), true);
    }

    if (loop.buffered() > 0)
        std::fprintf(stderr, "[INGEST] %zu trailing bytes of a partial record discarded\n",
            loop.buffered());
}

// --------------------------------------------------
// Sampler thread
// --------------------------------------------------

void sampler_thread_fn(Runtime& rt)
{
    SamplingLogger sampler(
        rt.state,
        *rt.rows,
        rt.stop,
        period_from_hz(rt.cfg.sample_rate_hz),
        rt.clock);

    try {
        sampler.run();
    } catch (const LogWriteError& e) {
        rt.shutdown(std::string("log write failed: ") + e.what(), true);
    } catch (const std::exception& e) {
        rt.shutdown(std::string("sampler failed: ") + e.what(), true);
    }

    if (sampler.late_ticks() > 0)
        std::printf("[SAMPLER] %zu of %zu ticks ran late\n",
            sampler.late_ticks(), sampler.ticks());
}

// --------------------------------------------------
// Controller
// --------------------------------------------------

Controller::Controller(Config cfg, std::unique_ptr<ITransport> transport,
                       RowSink* row_sink)
    : rt(std::move(cfg), std::move(transport), row_sink)
{
}

void Controller::request_stop(const std::string& why)
{
    rt.shutdown(why);
}

void Controller::release()
{
    rt.transport->close();
    rt.log.close();
    rt.phase.store(LifecycleState::Stopped);

    std::printf("[CTRL] stopped (%s): decoded=%llu routed=%llu unrecognized=%llu rows=%zu\n",
        rt.stop.reason().c_str(),
        (unsigned long long)rt.router.decoded(),
        (unsigned long long)rt.router.routed(),
        (unsigned long long)rt.router.unrecognized(),
        rt.log.rows_written());
}

int Controller::run()
{
    LifecycleState expected = LifecycleState::Idle;
    if (!rt.phase.compare_exchange_strong(expected, LifecycleState::AwaitingConnection))
    {
        std::fprintf(stderr, "[CTRL] session already used (%s)\n", to_string(expected));
        return 1;
    }

    std::printf("[CTRL] awaiting %s\n", rt.transport->describe().c_str());

    if (!rt.transport->open())
    {
        // An external stop during accept is an orderly exit.
        if (!rt.stop.triggered())
            rt.shutdown("cannot open " + rt.transport->describe() + ": " +
                        rt.transport->last_error(), true);
        release();
        return rt.failed.load() ? 1 : 0;
    }

    try {
        rt.log.open();
    } catch (const LogWriteError& e) {
        rt.shutdown(e.what(), true);
        release();
        return 1;
    }

    std::printf("[CTRL] logging %zu slots to %s at %.1f Hz\n",
        rt.slots.size(), rt.log.path().c_str(), rt.cfg.sample_rate_hz);

    expected = LifecycleState::AwaitingConnection;
    rt.phase.compare_exchange_strong(expected, LifecycleState::Running);
    if (rt.stop.triggered())
    {
        expected = LifecycleState::Running;
        rt.phase.compare_exchange_strong(expected, LifecycleState::Draining);
    }

    std::thread ingest(ingest_thread_fn, std::ref(rt));
    std::thread sampler(sampler_thread_fn, std::ref(rt));

    ingest.join();
    sampler.join();

    release();
    return rt.failed.load() ? 1 : 0;
}
