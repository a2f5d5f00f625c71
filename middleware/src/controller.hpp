#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "config.hpp"
#include "csv_log.hpp"
#include "ingest.hpp"
#include "sampler.hpp"
#include "sensor_state.hpp"
#include "shutdown.hpp"
#include "transport.hpp"

// --------------------------------------------------
// Lifecycle
// --------------------------------------------------

// Idle -> AwaitingConnection -> Running -> Draining -> Stopped.
// A controller runs one session; there is no way back to Running.
enum class LifecycleState
{
    Idle,
    AwaitingConnection,
    Running,
    Draining,
    Stopped
};

const char* to_string(LifecycleState s);

// --------------------------------------------------
// Runtime container
// --------------------------------------------------

struct Runtime
{
    Runtime(Config cfg, std::unique_ptr<ITransport> transport,
            RowSink* row_sink = nullptr);

    Config cfg;
    std::unique_ptr<ITransport> transport;

    SlotTable slots;
    SensorState state;
    SlotRouter router;
    CsvLog log;
    RowSink* rows;   // sampler output, &log unless overridden
    SteadyTickClock clock;

    ShutdownSignal stop;
    std::atomic<LifecycleState> phase{LifecycleState::Idle};
    std::atomic<bool> failed{false};

    // Fires the stop signal (first cause wins), moves Running to Draining
    // and closes the transport so a blocked read returns.
    void shutdown(const std::string& why, bool error = false);
};

// --------------------------------------------------
// Thread entry points
// --------------------------------------------------

void ingest_thread_fn(Runtime& rt);
void sampler_thread_fn(Runtime& rt);

// --------------------------------------------------
// Controller
// --------------------------------------------------

class Controller
{
public:
    // Rows go to the CSV log unless row_sink is given (it must outlive the
    // controller). The log file is opened either way.
    Controller(Config cfg, std::unique_ptr<ITransport> transport,
               RowSink* row_sink = nullptr);

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;

    // Accepts the connection, opens the log, runs both threads until a
    // shutdown trigger, joins them and releases everything. Returns the
    // process exit status: 0 for an orderly stop, 1 for a failure.
    int run();

    // External stop. Safe from any thread, at any phase.
    void request_stop(const std::string& why);

    LifecycleState state() const { return rt.phase.load(); }
    std::string stop_reason() const { return rt.stop.reason(); }

    const SensorState& sensors() const { return rt.state; }
    const SlotTable& slots() const { return rt.slots; }
    const SlotRouter& router() const { return rt.router; }
    size_t rows_written() const { return rt.log.rows_written(); }

private:
    void release();

    Runtime rt;
};
