#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

// One-shot stop broadcast shared by the ingest and sampling threads.
// The first trigger records the cause; later triggers are no-ops.
class ShutdownSignal
{
public:
    // Returns true if this call was the one that fired the signal.
    bool trigger(const std::string& why)
    {
        {
            std::lock_guard<std::mutex> lk(m);
            if (fired.load())
                return false;
            cause = why;
            fired.store(true);
        }
        cv.notify_all();
        return true;
    }

    bool triggered() const { return fired.load(); }

    std::string reason() const
    {
        std::lock_guard<std::mutex> lk(m);
        return cause;
    }

    // Sleeps until the deadline or the signal, whichever comes first.
    // Returns true if the deadline was reached without a stop.
    template <class Clock, class Duration>
    bool wait_until(const std::chrono::time_point<Clock, Duration>& deadline)
    {
        std::unique_lock<std::mutex> lk(m);
        return !cv.wait_until(lk, deadline, [&]{ return fired.load(); });
    }

    void wait()
    {
        std::unique_lock<std::mutex> lk(m);
        cv.wait(lk, [&]{ return fired.load(); });
    }

private:
    mutable std::mutex m;
    std::condition_variable cv;
    std::atomic<bool> fired{false};
    std::string cause;
};
