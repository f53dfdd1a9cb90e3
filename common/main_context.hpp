#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>

// MainContext is the single execution context that owns a process's workout
// and timer state. Other threads (gRPC handlers, the reachability monitor,
// background-grant and alert threads, the stdin reader) never touch that
// state directly; they post() a task and the owning thread runs it.
//
// Repeating timers are scheduled and cancelled from the owning thread and
// fire on it as well.
class MainContext {
public:
    using Task = std::function<void()>;
    using TimerId = uint64_t;

    // Safe from any thread.
    void post(Task task);

    TimerId schedule_every(std::chrono::milliseconds interval, Task task);
    // Cancelling an unknown or already cancelled id does nothing.
    void cancel(TimerId id);
    bool is_scheduled(TimerId id) const;

    // Runs every queued task and every due timer once. Returns how many ran.
    size_t run_pending();

    // Blocks the calling thread, which becomes the owning context, until
    // stop() is called.
    void run();
    void stop();

private:
    struct Repeating {
        std::chrono::milliseconds interval;
        std::chrono::steady_clock::time_point next;
        Task task;
    };

    std::chrono::steady_clock::time_point next_deadline_locked() const;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> queue_;
    std::map<TimerId, Repeating> timers_;
    TimerId next_id_ = 1;
    bool stopped_ = false;
};
