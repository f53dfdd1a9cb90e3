#include "main_context.hpp"

#include <vector>

using SteadyClock = std::chrono::steady_clock;

void MainContext::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
}

MainContext::TimerId MainContext::schedule_every(std::chrono::milliseconds interval, Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    TimerId id = next_id_++;
    timers_[id] = Repeating{interval, SteadyClock::now() + interval, std::move(task)};
    cv_.notify_one();
    return id;
}

void MainContext::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    timers_.erase(id);
}

bool MainContext::is_scheduled(TimerId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.count(id) != 0;
}

/*
 * run_pending
 * Tasks posted while this call runs wait for the next call. Timer tasks are
 * copied out before they run so a task may cancel its own timer.
 */
size_t MainContext::run_pending() {
    std::deque<Task> ready;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ready.swap(queue_);
    }
    size_t ran = 0;
    for (auto& task : ready) {
        task();
        ran++;
    }

    const auto now = SteadyClock::now();
    std::vector<TimerId> due;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& kv : timers_) {
            if (kv.second.next <= now) due.push_back(kv.first);
        }
    }
    for (TimerId id : due) {
        Task task;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = timers_.find(id);
            if (it == timers_.end()) continue;
            it->second.next = now + it->second.interval;
            task = it->second.task;
        }
        task();
        ran++;
    }
    return ran;
}

void MainContext::run() {
    while (true) {
        run_pending();

        std::unique_lock<std::mutex> lock(mutex_);
        if (stopped_) break;
        if (!queue_.empty()) continue;
        cv_.wait_until(lock, next_deadline_locked(), [this] { return stopped_ || !queue_.empty(); });
        if (stopped_) break;
    }
}

void MainContext::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    cv_.notify_all();
}

SteadyClock::time_point MainContext::next_deadline_locked() const {
    auto deadline = SteadyClock::now() + std::chrono::seconds(1);
    for (const auto& kv : timers_) {
        if (kv.second.next < deadline) deadline = kv.second.next;
    }
    return deadline;
}
