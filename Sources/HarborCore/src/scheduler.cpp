#include "harbor/scheduler.hpp"
#include "harbor/log.hpp"
#include <exception>

namespace harbor {

// An exception escaping a timer callback is logged; the loop keeps running.
static void run_timer_callback(const std::function<void()>& fn, timer_service::timer_id id) {
    try {
        fn();
    } catch (const std::exception& e) {
        LOG_ERROR("timer", "Timer %llu callback threw: %s", static_cast<unsigned long long>(id), e.what());
    }
}

// ============================================================================
// thread_timer_service
// ============================================================================

thread_timer_service::thread_timer_service() {
    worker_ = std::thread([this] { run_loop(); });
}

thread_timer_service::~thread_timer_service() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        timers_.clear();
    }
    cv_.notify_one();
    if (worker_.joinable()) {
        worker_.join();
    }
}

timer_service::timer_id thread_timer_service::schedule(std::chrono::milliseconds delay, std::function<void()> fn) {
    timer_id id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
        timers_[id] = entry{clock::now() + delay, std::move(fn)};
    }
    cv_.notify_one();
    return id;
}

bool thread_timer_service::cancel(timer_id id) {
    bool erased;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        erased = timers_.erase(id) > 0;
    }
    if (erased) cv_.notify_one();
    return erased;
}

size_t thread_timer_service::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void thread_timer_service::run_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        if (timers_.empty()) {
            cv_.wait(lock, [this] { return !running_ || !timers_.empty(); });
            continue;
        }

        auto next = timers_.begin();
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
            if (it->second.deadline < next->second.deadline) next = it;
        }

        // Copied: the entry may be cancelled while the lock is released
        auto deadline = next->second.deadline;
        if (deadline > clock::now()) {
            // Woken early by schedule/cancel/shutdown; re-evaluate
            cv_.wait_until(lock, deadline);
            continue;
        }

        auto id = next->first;
        auto fn = std::move(next->second.fn);
        timers_.erase(next);

        lock.unlock();
        run_timer_callback(fn, id);
        lock.lock();
    }
}

// ============================================================================
// manual_timer_service
// ============================================================================

timer_service::timer_id manual_timer_service::schedule(std::chrono::milliseconds delay, std::function<void()> fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_id_++;
    timers_[id] = entry{now_ + delay, std::move(fn)};
    return id;
}

bool manual_timer_service::cancel(timer_id id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.erase(id) > 0;
}

size_t manual_timer_service::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

std::chrono::milliseconds manual_timer_service::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

std::optional<std::chrono::milliseconds> manual_timer_service::next_delay() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<std::chrono::milliseconds> earliest;
    for (const auto& [_, e] : timers_) {
        if (!earliest || e.deadline < *earliest) earliest = e.deadline;
    }
    if (!earliest) return std::nullopt;
    return *earliest - now_;
}

size_t manual_timer_service::advance(std::chrono::milliseconds by) {
    size_t fired = 0;
    std::chrono::milliseconds target;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        target = now_ + by;
    }

    while (true) {
        timer_id id = 0;
        std::function<void()> fn;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            // Earliest deadline first; equal deadlines fire in scheduling order
            auto next = timers_.end();
            for (auto it = timers_.begin(); it != timers_.end(); ++it) {
                if (it->second.deadline > target) continue;
                if (next == timers_.end() || it->second.deadline < next->second.deadline) next = it;
            }
            if (next == timers_.end()) {
                now_ = target;
                break;
            }
            now_ = next->second.deadline;
            id = next->first;
            fn = std::move(next->second.fn);
            timers_.erase(next);
        }
        run_timer_callback(fn, id);
        ++fired;
    }
    return fired;
}

} // namespace harbor
