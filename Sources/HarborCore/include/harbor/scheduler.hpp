#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <set>
#include <thread>

namespace harbor {

// ============================================================================
// Scheduler interface - where event callbacks are dispatched
// ============================================================================
//
// Connection monitor and sync manager never call listeners directly; they
// hand them to a scheduler so the embedding application decides which
// thread observes reachable / unreachable / sync_completed events.

struct scheduler {
    virtual ~scheduler() = default;

    // Invoke the given function on this scheduler's execution context.
    // Can be called from any thread.
    virtual void invoke(std::function<void()>&& fn) = 0;

    // Check if the caller is currently on this scheduler's thread/context.
    [[nodiscard]] virtual bool is_on_thread() const noexcept = 0;

    // Check if invoke() is currently possible.
    [[nodiscard]] virtual bool can_invoke() const noexcept = 0;
};

using SharedScheduler = std::shared_ptr<scheduler>;

// ============================================================================
// Generic scheduler - runs callbacks on a dedicated worker thread
// ============================================================================

class std_thread_scheduler : public scheduler {
public:
    std_thread_scheduler() : running_(true) {
        worker_ = std::thread([this] { run_loop(); });
        thread_id_ = worker_.get_id();
    }

    ~std_thread_scheduler() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
        }
        cv_.notify_one();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    void invoke(std::function<void()>&& fn) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) return;
            queue_.push(std::move(fn));
        }
        cv_.notify_one();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return std::this_thread::get_id() == thread_id_;
    }

    [[nodiscard]] bool can_invoke() const noexcept override {
        return running_;
    }

private:
    void run_loop() {
        while (true) {
            std::function<void()> fn;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return !queue_.empty() || !running_; });

                if (!running_ && queue_.empty()) {
                    return;
                }

                fn = std::move(queue_.front());
                queue_.pop();
            }

            if (fn) {
                fn();
            }
        }
    }

    std::thread worker_;
    std::thread::id thread_id_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::function<void()>> queue_;
    std::atomic<bool> running_;
};

// ============================================================================
// Immediate scheduler - runs callbacks synchronously on calling thread
// ============================================================================
//
// Useful for testing or single-threaded applications.

class immediate_scheduler : public scheduler {
public:
    void invoke(std::function<void()>&& fn) override {
        if (fn) fn();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return true;  // Always "on thread" since we execute immediately
    }

    [[nodiscard]] bool can_invoke() const noexcept override {
        return true;
    }
};

// ============================================================================
// Callback gate - lets an owner stop callbacks that capture `this`
// ============================================================================
//
// Timer and listener callbacks hold a shared_ptr to the gate, not to their
// owner. Once close() returns, no callback is inside run() and none will
// enter again, so the owner may be destroyed even if the timer service or
// scheduler still holds a copy of the callback.
//
// close() does not wait for a callback running on the calling thread, so
// stop() may be called from inside one of the owner's own callbacks.

class callback_gate {
public:
    /// Runs fn unless the gate is closed. Returns false if it was skipped.
    template<typename Fn>
    bool run(Fn&& fn) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            inside_.insert(std::this_thread::get_id());
        }
        struct leave_on_exit {
            callback_gate& gate;
            ~leave_on_exit() { gate.leave(); }
        } leave{*this};
        fn();
        return true;
    }

    void close() {
        auto self = std::this_thread::get_id();
        std::unique_lock<std::mutex> lock(mutex_);
        closed_ = true;
        idle_.wait(lock, [&] { return inside_.size() == inside_.count(self); });
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    void leave() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            inside_.erase(inside_.find(std::this_thread::get_id()));
        }
        idle_.notify_all();
    }

    mutable std::mutex mutex_;
    std::condition_variable idle_;
    std::multiset<std::thread::id> inside_;
    bool closed_ = false;
};

using SharedGate = std::shared_ptr<callback_gate>;

// ============================================================================
// Timer service - one-shot delayed callbacks
// ============================================================================
//
// Periodic loops (connectivity probes, sync cycles, cleanup) re-arm a
// one-shot timer from inside their own callback, so a loop owns at most one
// pending timer id at a time and stop() only has to cancel that id.

class timer_service {
public:
    using timer_id = uint64_t;

    virtual ~timer_service() = default;

    virtual timer_id schedule(std::chrono::milliseconds delay, std::function<void()> fn) = 0;

    /// Returns true if the timer was still pending.
    virtual bool cancel(timer_id id) = 0;

    /// Number of timers that have not fired or been cancelled.
    [[nodiscard]] virtual size_t pending() const = 0;
};

// Runs every callback on one worker thread (the event loop).
class thread_timer_service : public timer_service {
public:
    thread_timer_service();
    ~thread_timer_service() override;

    thread_timer_service(const thread_timer_service&) = delete;
    thread_timer_service& operator=(const thread_timer_service&) = delete;

    timer_id schedule(std::chrono::milliseconds delay, std::function<void()> fn) override;
    bool cancel(timer_id id) override;
    [[nodiscard]] size_t pending() const override;

private:
    using clock = std::chrono::steady_clock;

    struct entry {
        clock::time_point deadline;
        std::function<void()> fn;
    };

    void run_loop();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<timer_id, entry> timers_;
    timer_id next_id_ = 1;
    bool running_ = true;
    std::thread worker_;
};

// Virtual time for tests: nothing fires until advance() is called, and then
// callbacks run on the caller's thread in deadline order.
class manual_timer_service : public timer_service {
public:
    timer_id schedule(std::chrono::milliseconds delay, std::function<void()> fn) override;
    bool cancel(timer_id id) override;
    [[nodiscard]] size_t pending() const override;

    /// Moves virtual time forward, firing every timer that comes due.
    /// Returns the number of callbacks run.
    size_t advance(std::chrono::milliseconds by);

    /// Delay until the earliest pending timer, if any.
    [[nodiscard]] std::optional<std::chrono::milliseconds> next_delay() const;

    [[nodiscard]] std::chrono::milliseconds now() const;

private:
    struct entry {
        std::chrono::milliseconds deadline;
        std::function<void()> fn;
    };

    mutable std::mutex mutex_;
    std::map<timer_id, entry> timers_;
    timer_id next_id_ = 1;
    std::chrono::milliseconds now_{0};
};

} // namespace harbor
