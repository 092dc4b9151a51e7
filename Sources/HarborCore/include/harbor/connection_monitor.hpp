#pragma once

#include "network.hpp"
#include "scheduler.hpp"
#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace harbor {

enum class connectivity {
    unknown,
    reachable,
    unreachable
};

const char* to_string(connectivity c) noexcept;

// Current belief about remote reachability. Owned by connection_monitor;
// everyone else gets copies.
struct connectivity_state {
    connectivity state = connectivity::unknown;
    int consecutive_successes = 0;
    int consecutive_failures = 0;
    std::optional<timestamp_t> last_checked_at;
    std::string last_detail;
};

struct connectivity_event {
    connectivity previous = connectivity::unknown;
    connectivity current = connectivity::unknown;
    connectivity_state state;
};

struct monitor_config {
    std::chrono::milliseconds probe_timeout{5000};
    std::chrono::milliseconds reachable_interval{30000};
    // Delay after the 1st, 2nd, ... consecutive failure; later failures use max_interval
    std::vector<std::chrono::milliseconds> failure_ladder = {
        std::chrono::milliseconds(5000),
        std::chrono::milliseconds(10000),
        std::chrono::milliseconds(20000),
        std::chrono::milliseconds(40000),
    };
    std::chrono::milliseconds max_interval{60000};
    int hysteresis = 2;   // agreeing probes needed before a transition
};

// ============================================================================
// connection_monitor - adaptive reachability polling with hysteresis
// ============================================================================

class connection_monitor {
public:
    using listener = std::function<void(const connectivity_event&)>;
    using listener_id = uint64_t;

    connection_monitor(std::shared_ptr<reachability_probe> probe,
                       std::shared_ptr<timer_service> timers,
                       monitor_config config = {},
                       SharedScheduler scheduler = nullptr,
                       clock_fn clock = system_now);
    ~connection_monitor();

    connection_monitor(const connection_monitor&) = delete;
    connection_monitor& operator=(const connection_monitor&) = delete;

    /// Schedules the first probe immediately. A second call while running is a no-op.
    void start();

    /// Cancels the pending probe timer and removes every listener. Waits for
    /// a probe already running on the timer thread.
    void stop();

    bool is_running() const;

    /// Runs one probe on the calling thread and applies its result.
    connectivity_state check_now();

    connectivity_state state() const;
    bool is_reachable() const;

    listener_id add_listener(listener fn);
    void remove_listener(listener_id id);
    size_t listener_count() const;

    /// Delay the loop will wait before the next probe, given the current state.
    std::chrono::milliseconds next_interval() const;

private:
    void on_timer(uint64_t generation);
    void schedule_probe_locked(std::chrono::milliseconds delay, uint64_t generation);
    void apply(const probe_result& result);
    std::chrono::milliseconds next_interval_locked() const;
    void emit(const connectivity_event& event);

    std::shared_ptr<reachability_probe> probe_;
    std::shared_ptr<timer_service> timers_;
    monitor_config config_;
    SharedScheduler scheduler_;
    clock_fn clock_;

    mutable std::mutex mutex_;
    connectivity_state state_;
    bool last_probe_ok_ = false;
    bool running_ = false;
    uint64_t generation_ = 0;
    SharedGate gate_;
    std::optional<timer_service::timer_id> timer_;
    std::map<listener_id, listener> listeners_;
    listener_id next_listener_id_ = 1;
};

} // namespace harbor
