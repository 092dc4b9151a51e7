#pragma once

#include "connection_monitor.hpp"
#include "network.hpp"
#include "queue.hpp"
#include "retry.hpp"
#include "scheduler.hpp"
#include "store.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace harbor {

enum class sync_state {
    idle,
    syncing,
    idle_with_pending_errors
};

const char* to_string(sync_state s) noexcept;

struct sync_config {
    std::chrono::milliseconds interval{60000};
    size_t batch_size = 50;
    size_t push_chunk_size = 0;                   // 0 = whole batch in one push
    std::chrono::milliseconds push_timeout{30000};
    int max_attempts = 5;                         // attempts before an item is marked failed
    bool sync_on_reachable = true;

    std::chrono::milliseconds cleanup_interval{std::chrono::hours(1)};
    std::chrono::hours transaction_retention{24 * 30};
    std::chrono::hours session_retention{24 * 7};
    std::chrono::hours order_retention{24 * 30};
};

// Durable record of one failed sync attempt for one transaction
struct sync_error_record {
    std::string id;
    std::string transaction_id;
    std::string idempotency_key;
    std::string error_kind;
    std::string message;
    int attempt = 0;
    timestamp_t timestamp{};

    json to_json() const;
    static sync_error_record from_json(const json& j);
};

struct sync_report {
    bool skipped = false;
    std::string skip_reason;
    size_t attempted = 0;
    size_t succeeded = 0;
    size_t failed = 0;
    bool abandoned = false;        // connectivity dropped while a chunk was in flight
    size_t not_sent = 0;           // items left pending by the abandon
    std::optional<std::string> error;   // storage failure that ended the cycle early
    timestamp_t started_at{};
    timestamp_t finished_at{};
};

struct cleanup_report {
    size_t transactions = 0;
    size_t sync_errors = 0;
    size_t sessions = 0;
    size_t orders = 0;
};

struct sync_status {
    sync_state state = sync_state::idle;
    std::optional<sync_report> last_report;
    size_t pending = 0;
    std::optional<timestamp_t> last_sync;
};

// Summary for a point-of-sale status indicator
struct network_status {
    bool offline = true;
    bool warning = false;     // unsynced data while the backend is unreachable
    bool loading = false;     // a sync cycle is running
    size_t pending = 0;
    size_t error_count = 0;
    std::optional<timestamp_t> last_sync;
};

// ============================================================================
// sync_manager - drains the transaction queue to the remote
// ============================================================================
//
// One cycle handles one batch. Items are pushed in chunks; every item that
// comes back gets an outcome written to the store before the next chunk is
// sent. If the monitor reports unreachable while a chunk is in flight, the
// chunk's response is discarded and the cycle ends, leaving the rest pending.

class sync_manager {
public:
    using on_sync_started_handler = std::function<void()>;
    using on_sync_completed_handler = std::function<void(size_t success_count, size_t failure_count)>;

    sync_manager(local_store& store,
                 transaction_queue& queue,
                 connection_monitor& monitor,
                 std::shared_ptr<batch_pusher> pusher,
                 std::shared_ptr<timer_service> timers,
                 sync_config config = {},
                 retry_policy retry = {},
                 SharedScheduler scheduler = nullptr,
                 clock_fn clock = system_now);
    ~sync_manager();

    sync_manager(const sync_manager&) = delete;
    sync_manager& operator=(const sync_manager&) = delete;

    /// Arms the periodic and cleanup timers and subscribes to the monitor.
    /// A second call while running is a no-op.
    void start();

    /// Cancels both timers and unsubscribes from the monitor. Waits for a
    /// cycle already running on the timer thread.
    void stop();

    bool is_running() const;

    /// Runs one cycle on the calling thread.
    sync_report sync_now();

    /// Runs a cycle now and restarts the periodic timer. False when unreachable.
    bool force_sync();

    cleanup_report cleanup(timestamp_t now);

    sync_status status();
    network_status network_state();
    std::vector<sync_error_record> sync_errors();
    std::vector<sync_error_record> sync_errors_for(const std::string& transaction_id);
    std::optional<timestamp_t> last_sync();

    void set_on_sync_started(on_sync_started_handler handler);
    void set_on_sync_completed(on_sync_completed_handler handler);

private:
    sync_report run_cycle();
    void push_chunk(const std::vector<offline_transaction>& chunk, sync_report& report, bool& abandon);
    void record_failure(const offline_transaction& item, const std::string& kind,
                        const std::string& message, sync_report& report);
    void save_last_sync(timestamp_t when);

    void arm_sync_timer(std::chrono::milliseconds delay);
    void arm_cleanup_timer();
    void on_sync_timer(uint64_t generation);
    void on_cleanup_timer(uint64_t generation);

    local_store& store_;
    transaction_queue& queue_;
    connection_monitor& monitor_;
    std::shared_ptr<batch_pusher> pusher_;
    std::shared_ptr<timer_service> timers_;
    sync_config config_;
    retry_policy retry_;
    SharedScheduler scheduler_;
    clock_fn clock_;

    mutable std::mutex mutex_;
    sync_state state_ = sync_state::idle;
    bool syncing_ = false;
    bool running_ = false;
    uint64_t generation_ = 0;
    SharedGate gate_;
    std::optional<timer_service::timer_id> sync_timer_;
    std::optional<timer_service::timer_id> cleanup_timer_;
    std::optional<connection_monitor::listener_id> monitor_listener_;
    std::optional<sync_report> last_report_;

    on_sync_started_handler on_sync_started_;
    on_sync_completed_handler on_sync_completed_;
};

} // namespace harbor
