#pragma once

#include "connection_monitor.hpp"
#include "log.hpp"
#include "network.hpp"
#include "offline_cache.hpp"
#include "queue.hpp"
#include "reference_data.hpp"
#include "retry.hpp"
#include "scheduler.hpp"
#include "session.hpp"
#include "store.hpp"
#include "sync.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace harbor {

struct configuration {
    /// Store file. Use ":memory:" for a throwaway store.
    store_config store;

    queue_config queue;
    monitor_config monitor;
    sync_config sync;
    session_config session;
    retry_policy retry;

    /// Tab / instance identity. Empty = random uuid per process.
    std::string instance_id;

    /// Reachability endpoint, e.g. "http://pos.example.com/web/webclient/version_info".
    std::string probe_url;
    std::optional<std::string> expected_marker;

    /// Batch endpoint for offline transactions.
    std::string push_url;

    /// Extra headers sent with every push (auth, database name).
    std::map<std::string, std::string> push_headers;

    log_level logging = log_level::warn;

    /// Scheduler for listener and handler callbacks. nullptr = immediate_scheduler.
    SharedScheduler sched = nullptr;

    /// Drives connectivity probes. nullptr = thread_timer_service.
    std::shared_ptr<timer_service> timers = nullptr;

    /// Drives sync and cleanup cycles. A push blocks this service's thread
    /// for up to sync.push_timeout, so it must not be the one probing.
    /// nullptr = `timers` when that was injected, else a second
    /// thread_timer_service.
    std::shared_ptr<timer_service> sync_timers = nullptr;

    /// Injected remote collaborators. When null they are built over HTTP
    /// from probe_url and push_url.
    std::shared_ptr<reachability_probe> probe = nullptr;
    std::shared_ptr<batch_pusher> pusher = nullptr;

    /// Watch for snapshots committed by other processes on the same file.
    bool cross_process_notifications = true;

    configuration() = default;

    explicit configuration(const std::string& path) {
        store.path = path;
    }

    configuration(const std::string& path, const std::string& probe, const std::string& push)
        : probe_url(probe), push_url(push) {
        store.path = path;
    }
};

// ============================================================================
// offline_core - store, queue, monitor, sync manager and sessions wired together
// ============================================================================

class offline_core {
public:
    explicit offline_core(const configuration& config);
    ~offline_core();

    offline_core(const offline_core&) = delete;
    offline_core& operator=(const offline_core&) = delete;

    /// Starts connectivity polling and the sync loop. Idempotent.
    void start();

    /// Stops both loops and waits for a probe or sync cycle already in
    /// progress; queued work stays in the store.
    void stop();

    bool is_running() const;

    local_store& store() { return *store_; }
    transaction_queue& queue() { return *queue_; }
    connection_monitor& monitor() { return *monitor_; }
    sync_manager& sync() { return *sync_; }
    session_persistence& sessions() { return *sessions_; }
    reference_cache& reference() { return reference_; }
    offline_cache& cache() { return *cache_; }

    const configuration& config() const { return config_; }

private:
    configuration config_;
    std::shared_ptr<timer_service> monitor_timers_;
    std::shared_ptr<timer_service> sync_timers_;
    std::unique_ptr<local_store> store_;
    std::unique_ptr<transaction_queue> queue_;
    std::unique_ptr<offline_cache> cache_;
    reference_cache reference_;
    std::unique_ptr<connection_monitor> monitor_;
    std::unique_ptr<sync_manager> sync_;
    std::unique_ptr<session_persistence> sessions_;
    bool running_ = false;
};

} // namespace harbor
