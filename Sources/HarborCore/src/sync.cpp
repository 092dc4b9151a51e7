#include "harbor/sync.hpp"
#include "harbor/log.hpp"
#include "harbor/offline_cache.hpp"
#include <algorithm>
#include <unordered_map>

namespace harbor {

const char* to_string(sync_state s) noexcept {
    switch (s) {
        case sync_state::idle: return "idle";
        case sync_state::syncing: return "syncing";
        case sync_state::idle_with_pending_errors: return "idle_with_pending_errors";
    }
    return "idle";
}

// ============================================================================
// sync_error_record
// ============================================================================

json sync_error_record::to_json() const {
    return {
        {"id", id},
        {"transaction_id", transaction_id},
        {"idempotency_key", idempotency_key},
        {"error_kind", error_kind},
        {"message", message},
        {"attempt", attempt},
        {"timestamp", to_millis(timestamp)},
    };
}

sync_error_record sync_error_record::from_json(const json& j) {
    sync_error_record r;
    r.id = j.value("id", "");
    r.transaction_id = j.value("transaction_id", "");
    r.idempotency_key = j.value("idempotency_key", "");
    r.error_kind = j.value("error_kind", "");
    r.message = j.value("message", "");
    r.attempt = j.value("attempt", 0);
    r.timestamp = from_millis(j.value("timestamp", int64_t{0}));
    return r;
}

// ============================================================================
// sync_manager
// ============================================================================

sync_manager::sync_manager(local_store& store,
                           transaction_queue& queue,
                           connection_monitor& monitor,
                           std::shared_ptr<batch_pusher> pusher,
                           std::shared_ptr<timer_service> timers,
                           sync_config config,
                           retry_policy retry,
                           SharedScheduler scheduler,
                           clock_fn clock)
    : store_(store)
    , queue_(queue)
    , monitor_(monitor)
    , pusher_(std::move(pusher))
    , timers_(std::move(timers))
    , config_(std::move(config))
    , retry_(std::move(retry))
    , scheduler_(scheduler ? std::move(scheduler) : std::make_shared<immediate_scheduler>())
    , clock_(std::move(clock)) {
    if (config_.batch_size == 0) config_.batch_size = 1;
    if (config_.push_chunk_size == 0 || config_.push_chunk_size > config_.batch_size) {
        config_.push_chunk_size = config_.batch_size;
    }
}

sync_manager::~sync_manager() {
    stop();
}

void sync_manager::set_on_sync_started(on_sync_started_handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_sync_started_ = std::move(handler);
}

void sync_manager::set_on_sync_completed(on_sync_completed_handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_sync_completed_ = std::move(handler);
}

void sync_manager::start() {
    SharedGate gate;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            LOG_DEBUG("sync", "start() while running, ignored");
            return;
        }
        running_ = true;
        ++generation_;
        gate_ = std::make_shared<callback_gate>();
        gate = gate_;
    }

    auto listener = monitor_.add_listener([this, gate](const connectivity_event& event) {
        gate->run([&] {
            if (event.current != connectivity::reachable || !config_.sync_on_reachable) return;
            LOG_INFO("sync", "Backend reachable again, scheduling immediate sync");
            arm_sync_timer(std::chrono::milliseconds(0));
        });
    });

    {
        std::lock_guard<std::mutex> lock(mutex_);
        monitor_listener_ = listener;
    }
    arm_sync_timer(config_.interval);
    arm_cleanup_timer();
    LOG_INFO("sync", "Sync manager started (interval %lld ms, batch %zu)",
             static_cast<long long>(config_.interval.count()), config_.batch_size);
}

void sync_manager::stop() {
    std::optional<connection_monitor::listener_id> listener;
    SharedGate gate;
    bool was_running;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sync_timer_) {
            timers_->cancel(*sync_timer_);
            sync_timer_.reset();
        }
        if (cleanup_timer_) {
            timers_->cancel(*cleanup_timer_);
            cleanup_timer_.reset();
        }
        ++generation_;
        listener = monitor_listener_;
        monitor_listener_.reset();
        gate = gate_;
        was_running = running_;
        running_ = false;
    }
    if (listener) monitor_.remove_listener(*listener);
    // A cycle already running on the timer thread finishes before stop() returns
    if (gate) gate->close();
    if (was_running) {
        LOG_INFO("sync", "Sync manager stopped");
    }
}

bool sync_manager::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void sync_manager::arm_sync_timer(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return;
    if (sync_timer_) timers_->cancel(*sync_timer_);
    auto generation = generation_;
    auto gate = gate_;
    sync_timer_ = timers_->schedule(delay, [this, gate, generation] {
        gate->run([&] { on_sync_timer(generation); });
    });
}

void sync_manager::arm_cleanup_timer() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return;
    if (cleanup_timer_) timers_->cancel(*cleanup_timer_);
    auto generation = generation_;
    auto gate = gate_;
    cleanup_timer_ = timers_->schedule(config_.cleanup_interval, [this, gate, generation] {
        gate->run([&] { on_cleanup_timer(generation); });
    });
}

void sync_manager::on_sync_timer(uint64_t generation) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || generation != generation_) return;
        sync_timer_.reset();
    }
    run_cycle();
    arm_sync_timer(config_.interval);
}

void sync_manager::on_cleanup_timer(uint64_t generation) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || generation != generation_) return;
        cleanup_timer_.reset();
    }
    try {
        cleanup(clock_());
    } catch (const store_error& e) {
        LOG_ERROR("sync", "Cleanup pass failed (%s): %s", to_string(e.code()), e.what());
    }
    arm_cleanup_timer();
}

sync_report sync_manager::sync_now() {
    return run_cycle();
}

bool sync_manager::force_sync() {
    if (!monitor_.is_reachable()) {
        LOG_WARN("sync", "Cannot force sync while unreachable");
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sync_timer_) {
            timers_->cancel(*sync_timer_);
            sync_timer_.reset();
        }
    }
    run_cycle();
    arm_sync_timer(config_.interval);
    return true;
}

sync_report sync_manager::run_cycle() {
    sync_report report;
    report.started_at = clock_();

    on_sync_started_handler started;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (syncing_) {
            report.skipped = true;
            report.skip_reason = "cycle already running";
            report.finished_at = report.started_at;
            return report;
        }
        if (!monitor_.is_reachable()) {
            report.skipped = true;
            report.skip_reason = "backend unreachable";
            report.finished_at = report.started_at;
            LOG_DEBUG("sync", "Skipping cycle: backend unreachable");
            return report;
        }
        syncing_ = true;
        state_ = sync_state::syncing;
        started = on_sync_started_;
    }

    if (started) {
        scheduler_->invoke([started] { started(); });
    }

    try {
        auto batch = queue_.dequeue_batch(config_.batch_size);
        for (auto& item : batch) {
            if (item.idempotency_key.empty()) {
                item.idempotency_key = queue_.ensure_idempotency_key(item.id);
            }
        }
        LOG_INFO("sync", "Sync cycle: %zu pending item(s) in batch", batch.size());

        bool abandon = false;
        for (size_t i = 0; i < batch.size() && !abandon; i += config_.push_chunk_size) {
            size_t end = std::min(i + config_.push_chunk_size, batch.size());
            std::vector<offline_transaction> chunk(batch.begin() + i, batch.begin() + end);
            push_chunk(chunk, report, abandon);
            if (abandon) {
                report.not_sent += batch.size() - end;
            }
        }
    } catch (const store_error& e) {
        // Outcomes already written stay written; the rest is picked up next cycle
        LOG_ERROR("sync", "Sync cycle stopped by storage error (%s): %s", to_string(e.code()), e.what());
        report.error = e.what();
    } catch (const std::exception& e) {
        LOG_ERROR("sync", "Sync cycle failed: %s", e.what());
        report.error = e.what();
    }

    report.finished_at = clock_();
    if (!report.abandoned && !report.error) {
        try {
            save_last_sync(report.finished_at);
        } catch (const store_error& e) {
            LOG_ERROR("sync", "Failed to persist last_sync: %s", e.what());
            report.error = e.what();
        }
    }

    on_sync_completed_handler completed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        syncing_ = false;
        state_ = (report.failed > 0 || report.error) ? sync_state::idle_with_pending_errors : sync_state::idle;
        last_report_ = report;
        completed = on_sync_completed_;
    }

    LOG_INFO("sync", "Sync cycle finished: %zu succeeded, %zu failed%s",
             report.succeeded, report.failed, report.abandoned ? " (abandoned on connectivity loss)" : "");

    if (completed) {
        size_t ok = report.succeeded;
        size_t failed = report.failed;
        scheduler_->invoke([completed, ok, failed] { completed(ok, failed); });
    }
    return report;
}

void sync_manager::push_chunk(const std::vector<offline_transaction>& chunk, sync_report& report, bool& abandon) {
    if (!monitor_.is_reachable()) {
        LOG_WARN("sync", "Connectivity lost before sending chunk, leaving %zu item(s) pending", chunk.size());
        report.abandoned = true;
        report.not_sent += chunk.size();
        abandon = true;
        return;
    }

    std::vector<push_item> items;
    items.reserve(chunk.size());
    for (const auto& t : chunk) {
        items.push_back({t.idempotency_key, t.kind, t.payload});
    }

    std::vector<push_outcome> outcomes;
    std::optional<remote_error> push_failure;
    try {
        outcomes = pusher_->push_batch(items, config_.push_timeout);
    } catch (const remote_error& e) {
        push_failure = e;
    }

    // The monitor flipped while the push was in flight: whatever came back is
    // not trusted, and the items stay as they were for the next cycle.
    if (!monitor_.is_reachable()) {
        LOG_WARN("sync", "Connectivity lost during push, discarding response for %zu item(s)", chunk.size());
        report.abandoned = true;
        abandon = true;
        return;
    }

    report.attempted += chunk.size();

    if (push_failure) {
        LOG_WARN("sync", "Push of %zu item(s) failed (%s): %s", chunk.size(),
                 to_string(push_failure->code()), push_failure->what());
        for (const auto& t : chunk) {
            record_failure(t, to_string(push_failure->code()), push_failure->what(), report);
        }
        return;
    }

    std::unordered_map<std::string, const push_outcome*> by_key;
    for (const auto& o : outcomes) {
        by_key[o.idempotency_key] = &o;
    }

    for (const auto& t : chunk) {
        auto it = by_key.find(t.idempotency_key);
        if (it == by_key.end()) {
            record_failure(t, "missing_outcome", "No outcome returned for idempotency key " + t.idempotency_key, report);
        } else if (it->second->result == push_result::success) {
            queue_.mark_synced(t.id);
            ++report.succeeded;
        } else {
            auto kind = it->second->error_kind.empty() ? std::string("rejected") : it->second->error_kind;
            record_failure(t, kind, "Remote rejected transaction: " + kind, report);
        }
    }
}

void sync_manager::record_failure(const offline_transaction& item, const std::string& kind,
                                  const std::string& message, sync_report& report) {
    int attempts = queue_.increment_attempt(item.id);

    sync_error_record record;
    record.id = uuid_t::generate().to_string();
    record.transaction_id = item.id;
    record.idempotency_key = item.idempotency_key;
    record.error_kind = kind;
    record.message = message;
    record.attempt = attempts;
    record.timestamp = clock_();
    execute_with_retry([&] { store_.put(collections::sync_error, record.to_json()); },
                       "sync.record_error", retry_);

    if (attempts >= config_.max_attempts) {
        LOG_WARN("sync", "Transaction %s failed %d times, marking failed", item.id.c_str(), attempts);
        queue_.mark_failed(item.id, kind + ": " + message);
    }
    ++report.failed;
}

void sync_manager::save_last_sync(timestamp_t when) {
    json record = {
        {"key", "last_sync"},
        {"value", to_millis(when)},
        {"updated_at", to_millis(when)},
    };
    execute_with_retry([&] { store_.put(collections::config, record); }, "sync.save_last_sync", retry_);
}

std::optional<timestamp_t> sync_manager::last_sync() {
    auto record = execute_with_retry([&] { return store_.get(collections::config, "last_sync"); },
                                     "sync.last_sync", retry_);
    if (!record || !record->contains("value") || !(*record)["value"].is_number()) {
        return std::nullopt;
    }
    return from_millis((*record)["value"].get<int64_t>());
}

cleanup_report sync_manager::cleanup(timestamp_t now) {
    cleanup_report result;
    result.transactions = queue_.remove_synced_before(now - config_.transaction_retention);
    result.sync_errors = execute_with_retry([&] {
        return store_.remove_older_than(collections::sync_error, "timestamp",
                                        to_millis(now - config_.transaction_retention));
    }, "sync.cleanup_errors", retry_);
    result.sessions = execute_with_retry([&] {
        return store_.remove_older_than(collections::session, "last_accessed",
                                        to_millis(now - config_.session_retention));
    }, "sync.cleanup_sessions", retry_);

    offline_cache cache(store_, retry_, clock_);
    result.orders = cache.remove_terminal_orders_before(now - config_.order_retention);

    LOG_INFO("sync", "Cleanup removed %zu transaction(s), %zu error record(s), %zu session(s), %zu order(s)",
             result.transactions, result.sync_errors, result.sessions, result.orders);
    return result;
}

std::vector<sync_error_record> sync_manager::sync_errors() {
    return execute_with_retry([&] {
        std::vector<sync_error_record> records;
        for (const auto& r : store_.all(collections::sync_error)) {
            records.push_back(sync_error_record::from_json(r));
        }
        return records;
    }, "sync.sync_errors", retry_);
}

std::vector<sync_error_record> sync_manager::sync_errors_for(const std::string& transaction_id) {
    return execute_with_retry([&] {
        std::vector<sync_error_record> records;
        for (const auto& r : store_.query(collections::sync_error, "transaction_id", transaction_id)) {
            records.push_back(sync_error_record::from_json(r));
        }
        return records;
    }, "sync.sync_errors_for", retry_);
}

sync_status sync_manager::status() {
    sync_status s;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        s.state = state_;
        s.last_report = last_report_;
    }
    s.pending = queue_.pending_count();
    s.last_sync = last_sync();
    return s;
}

network_status sync_manager::network_state() {
    network_status n;
    bool reachable = monitor_.is_reachable();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        n.loading = syncing_;
    }
    n.offline = !reachable;
    n.pending = queue_.pending_count();
    n.warning = n.pending > 0 && !reachable;
    n.error_count = execute_with_retry([&] { return store_.count(collections::sync_error); },
                                       "sync.error_count", retry_);
    n.last_sync = last_sync();
    return n;
}

} // namespace harbor
