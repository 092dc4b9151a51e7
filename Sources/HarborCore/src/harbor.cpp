#include "harbor/harbor.hpp"
#include "harbor/snapshot_notifier.hpp"

#include <stdexcept>

namespace harbor {

// Single definition of the global log level (declared extern in log.hpp).
std::atomic<log_level> g_log_level{log_level::warn};

namespace {

std::shared_ptr<reachability_probe> make_probe(const configuration& config,
                                               const std::shared_ptr<http_client>& client) {
    if (config.probe) return config.probe;
    if (config.probe_url.empty()) {
        throw std::invalid_argument("configuration needs probe_url or an injected probe");
    }
    return std::make_shared<http_reachability_probe>(client, http_probe_config{config.probe_url, config.expected_marker});
}

std::shared_ptr<batch_pusher> make_pusher(const configuration& config,
                                          const std::shared_ptr<http_client>& client) {
    if (config.pusher) return config.pusher;
    if (config.push_url.empty()) {
        throw std::invalid_argument("configuration needs push_url or an injected pusher");
    }
    return std::make_shared<http_batch_pusher>(client, config.push_url, config.push_headers);
}

} // namespace

offline_core::offline_core(const configuration& config)
    : config_(config) {
    set_log_level(config_.logging);

    monitor_timers_ = config_.timers ? config_.timers : std::make_shared<thread_timer_service>();
    if (config_.sync_timers) {
        sync_timers_ = config_.sync_timers;
    } else if (config_.timers) {
        sync_timers_ = config_.timers;
    } else {
        sync_timers_ = std::make_shared<thread_timer_service>();
    }
    SharedScheduler sched = config_.sched ? config_.sched : std::make_shared<immediate_scheduler>();

    std::shared_ptr<http_client> client;
    if (!config_.probe || !config_.pusher) {
        client = std::make_shared<asio_http_client>();
    }
    auto probe = make_probe(config_, client);
    auto pusher = make_pusher(config_, client);

    store_ = std::make_unique<local_store>(config_.store);
    queue_ = std::make_unique<transaction_queue>(*store_, config_.queue, config_.retry);
    cache_ = std::make_unique<offline_cache>(*store_, config_.retry);
    monitor_ = std::make_unique<connection_monitor>(probe, monitor_timers_, config_.monitor, sched);
    sync_ = std::make_unique<sync_manager>(*store_, *queue_, *monitor_, pusher, sync_timers_,
                                           config_.sync, config_.retry, sched);

    std::unique_ptr<snapshot_notifier> notifier;
    if (config_.cross_process_notifications) {
        notifier = make_snapshot_notifier(store_->path());
    }
    sessions_ = std::make_unique<session_persistence>(*store_, reference_, config_.instance_id,
                                                      config_.session, config_.retry, system_now,
                                                      std::move(notifier));

    LOG_INFO("harbor", "Offline core ready at %s (instance %s, schema v%d)",
             store_->path().c_str(), sessions_->instance_id().c_str(), store_->schema_version());
}

offline_core::~offline_core() {
    stop();
}

void offline_core::start() {
    if (running_) return;
    // monitor.stop() drops listeners, so subscriptions are made on every start
    sessions_->attach(*monitor_);
    sync_->start();
    monitor_->start();
    running_ = true;
}

void offline_core::stop() {
    if (!running_) return;
    sync_->stop();
    sessions_->detach();
    monitor_->stop();
    running_ = false;
}

bool offline_core::is_running() const {
    return running_;
}

} // namespace harbor
