#include "harbor/connection_monitor.hpp"
#include "harbor/log.hpp"
#include <algorithm>

namespace harbor {

const char* to_string(connectivity c) noexcept {
    switch (c) {
        case connectivity::unknown: return "unknown";
        case connectivity::reachable: return "reachable";
        case connectivity::unreachable: return "unreachable";
    }
    return "unknown";
}

connection_monitor::connection_monitor(std::shared_ptr<reachability_probe> probe,
                                       std::shared_ptr<timer_service> timers,
                                       monitor_config config,
                                       SharedScheduler scheduler,
                                       clock_fn clock)
    : probe_(std::move(probe))
    , timers_(std::move(timers))
    , config_(std::move(config))
    , scheduler_(scheduler ? std::move(scheduler) : std::make_shared<immediate_scheduler>())
    , clock_(std::move(clock)) {
    if (config_.hysteresis < 1) config_.hysteresis = 1;
}

connection_monitor::~connection_monitor() {
    stop();
}

void connection_monitor::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        LOG_DEBUG("monitor", "start() while running, ignored");
        return;
    }
    running_ = true;
    gate_ = std::make_shared<callback_gate>();
    schedule_probe_locked(std::chrono::milliseconds(0), ++generation_);
    LOG_INFO("monitor", "Connection monitor started");
}

void connection_monitor::stop() {
    SharedGate gate;
    bool was_running;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (timer_) {
            timers_->cancel(*timer_);
            timer_.reset();
        }
        ++generation_;
        listeners_.clear();
        gate = gate_;
        was_running = running_;
        running_ = false;
    }
    // A probe already running on the timer thread, and the listeners it is
    // notifying, finish before stop() returns
    if (gate) gate->close();
    if (was_running) {
        LOG_INFO("monitor", "Connection monitor stopped");
    }
}

void connection_monitor::schedule_probe_locked(std::chrono::milliseconds delay, uint64_t generation) {
    auto gate = gate_;
    timer_ = timers_->schedule(delay, [this, gate, generation] {
        gate->run([&] { on_timer(generation); });
    });
}

bool connection_monitor::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

connectivity_state connection_monitor::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool connection_monitor::is_reachable() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.state == connectivity::reachable;
}

connection_monitor::listener_id connection_monitor::add_listener(listener fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_listener_id_++;
    listeners_[id] = std::move(fn);
    return id;
}

void connection_monitor::remove_listener(listener_id id) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(id);
}

size_t connection_monitor::listener_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
}

std::chrono::milliseconds connection_monitor::next_interval() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_interval_locked();
}

std::chrono::milliseconds connection_monitor::next_interval_locked() const {
    std::chrono::milliseconds interval;
    if (last_probe_ok_) {
        // A success that has not been confirmed yet re-probes quickly
        interval = state_.state == connectivity::reachable
            ? config_.reachable_interval
            : (config_.failure_ladder.empty() ? config_.reachable_interval : config_.failure_ladder.front());
    } else {
        size_t step = state_.consecutive_failures > 0 ? static_cast<size_t>(state_.consecutive_failures - 1) : 0;
        interval = step < config_.failure_ladder.size() ? config_.failure_ladder[step] : config_.max_interval;
    }
    return std::min(interval, config_.max_interval);
}

connectivity_state connection_monitor::check_now() {
    probe_result result;
    try {
        result = probe_->probe(config_.probe_timeout);
    } catch (const remote_error& e) {
        result.reachable = false;
        result.detail = std::string(to_string(e.code())) + ": " + e.what();
    }
    apply(result);
    return state();
}

void connection_monitor::apply(const probe_result& result) {
    std::optional<connectivity_event> event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.last_checked_at = clock_();
        state_.last_detail = result.detail;
        last_probe_ok_ = result.reachable;

        if (result.reachable) {
            ++state_.consecutive_successes;
            state_.consecutive_failures = 0;
            if (state_.state != connectivity::reachable && state_.consecutive_successes >= config_.hysteresis) {
                event = connectivity_event{state_.state, connectivity::reachable, {}};
                state_.state = connectivity::reachable;
            }
        } else {
            ++state_.consecutive_failures;
            state_.consecutive_successes = 0;
            if (state_.state != connectivity::unreachable && state_.consecutive_failures >= config_.hysteresis) {
                event = connectivity_event{state_.state, connectivity::unreachable, {}};
                state_.state = connectivity::unreachable;
            }
        }

        LOG_DEBUG("monitor", "Probe %s (%s), state %s, successes %d, failures %d",
                  result.reachable ? "ok" : "failed", result.detail.c_str(), to_string(state_.state),
                  state_.consecutive_successes, state_.consecutive_failures);

        if (event) event->state = state_;
    }

    if (event) {
        LOG_INFO("monitor", "Connectivity %s -> %s", to_string(event->previous), to_string(event->current));
        emit(*event);
    }
}

void connection_monitor::emit(const connectivity_event& event) {
    std::vector<listener> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [_, fn] : listeners_) {
            targets.push_back(fn);
        }
    }
    for (auto& fn : targets) {
        scheduler_->invoke([fn, event] { fn(event); });
    }
}

void connection_monitor::on_timer(uint64_t generation) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || generation != generation_) return;
        timer_.reset();
    }

    check_now();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ || generation != generation_) return;
    auto delay = next_interval_locked();
    schedule_probe_locked(delay, generation);
    LOG_DEBUG("monitor", "Next probe in %lld ms", static_cast<long long>(delay.count()));
}

} // namespace harbor
