#pragma once

#include "TestSupport.hpp"
#include <cassert>
#include <iostream>

namespace offline_cache_tests {

using namespace harbor;
using namespace harbor_test;

// Checks a login against the cached hash, as a POS would while offline
class cached_credential_verifier : public credential_verifier {
public:
    explicit cached_credential_verifier(offline_cache& cache) : cache_(cache) {}

    verdict verify(const std::string& login, const std::string& secret) override {
        auto record = cache_.credential_by_login(login);
        if (!record || record->hash_algorithm != secret_hash_algorithm) return verdict::reject;
        return compute_secret_hash(secret, record->user_id) == record->secret_hash ? verdict::accept
                                                                                   : verdict::reject;
    }

private:
    offline_cache& cache_;
};

// ============================================================================
// test_secret_hash
// ============================================================================

void test_secret_hash() {
    std::cout << "  test_secret_hash..." << std::flush;

    // SHA-256("abc")
    assert(compute_secret_hash("ab", "c") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    assert(compute_secret_hash("1234", "7").size() == 64);
    // The user id salts the hash
    assert(compute_secret_hash("1234", "7") != compute_secret_hash("1234", "8"));

    auto record = credential_record::from_secret("7", "anna", "1234", "Anna");
    assert(record.secret_hash == compute_secret_hash("1234", "7"));
    assert(record.hash_algorithm == secret_hash_algorithm);
    assert(record.to_json().dump().find("1234") == std::string::npos);

    // Numeric ids written by the backend read back as strings
    auto numeric = credential_record::from_json({{"user_id", 42}, {"login", "bob"}, {"secret_hash", "x"}});
    assert(numeric.user_id == "42");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_credentials
// ============================================================================

void test_credentials() {
    std::cout << "  test_credentials..." << std::flush;

    test_clock clock;
    local_store store(store_config{});
    offline_cache cache(store, recording_retry(), clock.fn());
    cached_credential_verifier verifier(cache);

    cache.save_credential(credential_record::from_secret("7", "anna", "1234", "Anna"));
    auto by_id = cache.credential("7");
    assert(by_id && by_id->login == "anna");
    assert(by_id->name == "Anna");
    assert(by_id->cached_at == clock.now());
    assert(cache.credential_by_login("anna")->user_id == "7");

    assert(verifier.verify("anna", "1234") == verdict::accept);
    assert(verifier.verify("anna", "4321") == verdict::reject);
    assert(verifier.verify("nobody", "1234") == verdict::reject);

    // The login now belongs to another user id
    cache.save_credential(credential_record::from_secret("9", "anna", "5678"));
    assert(!cache.credential("7").has_value());
    assert(cache.credential_by_login("anna")->user_id == "9");
    assert(cache.all_credentials().size() == 1);
    assert(verifier.verify("anna", "1234") == verdict::reject);
    assert(verifier.verify("anna", "5678") == verdict::accept);

    bool threw = false;
    try {
        credential_record incomplete;
        incomplete.user_id = "3";
        incomplete.login = "carl";
        cache.save_credential(incomplete);
    } catch (const store_error& e) {
        threw = e.code() == store_errc::invalid_state;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_config_values
// ============================================================================

void test_config_values() {
    std::cout << "  test_config_values..." << std::flush;

    local_store store(store_config{});
    offline_cache cache(store, recording_retry());

    assert(!cache.config("currency").has_value());
    cache.set_config("currency", {{"name", "EUR"}, {"decimals", 2}});
    assert((*cache.config("currency"))["decimals"] == 2);

    cache.set_config("currency", {{"name", "USD"}, {"decimals", 2}});
    assert((*cache.config("currency"))["name"] == "USD");
    assert(store.count(collections::config) == 1);

    cache.set_config("receipt_footer", "Thank you");
    assert(*cache.config("receipt_footer") == "Thank you");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_orders
// ============================================================================

void test_orders() {
    std::cout << "  test_orders..." << std::flush;

    local_store store(store_config{});
    offline_cache cache(store, recording_retry());

    cache.save_order({{"id", "Order 1"}, {"state", "paid"}, {"date_order", 100}});
    cache.save_order({{"id", "Order 2"}, {"state", "cancel"}, {"date_order", 100}});
    cache.save_order({{"id", "Order 3"}, {"state", "draft"}, {"date_order", 100}});
    cache.save_order({{"id", "Order 4"}, {"state", "done"}, {"date_order", 900}});
    cache.save_order({{"id", "Order 5"}, {"state", "draft"}, {"date_order", 50}});

    auto drafts = cache.orders_by_state("draft");
    assert(drafts.size() == 2);
    assert(drafts[0]["id"] == "Order 5");
    assert((*cache.order("Order 1"))["state"] == "paid");

    // Open orders survive however old they are
    assert(cache.remove_terminal_orders_before(from_millis(500)) == 2);
    assert(!cache.order("Order 1").has_value());
    assert(!cache.order("Order 2").has_value());
    assert(cache.order("Order 3").has_value());
    assert(cache.order("Order 4").has_value());

    cache.remove_order("Order 3");
    assert(cache.orders_by_state("draft").size() == 1);

    bool threw = false;
    try {
        cache.remove_order("Order 3");
    } catch (const store_error& e) {
        threw = e.code() == store_errc::not_found;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_offline_core - the wired facade over virtual time
// ============================================================================

void test_offline_core() {
    std::cout << "  test_offline_core..." << std::flush;

    auto probe = std::make_shared<scripted_probe>(true);
    auto pusher = std::make_shared<mock_batch_pusher>();
    auto timers = std::make_shared<manual_timer_service>();

    configuration config;
    config.instance_id = "tab-A";
    config.probe = probe;
    config.pusher = pusher;
    config.timers = timers;
    config.logging = log_level::error;

    offline_core core(config);
    assert(core.sessions().instance_id() == "tab-A");
    assert(core.store().path() == ":memory:");
    assert(!core.is_running());

    core.sessions().open_session("anna");
    core.sessions().load_reference_data("product.product", json::array({{{"id", 1}}}));
    core.queue().enqueue({{"amount_total", 4.5}}, "pos.order");
    core.queue().enqueue({{"amount_total", 9.0}}, "pos.order");
    core.cache().set_config("currency", "EUR");

    core.start();
    core.start();
    assert(core.is_running());

    timers->advance(0ms);
    timers->advance(5000ms);
    assert(core.monitor().is_reachable());
    assert(pusher->calls.size() == 1);
    assert(core.queue().pending_count() == 0);
    assert(!core.sync().network_state().warning);

    core.stop();
    assert(!core.is_running());
    assert(timers->pending() == 0);
    assert(core.monitor().listener_count() == 0);

    // Restart re-subscribes everything
    core.start();
    assert(core.monitor().listener_count() == 2);
    core.stop();

    auto meta = core.sessions().snapshot();
    assert(meta.collections.size() == 1);

    // Without injected collaborators the URLs are required
    configuration bare;
    bare.logging = log_level::error;
    bare.timers = timers;
    bool threw = false;
    try {
        offline_core missing(bare);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// Real timer threads with short probe intervals
configuration threaded_config(std::shared_ptr<scripted_probe> probe,
                              std::shared_ptr<mock_batch_pusher> pusher,
                              SharedScheduler listeners = nullptr) {
    configuration config;
    config.instance_id = "tab-A";
    config.probe = std::move(probe);
    config.pusher = std::move(pusher);
    config.sched = std::move(listeners);
    config.logging = log_level::error;
    config.monitor.probe_timeout = 50ms;
    config.monitor.reachable_interval = 50ms;
    config.monitor.failure_ladder = {50ms};
    config.monitor.max_interval = 50ms;
    config.sync.interval = std::chrono::hours(1);
    return config;
}

// ============================================================================
// test_offline_core_monitor_runs_during_push - connectivity loss mid-push
// ============================================================================

void test_offline_core_monitor_runs_during_push() {
    std::cout << "  test_offline_core_monitor_runs_during_push..." << std::flush;

    auto probe = std::make_shared<scripted_probe>(true);
    auto pusher = std::make_shared<mock_batch_pusher>();
    auto listeners = std::make_shared<std_thread_scheduler>();
    std::atomic<bool> went_offline{false};
    std::atomic<int> checks_during_push{0};
    std::atomic<bool> completed{false};
    std::atomic<bool> on_listener_thread{false};

    offline_core core(threaded_config(probe, pusher, listeners));
    core.queue().enqueue({{"amount_total", 4.5}}, "pos.order");
    core.queue().enqueue({{"amount_total", 9.0}}, "pos.order");

    pusher->before_reply = [&](size_t, const std::vector<push_item>&) {
        int before = probe->calls();
        probe->set(false);
        // The monitor has to keep checking while this push holds the sync thread
        went_offline = wait_until([&] { return !core.monitor().is_reachable(); });
        checks_during_push = probe->calls() - before;
    };

    core.sync().set_on_sync_completed([&](size_t ok, size_t failed) {
        on_listener_thread = listeners->is_on_thread();
        completed = ok == 0 && failed == 0;
    });

    core.start();
    assert(wait_until([&] { return completed.load(); }));

    assert(went_offline.load());
    assert(checks_during_push.load() >= 2);
    assert(on_listener_thread.load());
    assert(pusher->calls.size() == 1);

    // The response came back after the drop: nothing is marked
    auto last = core.sync().status().last_report;
    assert(last && last->abandoned);
    assert(last->succeeded == 0);
    assert(core.queue().pending_count() == 2);
    assert(!core.monitor().is_reachable());

    core.stop();
    assert(core.monitor().listener_count() == 0);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_offline_core_teardown_during_push
// ============================================================================

void test_offline_core_teardown_during_push() {
    std::cout << "  test_offline_core_teardown_during_push..." << std::flush;

    auto probe = std::make_shared<scripted_probe>(true);
    auto pusher = std::make_shared<mock_batch_pusher>();

    std::atomic<bool> push_started{false};
    std::atomic<bool> push_finished{false};
    pusher->before_reply = [&](size_t, const std::vector<push_item>&) {
        push_started = true;
        std::this_thread::sleep_for(300ms);
        push_finished = true;
    };

    auto core = std::make_unique<offline_core>(threaded_config(probe, pusher));
    core->queue().enqueue({{"amount_total", 4.5}}, "pos.order");
    core->start();
    assert(wait_until([&] { return push_started.load(); }));

    // Destruction waits for the cycle that is using the sync manager
    core.reset();
    assert(push_finished.load());
    assert(pusher->calls.size() == 1);

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Testing offline cache..." << std::endl;
    test_secret_hash();
    test_credentials();
    test_config_values();
    test_orders();
    test_offline_core();
    test_offline_core_monitor_runs_during_push();
    test_offline_core_teardown_during_push();
}

} // namespace offline_cache_tests
