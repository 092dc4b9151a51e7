#pragma once

#include "TestSupport.hpp"
#include <cassert>
#include <iostream>

namespace retry_tests {

using namespace harbor;
using namespace harbor_test;

// ============================================================================
// test_classify - transient vs permanent
// ============================================================================

void test_classify() {
    std::cout << "  test_classify..." << std::flush;

    static_assert(classify(store_errc::aborted) == error_class::transient);
    static_assert(classify(store_errc::quota_exceeded) == error_class::transient);
    assert(classify(store_errc::constraint_violation) == error_class::permanent);
    assert(classify(store_errc::not_found) == error_class::permanent);
    assert(classify(store_errc::invalid_state) == error_class::permanent);
    assert(classify(store_errc::io) == error_class::permanent);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_backoff_schedule - 6 attempts with waits 100/200/500/1000/2000 ms
// ============================================================================

void test_backoff_schedule() {
    std::cout << "  test_backoff_schedule..." << std::flush;

    auto waits = std::make_shared<std::vector<std::chrono::milliseconds>>();
    int attempts = 0;

    bool exhausted = false;
    try {
        execute_with_retry([&] {
            ++attempts;
            throw store_error(store_errc::aborted, "database is locked", SQLITE_BUSY);
        }, "test.always_busy", recording_retry(waits));
    } catch (const retry_exhausted& e) {
        exhausted = true;
        assert(e.attempts() == 6);
        assert(e.code() == store_errc::aborted);
        assert(std::string(e.what()).find("test.always_busy") != std::string::npos);
    }
    assert(exhausted);
    assert(attempts == 6);

    std::vector<std::chrono::milliseconds> expected = {100ms, 200ms, 500ms, 1000ms, 2000ms};
    assert(*waits == expected);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_transient_then_success
// ============================================================================

void test_transient_then_success() {
    std::cout << "  test_transient_then_success..." << std::flush;

    auto waits = std::make_shared<std::vector<std::chrono::milliseconds>>();
    int attempts = 0;
    int value = execute_with_retry([&] {
        if (++attempts < 3) {
            throw store_error(store_errc::quota_exceeded, "disk full");
        }
        return 42;
    }, "test.flaky", recording_retry(waits));

    assert(value == 42);
    assert(attempts == 3);
    assert(waits->size() == 2);
    assert((*waits)[0] == 100ms);
    assert((*waits)[1] == 200ms);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_permanent_fails_once
// ============================================================================

void test_permanent_fails_once() {
    std::cout << "  test_permanent_fails_once..." << std::flush;

    auto waits = std::make_shared<std::vector<std::chrono::milliseconds>>();
    int attempts = 0;
    bool threw = false;
    try {
        execute_with_retry([&] {
            ++attempts;
            throw store_error(store_errc::constraint_violation, "UNIQUE constraint failed");
        }, "test.constraint", recording_retry(waits));
    } catch (const retry_exhausted&) {
        assert(false);
    } catch (const store_error& e) {
        threw = e.code() == store_errc::constraint_violation;
    }
    assert(threw);
    assert(attempts == 1);
    assert(waits->empty());

    // Anything that is not a store_error is not retried either
    attempts = 0;
    threw = false;
    try {
        execute_with_retry([&] {
            ++attempts;
            throw std::logic_error("bug");
        }, "test.logic", recording_retry(waits));
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);
    assert(attempts == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_nested_exhaustion_not_multiplied
// ============================================================================

void test_nested_exhaustion_not_multiplied() {
    std::cout << "  test_nested_exhaustion_not_multiplied..." << std::flush;

    int inner_attempts = 0;
    int outer_attempts = 0;
    auto policy = recording_retry();
    bool exhausted = false;
    try {
        execute_with_retry([&] {
            ++outer_attempts;
            execute_with_retry([&] {
                ++inner_attempts;
                throw store_error(store_errc::aborted, "busy");
            }, "test.inner", policy);
        }, "test.outer", policy);
    } catch (const retry_exhausted& e) {
        exhausted = true;
        assert(e.attempts() == 6);
    }
    assert(exhausted);
    assert(outer_attempts == 1);
    assert(inner_attempts == 6);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_real_backoff_timing - default sleeper waits ~3.8 s before giving up
// ============================================================================

void test_real_backoff_timing() {
    std::cout << "  test_real_backoff_timing..." << std::flush;

    auto start = std::chrono::steady_clock::now();
    bool exhausted = false;
    try {
        execute_with_retry([] {
            throw store_error(store_errc::aborted, "busy");
        }, "test.timed");
    } catch (const retry_exhausted&) {
        exhausted = true;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    assert(exhausted);
    assert(elapsed >= 3800ms);
    assert(elapsed < 8000ms);

    std::cout << " OK (" << elapsed.count() << " ms)" << std::endl;
}

// ============================================================================
// test_real_lock_contention - SQLITE_BUSY from a second connection is retried
// ============================================================================

void test_real_lock_contention() {
    std::cout << "  test_real_lock_contention..." << std::flush;

    temp_dir dir("busy");
    auto path = dir.file("pos.db");

    store_config config;
    config.path = path;
    config.busy_timeout_ms = 0;   // surface SQLITE_BUSY at once
    local_store store(config);

    // Another actor holds the write lock
    database holder(path, 0);
    holder.begin_transaction();
    holder.execute("INSERT INTO \"config\" (key, payload) VALUES ('holder', '{\"key\":\"holder\"}')");

    // Without retry the write fails as aborted
    bool aborted = false;
    try {
        store.put(collections::config, {{"key", "mine"}, {"value", 1}});
    } catch (const store_error& e) {
        aborted = e.code() == store_errc::aborted;
    }
    assert(aborted);

    // With retry, the holder commits during the first back-off
    int sleeps = 0;
    retry_policy policy;
    policy.sleep = [&](std::chrono::milliseconds d) {
        assert(d == 100ms);
        ++sleeps;
        holder.commit();
    };
    execute_with_retry([&] {
        store.put(collections::config, {{"key", "mine"}, {"value", 1}});
    }, "test.contended_put", policy);

    assert(sleeps == 1);
    assert(store.get(collections::config, "mine").has_value());
    assert(store.get(collections::config, "holder").has_value());

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Testing resilient operation executor..." << std::endl;
    test_classify();
    test_backoff_schedule();
    test_transient_then_success();
    test_permanent_fails_once();
    test_nested_exhaustion_not_multiplied();
    test_real_lock_contention();
    test_real_backoff_timing();
}

} // namespace retry_tests
