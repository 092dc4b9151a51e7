#pragma once

#include "TestSupport.hpp"
#include <cassert>
#include <iostream>
#include <set>

namespace queue_tests {

using namespace harbor;
using namespace harbor_test;

// ============================================================================
// test_enqueue_fifo - oldest first, fresh ids and keys
// ============================================================================

void test_enqueue_fifo() {
    std::cout << "  test_enqueue_fifo..." << std::flush;

    test_clock clock;
    local_store store(store_config{});
    transaction_queue queue(store, {}, recording_retry(), clock.fn());

    std::vector<std::string> ids;
    std::set<std::string> keys;
    for (int i = 0; i < 5; ++i) {
        auto t = queue.enqueue({{"order", i}}, "pos.order");
        assert(t.status == transaction_status::pending);
        assert(t.attempts == 0);
        assert(!t.idempotency_key.empty());
        ids.push_back(t.id);
        keys.insert(t.idempotency_key);
        // Items 3 and 4 share a timestamp; insertion order breaks the tie
        if (i < 3) clock.advance(1s);
    }
    assert(keys.size() == 5);
    assert(queue.pending_count() == 5);

    auto batch = queue.dequeue_batch(3);
    assert(batch.size() == 3);
    for (size_t i = 0; i < batch.size(); ++i) {
        assert(batch[i].id == ids[i]);
        assert(batch[i].payload["order"] == static_cast<int>(i));
        assert(batch[i].kind == "pos.order");
    }

    // Dequeue does not remove anything
    auto all = queue.dequeue_batch(10);
    assert(all.size() == 5);
    assert(all[3].id == ids[3]);
    assert(all[4].id == ids[4]);
    assert(queue.dequeue_batch(0).empty());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_status_transitions
// ============================================================================

void test_status_transitions() {
    std::cout << "  test_status_transitions..." << std::flush;

    test_clock clock;
    local_store store(store_config{});
    transaction_queue queue(store, {}, recording_retry(), clock.fn());

    auto a = queue.enqueue({{"n", 1}});
    auto b = queue.enqueue({{"n", 2}});

    assert(queue.increment_attempt(a.id) == 1);
    assert(queue.increment_attempt(a.id) == 2);

    queue.mark_synced(a.id);
    auto synced = queue.get(a.id);
    assert(synced && synced->status == transaction_status::synced);
    assert(synced->synced_at.has_value());
    assert(synced->attempts == 2);

    // Idempotent
    queue.mark_synced(a.id);

    bool threw = false;
    try {
        queue.mark_failed(a.id, "too late");
    } catch (const store_error& e) {
        threw = e.code() == store_errc::invalid_state;
    }
    assert(threw);

    queue.mark_failed(b.id, "validation: missing partner");
    auto failed = queue.get(b.id);
    assert(failed->status == transaction_status::failed);
    assert(failed->last_error == std::string("validation: missing partner"));
    assert(queue.pending_count() == 0);
    assert(queue.outstanding_count() == 1);

    assert(queue.retry_failed() == 1);
    assert(queue.pending_count() == 1);

    threw = false;
    try {
        queue.mark_synced("does-not-exist");
    } catch (const store_error& e) {
        threw = e.code() == store_errc::not_found;
    }
    assert(threw);
    assert(!queue.get("does-not-exist").has_value());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_overflow_reject_new
// ============================================================================

void test_overflow_reject_new() {
    std::cout << "  test_overflow_reject_new..." << std::flush;

    local_store store(store_config{});
    queue_config config;
    config.capacity = 3;
    transaction_queue queue(store, config, recording_retry());

    auto first = queue.enqueue({{"n", 1}});
    queue.enqueue({{"n", 2}});
    queue.enqueue({{"n", 3}});

    bool full = false;
    try {
        queue.enqueue({{"n", 4}});
    } catch (const queue_full_error& e) {
        full = e.capacity() == 3;
    }
    assert(full);
    assert(queue.pending_count() == 3);
    assert(queue.outstanding_count() == 3);
    assert(queue.overflow_count() == 0);

    // Synced items do not count against capacity
    queue.mark_synced(first.id);
    assert(queue.outstanding_count() == 2);
    queue.enqueue({{"n", 4}});
    assert(queue.pending_count() == 3);
    assert(queue.outstanding_count() == 3);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_overflow_archive_oldest
// ============================================================================

void test_overflow_archive_oldest() {
    std::cout << "  test_overflow_archive_oldest..." << std::flush;

    test_clock clock;
    local_store store(store_config{});
    queue_config config;
    config.capacity = 2;
    config.overflow = overflow_policy::archive_oldest;
    transaction_queue queue(store, config, recording_retry(), clock.fn());

    auto a = queue.enqueue({{"n", 1}});
    clock.advance(1s);
    auto b = queue.enqueue({{"n", 2}});
    clock.advance(1s);
    auto c = queue.enqueue({{"n", 3}});

    assert(queue.pending_count() == 2);
    assert(queue.outstanding_count() == 2);
    assert(queue.overflow_count() == 1);
    assert(!queue.get(a.id).has_value());

    auto entries = queue.overflow_entries();
    assert(entries.size() == 1);
    assert(entries[0].transaction.id == a.id);
    assert(entries[0].transaction.idempotency_key == a.idempotency_key);
    assert(entries[0].reason == "capacity");
    assert(entries[0].archived_at == clock.now());

    auto batch = queue.dequeue_batch(10);
    assert(batch.size() == 2);
    assert(batch[0].id == b.id);
    assert(batch[1].id == c.id);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_legacy_record_gets_key
// ============================================================================

void test_legacy_record_gets_key() {
    std::cout << "  test_legacy_record_gets_key..." << std::flush;

    local_store store(store_config{});
    transaction_queue queue(store, {}, recording_retry());

    // Written by an older build that had no idempotency keys
    store.put(collections::offline_transaction, {
        {"id", "legacy-1"}, {"kind", "pos.order"}, {"payload", {{"n", 1}}},
        {"status", "pending"}, {"attempts", 0}, {"created_at", 1},
    });
    store.put(collections::offline_transaction, {
        {"id", "legacy-2"}, {"kind", "pos.order"}, {"payload", {{"n", 2}}},
        {"status", "pending"}, {"attempts", 0}, {"created_at", 2},
    });

    auto batch = queue.dequeue_batch(10);
    assert(batch.size() == 2);
    assert(batch[0].idempotency_key.empty());

    auto key = queue.ensure_idempotency_key("legacy-1");
    assert(!key.empty());
    assert(queue.ensure_idempotency_key("legacy-1") == key);
    assert(queue.get("legacy-1")->idempotency_key == key);
    assert(queue.ensure_idempotency_key("legacy-2") != key);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_remove_synced_before
// ============================================================================

void test_remove_synced_before() {
    std::cout << "  test_remove_synced_before..." << std::flush;

    test_clock clock;
    local_store store(store_config{});
    transaction_queue queue(store, {}, recording_retry(), clock.fn());

    auto old_synced = queue.enqueue({{"n", 1}});
    auto old_pending = queue.enqueue({{"n", 2}});
    queue.mark_synced(old_synced.id);
    clock.advance(std::chrono::hours(24 * 31));
    auto fresh = queue.enqueue({{"n", 3}});
    queue.mark_synced(fresh.id);

    auto removed = queue.remove_synced_before(clock.now() - std::chrono::hours(24 * 30));
    assert(removed == 1);
    assert(!queue.get(old_synced.id).has_value());
    assert(queue.get(old_pending.id).has_value());
    assert(queue.get(fresh.id).has_value());

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Testing transaction queue..." << std::endl;
    test_enqueue_fifo();
    test_status_transitions();
    test_overflow_reject_new();
    test_overflow_archive_oldest();
    test_legacy_record_gets_key();
    test_remove_synced_before();
}

} // namespace queue_tests
