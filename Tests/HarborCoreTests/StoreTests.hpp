#pragma once

#include "TestSupport.hpp"
#include <cassert>
#include <iostream>

namespace store_tests {

using namespace harbor;
using namespace harbor_test;

// ============================================================================
// test_put_get_query - documents round-trip and index lookups
// ============================================================================

void test_put_get_query() {
    std::cout << "  test_put_get_query..." << std::flush;

    local_store store(store_config{});
    assert(store.schema_version() == harbor_schema().version());

    store.put(collections::order, {{"id", "Order 1"}, {"state", "draft"}, {"date_order", 200}});
    store.put(collections::order, {{"id", "Order 2"}, {"state", "paid"}, {"date_order", 100}});
    store.put(collections::order, {{"id", "Order 3"}, {"state", "draft"}, {"date_order", 50}});

    auto one = store.get(collections::order, "Order 1");
    assert(one.has_value());
    assert((*one)["state"] == "draft");
    assert(!store.get(collections::order, "Order 9").has_value());

    // Ordered by date_order, not insertion
    auto drafts = store.query(collections::order, "state", std::string("draft"));
    assert(drafts.size() == 2);
    assert(drafts[0]["id"] == "Order 3");
    assert(drafts[1]["id"] == "Order 1");

    auto limited = store.query(collections::order, "state", std::string("draft"), 1);
    assert(limited.size() == 1);

    assert(store.count(collections::order) == 3);
    assert(store.count(collections::order, "state", std::string("paid")) == 1);

    // Update keeps the key and replaces the index column
    store.put(collections::order, {{"id", "Order 1"}, {"state", "paid"}, {"date_order", 200}});
    assert(store.count(collections::order) == 3);
    assert(store.count(collections::order, "state", std::string("paid")) == 2);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_remove_and_errors - not_found, unknown collection, missing key
// ============================================================================

void test_remove_and_errors() {
    std::cout << "  test_remove_and_errors..." << std::flush;

    local_store store(store_config{});
    store.put(collections::config, {{"key", "currency"}, {"value", "EUR"}});
    store.remove(collections::config, "currency");
    assert(!store.get(collections::config, "currency").has_value());

    bool threw = false;
    try {
        store.remove(collections::config, "currency");
    } catch (const store_error& e) {
        threw = e.code() == store_errc::not_found;
    }
    assert(threw);

    threw = false;
    try {
        store.get("no_such_collection", "x");
    } catch (const store_error& e) {
        threw = e.code() == store_errc::invalid_state;
    }
    assert(threw);

    threw = false;
    try {
        store.put(collections::order, {{"state", "draft"}});
    } catch (const store_error& e) {
        threw = e.code() == store_errc::invalid_state;
    }
    assert(threw);

    threw = false;
    try {
        store.query(collections::order, "no_such_index", std::string("x"));
    } catch (const store_error& e) {
        threw = e.code() == store_errc::invalid_state;
    }
    assert(threw);

    // Second login on the unique index
    store.put(collections::user_credential, {{"user_id", "1"}, {"login", "anna"}});
    threw = false;
    try {
        store.put(collections::user_credential, {{"user_id", "2"}, {"login", "anna"}});
    } catch (const store_error& e) {
        threw = e.code() == store_errc::constraint_violation;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_write_is_atomic - a throwing write leaves nothing behind
// ============================================================================

void test_write_is_atomic() {
    std::cout << "  test_write_is_atomic..." << std::flush;

    local_store store(store_config{});

    try {
        store.write([&] {
            store.put(collections::config, {{"key", "a"}, {"value", 1}});
            store.put(collections::config, {{"key", "b"}, {"value", 2}});
            throw std::runtime_error("Simulated error");
        });
        assert(false);
    } catch (const std::runtime_error&) {
    }
    assert(store.count(collections::config) == 0);

    // bulk_put with one bad record writes none of them
    bool threw = false;
    try {
        store.bulk_put(collections::config, std::vector<json>{
            json{{"key", "a"}, {"value", 1}},
            json{{"value", 2}},
        });
    } catch (const store_error&) {
        threw = true;
    }
    assert(threw);
    assert(store.count(collections::config) == 0);

    store.write([&] {
        store.put(collections::config, {{"key", "a"}, {"value", 1}});
        store.put(collections::config, {{"key", "b"}, {"value", 2}});
    });
    assert(store.count(collections::config) == 2);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_engine_rollback_detected - a rollback nobody asked for aborts the write
// ============================================================================

void test_engine_rollback_detected() {
    std::cout << "  test_engine_rollback_detected..." << std::flush;

    local_store store(store_config{});

    bool aborted = false;
    try {
        store.write([&] {
            store.put(collections::config, {{"key", "lost"}, {"value", true}});
            // Same effect as the engine giving up on the transaction
            store.db().execute("ROLLBACK");
        });
    } catch (const store_error& e) {
        aborted = e.code() == store_errc::aborted;
    }
    assert(aborted);
    assert(!store.get(collections::config, "lost").has_value());
    assert(!store.db().is_in_transaction());

    // The store is usable afterwards
    store.put(collections::config, {{"key", "kept"}, {"value", true}});
    assert(store.get(collections::config, "kept").has_value());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_errc_mapping
// ============================================================================

void test_errc_mapping() {
    std::cout << "  test_errc_mapping..." << std::flush;

    assert(errc_from_sqlite(SQLITE_BUSY) == store_errc::aborted);
    assert(errc_from_sqlite(SQLITE_BUSY_SNAPSHOT) == store_errc::aborted);
    assert(errc_from_sqlite(SQLITE_LOCKED) == store_errc::aborted);
    assert(errc_from_sqlite(SQLITE_INTERRUPT) == store_errc::aborted);
    assert(errc_from_sqlite(SQLITE_FULL) == store_errc::quota_exceeded);
    assert(errc_from_sqlite(SQLITE_CONSTRAINT_UNIQUE) == store_errc::constraint_violation);
    assert(errc_from_sqlite(SQLITE_READONLY) == store_errc::invalid_state);
    assert(errc_from_sqlite(SQLITE_IOERR_WRITE) == store_errc::io);
    assert(errc_from_sqlite(SQLITE_CORRUPT) == store_errc::io);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_corrupt_payload - unreadable JSON surfaces as io
// ============================================================================

void test_corrupt_payload() {
    std::cout << "  test_corrupt_payload..." << std::flush;

    local_store store(store_config{});
    store.put(collections::config, {{"key", "broken"}, {"value", 1}});
    store.db().execute("UPDATE \"config\" SET payload = ? WHERE key = ?",
                       {std::string("{not json"), std::string("broken")});

    bool threw = false;
    try {
        store.get(collections::config, "broken");
    } catch (const store_error& e) {
        threw = e.code() == store_errc::io;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_schema_versioning - upgrade, reopen, newer version rejected
// ============================================================================

void test_schema_versioning() {
    std::cout << "  test_schema_versioning..." << std::flush;

    temp_dir dir("schema");
    auto path = dir.file("pos.db");

    {
        local_store store(store_config{path});
        assert(store.schema_version() == 2);
        store.put(collections::config, {{"key", "currency"}, {"value", "EUR"}});
    }

    // Reopening at the same version keeps the data
    {
        local_store store(store_config{path});
        assert(store.get(collections::config, "currency").has_value());
        assert(store.db().table_exists("transaction_overflow"));
    }

    // A store written by a newer build is refused
    {
        database raw(path);
        raw.set_user_version(99);
    }
    bool threw = false;
    try {
        local_store store(store_config{path});
    } catch (const store_error& e) {
        threw = e.code() == store_errc::invalid_state;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_failed_upgrade_applies_nothing
// ============================================================================

void test_failed_upgrade_applies_nothing() {
    std::cout << "  test_failed_upgrade_applies_nothing..." << std::flush;

    temp_dir dir("upgrade");
    auto path = dir.file("pos.db");

    schema_registry registry;
    collection_schema widget{"widget", "id", {{"size", column_type::integer}}, ""};
    registry.register_collection(widget);
    registry.add_step(1, "widgets", [widget](database& db) {
        for (const auto& sql : create_collection_sql(widget)) db.execute(sql);
    });
    registry.add_step(2, "broken step", [](database& db) {
        db.execute("CREATE TABLE gadget (id TEXT)");
        db.execute("THIS IS NOT SQL");
    });

    bool threw = false;
    try {
        local_store store(store_config{path}, registry);
    } catch (const store_error&) {
        threw = true;
    }
    assert(threw);

    database raw(path);
    assert(raw.user_version() == 0);
    assert(!raw.table_exists("widget"));
    assert(!raw.table_exists("gadget"));

    // Duplicate step versions are a programming error
    threw = false;
    try {
        registry.add_step(2, "again", [](database&) {});
    } catch (const store_error& e) {
        threw = e.code() == store_errc::invalid_state;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_remove_older_than
// ============================================================================

void test_remove_older_than() {
    std::cout << "  test_remove_older_than..." << std::flush;

    local_store store(store_config{});
    store.put(collections::order, {{"id", "a"}, {"state", "paid"}, {"date_order", 10}});
    store.put(collections::order, {{"id", "b"}, {"state", "draft"}, {"date_order", 10}});
    store.put(collections::order, {{"id", "c"}, {"state", "paid"}, {"date_order", 500}});

    auto removed = store.remove_older_than(collections::order, "date_order", 100,
                                           std::string("state"), std::string("paid"));
    assert(removed == 1);
    assert(!store.get(collections::order, "a").has_value());
    assert(store.get(collections::order, "b").has_value());
    assert(store.get(collections::order, "c").has_value());

    assert(store.remove_older_than(collections::order, "date_order", 100) == 1);
    assert(store.count(collections::order) == 1);

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Testing local store..." << std::endl;
    test_put_get_query();
    test_remove_and_errors();
    test_write_is_atomic();
    test_engine_rollback_detected();
    test_errc_mapping();
    test_corrupt_payload();
    test_schema_versioning();
    test_failed_upgrade_applies_nothing();
    test_remove_older_than();
}

} // namespace store_tests
