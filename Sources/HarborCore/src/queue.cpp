#include "harbor/queue.hpp"
#include "harbor/log.hpp"

namespace harbor {

const char* to_string(transaction_status status) noexcept {
    switch (status) {
        case transaction_status::pending: return "pending";
        case transaction_status::syncing: return "syncing";
        case transaction_status::synced: return "synced";
        case transaction_status::failed: return "failed";
    }
    return "pending";
}

std::optional<transaction_status> parse_transaction_status(const std::string& s) noexcept {
    if (s == "pending") return transaction_status::pending;
    if (s == "syncing") return transaction_status::syncing;
    if (s == "synced") return transaction_status::synced;
    if (s == "failed") return transaction_status::failed;
    return std::nullopt;
}

json offline_transaction::to_json() const {
    json j;
    j["id"] = id;
    j["idempotency_key"] = idempotency_key.empty() ? json(nullptr) : json(idempotency_key);
    j["kind"] = kind;
    j["payload"] = payload;
    j["status"] = to_string(status);
    j["attempts"] = attempts;
    j["created_at"] = to_millis(created_at);
    j["synced_at"] = synced_at ? json(to_millis(*synced_at)) : json(nullptr);
    j["last_error"] = last_error ? json(*last_error) : json(nullptr);
    return j;
}

offline_transaction offline_transaction::from_json(const json& j) {
    offline_transaction t;
    t.id = j.value("id", "");
    if (j.contains("idempotency_key") && j["idempotency_key"].is_string()) {
        t.idempotency_key = j["idempotency_key"].get<std::string>();
    }
    t.kind = j.value("kind", "");
    t.payload = j.value("payload", json(nullptr));
    // Unknown status strings read back as pending so the item is retried, not lost
    t.status = parse_transaction_status(j.value("status", "pending")).value_or(transaction_status::pending);
    t.attempts = j.value("attempts", 0);
    t.created_at = from_millis(j.value("created_at", int64_t{0}));
    if (j.contains("synced_at") && j["synced_at"].is_number()) {
        t.synced_at = from_millis(j["synced_at"].get<int64_t>());
    }
    if (j.contains("last_error") && j["last_error"].is_string()) {
        t.last_error = j["last_error"].get<std::string>();
    }
    return t;
}

json overflow_entry::to_json() const {
    return {
        {"id", transaction.id},
        {"archived_at", to_millis(archived_at)},
        {"reason", reason},
        {"transaction", transaction.to_json()},
    };
}

overflow_entry overflow_entry::from_json(const json& j) {
    overflow_entry e;
    e.transaction = offline_transaction::from_json(j.value("transaction", json::object()));
    e.archived_at = from_millis(j.value("archived_at", int64_t{0}));
    e.reason = j.value("reason", "");
    return e;
}

// ============================================================================
// transaction_queue
// ============================================================================

transaction_queue::transaction_queue(local_store& store, queue_config config, retry_policy retry, clock_fn clock)
    : store_(store)
    , config_(config)
    , retry_(std::move(retry))
    , clock_(std::move(clock)) {}

offline_transaction transaction_queue::require(const std::string& id) {
    auto record = store_.get(collections::offline_transaction, id);
    if (!record) {
        throw store_error(store_errc::not_found, "No offline transaction " + id);
    }
    return offline_transaction::from_json(*record);
}

void transaction_queue::archive_oldest_outstanding() {
    auto oldest_pending = store_.query(collections::offline_transaction, "status",
                                       std::string(to_string(transaction_status::pending)), 1);
    auto oldest_failed = store_.query(collections::offline_transaction, "status",
                                      std::string(to_string(transaction_status::failed)), 1);

    const json* victim = nullptr;
    if (!oldest_pending.empty()) victim = &oldest_pending.front();
    if (!oldest_failed.empty() &&
        (!victim || oldest_failed.front().value("created_at", int64_t{0}) < victim->value("created_at", int64_t{0}))) {
        victim = &oldest_failed.front();
    }
    if (!victim) {
        throw queue_full_error(config_.capacity);
    }

    overflow_entry entry;
    entry.transaction = offline_transaction::from_json(*victim);
    entry.archived_at = clock_();
    entry.reason = "capacity";

    store_.put(collections::transaction_overflow, entry.to_json());
    store_.remove(collections::offline_transaction, entry.transaction.id);
    LOG_WARN("queue", "Queue at capacity %zu, archived oldest transaction %s to overflow log",
             config_.capacity, entry.transaction.id.c_str());
}

offline_transaction transaction_queue::enqueue(const json& payload, const std::string& kind) {
    return execute_with_retry([&] {
        return store_.write([&] {
            size_t outstanding = count_outstanding();

            if (outstanding >= config_.capacity) {
                if (config_.overflow == overflow_policy::reject_new) {
                    LOG_WARN("queue", "Rejecting enqueue: %zu outstanding, capacity %zu",
                             outstanding, config_.capacity);
                    throw queue_full_error(config_.capacity);
                }
                archive_oldest_outstanding();
            }

            offline_transaction t;
            t.id = uuid_t::generate().to_string();
            t.idempotency_key = uuid_t::generate().to_string();
            t.kind = kind;
            t.payload = payload;
            t.status = transaction_status::pending;
            t.attempts = 0;
            t.created_at = clock_();

            store_.put(collections::offline_transaction, t.to_json());
            LOG_DEBUG("queue", "Enqueued %s (key %s)", t.id.c_str(), t.idempotency_key.c_str());
            return t;
        });
    }, "queue.enqueue", retry_);
}

std::vector<offline_transaction> transaction_queue::dequeue_batch(size_t max_size) {
    if (max_size == 0) return {};
    return execute_with_retry([&] {
        auto records = store_.query(collections::offline_transaction, "status",
                                    std::string(to_string(transaction_status::pending)), max_size);
        std::vector<offline_transaction> batch;
        batch.reserve(records.size());
        for (const auto& r : records) {
            batch.push_back(offline_transaction::from_json(r));
        }
        return batch;
    }, "queue.dequeue_batch", retry_);
}

void transaction_queue::mark_synced(const std::string& id) {
    execute_with_retry([&] {
        store_.write([&] {
            auto t = require(id);
            if (t.status == transaction_status::synced) return;
            t.status = transaction_status::synced;
            t.synced_at = clock_();
            t.last_error.reset();
            store_.put(collections::offline_transaction, t.to_json());
        });
    }, "queue.mark_synced", retry_);
}

void transaction_queue::mark_failed(const std::string& id, const std::string& error) {
    execute_with_retry([&] {
        store_.write([&] {
            auto t = require(id);
            if (t.status == transaction_status::synced) {
                throw store_error(store_errc::invalid_state, "Transaction " + id + " is already synced");
            }
            t.status = transaction_status::failed;
            t.last_error = error;
            store_.put(collections::offline_transaction, t.to_json());
        });
    }, "queue.mark_failed", retry_);
}

int transaction_queue::increment_attempt(const std::string& id) {
    return execute_with_retry([&] {
        return store_.write([&] {
            auto t = require(id);
            ++t.attempts;
            store_.put(collections::offline_transaction, t.to_json());
            return t.attempts;
        });
    }, "queue.increment_attempt", retry_);
}

std::optional<offline_transaction> transaction_queue::get(const std::string& id) {
    return execute_with_retry([&]() -> std::optional<offline_transaction> {
        auto record = store_.get(collections::offline_transaction, id);
        if (!record) return std::nullopt;
        return offline_transaction::from_json(*record);
    }, "queue.get", retry_);
}

size_t transaction_queue::retry_failed() {
    size_t moved = execute_with_retry([&] {
        return store_.write([&] {
            auto failed = store_.query(collections::offline_transaction, "status",
                                       std::string(to_string(transaction_status::failed)));
            for (const auto& record : failed) {
                auto t = offline_transaction::from_json(record);
                t.status = transaction_status::pending;
                store_.put(collections::offline_transaction, t.to_json());
            }
            return failed.size();
        });
    }, "queue.retry_failed", retry_);
    if (moved > 0) {
        LOG_INFO("queue", "Re-queued %zu failed transactions", moved);
    }
    return moved;
}

std::string transaction_queue::ensure_idempotency_key(const std::string& id) {
    return execute_with_retry([&] {
        return store_.write([&] {
            auto t = require(id);
            if (!t.idempotency_key.empty()) return t.idempotency_key;
            t.idempotency_key = uuid_t::generate().to_string();
            store_.put(collections::offline_transaction, t.to_json());
            LOG_INFO("queue", "Assigned idempotency key to legacy transaction %s", id.c_str());
            return t.idempotency_key;
        });
    }, "queue.ensure_idempotency_key", retry_);
}

size_t transaction_queue::remove_synced_before(timestamp_t cutoff) {
    return execute_with_retry([&] {
        return store_.remove_older_than(collections::offline_transaction, "created_at", to_millis(cutoff),
                                        std::string("status"),
                                        std::string(to_string(transaction_status::synced)));
    }, "queue.remove_synced_before", retry_);
}

size_t transaction_queue::pending_count() {
    return execute_with_retry([&] {
        return store_.count(collections::offline_transaction, "status",
                            std::string(to_string(transaction_status::pending)));
    }, "queue.pending_count", retry_);
}

size_t transaction_queue::count_outstanding() {
    return store_.count(collections::offline_transaction) -
        store_.count(collections::offline_transaction, "status",
                     std::string(to_string(transaction_status::synced)));
}

size_t transaction_queue::outstanding_count() {
    return execute_with_retry([&] {
        return store_.write([&] { return count_outstanding(); });
    }, "queue.outstanding_count", retry_);
}

size_t transaction_queue::overflow_count() {
    return execute_with_retry([&] {
        return store_.count(collections::transaction_overflow);
    }, "queue.overflow_count", retry_);
}

std::vector<overflow_entry> transaction_queue::overflow_entries() {
    return execute_with_retry([&] {
        std::vector<overflow_entry> entries;
        for (const auto& r : store_.all(collections::transaction_overflow)) {
            entries.push_back(overflow_entry::from_json(r));
        }
        return entries;
    }, "queue.overflow_entries", retry_);
}

} // namespace harbor
