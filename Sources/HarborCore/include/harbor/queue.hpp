#pragma once

#include "store.hpp"
#include "retry.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace harbor {

enum class transaction_status {
    pending,
    syncing,    // reserved; in-flight state is tracked by sync_manager in memory
    synced,
    failed
};

const char* to_string(transaction_status status) noexcept;
std::optional<transaction_status> parse_transaction_status(const std::string& s) noexcept;

// A locally originated write waiting for remote confirmation
struct offline_transaction {
    std::string id;
    std::string idempotency_key;
    std::string kind;
    json payload;
    transaction_status status = transaction_status::pending;
    int attempts = 0;
    timestamp_t created_at{};
    std::optional<timestamp_t> synced_at;
    std::optional<std::string> last_error;

    json to_json() const;
    static offline_transaction from_json(const json& j);
};

// An item moved out of the queue by the archive-oldest policy
struct overflow_entry {
    offline_transaction transaction;
    timestamp_t archived_at{};
    std::string reason;

    json to_json() const;
    static overflow_entry from_json(const json& j);
};

enum class overflow_policy {
    reject_new,      // throw queue_full_error, the caller decides
    archive_oldest   // move the oldest outstanding item to transaction_overflow
};

struct queue_config {
    size_t capacity = 5000;     // outstanding items (anything not yet synced)
    overflow_policy overflow = overflow_policy::reject_new;
};

/// Backpressure: the queue is at capacity and the policy is reject_new.
class queue_full_error : public std::runtime_error {
public:
    explicit queue_full_error(size_t capacity)
        : std::runtime_error("Transaction queue is full (capacity " + std::to_string(capacity) + ")")
        , capacity_(capacity) {}

    size_t capacity() const noexcept { return capacity_; }

private:
    size_t capacity_;
};

// ============================================================================
// transaction_queue - bounded FIFO of offline transactions
// ============================================================================

class transaction_queue {
public:
    transaction_queue(local_store& store,
                      queue_config config = {},
                      retry_policy retry = {},
                      clock_fn clock = system_now);

    /// Appends a pending transaction with a fresh id and idempotency key.
    /// The capacity check and the write share one store transaction.
    offline_transaction enqueue(const json& payload, const std::string& kind = "");

    /// Up to max_size pending items, oldest first.
    std::vector<offline_transaction> dequeue_batch(size_t max_size);

    void mark_synced(const std::string& id);
    void mark_failed(const std::string& id, const std::string& error);

    /// Returns the new attempt count.
    int increment_attempt(const std::string& id);

    std::optional<offline_transaction> get(const std::string& id);

    /// failed -> pending for every failed item. Returns how many moved.
    size_t retry_failed();

    /// Assigns a key to a record that has none. An existing key is returned unchanged.
    std::string ensure_idempotency_key(const std::string& id);

    /// Deletes synced items created before cutoff.
    size_t remove_synced_before(timestamp_t cutoff);

    size_t pending_count();
    size_t outstanding_count();
    size_t overflow_count();
    std::vector<overflow_entry> overflow_entries();

    const queue_config& config() const { return config_; }

private:
    offline_transaction require(const std::string& id);
    void archive_oldest_outstanding();
    size_t count_outstanding();

    local_store& store_;
    queue_config config_;
    retry_policy retry_;
    clock_fn clock_;
};

} // namespace harbor
