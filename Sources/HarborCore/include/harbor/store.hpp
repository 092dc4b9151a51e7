#pragma once

#include "db.hpp"
#include "schema.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace harbor {

using json = nlohmann::json;

struct store_config {
    std::string path = ":memory:";
    int busy_timeout_ms = 5000;
};

// ============================================================================
// local_store - schema-versioned document collections over SQLite
// ============================================================================
//
// Every record is a JSON object. Its primary key is read from the
// collection's key_field, and each declared index column is extracted from
// the top-level field of the same name on every write.
//
// Each public call runs inside one BEGIN IMMEDIATE transaction. Calls made
// from inside write() join the enclosing transaction instead.
//
// Errors are store_error; callers that want transient failures retried wrap
// calls in execute_with_retry().

class local_store {
public:
    explicit local_store(const store_config& config,
                         const schema_registry& schema = harbor_schema());

    local_store(const local_store&) = delete;
    local_store& operator=(const local_store&) = delete;

    std::optional<json> get(const std::string& collection, const std::string& key);

    /// Insert or update. An update keeps the record's insertion sequence.
    void put(const std::string& collection, const json& record);

    /// Throws store_errc::not_found when no record has this key.
    void remove(const std::string& collection, const std::string& key);

    /// Records whose index column equals value, ordered by the collection's
    /// order column and then insertion sequence.
    std::vector<json> query(const std::string& collection,
                            const std::string& index,
                            const column_value_t& value,
                            std::optional<size_t> limit = std::nullopt);

    void bulk_put(const std::string& collection, const std::vector<json>& records);

    std::vector<json> all(const std::string& collection);

    size_t count(const std::string& collection);
    size_t count(const std::string& collection, const std::string& index, const column_value_t& value);

    /// Deletes records whose time_index is older than cutoff (epoch millis).
    /// When filter_index is given, only records where it equals filter_value.
    size_t remove_older_than(const std::string& collection,
                             const std::string& time_index,
                             int64_t cutoff,
                             const std::optional<std::string>& filter_index = std::nullopt,
                             const column_value_t& filter_value = nullptr);

    /// Runs fn inside one transaction. Every store call fn makes joins it,
    /// so either all of them commit or none does.
    template<typename Fn>
    auto write(Fn&& fn) -> decltype(fn()) {
        return atomically(std::forward<Fn>(fn));
    }

    int32_t schema_version();
    const schema_registry& schema() const { return schema_; }
    database& db() { return *db_; }
    const std::string& path() const { return db_->path(); }

private:
    template<typename Fn>
    auto atomically(Fn&& fn) -> decltype(fn()) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (depth_ > 0) {
            return fn();
        }
        transaction tx(*db_);
        depth_guard guard(depth_);
        if constexpr (std::is_void_v<decltype(fn())>) {
            fn();
            tx.check();
            tx.commit();
        } else {
            auto result = fn();
            tx.check();
            tx.commit();
            return result;
        }
    }

    struct depth_guard {
        explicit depth_guard(int& d) : depth(d) { ++depth; }
        ~depth_guard() { --depth; }
        int& depth;
    };

    const collection_schema& require(const std::string& collection) const;
    const index_descriptor& require_index(const collection_schema& schema, const std::string& index) const;
    std::string order_clause(const collection_schema& schema) const;
    void put_unlocked(const collection_schema& schema, const json& record);
    std::vector<json> decode_rows(const std::vector<database::row_t>& rows) const;

    std::unique_ptr<database> db_;
    schema_registry schema_;
    std::recursive_mutex mutex_;
    int depth_ = 0;
};

/// Extracts a document key as text (string keys as-is, integer keys printed).
std::optional<std::string> record_key(const json& record, const std::string& key_field);

/// Converts a document field into the SQL value stored in an index column.
column_value_t index_value(const json& record, const index_descriptor& index);

} // namespace harbor
