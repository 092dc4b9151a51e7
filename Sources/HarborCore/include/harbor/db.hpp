#pragma once

#include "types.hpp"
#include <sqlite3.h>
#include <functional>
#include <stdexcept>
#include <unordered_map>

namespace harbor {

/// Storage failure kinds. The retry executor keys its transient/permanent
/// decision on this value, so every SQLite result code maps to exactly one.
enum class store_errc {
    aborted,               ///< engine rolled the transaction back (contention, interrupt)
    quota_exceeded,        ///< disk or page quota exhausted
    constraint_violation,  ///< UNIQUE / NOT NULL / CHECK failure
    not_found,             ///< key addressed by a mutator does not exist
    invalid_state,         ///< misuse, read-only file, schema newer than code
    io                     ///< anything else the engine reports
};

const char* to_string(store_errc code) noexcept;

/// Maps a (possibly extended) SQLite result code to a store_errc.
store_errc errc_from_sqlite(int rc) noexcept;

class store_error : public std::runtime_error {
public:
    store_error(store_errc code, const std::string& msg, int sqlite_code = 0)
        : std::runtime_error(msg), code_(code), sqlite_code_(sqlite_code) {}

    store_errc code() const noexcept { return code_; }
    int sqlite_code() const noexcept { return sqlite_code_; }

private:
    store_errc code_;
    int sqlite_code_;
};

class database {
public:
    explicit database(const std::string& path, int busy_timeout_ms = 5000);
    ~database();

    // Non-copyable
    database(const database&) = delete;
    database& operator=(const database&) = delete;

    bool table_exists(const std::string& name) const;

    // Query - returns rows as vector of column maps
    using row_t = std::unordered_map<std::string, column_value_t>;
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    // Execute SQL with optional params (for INSERT/UPDATE/DELETE without return)
    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    /// Rows touched by the last INSERT/UPDATE/DELETE on this connection.
    int changes() const;

    // Transaction support
    // IMMEDIATE takes the write lock up front so contention surfaces at BEGIN.
    // EXCLUSIVE additionally blocks readers; used for schema upgrades.
    void begin_transaction(bool exclusive = false);
    void commit();
    void rollback();
    bool is_in_transaction() const;

    // PRAGMA user_version
    int32_t user_version();
    void set_user_version(int32_t version);

    /// Called from sqlite3_rollback_hook for every rollback on this connection,
    /// whether requested by the application or performed by the engine.
    void set_rollback_listener(std::function<void()> listener) { rollback_listener_ = std::move(listener); }

    const std::string& path() const { return path_; }
    bool is_in_memory() const { return path_.empty() || path_ == ":memory:"; }

    void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value);

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    std::function<void()> rollback_listener_;

    column_value_t extract_column(sqlite3_stmt* stmt, int index);
    [[noreturn]] void fail(int rc, const std::string& what) const;
    void install_rollback_hook();
};

// RAII transaction guard.
//
// Registers itself as the connection's rollback listener so that a rollback
// the application did not ask for (SQLITE_FULL, SQLITE_IOERR, busy commit...)
// is reported as store_errc::aborted through check() and commit().
class transaction {
public:
    explicit transaction(database& db, bool exclusive = false);
    ~transaction();

    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    /// Throws store_errc::aborted if the engine rolled the transaction back.
    void check() const;

    void commit();
    void rollback();

private:
    database& db_;
    bool completed_ = false;
    bool explicit_rollback_ = false;
    bool engine_rolled_back_ = false;
};

} // namespace harbor
