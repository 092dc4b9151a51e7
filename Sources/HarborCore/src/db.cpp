#include "harbor/db.hpp"
#include "harbor/log.hpp"

namespace harbor {

const char* to_string(store_errc code) noexcept {
    switch (code) {
        case store_errc::aborted: return "aborted";
        case store_errc::quota_exceeded: return "quota_exceeded";
        case store_errc::constraint_violation: return "constraint_violation";
        case store_errc::not_found: return "not_found";
        case store_errc::invalid_state: return "invalid_state";
        case store_errc::io: return "io";
    }
    return "unknown";
}

store_errc errc_from_sqlite(int rc) noexcept {
    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
        case SQLITE_INTERRUPT:
        case SQLITE_ABORT:
            return store_errc::aborted;
        case SQLITE_FULL:
            return store_errc::quota_exceeded;
        case SQLITE_CONSTRAINT:
            return store_errc::constraint_violation;
        case SQLITE_NOTFOUND:
            return store_errc::not_found;
        case SQLITE_MISUSE:
        case SQLITE_READONLY:
        case SQLITE_CANTOPEN:
            return store_errc::invalid_state;
        default:
            return store_errc::io;
    }
}

database::database(const std::string& path, int busy_timeout_ms)
    : path_(path) {
    int flags = SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Failed to open database %s: %s", path.c_str(), error.c_str());
        throw store_error(errc_from_sqlite(rc), "Failed to open database: " + error, rc);
    }
    sqlite3_extended_result_codes(db_, 1);

    // Lock contention waits up to busy_timeout_ms inside SQLite before
    // surfacing SQLITE_BUSY, which the retry executor then treats as transient.
    sqlite3_busy_timeout(db_, busy_timeout_ms);

    execute("PRAGMA foreign_keys = ON");

    // WAL lets other instances read while this one writes
    if (!is_in_memory()) {
        execute("PRAGMA journal_mode = WAL");
        execute("PRAGMA synchronous = NORMAL");
    }
    execute("PRAGMA temp_store = MEMORY");

    install_rollback_hook();
}

database::~database() {
    if (db_) {
        if (!is_in_memory()) {
            sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_PASSIVE, nullptr, nullptr);
        }
        sqlite3_close(db_);
    }
}

void database::install_rollback_hook() {
    sqlite3_rollback_hook(db_, [](void* user_data) {
        auto* self = static_cast<database*>(user_data);
        if (self->rollback_listener_) self->rollback_listener_();
    }, this);
}

void database::fail(int rc, const std::string& what) const {
    std::string error = db_ ? sqlite3_errmsg(db_) : "no connection";
    auto code = errc_from_sqlite(rc);
    // Contention is expected under concurrent actors; the retry layer logs it.
    if (code == store_errc::aborted) {
        LOG_DEBUG("db", "%s: %s (rc=%d)", what.c_str(), error.c_str(), rc);
    } else {
        LOG_ERROR("db", "%s: %s (rc=%d)", what.c_str(), error.c_str(), rc);
    }
    throw store_error(code, what + ": " + error, rc);
}

void database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    if (!db_) {
        throw store_error(store_errc::invalid_state, "database is closed");
    }
    if (params.empty()) {
        // Fast path for parameterless statements
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            sqlite3_free(errmsg);
            fail(sqlite3_extended_errcode(db_), "SQL execution failed (SQL: " + sql + ")");
        }
        return;
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        fail(rc, "Failed to prepare statement (SQL: " + sql + ")");
    }

    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }

    rc = sqlite3_step(stmt);
    int ext = sqlite3_extended_errcode(db_);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        fail(ext, "Execution failed (SQL: " + sql + ")");
    }
}

int database::changes() const {
    return sqlite3_changes(db_);
}

bool database::table_exists(const std::string& name) const {
    const char* sql = "SELECT name FROM sqlite_master WHERE type='table' AND name=?";
    sqlite3_stmt* stmt = nullptr;

    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        fail(rc, "Failed to prepare table_exists statement");
    }

    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    bool exists = (sqlite3_step(stmt) == SQLITE_ROW);
    sqlite3_finalize(stmt);

    return exists;
}

void database::bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value) {
    std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            sqlite3_bind_text(stmt, index, v.c_str(), -1, SQLITE_TRANSIENT);
        } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            if (v.empty()) {
                sqlite3_bind_zeroblob(stmt, index, 0);
            } else {
                sqlite3_bind_blob(stmt, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }
    }, value);
}

column_value_t database::extract_column(sqlite3_stmt* stmt, int index) {
    int type = sqlite3_column_type(stmt, index);
    switch (type) {
        case SQLITE_INTEGER:
            return sqlite3_column_int64(stmt, index);
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            return std::string(text ? text : "");
        }
        case SQLITE_BLOB: {
            const void* data = sqlite3_column_blob(stmt, index);
            int size = sqlite3_column_bytes(stmt, index);
            const uint8_t* bytes = static_cast<const uint8_t*>(data);
            return std::vector<uint8_t>(bytes, bytes + size);
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

std::vector<database::row_t> database::query(const std::string& sql,
                                             const std::vector<column_value_t>& params) {
    if (!db_) {
        throw store_error(store_errc::invalid_state, "database is closed");
    }
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        fail(rc, "Failed to prepare query (SQL: " + sql + ")");
    }

    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }

    std::vector<row_t> results;
    int col_count = sqlite3_column_count(stmt);

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        row_t row;
        for (int i = 0; i < col_count; ++i) {
            const char* name = sqlite3_column_name(stmt, i);
            row[name] = extract_column(stmt, i);
        }
        results.push_back(std::move(row));
    }

    int ext = sqlite3_extended_errcode(db_);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        fail(ext, "Query failed (SQL: " + sql + ")");
    }

    return results;
}

void database::begin_transaction(bool exclusive) {
    const char* sql = exclusive ? "BEGIN EXCLUSIVE" : "BEGIN IMMEDIATE";
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        fail(sqlite3_extended_errcode(db_), "Failed to begin transaction");
    }
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

bool database::is_in_transaction() const {
    // sqlite3_get_autocommit returns 0 if a transaction is active, non-zero otherwise
    return db_ && sqlite3_get_autocommit(db_) == 0;
}

int32_t database::user_version() {
    auto rows = query("PRAGMA user_version");
    if (rows.empty()) return 0;
    auto it = rows[0].find("user_version");
    if (it == rows[0].end()) return 0;
    return static_cast<int32_t>(detail::as_int(it->second).value_or(0));
}

void database::set_user_version(int32_t version) {
    // PRAGMA does not accept bound parameters
    execute("PRAGMA user_version = " + std::to_string(version));
}

// ============================================================================
// transaction
// ============================================================================

transaction::transaction(database& db, bool exclusive) : db_(db) {
    db_.begin_transaction(exclusive);
    db_.set_rollback_listener([this] {
        if (!explicit_rollback_) {
            engine_rolled_back_ = true;
        }
    });
}

transaction::~transaction() {
    if (!completed_ && !engine_rolled_back_ && db_.is_in_transaction()) {
        explicit_rollback_ = true;
        try {
            db_.rollback();
        } catch (const store_error& e) {
            LOG_ERROR("db", "Rollback during unwind failed: %s", e.what());
        }
    }
    db_.set_rollback_listener(nullptr);
}

void transaction::check() const {
    if (engine_rolled_back_ || !db_.is_in_transaction()) {
        throw store_error(store_errc::aborted, "Transaction aborted by storage engine");
    }
}

void transaction::commit() {
    check();
    try {
        db_.commit();
    } catch (const store_error&) {
        // A failed COMMIT on a busy database leaves the transaction open;
        // the destructor rolls it back.
        if (engine_rolled_back_) {
            completed_ = true;
            throw store_error(store_errc::aborted, "Transaction aborted during commit");
        }
        throw;
    }
    completed_ = true;
}

void transaction::rollback() {
    explicit_rollback_ = true;
    completed_ = true;
    if (db_.is_in_transaction()) {
        db_.rollback();
    }
}

} // namespace harbor
