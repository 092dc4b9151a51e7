#include "harbor/store.hpp"
#include "harbor/log.hpp"

namespace harbor {

std::optional<std::string> record_key(const json& record, const std::string& key_field) {
    if (!record.is_object()) return std::nullopt;
    auto it = record.find(key_field);
    if (it == record.end()) return std::nullopt;
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number_integer()) return std::to_string(it->get<int64_t>());
    return std::nullopt;
}

column_value_t index_value(const json& record, const index_descriptor& index) {
    auto it = record.find(index.name);
    if (it == record.end() || it->is_null()) return nullptr;

    switch (index.type) {
        case column_type::integer:
            if (it->is_boolean()) return static_cast<int64_t>(it->get<bool>() ? 1 : 0);
            if (it->is_number()) return it->get<int64_t>();
            return nullptr;
        case column_type::real:
            if (it->is_number()) return it->get<double>();
            return nullptr;
        case column_type::text:
            if (it->is_string()) return it->get<std::string>();
            if (it->is_number_integer()) return std::to_string(it->get<int64_t>());
            return it->dump();
        case column_type::blob:
            return nullptr;
    }
    return nullptr;
}

local_store::local_store(const store_config& config, const schema_registry& schema)
    : db_(std::make_unique<database>(config.path, config.busy_timeout_ms))
    , schema_(schema) {
    migrate(*db_, schema_);
    LOG_DEBUG("store", "Opened store %s at schema version %d", config.path.c_str(), schema_.version());
}

const collection_schema& local_store::require(const std::string& collection) const {
    auto* schema = schema_.get(collection);
    if (!schema) {
        throw store_error(store_errc::invalid_state, "Unknown collection: " + collection);
    }
    return *schema;
}

const index_descriptor& local_store::require_index(const collection_schema& schema,
                                                   const std::string& index) const {
    auto* idx = schema.find_index(index);
    if (!idx) {
        throw store_error(store_errc::invalid_state,
                          "Collection " + schema.name + " has no index " + index);
    }
    return *idx;
}

std::string local_store::order_clause(const collection_schema& schema) const {
    if (schema.order_by.empty()) {
        return " ORDER BY rowid ASC";
    }
    return " ORDER BY " + quote_identifier(schema.order_by) + " ASC, rowid ASC";
}

std::vector<json> local_store::decode_rows(const std::vector<database::row_t>& rows) const {
    std::vector<json> result;
    result.reserve(rows.size());
    for (const auto& row : rows) {
        auto it = row.find("payload");
        if (it == row.end()) continue;
        auto text = detail::as_string(it->second);
        if (!text) continue;
        try {
            result.push_back(json::parse(*text));
        } catch (const json::parse_error& e) {
            throw store_error(store_errc::io, std::string("Corrupt record payload: ") + e.what());
        }
    }
    return result;
}

std::optional<json> local_store::get(const std::string& collection, const std::string& key) {
    const auto& schema = require(collection);
    return atomically([&]() -> std::optional<json> {
        auto rows = db_->query("SELECT payload FROM " + quote_identifier(schema.name) + " WHERE key = ?", {key});
        auto records = decode_rows(rows);
        if (records.empty()) return std::nullopt;
        return std::move(records.front());
    });
}

void local_store::put_unlocked(const collection_schema& schema, const json& record) {
    auto key = record_key(record, schema.key_field);
    if (!key) {
        throw store_error(store_errc::invalid_state,
                          "Record for " + schema.name + " has no usable '" + schema.key_field + "' field");
    }

    std::string columns = "key, payload";
    std::string placeholders = "?, ?";
    std::string update_set = "payload = excluded.payload";
    std::vector<column_value_t> params = {*key, record.dump()};

    for (const auto& idx : schema.indexes) {
        auto col = quote_identifier(idx.name);
        columns += ", " + col;
        placeholders += ", ?";
        update_set += ", " + col + " = excluded." + col;
        params.push_back(index_value(record, idx));
    }

    // Upsert rather than REPLACE so an update keeps the original rowid
    std::string sql = "INSERT INTO " + quote_identifier(schema.name) + " (" + columns + ") VALUES (" +
                      placeholders + ") ON CONFLICT(key) DO UPDATE SET " + update_set;
    db_->execute(sql, params);
}

void local_store::put(const std::string& collection, const json& record) {
    const auto& schema = require(collection);
    atomically([&] { put_unlocked(schema, record); });
}

void local_store::bulk_put(const std::string& collection, const std::vector<json>& records) {
    const auto& schema = require(collection);
    atomically([&] {
        for (const auto& record : records) {
            put_unlocked(schema, record);
        }
    });
}

void local_store::remove(const std::string& collection, const std::string& key) {
    const auto& schema = require(collection);
    atomically([&] {
        db_->execute("DELETE FROM " + quote_identifier(schema.name) + " WHERE key = ?", {key});
        if (db_->changes() == 0) {
            throw store_error(store_errc::not_found, "No record " + key + " in " + collection);
        }
    });
}

std::vector<json> local_store::query(const std::string& collection,
                                     const std::string& index,
                                     const column_value_t& value,
                                     std::optional<size_t> limit) {
    const auto& schema = require(collection);
    const auto& idx = require_index(schema, index);

    std::string sql = "SELECT payload FROM " + quote_identifier(schema.name) + " WHERE " +
                      quote_identifier(idx.name) + " = ?" + order_clause(schema);
    std::vector<column_value_t> params = {value};
    if (limit) {
        sql += " LIMIT ?";
        params.push_back(static_cast<int64_t>(*limit));
    }
    return atomically([&] { return decode_rows(db_->query(sql, params)); });
}

std::vector<json> local_store::all(const std::string& collection) {
    const auto& schema = require(collection);
    std::string sql = "SELECT payload FROM " + quote_identifier(schema.name) + order_clause(schema);
    return atomically([&] { return decode_rows(db_->query(sql)); });
}

size_t local_store::count(const std::string& collection) {
    const auto& schema = require(collection);
    return atomically([&] {
        auto rows = db_->query("SELECT COUNT(*) AS n FROM " + quote_identifier(schema.name));
        return static_cast<size_t>(detail::as_int(rows.at(0).at("n")).value_or(0));
    });
}

size_t local_store::count(const std::string& collection, const std::string& index, const column_value_t& value) {
    const auto& schema = require(collection);
    const auto& idx = require_index(schema, index);
    return atomically([&] {
        auto rows = db_->query("SELECT COUNT(*) AS n FROM " + quote_identifier(schema.name) +
                               " WHERE " + quote_identifier(idx.name) + " = ?", {value});
        return static_cast<size_t>(detail::as_int(rows.at(0).at("n")).value_or(0));
    });
}

size_t local_store::remove_older_than(const std::string& collection,
                                      const std::string& time_index,
                                      int64_t cutoff,
                                      const std::optional<std::string>& filter_index,
                                      const column_value_t& filter_value) {
    const auto& schema = require(collection);
    const auto& time_idx = require_index(schema, time_index);

    std::string sql = "DELETE FROM " + quote_identifier(schema.name) + " WHERE " +
                      quote_identifier(time_idx.name) + " < ?";
    std::vector<column_value_t> params = {cutoff};
    if (filter_index) {
        const auto& filter_idx = require_index(schema, *filter_index);
        sql += " AND " + quote_identifier(filter_idx.name) + " = ?";
        params.push_back(filter_value);
    }

    return atomically([&] {
        db_->execute(sql, params);
        return static_cast<size_t>(db_->changes());
    });
}

int32_t local_store::schema_version() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return db_->user_version();
}

} // namespace harbor
