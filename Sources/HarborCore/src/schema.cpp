#include "harbor/schema.hpp"
#include "harbor/db.hpp"
#include "harbor/log.hpp"
#include <algorithm>

namespace harbor {

void schema_registry::register_collection(collection_schema schema) {
    auto name = schema.name;
    collections_[name] = std::move(schema);
}

void schema_registry::add_step(int32_t version, std::string description, std::function<void(database&)> apply) {
    auto it = std::find_if(steps_.begin(), steps_.end(),
                           [version](const schema_step& s) { return s.version == version; });
    if (it != steps_.end()) {
        throw store_error(store_errc::invalid_state,
                          "Duplicate schema step for version " + std::to_string(version));
    }
    steps_.push_back({version, std::move(description), std::move(apply)});
    std::sort(steps_.begin(), steps_.end(),
              [](const schema_step& a, const schema_step& b) { return a.version < b.version; });
}

const collection_schema* schema_registry::get(const std::string& name) const {
    auto it = collections_.find(name);
    if (it == collections_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<const collection_schema*> schema_registry::all() const {
    std::vector<const collection_schema*> result;
    result.reserve(collections_.size());
    for (const auto& [_, schema] : collections_) {
        result.push_back(&schema);
    }
    return result;
}

int32_t schema_registry::version() const {
    return steps_.empty() ? 0 : steps_.back().version;
}

std::string quote_identifier(const std::string& name) {
    std::string quoted = "\"";
    for (char c : name) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

static const char* sql_type(column_type type) {
    switch (type) {
        case column_type::integer: return "INTEGER";
        case column_type::real: return "REAL";
        case column_type::text: return "TEXT";
        case column_type::blob: return "BLOB";
    }
    return "TEXT";
}

std::vector<std::string> create_collection_sql(const collection_schema& schema) {
    std::vector<std::string> statements;
    std::string table = quote_identifier(schema.name);

    std::string sql = "CREATE TABLE IF NOT EXISTS " + table +
                      " (key TEXT PRIMARY KEY NOT NULL, payload TEXT NOT NULL";
    for (const auto& idx : schema.indexes) {
        sql += ", " + quote_identifier(idx.name) + " " + sql_type(idx.type);
    }
    sql += ")";
    statements.push_back(std::move(sql));

    for (const auto& idx : schema.indexes) {
        std::string index_name = quote_identifier(schema.name + "_" + idx.name + "_idx");
        statements.push_back(std::string("CREATE ") + (idx.unique ? "UNIQUE " : "") +
                             "INDEX IF NOT EXISTS " + index_name + " ON " + table +
                             "(" + quote_identifier(idx.name) + ")");
    }
    return statements;
}

static void create_collections(database& db, const std::vector<collection_schema>& schemas) {
    for (const auto& schema : schemas) {
        for (const auto& sql : create_collection_sql(schema)) {
            db.execute(sql);
        }
    }
}

const schema_registry& harbor_schema() {
    static const schema_registry registry = [] {
        schema_registry r;

        std::vector<collection_schema> v1 = {
            {collections::session, "key", {
                {"tab_id", column_type::text, true},
                {"owner_id", column_type::text},
                {"expires_at", column_type::integer},
                {"last_accessed", column_type::integer},
            }, ""},
            {collections::user_credential, "user_id", {
                {"login", column_type::text, true},
            }, ""},
            {collections::config, "key", {}, ""},
            {collections::offline_transaction, "id", {
                {"idempotency_key", column_type::text, true},
                {"status", column_type::text},
                {"created_at", column_type::integer},
            }, "created_at"},
            {collections::order, "id", {
                {"state", column_type::text},
                {"date_order", column_type::integer},
            }, "date_order"},
            {collections::sync_error, "id", {
                {"transaction_id", column_type::text},
                {"error_kind", column_type::text},
                {"timestamp", column_type::integer},
            }, "timestamp"},
            {collections::reference_data, "key", {
                {"collection", column_type::text},
                {"cached_at", column_type::integer},
            }, ""},
        };

        // Overflow log for the archive-oldest queue policy
        std::vector<collection_schema> v2 = {
            {collections::transaction_overflow, "id", {
                {"archived_at", column_type::integer},
            }, "archived_at"},
        };

        for (const auto& s : v1) r.register_collection(s);
        for (const auto& s : v2) r.register_collection(s);

        r.add_step(1, "initial collections", [v1](database& db) { create_collections(db, v1); });
        r.add_step(2, "transaction overflow log", [v2](database& db) { create_collections(db, v2); });
        return r;
    }();
    return registry;
}

void migrate(database& db, const schema_registry& registry) {
    const int32_t target = registry.version();

    int32_t current = db.user_version();
    if (current > target) {
        LOG_ERROR("store", "Stored schema version %d is newer than supported version %d", current, target);
        throw store_error(store_errc::invalid_state,
                          "Stored schema version " + std::to_string(current) +
                          " is newer than supported version " + std::to_string(target));
    }
    if (current == target) return;

    transaction tx(db, true);

    // Another instance may have upgraded while we waited for the lock
    current = db.user_version();
    if (current > target) {
        throw store_error(store_errc::invalid_state,
                          "Stored schema version " + std::to_string(current) +
                          " is newer than supported version " + std::to_string(target));
    }

    for (const auto& step : registry.steps()) {
        if (step.version <= current) continue;
        LOG_INFO("store", "Applying schema step %d: %s", step.version, step.description.c_str());
        step.apply(db);
        tx.check();
    }

    db.set_user_version(target);
    tx.commit();
    LOG_INFO("store", "Schema upgraded from version %d to %d", current, target);
}

} // namespace harbor
