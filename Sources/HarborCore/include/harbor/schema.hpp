#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <map>
#include <functional>

namespace harbor {

class database;

// A secondary index column, extracted from the top-level document field of
// the same name every time a record is written.
struct index_descriptor {
    std::string name;
    column_type type = column_type::text;
    bool unique = false;
};

// Schema info for a collection
struct collection_schema {
    std::string name;
    std::string key_field = "id";               // document field holding the primary key
    std::vector<index_descriptor> indexes;
    std::string order_by;                       // index used for FIFO ordering, empty = insertion order

    const index_descriptor* find_index(const std::string& index_name) const {
        for (const auto& idx : indexes) {
            if (idx.name == index_name) return &idx;
        }
        return nullptr;
    }
};

// One upgrade step. Steps run in ascending version order; step N moves the
// store from version N-1 to version N.
struct schema_step {
    int32_t version = 0;
    std::string description;
    std::function<void(database&)> apply;
};

class schema_registry {
public:
    void register_collection(collection_schema schema);
    void add_step(int32_t version, std::string description, std::function<void(database&)> apply);

    const collection_schema* get(const std::string& name) const;
    std::vector<const collection_schema*> all() const;

    const std::vector<schema_step>& steps() const { return steps_; }

    /// Highest version any registered step produces.
    int32_t version() const;

private:
    std::map<std::string, collection_schema> collections_;
    std::vector<schema_step> steps_;
};

// Collection names
namespace collections {
    inline constexpr const char* session = "session";
    inline constexpr const char* user_credential = "user_credential";
    inline constexpr const char* config = "config";
    inline constexpr const char* offline_transaction = "offline_transaction";
    inline constexpr const char* transaction_overflow = "transaction_overflow";
    inline constexpr const char* order = "order";
    inline constexpr const char* sync_error = "sync_error";
    inline constexpr const char* reference_data = "reference_data";
}

/// SQL that creates the table and indexes backing a collection.
std::vector<std::string> create_collection_sql(const collection_schema& schema);

/// Quotes an identifier for use in SQL ("order" is a keyword).
std::string quote_identifier(const std::string& name);

/// The schema every Harbor store is opened with.
const schema_registry& harbor_schema();

/// Brings the database to registry.version(). All pending steps run inside one
/// exclusive transaction; on failure nothing is applied and the error
/// propagates. A stored version newer than the registry is rejected with
/// store_errc::invalid_state.
void migrate(database& db, const schema_registry& registry);

} // namespace harbor
