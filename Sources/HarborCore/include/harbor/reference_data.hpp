#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace harbor {

using json = nlohmann::json;

// ============================================================================
// Reference data shapes
// ============================================================================
//
// Upstream producers hand over a collection in one of several layouts. Each
// recognized layout is one alternative of raw_shape; anything else is
// unrecognized_shape and contributes no records.

struct direct_collection { const json* records; };     // [ {...}, ... ]
struct wrapped_records { const json* records; };       // { "records": [ ... ] }
struct wrapped_data { const json* records; };          // { "data": [ ... ] }
struct internal_records { const json* records; };      // { "_records": [ ... ] }
struct singleton_record { const json* record; };       // { "id": ..., ... }
struct unrecognized_shape {};

using raw_shape = std::variant<direct_collection,
                               wrapped_records,
                               wrapped_data,
                               internal_records,
                               singleton_record,
                               unrecognized_shape>;

/// Views into raw; raw must outlive the result.
raw_shape classify_shape(const json& raw);

const char* shape_name(const raw_shape& shape) noexcept;

/// Canonical sequence of records for any accepted shape. Non-object
/// elements are dropped; an unrecognized shape yields an empty vector.
std::vector<json> normalize_reference_data(const json& raw);

struct cached_collection {
    std::vector<json> records;
    timestamp_t cached_at{};
};

// ============================================================================
// reference_cache - in-memory reference data, keyed by collection name
// ============================================================================

class reference_cache {
public:
    void set(const std::string& collection, std::vector<json> records, timestamp_t cached_at);
    std::optional<cached_collection> get(const std::string& collection) const;
    bool has(const std::string& collection) const;
    std::vector<std::string> collections() const;
    size_t record_count() const;
    bool empty() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::map<std::string, cached_collection> collections_;
};

} // namespace harbor
