#include "harbor/reference_data.hpp"

namespace harbor {

namespace {

bool has_array(const json& raw, const char* field) {
    auto it = raw.find(field);
    return it != raw.end() && it->is_array();
}

std::vector<json> objects_of(const json& array) {
    std::vector<json> result;
    result.reserve(array.size());
    for (const auto& element : array) {
        if (element.is_object()) {
            result.push_back(element);
        }
    }
    return result;
}

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

raw_shape classify_shape(const json& raw) {
    if (raw.is_array()) {
        return direct_collection{&raw};
    }
    if (!raw.is_object()) {
        return unrecognized_shape{};
    }
    if (has_array(raw, "records")) return wrapped_records{&raw.at("records")};
    if (has_array(raw, "data")) return wrapped_data{&raw.at("data")};
    if (has_array(raw, "_records")) return internal_records{&raw.at("_records")};
    if (raw.contains("id") && !raw["id"].is_null()) return singleton_record{&raw};
    return unrecognized_shape{};
}

const char* shape_name(const raw_shape& shape) noexcept {
    return std::visit(overloaded{
        [](const direct_collection&) { return "direct"; },
        [](const wrapped_records&) { return "records"; },
        [](const wrapped_data&) { return "data"; },
        [](const internal_records&) { return "_records"; },
        [](const singleton_record&) { return "singleton"; },
        [](const unrecognized_shape&) { return "unrecognized"; },
    }, shape);
}

std::vector<json> normalize_reference_data(const json& raw) {
    return std::visit(overloaded{
        [](const direct_collection& s) { return objects_of(*s.records); },
        [](const wrapped_records& s) { return objects_of(*s.records); },
        [](const wrapped_data& s) { return objects_of(*s.records); },
        [](const internal_records& s) { return objects_of(*s.records); },
        [](const singleton_record& s) { return std::vector<json>{*s.record}; },
        [](const unrecognized_shape&) { return std::vector<json>{}; },
    }, classify_shape(raw));
}

void reference_cache::set(const std::string& collection, std::vector<json> records, timestamp_t cached_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    collections_[collection] = cached_collection{std::move(records), cached_at};
}

std::optional<cached_collection> reference_cache::get(const std::string& collection) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = collections_.find(collection);
    if (it == collections_.end()) return std::nullopt;
    return it->second;
}

bool reference_cache::has(const std::string& collection) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return collections_.count(collection) > 0;
}

std::vector<std::string> reference_cache::collections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, _] : collections_) {
        names.push_back(name);
    }
    return names;
}

size_t reference_cache::record_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& [_, entry] : collections_) {
        n += entry.records.size();
    }
    return n;
}

bool reference_cache::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return collections_.empty();
}

void reference_cache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    collections_.clear();
}

} // namespace harbor
