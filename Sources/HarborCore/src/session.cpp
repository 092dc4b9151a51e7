#include "harbor/session.hpp"
#include "harbor/log.hpp"

#include <map>
#include <set>

namespace harbor {

namespace {

constexpr const char* snapshot_meta_key = "snapshot_meta";

std::string reference_key(const std::string& collection, const std::string& record_id) {
    return collection + "/" + record_id;
}

// Records without an id, and repeats of an id already written, are keyed by
// their position so the stored sequence matches the loaded one.
std::string positional_key(const std::string& collection, size_t position) {
    return collection + "/#" + std::to_string(position);
}

} // namespace

json session_record::to_json() const {
    return {
        {"key", key},
        {"owner_id", owner_id},
        {"tab_id", tab_id},
        {"payload", payload},
        {"created_at", to_millis(created_at)},
        {"last_accessed", to_millis(last_accessed)},
        {"expires_at", to_millis(expires_at)},
        {"ttl_ms", static_cast<int64_t>(ttl.count())},
    };
}

session_record session_record::from_json(const json& j) {
    session_record s;
    s.key = j.at("key").get<std::string>();
    s.owner_id = j.at("owner_id").get<std::string>();
    s.tab_id = j.at("tab_id").get<std::string>();
    s.payload = j.value("payload", json::object());
    s.created_at = from_millis(j.value("created_at", int64_t{0}));
    s.last_accessed = from_millis(j.value("last_accessed", int64_t{0}));
    s.expires_at = from_millis(j.at("expires_at").get<int64_t>());
    s.ttl = std::chrono::milliseconds(j.value("ttl_ms", int64_t{0}));
    return s;
}

json snapshot_meta::to_json() const {
    return {
        {"version", version},
        {"taken_at", to_millis(taken_at)},
        {"instance_id", instance_id},
        {"collections", collections},
    };
}

snapshot_meta snapshot_meta::from_json(const json& j) {
    snapshot_meta m;
    m.version = j.at("version").get<int>();
    m.taken_at = from_millis(j.value("taken_at", int64_t{0}));
    m.instance_id = j.value("instance_id", "");
    m.collections = j.value("collections", std::vector<std::string>{});
    return m;
}

session_persistence::session_persistence(local_store& store,
                                         reference_cache& cache,
                                         std::string instance_id,
                                         session_config config,
                                         retry_policy retry,
                                         clock_fn clock,
                                         std::unique_ptr<snapshot_notifier> notifier)
    : store_(store)
    , cache_(cache)
    , instance_id_(instance_id.empty() ? uuid_t::generate().to_string() : std::move(instance_id))
    , config_(std::move(config))
    , retry_(std::move(retry))
    , clock_(std::move(clock))
    , notifier_(std::move(notifier)) {
    if (notifier_) {
        notifier_->subscribe([this](const std::string& origin) { on_snapshot_notice(origin); });
    }
    LOG_DEBUG("session", "Instance %s", instance_id_.c_str());
}

session_persistence::~session_persistence() {
    if (notifier_) {
        notifier_->unsubscribe();
    }
    detach();
}

// MARK: - Sessions

std::optional<session_record> session_persistence::own_session() {
    auto records = store_.query(collections::session, "tab_id", instance_id_, 1);
    if (records.empty()) return std::nullopt;
    return session_record::from_json(records.front());
}

session_record session_persistence::open_session(const std::string& owner_id,
                                                 json payload,
                                                 std::optional<std::chrono::milliseconds> ttl) {
    if (owner_id.empty()) {
        throw store_error(store_errc::invalid_state, "Session needs an owner");
    }
    auto now = clock_();
    session_record s;
    s.owner_id = owner_id;
    s.tab_id = instance_id_;
    s.key = owner_id + "@" + instance_id_;
    s.payload = std::move(payload);
    s.created_at = now;
    s.last_accessed = now;
    s.ttl = ttl.value_or(config_.ttl);
    s.expires_at = now + s.ttl;

    execute_with_retry([&] {
        store_.write([&] {
            for (const auto& previous : store_.query(collections::session, "tab_id", instance_id_)) {
                store_.remove(collections::session, previous.at("key").get<std::string>());
            }
            store_.put(collections::session, s.to_json());
        });
    }, "session.open", retry_);

    LOG_INFO("session", "Opened session %s", s.key.c_str());
    return s;
}

bool session_persistence::heartbeat() {
    auto now = clock_();
    return execute_with_retry([&] {
        return store_.write([&] {
            auto s = own_session();
            if (!s || !is_valid(*s, now)) return false;
            s->last_accessed = now;
            s->expires_at = now + s->ttl;
            store_.put(collections::session, s->to_json());
            return true;
        });
    }, "session.heartbeat", retry_);
}

void session_persistence::close_session() {
    size_t closed = execute_with_retry([&] {
        return store_.write([&] {
            auto records = store_.query(collections::session, "tab_id", instance_id_);
            for (const auto& r : records) {
                store_.remove(collections::session, r.at("key").get<std::string>());
            }
            return records.size();
        });
    }, "session.close", retry_);
    if (closed > 0) {
        LOG_INFO("session", "Closed session for tab %s", instance_id_.c_str());
    }
}

std::optional<session_record> session_persistence::active_session() {
    auto s = execute_with_retry([&] { return own_session(); }, "session.active", retry_);
    if (!s || !is_valid(*s, clock_())) return std::nullopt;
    return s;
}

bool session_persistence::is_valid(const session_record& session, timestamp_t now) {
    return !session.key.empty() && now < session.expires_at;
}

size_t session_persistence::purge_expired(timestamp_t now) {
    size_t removed = execute_with_retry([&] {
        return store_.remove_older_than(collections::session, "expires_at", to_millis(now) + 1);
    }, "session.purge_expired", retry_);
    if (removed > 0) {
        LOG_INFO("session", "Purged %zu expired sessions", removed);
    }
    return removed;
}

// MARK: - Reference data

void session_persistence::write_collection(const std::string& collection,
                                           const std::vector<json>& records,
                                           timestamp_t cached_at) {
    auto stamp = to_millis(cached_at);
    store_.write([&] {
        store_.remove_older_than(collections::reference_data, "cached_at", stamp + 1,
                                 std::string("collection"), collection);
        std::set<std::string> used;
        for (size_t position = 0; position < records.size(); ++position) {
            const auto& record = records[position];
            auto id = record_key(record, "id");
            auto key = id ? reference_key(collection, *id) : positional_key(collection, position);
            while (!used.insert(key).second) {
                key = positional_key(key, position);
            }
            store_.put(collections::reference_data, {
                {"key", key},
                {"collection", collection},
                {"cached_at", stamp},
                {"record", record},
            });
        }
    });
}

size_t session_persistence::load_reference_data(const std::string& collection, const json& raw) {
    auto shape = classify_shape(raw);
    if (std::holds_alternative<unrecognized_shape>(shape)) {
        LOG_WARN("session", "Unrecognized shape for %s, no records loaded", collection.c_str());
        return 0;
    }
    auto records = normalize_reference_data(raw);
    auto now = clock_();
    execute_with_retry([&] { write_collection(collection, records, now); }, "session.load_reference_data", retry_);
    cache_.set(collection, records, now);
    LOG_DEBUG("session", "Loaded %zu %s records (%s)", records.size(), collection.c_str(), shape_name(shape));
    return records.size();
}

size_t session_persistence::read_reference_data(std::vector<std::string>& warnings) {
    auto rows = execute_with_retry([&] { return store_.all(collections::reference_data); },
                                   "session.read_reference_data", retry_);

    std::map<std::string, cached_collection> loaded;
    for (const auto& row : rows) {
        auto collection = row.find("collection");
        auto record = row.find("record");
        if (collection == row.end() || !collection->is_string() || record == row.end() || !record->is_object()) {
            warnings.push_back("Skipped malformed reference record " + row.value("key", std::string("?")));
            continue;
        }
        auto& entry = loaded[collection->get<std::string>()];
        entry.records.push_back(*record);
        auto cached_at = from_millis(row.value("cached_at", int64_t{0}));
        if (cached_at > entry.cached_at) entry.cached_at = cached_at;
    }

    for (auto& [name, entry] : loaded) {
        cache_.set(name, std::move(entry.records), entry.cached_at);
    }
    return loaded.size();
}

size_t session_persistence::reload_reference_data() {
    std::vector<std::string> warnings;
    size_t n = read_reference_data(warnings);
    for (const auto& w : warnings) {
        LOG_WARN("session", "%s", w.c_str());
    }
    return n;
}

void session_persistence::on_snapshot_notice(const std::string& origin) {
    if (origin == instance_id_) return;
    try {
        size_t n = reload_reference_data();
        LOG_INFO("session", "Reloaded %zu collections after snapshot from %s", n, origin.c_str());
    } catch (const store_error& e) {
        LOG_ERROR("session", "Reload after snapshot from %s failed: %s", origin.c_str(), e.what());
    }
}

// MARK: - Snapshot / restore

snapshot_meta session_persistence::snapshot() {
    snapshot_meta meta;
    meta.taken_at = clock_();
    meta.instance_id = instance_id_;
    meta.collections = cache_.collections();

    execute_with_retry([&] {
        store_.write([&] {
            auto s = own_session();
            if (s && is_valid(*s, meta.taken_at)) {
                s->last_accessed = meta.taken_at;
                store_.put(collections::session, s->to_json());
            }
            for (const auto& name : meta.collections) {
                auto entry = cache_.get(name);
                if (entry) {
                    write_collection(name, entry->records, entry->cached_at);
                }
            }
            store_.put(collections::config, {
                {"key", snapshot_meta_key},
                {"value", meta.to_json()},
                {"updated_at", to_millis(meta.taken_at)},
            });
        });
    }, "session.snapshot", retry_);

    LOG_INFO("session", "Snapshot v%d with %zu collections", meta.version, meta.collections.size());
    if (notifier_) {
        notifier_->post(instance_id_);
    }
    return meta;
}

restore_result session_persistence::restore() {
    restore_result result;
    try {
        auto record = execute_with_retry([&] { return store_.get(collections::config, snapshot_meta_key); },
                                         "session.restore", retry_);
        if (!record || !record->contains("value")) {
            result.warnings.push_back("No snapshot found");
            return result;
        }

        snapshot_meta meta;
        try {
            meta = snapshot_meta::from_json(record->at("value"));
        } catch (const json::exception& e) {
            result.warnings.push_back(std::string("Unreadable snapshot metadata: ") + e.what());
            return result;
        }
        if (meta.version > snapshot_format_version) {
            result.warnings.push_back("Snapshot version " + std::to_string(meta.version) +
                                      " is newer than supported version " +
                                      std::to_string(snapshot_format_version));
            return result;
        }
        result.meta = meta;

        result.collections = read_reference_data(result.warnings);
        for (const auto& name : meta.collections) {
            if (!cache_.has(name)) {
                cache_.set(name, {}, meta.taken_at);
            }
        }
        result.collections = cache_.collections().size();
        result.records = cache_.record_count();

        try {
            auto s = execute_with_retry([&] { return own_session(); }, "session.restore", retry_);
            if (s && is_valid(*s, clock_())) {
                result.session = std::move(s);
            }
        } catch (const json::exception& e) {
            result.warnings.push_back(std::string("Unreadable session record: ") + e.what());
        }

        result.usable = true;
    } catch (const store_error& e) {
        result.warnings.push_back(std::string("Snapshot could not be read: ") + e.what());
    } catch (const json::exception& e) {
        result.warnings.push_back(std::string("Snapshot could not be parsed: ") + e.what());
    }

    for (const auto& w : result.warnings) {
        LOG_WARN("session", "%s", w.c_str());
    }
    if (result.usable) {
        LOG_INFO("session", "Restored %zu collections (%zu records)", result.collections, result.records);
    }
    return result;
}

bool session_persistence::ensure_data_available() {
    if (!cache_.empty()) {
        return true;
    }
    LOG_INFO("session", "Reference data missing in memory, restoring from snapshot");
    auto result = restore();
    return result.usable && !cache_.empty();
}

// MARK: - Reconnection

void session_persistence::attach(connection_monitor& monitor) {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    if (monitor_) return;
    monitor_ = &monitor;
    auto gate = listener_gate_ = std::make_shared<callback_gate>();
    listener_ = monitor.add_listener([this, gate](const connectivity_event& event) {
        gate->run([&] {
            if (!config_.restore_on_reconnect) return;
            if (event.previous == connectivity::unreachable && event.current == connectivity::reachable) {
                ensure_data_available();
            }
        });
    });
}

void session_persistence::detach() {
    SharedGate gate;
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        if (monitor_ && listener_) {
            monitor_->remove_listener(*listener_);
        }
        monitor_ = nullptr;
        listener_.reset();
        gate = std::move(listener_gate_);
    }
    // A restore already running for this listener finishes first
    if (gate) gate->close();
}

} // namespace harbor
