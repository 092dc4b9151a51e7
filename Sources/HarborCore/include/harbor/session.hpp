#pragma once

#include "connection_monitor.hpp"
#include "reference_data.hpp"
#include "retry.hpp"
#include "snapshot_notifier.hpp"
#include "store.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace harbor {

/// Layout version written into every snapshot_meta record
inline constexpr int snapshot_format_version = 1;

struct session_config {
    std::chrono::milliseconds ttl{std::chrono::hours(12)};
    bool restore_on_reconnect = true;
};

// One tab's login session. The key is "<owner_id>@<tab_id>".
struct session_record {
    std::string key;
    std::string owner_id;
    std::string tab_id;
    json payload = json::object();
    timestamp_t created_at{};
    timestamp_t last_accessed{};
    timestamp_t expires_at{};
    std::chrono::milliseconds ttl{0};

    json to_json() const;
    static session_record from_json(const json& j);
};

struct snapshot_meta {
    int version = snapshot_format_version;
    timestamp_t taken_at{};
    std::string instance_id;
    std::vector<std::string> collections;

    json to_json() const;
    static snapshot_meta from_json(const json& j);
};

struct restore_result {
    bool usable = false;
    std::optional<snapshot_meta> meta;
    std::optional<session_record> session;
    size_t collections = 0;
    size_t records = 0;
    std::vector<std::string> warnings;
};

// ============================================================================
// session_persistence - per-tab sessions and reference-data snapshots
// ============================================================================
//
// Sessions belong to one instance (tab): every read and write is scoped to
// instance_id(), so two tabs of the same user never see each other's session.
// Reference data is shared by all instances of the same store.

class session_persistence {
public:
    /// An empty instance_id gets a random uuid.
    session_persistence(local_store& store,
                        reference_cache& cache,
                        std::string instance_id = "",
                        session_config config = {},
                        retry_policy retry = {},
                        clock_fn clock = system_now,
                        std::unique_ptr<snapshot_notifier> notifier = nullptr);
    ~session_persistence();

    session_persistence(const session_persistence&) = delete;
    session_persistence& operator=(const session_persistence&) = delete;

    const std::string& instance_id() const { return instance_id_; }

    /// Replaces whatever session this tab held before.
    session_record open_session(const std::string& owner_id,
                                json payload = json::object(),
                                std::optional<std::chrono::milliseconds> ttl = std::nullopt);

    /// Extends this tab's session by its ttl. False if there is none or it expired.
    bool heartbeat();

    void close_session();

    /// This tab's session, if present and not expired.
    std::optional<session_record> active_session();

    static bool is_valid(const session_record& session, timestamp_t now);

    /// Removes expired sessions of every tab.
    size_t purge_expired(timestamp_t now);

    /// Normalizes raw, replaces the collection in memory and in the store.
    /// Returns the number of records accepted.
    size_t load_reference_data(const std::string& collection, const json& raw);

    snapshot_meta snapshot();

    /// Never throws; problems come back as warnings with usable == false.
    restore_result restore();

    /// True when reference data is in memory, restoring it first if needed.
    bool ensure_data_available();

    /// Re-reads shared reference data from the store into memory.
    size_t reload_reference_data();

    /// Calls ensure_data_available() on each unreachable -> reachable event.
    void attach(connection_monitor& monitor);
    void detach();

private:
    std::optional<session_record> own_session();
    void write_collection(const std::string& collection, const std::vector<json>& records, timestamp_t cached_at);
    size_t read_reference_data(std::vector<std::string>& warnings);
    void on_snapshot_notice(const std::string& origin);

    local_store& store_;
    reference_cache& cache_;
    std::string instance_id_;
    session_config config_;
    retry_policy retry_;
    clock_fn clock_;
    std::unique_ptr<snapshot_notifier> notifier_;

    std::mutex monitor_mutex_;
    connection_monitor* monitor_ = nullptr;
    std::optional<connection_monitor::listener_id> listener_;
    SharedGate listener_gate_;
};

} // namespace harbor
