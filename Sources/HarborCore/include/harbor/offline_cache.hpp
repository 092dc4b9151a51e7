#pragma once

#include "retry.hpp"
#include "store.hpp"
#include <optional>
#include <string>
#include <vector>

namespace harbor {

/// Tag stored next to every cached hash
inline constexpr const char* secret_hash_algorithm = "sha256-uid-salt";

/// Hex SHA-256 of secret followed by user_id. The same function is used when
/// the hash is produced online and when a login is checked offline.
std::string compute_secret_hash(const std::string& secret, const std::string& user_id);

// Locally verifiable copy of a user's auth secret. Never holds the plaintext.
struct credential_record {
    std::string user_id;
    std::string login;
    std::string name;
    std::string secret_hash;
    std::string hash_algorithm = secret_hash_algorithm;
    timestamp_t cached_at{};

    json to_json() const;
    static credential_record from_json(const json& j);

    /// Builds a record from a freshly verified online login.
    static credential_record from_secret(const std::string& user_id,
                                         const std::string& login,
                                         const std::string& secret,
                                         const std::string& name = "");
};

enum class verdict {
    accept,
    reject
};

// Credential policy supplied by the embedding application
class credential_verifier {
public:
    virtual ~credential_verifier() = default;
    virtual verdict verify(const std::string& login, const std::string& secret) = 0;
};

/// paid, done, invoiced, cancel
const std::vector<std::string>& terminal_order_states();

// ============================================================================
// offline_cache - credentials, config values and orders kept for offline use
// ============================================================================

class offline_cache {
public:
    explicit offline_cache(local_store& store, retry_policy retry = {}, clock_fn clock = system_now);

    void save_credential(const credential_record& record);
    std::optional<credential_record> credential(const std::string& user_id);
    std::optional<credential_record> credential_by_login(const std::string& login);
    std::vector<credential_record> all_credentials();

    void set_config(const std::string& key, const json& value);
    std::optional<json> config(const std::string& key);

    /// Orders are JSON objects with at least "id"; "state" and "date_order"
    /// (epoch millis) are indexed.
    void save_order(const json& order);
    std::optional<json> order(const std::string& id);
    std::vector<json> orders_by_state(const std::string& state);
    void remove_order(const std::string& id);
    size_t remove_terminal_orders_before(timestamp_t cutoff);

private:
    local_store& store_;
    retry_policy retry_;
    clock_fn clock_;
};

} // namespace harbor
