#include "harbor/offline_cache.hpp"
#include "harbor/log.hpp"

#include <openssl/evp.h>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace harbor {

std::string compute_secret_hash(const std::string& secret, const std::string& user_id) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    std::string salted = secret + user_id;
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (!EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) ||
        !EVP_DigestUpdate(ctx.get(), salted.data(), salted.size()) ||
        !EVP_DigestFinal_ex(ctx.get(), digest, &digest_len)) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    std::ostringstream hex;
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex << std::setfill('0') << std::setw(2) << std::hex << static_cast<int>(digest[i]);
    }
    return hex.str();
}

json credential_record::to_json() const {
    return {
        {"user_id", user_id},
        {"login", login},
        {"name", name},
        {"secret_hash", secret_hash},
        {"hash_algorithm", hash_algorithm},
        {"cached_at", to_millis(cached_at)},
    };
}

credential_record credential_record::from_json(const json& j) {
    credential_record r;
    if (j.contains("user_id") && j["user_id"].is_number_integer()) {
        r.user_id = std::to_string(j["user_id"].get<int64_t>());
    } else {
        r.user_id = j.value("user_id", "");
    }
    r.login = j.value("login", "");
    r.name = j.value("name", "");
    r.secret_hash = j.value("secret_hash", "");
    r.hash_algorithm = j.value("hash_algorithm", secret_hash_algorithm);
    r.cached_at = from_millis(j.value("cached_at", int64_t{0}));
    return r;
}

credential_record credential_record::from_secret(const std::string& user_id,
                                                 const std::string& login,
                                                 const std::string& secret,
                                                 const std::string& name) {
    credential_record r;
    r.user_id = user_id;
    r.login = login;
    r.name = name;
    r.secret_hash = compute_secret_hash(secret, user_id);
    return r;
}

const std::vector<std::string>& terminal_order_states() {
    static const std::vector<std::string> states = {"paid", "done", "invoiced", "cancel"};
    return states;
}

offline_cache::offline_cache(local_store& store, retry_policy retry, clock_fn clock)
    : store_(store), retry_(std::move(retry)), clock_(std::move(clock)) {}

void offline_cache::save_credential(const credential_record& record) {
    if (record.user_id.empty() || record.login.empty() || record.secret_hash.empty()) {
        throw store_error(store_errc::invalid_state, "Credential record needs user_id, login and secret_hash");
    }
    auto stored = record;
    stored.cached_at = clock_();
    execute_with_retry([&] {
        store_.write([&] {
            // A login moving to another user id must not trip the unique index
            for (const auto& other : store_.query(collections::user_credential, "login", stored.login)) {
                auto other_id = record_key(other, "user_id");
                if (other_id && *other_id != stored.user_id) {
                    store_.remove(collections::user_credential, *other_id);
                }
            }
            store_.put(collections::user_credential, stored.to_json());
        });
    }, "cache.save_credential", retry_);
    LOG_DEBUG("cache", "Cached credential for %s", stored.login.c_str());
}

std::optional<credential_record> offline_cache::credential(const std::string& user_id) {
    return execute_with_retry([&]() -> std::optional<credential_record> {
        auto record = store_.get(collections::user_credential, user_id);
        if (!record) return std::nullopt;
        return credential_record::from_json(*record);
    }, "cache.credential", retry_);
}

std::optional<credential_record> offline_cache::credential_by_login(const std::string& login) {
    return execute_with_retry([&]() -> std::optional<credential_record> {
        auto records = store_.query(collections::user_credential, "login", login, 1);
        if (records.empty()) return std::nullopt;
        return credential_record::from_json(records.front());
    }, "cache.credential_by_login", retry_);
}

std::vector<credential_record> offline_cache::all_credentials() {
    return execute_with_retry([&] {
        std::vector<credential_record> result;
        for (const auto& r : store_.all(collections::user_credential)) {
            result.push_back(credential_record::from_json(r));
        }
        return result;
    }, "cache.all_credentials", retry_);
}

void offline_cache::set_config(const std::string& key, const json& value) {
    json record = {
        {"key", key},
        {"value", value},
        {"updated_at", to_millis(clock_())},
    };
    execute_with_retry([&] { store_.put(collections::config, record); }, "cache.set_config", retry_);
}

std::optional<json> offline_cache::config(const std::string& key) {
    return execute_with_retry([&]() -> std::optional<json> {
        auto record = store_.get(collections::config, key);
        if (!record || !record->contains("value")) return std::nullopt;
        return (*record)["value"];
    }, "cache.config", retry_);
}

void offline_cache::save_order(const json& order) {
    execute_with_retry([&] { store_.put(collections::order, order); }, "cache.save_order", retry_);
}

std::optional<json> offline_cache::order(const std::string& id) {
    return execute_with_retry([&] { return store_.get(collections::order, id); }, "cache.order", retry_);
}

std::vector<json> offline_cache::orders_by_state(const std::string& state) {
    return execute_with_retry([&] { return store_.query(collections::order, "state", state); },
                              "cache.orders_by_state", retry_);
}

void offline_cache::remove_order(const std::string& id) {
    execute_with_retry([&] { store_.remove(collections::order, id); }, "cache.remove_order", retry_);
}

size_t offline_cache::remove_terminal_orders_before(timestamp_t cutoff) {
    size_t removed = execute_with_retry([&] {
        return store_.write([&] {
            size_t n = 0;
            for (const auto& state : terminal_order_states()) {
                n += store_.remove_older_than(collections::order, "date_order", to_millis(cutoff),
                                              std::string("state"), state);
            }
            return n;
        });
    }, "cache.remove_terminal_orders", retry_);
    if (removed > 0) {
        LOG_INFO("cache", "Removed %zu closed orders", removed);
    }
    return removed;
}

} // namespace harbor
