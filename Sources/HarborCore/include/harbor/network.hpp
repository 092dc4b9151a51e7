#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace harbor {

using json = nlohmann::json;

// ============================================================================
// Remote errors
// ============================================================================

enum class remote_errc {
    timeout,      // no answer within the call's deadline
    connection,   // resolve / connect / socket failure
    protocol      // answered, but not with something we understand
};

const char* to_string(remote_errc code) noexcept;

class remote_error : public std::runtime_error {
public:
    remote_error(remote_errc code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    remote_errc code() const noexcept { return code_; }

private:
    remote_errc code_;
};

// ============================================================================
// HTTP Client Interface
// ============================================================================

struct http_response {
    int status_code = 0;
    std::map<std::string, std::string> headers;   // names lower-cased
    std::vector<uint8_t> body;

    bool is_success() const { return status_code >= 200 && status_code < 300; }
    bool is_redirect() const { return status_code >= 300 && status_code < 400; }

    std::string body_string() const {
        return std::string(body.begin(), body.end());
    }

    std::optional<std::string> header(const std::string& name) const;
};

struct http_request {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;
    std::chrono::milliseconds timeout{5000};

    void set_body(const std::string& s) {
        body = std::vector<uint8_t>(s.begin(), s.end());
    }

    void set_json_body(const std::string& json) {
        set_body(json);
        headers["Content-Type"] = "application/json";
    }
};

class http_client {
public:
    virtual ~http_client() = default;

    // Synchronous request (blocks until complete or request.timeout elapses).
    // Throws remote_error. Redirects are returned, never followed.
    virtual http_response send(const http_request& request) = 0;
};

struct parsed_url {
    std::string host;
    std::string port = "80";
    std::string target = "/";
};

/// Accepts http://host[:port][/path]. Throws remote_error(protocol) otherwise.
parsed_url parse_url(const std::string& url);

/// Parses a raw HTTP/1.x response (status line, headers, body; chunked
/// transfer encoding is decoded). Throws remote_error(protocol).
http_response parse_http_response(const std::string& raw);

/// Plain HTTP/1.1 over standalone asio, one connection per request.
class asio_http_client : public http_client {
public:
    http_response send(const http_request& request) override;
};

// ============================================================================
// Remote capabilities consumed by the core
// ============================================================================

struct push_item {
    std::string idempotency_key;
    std::string kind;
    json payload;
};

enum class push_result {
    success,
    failure
};

struct push_outcome {
    std::string idempotency_key;
    push_result result = push_result::failure;
    std::string error_kind;   // empty on success
};

// Submits offline transactions. Implementations must be idempotent per key:
// the remote ignores a key it has already applied and still reports success.
class batch_pusher {
public:
    virtual ~batch_pusher() = default;

    /// Outcomes may come back in any order and may omit items.
    /// Throws remote_error when the batch as a whole could not be delivered.
    virtual std::vector<push_outcome> push_batch(const std::vector<push_item>& items,
                                                 std::chrono::milliseconds timeout) = 0;
};

struct probe_result {
    bool reachable = false;
    std::optional<int> status_code;
    std::string detail;
};

// Cheap, side-effect-free reachability check
class reachability_probe {
public:
    virtual ~reachability_probe() = default;

    /// Never throws for network trouble; failures come back as reachable == false.
    virtual probe_result probe(std::chrono::milliseconds timeout) = 0;
};

// ============================================================================
// HTTP implementations
// ============================================================================

struct http_probe_config {
    std::string url;
    std::optional<std::string> expected_marker;   // body must contain this when set
};

/// GET <url>. Reachable only on 2xx without redirect and, when configured,
/// with the expected marker in the body. A captive portal answering with a
/// 302 to its login page, or a 200 login page, is unreachable.
class http_reachability_probe : public reachability_probe {
public:
    http_reachability_probe(std::shared_ptr<http_client> client, http_probe_config config);

    probe_result probe(std::chrono::milliseconds timeout) override;

private:
    std::shared_ptr<http_client> client_;
    http_probe_config config_;
};

/// Request body for a batch push.
std::string encode_push_request(const std::vector<push_item>& items);

/// Parses the push response body. Throws remote_error(protocol).
std::vector<push_outcome> parse_push_response(const std::string& body);

/// POST <url> with {"items":[...]}, expects {"results":[...]}.
class http_batch_pusher : public batch_pusher {
public:
    http_batch_pusher(std::shared_ptr<http_client> client,
                      std::string url,
                      std::map<std::string, std::string> headers = {});

    std::vector<push_outcome> push_batch(const std::vector<push_item>& items,
                                         std::chrono::milliseconds timeout) override;

private:
    std::shared_ptr<http_client> client_;
    std::string url_;
    std::map<std::string, std::string> headers_;
};

} // namespace harbor
