#include "harbor/network.hpp"
#include "harbor/log.hpp"

#include <asio.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace harbor {

const char* to_string(remote_errc code) noexcept {
    switch (code) {
        case remote_errc::timeout: return "timeout";
        case remote_errc::connection: return "network";
        case remote_errc::protocol: return "protocol";
    }
    return "network";
}

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<std::string> http_response::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    if (it == headers.end()) return std::nullopt;
    return it->second;
}

// ============================================================================
// URL / response parsing
// ============================================================================

parsed_url parse_url(const std::string& url) {
    static const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        throw remote_error(remote_errc::protocol, "Unsupported URL (only http:// is supported): " + url);
    }

    parsed_url result;
    std::string rest = url.substr(scheme.size());
    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        result.target = rest.substr(slash);
    }

    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        result.host = authority.substr(0, colon);
        result.port = authority.substr(colon + 1);
        if (result.port.empty() ||
            !std::all_of(result.port.begin(), result.port.end(), [](unsigned char c) { return std::isdigit(c); })) {
            throw remote_error(remote_errc::protocol, "Invalid port in URL: " + url);
        }
    } else {
        result.host = authority;
    }

    if (result.host.empty()) {
        throw remote_error(remote_errc::protocol, "Missing host in URL: " + url);
    }
    return result;
}

static std::string decode_chunked(const std::string& body) {
    std::string decoded;
    size_t pos = 0;
    while (pos < body.size()) {
        auto line_end = body.find("\r\n", pos);
        if (line_end == std::string::npos) {
            throw remote_error(remote_errc::protocol, "Truncated chunked body");
        }
        size_t size = 0;
        try {
            size = std::stoul(body.substr(pos, line_end - pos), nullptr, 16);
        } catch (const std::logic_error&) {
            throw remote_error(remote_errc::protocol, "Invalid chunk size");
        }
        pos = line_end + 2;
        if (size == 0) break;
        if (pos + size > body.size()) {
            throw remote_error(remote_errc::protocol, "Truncated chunk");
        }
        decoded.append(body, pos, size);
        pos += size + 2;
    }
    return decoded;
}

http_response parse_http_response(const std::string& raw) {
    auto header_end = raw.find("\r\n\r\n");
    if (header_end == std::string::npos) {
        throw remote_error(remote_errc::protocol, "Malformed HTTP response: no header terminator");
    }

    std::istringstream head(raw.substr(0, header_end));
    std::string status_line;
    std::getline(head, status_line);
    if (!status_line.empty() && status_line.back() == '\r') status_line.pop_back();

    http_response response;
    {
        std::istringstream status(status_line);
        std::string version;
        status >> version >> response.status_code;
        if (version.rfind("HTTP/", 0) != 0 || status.fail()) {
            throw remote_error(remote_errc::protocol, "Malformed HTTP status line: " + status_line);
        }
    }

    std::string line;
    while (std::getline(head, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string value = line.substr(colon + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        response.headers[to_lower(line.substr(0, colon))] = value;
    }

    std::string body = raw.substr(header_end + 4);
    auto encoding = response.header("transfer-encoding");
    if (encoding && to_lower(*encoding).find("chunked") != std::string::npos) {
        body = decode_chunked(body);
    } else if (auto length = response.header("content-length")) {
        size_t n = 0;
        try {
            n = std::stoul(*length);
        } catch (const std::logic_error&) {
            throw remote_error(remote_errc::protocol, "Invalid Content-Length: " + *length);
        }
        if (body.size() < n) {
            throw remote_error(remote_errc::protocol, "Truncated HTTP body");
        }
        body.resize(n);
    }
    response.body.assign(body.begin(), body.end());
    return response;
}

// ============================================================================
// asio_http_client
// ============================================================================

http_response asio_http_client::send(const http_request& request) {
    using asio::ip::tcp;

    auto url = parse_url(request.url);

    std::string wire = request.method + " " + url.target + " HTTP/1.1\r\n";
    wire += "Host: " + url.host + (url.port == "80" ? "" : ":" + url.port) + "\r\n";
    wire += "Connection: close\r\n";
    wire += "Accept: */*\r\n";
    for (const auto& [name, value] : request.headers) {
        wire += name + ": " + value + "\r\n";
    }
    if (!request.body.empty() || request.method == "POST" || request.method == "PUT") {
        wire += "Content-Length: " + std::to_string(request.body.size()) + "\r\n";
    }
    wire += "\r\n";
    wire.append(request.body.begin(), request.body.end());

    asio::io_context io;
    tcp::resolver resolver(io);
    tcp::socket socket(io);
    asio::steady_timer deadline(io);

    std::string received;
    asio::error_code failure;
    bool completed = false;
    bool timed_out = false;

    auto finish = [&](const asio::error_code& ec) {
        if (completed) return;
        completed = true;
        failure = ec;
        deadline.cancel();
    };

    deadline.expires_after(request.timeout);
    deadline.async_wait([&](const asio::error_code& ec) {
        if (ec || completed) return;
        timed_out = true;
        completed = true;
        asio::error_code ignored;
        resolver.cancel();
        socket.close(ignored);
    });

    resolver.async_resolve(url.host, url.port,
        [&](const asio::error_code& ec, tcp::resolver::results_type endpoints) {
            if (ec) { finish(ec); return; }
            asio::async_connect(socket, endpoints,
                [&](const asio::error_code& ec, const tcp::endpoint&) {
                    if (ec) { finish(ec); return; }
                    asio::async_write(socket, asio::buffer(wire),
                        [&](const asio::error_code& ec, std::size_t) {
                            if (ec) { finish(ec); return; }
                            // Connection: close, so the body ends at EOF
                            asio::async_read(socket, asio::dynamic_buffer(received),
                                [&](const asio::error_code& ec, std::size_t) {
                                    finish(ec == asio::error::eof ? asio::error_code() : ec);
                                });
                        });
                });
        });

    io.run();

    if (timed_out) {
        LOG_DEBUG("http", "%s %s timed out after %lld ms", request.method.c_str(), request.url.c_str(),
                  static_cast<long long>(request.timeout.count()));
        throw remote_error(remote_errc::timeout,
                           request.method + " " + request.url + " timed out after " +
                           std::to_string(request.timeout.count()) + " ms");
    }
    if (failure) {
        LOG_DEBUG("http", "%s %s failed: %s", request.method.c_str(), request.url.c_str(), failure.message().c_str());
        throw remote_error(remote_errc::connection,
                           request.method + " " + request.url + " failed: " + failure.message());
    }
    return parse_http_response(received);
}

// ============================================================================
// http_reachability_probe
// ============================================================================

http_reachability_probe::http_reachability_probe(std::shared_ptr<http_client> client, http_probe_config config)
    : client_(std::move(client)), config_(std::move(config)) {}

probe_result http_reachability_probe::probe(std::chrono::milliseconds timeout) {
    http_request request;
    request.method = "GET";
    request.url = config_.url;
    request.timeout = timeout;
    request.headers["Cache-Control"] = "no-cache";

    probe_result result;
    http_response response;
    try {
        response = client_->send(request);
    } catch (const remote_error& e) {
        result.detail = std::string(to_string(e.code())) + ": " + e.what();
        return result;
    }

    result.status_code = response.status_code;
    if (response.is_redirect()) {
        // Captive portals answer with a redirect to their login page
        result.detail = "redirected to " + response.header("location").value_or("<no location>");
        LOG_DEBUG("http", "Probe %s redirected: %s", config_.url.c_str(), result.detail.c_str());
        return result;
    }
    if (!response.is_success()) {
        result.detail = "HTTP " + std::to_string(response.status_code);
        return result;
    }
    if (config_.expected_marker && response.body_string().find(*config_.expected_marker) == std::string::npos) {
        result.detail = "response does not carry the expected marker";
        LOG_DEBUG("http", "Probe %s: 2xx without marker, treating as unreachable", config_.url.c_str());
        return result;
    }

    result.reachable = true;
    result.detail = "ok";
    return result;
}

// ============================================================================
// http_batch_pusher
// ============================================================================

std::string encode_push_request(const std::vector<push_item>& items) {
    json list = json::array();
    for (const auto& item : items) {
        list.push_back({
            {"idempotencyKey", item.idempotency_key},
            {"kind", item.kind},
            {"payload", item.payload},
        });
    }
    return json{{"items", list}}.dump();
}

std::vector<push_outcome> parse_push_response(const std::string& body) {
    json doc;
    try {
        doc = json::parse(body);
    } catch (const json::parse_error& e) {
        throw remote_error(remote_errc::protocol, std::string("Push response is not JSON: ") + e.what());
    }
    if (!doc.is_object() || !doc.contains("results") || !doc["results"].is_array()) {
        throw remote_error(remote_errc::protocol, "Push response has no results array");
    }

    std::vector<push_outcome> outcomes;
    for (const auto& r : doc["results"]) {
        if (!r.is_object() || !r.contains("idempotencyKey") || !r["idempotencyKey"].is_string()) {
            LOG_WARN("http", "Skipping push result without idempotencyKey: %s", r.dump().c_str());
            continue;
        }
        push_outcome outcome;
        outcome.idempotency_key = r["idempotencyKey"].get<std::string>();
        auto status = r.value("outcome", "");
        outcome.result = status == "success" ? push_result::success : push_result::failure;
        if (outcome.result == push_result::failure) {
            outcome.error_kind = r.contains("errorKind") && r["errorKind"].is_string()
                ? r["errorKind"].get<std::string>()
                : (status.empty() ? "missing_outcome" : "rejected");
        }
        outcomes.push_back(std::move(outcome));
    }
    return outcomes;
}

http_batch_pusher::http_batch_pusher(std::shared_ptr<http_client> client,
                                     std::string url,
                                     std::map<std::string, std::string> headers)
    : client_(std::move(client)), url_(std::move(url)), headers_(std::move(headers)) {}

std::vector<push_outcome> http_batch_pusher::push_batch(const std::vector<push_item>& items,
                                                        std::chrono::milliseconds timeout) {
    http_request request;
    request.method = "POST";
    request.url = url_;
    request.headers = headers_;
    request.timeout = timeout;
    request.set_json_body(encode_push_request(items));

    auto response = client_->send(request);
    if (!response.is_success()) {
        throw remote_error(remote_errc::protocol,
                           "Push to " + url_ + " answered HTTP " + std::to_string(response.status_code));
    }
    return parse_push_response(response.body_string());
}

} // namespace harbor
