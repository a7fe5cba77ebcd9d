#ifndef FETCHPP_CLIENT_CLIENT_CONFIG_HPP
#define FETCHPP_CLIENT_CLIENT_CONFIG_HPP

#include "fetchpp/http/http_types.hpp"
#include "fetchpp/retry/retry_options.hpp"
#include "fetchpp/timeout/timeout_options.hpp"
#include "fetchpp/transport/curl_transport.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstddef>
#include <string>

namespace fetchpp {

// ─────────────────────────────────────────────────────────────────────────────
// Client Configuration
// ─────────────────────────────────────────────────────────────────────────────
// Defaults for every request issued through one HttpClient. RequestOptions
// can override the per-request parts.
//
// JSON form (every key optional):
//   {
//     "baseUrl": "http://localhost:8080/api/",
//     "headers": {"Authorization": "Bearer ..."},
//     "retry": 2 | {"limit": 2, "statusCodes": [503], ...},
//     "timeout": 5000 | {"connect": 1000, "request": 30000},
//     "throwHttpErrors": true,
//     "followRedirect": true,
//     "maxRedirects": 10,
//     "methodRewriting": false,
//     "keepAlive": true,
//     "userAgent": "fetchpp/1.0",
//     "pool": {"maxIdle": 16, "maxPerOrigin": 0, "idleTimeout": 30000}
//   }

struct ClientConfig {
    // ─────────────────────────────────────────────────────────────────────────
    // Target
    // ─────────────────────────────────────────────────────────────────────────

    // Prefix for relative request URLs. Empty = request URLs must be absolute.
    std::string base_url;

    // Sent with every request; request headers win on conflict.
    HeaderMap default_headers;

    // ─────────────────────────────────────────────────────────────────────────
    // Retry & Timeouts
    // ─────────────────────────────────────────────────────────────────────────

    RetryOptions retry;
    TimeoutOptions timeout;

    // ─────────────────────────────────────────────────────────────────────────
    // Response Handling
    // ─────────────────────────────────────────────────────────────────────────

    // Non-2xx final responses fail with ErrorKind::HttpStatus.
    bool throw_http_errors{true};

    bool follow_redirect{true};
    std::size_t max_redirects{10};

    // Also turn 301/302 of non-GET/HEAD requests into GET (303 always does).
    bool method_rewriting{false};

    // ─────────────────────────────────────────────────────────────────────────
    // Connections
    // ─────────────────────────────────────────────────────────────────────────

    bool keep_alive{true};
    std::string user_agent{"fetchpp/1.0"};
    ConnectionPoolConfig pool;

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-Style Helpers
    // ─────────────────────────────────────────────────────────────────────────

    ClientConfig& with_base_url(std::string url);
    ClientConfig& with_header(const std::string& name, const std::string& value);
    ClientConfig& with_bearer_token(const std::string& token);
    ClientConfig& with_retry(RetryOptions options);
    ClientConfig& with_retry_limit(std::size_t limit);
    ClientConfig& with_timeout(TimeoutOptions options);
    ClientConfig& with_timeout(std::chrono::milliseconds inactivity);
    ClientConfig& with_throw_http_errors(bool enable);
    ClientConfig& with_follow_redirect(bool enable);
    ClientConfig& with_max_redirects(std::size_t limit);
    ClientConfig& with_method_rewriting(bool enable);
    ClientConfig& with_keep_alive(bool enable);

    /// The connection settings as CurlTransport takes them.
    [[nodiscard]] CurlTransportConfig transport_config() const;

    /// Throws std::invalid_argument on a malformed document.
    [[nodiscard]] static ClientConfig from_json(const nlohmann::json& value);
};

}  // namespace fetchpp

#endif  // FETCHPP_CLIENT_CLIENT_CONFIG_HPP
