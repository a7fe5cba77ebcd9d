#include "fetchpp/client/client_config.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace fetchpp {

ClientConfig& ClientConfig::with_base_url(std::string url) {
    base_url = std::move(url);
    return *this;
}

ClientConfig& ClientConfig::with_header(const std::string& name, const std::string& value) {
    set_header(default_headers, name, value);
    return *this;
}

ClientConfig& ClientConfig::with_bearer_token(const std::string& token) {
    return with_header("Authorization", "Bearer " + token);
}

ClientConfig& ClientConfig::with_retry(RetryOptions options) {
    retry = std::move(options);
    return *this;
}

ClientConfig& ClientConfig::with_retry_limit(std::size_t limit) {
    retry.with_limit(limit);
    return *this;
}

ClientConfig& ClientConfig::with_timeout(TimeoutOptions options) {
    timeout = options;
    return *this;
}

ClientConfig& ClientConfig::with_timeout(std::chrono::milliseconds inactivity) {
    timeout = TimeoutOptions::inactivity(inactivity);
    return *this;
}

ClientConfig& ClientConfig::with_throw_http_errors(bool enable) {
    throw_http_errors = enable;
    return *this;
}

ClientConfig& ClientConfig::with_follow_redirect(bool enable) {
    follow_redirect = enable;
    return *this;
}

ClientConfig& ClientConfig::with_max_redirects(std::size_t limit) {
    max_redirects = limit;
    return *this;
}

ClientConfig& ClientConfig::with_method_rewriting(bool enable) {
    method_rewriting = enable;
    return *this;
}

ClientConfig& ClientConfig::with_keep_alive(bool enable) {
    keep_alive = enable;
    return *this;
}

CurlTransportConfig ClientConfig::transport_config() const {
    CurlTransportConfig transport;
    transport.keep_alive = keep_alive;
    transport.user_agent = user_agent;
    transport.pool = pool;
    return transport;
}

ClientConfig ClientConfig::from_json(const nlohmann::json& value) {
    if (value.is_object() == false) {
        throw std::invalid_argument("client config must be an object");
    }

    ClientConfig config;
    try {
        if (value.contains("baseUrl")) {
            config.base_url = value.at("baseUrl").get<std::string>();
        }
        if (value.contains("headers")) {
            for (const auto& [name, header] : value.at("headers").items()) {
                config.with_header(name, header.get<std::string>());
            }
        }
        if (value.contains("retry")) {
            config.retry = RetryOptions::from_json(value.at("retry"));
        }
        if (value.contains("timeout")) {
            config.timeout = TimeoutOptions::from_json(value.at("timeout"));
        }

        config.throw_http_errors = value.value("throwHttpErrors", config.throw_http_errors);
        config.follow_redirect = value.value("followRedirect", config.follow_redirect);
        config.max_redirects = value.value("maxRedirects", config.max_redirects);
        config.method_rewriting = value.value("methodRewriting", config.method_rewriting);
        config.keep_alive = value.value("keepAlive", config.keep_alive);
        config.user_agent = value.value("userAgent", config.user_agent);

        if (value.contains("pool")) {
            const auto& pool = value.at("pool");
            config.pool.max_idle_connections = pool.value("maxIdle", config.pool.max_idle_connections);
            config.pool.max_per_origin = pool.value("maxPerOrigin", config.pool.max_per_origin);
            if (pool.contains("idleTimeout")) {
                config.pool.idle_timeout = std::chrono::milliseconds{pool.at("idleTimeout").get<std::int64_t>()};
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Invalid client config: ") + e.what());
    }

    return config;
}

}  // namespace fetchpp
