#ifndef FETCHPP_CLIENT_REQUEST_OPTIONS_HPP
#define FETCHPP_CLIENT_REQUEST_OPTIONS_HPP

#include "fetchpp/http/http_types.hpp"
#include "fetchpp/http/request_body.hpp"
#include "fetchpp/retry/retry_options.hpp"
#include "fetchpp/timeout/timeout_options.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace fetchpp {

// ─────────────────────────────────────────────────────────────────────────────
// Hooks
// ─────────────────────────────────────────────────────────────────────────────

/// An exchange of an attempt got its connection (including redirect hops).
struct AttemptInfo {
    std::size_t ordinal{1};
    std::string url;
    std::string method;
    std::uint64_t connection_id{0};
    bool reused_connection{false};
};

struct RequestHooks {
    // Runs after the delay was decided and before the wait starts.
    std::function<void(const RetryNotice&)> before_retry;

    std::function<void(const AttemptInfo&)> on_request;
};

// ─────────────────────────────────────────────────────────────────────────────
// RequestOptions
// ─────────────────────────────────────────────────────────────────────────────
// One request. Unset optionals fall back to the ClientConfig.
//
// Usage:
//   RequestOptions options;
//   options.with_method("PUT")
//          .with_url("/items/42")
//          .with_body(R"({"name": "x"})")
//          .with_header("Content-Type", "application/json")
//          .with_retry(RetryOptions{}.with_limit(5));

struct RequestOptions {
    std::string method{"GET"};

    // Absolute, or relative to ClientConfig::base_url.
    std::string url;

    HeaderMap headers;
    RequestBody body;

    std::optional<RetryOptions> retry;
    std::optional<TimeoutOptions> timeout;
    std::optional<bool> throw_http_errors;
    std::optional<bool> follow_redirect;
    std::optional<std::size_t> max_redirects;

    RequestHooks hooks;

    RequestOptions& with_method(std::string value) {
        method = std::move(value);
        return *this;
    }

    RequestOptions& with_url(std::string value) {
        url = std::move(value);
        return *this;
    }

    RequestOptions& with_header(std::string_view name, std::string value) {
        set_header(headers, name, std::move(value));
        return *this;
    }

    RequestOptions& with_body(RequestBody value) {
        body = std::move(value);
        return *this;
    }

    RequestOptions& with_retry(RetryOptions value) {
        retry = std::move(value);
        return *this;
    }

    RequestOptions& with_timeout(TimeoutOptions value) {
        timeout = value;
        return *this;
    }

    RequestOptions& with_throw_http_errors(bool value) {
        throw_http_errors = value;
        return *this;
    }

    RequestOptions& with_follow_redirect(bool value) {
        follow_redirect = value;
        return *this;
    }

    RequestOptions& with_max_redirects(std::size_t value) {
        max_redirects = value;
        return *this;
    }

    RequestOptions& with_before_retry(std::function<void(const RetryNotice&)> hook) {
        hooks.before_retry = std::move(hook);
        return *this;
    }

    RequestOptions& with_on_request(std::function<void(const AttemptInfo&)> hook) {
        hooks.on_request = std::move(hook);
        return *this;
    }
};

}  // namespace fetchpp

#endif  // FETCHPP_CLIENT_REQUEST_OPTIONS_HPP
