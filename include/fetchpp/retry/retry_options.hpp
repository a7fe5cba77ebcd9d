#ifndef FETCHPP_RETRY_RETRY_OPTIONS_HPP
#define FETCHPP_RETRY_RETRY_OPTIONS_HPP

#include "fetchpp/error.hpp"
#include "fetchpp/http/http_types.hpp"

#include <asio/awaitable.hpp>
#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace fetchpp {

// ─────────────────────────────────────────────────────────────────────────────
// RetryContext - input of a delay strategy
// ─────────────────────────────────────────────────────────────────────────────

struct RetryContext {
    // Ordinal of the attempt that just failed (1 for the first try).
    std::size_t attempt_count{1};

    // Error outcome; absent when the attempt produced a plain response.
    std::optional<RequestError> error;

    // Response outcome, when there was one.
    std::shared_ptr<const Response> response;

    // Parsed Retry-After, as a wait from now.
    std::optional<std::chrono::milliseconds> retry_after;

    // What the built-in strategy would wait (ms); 0 means it would stop.
    double computed_value{0.0};
};

/// Returns the wait in ms before the next attempt; 0 stops retrying.
/// Negative or non-finite values are rejected as a strategy failure.
using DelayStrategy = std::function<asio::awaitable<double>(RetryContext)>;

/// Adapt a synchronous strategy to the awaitable form.
[[nodiscard]] DelayStrategy make_delay_strategy(std::function<double(const RetryContext&)> strategy);

// ─────────────────────────────────────────────────────────────────────────────
// DelayDecision
// ─────────────────────────────────────────────────────────────────────────────

struct DelayDecision {
    std::chrono::milliseconds wait{0};

    [[nodiscard]] bool stop() const noexcept {
        return wait.count() == 0;
    }

    [[nodiscard]] static DelayDecision stop_retrying() noexcept {
        return DelayDecision{};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// RetryNotice - a retry is about to happen (or, for streams, may happen)
// ─────────────────────────────────────────────────────────────────────────────

struct RetryNotice {
    std::size_t next_ordinal{2};
    std::size_t retry_count{1};  // carry this into the next stream
    RequestError error;
    std::chrono::milliseconds delay{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// RetryOptions
// ─────────────────────────────────────────────────────────────────────────────
// Which outcomes are retried and how long to wait. An empty allow-list
// allows nothing in that dimension.
//
// Usage:
//   RetryOptions retry;
//   retry.with_limit(3)
//        .with_status_code(418)
//        .with_calculate_delay(make_delay_strategy(
//            [](const RetryContext& ctx) { return ctx.computed_value / 2; }));
//
// JSON forms:
//   2                                              -> limit with defaults
//   {"limit": 2, "methods": ["GET"], "statusCodes": [503],
//    "errorCodes": ["ECONNRESET"], "maxRetryAfter": 5000}

class RetryOptions {
public:
    RetryOptions()
        : limit_(2)
        , methods_{"GET", "PUT", "HEAD", "DELETE", "OPTIONS", "TRACE"}
        , status_codes_{408, 413, 429, 500, 502, 503, 504, 521, 522, 524}
        , error_codes_{
              "ETIMEDOUT", "ECONNRESET", "EADDRINUSE", "ECONNREFUSED",
              "EPIPE", "ENOTFOUND", "ENETUNREACH", "EAI_AGAIN"}
    {}

    // ─────────────────────────────────────────────────────────────────────────
    // Configuration (Builder Pattern)
    // ─────────────────────────────────────────────────────────────────────────

    /// Retries after the first attempt; 0 disables retrying.
    RetryOptions& with_limit(std::size_t limit) {
        limit_ = limit;
        return *this;
    }

    RetryOptions& with_methods(std::set<std::string> methods);

    RetryOptions& with_method(std::string_view method) {
        methods_.insert(normalize_method(method));
        return *this;
    }

    RetryOptions& with_status_codes(std::set<int> codes) {
        status_codes_ = std::move(codes);
        return *this;
    }

    RetryOptions& with_status_code(int code) {
        status_codes_.insert(code);
        return *this;
    }

    RetryOptions& without_status_code(int code) {
        status_codes_.erase(code);
        return *this;
    }

    RetryOptions& with_error_codes(std::set<std::string> codes) {
        error_codes_ = std::move(codes);
        return *this;
    }

    RetryOptions& with_error_code(std::string code) {
        error_codes_.insert(std::move(code));
        return *this;
    }

    /// Ceiling for a server-requested Retry-After; above it nothing is retried.
    RetryOptions& with_max_retry_after(std::chrono::milliseconds ceiling) {
        max_retry_after_ = ceiling;
        return *this;
    }

    RetryOptions& with_calculate_delay(DelayStrategy strategy) {
        calculate_delay_ = std::move(strategy);
        return *this;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Query Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::size_t limit() const noexcept {
        return limit_;
    }

    [[nodiscard]] const std::set<std::string>& methods() const noexcept {
        return methods_;
    }

    [[nodiscard]] const std::set<int>& status_codes() const noexcept {
        return status_codes_;
    }

    [[nodiscard]] const std::set<std::string>& error_codes() const noexcept {
        return error_codes_;
    }

    [[nodiscard]] std::optional<std::chrono::milliseconds> max_retry_after() const noexcept {
        return max_retry_after_;
    }

    /// Empty means the built-in strategy (RetryContext::computed_value).
    [[nodiscard]] const DelayStrategy& calculate_delay() const noexcept {
        return calculate_delay_;
    }

    [[nodiscard]] bool allows_method(std::string_view method) const {
        return methods_.contains(normalize_method(method));
    }

    [[nodiscard]] bool allows_status(int status_code) const {
        return status_codes_.contains(status_code);
    }

    [[nodiscard]] bool allows_error_code(const std::string& code) const {
        return error_codes_.contains(code);
    }

    /// Throws std::invalid_argument on a malformed document. Keys that are
    /// absent keep their defaults.
    [[nodiscard]] static RetryOptions from_json(const nlohmann::json& value);

private:
    std::size_t limit_;
    std::set<std::string> methods_;
    std::set<int> status_codes_;
    std::set<std::string> error_codes_;
    std::optional<std::chrono::milliseconds> max_retry_after_;
    DelayStrategy calculate_delay_;
};

}  // namespace fetchpp

#endif  // FETCHPP_RETRY_RETRY_OPTIONS_HPP
