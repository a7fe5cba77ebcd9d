#ifndef FETCHPP_ERROR_HPP
#define FETCHPP_ERROR_HPP

#include "fetchpp/http/http_types.hpp"
#include "fetchpp/timeout/timeout_options.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace fetchpp {

// ─────────────────────────────────────────────────────────────────────────────
// TransportError
// ─────────────────────────────────────────────────────────────────────────────
// Low-level failure reported by a transport. `code` uses the conventional
// errno-style names (ECONNREFUSED, ECONNRESET, ...) so that retry
// allow-lists can match them directly.

struct TransportError {
    std::string code;
    std::string message;

    [[nodiscard]] static TransportError aborted() {
        return {"ERR_ABORTED", "Exchange aborted"};
    }
};

template <typename T>
using TransportResult = tl::expected<T, TransportError>;

// ─────────────────────────────────────────────────────────────────────────────
// RequestError
// ─────────────────────────────────────────────────────────────────────────────

enum class ErrorKind {
    Timeout,         // a phase deadline elapsed
    Transport,       // network failure, pass-through code
    HttpStatus,      // non-2xx response with throw_http_errors
    Strategy,        // calculate_delay threw or returned an invalid value
    Cancelled,       // AbortSignal fired
    MaxRedirects,    // redirect chain too long
    InvalidRequest   // unusable URL or options
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Timeout:        return "Timeout";
        case ErrorKind::Transport:      return "Transport";
        case ErrorKind::HttpStatus:     return "HttpStatus";
        case ErrorKind::Strategy:       return "Strategy";
        case ErrorKind::Cancelled:      return "Cancelled";
        case ErrorKind::MaxRedirects:   return "MaxRedirects";
        case ErrorKind::InvalidRequest: return "InvalidRequest";
    }
    return "Unknown";
}

inline constexpr std::string_view kTimeoutErrorCode = "ETIMEDOUT";

struct RequestError {
    ErrorKind kind{ErrorKind::Transport};
    std::string code;
    std::string message;

    // Timeout failures
    std::optional<TimeoutPhase> phase;
    std::chrono::milliseconds timeout{0};

    // HttpStatus failures; the full response including its body
    std::shared_ptr<const Response> response;

    // Strategy failures; the exception the strategy threw, if it threw
    std::exception_ptr cause;

    [[nodiscard]] bool is(ErrorKind k) const noexcept {
        return kind == k;
    }

    [[nodiscard]] std::optional<int> status_code() const {
        if (response) {
            return response->status_code;
        }
        return std::nullopt;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static RequestError timed_out(TimeoutPhase phase, std::chrono::milliseconds timeout);
    [[nodiscard]] static RequestError transport(const TransportError& error);
    [[nodiscard]] static RequestError http_status(Response response);
    [[nodiscard]] static RequestError strategy_threw(std::exception_ptr cause);
    [[nodiscard]] static RequestError strategy_invalid(std::string message);
    [[nodiscard]] static RequestError cancelled();
    [[nodiscard]] static RequestError max_redirects(std::size_t limit);
    [[nodiscard]] static RequestError invalid_request(std::string message);
};

template <typename T>
using Result = tl::expected<T, RequestError>;

}  // namespace fetchpp

#endif  // FETCHPP_ERROR_HPP
