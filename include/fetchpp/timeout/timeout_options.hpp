#ifndef FETCHPP_TIMEOUT_TIMEOUT_OPTIONS_HPP
#define FETCHPP_TIMEOUT_TIMEOUT_OPTIONS_HPP

#include <nlohmann/json_fwd.hpp>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace fetchpp {

// ─────────────────────────────────────────────────────────────────────────────
// TimeoutPhase
// ─────────────────────────────────────────────────────────────────────────────
// Stages of one network exchange that can carry their own deadline.

enum class TimeoutPhase : std::uint8_t {
    Lookup,         // address resolution
    Connect,        // TCP handshake
    SecureConnect,  // TLS handshake
    Socket,         // inactivity: rearmed on every progress event
    Send,           // writing the request
    Response,       // waiting for the response head
    Read,           // downloading the body
    Request         // the whole exchange
};

inline constexpr std::size_t kTimeoutPhaseCount = 8;

inline constexpr std::array<TimeoutPhase, kTimeoutPhaseCount> kAllTimeoutPhases{
    TimeoutPhase::Lookup,   TimeoutPhase::Connect,  TimeoutPhase::SecureConnect,
    TimeoutPhase::Socket,   TimeoutPhase::Send,     TimeoutPhase::Response,
    TimeoutPhase::Read,     TimeoutPhase::Request,
};

/// Names as they appear in configuration and timeout messages.
[[nodiscard]] constexpr std::string_view to_string(TimeoutPhase phase) noexcept {
    switch (phase) {
        case TimeoutPhase::Lookup:        return "lookup";
        case TimeoutPhase::Connect:       return "connect";
        case TimeoutPhase::SecureConnect: return "secureConnect";
        case TimeoutPhase::Socket:        return "socket";
        case TimeoutPhase::Send:          return "send";
        case TimeoutPhase::Response:      return "response";
        case TimeoutPhase::Read:          return "read";
        case TimeoutPhase::Request:       return "request";
    }
    return "unknown";
}

[[nodiscard]] std::optional<TimeoutPhase> parse_timeout_phase(std::string_view name) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// TimeoutOptions
// ─────────────────────────────────────────────────────────────────────────────
// Phase -> deadline. A phase without a value is never armed.
//
// JSON forms:
//   300                                  -> socket inactivity of 300ms
//   {"connect": 1000, "response": 5000}  -> per phase

class TimeoutOptions {
public:
    TimeoutOptions() = default;

    /// The bare-number shorthand: one inactivity deadline.
    [[nodiscard]] static TimeoutOptions inactivity(std::chrono::milliseconds timeout) {
        return TimeoutOptions{}.with(TimeoutPhase::Socket, timeout);
    }

    TimeoutOptions& with(TimeoutPhase phase, std::chrono::milliseconds timeout) {
        phases_[static_cast<std::size_t>(phase)] = timeout;
        return *this;
    }

    TimeoutOptions& without(TimeoutPhase phase) {
        phases_[static_cast<std::size_t>(phase)].reset();
        return *this;
    }

    [[nodiscard]] std::optional<std::chrono::milliseconds> get(TimeoutPhase phase) const noexcept {
        return phases_[static_cast<std::size_t>(phase)];
    }

    [[nodiscard]] bool has(TimeoutPhase phase) const noexcept {
        return phases_[static_cast<std::size_t>(phase)].has_value();
    }

    [[nodiscard]] bool empty() const noexcept;

    /// Throws std::invalid_argument for negative values, unknown phase names
    /// or a document that is neither a number nor an object.
    [[nodiscard]] static TimeoutOptions from_json(const nlohmann::json& value);

private:
    std::array<std::optional<std::chrono::milliseconds>, kTimeoutPhaseCount> phases_{};
};

}  // namespace fetchpp

#endif  // FETCHPP_TIMEOUT_TIMEOUT_OPTIONS_HPP
