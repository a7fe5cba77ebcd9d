#ifndef FETCHPP_TIMEOUT_TIMEOUT_COMPOSER_HPP
#define FETCHPP_TIMEOUT_TIMEOUT_COMPOSER_HPP

#include "fetchpp/error.hpp"
#include "fetchpp/timeout/timeout_options.hpp"
#include "fetchpp/timeout/timer.hpp"
#include "fetchpp/transport/transport.hpp"

#include <array>
#include <functional>
#include <memory>
#include <optional>

namespace fetchpp {

// ─────────────────────────────────────────────────────────────────────────────
// TimeoutComposer
// ─────────────────────────────────────────────────────────────────────────────
// Combines the per-phase deadlines of one exchange into a single verdict.
//
// Phase timeline, driven by transport events:
//
//   start()            arm request
//   Socket (fresh)     arm socket, arm lookup
//   Socket (reused)    arm socket, arm send
//   Lookup             lookup  -> connect
//   Connect            connect -> secureConnect (https) or send
//   SecureConnect      secureConnect -> send
//   Upload             send -> response
//   Response           response -> read
//   End                complete()
//
// Every event also rearms the socket (inactivity) deadline. The first timer
// to fire disarms the others, records the failure and invokes `on_timeout`
// (which must abort the exchange synchronously). Nothing is armed for a
// phase without a configured duration.
//
// Usage:
//   TimeoutComposer timeouts(options, timer_factory, url.is_secure(),
//                            [&] { exchange->abort(); });
//   auto exchange = transport.open([&](const TransportEvent& e) { timeouts.on_event(e); });
//   timeouts.start();
//   ... co_await exchange->send(...) ...
//   timeouts.complete();

class TimeoutComposer {
public:
    TimeoutComposer(
        TimeoutOptions options,
        ITimerFactory& timers,
        bool secure,
        std::function<void()> on_timeout
    );

    ~TimeoutComposer();

    TimeoutComposer(const TimeoutComposer&) = delete;
    TimeoutComposer& operator=(const TimeoutComposer&) = delete;

    void start();

    void on_event(const TransportEvent& event);

    /// The exchange finished (or was abandoned); disarm everything.
    void complete() noexcept;

    [[nodiscard]] bool fired() const noexcept {
        return failure_.has_value();
    }

    /// Phase-tagged timeout failure, once a deadline elapsed.
    [[nodiscard]] const std::optional<RequestError>& failure() const noexcept {
        return failure_;
    }

    [[nodiscard]] bool is_armed(TimeoutPhase phase) const noexcept;

private:
    void arm(TimeoutPhase phase);
    void disarm(TimeoutPhase phase) noexcept;
    void disarm_all() noexcept;
    void fire(TimeoutPhase phase);

    TimeoutOptions options_;
    bool secure_;
    std::function<void()> on_timeout_;
    std::array<std::unique_ptr<ITimer>, kTimeoutPhaseCount> timers_;
    std::optional<RequestError> failure_;
    bool finished_{false};
};

}  // namespace fetchpp

#endif  // FETCHPP_TIMEOUT_TIMEOUT_COMPOSER_HPP
