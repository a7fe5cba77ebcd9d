#ifndef FETCHPP_RETRY_DELAY_SCHEDULER_HPP
#define FETCHPP_RETRY_DELAY_SCHEDULER_HPP

#include "fetchpp/error.hpp"
#include "fetchpp/retry/backoff_policy.hpp"
#include "fetchpp/retry/retry_options.hpp"
#include "fetchpp/timeout/timeout_options.hpp"

#include <asio/awaitable.hpp>

#include <chrono>
#include <memory>
#include <optional>

namespace fetchpp {

// ─────────────────────────────────────────────────────────────────────────────
// DelayScheduler
// ─────────────────────────────────────────────────────────────────────────────
// Turns an eligible outcome into a wait (or a stop):
//
//   1. Retry-After of the response, parsed as a wait from now
//   2. above the effective max_retry_after -> stop, strategy not consulted
//   3. computed_value from the built-in strategy
//   4. calculate_delay (if set) decides; 0 stops, > 0 is the wait
//   5. a throwing strategy or a negative / non-finite result is fatal
//
// The effective max_retry_after is the configured one or, when unset, the
// smaller of the request and connect timeouts (unbounded if neither is set).

class DelayScheduler {
public:
    DelayScheduler(
        const RetryOptions& retry,
        const TimeoutOptions& timeout,
        std::shared_ptr<IBackoffPolicy> backoff = nullptr
    );

    [[nodiscard]] asio::awaitable<Result<DelayDecision>> decide(RetryContext context);

    [[nodiscard]] std::optional<std::chrono::milliseconds> effective_max_retry_after() const noexcept {
        return max_retry_after_;
    }

    /// The built-in strategy; `context.retry_after` must already be filled.
    [[nodiscard]] double default_delay(const RetryContext& context);

private:
    const RetryOptions& retry_;
    std::optional<std::chrono::milliseconds> max_retry_after_;
    std::shared_ptr<IBackoffPolicy> backoff_;
};

}  // namespace fetchpp

#endif  // FETCHPP_RETRY_DELAY_SCHEDULER_HPP
