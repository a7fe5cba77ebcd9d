#ifndef FETCHPP_RETRY_RETRY_CONTROLLER_HPP
#define FETCHPP_RETRY_RETRY_CONTROLLER_HPP

#include "fetchpp/retry/attempt_tracker.hpp"
#include "fetchpp/retry/backoff_policy.hpp"
#include "fetchpp/retry/delay_scheduler.hpp"
#include "fetchpp/retry/retry_options.hpp"
#include "fetchpp/retry/retry_policy.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <chrono>
#include <memory>
#include <optional>

namespace fetchpp {

class AbortSignal;

// ─────────────────────────────────────────────────────────────────────────────
// RetryController
// ─────────────────────────────────────────────────────────────────────────────
// Evaluation followed by scheduling, as one step. The buffered client waits
// and loops on a notice; ResponseStream waits and hands it to its caller.
//
//   consider() -> error       strategy failure, terminal
//              -> nullopt     not retried; surface the outcome unchanged
//              -> RetryNotice retry after notice.delay

class RetryController {
public:
    RetryController(
        const RetryOptions& retry,
        const TimeoutOptions& timeout,
        std::shared_ptr<IBackoffPolicy> backoff = nullptr
    )
        : evaluator_(retry)
        , scheduler_(retry, timeout, std::move(backoff))
    {}

    [[nodiscard]] asio::awaitable<Result<std::optional<RetryNotice>>> consider(
        const Attempt& attempt,
        RetryContext outcome,
        bool body_replayable
    );

    [[nodiscard]] const RetryPolicyEvaluator& evaluator() const noexcept {
        return evaluator_;
    }

    [[nodiscard]] DelayScheduler& scheduler() noexcept {
        return scheduler_;
    }

private:
    RetryPolicyEvaluator evaluator_;
    DelayScheduler scheduler_;
};

/// Sleep before the next attempt. false when `signal` fired meanwhile.
[[nodiscard]] asio::awaitable<bool> wait_before_retry(
    asio::any_io_executor executor,
    std::chrono::milliseconds delay,
    AbortSignal* signal
);

}  // namespace fetchpp

#endif  // FETCHPP_RETRY_RETRY_CONTROLLER_HPP
