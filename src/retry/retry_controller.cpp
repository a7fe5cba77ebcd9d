#include "fetchpp/retry/retry_controller.hpp"
#include "fetchpp/abort_signal.hpp"
#include "fetchpp/log/logger.hpp"

#include <asio/redirect_error.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>

namespace fetchpp {

asio::awaitable<Result<std::optional<RetryNotice>>> RetryController::consider(
    const Attempt& attempt,
    RetryContext outcome,
    bool body_replayable
) {
    outcome.attempt_count = attempt.ordinal;

    const auto verdict = evaluator_.evaluate(attempt.ordinal, attempt.method, outcome, body_replayable);
    if (verdict != RetryVerdict::Eligible) {
        FETCHPP_LOG_DEBUG(Retry, "Not retrying attempt {} of {} {}: {}",
            attempt.ordinal, attempt.method, attempt.url, to_string(verdict));
        co_return std::optional<RetryNotice>{};
    }

    auto decision = co_await scheduler_.decide(outcome);
    if (!decision) {
        co_return tl::unexpected(decision.error());
    }
    if (decision->stop()) {
        co_return std::optional<RetryNotice>{};
    }

    RetryNotice notice;
    notice.next_ordinal = attempt.ordinal + 1;
    notice.retry_count = attempt.ordinal;
    notice.delay = decision->wait;
    if (outcome.error.has_value()) {
        notice.error = std::move(*outcome.error);
    } else if (outcome.response) {
        notice.error = RequestError::http_status(*outcome.response);
    }

    FETCHPP_LOG_INFO(Retry, "Retrying {} {} in {}ms (retry {}/{}): {}",
        attempt.method, attempt.url, notice.delay.count(),
        notice.retry_count, evaluator_.options().limit(), notice.error.message);

    co_return std::optional<RetryNotice>{std::move(notice)};
}

asio::awaitable<bool> wait_before_retry(
    asio::any_io_executor executor,
    std::chrono::milliseconds delay,
    AbortSignal* signal
) {
    if (signal != nullptr && signal->aborted()) {
        co_return false;
    }

    asio::steady_timer timer(executor, delay);
    AbortSubscription subscription(signal, [&timer]() { timer.cancel(); });

    asio::error_code ec;
    co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));

    const bool cancelled = (signal != nullptr && signal->aborted());
    co_return cancelled == false;
}

}  // namespace fetchpp
