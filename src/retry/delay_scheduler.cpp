#include "fetchpp/retry/delay_scheduler.hpp"
#include "fetchpp/log/logger.hpp"
#include "fetchpp/retry/retry_after.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <exception>

namespace fetchpp {

namespace {

std::optional<std::chrono::milliseconds> resolve_max_retry_after(
    const RetryOptions& retry,
    const TimeoutOptions& timeout
) {
    if (retry.max_retry_after().has_value()) {
        return retry.max_retry_after();
    }

    const auto request = timeout.get(TimeoutPhase::Request);
    const auto connect = timeout.get(TimeoutPhase::Connect);
    if (request.has_value() && connect.has_value()) {
        return std::min(*request, *connect);
    }
    if (request.has_value()) {
        return request;
    }
    return connect;
}

const Response* response_of(const RetryContext& context) {
    if (context.response) {
        return context.response.get();
    }
    if (context.error.has_value() && context.error->response) {
        return context.error->response.get();
    }
    return nullptr;
}

}  // namespace

DelayScheduler::DelayScheduler(
    const RetryOptions& retry,
    const TimeoutOptions& timeout,
    std::shared_ptr<IBackoffPolicy> backoff
)
    : retry_(retry)
    , max_retry_after_(resolve_max_retry_after(retry, timeout))
    , backoff_(backoff ? std::move(backoff) : std::make_shared<ExponentialBackoff>())
{}

double DelayScheduler::default_delay(const RetryContext& context) {
    const auto* response = response_of(context);
    if (response != nullptr) {
        const bool has_retry_after = context.retry_after.has_value() && context.retry_after->count() > 0;
        if (has_retry_after) {
            return static_cast<double>(context.retry_after->count());
        }
        // Payload Too Large without a hint: retrying the same body cannot help.
        if (response->status_code == 413) {
            return 0.0;
        }
    }
    return static_cast<double>(backoff_->next_delay(context.attempt_count).count());
}

asio::awaitable<Result<DelayDecision>> DelayScheduler::decide(RetryContext context) {
    const auto* response = response_of(context);
    if (response != nullptr) {
        context.retry_after = retry_after_of(*response);
    }

    if (context.retry_after.has_value() && max_retry_after_.has_value()) {
        const bool too_long = (*context.retry_after > *max_retry_after_);
        if (too_long) {
            FETCHPP_LOG_DEBUG(Retry, "Not retrying: Retry-After {}ms exceeds maxRetryAfter {}ms",
                context.retry_after->count(), max_retry_after_->count());
            co_return DelayDecision::stop_retrying();
        }
    }

    context.computed_value = default_delay(context);

    double value = context.computed_value;
    auto strategy = retry_.calculate_delay();
    if (strategy) {
        try {
            value = co_await strategy(context);
        } catch (...) {
            auto error = RequestError::strategy_threw(std::current_exception());
            FETCHPP_LOG_ERROR(Retry, "Retry strategy threw: {}", error.message);
            co_return tl::unexpected(std::move(error));
        }
    }

    const bool valid = std::isfinite(value) && (value >= 0.0);
    if (valid == false) {
        auto error = RequestError::strategy_invalid(
            fmt::format("Retry strategy returned an invalid delay: {}", value));
        FETCHPP_LOG_ERROR(Retry, "{}", error.message);
        co_return tl::unexpected(std::move(error));
    }

    if (value == 0.0) {
        FETCHPP_LOG_DEBUG(Retry, "Not retrying: strategy returned 0 after attempt {}", context.attempt_count);
        co_return DelayDecision::stop_retrying();
    }

    constexpr double kLongestWait = 1e12;  // ~31 years, fits a steady_clock deadline
    const auto wait = std::chrono::milliseconds{static_cast<std::int64_t>(std::ceil(std::min(value, kLongestWait)))};
    co_return DelayDecision{wait};
}

}  // namespace fetchpp
