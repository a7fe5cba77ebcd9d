#ifndef FETCHPP_RETRY_RETRY_POLICY_HPP
#define FETCHPP_RETRY_RETRY_POLICY_HPP

#include "fetchpp/retry/retry_options.hpp"

#include <cstddef>
#include <string_view>

namespace fetchpp {

// ─────────────────────────────────────────────────────────────────────────────
// RetryVerdict
// ─────────────────────────────────────────────────────────────────────────────

enum class RetryVerdict {
    Eligible,
    LimitReached,         // ordinal >= limit + 1
    MethodNotAllowed,
    ErrorCodeNotAllowed,
    StatusNotAllowed,
    BodyNotReplayable,    // the body was a one-shot stream
    NeverRetried          // strategy failure, cancellation, redirect loop, bad request
};

[[nodiscard]] constexpr std::string_view to_string(RetryVerdict verdict) noexcept {
    switch (verdict) {
        case RetryVerdict::Eligible:            return "eligible";
        case RetryVerdict::LimitReached:        return "retry limit reached";
        case RetryVerdict::MethodNotAllowed:    return "method not retryable";
        case RetryVerdict::ErrorCodeNotAllowed: return "error code not retryable";
        case RetryVerdict::StatusNotAllowed:    return "status code not retryable";
        case RetryVerdict::BodyNotReplayable:   return "request body cannot be replayed";
        case RetryVerdict::NeverRetried:        return "failure is never retried";
    }
    return "unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// RetryPolicyEvaluator
// ─────────────────────────────────────────────────────────────────────────────
// Decides *whether* an outcome may be retried; DelayScheduler decides *how
// long* to wait (and may still stop). Shared by the buffered client and
// ResponseStream so both modes make identical decisions.
//
// Usage:
//   RetryPolicyEvaluator evaluator(options.retry);
//   const auto verdict = evaluator.evaluate(attempt.ordinal, attempt.method,
//                                           context, body.is_replayable());
//   if (verdict == RetryVerdict::Eligible) { ... ask the scheduler ... }

class RetryPolicyEvaluator {
public:
    explicit RetryPolicyEvaluator(const RetryOptions& options)
        : options_(options) {}

    /// `outcome` carries the error and/or the non-2xx response of the attempt
    /// with ordinal `ordinal`.
    [[nodiscard]] RetryVerdict evaluate(
        std::size_t ordinal,
        std::string_view method,
        const RetryContext& outcome,
        bool body_replayable
    ) const;

    [[nodiscard]] const RetryOptions& options() const noexcept {
        return options_;
    }

private:
    const RetryOptions& options_;
};

}  // namespace fetchpp

#endif  // FETCHPP_RETRY_RETRY_POLICY_HPP
