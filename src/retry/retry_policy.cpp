#include "fetchpp/retry/retry_policy.hpp"

namespace fetchpp {

namespace {

bool never_retried(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Timeout:
        case ErrorKind::Transport:
        case ErrorKind::HttpStatus:
            return false;

        case ErrorKind::Strategy:
        case ErrorKind::Cancelled:
        case ErrorKind::MaxRedirects:
        case ErrorKind::InvalidRequest:
            return true;
    }
    return true;
}

}  // namespace

RetryVerdict RetryPolicyEvaluator::evaluate(
    std::size_t ordinal,
    std::string_view method,
    const RetryContext& outcome,
    bool body_replayable
) const {
    if (outcome.error.has_value() && never_retried(outcome.error->kind)) {
        return RetryVerdict::NeverRetried;
    }

    // ordinal counts attempts from 1; retries so far = ordinal - 1
    const bool within_limit = (ordinal - 1 < options_.limit());
    if (within_limit == false) {
        return RetryVerdict::LimitReached;
    }

    if (options_.allows_method(method) == false) {
        return RetryVerdict::MethodNotAllowed;
    }

    // A status failure is judged by its status; network failures by their code.
    const auto* response = outcome.response.get();
    if (response == nullptr && outcome.error.has_value() && outcome.error->response) {
        response = outcome.error->response.get();
    }

    if (response != nullptr) {
        if (options_.allows_status(response->status_code) == false) {
            return RetryVerdict::StatusNotAllowed;
        }
    } else if (outcome.error.has_value()) {
        if (options_.allows_error_code(outcome.error->code) == false) {
            return RetryVerdict::ErrorCodeNotAllowed;
        }
    }

    if (body_replayable == false) {
        return RetryVerdict::BodyNotReplayable;
    }

    return RetryVerdict::Eligible;
}

}  // namespace fetchpp
