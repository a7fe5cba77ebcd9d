#include "fetchpp/error.hpp"

#include <fmt/format.h>

#include <stdexcept>

namespace fetchpp {

RequestError RequestError::timed_out(TimeoutPhase phase, std::chrono::milliseconds timeout) {
    RequestError error;
    error.kind = ErrorKind::Timeout;
    error.code = std::string(kTimeoutErrorCode);
    error.message = fmt::format("Timeout awaiting '{}' for {}ms", to_string(phase), timeout.count());
    error.phase = phase;
    error.timeout = timeout;
    return error;
}

RequestError RequestError::transport(const TransportError& error) {
    RequestError result;
    result.kind = ErrorKind::Transport;
    result.code = error.code;
    result.message = error.message;
    return result;
}

RequestError RequestError::http_status(Response response) {
    RequestError error;
    error.kind = ErrorKind::HttpStatus;
    error.code = "ERR_NON_2XX_3XX_RESPONSE";
    error.message = fmt::format("Response code {} ({})",
        response.status_code,
        response.status_message.empty() ? std::string(reason_phrase(response.status_code))
                                        : response.status_message);
    error.response = std::make_shared<const Response>(std::move(response));
    return error;
}

RequestError RequestError::strategy_threw(std::exception_ptr cause) {
    RequestError error;
    error.kind = ErrorKind::Strategy;
    error.code = "ERR_RETRY_STRATEGY";
    error.cause = cause;
    try {
        std::rethrow_exception(cause);
    } catch (const std::exception& e) {
        error.message = e.what();
    } catch (...) {
        error.message = "Retry strategy threw a non-standard exception";
    }
    return error;
}

RequestError RequestError::strategy_invalid(std::string message) {
    RequestError error;
    error.kind = ErrorKind::Strategy;
    error.code = "ERR_RETRY_STRATEGY";
    error.message = std::move(message);
    error.cause = std::make_exception_ptr(std::invalid_argument(error.message));
    return error;
}

RequestError RequestError::cancelled() {
    RequestError error;
    error.kind = ErrorKind::Cancelled;
    error.code = "ERR_CANCELED";
    error.message = "Request was cancelled";
    return error;
}

RequestError RequestError::max_redirects(std::size_t limit) {
    RequestError error;
    error.kind = ErrorKind::MaxRedirects;
    error.code = "ERR_TOO_MANY_REDIRECTS";
    error.message = fmt::format("Redirected {} times. Aborting.", limit);
    return error;
}

RequestError RequestError::invalid_request(std::string message) {
    RequestError error;
    error.kind = ErrorKind::InvalidRequest;
    error.code = "ERR_INVALID_REQUEST";
    error.message = std::move(message);
    return error;
}

}  // namespace fetchpp
