#pragma once

#include "fetchpp/abort_signal.hpp"
#include "fetchpp/client/request_options.hpp"
#include "fetchpp/error.hpp"
#include "fetchpp/retry/retry_options.hpp"

#include <asio/awaitable.hpp>

#include <cstddef>
#include <functional>
#include <string_view>

namespace fetchpp {

class HttpClient;
class AttemptRunner;
class AttemptTracker;
class RetryController;
struct PreparedRequest;

// ═══════════════════════════════════════════════════════════════════════════
// ResponseStream
// ═══════════════════════════════════════════════════════════════════════════
// A single attempt whose body is delivered as it arrives. Retry decisions
// are the same as for buffered requests, but an eligible outcome is not
// retried here: after the scheduled delay the stream emits `retry` and
// stops. The caller drives the retry by running a new stream that carries
// RetryNotice::retry_count forward.
//
// Events:
//   response  head received (Response without body)
//   data      body chunk
//   retry     a retry is due now; nothing else follows
//   error     terminal failure; nothing else follows
//   end       body complete
//
// Once a data chunk was delivered the attempt is never retried. Non-2xx
// responses are collected internally (never emitted as data) until the retry
// decision is made. Without a retry handler, retry-eligible failures
// surface as errors.
//
// Usage:
//   std::size_t retry_count = 0;
//   bool again = true;
//   while (again) {
//       again = false;
//       auto stream = client.stream(options, retry_count);
//       stream.on_data([&](std::string_view chunk) { out << chunk; })
//             .on_retry([&](const RetryNotice& notice) {
//                 retry_count = notice.retry_count;
//                 again = true;
//             })
//             .on_error([](const RequestError& e) { std::cerr << e.message; });
//       co_await stream.run();
//   }

class ResponseStream {
public:
    using ResponseHandler = std::function<void(const Response&)>;
    using DataHandler = std::function<void(std::string_view)>;
    using RetryHandler = std::function<void(const RetryNotice&)>;
    using ErrorHandler = std::function<void(const RequestError&)>;
    using EndHandler = std::function<void()>;

    ResponseStream(
        HttpClient& client,
        RequestOptions options,
        std::size_t retry_count = 0,
        AbortSignal* signal = nullptr
    );

    ResponseStream& on_response(ResponseHandler handler) {
        on_response_ = std::move(handler);
        return *this;
    }

    ResponseStream& on_data(DataHandler handler) {
        on_data_ = std::move(handler);
        return *this;
    }

    ResponseStream& on_retry(RetryHandler handler) {
        on_retry_ = std::move(handler);
        return *this;
    }

    ResponseStream& on_error(ErrorHandler handler) {
        on_error_ = std::move(handler);
        return *this;
    }

    ResponseStream& on_end(EndHandler handler) {
        on_end_ = std::move(handler);
        return *this;
    }

    /// Drive the attempt to its last event. Runs once.
    [[nodiscard]] asio::awaitable<void> run();

    /// Retries performed before this stream's attempt.
    [[nodiscard]] std::size_t retry_count() const noexcept {
        return retry_count_;
    }

    /// Whether body bytes reached the data handler.
    [[nodiscard]] bool delivered() const noexcept {
        return delivered_;
    }

private:
    asio::awaitable<void> retry_or_fail(
        PreparedRequest& request,
        AttemptTracker& tracker,
        RetryController& retries,
        RetryContext outcome
    );

    void fail(const RequestError& error);
    void deliver(const Response& response);

    HttpClient& client_;
    RequestOptions options_;
    std::size_t retry_count_;
    AbortSignal* signal_;

    ResponseHandler on_response_;
    DataHandler on_data_;
    RetryHandler on_retry_;
    ErrorHandler on_error_;
    EndHandler on_end_;

    bool started_{false};
    bool delivered_{false};
};

}  // namespace fetchpp
