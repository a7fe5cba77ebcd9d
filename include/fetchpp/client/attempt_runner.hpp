#ifndef FETCHPP_CLIENT_ATTEMPT_RUNNER_HPP
#define FETCHPP_CLIENT_ATTEMPT_RUNNER_HPP

#include "fetchpp/abort_signal.hpp"
#include "fetchpp/client/redirect_handler.hpp"
#include "fetchpp/client/request_options.hpp"
#include "fetchpp/error.hpp"
#include "fetchpp/retry/attempt_tracker.hpp"
#include "fetchpp/timeout/timer.hpp"
#include "fetchpp/transport/transport.hpp"

#include <asio/awaitable.hpp>

#include <memory>
#include <optional>
#include <string>

namespace fetchpp {

// ─────────────────────────────────────────────────────────────────────────────
// PreparedRequest
// ─────────────────────────────────────────────────────────────────────────────
// RequestOptions merged with the client defaults. url/method/body track the
// current target: a followed redirect rewrites them, so a retry goes to the
// last URL of the chain.

struct PreparedRequest {
    std::string method;
    Url url;
    HeaderMap headers;
    RequestBody body;

    RetryOptions retry;
    TimeoutOptions timeout;
    bool throw_http_errors{true};
    bool follow_redirect{true};
    std::size_t max_redirects{10};
    bool method_rewriting{false};

    RequestHooks hooks;
};

/// Final statuses that count as success: 2xx, 304, and 3xx when redirects
/// are not followed.
[[nodiscard]] constexpr bool is_response_ok(int status_code, bool follow_redirect) noexcept {
    const int limit = follow_redirect ? 299 : 399;
    return (status_code >= 200 && status_code <= limit) || status_code == 304;
}

class ExchangeSession;

// ─────────────────────────────────────────────────────────────────────────────
// AttemptRunner
// ─────────────────────────────────────────────────────────────────────────────
// Runs one attempt: an exchange under its own TimeoutComposer, plus one
// more exchange per followed redirect, all with the attempt's ordinal.
// open() returns the final response head with its exchange still open; the
// body is then pulled with read_some() or read_all().
//
// Usage:
//   AttemptRunner runner(transport, timers, request, redirects, signal);
//   auto head = co_await runner.open(tracker);
//   auto body = co_await runner.read_all();

class AttemptRunner {
public:
    AttemptRunner(
        ITransport& transport,
        ITimerFactory& timers,
        PreparedRequest& request,
        RedirectHandler& redirects,
        AbortSignal* signal
    );

    ~AttemptRunner();

    AttemptRunner(const AttemptRunner&) = delete;
    AttemptRunner& operator=(const AttemptRunner&) = delete;

    [[nodiscard]] asio::awaitable<Result<ResponseHead>> open(AttemptTracker& tracker);

    /// Next body chunk of the open exchange; nullopt at the end.
    [[nodiscard]] asio::awaitable<Result<std::optional<std::string>>> read_some();

    /// Rest of the body; the exchange is closed afterwards.
    [[nodiscard]] asio::awaitable<Result<std::string>> read_all();

    /// Release the exchange and disarm its deadlines.
    void close() noexcept;

    /// Response of the final exchange (url, method and redirect chain filled).
    [[nodiscard]] Response make_response(
        const ResponseHead& head,
        std::string body,
        std::size_t retry_count
    ) const;

private:
    void apply_redirect(RedirectTarget target);

    ITransport& transport_;
    ITimerFactory& timers_;
    PreparedRequest& request_;
    RedirectHandler& redirects_;
    AbortSignal* signal_;
    std::unique_ptr<ExchangeSession> session_;
};

}  // namespace fetchpp

#endif  // FETCHPP_CLIENT_ATTEMPT_RUNNER_HPP
