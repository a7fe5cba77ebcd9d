#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// HttpClient
// ═══════════════════════════════════════════════════════════════════════════
// Coroutine HTTP client with retries, per-phase timeouts and redirects.
//
// Usage:
//   asio::io_context io;
//   HttpClient client(io.get_executor(), ClientConfig{}.with_retry_limit(3));
//
//   asio::co_spawn(io, [&]() -> asio::awaitable<void> {
//       auto response = co_await client.get("http://localhost:8080/status");
//       if (!response) {
//           std::cerr << response.error().message << "\n";
//           co_return;
//       }
//       std::cout << response->status_code << " after "
//                 << response->retry_count << " retries\n";
//   }, asio::detached);
//
//   io.run();
//
// Every attempt of a request goes through the same transport, and therefore
// the same keep-alive pool. A request runs on one coroutine; independent
// requests may run concurrently on the same client.

#include "fetchpp/abort_signal.hpp"
#include "fetchpp/client/attempt_runner.hpp"
#include "fetchpp/client/client_config.hpp"
#include "fetchpp/client/request_options.hpp"
#include "fetchpp/client/response_stream.hpp"
#include "fetchpp/error.hpp"
#include "fetchpp/retry/backoff_policy.hpp"
#include "fetchpp/timeout/timer.hpp"
#include "fetchpp/transport/transport.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <memory>
#include <string>

namespace fetchpp {

class HttpClient {
public:
    // ─────────────────────────────────────────────────────────────────────────
    // Construction
    // ─────────────────────────────────────────────────────────────────────────

    /// Plain HTTP/1.1 over TCP with a keep-alive pool sized from `config`.
    explicit HttpClient(asio::any_io_executor executor, ClientConfig config = {});

    /// Custom transport. Timers default to asio timers on the transport's
    /// executor, backoff to ExponentialBackoff.
    explicit HttpClient(
        std::shared_ptr<ITransport> transport,
        ClientConfig config = {},
        std::shared_ptr<ITimerFactory> timers = nullptr,
        std::shared_ptr<IBackoffPolicy> backoff = nullptr
    );

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Buffered Requests
    // ─────────────────────────────────────────────────────────────────────────

    /// Runs attempts until success, a terminal failure or the retry budget
    /// is spent. The response carries the retries actually performed.
    [[nodiscard]] asio::awaitable<Result<Response>> request(
        RequestOptions options,
        AbortSignal* signal = nullptr
    );

    [[nodiscard]] asio::awaitable<Result<Response>> get(std::string url, AbortSignal* signal = nullptr);

    [[nodiscard]] asio::awaitable<Result<Response>> post(
        std::string url,
        RequestBody body,
        AbortSignal* signal = nullptr
    );

    // ─────────────────────────────────────────────────────────────────────────
    // Streaming
    // ─────────────────────────────────────────────────────────────────────────

    /// One attempt, delivered incrementally. `retry_count` is the value of
    /// the RetryNotice that led to this stream (0 for the first).
    [[nodiscard]] ResponseStream stream(
        RequestOptions options,
        std::size_t retry_count = 0,
        AbortSignal* signal = nullptr
    );

    // ─────────────────────────────────────────────────────────────────────────
    // Internals shared with ResponseStream
    // ─────────────────────────────────────────────────────────────────────────

    /// Merge `options` with the client defaults and resolve the URL.
    [[nodiscard]] Result<PreparedRequest> prepare(const RequestOptions& options) const;

    [[nodiscard]] const ClientConfig& config() const noexcept {
        return config_;
    }

    [[nodiscard]] ITransport& transport() noexcept {
        return *transport_;
    }

    [[nodiscard]] ITimerFactory& timers() noexcept {
        return *timers_;
    }

    [[nodiscard]] const std::shared_ptr<IBackoffPolicy>& backoff() const noexcept {
        return backoff_;
    }

    [[nodiscard]] asio::any_io_executor get_executor() {
        return transport_->get_executor();
    }

private:
    asio::awaitable<Result<Response>> run_attempt(
        AttemptRunner& runner,
        AttemptTracker& tracker
    );

    ClientConfig config_;
    std::shared_ptr<ITransport> transport_;
    std::shared_ptr<ITimerFactory> timers_;
    std::shared_ptr<IBackoffPolicy> backoff_;
};

}  // namespace fetchpp
