#include "fetchpp/client/http_client.hpp"
#include "fetchpp/log/logger.hpp"
#include "fetchpp/retry/retry_controller.hpp"
#include "fetchpp/transport/curl_transport.hpp"

namespace fetchpp {

// ═══════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════

HttpClient::HttpClient(asio::any_io_executor executor, ClientConfig config)
    : config_(std::move(config))
{
    transport_ = std::make_shared<CurlTransport>(executor, config_.transport_config());
    timers_ = std::make_shared<AsioTimerFactory>(executor);
    backoff_ = std::make_shared<ExponentialBackoff>();
}

HttpClient::HttpClient(
    std::shared_ptr<ITransport> transport,
    ClientConfig config,
    std::shared_ptr<ITimerFactory> timers,
    std::shared_ptr<IBackoffPolicy> backoff
)
    : config_(std::move(config))
    , transport_(std::move(transport))
    , timers_(std::move(timers))
    , backoff_(std::move(backoff))
{
    if (!timers_) {
        timers_ = std::make_shared<AsioTimerFactory>(transport_->get_executor());
    }
    if (!backoff_) {
        backoff_ = std::make_shared<ExponentialBackoff>();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Request Preparation
// ═══════════════════════════════════════════════════════════════════════════

Result<PreparedRequest> HttpClient::prepare(const RequestOptions& options) const {
    auto url = join_url(config_.base_url, options.url);
    if (url.has_value() == false) {
        return tl::unexpected(RequestError::invalid_request(
            "Invalid URL: '" + options.url + "'" +
            (config_.base_url.empty() ? std::string{} : " (base '" + config_.base_url + "')")));
    }

    PreparedRequest request;
    request.method = normalize_method(options.method);
    request.url = std::move(*url);

    request.headers = config_.default_headers;
    for (const auto& [name, value] : options.headers) {
        set_header(request.headers, name, value);
    }
    request.body = options.body;

    request.retry = options.retry.value_or(config_.retry);
    request.timeout = options.timeout.value_or(config_.timeout);
    request.throw_http_errors = options.throw_http_errors.value_or(config_.throw_http_errors);
    request.follow_redirect = options.follow_redirect.value_or(config_.follow_redirect);
    request.max_redirects = options.max_redirects.value_or(config_.max_redirects);
    request.method_rewriting = config_.method_rewriting;
    request.hooks = options.hooks;

    return request;
}

// ═══════════════════════════════════════════════════════════════════════════
// Buffered Requests
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<Result<Response>> HttpClient::request(RequestOptions options, AbortSignal* signal) {
    auto prepared = prepare(options);
    if (!prepared) {
        co_return tl::unexpected(prepared.error());
    }
    auto& request = *prepared;

    AttemptTracker tracker;
    RedirectHandler redirects(request.follow_redirect, request.max_redirects, request.method_rewriting);
    RetryController retries(request.retry, request.timeout, backoff_);

    // Ends when an attempt succeeds or the controller stops retrying
    for (;;) {
        if (signal != nullptr && signal->aborted()) {
            co_return tl::unexpected(RequestError::cancelled());
        }

        tracker.begin(request.url.href, request.method);

        AttemptRunner runner(*transport_, *timers_, request, redirects, signal);
        auto last = co_await run_attempt(runner, tracker);

        if (signal != nullptr && signal->aborted()) {
            co_return tl::unexpected(RequestError::cancelled());
        }

        RetryContext outcome;
        if (last) {
            const bool ok = is_response_ok(last->status_code, request.follow_redirect);
            if (ok) {
                co_return last;
            }
            outcome.response = std::make_shared<const Response>(*last);
            if (request.throw_http_errors) {
                last = tl::unexpected(RequestError::http_status(*last));
                outcome.error = last.error();
            }
        } else {
            outcome.error = last.error();
        }

        auto decision = co_await retries.consider(tracker.current(), std::move(outcome), request.body.is_replayable());
        // An abort during the delay strategy beats its verdict, and its exception
        if (signal != nullptr && signal->aborted()) {
            co_return tl::unexpected(RequestError::cancelled());
        }
        if (!decision) {
            co_return tl::unexpected(decision.error());
        }
        if (decision->has_value() == false) {
            co_return last;
        }

        const auto& notice = **decision;
        if (request.hooks.before_retry) {
            request.hooks.before_retry(notice);
        }

        const bool waited = co_await wait_before_retry(get_executor(), notice.delay, signal);
        if (waited == false) {
            co_return tl::unexpected(RequestError::cancelled());
        }
    }
}

asio::awaitable<Result<Response>> HttpClient::get(std::string url, AbortSignal* signal) {
    RequestOptions options;
    options.with_method("GET").with_url(std::move(url));
    co_return co_await request(std::move(options), signal);
}

asio::awaitable<Result<Response>> HttpClient::post(std::string url, RequestBody body, AbortSignal* signal) {
    RequestOptions options;
    options.with_method("POST").with_url(std::move(url)).with_body(std::move(body));
    co_return co_await request(std::move(options), signal);
}

asio::awaitable<Result<Response>> HttpClient::run_attempt(AttemptRunner& runner, AttemptTracker& tracker) {
    auto head = co_await runner.open(tracker);
    if (!head) {
        co_return tl::unexpected(head.error());
    }

    auto body = co_await runner.read_all();
    if (!body) {
        co_return tl::unexpected(body.error());
    }

    co_return runner.make_response(*head, std::move(*body), tracker.retry_count());
}

// ═══════════════════════════════════════════════════════════════════════════
// Streaming
// ═══════════════════════════════════════════════════════════════════════════

ResponseStream HttpClient::stream(RequestOptions options, std::size_t retry_count, AbortSignal* signal) {
    return ResponseStream(*this, std::move(options), retry_count, signal);
}

}  // namespace fetchpp
