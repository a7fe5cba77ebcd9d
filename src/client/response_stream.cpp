#include "fetchpp/client/response_stream.hpp"
#include "fetchpp/client/attempt_runner.hpp"
#include "fetchpp/client/http_client.hpp"
#include "fetchpp/log/logger.hpp"
#include "fetchpp/retry/retry_controller.hpp"

namespace fetchpp {

ResponseStream::ResponseStream(
    HttpClient& client,
    RequestOptions options,
    std::size_t retry_count,
    AbortSignal* signal
)
    : client_(client)
    , options_(std::move(options))
    , retry_count_(retry_count)
    , signal_(signal)
{}

asio::awaitable<void> ResponseStream::run() {
    if (started_) {
        co_return;
    }
    started_ = true;

    auto prepared = client_.prepare(options_);
    if (!prepared) {
        fail(prepared.error());
        co_return;
    }
    auto& request = *prepared;

    AttemptTracker tracker(retry_count_);
    RedirectHandler redirects(request.follow_redirect, request.max_redirects, request.method_rewriting);
    RetryController retries(request.retry, request.timeout, client_.backoff());

    tracker.begin(request.url.href, request.method);
    AttemptRunner runner(client_.transport(), client_.timers(), request, redirects, signal_);

    auto head = co_await runner.open(tracker);
    if (!head) {
        RetryContext outcome;
        outcome.error = head.error();
        co_await retry_or_fail(request, tracker, retries, std::move(outcome));
        co_return;
    }

    const bool ok = is_response_ok(head->status_code, request.follow_redirect);
    if (ok == false) {
        // Held back until it is clear whether this attempt is retried
        auto body = co_await runner.read_all();
        if (!body) {
            RetryContext outcome;
            outcome.error = body.error();
            co_await retry_or_fail(request, tracker, retries, std::move(outcome));
            co_return;
        }

        auto response = runner.make_response(*head, std::move(*body), tracker.retry_count());
        RetryContext outcome;
        outcome.response = std::make_shared<const Response>(response);
        if (request.throw_http_errors) {
            outcome.error = RequestError::http_status(response);
        }
        co_await retry_or_fail(request, tracker, retries, std::move(outcome));
        co_return;
    }

    if (on_response_) {
        on_response_(runner.make_response(*head, std::string{}, tracker.retry_count()));
    }

    while (true) {
        auto chunk = co_await runner.read_some();
        if (!chunk) {
            if (delivered_) {
                FETCHPP_LOG_DEBUG(Stream, "Stream failed after delivering data: {}", chunk.error().message);
                fail(chunk.error());
                co_return;
            }
            RetryContext outcome;
            outcome.error = chunk.error();
            co_await retry_or_fail(request, tracker, retries, std::move(outcome));
            co_return;
        }
        if (chunk->has_value() == false) {
            break;
        }
        delivered_ = true;
        if (on_data_) {
            on_data_(**chunk);
        }
    }

    if (on_end_) {
        on_end_();
    }
}

asio::awaitable<void> ResponseStream::retry_or_fail(
    PreparedRequest& request,
    AttemptTracker& tracker,
    RetryController& retries,
    RetryContext outcome
) {
    // Not retried: the error, or the plain non-2xx response without throw_http_errors
    const auto surface = [this, &outcome]() {
        if (outcome.error.has_value()) {
            fail(*outcome.error);
        } else if (outcome.response) {
            deliver(*outcome.response);
        }
    };

    auto decision = co_await retries.consider(tracker.current(), outcome, request.body.is_replayable());
    if (signal_ != nullptr && signal_->aborted()) {
        fail(RequestError::cancelled());
        co_return;
    }
    if (!decision) {
        fail(decision.error());
        co_return;
    }
    if (decision->has_value() == false) {
        surface();
        co_return;
    }

    auto notice = std::move(**decision);
    if (!on_retry_) {
        FETCHPP_LOG_DEBUG(Stream, "Stream has no retry handler; surfacing the failure");
        fail(notice.error);
        co_return;
    }

    if (request.hooks.before_retry) {
        request.hooks.before_retry(notice);
    }

    const bool waited = co_await wait_before_retry(client_.get_executor(), notice.delay, signal_);
    if (waited == false) {
        fail(RequestError::cancelled());
        co_return;
    }

    on_retry_(notice);
}

void ResponseStream::fail(const RequestError& error) {
    if (on_error_) {
        on_error_(error);
    }
}

void ResponseStream::deliver(const Response& response) {
    if (on_response_) {
        Response head = response;
        head.body.clear();
        on_response_(head);
    }
    if (!response.body.empty()) {
        delivered_ = true;
        if (on_data_) {
            on_data_(response.body);
        }
    }
    if (on_end_) {
        on_end_();
    }
}

}  // namespace fetchpp
