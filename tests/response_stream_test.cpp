// ─────────────────────────────────────────────────────────────────────────────
// ResponseStream Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "fetchpp/client/http_client.hpp"
#include "fixtures/run_sync.hpp"
#include "mocks/mock_transport.hpp"

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

#include <string>
#include <vector>

using namespace fetchpp;
using namespace fetchpp::testing;
using namespace std::chrono_literals;

namespace {

// Every event a stream emitted, in order.
struct StreamLog {
    std::vector<std::string> events;
    std::string body;
    std::optional<Response> head;
    std::optional<RetryNotice> retry;
    std::optional<RequestError> error;

    void attach(ResponseStream& stream, bool with_retry = true) {
        stream.on_response([this](const Response& response) {
                  events.push_back("response");
                  head = response;
              })
              .on_data([this](std::string_view chunk) {
                  events.push_back("data");
                  body += chunk;
              })
              .on_error([this](const RequestError& e) {
                  events.push_back("error");
                  error = e;
              })
              .on_end([this]() { events.push_back("end"); });
        if (with_retry) {
            stream.on_retry([this](const RetryNotice& notice) {
                events.push_back("retry");
                retry = notice;
            });
        }
    }
};

struct StreamFixture {
    explicit StreamFixture(ClientConfig config = {})
        : transport(std::make_shared<MockTransport>(io.get_executor()))
        , client(transport, std::move(config), nullptr, std::make_shared<ConstantBackoff>(5ms))
    {}

    StreamLog run(RequestOptions options, std::size_t retry_count = 0, bool with_retry = true) {
        StreamLog log;
        auto stream = client.stream(std::move(options), retry_count);
        log.attach(stream, with_retry);
        run_sync(io, stream.run());
        return log;
    }

    StreamLog run(std::string url, std::size_t retry_count = 0, bool with_retry = true) {
        return run(RequestOptions{}.with_url(std::move(url)), retry_count, with_retry);
    }

    asio::io_context io;
    std::shared_ptr<MockTransport> transport;
    HttpClient client;
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Delivery
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ResponseStream delivers the body chunk by chunk", "[stream]") {
    StreamFixture fx;
    ScriptedExchange exchange;
    exchange.headers = {{"Content-Type", "text/plain"}};
    exchange.chunks = {"alpha ", "beta ", "gamma"};
    fx.transport->queue(exchange);

    auto log = fx.run("http://localhost/feed");

    REQUIRE(log.events == std::vector<std::string>{"response", "data", "data", "data", "end"});
    REQUIRE(log.body == "alpha beta gamma");
    REQUIRE(log.head.has_value());
    REQUIRE(log.head->status_code == 200);
    REQUIRE(log.head->body.empty());
    REQUIRE(log.head->retry_count == 0);
}

TEST_CASE("ResponseStream runs only once", "[stream]") {
    StreamFixture fx;
    fx.transport->queue_response(200, "x").queue_response(200, "y");

    int ends = 0;
    auto stream = fx.client.stream(RequestOptions{}.with_url("http://localhost/x"));
    stream.on_end([&ends]() { ++ends; });
    run_sync(fx.io, stream.run());
    run_sync(fx.io, stream.run());

    REQUIRE(ends == 1);
    REQUIRE(fx.transport->request_count() == 1);
}

TEST_CASE("ResponseStream delivers a non-2xx response when errors are not thrown", "[stream]") {
    StreamFixture fx(ClientConfig{}.with_throw_http_errors(false));
    fx.transport->queue_response(404, "no such thing");

    auto log = fx.run("http://localhost/missing");

    REQUIRE(log.events == std::vector<std::string>{"response", "data", "end"});
    REQUIRE(log.head->status_code == 404);
    REQUIRE(log.body == "no such thing");
}

TEST_CASE("ResponseStream reports a non-2xx response as an error", "[stream]") {
    StreamFixture fx;
    fx.transport->queue_response(404, "no such thing");

    auto log = fx.run("http://localhost/missing");

    REQUIRE(log.events == std::vector<std::string>{"error"});
    REQUIRE(log.error->kind == ErrorKind::HttpStatus);
    REQUIRE(log.error->response->body == "no such thing");
}

// ═══════════════════════════════════════════════════════════════════════════
// Retry Events
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ResponseStream emits retry instead of retrying itself", "[stream][retry]") {
    StreamFixture fx;
    fx.transport->queue_response(503, "busy").queue_response(200, "ok");

    auto first = fx.run("http://localhost/x");

    REQUIRE(first.events == std::vector<std::string>{"retry"});
    REQUIRE(first.retry->retry_count == 1);
    REQUIRE(first.retry->next_ordinal == 2);
    REQUIRE(first.retry->error.status_code() == 503);
    REQUIRE(fx.transport->request_count() == 1);

    auto second = fx.run("http://localhost/x", first.retry->retry_count);

    REQUIRE(second.events == std::vector<std::string>{"response", "data", "end"});
    REQUIRE(second.head->retry_count == 1);
    REQUIRE(fx.transport->request_count() == 2);
}

TEST_CASE("ResponseStream carries the retry count across streams", "[stream][retry]") {
    StreamFixture fx;
    fx.transport->queue_error("ECONNRESET").queue_error("ECONNRESET").queue_error("ECONNRESET");

    auto first = fx.run("http://localhost/x");
    REQUIRE(first.retry.has_value());

    auto second = fx.run("http://localhost/x", first.retry->retry_count);
    REQUIRE(second.retry.has_value());
    REQUIRE(second.retry->retry_count == 2);

    // The third attempt is the last one the default limit allows
    auto third = fx.run("http://localhost/x", second.retry->retry_count);
    REQUIRE(third.events == std::vector<std::string>{"error"});
    REQUIRE(third.error->code == "ECONNRESET");
}

TEST_CASE("ResponseStream without a retry handler surfaces the failure", "[stream][retry]") {
    StreamFixture fx;
    fx.transport->queue_response(503).queue_response(200);

    auto log = fx.run("http://localhost/x", 0, false);

    REQUIRE(log.events == std::vector<std::string>{"error"});
    REQUIRE(log.error->status_code() == 503);
    REQUIRE(fx.transport->request_count() == 1);
}

TEST_CASE("ResponseStream waits the delay before emitting retry", "[stream][retry]") {
    asio::io_context io;
    auto transport = std::make_shared<MockTransport>(io.get_executor());
    HttpClient client(transport, ClientConfig{}, nullptr, std::make_shared<ConstantBackoff>(80ms));
    transport->queue_response(500);

    std::chrono::steady_clock::time_point emitted;
    auto stream = client.stream(RequestOptions{}.with_url("http://localhost/x"));
    stream.on_retry([&emitted](const RetryNotice&) { emitted = std::chrono::steady_clock::now(); });
    run_sync(io, stream.run());

    REQUIRE(emitted - transport->requests()[0].sent_at >= 80ms);
}

TEST_CASE("ResponseStream runs before_retry hooks", "[stream][retry]") {
    StreamFixture fx;
    fx.transport->queue_error("ETIMEDOUT");

    std::vector<std::string> order;
    auto stream = fx.client.stream(RequestOptions{}
        .with_url("http://localhost/x")
        .with_before_retry([&order](const RetryNotice&) { order.push_back("before_retry"); }));
    stream.on_retry([&order](const RetryNotice&) { order.push_back("retry"); });
    run_sync(fx.io, stream.run());

    REQUIRE(order == std::vector<std::string>{"before_retry", "retry"});
}

TEST_CASE("ResponseStream never retries after data was delivered", "[stream][retry]") {
    StreamFixture fx;
    ScriptedExchange broken;
    broken.chunks = {"first half"};
    broken.read_error = TransportError{"ECONNRESET", "socket hang up"};
    fx.transport->queue(broken).queue_response(200, "whole");

    auto log = fx.run("http://localhost/x");

    REQUIRE(log.events == std::vector<std::string>{"response", "data", "error"});
    REQUIRE(log.body == "first half");
    REQUIRE(log.error->code == "ECONNRESET");
    REQUIRE(fx.transport->request_count() == 1);
}

TEST_CASE("ResponseStream retries a failure before any data", "[stream][retry]") {
    StreamFixture fx;
    ScriptedExchange broken;
    broken.read_error = TransportError{"ECONNRESET", "socket hang up"};
    fx.transport->queue(broken);

    auto log = fx.run("http://localhost/x");

    REQUIRE(log.events == std::vector<std::string>{"response", "retry"});
    REQUIRE(log.body.empty());
}

TEST_CASE("ResponseStream cancelled while the delay strategy is suspended", "[stream][retry][cancel]") {
    StreamFixture fx;
    fx.transport->queue_response(503).queue_response(200);

    AbortSignal signal;
    asio::steady_timer trigger(fx.io, 20ms);
    trigger.async_wait([&signal](const asio::error_code&) { signal.abort(); });

    auto strategy = [](RetryContext) -> asio::awaitable<double> {
        asio::steady_timer timer(co_await asio::this_coro::executor, 100ms);
        co_await timer.async_wait(asio::use_awaitable);
        co_return 1.0;
    };

    StreamLog log;
    auto stream = fx.client.stream(RequestOptions{}
        .with_url("http://localhost/x")
        .with_retry(RetryOptions{}.with_calculate_delay(strategy)), 0, &signal);
    log.attach(stream);
    run_sync(fx.io, stream.run());

    REQUIRE(log.events == std::vector<std::string>{"error"});
    REQUIRE(log.error->kind == ErrorKind::Cancelled);
    REQUIRE_FALSE(log.retry.has_value());
    REQUIRE(fx.transport->request_count() == 1);
}

TEST_CASE("ResponseStream reports timeouts with their phase", "[stream][timeout]") {
    StreamFixture fx(ClientConfig{}
        .with_retry_limit(0)
        .with_timeout(TimeoutOptions{}.with(TimeoutPhase::Response, 30ms)));
    ScriptedExchange stalled;
    stalled.head_delay = 5s;
    fx.transport->queue(stalled);

    auto log = fx.run("http://localhost/slow");

    REQUIRE(log.events == std::vector<std::string>{"error"});
    REQUIRE(log.error->kind == ErrorKind::Timeout);
    REQUIRE(log.error->phase == TimeoutPhase::Response);
}

TEST_CASE("ResponseStream follows redirects before streaming", "[stream][redirect]") {
    StreamFixture fx;
    fx.transport->queue_redirect(301, "/moved").queue_response(200, "here");

    auto log = fx.run("http://localhost/old");

    REQUIRE(log.events == std::vector<std::string>{"response", "data", "end"});
    REQUIRE(log.head->url == "http://localhost/moved");
    REQUIRE(log.head->redirect_urls == std::vector<std::string>{"http://localhost/moved"});
}
