// ─────────────────────────────────────────────────────────────────────────────
// Delay Scheduling Tests
// ─────────────────────────────────────────────────────────────────────────────
// Backoff policies, DelayScheduler and RetryController.

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "fetchpp/abort_signal.hpp"
#include "fetchpp/retry/backoff_policy.hpp"
#include "fetchpp/retry/delay_scheduler.hpp"
#include "fetchpp/retry/retry_controller.hpp"
#include "fixtures/run_sync.hpp"

#include <asio/io_context.hpp>
#include <asio/post.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

#include <cmath>
#include <limits>
#include <stdexcept>

using namespace fetchpp;
using namespace std::chrono_literals;
using fetchpp::testing::run_sync;

namespace {

RetryContext with_response(int status, std::size_t attempt = 1, const char* retry_after = nullptr) {
    Response response;
    response.status_code = status;
    if (retry_after != nullptr) {
        response.headers["Retry-After"] = retry_after;
    }
    RetryContext context;
    context.attempt_count = attempt;
    context.response = std::make_shared<const Response>(std::move(response));
    return context;
}

RetryContext with_network_error(std::size_t attempt) {
    RetryContext context;
    context.attempt_count = attempt;
    context.error = RequestError::transport(TransportError{"ECONNRESET", "socket hang up"});
    return context;
}

std::shared_ptr<IBackoffPolicy> fixed(std::chrono::milliseconds delay) {
    return std::make_shared<ConstantBackoff>(delay);
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Backoff Policies
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ExponentialBackoff doubles from one second", "[retry][backoff]") {
    ExponentialBackoff backoff({.jitter = 0ms});

    REQUIRE(backoff.next_delay(1) == 1000ms);
    REQUIRE(backoff.next_delay(2) == 2000ms);
    REQUIRE(backoff.next_delay(3) == 4000ms);
    REQUIRE(backoff.next_delay(4) == 8000ms);
}

TEST_CASE("ExponentialBackoff default jitter adds under 100ms", "[retry][backoff]") {
    ExponentialBackoff backoff;

    for (int i = 0; i < 50; ++i) {
        const auto delay = backoff.next_delay(2);
        REQUIRE(delay >= 2000ms);
        REQUIRE(delay <= 2100ms);
    }
}

TEST_CASE("ExponentialBackoff with the same seed repeats its jitter", "[retry][backoff]") {
    ExponentialBackoff first({}, 42);
    ExponentialBackoff second({}, 42);

    for (std::size_t attempt = 1; attempt <= 5; ++attempt) {
        REQUIRE(first.next_delay(attempt) == second.next_delay(attempt));
    }
}

TEST_CASE("ExponentialBackoff respects its ceiling", "[retry][backoff]") {
    ExponentialBackoff backoff({.initial = 100ms, .factor = 10.0, .ceiling = 5000ms, .jitter = 0ms});
    REQUIRE(backoff.next_delay(5) == 5000ms);
}

TEST_CASE("ExponentialBackoff stays finite for huge attempt counts", "[retry][backoff]") {
    ExponentialBackoff backoff({.jitter = 0ms});
    const auto delay = backoff.next_delay(5000);
    REQUIRE(delay.count() > 0);
    REQUIRE(delay <= std::chrono::milliseconds{1'000'000'000'000});
}

TEST_CASE("ConstantBackoff is constant", "[retry][backoff]") {
    ConstantBackoff backoff(250ms);
    REQUIRE(backoff.next_delay(1) == 250ms);
    REQUIRE(backoff.next_delay(7) == 250ms);
}

// ═══════════════════════════════════════════════════════════════════════════
// DelayScheduler
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("DelayScheduler effective max_retry_after", "[retry][scheduler]") {
    RetryOptions retry;
    TimeoutOptions timeout;

    SECTION("Unbounded by default") {
        DelayScheduler scheduler(retry, timeout);
        REQUIRE_FALSE(scheduler.effective_max_retry_after().has_value());
    }

    SECTION("Smaller of request and connect timeouts") {
        timeout.with(TimeoutPhase::Request, 3000ms).with(TimeoutPhase::Connect, 800ms);
        DelayScheduler scheduler(retry, timeout);
        REQUIRE(scheduler.effective_max_retry_after() == 800ms);
    }

    SECTION("Request timeout alone") {
        timeout.with(TimeoutPhase::Request, 3000ms);
        DelayScheduler scheduler(retry, timeout);
        REQUIRE(scheduler.effective_max_retry_after() == 3000ms);
    }

    SECTION("Explicit value wins over timeouts") {
        timeout.with(TimeoutPhase::Request, 3000ms);
        retry.with_max_retry_after(10s);
        DelayScheduler scheduler(retry, timeout);
        REQUIRE(scheduler.effective_max_retry_after() == 10000ms);
    }
}

TEST_CASE("DelayScheduler built-in strategy", "[retry][scheduler]") {
    RetryOptions retry;
    TimeoutOptions timeout;
    DelayScheduler scheduler(retry, timeout, fixed(1000ms));

    SECTION("Backoff when there is no Retry-After") {
        auto decision = run_sync(scheduler.decide(with_response(503)));
        REQUIRE(decision.has_value());
        REQUIRE(decision->wait == 1000ms);
    }

    SECTION("A positive Retry-After wins") {
        auto decision = run_sync(scheduler.decide(with_response(429, 1, "2")));
        REQUIRE(decision.has_value());
        REQUIRE(decision->wait == 2000ms);
    }

    SECTION("Retry-After 0 falls back to backoff") {
        auto decision = run_sync(scheduler.decide(with_response(503, 1, "0")));
        REQUIRE(decision.has_value());
        REQUIRE(decision->wait == 1000ms);
    }

    SECTION("413 without Retry-After stops") {
        auto decision = run_sync(scheduler.decide(with_response(413)));
        REQUIRE(decision.has_value());
        REQUIRE(decision->stop());
    }

    SECTION("413 with Retry-After waits") {
        auto decision = run_sync(scheduler.decide(with_response(413, 1, "1")));
        REQUIRE(decision.has_value());
        REQUIRE(decision->wait == 1000ms);
    }

    SECTION("Network errors use backoff") {
        auto decision = run_sync(scheduler.decide(with_network_error(2)));
        REQUIRE(decision.has_value());
        REQUIRE(decision->wait == 1000ms);
    }
}

TEST_CASE("DelayScheduler exponential default", "[retry][scheduler]") {
    RetryOptions retry;
    TimeoutOptions timeout;
    DelayScheduler scheduler(retry, timeout);

    auto context = with_network_error(3);
    const double computed = scheduler.default_delay(context);
    REQUIRE(computed >= 4000.0);
    REQUIRE(computed <= 4100.0);
}

TEST_CASE("DelayScheduler Retry-After ceiling", "[retry][scheduler]") {
    RetryOptions retry;
    retry.with_max_retry_after(1000ms);

    bool strategy_called = false;
    retry.with_calculate_delay(make_delay_strategy([&](const RetryContext&) {
        strategy_called = true;
        return 10.0;
    }));

    TimeoutOptions timeout;
    DelayScheduler scheduler(retry, timeout, fixed(1000ms));

    SECTION("Above the ceiling stops without consulting the strategy") {
        auto decision = run_sync(scheduler.decide(with_response(429, 1, "5")));
        REQUIRE(decision.has_value());
        REQUIRE(decision->stop());
        REQUIRE(strategy_called == false);
    }

    SECTION("At the ceiling the strategy decides") {
        auto decision = run_sync(scheduler.decide(with_response(429, 1, "1")));
        REQUIRE(decision.has_value());
        REQUIRE(decision->wait == 10ms);
        REQUIRE(strategy_called == true);
    }
}

TEST_CASE("DelayScheduler custom strategy", "[retry][scheduler]") {
    RetryOptions retry;
    TimeoutOptions timeout;

    SECTION("Sees the context and computed value") {
        RetryContext seen;
        retry.with_calculate_delay(make_delay_strategy([&](const RetryContext& context) {
            seen = context;
            return context.computed_value / 2;
        }));
        DelayScheduler scheduler(retry, timeout, fixed(1000ms));

        auto decision = run_sync(scheduler.decide(with_response(503, 2, "3")));
        REQUIRE(decision.has_value());
        REQUIRE(decision->wait == 1500ms);
        REQUIRE(seen.attempt_count == 2);
        REQUIRE(seen.retry_after == 3000ms);
        REQUIRE_THAT(seen.computed_value, Catch::Matchers::WithinAbs(3000.0, 0.001));
        REQUIRE(seen.response->status_code == 503);
    }

    SECTION("Zero stops") {
        retry.with_calculate_delay(make_delay_strategy([](const RetryContext&) { return 0.0; }));
        DelayScheduler scheduler(retry, timeout);
        auto decision = run_sync(scheduler.decide(with_response(503)));
        REQUIRE(decision.has_value());
        REQUIRE(decision->stop());
    }

    SECTION("Fractions round up") {
        retry.with_calculate_delay(make_delay_strategy([](const RetryContext&) { return 0.2; }));
        DelayScheduler scheduler(retry, timeout);
        auto decision = run_sync(scheduler.decide(with_response(503)));
        REQUIRE(decision.has_value());
        REQUIRE(decision->wait == 1ms);
    }

    SECTION("Negative values are a strategy error") {
        retry.with_calculate_delay(make_delay_strategy([](const RetryContext&) { return -1.0; }));
        DelayScheduler scheduler(retry, timeout);
        auto decision = run_sync(scheduler.decide(with_response(503)));
        REQUIRE_FALSE(decision.has_value());
        REQUIRE(decision.error().kind == ErrorKind::Strategy);
    }

    SECTION("NaN and infinity are strategy errors") {
        retry.with_calculate_delay(make_delay_strategy([](const RetryContext&) {
            return std::numeric_limits<double>::quiet_NaN();
        }));
        DelayScheduler nan_scheduler(retry, timeout);
        REQUIRE_FALSE(run_sync(nan_scheduler.decide(with_response(503))).has_value());

        retry.with_calculate_delay(make_delay_strategy([](const RetryContext&) {
            return std::numeric_limits<double>::infinity();
        }));
        DelayScheduler inf_scheduler(retry, timeout);
        REQUIRE_FALSE(run_sync(inf_scheduler.decide(with_response(503))).has_value());
    }

    SECTION("A throwing strategy keeps the exception") {
        retry.with_calculate_delay(make_delay_strategy([](const RetryContext&) -> double {
            throw std::runtime_error("strategy exploded");
        }));
        DelayScheduler scheduler(retry, timeout);
        auto decision = run_sync(scheduler.decide(with_response(503)));
        REQUIRE_FALSE(decision.has_value());
        REQUIRE(decision.error().kind == ErrorKind::Strategy);
        REQUIRE(decision.error().message == "strategy exploded");
        REQUIRE_THROWS_AS(std::rethrow_exception(decision.error().cause), std::runtime_error);
    }

    SECTION("Asynchronous strategies are awaited") {
        retry.with_calculate_delay([](RetryContext context) -> asio::awaitable<double> {
            asio::steady_timer timer(co_await asio::this_coro::executor, 5ms);
            co_await timer.async_wait(asio::use_awaitable);
            co_return static_cast<double>(context.attempt_count) * 7.0;
        });
        DelayScheduler scheduler(retry, timeout);
        auto decision = run_sync(scheduler.decide(with_response(503, 3)));
        REQUIRE(decision.has_value());
        REQUIRE(decision->wait == 21ms);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// RetryController
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("RetryController builds notices for eligible outcomes", "[retry][controller]") {
    RetryOptions retry;
    TimeoutOptions timeout;
    RetryController controller(retry, timeout, fixed(20ms));

    AttemptTracker tracker;
    const auto& attempt = tracker.begin("http://h/x", "GET");

    auto notice = run_sync(controller.consider(attempt, with_response(503), true));
    REQUIRE(notice.has_value());
    REQUIRE(notice->has_value());
    REQUIRE((*notice)->next_ordinal == 2);
    REQUIRE((*notice)->retry_count == 1);
    REQUIRE((*notice)->delay == 20ms);
    REQUIRE((*notice)->error.kind == ErrorKind::HttpStatus);
    REQUIRE((*notice)->error.status_code() == 503);
}

TEST_CASE("RetryController declines ineligible outcomes", "[retry][controller]") {
    RetryOptions retry;
    TimeoutOptions timeout;
    RetryController controller(retry, timeout, fixed(20ms));

    AttemptTracker tracker;
    const auto& attempt = tracker.begin("http://h/x", "POST");

    auto notice = run_sync(controller.consider(attempt, with_response(503), true));
    REQUIRE(notice.has_value());
    REQUIRE_FALSE(notice->has_value());
}

TEST_CASE("RetryController passes strategy failures through", "[retry][controller]") {
    RetryOptions retry;
    retry.with_calculate_delay(make_delay_strategy([](const RetryContext&) { return -5.0; }));
    TimeoutOptions timeout;
    RetryController controller(retry, timeout);

    AttemptTracker tracker;
    const auto& attempt = tracker.begin("http://h/x", "GET");

    auto notice = run_sync(controller.consider(attempt, with_network_error(1), true));
    REQUIRE_FALSE(notice.has_value());
    REQUIRE(notice.error().kind == ErrorKind::Strategy);
}

TEST_CASE("wait_before_retry sleeps and honours cancellation", "[retry][controller]") {
    asio::io_context io;

    SECTION("Completes after the delay") {
        const auto started = std::chrono::steady_clock::now();
        const bool waited = run_sync(io, wait_before_retry(io.get_executor(), 30ms, nullptr));
        REQUIRE(waited);
        REQUIRE(std::chrono::steady_clock::now() - started >= 30ms);
    }

    SECTION("Aborting cuts the wait short") {
        AbortSignal signal;
        asio::steady_timer trigger(io, 10ms);
        trigger.async_wait([&signal](const asio::error_code&) { signal.abort(); });

        const auto started = std::chrono::steady_clock::now();
        const bool waited = run_sync(io, wait_before_retry(io.get_executor(), 10s, &signal));
        REQUIRE_FALSE(waited);
        REQUIRE(std::chrono::steady_clock::now() - started < 5s);
    }

    SECTION("An already aborted signal returns at once") {
        AbortSignal signal;
        signal.abort();
        REQUIRE_FALSE(run_sync(io, wait_before_retry(io.get_executor(), 10s, &signal)));
    }
}
