// ─────────────────────────────────────────────────────────────────────────────
// Configuration Tests
// ─────────────────────────────────────────────────────────────────────────────
// RetryOptions, TimeoutOptions and ClientConfig defaults, builders and the
// JSON forms accepted by --config.

#include <catch2/catch_test_macros.hpp>

#include "fetchpp/client/client_config.hpp"
#include "fetchpp/retry/retry_options.hpp"
#include "fetchpp/timeout/timeout_options.hpp"

#include <nlohmann/json.hpp>

using namespace fetchpp;
using namespace std::chrono_literals;
using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// RetryOptions
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("RetryOptions defaults", "[config][retry]") {
    RetryOptions options;

    SECTION("Two retries after the first attempt") {
        REQUIRE(options.limit() == 2);
    }

    SECTION("Idempotent methods only") {
        REQUIRE(options.methods() == std::set<std::string>{"GET", "PUT", "HEAD", "DELETE", "OPTIONS", "TRACE"});
        REQUIRE(options.allows_method("get"));
        REQUIRE_FALSE(options.allows_method("POST"));
        REQUIRE_FALSE(options.allows_method("PATCH"));
    }

    SECTION("Transient status codes") {
        REQUIRE(options.status_codes() == std::set<int>{408, 413, 429, 500, 502, 503, 504, 521, 522, 524});
        REQUIRE_FALSE(options.allows_status(404));
        REQUIRE_FALSE(options.allows_status(501));
    }

    SECTION("Transient network error codes") {
        for (const auto* code : {"ETIMEDOUT", "ECONNRESET", "EADDRINUSE", "ECONNREFUSED",
                                 "EPIPE", "ENOTFOUND", "ENETUNREACH", "EAI_AGAIN"}) {
            REQUIRE(options.allows_error_code(code));
        }
        REQUIRE_FALSE(options.allows_error_code("ERR_UNSUPPORTED_PROTOCOL"));
    }

    SECTION("No Retry-After ceiling and no custom strategy") {
        REQUIRE_FALSE(options.max_retry_after().has_value());
        REQUIRE_FALSE(static_cast<bool>(options.calculate_delay()));
    }
}

TEST_CASE("RetryOptions builders", "[config][retry]") {
    RetryOptions options;
    options.with_limit(5)
           .with_methods({"post", "Get"})
           .with_status_code(418)
           .without_status_code(503)
           .with_error_code("EHOSTUNREACH")
           .with_max_retry_after(2s);

    REQUIRE(options.limit() == 5);
    REQUIRE(options.methods() == std::set<std::string>{"GET", "POST"});
    REQUIRE(options.allows_status(418));
    REQUIRE_FALSE(options.allows_status(503));
    REQUIRE(options.allows_error_code("EHOSTUNREACH"));
    REQUIRE(options.max_retry_after() == std::chrono::milliseconds{2000});
}

TEST_CASE("RetryOptions from_json", "[config][retry][json]") {
    SECTION("A bare number is the limit") {
        auto options = RetryOptions::from_json(Json(4));
        REQUIRE(options.limit() == 4);
        REQUIRE(options.allows_status(503));
    }

    SECTION("Object form replaces only the keys present") {
        auto options = RetryOptions::from_json(Json{
            {"limit", 1},
            {"methods", {"post"}},
            {"statusCodes", {503}},
            {"maxRetryAfter", 1500},
        });

        REQUIRE(options.limit() == 1);
        REQUIRE(options.methods() == std::set<std::string>{"POST"});
        REQUIRE(options.status_codes() == std::set<int>{503});
        REQUIRE(options.allows_error_code("ECONNRESET"));
        REQUIRE(options.max_retry_after() == std::chrono::milliseconds{1500});
    }

    SECTION("Empty lists allow nothing") {
        auto options = RetryOptions::from_json(Json{{"methods", Json::array()}, {"statusCodes", Json::array()}});
        REQUIRE(options.methods().empty());
        REQUIRE(options.status_codes().empty());
    }

    SECTION("Malformed documents are rejected") {
        REQUIRE_THROWS_AS(RetryOptions::from_json(Json(-1)), std::invalid_argument);
        REQUIRE_THROWS_AS(RetryOptions::from_json(Json("two")), std::invalid_argument);
        REQUIRE_THROWS_AS(RetryOptions::from_json(Json{{"methods", "GET"}}), std::invalid_argument);
        REQUIRE_THROWS_AS(RetryOptions::from_json(Json{{"statusCodes", {"x"}}}), std::invalid_argument);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// TimeoutOptions
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("TimeoutOptions phases", "[config][timeout]") {
    TimeoutOptions options;
    REQUIRE(options.empty());

    options.with(TimeoutPhase::Connect, 100ms).with(TimeoutPhase::Request, 5s);
    REQUIRE(options.has(TimeoutPhase::Connect));
    REQUIRE(options.get(TimeoutPhase::Request) == std::chrono::milliseconds{5000});
    REQUIRE_FALSE(options.has(TimeoutPhase::Socket));

    options.without(TimeoutPhase::Connect).without(TimeoutPhase::Request);
    REQUIRE(options.empty());
}

TEST_CASE("TimeoutPhase names", "[config][timeout]") {
    for (const auto phase : kAllTimeoutPhases) {
        REQUIRE(parse_timeout_phase(to_string(phase)) == phase);
    }
    REQUIRE(to_string(TimeoutPhase::SecureConnect) == "secureConnect");
    REQUIRE_FALSE(parse_timeout_phase("Connect").has_value());
}

TEST_CASE("TimeoutOptions from_json", "[config][timeout][json]") {
    SECTION("A bare number is the inactivity deadline") {
        auto options = TimeoutOptions::from_json(Json(300));
        REQUIRE(options.get(TimeoutPhase::Socket) == std::chrono::milliseconds{300});
        REQUIRE_FALSE(options.has(TimeoutPhase::Request));
    }

    SECTION("Object form sets each named phase") {
        auto options = TimeoutOptions::from_json(Json{{"lookup", 50}, {"connect", 100}, {"response", 2000}});
        REQUIRE(options.get(TimeoutPhase::Lookup) == std::chrono::milliseconds{50});
        REQUIRE(options.get(TimeoutPhase::Connect) == std::chrono::milliseconds{100});
        REQUIRE(options.get(TimeoutPhase::Response) == std::chrono::milliseconds{2000});
        REQUIRE_FALSE(options.has(TimeoutPhase::Socket));
    }

    SECTION("Unknown phases and negative values are rejected") {
        REQUIRE_THROWS_AS(TimeoutOptions::from_json(Json{{"dns", 10}}), std::invalid_argument);
        REQUIRE_THROWS_AS(TimeoutOptions::from_json(Json{{"connect", -1}}), std::invalid_argument);
        REQUIRE_THROWS_AS(TimeoutOptions::from_json(Json(-5)), std::invalid_argument);
        REQUIRE_THROWS_AS(TimeoutOptions::from_json(Json("fast")), std::invalid_argument);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// ClientConfig
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ClientConfig defaults", "[config][client]") {
    ClientConfig config;

    REQUIRE(config.base_url.empty());
    REQUIRE(config.throw_http_errors == true);
    REQUIRE(config.follow_redirect == true);
    REQUIRE(config.max_redirects == 10);
    REQUIRE(config.method_rewriting == false);
    REQUIRE(config.keep_alive == true);
    REQUIRE(config.pool.max_idle_connections == 16);
    REQUIRE(config.retry.limit() == 2);
    REQUIRE(config.timeout.empty());
}

TEST_CASE("ClientConfig builders", "[config][client]") {
    ClientConfig config;
    config.with_base_url("http://localhost:8080/api")
          .with_bearer_token("secret")
          .with_retry_limit(4)
          .with_timeout(250ms)
          .with_throw_http_errors(false)
          .with_max_redirects(3)
          .with_keep_alive(false);

    REQUIRE(config.base_url == "http://localhost:8080/api");
    REQUIRE(get_header(config.default_headers, "authorization") == "Bearer secret");
    REQUIRE(config.retry.limit() == 4);
    REQUIRE(config.timeout.get(TimeoutPhase::Socket) == std::chrono::milliseconds{250});
    REQUIRE(config.throw_http_errors == false);
    REQUIRE(config.max_redirects == 3);
    REQUIRE(config.keep_alive == false);

    const auto transport = config.transport_config();
    REQUIRE(transport.keep_alive == false);
    REQUIRE(transport.user_agent == config.user_agent);
}

TEST_CASE("ClientConfig from_json", "[config][client][json]") {
    const auto config = ClientConfig::from_json(Json::parse(R"({
        "baseUrl": "http://127.0.0.1:9000/v1/",
        "headers": {"X-Trace": "abc"},
        "retry": {"limit": 3, "statusCodes": [503]},
        "timeout": {"connect": 500, "request": 10000},
        "throwHttpErrors": false,
        "followRedirect": false,
        "maxRedirects": 2,
        "methodRewriting": true,
        "keepAlive": false,
        "userAgent": "fetchpp-test/2",
        "pool": {"maxIdle": 1, "maxPerOrigin": 2, "idleTimeout": 1000}
    })"));

    REQUIRE(config.base_url == "http://127.0.0.1:9000/v1/");
    REQUIRE(get_header(config.default_headers, "x-trace") == "abc");
    REQUIRE(config.retry.limit() == 3);
    REQUIRE(config.retry.status_codes() == std::set<int>{503});
    REQUIRE(config.timeout.get(TimeoutPhase::Connect) == std::chrono::milliseconds{500});
    REQUIRE(config.timeout.get(TimeoutPhase::Request) == std::chrono::milliseconds{10000});
    REQUIRE(config.throw_http_errors == false);
    REQUIRE(config.follow_redirect == false);
    REQUIRE(config.max_redirects == 2);
    REQUIRE(config.method_rewriting == true);
    REQUIRE(config.keep_alive == false);
    REQUIRE(config.user_agent == "fetchpp-test/2");
    REQUIRE(config.pool.max_idle_connections == 1);
    REQUIRE(config.pool.max_per_origin == 2);
    REQUIRE(config.pool.idle_timeout == std::chrono::milliseconds{1000});
}

TEST_CASE("ClientConfig from_json rejects malformed documents", "[config][client][json]") {
    REQUIRE_THROWS_AS(ClientConfig::from_json(Json::array()), std::invalid_argument);
    REQUIRE_THROWS_AS(ClientConfig::from_json(Json{{"maxRedirects", "ten"}}), std::invalid_argument);
    REQUIRE_THROWS_AS(ClientConfig::from_json(Json{{"timeout", {{"bogus", 1}}}}), std::invalid_argument);
}
