// ─────────────────────────────────────────────────────────────────────────────
// fetchpp-cli - one HTTP request with retries, phase timeouts and redirects
// ─────────────────────────────────────────────────────────────────────────────
// Usage:
//   fetchpp-cli http://localhost:8080/flaky --retry 3 --timeout 2000
//   fetchpp-cli http://localhost:8080/items -X POST -d '{"a":1}' \
//               -H "Content-Type: application/json" --retry-methods POST
//   fetchpp-cli /status --config client.json --timeout-phase connect=500
//   fetchpp-cli http://localhost:8080/big --stream -v
//
// --config takes a JSON file in the ClientConfig format; flags given on the
// command line override it. With --stream the body is printed as it arrives
// and retries are driven here, one stream per attempt.

#include <cxxopts.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "fetchpp/client/http_client.hpp"
#include "fetchpp/log/logger.hpp"
#include "fetchpp/log/spdlog_logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include <unistd.h>

#include <csignal>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <vector>

using namespace fetchpp;
using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// Terminal Output
// ═══════════════════════════════════════════════════════════════════════════
// Status lines and diagnostics go to stderr so stdout carries only the body.

namespace {

struct Style {
    bool on = true;

    std::string operator()(std::string_view sgr, std::string_view text) const {
        if (!on) {
            return std::string(text);
        }
        return fmt::format("\033[{}m{}\033[0m", sgr, text);
    }
};

Style style;

constexpr std::string_view kRed = "31";
constexpr std::string_view kGreen = "1;32";
constexpr std::string_view kYellow = "1;33";
constexpr std::string_view kDim = "2";

void print_error(std::string_view msg) {
    std::cerr << style(kRed, "fetchpp: ") << msg << "\n";
}

void print_status(const Response& response) {
    const auto line = fmt::format("{} {}", response.status_code, response.status_message);
    std::cerr << style(response.is_success() ? kGreen : kYellow, line)
              << style(kDim, fmt::format("  {} {}  retries: {}", response.method, response.url, response.retry_count))
              << "\n";
    for (const auto& hop : response.redirect_urls) {
        std::cerr << style(kDim, "  via " + hop) << "\n";
    }
}

void print_failure(const RequestError& error) {
    print_error(fmt::format("{} [{}]", error.message, error.code));
    if (error.response) {
        print_status(*error.response);
        std::cout << error.response->body;
    }
}

Json response_to_json(const Response& response) {
    return Json{
        {"statusCode", response.status_code},
        {"statusMessage", response.status_message},
        {"url", response.url},
        {"method", response.method},
        {"redirectUrls", response.redirect_urls},
        {"retryCount", response.retry_count},
        {"headers", response.headers},
        {"body", response.body},
    };
}

Json error_to_json(const RequestError& error) {
    Json out{
        {"kind", std::string(to_string(error.kind))},
        {"code", error.code},
        {"message", error.message},
    };
    if (error.phase.has_value()) {
        out["phase"] = std::string(to_string(*error.phase));
        out["timeout"] = error.timeout.count();
    }
    if (error.response) {
        out["response"] = response_to_json(*error.response);
    }
    return out;
}

// "Name: Value" with optional whitespace after the colon
std::optional<std::pair<std::string, std::string>> split_header(std::string_view line) {
    const auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return std::nullopt;
    }
    auto value = line.substr(colon + 1);
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    return std::pair{std::string(line.substr(0, colon)), std::string(value)};
}

Json load_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::invalid_argument("Cannot open " + path);
    }
    try {
        return Json::parse(file);
    } catch (const Json::parse_error& e) {
        throw std::invalid_argument(path + ": " + e.what());
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<int> run_buffered(HttpClient& client, RequestOptions options, AbortSignal& signal, bool json_output) {
    auto result = co_await client.request(std::move(options), &signal);

    if (json_output) {
        const Json out = result ? Json{{"response", response_to_json(*result)}}
                                : Json{{"error", error_to_json(result.error())}};
        std::cout << out.dump(2) << "\n";
        co_return result ? 0 : 1;
    }

    if (!result) {
        print_failure(result.error());
        co_return 1;
    }
    print_status(*result);
    std::cout << result->body;
    co_return 0;
}

asio::awaitable<int> run_streaming(HttpClient& client, RequestOptions options, AbortSignal& signal) {
    std::size_t retry_count = 0;
    int exit_code = 0;
    bool again = true;

    while (again) {
        again = false;

        auto stream = client.stream(options, retry_count, &signal);
        stream.on_response([](const Response& response) { print_status(response); })
              .on_data([](std::string_view chunk) { std::cout << chunk << std::flush; })
              .on_retry([&](const RetryNotice& notice) {
                  std::cerr << style(kYellow, fmt::format("retry {} after {}ms: {}",
                                notice.next_ordinal, notice.delay.count(), notice.error.message)) << "\n";
                  retry_count = notice.retry_count;
                  again = true;
              })
              .on_error([&](const RequestError& error) {
                  print_failure(error);
                  exit_code = 1;
              });

        co_await stream.run();
    }

    co_return exit_code;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("fetchpp-cli", "HTTP client with retries and per-phase timeouts");

    options.add_options()
        ("url", "Request URL (absolute, or relative to the configured baseUrl)", cxxopts::value<std::string>())
        ("X,method", "Request method", cxxopts::value<std::string>()->default_value("GET"))
        ("H,header", "HTTP header (can be repeated, format: 'Name: Value')", cxxopts::value<std::vector<std::string>>())
        ("d,data", "Request body", cxxopts::value<std::string>())
        ("config", "Client configuration file (JSON)", cxxopts::value<std::string>())

        // Retry
        ("retry", "Retry limit (0 disables retrying)", cxxopts::value<std::size_t>())
        ("retry-methods", "Methods eligible for retry (comma separated)", cxxopts::value<std::vector<std::string>>())
        ("retry-status", "Status codes eligible for retry (comma separated)", cxxopts::value<std::vector<int>>())
        ("max-retry-after", "Largest Retry-After honoured (ms)", cxxopts::value<long>())

        // Timeouts
        ("timeout", "Socket inactivity timeout (ms)", cxxopts::value<long>())
        ("timeout-phase", "Phase timeout, e.g. connect=500 (can be repeated)", cxxopts::value<std::vector<std::string>>())

        // Response handling
        ("no-throw-http-errors", "Treat non-2xx responses as results")
        ("no-follow", "Do not follow redirects")
        ("max-redirects", "Redirect limit", cxxopts::value<std::size_t>())
        ("stream", "Print the body as it arrives")

        // Connections
        ("no-keep-alive", "Close each connection after its exchange")

        // Output options
        ("j,json", "Output the result as JSON")
        ("no-color", "Disable colored output")
        ("log-level", "Level, optionally per component: 'warn,retry=debug,pool=trace'", cxxopts::value<std::string>()->default_value("warn"))
        ("log-file", "Append log records to this file instead of stderr", cxxopts::value<std::string>())
        ("v,verbose", "Debug logging for the retry and redirect components")
        ("h,help", "Print usage");

    options.parse_positional({"url"});
    options.positional_help("<url>");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help") || result.count("url") == 0) {
            std::cout << options.help() << "\n";
            return result.count("help") ? 0 : 1;
        }

        style.on = result.count("no-color") == 0 && ::isatty(::fileno(stderr)) == 1;
        const bool json_output = result.count("json") > 0;

        auto filter = LevelFilter::parse(result["log-level"].as<std::string>());
        if (!filter) {
            print_error("--log-level: " + filter.error());
            return 1;
        }
        if (result.count("verbose")) {
            filter->set(LogComponent::Retry, LogLevel::Debug).set(LogComponent::Redirect, LogLevel::Debug);
        }
        set_logger(result.count("log-file") ? make_spdlog_file_logger(result["log-file"].as<std::string>(), *filter)
                                            : make_spdlog_console_logger(*filter));

        // Client configuration: file first, flags on top
        ClientConfig config;
        if (result.count("config")) {
            config = ClientConfig::from_json(load_json_file(result["config"].as<std::string>()));
        }

        if (result.count("retry")) {
            config.retry.with_limit(result["retry"].as<std::size_t>());
        }
        if (result.count("retry-methods")) {
            const auto methods = result["retry-methods"].as<std::vector<std::string>>();
            config.retry.with_methods(std::set<std::string>(methods.begin(), methods.end()));
        }
        if (result.count("retry-status")) {
            const auto codes = result["retry-status"].as<std::vector<int>>();
            config.retry.with_status_codes(std::set<int>(codes.begin(), codes.end()));
        }
        if (result.count("max-retry-after")) {
            config.retry.with_max_retry_after(std::chrono::milliseconds{result["max-retry-after"].as<long>()});
        }

        if (result.count("timeout")) {
            config.timeout.with(TimeoutPhase::Socket, std::chrono::milliseconds{result["timeout"].as<long>()});
        }
        if (result.count("timeout-phase")) {
            for (const auto& entry : result["timeout-phase"].as<std::vector<std::string>>()) {
                const auto eq = entry.find('=');
                const auto phase = parse_timeout_phase(entry.substr(0, eq));
                if (eq == std::string::npos || phase.has_value() == false) {
                    print_error("Invalid --timeout-phase '" + entry + "'");
                    return 1;
                }
                config.timeout.with(*phase, std::chrono::milliseconds{std::stol(entry.substr(eq + 1))});
            }
        }

        if (result.count("no-throw-http-errors")) {
            config.throw_http_errors = false;
        }
        if (result.count("no-follow")) {
            config.follow_redirect = false;
        }
        if (result.count("max-redirects")) {
            config.max_redirects = result["max-redirects"].as<std::size_t>();
        }
        if (result.count("no-keep-alive")) {
            config.with_keep_alive(false);
        }

        // Request
        RequestOptions request;
        request.with_url(result["url"].as<std::string>())
               .with_method(result["method"].as<std::string>());
        if (result.count("header")) {
            for (const auto& line : result["header"].as<std::vector<std::string>>()) {
                const auto header = split_header(line);
                if (!header) {
                    print_error("Invalid -H '" + line + "', expected 'Name: Value'");
                    return 1;
                }
                request.with_header(header->first, header->second);
            }
        }
        if (result.count("data")) {
            request.with_body(result["data"].as<std::string>());
        }
        request.with_before_retry([](const RetryNotice& notice) {
            FETCHPP_LOG_INFO(Client, "Attempt {} failed ({}); next in {}ms",
                notice.retry_count, notice.error.code, notice.delay.count());
        });

        asio::io_context io;
        HttpClient client(io.get_executor(), config);
        AbortSignal signal;

        asio::signal_set interrupts(io, SIGINT, SIGTERM);
        interrupts.async_wait([&signal](const asio::error_code& ec, int /*signo*/) {
            if (!ec) {
                signal.abort();
            }
        });

        int exit_code = 1;
        const bool streaming = result.count("stream") > 0;
        asio::co_spawn(io, [&]() -> asio::awaitable<void> {
            exit_code = streaming ? co_await run_streaming(client, request, signal)
                                  : co_await run_buffered(client, request, signal, json_output);
            interrupts.cancel();
        }, asio::detached);

        io.run();
        return exit_code;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    } catch (const spdlog::spdlog_ex& e) {
        print_error(e.what());
        return 1;
    } catch (const std::invalid_argument& e) {
        print_error(e.what());
        return 1;
    }
}
