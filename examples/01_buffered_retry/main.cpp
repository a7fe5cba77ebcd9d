// Example 01: Buffered Request with Retries
//
// Demonstrates a request that is retried on 5xx responses and network
// errors, with a per-phase timeout and a hook that reports every retry.
//
// Usage: example_buffered_retry [url]

#include <fetchpp/client/http_client.hpp>
#include <fetchpp/log/spdlog_logger.hpp>

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>

#include <iostream>
#include <string>

using namespace fetchpp;
using namespace std::chrono_literals;

asio::awaitable<int> run_client(HttpClient& client, std::string url) {
    std::cout << "=== Buffered Request with Retries ===\n\n";

    // 1. Describe the request
    RequestOptions options;
    options.with_url(url)
           .with_header("Accept", "application/json")
           .with_before_retry([](const RetryNotice& notice) {
               std::cout << "[Retry " << notice.retry_count << "] "
                         << notice.error.message << " (waiting "
                         << notice.delay.count() << "ms)\n";
           })
           .with_on_request([](const AttemptInfo& info) {
               std::cout << "[Attempt " << info.ordinal << "] " << info.method << " " << info.url
                         << " on connection #" << info.connection_id
                         << (info.reused_connection ? " (reused)" : "") << "\n";
           });

    // 2. Run it
    auto response = co_await client.request(options);
    if (!response) {
        const auto& error = response.error();
        std::cerr << "ERROR [" << error.code << "]: " << error.message << "\n";
        if (error.response) {
            std::cerr << "  Body: " << error.response->body << "\n";
        }
        co_return 1;
    }

    // 3. Show the result
    std::cout << "\nStatus: " << response->status_code << " " << response->status_message << "\n";
    std::cout << "Retries: " << response->retry_count << "\n";
    for (const auto& hop : response->redirect_urls) {
        std::cout << "Redirected to: " << hop << "\n";
    }
    std::cout << "\n" << response->body << "\n";

    co_return 0;
}

int main(int argc, char* argv[]) {
    const std::string url = (argc > 1) ? argv[1] : "http://127.0.0.1:8080/status";

    try {
        set_logger(make_spdlog_console_logger(LogLevel::Info));

        asio::io_context io;

        ClientConfig config;
        config.with_retry(RetryOptions{}.with_limit(3).with_max_retry_after(10s))
              .with_timeout(TimeoutOptions{}
                  .with(TimeoutPhase::Connect, 2s)
                  .with(TimeoutPhase::Response, 5s)
                  .with(TimeoutPhase::Request, 30s));

        HttpClient client(io.get_executor(), config);

        int exit_code = 0;
        asio::co_spawn(io,
            [&client, &url, &exit_code]() -> asio::awaitable<void> {
                exit_code = co_await run_client(client, url);
            },
            asio::detached
        );

        io.run();
        return exit_code;

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << "\n";
        return 1;
    }
}
