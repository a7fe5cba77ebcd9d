// Example 02: Streaming with Caller-Driven Retries
//
// A stream delivers the body as it arrives and never retries by itself.
// When a retry is due it emits a RetryNotice; the caller opens a new stream
// carrying the notice's retry_count so the limit spans all of them.
//
// Usage: example_stream_retry [url]

#include <fetchpp/client/http_client.hpp>
#include <fetchpp/log/spdlog_logger.hpp>

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include <csignal>
#include <iostream>
#include <string>

using namespace fetchpp;
using namespace std::chrono_literals;

asio::awaitable<int> stream_with_retries(HttpClient& client, std::string url, AbortSignal& signal) {
    std::cout << "=== Streaming with Retries ===\n\n";

    RequestOptions options;
    options.with_url(url).with_timeout(TimeoutOptions::inactivity(10s));

    std::size_t retry_count = 0;
    std::size_t bytes = 0;
    bool again = true;
    int exit_code = 0;

    while (again) {
        again = false;

        auto stream = client.stream(options, retry_count, &signal);
        stream.on_response([](const Response& head) {
                  std::cout << "[Response] " << head.status_code << " " << head.status_message << "\n";
              })
              .on_data([&bytes](std::string_view chunk) {
                  bytes += chunk.size();
                  std::cout << chunk << std::flush;
              })
              .on_retry([&](const RetryNotice& notice) {
                  std::cout << "[Retry " << notice.retry_count << "] " << notice.error.message << "\n";
                  retry_count = notice.retry_count;
                  again = true;
              })
              .on_error([&exit_code](const RequestError& error) {
                  std::cerr << "\nERROR [" << error.code << "]: " << error.message << "\n";
                  exit_code = 1;
              })
              .on_end([]() { std::cout << "\n[End]\n"; });

        co_await stream.run();
    }

    std::cout << "Received " << bytes << " bytes after " << retry_count << " retries\n";
    co_return exit_code;
}

int main(int argc, char* argv[]) {
    const std::string url = (argc > 1) ? argv[1] : "http://127.0.0.1:8080/events";

    try {
        set_logger(make_spdlog_console_logger(LogLevel::Debug));

        asio::io_context io;
        HttpClient client(io.get_executor(), ClientConfig{}.with_retry_limit(5));

        // Ctrl+C cancels the stream in flight
        AbortSignal signal;
        asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&signal](const asio::error_code& ec, int) {
            if (!ec) {
                signal.abort();
            }
        });

        int exit_code = 0;
        asio::co_spawn(io,
            [&]() -> asio::awaitable<void> {
                exit_code = co_await stream_with_retries(client, url, signal);
                signals.cancel();
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
