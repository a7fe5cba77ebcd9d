#ifndef FETCHPP_TRANSPORT_CURL_TRANSPORT_HPP
#define FETCHPP_TRANSPORT_CURL_TRANSPORT_HPP

#include "fetchpp/transport/curl_multi.hpp"
#include "fetchpp/transport/transport.hpp"

#include <asio/any_io_executor.hpp>

#include <cstddef>
#include <memory>
#include <string>

namespace fetchpp {

// ─────────────────────────────────────────────────────────────────────────────
// CurlTransport - HTTP/1.1 and HTTPS through libcurl
// ─────────────────────────────────────────────────────────────────────────────
// Every exchange is one curl easy handle on a shared multi handle, so
// keep-alive connections are pooled across attempts and requests. curl's
// callbacks are turned into transport events:
//
//   resolver start / open socket   Socket (fresh), Lookup
//   pre-request                    Socket (reused), Connect, SecureConnect
//   request body drained           Upload
//   blank line after the head      Response (1xx interim heads are skipped)
//   body bytes                     Data
//   body read to the end           End
//
// Redirects are never followed by curl; the client handles them.
//
// Usage:
//   asio::io_context io;
//   CurlTransport transport(io.get_executor());
//   auto exchange = transport.open([](const TransportEvent& e) { ... });
//   auto head = co_await exchange->send(request);

struct CurlTransportConfig {
    // Reuse connections; false closes each one after its exchange.
    bool keep_alive{true};

    // Sent unless the request carries its own.
    std::string user_agent{"fetchpp/1.0"};

    // Body bytes held for the reader before curl is paused.
    std::size_t max_buffered_body{1024 * 1024};

    ConnectionPoolConfig pool;
};

class CurlTransport final : public ITransport {
public:
    /// Throws std::runtime_error when curl cannot be initialized.
    explicit CurlTransport(asio::any_io_executor executor, CurlTransportConfig config = {});

    [[nodiscard]] asio::any_io_executor get_executor() override {
        return executor_;
    }

    [[nodiscard]] std::unique_ptr<IExchange> open(TransportEventSink sink) override;

    [[nodiscard]] const std::shared_ptr<CurlMulti>& multi() const noexcept {
        return multi_;
    }

    [[nodiscard]] const CurlTransportConfig& config() const noexcept {
        return config_;
    }

private:
    asio::any_io_executor executor_;
    CurlTransportConfig config_;
    std::shared_ptr<CurlMulti> multi_;
};

}  // namespace fetchpp

#endif  // FETCHPP_TRANSPORT_CURL_TRANSPORT_HPP
