#ifndef FETCHPP_TRANSPORT_TRANSPORT_HPP
#define FETCHPP_TRANSPORT_TRANSPORT_HPP

#include "fetchpp/error.hpp"
#include "fetchpp/http/http_types.hpp"
#include "fetchpp/http/request_body.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace fetchpp {

// ─────────────────────────────────────────────────────────────────────────────
// Transport Events
// ─────────────────────────────────────────────────────────────────────────────
// Progress of one exchange, in the order a transport reports them. A reused
// keep-alive connection skips Lookup and Connect.

enum class TransportEventKind {
    Socket,         // a connection was assigned (fresh or reused)
    Lookup,         // address resolution finished
    Connect,        // TCP connection established
    SecureConnect,  // TLS handshake finished
    Upload,         // request fully written
    Response,       // response head received
    Data,           // body bytes received
    End             // body complete
};

[[nodiscard]] constexpr std::string_view to_string(TransportEventKind kind) noexcept {
    switch (kind) {
        case TransportEventKind::Socket:        return "socket";
        case TransportEventKind::Lookup:        return "lookup";
        case TransportEventKind::Connect:       return "connect";
        case TransportEventKind::SecureConnect: return "secureConnect";
        case TransportEventKind::Upload:        return "upload";
        case TransportEventKind::Response:      return "response";
        case TransportEventKind::Data:          return "data";
        case TransportEventKind::End:           return "end";
    }
    return "unknown";
}

struct TransportEvent {
    TransportEventKind kind;
    bool reused_connection{false};  // Socket only
    std::size_t bytes{0};           // Data only
};

using TransportEventSink = std::function<void(const TransportEvent&)>;

// ─────────────────────────────────────────────────────────────────────────────
// OutgoingRequest
// ─────────────────────────────────────────────────────────────────────────────

struct OutgoingRequest {
    std::string method{"GET"};
    Url url;
    HeaderMap headers;
    RequestBody body;
};

// ─────────────────────────────────────────────────────────────────────────────
// IExchange - one request/response on one connection
// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle: send() once, then read_some() until it yields nullopt. The
// connection goes back to the pool only when the body was read to the end
// and the server allows reuse; destroying an unfinished exchange closes it.

class IExchange {
public:
    virtual ~IExchange() = default;

    /// Write the request and wait for the response head.
    [[nodiscard]] virtual asio::awaitable<TransportResult<ResponseHead>> send(OutgoingRequest request) = 0;

    /// Next body chunk; nullopt once the body is complete.
    [[nodiscard]] virtual asio::awaitable<TransportResult<std::optional<std::string>>> read_some() = 0;

    /// Abort synchronously: pending operations complete with an error and
    /// no further events reach the sink.
    virtual void abort() noexcept = 0;

    /// Identity of the underlying connection; 0 until one is assigned.
    [[nodiscard]] virtual std::uint64_t connection_id() const noexcept = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// ITransport - creates exchanges
// ─────────────────────────────────────────────────────────────────────────────
// Every attempt of a request goes through the same transport instance, so
// a transport owning a keep-alive pool lets retries reuse connections.

class ITransport {
public:
    virtual ~ITransport() = default;

    [[nodiscard]] virtual asio::any_io_executor get_executor() = 0;

    [[nodiscard]] virtual std::unique_ptr<IExchange> open(TransportEventSink sink) = 0;
};

}  // namespace fetchpp

#endif  // FETCHPP_TRANSPORT_TRANSPORT_HPP
