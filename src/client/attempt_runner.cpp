#include "fetchpp/client/attempt_runner.hpp"
#include "fetchpp/log/logger.hpp"
#include "fetchpp/timeout/timeout_composer.hpp"

#include <functional>

namespace fetchpp {

// ─────────────────────────────────────────────────────────────────────────────
// ExchangeSession
// ─────────────────────────────────────────────────────────────────────────────
// One transport exchange wired to its deadlines and to the abort signal.
// Transport failures are translated here: an aborted exchange reports the
// reason it was aborted for (timeout phase or cancellation).

class ExchangeSession {
public:
    using SocketCallback = std::function<void(const TransportEvent&, std::uint64_t)>;

    ExchangeSession(
        ITransport& transport,
        ITimerFactory& timers,
        const TimeoutOptions& timeout,
        bool secure,
        AbortSignal* signal,
        SocketCallback on_socket
    )
        : on_socket_(std::move(on_socket))
        , composer_(timeout, timers, secure, [this]() { abort_exchange(); })
        , exchange_(transport.open([this](const TransportEvent& event) { on_event(event); }))
        , cancelled_(false)
        , cancellation_(signal, [this]() { cancel(); })
    {}

    ~ExchangeSession() {
        composer_.complete();
    }

    ExchangeSession(const ExchangeSession&) = delete;
    ExchangeSession& operator=(const ExchangeSession&) = delete;

    asio::awaitable<Result<ResponseHead>> start(OutgoingRequest request) {
        if (cancelled_) {
            co_return tl::unexpected(RequestError::cancelled());
        }

        composer_.start();
        auto head = co_await exchange_->send(std::move(request));

        if (auto interrupted = interruption()) {
            co_return tl::unexpected(std::move(*interrupted));
        }
        if (!head) {
            co_return tl::unexpected(RequestError::transport(head.error()));
        }
        co_return std::move(*head);
    }

    asio::awaitable<Result<std::optional<std::string>>> read_some() {
        if (auto interrupted = interruption()) {
            co_return tl::unexpected(std::move(*interrupted));
        }

        auto chunk = co_await exchange_->read_some();

        if (auto interrupted = interruption()) {
            co_return tl::unexpected(std::move(*interrupted));
        }
        if (!chunk) {
            co_return tl::unexpected(RequestError::transport(chunk.error()));
        }
        co_return std::move(*chunk);
    }

    void finish() noexcept {
        composer_.complete();
    }

private:
    void on_event(const TransportEvent& event) {
        composer_.on_event(event);
        if (event.kind == TransportEventKind::Socket && on_socket_) {
            on_socket_(event, exchange_->connection_id());
        }
    }

    void abort_exchange() noexcept {
        if (exchange_) {
            exchange_->abort();
        }
    }

    void cancel() {
        cancelled_ = true;
        composer_.complete();
        abort_exchange();
    }

    std::optional<RequestError> interruption() const {
        if (cancelled_) {
            return RequestError::cancelled();
        }
        if (composer_.fired()) {
            return *composer_.failure();
        }
        return std::nullopt;
    }

    SocketCallback on_socket_;
    TimeoutComposer composer_;
    std::unique_ptr<IExchange> exchange_;
    bool cancelled_{false};
    AbortSubscription cancellation_;  // last: may fire during construction
};

// ─────────────────────────────────────────────────────────────────────────────
// AttemptRunner
// ─────────────────────────────────────────────────────────────────────────────

AttemptRunner::AttemptRunner(
    ITransport& transport,
    ITimerFactory& timers,
    PreparedRequest& request,
    RedirectHandler& redirects,
    AbortSignal* signal
)
    : transport_(transport)
    , timers_(timers)
    , request_(request)
    , redirects_(redirects)
    , signal_(signal)
{}

AttemptRunner::~AttemptRunner() = default;

asio::awaitable<Result<ResponseHead>> AttemptRunner::open(AttemptTracker& tracker) {
    const std::size_t ordinal = tracker.current().ordinal;

    while (true) {
        close();

        auto on_socket = [this, ordinal](const TransportEvent& event, std::uint64_t connection_id) {
            FETCHPP_LOG_TRACE(Client, "Attempt {} on connection #{}{}",
                ordinal, connection_id, event.reused_connection ? " (reused)" : "");
            if (request_.hooks.on_request) {
                request_.hooks.on_request(AttemptInfo{
                    .ordinal = ordinal,
                    .url = request_.url.href,
                    .method = request_.method,
                    .connection_id = connection_id,
                    .reused_connection = event.reused_connection,
                });
            }
        };

        session_ = std::make_unique<ExchangeSession>(
            transport_, timers_, request_.timeout, request_.url.is_secure(), signal_, std::move(on_socket));

        FETCHPP_LOG_DEBUG(Client, "Attempt {}: {} {}", ordinal, request_.method, request_.url.href);

        OutgoingRequest outgoing{
            .method = request_.method,
            .url = request_.url,
            .headers = request_.headers,
            .body = request_.body,
        };
        auto head = co_await session_->start(std::move(outgoing));
        if (!head) {
            close();
            co_return tl::unexpected(head.error());
        }

        auto redirect = redirects_.next(request_.url, request_.method, *head);
        if (!redirect) {
            close();
            co_return tl::unexpected(redirect.error());
        }
        if (redirect->has_value() == false) {
            co_return std::move(*head);
        }

        // Drain so curl can keep the connection for the next hop
        auto drained = co_await read_all();
        if (!drained) {
            co_return tl::unexpected(drained.error());
        }

        apply_redirect(std::move(**redirect));
        tracker.redirect(request_.url.href, request_.method);
    }
}

asio::awaitable<Result<std::optional<std::string>>> AttemptRunner::read_some() {
    if (!session_) {
        co_return std::optional<std::string>{};
    }
    auto chunk = co_await session_->read_some();
    if (!chunk || chunk->has_value() == false) {
        close();
    }
    co_return chunk;
}

asio::awaitable<Result<std::string>> AttemptRunner::read_all() {
    std::string body;
    while (true) {
        auto chunk = co_await read_some();
        if (!chunk) {
            co_return tl::unexpected(chunk.error());
        }
        if (chunk->has_value() == false) {
            break;
        }
        body += **chunk;
    }
    co_return body;
}

void AttemptRunner::close() noexcept {
    if (session_) {
        session_->finish();
        session_.reset();
    }
}

Response AttemptRunner::make_response(
    const ResponseHead& head,
    std::string body,
    std::size_t retry_count
) const {
    Response response;
    response.status_code = head.status_code;
    response.status_message = head.status_message.empty()
        ? std::string(reason_phrase(head.status_code))
        : head.status_message;
    response.headers = head.headers;
    response.body = std::move(body);
    response.url = request_.url.href;
    response.method = request_.method;
    response.redirect_urls = redirects_.redirect_urls();
    response.retry_count = retry_count;
    return response;
}

void AttemptRunner::apply_redirect(RedirectTarget target) {
    const bool same_origin = (target.url.origin() == request_.url.origin());
    if (same_origin == false) {
        erase_header(request_.headers, "Authorization");
        erase_header(request_.headers, "Cookie");
    }
    erase_header(request_.headers, "Host");

    if (target.drop_body) {
        request_.body = RequestBody{};
        erase_header(request_.headers, "Content-Length");
        erase_header(request_.headers, "Content-Type");
        erase_header(request_.headers, "Transfer-Encoding");
    }

    request_.url = std::move(target.url);
    request_.method = std::move(target.method);
}

}  // namespace fetchpp
