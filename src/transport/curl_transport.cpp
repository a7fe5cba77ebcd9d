#include "fetchpp/transport/curl_transport.hpp"
#include "fetchpp/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/redirect_error.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstring>
#include <deque>
#include <exception>
#include <sys/socket.h>

namespace fetchpp {

namespace {

std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' ||
                             text.back() == '\r' || text.back() == '\n')) {
        text.remove_suffix(1);
    }
    return text;
}

bool sends_empty_body(const std::string& method) {
    return method == "POST" || method == "PUT" || method == "PATCH";
}

// ─────────────────────────────────────────────────────────────────────────────
// CurlTransfer
// ─────────────────────────────────────────────────────────────────────────────
// State shared by one exchange and curl's callbacks. The multi handle keeps
// it alive while attached, so callbacks never see a destroyed transfer even
// when the exchange goes away first.

class CurlTransfer : public std::enable_shared_from_this<CurlTransfer> {
public:
    CurlTransfer(CurlMulti& multi, const CurlTransportConfig& config, TransportEventSink sink)
        : multi_(multi)
        , config_(config)
        , sink_(std::move(sink))
        , wake_(multi.get_executor())
        , easy_(curl_easy_init())
    {
        wake_.expires_at(asio::steady_timer::time_point::max());
    }

    ~CurlTransfer() {
        if (easy_ != nullptr) {
            curl_easy_cleanup(easy_);
        }
        curl_slist_free_all(headers_);
    }

    CurlTransfer(const CurlTransfer&) = delete;
    CurlTransfer& operator=(const CurlTransfer&) = delete;

    TransportResult<void> start(OutgoingRequest request);

    template <typename Ready>
    asio::awaitable<void> wait_until(Ready ready) {
        while (ready() == false && aborted_ == false && !callback_error_) {
            asio::error_code ec;
            co_await wake_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        }
    }

    void abort() noexcept {
        if (aborted_ || ended_) {
            return;
        }
        aborted_ = true;
        notify();
        if (started_ && finished_ == false) {
            multi_.remove(easy_);
        }
    }

    /// The exchange is gone: no more events, and curl lets go of the handle.
    void detach() noexcept {
        sink_ = nullptr;
        detached_ = true;
        aborted_ = true;
        if (started_ && finished_ == false) {
            multi_.remove(easy_);
        }
    }

    std::optional<std::string> take_chunk();

    void end() {
        if (ended_ == false) {
            ended_ = true;
            emit(TransportEvent{TransportEventKind::End});
        }
    }

    void rethrow_callback_error() const {
        if (callback_error_) {
            std::rethrow_exception(callback_error_);
        }
    }

    [[nodiscard]] bool started() const noexcept { return started_; }
    [[nodiscard]] bool aborted() const noexcept { return aborted_; }
    [[nodiscard]] bool finished() const noexcept { return finished_; }
    [[nodiscard]] bool head_ready() const noexcept { return head_ready_; }
    [[nodiscard]] bool has_chunk() const noexcept { return chunks_.empty() == false; }
    [[nodiscard]] const ResponseHead& head() const noexcept { return head_; }
    [[nodiscard]] std::uint64_t connection_id() const noexcept { return connection_id_; }

    [[nodiscard]] bool failure_pending() const noexcept { return failure_.has_value(); }

    [[nodiscard]] TransportError failure() const {
        return failure_.value_or(TransportError{"ERR_NETWORK", "Transfer ended without a response"});
    }

    // ─────────────────────────────────────────────────────────────────────────
    // curl callbacks
    // ─────────────────────────────────────────────────────────────────────────

    int on_resolver_start();
    curl_socket_t on_open_socket(curlsocktype purpose, const curl_sockaddr& address);
    int on_prereq(const char* peer_ip, const char* local_ip, int peer_port, int local_port);
    int on_progress();
    std::size_t on_header(std::string_view line);
    std::size_t on_write(const char* data, std::size_t length);
    std::size_t on_read(char* buffer, std::size_t capacity);

private:
    void configure(const OutgoingRequest& request);
    void on_done(CURLcode result);

    void emit(TransportEvent event) {
        if (stopping() || !sink_) {
            return;
        }
        try {
            sink_(event);
        } catch (...) {
            // curl is on the stack: hand the exception to the awaiting coroutine
            callback_error_ = std::current_exception();
            notify();
        }
    }

    void notify() noexcept {
        wake_.cancel();
    }

    [[nodiscard]] bool stopping() const noexcept {
        return aborted_ || stream_failed_ || static_cast<bool>(callback_error_);
    }

    void open_connection(bool reused);
    void emit_connected();
    void emit_uploaded();
    void pump_stream();

    CurlMulti& multi_;
    CurlTransportConfig config_;
    TransportEventSink sink_;
    asio::steady_timer wake_;

    CURL* easy_;
    curl_slist* headers_{nullptr};
    char error_[CURL_ERROR_SIZE] = {};

    // Request
    bool secure_{false};
    bool uploads_body_{false};
    std::string upload_;
    std::size_t upload_offset_{0};
    std::shared_ptr<IBodyStream> stream_;
    std::string pending_chunk_;
    std::size_t pending_offset_{0};
    bool stream_reading_{false};
    bool stream_done_{false};
    bool upload_paused_{false};
    bool stream_failed_{false};

    // Progress
    std::uint64_t connection_id_{0};
    bool socket_emitted_{false};
    bool reused_{false};
    bool lookup_emitted_{false};
    bool connect_emitted_{false};
    bool secure_emitted_{false};
    bool upload_emitted_{false};

    // Response
    ResponseHead head_;
    bool head_ready_{false};
    std::deque<std::string> chunks_;
    std::size_t buffered_{0};
    bool body_paused_{false};
    std::optional<TransportError> failure_;

    bool started_{false};
    bool finished_{false};
    bool ended_{false};
    bool aborted_{false};
    bool detached_{false};
    std::exception_ptr callback_error_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Trampolines
// ─────────────────────────────────────────────────────────────────────────────

CurlTransfer& transfer_of(void* userdata) {
    return *static_cast<CurlTransfer*>(userdata);
}

int resolver_start_cb(void*, void*, void* userdata) {
    return transfer_of(userdata).on_resolver_start();
}

curl_socket_t open_socket_cb(void* clientp, curlsocktype purpose, curl_sockaddr* address) {
    return transfer_of(clientp).on_open_socket(purpose, *address);
}

int prereq_cb(void* clientp, char* peer_ip, char* local_ip, int peer_port, int local_port) {
    return transfer_of(clientp).on_prereq(peer_ip, local_ip, peer_port, local_port);
}

int progress_cb(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    return transfer_of(clientp).on_progress();
}

std::size_t header_cb(char* buffer, std::size_t size, std::size_t count, void* userdata) {
    return transfer_of(userdata).on_header(std::string_view(buffer, size * count));
}

std::size_t write_cb(char* data, std::size_t size, std::size_t count, void* userdata) {
    return transfer_of(userdata).on_write(data, size * count);
}

std::size_t read_cb(char* buffer, std::size_t size, std::size_t count, void* userdata) {
    return transfer_of(userdata).on_read(buffer, size * count);
}

// ─────────────────────────────────────────────────────────────────────────────
// Setup
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<void> CurlTransfer::start(OutgoingRequest request) {
    if (easy_ == nullptr) {
        return tl::unexpected(TransportError{"ERR_NETWORK", "curl_easy_init failed"});
    }

    secure_ = request.url.is_secure();
    configure(request);

    if (request.body.is_stream()) {
        stream_ = request.body.stream();
    } else {
        upload_ = request.body.content();
    }

    const auto rc = multi_.add(easy_, shared_from_this(), [this](CURLcode result) { on_done(result); });
    if (rc != CURLM_OK) {
        return tl::unexpected(TransportError{"ERR_NETWORK", curl_multi_strerror(rc)});
    }
    started_ = true;
    FETCHPP_LOG_TRACE(Transport, "Started {} {}", request.method, request.url.href);
    return {};
}

void CurlTransfer::configure(const OutgoingRequest& request) {
    curl_easy_setopt(easy_, CURLOPT_URL, request.url.href.c_str());
    curl_easy_setopt(easy_, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(easy_, CURLOPT_HTTP_VERSION, static_cast<long>(CURL_HTTP_VERSION_1_1));
    curl_easy_setopt(easy_, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(easy_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(easy_, CURLOPT_ERRORBUFFER, error_);

    // Pooling
    const auto max_age = std::chrono::ceil<std::chrono::seconds>(config_.pool.idle_timeout).count();
    curl_easy_setopt(easy_, CURLOPT_MAXAGE_CONN, static_cast<long>(std::max<std::int64_t>(max_age, 1)));
    curl_easy_setopt(easy_, CURLOPT_FORBID_REUSE, config_.keep_alive ? 0L : 1L);

    // Phase callbacks
    curl_easy_setopt(easy_, CURLOPT_RESOLVER_START_FUNCTION, &resolver_start_cb);
    curl_easy_setopt(easy_, CURLOPT_RESOLVER_START_DATA, this);
    curl_easy_setopt(easy_, CURLOPT_OPENSOCKETFUNCTION, &open_socket_cb);
    curl_easy_setopt(easy_, CURLOPT_OPENSOCKETDATA, this);
    curl_easy_setopt(easy_, CURLOPT_CLOSESOCKETFUNCTION, &CurlMulti::close_socket);
    curl_easy_setopt(easy_, CURLOPT_CLOSESOCKETDATA, &multi_);
    curl_easy_setopt(easy_, CURLOPT_PREREQFUNCTION, &prereq_cb);
    curl_easy_setopt(easy_, CURLOPT_PREREQDATA, this);
    curl_easy_setopt(easy_, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(easy_, CURLOPT_XFERINFOFUNCTION, &progress_cb);
    curl_easy_setopt(easy_, CURLOPT_XFERINFODATA, this);
    curl_easy_setopt(easy_, CURLOPT_HEADERFUNCTION, &header_cb);
    curl_easy_setopt(easy_, CURLOPT_HEADERDATA, this);
    curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, &write_cb);
    curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);

    // Method and body
    const auto& method = request.method;
    curl_off_t upload_size = -1;
    if (request.body.is_stream()) {
        uploads_body_ = true;
        if (const auto length = get_header(request.headers, "Content-Length")) {
            curl_off_t declared = 0;
            const auto [end, ec] = std::from_chars(length->data(), length->data() + length->size(), declared);
            if (ec == std::errc{} && end == length->data() + length->size()) {
                upload_size = declared;
            }
        }
    } else if (request.body.empty() == false) {
        uploads_body_ = request.body.content().empty() == false;
        upload_size = static_cast<curl_off_t>(request.body.content().size());
    } else if (sends_empty_body(method)) {
        upload_size = 0;
    }

    const bool uploads = uploads_body_ || upload_size == 0;
    if (method == "HEAD") {
        curl_easy_setopt(easy_, CURLOPT_NOBODY, 1L);
    } else if (uploads) {
        curl_easy_setopt(easy_, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(easy_, CURLOPT_INFILESIZE_LARGE, upload_size);
        curl_easy_setopt(easy_, CURLOPT_READFUNCTION, &read_cb);
        curl_easy_setopt(easy_, CURLOPT_READDATA, this);
        curl_easy_setopt(easy_, CURLOPT_CUSTOMREQUEST, method.c_str());
    } else if (method == "GET") {
        curl_easy_setopt(easy_, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(easy_, CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    // Headers; curl derives the framing headers from the upload size
    for (const auto& [name, value] : request.headers) {
        if (iequals(name, "Content-Length") || iequals(name, "Transfer-Encoding")) {
            continue;
        }
        const auto line = value.empty() ? name + ";" : name + ": " + value;
        headers_ = curl_slist_append(headers_, line.c_str());
    }
    if (find_header(request.headers, "Expect") == request.headers.end()) {
        headers_ = curl_slist_append(headers_, "Expect:");
    }
    if (config_.keep_alive == false && find_header(request.headers, "Connection") == request.headers.end()) {
        headers_ = curl_slist_append(headers_, "Connection: close");
    }
    curl_easy_setopt(easy_, CURLOPT_HTTPHEADER, headers_);

    if (find_header(request.headers, "User-Agent") == request.headers.end() && !config_.user_agent.empty()) {
        curl_easy_setopt(easy_, CURLOPT_USERAGENT, config_.user_agent.c_str());
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Connection Phases
// ─────────────────────────────────────────────────────────────────────────────

void CurlTransfer::open_connection(bool reused) {
    socket_emitted_ = true;
    reused_ = reused;
    emit(TransportEvent{TransportEventKind::Socket, reused});
}

void CurlTransfer::emit_connected() {
    if (connect_emitted_ == false) {
        connect_emitted_ = true;
        emit(TransportEvent{TransportEventKind::Connect});
    }
    if (secure_ && secure_emitted_ == false) {
        secure_emitted_ = true;
        emit(TransportEvent{TransportEventKind::SecureConnect});
    }
}

void CurlTransfer::emit_uploaded() {
    if (upload_emitted_ == false) {
        upload_emitted_ = true;
        emit(TransportEvent{TransportEventKind::Upload});
    }
}

int CurlTransfer::on_resolver_start() {
    if (socket_emitted_ == false) {
        connection_id_ = multi_.reserve_connection_id();
        open_connection(false);
    }
    return stopping() ? 1 : 0;
}

curl_socket_t CurlTransfer::on_open_socket(curlsocktype purpose, const curl_sockaddr& address) {
    if (purpose != CURLSOCKTYPE_IPCXN) {
        return CURL_SOCKET_BAD;
    }

    if (socket_emitted_ == false) {
        connection_id_ = multi_.reserve_connection_id();
        open_connection(false);
    } else if (reused_) {
        // The kept-alive connection was dead; curl reconnects on its own
        connection_id_ = multi_.reserve_connection_id();
        reused_ = false;
    }
    if (lookup_emitted_ == false) {
        lookup_emitted_ = true;
        emit(TransportEvent{TransportEventKind::Lookup});
    }
    if (stopping()) {
        return CURL_SOCKET_BAD;
    }
    return ::socket(address.family, address.socktype | SOCK_CLOEXEC, address.protocol);
}

int CurlTransfer::on_prereq(const char* peer_ip, const char* local_ip, int peer_port, int local_port) {
    const auto pair = connection_address_pair(local_ip, local_port, peer_ip, peer_port);

    if (socket_emitted_ == false) {
        // curl skipped lookup and connect: a kept-alive connection
        if (const auto known = multi_.find_connection(pair)) {
            connection_id_ = *known;
        } else {
            connection_id_ = multi_.reserve_connection_id();
            multi_.bind_connection(pair, connection_id_);
        }
        FETCHPP_LOG_DEBUG(Pool, "Reusing connection #{}", connection_id_);
        open_connection(true);
    } else {
        multi_.bind_connection(pair, connection_id_);
        emit_connected();
    }

    if (uploads_body_ == false) {
        emit_uploaded();
    }
    return stopping() ? CURL_PREREQFUNC_ABORT : CURL_PREREQFUNC_OK;
}

int CurlTransfer::on_progress() {
    if (stopping()) {
        return 1;
    }

    // Lets the connect deadline stop before a TLS handshake
    if (socket_emitted_ && reused_ == false && connect_emitted_ == false) {
        curl_off_t connected_after = 0;
        curl_easy_getinfo(easy_, CURLINFO_CONNECT_TIME_T, &connected_after);
        if (connected_after > 0) {
            connect_emitted_ = true;
            emit(TransportEvent{TransportEventKind::Connect});
        }
    }
    return stopping() ? 1 : 0;
}

// ─────────────────────────────────────────────────────────────────────────────
// Request Body
// ─────────────────────────────────────────────────────────────────────────────

std::size_t CurlTransfer::on_read(char* buffer, std::size_t capacity) {
    if (stopping()) {
        return CURL_READFUNC_ABORT;
    }

    if (!stream_) {
        const auto count = std::min(capacity, upload_.size() - upload_offset_);
        std::memcpy(buffer, upload_.data() + upload_offset_, count);
        upload_offset_ += count;
        if (upload_offset_ == upload_.size()) {
            emit_uploaded();
        }
        return count;
    }

    if (pending_offset_ == pending_chunk_.size()) {
        if (stream_done_) {
            emit_uploaded();
            return 0;
        }
        if (stream_reading_ == false) {
            pump_stream();
        }
        upload_paused_ = true;
        return CURL_READFUNC_PAUSE;
    }

    const auto count = std::min(capacity, pending_chunk_.size() - pending_offset_);
    std::memcpy(buffer, pending_chunk_.data() + pending_offset_, count);
    pending_offset_ += count;
    return count;
}

void CurlTransfer::pump_stream() {
    stream_reading_ = true;
    asio::co_spawn(multi_.get_executor(),
        [self = shared_from_this()]() -> asio::awaitable<void> {
            std::optional<std::string> chunk;
            try {
                chunk = co_await self->stream_->read_chunk();
            } catch (const std::exception& e) {
                self->failure_ = TransportError{"ERR_BODY_STREAM", e.what()};
                self->stream_failed_ = true;
            }

            self->stream_reading_ = false;
            if (self->detached_) {
                co_return;
            }
            // After a failure the read callback aborts the transfer once resumed
            if (self->stream_failed_ == false) {
                if (chunk.has_value()) {
                    self->pending_chunk_ = std::move(*chunk);
                    self->pending_offset_ = 0;
                } else {
                    self->stream_done_ = true;
                }
            }
            if (self->upload_paused_ && self->finished_ == false && self->aborted_ == false) {
                self->upload_paused_ = false;
                self->multi_.pause(self->easy_, CURLPAUSE_CONT);
            }
        },
        asio::detached);
}

// ─────────────────────────────────────────────────────────────────────────────
// Response
// ─────────────────────────────────────────────────────────────────────────────

std::size_t CurlTransfer::on_header(std::string_view line) {
    const std::size_t length = line.size();
    if (stopping()) {
        return 0;
    }
    if (head_ready_) {
        return length;  // trailers
    }

    const auto content = trim(line);
    if (content.empty()) {
        if (head_.status_code == 0) {
            return length;
        }
        if (head_.status_code < 200) {
            head_ = ResponseHead{};  // interim 1xx
            return length;
        }
        head_ready_ = true;
        emit(TransportEvent{TransportEventKind::Response});
        notify();
        return stopping() ? 0 : length;
    }

    ResponseHead status;
    if (parse_status_line(content, status)) {
        head_ = std::move(status);
        return length;
    }

    const auto colon = content.find(':');
    if (colon == std::string_view::npos || head_.status_code == 0) {
        return length;
    }
    const auto name = trim(content.substr(0, colon));
    const auto value = trim(content.substr(colon + 1));
    if (name.empty()) {
        return length;
    }

    const auto existing = find_header(head_.headers, name);
    if (existing != head_.headers.end()) {
        set_header(head_.headers, name, existing->second + ", " + std::string(value));
    } else {
        head_.headers.emplace(std::string(name), std::string(value));
    }
    return length;
}

std::size_t CurlTransfer::on_write(const char* data, std::size_t length) {
    if (stopping()) {
        return 0;
    }
    if (buffered_ >= config_.max_buffered_body && buffered_ > 0) {
        body_paused_ = true;
        return CURL_WRITEFUNC_PAUSE;
    }

    chunks_.emplace_back(data, length);
    buffered_ += length;
    emit(TransportEvent{TransportEventKind::Data, false, length});
    notify();
    return stopping() ? 0 : length;
}

std::optional<std::string> CurlTransfer::take_chunk() {
    if (chunks_.empty()) {
        return std::nullopt;
    }
    auto chunk = std::move(chunks_.front());
    chunks_.pop_front();
    buffered_ -= chunk.size();

    if (body_paused_ && buffered_ < config_.max_buffered_body && finished_ == false) {
        body_paused_ = false;
        multi_.pause(easy_, CURLPAUSE_CONT);
    }
    return chunk;
}

void CurlTransfer::on_done(CURLcode result) {
    finished_ = true;
    if (aborted_) {
        notify();
        return;
    }

    if (result == CURLE_OK) {
        if (head_ready_ == false) {
            failure_ = TransportError{"ERR_INVALID_RESPONSE", "Transfer ended before a response head"};
        }
    } else if (!failure_) {
        long os_errno = 0;
        curl_easy_getinfo(easy_, CURLINFO_OS_ERRNO, &os_errno);
        std::string message = result == CURLE_GOT_NOTHING ? std::string("socket hang up")
                            : error_[0] != '\0'           ? std::string(error_)
                                                          : std::string(curl_easy_strerror(result));
        failure_ = TransportError{transport_error_code(result, os_errno), std::move(message)};
        FETCHPP_LOG_DEBUG(Transport, "Transfer on connection #{} failed: {} ({})",
            connection_id_, failure_->message, failure_->code);
    }

    if (result == CURLE_OK) {
        long connects = 0;
        curl_easy_getinfo(easy_, CURLINFO_NUM_CONNECTS, &connects);
        FETCHPP_LOG_TRACE(Transport, "Transfer on connection #{} done, {} new connection(s)",
            connection_id_, connects);
    }
    notify();
}

// ─────────────────────────────────────────────────────────────────────────────
// CurlExchange
// ─────────────────────────────────────────────────────────────────────────────

class CurlExchange final : public IExchange {
public:
    CurlExchange(std::shared_ptr<CurlMulti> multi, const CurlTransportConfig& config, TransportEventSink sink)
        : multi_(std::move(multi))
        , transfer_(std::make_shared<CurlTransfer>(*multi_, config, std::move(sink)))
    {}

    ~CurlExchange() override {
        transfer_->detach();
    }

    asio::awaitable<TransportResult<ResponseHead>> send(OutgoingRequest request) override {
        if (transfer_->aborted()) {
            co_return tl::unexpected(TransportError::aborted());
        }
        if (transfer_->started()) {
            co_return tl::unexpected(TransportError{"ERR_INVALID_STATE", "Request already sent"});
        }

        auto started = transfer_->start(std::move(request));
        if (!started) {
            co_return tl::unexpected(started.error());
        }

        auto* transfer = transfer_.get();
        co_await transfer->wait_until([transfer]() {
            return transfer->head_ready() || transfer->finished();
        });

        transfer->rethrow_callback_error();
        if (transfer->aborted()) {
            co_return tl::unexpected(TransportError::aborted());
        }
        if (transfer->head_ready()) {
            co_return transfer->head();
        }
        co_return tl::unexpected(transfer->failure());
    }

    asio::awaitable<TransportResult<std::optional<std::string>>> read_some() override {
        if (transfer_->aborted()) {
            co_return tl::unexpected(TransportError::aborted());
        }
        if (transfer_->head_ready() == false) {
            co_return tl::unexpected(TransportError{"ERR_INVALID_STATE", "Body read before the response head"});
        }

        auto* transfer = transfer_.get();
        co_await transfer->wait_until([transfer]() {
            return transfer->has_chunk() || transfer->finished();
        });

        transfer->rethrow_callback_error();
        if (transfer->aborted()) {
            co_return tl::unexpected(TransportError::aborted());
        }
        if (auto chunk = transfer->take_chunk()) {
            co_return std::optional<std::string>{std::move(*chunk)};
        }
        if (transfer->failure_pending()) {
            co_return tl::unexpected(transfer->failure());
        }
        transfer->end();
        co_return std::optional<std::string>{};
    }

    void abort() noexcept override {
        transfer_->abort();
    }

    [[nodiscard]] std::uint64_t connection_id() const noexcept override {
        return transfer_->connection_id();
    }

private:
    std::shared_ptr<CurlMulti> multi_;
    std::shared_ptr<CurlTransfer> transfer_;
};

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// CurlTransport
// ─────────────────────────────────────────────────────────────────────────────

CurlTransport::CurlTransport(asio::any_io_executor executor, CurlTransportConfig config)
    : executor_(std::move(executor))
    , config_(std::move(config))
    , multi_(CurlMulti::create(executor_, config_.pool))
{}

std::unique_ptr<IExchange> CurlTransport::open(TransportEventSink sink) {
    return std::make_unique<CurlExchange>(multi_, config_, std::move(sink));
}

}  // namespace fetchpp
