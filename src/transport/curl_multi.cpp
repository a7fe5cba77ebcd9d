#include "fetchpp/transport/curl_multi.hpp"
#include "fetchpp/log/logger.hpp"

#include <asio/error.hpp>

#include <fmt/format.h>

#include <arpa/inet.h>
#include <cerrno>
#include <cstdlib>
#include <mutex>
#include <netinet/in.h>
#include <stdexcept>
#include <sys/socket.h>
#include <system_error>
#include <unistd.h>

namespace fetchpp {

namespace {

void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, []() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("curl_global_init failed");
        }
        std::atexit([]() { curl_global_cleanup(); });
    });
}

// curl must not be re-entered from its own callbacks
struct ActingScope {
    explicit ActingScope(int& depth) noexcept : depth_(depth) { ++depth_; }
    ~ActingScope() { --depth_; }

    ActingScope(const ActingScope&) = delete;
    ActingScope& operator=(const ActingScope&) = delete;

private:
    int& depth_;
};

struct Endpoint {
    std::string ip;
    long port{0};
};

std::optional<Endpoint> endpoint_of(const sockaddr_storage& address) {
    char text[INET6_ADDRSTRLEN] = {};
    if (address.ss_family == AF_INET) {
        const auto* v4 = reinterpret_cast<const sockaddr_in*>(&address);
        if (inet_ntop(AF_INET, &v4->sin_addr, text, sizeof(text)) == nullptr) {
            return std::nullopt;
        }
        return Endpoint{text, ntohs(v4->sin_port)};
    }
    if (address.ss_family == AF_INET6) {
        const auto* v6 = reinterpret_cast<const sockaddr_in6*>(&address);
        if (inet_ntop(AF_INET6, &v6->sin6_addr, text, sizeof(text)) == nullptr) {
            return std::nullopt;
        }
        return Endpoint{text, ntohs(v6->sin6_port)};
    }
    return std::nullopt;
}

std::optional<std::string> address_pair_of(curl_socket_t fd) {
    sockaddr_storage local{};
    sockaddr_storage peer{};
    socklen_t local_size = sizeof(local);
    socklen_t peer_size = sizeof(peer);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&local), &local_size) != 0 ||
        ::getpeername(fd, reinterpret_cast<sockaddr*>(&peer), &peer_size) != 0) {
        return std::nullopt;
    }

    const auto local_endpoint = endpoint_of(local);
    const auto peer_endpoint = endpoint_of(peer);
    if (!local_endpoint || !peer_endpoint) {
        return std::nullopt;
    }
    return connection_address_pair(local_endpoint->ip, local_endpoint->port,
                                   peer_endpoint->ip, peer_endpoint->port);
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

std::shared_ptr<CurlMulti> CurlMulti::create(asio::any_io_executor executor, ConnectionPoolConfig config) {
    ensure_curl_initialized();
    return std::shared_ptr<CurlMulti>(new CurlMulti(std::move(executor), std::move(config)));
}

CurlMulti::CurlMulti(asio::any_io_executor executor, ConnectionPoolConfig config)
    : executor_(std::move(executor))
    , config_(std::move(config))
    , multi_(curl_multi_init())
    , timer_(executor_)
{
    if (multi_ == nullptr) {
        throw std::runtime_error("curl_multi_init failed");
    }

    curl_multi_setopt(multi_, CURLMOPT_SOCKETFUNCTION, &CurlMulti::on_socket);
    curl_multi_setopt(multi_, CURLMOPT_SOCKETDATA, this);
    curl_multi_setopt(multi_, CURLMOPT_TIMERFUNCTION, &CurlMulti::on_timer);
    curl_multi_setopt(multi_, CURLMOPT_TIMERDATA, this);
    curl_multi_setopt(multi_, CURLMOPT_MAXCONNECTS, static_cast<long>(config_.max_idle_connections));
    curl_multi_setopt(multi_, CURLMOPT_MAX_HOST_CONNECTIONS, static_cast<long>(config_.max_per_origin));
}

CurlMulti::~CurlMulti() {
    for (auto& [easy, transfer] : transfers_) {
        curl_multi_remove_handle(multi_, easy);
    }
    transfers_.clear();

    for (auto& [fd, watch] : watches_) {
        watch->descriptor.release();
    }
    watches_.clear();

    // Cached connections are closed here, through close_socket()
    curl_multi_setopt(multi_, CURLMOPT_SOCKETFUNCTION, static_cast<curl_socket_callback>(nullptr));
    curl_multi_setopt(multi_, CURLMOPT_TIMERFUNCTION, static_cast<curl_multi_timer_callback>(nullptr));
    curl_multi_cleanup(multi_);
}

// ═══════════════════════════════════════════════════════════════════════════
// Transfers
// ═══════════════════════════════════════════════════════════════════════════

CURLMcode CurlMulti::add(CURL* easy, std::shared_ptr<void> owner, DoneHandler on_done) {
    transfers_[easy] = Transfer{std::move(owner), std::move(on_done)};

    CURLMcode rc = CURLM_OK;
    {
        ActingScope scope(acting_);
        rc = curl_multi_add_handle(multi_, easy);
    }
    if (rc != CURLM_OK) {
        FETCHPP_LOG_ERROR(Transport, "curl_multi_add_handle failed: {}", curl_multi_strerror(rc));
        transfers_.erase(easy);
    }
    return rc;
}

void CurlMulti::remove(CURL* easy) noexcept {
    auto it = transfers_.find(easy);
    if (it == transfers_.end()) {
        return;
    }
    it->second.removing = true;

    if (acting()) {
        pending_removals_.push_back(easy);
        return;
    }
    detach(easy);
}

CURLcode CurlMulti::pause(CURL* easy, int bitmask) {
    CURLcode rc = CURLE_OK;
    {
        ActingScope scope(acting_);
        rc = curl_easy_pause(easy, bitmask);
    }
    drain_removals();
    check_completed();
    return rc;
}

void CurlMulti::detach(CURL* easy) noexcept {
    auto it = transfers_.find(easy);
    if (it == transfers_.end()) {
        return;
    }
    curl_multi_remove_handle(multi_, easy);

    // The owner may hold the easy handle: release it only after removal
    auto transfer = std::move(it->second);
    transfers_.erase(it);
}

void CurlMulti::drain_removals() noexcept {
    auto removals = std::move(pending_removals_);
    pending_removals_.clear();
    for (CURL* easy : removals) {
        detach(easy);
    }
}

void CurlMulti::check_completed() {
    int queued = 0;
    while (CURLMsg* message = curl_multi_info_read(multi_, &queued)) {
        if (message->msg != CURLMSG_DONE) {
            continue;
        }
        CURL* easy = message->easy_handle;
        const CURLcode result = message->data.result;

        auto it = transfers_.find(easy);
        if (it == transfers_.end()) {
            continue;
        }
        auto transfer = std::move(it->second);
        transfers_.erase(it);
        curl_multi_remove_handle(multi_, easy);

        if (transfer.removing == false && transfer.on_done) {
            transfer.on_done(result);
        }
    }
}

void CurlMulti::act(curl_socket_t fd, int events) {
    int running = 0;
    CURLMcode rc = CURLM_OK;
    {
        ActingScope scope(acting_);
        rc = curl_multi_socket_action(multi_, fd, events, &running);
    }
    if (rc != CURLM_OK) {
        FETCHPP_LOG_WARN(Transport, "curl_multi_socket_action failed: {}", curl_multi_strerror(rc));
    }
    drain_removals();
    check_completed();
}

// ═══════════════════════════════════════════════════════════════════════════
// Socket and Timer Callbacks
// ═══════════════════════════════════════════════════════════════════════════

int CurlMulti::on_socket(CURL*, curl_socket_t fd, int what, void* userp, void*) {
    auto* self = static_cast<CurlMulti*>(userp);
    if (what == CURL_POLL_REMOVE) {
        self->unwatch(fd);
        return 0;
    }
    try {
        self->watch(fd, what);
    } catch (const std::system_error& e) {
        FETCHPP_LOG_ERROR(Transport, "Cannot watch socket {}: {}", fd, e.what());
        return -1;
    }
    return 0;
}

int CurlMulti::on_timer(CURLM*, long timeout_ms, void* userp) {
    static_cast<CurlMulti*>(userp)->schedule(timeout_ms);
    return 0;
}

void CurlMulti::schedule(long timeout_ms) {
    if (timeout_ms < 0) {
        timer_.cancel();
        return;
    }

    // Even a zero timeout goes through the executor: curl is still on the stack
    timer_.expires_after(std::chrono::milliseconds{timeout_ms});
    timer_.async_wait([weak = weak_from_this()](const asio::error_code& ec) {
        auto self = weak.lock();
        if (!self || ec) {
            return;
        }
        self->act(CURL_SOCKET_TIMEOUT, 0);
    });
}

void CurlMulti::watch(curl_socket_t fd, int what) {
    auto& slot = watches_[fd];
    if (!slot) {
        slot = std::make_unique<Watch>(executor_, fd, ++next_generation_);
    }
    slot->wanted = what;
    arm(fd, *slot);
}

void CurlMulti::unwatch(curl_socket_t fd) noexcept {
    auto it = watches_.find(fd);
    if (it == watches_.end()) {
        return;
    }
    // curl owns the descriptor and closes it itself
    it->second->descriptor.release();
    watches_.erase(it);
}

void CurlMulti::arm(curl_socket_t fd, Watch& watch) {
    const auto generation = watch.generation;

    if ((watch.wanted & CURL_POLL_IN) && watch.reading == false) {
        watch.reading = true;
        watch.descriptor.async_wait(asio::posix::stream_descriptor::wait_read,
            [weak = weak_from_this(), fd, generation](const asio::error_code& ec) {
                if (auto self = weak.lock()) {
                    self->on_ready(fd, generation, CURL_CSELECT_IN, ec);
                }
            });
    }

    if ((watch.wanted & CURL_POLL_OUT) && watch.writing == false) {
        watch.writing = true;
        watch.descriptor.async_wait(asio::posix::stream_descriptor::wait_write,
            [weak = weak_from_this(), fd, generation](const asio::error_code& ec) {
                if (auto self = weak.lock()) {
                    self->on_ready(fd, generation, CURL_CSELECT_OUT, ec);
                }
            });
    }
}

void CurlMulti::on_ready(curl_socket_t fd, std::uint64_t generation, int direction, const asio::error_code& ec) {
    auto it = watches_.find(fd);
    if (it == watches_.end() || it->second->generation != generation) {
        return;
    }

    const bool reading = (direction == CURL_CSELECT_IN);
    (reading ? it->second->reading : it->second->writing) = false;
    if (ec == asio::error::operation_aborted) {
        return;
    }
    const int poll_bit = reading ? CURL_POLL_IN : CURL_POLL_OUT;
    if ((it->second->wanted & poll_bit) == 0) {
        return;
    }

    act(fd, ec ? CURL_CSELECT_ERR : direction);

    it = watches_.find(fd);
    if (it != watches_.end() && it->second->generation == generation) {
        arm(fd, *it->second);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Connection Identity
// ═══════════════════════════════════════════════════════════════════════════

void CurlMulti::bind_connection(const std::string& address_pair, std::uint64_t id) {
    connections_[address_pair] = id;
    FETCHPP_LOG_DEBUG(Pool, "Connection #{} is {}", id, address_pair);
}

std::optional<std::uint64_t> CurlMulti::find_connection(const std::string& address_pair) const {
    const auto it = connections_.find(address_pair);
    if (it == connections_.end()) {
        return std::nullopt;
    }
    return it->second;
}

int CurlMulti::close_socket(void* clientp, curl_socket_t fd) {
    auto* self = static_cast<CurlMulti*>(clientp);
    if (const auto pair = address_pair_of(fd)) {
        const auto it = self->connections_.find(*pair);
        if (it != self->connections_.end()) {
            FETCHPP_LOG_DEBUG(Pool, "Closing connection #{}", it->second);
            self->connections_.erase(it);
        }
    }
    return ::close(fd);
}

// ═══════════════════════════════════════════════════════════════════════════
// Error Codes
// ═══════════════════════════════════════════════════════════════════════════

std::string transport_error_code(CURLcode code, long os_errno) {
    switch (code) {
        case CURLE_COULDNT_CONNECT:
            switch (os_errno) {
                case ENETUNREACH:
                case EHOSTUNREACH:
                    return "ENETUNREACH";
                case EADDRINUSE:
                case EADDRNOTAVAIL:
                    return "EADDRINUSE";
                case ETIMEDOUT:
                    return "ETIMEDOUT";
                default:
                    return "ECONNREFUSED";
            }
        case CURLE_COULDNT_RESOLVE_HOST:
            return "ENOTFOUND";
        case CURLE_OPERATION_TIMEDOUT:
            return "ETIMEDOUT";
        case CURLE_SEND_ERROR:
            return os_errno == ECONNRESET ? "ECONNRESET" : "EPIPE";
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return "ECONNRESET";
        case CURLE_ABORTED_BY_CALLBACK:
        case CURLE_WRITE_ERROR:
        case CURLE_READ_ERROR:
            return "ERR_ABORTED";
        case CURLE_UNSUPPORTED_PROTOCOL:
            return "ERR_UNSUPPORTED_PROTOCOL";
        case CURLE_URL_MALFORMAT:
            return "ERR_INVALID_URL";
        case CURLE_WEIRD_SERVER_REPLY:
        case CURLE_BAD_CONTENT_ENCODING:
        case CURLE_HTTP2:
            return "ERR_INVALID_RESPONSE";
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_ISSUER_ERROR:
            return "ERR_TLS";
        default:
            return "ERR_NETWORK";
    }
}

std::string connection_address_pair(
    std::string_view local_ip,
    long local_port,
    std::string_view peer_ip,
    long peer_port
) {
    return fmt::format("{}:{}>{}:{}", local_ip, local_port, peer_ip, peer_port);
}

}  // namespace fetchpp
