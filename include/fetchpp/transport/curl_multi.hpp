#ifndef FETCHPP_TRANSPORT_CURL_MULTI_HPP
#define FETCHPP_TRANSPORT_CURL_MULTI_HPP

#include <asio/any_io_executor.hpp>
#include <asio/posix/stream_descriptor.hpp>
#include <asio/steady_timer.hpp>

#include <curl/curl.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace fetchpp {

// ─────────────────────────────────────────────────────────────────────────────
// ConnectionPoolConfig
// ─────────────────────────────────────────────────────────────────────────────
// Keep-alive connections live in the curl multi handle and are shared by
// every exchange of one transport.

struct ConnectionPoolConfig {
    // Connections curl keeps open after their transfer (CURLMOPT_MAXCONNECTS).
    std::size_t max_idle_connections{16};

    // Concurrent connections per host, 0 = unlimited (CURLMOPT_MAX_HOST_CONNECTIONS).
    std::size_t max_per_origin{0};

    // Idle connections older than this are not reused (CURLOPT_MAXAGE_CONN).
    std::chrono::milliseconds idle_timeout{30'000};
};

// ─────────────────────────────────────────────────────────────────────────────
// CurlMulti - curl multi handle driven by an asio executor
// ─────────────────────────────────────────────────────────────────────────────
// Uses the multi_socket API: curl tells us which sockets to watch and when
// its next timeout is due, asio waits for readiness and hands it back with
// curl_multi_socket_action(). Finished transfers are reported through the
// handler given to add().
//
// All calls must come from the executor's thread. Removing a transfer while
// curl is running callbacks is deferred until curl has returned.
//
// Usage:
//   auto multi = CurlMulti::create(io.get_executor());
//   multi->add(easy, owner, [](CURLcode result) { ... });
//   ...
//   multi->remove(easy);

class CurlMulti : public std::enable_shared_from_this<CurlMulti> {
public:
    using DoneHandler = std::function<void(CURLcode)>;

    /// Throws std::runtime_error when curl cannot be initialized.
    [[nodiscard]] static std::shared_ptr<CurlMulti> create(
        asio::any_io_executor executor,
        ConnectionPoolConfig config = {}
    );

    ~CurlMulti();

    CurlMulti(const CurlMulti&) = delete;
    CurlMulti& operator=(const CurlMulti&) = delete;

    [[nodiscard]] asio::any_io_executor get_executor() const {
        return executor_;
    }

    [[nodiscard]] const ConnectionPoolConfig& config() const noexcept {
        return config_;
    }

    /// Start a transfer. `owner` is kept alive until the handle is removed.
    [[nodiscard]] CURLMcode add(CURL* easy, std::shared_ptr<void> owner, DoneHandler on_done);

    /// Stop a transfer; its done handler is not called afterwards.
    void remove(CURL* easy) noexcept;

    /// curl_easy_pause(), guarded like socket actions.
    CURLcode pause(CURL* easy, int bitmask);

    [[nodiscard]] bool acting() const noexcept {
        return acting_ > 0;
    }

    [[nodiscard]] std::size_t active_transfers() const noexcept {
        return transfers_.size();
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Connection Identity
    // ─────────────────────────────────────────────────────────────────────────
    // curl does not number its connections, so exchanges tag them: a fresh
    // connection reserves an id and binds it to its address pair once
    // connected; a reused one looks its id up by the same pair.

    [[nodiscard]] std::uint64_t reserve_connection_id() noexcept {
        return ++last_connection_id_;
    }

    [[nodiscard]] std::uint64_t connections_opened() const noexcept {
        return last_connection_id_;
    }

    void bind_connection(const std::string& address_pair, std::uint64_t id);

    [[nodiscard]] std::optional<std::uint64_t> find_connection(const std::string& address_pair) const;

    /// CURLOPT_CLOSESOCKETFUNCTION for every easy handle of this multi.
    static int close_socket(void* clientp, curl_socket_t fd);

private:
    explicit CurlMulti(asio::any_io_executor executor, ConnectionPoolConfig config);

    struct Transfer {
        std::shared_ptr<void> owner;
        DoneHandler on_done;
        bool removing{false};
    };

    struct Watch {
        Watch(asio::any_io_executor executor, curl_socket_t fd, std::uint64_t gen)
            : descriptor(executor, fd)
            , generation(gen)
        {}

        asio::posix::stream_descriptor descriptor;
        std::uint64_t generation;
        int wanted{0};
        bool reading{false};
        bool writing{false};
    };

    static int on_socket(CURL* easy, curl_socket_t fd, int what, void* userp, void* socketp);
    static int on_timer(CURLM* multi, long timeout_ms, void* userp);

    void watch(curl_socket_t fd, int what);
    void unwatch(curl_socket_t fd) noexcept;
    void arm(curl_socket_t fd, Watch& watch);
    void on_ready(curl_socket_t fd, std::uint64_t generation, int direction, const asio::error_code& ec);
    void schedule(long timeout_ms);

    void act(curl_socket_t fd, int events);
    void drain_removals() noexcept;
    void check_completed();
    void detach(CURL* easy) noexcept;

    asio::any_io_executor executor_;
    ConnectionPoolConfig config_;
    CURLM* multi_{nullptr};
    asio::steady_timer timer_;

    std::unordered_map<CURL*, Transfer> transfers_;
    std::vector<CURL*> pending_removals_;
    std::unordered_map<curl_socket_t, std::unique_ptr<Watch>> watches_;
    std::uint64_t next_generation_{0};
    int acting_{0};

    std::unordered_map<std::string, std::uint64_t> connections_;
    std::uint64_t last_connection_id_{0};
};

/// errno-style code (ECONNREFUSED, ENOTFOUND, ...) for a failed transfer.
/// `os_errno` is CURLINFO_OS_ERRNO and refines connect failures.
[[nodiscard]] std::string transport_error_code(CURLcode code, long os_errno);

/// "local-ip:port>peer-ip:port", the key connection ids are bound under.
[[nodiscard]] std::string connection_address_pair(
    std::string_view local_ip,
    long local_port,
    std::string_view peer_ip,
    long peer_port
);

}  // namespace fetchpp

#endif  // FETCHPP_TRANSPORT_CURL_MULTI_HPP
