#pragma once

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace fetchpp {

// ─────────────────────────────────────────────────────────────────────────────
// AbortSignal - caller-side cancellation
// ─────────────────────────────────────────────────────────────────────────────
// Cancels a request at whatever point it is suspended: the transport
// exchange is aborted, phase timers are disarmed and a pending backoff wait
// is cut short. The request then fails with ErrorKind::Cancelled.
//
// Use from the executor the request runs on.
//
// Usage:
//   AbortSignal signal;
//   asio::co_spawn(io, client.request(options, &signal), handler);
//   ...
//   signal.abort();

class AbortSignal {
public:
    using SubscriptionId = std::size_t;

    AbortSignal() = default;
    AbortSignal(const AbortSignal&) = delete;
    AbortSignal& operator=(const AbortSignal&) = delete;

    /// Fire every subscriber once. Later calls do nothing.
    void abort() {
        if (aborted_) {
            return;
        }
        aborted_ = true;
        auto callbacks = std::exchange(callbacks_, {});
        for (auto& [id, callback] : callbacks) {
            callback();
        }
    }

    [[nodiscard]] bool aborted() const noexcept {
        return aborted_;
    }

    /// Runs `callback` on abort(); immediately if already aborted.
    SubscriptionId subscribe(std::function<void()> callback) {
        const auto id = next_id_++;
        if (aborted_) {
            callback();
            return id;
        }
        callbacks_.emplace_back(id, std::move(callback));
        return id;
    }

    void unsubscribe(SubscriptionId id) noexcept {
        std::erase_if(callbacks_, [id](const auto& entry) { return entry.first == id; });
    }

private:
    bool aborted_{false};
    SubscriptionId next_id_{1};
    std::vector<std::pair<SubscriptionId, std::function<void()>>> callbacks_;
};

// ─────────────────────────────────────────────────────────────────────────────
// AbortSubscription - RAII unsubscribe
// ─────────────────────────────────────────────────────────────────────────────
// A null signal makes this a no-op, so call sites need no branching.

class AbortSubscription {
public:
    AbortSubscription() = default;

    AbortSubscription(AbortSignal* signal, std::function<void()> callback)
        : signal_(signal)
    {
        if (signal_ != nullptr) {
            id_ = signal_->subscribe(std::move(callback));
        }
    }

    ~AbortSubscription() {
        if (signal_ != nullptr) {
            signal_->unsubscribe(id_);
        }
    }

    AbortSubscription(const AbortSubscription&) = delete;
    AbortSubscription& operator=(const AbortSubscription&) = delete;

private:
    AbortSignal* signal_{nullptr};
    AbortSignal::SubscriptionId id_{0};
};

}  // namespace fetchpp
