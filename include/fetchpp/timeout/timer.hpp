#ifndef FETCHPP_TIMEOUT_TIMER_HPP
#define FETCHPP_TIMEOUT_TIMER_HPP

#include <asio/any_io_executor.hpp>

#include <chrono>
#include <functional>
#include <memory>

namespace fetchpp {

// ─────────────────────────────────────────────────────────────────────────────
// ITimer - cancellable one-shot deadline
// ─────────────────────────────────────────────────────────────────────────────
// Decouples the timeout logic from any clock. Tests drive a manual
// implementation; production code uses asio::steady_timer.

class ITimer {
public:
    virtual ~ITimer() = default;

    /// Schedule `on_fire`; replaces any pending deadline.
    virtual void arm(std::chrono::milliseconds delay, std::function<void()> on_fire) = 0;

    /// Cancel the pending deadline. A disarmed timer never calls back, even
    /// if its expiry was already queued.
    virtual void disarm() noexcept = 0;

    [[nodiscard]] virtual bool armed() const noexcept = 0;
};

class ITimerFactory {
public:
    virtual ~ITimerFactory() = default;

    [[nodiscard]] virtual std::unique_ptr<ITimer> make_timer() = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// AsioTimerFactory
// ─────────────────────────────────────────────────────────────────────────────

class AsioTimerFactory final : public ITimerFactory {
public:
    explicit AsioTimerFactory(asio::any_io_executor executor)
        : executor_(std::move(executor)) {}

    [[nodiscard]] std::unique_ptr<ITimer> make_timer() override;

private:
    asio::any_io_executor executor_;
};

}  // namespace fetchpp

#endif  // FETCHPP_TIMEOUT_TIMER_HPP
