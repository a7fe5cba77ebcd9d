#include "fetchpp/timeout/timer.hpp"

#include <asio/steady_timer.hpp>

#include <cstdint>

namespace fetchpp {

namespace {

// steady_timer::cancel() cannot recall a completion that is already queued,
// so every arm gets a generation number and stale completions are dropped.
class AsioTimer final : public ITimer {
public:
    explicit AsioTimer(asio::any_io_executor executor)
        : state_(std::make_shared<State>(std::move(executor))) {}

    ~AsioTimer() override {
        disarm();
    }

    void arm(std::chrono::milliseconds delay, std::function<void()> on_fire) override {
        const auto generation = ++state_->generation;
        state_->armed = true;
        state_->on_fire = std::move(on_fire);
        state_->timer.expires_after(delay);
        state_->timer.async_wait(
            [weak = std::weak_ptr<State>(state_), generation](const asio::error_code& ec) {
                auto state = weak.lock();
                if (!state || ec) {
                    return;
                }
                const bool stale = (state->armed == false) || (state->generation != generation);
                if (stale) {
                    return;
                }
                state->armed = false;
                auto callback = std::move(state->on_fire);
                state->on_fire = nullptr;
                if (callback) {
                    callback();
                }
            });
    }

    void disarm() noexcept override {
        ++state_->generation;
        state_->armed = false;
        state_->on_fire = nullptr;
        state_->timer.cancel();
    }

    [[nodiscard]] bool armed() const noexcept override {
        return state_->armed;
    }

private:
    struct State {
        explicit State(asio::any_io_executor executor)
            : timer(std::move(executor)) {}

        asio::steady_timer timer;
        std::uint64_t generation{0};
        bool armed{false};
        std::function<void()> on_fire;
    };

    std::shared_ptr<State> state_;
};

}  // namespace

std::unique_ptr<ITimer> AsioTimerFactory::make_timer() {
    return std::make_unique<AsioTimer>(executor_);
}

}  // namespace fetchpp
