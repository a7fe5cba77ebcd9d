#pragma once

#include "fetchpp/timeout/timer.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <vector>

namespace fetchpp::testing {

// ─────────────────────────────────────────────────────────────────────────────
// ManualClock / ManualTimer - deadlines driven by advance()
// ─────────────────────────────────────────────────────────────────────────────
// Time only moves when the test says so; expired timers fire in deadline
// order during advance().

class ManualClock {
public:
    struct Entry {
        std::chrono::milliseconds deadline{0};
        std::function<void()> on_fire;
        bool armed{false};
    };

    [[nodiscard]] std::chrono::milliseconds now() const noexcept {
        return now_;
    }

    [[nodiscard]] std::shared_ptr<Entry> add() {
        auto entry = std::make_shared<Entry>();
        entries_.push_back(entry);
        return entry;
    }

    void advance(std::chrono::milliseconds step) {
        const auto target = now_ + step;
        while (true) {
            std::shared_ptr<Entry> next;
            for (const auto& weak : entries_) {
                auto entry = weak.lock();
                if (!entry || entry->armed == false || entry->deadline > target) {
                    continue;
                }
                if (!next || entry->deadline < next->deadline) {
                    next = entry;
                }
            }
            if (!next) {
                break;
            }
            now_ = next->deadline;
            next->armed = false;
            auto callback = std::move(next->on_fire);
            callback();
        }
        now_ = target;
    }

private:
    std::chrono::milliseconds now_{0};
    std::vector<std::weak_ptr<Entry>> entries_;
};

class ManualTimer final : public ITimer {
public:
    explicit ManualTimer(ManualClock& clock)
        : clock_(clock)
        , entry_(clock.add())
    {}

    void arm(std::chrono::milliseconds delay, std::function<void()> on_fire) override {
        entry_->deadline = clock_.now() + delay;
        entry_->on_fire = std::move(on_fire);
        entry_->armed = true;
    }

    void disarm() noexcept override {
        entry_->armed = false;
    }

    [[nodiscard]] bool armed() const noexcept override {
        return entry_->armed;
    }

private:
    ManualClock& clock_;
    std::shared_ptr<ManualClock::Entry> entry_;
};

class ManualTimerFactory final : public ITimerFactory {
public:
    [[nodiscard]] std::unique_ptr<ITimer> make_timer() override {
        ++created_;
        return std::make_unique<ManualTimer>(clock_);
    }

    [[nodiscard]] ManualClock& clock() noexcept {
        return clock_;
    }

    [[nodiscard]] std::size_t created() const noexcept {
        return created_;
    }

private:
    ManualClock clock_;
    std::size_t created_{0};
};

}  // namespace fetchpp::testing
