#ifndef FETCHPP_RETRY_BACKOFF_POLICY_HPP
#define FETCHPP_RETRY_BACKOFF_POLICY_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <random>

namespace fetchpp {

// ─────────────────────────────────────────────────────────────────────────────
// IBackoffPolicy
// ─────────────────────────────────────────────────────────────────────────────
// The wait used when the server sent no Retry-After. It becomes
// RetryContext::computed_value, which a custom strategy may return as is,
// scale or ignore.

struct IBackoffPolicy {
    virtual ~IBackoffPolicy() = default;

    // failed_attempt: 1-based ordinal of the attempt that just failed
    virtual std::chrono::milliseconds next_delay(std::size_t failed_attempt) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// ExponentialBackoff
// ─────────────────────────────────────────────────────────────────────────────
//   delay(n) = min(initial * factor^(n-1), ceiling) + U[0, jitter)
//
// With the defaults the waits are 1s, 2s, 4s, ... each plus up to 100ms.
// Jitter only ever lengthens a wait.

class ExponentialBackoff : public IBackoffPolicy {
public:
    struct Options {
        std::chrono::milliseconds initial{1'000};
        double factor{2.0};
        std::chrono::milliseconds ceiling{std::chrono::milliseconds::max()};
        std::chrono::milliseconds jitter{100};  // 0 = deterministic
    };

    ExponentialBackoff() : ExponentialBackoff(Options{}) {}

    explicit ExponentialBackoff(Options options, std::uint32_t seed = std::random_device{}());

    std::chrono::milliseconds next_delay(std::size_t failed_attempt) override;

    [[nodiscard]] const Options& options() const noexcept {
        return options_;
    }

private:
    Options options_;
    std::mt19937 rng_;
};

// ─────────────────────────────────────────────────────────────────────────────
// ConstantBackoff
// ─────────────────────────────────────────────────────────────────────────────

class ConstantBackoff : public IBackoffPolicy {
public:
    explicit ConstantBackoff(std::chrono::milliseconds delay) : delay_(delay) {}

    std::chrono::milliseconds next_delay(std::size_t) override {
        return delay_;
    }

private:
    std::chrono::milliseconds delay_;
};

}  // namespace fetchpp

#endif  // FETCHPP_RETRY_BACKOFF_POLICY_HPP
