#include "fetchpp/retry/backoff_policy.hpp"

#include <algorithm>
#include <cmath>

namespace fetchpp {

namespace {

// Keeps the double -> int64 conversion in range however large the exponent gets
constexpr double kLongestWaitMs = 1e12;

}  // namespace

ExponentialBackoff::ExponentialBackoff(Options options, std::uint32_t seed)
    : options_(options)
    , rng_(seed)
{}

std::chrono::milliseconds ExponentialBackoff::next_delay(std::size_t failed_attempt) {
    const auto steps = static_cast<double>(failed_attempt > 0 ? failed_attempt - 1 : 0);
    double wait_ms = static_cast<double>(options_.initial.count()) * std::pow(options_.factor, steps);
    wait_ms = std::min(wait_ms, static_cast<double>(options_.ceiling.count()));

    if (options_.jitter.count() > 0) {
        std::uniform_real_distribution<double> jitter(0.0, static_cast<double>(options_.jitter.count()));
        wait_ms += jitter(rng_);
    }

    wait_ms = std::clamp(wait_ms, 0.0, kLongestWaitMs);
    return std::chrono::milliseconds{static_cast<std::int64_t>(wait_ms)};
}

}  // namespace fetchpp
