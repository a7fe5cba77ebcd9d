#ifndef FETCHPP_RETRY_ATTEMPT_TRACKER_HPP
#define FETCHPP_RETRY_ATTEMPT_TRACKER_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace fetchpp {

// ─────────────────────────────────────────────────────────────────────────────
// Attempt
// ─────────────────────────────────────────────────────────────────────────────
// One logical try of a request. Redirect hops belong to the attempt that
// produced them: they retarget it without a new ordinal.

struct Attempt {
    std::size_t ordinal{1};  // 1-based
    std::chrono::steady_clock::time_point started_at;
    std::string url;
    std::string method;
    std::size_t redirects{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// AttemptTracker
// ─────────────────────────────────────────────────────────────────────────────
// Owns the ordinal sequence of one request. Not thread-safe; a request runs
// on a single coroutine.
//
// A stream that continues a previous stream's retry is seeded with the
// carried retry count, so its first begin() yields ordinal (seed + 1).

class AttemptTracker {
public:
    AttemptTracker() = default;

    explicit AttemptTracker(std::size_t carried_retry_count)
        : last_ordinal_(carried_retry_count) {}

    /// Start the next attempt against `url`.
    Attempt& begin(std::string url, std::string method) {
        current_ = Attempt{
            .ordinal = last_ordinal_ + 1,
            .started_at = std::chrono::steady_clock::now(),
            .url = std::move(url),
            .method = std::move(method),
        };
        last_ordinal_ = current_->ordinal;
        return *current_;
    }

    /// Retarget the active attempt after a redirect; the ordinal stays.
    void redirect(std::string url, std::string method) {
        if (!current_) {
            return;
        }
        current_->url = std::move(url);
        current_->method = std::move(method);
        ++current_->redirects;
    }

    [[nodiscard]] bool started() const noexcept {
        return current_.has_value();
    }

    /// Active attempt. Only valid after begin().
    [[nodiscard]] const Attempt& current() const {
        return *current_;
    }

    /// Ordinal the next begin() will produce.
    [[nodiscard]] std::size_t next_ordinal() const noexcept {
        return last_ordinal_ + 1;
    }

    /// Retries actually performed so far (ordinal - 1).
    [[nodiscard]] std::size_t retry_count() const noexcept {
        return last_ordinal_ == 0 ? 0 : last_ordinal_ - 1;
    }

private:
    std::size_t last_ordinal_{0};
    std::optional<Attempt> current_;
};

}  // namespace fetchpp

#endif  // FETCHPP_RETRY_ATTEMPT_TRACKER_HPP
