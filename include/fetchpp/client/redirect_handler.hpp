#ifndef FETCHPP_CLIENT_REDIRECT_HANDLER_HPP
#define FETCHPP_CLIENT_REDIRECT_HANDLER_HPP

#include "fetchpp/error.hpp"
#include "fetchpp/http/http_types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace fetchpp {

// ─────────────────────────────────────────────────────────────────────────────
// RedirectHandler
// ─────────────────────────────────────────────────────────────────────────────
// Decides whether a response head is a redirect to follow and where it
// leads. A hop stays within the current attempt: the caller retargets the
// attempt and runs the new exchange under fresh phase deadlines, and its
// outcome is judged like any other.
//
// Followed: 300, 301, 302, 303, 307, 308 with a Location header.
// Method: 303 turns anything but GET/HEAD into GET without a body; 301/302
// do the same only with method rewriting on. 307/308 keep method and body.
//
// One handler lives for the whole request, so the hop limit spans retries.

struct RedirectTarget {
    Url url;
    std::string method;
    bool drop_body{false};
};

class RedirectHandler {
public:
    RedirectHandler(bool follow, std::size_t max_redirects, bool method_rewriting)
        : follow_(follow)
        , max_redirects_(max_redirects)
        , method_rewriting_(method_rewriting)
    {}

    /// nullopt when `head` is a final response. Fails once the hop limit
    /// is exceeded or the Location cannot be resolved.
    [[nodiscard]] Result<std::optional<RedirectTarget>> next(
        const Url& current,
        const std::string& method,
        const ResponseHead& head
    );

    /// Every URL a followed redirect pointed to, in order.
    [[nodiscard]] const std::vector<std::string>& redirect_urls() const noexcept {
        return redirect_urls_;
    }

    [[nodiscard]] std::size_t count() const noexcept {
        return redirect_urls_.size();
    }

    [[nodiscard]] bool follows() const noexcept {
        return follow_;
    }

    [[nodiscard]] static bool is_followable_status(int status_code) noexcept;

private:
    bool follow_;
    std::size_t max_redirects_;
    bool method_rewriting_;
    std::vector<std::string> redirect_urls_;
};

}  // namespace fetchpp

#endif  // FETCHPP_CLIENT_REDIRECT_HANDLER_HPP
