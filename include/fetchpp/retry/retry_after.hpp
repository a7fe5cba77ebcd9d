#ifndef FETCHPP_RETRY_RETRY_AFTER_HPP
#define FETCHPP_RETRY_RETRY_AFTER_HPP

#include "fetchpp/http/http_types.hpp"

#include <chrono>
#include <optional>
#include <string_view>

namespace fetchpp {

// ─────────────────────────────────────────────────────────────────────────────
// Retry-After
// ─────────────────────────────────────────────────────────────────────────────
// Accepted forms (RFC 9110 section 10.2.3):
//   Retry-After: 120                              delay-seconds (fractions allowed)
//   Retry-After: Wed, 21 Oct 2015 07:28:00 GMT    IMF-fixdate
//   Retry-After: Wednesday, 21-Oct-15 07:28:00 GMT  obsolete RFC 850
//   Retry-After: Wed Oct 21 07:28:00 2015         obsolete asctime
//
// The result is a wait measured from `now`. A date in the past yields 0ms.
// Anything else is unparsable and yields nullopt.

[[nodiscard]] std::optional<std::chrono::milliseconds> parse_retry_after(
    std::string_view value,
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now()
);

/// Retry-After of a response, if present and parsable.
[[nodiscard]] std::optional<std::chrono::milliseconds> retry_after_of(
    const Response& response,
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now()
);

/// Parse an HTTP-date into a UTC time point.
[[nodiscard]] std::optional<std::chrono::system_clock::time_point> parse_http_date(std::string_view value);

}  // namespace fetchpp

#endif  // FETCHPP_RETRY_RETRY_AFTER_HPP
