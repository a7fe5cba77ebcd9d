#include "fetchpp/retry/retry_after.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <ctime>
#include <string>

namespace fetchpp {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

// "120" or "1.5"; no sign, no exponent.
std::optional<double> parse_delay_seconds(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }

    double whole = 0.0;
    double fraction = 0.0;
    double scale = 1.0;
    bool seen_dot = false;
    bool seen_digit = false;

    for (const char c : text) {
        if (c == '.' && seen_dot == false) {
            seen_dot = true;
            continue;
        }
        const bool is_digit = std::isdigit(static_cast<unsigned char>(c)) != 0;
        if (is_digit == false) {
            return std::nullopt;
        }
        seen_digit = true;
        if (seen_dot) {
            scale /= 10.0;
            fraction += (c - '0') * scale;
        } else {
            whole = whole * 10.0 + (c - '0');
        }
    }

    if (seen_digit == false) {
        return std::nullopt;
    }
    return whole + fraction;
}

constexpr double kMaxDelaySeconds = 1e9;

constexpr std::array<const char*, 3> kHttpDateFormats{
    "%a, %d %b %Y %H:%M:%S GMT",  // IMF-fixdate
    "%A, %d-%b-%y %H:%M:%S GMT",  // RFC 850
    "%a %b %e %H:%M:%S %Y",       // asctime
};

}  // namespace

std::optional<std::chrono::system_clock::time_point> parse_http_date(std::string_view value) {
    const std::string text(trim(value));

    for (const char* format : kHttpDateFormats) {
        std::tm parts{};
        const char* end = ::strptime(text.c_str(), format, &parts);
        const bool matched = (end != nullptr) && (*end == '\0');
        if (matched == false) {
            continue;
        }
        const std::time_t seconds = ::timegm(&parts);
        if (seconds == static_cast<std::time_t>(-1)) {
            return std::nullopt;
        }
        return std::chrono::system_clock::from_time_t(seconds);
    }

    return std::nullopt;
}

std::optional<std::chrono::milliseconds> parse_retry_after(
    std::string_view value,
    std::chrono::system_clock::time_point now
) {
    const auto text = trim(value);

    const auto seconds = parse_delay_seconds(text);
    if (seconds.has_value()) {
        const double capped = std::min(*seconds, kMaxDelaySeconds);
        return std::chrono::milliseconds{static_cast<std::int64_t>(std::llround(capped * 1000.0))};
    }

    const auto date = parse_http_date(text);
    if (date.has_value() == false) {
        return std::nullopt;
    }

    const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(*date - now);
    if (remaining.count() < 0) {
        return std::chrono::milliseconds{0};
    }
    return remaining;
}

std::optional<std::chrono::milliseconds> retry_after_of(
    const Response& response,
    std::chrono::system_clock::time_point now
) {
    const auto header = response.header("Retry-After");
    if (header.has_value() == false) {
        return std::nullopt;
    }
    return parse_retry_after(*header, now);
}

}  // namespace fetchpp
