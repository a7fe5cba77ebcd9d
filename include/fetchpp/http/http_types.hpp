#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace fetchpp {

// ─────────────────────────────────────────────────────────────────────────────
// Case-Insensitive Header Lookup
// ─────────────────────────────────────────────────────────────────────────────
// Header names keep the casing they were sent or received with; lookups
// ignore case per RFC 9110.

using HeaderMap = std::unordered_map<std::string, std::string>;

[[nodiscard]] inline bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::ranges::equal(a, b, [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

inline HeaderMap::const_iterator find_header(
    const HeaderMap& headers,
    std::string_view name
) {
    return std::ranges::find_if(headers,
        [&name](const auto& pair) { return iequals(pair.first, name); });
}

[[nodiscard]] inline std::optional<std::string> get_header(
    const HeaderMap& headers,
    std::string_view name
) {
    const auto it = find_header(headers, name);
    const bool found = (it != headers.end());
    if (found) {
        return it->second;
    }
    return std::nullopt;
}

/// Insert or replace, matching an existing name case-insensitively.
inline void set_header(HeaderMap& headers, std::string_view name, std::string value) {
    for (auto& [key, existing] : headers) {
        if (iequals(key, name)) {
            existing = std::move(value);
            return;
        }
    }
    headers.emplace(std::string(name), std::move(value));
}

inline void erase_header(HeaderMap& headers, std::string_view name) {
    std::erase_if(headers, [&name](const auto& pair) { return iequals(pair.first, name); });
}

// ─────────────────────────────────────────────────────────────────────────────
// Methods
// ─────────────────────────────────────────────────────────────────────────────
// Methods are plain upper-case tokens so that retry allow-lists can name any
// method a caller sends.

[[nodiscard]] inline std::string normalize_method(std::string_view method) {
    std::string upper(method);
    std::ranges::transform(upper, upper.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper;
}

[[nodiscard]] std::string_view reason_phrase(int status_code) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Url
// ─────────────────────────────────────────────────────────────────────────────
// Parsed absolute http(s) URL. Parsing and relative resolution go through
// ada-url (WHATWG URL Standard).

struct Url {
    std::string href;     // full serialized URL
    std::string scheme;   // "http" or "https"
    std::string host;     // "api.example.com" or "127.0.0.1"
    std::uint16_t port{80};
    std::string target;   // "/path?query", always starts with '/'

    [[nodiscard]] bool is_secure() const {
        return scheme == "https";
    }

    /// Keep-alive pool key.
    [[nodiscard]] std::string origin() const {
        return scheme + "://" + host + ":" + std::to_string(port);
    }

    /// Value for the Host request header.
    [[nodiscard]] std::string host_header() const {
        const bool default_port = (is_secure() && port == 443) || (!is_secure() && port == 80);
        if (default_port) {
            return host;
        }
        return host + ":" + std::to_string(port);
    }
};

/// Parse an absolute URL. nullopt for invalid input or a scheme other than
/// http/https.
[[nodiscard]] std::optional<Url> parse_url(std::string_view input);

/// Resolve `reference` (absolute, or relative such as a Location header)
/// against `base`.
[[nodiscard]] std::optional<Url> resolve_url(const Url& base, std::string_view reference);

/// Join a configured base URL with a request path. An absolute `path` wins.
[[nodiscard]] std::optional<Url> join_url(std::string_view base_url, std::string_view path);

// ─────────────────────────────────────────────────────────────────────────────
// ResponseHead / Response
// ─────────────────────────────────────────────────────────────────────────────

struct ResponseHead {
    int status_code{0};
    std::string status_message;
    HeaderMap headers;
    int version_minor{1};  // HTTP/1.x
};

/// Read "HTTP/1.1 200 OK" into status_code, status_message and
/// version_minor. False when the line is not an HTTP/1.x status line.
[[nodiscard]] bool parse_status_line(std::string_view line, ResponseHead& head);

struct Response {
    int status_code{0};
    std::string status_message;
    HeaderMap headers;
    std::string body;

    std::string url;                         // final URL after redirects
    std::string method;                      // method of the final exchange
    std::vector<std::string> redirect_urls;  // every URL a redirect pointed to
    std::size_t retry_count{0};

    [[nodiscard]] bool is_success() const {
        return (status_code >= 200) && (status_code < 300);
    }

    [[nodiscard]] std::optional<std::string> header(std::string_view name) const {
        return get_header(headers, name);
    }
};

}  // namespace fetchpp
