#include "fetchpp/http/http_types.hpp"

#include <ada.h>

#include <charconv>

namespace fetchpp {

namespace {

std::optional<Url> from_ada(const ada::url& parsed) {
    std::string scheme(parsed.get_protocol());
    const bool has_colon = (scheme.empty() == false) && (scheme.back() == ':');
    if (has_colon) {
        scheme.pop_back();
    }

    const bool is_http = (scheme == "http");
    const bool is_https = (scheme == "https");
    if ((is_http || is_https) == false) {
        return std::nullopt;
    }

    Url url;
    url.scheme = std::move(scheme);
    url.host = std::string(parsed.get_hostname());
    if (url.host.empty()) {
        return std::nullopt;
    }

    const std::string port_str(parsed.get_port());
    if (port_str.empty()) {
        url.port = is_https ? 443 : 80;
    } else {
        unsigned value = 0;
        const auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), value);
        if (ec != std::errc{} || value > 65535) {
            return std::nullopt;
        }
        url.port = static_cast<std::uint16_t>(value);
    }

    std::string target(parsed.get_pathname());
    if (target.empty()) {
        target = "/";
    }
    target += std::string(parsed.get_search());
    url.target = std::move(target);
    url.href = std::string(parsed.get_href());
    return url;
}

}  // namespace

std::optional<Url> parse_url(std::string_view input) {
    auto parsed = ada::parse<ada::url>(input);
    if (!parsed) {
        return std::nullopt;
    }
    return from_ada(*parsed);
}

std::optional<Url> resolve_url(const Url& base, std::string_view reference) {
    auto parsed_base = ada::parse<ada::url>(base.href);
    if (!parsed_base) {
        return std::nullopt;
    }
    auto parsed = ada::parse<ada::url>(reference, &*parsed_base);
    if (!parsed) {
        return std::nullopt;
    }
    return from_ada(*parsed);
}

std::optional<Url> join_url(std::string_view base_url, std::string_view path) {
    const bool no_base = base_url.empty();
    const bool path_is_absolute = (path.find("://") != std::string_view::npos);
    if (no_base || path_is_absolute) {
        return parse_url(path);
    }

    std::string joined(base_url);
    if (path.empty() == false) {
        while (joined.empty() == false && joined.back() == '/') {
            joined.pop_back();
        }
        if (path.front() != '/') {
            joined += '/';
        }
        joined += path;
    }
    return parse_url(joined);
}

bool parse_status_line(std::string_view line, ResponseHead& head) {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    // "HTTP/1.x NNN" then an optional reason
    constexpr std::string_view kPrefix = "HTTP/1.";
    const bool well_formed = line.size() >= 12 &&
                             line.starts_with(kPrefix) &&
                             std::isdigit(static_cast<unsigned char>(line[7])) &&
                             line[8] == ' ';
    if (well_formed == false) {
        return false;
    }

    int code = 0;
    const auto digits = line.substr(9, 3);
    const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), code);
    if (ec != std::errc{} || end != digits.data() + digits.size() || code < 100) {
        return false;
    }
    if (line.size() > 12 && line[12] != ' ') {
        return false;
    }

    head.version_minor = line[7] - '0';
    head.status_code = code;
    head.status_message = line.size() > 13 ? std::string(line.substr(13)) : std::string{};
    return true;
}

std::string_view reason_phrase(int status_code) noexcept {
    switch (status_code) {
        case 100: return "Continue";
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 206: return "Partial Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 303: return "See Other";
        case 304: return "Not Modified";
        case 307: return "Temporary Redirect";
        case 308: return "Permanent Redirect";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 409: return "Conflict";
        case 410: return "Gone";
        case 413: return "Payload Too Large";
        case 418: return "I'm a Teapot";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        case 521: return "Web Server Is Down";
        case 522: return "Connection Timed Out";
        case 524: return "A Timeout Occurred";
        default:  return "Unknown";
    }
}

}  // namespace fetchpp
