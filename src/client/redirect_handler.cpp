#include "fetchpp/client/redirect_handler.hpp"
#include "fetchpp/log/logger.hpp"

namespace fetchpp {

bool RedirectHandler::is_followable_status(int status_code) noexcept {
    switch (status_code) {
        case 300:
        case 301:
        case 302:
        case 303:
        case 307:
        case 308:
            return true;
        default:
            return false;
    }
}

Result<std::optional<RedirectTarget>> RedirectHandler::next(
    const Url& current,
    const std::string& method,
    const ResponseHead& head
) {
    if (follow_ == false || is_followable_status(head.status_code) == false) {
        return std::optional<RedirectTarget>{};
    }

    const auto location = get_header(head.headers, "Location");
    if (location.has_value() == false) {
        return std::optional<RedirectTarget>{};
    }

    if (redirect_urls_.size() >= max_redirects_) {
        FETCHPP_LOG_WARN(Redirect, "Redirect limit of {} reached at {}", max_redirects_, current.href);
        return tl::unexpected(RequestError::max_redirects(max_redirects_));
    }

    auto resolved = resolve_url(current, *location);
    if (resolved.has_value() == false) {
        return tl::unexpected(RequestError::invalid_request(
            "Cannot follow redirect to '" + *location + "'"));
    }

    RedirectTarget target;
    target.url = std::move(*resolved);
    target.method = method;

    const bool keeps_method = (method == "GET" || method == "HEAD");
    const bool see_other = (head.status_code == 303);
    const bool rewritable = method_rewriting_ && (head.status_code == 301 || head.status_code == 302);
    if (keeps_method == false && (see_other || rewritable)) {
        target.method = "GET";
        target.drop_body = true;
    }

    redirect_urls_.push_back(target.url.href);
    FETCHPP_LOG_INFO(Redirect, "Following {} to {} as {} (hop {}/{})",
        head.status_code, target.url.href, target.method, redirect_urls_.size(), max_redirects_);
    return std::optional<RedirectTarget>{std::move(target)};
}

}  // namespace fetchpp
