#include "fetchpp/retry/retry_options.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace fetchpp {

namespace {

std::size_t to_count(const nlohmann::json& value, std::string_view field) {
    const bool is_integer = value.is_number_integer() || value.is_number_unsigned();
    if (is_integer == false || value.get<std::int64_t>() < 0) {
        throw std::invalid_argument("retry." + std::string(field) + " must be a non-negative integer");
    }
    return value.get<std::size_t>();
}

const nlohmann::json& require_array(const nlohmann::json& value, std::string_view field) {
    if (value.is_array() == false) {
        throw std::invalid_argument("retry." + std::string(field) + " must be an array");
    }
    return value;
}

}  // namespace

DelayStrategy make_delay_strategy(std::function<double(const RetryContext&)> strategy) {
    return [strategy = std::move(strategy)](RetryContext context) -> asio::awaitable<double> {
        co_return strategy(context);
    };
}

RetryOptions& RetryOptions::with_methods(std::set<std::string> methods) {
    methods_.clear();
    for (const auto& method : methods) {
        methods_.insert(normalize_method(method));
    }
    return *this;
}

RetryOptions RetryOptions::from_json(const nlohmann::json& value) {
    RetryOptions options;

    if (value.is_number()) {
        options.with_limit(to_count(value, "limit"));
        return options;
    }

    if (value.is_object() == false) {
        throw std::invalid_argument("retry must be a number or an object");
    }

    try {
        if (value.contains("limit")) {
            options.with_limit(to_count(value.at("limit"), "limit"));
        }

        if (value.contains("methods")) {
            std::set<std::string> methods;
            for (const auto& method : require_array(value.at("methods"), "methods")) {
                methods.insert(method.get<std::string>());
            }
            options.with_methods(std::move(methods));
        }

        if (value.contains("statusCodes")) {
            std::set<int> codes;
            for (const auto& code : require_array(value.at("statusCodes"), "statusCodes")) {
                codes.insert(code.get<int>());
            }
            options.with_status_codes(std::move(codes));
        }

        if (value.contains("errorCodes")) {
            std::set<std::string> codes;
            for (const auto& code : require_array(value.at("errorCodes"), "errorCodes")) {
                codes.insert(code.get<std::string>());
            }
            options.with_error_codes(std::move(codes));
        }

        if (value.contains("maxRetryAfter") && value.at("maxRetryAfter").is_null() == false) {
            const auto ceiling = to_count(value.at("maxRetryAfter"), "maxRetryAfter");
            options.with_max_retry_after(std::chrono::milliseconds{static_cast<std::int64_t>(ceiling)});
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Invalid retry options: ") + e.what());
    }

    return options;
}

}  // namespace fetchpp
