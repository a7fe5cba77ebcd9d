#include "fetchpp/timeout/timeout_options.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace fetchpp {

namespace {

std::chrono::milliseconds to_duration(const nlohmann::json& value, std::string_view field) {
    const bool is_integer = value.is_number_integer() || value.is_number_unsigned();
    if (is_integer == false) {
        throw std::invalid_argument("timeout." + std::string(field) + " must be an integer number of ms");
    }
    const auto ms = value.get<std::int64_t>();
    if (ms < 0) {
        throw std::invalid_argument("timeout." + std::string(field) + " must not be negative");
    }
    return std::chrono::milliseconds{ms};
}

}  // namespace

std::optional<TimeoutPhase> parse_timeout_phase(std::string_view name) noexcept {
    for (const auto phase : kAllTimeoutPhases) {
        if (to_string(phase) == name) {
            return phase;
        }
    }
    return std::nullopt;
}

bool TimeoutOptions::empty() const noexcept {
    return std::ranges::none_of(phases_, [](const auto& value) { return value.has_value(); });
}

TimeoutOptions TimeoutOptions::from_json(const nlohmann::json& value) {
    if (value.is_number()) {
        return inactivity(to_duration(value, "socket"));
    }

    if (value.is_object() == false) {
        throw std::invalid_argument("timeout must be a number or an object of phase durations");
    }

    TimeoutOptions options;
    for (const auto& [name, duration] : value.items()) {
        const auto phase = parse_timeout_phase(name);
        if (phase.has_value() == false) {
            throw std::invalid_argument("Unknown timeout phase '" + name + "'");
        }
        options.with(*phase, to_duration(duration, name));
    }
    return options;
}

}  // namespace fetchpp
