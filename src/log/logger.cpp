#include "fetchpp/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>

namespace fetchpp {

namespace {

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

std::optional<LogLevel> parse_log_level(std::string_view name) {
    const auto lower = lowercase(name);
    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info")  return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "off")   return LogLevel::Off;
    return std::nullopt;
}

std::optional<LogComponent> parse_log_component(std::string_view name) {
    const auto lower = lowercase(name);
    for (std::size_t i = 0; i < kLogComponentCount; ++i) {
        const auto component = static_cast<LogComponent>(i);
        if (lower == to_string(component)) {
            return component;
        }
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// LevelFilter
// ─────────────────────────────────────────────────────────────────────────────

tl::expected<LevelFilter, std::string> LevelFilter::parse(std::string_view text) {
    LevelFilter filter;
    if (trim(text).empty()) {
        return tl::make_unexpected(std::string("empty log level"));
    }

    while (!text.empty()) {
        const auto comma = text.find(',');
        const auto entry = trim(text.substr(0, comma));
        text = (comma == std::string_view::npos) ? std::string_view{} : text.substr(comma + 1);
        if (entry.empty()) {
            continue;
        }

        const auto eq = entry.find('=');
        if (eq == std::string_view::npos) {
            const auto level = parse_log_level(entry);
            if (!level) {
                return tl::make_unexpected(fmt::format("unknown log level '{}'", entry));
            }
            filter.set_all(*level);
            continue;
        }

        const auto component = parse_log_component(trim(entry.substr(0, eq)));
        if (!component) {
            return tl::make_unexpected(fmt::format("unknown log component '{}'", trim(entry.substr(0, eq))));
        }
        const auto level = parse_log_level(trim(entry.substr(eq + 1)));
        if (!level) {
            return tl::make_unexpected(fmt::format("unknown log level '{}'", trim(entry.substr(eq + 1))));
        }
        filter.set(*component, *level);
    }
    return filter;
}

LogLevel LevelFilter::lowest() const noexcept {
    return *std::min_element(thresholds_.begin(), thresholds_.end(),
        [](LogLevel a, LogLevel b) {
            return static_cast<std::uint8_t>(a) < static_cast<std::uint8_t>(b);
        });
}

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger
// ─────────────────────────────────────────────────────────────────────────────

namespace {

struct GlobalLogger {
    std::mutex mutex;
    std::unique_ptr<ILogger> instance = std::make_unique<NullLogger>();
};

GlobalLogger& global() {
    static GlobalLogger holder;
    return holder;
}

}  // namespace

ILogger& get_logger() noexcept {
    auto& holder = global();
    std::lock_guard<std::mutex> lock(holder.mutex);
    return *holder.instance;
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    auto& holder = global();
    std::lock_guard<std::mutex> lock(holder.mutex);
    if (logger) {
        holder.instance = std::move(logger);
    } else {
        holder.instance = std::make_unique<NullLogger>();
    }
}

}  // namespace fetchpp
