#pragma once

#include <fmt/format.h>
#include <tl/expected.hpp>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace fetchpp {

// ─────────────────────────────────────────────────────────────────────────────
// Levels and Components
// ─────────────────────────────────────────────────────────────────────────────
// Every record belongs to the engine component that emitted it, so a caller
// can trace one concern (say the retry loop) without drowning in pool chatter.

enum class LogLevel : std::uint8_t {
    Trace = 0,  // Per-event detail (transport progress, timer arming)
    Debug = 1,  // Attempt lifecycle, eligibility verdicts
    Info  = 2,  // Retries and redirects
    Warn  = 3,  // Timeouts, recoverable failures
    Error = 4,  // Request failed for good
    Off   = 5
};

enum class LogComponent : std::uint8_t {
    Client = 0,
    Retry,
    Timeout,
    Redirect,
    Stream,
    Pool,
    Transport
};

inline constexpr std::size_t kLogComponentCount = 7;

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr std::string_view to_string(LogComponent component) noexcept {
    switch (component) {
        case LogComponent::Client:    return "client";
        case LogComponent::Retry:     return "retry";
        case LogComponent::Timeout:   return "timeout";
        case LogComponent::Redirect:  return "redirect";
        case LogComponent::Stream:    return "stream";
        case LogComponent::Pool:      return "pool";
        case LogComponent::Transport: return "transport";
    }
    return "unknown";
}

/// "trace" .. "off", case-insensitive; "warning" is accepted for Warn.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

[[nodiscard]] std::optional<LogComponent> parse_log_component(std::string_view name);

// ─────────────────────────────────────────────────────────────────────────────
// LevelFilter - one threshold per component
// ─────────────────────────────────────────────────────────────────────────────

class LevelFilter {
public:
    // Implicit so a plain LogLevel can be passed wherever a filter is expected.
    constexpr LevelFilter(LogLevel level = LogLevel::Info) noexcept {
        thresholds_.fill(level);
    }

    /// Parses "info", "retry=debug" or "warn,retry=trace,pool=off".
    /// A bare level resets every component; later entries win.
    [[nodiscard]] static tl::expected<LevelFilter, std::string> parse(std::string_view text);

    LevelFilter& set(LogComponent component, LogLevel level) noexcept {
        thresholds_[static_cast<std::size_t>(component)] = level;
        return *this;
    }

    LevelFilter& set_all(LogLevel level) noexcept {
        thresholds_.fill(level);
        return *this;
    }

    [[nodiscard]] LogLevel threshold(LogComponent component) const noexcept {
        return thresholds_[static_cast<std::size_t>(component)];
    }

    /// The most verbose threshold of any component.
    [[nodiscard]] LogLevel lowest() const noexcept;

    [[nodiscard]] bool enabled(LogLevel level, LogComponent component) const noexcept {
        if (level == LogLevel::Off) {
            return false;
        }
        return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(threshold(component));
    }

    friend bool operator==(const LevelFilter&, const LevelFilter&) = default;

private:
    std::array<LogLevel, kLogComponentCount> thresholds_{};
};

// ─────────────────────────────────────────────────────────────────────────────
// LogRecord
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    LogComponent component;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(LogLevel lvl, LogComponent comp, std::string msg,
              std::source_location loc = std::source_location::current())
        : level(lvl)
        , component(comp)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger - Swappable logging backend
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level, LogComponent component) const noexcept = 0;

    /// Formats only when the record would be kept.
    template <typename... Args>
    void write(LogLevel level, LogComponent component, std::source_location loc,
               fmt::format_string<Args...> format, Args&&... args) {
        if (should_log(level, component)) {
            log(LogRecord(level, component, fmt::format(format, std::forward<Args>(args)...), loc));
        }
    }
};

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel, LogComponent) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger
// ─────────────────────────────────────────────────────────────────────────────

// Defaults to NullLogger.
[[nodiscard]] ILogger& get_logger() noexcept;

// nullptr restores the NullLogger.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

// FETCHPP_LOG_DEBUG(Retry, "attempt {}", n) - arguments are only evaluated
// when the component logs at that level.
#define FETCHPP_LOG(level, component, ...)                                      \
    do {                                                                        \
        auto& fetchpp_logger_ = ::fetchpp::get_logger();                        \
        if (fetchpp_logger_.should_log(level, ::fetchpp::LogComponent::component)) \
            fetchpp_logger_.write(level, ::fetchpp::LogComponent::component,    \
                                  std::source_location::current(), __VA_ARGS__); \
    } while (false)

#define FETCHPP_LOG_TRACE(component, ...) FETCHPP_LOG(::fetchpp::LogLevel::Trace, component, __VA_ARGS__)
#define FETCHPP_LOG_DEBUG(component, ...) FETCHPP_LOG(::fetchpp::LogLevel::Debug, component, __VA_ARGS__)
#define FETCHPP_LOG_INFO(component, ...)  FETCHPP_LOG(::fetchpp::LogLevel::Info, component, __VA_ARGS__)
#define FETCHPP_LOG_WARN(component, ...)  FETCHPP_LOG(::fetchpp::LogLevel::Warn, component, __VA_ARGS__)
#define FETCHPP_LOG_ERROR(component, ...) FETCHPP_LOG(::fetchpp::LogLevel::Error, component, __VA_ARGS__)

}  // namespace fetchpp
