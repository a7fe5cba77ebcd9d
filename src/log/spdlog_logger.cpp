#include "fetchpp/log/spdlog_logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <stdexcept>

namespace fetchpp {

namespace {

constexpr const char* kPattern = "[%H:%M:%S.%e] [%^%l%$] %v";

spdlog::level::level_enum spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info:  return spdlog::level::info;
        case LogLevel::Warn:  return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Off:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

std::string_view file_name(const char* path) noexcept {
    const std::string_view full(path);
    const auto slash = full.find_last_of('/');
    return slash == std::string_view::npos ? full : full.substr(slash + 1);
}

std::shared_ptr<spdlog::logger> make_logger(std::vector<spdlog::sink_ptr> sinks) {
    auto logger = std::make_shared<spdlog::logger>("fetchpp", sinks.begin(), sinks.end());
    logger->set_pattern(kPattern);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

}  // namespace

SpdlogLogger::SpdlogLogger(LevelFilter filter)
    : SpdlogLogger(std::vector<spdlog::sink_ptr>{std::make_shared<spdlog::sinks::stderr_color_sink_mt>()}, filter)
{}

SpdlogLogger::SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LevelFilter filter)
    : SpdlogLogger(make_logger(std::move(sinks)), filter)
{}

SpdlogLogger::SpdlogLogger(std::shared_ptr<spdlog::logger> logger, LevelFilter filter)
    : logger_(std::move(logger))
    , filter_(filter)
{
    if (!logger_) {
        throw std::invalid_argument("SpdlogLogger needs a spdlog logger");
    }
    logger_->set_level(spdlog_level(filter_.lowest()));
}

void SpdlogLogger::log(const LogRecord& record) {
    if (!filter_.enabled(record.level, record.component)) {
        return;
    }
    // Location goes inline and to spdlog, for patterns using %s:%#
    logger_->log(
        spdlog::source_loc{record.location.file_name(),
                           static_cast<int>(record.location.line()),
                           record.location.function_name()},
        spdlog_level(record.level),
        "[{}] {}:{} {}",
        to_string(record.component),
        file_name(record.location.file_name()),
        record.location.line(),
        record.message);
}

void SpdlogLogger::set_filter(LevelFilter filter) {
    filter_ = filter;
    logger_->set_level(spdlog_level(filter_.lowest()));
}

void SpdlogLogger::set_pattern(const std::string& pattern) {
    logger_->set_pattern(pattern);
}

void SpdlogLogger::flush() {
    logger_->flush();
}

std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(LevelFilter filter) {
    return std::make_unique<SpdlogLogger>(filter);
}

std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(const std::string& path, LevelFilter filter) {
    std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::basic_file_sink_mt>(path)};
    return std::make_unique<SpdlogLogger>(std::move(sinks), filter);
}

}  // namespace fetchpp
