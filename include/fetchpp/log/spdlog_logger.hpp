#pragma once

#include "fetchpp/log/logger.hpp"

#include <spdlog/logger.h>

#include <memory>
#include <string>
#include <vector>

namespace fetchpp {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger - ILogger backed by spdlog sinks
// ─────────────────────────────────────────────────────────────────────────────
// Filtering happens here, per component; the spdlog logger is kept at the most
// verbose threshold in the filter. Records come out as
//   [12:00:01.250] [info] [retry] attempt_runner.cpp:142 Retrying GET ...
// and warnings flush immediately so a failing request is visible before exit.

class SpdlogLogger final : public ILogger {
public:
    /// Colored stderr sink
    explicit SpdlogLogger(LevelFilter filter = {});

    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LevelFilter filter = {});

    /// Wrap a caller-configured spdlog logger; its pattern is left alone.
    SpdlogLogger(std::shared_ptr<spdlog::logger> logger, LevelFilter filter);

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level, LogComponent component) const noexcept override {
        return filter_.enabled(level, component);
    }

    [[nodiscard]] const LevelFilter& filter() const noexcept {
        return filter_;
    }

    void set_filter(LevelFilter filter);

    void set_pattern(const std::string& pattern);

    void flush();

    [[nodiscard]] std::shared_ptr<spdlog::logger> get_spdlog_logger() const noexcept {
        return logger_;
    }

private:
    std::shared_ptr<spdlog::logger> logger_;
    LevelFilter filter_;
};

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(LevelFilter filter = {});

/// Appends to `path`; throws spdlog::spdlog_ex when it cannot be opened.
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(
    const std::string& path,
    LevelFilter filter = {}
);

}  // namespace fetchpp
