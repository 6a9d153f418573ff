#pragma once

#include "negotiate/log/logger.hpp"

#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace negotiate {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger - ILogger backed by spdlog sinks
// ─────────────────────────────────────────────────────────────────────────────
// Records are emitted as "[component] message" with the call site attached
// as spdlog's source location, so the default pattern shows file:line.

class SpdlogLogger final : public ILogger {
public:
    /// Create logger with a colored console sink on stderr
    explicit SpdlogLogger(LogLevel min_level = LogLevel::Info);

    /// Wrap an existing spdlog logger; its level becomes the minimum level
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    /// Create one logger writing to every given sink
    SpdlogLogger(
        std::vector<spdlog::sink_ptr> sinks,
        LogLevel min_level = LogLevel::Info
    );

    ~SpdlogLogger() override = default;

    // Non-copyable
    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // ILogger interface
    // ─────────────────────────────────────────────────────────────────────────

    /// Emit "[component] message" at the record's level and call site
    void log(const LogRecord& record) override;

    /// False for every level once the minimum level is Off
    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    // ─────────────────────────────────────────────────────────────────────────
    // Spdlog-specific methods
    // ─────────────────────────────────────────────────────────────────────────

    /// Get underlying spdlog logger
    [[nodiscard]] std::shared_ptr<spdlog::logger> get_spdlog_logger() const noexcept {
        return logger_;
    }

    /// Set the minimum level on both this adapter and the spdlog logger
    void set_level(LogLevel level) noexcept;

    /// Set pattern format (spdlog pattern syntax, e.g. "%v" for the bare message)
    void set_pattern(const std::string& pattern);

    /// Flush every sink
    void flush();

    // ─────────────────────────────────────────────────────────────────────────
    // Level conversion
    // ─────────────────────────────────────────────────────────────────────────

    /// Map a LogLevel onto spdlog's level enum
    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;

    /// Map spdlog's level enum back; critical folds into Error
    [[nodiscard]] static LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

private:
    std::shared_ptr<spdlog::logger> logger_;
    LogLevel min_level_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Factory Functions
// ─────────────────────────────────────────────────────────────────────────────

/// Create a console logger (stderr, colored) with spdlog
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(
    LogLevel min_level = LogLevel::Info
);

/// Create a file logger with spdlog; the file is appended to
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info
);

}  // namespace negotiate
