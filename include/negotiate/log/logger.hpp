#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace negotiate {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,  // Per-call detail (bytes written, writer reuse)
    Debug = 1,  // Rejected payloads with their cause
    Info  = 2,
    Warn  = 3,  // Operator-facing problems (legacy server detected)
    Error = 4,
    Off   = 5
};

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

// ─────────────────────────────────────────────────────────────────────────────
// Log Components
// ─────────────────────────────────────────────────────────────────────────────
// Every record is tagged with the part of the codec that produced it, so a
// sink can filter decoder diagnostics without parsing message text.

enum class LogComponent : std::uint8_t {
    Decoder,
    Encoder,
    WriterPool,
    Cli
};

[[nodiscard]] constexpr std::string_view to_string(LogComponent component) noexcept {
    switch (component) {
        case LogComponent::Decoder:    return "decoder";
        case LogComponent::Encoder:    return "encoder";
        case LogComponent::WriterPool: return "writer-pool";
        case LogComponent::Cli:        return "cli";
    }
    return "unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// Log Record
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    LogComponent component;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        LogComponent comp,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , component(comp)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger Interface
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    // Checked before a message is formatted
    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void write(
        LogLevel level,
        LogComponent component,
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        if (should_log(level)) {
            log(LogRecord(level, component, std::string(msg), loc));
        }
    }
};

// Discards everything; the default global logger.
class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger
// ─────────────────────────────────────────────────────────────────────────────

// Returns the process-wide logger (NullLogger until one is installed)
[[nodiscard]] ILogger& get_logger() noexcept;

// Installs a new process-wide logger; nullptr restores the NullLogger
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

// Format arguments are only evaluated when the level is enabled.
#define NEGOTIATE_LOG(level, component, ...) \
    do { \
        auto& negotiate_logger_ = ::negotiate::get_logger(); \
        if (negotiate_logger_.should_log(level)) { \
            negotiate_logger_.log(::negotiate::LogRecord( \
                level, component, std::format(__VA_ARGS__), \
                std::source_location::current())); \
        } \
    } while (false)

#define NEGOTIATE_LOG_TRACE(component, ...) \
    NEGOTIATE_LOG(::negotiate::LogLevel::Trace, component, __VA_ARGS__)

#define NEGOTIATE_LOG_DEBUG(component, ...) \
    NEGOTIATE_LOG(::negotiate::LogLevel::Debug, component, __VA_ARGS__)

#define NEGOTIATE_LOG_INFO(component, ...) \
    NEGOTIATE_LOG(::negotiate::LogLevel::Info, component, __VA_ARGS__)

#define NEGOTIATE_LOG_WARN(component, ...) \
    NEGOTIATE_LOG(::negotiate::LogLevel::Warn, component, __VA_ARGS__)

#define NEGOTIATE_LOG_ERROR(component, ...) \
    NEGOTIATE_LOG(::negotiate::LogLevel::Error, component, __VA_ARGS__)

}  // namespace negotiate
