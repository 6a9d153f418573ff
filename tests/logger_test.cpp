#include <catch2/catch_test_macros.hpp>

#include "negotiate/log/logger.hpp"

#include <string_view>
#include <vector>

using namespace negotiate;

// ─────────────────────────────────────────────────────────────────────────────
// Test Logger - Captures log records for verification
// ─────────────────────────────────────────────────────────────────────────────

class TestLogger final : public ILogger {
public:
    explicit TestLogger(LogLevel min_level = LogLevel::Trace)
        : min_level_(min_level)
    {}

    void log(const LogRecord& record) override {
        records_.push_back(record);
    }

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
    }

    [[nodiscard]] const std::vector<LogRecord>& records() const noexcept {
        return records_;
    }

private:
    LogLevel min_level_;
    std::vector<LogRecord> records_;
};

TEST_CASE("LogLevel and LogComponent have printable names", "[log]") {
    REQUIRE(to_string(LogLevel::Trace) == "TRACE");
    REQUIRE(to_string(LogLevel::Warn) == "WARN");
    REQUIRE(to_string(LogLevel::Off) == "OFF");

    REQUIRE(to_string(LogComponent::Decoder) == "decoder");
    REQUIRE(to_string(LogComponent::Encoder) == "encoder");
    REQUIRE(to_string(LogComponent::WriterPool) == "writer-pool");
}

TEST_CASE("NullLogger discards everything", "[log]") {
    NullLogger logger;

    REQUIRE_FALSE(logger.should_log(LogLevel::Trace));
    REQUIRE_FALSE(logger.should_log(LogLevel::Error));

    logger.write(LogLevel::Error, LogComponent::Decoder, "ignored");
}

TEST_CASE("ILogger::write filters below the minimum level", "[log]") {
    TestLogger logger(LogLevel::Warn);

    logger.write(LogLevel::Debug, LogComponent::Decoder, "debug message");
    logger.write(LogLevel::Warn, LogComponent::Decoder, "warn message");
    logger.write(LogLevel::Error, LogComponent::Encoder, "error message");

    REQUIRE(logger.records().size() == 2);
    REQUIRE(logger.records()[0].level == LogLevel::Warn);
    REQUIRE(logger.records()[0].component == LogComponent::Decoder);
    REQUIRE(logger.records()[1].message == "error message");
    REQUIRE(logger.records()[1].component == LogComponent::Encoder);
}

TEST_CASE("LogRecord captures the call site", "[log]") {
    TestLogger logger;
    logger.write(LogLevel::Info, LogComponent::Cli, "here");

    REQUIRE(logger.records().size() == 1);
    const std::string_view file(logger.records()[0].location.file_name());
    REQUIRE(file.find("logger_test") != std::string_view::npos);
    REQUIRE(logger.records()[0].location.line() > 0);
}

TEST_CASE("Global logger defaults to a silent logger", "[log]") {
    set_logger(nullptr);
    REQUIRE_FALSE(get_logger().should_log(LogLevel::Error));
}

TEST_CASE("NEGOTIATE_LOG macros format and tag records", "[log]") {
    auto test_logger = std::make_unique<TestLogger>(LogLevel::Debug);
    auto* raw = test_logger.get();
    set_logger(std::move(test_logger));

    NEGOTIATE_LOG_TRACE(LogComponent::Encoder, "filtered {}", 1);
    NEGOTIATE_LOG_DEBUG(LogComponent::Decoder, "rejected: {}", "bad token");
    NEGOTIATE_LOG_WARN(LogComponent::Decoder, "legacy server");
    NEGOTIATE_LOG_ERROR(LogComponent::WriterPool, "{} + {} = {}", 1, 2, 3);

    REQUIRE(raw->records().size() == 3);
    REQUIRE(raw->records()[0].message == "rejected: bad token");
    REQUIRE(raw->records()[0].level == LogLevel::Debug);
    REQUIRE(raw->records()[1].level == LogLevel::Warn);
    REQUIRE(raw->records()[2].message == "1 + 2 = 3");
    REQUIRE(raw->records()[2].component == LogComponent::WriterPool);

    set_logger(nullptr);
}

TEST_CASE("NEGOTIATE_LOG skips argument evaluation when disabled", "[log]") {
    set_logger(std::make_unique<TestLogger>(LogLevel::Error));

    int evaluations = 0;
    auto count = [&evaluations]() { ++evaluations; return evaluations; };

    NEGOTIATE_LOG_DEBUG(LogComponent::Decoder, "value {}", count());
    REQUIRE(evaluations == 0);

    NEGOTIATE_LOG_ERROR(LogComponent::Decoder, "value {}", count());
    REQUIRE(evaluations == 1);

    set_logger(nullptr);
}
