// ═══════════════════════════════════════════════════════════════════════════
// Concurrency Tests
// ═══════════════════════════════════════════════════════════════════════════
// The shared writer pool and the thread-local decoders are used from many
// threads at once by a server.

#include <catch2/catch_test_macros.hpp>

#include "negotiate/json/byte_buffer.hpp"
#include "negotiate/log/logger.hpp"
#include "negotiate/protocol/negotiate_protocol.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace negotiate;

namespace {

constexpr int kThreads = 8;
constexpr int kIterations = 500;

// Counts records; may be called from any thread
class CountingLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {
        count_.fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return level >= LogLevel::Debug;
    }

    [[nodiscard]] std::size_t count() const noexcept {
        return count_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<std::size_t> count_{0};
};

NegotiationResult response_for(int thread_index, int iteration) {
    NegotiationResult response;
    response.connection_id = std::to_string(thread_index) + "-" + std::to_string(iteration);
    response.available_transports = std::vector<TransportDescriptor>{
        TransportDescriptor{std::string("WebSockets"), std::vector<std::string>{"Text", "Binary"}},
    };
    return response;
}

}  // namespace

TEST_CASE("write_response is safe with the shared pool across threads", "[concurrency][encode]") {
    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([t, &mismatches]() {
            for (int i = 0; i < kIterations; ++i) {
                ArrayByteBuffer buffer;
                write_response(response_for(t, i), buffer);

                const std::string expected =
                    R"({"connectionId":")" + std::to_string(t) + "-" + std::to_string(i)
                    + R"(","availableTransports":[{"transport":"WebSockets","transferFormats":["Text","Binary"]}]})";
                if (buffer.written_view() != expected) {
                    mismatches.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(mismatches.load() == 0);
    REQUIRE(JsonWriterPool::shared().idle_count() <= WriterPoolConfig{}.max_idle_writers);
}

TEST_CASE("parse_response uses independent decoders per thread", "[concurrency][decode]") {
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([t, &failures]() {
            for (int i = 0; i < kIterations; ++i) {
                ArrayByteBuffer buffer;
                const auto original = response_for(t, i);
                write_response(original, buffer);

                auto decoded = parse_response(buffer.written_view());
                if (!decoded || *decoded != original) {
                    failures.fetch_add(1, std::memory_order_relaxed);
                }

                // Interleave rejections to exercise decoder reuse after errors
                auto rejected = parse_response(R"({"connectionId":"x"})");
                if (rejected) {
                    failures.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(failures.load() == 0);
}

TEST_CASE("Decoder diagnostics are delivered from every thread", "[concurrency][logger]") {
    auto counting = std::make_unique<CountingLogger>();
    auto* logger = counting.get();
    set_logger(std::move(counting));

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([]() {
            for (int i = 0; i < 50; ++i) {
                (void)parse_response(R"({"availableTransports":[]})");
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(logger->count() == static_cast<std::size_t>(kThreads * 50));
    set_logger(nullptr);
}
