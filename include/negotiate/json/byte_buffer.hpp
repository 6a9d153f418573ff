#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace negotiate {

// ─────────────────────────────────────────────────────────────────────────────
// IByteBufferWriter - growable output sink
// ─────────────────────────────────────────────────────────────────────────────
// Writers ask for writable memory with get_span(), fill a prefix of it and
// commit that prefix with advance(). The span returned by get_span() is
// invalidated by the next get_span() or advance() call.

class IByteBufferWriter {
public:
    virtual ~IByteBufferWriter() = default;

    // Returns at least max(size_hint, 1) writable bytes
    [[nodiscard]] virtual std::span<std::uint8_t> get_span(std::size_t size_hint = 0) = 0;

    // Commits count bytes of the most recently returned span
    virtual void advance(std::size_t count) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// ArrayByteBuffer - contiguous, vector-backed IByteBufferWriter
// ─────────────────────────────────────────────────────────────────────────────
// clear() keeps the allocation, so one buffer can serve many messages.

class ArrayByteBuffer final : public IByteBufferWriter {
public:
    ArrayByteBuffer() = default;
    explicit ArrayByteBuffer(std::size_t initial_capacity);

    [[nodiscard]] std::span<std::uint8_t> get_span(std::size_t size_hint = 0) override;
    void advance(std::size_t count) override;

    [[nodiscard]] std::span<const std::uint8_t> written() const noexcept {
        return {storage_.data(), written_};
    }

    [[nodiscard]] std::string_view written_view() const noexcept {
        return {reinterpret_cast<const char*>(storage_.data()), written_};
    }

    [[nodiscard]] std::size_t written_count() const noexcept { return written_; }
    [[nodiscard]] std::size_t capacity() const noexcept { return storage_.size(); }

    void clear() noexcept { written_ = 0; }

private:
    std::vector<std::uint8_t> storage_;
    std::size_t written_{0};
};

}  // namespace negotiate
