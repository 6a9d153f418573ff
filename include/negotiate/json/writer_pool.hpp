#pragma once

#include "negotiate/json/json_writer.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace negotiate {

struct WriterPoolConfig {
    // Idle writers kept for reuse; extra released writers are destroyed
    std::size_t max_idle_writers{16};

    // Writers whose pending buffer grew beyond this are not pooled,
    // so one oversized message does not pin memory forever
    std::size_t max_retained_capacity{16 * 1024};

    JsonWriterOptions writer_options{};
};

// ─────────────────────────────────────────────────────────────────────────────
// JsonWriterPool - thread-safe cache of reusable JsonWriter instances
// ─────────────────────────────────────────────────────────────────────────────
// acquire() hands out an instance exclusively owned by the caller until it
// is given back with release(). Prefer PooledJsonWriter, which releases on
// every exit path.

class JsonWriterPool {
public:
    JsonWriterPool() : JsonWriterPool(WriterPoolConfig{}) {}
    explicit JsonWriterPool(WriterPoolConfig config);

    JsonWriterPool(const JsonWriterPool&) = delete;
    JsonWriterPool& operator=(const JsonWriterPool&) = delete;

    // Returns a writer attached to output, reusing an idle one when available
    [[nodiscard]] std::unique_ptr<JsonWriter> acquire(IByteBufferWriter& output);

    // Detaches the writer and keeps it for reuse if the pool has room
    void release(std::unique_ptr<JsonWriter> writer) noexcept;

    [[nodiscard]] std::size_t idle_count() const;

    [[nodiscard]] const WriterPoolConfig& config() const noexcept { return config_; }

    // Process-wide pool used by write_response() when none is given
    [[nodiscard]] static JsonWriterPool& shared();

private:
    WriterPoolConfig config_;
    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<JsonWriter>> idle_;
};

// ─────────────────────────────────────────────────────────────────────────────
// PooledJsonWriter - scoped lease on a pooled writer
// ─────────────────────────────────────────────────────────────────────────────
// Usage:
//   {
//       PooledJsonWriter writer(JsonWriterPool::shared(), buffer);
//       writer->write_start_object();
//       ...
//   }   // returned to the pool here, also when an exception unwinds

class PooledJsonWriter {
public:
    PooledJsonWriter(JsonWriterPool& pool, IByteBufferWriter& output)
        : pool_(pool)
        , writer_(pool.acquire(output))
    {}

    ~PooledJsonWriter() {
        pool_.release(std::move(writer_));
    }

    PooledJsonWriter(const PooledJsonWriter&) = delete;
    PooledJsonWriter& operator=(const PooledJsonWriter&) = delete;

    [[nodiscard]] JsonWriter& get() noexcept { return *writer_; }
    JsonWriter* operator->() noexcept { return writer_.get(); }
    JsonWriter& operator*() noexcept { return *writer_; }

private:
    JsonWriterPool& pool_;
    std::unique_ptr<JsonWriter> writer_;
};

}  // namespace negotiate
