#include "negotiate/json/writer_pool.hpp"

#include "negotiate/log/logger.hpp"

namespace negotiate {

JsonWriterPool::JsonWriterPool(WriterPoolConfig config)
    : config_(config)
{
    // release() must not allocate: reserve every slot it may fill
    idle_.reserve(config_.max_idle_writers);
}

std::unique_ptr<JsonWriter> JsonWriterPool::acquire(IByteBufferWriter& output) {
    std::unique_ptr<JsonWriter> writer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!idle_.empty()) {
            writer = std::move(idle_.back());
            idle_.pop_back();
        }
    }

    if (writer == nullptr) {
        NEGOTIATE_LOG_TRACE(LogComponent::WriterPool, "pool empty, creating a new writer");
        writer = std::make_unique<JsonWriter>(config_.writer_options);
    }

    writer->reset(output);
    return writer;
}

void JsonWriterPool::release(std::unique_ptr<JsonWriter> writer) noexcept {
    if (writer == nullptr) {
        return;
    }
    writer->reset();

    if (writer->pending_capacity() > config_.max_retained_capacity) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (idle_.size() < config_.max_idle_writers) {
        idle_.push_back(std::move(writer));
    }
}

std::size_t JsonWriterPool::idle_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

JsonWriterPool& JsonWriterPool::shared() {
    static JsonWriterPool pool;
    return pool;
}

}  // namespace negotiate
