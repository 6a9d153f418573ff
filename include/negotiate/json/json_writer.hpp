#pragma once

#include "negotiate/json/byte_buffer.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace negotiate {

struct JsonWriterOptions {
    // Deepest object/array nesting accepted before write_start_* throws
    std::size_t max_depth{64};
};

// ─────────────────────────────────────────────────────────────────────────────
// JsonWriter - forward-only, compact UTF-8 JSON writer
// ─────────────────────────────────────────────────────────────────────────────
// Output accumulates in an internal pending buffer and is committed to the
// attached IByteBufferWriter by flush(). Separators are inserted
// automatically; structural misuse (closing the wrong container, a property
// outside an object, a second root value) throws std::logic_error.
// Strings are serialized by nlohmann/json; text that is not valid UTF-8
// throws nlohmann::json::type_error and nothing of it is written.
//
// A writer is reusable: reset(output) re-attaches it to a new sink and keeps
// the pending buffer's capacity, which is what makes pooling worthwhile.
//
// Usage:
//   ArrayByteBuffer buffer;
//   JsonWriter writer(buffer);
//   writer.write_start_object();
//   writer.write_string("connectionId", "abc");
//   writer.write_end_object();
//   writer.flush();    // buffer.written_view() == R"({"connectionId":"abc"})"

class JsonWriter {
public:
    JsonWriter() = default;
    explicit JsonWriter(JsonWriterOptions options) : options_(options) {}
    explicit JsonWriter(IByteBufferWriter& output, JsonWriterOptions options = {});

    JsonWriter(const JsonWriter&) = delete;
    JsonWriter& operator=(const JsonWriter&) = delete;

    // Attach to a sink and clear all state
    void reset(IByteBufferWriter& output);

    // Detach from the sink and discard unflushed output
    void reset() noexcept;

    [[nodiscard]] bool attached() const noexcept { return output_ != nullptr; }

    void write_start_object();
    void write_start_object(std::string_view property_name);
    void write_end_object();

    void write_start_array();
    void write_start_array(std::string_view property_name);
    void write_end_array();

    void write_string(std::string_view property_name, std::string_view value);
    void write_null(std::string_view property_name);
    void write_string_value(std::string_view value);

    // Commit pending bytes to the attached sink
    void flush();

    // Number of currently open objects and arrays
    [[nodiscard]] std::size_t current_depth() const noexcept { return containers_.size(); }

    [[nodiscard]] std::size_t bytes_pending() const noexcept { return pending_.size(); }
    [[nodiscard]] std::size_t bytes_committed() const noexcept { return committed_; }
    [[nodiscard]] std::size_t pending_capacity() const noexcept { return pending_.capacity(); }

    [[nodiscard]] const JsonWriterOptions& options() const noexcept { return options_; }

private:
    enum class Container : std::uint8_t { Object, Array };

    void begin_value();
    void begin_property(std::string_view property_name);
    void open(Container container);
    void close(Container container);
    void end_value() noexcept;
    [[nodiscard]] static std::string quote(std::string_view text);

    JsonWriterOptions options_;
    IByteBufferWriter* output_{nullptr};
    std::string pending_;
    std::vector<Container> containers_;
    std::size_t committed_{0};
    bool needs_separator_{false};
    bool root_complete_{false};
};

}  // namespace negotiate
