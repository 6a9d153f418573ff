#include "negotiate/protocol/negotiate_protocol.hpp"

#include "negotiate/log/logger.hpp"

#include <stdexcept>

namespace negotiate {

namespace {

[[nodiscard]] bool has_text(const std::optional<std::string>& value) noexcept {
    return value.has_value() && !value->empty();
}

void write_transport(JsonWriter& writer, const TransportDescriptor& descriptor) {
    writer.write_start_object();

    // Peers expect the property even when the name is unknown
    if (descriptor.transport.has_value()) {
        writer.write_string(property::transport, *descriptor.transport);
    } else {
        writer.write_null(property::transport);
    }

    writer.write_start_array(property::transfer_formats);
    if (descriptor.transfer_formats.has_value()) {
        for (const auto& format : *descriptor.transfer_formats) {
            writer.write_string_value(format);
        }
    }
    writer.write_end_array();

    writer.write_end_object();
}

}  // namespace

void write_response(const NegotiationResult& response, IByteBufferWriter& output) {
    write_response(response, output, JsonWriterPool::shared());
}

void write_response(const NegotiationResult& response, IByteBufferWriter& output, JsonWriterPool& pool) {
    PooledJsonWriter lease(pool, output);
    JsonWriter& writer = lease.get();

    writer.write_start_object();

    if (has_text(response.url)) {
        writer.write_string(property::url, *response.url);
    }
    if (has_text(response.access_token)) {
        writer.write_string(property::access_token, *response.access_token);
    }
    if (has_text(response.connection_id)) {
        writer.write_string(property::connection_id, *response.connection_id);
    }

    writer.write_start_array(property::available_transports);
    if (response.available_transports.has_value()) {
        for (const auto& descriptor : *response.available_transports) {
            write_transport(writer, descriptor);
        }
    }
    writer.write_end_array();

    writer.write_end_object();
    writer.flush();

    if (writer.current_depth() != 0) {
        throw std::logic_error(
            "write_response left " + std::to_string(writer.current_depth()) + " JSON containers open");
    }

    NEGOTIATE_LOG_TRACE(LogComponent::Encoder, "wrote negotiate response ({} bytes)", writer.bytes_committed());
}

}  // namespace negotiate
