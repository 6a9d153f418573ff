#ifndef NEGOTIATE_PROTOCOL_NEGOTIATE_PROTOCOL_HPP
#define NEGOTIATE_PROTOCOL_NEGOTIATE_PROTOCOL_HPP

// ─────────────────────────────────────────────────────────────────────────────
// Negotiation Response Codec
// ─────────────────────────────────────────────────────────────────────────────
//
// Encodes and decodes the JSON body of a negotiate response:
//
//   {
//     "url": "...",                 // redirect target (optional)
//     "accessToken": "...",         // bearer token for url/transport (optional)
//     "connectionId": "...",
//     "availableTransports": [
//       { "transport": "WebSockets", "transferFormats": ["Text", "Binary"] }
//     ],
//     "error": "..."                // negotiation failure (optional)
//   }
//
// SERVER SIDE:
//   ArrayByteBuffer body;
//   negotiate::write_response(result, body);
//   send(body.written_view());
//
// CLIENT SIDE:
//   auto parsed = negotiate::parse_response(body);
//   if (!parsed) {
//       log(parsed.error().describe());   // cause kept for diagnostics
//   }
//
// Decoding is a single forward pass over simdjson's On-Demand cursor: known
// properties are read in place, unknown ones are skipped without building a
// document tree.
//
// ─────────────────────────────────────────────────────────────────────────────

#include "negotiate/json/byte_buffer.hpp"
#include "negotiate/json/writer_pool.hpp"
#include "negotiate/protocol/negotiate_error.hpp"
#include "negotiate/protocol/negotiation_types.hpp"

#include <simdjson.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace negotiate {

// ═══════════════════════════════════════════════════════════════════════════
// Encoding
// ═══════════════════════════════════════════════════════════════════════════

// Writes response to output using a writer from JsonWriterPool::shared().
// Empty url/accessToken/connectionId are omitted; availableTransports is
// always written (an empty array when absent) and an absent transport name
// is written as null.
void write_response(const NegotiationResult& response, IByteBufferWriter& output);

void write_response(const NegotiationResult& response, IByteBufferWriter& output, JsonWriterPool& pool);

// ═══════════════════════════════════════════════════════════════════════════
// Decoding
// ═══════════════════════════════════════════════════════════════════════════

struct DecoderConfig {
    // Negotiate responses are a few hundred bytes; anything far larger is
    // not one
    std::size_t max_payload_size{64 * 1024};
};

class NegotiateDecoder {
public:
    NegotiateDecoder() = default;
    explicit NegotiateDecoder(DecoderConfig config) : config_(config) {}

    NegotiateDecoder(const NegotiateDecoder&) = delete;
    NegotiateDecoder& operator=(const NegotiateDecoder&) = delete;

    // Not thread-safe: a decoder owns its tokenizer state
    [[nodiscard]] NegotiateResult<NegotiationResult> parse(std::string_view content);
    [[nodiscard]] NegotiateResult<NegotiationResult> parse(std::span<const std::uint8_t> content);

    // Avoids the padding copy when the caller already holds
    // SIMDJSON_PADDING bytes after the content
    [[nodiscard]] NegotiateResult<NegotiationResult> parse_padded(simdjson::padded_string_view content);

    [[nodiscard]] const DecoderConfig& config() const noexcept { return config_; }
    void set_config(DecoderConfig config) noexcept { config_ = config; }

private:
    simdjson::ondemand::parser parser_;
    DecoderConfig config_;
};

// Decode with a thread-local NegotiateDecoder (default configuration)
[[nodiscard]] NegotiateResult<NegotiationResult> parse_response(std::string_view content);
[[nodiscard]] NegotiateResult<NegotiationResult> parse_response(std::span<const std::uint8_t> content);

}  // namespace negotiate

#endif  // NEGOTIATE_PROTOCOL_NEGOTIATE_PROTOCOL_HPP
