#ifndef NEGOTIATE_PROTOCOL_NEGOTIATE_ERROR_HPP
#define NEGOTIATE_PROTOCOL_NEGOTIATE_ERROR_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

#include "negotiate/protocol/negotiation_types.hpp"

namespace negotiate {

// ─────────────────────────────────────────────────────────────────────────────
// Decode Error Causes
// ─────────────────────────────────────────────────────────────────────────────
// Produced while walking a payload. Never returned on their own: decode
// callers always receive them wrapped in InvalidNegotiationPayload.

struct NegotiateError {
    enum class Code {
        Structural,              // Token stream does not have the expected shape
        MissingRequiredField,    // Required property absent when checked
        LegacyProtocolDetected,  // Payload came from an incompatible legacy server
        PrematureEnd,            // Input ended before a structure closed
        Tokenization,            // Tokenizer rejected the bytes themselves
        PayloadTooLarge          // Input larger than DecoderConfig allows
    };

    Code code{Code::Structural};
    std::string message;
    std::optional<std::string> field;     // Property being read or found missing
    std::optional<std::string> token;     // Structural: offending token kind
    std::optional<std::string> expected;  // Structural: what was expected instead

    static NegotiateError structural(std::string_view token_kind, std::string_view context, std::string_view expected) {
        return {
            Code::Structural,
            "Unexpected token '" + std::string(token_kind) + "' when reading " + std::string(context)
                + ", expected " + std::string(expected) + ".",
            std::nullopt,
            std::string(token_kind),
            std::string(expected)
        };
    }

    static NegotiateError unexpected_type(std::string_view token_kind, std::string_view property, std::string_view expected) {
        return {
            Code::Structural,
            "Expected '" + std::string(property) + "' to be of type " + std::string(expected)
                + " but found '" + std::string(token_kind) + "'.",
            std::string(property),
            std::string(token_kind),
            std::string(expected)
        };
    }

    // Tokenizer-reported shape problems (missing comma, key that is not a string)
    static NegotiateError malformed_structure(std::string_view detail) {
        return {Code::Structural, "Malformed JSON structure: " + std::string(detail), std::nullopt, std::nullopt, std::nullopt};
    }

    static NegotiateError missing_field(std::string_view name) {
        return {
            Code::MissingRequiredField,
            "Missing required property '" + std::string(name) + "'.",
            std::string(name),
            std::nullopt,
            std::nullopt
        };
    }

    static NegotiateError legacy_protocol() {
        return {
            Code::LegacyProtocolDetected,
            "Detected a connection attempt to an ASP.NET SignalR Server. This client only supports "
            "connecting to an ASP.NET Core SignalR Server. See https://aka.ms/signalr-core-differences for details.",
            std::string(property::legacy_protocol_version),
            std::nullopt,
            std::nullopt
        };
    }

    static NegotiateError premature_end() {
        return {Code::PrematureEnd, "Unexpected end when reading JSON.", std::nullopt, std::nullopt, std::nullopt};
    }

    static NegotiateError tokenization(std::string_view detail) {
        return {Code::Tokenization, "Malformed JSON: " + std::string(detail), std::nullopt, std::nullopt, std::nullopt};
    }

    static NegotiateError payload_too_large(std::size_t size, std::size_t limit) {
        return {
            Code::PayloadTooLarge,
            "Negotiation payload of " + std::to_string(size) + " bytes exceeds limit of "
                + std::to_string(limit) + " bytes.",
            std::nullopt,
            std::nullopt,
            std::nullopt
        };
    }
};

[[nodiscard]] constexpr std::string_view to_string(NegotiateError::Code code) noexcept {
    switch (code) {
        case NegotiateError::Code::Structural:             return "Structural";
        case NegotiateError::Code::MissingRequiredField:   return "MissingRequiredField";
        case NegotiateError::Code::LegacyProtocolDetected: return "LegacyProtocolDetected";
        case NegotiateError::Code::PrematureEnd:           return "PrematureEnd";
        case NegotiateError::Code::Tokenization:           return "Tokenization";
        case NegotiateError::Code::PayloadTooLarge:        return "PayloadTooLarge";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// InvalidNegotiationPayload
// ─────────────────────────────────────────────────────────────────────────────
// The only error shape a decode caller sees: "this was not a valid
// negotiation response", with the underlying diagnostic kept as the cause.

struct InvalidNegotiationPayload {
    static constexpr std::string_view kMessage = "Invalid negotiation response received.";

    NegotiateError cause;

    [[nodiscard]] std::string_view message() const noexcept { return kMessage; }

    [[nodiscard]] NegotiateError::Code cause_code() const noexcept { return cause.code; }

    // "Invalid negotiation response received. (<Code>: <cause message>)"
    [[nodiscard]] std::string describe() const {
        return std::string(kMessage) + " (" + std::string(to_string(cause.code)) + ": " + cause.message + ")";
    }
};

template <typename T>
using NegotiateResult = tl::expected<T, InvalidNegotiationPayload>;

}  // namespace negotiate

#endif  // NEGOTIATE_PROTOCOL_NEGOTIATE_ERROR_HPP
