#ifndef NEGOTIATE_PROTOCOL_NEGOTIATION_TYPES_HPP
#define NEGOTIATE_PROTOCOL_NEGOTIATION_TYPES_HPP

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace negotiate {

using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// Wire Property Names
// ═══════════════════════════════════════════════════════════════════════════
// Shared by the encoder and the decoder; both sides must agree byte for byte.

namespace property {

inline constexpr std::string_view url                  = "url";
inline constexpr std::string_view access_token         = "accessToken";
inline constexpr std::string_view connection_id        = "connectionId";
inline constexpr std::string_view available_transports = "availableTransports";
inline constexpr std::string_view error                = "error";
inline constexpr std::string_view transport            = "transport";
inline constexpr std::string_view transfer_formats     = "transferFormats";

// Only ever sent by the legacy (pre-Core) server's negotiate endpoint.
inline constexpr std::string_view legacy_protocol_version = "ProtocolVersion";

}  // namespace property

// ═══════════════════════════════════════════════════════════════════════════
// Well-Known Names
// ═══════════════════════════════════════════════════════════════════════════

namespace transport_name {

inline constexpr std::string_view web_sockets        = "WebSockets";
inline constexpr std::string_view server_sent_events = "ServerSentEvents";
inline constexpr std::string_view long_polling       = "LongPolling";

}  // namespace transport_name

namespace transfer_format {

inline constexpr std::string_view text   = "Text";
inline constexpr std::string_view binary = "Binary";

}  // namespace transfer_format

// ═══════════════════════════════════════════════════════════════════════════
// Transport Descriptor
// ═══════════════════════════════════════════════════════════════════════════
// One entry of "availableTransports". Both members may be absent while a
// value is being built; the decoder only produces descriptors with both set.

struct TransportDescriptor {
    std::optional<std::string> transport;
    std::optional<std::vector<std::string>> transfer_formats;

    [[nodiscard]] bool supports(std::string_view format) const;

    [[nodiscard]] Json to_json() const;

    bool operator==(const TransportDescriptor&) const = default;
};

// ═══════════════════════════════════════════════════════════════════════════
// Negotiation Result
// ═══════════════════════════════════════════════════════════════════════════
// Either the success shape (connection_id + available_transports) or the
// redirect/error shape (url and/or error). access_token may accompany both.

struct NegotiationResult {
    std::optional<std::string> connection_id;
    std::optional<std::string> url;
    std::optional<std::string> access_token;
    std::optional<std::vector<TransportDescriptor>> available_transports;
    std::optional<std::string> error;

    [[nodiscard]] bool is_redirect() const noexcept { return url.has_value(); }
    [[nodiscard]] bool is_error() const noexcept { return error.has_value(); }

    // First descriptor whose transport name matches, or nullptr
    [[nodiscard]] const TransportDescriptor* find_transport(std::string_view name) const;

    [[nodiscard]] bool supports(std::string_view transport, std::string_view format) const;

    // Diagnostic view; the wire encoding lives in negotiate_protocol.hpp
    [[nodiscard]] Json to_json() const;

    bool operator==(const NegotiationResult&) const = default;
};

}  // namespace negotiate

#endif  // NEGOTIATE_PROTOCOL_NEGOTIATION_TYPES_HPP
