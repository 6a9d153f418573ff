#include "negotiate/protocol/negotiate_protocol.hpp"

#include "negotiate/log/logger.hpp"

#include <string>
#include <utility>
#include <vector>

namespace negotiate {

namespace {

using simdjson::ondemand::json_type;

template <typename T>
using Step = tl::expected<T, NegotiateError>;

constexpr std::string_view kResponseContext   = "negotiation response JSON";
constexpr std::string_view kTransportsContext = "available transports JSON";
constexpr std::string_view kFormatsContext    = "transfer formats JSON";

[[nodiscard]] std::string_view token_name(json_type type) noexcept {
    switch (type) {
        case json_type::object:  return "StartObject";
        case json_type::array:   return "StartArray";
        case json_type::string:  return "String";
        case json_type::number:  return "Number";
        case json_type::boolean: return "Boolean";
        case json_type::null:    return "Null";
        default:                 return "Unknown";
    }
}

[[nodiscard]] NegotiateError from_simdjson(simdjson::error_code error) {
    switch (error) {
        case simdjson::EMPTY:
        case simdjson::INCOMPLETE_ARRAY_OR_OBJECT:
        case simdjson::UNCLOSED_STRING:
            return NegotiateError::premature_end();
        case simdjson::TAPE_ERROR:
            return NegotiateError::malformed_structure(simdjson::error_message(error));
        default:
            return NegotiateError::tokenization(simdjson::error_message(error));
    }
}

[[nodiscard]] Step<json_type> peek_type(simdjson::ondemand::value& value) {
    auto type_result = value.type();
    if (type_result.error() != simdjson::SUCCESS) {
        return tl::unexpected(from_simdjson(type_result.error()));
    }
    return type_result.value();
}

// type() only looks at the first byte; this checks the whole literal
[[nodiscard]] Step<void> read_null(simdjson::ondemand::value& value) {
    auto null_result = value.is_null();
    if (null_result.error() != simdjson::SUCCESS) {
        return tl::unexpected(from_simdjson(null_result.error()));
    }
    if (!null_result.value()) {
        return tl::unexpected(from_simdjson(simdjson::N_ATOM_ERROR));
    }
    return {};
}

// Reads every token of a value the decoder has no use for. On-Demand only
// validates what is consumed, so skipped members must still be walked.
[[nodiscard]] Step<void> skip_value(simdjson::ondemand::value& value) {
    auto type = peek_type(value);
    if (!type) {
        return tl::unexpected(std::move(type.error()));
    }

    switch (*type) {
        case json_type::object: {
            auto object_result = value.get_object();
            if (object_result.error() != simdjson::SUCCESS) {
                return tl::unexpected(from_simdjson(object_result.error()));
            }
            simdjson::ondemand::object object = object_result.value();

            for (auto field : object) {
                auto key_result = field.unescaped_key();
                if (key_result.error() != simdjson::SUCCESS) {
                    return tl::unexpected(from_simdjson(key_result.error()));
                }
                auto value_result = field.value();
                if (value_result.error() != simdjson::SUCCESS) {
                    return tl::unexpected(from_simdjson(value_result.error()));
                }
                simdjson::ondemand::value member = value_result.value();
                auto skipped = skip_value(member);
                if (!skipped) {
                    return skipped;
                }
            }
            return {};
        }

        case json_type::array: {
            auto array_result = value.get_array();
            if (array_result.error() != simdjson::SUCCESS) {
                return tl::unexpected(from_simdjson(array_result.error()));
            }
            simdjson::ondemand::array array = array_result.value();

            for (auto element_result : array) {
                if (element_result.error() != simdjson::SUCCESS) {
                    return tl::unexpected(from_simdjson(element_result.error()));
                }
                simdjson::ondemand::value element = element_result.value();
                auto skipped = skip_value(element);
                if (!skipped) {
                    return skipped;
                }
            }
            return {};
        }

        case json_type::string: {
            auto str = value.get_string();
            if (str.error() != simdjson::SUCCESS) {
                return tl::unexpected(from_simdjson(str.error()));
            }
            return {};
        }

        case json_type::number: {
            // Integer first, then unsigned, then double
            if (value.get_int64().error() == simdjson::SUCCESS) {
                return {};
            }
            if (value.get_uint64().error() == simdjson::SUCCESS) {
                return {};
            }
            auto double_val = value.get_double();
            if (double_val.error() != simdjson::SUCCESS) {
                return tl::unexpected(from_simdjson(double_val.error()));
            }
            return {};
        }

        case json_type::boolean: {
            auto bool_val = value.get_bool();
            if (bool_val.error() != simdjson::SUCCESS) {
                return tl::unexpected(from_simdjson(bool_val.error()));
            }
            return {};
        }

        case json_type::null:
            return read_null(value);

        default:
            return tl::unexpected(NegotiateError::tokenization("unrecognized value"));
    }
}

// String or null; null leaves the property unset
[[nodiscard]] Step<std::optional<std::string>> read_as_string(
    simdjson::ondemand::value& value,
    std::string_view property_name
) {
    auto type = peek_type(value);
    if (!type) {
        return tl::unexpected(std::move(type.error()));
    }
    if (*type == json_type::null) {
        auto null_check = read_null(value);
        if (!null_check) {
            return tl::unexpected(std::move(null_check.error()));
        }
        return std::optional<std::string>{};
    }
    if (*type != json_type::string) {
        return tl::unexpected(NegotiateError::unexpected_type(token_name(*type), property_name, "String"));
    }

    auto str = value.get_string();
    if (str.error() != simdjson::SUCCESS) {
        return tl::unexpected(from_simdjson(str.error()));
    }
    return std::optional<std::string>(std::string(str.value()));
}

[[nodiscard]] Step<simdjson::ondemand::array> enter_array(
    simdjson::ondemand::value& value,
    std::string_view property_name
) {
    auto type = peek_type(value);
    if (!type) {
        return tl::unexpected(std::move(type.error()));
    }
    if (*type != json_type::array) {
        return tl::unexpected(NegotiateError::unexpected_type(token_name(*type), property_name, "Array"));
    }

    auto array = value.get_array();
    if (array.error() != simdjson::SUCCESS) {
        return tl::unexpected(from_simdjson(array.error()));
    }
    return array.value();
}

// ─────────────────────────────────────────────────────────────────────────────
// Transport descriptors
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] Step<std::vector<std::string>> read_transfer_formats(simdjson::ondemand::value& value) {
    auto array = enter_array(value, property::transfer_formats);
    if (!array) {
        return tl::unexpected(std::move(array.error()));
    }

    std::vector<std::string> formats;
    for (auto element : *array) {
        if (element.error() != simdjson::SUCCESS) {
            return tl::unexpected(from_simdjson(element.error()));
        }

        auto type = element.type();
        if (type.error() != simdjson::SUCCESS) {
            return tl::unexpected(from_simdjson(type.error()));
        }
        if (type.value() != json_type::string) {
            return tl::unexpected(NegotiateError::structural(token_name(type.value()), kFormatsContext, "String"));
        }

        auto str = element.get_string();
        if (str.error() != simdjson::SUCCESS) {
            return tl::unexpected(from_simdjson(str.error()));
        }
        formats.emplace_back(str.value());
    }
    return formats;
}

[[nodiscard]] Step<TransportDescriptor> read_transport(simdjson::ondemand::value& value) {
    auto object_result = value.get_object();
    if (object_result.error() != simdjson::SUCCESS) {
        return tl::unexpected(from_simdjson(object_result.error()));
    }
    simdjson::ondemand::object object = object_result.value();

    TransportDescriptor descriptor;
    for (auto field : object) {
        auto key_result = field.unescaped_key();
        if (key_result.error() != simdjson::SUCCESS) {
            return tl::unexpected(from_simdjson(key_result.error()));
        }
        const std::string_view key = key_result.value();

        auto value_result = field.value();
        if (value_result.error() != simdjson::SUCCESS) {
            return tl::unexpected(from_simdjson(value_result.error()));
        }
        simdjson::ondemand::value member = value_result.value();

        if (key == property::transport) {
            auto name = read_as_string(member, property::transport);
            if (!name) {
                return tl::unexpected(std::move(name.error()));
            }
            descriptor.transport = std::move(*name);
        } else if (key == property::transfer_formats) {
            auto formats = read_transfer_formats(member);
            if (!formats) {
                return tl::unexpected(std::move(formats.error()));
            }
            descriptor.transfer_formats = std::move(*formats);
        } else {
            auto skipped = skip_value(member);
            if (!skipped) {
                return tl::unexpected(std::move(skipped.error()));
            }
        }
    }

    if (!descriptor.transport.has_value()) {
        return tl::unexpected(NegotiateError::missing_field(property::transport));
    }
    if (!descriptor.transfer_formats.has_value()) {
        return tl::unexpected(NegotiateError::missing_field(property::transfer_formats));
    }
    return descriptor;
}

[[nodiscard]] Step<std::vector<TransportDescriptor>> read_available_transports(simdjson::ondemand::value& value) {
    auto array = enter_array(value, property::available_transports);
    if (!array) {
        return tl::unexpected(std::move(array.error()));
    }

    std::vector<TransportDescriptor> transports;
    for (auto element : *array) {
        if (element.error() != simdjson::SUCCESS) {
            return tl::unexpected(from_simdjson(element.error()));
        }

        auto type = element.type();
        if (type.error() != simdjson::SUCCESS) {
            return tl::unexpected(from_simdjson(type.error()));
        }
        if (type.value() != json_type::object) {
            return tl::unexpected(NegotiateError::structural(token_name(type.value()), kTransportsContext, "StartObject"));
        }

        simdjson::ondemand::value entry = element.value();
        auto descriptor = read_transport(entry);
        if (!descriptor) {
            return tl::unexpected(std::move(descriptor.error()));
        }
        transports.push_back(std::move(*descriptor));
    }
    return transports;
}

// ─────────────────────────────────────────────────────────────────────────────
// Top-level object
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] Step<NegotiationResult> read_response(simdjson::ondemand::document& document) {
    auto type = document.type();
    if (type.error() != simdjson::SUCCESS) {
        return tl::unexpected(from_simdjson(type.error()));
    }
    if (type.value() != json_type::object) {
        return tl::unexpected(NegotiateError::structural(token_name(type.value()), kResponseContext, "StartObject"));
    }

    auto object_result = document.get_object();
    if (object_result.error() != simdjson::SUCCESS) {
        return tl::unexpected(from_simdjson(object_result.error()));
    }
    simdjson::ondemand::object object = object_result.value();

    NegotiationResult response;
    for (auto field : object) {
        auto key_result = field.unescaped_key();
        if (key_result.error() != simdjson::SUCCESS) {
            return tl::unexpected(from_simdjson(key_result.error()));
        }
        const std::string_view key = key_result.value();

        auto value_result = field.value();
        if (value_result.error() != simdjson::SUCCESS) {
            return tl::unexpected(from_simdjson(value_result.error()));
        }
        simdjson::ondemand::value member = value_result.value();

        std::optional<std::string>* string_slot = nullptr;
        if (key == property::url) {
            string_slot = &response.url;
        } else if (key == property::access_token) {
            string_slot = &response.access_token;
        } else if (key == property::connection_id) {
            string_slot = &response.connection_id;
        } else if (key == property::error) {
            string_slot = &response.error;
        } else if (key == property::available_transports) {
            auto transports = read_available_transports(member);
            if (!transports) {
                return tl::unexpected(std::move(transports.error()));
            }
            response.available_transports = std::move(*transports);
        } else if (key == property::legacy_protocol_version) {
            return tl::unexpected(NegotiateError::legacy_protocol());
        } else {
            // A newer field this version does not know about
            auto skipped = skip_value(member);
            if (!skipped) {
                return tl::unexpected(std::move(skipped.error()));
            }
        }

        if (string_slot != nullptr) {
            auto text = read_as_string(member, key);
            if (!text) {
                return tl::unexpected(std::move(text.error()));
            }
            *string_slot = std::move(*text);
        }
    }

    // Without a redirect or an error, the peer must say how to connect
    if (!response.url.has_value() && !response.error.has_value()) {
        if (!response.connection_id.has_value()) {
            return tl::unexpected(NegotiateError::missing_field(property::connection_id));
        }
        if (!response.available_transports.has_value()) {
            return tl::unexpected(NegotiateError::missing_field(property::available_transports));
        }
    }

    return response;
}

[[nodiscard]] NegotiateResult<NegotiationResult> wrap(Step<NegotiationResult> step) {
    if (step) {
        return std::move(*step);
    }

    InvalidNegotiationPayload failure{std::move(step.error())};
    if (failure.cause_code() == NegotiateError::Code::LegacyProtocolDetected) {
        NEGOTIATE_LOG_WARN(LogComponent::Decoder, "{}", failure.cause.message);
    } else {
        NEGOTIATE_LOG_DEBUG(LogComponent::Decoder, "rejected negotiate response: {}", failure.describe());
    }
    return tl::unexpected(std::move(failure));
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// NegotiateDecoder
// ─────────────────────────────────────────────────────────────────────────────

NegotiateResult<NegotiationResult> NegotiateDecoder::parse(std::string_view content) {
    if (content.size() > config_.max_payload_size) {
        return wrap(tl::unexpected(NegotiateError::payload_too_large(content.size(), config_.max_payload_size)));
    }

    // simdjson reads a few bytes past the end of the input
    simdjson::padded_string padded(content);
    return parse_padded(padded);
}

NegotiateResult<NegotiationResult> NegotiateDecoder::parse(std::span<const std::uint8_t> content) {
    return parse(std::string_view(reinterpret_cast<const char*>(content.data()), content.size()));
}

NegotiateResult<NegotiationResult> NegotiateDecoder::parse_padded(simdjson::padded_string_view content) {
    if (content.size() > config_.max_payload_size) {
        return wrap(tl::unexpected(NegotiateError::payload_too_large(content.size(), config_.max_payload_size)));
    }

    try {
        auto document_result = parser_.iterate(content);
        if (document_result.error() != simdjson::SUCCESS) {
            return wrap(tl::unexpected(from_simdjson(document_result.error())));
        }
        auto document = std::move(document_result).value();
        return wrap(read_response(document));
    } catch (const simdjson::simdjson_error& e) {
        return wrap(tl::unexpected(from_simdjson(e.error())));
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Convenience Functions
// ─────────────────────────────────────────────────────────────────────────────

NegotiateResult<NegotiationResult> parse_response(std::string_view content) {
    thread_local NegotiateDecoder decoder;
    return decoder.parse(content);
}

NegotiateResult<NegotiationResult> parse_response(std::span<const std::uint8_t> content) {
    return parse_response(std::string_view(reinterpret_cast<const char*>(content.data()), content.size()));
}

}  // namespace negotiate
