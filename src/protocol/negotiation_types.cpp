#include "negotiate/protocol/negotiation_types.hpp"

#include <algorithm>

namespace negotiate {

namespace {

Json optional_string(const std::optional<std::string>& value) {
    if (value.has_value()) {
        return *value;
    }
    return nullptr;
}

}  // namespace

bool TransportDescriptor::supports(std::string_view format) const {
    if (!transfer_formats.has_value()) {
        return false;
    }
    return std::find(transfer_formats->begin(), transfer_formats->end(), format)
        != transfer_formats->end();
}

Json TransportDescriptor::to_json() const {
    Json j = Json::object();
    j[std::string(property::transport)] = optional_string(transport);
    if (transfer_formats.has_value()) {
        j[std::string(property::transfer_formats)] = *transfer_formats;
    } else {
        j[std::string(property::transfer_formats)] = nullptr;
    }
    return j;
}

const TransportDescriptor* NegotiationResult::find_transport(std::string_view name) const {
    if (!available_transports.has_value()) {
        return nullptr;
    }
    for (const auto& descriptor : *available_transports) {
        if (descriptor.transport.has_value() && *descriptor.transport == name) {
            return &descriptor;
        }
    }
    return nullptr;
}

bool NegotiationResult::supports(std::string_view transport, std::string_view format) const {
    const TransportDescriptor* descriptor = find_transport(transport);
    return (descriptor != nullptr) && descriptor->supports(format);
}

Json NegotiationResult::to_json() const {
    Json j = Json::object();
    if (url) j[std::string(property::url)] = *url;
    if (access_token) j[std::string(property::access_token)] = *access_token;
    if (connection_id) j[std::string(property::connection_id)] = *connection_id;

    if (available_transports.has_value()) {
        Json transports = Json::array();
        for (const auto& descriptor : *available_transports) {
            transports.push_back(descriptor.to_json());
        }
        j[std::string(property::available_transports)] = std::move(transports);
    }

    if (error) j[std::string(property::error)] = *error;
    return j;
}

}  // namespace negotiate
