#include <catch2/catch_test_macros.hpp>

#include "negotiate/protocol/negotiation_types.hpp"

#include <string>
#include <vector>

using namespace negotiate;

namespace {

NegotiationResult sample_success() {
    NegotiationResult result;
    result.connection_id = "c1";
    result.available_transports = std::vector<TransportDescriptor>{
        TransportDescriptor{std::string(transport_name::web_sockets), std::vector<std::string>{"Text", "Binary"}},
        TransportDescriptor{std::string(transport_name::long_polling), std::vector<std::string>{"Text"}},
    };
    return result;
}

}  // namespace

TEST_CASE("NegotiationResult classifies its shape", "[types]") {
    NegotiationResult result;
    REQUIRE_FALSE(result.is_redirect());
    REQUIRE_FALSE(result.is_error());

    result.url = "https://x/y";
    REQUIRE(result.is_redirect());

    result.error = "busy";
    REQUIRE(result.is_error());
}

TEST_CASE("NegotiationResult finds transports by exact name", "[types]") {
    const auto result = sample_success();

    const auto* ws = result.find_transport(transport_name::web_sockets);
    REQUIRE(ws != nullptr);
    REQUIRE(ws->supports(transfer_format::binary));

    REQUIRE(result.find_transport("websockets") == nullptr);
    REQUIRE(result.find_transport(transport_name::server_sent_events) == nullptr);

    SECTION("without a transport list") {
        NegotiationResult empty;
        REQUIRE(empty.find_transport(transport_name::web_sockets) == nullptr);
        REQUIRE_FALSE(empty.supports(transport_name::web_sockets, transfer_format::text));
    }
}

TEST_CASE("NegotiationResult supports checks transport and format", "[types]") {
    const auto result = sample_success();

    REQUIRE(result.supports(transport_name::web_sockets, transfer_format::binary));
    REQUIRE(result.supports(transport_name::long_polling, transfer_format::text));
    REQUIRE_FALSE(result.supports(transport_name::long_polling, transfer_format::binary));
}

TEST_CASE("TransportDescriptor without formats supports nothing", "[types]") {
    TransportDescriptor descriptor;
    descriptor.transport = "WebSockets";
    REQUIRE_FALSE(descriptor.supports(transfer_format::text));
}

TEST_CASE("NegotiationResult to_json mirrors the populated fields", "[types][json]") {
    auto result = sample_success();
    result.access_token = "tok";

    const auto j = result.to_json();
    REQUIRE(j["connectionId"] == "c1");
    REQUIRE(j["accessToken"] == "tok");
    REQUIRE_FALSE(j.contains("url"));
    REQUIRE_FALSE(j.contains("error"));
    REQUIRE(j["availableTransports"].size() == 2);
    REQUIRE(j["availableTransports"][0]["transport"] == "WebSockets");
    REQUIRE(j["availableTransports"][0]["transferFormats"] == Json::array({"Text", "Binary"}));

    SECTION("absent descriptor members become null") {
        const auto descriptor = TransportDescriptor{}.to_json();
        REQUIRE(descriptor["transport"].is_null());
        REQUIRE(descriptor["transferFormats"].is_null());
    }
}

TEST_CASE("NegotiationResult compares by value", "[types]") {
    auto a = sample_success();
    auto b = sample_success();
    REQUIRE(a == b);

    b.available_transports->at(1).transfer_formats->push_back("Binary");
    REQUIRE_FALSE(a == b);
}
