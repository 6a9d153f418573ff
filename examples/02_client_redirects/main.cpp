// Example 02: Client-side negotiation with redirects
//
// Decodes a sequence of canned server replies the way connection setup
// would: follow redirects (bounded), stop on errors, and pick a transport
// once a connect response arrives.

#include <negotiate/log/spdlog_logger.hpp>
#include <negotiate/protocol/negotiate_protocol.hpp>

#include <iostream>
#include <map>
#include <string>

using namespace negotiate;

namespace {

// Stand-in for the HTTP layer: POST {url}/negotiate -> body
const std::map<std::string, std::string> kServerReplies = {
    {"https://gateway.example.com/hub",
     R"({"url":"https://node-7.example.com/hub","accessToken":"token-for-node-7"})"},
    {"https://node-7.example.com/hub",
     R"({"connectionId":"c-42","availableTransports":[)"
     R"({"transport":"WebSockets","transferFormats":["Text","Binary"]},)"
     R"({"transport":"ServerSentEvents","transferFormats":["Text"]}]})"},
    {"https://legacy.example.com/signalr",
     R"({"Url":"/signalr","ConnectionId":"x","ProtocolVersion":"1.5"})"},
};

constexpr int kMaxRedirects = 5;

void negotiate_with(std::string url) {
    std::cout << "--- negotiating with " << url << "\n";

    for (int attempt = 0; attempt <= kMaxRedirects; ++attempt) {
        const auto reply = kServerReplies.find(url);
        if (reply == kServerReplies.end()) {
            std::cout << "no server at " << url << "\n";
            return;
        }

        auto result = parse_response(reply->second);
        if (!result) {
            std::cout << result.error().message() << "\n  " << result.error().cause.message << "\n";
            return;
        }

        if (result->is_error()) {
            std::cout << "server refused: " << *result->error << "\n";
            return;
        }

        if (result->is_redirect()) {
            std::cout << "redirected to " << *result->url
                      << (result->access_token ? " (with access token)" : "") << "\n";
            url = *result->url;
            continue;
        }

        const char* chosen = result->supports(transport_name::web_sockets, transfer_format::binary)
            ? "WebSockets/Binary"
            : "first available";
        std::cout << "connection " << *result->connection_id << " using " << chosen << "\n";
        return;
    }

    std::cout << "too many redirects\n";
}

}  // namespace

int main() {
    std::cout << "=== Client Negotiation Example ===\n\n";

    set_logger(make_spdlog_console_logger(LogLevel::Debug));

    negotiate_with("https://gateway.example.com/hub");
    negotiate_with("https://legacy.example.com/signalr");

    set_logger(nullptr);
    return 0;
}
