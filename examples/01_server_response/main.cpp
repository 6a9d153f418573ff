// Example 01: Server-side negotiate response
//
// Builds the response a hub endpoint returns for a negotiate request and
// encodes it into a reusable buffer, the way a request handler would.

#include <negotiate/json/byte_buffer.hpp>
#include <negotiate/log/spdlog_logger.hpp>
#include <negotiate/protocol/negotiate_protocol.hpp>

#include <iostream>
#include <string>

using namespace negotiate;

int main() {
    std::cout << "=== Server Negotiate Response Example ===\n\n";

    set_logger(make_spdlog_console_logger(LogLevel::Trace));

    // One buffer per handler thread, cleared between requests
    ArrayByteBuffer body(512);

    for (int request = 1; request <= 3; ++request) {
        NegotiationResult response;
        response.connection_id = "conn-" + std::to_string(request);
        response.available_transports = std::vector<TransportDescriptor>{
            {std::string(transport_name::web_sockets),
             std::vector<std::string>{std::string(transfer_format::text), std::string(transfer_format::binary)}},
            {std::string(transport_name::long_polling),
             std::vector<std::string>{std::string(transfer_format::text)}},
        };

        body.clear();
        write_response(response, body);

        std::cout << "request " << request << ": " << body.written_view() << "\n";
    }

    // Point clients at another hub instead
    NegotiationResult redirect;
    redirect.url = "https://eu-west.example.com/hub";
    redirect.access_token = "eyJhbGciOi...";

    body.clear();
    write_response(redirect, body);
    std::cout << "redirect:  " << body.written_view() << "\n";

    std::cout << "\nidle pooled writers: " << JsonWriterPool::shared().idle_count() << "\n";

    set_logger(nullptr);
    return 0;
}
