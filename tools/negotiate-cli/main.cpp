// ─────────────────────────────────────────────────────────────────────────────
// negotiate-cli - inspect and produce negotiate response payloads
// ─────────────────────────────────────────────────────────────────────────────
// Usage:
//   # Validate a payload captured from a server (file or stdin)
//   negotiate-cli --decode response.json
//   curl -s -X POST https://host/hub/negotiate | negotiate-cli --decode - --pretty
//
//   # Produce the payload a server would send
//   negotiate-cli --encode --connection-id abc123 \
//                 --transport WebSockets:Text,Binary \
//                 --transport LongPolling:Text
//
//   # Redirect response
//   negotiate-cli --encode --url https://other/hub --access-token secret
//
// Exit status is 0 on success, 1 when the payload is rejected or the
// arguments are invalid.

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "negotiate/json/byte_buffer.hpp"
#include "negotiate/log/logger.hpp"
#include "negotiate/log/spdlog_logger.hpp"
#include "negotiate/protocol/negotiate_protocol.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace negotiate;

namespace color {
    const char* reset = "\033[0m";
    const char* red   = "\033[31m";
    const char* green = "\033[32m";
    const char* dim   = "\033[2m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

namespace {

void print_error(const std::string& message) {
    std::cerr << color::c(color::red) << "error: " << color::c(color::reset) << message << "\n";
}

std::optional<std::string> read_input(const std::string& path) {
    if (path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

// "WebSockets:Text,Binary" -> {transport: WebSockets, formats: [Text, Binary]}
// "WebSockets" and "WebSockets:" both give an empty format list.
TransportDescriptor parse_transport_arg(const std::string& arg) {
    TransportDescriptor descriptor;
    descriptor.transfer_formats = std::vector<std::string>{};

    const auto colon = arg.find(':');
    descriptor.transport = arg.substr(0, colon);
    if (colon == std::string::npos) {
        return descriptor;
    }

    std::istringstream formats(arg.substr(colon + 1));
    std::string format;
    while (std::getline(formats, format, ',')) {
        if (!format.empty()) {
            descriptor.transfer_formats->push_back(format);
        }
    }
    return descriptor;
}

int run_decode(const std::string& path, bool pretty) {
    auto content = read_input(path);
    if (!content) {
        print_error("cannot read '" + path + "'");
        return 1;
    }
    NEGOTIATE_LOG_DEBUG(LogComponent::Cli, "read {} bytes from {}", content->size(), path == "-" ? "stdin" : path);

    auto result = parse_response(*content);
    if (!result) {
        const auto& failure = result.error();
        print_error(std::string(failure.message()));
        std::cerr << color::c(color::dim) << "  cause (" << to_string(failure.cause.code) << "): "
                  << failure.cause.message << color::c(color::reset) << "\n";
        return 1;
    }

    const int indent = pretty ? 2 : -1;
    std::cout << result->to_json().dump(indent) << "\n";

    if (pretty) {
        const char* shape = result->is_error()    ? "error"
                          : result->is_redirect() ? "redirect"
                          :                         "connect";
        std::cerr << color::c(color::green) << "valid " << shape << " response" << color::c(color::reset) << "\n";
    }
    return 0;
}

int run_encode(const cxxopts::ParseResult& args) {
    NegotiationResult response;

    if (args.count("connection-id")) {
        response.connection_id = args["connection-id"].as<std::string>();
    }
    if (args.count("url")) {
        response.url = args["url"].as<std::string>();
    }
    if (args.count("access-token")) {
        response.access_token = args["access-token"].as<std::string>();
    }

    std::vector<TransportDescriptor> transports;
    for (const auto& arg : args["transport"].as<std::vector<std::string>>()) {
        if (!arg.empty()) {
            transports.push_back(parse_transport_arg(arg));
        }
    }
    if (!transports.empty()) {
        response.available_transports = std::move(transports);
    }

    const bool has_target = response.url.has_value();
    const bool has_connection = response.connection_id.has_value() && response.available_transports.has_value();
    if (!has_target && !has_connection) {
        print_error("--encode needs --url, or --connection-id with at least one --transport");
        return 1;
    }

    NEGOTIATE_LOG_DEBUG(LogComponent::Cli, "encoding response with {} transport(s)",
        response.available_transports ? response.available_transports->size() : 0);

    ArrayByteBuffer buffer;
    write_response(response, buffer);
    std::cout << buffer.written_view() << "\n";
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("negotiate-cli", "Negotiate response encoder/decoder");

    options.add_options()
        ("d,decode", "Decode and validate a payload from a file ('-' for stdin)", cxxopts::value<std::string>())
        ("e,encode", "Encode a negotiate response from the options below")

        ("connection-id", "Connection id to advertise", cxxopts::value<std::string>())
        ("t,transport", "Transport as Name:Format1,Format2 (repeatable)",
            cxxopts::value<std::vector<std::string>>()->default_value(""))
        ("u,url", "Redirect URL", cxxopts::value<std::string>())
        ("access-token", "Access token for the redirect or transport", cxxopts::value<std::string>())

        ("p,pretty", "Indent decoded output and print a summary")
        ("no-color", "Disable colored output")
        ("v,verbose", "Log codec diagnostics to stderr")
        ("h,help", "Print usage");

    try {
        auto args = options.parse(argc, argv);

        if (args.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        color::enabled = !args.count("no-color");

        if (args.count("verbose")) {
            set_logger(make_spdlog_console_logger(LogLevel::Debug));
        }

        const bool decode = args.count("decode") > 0;
        const bool encode = args.count("encode") > 0;
        if (decode == encode) {
            print_error("choose exactly one of --decode or --encode");
            std::cout << options.help() << "\n";
            return 1;
        }

        if (decode) {
            return run_decode(args["decode"].as<std::string>(), args.count("pretty") > 0);
        }
        return run_encode(args);

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }
}
