#include "echotest/server.hpp"
#include "echotest/codec.hpp"
#include "echotest/error.hpp"
#include "echotest/logger.hpp"
#include "echotest/version.hpp"
#include "echotest/transport/stdio_transport.hpp"

namespace echotest {

namespace {

std::string_view trim(std::string_view s) {
    constexpr std::string_view whitespace = " \t\r\n\f\v";
    auto begin = s.find_first_not_of(whitespace);
    if (begin == std::string_view::npos) return {};
    auto end = s.find_last_not_of(whitespace);
    return s.substr(begin, end - begin + 1);
}

Router::Options router_options(const EchoServer::Options& opts) {
    Router::Options ropts;
    ropts.server_info = opts.server_info;
    ropts.protocol_version = opts.protocol_version;
    ropts.capabilities.tools = nlohmann::json{{"listChanged", false}};
    return ropts;
}

} // anonymous namespace

EchoServer::Options EchoServer::default_options() {
    Options opts;
    opts.server_info = {std::string(SERVER_NAME), std::string(SERVER_VERSION)};
    opts.protocol_version = std::string(PROTOCOL_VERSION);
    return opts;
}

EchoServer::EchoServer() : EchoServer(default_options()) {}

EchoServer::EchoServer(Options opts)
    : opts_(std::move(opts)), router_(router_options(opts_)) {}

std::optional<std::string> EchoServer::handle_line(std::string_view line) const {
    std::string_view trimmed = trim(line);
    if (trimmed.empty()) return std::nullopt;

    nlohmann::json j;
    try {
        j = Codec::parse_line(trimmed);
    } catch (const ParseError& e) {
        // No id can be trusted from a line that did not parse
        ECHOTEST_LOG_WARN("{}", e.what());
        return Codec::serialize(make_error(nullptr, error::ParseError, e.what()));
    }

    if (!j.is_object()) {
        ECHOTEST_LOG_WARN("ignoring {} line: requests must be JSON objects", j.type_name());
        return std::nullopt;
    }

    JsonRpcRequest req = request_from_json(j);
    if (logger::enabled(logger::level::debug)) {
        ECHOTEST_LOG_DEBUG("<- {} id={}", req.method, req.id.dump());
    }

    auto resp = router_.dispatch(req);
    if (!resp) return std::nullopt;
    return Codec::serialize(*resp);
}

void EchoServer::serve(ILineSource& source, ILineSink& sink) const {
    ECHOTEST_LOG_INFO("{} {} serving (protocol {})",
                      opts_.server_info.name, opts_.server_info.version, opts_.protocol_version);
    size_t lines = 0;
    while (auto line = source.read_line()) {
        ++lines;
        if (auto out = handle_line(*line)) {
            sink.write_line(*out);
        }
    }
    ECHOTEST_LOG_INFO("input closed after {} lines", lines);
}

void EchoServer::serve_stdio() const {
    StdioTransport transport;
    serve(transport, transport);
}

} // namespace echotest
