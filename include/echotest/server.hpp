#pragma once
#include "types.hpp"
#include "router.hpp"
#include "transport/transport.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace echotest {

/// Line-at-a-time JSON-RPC responder. Each input line yields at most one
/// output line; responses leave in the order their requests arrived.
class EchoServer {
public:
    struct Options {
        Implementation server_info;
        std::string protocol_version;
    };

    /// Server with the fixture's identity: "echo-test" 1.0.0, protocol 2024-11-05.
    EchoServer();
    explicit EchoServer(Options opts);

    EchoServer(const EchoServer&) = delete;
    EchoServer& operator=(const EchoServer&) = delete;

    /// Process one raw input line. Returns the serialized response to write,
    /// or nullopt when the line produces no output (blank lines, notifications,
    /// id-less requests). Malformed input never throws.
    [[nodiscard]] std::optional<std::string> handle_line(std::string_view line) const;

    /// Run until the source is exhausted.
    void serve(ILineSource& source, ILineSink& sink) const;

    /// Serve over the process stdin/stdout.
    void serve_stdio() const;

    [[nodiscard]] const Options& options() const { return opts_; }

    [[nodiscard]] static Options default_options();

private:
    Options opts_;
    Router router_;
};

} // namespace echotest
