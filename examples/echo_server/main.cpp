/// echo-test server: stdio JSON-RPC fixture for integration tests.
/// Usage: ./echo_server
/// Reads one request per line from stdin and writes responses to stdout.
/// Diagnostics go to stderr. Exits when stdin is closed.

#include <echotest/echotest.hpp>
#include <csignal>

int main() {
    // A closed stdout must surface as a write error, not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    echotest::logger::set_level(echotest::logger::level::warning);

    echotest::EchoServer server;
    try {
        server.serve_stdio();
    } catch (const echotest::TransportError& e) {
        ECHOTEST_LOG_ERROR("{}", e.what());
        return 1;
    }
    return 0;
}
