#include "echotest/transport/stream_transport.hpp"
#include "echotest/error.hpp"
#include <string>

namespace echotest {

std::optional<std::string> StreamTransport::read_line() {
    std::string line;
    if (!std::getline(in_, line)) {
        if (in_.bad()) throw TransportError("Read error on input stream");
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

void StreamTransport::write_line(std::string_view line) {
    out_ << line << '\n';
    out_.flush();
    if (!out_) {
        throw TransportError("Write error on output stream");
    }
}

} // namespace echotest
