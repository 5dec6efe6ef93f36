#pragma once
#include "transport.hpp"
#include <istream>
#include <ostream>

namespace echotest {

/// Line transport over iostreams. Lets the serve loop run against
/// std::stringstream in tests, or against std::cin/std::cout.
class StreamTransport : public ILineSource, public ILineSink {
public:
    StreamTransport(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

    std::optional<std::string> read_line() override;
    void write_line(std::string_view line) override;

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace echotest
