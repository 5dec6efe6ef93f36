#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace echotest {

/// Source of newline-delimited input.
class ILineSource {
public:
    virtual ~ILineSource() = default;

    /// Next line without its terminator, or nullopt at end of input.
    /// A final line with no trailing newline is still delivered.
    virtual std::optional<std::string> read_line() = 0;
};

/// Sink for newline-delimited output.
class ILineSink {
public:
    virtual ~ILineSink() = default;

    /// Write `line` followed by '\n'. The line is flushed before returning.
    virtual void write_line(std::string_view line) = 0;
};

} // namespace echotest
