#pragma once
#include "transport.hpp"
#include <string>

namespace echotest {

/// StdioTransport reads newline-delimited text from a file descriptor and
/// writes lines to another one. Single-threaded and blocking: every line is
/// handed to write(2) immediately, so nothing is buffered across lines.
class StdioTransport : public ILineSource, public ILineSink {
public:
    /// Create transport using system stdin/stdout.
    StdioTransport();

    /// Create transport using specified file descriptors (for testing).
    /// The descriptors are owned and closed on destruction.
    StdioTransport(int read_fd, int write_fd);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    std::optional<std::string> read_line() override;
    void write_line(std::string_view line) override;

private:
    /// Read one more chunk into the buffer. Returns false at end of input.
    bool fill_buffer();

    int read_fd_;
    int write_fd_;
    bool owns_fds_;

    std::string buffer_;
    bool eof_{false};
};

} // namespace echotest
