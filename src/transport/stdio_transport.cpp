#include "echotest/transport/stdio_transport.hpp"
#include "echotest/error.hpp"
#include "echotest/logger.hpp"
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace echotest {

namespace {

void strip_carriage_return(std::string& line) {
    // Remove trailing \r if present (CRLF)
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

} // anonymous namespace

StdioTransport::StdioTransport()
    : read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true) {
}

StdioTransport::~StdioTransport() {
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0 && write_fd_ != read_fd_) ::close(write_fd_);
    }
}

bool StdioTransport::fill_buffer() {
    char chunk[4096];
    while (true) {
        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw TransportError(std::string("Read error: ") + std::strerror(errno));
        }
        if (n == 0) {
            ECHOTEST_LOG_DEBUG("end of input on fd {}", read_fd_);
            eof_ = true;
            return false;
        }
        buffer_.append(chunk, static_cast<size_t>(n));
        return true;
    }
}

std::optional<std::string> StdioTransport::read_line() {
    size_t scanned = 0;
    while (true) {
        size_t nl = buffer_.find('\n', scanned);
        if (nl != std::string::npos) {
            std::string line = buffer_.substr(0, nl);
            buffer_.erase(0, nl + 1);
            strip_carriage_return(line);
            return line;
        }
        scanned = buffer_.size();

        if (eof_ || !fill_buffer()) {
            if (buffer_.empty()) return std::nullopt;
            std::string line = std::move(buffer_);
            buffer_.clear();
            strip_carriage_return(line);
            return line;
        }
    }
}

void StdioTransport::write_line(std::string_view line) {
    std::string out;
    out.reserve(line.size() + 1);
    out.append(line);
    out += '\n';

    const char* data = out.data();
    size_t remaining = out.size();
    while (remaining > 0) {
        ssize_t written = ::write(write_fd_, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw TransportError(std::string("Write error: ") + std::strerror(errno));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
}

} // namespace echotest
