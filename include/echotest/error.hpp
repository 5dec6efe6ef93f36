#pragma once
#include <stdexcept>
#include <string>

namespace echotest {

class EchoTestError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Input line is not a valid JSON value.
class ParseError : public EchoTestError {
public:
    using EchoTestError::EchoTestError;
};

class TransportError : public EchoTestError {
public:
    using EchoTestError::EchoTestError;
};

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
} // namespace error

} // namespace echotest
