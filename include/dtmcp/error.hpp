#pragma once
#include <stdexcept>
#include <string>

namespace dtmcp {

class McpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The input line is not a well-formed request envelope.
class McpParseError : public McpError {
public:
    using McpError::McpError;
};

/// Carries an explicit JSON-RPC error code through a handler.
class McpProtocolError : public McpError {
public:
    int code;
    McpProtocolError(int code, const std::string& msg)
        : McpError(msg), code(code) {}
};

class McpTransportError : public McpError {
public:
    using McpError::McpError;
};

/// tools/call named a tool that is not in the catalog.
class UnknownToolError : public McpError {
public:
    explicit UnknownToolError(const std::string& name)
        : McpError("Unknown tool: " + name) {}
};

/// A tool argument has the wrong JSON type or is out of range.
class InvalidArgumentError : public McpError {
public:
    using McpError::McpError;
};

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
} // namespace error

} // namespace dtmcp
