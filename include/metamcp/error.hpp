#pragma once
#include <stdexcept>
#include <string>

namespace metamcp {

class McpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class McpParseError : public McpError {
public:
    using McpError::McpError;
};

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

class McpTimeoutError : public McpError {
public:
    using McpError::McpError;
};

/// Failure to create pipes, fork or exec a child process.
class ProcessError : public McpError {
public:
    using McpError::McpError;
};

/// Engine subprocess failed. The message is always safe to show to callers.
class EngineError : public McpError {
public:
    using McpError::McpError;
};

class EngineTimeoutError : public EngineError {
public:
    using EngineError::EngineError;
};

/// Tool arguments rejected before the engine is invoked.
class ValidationError : public McpError {
public:
    using McpError::McpError;
};

class SessionError : public McpError {
public:
    using McpError::McpError;
};

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
} // namespace error

namespace message {
    constexpr const char* EngineTimedOut = "Engine execution timed out";
    constexpr const char* EngineFailed =
        "Engine failed to execute. Please check your input or contact support.";
    constexpr const char* EngineNotStarted = "Failed to start engine process";
} // namespace message

} // namespace metamcp
