#pragma once

#include <stdexcept>
#include <string>

namespace piperpc {

// JSON-RPC 2.0 error codes
enum class ErrorCode : int {
    PARSE_ERROR      = -32700,
    INVALID_REQUEST  = -32600,
    METHOD_NOT_FOUND = -32601,
    INVALID_PARAMS   = -32602,
    INTERNAL_ERROR   = -32603,
};

class Error : public std::runtime_error {
public:
    explicit Error(const std::string & what) : std::runtime_error(what) {}
};

// The line is not valid JSON.
class MalformedMessage : public Error {
public:
    explicit MalformedMessage(const std::string & what) : Error(what) {}
};

// The line is JSON but not a well-formed request or response.
class ProtocolViolation : public Error {
public:
    explicit ProtocolViolation(const std::string & what) : Error(what) {}
};

// The stream could not be opened, or a read/write on it failed.
class ConnectionError : public Error {
public:
    explicit ConnectionError(const std::string & what) : Error(what) {}
};

// The stream ended or was closed while a request was outstanding.
class ConnectionClosed : public Error {
public:
    explicit ConnectionClosed(const std::string & what) : Error(what) {}
};

class Timeout : public Error {
public:
    explicit Timeout(const std::string & what) : Error(what) {}
};

// A method other than "initialize" was called before the handshake succeeded.
class NotInitialized : public Error {
public:
    explicit NotInitialized(const std::string & what) : Error(what) {}
};

class InvalidExpression : public Error {
public:
    explicit InvalidExpression(const std::string & what) : Error(what) {}
};

// A structured JSON-RPC error. Method handlers throw it to pick the wire
// error code; the client helpers throw it when the response is an error.
class RpcError : public Error {
public:
    RpcError(int code, const std::string & message) : Error(message), rpc_code(code) {}
    RpcError(ErrorCode code, const std::string & message) : RpcError(static_cast<int>(code), message) {}

    int code() const { return rpc_code; }

private:
    int rpc_code;
};

} // namespace piperpc
