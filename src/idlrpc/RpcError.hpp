#ifndef SRC_IDLRPC_RPC_ERROR_HPP_
#define SRC_IDLRPC_RPC_ERROR_HPP_

#include "idlrpc/Value.hpp"

#include <optional>
#include <string>

namespace idlrpc {

struct RpcError {
    enum ErrorCode : int {
        // Standardized JSON-RPC 2.0 error codes
        kParseError = -32700,
        kInvalidRequest = -32600,
        kMethodNotFound = -32601,
        kInvalidParams = -32602,
        kInternalError = -32603,

        // Top of the block reserved for application errors, handlers pick codes at or below this value.
        kServerErrorStart = -32000,
    };

    RpcError() = default;
    RpcError(int errorCode, std::string errorMessage): code(errorCode), message(std::move(errorMessage)) { }
    RpcError(int errorCode, std::string errorMessage, Value errorData):
        code(errorCode), message(std::move(errorMessage)), data(std::move(errorData)) { }

    int code = kInternalError;
    std::string message;
    // Absent when nil.
    Value data;

    // {code, message} plus data when not nil.
    Value toValue() const;
    // Accepts only an object with an integer code and a string message. Returns empty for any other shape.
    static std::optional<RpcError> fromValue(const Value& value);

    bool operator==(const RpcError& e) const { return code == e.code && message == e.message && data == e.data; }
};

} // namespace idlrpc

#endif // SRC_IDLRPC_RPC_ERROR_HPP_
