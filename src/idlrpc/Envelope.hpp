#ifndef SRC_IDLRPC_ENVELOPE_HPP_
#define SRC_IDLRPC_ENVELOPE_HPP_

#include "idlrpc/RpcError.hpp"
#include "idlrpc/Value.hpp"

#include <optional>
#include <string>

namespace idlrpc {

static constexpr const char* kJSONRPCVersion = "2.0";

// {jsonrpc, id, method, params}. The id is a string, an integer, or nil, and is echoed back unchanged.
struct Request {
    Value id;
    std::string method;
    // A positional array, or a single value passed as the only parameter. Nil when absent.
    Value params;

    Value toValue() const;
    // Returns empty and fills |errorMessage| if |value| is not an object, or id or method are of the wrong kind.
    static std::optional<Request> fromValue(const Value& value, std::string& errorMessage);
};

// {jsonrpc, id, result} on success or {jsonrpc, id, error} on failure, never both.
struct Response {
    Value id;
    Value result;
    std::optional<RpcError> error;

    static Response makeResult(Value id, Value result) { return Response { std::move(id), std::move(result), {} }; }
    static Response makeError(Value id, RpcError error) {
        return Response { std::move(id), Value(), std::move(error) };
    }

    Value toValue() const;
    // Returns empty and fills |errorMessage| if |value| is not an object or carries a malformed error.
    static std::optional<Response> fromValue(const Value& value, std::string& errorMessage);
};

} // namespace idlrpc

#endif // SRC_IDLRPC_ENVELOPE_HPP_
