#include "idlrpc/RpcError.hpp"

#include <limits>

namespace idlrpc {

Value RpcError::toValue() const {
    auto value = Value::makeObject();
    value.set("code", Value::makeInteger(code));
    value.set("message", Value::makeString(message));
    if (!data.isNil()) {
        value.set("data", data);
    }
    return value;
}

// static
std::optional<RpcError> RpcError::fromValue(const Value& value) {
    if (!value.isObject()) {
        return std::nullopt;
    }

    const Value* code = value.find("code");
    if (!code || !code->isInteger() || code->getInteger() < std::numeric_limits<int>::min()
        || code->getInteger() > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    const Value* message = value.find("message");
    if (!message || !message->isString()) {
        return std::nullopt;
    }

    RpcError error(static_cast<int>(code->getInteger()), message->getString());
    if (const Value* data = value.find("data")) {
        error.data = *data;
    }
    return error;
}

} // namespace idlrpc
