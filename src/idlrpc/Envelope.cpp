#include "idlrpc/Envelope.hpp"

#include "fmt/format.h"

namespace {

bool isValidId(const idlrpc::Value& id) { return id.isNil() || id.isString() || id.isInteger(); }

} // namespace

namespace idlrpc {

Value Request::toValue() const {
    auto value = Value::makeObject();
    value.set("jsonrpc", Value::makeString(kJSONRPCVersion));
    value.set("id", id);
    value.set("method", Value::makeString(method));
    value.set("params", params);
    return value;
}

// static
std::optional<Request> Request::fromValue(const Value& value, std::string& errorMessage) {
    if (!value.isObject()) {
        errorMessage = fmt::format("request must be an object, got {}", value.kindName());
        return std::nullopt;
    }

    Request request;
    if (const Value* id = value.find("id")) {
        if (!isValidId(*id)) {
            errorMessage = fmt::format("request id must be a string, integer or null, got {}", id->kindName());
            return std::nullopt;
        }
        request.id = *id;
    }

    if (const Value* method = value.find("method")) {
        if (method->isString()) {
            request.method = method->getString();
        } else if (!method->isNil()) {
            errorMessage = fmt::format("request method must be a string, got {}", method->kindName());
            return std::nullopt;
        }
    }

    if (const Value* params = value.find("params")) {
        request.params = *params;
    }

    return request;
}

Value Response::toValue() const {
    auto value = Value::makeObject();
    value.set("jsonrpc", Value::makeString(kJSONRPCVersion));
    value.set("id", id);
    if (error) {
        value.set("error", error->toValue());
    } else {
        value.set("result", result);
    }
    return value;
}

// static
std::optional<Response> Response::fromValue(const Value& value, std::string& errorMessage) {
    if (!value.isObject()) {
        errorMessage = fmt::format("response must be an object, got {}", value.kindName());
        return std::nullopt;
    }

    Response response;
    if (const Value* id = value.find("id")) {
        if (!isValidId(*id)) {
            errorMessage = fmt::format("response id must be a string, integer or null, got {}", id->kindName());
            return std::nullopt;
        }
        response.id = *id;
    }

    const Value* error = value.find("error");
    if (error && !error->isNil()) {
        response.error = RpcError::fromValue(*error);
        if (!response.error) {
            errorMessage = fmt::format("response error is malformed: {}", error->toString());
            return std::nullopt;
        }
        return response;
    }

    if (const Value* result = value.find("result")) {
        response.result = *result;
    }
    return response;
}

} // namespace idlrpc
