#include "idlrpc/Dispatcher.hpp"

#include "idlrpc/ContractModel.hpp"
#include "idlrpc/Converter.hpp"
#include "idlrpc/HandlerRegistry.hpp"
#include "idlrpc/JSONCodec.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <cctype>

namespace idlrpc {

Dispatcher::Dispatcher(std::shared_ptr<const HandlerRegistry> registry, bool forceASCII):
    m_registry(std::move(registry)),
    m_forceASCII(forceASCII),
    m_introspectionResult(encodeElements(m_registry->model().rawElements())) { }

Reply<Value> Dispatcher::call(std::string_view method, const std::vector<Value>& params) const {
    const ContractModel& model = m_registry->model();
    const Function* function = model.lookupMethod(method);
    if (!function) {
        return RpcError(RpcError::kMethodNotFound, fmt::format("Unsupported method: {}", method));
    }

    auto names = parseMethod(method);
    const std::string& interfaceName = names.first;
    const std::string& functionName = names.second;

    const Handler* handler = m_registry->lookup(interfaceName);
    if (!handler) {
        return RpcError(RpcError::kMethodNotFound,
                        fmt::format("No handler registered for interface: {}", interfaceName));
    }

    const Callable* callable = handler->find(functionName);
    if (!callable || !callable->invoke) {
        return RpcError(RpcError::kMethodNotFound,
                        fmt::format("Function {} not found on handler {}", functionName, interfaceName));
    }

    if (callable->params.size() != params.size()) {
        return RpcError(RpcError::kInvalidParams, fmt::format("Method {} expects {} params but was passed {}", method,
                                                              callable->params.size(), params.size()));
    }
    if (function->params.size() != params.size()) {
        return RpcError(RpcError::kInvalidParams, fmt::format("Method {} expects {} params but was passed {}", method,
                                                              function->params.size(), params.size()));
    }

    Converter converter(model);
    std::vector<Value> converted;
    converted.reserve(params.size());
    for (size_t i = 0; i < params.size(); ++i) {
        auto result = converter.convert(function->params[i], callable->params[i], params[i],
                                        fmt::format("param[{}]", i));
        if (result.status == ConversionResult::kSchemaError) {
            SPDLOG_CRITICAL("Schema error dispatching {}: {}", method, result.message);
            return RpcError(RpcError::kInternalError, result.message);
        }
        if (!result.ok()) {
            return RpcError(RpcError::kInvalidParams, result.message);
        }
        converted.emplace_back(std::move(result.value));
    }

    SPDLOG_TRACE("Invoking {} with {} params.", method, converted.size());
    std::vector<Value> returns = callable->invoke(converted);
    if (returns.size() != 2) {
        return RpcError(RpcError::kInternalError,
                        fmt::format("Method {} did not return 2 values. len(ret)={}", method, returns.size()));
    }

    if (returns[1].isNil()) {
        return Reply<Value>(std::move(returns[0]));
    }

    auto error = RpcError::fromValue(returns[1]);
    if (!error) {
        return RpcError(RpcError::kInternalError,
                        fmt::format("Method {} did not return an RPC error for last return value: {}", method,
                                    returns[1].toString()));
    }
    return *error;
}

std::string Dispatcher::invoke(std::string_view payload) const {
    // The first significant character tells a batch from a single request.
    size_t start = 0;
    while (start < payload.size() && std::isspace(static_cast<unsigned char>(payload[start]))) {
        ++start;
    }
    if (start == payload.size() || (payload[start] != '[' && payload[start] != '{')) {
        return parseErrorResponse("request must be a JSON object or array");
    }
    bool batch = payload[start] == '[';

    std::string errorMessage;
    auto value = parseJSON(payload, &errorMessage);
    if (!value) {
        return parseErrorResponse(errorMessage);
    }

    if (!batch) {
        auto request = Request::fromValue(*value, errorMessage);
        if (!request) {
            return parseErrorResponse(errorMessage);
        }
        return serializeJSON(invokeOne(*request).toValue(), m_forceASCII);
    }

    std::vector<Request> requests;
    requests.reserve(value->size());
    for (const auto& element : value->getArray()) {
        auto request = Request::fromValue(element, errorMessage);
        if (!request) {
            return parseErrorResponse(errorMessage);
        }
        requests.emplace_back(std::move(*request));
    }

    SPDLOG_TRACE("Processing batch of {} requests.", requests.size());
    auto responses = Value::makeArray();
    for (const auto& request : requests) {
        responses.push(invokeOne(request).toValue());
    }
    return serializeJSON(responses, m_forceASCII);
}

Response Dispatcher::invokeOne(const Request& request) const {
    if (request.method == kIntrospectionMethod) {
        SPDLOG_TRACE("Answering introspection request.");
        return Response::makeResult(request.id, m_introspectionResult);
    }

    std::vector<Value> params;
    if (request.params.isArray()) {
        params = request.params.getArray();
    } else {
        params.emplace_back(request.params);
    }

    auto reply = call(request.method, params);
    if (reply.error) {
        SPDLOG_DEBUG("Method {} failed with code {}: {}", request.method, reply.error->code, reply.error->message);
        return Response::makeError(request.id, std::move(*reply.error));
    }
    return Response::makeResult(request.id, std::move(reply.result));
}

// static
std::pair<std::string, std::string> Dispatcher::parseMethod(std::string_view method) {
    size_t separator = method.find('.');
    if (separator == std::string_view::npos || separator == method.size() - 1) {
        return std::make_pair(std::string(method), std::string());
    }
    return std::make_pair(std::string(method.substr(0, separator)), capitalize(method.substr(separator + 1)));
}

std::string Dispatcher::parseErrorResponse(const std::string& message) const {
    SPDLOG_ERROR("Rejecting request, unable to parse JSON: {}", message);
    auto response = Response::makeError(Value::makeNil(), RpcError(RpcError::kParseError,
                                                                    fmt::format("Unable to parse JSON: {}", message)));
    return serializeJSON(response.toValue(), m_forceASCII);
}

} // namespace idlrpc
