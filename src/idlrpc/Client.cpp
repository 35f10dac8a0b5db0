#include "idlrpc/Client.hpp"

#include "idlrpc/Dispatcher.hpp"
#include "idlrpc/IdGenerator.hpp"
#include "idlrpc/JSONCodec.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

namespace idlrpc {

LoopbackTransport::LoopbackTransport(std::shared_ptr<const Dispatcher> dispatcher):
    m_dispatcher(std::move(dispatcher)) { }

std::optional<std::string> LoopbackTransport::send(std::string_view request, std::string& /* errorMessage */) {
    return m_dispatcher->invoke(request);
}

Client::Client(std::shared_ptr<Transport> transport, std::unique_ptr<IdGenerator> idGenerator, bool forceASCII):
    m_transport(std::move(transport)), m_idGenerator(std::move(idGenerator)), m_forceASCII(forceASCII) { }

// Out of line so IdGenerator can stay forward-declared in the header.
Client::~Client() { m_idGenerator.reset(); }

Reply<Value> Client::call(std::string_view method, std::vector<Value> params) {
    auto request = makeRequest(std::string(method), std::move(params));

    std::string errorMessage;
    auto responseValue = exchange(request.toValue(), errorMessage);
    if (!responseValue) {
        return RpcError(RpcError::kInternalError, fmt::format("{}: {}", method, errorMessage));
    }

    auto response = Response::fromValue(*responseValue, errorMessage);
    if (!response) {
        return RpcError(RpcError::kInternalError,
                        fmt::format("{}: Call unable to decode response: {}", method, errorMessage));
    }

    if (response->error) {
        return *response->error;
    }
    return Reply<Value>(std::move(response->result));
}

std::vector<Response> Client::callBatch(std::vector<Request> batch) {
    auto requests = Value::makeArray();
    for (auto& request : batch) {
        if (request.id.isNil()) {
            request.id = Value::makeString(m_idGenerator->nextId());
        }
        requests.push(request.toValue());
    }

    std::vector<Response> responses;
    std::string errorMessage;
    auto responseValue = exchange(requests, errorMessage);
    if (!responseValue) {
        responses.emplace_back(Response::makeError(Value(), RpcError(RpcError::kInternalError,
                                                                     fmt::format("CallBatch {}", errorMessage))));
        return responses;
    }

    if (!responseValue->isArray()) {
        // A server answers an unacceptable batch with one error object rather than an array.
        auto single = Response::fromValue(*responseValue, errorMessage);
        if (single && single->error) {
            responses.emplace_back(std::move(*single));
        } else {
            responses.emplace_back(Response::makeError(Value(), RpcError(RpcError::kInternalError,
                    fmt::format("CallBatch unable to decode response: expected array, got {}",
                                responseValue->kindName()))));
        }
        return responses;
    }

    for (const auto& element : responseValue->getArray()) {
        auto response = Response::fromValue(element, errorMessage);
        if (!response) {
            responses.clear();
            responses.emplace_back(Response::makeError(Value(), RpcError(RpcError::kInternalError,
                    fmt::format("CallBatch unable to decode response: {}", errorMessage))));
            return responses;
        }
        responses.emplace_back(std::move(*response));
    }
    return responses;
}

Request Client::makeRequest(std::string method, std::vector<Value> params) {
    return Request { Value::makeString(m_idGenerator->nextId()), std::move(method),
                     Value::makeArray(std::move(params)) };
}

std::optional<Value> Client::exchange(const Value& request, std::string& errorMessage) {
    auto payload = serializeJSON(request, m_forceASCII);
    SPDLOG_TRACE("Client sending {} bytes.", payload.size());

    std::string transportError;
    auto responsePayload = m_transport->send(payload, transportError);
    if (!responsePayload) {
        errorMessage = fmt::format("Transport error during request: {}", transportError);
        return std::nullopt;
    }

    std::string parseError;
    auto response = parseJSON(*responsePayload, &parseError);
    if (!response) {
        errorMessage = fmt::format("unable to parse response JSON: {}", parseError);
        return std::nullopt;
    }
    return response;
}

} // namespace idlrpc
