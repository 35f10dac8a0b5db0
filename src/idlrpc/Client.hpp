#ifndef SRC_IDLRPC_CLIENT_HPP_
#define SRC_IDLRPC_CLIENT_HPP_

#include "idlrpc/Envelope.hpp"
#include "idlrpc/Handler.hpp"
#include "idlrpc/Value.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace idlrpc {

class Dispatcher;
class IdGenerator;

// Byte-in, byte-out request/response exchange with a server.
class Transport {
public:
    Transport() = default;
    virtual ~Transport() = default;

    // Returns the response payload, or empty with |errorMessage| filled if the exchange failed.
    virtual std::optional<std::string> send(std::string_view request, std::string& errorMessage) = 0;
};

// Hands requests straight to a Dispatcher in the same process.
class LoopbackTransport : public Transport {
public:
    LoopbackTransport() = delete;
    explicit LoopbackTransport(std::shared_ptr<const Dispatcher> dispatcher);
    virtual ~LoopbackTransport() = default;

    std::optional<std::string> send(std::string_view request, std::string& errorMessage) override;

private:
    std::shared_ptr<const Dispatcher> m_dispatcher;
};

class Client {
public:
    Client() = delete;
    Client(std::shared_ptr<Transport> transport, std::unique_ptr<IdGenerator> idGenerator, bool forceASCII = false);
    ~Client();

    // Sends one request with a fresh id. Transport failures and undecodable responses are kInternalError.
    Reply<Value> call(std::string_view method, std::vector<Value> params);

    // Sends |batch| as one array. Requests with a nil id are given a fresh one. If the exchange itself fails, returns a
    // single Response carrying the error.
    std::vector<Response> callBatch(std::vector<Request> batch);

    // Builds a request with a fresh id, for assembling batches.
    Request makeRequest(std::string method, std::vector<Value> params);

private:
    std::optional<Value> exchange(const Value& request, std::string& errorMessage);

    std::shared_ptr<Transport> m_transport;
    std::unique_ptr<IdGenerator> m_idGenerator;
    bool m_forceASCII;
};

} // namespace idlrpc

#endif // SRC_IDLRPC_CLIENT_HPP_
