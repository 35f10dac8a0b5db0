#ifndef SRC_IDLRPC_DISPATCHER_HPP_
#define SRC_IDLRPC_DISPATCHER_HPP_

#include "idlrpc/Envelope.hpp"
#include "idlrpc/Handler.hpp"
#include "idlrpc/Value.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace idlrpc {

class HandlerRegistry;

// Routes JSON-RPC requests to registered handlers. Holds no mutable state, so any number of threads may call into a
// Dispatcher at once, provided handler registration completed before the first call.
class Dispatcher {
public:
    // Reserved method returning the schema elements, answered without consulting the registry.
    static constexpr const char* kIntrospectionMethod = "barrister-idl";

    Dispatcher() = delete;
    // With |forceASCII| responses are serialized with all non-ASCII characters escaped.
    explicit Dispatcher(std::shared_ptr<const HandlerRegistry> registry, bool forceASCII = false);
    ~Dispatcher() = default;

    // Resolves |method| to a handler function, converts |params| against the schema and invokes it. Lookup failures
    // are kMethodNotFound, arity and conversion failures kInvalidParams, and a malformed handler return kInternalError.
    Reply<Value> call(std::string_view method, const std::vector<Value>& params) const;

    // Decodes a single request object or a batch array from |payload|, and returns the serialized response or
    // array of responses, positionally matching the batch. Undecodable payloads yield a single kParseError response.
    std::string invoke(std::string_view payload) const;

    // Answers one decoded request. An array of params spreads into positional arguments, any other value is passed
    // as the only argument.
    Response invokeOne(const Request& request) const;

    // Splits "Interface.function" at the first '.' into the interface name and the capitalized function name. Without
    // a '.', or with nothing following it, returns the whole method as the interface and an empty function name.
    static std::pair<std::string, std::string> parseMethod(std::string_view method);

private:
    std::string parseErrorResponse(const std::string& message) const;

    std::shared_ptr<const HandlerRegistry> m_registry;
    bool m_forceASCII;
    // Encoded once, the model never changes.
    Value m_introspectionResult;
};

} // namespace idlrpc

#endif // SRC_IDLRPC_DISPATCHER_HPP_
