#ifndef SRC_IDLRPC_HANDLER_REGISTRY_HPP_
#define SRC_IDLRPC_HANDLER_REGISTRY_HPP_

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace idlrpc {

class ContractModel;
class ErrorReporter;
struct Function;
class Handler;

// Binds schema interface names to Handlers. All registerHandler() calls must complete before any request is served,
// registration is not safe against concurrent dispatch.
class HandlerRegistry {
public:
    HandlerRegistry() = delete;
    HandlerRegistry(std::shared_ptr<const ContractModel> model, std::shared_ptr<ErrorReporter> errorReporter);
    ~HandlerRegistry() = default;

    // Verifies that |handler| binds every function of |interfaceName| with the declared arity, a [result, error]
    // return, and representations that accept a synthesized test value of every parameter and of the return type.
    // On success stores the handler, replacing any earlier one for the same interface. On failure adds a
    // kRegistrationError (or kSchemaError for undeclared schema types) to the ErrorReporter and returns false,
    // leaving the registry unchanged.
    bool registerHandler(const std::string& interfaceName, std::shared_ptr<const Handler> handler);

    // Returns nullptr if no handler is registered for |interfaceName|.
    const Handler* lookup(std::string_view interfaceName) const;
    size_t size() const { return m_handlers.size(); }

    const ContractModel& model() const { return *m_model; }

private:
    bool verifyFunction(const std::string& interfaceName, const Function& function, const Handler& handler);

    std::shared_ptr<const ContractModel> m_model;
    std::shared_ptr<ErrorReporter> m_errorReporter;
    std::unordered_map<std::string, std::shared_ptr<const Handler>> m_handlers;
};

} // namespace idlrpc

#endif // SRC_IDLRPC_HANDLER_REGISTRY_HPP_
