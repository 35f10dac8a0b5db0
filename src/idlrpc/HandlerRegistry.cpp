#include "idlrpc/HandlerRegistry.hpp"

#include "idlrpc/ContractModel.hpp"
#include "idlrpc/Converter.hpp"
#include "idlrpc/ErrorReporter.hpp"
#include "idlrpc/Handler.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

namespace idlrpc {

HandlerRegistry::HandlerRegistry(std::shared_ptr<const ContractModel> model,
                                 std::shared_ptr<ErrorReporter> errorReporter):
    m_model(std::move(model)), m_errorReporter(std::move(errorReporter)) { }

bool HandlerRegistry::registerHandler(const std::string& interfaceName, std::shared_ptr<const Handler> handler) {
    const std::vector<Function>* functions = m_model->lookupInterface(interfaceName);
    if (!functions) {
        m_errorReporter->addError(ErrorReporter::kRegistrationError,
                                  fmt::format("Schema has no interface: {}", interfaceName));
        return false;
    }
    if (!handler) {
        m_errorReporter->addError(ErrorReporter::kRegistrationError,
                                  fmt::format("Null handler registered for interface: {}", interfaceName));
        return false;
    }

    for (const auto& function : *functions) {
        if (!verifyFunction(interfaceName, function, *handler)) {
            return false;
        }
    }

    if (m_handlers.find(interfaceName) != m_handlers.end()) {
        SPDLOG_WARN("Replacing handler for interface {}.", interfaceName);
    }
    m_handlers[interfaceName] = std::move(handler);
    SPDLOG_INFO("Registered handler for interface {} with {} functions.", interfaceName, functions->size());
    return true;
}

const Handler* HandlerRegistry::lookup(std::string_view interfaceName) const {
    auto iter = m_handlers.find(std::string(interfaceName));
    if (iter == m_handlers.end()) {
        return nullptr;
    }
    return iter->second.get();
}

bool HandlerRegistry::verifyFunction(const std::string& interfaceName, const Function& function,
                                     const Handler& handler) {
    auto functionName = capitalize(function.name);
    const Callable* callable = handler.find(functionName);
    if (!callable || !callable->invoke) {
        m_errorReporter->addError(ErrorReporter::kRegistrationError,
                                  fmt::format("{} handler has no function named: {}", interfaceName, functionName));
        return false;
    }

    if (callable->params.size() != function.params.size()) {
        m_errorReporter->addError(ErrorReporter::kRegistrationError,
                                  fmt::format("{} handler function {} accepts {} params but schema specifies {}",
                                              interfaceName, functionName, callable->params.size(),
                                              function.params.size()));
        return false;
    }

    if (callable->returns.size() != 2) {
        m_errorReporter->addError(ErrorReporter::kRegistrationError,
                                  fmt::format("{} handler function {} returns {} values but must return 2",
                                              interfaceName, functionName, callable->returns.size()));
        return false;
    }

    if (callable->returns[1].kind != Representation::kError || callable->returns[1].isArray) {
        m_errorReporter->addError(ErrorReporter::kRegistrationError,
                                  fmt::format("{}.{} return value[1] has invalid type: {} (expected: error)",
                                              interfaceName, functionName, callable->returns[1].toString()));
        return false;
    }

    // Run a representative value of every schema type through the declared representations, so a signature that
    // drifted from the schema fails here instead of on the first request.
    Converter converter(*m_model);
    auto check = [&](const Field& field, const Representation& target, const std::string& path) {
        auto testValue = converter.makeTestValue(field);
        if (testValue.ok()) {
            auto result = converter.convert(field, target, testValue.value, "value");
            if (result.ok()) {
                return true;
            }
            testValue = std::move(result);
        }
        auto kind = testValue.status == ConversionResult::kSchemaError ? ErrorReporter::kSchemaError
                                                                       : ErrorReporter::kRegistrationError;
        m_errorReporter->addError(kind, fmt::format("{} has invalid type: {} reason: {}", path, target.toString(),
                                                    testValue.message));
        return false;
    };

    // Test values are never null, so an optional parameter bound to a type that cannot hold nil needs its own check.
    auto checkNullable = [&](const Field& field, const Representation& target, const std::string& path) {
        if (!field.optional || field.isArray != target.isArray) {
            return true;
        }
        if (field.isArray ? target.elementNullable : target.nullable) {
            return true;
        }
        m_errorReporter->addError(ErrorReporter::kRegistrationError,
                                  fmt::format("{} has invalid type: {} reason: optional field '{}' of type {}{} "
                                              "accepts null{}", path, target.toString(), field.name,
                                              field.isArray ? "[]" : "", field.type,
                                              field.isArray ? " elements" : ""));
        return false;
    };

    for (size_t i = 0; i < function.params.size(); ++i) {
        auto path = fmt::format("{}.{} param[{}]", interfaceName, functionName, i);
        if (!checkNullable(function.params[i], callable->params[i], path)) {
            return false;
        }
        if (!check(function.params[i], callable->params[i], path)) {
            return false;
        }
    }

    return check(function.returns, callable->returns[0],
                 fmt::format("{}.{} return value[0]", interfaceName, functionName));
}

} // namespace idlrpc
