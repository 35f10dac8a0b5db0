#include "idlrpc/Handler.hpp"

#include <cctype>

namespace idlrpc {

std::string capitalize(std::string_view name) {
    std::string capitalized(name);
    if (!capitalized.empty()) {
        capitalized[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(capitalized[0])));
    }
    return capitalized;
}

Handler& Handler::bindCallable(std::string_view functionName, Callable callable) {
    m_callables[capitalize(functionName)] = std::move(callable);
    return *this;
}

const Callable* Handler::find(std::string_view functionName) const {
    auto iter = m_callables.find(capitalize(functionName));
    if (iter == m_callables.end()) {
        return nullptr;
    }
    return &iter->second;
}

} // namespace idlrpc
