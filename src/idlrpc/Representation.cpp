#include "idlrpc/Representation.hpp"

#include "fmt/format.h"

namespace idlrpc {

std::string Representation::toString() const {
    std::string name;
    switch (kind) {
    case kString:
        name = "string";
        break;
    case kInt:
        name = "int";
        break;
    case kFloat:
        name = "float";
        break;
    case kBool:
        name = "bool";
        break;
    case kStruct:
        name = fmt::format("struct {}", typeName);
        break;
    case kEnum:
        name = fmt::format("enum {}", typeName);
        break;
    case kError:
        name = "error";
        break;
    case kAny:
        name = "any";
        break;
    }
    if (isArray) {
        return fmt::format("[]{}{}", elementNullable ? "?" : "", name);
    }
    return (nullable && kind != kAny && kind != kError) ? fmt::format("?{}", name) : name;
}

} // namespace idlrpc
