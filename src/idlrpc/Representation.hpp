#ifndef SRC_IDLRPC_REPRESENTATION_HPP_
#define SRC_IDLRPC_REPRESENTATION_HPP_

#include <cstdint>
#include <string>

namespace idlrpc {

// The shape a handler declares for one of its parameters or return values. The Converter checks schema types against
// it, so a handler whose signature drifted from the schema is caught at registration.
struct Representation {
    enum Kind : int32_t {
        kString,
        kInt,
        kFloat,
        kBool,
        // typeName names the struct.
        kStruct,
        // typeName names the enum.
        kEnum,
        // The error slot of a handler return, an RpcError or nil.
        kError,
        // Takes whatever the schema type converts to.
        kAny,
    };

    Kind kind = kAny;
    std::string typeName;
    bool isArray = false;
    // The handler accepts nil in place of a value. Arrays always accept nil, as an empty array.
    bool nullable = false;
    // For arrays, the handler accepts nil elements.
    bool elementNullable = false;

    static Representation makeString() { return Representation { kString, "", false }; }
    static Representation makeInt() { return Representation { kInt, "", false }; }
    static Representation makeFloat() { return Representation { kFloat, "", false }; }
    static Representation makeBool() { return Representation { kBool, "", false }; }
    static Representation makeStruct(std::string name) { return Representation { kStruct, std::move(name), false }; }
    static Representation makeEnum(std::string name) { return Representation { kEnum, std::move(name), false }; }
    static Representation makeError() { return Representation { kError, "", false, true }; }
    static Representation makeAny() { return Representation { kAny, "", false, true, true }; }

    // Copy of this representation accepting nil.
    Representation asNullable() const {
        Representation optional = *this;
        optional.nullable = true;
        return optional;
    }
    // Copy of this representation as an array of itself.
    Representation asArray() const {
        Representation array = *this;
        array.isArray = true;
        array.nullable = true;
        array.elementNullable = nullable;
        return array;
    }
    // Copy of this representation describing one array element.
    Representation elementRepresentation() const {
        Representation element = *this;
        element.isArray = false;
        element.nullable = elementNullable;
        return element;
    }

    // For diagnostics, for example "[]int", "?string" or "struct Person".
    std::string toString() const;

    bool operator==(const Representation& r) const {
        return kind == r.kind && typeName == r.typeName && isArray == r.isArray && nullable == r.nullable
            && elementNullable == r.elementNullable;
    }
    bool operator!=(const Representation& r) const { return !(*this == r); }
};

} // namespace idlrpc

#endif // SRC_IDLRPC_REPRESENTATION_HPP_
