#ifndef SRC_IDLRPC_SCHEMA_HPP_
#define SRC_IDLRPC_SCHEMA_HPP_

#include "idlrpc/Value.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace idlrpc {

// Type annotation of a function parameter, function return value, or struct member.
struct Field {
    std::string name;
    // One of the primitives "string", "int", "float", "bool", or the name of a struct or enum.
    std::string type;
    bool optional = false;
    bool isArray = false;
    std::string comment;

    bool isPrimitive() const;
    // A copy of this field with isArray cleared, describing one element of an array field.
    Field elementField() const;

    bool operator==(const Field& f) const;
    bool operator!=(const Field& f) const { return !(*this == f); }
};

struct EnumValue {
    std::string value;
    std::string comment;

    bool operator==(const EnumValue& e) const { return value == e.value && comment == e.comment; }
};

struct Function {
    std::string name;
    std::string comment;
    std::vector<Field> params;
    Field returns;

    bool operator==(const Function& f) const;
};

namespace schema {

static constexpr const char* kStringType = "string";
static constexpr const char* kIntType = "int";
static constexpr const char* kFloatType = "float";
static constexpr const char* kBoolType = "bool";

struct Comment {
    std::string value;

    bool operator==(const Comment& c) const { return value == c.value; }
};

struct Enum {
    std::string name;
    std::string comment;
    std::vector<EnumValue> values;

    bool operator==(const Enum& e) const { return name == e.name && comment == e.comment && values == e.values; }
};

struct Struct {
    std::string name;
    // Empty if the struct has no parent.
    std::string extends;
    std::string comment;
    std::vector<Field> fields;

    bool operator==(const Struct& s) const {
        return name == s.name && extends == s.extends && comment == s.comment && fields == s.fields;
    }
};

struct Interface {
    std::string name;
    std::string comment;
    std::vector<Function> functions;

    bool operator==(const Interface& i) const {
        return name == i.name && comment == i.comment && functions == i.functions;
    }
};

// As it appears in the schema, with date_generated in milliseconds.
struct Meta {
    std::string barristerVersion;
    int64_t dateGenerated = 0;
    std::string checksum;

    bool operator==(const Meta& m) const {
        return barristerVersion == m.barristerVersion && dateGenerated == m.dateGenerated && checksum == m.checksum;
    }
};

} // namespace schema

// One parsed unit of the schema, selected on the "type" discriminator.
using Element = std::variant<schema::Comment, schema::Enum, schema::Struct, schema::Interface, schema::Meta>;

// Decodes the ordered element sequence in |value|. Returns false and fills |errorMessage| if |value| is not an array
// of well-formed elements, in which case |elements| is left empty.
bool decodeElements(const Value& value, std::vector<Element>& elements, std::string& errorMessage);

// Encodes elements back into their schema form. The introspection method returns encodeElements() of the parsed model.
Value encodeElement(const Element& element);
Value encodeElements(const std::vector<Element>& elements);

} // namespace idlrpc

#endif // SRC_IDLRPC_SCHEMA_HPP_
