#ifndef SRC_IDLRPC_CONVERTER_HPP_
#define SRC_IDLRPC_CONVERTER_HPP_

#include "idlrpc/Representation.hpp"
#include "idlrpc/Schema.hpp"
#include "idlrpc/Value.hpp"

#include <string>

namespace idlrpc {

class ContractModel;

struct ConversionResult {
    enum Status {
        kOk,
        // The value does not conform to the schema or representation, message cites the path.
        kConversionError,
        // The schema names a type that is neither primitive nor declared. A configuration defect, never a
        // per-request error.
        kSchemaError,
    };

    static ConversionResult makeOk(Value v) { return ConversionResult { kOk, std::move(v), "" }; }
    static ConversionResult makeConversionError(std::string m) {
        return ConversionResult { kConversionError, Value(), std::move(m) };
    }
    static ConversionResult makeSchemaError(std::string m) {
        return ConversionResult { kSchemaError, Value(), std::move(m) };
    }

    bool ok() const { return status == kOk; }

    Status status;
    Value value;
    std::string message;
};

// Validates and coerces dynamic values against a schema Field and the Representation a handler declared for it. Only
// reads the ContractModel, which must outlive the Converter.
class Converter {
public:
    Converter() = delete;
    explicit Converter(const ContractModel& model);
    ~Converter() = default;

    // Converts |value| for |field| into the shape |target| asks for. |path| names the value in messages and is
    // extended with .fieldName and [index] on the way down. Converted values are: integers for int, floats for float,
    // strings for string and enums, objects holding exactly the resolved fields (nil for absent optionals) for
    // structs, and arrays preserving source order.
    ConversionResult convert(const Field& field, const Representation& target, const Value& value,
                             const std::string& path) const;

    // Deterministic representative value of |field|'s schema type: "testval", 99, 10.3, true, a one-element array,
    // an object of resolved field test values, or the first enum value.
    ConversionResult makeTestValue(const Field& field) const;

private:
    ConversionResult convertStruct(const Field& field, const Representation& target, const Value& value,
                                   const std::string& path) const;
    ConversionResult convertEnum(const Field& field, const Representation& target, const Value& value,
                                 const std::string& path) const;
    ConversionResult makeTestValue(const Field& field, size_t depth) const;

    const ContractModel& m_model;
};

} // namespace idlrpc

#endif // SRC_IDLRPC_CONVERTER_HPP_
