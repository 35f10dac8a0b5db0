#include "idlrpc/Converter.hpp"

#include "idlrpc/ContractModel.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <cmath>

namespace {

// Self-referencing structs stop synthesizing nested test values past this depth.
constexpr size_t kMaxTestValueDepth = 16;

std::string fieldPath(const std::string& path, const std::string& fieldName) {
    if (path.empty()) {
        return fieldName;
    }
    return fmt::format("{}.{}", path, fieldName);
}

std::string schemaTypeName(const idlrpc::Field& field) {
    return field.isArray ? fmt::format("[]{}", field.type) : field.type;
}

idlrpc::ConversionResult mismatch(const idlrpc::Field& field, const idlrpc::Representation& target,
                                  const std::string& path) {
    return idlrpc::ConversionResult::makeConversionError(fmt::format(
        "{}: schema type {} does not match representation {}", path, schemaTypeName(field), target.toString()));
}

idlrpc::ConversionResult wrongKind(const char* expected, const idlrpc::Value& value, const std::string& path) {
    return idlrpc::ConversionResult::makeConversionError(
        fmt::format("{}: expected {} but got {} {}", path, expected, value.kindName(), value.toString()));
}

} // namespace

namespace idlrpc {

Converter::Converter(const ContractModel& model): m_model(model) { }

ConversionResult Converter::convert(const Field& field, const Representation& target, const Value& value,
                                    const std::string& path) const {
    if (value.isNil()) {
        if (!field.optional) {
            return ConversionResult::makeConversionError(fmt::format("{}: required value is null", path));
        }
        if (!target.nullable) {
            return ConversionResult::makeConversionError(
                fmt::format("{}: null is not accepted by representation {}", path, target.toString()));
        }
        return ConversionResult::makeOk(Value::makeNil());
    }

    if (field.isArray) {
        if (!target.isArray && target.kind != Representation::kAny) {
            return mismatch(field, target, path);
        }
        if (!value.isArray()) {
            return wrongKind("array", value, path);
        }
        Field elementField = field.elementField();
        Representation elementTarget = target.elementRepresentation();
        Value::Array elements;
        elements.reserve(value.size());
        for (size_t i = 0; i < value.size(); ++i) {
            auto result = convert(elementField, elementTarget, value.getArray()[i], fmt::format("{}[{}]", path, i));
            if (!result.ok()) {
                return result;
            }
            elements.emplace_back(std::move(result.value));
        }
        return ConversionResult::makeOk(Value::makeArray(std::move(elements)));
    }

    if (target.isArray) {
        return mismatch(field, target, path);
    }

    if (field.type == schema::kStringType) {
        if (target.kind != Representation::kString && target.kind != Representation::kAny) {
            return mismatch(field, target, path);
        }
        if (!value.isString()) {
            return wrongKind("string", value, path);
        }
        return ConversionResult::makeOk(value);
    }

    if (field.type == schema::kIntType) {
        if (target.kind != Representation::kInt && target.kind != Representation::kAny) {
            return mismatch(field, target, path);
        }
        if (!value.isNumber()) {
            return wrongKind("int", value, path);
        }
        if (value.isInteger()) {
            return ConversionResult::makeOk(value);
        }
        // No silent truncation of fractional values.
        double d = value.getFloat();
        if (!value.isIntegral() || d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
            return ConversionResult::makeConversionError(
                fmt::format("{}: expected int but got non-integral or out of range number {}", path, d));
        }
        return ConversionResult::makeOk(Value::makeInteger(static_cast<int64_t>(d)));
    }

    if (field.type == schema::kFloatType) {
        if (target.kind != Representation::kFloat && target.kind != Representation::kAny) {
            return mismatch(field, target, path);
        }
        if (!value.isNumber()) {
            return wrongKind("float", value, path);
        }
        return ConversionResult::makeOk(Value::makeFloat(value.getNumber()));
    }

    if (field.type == schema::kBoolType) {
        if (target.kind != Representation::kBool && target.kind != Representation::kAny) {
            return mismatch(field, target, path);
        }
        if (!value.isBool()) {
            return wrongKind("bool", value, path);
        }
        return ConversionResult::makeOk(value);
    }

    if (m_model.lookupStruct(field.type)) {
        return convertStruct(field, target, value, path);
    }

    if (m_model.lookupEnum(field.type)) {
        return convertEnum(field, target, value, path);
    }

    SPDLOG_CRITICAL("Schema references unknown type '{}' at {}.", field.type, path);
    return ConversionResult::makeSchemaError(
        fmt::format("{}: type '{}' is not a primitive or a declared struct or enum", path, field.type));
}

ConversionResult Converter::makeTestValue(const Field& field) const { return makeTestValue(field, 0); }

ConversionResult Converter::convertStruct(const Field& field, const Representation& target, const Value& value,
                                          const std::string& path) const {
    if (target.kind != Representation::kAny
        && (target.kind != Representation::kStruct || target.typeName != field.type)) {
        return mismatch(field, target, path);
    }
    if (!value.isObject()) {
        return wrongKind(fmt::format("struct {}", field.type).c_str(), value, path);
    }

    const Struct* structType = m_model.lookupStruct(field.type);
    auto record = Value::makeObject();
    // Members not in the resolved field set are dropped.
    for (const auto& structField : structType->resolvedFields) {
        const Value* member = value.find(structField.name);
        auto result = convert(structField, Representation::makeAny(), member ? *member : Value::makeNil(),
                              fieldPath(path, structField.name));
        if (!result.ok()) {
            return result;
        }
        record.set(structField.name, std::move(result.value));
    }

    return ConversionResult::makeOk(std::move(record));
}

ConversionResult Converter::convertEnum(const Field& field, const Representation& target, const Value& value,
                                        const std::string& path) const {
    if (target.kind != Representation::kAny && target.kind != Representation::kString
        && (target.kind != Representation::kEnum || target.typeName != field.type)) {
        return mismatch(field, target, path);
    }
    if (!value.isString()) {
        return wrongKind(fmt::format("enum {}", field.type).c_str(), value, path);
    }

    const std::vector<EnumValue>* enumValues = m_model.lookupEnum(field.type);
    std::string allowed;
    for (const auto& enumValue : *enumValues) {
        if (enumValue.value == value.getString()) {
            return ConversionResult::makeOk(value);
        }
        if (!allowed.empty()) {
            allowed += ", ";
        }
        allowed += enumValue.value;
    }

    return ConversionResult::makeConversionError(fmt::format("{}: value '{}' is not in enum {}, allowed values: {}",
                                                             path, value.getString(), field.type, allowed));
}

ConversionResult Converter::makeTestValue(const Field& field, size_t depth) const {
    if (field.isArray) {
        if (depth >= kMaxTestValueDepth) {
            return ConversionResult::makeOk(Value::makeArray());
        }
        auto element = makeTestValue(field.elementField(), depth);
        if (!element.ok()) {
            return element;
        }
        Value::Array elements;
        elements.emplace_back(std::move(element.value));
        return ConversionResult::makeOk(Value::makeArray(std::move(elements)));
    }

    if (field.type == schema::kStringType) {
        return ConversionResult::makeOk(Value::makeString("testval"));
    }
    if (field.type == schema::kIntType) {
        return ConversionResult::makeOk(Value::makeInteger(99));
    }
    if (field.type == schema::kFloatType) {
        return ConversionResult::makeOk(Value::makeFloat(10.3));
    }
    if (field.type == schema::kBoolType) {
        return ConversionResult::makeOk(Value::makeBool(true));
    }

    if (const Struct* structType = m_model.lookupStruct(field.type)) {
        if (depth >= kMaxTestValueDepth) {
            if (field.optional) {
                return ConversionResult::makeOk(Value::makeNil());
            }
            return ConversionResult::makeSchemaError(
                fmt::format("struct '{}' requires an instance of itself in field '{}'", field.type, field.name));
        }
        auto record = Value::makeObject();
        for (const auto& structField : structType->resolvedFields) {
            auto result = makeTestValue(structField, depth + 1);
            if (!result.ok()) {
                return result;
            }
            record.set(structField.name, std::move(result.value));
        }
        return ConversionResult::makeOk(std::move(record));
    }

    if (const std::vector<EnumValue>* enumValues = m_model.lookupEnum(field.type)) {
        if (enumValues->empty()) {
            return ConversionResult::makeSchemaError(
                fmt::format("enum '{}' of field '{}' declares no values", field.type, field.name));
        }
        return ConversionResult::makeOk(Value::makeString(enumValues->front().value));
    }

    return ConversionResult::makeSchemaError(
        fmt::format("unable to create test value for field '{}' of unknown type '{}'", field.name, field.type));
}

} // namespace idlrpc
