#include "idlrpc/Schema.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

namespace {

using idlrpc::Value;

// Helpers for reading attributes of schema objects. A missing or null attribute leaves |out| at its default, an
// attribute of the wrong kind is a decode error.
bool readString(const Value& object, const char* key, std::string& out, const std::string& where, std::string& error) {
    const Value* value = object.find(key);
    if (!value || value->isNil()) {
        return true;
    }
    if (!value->isString()) {
        error = fmt::format("{}: '{}' must be a string, got {}", where, key, value->kindName());
        return false;
    }
    out = value->getString();
    return true;
}

bool readRequiredString(const Value& object, const char* key, std::string& out, const std::string& where,
                        std::string& error) {
    const Value* value = object.find(key);
    if (!value || value->isNil()) {
        error = fmt::format("{}: missing required '{}'", where, key);
        return false;
    }
    return readString(object, key, out, where, error);
}

bool readBool(const Value& object, const char* key, bool& out, const std::string& where, std::string& error) {
    const Value* value = object.find(key);
    if (!value || value->isNil()) {
        return true;
    }
    if (!value->isBool()) {
        error = fmt::format("{}: '{}' must be a bool, got {}", where, key, value->kindName());
        return false;
    }
    out = value->getBool();
    return true;
}

bool readInteger(const Value& object, const char* key, int64_t& out, const std::string& where, std::string& error) {
    const Value* value = object.find(key);
    if (!value || value->isNil()) {
        return true;
    }
    if (value->isInteger()) {
        out = value->getInteger();
        return true;
    }
    if (!value->isIntegral() || value->getFloat() < -9223372036854775808.0
        || value->getFloat() >= 9223372036854775808.0) {
        error = fmt::format("{}: '{}' must be an integer, got {}", where, key, value->toString());
        return false;
    }
    out = static_cast<int64_t>(value->getFloat());
    return true;
}

// Returns nullptr for a missing or null attribute, and sets |error| if present but not an array.
const Value* readArray(const Value& object, const char* key, const std::string& where, std::string& error) {
    const Value* value = object.find(key);
    if (!value || value->isNil()) {
        return nullptr;
    }
    if (!value->isArray()) {
        error = fmt::format("{}: '{}' must be an array, got {}", where, key, value->kindName());
    }
    return value;
}

// Function return descriptors carry no meaningful name, so |requireName| is false for them.
bool decodeField(const Value& value, idlrpc::Field& field, const std::string& where, std::string& error,
                 bool requireName = true) {
    if (!value.isObject()) {
        error = fmt::format("{}: field must be an object, got {}", where, value.kindName());
        return false;
    }
    return (requireName ? readRequiredString(value, "name", field.name, where, error)
                        : readString(value, "name", field.name, where, error))
        && readRequiredString(value, "type", field.type, where, error)
        && readBool(value, "optional", field.optional, where, error)
        && readBool(value, "is_array", field.isArray, where, error)
        && readString(value, "comment", field.comment, where, error);
}

bool decodeFields(const Value& object, const char* key, std::vector<idlrpc::Field>& fields, const std::string& where,
                  std::string& error) {
    const Value* array = readArray(object, key, where, error);
    if (!error.empty()) {
        return false;
    }
    if (!array) {
        return true;
    }
    for (size_t i = 0; i < array->size(); ++i) {
        idlrpc::Field field;
        if (!decodeField(array->getArray()[i], field, fmt::format("{}.{}[{}]", where, key, i), error)) {
            return false;
        }
        fields.emplace_back(std::move(field));
    }
    return true;
}

bool decodeFunction(const Value& value, idlrpc::Function& function, const std::string& where, std::string& error) {
    if (!value.isObject()) {
        error = fmt::format("{}: function must be an object, got {}", where, value.kindName());
        return false;
    }
    if (!readRequiredString(value, "name", function.name, where, error)
        || !readString(value, "comment", function.comment, where, error)
        || !decodeFields(value, "params", function.params, where, error)) {
        return false;
    }
    const Value* returns = value.find("returns");
    if (!returns || returns->isNil()) {
        error = fmt::format("{}: missing required 'returns'", where);
        return false;
    }
    return decodeField(*returns, function.returns, where + ".returns", error, false);
}

bool isKnownElementType(const std::string& type) {
    return type == "comment" || type == "enum" || type == "struct" || type == "interface" || type == "meta";
}

bool decodeElement(const Value& value, idlrpc::Element& element, const std::string& where, std::string& error) {
    if (!value.isObject()) {
        error = fmt::format("{}: element must be an object, got {}", where, value.kindName());
        return false;
    }

    std::string type;
    if (!readRequiredString(value, "type", type, where, error)) {
        return false;
    }

    if (type == "comment") {
        idlrpc::schema::Comment comment;
        if (!readString(value, "value", comment.value, where, error)) {
            return false;
        }
        element = std::move(comment);
    } else if (type == "enum") {
        idlrpc::schema::Enum enumElement;
        if (!readRequiredString(value, "name", enumElement.name, where, error)
            || !readString(value, "comment", enumElement.comment, where, error)) {
            return false;
        }
        const Value* values = readArray(value, "values", where, error);
        if (!error.empty()) {
            return false;
        }
        if (values) {
            for (size_t i = 0; i < values->size(); ++i) {
                const Value& enumValue = values->getArray()[i];
                auto valueWhere = fmt::format("{}.values[{}]", where, i);
                if (!enumValue.isObject()) {
                    error = fmt::format("{}: enum value must be an object, got {}", valueWhere, enumValue.kindName());
                    return false;
                }
                idlrpc::EnumValue decoded;
                if (!readRequiredString(enumValue, "value", decoded.value, valueWhere, error)
                    || !readString(enumValue, "comment", decoded.comment, valueWhere, error)) {
                    return false;
                }
                enumElement.values.emplace_back(std::move(decoded));
            }
        }
        element = std::move(enumElement);
    } else if (type == "struct") {
        idlrpc::schema::Struct structElement;
        if (!readRequiredString(value, "name", structElement.name, where, error)
            || !readString(value, "extends", structElement.extends, where, error)
            || !readString(value, "comment", structElement.comment, where, error)
            || !decodeFields(value, "fields", structElement.fields, where, error)) {
            return false;
        }
        element = std::move(structElement);
    } else if (type == "interface") {
        idlrpc::schema::Interface interfaceElement;
        if (!readRequiredString(value, "name", interfaceElement.name, where, error)
            || !readString(value, "comment", interfaceElement.comment, where, error)) {
            return false;
        }
        const Value* functions = readArray(value, "functions", where, error);
        if (!error.empty()) {
            return false;
        }
        if (functions) {
            for (size_t i = 0; i < functions->size(); ++i) {
                idlrpc::Function function;
                if (!decodeFunction(functions->getArray()[i], function, fmt::format("{}.functions[{}]", where, i),
                                    error)) {
                    return false;
                }
                interfaceElement.functions.emplace_back(std::move(function));
            }
        }
        element = std::move(interfaceElement);
    } else if (type == "meta") {
        idlrpc::schema::Meta meta;
        if (!readString(value, "barrister_version", meta.barristerVersion, where, error)
            || !readInteger(value, "date_generated", meta.dateGenerated, where, error)
            || !readString(value, "checksum", meta.checksum, where, error)) {
            return false;
        }
        element = std::move(meta);
    } else {
        error = fmt::format("{}: unknown element type '{}'", where, type);
        return false;
    }

    return true;
}

Value encodeField(const idlrpc::Field& field) {
    auto value = Value::makeObject();
    value.set("name", Value::makeString(field.name));
    value.set("type", Value::makeString(field.type));
    value.set("optional", Value::makeBool(field.optional));
    value.set("is_array", Value::makeBool(field.isArray));
    value.set("comment", Value::makeString(field.comment));
    return value;
}

Value encodeFields(const std::vector<idlrpc::Field>& fields) {
    auto array = Value::makeArray();
    for (const auto& field : fields) {
        array.push(encodeField(field));
    }
    return array;
}

} // namespace

namespace idlrpc {

bool Field::isPrimitive() const {
    return type == schema::kStringType || type == schema::kIntType || type == schema::kFloatType
        || type == schema::kBoolType;
}

Field Field::elementField() const {
    Field element = *this;
    element.isArray = false;
    return element;
}

bool Field::operator==(const Field& f) const {
    return name == f.name && type == f.type && optional == f.optional && isArray == f.isArray && comment == f.comment;
}

bool Function::operator==(const Function& f) const {
    return name == f.name && comment == f.comment && params == f.params && returns == f.returns;
}

bool decodeElements(const Value& value, std::vector<Element>& elements, std::string& errorMessage) {
    elements.clear();
    errorMessage.clear();
    if (!value.isArray()) {
        errorMessage = fmt::format("schema must be an array of elements, got {}", value.kindName());
        return false;
    }

    std::vector<Element> decoded;
    decoded.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        const Value& raw = value.getArray()[i];
        const Value* type = raw.isObject() ? raw.find("type") : nullptr;
        if (type && type->isString() && !isKnownElementType(type->getString())) {
            SPDLOG_WARN("Ignoring element[{}] of unknown type '{}'.", i, type->getString());
            continue;
        }
        Element element;
        if (!decodeElement(raw, element, fmt::format("element[{}]", i), errorMessage)) {
            return false;
        }
        decoded.emplace_back(std::move(element));
    }

    elements = std::move(decoded);
    return true;
}

Value encodeElement(const Element& element) {
    auto value = Value::makeObject();

    if (std::holds_alternative<schema::Comment>(element)) {
        const auto& comment = std::get<schema::Comment>(element);
        value.set("type", Value::makeString("comment"));
        value.set("value", Value::makeString(comment.value));
    } else if (std::holds_alternative<schema::Enum>(element)) {
        const auto& enumElement = std::get<schema::Enum>(element);
        value.set("type", Value::makeString("enum"));
        value.set("name", Value::makeString(enumElement.name));
        value.set("comment", Value::makeString(enumElement.comment));
        auto values = Value::makeArray();
        for (const auto& enumValue : enumElement.values) {
            auto encoded = Value::makeObject();
            encoded.set("value", Value::makeString(enumValue.value));
            encoded.set("comment", Value::makeString(enumValue.comment));
            values.push(std::move(encoded));
        }
        value.set("values", std::move(values));
    } else if (std::holds_alternative<schema::Struct>(element)) {
        const auto& structElement = std::get<schema::Struct>(element);
        value.set("type", Value::makeString("struct"));
        value.set("name", Value::makeString(structElement.name));
        if (!structElement.extends.empty()) {
            value.set("extends", Value::makeString(structElement.extends));
        }
        value.set("comment", Value::makeString(structElement.comment));
        value.set("fields", encodeFields(structElement.fields));
    } else if (std::holds_alternative<schema::Interface>(element)) {
        const auto& interfaceElement = std::get<schema::Interface>(element);
        value.set("type", Value::makeString("interface"));
        value.set("name", Value::makeString(interfaceElement.name));
        value.set("comment", Value::makeString(interfaceElement.comment));
        auto functions = Value::makeArray();
        for (const auto& function : interfaceElement.functions) {
            auto encoded = Value::makeObject();
            encoded.set("name", Value::makeString(function.name));
            encoded.set("comment", Value::makeString(function.comment));
            encoded.set("params", encodeFields(function.params));
            encoded.set("returns", encodeField(function.returns));
            functions.push(std::move(encoded));
        }
        value.set("functions", std::move(functions));
    } else {
        const auto& meta = std::get<schema::Meta>(element);
        value.set("type", Value::makeString("meta"));
        value.set("barrister_version", Value::makeString(meta.barristerVersion));
        value.set("date_generated", Value::makeInteger(meta.dateGenerated));
        value.set("checksum", Value::makeString(meta.checksum));
    }

    return value;
}

Value encodeElements(const std::vector<Element>& elements) {
    auto array = Value::makeArray();
    for (const auto& element : elements) {
        array.push(encodeElement(element));
    }
    return array;
}

} // namespace idlrpc
