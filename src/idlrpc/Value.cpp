#include "idlrpc/Value.hpp"

#include "fmt/format.h"

#include <cmath>
#include <utility>

namespace idlrpc {

Value::Value(): m_data(std::monostate()) { }
Value::Value(const Value&) = default;
Value::Value(Value&&) noexcept = default;
Value& Value::operator=(const Value&) = default;
Value& Value::operator=(Value&&) noexcept = default;
Value::~Value() = default;

Value Value::makeNil() { return Value(); }

Value Value::makeBool(bool b) {
    Value v;
    v.m_data = b;
    return v;
}

Value Value::makeInteger(int64_t i) {
    Value v;
    v.m_data = i;
    return v;
}

Value Value::makeFloat(double d) {
    Value v;
    v.m_data = d;
    return v;
}

Value Value::makeString(std::string s) {
    Value v;
    v.m_data = std::move(s);
    return v;
}

Value Value::makeArray(Array elements) {
    Value v;
    v.m_data = std::move(elements);
    return v;
}

Value Value::makeObject(Object members) {
    Value v;
    v.m_data = std::move(members);
    return v;
}

// static
const char* Value::kindName(Kind kind) {
    switch (kind) {
    case kNil:
        return "null";
    case kBoolean:
        return "bool";
    case kInteger:
        return "int";
    case kFloat:
        return "float";
    case kString:
        return "string";
    case kArray:
        return "array";
    case kObject:
        return "object";
    }
    return "unknown";
}

bool Value::isIntegral() const {
    if (isInteger()) {
        return true;
    }
    if (!isFloat()) {
        return false;
    }
    double d = getFloat();
    return std::isfinite(d) && std::trunc(d) == d;
}

double Value::getNumber() const {
    assert(isNumber());
    if (isInteger()) {
        return static_cast<double>(getInteger());
    }
    return getFloat();
}

const Value::Array& Value::getArray() const {
    assert(isArray());
    return std::get<Array>(m_data);
}

Value::Array& Value::getArray() {
    assert(isArray());
    return std::get<Array>(m_data);
}

const Value::Object& Value::getObject() const {
    assert(isObject());
    return std::get<Object>(m_data);
}

Value::Object& Value::getObject() {
    assert(isObject());
    return std::get<Object>(m_data);
}

size_t Value::size() const {
    if (isArray()) {
        return getArray().size();
    }
    if (isObject()) {
        return getObject().size();
    }
    return 0;
}

void Value::push(Value element) { getArray().emplace_back(std::move(element)); }

const Value* Value::find(std::string_view key) const {
    if (!isObject()) {
        return nullptr;
    }
    for (const auto& member : getObject()) {
        if (member.key == key) {
            return &member.value;
        }
    }
    return nullptr;
}

void Value::set(std::string key, Value value) {
    auto& members = getObject();
    for (auto& member : members) {
        if (member.key == key) {
            member.value = std::move(value);
            return;
        }
    }
    members.emplace_back(std::move(key), std::move(value));
}

bool Value::operator==(const Value& v) const {
    if (kind() != v.kind()) {
        return false;
    }

    switch (kind()) {
    case kNil:
        return true;
    case kBoolean:
        return getBool() == v.getBool();
    case kInteger:
        return getInteger() == v.getInteger();
    case kFloat:
        return getFloat() == v.getFloat();
    case kString:
        return getString() == v.getString();
    case kArray: {
        const auto& a = getArray();
        const auto& b = v.getArray();
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            if (a[i] != b[i]) {
                return false;
            }
        }
        return true;
    }
    case kObject: {
        if (size() != v.size()) {
            return false;
        }
        for (const auto& member : getObject()) {
            const Value* other = v.find(member.key);
            if (!other || *other != member.value) {
                return false;
            }
        }
        return true;
    }
    }

    return false;
}

std::string Value::toString() const {
    switch (kind()) {
    case kNil:
        return "null";
    case kBoolean:
        return getBool() ? "true" : "false";
    case kInteger:
        return fmt::format("{}", getInteger());
    case kFloat:
        return fmt::format("{}", getFloat());
    case kString:
        return fmt::format("\"{}\"", getString());
    case kArray: {
        std::string out("[");
        for (size_t i = 0; i < getArray().size(); ++i) {
            if (i > 0) {
                out += ",";
            }
            out += getArray()[i].toString();
        }
        return out + "]";
    }
    case kObject: {
        std::string out("{");
        bool first = true;
        for (const auto& member : getObject()) {
            if (!first) {
                out += ",";
            }
            first = false;
            out += fmt::format("\"{}\":{}", member.key, member.value.toString());
        }
        return out + "}";
    }
    }

    return "";
}

} // namespace idlrpc
