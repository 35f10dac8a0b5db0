#ifndef SRC_IDLRPC_VALUE_HPP_
#define SRC_IDLRPC_VALUE_HPP_

#include <cassert>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace idlrpc {

struct Member;

// Generic tree-shaped dynamic value, the in-memory form of any decoded JSON payload. Like a Slot, construction goes
// through the static make*() functions and access through the get*() methods, which assert on the wrong kind.
class Value {
public:
    using Array = std::vector<Value>;
    using Object = std::vector<Member>;

    // Order matches the alternatives of m_data.
    enum Kind : int32_t {
        kNil = 0,
        kBoolean = 1,
        kInteger = 2,
        kFloat = 3,
        kString = 4,
        kArray = 5,
        kObject = 6,
    };

    Value();
    Value(const Value&);
    Value(Value&&) noexcept;
    Value& operator=(const Value&);
    Value& operator=(Value&&) noexcept;
    ~Value();

    static Value makeNil();
    static Value makeBool(bool b);
    static Value makeInteger(int64_t i);
    static Value makeFloat(double d);
    static Value makeString(std::string s);
    static Value makeArray(Array elements = Array());
    static Value makeObject(Object members = Object());

    Kind kind() const { return static_cast<Kind>(m_data.index()); }
    static const char* kindName(Kind kind);
    const char* kindName() const { return kindName(kind()); }

    inline bool isNil() const { return kind() == kNil; }
    inline bool isBool() const { return kind() == kBoolean; }
    inline bool isInteger() const { return kind() == kInteger; }
    inline bool isFloat() const { return kind() == kFloat; }
    inline bool isNumber() const { return isInteger() || isFloat(); }
    inline bool isString() const { return kind() == kString; }
    inline bool isArray() const { return kind() == kArray; }
    inline bool isObject() const { return kind() == kObject; }

    // True for integers and for floats with no fractional part.
    bool isIntegral() const;

    inline bool getBool() const {
        assert(isBool());
        return std::get<bool>(m_data);
    }
    inline int64_t getInteger() const {
        assert(isInteger());
        return std::get<int64_t>(m_data);
    }
    inline double getFloat() const {
        assert(isFloat());
        return std::get<double>(m_data);
    }
    // Either numeric kind, widened to double.
    double getNumber() const;
    inline const std::string& getString() const {
        assert(isString());
        return std::get<std::string>(m_data);
    }
    const Array& getArray() const;
    Array& getArray();
    const Object& getObject() const;
    Object& getObject();

    // Number of array elements or object members, zero for all other kinds.
    size_t size() const;

    // Appends to an array value.
    void push(Value element);

    // Object member access. find() returns nullptr if the key is absent or this is not an object. set() replaces an
    // existing member in place, or appends a new one preserving insertion order.
    const Value* find(std::string_view key) const;
    void set(std::string key, Value value);

    // Deep comparison. Objects compare as keyed mappings, ignoring member order. Integer 3 and float 3.0 differ.
    bool operator==(const Value& v) const;
    bool operator!=(const Value& v) const { return !(*this == v); }

    // Compact JSON-like rendering for log and diagnostic messages.
    std::string toString() const;

private:
    std::variant<std::monostate, bool, int64_t, double, std::string, Array, Object> m_data;
};

struct Member {
    Member() = default;
    Member(std::string k, Value v): key(std::move(k)), value(std::move(v)) { }

    std::string key;
    Value value;
};

} // namespace idlrpc

#endif // SRC_IDLRPC_VALUE_HPP_
