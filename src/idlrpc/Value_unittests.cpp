#include "idlrpc/Value.hpp"

#include "doctest/doctest.h"

namespace idlrpc {

TEST_CASE("Value scalars") {
    SUBCASE("nil") {
        Value v;
        CHECK(v.isNil());
        CHECK_EQ(v.kind(), Value::kNil);
        CHECK_EQ(v, Value::makeNil());
        CHECK_EQ(v.size(), 0);
    }

    SUBCASE("bool") {
        Value t = Value::makeBool(true);
        REQUIRE(t.isBool());
        CHECK(t.getBool());
        CHECK_NE(t, Value::makeBool(false));
    }

    SUBCASE("integer") {
        Value i = Value::makeInteger(-42);
        REQUIRE(i.isInteger());
        CHECK(i.isNumber());
        CHECK(i.isIntegral());
        CHECK_EQ(i.getInteger(), -42);
        CHECK_EQ(i.getNumber(), -42.0);
    }

    SUBCASE("float") {
        Value f = Value::makeFloat(2.5);
        REQUIRE(f.isFloat());
        CHECK(f.isNumber());
        CHECK_FALSE(f.isIntegral());
        CHECK(Value::makeFloat(3.0).isIntegral());
        CHECK_EQ(f.getNumber(), 2.5);
    }

    SUBCASE("integer and float are distinct") {
        CHECK_NE(Value::makeInteger(3), Value::makeFloat(3.0));
    }

    SUBCASE("string") {
        Value s = Value::makeString("abc");
        REQUIRE(s.isString());
        CHECK_EQ(s.getString(), "abc");
        CHECK_EQ(s.toString(), "\"abc\"");
    }
}

TEST_CASE("Value arrays") {
    Value a = Value::makeArray();
    REQUIRE(a.isArray());
    CHECK_EQ(a.size(), 0);
    a.push(Value::makeInteger(1));
    a.push(Value::makeString("two"));
    REQUIRE_EQ(a.size(), 2);
    CHECK_EQ(a.getArray()[0], Value::makeInteger(1));
    CHECK_EQ(a.getArray()[1], Value::makeString("two"));
    CHECK_EQ(a.toString(), "[1,\"two\"]");

    Value b = Value::makeArray();
    b.push(Value::makeString("two"));
    b.push(Value::makeInteger(1));
    CHECK_NE(a, b);
}

TEST_CASE("Value objects") {
    SUBCASE("find and set") {
        Value o = Value::makeObject();
        REQUIRE(o.isObject());
        CHECK(o.find("a") == nullptr);
        o.set("a", Value::makeInteger(1));
        o.set("b", Value::makeBool(false));
        REQUIRE(o.find("a") != nullptr);
        CHECK_EQ(*o.find("a"), Value::makeInteger(1));
        CHECK_EQ(o.size(), 2);

        o.set("a", Value::makeString("replaced"));
        CHECK_EQ(o.size(), 2);
        CHECK_EQ(*o.find("a"), Value::makeString("replaced"));
        // Replacement keeps the member's position.
        CHECK_EQ(o.getObject()[0].key, "a");
    }

    SUBCASE("find on non-object") {
        CHECK(Value::makeInteger(1).find("a") == nullptr);
    }

    SUBCASE("equality ignores member order") {
        Value o1 = Value::makeObject();
        o1.set("x", Value::makeInteger(1));
        o1.set("y", Value::makeInteger(2));
        Value o2 = Value::makeObject();
        o2.set("y", Value::makeInteger(2));
        o2.set("x", Value::makeInteger(1));
        CHECK_EQ(o1, o2);

        o2.set("z", Value::makeNil());
        CHECK_NE(o1, o2);
    }

    SUBCASE("insertion order preserved") {
        Value o = Value::makeObject();
        o.set("z", Value::makeInteger(1));
        o.set("a", Value::makeInteger(2));
        CHECK_EQ(o.toString(), "{\"z\":1,\"a\":2}");
    }
}

TEST_CASE("Value kind names") {
    CHECK_EQ(std::string(Value::makeNil().kindName()), "null");
    CHECK_EQ(std::string(Value::makeObject().kindName()), "object");
}

} // namespace idlrpc
