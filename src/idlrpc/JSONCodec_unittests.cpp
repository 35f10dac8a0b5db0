#include "idlrpc/JSONCodec.hpp"

#include "doctest/doctest.h"

#include <cmath>
#include <limits>

namespace idlrpc {

TEST_CASE("parseJSON") {
    SUBCASE("scalars") {
        auto v = parseJSON("null");
        REQUIRE(v);
        CHECK(v->isNil());

        v = parseJSON("true");
        REQUIRE(v);
        CHECK_EQ(*v, Value::makeBool(true));

        v = parseJSON("\"hi\"");
        REQUIRE(v);
        CHECK_EQ(*v, Value::makeString("hi"));
    }

    SUBCASE("numbers") {
        auto v = parseJSON("42");
        REQUIRE(v);
        CHECK_EQ(*v, Value::makeInteger(42));

        v = parseJSON("-7");
        REQUIRE(v);
        CHECK_EQ(*v, Value::makeInteger(-7));

        v = parseJSON("3.0");
        REQUIRE(v);
        CHECK_EQ(*v, Value::makeFloat(3.0));

        v = parseJSON("1e2");
        REQUIRE(v);
        CHECK_EQ(*v, Value::makeFloat(100.0));

        v = parseJSON("1337654725230");
        REQUIRE(v);
        CHECK_EQ(*v, Value::makeInteger(1337654725230));
    }

    SUBCASE("nested") {
        auto v = parseJSON(R"({"b": [1, 2.5, "x"], "a": {"c": null}})");
        REQUIRE(v);
        REQUIRE(v->isObject());
        REQUIRE_EQ(v->size(), 2);
        // Source member order is kept.
        CHECK_EQ(v->getObject()[0].key, "b");
        const Value* b = v->find("b");
        REQUIRE(b != nullptr);
        REQUIRE_EQ(b->size(), 3);
        CHECK_EQ(b->getArray()[0], Value::makeInteger(1));
        CHECK_EQ(b->getArray()[1], Value::makeFloat(2.5));
        CHECK_EQ(b->getArray()[2], Value::makeString("x"));
        const Value* a = v->find("a");
        REQUIRE(a != nullptr);
        REQUIRE(a->find("c") != nullptr);
        CHECK(a->find("c")->isNil());
    }

    SUBCASE("unicode escapes") {
        auto v = parseJSON(R"("café")");
        REQUIRE(v);
        CHECK_EQ(v->getString(), "caf\xc3\xa9");
    }

    SUBCASE("malformed") {
        std::string errorMessage;
        CHECK_FALSE(parseJSON("{\"a\": ", &errorMessage));
        CHECK_FALSE(errorMessage.empty());
        CHECK_FALSE(parseJSON(""));
        CHECK_FALSE(parseJSON("[1, 2,]"));
        CHECK_FALSE(parseJSON("NaN"));
    }
}

TEST_CASE("serializeJSON") {
    SUBCASE("compact output in insertion order") {
        auto o = Value::makeObject();
        o.set("z", Value::makeInteger(1));
        o.set("a", Value::makeArray());
        o.set("m", Value::makeNil());
        CHECK_EQ(serializeJSON(o), R"({"z":1,"a":[],"m":null})");
    }

    SUBCASE("floats stay floats") {
        CHECK_EQ(serializeJSON(Value::makeFloat(3.0)), "3.0");
        CHECK_EQ(serializeJSON(Value::makeFloat(2.5)), "2.5");
        CHECK_EQ(serializeJSON(Value::makeInteger(3)), "3");
    }

    SUBCASE("non-finite floats are null") {
        CHECK_EQ(serializeJSON(Value::makeFloat(std::numeric_limits<double>::infinity())), "null");
        CHECK_EQ(serializeJSON(Value::makeFloat(std::nan(""))), "null");
    }

    SUBCASE("escapes") {
        CHECK_EQ(serializeJSON(Value::makeString("a\"b\\c\n")), R"("a\"b\\c\n")");
    }

    SUBCASE("force ASCII") {
        auto s = Value::makeString("caf\xc3\xa9");
        CHECK_EQ(serializeJSON(s), "\"caf\xc3\xa9\"");
        CHECK_EQ(serializeJSON(s, true), R"("café")");
    }

    SUBCASE("reparse") {
        auto v = parseJSON(R"({"id":"1","params":[1,2.5,true,null,{"k":["v"]}]})");
        REQUIRE(v);
        auto again = parseJSON(serializeJSON(*v));
        REQUIRE(again);
        CHECK_EQ(*v, *again);
    }
}

} // namespace idlrpc
