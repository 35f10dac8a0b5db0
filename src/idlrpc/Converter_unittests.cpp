#include "idlrpc/Converter.hpp"

#include "idlrpc/ConformTestFixture.hpp"
#include "idlrpc/ContractModel.hpp"
#include "idlrpc/ErrorReporter.hpp"
#include "idlrpc/JSONCodec.hpp"

#include "doctest/doctest.h"

namespace idlrpc {

namespace {

Field makeField(std::string type, bool isArray = false, bool optional = false) {
    return Field { "value", std::move(type), optional, isArray, "" };
}

Value json(std::string_view text) {
    auto value = parseJSON(text);
    REQUIRE(value);
    return *value;
}

} // namespace

TEST_CASE_FIXTURE(ConformTestFixture, "Converter primitives") {
    Converter converter(model());

    SUBCASE("string") {
        auto result = converter.convert(makeField("string"), Representation::makeString(), Value::makeString("hi"),
                                        "s");
        REQUIRE(result.ok());
        CHECK_EQ(result.value, Value::makeString("hi"));

        result = converter.convert(makeField("string"), Representation::makeString(), Value::makeInteger(1), "s");
        CHECK_EQ(result.status, ConversionResult::kConversionError);
        CHECK_EQ(result.message.substr(0, 2), "s:");
    }

    SUBCASE("int accepts integral floats only") {
        auto result = converter.convert(makeField("int"), Representation::makeInt(), Value::makeFloat(4.0), "n");
        REQUIRE(result.ok());
        CHECK_EQ(result.value, Value::makeInteger(4));

        result = converter.convert(makeField("int"), Representation::makeInt(), Value::makeFloat(4.5), "n");
        CHECK_EQ(result.status, ConversionResult::kConversionError);

        result = converter.convert(makeField("int"), Representation::makeInt(), Value::makeString("4"), "n");
        CHECK_EQ(result.status, ConversionResult::kConversionError);
    }

    SUBCASE("float widens integers") {
        auto result = converter.convert(makeField("float"), Representation::makeFloat(), Value::makeInteger(3), "f");
        REQUIRE(result.ok());
        CHECK_EQ(result.value, Value::makeFloat(3.0));
    }

    SUBCASE("bool") {
        auto result = converter.convert(makeField("bool"), Representation::makeBool(), Value::makeBool(false), "b");
        REQUIRE(result.ok());
        CHECK_EQ(result.value, Value::makeBool(false));

        result = converter.convert(makeField("bool"), Representation::makeBool(), Value::makeInteger(0), "b");
        CHECK_EQ(result.status, ConversionResult::kConversionError);
    }

    SUBCASE("null") {
        auto result = converter.convert(makeField("string"), Representation::makeString(), Value::makeNil(), "p");
        CHECK_EQ(result.status, ConversionResult::kConversionError);
        CHECK_EQ(result.message, "p: required value is null");

        result = converter.convert(makeField("string", false, true), Representation::makeString().asNullable(),
                                   Value::makeNil(), "p");
        REQUIRE(result.ok());
        CHECK(result.value.isNil());

        result = converter.convert(makeField("string", false, true), Representation::makeAny(), Value::makeNil(), "p");
        CHECK(result.ok());
    }

    SUBCASE("null into a representation that cannot hold it") {
        auto result = converter.convert(makeField("string", false, true), Representation::makeString(),
                                        Value::makeNil(), "p");
        CHECK_EQ(result.status, ConversionResult::kConversionError);
        CHECK_EQ(result.message, "p: null is not accepted by representation string");

        result = converter.convert(makeField("int", true, true), Representation::makeInt().asArray(),
                                   json("[1, null]"), "a");
        CHECK_EQ(result.status, ConversionResult::kConversionError);
        CHECK_EQ(result.message, "a[1]: null is not accepted by representation int");

        result = converter.convert(makeField("int", true, true), Representation::makeInt().asNullable().asArray(),
                                   json("[1, null]"), "a");
        REQUIRE(result.ok());
        CHECK(result.value.getArray()[1].isNil());

        result = converter.convert(makeField("int", true, true), Representation::makeInt().asArray(),
                                   Value::makeNil(), "a");
        CHECK(result.ok());
    }

    SUBCASE("representation mismatch") {
        auto result = converter.convert(makeField("int"), Representation::makeString(), Value::makeInteger(1), "p");
        CHECK_EQ(result.status, ConversionResult::kConversionError);
        CHECK_NE(result.message.find("does not match"), std::string::npos);

        result = converter.convert(makeField("int"), Representation::makeInt().asArray(), Value::makeInteger(1), "p");
        CHECK_EQ(result.status, ConversionResult::kConversionError);
    }

    SUBCASE("any") {
        auto result = converter.convert(makeField("int"), Representation::makeAny(), Value::makeInteger(1), "p");
        REQUIRE(result.ok());
        CHECK_EQ(result.value, Value::makeInteger(1));
    }
}

TEST_CASE_FIXTURE(ConformTestFixture, "Converter arrays") {
    Converter converter(model());

    SUBCASE("elements converted in order") {
        auto result = converter.convert(makeField("float", true), Representation::makeFloat().asArray(),
                                        json("[1, 2.5, 3]"), "nums");
        REQUIRE(result.ok());
        CHECK_EQ(result.value, json("[1.0, 2.5, 3.0]"));
    }

    SUBCASE("empty array") {
        auto result = converter.convert(makeField("int", true), Representation::makeInt().asArray(), json("[]"), "a");
        REQUIRE(result.ok());
        CHECK_EQ(result.value.size(), 0);
    }

    SUBCASE("element error carries index") {
        auto result = converter.convert(makeField("int", true), Representation::makeInt().asArray(),
                                        json("[1, \"two\"]"), "param[0]");
        CHECK_EQ(result.status, ConversionResult::kConversionError);
        CHECK_EQ(result.message.substr(0, 12), "param[0][1]:");
    }

    SUBCASE("scalar for array") {
        auto result = converter.convert(makeField("int", true), Representation::makeInt().asArray(),
                                        Value::makeInteger(1), "a");
        CHECK_EQ(result.status, ConversionResult::kConversionError);
    }

    SUBCASE("array for scalar representation") {
        auto result = converter.convert(makeField("int", true), Representation::makeInt(), json("[1]"), "a");
        CHECK_EQ(result.status, ConversionResult::kConversionError);
    }

    SUBCASE("any accepts arrays") {
        auto result = converter.convert(makeField("string", true), Representation::makeAny(), json("[\"a\"]"), "a");
        REQUIRE(result.ok());
        CHECK_EQ(result.value, json("[\"a\"]"));
    }
}

TEST_CASE_FIXTURE(ConformTestFixture, "Converter structs") {
    Converter converter(model());

    SUBCASE("optional member may be absent") {
        auto result = converter.convert(makeField("Person"), Representation::makeStruct("Person"),
                                        json(R"({"personId": "1", "firstName": "Ann", "lastName": "Lee"})"), "p");
        REQUIRE(result.ok());
        REQUIRE(result.value.find("email") != nullptr);
        CHECK(result.value.find("email")->isNil());
        CHECK_EQ(*result.value.find("personId"), Value::makeString("1"));
    }

    SUBCASE("optional member may be null") {
        auto result = converter.convert(makeField("Person"), Representation::makeStruct("Person"),
            json(R"({"personId": "1", "firstName": "Ann", "lastName": "Lee", "email": null})"), "p");
        CHECK(result.ok());
    }

    SUBCASE("missing required member") {
        auto result = converter.convert(makeField("Person"), Representation::makeStruct("Person"),
                                        json(R"({"personId": "1", "firstName": "Ann"})"), "p");
        CHECK_EQ(result.status, ConversionResult::kConversionError);
        CHECK_EQ(result.message, "p.lastName: required value is null");
    }

    SUBCASE("unknown members are dropped") {
        auto result = converter.convert(makeField("HiResponse"), Representation::makeStruct("HiResponse"),
                                        json(R"({"hi": "x", "extra": 1})"), "r");
        REQUIRE(result.ok());
        CHECK_EQ(result.value, json(R"({"hi": "x"})"));
    }

    SUBCASE("inherited members are required") {
        auto result = converter.convert(makeField("RepeatResponse"), Representation::makeStruct("RepeatResponse"),
                                        json(R"({"count": 1, "items": ["a"]})"), "r");
        CHECK_EQ(result.status, ConversionResult::kConversionError);
        CHECK_EQ(result.message.substr(0, 8), "r.status");

        result = converter.convert(makeField("RepeatResponse"), Representation::makeStruct("RepeatResponse"),
                                   json(R"({"count": 1, "items": ["a"], "status": "ok"})"), "r");
        REQUIRE(result.ok());
        CHECK_EQ(result.value.size(), 3);
    }

    SUBCASE("nested error path") {
        auto result = converter.convert(makeField("RepeatResponse"), Representation::makeStruct("RepeatResponse"),
                                        json(R"({"count": 1, "items": ["a", 2], "status": "ok"})"), "r");
        CHECK_EQ(result.status, ConversionResult::kConversionError);
        CHECK_EQ(result.message.substr(0, 11), "r.items[1]:");
    }

    SUBCASE("wrong struct representation") {
        auto result = converter.convert(makeField("Person"), Representation::makeStruct("HiResponse"),
                                        json(R"({"personId": "1", "firstName": "Ann", "lastName": "Lee"})"), "p");
        CHECK_EQ(result.status, ConversionResult::kConversionError);
    }

    SUBCASE("not an object") {
        auto result = converter.convert(makeField("Person"), Representation::makeStruct("Person"),
                                        Value::makeString("Ann"), "p");
        CHECK_EQ(result.status, ConversionResult::kConversionError);
    }
}

TEST_CASE_FIXTURE(ConformTestFixture, "Converter enums") {
    Converter converter(model());

    SUBCASE("declared value") {
        auto result = converter.convert(makeField("MathOp"), Representation::makeEnum("MathOp"),
                                        Value::makeString("multiply"), "op");
        REQUIRE(result.ok());
        CHECK_EQ(result.value, Value::makeString("multiply"));
    }

    SUBCASE("string representation") {
        auto result = converter.convert(makeField("MathOp"), Representation::makeString(), Value::makeString("add"),
                                        "op");
        CHECK(result.ok());
    }

    SUBCASE("undeclared value lists allowed values") {
        auto result = converter.convert(makeField("MathOp"), Representation::makeEnum("MathOp"),
                                        Value::makeString("divide"), "op");
        CHECK_EQ(result.status, ConversionResult::kConversionError);
        CHECK_NE(result.message.find("add, multiply"), std::string::npos);
    }

    SUBCASE("other enum") {
        auto result = converter.convert(makeField("MathOp"), Representation::makeEnum("Status"),
                                        Value::makeString("add"), "op");
        CHECK_EQ(result.status, ConversionResult::kConversionError);
    }
}

TEST_CASE_FIXTURE(ConformTestFixture, "Converter unknown types") {
    Converter converter(model());

    auto result = converter.convert(makeField("Widget"), Representation::makeAny(), Value::makeString("w"), "w");
    CHECK_EQ(result.status, ConversionResult::kSchemaError);
    CHECK_FALSE(result.ok());

    CHECK_EQ(converter.makeTestValue(makeField("Widget")).status, ConversionResult::kSchemaError);
}

TEST_CASE_FIXTURE(ConformTestFixture, "Converter test values") {
    Converter converter(model());

    SUBCASE("primitives") {
        CHECK_EQ(converter.makeTestValue(makeField("string")).value, Value::makeString("testval"));
        CHECK_EQ(converter.makeTestValue(makeField("int")).value, Value::makeInteger(99));
        CHECK_EQ(converter.makeTestValue(makeField("float")).value, Value::makeFloat(10.3));
        CHECK_EQ(converter.makeTestValue(makeField("bool")).value, Value::makeBool(true));
    }

    SUBCASE("array") {
        CHECK_EQ(converter.makeTestValue(makeField("int", true)).value, json("[99]"));
    }

    SUBCASE("enum takes first value") {
        CHECK_EQ(converter.makeTestValue(makeField("MathOp")).value, Value::makeString("add"));
    }

    SUBCASE("struct includes inherited fields") {
        auto result = converter.makeTestValue(makeField("RepeatResponse"));
        REQUIRE(result.ok());
        CHECK_EQ(result.value, json(R"({"count": 99, "items": ["testval"], "status": "ok"})"));
    }

    SUBCASE("test values convert against their own type") {
        for (const char* type : { "Person", "RepeatRequest", "RepeatResponse", "HiResponse", "Status" }) {
            auto testValue = converter.makeTestValue(makeField(type));
            REQUIRE(testValue.ok());
            CHECK(converter.convert(makeField(type), Representation::makeAny(), testValue.value, "value").ok());
        }
    }

    SUBCASE("self-referencing structs") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        auto recursive = ContractModel::parse(R"([
            {"type": "struct", "name": "Node", "fields": [
                {"name": "label", "type": "string"},
                {"name": "next", "type": "Node", "optional": true},
                {"name": "children", "type": "Node", "is_array": true}]},
            {"type": "struct", "name": "Loop", "fields": [{"name": "self", "type": "Loop"}]}])", errorReporter);
        REQUIRE(recursive);
        Converter recursiveConverter(*recursive);
        auto node = recursiveConverter.makeTestValue(makeField("Node"));
        REQUIRE(node.ok());
        CHECK(recursiveConverter.convert(makeField("Node"), Representation::makeStruct("Node"), node.value, "n").ok());

        CHECK_EQ(recursiveConverter.makeTestValue(makeField("Loop")).status, ConversionResult::kSchemaError);
    }
}

} // namespace idlrpc
