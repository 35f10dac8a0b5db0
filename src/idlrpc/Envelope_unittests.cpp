#include "idlrpc/Envelope.hpp"

#include "idlrpc/JSONCodec.hpp"
#include "idlrpc/RpcError.hpp"

#include "doctest/doctest.h"

namespace idlrpc {

TEST_CASE("RpcError values") {
    SUBCASE("data omitted when nil") {
        RpcError error(RpcError::kMethodNotFound, "nope");
        CHECK_EQ(serializeJSON(error.toValue()), R"({"code":-32601,"message":"nope"})");
        error.data = Value::makeInteger(1);
        CHECK_EQ(serializeJSON(error.toValue()), R"({"code":-32601,"message":"nope","data":1})");
    }

    SUBCASE("fromValue") {
        auto value = parseJSON(R"({"code": -32000, "message": "bad", "data": [1]})");
        REQUIRE(value);
        auto error = RpcError::fromValue(*value);
        REQUIRE(error);
        CHECK_EQ(error->code, -32000);
        CHECK_EQ(error->message, "bad");
        CHECK_EQ(error->data.size(), 1);
    }

    SUBCASE("fromValue rejects other shapes") {
        for (const char* json : { "null", "\"error\"", R"({"message": "m"})", R"({"code": "1", "message": "m"})",
                                  R"({"code": 1.5, "message": "m"})", R"({"code": 1})",
                                  R"({"code": 99999999999, "message": "m"})" }) {
            auto value = parseJSON(json);
            REQUIRE(value);
            CHECK_FALSE(RpcError::fromValue(*value));
        }
    }
}

TEST_CASE("Request envelope") {
    SUBCASE("toValue") {
        auto params = Value::makeArray();
        params.push(Value::makeString("hi"));
        Request request { Value::makeString("abc"), "B.echo", params };
        CHECK_EQ(serializeJSON(request.toValue()),
                 R"({"jsonrpc":"2.0","id":"abc","method":"B.echo","params":["hi"]})");
    }

    SUBCASE("fromValue") {
        std::string errorMessage;
        auto value = parseJSON(R"({"jsonrpc": "2.0", "id": 4, "method": "A.add", "params": [1, 2]})");
        REQUIRE(value);
        auto request = Request::fromValue(*value, errorMessage);
        REQUIRE(request);
        CHECK_EQ(request->id, Value::makeInteger(4));
        CHECK_EQ(request->method, "A.add");
        CHECK_EQ(request->params.size(), 2);
    }

    SUBCASE("absent members") {
        std::string errorMessage;
        auto request = Request::fromValue(Value::makeObject(), errorMessage);
        REQUIRE(request);
        CHECK(request->id.isNil());
        CHECK(request->method.empty());
        CHECK(request->params.isNil());
    }

    SUBCASE("malformed") {
        std::string errorMessage;
        for (const char* json : { "[]", R"({"id": 1.5})", R"({"id": true})", R"({"method": 7})" }) {
            auto value = parseJSON(json);
            REQUIRE(value);
            CHECK_FALSE(Request::fromValue(*value, errorMessage));
            CHECK_FALSE(errorMessage.empty());
        }
    }
}

TEST_CASE("Response envelope") {
    SUBCASE("result") {
        auto response = Response::makeResult(Value::makeString("1"), Value::makeNil());
        CHECK_EQ(serializeJSON(response.toValue()), R"({"jsonrpc":"2.0","id":"1","result":null})");
    }

    SUBCASE("error excludes result") {
        auto response = Response::makeError(Value::makeNil(), RpcError(RpcError::kParseError, "bad"));
        CHECK_EQ(serializeJSON(response.toValue()),
                 R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"bad"}})");
    }

    SUBCASE("fromValue") {
        std::string errorMessage;
        auto value = parseJSON(R"({"jsonrpc": "2.0", "id": "9", "error": {"code": -32602, "message": "m"}})");
        REQUIRE(value);
        auto response = Response::fromValue(*value, errorMessage);
        REQUIRE(response);
        REQUIRE(response->error);
        CHECK_EQ(response->error->code, RpcError::kInvalidParams);

        value = parseJSON(R"({"jsonrpc": "2.0", "id": "9", "result": [1], "error": null})");
        REQUIRE(value);
        response = Response::fromValue(*value, errorMessage);
        REQUIRE(response);
        CHECK_FALSE(response->error);
        CHECK_EQ(response->result.size(), 1);

        value = parseJSON(R"({"id": "9", "error": {"code": "x"}})");
        REQUIRE(value);
        CHECK_FALSE(Response::fromValue(*value, errorMessage));
    }
}

} // namespace idlrpc
