#include "idlrpc/Dispatcher.hpp"

#include "idlrpc/ConformTestFixture.hpp"
#include "idlrpc/ErrorReporter.hpp"
#include "idlrpc/Handler.hpp"
#include "idlrpc/HandlerRegistry.hpp"
#include "idlrpc/JSONCodec.hpp"
#include "idlrpc/Schema.hpp"
#include "server/ConformanceHandlers.hpp"

#include "doctest/doctest.h"

#include <cmath>
#include <optional>
#include <string>

namespace idlrpc {

namespace {

std::shared_ptr<HandlerRegistry> makeRegistry(bool registerHandlers = true) {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    auto registry = std::make_shared<HandlerRegistry>(parseConformSchema(), errorReporter);
    if (registerHandlers) {
        REQUIRE(registry->registerHandler("A", server::makeInterfaceAHandler()));
        REQUIRE(registry->registerHandler("B", server::makeInterfaceBHandler()));
    }
    return registry;
}

Value invokeJSON(const Dispatcher& dispatcher, std::string_view payload) {
    auto response = parseJSON(dispatcher.invoke(payload));
    REQUIRE(response);
    return *response;
}

int64_t errorCode(const Value& response) {
    const Value* error = response.find("error");
    REQUIRE(error != nullptr);
    REQUIRE(error->find("code") != nullptr);
    return error->find("code")->getInteger();
}

std::vector<Value> params(std::string_view json) {
    auto value = parseJSON(json);
    REQUIRE(value);
    REQUIRE(value->isArray());
    return value->getArray();
}

} // namespace

TEST_CASE("Dispatcher parseMethod") {
    auto names = Dispatcher::parseMethod("A.add");
    CHECK_EQ(names.first, "A");
    CHECK_EQ(names.second, "Add");

    names = Dispatcher::parseMethod("A.b.c");
    CHECK_EQ(names.first, "A");
    CHECK_EQ(names.second, "B.c");

    names = Dispatcher::parseMethod("nodot");
    CHECK_EQ(names.first, "nodot");
    CHECK(names.second.empty());

    names = Dispatcher::parseMethod("B.");
    CHECK_EQ(names.first, "B.");
    CHECK(names.second.empty());
}

TEST_CASE("Dispatcher call") {
    Dispatcher dispatcher(makeRegistry());

    SUBCASE("success") {
        auto reply = dispatcher.call("A.add", params("[2, 3]"));
        REQUIRE_FALSE(reply.error);
        CHECK_EQ(reply.result, Value::makeInteger(5));
    }

    SUBCASE("float arguments coerced") {
        auto reply = dispatcher.call("A.sqrt", params("[16]"));
        REQUIRE_FALSE(reply.error);
        CHECK_EQ(reply.result, Value::makeFloat(4.0));
    }

    SUBCASE("enum argument") {
        auto reply = dispatcher.call("A.calc", params(R"([[1, 2.5, 4], "multiply"])"));
        REQUIRE_FALSE(reply.error);
        CHECK_EQ(reply.result, Value::makeFloat(10.0));

        reply = dispatcher.call("A.calc", params(R"([[1, 2], "divide"])"));
        REQUIRE(reply.error);
        CHECK_EQ(reply.error->code, RpcError::kInvalidParams);
    }

    SUBCASE("struct argument and result") {
        auto reply = dispatcher.call("A.repeat", params(R"([{"to_repeat": "go", "count": 2, "force_uppercase": true}])"));
        REQUIRE_FALSE(reply.error);
        auto expected = parseJSON(R"({"status": "ok", "count": 2, "items": ["GO", "GO"]})");
        REQUIRE(expected);
        CHECK_EQ(reply.result, *expected);
    }

    SUBCASE("repeat counts are bounded") {
        auto reply = dispatcher.call("A.repeat_num", params("[7, 100001]"));
        REQUIRE(reply.error);
        CHECK_EQ(reply.error->code, RpcError::kServerErrorStart);
        CHECK_EQ(reply.error->message, "count 100001 exceeds the limit of 100000");

        reply = dispatcher.call("A.repeat", params(R"([{"to_repeat": "go", "count": 9223372036854775807,
                                                        "force_uppercase": false}])"));
        REQUIRE(reply.error);
        CHECK_EQ(reply.error->code, RpcError::kServerErrorStart);

        reply = dispatcher.call("A.repeat_num", params(R"([7, 3])"));
        REQUIRE_FALSE(reply.error);
        CHECK_EQ(reply.result.size(), 3);
    }

    SUBCASE("optional struct member") {
        auto reply = dispatcher.call("A.putPerson",
                                     params(R"([{"personId": "p1", "firstName": "A", "lastName": "B", "email": null}])"));
        REQUIRE_FALSE(reply.error);
        CHECK_EQ(reply.result, Value::makeString("p1"));
    }

    SUBCASE("missing required struct member") {
        auto reply = dispatcher.call("A.putPerson", params(R"([{"personId": "p1", "firstName": "A"}])"));
        REQUIRE(reply.error);
        CHECK_EQ(reply.error->code, RpcError::kInvalidParams);
        CHECK_EQ(reply.error->message, "param[0].lastName: required value is null");
    }

    SUBCASE("no params") {
        auto reply = dispatcher.call("A.say_hi", {});
        REQUIRE_FALSE(reply.error);
        REQUIRE(reply.result.find("hi") != nullptr);
        CHECK_EQ(*reply.result.find("hi"), Value::makeString("hi"));
    }

    SUBCASE("optional result") {
        auto reply = dispatcher.call("B.echo", params(R"(["return-null"])"));
        REQUIRE_FALSE(reply.error);
        CHECK(reply.result.isNil());
    }

    SUBCASE("unknown interface") {
        auto reply = dispatcher.call("UnknownIface.foo", params("[]"));
        REQUIRE(reply.error);
        CHECK_EQ(reply.error->code, RpcError::kMethodNotFound);
        CHECK_EQ(reply.error->message, "Unsupported method: UnknownIface.foo");
    }

    SUBCASE("method names are case-sensitive") {
        auto reply = dispatcher.call("B.Echo", params(R"(["hi"])"));
        REQUIRE(reply.error);
        CHECK_EQ(reply.error->code, RpcError::kMethodNotFound);
    }

    SUBCASE("conversion failure") {
        auto reply = dispatcher.call("B.echo", params("[1]"));
        REQUIRE(reply.error);
        CHECK_EQ(reply.error->code, RpcError::kInvalidParams);
        CHECK_EQ(reply.error->message.substr(0, 9), "param[0]:");
    }

    SUBCASE("wrong arity") {
        auto reply = dispatcher.call("A.add", params("[1]"));
        REQUIRE(reply.error);
        CHECK_EQ(reply.error->code, RpcError::kInvalidParams);
        CHECK_EQ(reply.error->message, "Method A.add expects 2 params but was passed 1");
    }

    SUBCASE("fractional int") {
        auto reply = dispatcher.call("A.add", params("[1.5, 2]"));
        REQUIRE(reply.error);
        CHECK_EQ(reply.error->code, RpcError::kInvalidParams);
    }

    SUBCASE("application error") {
        auto handler = server::makeInterfaceAHandler();
        handler->bind("calc", [](std::vector<double>, std::string operation) -> Reply<double> {
            return RpcError(-32001, operation, Value::makeString("detail"));
        }, Signature { { Representation::makeFloat().asArray(), Representation::makeEnum("MathOp") },
                       Representation::makeFloat() });
        auto registry = makeRegistry();
        REQUIRE(registry->registerHandler("A", handler));
        Dispatcher custom(registry);
        auto reply = custom.call("A.calc", params(R"([[], "add"])"));
        REQUIRE(reply.error);
        CHECK_EQ(*reply.error, RpcError(-32001, "add", Value::makeString("detail")));
    }
}

TEST_CASE("Dispatcher null optional arguments") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    auto model = ContractModel::parse(R"([{"type": "interface", "name": "C", "functions": [
        {"name": "opt", "params": [{"name": "s", "type": "string", "optional": true, "is_array": false}],
         "returns": {"type": "string", "optional": false, "is_array": false}},
        {"name": "arr", "params": [{"name": "n", "type": "int", "optional": true, "is_array": true}],
         "returns": {"type": "int", "optional": false, "is_array": false}}]}])", errorReporter);
    REQUIRE(model);
    auto registry = std::make_shared<HandlerRegistry>(std::move(model), errorReporter);
    auto handler = std::make_shared<Handler>();
    handler->bind("opt", [](std::optional<std::string> s) -> Reply<std::string> { return s.value_or("<none>"); });
    handler->bind("arr", [](std::vector<std::optional<int64_t>> n) -> Reply<int64_t> {
        int64_t sum = 0;
        for (const auto& i : n) {
            sum += i.value_or(100);
        }
        return sum;
    });
    REQUIRE(registry->registerHandler("C", handler));
    Dispatcher dispatcher(registry);

    SUBCASE("null scalar") {
        auto reply = dispatcher.call("C.opt", params("[null]"));
        REQUIRE_FALSE(reply.error);
        CHECK_EQ(reply.result, Value::makeString("<none>"));
    }

    SUBCASE("null array element") {
        auto reply = dispatcher.call("C.arr", params("[[1, null]]"));
        REQUIRE_FALSE(reply.error);
        CHECK_EQ(reply.result, Value::makeInteger(101));
    }

    SUBCASE("null array") {
        auto reply = dispatcher.call("C.arr", params("[null]"));
        REQUIRE_FALSE(reply.error);
        CHECK_EQ(reply.result, Value::makeInteger(0));
    }

    SUBCASE("over the wire") {
        auto response = invokeJSON(dispatcher, R"({"jsonrpc": "2.0", "id": 1, "method": "C.opt", "params": [null]})");
        REQUIRE(response.find("result") != nullptr);
        CHECK_EQ(*response.find("result"), Value::makeString("<none>"));
    }
}

TEST_CASE("Dispatcher keeps serving after a non-nullable binding is refused") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    auto model = ContractModel::parse(R"([{"type": "interface", "name": "C", "functions": [
        {"name": "opt", "params": [{"name": "s", "type": "string", "optional": true, "is_array": false}],
         "returns": {"type": "string", "optional": false, "is_array": false}}]}])", errorReporter);
    REQUIRE(model);
    auto registry = std::make_shared<HandlerRegistry>(std::move(model), errorReporter);
    auto handler = std::make_shared<Handler>();
    handler->bind("opt", [](std::optional<std::string> s) -> Reply<std::string> { return s.value_or(""); });
    REQUIRE(registry->registerHandler("C", handler));
    auto plain = std::make_shared<Handler>();
    plain->bind("opt", [](std::string s) -> Reply<std::string> { return s; });
    CHECK_FALSE(registry->registerHandler("C", plain));
    // The earlier handler stays registered.
    Dispatcher dispatcher(registry);
    auto reply = dispatcher.call("C.opt", params("[null]"));
    REQUIRE_FALSE(reply.error);
    CHECK_EQ(reply.result, Value::makeString(""));
}

TEST_CASE("Dispatcher malformed handler returns") {
    auto registry = makeRegistry(false);

    SUBCASE("wrong return count") {
        auto handler = std::make_shared<Handler>();
        Callable callable;
        callable.params = { Representation::makeString() };
        callable.returns = { Representation::makeString(), Representation::makeError() };
        callable.invoke = [](const std::vector<Value>& params) { return params; };
        handler->bindCallable("echo", std::move(callable));
        REQUIRE(registry->registerHandler("B", handler));

        Dispatcher dispatcher(registry);
        auto reply = dispatcher.call("B.echo", params(R"(["hi"])"));
        REQUIRE(reply.error);
        CHECK_EQ(reply.error->code, RpcError::kInternalError);
        CHECK_EQ(reply.error->message, "Method B.echo did not return 2 values. len(ret)=1");
    }

    SUBCASE("error slot not an RPC error") {
        auto handler = std::make_shared<Handler>();
        Callable callable;
        callable.params = { Representation::makeString() };
        callable.returns = { Representation::makeString(), Representation::makeError() };
        callable.invoke = [](const std::vector<Value>& params) {
            std::vector<Value> returns;
            returns.emplace_back(params[0]);
            returns.emplace_back(Value::makeString("oops"));
            return returns;
        };
        handler->bindCallable("echo", std::move(callable));
        REQUIRE(registry->registerHandler("B", handler));

        Dispatcher dispatcher(registry);
        auto reply = dispatcher.call("B.echo", params(R"(["hi"])"));
        REQUIRE(reply.error);
        CHECK_EQ(reply.error->code, RpcError::kInternalError);
    }

    SUBCASE("no handler") {
        Dispatcher dispatcher(registry);
        auto reply = dispatcher.call("B.echo", params(R"(["hi"])"));
        REQUIRE(reply.error);
        CHECK_EQ(reply.error->code, RpcError::kMethodNotFound);
        CHECK_EQ(reply.error->message, "No handler registered for interface: B");
    }
}

TEST_CASE("Dispatcher invoke") {
    Dispatcher dispatcher(makeRegistry());

    SUBCASE("single request") {
        auto response = invokeJSON(dispatcher, R"({"jsonrpc": "2.0", "id": "7", "method": "B.echo", "params": ["hi"]})");
        CHECK_EQ(*response.find("jsonrpc"), Value::makeString("2.0"));
        CHECK_EQ(*response.find("id"), Value::makeString("7"));
        CHECK_EQ(*response.find("result"), Value::makeString("hi"));
        CHECK(response.find("error") == nullptr);
    }

    SUBCASE("integer id echoed") {
        auto response = invokeJSON(dispatcher, R"({"jsonrpc": "2.0", "id": 12, "method": "A.add", "params": [1, 1]})");
        CHECK_EQ(*response.find("id"), Value::makeInteger(12));
        CHECK_EQ(*response.find("result"), Value::makeInteger(2));
    }

    SUBCASE("null result is present") {
        auto response = invokeJSON(dispatcher,
                                   R"({"jsonrpc": "2.0", "id": "1", "method": "B.echo", "params": ["return-null"]})");
        REQUIRE(response.find("result") != nullptr);
        CHECK(response.find("result")->isNil());
        CHECK(response.find("error") == nullptr);
    }

    SUBCASE("single param not in an array") {
        auto response = invokeJSON(dispatcher, R"({"jsonrpc": "2.0", "id": "1", "method": "B.echo", "params": "solo"})");
        CHECK_EQ(*response.find("result"), Value::makeString("solo"));
    }

    SUBCASE("error response") {
        auto response = invokeJSON(dispatcher, R"({"jsonrpc": "2.0", "id": "3", "method": "B.echo", "params": [3]})");
        CHECK_EQ(errorCode(response), RpcError::kInvalidParams);
        CHECK_EQ(*response.find("id"), Value::makeString("3"));
        CHECK(response.find("result") == nullptr);
    }

    SUBCASE("batch keeps positions") {
        auto response = invokeJSON(dispatcher, R"([{"jsonrpc": "2.0", "id": "1", "method": "B.echo", "params": ["hi"]},
                                                   {"jsonrpc": "2.0", "id": "2", "method": "X.nope"}])");
        REQUIRE(response.isArray());
        REQUIRE_EQ(response.size(), 2);
        const Value& first = response.getArray()[0];
        CHECK_EQ(*first.find("id"), Value::makeString("1"));
        CHECK_EQ(*first.find("result"), Value::makeString("hi"));
        const Value& second = response.getArray()[1];
        CHECK_EQ(*second.find("id"), Value::makeString("2"));
        CHECK_EQ(errorCode(second), RpcError::kMethodNotFound);
    }

    SUBCASE("batch with duplicate ids") {
        auto response = invokeJSON(dispatcher, R"([{"id": "1", "method": "A.add", "params": [1, 2]},
                                                   {"id": "1", "method": "A.add", "params": [3, 4]}])");
        REQUIRE_EQ(response.size(), 2);
        CHECK_EQ(*response.getArray()[0].find("result"), Value::makeInteger(3));
        CHECK_EQ(*response.getArray()[1].find("result"), Value::makeInteger(7));
    }

    SUBCASE("empty batch") {
        auto response = invokeJSON(dispatcher, "[]");
        REQUIRE(response.isArray());
        CHECK_EQ(response.size(), 0);
    }

    SUBCASE("parse errors") {
        for (const char* payload : { "", "   ", "\"just a string\"", "42", "{\"id\": ", "[1, 2]",
                                     "{\"id\": {}, \"method\": \"B.echo\"}" }) {
            auto response = invokeJSON(dispatcher, payload);
            REQUIRE(response.isObject());
            CHECK_EQ(errorCode(response), RpcError::kParseError);
            REQUIRE(response.find("id") != nullptr);
            CHECK(response.find("id")->isNil());
        }
    }

    SUBCASE("leading whitespace") {
        auto response = invokeJSON(dispatcher, " \n\t{\"id\": \"1\", \"method\": \"A.add\", \"params\": [2, 2]}");
        CHECK_EQ(*response.find("result"), Value::makeInteger(4));
    }

    SUBCASE("absent params") {
        auto response = invokeJSON(dispatcher, R"({"id": "1", "method": "A.say_hi"})");
        CHECK_EQ(errorCode(response), RpcError::kInvalidParams);

        response = invokeJSON(dispatcher, R"({"id": "1", "method": "A.say_hi", "params": []})");
        REQUIRE(response.find("result") != nullptr);
        CHECK_EQ(*response.find("result")->find("hi"), Value::makeString("hi"));
    }
}

TEST_CASE("Dispatcher introspection") {
    auto model = parseConformSchema();
    Value expected = encodeElements(model->rawElements());

    SUBCASE("without handlers") {
        Dispatcher dispatcher(makeRegistry(false));
        auto response = invokeJSON(dispatcher, R"({"jsonrpc": "2.0", "id": "123", "method": "barrister-idl", "params": ""})");
        CHECK_EQ(*response.find("id"), Value::makeString("123"));
        REQUIRE(response.find("result") != nullptr);
        CHECK_EQ(*response.find("result"), expected);

        std::vector<Element> decoded;
        std::string errorMessage;
        REQUIRE(decodeElements(*response.find("result"), decoded, errorMessage));
        CHECK(decoded == model->rawElements());
    }

    SUBCASE("in a batch") {
        Dispatcher dispatcher(makeRegistry());
        auto response = invokeJSON(dispatcher, R"([{"id": 1, "method": "barrister-idl"}, {"id": 2, "method": "barrister-idl"}])");
        REQUIRE_EQ(response.size(), 2);
        CHECK_EQ(*response.getArray()[0].find("result"), expected);
        CHECK_EQ(*response.getArray()[1].find("result"), expected);
    }
}

TEST_CASE("Dispatcher force ASCII") {
    Dispatcher dispatcher(makeRegistry(), true);
    auto payload = dispatcher.invoke("{\"id\": \"1\", \"method\": \"B.echo\", \"params\": [\"caf\xc3\xa9\"]}");
    CHECK_NE(payload.find("\\u00E9"), std::string::npos);
    for (auto c : payload) {
        CHECK(static_cast<unsigned char>(c) < 0x80);
    }
}

} // namespace idlrpc
