#include "idlrpc/HandlerRegistry.hpp"

#include "idlrpc/ConformTestFixture.hpp"
#include "idlrpc/ErrorReporter.hpp"
#include "idlrpc/Handler.hpp"
#include "server/ConformanceHandlers.hpp"

#include "doctest/doctest.h"

#include <optional>
#include <string>

namespace idlrpc {

namespace {

std::shared_ptr<Handler> makeEchoHandler() {
    auto handler = std::make_shared<Handler>();
    handler->bind("echo", [](std::string s) -> Reply<std::optional<std::string>> {
        return Reply<std::optional<std::string>>(std::optional<std::string>(s));
    });
    return handler;
}

} // namespace

TEST_CASE_FIXTURE(ConformTestFixture, "HandlerRegistry accepts matching handlers") {
    HandlerRegistry registry(sharedModel(), errorReporter());

    SUBCASE("conformance handlers") {
        CHECK(registry.registerHandler("A", server::makeInterfaceAHandler()));
        CHECK(registry.registerHandler("B", server::makeInterfaceBHandler()));
        CHECK(errorReporter()->ok());
        CHECK_EQ(registry.size(), 2);
        CHECK(registry.lookup("A") != nullptr);
        CHECK(registry.lookup("C") == nullptr);
    }

    SUBCASE("replacement") {
        auto first = makeEchoHandler();
        auto second = makeEchoHandler();
        REQUIRE(registry.registerHandler("B", first));
        REQUIRE(registry.registerHandler("B", second));
        CHECK_EQ(registry.lookup("B"), second.get());
        CHECK_EQ(registry.size(), 1);
    }

    SUBCASE("any representation") {
        auto handler = std::make_shared<Handler>();
        handler->bind("echo", [](Value s) -> Reply<Value> { return s; });
        CHECK(registry.registerHandler("B", handler));
    }

    SUBCASE("enum as string") {
        auto handler = server::makeInterfaceAHandler();
        handler->bind("calc", [](std::vector<double> nums, std::string) -> Reply<double> {
            return nums.empty() ? 0.0 : nums[0];
        });
        CHECK(registry.registerHandler("A", handler));
    }
}

TEST_CASE_FIXTURE(ConformTestFixture, "HandlerRegistry rejects mismatched handlers") {
    HandlerRegistry registry(sharedModel(), errorReporter());

    SUBCASE("unknown interface") {
        CHECK_FALSE(registry.registerHandler("C", makeEchoHandler()));
        CHECK(errorReporter()->hasErrorOfKind(ErrorReporter::kRegistrationError));
        CHECK_EQ(registry.size(), 0);
    }

    SUBCASE("null handler") {
        CHECK_FALSE(registry.registerHandler("B", nullptr));
        CHECK(errorReporter()->hasErrorOfKind(ErrorReporter::kRegistrationError));
    }

    SUBCASE("missing function") {
        auto handler = std::make_shared<Handler>();
        handler->bind("shout", [](std::string s) -> Reply<std::string> { return s; });
        CHECK_FALSE(registry.registerHandler("B", handler));
        REQUIRE_EQ(errorReporter()->errorCount(), 1);
        CHECK_NE(errorReporter()->errors()[0].message.find("Echo"), std::string::npos);
        CHECK(registry.lookup("B") == nullptr);
    }

    SUBCASE("wrong arity") {
        auto handler = std::make_shared<Handler>();
        handler->bind("echo", [](std::string s, std::string t) -> Reply<std::string> { return s + t; });
        CHECK_FALSE(registry.registerHandler("B", handler));
        CHECK(errorReporter()->hasErrorOfKind(ErrorReporter::kRegistrationError));
    }

    SUBCASE("wrong parameter type") {
        auto handler = std::make_shared<Handler>();
        handler->bind("echo", [](int64_t s) -> Reply<std::string> { return std::to_string(s); });
        CHECK_FALSE(registry.registerHandler("B", handler));
        REQUIRE_EQ(errorReporter()->errorCount(), 1);
        CHECK_EQ(errorReporter()->errors()[0].message.substr(0, 26), "B.Echo param[0] has invali");
    }

    SUBCASE("wrong return type") {
        auto handler = std::make_shared<Handler>();
        handler->bind("echo", [](std::string s) -> Reply<int64_t> { return static_cast<int64_t>(s.size()); });
        CHECK_FALSE(registry.registerHandler("B", handler));
        REQUIRE_EQ(errorReporter()->errorCount(), 1);
        CHECK_NE(errorReporter()->errors()[0].message.find("return value[0]"), std::string::npos);
    }

    SUBCASE("array where scalar declared") {
        auto handler = std::make_shared<Handler>();
        handler->bind("echo", [](std::vector<std::string> s) -> Reply<std::string> { return s.front(); });
        CHECK_FALSE(registry.registerHandler("B", handler));
    }

    SUBCASE("wrong struct") {
        auto handler = server::makeInterfaceAHandler();
        handler->bind("putPerson", [](Value p) -> Reply<std::string> { return p.toString(); },
                      Signature { { Representation::makeStruct("RepeatRequest") }, Representation::makeString() });
        CHECK_FALSE(registry.registerHandler("A", handler));
        CHECK(errorReporter()->hasErrorOfKind(ErrorReporter::kRegistrationError));
    }

    SUBCASE("error slot must be an error") {
        auto handler = std::make_shared<Handler>();
        Callable callable;
        callable.params = { Representation::makeString() };
        callable.returns = { Representation::makeString(), Representation::makeString() };
        callable.invoke = [](const std::vector<Value>& params) { return params; };
        handler->bindCallable("echo", std::move(callable));
        CHECK_FALSE(registry.registerHandler("B", handler));
    }

    SUBCASE("must return two values") {
        auto handler = std::make_shared<Handler>();
        Callable callable;
        callable.params = { Representation::makeString() };
        callable.returns = { Representation::makeString() };
        callable.invoke = [](const std::vector<Value>& params) { return params; };
        handler->bindCallable("echo", std::move(callable));
        CHECK_FALSE(registry.registerHandler("B", handler));
    }
}

TEST_CASE("HandlerRegistry optional parameters need nullable representations") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    auto model = ContractModel::parse(R"([{"type": "interface", "name": "C", "functions": [
        {"name": "opt", "params": [{"name": "s", "type": "string", "optional": true, "is_array": false}],
         "returns": {"type": "string", "optional": false, "is_array": false}},
        {"name": "arr", "params": [{"name": "n", "type": "int", "optional": true, "is_array": true}],
         "returns": {"type": "int", "optional": false, "is_array": false}}]}])", errorReporter);
    REQUIRE(model);
    HandlerRegistry registry(std::move(model), errorReporter);

    SUBCASE("plain scalar") {
        auto handler = std::make_shared<Handler>();
        handler->bind("opt", [](std::string s) -> Reply<std::string> { return s; });
        handler->bind("arr", [](std::vector<std::optional<int64_t>> n) -> Reply<int64_t> {
            return static_cast<int64_t>(n.size());
        });
        CHECK_FALSE(registry.registerHandler("C", handler));
        REQUIRE_EQ(errorReporter->errorCount(), 1);
        CHECK_EQ(errorReporter->errors()[0].kind, ErrorReporter::kRegistrationError);
        CHECK_NE(errorReporter->errors()[0].message.find("C.Opt param[0]"), std::string::npos);
        CHECK_NE(errorReporter->errors()[0].message.find("accepts null"), std::string::npos);
    }

    SUBCASE("plain array elements") {
        auto handler = std::make_shared<Handler>();
        handler->bind("opt", [](std::optional<std::string> s) -> Reply<std::string> { return s.value_or(""); });
        handler->bind("arr", [](std::vector<int64_t> n) -> Reply<int64_t> { return static_cast<int64_t>(n.size()); });
        CHECK_FALSE(registry.registerHandler("C", handler));
        REQUIRE_EQ(errorReporter->errorCount(), 1);
        CHECK_NE(errorReporter->errors()[0].message.find("C.Arr param[0]"), std::string::npos);
        CHECK_NE(errorReporter->errors()[0].message.find("null elements"), std::string::npos);
    }

    SUBCASE("nullable types") {
        auto handler = std::make_shared<Handler>();
        handler->bind("opt", [](std::optional<std::string> s) -> Reply<std::string> { return s.value_or(""); });
        handler->bind("arr", [](std::vector<std::optional<int64_t>> n) -> Reply<int64_t> {
            return static_cast<int64_t>(n.size());
        });
        CHECK(registry.registerHandler("C", handler));
        CHECK(errorReporter->ok());
    }

    SUBCASE("any representation") {
        auto handler = std::make_shared<Handler>();
        handler->bind("opt", [](Value s) -> Reply<std::string> { return s.toString(); });
        handler->bind("arr", [](Value n) -> Reply<int64_t> { return static_cast<int64_t>(n.isNil() ? 0 : n.size()); });
        CHECK(registry.registerHandler("C", handler));
    }
}

TEST_CASE("HandlerRegistry undeclared schema types") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    auto model = ContractModel::parse(R"([{"type": "interface", "name": "W", "functions": [
        {"name": "make", "params": [],
         "returns": {"name": "", "type": "Widget", "optional": false, "is_array": false}}]}])", errorReporter);
    REQUIRE(model);
    HandlerRegistry registry(std::move(model), errorReporter);

    auto handler = std::make_shared<Handler>();
    handler->bind("make", []() -> Reply<Value> { return Value::makeObject(); });
    CHECK_FALSE(registry.registerHandler("W", handler));
    CHECK(errorReporter->hasErrorOfKind(ErrorReporter::kSchemaError));
}

} // namespace idlrpc
