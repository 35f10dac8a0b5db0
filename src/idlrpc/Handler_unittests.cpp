#include "idlrpc/Handler.hpp"

#include "doctest/doctest.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace idlrpc {

namespace {

Reply<int64_t> negate(int64_t a) { return -a; }

struct Counter {
    Reply<int64_t> increment(int64_t by) {
        total += by;
        return total;
    }
    int64_t total = 0;
};

} // namespace

TEST_CASE("capitalize") {
    CHECK_EQ(capitalize("echo"), "Echo");
    CHECK_EQ(capitalize("Echo"), "Echo");
    CHECK_EQ(capitalize("say_hi"), "Say_hi");
    CHECK_EQ(capitalize(""), "");
}

TEST_CASE("Handler derived representations") {
    Handler handler;
    handler.bind("join", [](std::vector<std::string> parts, std::optional<std::string> separator, bool trailing,
                            double weight, Value extra) -> Reply<std::string> {
        std::string joined;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0 && separator) {
                joined += *separator;
            }
            joined += parts[i];
        }
        if (trailing && separator) {
            joined += *separator;
        }
        if (weight > 1.0 && extra.isString()) {
            joined += extra.getString();
        }
        return joined;
    });

    const Callable* join = handler.find("join");
    REQUIRE(join != nullptr);
    CHECK_EQ(join, handler.find("Join"));
    REQUIRE_EQ(join->params.size(), 5);
    CHECK_EQ(join->params[0], Representation::makeString().asArray());
    CHECK_EQ(join->params[1], Representation::makeString().asNullable());
    CHECK(join->params[1].nullable);
    CHECK_FALSE(join->params[0].elementNullable);
    CHECK_EQ(join->params[2], Representation::makeBool());
    CHECK_EQ(join->params[3], Representation::makeFloat());
    CHECK_EQ(join->params[4], Representation::makeAny());
    REQUIRE_EQ(join->returns.size(), 2);
    CHECK_EQ(join->returns[0], Representation::makeString());
    CHECK_EQ(join->returns[1], Representation::makeError());

    SUBCASE("invoke") {
        std::vector<Value> params;
        auto parts = Value::makeArray();
        parts.push(Value::makeString("a"));
        parts.push(Value::makeString("b"));
        params.emplace_back(std::move(parts));
        params.emplace_back(Value::makeString(","));
        params.emplace_back(Value::makeBool(true));
        params.emplace_back(Value::makeFloat(2.0));
        params.emplace_back(Value::makeString("!"));
        auto returns = join->invoke(params);
        REQUIRE_EQ(returns.size(), 2);
        CHECK_EQ(returns[0], Value::makeString("a,b,!"));
        CHECK(returns[1].isNil());
    }

    SUBCASE("optional parameter passed as nil") {
        std::vector<Value> params;
        params.emplace_back(Value::makeArray());
        params.emplace_back(Value::makeNil());
        params.emplace_back(Value::makeBool(false));
        params.emplace_back(Value::makeFloat(0.5));
        params.emplace_back(Value::makeNil());
        auto returns = join->invoke(params);
        REQUIRE_EQ(returns.size(), 2);
        CHECK_EQ(returns[0], Value::makeString(""));
    }

    SUBCASE("wrong arity yields no returns") {
        CHECK(join->invoke(std::vector<Value>()).empty());
    }

    CHECK(handler.find("split") == nullptr);
    CHECK_EQ(handler.size(), 1);
}

TEST_CASE("Handler nullable array elements") {
    Handler handler;
    handler.bind("count", [](std::vector<std::optional<int64_t>> values) -> Reply<int64_t> {
        int64_t present = 0;
        for (const auto& v : values) {
            if (v) {
                ++present;
            }
        }
        return present;
    });
    const Callable* count = handler.find("count");
    REQUIRE(count != nullptr);
    CHECK_EQ(count->params[0], Representation::makeInt().asNullable().asArray());
    CHECK(count->params[0].elementNullable);
    CHECK(count->params[0].elementRepresentation().nullable);
    CHECK_EQ(count->params[0].toString(), "[]?int");
    auto values = Value::makeArray();
    values.push(Value::makeInteger(1));
    values.push(Value::makeNil());
    auto returns = count->invoke({ values });
    REQUIRE_EQ(returns.size(), 2);
    CHECK_EQ(returns[0], Value::makeInteger(1));
}

TEST_CASE("Handler callables") {
    Handler handler;

    SUBCASE("function pointer") {
        handler.bind("negate", negate);
        const Callable* callable = handler.find("negate");
        REQUIRE(callable != nullptr);
        auto returns = callable->invoke({ Value::makeInteger(5) });
        REQUIRE_EQ(returns.size(), 2);
        CHECK_EQ(returns[0], Value::makeInteger(-5));
    }

    SUBCASE("stateful object") {
        auto counter = std::make_shared<Counter>();
        handler.bind("increment", [counter](int64_t by) { return counter->increment(by); });
        const Callable* callable = handler.find("increment");
        REQUIRE(callable != nullptr);
        callable->invoke({ Value::makeInteger(2) });
        auto returns = callable->invoke({ Value::makeInteger(3) });
        CHECK_EQ(returns[0], Value::makeInteger(5));
        CHECK_EQ(counter->total, 5);
    }

    SUBCASE("error reply") {
        handler.bind("fail", [](std::string reason) -> Reply<std::string> {
            return RpcError(RpcError::kServerErrorStart, reason);
        });
        auto returns = handler.find("fail")->invoke({ Value::makeString("nope") });
        REQUIRE_EQ(returns.size(), 2);
        CHECK(returns[0].isString());
        auto error = RpcError::fromValue(returns[1]);
        REQUIRE(error);
        CHECK_EQ(error->code, -32000);
        CHECK_EQ(error->message, "nope");
    }

    SUBCASE("explicit signature") {
        handler.bind("name", [](Value person) -> Reply<std::string> { return person.find("name")->getString(); },
                     Signature { { Representation::makeStruct("Person") }, Representation::makeString() });
        const Callable* callable = handler.find("Name");
        REQUIRE(callable != nullptr);
        REQUIRE_EQ(callable->params.size(), 1);
        CHECK_EQ(callable->params[0], Representation::makeStruct("Person"));
        CHECK_EQ(callable->params[0].toString(), "struct Person");
    }

    SUBCASE("rebinding replaces") {
        handler.bind("f", []() -> Reply<int64_t> { return 1; });
        handler.bind("F", []() -> Reply<int64_t> { return 2; });
        CHECK_EQ(handler.size(), 1);
        CHECK_EQ(handler.find("f")->invoke({})[0], Value::makeInteger(2));
    }
}

} // namespace idlrpc
