#include "server/ConformanceHandlers.hpp"

#include "idlrpc/Handler.hpp"
#include "idlrpc/Representation.hpp"
#include "idlrpc/RpcError.hpp"
#include "idlrpc/Value.hpp"

#include "fmt/format.h"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace {

using idlrpc::Reply;
using idlrpc::Representation;
using idlrpc::Signature;
using idlrpc::Value;

Reply<double> calc(std::vector<double> nums, std::string operation) {
    if (operation == "add") {
        double sum = 0.0;
        for (auto num : nums) {
            sum += num;
        }
        return sum;
    }
    if (operation == "multiply") {
        double product = 1.0;
        for (auto num : nums) {
            product *= num;
        }
        return product;
    }
    return idlrpc::RpcError(idlrpc::RpcError::kServerErrorStart, fmt::format("Unknown operation: {}", operation));
}

std::optional<idlrpc::RpcError> checkCount(int64_t count) {
    if (count > server::kMaxRepeatCount) {
        return idlrpc::RpcError(idlrpc::RpcError::kServerErrorStart,
                                fmt::format("count {} exceeds the limit of {}", count, server::kMaxRepeatCount));
    }
    return std::nullopt;
}

// Echoes req1.to_repeat req1.count times, upper cased if req1.force_uppercase.
Reply<Value> repeat(Value req1) {
    std::string toRepeat = req1.find("to_repeat")->getString();
    if (req1.find("force_uppercase")->getBool()) {
        for (auto& c : toRepeat) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }

    int64_t count = req1.find("count")->getInteger();
    if (auto error = checkCount(count)) {
        return *error;
    }
    auto items = Value::makeArray();
    for (int64_t i = 0; i < count; ++i) {
        items.push(Value::makeString(toRepeat));
    }

    auto response = Value::makeObject();
    response.set("status", Value::makeString("ok"));
    response.set("count", Value::makeInteger(count));
    response.set("items", std::move(items));
    return response;
}

} // namespace

namespace server {

std::shared_ptr<idlrpc::Handler> makeInterfaceAHandler() {
    auto handler = std::make_shared<idlrpc::Handler>();

    handler->bind("add", [](int64_t a, int64_t b) -> Reply<int64_t> { return a + b; });

    handler->bind("calc", calc,
                  Signature { { Representation::makeFloat().asArray(), Representation::makeEnum("MathOp") },
                              Representation::makeFloat() });

    handler->bind("sqrt", [](double a) -> Reply<double> { return std::sqrt(a); });

    handler->bind("repeat", repeat,
                  Signature { { Representation::makeStruct("RepeatRequest") },
                              Representation::makeStruct("RepeatResponse") });

    handler->bind("say_hi", []() -> Reply<Value> {
        auto hi = Value::makeObject();
        hi.set("hi", Value::makeString("hi"));
        return hi;
    }, Signature { {}, Representation::makeStruct("HiResponse") });

    handler->bind("repeat_num", [](int64_t num, int64_t count) -> Reply<std::vector<int64_t>> {
        if (auto error = checkCount(count)) {
            return *error;
        }
        std::vector<int64_t> nums;
        for (int64_t i = 0; i < count; ++i) {
            nums.emplace_back(num);
        }
        return nums;
    });

    // Invoked with a null email to exercise optional enforcement.
    handler->bind("putPerson", [](Value p) -> Reply<std::string> { return p.find("personId")->getString(); },
                  Signature { { Representation::makeStruct("Person") }, Representation::makeString() });

    return handler;
}

std::shared_ptr<idlrpc::Handler> makeInterfaceBHandler() {
    auto handler = std::make_shared<idlrpc::Handler>();
    handler->bind("echo", [](std::string s) -> Reply<std::optional<std::string>> {
        if (s == "return-null") {
            return Reply<std::optional<std::string>>(std::optional<std::string>());
        }
        return Reply<std::optional<std::string>>(std::optional<std::string>(std::move(s)));
    });
    return handler;
}

} // namespace server
