#include "idlrpc/Client.hpp"

#include "idlrpc/ConformTestFixture.hpp"
#include "idlrpc/Dispatcher.hpp"
#include "idlrpc/ErrorReporter.hpp"
#include "idlrpc/HandlerRegistry.hpp"
#include "idlrpc/IdGenerator.hpp"
#include "idlrpc/JSONCodec.hpp"
#include "server/ConformanceHandlers.hpp"

#include "doctest/doctest.h"

#include <cctype>
#include <set>

namespace idlrpc {

namespace {

std::shared_ptr<Dispatcher> makeDispatcher() {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    auto registry = std::make_shared<HandlerRegistry>(parseConformSchema(), errorReporter);
    REQUIRE(registry->registerHandler("A", server::makeInterfaceAHandler()));
    REQUIRE(registry->registerHandler("B", server::makeInterfaceBHandler()));
    return std::make_shared<Dispatcher>(registry);
}

// Records each request and answers with a fixed payload, or fails.
class CannedTransport : public Transport {
public:
    explicit CannedTransport(std::optional<std::string> reply): m_reply(std::move(reply)) { }
    virtual ~CannedTransport() = default;

    std::optional<std::string> send(std::string_view request, std::string& errorMessage) override {
        requests.emplace_back(request);
        if (!m_reply) {
            errorMessage = "connection refused";
        }
        return m_reply;
    }

    std::vector<std::string> requests;

private:
    std::optional<std::string> m_reply;
};

} // namespace

TEST_CASE("IdGenerator") {
    SUBCASE("random ids") {
        RandomIdGenerator generator(1234);
        std::set<std::string> ids;
        for (int i = 0; i < 100; ++i) {
            auto id = generator.nextId();
            REQUIRE_EQ(id.size(), RandomIdGenerator::kIdLength);
            for (auto c : id) {
                CHECK((std::isdigit(static_cast<unsigned char>(c)) || (c >= 'a' && c <= 'z')));
            }
            ids.insert(id);
        }
        CHECK_EQ(ids.size(), 100);
    }

    SUBCASE("seeded generators repeat") {
        RandomIdGenerator a(99);
        RandomIdGenerator b(99);
        CHECK_EQ(a.nextId(), b.nextId());
    }

    SUBCASE("sequential ids") {
        SequentialIdGenerator generator;
        CHECK_EQ(generator.nextId(), "1");
        CHECK_EQ(generator.nextId(), "2");
    }
}

TEST_CASE("Client over loopback") {
    Client client(std::make_shared<LoopbackTransport>(makeDispatcher()), std::make_unique<SequentialIdGenerator>());

    SUBCASE("call") {
        std::vector<Value> params;
        params.emplace_back(Value::makeInteger(40));
        params.emplace_back(Value::makeInteger(2));
        auto reply = client.call("A.add", std::move(params));
        REQUIRE_FALSE(reply.error);
        CHECK_EQ(reply.result, Value::makeInteger(42));
    }

    SUBCASE("repeat_num") {
        std::vector<Value> params;
        params.emplace_back(Value::makeInteger(7));
        params.emplace_back(Value::makeInteger(3));
        auto reply = client.call("A.repeat_num", std::move(params));
        REQUIRE_FALSE(reply.error);
        auto expected = parseJSON("[7, 7, 7]");
        REQUIRE(expected);
        CHECK_EQ(reply.result, *expected);
    }

    SUBCASE("server error") {
        auto reply = client.call("A.nope", {});
        REQUIRE(reply.error);
        CHECK_EQ(reply.error->code, RpcError::kMethodNotFound);
    }

    SUBCASE("empty sum") {
        std::vector<Value> params;
        params.emplace_back(Value::makeArray());
        params.emplace_back(Value::makeString("add"));
        auto reply = client.call("A.calc", std::move(params));
        REQUIRE_FALSE(reply.error);
        CHECK_EQ(reply.result, Value::makeFloat(0.0));
    }

    SUBCASE("batch") {
        std::vector<Request> batch;
        batch.emplace_back(client.makeRequest("B.echo", { Value::makeString("one") }));
        batch.emplace_back(Request { Value(), "B.echo", Value::makeArray({ Value::makeString("two") }) });
        batch.emplace_back(client.makeRequest("B.nope", {}));
        auto responses = client.callBatch(std::move(batch));
        REQUIRE_EQ(responses.size(), 3);
        CHECK_EQ(responses[0].id, Value::makeString("1"));
        CHECK_EQ(responses[0].result, Value::makeString("one"));
        CHECK_EQ(responses[1].id, Value::makeString("3"));
        CHECK_EQ(responses[1].result, Value::makeString("two"));
        REQUIRE(responses[2].error);
        CHECK_EQ(responses[2].error->code, RpcError::kMethodNotFound);
    }

    SUBCASE("introspection") {
        auto reply = client.call(Dispatcher::kIntrospectionMethod, {});
        REQUIRE_FALSE(reply.error);
        CHECK_EQ(reply.result.size(), 11);
    }
}

TEST_CASE("Client failures") {
    SUBCASE("transport error") {
        auto transport = std::make_shared<CannedTransport>(std::nullopt);
        Client client(transport, std::make_unique<SequentialIdGenerator>());
        auto reply = client.call("B.echo", { Value::makeString("hi") });
        REQUIRE(reply.error);
        CHECK_EQ(reply.error->code, RpcError::kInternalError);
        CHECK_NE(reply.error->message.find("connection refused"), std::string::npos);

        auto responses = client.callBatch({ client.makeRequest("B.echo", {}) });
        REQUIRE_EQ(responses.size(), 1);
        REQUIRE(responses[0].error);
        CHECK_EQ(responses[0].error->code, RpcError::kInternalError);
    }

    SUBCASE("unparseable response") {
        auto transport = std::make_shared<CannedTransport>(std::string("<html>"));
        Client client(transport, std::make_unique<SequentialIdGenerator>());
        auto reply = client.call("B.echo", { Value::makeString("hi") });
        REQUIRE(reply.error);
        CHECK_EQ(reply.error->code, RpcError::kInternalError);
    }

    SUBCASE("malformed error object") {
        auto transport = std::make_shared<CannedTransport>(std::string(R"({"id": "1", "error": "bad"})"));
        Client client(transport, std::make_unique<SequentialIdGenerator>());
        auto reply = client.call("B.echo", { Value::makeString("hi") });
        REQUIRE(reply.error);
        CHECK_EQ(reply.error->code, RpcError::kInternalError);
    }

    SUBCASE("batch answered with one error") {
        auto transport = std::make_shared<CannedTransport>(
            std::string(R"({"jsonrpc": "2.0", "id": null, "error": {"code": -32700, "message": "bad"}})"));
        Client client(transport, std::make_unique<SequentialIdGenerator>());
        auto responses = client.callBatch({ client.makeRequest("B.echo", {}) });
        REQUIRE_EQ(responses.size(), 1);
        REQUIRE(responses[0].error);
        CHECK_EQ(responses[0].error->code, RpcError::kParseError);
    }

    SUBCASE("request payload") {
        auto transport = std::make_shared<CannedTransport>(std::string(R"({"id": "1", "result": "x"})"));
        Client client(transport, std::make_unique<SequentialIdGenerator>(), true);
        auto reply = client.call("B.echo", { Value::makeString("caf\xc3\xa9") });
        REQUIRE_FALSE(reply.error);
        CHECK_EQ(reply.result, Value::makeString("x"));
        REQUIRE_EQ(transport->requests.size(), 1);
        CHECK_EQ(transport->requests[0], R"({"jsonrpc":"2.0","id":"1","method":"B.echo","params":["caf\u00E9"]})");
    }
}

} // namespace idlrpc
