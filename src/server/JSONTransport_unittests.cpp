#include "server/JSONTransport.hpp"

#include "idlrpc/ConformTestFixture.hpp"
#include "idlrpc/Dispatcher.hpp"
#include "idlrpc/ErrorReporter.hpp"
#include "idlrpc/HandlerRegistry.hpp"
#include "server/ConformanceHandlers.hpp"

#include "doctest/doctest.h"
#include "fmt/format.h"

#include <stdio.h>
#include <string>

namespace server {

namespace {

std::shared_ptr<idlrpc::Dispatcher> makeDispatcher() {
    auto errorReporter = std::make_shared<idlrpc::ErrorReporter>(true);
    auto registry = std::make_shared<idlrpc::HandlerRegistry>(idlrpc::parseConformSchema(), errorReporter);
    REQUIRE(registry->registerHandler("A", makeInterfaceAHandler()));
    REQUIRE(registry->registerHandler("B", makeInterfaceBHandler()));
    return std::make_shared<idlrpc::Dispatcher>(registry);
}

std::string frame(const std::string& payload) {
    return fmt::format("Content-Length: {}\r\n\r\n{}", payload.size(), payload);
}

// Runs the transport over |input| and returns the exit code, with everything written in |output|.
int runTransport(const std::string& input, std::string& output) {
    FILE* inputFile = tmpfile();
    FILE* outputFile = tmpfile();
    REQUIRE(inputFile != nullptr);
    REQUIRE(outputFile != nullptr);
    fwrite(input.data(), 1, input.size(), inputFile);
    rewind(inputFile);

    JSONTransport transport(inputFile, outputFile);
    transport.setDispatcher(makeDispatcher());
    int exitCode = transport.runLoop();

    rewind(outputFile);
    output.clear();
    char buffer[1024];
    size_t read = 0;
    while ((read = fread(buffer, 1, sizeof(buffer), outputFile)) > 0) {
        output.append(buffer, read);
    }
    fclose(inputFile);
    fclose(outputFile);
    return exitCode;
}

} // namespace

TEST_CASE("JSONTransport framing") {
    SUBCASE("one request") {
        std::string output;
        CHECK_EQ(runTransport(frame(R"({"jsonrpc":"2.0","id":"1","method":"A.add","params":[1,2]})"), output), 0);
        CHECK_EQ(output, frame(R"({"jsonrpc":"2.0","id":"1","result":3})"));
    }

    SUBCASE("several requests and extra headers") {
        std::string input = frame(R"({"id":"1","method":"B.echo","params":["a"]})");
        input += "Content-Type: application/vscode-jsonrpc; charset=utf-8\r\n";
        input += frame(R"({"id":"2","method":"B.echo","params":["b"]})");
        std::string output;
        CHECK_EQ(runTransport(input, output), 0);
        CHECK_EQ(output, frame(R"({"jsonrpc":"2.0","id":"1","result":"a"})")
                     + frame(R"({"jsonrpc":"2.0","id":"2","result":"b"})"));
    }

    SUBCASE("parse error keeps serving") {
        std::string input = frame("{not json") + frame(R"({"id":"2","method":"B.echo","params":["b"]})");
        std::string output;
        CHECK_EQ(runTransport(input, output), 0);
        CHECK_NE(output.find("-32700"), std::string::npos);
        CHECK_NE(output.find(R"("result":"b")"), std::string::npos);
    }

    SUBCASE("empty input") {
        std::string output;
        CHECK_EQ(runTransport("", output), 0);
        CHECK(output.empty());
    }

    SUBCASE("oversized payload") {
        std::string output;
        CHECK_EQ(runTransport(fmt::format("Content-Length: {}\r\n\r\n", JSONTransport::kMaxContentLength + 1), output),
                 -1);
        CHECK(output.empty());
    }

    SUBCASE("truncated payload") {
        std::string output;
        CHECK_EQ(runTransport("Content-Length: 100\r\n\r\n{\"id\":", output), -1);
    }
}

} // namespace server
