#include "idlrpc/ContractModel.hpp"

#include "idlrpc/ConformTestFixture.hpp"
#include "idlrpc/ErrorReporter.hpp"
#include "idlrpc/JSONCodec.hpp"
#include "idlrpc/Schema.hpp"

#include "doctest/doctest.h"

#include <filesystem>
#include <fstream>
#include <limits>

namespace idlrpc {

namespace {

std::unique_ptr<ContractModel> parseSuppressed(std::string_view json, std::shared_ptr<ErrorReporter>& errorReporter) {
    errorReporter = std::make_shared<ErrorReporter>(true);
    return ContractModel::parse(json, errorReporter);
}

} // namespace

TEST_CASE("ContractModel conformance schema") {
    auto model = parseConformSchema();
    REQUIRE(model);

    SUBCASE("elements in schema order") {
        const auto& elements = model->rawElements();
        REQUIRE_EQ(elements.size(), 11);
        REQUIRE(std::holds_alternative<schema::Comment>(elements[0]));
        CHECK_EQ(std::get<schema::Comment>(elements[0]).value.substr(0, 24), "Barrister conformance ID");

        REQUIRE(std::holds_alternative<schema::Enum>(elements[1]));
        const auto& status = std::get<schema::Enum>(elements[1]);
        CHECK_EQ(status.name, "Status");
        REQUIRE_EQ(status.values.size(), 2);
        CHECK_EQ(status.values[0].value, "ok");
        CHECK_EQ(status.values[1].value, "err");

        REQUIRE(std::holds_alternative<schema::Enum>(elements[2]));
        const auto& mathOp = std::get<schema::Enum>(elements[2]);
        REQUIRE_EQ(mathOp.values.size(), 2);
        CHECK_EQ(mathOp.values[1].value, "multiply");
        CHECK_EQ(mathOp.values[1].comment, "mult comment");

        REQUIRE(std::holds_alternative<schema::Struct>(elements[4]));
        const auto& repeatResponse = std::get<schema::Struct>(elements[4]);
        CHECK_EQ(repeatResponse.name, "RepeatResponse");
        CHECK_EQ(repeatResponse.extends, "Response");
        CHECK_EQ(repeatResponse.comment, "testing struct inheritance");
        REQUIRE_EQ(repeatResponse.fields.size(), 2);
        CHECK_EQ(repeatResponse.fields[1].name, "items");
        CHECK(repeatResponse.fields[1].isArray);
        CHECK_FALSE(repeatResponse.fields[1].optional);

        CHECK(std::holds_alternative<schema::Meta>(elements[10]));
    }

    SUBCASE("meta") {
        CHECK_EQ(model->meta().barristerVersion, "0.1.2");
        CHECK_EQ(model->meta().dateGenerated, 1337654725230000000);
        CHECK_EQ(model->meta().checksum, "34f6238ed03c6319017382e0fdc638a7");
    }

    SUBCASE("method lookup") {
        const Function* add = model->lookupMethod("A.add");
        REQUIRE(add != nullptr);
        CHECK_EQ(add->name, "add");
        REQUIRE_EQ(add->params.size(), 2);
        CHECK_EQ(add->params[0].type, "int");
        CHECK_EQ(add->returns.type, "int");

        const Function* echo = model->lookupMethod("B.echo");
        REQUIRE(echo != nullptr);
        CHECK(echo->returns.optional);

        CHECK(model->lookupMethod("B.Echo") == nullptr);
        CHECK(model->lookupMethod("A") == nullptr);
        CHECK(model->lookupMethod("C.add") == nullptr);
    }

    SUBCASE("interfaces") {
        REQUIRE_EQ(model->interfaceNames().size(), 2);
        CHECK_EQ(model->interfaceNames()[0], "A");
        CHECK_EQ(model->interfaceNames()[1], "B");
        const auto* functions = model->lookupInterface("A");
        REQUIRE(functions != nullptr);
        CHECK_EQ(functions->size(), 7);
        CHECK(model->lookupInterface("Status") == nullptr);
    }

    SUBCASE("enum and struct lookup") {
        REQUIRE(model->lookupEnum("MathOp") != nullptr);
        CHECK(model->lookupEnum("Person") == nullptr);
        CHECK(model->lookupStruct("Person") != nullptr);
        CHECK(model->lookupStruct("MathOp") == nullptr);
    }

    SUBCASE("inherited fields") {
        const Struct* repeatResponse = model->lookupStruct("RepeatResponse");
        REQUIRE(repeatResponse != nullptr);
        REQUIRE_EQ(repeatResponse->resolvedFields.size(), 3);
        CHECK_EQ(repeatResponse->resolvedFields[0].name, "count");
        CHECK_EQ(repeatResponse->resolvedFields[1].name, "items");
        CHECK_EQ(repeatResponse->resolvedFields[2].name, "status");
        REQUIRE(repeatResponse->resolvedField("status") != nullptr);
        CHECK_EQ(repeatResponse->resolvedField("status")->type, "Status");
        CHECK(repeatResponse->resolvedField("hi") == nullptr);
    }

    SUBCASE("parse is deterministic") {
        auto again = parseConformSchema();
        REQUIRE(again);
        CHECK(*model == *again);
    }
}

TEST_CASE("ContractModel struct resolution") {
    SUBCASE("child fields shadow ancestors") {
        std::shared_ptr<ErrorReporter> errorReporter;
        auto model = parseSuppressed(R"([
            {"type": "struct", "name": "Base", "fields": [
                {"name": "id", "type": "int"}, {"name": "label", "type": "string"}]},
            {"type": "struct", "name": "Middle", "extends": "Base", "fields": [
                {"name": "label", "type": "float"}]},
            {"type": "struct", "name": "Leaf", "extends": "Middle", "fields": [
                {"name": "extra", "type": "bool"}]}])", errorReporter);
        REQUIRE(model);
        const Struct* leaf = model->lookupStruct("Leaf");
        REQUIRE(leaf != nullptr);
        REQUIRE_EQ(leaf->resolvedFields.size(), 3);
        CHECK_EQ(leaf->resolvedFields[0].name, "extra");
        CHECK_EQ(leaf->resolvedFields[1].name, "label");
        CHECK_EQ(leaf->resolvedFields[1].type, "float");
        CHECK_EQ(leaf->resolvedFields[2].name, "id");
    }

    SUBCASE("unknown parent is ignored") {
        std::shared_ptr<ErrorReporter> errorReporter;
        auto model = parseSuppressed(R"([{"type": "struct", "name": "Orphan", "extends": "Missing", "fields": [
            {"name": "a", "type": "int"}]}])", errorReporter);
        REQUIRE(model);
        CHECK(errorReporter->ok());
        const Struct* orphan = model->lookupStruct("Orphan");
        REQUIRE(orphan != nullptr);
        CHECK_EQ(orphan->resolvedFields.size(), 1);
    }

    SUBCASE("extends cycle terminates") {
        std::shared_ptr<ErrorReporter> errorReporter;
        auto model = parseSuppressed(R"([
            {"type": "struct", "name": "X", "extends": "Y", "fields": [{"name": "x", "type": "int"}]},
            {"type": "struct", "name": "Y", "extends": "X", "fields": [{"name": "y", "type": "int"}]}])",
                                     errorReporter);
        REQUIRE(model);
        const Struct* x = model->lookupStruct("X");
        REQUIRE(x != nullptr);
        REQUIRE_EQ(x->resolvedFields.size(), 2);
        CHECK_EQ(x->resolvedFields[0].name, "x");
        CHECK_EQ(x->resolvedFields[1].name, "y");
    }

    SUBCASE("later duplicate wins") {
        std::shared_ptr<ErrorReporter> errorReporter;
        auto model = parseSuppressed(R"([
            {"type": "enum", "name": "E", "values": [{"value": "first"}]},
            {"type": "enum", "name": "E", "values": [{"value": "second"}]}])", errorReporter);
        REQUIRE(model);
        const auto* values = model->lookupEnum("E");
        REQUIRE(values != nullptr);
        REQUIRE_EQ(values->size(), 1);
        CHECK_EQ((*values)[0].value, "second");
    }
}

TEST_CASE("ContractModel malformed schemas") {
    SUBCASE("invalid JSON") {
        std::shared_ptr<ErrorReporter> errorReporter;
        CHECK_FALSE(parseSuppressed("[{\"type\": ", errorReporter));
        CHECK(errorReporter->hasErrorOfKind(ErrorReporter::kParseError));
    }
    SUBCASE("not an array") {
        std::shared_ptr<ErrorReporter> errorReporter;
        CHECK_FALSE(parseSuppressed("{\"type\": \"comment\"}", errorReporter));
        CHECK_EQ(errorReporter->errorCount(), 1);
    }
    SUBCASE("missing element type") {
        std::shared_ptr<ErrorReporter> errorReporter;
        CHECK_FALSE(parseSuppressed(R"([{"name": "U"}])", errorReporter));
        CHECK(errorReporter->hasErrorOfKind(ErrorReporter::kParseError));
    }
    SUBCASE("date_generated out of integer range") {
        std::shared_ptr<ErrorReporter> errorReporter;
        CHECK_FALSE(parseSuppressed(R"([{"type": "meta", "date_generated": 1e300}])", errorReporter));
        CHECK(errorReporter->hasErrorOfKind(ErrorReporter::kParseError));
    }
    SUBCASE("attribute of the wrong kind") {
        std::shared_ptr<ErrorReporter> errorReporter;
        CHECK_FALSE(parseSuppressed(R"([{"type": "struct", "name": "S", "fields": [
            {"name": "a", "type": "int", "optional": "yes"}]}])", errorReporter));
        CHECK(errorReporter->hasErrorOfKind(ErrorReporter::kParseError));
    }
    SUBCASE("function without returns") {
        std::shared_ptr<ErrorReporter> errorReporter;
        CHECK_FALSE(parseSuppressed(R"([{"type": "interface", "name": "I", "functions": [
            {"name": "f", "params": []}]}])", errorReporter));
    }
    SUBCASE("empty schema") {
        std::shared_ptr<ErrorReporter> errorReporter;
        auto model = parseSuppressed("[]", errorReporter);
        REQUIRE(model);
        CHECK(model->rawElements().empty());
        CHECK(model->interfaceNames().empty());
    }
}

TEST_CASE("ContractModel lenient decoding") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);

    SUBCASE("returns without a name") {
        auto model = ContractModel::parse(R"([{"type": "interface", "name": "I", "functions": [
            {"name": "f", "params": [],
             "returns": {"type": "int", "optional": false, "is_array": false}}]}])", errorReporter);
        REQUIRE(model);
        CHECK(errorReporter->ok());
        const Function* function = model->lookupMethod("I.f");
        REQUIRE(function != nullptr);
        CHECK(function->returns.name.empty());
        CHECK_EQ(function->returns.type, "int");
    }

    SUBCASE("parameters still need names") {
        CHECK_FALSE(ContractModel::parse(R"([{"type": "interface", "name": "I", "functions": [
            {"name": "f", "params": [{"type": "int"}],
             "returns": {"type": "int"}}]}])", errorReporter));
        CHECK(errorReporter->hasErrorOfKind(ErrorReporter::kParseError));
    }

    SUBCASE("unknown element types are skipped") {
        auto model = ContractModel::parse(R"([{"type": "union", "name": "U"},
            {"type": "enum", "name": "E", "values": [{"value": "x"}]}])", errorReporter);
        REQUIRE(model);
        CHECK(errorReporter->ok());
        REQUIRE_EQ(model->rawElements().size(), 1);
        CHECK(model->lookupEnum("E") != nullptr);
    }
}

TEST_CASE("ContractModel meta scaling") {
    SUBCASE("milliseconds") {
        auto model = ContractModel::build({ schema::Meta { "0.1.2", 1337654725230, "x" } });
        REQUIRE(model);
        CHECK_EQ(model->meta().dateGenerated, 1337654725230000000);
    }
    SUBCASE("negative milliseconds") {
        auto model = ContractModel::build({ schema::Meta { "0.1.2", -1000, "x" } });
        REQUIRE(model);
        CHECK_EQ(model->meta().dateGenerated, -1000000000);
    }
    SUBCASE("already finer than milliseconds") {
        auto model = ContractModel::build({ schema::Meta { "0.1.2", 1337654725230000, "x" } });
        REQUIRE(model);
        CHECK_EQ(model->meta().dateGenerated, 1337654725230000);
    }
    SUBCASE("largest value that scales") {
        int64_t limit = std::numeric_limits<int64_t>::max() / Meta::kDateGeneratedScale;
        auto model = ContractModel::build({ schema::Meta { "0.1.2", limit, "x" } });
        REQUIRE(model);
        CHECK_EQ(model->meta().dateGenerated, limit * Meta::kDateGeneratedScale);
        model = ContractModel::build({ schema::Meta { "0.1.2", limit + 1, "x" } });
        REQUIRE(model);
        CHECK_EQ(model->meta().dateGenerated, limit + 1);
    }
}

TEST_CASE("ContractModel parseFile") {
    SUBCASE("missing file") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        CHECK_FALSE(ContractModel::parseFile("no/such/schema.json", errorReporter));
        CHECK(errorReporter->hasErrorOfKind(ErrorReporter::kParseError));
    }
    SUBCASE("conformance schema") {
        auto path = std::filesystem::temp_directory_path() / "idlrpc_ContractModel_unittests.json";
        {
            std::ofstream out(path, std::ofstream::binary | std::ofstream::trunc);
            out << kConformSchemaJSON;
        }
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        auto model = ContractModel::parseFile(path.string(), errorReporter);
        REQUIRE(model);
        CHECK(*model == *parseConformSchema());
        std::error_code errorCode;
        std::filesystem::remove(path, errorCode);
    }
}

TEST_CASE("Schema element encoding") {
    auto model = parseConformSchema();
    REQUIRE(model);
    Value encoded = encodeElements(model->rawElements());
    REQUIRE(encoded.isArray());
    REQUIRE_EQ(encoded.size(), 11);

    SUBCASE("decodes back to the same elements") {
        std::vector<Element> decoded;
        std::string errorMessage;
        REQUIRE(decodeElements(encoded, decoded, errorMessage));
        CHECK(decoded == model->rawElements());
    }

    SUBCASE("struct without parent omits extends") {
        const Value& response = encoded.getArray()[3];
        CHECK(response.find("extends") == nullptr);
        const Value& repeatResponse = encoded.getArray()[4];
        REQUIRE(repeatResponse.find("extends") != nullptr);
        CHECK_EQ(*repeatResponse.find("extends"), Value::makeString("Response"));
    }

    SUBCASE("meta keeps milliseconds") {
        const Value& meta = encoded.getArray()[10];
        REQUIRE(meta.find("date_generated") != nullptr);
        CHECK_EQ(*meta.find("date_generated"), Value::makeInteger(1337654725230));
    }
}

} // namespace idlrpc
