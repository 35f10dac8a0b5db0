#include "idlrpc/ErrorReporter.hpp"

#include <doctest/doctest.h>

namespace idlrpc {

TEST_CASE("ErrorReporter collects errors") {
    SUBCASE("empty") {
        ErrorReporter er(true);
        CHECK(er.ok());
        CHECK_EQ(er.errorCount(), 0);
        CHECK_FALSE(er.hasErrorOfKind(ErrorReporter::kParseError));
    }
    SUBCASE("kinds") {
        ErrorReporter er(true);
        er.addError(ErrorReporter::kRegistrationError, "A.add mismatch");
        er.addFileNotFoundError("missing.json");
        CHECK_FALSE(er.ok());
        REQUIRE_EQ(er.errorCount(), 2);
        CHECK(er.hasErrorOfKind(ErrorReporter::kRegistrationError));
        CHECK(er.hasErrorOfKind(ErrorReporter::kParseError));
        CHECK_FALSE(er.hasErrorOfKind(ErrorReporter::kSchemaError));
        CHECK_EQ(er.errors()[0].message, "A.add mismatch");
        CHECK_EQ(er.errors()[1].kind, ErrorReporter::kParseError);
        CHECK_NE(er.errors()[1].message.find("missing.json"), std::string::npos);
    }
    SUBCASE("clear") {
        ErrorReporter er(true);
        er.addFileReadError("x");
        er.addFileOpenError("y");
        CHECK_EQ(er.errorCount(), 2);
        er.clear();
        CHECK(er.ok());
    }
    SUBCASE("kind names") {
        CHECK_EQ(std::string(ErrorReporter::kindName(ErrorReporter::kSchemaError)), "schema error");
    }
}

} // namespace idlrpc
