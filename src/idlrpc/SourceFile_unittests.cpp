#include "idlrpc/SourceFile.hpp"

#include "idlrpc/ErrorReporter.hpp"

#include "doctest/doctest.h"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace idlrpc {

TEST_CASE("SourceFile read") {
    SUBCASE("missing file") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        SourceFile sourceFile("this/path/does/not/exist.json");
        CHECK_FALSE(sourceFile.read(errorReporter));
        CHECK_EQ(errorReporter->errorCount(), 1);
        CHECK(errorReporter->hasErrorOfKind(ErrorReporter::kParseError));
    }

    SUBCASE("directory is not a file") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        SourceFile sourceFile(fs::temp_directory_path().string());
        CHECK_FALSE(sourceFile.read(errorReporter));
        CHECK_FALSE(errorReporter->ok());
    }

    SUBCASE("contents") {
        fs::path path = fs::temp_directory_path() / "idlrpc_SourceFile_unittests.json";
        {
            std::ofstream out(path, std::ofstream::binary | std::ofstream::trunc);
            out << "[{\"type\": \"comment\"}]";
        }
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        SourceFile sourceFile(path.string());
        REQUIRE(sourceFile.read(errorReporter));
        CHECK(errorReporter->ok());
        CHECK_EQ(sourceFile.size(), 21);
        CHECK_EQ(sourceFile.codeView(), "[{\"type\": \"comment\"}]");
        CHECK_EQ(sourceFile.code()[sourceFile.size()], '\0');
        std::error_code errorCode;
        fs::remove(path, errorCode);
    }
}

} // namespace idlrpc
