#include "idlrpc/ErrorReporter.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

namespace idlrpc {

ErrorReporter::ErrorReporter(bool suppress): m_suppress(suppress) {}

ErrorReporter::~ErrorReporter() {}

void ErrorReporter::addError(ErrorKind kind, const std::string& error) {
    if (!m_suppress) {
        spdlog::error("{}: {}", kindName(kind), error);
    }
    m_errors.emplace_back(Error{kind, error});
}

void ErrorReporter::addFileNotFoundError(std::string filePath) {
    addError(kParseError, fmt::format("File '{}' not found.", filePath));
}

void ErrorReporter::addFileOpenError(std::string filePath) {
    addError(kParseError, fmt::format("Unable to open file '{}'.", filePath));
}

void ErrorReporter::addFileReadError(std::string filePath) {
    addError(kParseError, fmt::format("Failed to read file '{}'.", filePath));
}

bool ErrorReporter::hasErrorOfKind(ErrorKind kind) const {
    for (const auto& error : m_errors) {
        if (error.kind == kind) {
            return true;
        }
    }
    return false;
}

// static
const char* ErrorReporter::kindName(ErrorKind kind) {
    switch (kind) {
    case kParseError:
        return "parse error";
    case kSchemaError:
        return "schema error";
    case kRegistrationError:
        return "registration error";
    }
    return "error";
}

} // namespace idlrpc
