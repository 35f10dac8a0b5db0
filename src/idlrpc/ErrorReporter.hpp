#ifndef SRC_IDLRPC_ERROR_REPORTER_HPP_
#define SRC_IDLRPC_ERROR_REPORTER_HPP_

#include <string>
#include <vector>

namespace idlrpc {

// Collects the configuration errors found while loading a schema and registering handlers. These are never per-request
// errors, which travel back to the caller inside the response envelope instead.
class ErrorReporter {
public:
    enum ErrorKind {
        // The schema bytes or file could not be decoded into schema elements.
        kParseError,
        // The schema references a type it never declares.
        kSchemaError,
        // A handler does not satisfy the interface it was registered under.
        kRegistrationError,
    };

    struct Error {
        ErrorKind kind;
        std::string message;
    };

    // If suppress is true, will not print reported errors to log (useful for testing failures without
    // polluting the log)
    ErrorReporter(bool suppress = false);
    ~ErrorReporter();

    void addError(ErrorKind kind, const std::string& error);

    // Specific errors, all of kind kParseError.

    // Unable to locate a file under filePath.
    void addFileNotFoundError(std::string filePath);
    // Unable to open file at filePath.
    void addFileOpenError(std::string filePath);
    // Failed to read file at filePath.
    void addFileReadError(std::string filePath);

    size_t errorCount() const { return m_errors.size(); }
    bool ok() const { return m_errors.size() == 0; }
    bool hasErrorOfKind(ErrorKind kind) const;
    const std::vector<Error>& errors() const { return m_errors; }
    void clear() { m_errors.clear(); }

    static const char* kindName(ErrorKind kind);

private:
    bool m_suppress;
    std::vector<Error> m_errors;
};

} // namespace idlrpc

#endif // SRC_IDLRPC_ERROR_REPORTER_HPP_
