#ifndef SRC_IDLRPC_SOURCE_FILE_HPP_
#define SRC_IDLRPC_SOURCE_FILE_HPP_

#include <memory>
#include <string>
#include <string_view>

namespace idlrpc {

class ErrorReporter;

// A schema file loaded from disk into memory. Inserts a null character at the end of the loaded string, for ease of
// use when handing to the JSON parser.
class SourceFile {
public:
    SourceFile() = delete;
    SourceFile(std::string path);
    ~SourceFile() = default;

    // Reports failures to |errorReporter| as parse errors.
    bool read(std::shared_ptr<ErrorReporter> errorReporter);

    const std::string& path() const { return m_path; }
    const char* code() const { return m_code.get(); }
    size_t size() const { return m_codeSize; }
    std::string_view codeView() const { return std::string_view(m_code.get(), m_codeSize); }

private:
    std::string m_path;
    size_t m_codeSize;
    std::unique_ptr<char[]> m_code;
};

} // namespace idlrpc

#endif // SRC_IDLRPC_SOURCE_FILE_HPP_
