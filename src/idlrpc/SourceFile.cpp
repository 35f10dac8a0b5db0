#include "idlrpc/SourceFile.hpp"

#include "idlrpc/ErrorReporter.hpp"

#include "spdlog/spdlog.h"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace idlrpc {

SourceFile::SourceFile(std::string path): m_path(path), m_codeSize(0) { }

bool SourceFile::read(std::shared_ptr<ErrorReporter> errorReporter) {
    fs::path filePath(m_path);
    std::error_code errorCode;
    if (!fs::is_regular_file(filePath, errorCode)) {
        errorReporter->addFileNotFoundError(m_path);
        return false;
    }

    auto fileSize = fs::file_size(filePath, errorCode);
    if (errorCode) {
        errorReporter->addFileReadError(m_path);
        return false;
    }

    // codeView() excludes the null terminator.
    m_codeSize = static_cast<size_t>(fileSize);
    m_code = std::make_unique<char[]>(m_codeSize + 1);
    m_code[m_codeSize] = '\0';
    std::ifstream inFile(filePath, std::ifstream::binary);
    if (!inFile) {
        errorReporter->addFileOpenError(m_path);
        return false;
    }
    inFile.read(m_code.get(), static_cast<std::streamsize>(m_codeSize));
    if (!inFile) {
        errorReporter->addFileReadError(m_path);
        return false;
    }

    SPDLOG_DEBUG("Read {} bytes from '{}'.", m_codeSize, m_path);
    return true;
}

} // namespace idlrpc
