#include "server/JSONTransport.hpp"

#include "idlrpc/Dispatcher.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <array>
#include <cerrno>
#include <cstdlib>
#include <string>
#include <string.h>
#include <vector>

namespace server {

JSONTransport::JSONTransport(FILE* inputStream, FILE* outputStream):
    m_inputStream(inputStream), m_outputStream(outputStream) { }

int JSONTransport::runLoop() {
    if (!m_dispatcher) {
        SPDLOG_CRITICAL("JSONTransport run loop started without a dispatcher.");
        return -1;
    }

    std::vector<char> json;
    SPDLOG_INFO("runLoop entry");

    while (!feof(m_inputStream)) {
        size_t contentLength = readHeaders();
        if (contentLength == 0) {
            if (ferror(m_inputStream)) {
                SPDLOG_CRITICAL("Input stream error, exiting processing loop.");
                return -1;
            }
            continue;
        }

        if (contentLength > kMaxContentLength) {
            SPDLOG_CRITICAL("Rejecting Content-Length: {} > 1 MB.", contentLength);
            return -1;
        }

        json.resize(contentLength);
        size_t bytesRead = 0;
        while (bytesRead < contentLength) {
            size_t read = fread(json.data() + bytesRead, 1, contentLength - bytesRead, m_inputStream);
            if (read == 0 || ferror(m_inputStream)) {
                SPDLOG_CRITICAL("Input read failure.");
                return -1;
            }
            bytesRead += read;
        }
        SPDLOG_TRACE("Read {} JSON bytes", contentLength);

        std::string response = m_dispatcher->invoke(std::string_view(json.data(), contentLength));
        sendMessage(response);
    }

    SPDLOG_INFO("Normal exit from processing loop.");
    return 0;
}

size_t JSONTransport::readHeaders() {
    std::array<char, 256> headerBuf;
    size_t contentLength = 0;

    while (!feof(m_inputStream)) {
        if (ferror(m_inputStream)) {
            if (errno == EINTR) {
                clearerr(m_inputStream);
                errno = 0;
            } else {
                SPDLOG_ERROR("File error on input stream while reading headers: {}.", strerror(errno));
                return 0;
            }
        }

        if (!fgets(headerBuf.data(), headerBuf.size(), m_inputStream)) {
            continue;
        }
        std::string headerLine(headerBuf.data());

        if (headerLine.size() == 0) {
            continue;
        }

        // Header lines longer than 256 characters are parse errors.
        if (headerLine.size() == headerBuf.size() - 1 && headerLine.back() != '\n') {
            SPDLOG_ERROR("Received a header line longer than 256 characters.");
            return 0;
        }

        static const std::string lengthHeader("Content-Length:");
        if (headerLine.substr(0, lengthHeader.size()) == lengthHeader) {
            contentLength = std::strtoull(headerLine.data() + lengthHeader.size(), nullptr, 10);
            SPDLOG_TRACE("Parsed Content-Length header with {} bytes", contentLength);
        } else if (headerLine == "\r\n" || headerLine == "\n") {
            // empty line indicates end of headers
            SPDLOG_TRACE("Parsed end of headers.");
            return contentLength;
        }
        // some other header here, don't bother parsing
    }

    SPDLOG_INFO("Encountered EOF during header parsing.");
    return 0;
}

void JSONTransport::sendMessage(std::string_view payload) {
    std::string output = fmt::format("Content-Length: {}\r\n\r\n{}", payload.size(), payload);
    std::fwrite(output.data(), 1, output.size(), m_outputStream);
    std::fflush(m_outputStream);
}

} // namespace server
