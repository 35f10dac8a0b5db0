#ifndef SRC_SERVER_JSON_TRANSPORT_HPP_
#define SRC_SERVER_JSON_TRANSPORT_HPP_

#include <memory>
#include <stdio.h>
#include <string_view>

namespace idlrpc {
class Dispatcher;
}

namespace server {

// Reads Content-Length framed JSON-RPC payloads and writes back framed responses. Modeled on the clangd transport.
class JSONTransport {
public:
    // Payloads longer than this are rejected and end the run loop.
    static constexpr size_t kMaxContentLength = 1024 * 1024;

    JSONTransport() = delete;
    // Non-owning stream pointers. Uses stdio rather than C++ streams for reliability on stdin.
    JSONTransport(FILE* inputStream, FILE* outputStream);
    ~JSONTransport() = default;

    void setDispatcher(std::shared_ptr<const idlrpc::Dispatcher> dispatcher) { m_dispatcher = std::move(dispatcher); }

    // The main run loop, returns an exit status code.
    int runLoop();

private:
    // Returns the Content-Length of the next message, or 0 on EOF or a malformed header.
    size_t readHeaders();
    void sendMessage(std::string_view payload);

    FILE* m_inputStream;
    FILE* m_outputStream;
    std::shared_ptr<const idlrpc::Dispatcher> m_dispatcher;
};

} // namespace server

#endif // SRC_SERVER_JSON_TRANSPORT_HPP_
