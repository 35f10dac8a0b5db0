#ifndef SRC_SERVER_CONFORMANCE_HANDLERS_HPP_
#define SRC_SERVER_CONFORMANCE_HANDLERS_HPP_

#include <cstdint>
#include <memory>

namespace idlrpc {
class Handler;
}

namespace server {

// Implementations of the two interfaces in the conformance IDL. The operations are not useful on their own, they
// exercise as much of the type system as possible.

// Largest count repeat and repeat_num accept, larger counts are answered with an error.
constexpr int64_t kMaxRepeatCount = 100000;

// A: add, calc, sqrt, repeat, say_hi, repeat_num, putPerson.
std::shared_ptr<idlrpc::Handler> makeInterfaceAHandler();

// B: echo, which returns null when passed "return-null".
std::shared_ptr<idlrpc::Handler> makeInterfaceBHandler();

} // namespace server

#endif // SRC_SERVER_CONFORMANCE_HANDLERS_HPP_
