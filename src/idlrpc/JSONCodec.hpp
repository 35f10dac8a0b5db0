#ifndef SRC_IDLRPC_JSON_CODEC_HPP_
#define SRC_IDLRPC_JSON_CODEC_HPP_

#include "idlrpc/Value.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace idlrpc {

// Decodes |json| into a Value. Integers representable as int64_t decode as integers, all other numbers as floats. On
// failure returns an empty optional, and if |errorMessage| is non-null fills it with the offset and reason.
std::optional<Value> parseJSON(std::string_view json, std::string* errorMessage = nullptr);

// Produces a compact JSON serialization of |value|. With |forceASCII| every code point above 0x7f is written as a
// \uXXXX escape. Non-finite floats have no JSON form and are written as null.
std::string serializeJSON(const Value& value, bool forceASCII = false);

} // namespace idlrpc

#endif // SRC_IDLRPC_JSON_CODEC_HPP_
