#ifndef SRC_IDLRPC_CONFORM_TEST_FIXTURE_HPP_
#define SRC_IDLRPC_CONFORM_TEST_FIXTURE_HPP_

// Shared by the unit tests only.

#include "idlrpc/ContractModel.hpp"
#include "idlrpc/ErrorReporter.hpp"

#include <memory>

namespace idlrpc {

// The conformance IDL in its JSON form, 11 elements: a comment, 2 enums, 5 structs, 2 interfaces and the meta.
static constexpr const char* kConformSchemaJSON = R"json([
{"type": "comment",
 "value": "Barrister conformance IDL\n\nThe bits in here have silly names and the operations\nare not intended to be useful.  The intent is to\nexercise as much of the IDL grammar as possible"},
{"type": "enum", "name": "Status", "comment": "",
 "values": [{"value": "ok", "comment": ""}, {"value": "err", "comment": ""}]},
{"type": "enum", "name": "MathOp", "comment": "",
 "values": [{"value": "add", "comment": ""}, {"value": "multiply", "comment": "mult comment"}]},
{"type": "struct", "name": "Response", "extends": "", "comment": "",
 "fields": [{"name": "status", "type": "Status", "optional": false, "is_array": false, "comment": ""}]},
{"type": "struct", "name": "RepeatResponse", "extends": "Response", "comment": "testing struct inheritance",
 "fields": [{"name": "count", "type": "int", "optional": false, "is_array": false, "comment": ""},
            {"name": "items", "type": "string", "optional": false, "is_array": true, "comment": ""}]},
{"type": "struct", "name": "HiResponse", "extends": "", "comment": "",
 "fields": [{"name": "hi", "type": "string", "optional": false, "is_array": false, "comment": ""}]},
{"type": "struct", "name": "RepeatRequest", "extends": "", "comment": "",
 "fields": [{"name": "to_repeat", "type": "string", "optional": false, "is_array": false, "comment": ""},
            {"name": "count", "type": "int", "optional": false, "is_array": false, "comment": ""},
            {"name": "force_uppercase", "type": "bool", "optional": false, "is_array": false, "comment": ""}]},
{"type": "struct", "name": "Person", "extends": "", "comment": "",
 "fields": [{"name": "personId", "type": "string", "optional": false, "is_array": false, "comment": ""},
            {"name": "firstName", "type": "string", "optional": false, "is_array": false, "comment": ""},
            {"name": "lastName", "type": "string", "optional": false, "is_array": false, "comment": ""},
            {"name": "email", "type": "string", "optional": true, "is_array": false, "comment": ""}]},
{"type": "interface", "name": "A", "comment": "",
 "functions": [
  {"name": "add", "comment": "returns a+b",
   "params": [{"name": "a", "type": "int", "optional": false, "is_array": false, "comment": ""},
              {"name": "b", "type": "int", "optional": false, "is_array": false, "comment": ""}],
   "returns": {"type": "int", "optional": false, "is_array": false, "comment": ""}},
  {"name": "calc", "comment": "performs the given operation against all the values in nums and returns the result",
   "params": [{"name": "nums", "type": "float", "optional": false, "is_array": true, "comment": ""},
              {"name": "operation", "type": "MathOp", "optional": false, "is_array": false, "comment": ""}],
   "returns": {"type": "float", "optional": false, "is_array": false, "comment": ""}},
  {"name": "sqrt", "comment": "returns the square root of a",
   "params": [{"name": "a", "type": "float", "optional": false, "is_array": false, "comment": ""}],
   "returns": {"type": "float", "optional": false, "is_array": false, "comment": ""}},
  {"name": "repeat", "comment": "Echos the req1.to_repeat string as a list, optionally forcing to_repeat to upper case",
   "params": [{"name": "req1", "type": "RepeatRequest", "optional": false, "is_array": false, "comment": ""}],
   "returns": {"type": "RepeatResponse", "optional": false, "is_array": false, "comment": ""}},
  {"name": "say_hi", "comment": "returns a result with hi=\"hi\"",
   "params": [],
   "returns": {"type": "HiResponse", "optional": false, "is_array": false, "comment": ""}},
  {"name": "repeat_num", "comment": "returns num as an array repeated 'count' number of times",
   "params": [{"name": "num", "type": "int", "optional": false, "is_array": false, "comment": ""},
              {"name": "count", "type": "int", "optional": false, "is_array": false, "comment": ""}],
   "returns": {"type": "int", "optional": false, "is_array": true, "comment": ""}},
  {"name": "putPerson", "comment": "simply returns p.personId",
   "params": [{"name": "p", "type": "Person", "optional": false, "is_array": false, "comment": ""}],
   "returns": {"type": "string", "optional": false, "is_array": false, "comment": ""}}]},
{"type": "interface", "name": "B", "comment": "",
 "functions": [
  {"name": "echo", "comment": "simply returns s, if s == \"return-null\" then you should return a null",
   "params": [{"name": "s", "type": "string", "optional": false, "is_array": false, "comment": ""}],
   "returns": {"type": "string", "optional": true, "is_array": false, "comment": ""}}]},
{"type": "meta", "barrister_version": "0.1.2", "date_generated": 1337654725230,
 "checksum": "34f6238ed03c6319017382e0fdc638a7"}
])json";

inline std::shared_ptr<const ContractModel> parseConformSchema() {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    return ContractModel::parse(kConformSchemaJSON, errorReporter);
}

// For consumption by unittests only, a test fixture holding the parsed conformance schema and a quiet ErrorReporter.
class ConformTestFixture {
public:
    ConformTestFixture():
        m_errorReporter(std::make_shared<ErrorReporter>(true)),
        m_model(ContractModel::parse(kConformSchemaJSON, m_errorReporter)) { }
    virtual ~ConformTestFixture() = default;

protected:
    const ContractModel& model() const { return *m_model; }
    std::shared_ptr<const ContractModel> sharedModel() const { return m_model; }
    std::shared_ptr<ErrorReporter> errorReporter() const { return m_errorReporter; }

private:
    std::shared_ptr<ErrorReporter> m_errorReporter;
    std::shared_ptr<const ContractModel> m_model;
};

} // namespace idlrpc

#endif // SRC_IDLRPC_CONFORM_TEST_FIXTURE_HPP_
