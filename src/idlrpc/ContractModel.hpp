#ifndef SRC_IDLRPC_CONTRACT_MODEL_HPP_
#define SRC_IDLRPC_CONTRACT_MODEL_HPP_

#include "idlrpc/Schema.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace idlrpc {

class ErrorReporter;

// A struct as indexed by the ContractModel, carrying the fields it inherits.
struct Struct {
    std::string name;
    std::string extends;
    // Own fields in declaration order.
    std::vector<Field> fields;
    // Own fields merged with every ancestor's fields. A name declared closer to this struct shadows the same name
    // further up the chain. Ordered own fields first, then each ancestor's remaining fields, walking rootward.
    std::vector<Field> resolvedFields;

    // Returns nullptr if |fieldName| is not in the resolved field set.
    const Field* resolvedField(std::string_view fieldName) const;

    bool operator==(const Struct& s) const {
        return name == s.name && extends == s.extends && fields == s.fields && resolvedFields == s.resolvedFields;
    }
};

// Contract metadata, with dateGenerated scaled from the schema's milliseconds to nanoseconds. A schema value too large
// to scale is taken to be at a finer precision already and is stored as is.
struct Meta {
    static constexpr int64_t kDateGeneratedScale = 1000000;

    std::string barristerVersion;
    int64_t dateGenerated = 0;
    std::string checksum;

    bool operator==(const Meta& m) const {
        return barristerVersion == m.barristerVersion && dateGenerated == m.dateGenerated && checksum == m.checksum;
    }
};

// Indexed, immutable in-memory form of a schema. Built once at startup, then shared read-only by every request.
class ContractModel {
public:
    ContractModel() = default;
    ~ContractModel() = default;

    // Decodes |schemaJSON| as an element sequence and builds the model. Returns nullptr on failure after adding a
    // kParseError to |errorReporter|, no partial model is ever produced.
    static std::unique_ptr<ContractModel> parse(std::string_view schemaJSON,
                                                std::shared_ptr<ErrorReporter> errorReporter);
    // Reads the schema from the file at |path|, then parses as above.
    static std::unique_ptr<ContractModel> parseFile(const std::string& path,
                                                    std::shared_ptr<ErrorReporter> errorReporter);

    // Indexes |elements| and computes the resolved field set of every struct. Later elements of the same name replace
    // earlier ones. An extends reference to an unknown struct ends the ancestor walk without error.
    static std::unique_ptr<ContractModel> build(std::vector<Element> elements);

    // |qualifiedName| is "Interface.function". Returns nullptr if not found.
    const Function* lookupMethod(std::string_view qualifiedName) const;
    const Struct* lookupStruct(std::string_view name) const;
    const std::vector<EnumValue>* lookupEnum(std::string_view name) const;
    const std::vector<Function>* lookupInterface(std::string_view name) const;

    // The elements in schema order, as used for the introspection result.
    const std::vector<Element>& rawElements() const { return m_elements; }
    const Meta& meta() const { return m_meta; }
    // Interface names in schema order.
    const std::vector<std::string>& interfaceNames() const { return m_interfaceNames; }

    bool operator==(const ContractModel& model) const;
    bool operator!=(const ContractModel& model) const { return !(*this == model); }

private:
    void resolveStructFields(Struct& target) const;

    std::vector<Element> m_elements;
    Meta m_meta;
    std::vector<std::string> m_interfaceNames;

    std::unordered_map<std::string, std::vector<Function>> m_interfaces;
    std::unordered_map<std::string, Function> m_methods;
    std::unordered_map<std::string, Struct> m_structs;
    std::unordered_map<std::string, std::vector<EnumValue>> m_enums;
};

} // namespace idlrpc

#endif // SRC_IDLRPC_CONTRACT_MODEL_HPP_
