#include "idlrpc/ContractModel.hpp"

#include "idlrpc/ErrorReporter.hpp"
#include "idlrpc/JSONCodec.hpp"
#include "idlrpc/SourceFile.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <limits>
#include <unordered_set>

namespace {

int64_t scaleDateGenerated(int64_t dateGenerated) {
    constexpr int64_t kScale = idlrpc::Meta::kDateGeneratedScale;
    if (dateGenerated > std::numeric_limits<int64_t>::max() / kScale
        || dateGenerated < std::numeric_limits<int64_t>::min() / kScale) {
        SPDLOG_WARN("Meta date_generated {} does not fit milliseconds scaled to nanoseconds, keeping it unscaled.",
                    dateGenerated);
        return dateGenerated;
    }
    return dateGenerated * kScale;
}

} // namespace

namespace idlrpc {

const Field* Struct::resolvedField(std::string_view fieldName) const {
    for (const auto& field : resolvedFields) {
        if (field.name == fieldName) {
            return &field;
        }
    }
    return nullptr;
}

// static
std::unique_ptr<ContractModel> ContractModel::parse(std::string_view schemaJSON,
                                                    std::shared_ptr<ErrorReporter> errorReporter) {
    std::string errorMessage;
    auto value = parseJSON(schemaJSON, &errorMessage);
    if (!value) {
        errorReporter->addError(ErrorReporter::kParseError, fmt::format("Unable to parse schema JSON, {}",
                                                                        errorMessage));
        return nullptr;
    }

    std::vector<Element> elements;
    if (!decodeElements(*value, elements, errorMessage)) {
        errorReporter->addError(ErrorReporter::kParseError, fmt::format("Malformed schema, {}", errorMessage));
        return nullptr;
    }

    return build(std::move(elements));
}

// static
std::unique_ptr<ContractModel> ContractModel::parseFile(const std::string& path,
                                                        std::shared_ptr<ErrorReporter> errorReporter) {
    SourceFile sourceFile(path);
    if (!sourceFile.read(errorReporter)) {
        return nullptr;
    }
    return parse(sourceFile.codeView(), errorReporter);
}

// static
std::unique_ptr<ContractModel> ContractModel::build(std::vector<Element> elements) {
    auto model = std::make_unique<ContractModel>();

    for (const auto& element : elements) {
        if (std::holds_alternative<schema::Meta>(element)) {
            const auto& meta = std::get<schema::Meta>(element);
            model->m_meta = Meta { meta.barristerVersion, scaleDateGenerated(meta.dateGenerated), meta.checksum };
        } else if (std::holds_alternative<schema::Interface>(element)) {
            const auto& interfaceElement = std::get<schema::Interface>(element);
            for (const auto& function : interfaceElement.functions) {
                model->m_methods[fmt::format("{}.{}", interfaceElement.name, function.name)] = function;
            }
            if (model->m_interfaces.find(interfaceElement.name) == model->m_interfaces.end()) {
                model->m_interfaceNames.emplace_back(interfaceElement.name);
            }
            model->m_interfaces[interfaceElement.name] = interfaceElement.functions;
        } else if (std::holds_alternative<schema::Struct>(element)) {
            const auto& structElement = std::get<schema::Struct>(element);
            model->m_structs[structElement.name] = Struct { structElement.name, structElement.extends,
                                                            structElement.fields, {} };
        } else if (std::holds_alternative<schema::Enum>(element)) {
            const auto& enumElement = std::get<schema::Enum>(element);
            model->m_enums[enumElement.name] = enumElement.values;
        }
    }

    for (auto& pair : model->m_structs) {
        model->resolveStructFields(pair.second);
    }

    model->m_elements = std::move(elements);
    SPDLOG_DEBUG("Built contract model with {} interfaces, {} methods, {} structs, {} enums.",
                 model->m_interfaces.size(), model->m_methods.size(), model->m_structs.size(), model->m_enums.size());
    return model;
}

const Function* ContractModel::lookupMethod(std::string_view qualifiedName) const {
    auto iter = m_methods.find(std::string(qualifiedName));
    if (iter == m_methods.end()) {
        return nullptr;
    }
    return &iter->second;
}

const Struct* ContractModel::lookupStruct(std::string_view name) const {
    auto iter = m_structs.find(std::string(name));
    if (iter == m_structs.end()) {
        return nullptr;
    }
    return &iter->second;
}

const std::vector<EnumValue>* ContractModel::lookupEnum(std::string_view name) const {
    auto iter = m_enums.find(std::string(name));
    if (iter == m_enums.end()) {
        return nullptr;
    }
    return &iter->second;
}

const std::vector<Function>* ContractModel::lookupInterface(std::string_view name) const {
    auto iter = m_interfaces.find(std::string(name));
    if (iter == m_interfaces.end()) {
        return nullptr;
    }
    return &iter->second;
}

bool ContractModel::operator==(const ContractModel& model) const {
    return m_elements == model.m_elements && m_meta == model.m_meta && m_interfaceNames == model.m_interfaceNames
        && m_interfaces == model.m_interfaces && m_methods == model.m_methods && m_structs == model.m_structs
        && m_enums == model.m_enums;
}

void ContractModel::resolveStructFields(Struct& target) const {
    target.resolvedFields.clear();
    std::unordered_set<std::string> fieldNames;
    // Guards against extends cycles, which would otherwise walk forever.
    std::unordered_set<std::string> visited;

    const Struct* current = &target;
    while (current && visited.insert(current->name).second) {
        for (const auto& field : current->fields) {
            if (fieldNames.insert(field.name).second) {
                target.resolvedFields.emplace_back(field);
            }
        }

        if (current->extends.empty()) {
            break;
        }
        auto parent = m_structs.find(current->extends);
        if (parent == m_structs.end()) {
            SPDLOG_DEBUG("Struct '{}' extends unknown struct '{}', ignoring.", current->name, current->extends);
            break;
        }
        current = &parent->second;
    }
}

} // namespace idlrpc
