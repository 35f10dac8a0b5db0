#include "idlrpc/JSONCodec.hpp"

#include "fmt/format.h"
#include "rapidjson/document.h"
#include "rapidjson/encodings.h"
#include "rapidjson/error/en.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"
#include "spdlog/spdlog.h"

#include <cmath>

namespace {

idlrpc::Value decodeValue(const rapidjson::Value& json) {
    switch (json.GetType()) {
    case rapidjson::kNullType:
        return idlrpc::Value::makeNil();
    case rapidjson::kFalseType:
        return idlrpc::Value::makeBool(false);
    case rapidjson::kTrueType:
        return idlrpc::Value::makeBool(true);
    case rapidjson::kNumberType:
        if (json.IsInt64()) {
            return idlrpc::Value::makeInteger(json.GetInt64());
        }
        return idlrpc::Value::makeFloat(json.GetDouble());
    case rapidjson::kStringType:
        return idlrpc::Value::makeString(std::string(json.GetString(), json.GetStringLength()));
    case rapidjson::kArrayType: {
        idlrpc::Value::Array elements;
        elements.reserve(json.Size());
        for (const auto& element : json.GetArray()) {
            elements.emplace_back(decodeValue(element));
        }
        return idlrpc::Value::makeArray(std::move(elements));
    }
    case rapidjson::kObjectType: {
        auto object = idlrpc::Value::makeObject();
        for (const auto& member : json.GetObject()) {
            object.set(std::string(member.name.GetString(), member.name.GetStringLength()),
                       decodeValue(member.value));
        }
        return object;
    }
    }

    return idlrpc::Value::makeNil();
}

template <typename Writer> void encodeValue(const idlrpc::Value& value, Writer& writer) {
    switch (value.kind()) {
    case idlrpc::Value::kNil:
        writer.Null();
        break;
    case idlrpc::Value::kBoolean:
        writer.Bool(value.getBool());
        break;
    case idlrpc::Value::kInteger:
        writer.Int64(value.getInteger());
        break;
    case idlrpc::Value::kFloat:
        if (std::isfinite(value.getFloat())) {
            writer.Double(value.getFloat());
        } else {
            SPDLOG_WARN("Encoding non-finite float {} as null.", value.getFloat());
            writer.Null();
        }
        break;
    case idlrpc::Value::kString:
        writer.String(value.getString().data(), static_cast<rapidjson::SizeType>(value.getString().size()));
        break;
    case idlrpc::Value::kArray:
        writer.StartArray();
        for (const auto& element : value.getArray()) {
            encodeValue(element, writer);
        }
        writer.EndArray();
        break;
    case idlrpc::Value::kObject:
        writer.StartObject();
        for (const auto& member : value.getObject()) {
            writer.Key(member.key.data(), static_cast<rapidjson::SizeType>(member.key.size()));
            encodeValue(member.value, writer);
        }
        writer.EndObject();
        break;
    }
}

} // namespace

namespace idlrpc {

std::optional<Value> parseJSON(std::string_view json, std::string* errorMessage) {
    rapidjson::Document document;
    rapidjson::ParseResult parseResult = document.Parse(json.data(), json.size());
    if (!parseResult) {
        if (errorMessage) {
            *errorMessage = fmt::format("offset {}: {}", parseResult.Offset(),
                                        rapidjson::GetParseError_En(parseResult.Code()));
        }
        SPDLOG_DEBUG("JSON parse failed at offset {}.", parseResult.Offset());
        return std::nullopt;
    }

    return decodeValue(document);
}

std::string serializeJSON(const Value& value, bool forceASCII) {
    rapidjson::StringBuffer buffer;
    if (forceASCII) {
        rapidjson::Writer<rapidjson::StringBuffer, rapidjson::UTF8<>, rapidjson::ASCII<>> writer(buffer);
        encodeValue(value, writer);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        encodeValue(value, writer);
    }
    return std::string(buffer.GetString(), buffer.GetSize());
}

} // namespace idlrpc
