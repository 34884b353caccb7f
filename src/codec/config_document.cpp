/**
 * @file config_document.cpp
 * @brief modbusconf source file.
 */

#include "modbusconf/codec/config_document.hpp"

#include <limits>
#include <memory>

#include "modbusconf/core/config_errors.hpp"

namespace mbc {
namespace {

bool isPresent(const Json::Value& object, const char* key) {
    return object.isObject() && object.isMember(key) && !object[key].isNull();
}

std::string requireString(const Json::Value& object, const char* key, const std::string& where) {
    if (!isPresent(object, key) || !object[key].isString()) {
        throw ConfigFormatError(where + ": field '" + key + "' must be a string");
    }
    return object[key].asString();
}

std::optional<std::string> optionalString(const Json::Value& object, const char* key,
                                          const std::string& where) {
    if (!isPresent(object, key)) {
        return std::nullopt;
    }
    if (!object[key].isString()) {
        throw ConfigFormatError(where + ": field '" + key + "' must be a string");
    }
    return object[key].asString();
}

std::optional<std::int64_t> optionalInteger(const Json::Value& object, const char* key,
                                            const std::string& where) {
    if (!isPresent(object, key)) {
        return std::nullopt;
    }
    if (!object[key].isInt64()) {
        throw ConfigFormatError(where + ": field '" + key + "' must be an integer");
    }
    return object[key].asInt64();
}

int narrowToInt(std::int64_t value, const char* key, const std::string& where) {
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw ConfigFormatError(where + ": field '" + key + "' " + std::to_string(value) + " out of range");
    }
    return static_cast<int>(value);
}

std::int64_t requireInteger(const Json::Value& object, const char* key, const std::string& where) {
    const auto value = optionalInteger(object, key, where);
    if (!value) {
        throw ConfigFormatError(where + ": missing required field '" + key + "'");
    }
    return *value;
}

std::optional<double> optionalNumber(const Json::Value& object, const char* key,
                                     const std::string& where) {
    if (!isPresent(object, key)) {
        return std::nullopt;
    }
    if (!object[key].isNumeric()) {
        throw ConfigFormatError(where + ": field '" + key + "' must be a number");
    }
    return object[key].asDouble();
}

Json::Value nullable(const std::optional<std::string>& value) {
    return value ? Json::Value(*value) : Json::Value(Json::nullValue);
}

Json::Value nullable(const std::optional<double>& value) {
    return value ? Json::Value(*value) : Json::Value(Json::nullValue);
}

NativeController readNativeController(const Json::Value& object, const std::string& where) {
    if (!object.isObject()) {
        throw ConfigFormatError(where + " must be an object");
    }
    NativeController controller;
    controller.name = requireString(object, "name", where);
    controller.host = requireString(object, "host", where);
    controller.port = requireInteger(object, "port", where);
    controller.timeout = optionalInteger(object, "timeout", where);
    return controller;
}

NativePoint readNativePoint(const Json::Value& object, const std::string& where) {
    if (!object.isObject()) {
        throw ConfigFormatError(where + " must be an object");
    }
    NativePoint point;
    point.name = requireString(object, "name", where);
    point.description = optionalString(object, "description", where);

    const auto kindText = requireString(object, "type", where);
    const auto kind = parsePointKind(kindText);
    if (!kind) {
        throw ConfigFormatError(where + ": Invalid type '" + kindText + "'");
    }
    point.kind = *kind;

    const auto encodingText = requireString(object, "data_type", where);
    const auto encoding = parsePointEncoding(encodingText);
    if (!encoding) {
        throw ConfigFormatError(where + ": Invalid data_type '" + encodingText + "'");
    }
    point.encoding = *encoding;

    point.address = requireInteger(object, "address", where);
    point.length = optionalInteger(object, "len", where);
    point.unitId = optionalInteger(object, "unit_id", where);
    point.formula = optionalString(object, "formula", where);
    point.unit = optionalString(object, "unit", where);
    point.minValue = optionalNumber(object, "min_value", where);
    point.maxValue = optionalNumber(object, "max_value", where);
    if (isPresent(object, "writable")) {
        if (!object["writable"].isBool()) {
            throw ConfigFormatError(where + ": field 'writable' must be a boolean");
        }
        point.writable = object["writable"].asBool();
    }
    return point;
}

NativeDocument readNative(const Json::Value& root) {
    NativeDocument document;
    if (isPresent(root, "export_time") && root["export_time"].isString()) {
        document.exportTime = root["export_time"].asString();
    }

    Json::Value controller;
    Json::Value points;
    if (isPresent(root, "controller")) {
        controller = root["controller"];
        points = root["points"];
    } else {
        const auto& list = root["controllers"];
        if (!list.isArray() || list.size() != 1U) {
            throw DuplicateError("Native document must describe exactly one controller "
                                 "(single-controller-per-document constraint)");
        }
        controller = list[0U];
        points = controller.isMember("points") ? controller["points"] : Json::Value(Json::arrayValue);
    }

    document.controller = readNativeController(controller, "controller");
    if (!points.isNull() && !points.isArray()) {
        throw ConfigFormatError("'points' must be an array");
    }
    for (Json::ArrayIndex i = 0; i < points.size(); ++i) {
        document.points.push_back(readNativePoint(points[i], "Point " + std::to_string(i)));
    }
    return document;
}

GatewayEntry readGatewayEntry(const Json::Value& object, const std::string& where) {
    if (!object.isObject()) {
        throw ConfigFormatError(where + " must be an object");
    }
    GatewayEntry entry;
    entry.tag = requireString(object, "tag", where);
    if (const auto type = optionalString(object, "type", where)) {
        entry.type = *type;
    }
    entry.functionCode = narrowToInt(requireInteger(object, "functionCode", where), "functionCode", where);
    entry.address = requireInteger(object, "address", where);
    entry.objectsCount = optionalInteger(object, "objectsCount", where);
    return entry;
}

GatewaySlave readGatewaySlave(const Json::Value& object, const std::string& where) {
    if (!object.isObject()) {
        throw ConfigFormatError(where + " must be an object");
    }
    GatewaySlave slave;
    if (const auto method = optionalString(object, "method", where)) {
        slave.method = *method;
    }
    if (const auto type = optionalString(object, "type", where)) {
        slave.type = *type;
    }
    slave.host = requireString(object, "host", where);
    slave.port = requireInteger(object, "port", where);
    slave.timeout = optionalInteger(object, "timeout", where);
    if (const auto retries = optionalInteger(object, "retries", where)) {
        slave.retries = narrowToInt(*retries, "retries", where);
    }
    if (const auto pollPeriod = optionalInteger(object, "pollPeriod", where)) {
        slave.pollPeriod = narrowToInt(*pollPeriod, "pollPeriod", where);
    }
    slave.unitId = optionalInteger(object, "unitId", where);
    slave.deviceName = requireString(object, "deviceName", where);
    if (const auto deviceType = optionalString(object, "deviceType", where)) {
        slave.deviceType = *deviceType;
    }

    for (const auto section : {GatewaySection::Attributes, GatewaySection::Timeseries, GatewaySection::Rpc}) {
        const char* key = toString(section);
        if (!isPresent(object, key)) {
            continue;
        }
        const auto& items = object[key];
        if (!items.isArray()) {
            throw ConfigFormatError(where + ": '" + key + "' must be an array");
        }
        auto& target = slave.section(section);
        for (Json::ArrayIndex i = 0; i < items.size(); ++i) {
            target.push_back(readGatewayEntry(items[i], where + " " + key + " " + std::to_string(i)));
        }
    }
    return slave;
}

GatewayDocument readGateway(const Json::Value& root) {
    GatewayDocument document;
    if (isPresent(root, "export_time") && root["export_time"].isString()) {
        document.exportTime = root["export_time"].asString();
    }
    const auto& slaves = root["master"]["slaves"];
    if (!slaves.isArray()) {
        throw ConfigFormatError("'master.slaves' must be an array");
    }
    for (Json::ArrayIndex i = 0; i < slaves.size(); ++i) {
        document.slaves.push_back(readGatewaySlave(slaves[i], "Slave " + std::to_string(i)));
    }
    return document;
}

Json::Value writeEntry(const GatewayEntry& entry) {
    Json::Value object(Json::objectValue);
    object["tag"] = entry.tag;
    object["type"] = entry.type;
    object["functionCode"] = entry.functionCode;
    object["address"] = static_cast<Json::Int64>(entry.address);
    if (entry.objectsCount) {
        object["objectsCount"] = static_cast<Json::Int64>(*entry.objectsCount);
    }
    return object;
}

Json::Value writeNative(const NativeDocument& document) {
    Json::Value root(Json::objectValue);
    root["format"] = toString(ConfigDialect::Native);
    root["export_time"] = document.exportTime;

    Json::Value controller(Json::objectValue);
    controller["name"] = document.controller.name;
    controller["host"] = document.controller.host;
    controller["port"] = static_cast<Json::Int64>(document.controller.port);
    if (document.controller.timeout) {
        controller["timeout"] = static_cast<Json::Int64>(*document.controller.timeout);
    }
    root["controller"] = controller;

    Json::Value points(Json::arrayValue);
    for (const auto& point : document.points) {
        Json::Value object(Json::objectValue);
        object["name"] = point.name;
        object["description"] = nullable(point.description);
        object["type"] = toString(point.kind);
        object["data_type"] = toString(point.encoding);
        object["address"] = static_cast<Json::Int64>(point.address);
        object["len"] = static_cast<Json::Int64>(point.length.value_or(1));
        object["unit_id"] = static_cast<Json::Int64>(point.unitId.value_or(1));
        object["formula"] = nullable(point.formula);
        object["unit"] = nullable(point.unit);
        object["min_value"] = nullable(point.minValue);
        object["max_value"] = nullable(point.maxValue);
        if (point.writable) {
            object["writable"] = *point.writable;
        }
        points.append(object);
    }
    root["points"] = points;
    return root;
}

Json::Value writeGateway(const GatewayDocument& document) {
    Json::Value slaves(Json::arrayValue);
    for (const auto& slave : document.slaves) {
        Json::Value object(Json::objectValue);
        object["method"] = slave.method;
        object["type"] = slave.type;
        object["host"] = slave.host;
        object["port"] = static_cast<Json::Int64>(slave.port);
        if (slave.timeout) {
            object["timeout"] = static_cast<Json::Int64>(*slave.timeout);
        }
        object["retries"] = slave.retries;
        object["pollPeriod"] = slave.pollPeriod;
        if (slave.unitId) {
            object["unitId"] = static_cast<Json::Int64>(*slave.unitId);
        }
        object["deviceName"] = slave.deviceName;
        object["deviceType"] = slave.deviceType;
        for (const auto section : {GatewaySection::Attributes, GatewaySection::Timeseries, GatewaySection::Rpc}) {
            Json::Value items(Json::arrayValue);
            for (const auto& entry : slave.section(section)) {
                items.append(writeEntry(entry));
            }
            object[toString(section)] = items;
        }
        slaves.append(object);
    }

    Json::Value root(Json::objectValue);
    root["master"]["slaves"] = slaves;
    root["export_time"] = document.exportTime;
    root["format"] = toString(ConfigDialect::Gateway);
    return root;
}

} // namespace

const char* toString(ConfigDialect dialect) {
    switch (dialect) {
    case ConfigDialect::Native:
        return "native";
    case ConfigDialect::Gateway:
        return "gateway";
    }
    return "unknown";
}

std::optional<ConfigDialect> parseConfigDialect(const std::string& text) {
    if (text == "native") {
        return ConfigDialect::Native;
    }
    if (text == "gateway" || text == "thingsboard") {
        return ConfigDialect::Gateway;
    }
    return std::nullopt;
}

ConfigDialect requireConfigDialect(const std::string& text) {
    const auto dialect = parseConfigDialect(text);
    if (!dialect) {
        throw ConfigFormatError("Unsupported format: " + text);
    }
    return *dialect;
}

const char* toString(GatewaySection section) {
    switch (section) {
    case GatewaySection::Attributes:
        return "attributes";
    case GatewaySection::Timeseries:
        return "timeseries";
    case GatewaySection::Rpc:
        return "rpc";
    }
    return "unknown";
}

const std::vector<GatewayEntry>& GatewaySlave::section(GatewaySection which) const {
    switch (which) {
    case GatewaySection::Attributes:
        return attributes;
    case GatewaySection::Timeseries:
        return timeseries;
    case GatewaySection::Rpc:
        break;
    }
    return rpc;
}

std::vector<GatewayEntry>& GatewaySlave::section(GatewaySection which) {
    return const_cast<std::vector<GatewayEntry>&>(static_cast<const GatewaySlave&>(*this).section(which));
}

ConfigDialect dialectOf(const ConfigDocument& document) {
    return std::holds_alternative<NativeDocument>(document) ? ConfigDialect::Native
                                                            : ConfigDialect::Gateway;
}

ConfigDocument ConfigDocumentJson::fromJson(const Json::Value& root, ConfigDialect dialect) {
    if (!root.isObject()) {
        throw ConfigFormatError("Configuration document must be a JSON object");
    }
    switch (dialect) {
    case ConfigDialect::Native:
        return readNative(root);
    case ConfigDialect::Gateway:
        return readGateway(root);
    }
    throw ConfigFormatError("Unsupported configuration dialect");
}

Json::Value ConfigDocumentJson::toJson(const ConfigDocument& document) {
    if (const auto* native = std::get_if<NativeDocument>(&document)) {
        return writeNative(*native);
    }
    return writeGateway(std::get<GatewayDocument>(document));
}

Json::Value ConfigDocumentJson::parse(const std::string& text) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["failIfExtra"] = true;
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        throw ConfigFormatError("Invalid JSON document: " + errors);
    }
    return root;
}

std::string ConfigDocumentJson::serialize(const Json::Value& root) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, root);
}

} // namespace mbc
