/**
 * @file config_validator.cpp
 * @brief modbusconf source file.
 */

#include "modbusconf/config/config_validator.hpp"

#include <set>
#include <sstream>
#include <tuple>

#include "modbusconf/codec/function_code_map.hpp"
#include "modbusconf/core/config_errors.hpp"

namespace mbc {
namespace {

using Issues = std::vector<ValidationIssue>;

void error(Issues& issues, const std::string& message) {
    issues.push_back({ValidationSeverity::Error, message, false});
}

void warning(Issues& issues, const std::string& message) {
    issues.push_back({ValidationSeverity::Warning, message, false});
}

bool has(const Json::Value& object, const char* key) {
    return object.isObject() && object.isMember(key);
}

std::string textOf(const Json::Value& value) {
    return value.isString() ? value.asString() : "<" + std::string(value.isNull() ? "null" : "non-string") + ">";
}

bool isNonNegativeInteger(const Json::Value& value) {
    return value.isInt64() && value.asInt64() >= 0;
}

bool hasNativeFingerprint(const Json::Value& root) {
    return (has(root, "controller") && has(root, "points")) || has(root, "controllers");
}

bool hasGatewayFingerprint(const Json::Value& root) {
    return has(root, "master") && has(root["master"], "slaves");
}

void checkIntegerRange(Issues& issues, const Json::Value& object, const char* key,
                       std::int64_t minValue, std::int64_t maxValue, const std::string& where) {
    if (!has(object, key) || object[key].isNull()) {
        return;
    }
    const auto& value = object[key];
    if (!value.isInt64() || value.asInt64() < minValue || value.asInt64() > maxValue) {
        std::ostringstream os;
        os << where << ": '" << key << "' must be an integer in " << minValue << ".." << maxValue;
        error(issues, os.str());
    }
}

void checkNativeController(Issues& issues, const Json::Value& controller, const std::string& where) {
    if (!controller.isObject()) {
        error(issues, where + ": must be an object");
        return;
    }
    for (const char* field : {"name", "host", "port"}) {
        if (!has(controller, field)) {
            error(issues, "Missing required field '" + std::string(field) + "' in " + where);
        }
    }
    for (const char* field : {"name", "host"}) {
        if (has(controller, field) && !controller[field].isString()) {
            error(issues, where + ": '" + field + "' must be a string");
        }
    }
    checkIntegerRange(issues, controller, "port", 1, 65535, where);
    if (!has(controller, "timeout") || controller["timeout"].isNull()) {
        warning(issues, where + ": 'timeout' missing, default timeout applies");
    } else {
        checkIntegerRange(issues, controller, "timeout", 1, 2147483647, where);
    }
}

void checkNativePoints(Issues& issues, const Json::Value& points, const std::string& prefix) {
    if (points.isNull()) {
        return;
    }
    if (!points.isArray()) {
        error(issues, "'points' must be an array");
        return;
    }

    std::set<std::tuple<std::int64_t, std::int64_t, std::string>> seen;
    for (Json::ArrayIndex i = 0; i < points.size(); ++i) {
        const auto& point = points[i];
        const auto where = prefix + std::to_string(i);
        if (!point.isObject()) {
            error(issues, where + ": must be an object");
            continue;
        }
        for (const char* field : {"name", "type", "data_type", "address"}) {
            if (!has(point, field)) {
                error(issues, where + ": Missing required field '" + field + "'");
            }
        }
        if (has(point, "name") && !point["name"].isString()) {
            error(issues, where + ": 'name' must be a string");
        }

        std::optional<PointKind> kind;
        if (has(point, "type")) {
            kind = point["type"].isString() ? parsePointKind(point["type"].asString()) : std::nullopt;
            if (!kind) {
                error(issues, where + ": Invalid type '" + textOf(point["type"]) + "'");
            }
        }
        if (has(point, "data_type") &&
            (!point["data_type"].isString() || !parsePointEncoding(point["data_type"].asString()))) {
            error(issues, where + ": Invalid data_type '" + textOf(point["data_type"]) + "'");
        }
        if (has(point, "address")) {
            if (!isNonNegativeInteger(point["address"])) {
                error(issues, where + ": 'address' must be a non-negative integer");
            } else if (point["address"].asInt64() > static_cast<std::int64_t>(kMaxPointAddress)) {
                warning(issues, where + ": address " + std::to_string(point["address"].asInt64()) +
                                    " outside 0..65535, point will be rejected");
            }
        }
        checkIntegerRange(issues, point, "len", 1, 65536, where);
        checkIntegerRange(issues, point, "unit_id", 0, kMaxUnitId, where);
        for (const char* field : {"min_value", "max_value"}) {
            if (has(point, field) && !point[field].isNull() && !point[field].isNumeric()) {
                error(issues, where + ": '" + field + "' must be a number or null");
            }
        }
        for (const char* field : {"description", "formula", "unit"}) {
            if (has(point, field) && !point[field].isNull() && !point[field].isString()) {
                error(issues, where + ": '" + field + "' must be a string or null");
            }
        }
        if (has(point, "writable") && !point["writable"].isNull()) {
            if (!point["writable"].isBool()) {
                error(issues, where + ": 'writable' must be a boolean");
            } else if (point["writable"].asBool() && kind && !isWritableKind(*kind)) {
                warning(issues, where + ": type '" + std::string(toString(*kind)) +
                                    "' is read-only, write capability will be dropped");
            }
        }

        if (kind && has(point, "address") && isNonNegativeInteger(point["address"])) {
            const auto& unitValue = point["unit_id"];
            const std::int64_t unitId = unitValue.isInt64() ? unitValue.asInt64() : 1;
            const auto key = std::make_tuple(unitId, point["address"].asInt64(), std::string(toString(*kind)));
            if (!seen.insert(key).second) {
                warning(issues, where + ": duplicates unit/address/type of an earlier point");
            }
        }
    }
}

void validateNative(Issues& issues, const Json::Value& root) {
    const bool hasSingle = has(root, "controller") && has(root, "points");
    const bool hasMulti = has(root, "controllers");

    if (!hasSingle && !hasMulti) {
        error(issues, "Missing 'controller' and 'points' sections or 'controllers' section in native format");
        return;
    }

    if (hasSingle) {
        if (hasMulti) {
            warning(issues, "'controllers' section ignored because 'controller' is present");
        }
        checkNativeController(issues, root["controller"], "controller");
        if (root["points"].isNull()) {
            error(issues, "'points' must be an array");
        } else {
            checkNativePoints(issues, root["points"], "Point ");
        }
        return;
    }

    const auto& controllers = root["controllers"];
    if (!controllers.isArray()) {
        error(issues, "'controllers' must be an array");
        return;
    }
    if (controllers.empty()) {
        error(issues, "'controllers' list is empty");
        return;
    }
    if (controllers.size() > 1U) {
        issues.push_back({ValidationSeverity::Error,
                          "Native document lists " + std::to_string(controllers.size()) +
                              " controllers; only one controller per document is allowed "
                              "(single-controller-per-document constraint)",
                          true});
    }
    for (Json::ArrayIndex i = 0; i < controllers.size(); ++i) {
        const auto where = "Controller " + std::to_string(i);
        checkNativeController(issues, controllers[i], where);
        if (controllers[i].isObject()) {
            checkNativePoints(issues, controllers[i]["points"], where + " Point ");
        }
    }
}

void checkGatewayEntry(Issues& issues, const Json::Value& item, GatewaySection section,
                       const std::string& where) {
    if (!item.isObject()) {
        error(issues, where + ": must be an object");
        return;
    }
    if (!has(item, "tag")) {
        error(issues, where + ": Missing 'tag' field");
    } else if (!item["tag"].isString()) {
        error(issues, where + ": 'tag' must be a string");
    }
    if (!has(item, "functionCode")) {
        error(issues, where + ": Missing 'functionCode' field");
    } else if (!item["functionCode"].isInt()) {
        error(issues, where + ": 'functionCode' must be an integer");
    } else {
        const auto mapping = FunctionCodeMap::lookup(item["functionCode"].asInt());
        if (!mapping) {
            warning(issues, where + ": functionCode " + std::to_string(item["functionCode"].asInt()) +
                                " is not mapped, point will be rejected");
        } else if (section == GatewaySection::Rpc && !isWritableKind(mapping->kind)) {
            warning(issues, where + ": functionCode " + std::to_string(item["functionCode"].asInt()) +
                                " addresses a read-only kind, write capability will be dropped");
        }
    }
    if (!has(item, "address")) {
        error(issues, where + ": Missing 'address' field");
    } else if (!isNonNegativeInteger(item["address"])) {
        error(issues, where + ": 'address' must be a non-negative integer");
    }
    checkIntegerRange(issues, item, "objectsCount", 1, 65536, where);
    if (has(item, "type") && !item["type"].isString()) {
        error(issues, where + ": 'type' must be a string");
    }
}

void validateGateway(Issues& issues, const Json::Value& root) {
    if (!has(root, "master")) {
        error(issues, "Missing 'master' section in gateway format");
        return;
    }
    const auto& master = root["master"];
    if (!master.isObject() || !has(master, "slaves")) {
        error(issues, "Missing 'slaves' section in master");
        return;
    }
    const auto& slaves = master["slaves"];
    if (!slaves.isArray()) {
        error(issues, "'master.slaves' must be an array");
        return;
    }
    if (slaves.empty()) {
        error(issues, "'master.slaves' must contain exactly one slave");
        return;
    }
    if (slaves.size() > 1U) {
        issues.push_back({ValidationSeverity::Error,
                          "Gateway document contains " + std::to_string(slaves.size()) +
                              " slaves; only one controller per document is allowed "
                              "(single-controller-per-document constraint)",
                          true});
    }

    for (Json::ArrayIndex i = 0; i < slaves.size(); ++i) {
        const auto& slave = slaves[i];
        const auto where = "Slave " + std::to_string(i);
        if (!slave.isObject()) {
            error(issues, where + ": must be an object");
            continue;
        }
        for (const char* field : {"host", "port", "deviceName"}) {
            if (!has(slave, field)) {
                error(issues, where + ": Missing required field '" + field + "'");
            }
        }
        for (const char* field : {"host", "deviceName"}) {
            if (has(slave, field) && !slave[field].isString()) {
                error(issues, where + ": '" + field + "' must be a string");
            }
        }
        checkIntegerRange(issues, slave, "port", 1, 65535, where);
        checkIntegerRange(issues, slave, "unitId", 0, kMaxUnitId, where);
        if (!has(slave, "timeout") || slave["timeout"].isNull()) {
            warning(issues, where + ": 'timeout' missing, default timeout applies");
        } else {
            checkIntegerRange(issues, slave, "timeout", 1, 2147483647, where);
        }

        for (const auto section : {GatewaySection::Attributes, GatewaySection::Timeseries, GatewaySection::Rpc}) {
            const char* key = toString(section);
            if (!has(slave, key) || slave[key].isNull()) {
                continue;
            }
            const auto& items = slave[key];
            if (!items.isArray()) {
                error(issues, where + ": '" + key + "' must be an array");
                continue;
            }
            for (Json::ArrayIndex j = 0; j < items.size(); ++j) {
                checkGatewayEntry(issues, items[j], section, where + " " + key + " " + std::to_string(j));
            }
        }
    }
}

} // namespace

bool ValidationResult::isValid() const { return !ConfigurationValidator::hasErrors(issues); }

std::vector<std::string> ValidationResult::errors() const {
    std::vector<std::string> out;
    for (const auto& issue : issues) {
        if (issue.severity == ValidationSeverity::Error) {
            out.push_back(issue.message);
        }
    }
    return out;
}

std::vector<std::string> ValidationResult::warnings() const {
    std::vector<std::string> out;
    for (const auto& issue : issues) {
        if (issue.severity == ValidationSeverity::Warning) {
            out.push_back(issue.message);
        }
    }
    return out;
}

Json::Value ValidationResult::toJson() const {
    Json::Value root(Json::objectValue);
    root["is_valid"] = isValid();
    root["errors"] = Json::Value(Json::arrayValue);
    root["warnings"] = Json::Value(Json::arrayValue);
    for (const auto& message : errors()) {
        root["errors"].append(message);
    }
    for (const auto& message : warnings()) {
        root["warnings"].append(message);
    }
    return root;
}

std::optional<ConfigDialect> ConfigurationValidator::detectDialect(const Json::Value& root) {
    if (hasGatewayFingerprint(root)) {
        return ConfigDialect::Gateway;
    }
    if (hasNativeFingerprint(root)) {
        return ConfigDialect::Native;
    }
    return std::nullopt;
}

ValidationResult ConfigurationValidator::validate(const Json::Value& root, ConfigDialect expected) {
    ValidationResult result;
    if (!root.isObject()) {
        error(result.issues, "Configuration document must be a JSON object");
        return result;
    }

    switch (expected) {
    case ConfigDialect::Native:
        if (hasGatewayFingerprint(root)) {
            throw FormatMismatchError(toString(ConfigDialect::Native), toString(ConfigDialect::Gateway));
        }
        validateNative(result.issues, root);
        return result;
    case ConfigDialect::Gateway:
        if (hasNativeFingerprint(root)) {
            throw FormatMismatchError(toString(ConfigDialect::Gateway), toString(ConfigDialect::Native));
        }
        validateGateway(result.issues, root);
        return result;
    }
    throw ConfigFormatError("Unsupported configuration dialect");
}

void ConfigurationValidator::requireValid(const Json::Value& root, ConfigDialect expected) {
    const auto result = validate(root, expected);
    for (const auto& issue : result.issues) {
        if (issue.singleController) {
            throw DuplicateError(issue.message);
        }
    }
    for (const auto& issue : result.issues) {
        if (issue.severity == ValidationSeverity::Error) {
            throw ConfigFormatError("Invalid configuration: " + issue.message);
        }
    }
}

ConfigDocument ConfigurationValidator::parseDocument(const Json::Value& root, ConfigDialect expected) {
    requireValid(root, expected);
    return ConfigDocumentJson::fromJson(root, expected);
}

bool ConfigurationValidator::hasErrors(const std::vector<ValidationIssue>& issues) {
    for (const auto& issue : issues) {
        if (issue.severity == ValidationSeverity::Error) {
            return true;
        }
    }
    return false;
}

} // namespace mbc
