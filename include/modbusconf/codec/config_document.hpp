/**
 * @file config_document.hpp
 * @brief modbusconf source file.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <json/json.h>

#include "modbusconf/model/point_model.hpp"

namespace mbc {

/**
 * @brief On-disk configuration dialect.
 */
enum class ConfigDialect { Native, Gateway };

const char* toString(ConfigDialect dialect);

/**
 * @brief Parse "native", "gateway" (or the legacy "thingsboard" alias).
 */
std::optional<ConfigDialect> parseConfigDialect(const std::string& text);

/**
 * @brief Same as parseConfigDialect() but raises ConfigFormatError.
 */
ConfigDialect requireConfigDialect(const std::string& text);

// ---- native dialect -------------------------------------------------------

struct NativeController {
    std::string name;
    std::string host;
    std::int64_t port = 0;
    std::optional<std::int64_t> timeout;
};

/**
 * @brief One `points[]` entry of a native document.
 *
 * Numeric fields keep the raw document width; range checks happen on decode.
 */
struct NativePoint {
    std::string name;
    std::optional<std::string> description;
    PointKind kind = PointKind::HoldingRegister;
    PointEncoding encoding = PointEncoding::UInt16;
    std::int64_t address = 0;
    std::optional<std::int64_t> length;
    std::optional<std::int64_t> unitId;
    std::optional<std::string> formula;
    std::optional<std::string> unit;
    std::optional<double> minValue;
    std::optional<double> maxValue;
    std::optional<bool> writable;
};

struct NativeDocument {
    std::string exportTime;
    NativeController controller;
    std::vector<NativePoint> points;
};

// ---- gateway dialect ------------------------------------------------------

/**
 * @brief Section of a gateway slave block holding an entry.
 */
enum class GatewaySection { Attributes, Timeseries, Rpc };

const char* toString(GatewaySection section);

struct GatewayEntry {
    std::string tag;
    /// Wire-type label ("bits", "int16", ...); empty when absent.
    std::string type;
    int functionCode = 0;
    std::int64_t address = 0;
    std::optional<std::int64_t> objectsCount;
};

struct GatewaySlave {
    std::string method = "socket";
    std::string type = "tcp";
    std::string host;
    std::int64_t port = 0;
    std::optional<std::int64_t> timeout;
    int retries = 3;
    int pollPeriod = 1000;
    std::optional<std::int64_t> unitId;
    std::string deviceName;
    std::string deviceType;
    std::vector<GatewayEntry> attributes;
    std::vector<GatewayEntry> timeseries;
    std::vector<GatewayEntry> rpc;

    const std::vector<GatewayEntry>& section(GatewaySection which) const;
    std::vector<GatewayEntry>& section(GatewaySection which);
};

struct GatewayDocument {
    std::string exportTime;
    std::vector<GatewaySlave> slaves;
};

/**
 * @brief Tagged dialect document; the alternative is the discriminator.
 */
using ConfigDocument = std::variant<NativeDocument, GatewayDocument>;

ConfigDialect dialectOf(const ConfigDocument& document);

/**
 * @brief Conversion between JSON trees and typed dialect documents.
 *
 * fromJson() expects a tree already accepted by ConfigValidator; it still
 * raises ConfigFormatError on a type mismatch instead of guessing.
 */
class ConfigDocumentJson {
public:
    static ConfigDocument fromJson(const Json::Value& root, ConfigDialect dialect);
    static Json::Value toJson(const ConfigDocument& document);

    static Json::Value parse(const std::string& text);
    static std::string serialize(const Json::Value& root);
};

} // namespace mbc
