/**
 * @file format_codec.cpp
 * @brief modbusconf source file.
 */

#include "modbusconf/codec/format_codec.hpp"

#include <cctype>
#include <iostream>
#include <limits>
#include <map>
#include <utility>

#include "modbusconf/codec/function_code_map.hpp"
#include "modbusconf/codec/gateway_point_builder.hpp"
#include "modbusconf/core/config_errors.hpp"

namespace mbc {
namespace {

std::string deviceTypeFor(const std::string& name) {
    std::string type;
    type.reserve(name.size());
    for (const unsigned char c : name) {
        type.push_back(c == ' ' ? '_' : static_cast<char>(std::tolower(c)));
    }
    return type;
}

const char* wireTypeLabel(PointEncoding encoding) {
    return encoding == PointEncoding::Bool ? "bits" : toString(encoding);
}

std::uint16_t checkedPort(std::int64_t port) {
    if (port < 1 || port > 0xFFFF) {
        throw ConfigFormatError("controller: port " + std::to_string(port) + " outside 1..65535");
    }
    return static_cast<std::uint16_t>(port);
}

int checkedTimeout(const std::optional<std::int64_t>& timeout, int fallback) {
    if (!timeout) {
        return fallback;
    }
    if (*timeout <= 0 || *timeout > std::numeric_limits<int>::max()) {
        throw ConfigFormatError("controller: timeout " + std::to_string(*timeout) + " must be positive");
    }
    return static_cast<int>(*timeout);
}

std::uint32_t checkedField(std::int64_t value, std::int64_t maxValue, const std::string& point,
                           const char* field) {
    if (value < 0 || value > maxValue) {
        throw ConfigProcessingError("Point '" + point + "': " + field + " " + std::to_string(value) +
                                    " out of range");
    }
    return static_cast<std::uint32_t>(value);
}

} // namespace

const CanonicalPoint& IncomingPoint::require() const {
    if (!point) {
        throw ConfigProcessingError(error.empty() ? "Point '" + name + "' could not be decoded" : error);
    }
    return *point;
}

FormatCodec::FormatCodec(CodecOptions options) : options_(std::move(options)) {}

ConfigDocument FormatCodec::encode(const CanonicalController& controller,
                                   const std::vector<CanonicalPoint>& points,
                                   ConfigDialect dialect,
                                   const std::string& exportTime) const {
    switch (dialect) {
    case ConfigDialect::Native: {
        auto document = encodeNative(controller, points);
        document.exportTime = exportTime;
        return document;
    }
    case ConfigDialect::Gateway: {
        auto document = encodeGateway(controller, points);
        document.exportTime = exportTime;
        return document;
    }
    }
    throw ConfigFormatError("Unsupported format: " + std::to_string(static_cast<int>(dialect)));
}

NativeDocument FormatCodec::encodeNative(const CanonicalController& controller,
                                         const std::vector<CanonicalPoint>& points) const {
    NativeDocument document;
    document.controller.name = controller.name;
    document.controller.host = controller.host;
    document.controller.port = controller.port;
    document.controller.timeout = controller.timeoutSeconds;

    document.points.reserve(points.size());
    for (const auto& point : points) {
        NativePoint entry;
        entry.name = point.name;
        entry.description = point.description;
        entry.kind = point.kind;
        entry.encoding = point.encoding;
        entry.address = point.address;
        entry.length = point.length;
        entry.unitId = point.unitId;
        entry.formula = point.formula;
        entry.unit = point.unit;
        entry.minValue = point.minValue;
        entry.maxValue = point.maxValue;
        // Only an explicitly disabled write on a writable kind needs spelling out.
        if (isWritableKind(point.kind) && !point.capability.writable) {
            entry.writable = false;
        }
        document.points.push_back(std::move(entry));
    }
    return document;
}

GatewayDocument FormatCodec::encodeGateway(const CanonicalController& controller,
                                           const std::vector<CanonicalPoint>& points) const {
    std::map<std::uint32_t, std::vector<const CanonicalPoint*>> byUnit;
    for (const auto& point : points) {
        byUnit[point.unitId].push_back(&point);
    }

    GatewayDocument document;
    if (byUnit.empty()) {
        document.slaves.push_back(encodeSlave(controller, options_.defaultUnitId, {}));
        return document;
    }
    for (const auto& [unitId, unitPoints] : byUnit) {
        document.slaves.push_back(encodeSlave(controller, unitId, unitPoints));
    }
    return document;
}

GatewaySlave FormatCodec::encodeSlave(const CanonicalController& controller, std::uint32_t unitId,
                                      const std::vector<const CanonicalPoint*>& points) const {
    GatewaySlave slave;
    slave.host = controller.host;
    slave.port = controller.port;
    slave.timeout = controller.timeoutSeconds;
    slave.retries = options_.gatewayRetries;
    slave.pollPeriod = options_.gatewayPollPeriodMs;
    slave.unitId = unitId;
    slave.deviceName = controller.name;
    slave.deviceType = deviceTypeFor(controller.name);

    for (const auto* point : points) {
        GatewayEntry read;
        read.tag = point->name;
        read.type = wireTypeLabel(point->encoding);
        read.functionCode = toInt(FunctionCodeMap::readCode(point->kind));
        read.address = point->address;
        read.objectsCount = point->length;
        if (isBitKind(point->kind)) {
            slave.attributes.push_back(read);
        } else {
            slave.timeseries.push_back(read);
        }

        if (!isWritableKind(point->kind) || !point->capability.writable) {
            continue;
        }
        const auto writeCode = FunctionCodeMap::writeCode(point->kind, point->length);
        if (!writeCode) {
            continue;
        }
        GatewayEntry rpc;
        rpc.tag = options_.writeTagPrefix + point->name;
        rpc.type = read.type;
        rpc.functionCode = toInt(*writeCode);
        rpc.address = point->address;
        if (!isBitKind(point->kind)) {
            rpc.objectsCount = point->length;
        }
        slave.rpc.push_back(std::move(rpc));
    }
    return slave;
}

DecodedConfig FormatCodec::decode(const ConfigDocument& document, DecodePolicy policy) const {
    if (const auto* native = std::get_if<NativeDocument>(&document)) {
        return decodeNative(*native, policy);
    }
    if (const auto* gateway = std::get_if<GatewayDocument>(&document)) {
        return decodeGateway(*gateway, policy);
    }
    throw ConfigFormatError("Unsupported configuration dialect");
}

DecodedConfig FormatCodec::decodeNative(const NativeDocument& document, DecodePolicy policy) const {
    DecodedConfig decoded;
    decoded.controller.name = document.controller.name;
    decoded.controller.host = document.controller.host;
    decoded.controller.port = checkedPort(document.controller.port);
    decoded.controller.timeoutSeconds = checkedTimeout(document.controller.timeout,
                                                       options_.defaultTimeoutSeconds);
    decoded.controller.online = false;

    decoded.points.reserve(document.points.size());
    for (const auto& entry : document.points) {
        IncomingPoint incoming;
        incoming.name = entry.name;
        try {
            CanonicalPoint point;
            point.name = entry.name;
            point.description = entry.description;
            point.kind = entry.kind;
            point.encoding = entry.encoding;
            point.address = checkedField(entry.address, kMaxPointAddress, entry.name, "address");
            point.length = entry.length
                               ? checkedField(*entry.length, kMaxPointAddress + 1, entry.name, "len")
                               : options_.defaultLength;
            point.unitId = entry.unitId ? checkedField(*entry.unitId, kMaxUnitId, entry.name, "unit_id")
                                        : options_.defaultUnitId;
            point.formula = entry.formula;
            point.unit = entry.unit;
            point.minValue = entry.minValue;
            point.maxValue = entry.maxValue;
            point.capability.readable = true;
            point.capability.writable = entry.writable.value_or(isWritableKind(entry.kind));
            if (demoteWriteCapability(point) && options_.traceCodec) {
                std::cerr << "[mbc-codec] point " << point.name << " (type: " << toString(point.kind)
                          << ") cannot be written, ignoring write capability\n";
            }
            checkPointFields(point);
            incoming.point = std::move(point);
        } catch (const ConfigProcessingError& ex) {
            if (policy == DecodePolicy::Strict) {
                throw;
            }
            incoming.error = ex.what();
        }
        decoded.points.push_back(std::move(incoming));
    }
    return decoded;
}

DecodedConfig FormatCodec::decodeGateway(const GatewayDocument& document, DecodePolicy policy) const {
    if (document.slaves.size() > 1U) {
        throw DuplicateError("Gateway document contains " + std::to_string(document.slaves.size()) +
                             " slaves; only one controller per document is allowed "
                             "(single-controller-per-document constraint)");
    }
    if (document.slaves.empty()) {
        throw ConfigFormatError("Gateway document contains no slave");
    }
    const auto& slave = document.slaves.front();

    DecodedConfig decoded;
    decoded.controller.name = slave.deviceName.empty() ? "Imported Controller" : slave.deviceName;
    decoded.controller.host = slave.host;
    decoded.controller.port = checkedPort(slave.port);
    decoded.controller.timeoutSeconds = checkedTimeout(slave.timeout, options_.defaultTimeoutSeconds);
    decoded.controller.online = false;

    const auto unitId = slave.unitId.value_or(options_.defaultUnitId);
    if (unitId < 0 || unitId > static_cast<std::int64_t>(kMaxUnitId)) {
        throw ConfigFormatError("Slave 0: unitId " + std::to_string(unitId) + " outside 0..255");
    }

    GatewayPointBuilder builder(static_cast<std::uint32_t>(unitId), options_.writeTagPrefix,
                                options_.defaultLength);
    for (const auto section : {GatewaySection::Attributes, GatewaySection::Timeseries, GatewaySection::Rpc}) {
        for (const auto& entry : slave.section(section)) {
            try {
                builder.add(section, entry);
            } catch (const ConfigProcessingError& ex) {
                if (policy == DecodePolicy::Strict) {
                    throw;
                }
                if (options_.traceCodec) {
                    std::cerr << "[mbc-codec] " << ex.what() << '\n';
                }
                builder.addFailure(entry.tag, ex.what());
            }
        }
    }

    std::vector<std::string> demoted;
    decoded.points = builder.build(demoted);
    if (options_.traceCodec) {
        for (const auto& name : demoted) {
            std::cerr << "[mbc-codec] point " << name
                      << " is read-only, ignoring write capability from rpc section\n";
        }
    }
    return decoded;
}

} // namespace mbc
