/**
 * @file gateway_point_builder.cpp
 * @brief modbusconf source file.
 */

#include "modbusconf/codec/gateway_point_builder.hpp"

#include <utility>

#include "modbusconf/codec/function_code_map.hpp"
#include "modbusconf/core/config_errors.hpp"

namespace mbc {
namespace {

std::string describe(GatewaySection section, const GatewayEntry& entry) {
    return std::string("Entry '") + entry.tag + "' in " + toString(section);
}

PointEncoding encodingFor(GatewaySection section, const GatewayEntry& entry) {
    if (entry.type.empty()) {
        return section == GatewaySection::Attributes ? PointEncoding::Bool : PointEncoding::UInt16;
    }
    if (entry.type == "bits") {
        return PointEncoding::Bool;
    }
    if (entry.type == "bytes") {
        return PointEncoding::UInt16;
    }
    const auto encoding = parsePointEncoding(entry.type);
    if (!encoding) {
        throw ConfigProcessingError(describe(section, entry) + ": wire type '" + entry.type +
                                    "' cannot be mapped to an encoding");
    }
    return *encoding;
}

} // namespace

GatewayPointBuilder::GatewayPointBuilder(std::uint32_t unitId,
                                         std::string writeTagPrefix,
                                         std::uint32_t defaultLength)
    : unitId_(unitId), writeTagPrefix_(std::move(writeTagPrefix)), defaultLength_(defaultLength) {}

void GatewayPointBuilder::add(GatewaySection section, const GatewayEntry& entry) {
    if (entry.tag.empty()) {
        throw ConfigProcessingError(std::string("Entry in ") + toString(section) + " has an empty tag");
    }
    const auto mapping = FunctionCodeMap::lookup(entry.functionCode);
    if (!mapping) {
        throw ConfigProcessingError(describe(section, entry) + ": function code " +
                                    std::to_string(entry.functionCode) +
                                    " cannot be mapped to a point kind");
    }
    if (entry.address < 0 || entry.address > static_cast<std::int64_t>(kMaxPointAddress)) {
        throw ConfigProcessingError(describe(section, entry) + ": address " +
                                    std::to_string(entry.address) + " out of range");
    }
    if (entry.objectsCount &&
        (*entry.objectsCount < 1 ||
         *entry.objectsCount - 1 > static_cast<std::int64_t>(kMaxPointAddress) - entry.address)) {
        throw ConfigProcessingError(describe(section, entry) + ": objectsCount " +
                                    std::to_string(*entry.objectsCount) + " out of range");
    }
    const auto address = static_cast<std::uint32_t>(entry.address);

    const Key key{static_cast<int>(mapping->kind), address, unitId_};
    auto it = indexByKey_.find(key);
    // The wire type only matters while no read entry has fixed the encoding.
    const bool encodingOpen = it == indexByKey_.end() || !slots_[it->second].encodingFromRead;
    const auto encoding = encodingOpen ? encodingFor(section, entry) : PointEncoding::UInt16;
    if (it == indexByKey_.end()) {
        Slot slot;
        slot.kind = mapping->kind;
        slot.address = address;
        slot.length = defaultLength_;
        it = indexByKey_.emplace(key, slots_.size()).first;
        slots_.push_back(std::move(slot));
    }
    auto& slot = slots_[it->second];

    if (section == GatewaySection::Rpc) {
        slot.writable = true;
        const bool prefixed = !writeTagPrefix_.empty() &&
                              entry.tag.size() > writeTagPrefix_.size() &&
                              entry.tag.compare(0, writeTagPrefix_.size(), writeTagPrefix_) == 0;
        if (prefixed) {
            slot.writeTag = entry.tag.substr(writeTagPrefix_.size());
            slot.writeTagPrefixed = true;
        } else if (slot.writeTag.empty()) {
            slot.writeTag = entry.tag;
        }
        if (!slot.encodingFromRead) {
            slot.encoding = encoding;
        }
        if (!slot.lengthFromRead && entry.objectsCount) {
            slot.length = static_cast<std::uint32_t>(*entry.objectsCount);
        }
        return;
    }

    slot.readable = true;
    if (slot.readTag.empty()) {
        slot.readTag = entry.tag;
    }
    if (!slot.encodingFromRead) {
        slot.encoding = encoding;
        slot.encodingFromRead = true;
    }
    if (!slot.lengthFromRead && entry.objectsCount) {
        slot.length = static_cast<std::uint32_t>(*entry.objectsCount);
        slot.lengthFromRead = true;
    }
}

void GatewayPointBuilder::addFailure(const std::string& tag, const std::string& reason) {
    Slot slot;
    slot.failureTag = tag;
    slot.failure = reason;
    slots_.push_back(std::move(slot));
}

std::vector<IncomingPoint> GatewayPointBuilder::build(std::vector<std::string>& demoted) const {
    std::vector<IncomingPoint> points;
    points.reserve(slots_.size());
    for (const auto& slot : slots_) {
        IncomingPoint incoming;
        if (!slot.failure.empty()) {
            incoming.name = slot.failureTag;
            incoming.error = slot.failure;
            points.push_back(std::move(incoming));
            continue;
        }

        CanonicalPoint point;
        if (slot.writeTagPrefixed || slot.readTag.empty()) {
            point.name = slot.writeTag;
        } else {
            point.name = slot.readTag;
        }
        point.kind = slot.kind;
        point.encoding = slot.encoding;
        point.address = slot.address;
        point.length = slot.length;
        point.unitId = unitId_;
        point.capability.readable = slot.readable;
        point.capability.writable = slot.writable;
        if (demoteWriteCapability(point)) {
            // A read-only kind reached only through rpc still reads.
            point.capability.readable = true;
            demoted.push_back(point.name);
        }

        incoming.name = point.name;
        incoming.point = std::move(point);
        points.push_back(std::move(incoming));
    }
    return points;
}

} // namespace mbc
