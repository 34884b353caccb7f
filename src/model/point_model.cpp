/**
 * @file point_model.cpp
 * @brief modbusconf source file.
 */

#include "modbusconf/model/point_model.hpp"

#include <sstream>

#include "modbusconf/core/config_errors.hpp"

namespace mbc {

PointNaturalKey naturalKeyOf(const CanonicalPoint& point) {
    PointNaturalKey key;
    key.controllerId = point.controllerId;
    key.unitId = point.unitId;
    key.address = point.address;
    key.kind = point.kind;
    return key;
}

const char* toString(PointKind kind) {
    switch (kind) {
    case PointKind::Coil:
        return "coil";
    case PointKind::DiscreteInput:
        return "input";
    case PointKind::HoldingRegister:
        return "holding_register";
    case PointKind::InputRegister:
        return "input_register";
    }
    return "unknown";
}

const char* toString(PointEncoding encoding) {
    switch (encoding) {
    case PointEncoding::Bool:
        return "bool";
    case PointEncoding::Int16:
        return "int16";
    case PointEncoding::UInt16:
        return "uint16";
    case PointEncoding::Int32:
        return "int32";
    case PointEncoding::UInt32:
        return "uint32";
    case PointEncoding::Float32:
        return "float32";
    case PointEncoding::Float64:
        return "float64";
    case PointEncoding::String:
        return "string";
    }
    return "unknown";
}

std::optional<PointKind> parsePointKind(const std::string& text) {
    if (text == "coil") {
        return PointKind::Coil;
    }
    if (text == "input" || text == "discrete_input") {
        return PointKind::DiscreteInput;
    }
    if (text == "holding_register") {
        return PointKind::HoldingRegister;
    }
    if (text == "input_register") {
        return PointKind::InputRegister;
    }
    return std::nullopt;
}

std::optional<PointEncoding> parsePointEncoding(const std::string& text) {
    static constexpr PointEncoding kAll[] = {
        PointEncoding::Bool,    PointEncoding::Int16,   PointEncoding::UInt16,
        PointEncoding::Int32,   PointEncoding::UInt32,  PointEncoding::Float32,
        PointEncoding::Float64, PointEncoding::String,
    };
    for (const auto encoding : kAll) {
        if (text == toString(encoding)) {
            return encoding;
        }
    }
    return std::nullopt;
}

bool demoteWriteCapability(CanonicalPoint& point) {
    if (!point.capability.writable || isWritableKind(point.kind)) {
        return false;
    }
    point.capability.writable = false;
    return true;
}

void checkPointFields(const CanonicalPoint& point) {
    std::ostringstream os;
    os << "Point '" << point.name << "': ";
    if (point.name.empty()) {
        throw ConfigProcessingError("Point name cannot be empty");
    }
    if (point.address > kMaxPointAddress) {
        os << "address " << point.address << " outside 0.." << kMaxPointAddress;
        throw ConfigProcessingError(os.str());
    }
    if (point.length == 0U) {
        os << "length must be at least 1";
        throw ConfigProcessingError(os.str());
    }
    if (point.length - 1U > kMaxPointAddress - point.address) {
        os << "range " << point.address << "+" << point.length << " exceeds address space";
        throw ConfigProcessingError(os.str());
    }
    if (point.unitId > kMaxUnitId) {
        os << "unit id " << point.unitId << " outside 0.." << kMaxUnitId;
        throw ConfigProcessingError(os.str());
    }
    if (point.minValue && point.maxValue && *point.minValue > *point.maxValue) {
        os << "min_value " << *point.minValue << " exceeds max_value " << *point.maxValue;
        throw ConfigProcessingError(os.str());
    }
}

} // namespace mbc
