/**
 * @file point_model.hpp
 * @brief modbusconf source file.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace mbc {

/**
 * @brief Access class of a Modbus point.
 */
enum class PointKind { Coil, DiscreteInput, HoldingRegister, InputRegister };

/**
 * @brief Value encoding of a point's raw bits/registers.
 */
enum class PointEncoding { Bool, Int16, UInt16, Int32, UInt32, Float32, Float64, String };

/// Largest valid register/bit address.
constexpr std::uint32_t kMaxPointAddress = 0xFFFFU;
/// Largest valid secondary-device (unit) id.
constexpr std::uint32_t kMaxUnitId = 0xFFU;

using CatalogClock = std::chrono::system_clock;

/**
 * @brief Read/write capability pair carried by a point.
 */
struct PointCapability {
    bool readable = true;
    bool writable = false;
};

/**
 * @brief Dialect-neutral controller (physical field-bus device).
 *
 * Duplicate detection uses (host, port), never the opaque id.
 */
struct CanonicalController {
    /// Opaque id assigned by the catalog store.
    std::string id;
    std::string name;
    std::string host;
    std::uint16_t port = 502;
    /// Request timeout in seconds.
    int timeoutSeconds = 10;
    /// Liveness flag; imported controllers start offline.
    bool online = false;
    CatalogClock::time_point createdAt{};
    CatalogClock::time_point updatedAt{};
};

/**
 * @brief Dialect-neutral addressable data point.
 */
struct CanonicalPoint {
    /// Opaque id assigned by the catalog store.
    std::string id;
    std::string controllerId;
    std::string name;
    std::optional<std::string> description;
    PointKind kind = PointKind::HoldingRegister;
    PointEncoding encoding = PointEncoding::UInt16;
    std::uint32_t address = 0;
    /// Register or bit count.
    std::uint32_t length = 1;
    /// Secondary-device id multiplexed behind one host:port.
    std::uint32_t unitId = 1;
    /// Scaling expression over a placeholder value, evaluated by device I/O.
    std::optional<std::string> formula;
    std::optional<std::string> unit;
    std::optional<double> minValue;
    std::optional<double> maxValue;
    PointCapability capability{};
    CatalogClock::time_point createdAt{};
    CatalogClock::time_point updatedAt{};
};

/**
 * @brief Natural key of a point: (controller id, unit id, address, kind).
 */
struct PointNaturalKey {
    std::string controllerId;
    std::uint32_t unitId = 1;
    std::uint32_t address = 0;
    PointKind kind = PointKind::HoldingRegister;

    bool operator==(const PointNaturalKey& other) const = default;
};

PointNaturalKey naturalKeyOf(const CanonicalPoint& point);

/**
 * @brief True for kinds that accept writes (coil, holding register).
 */
constexpr bool isWritableKind(PointKind kind) {
    return kind == PointKind::Coil || kind == PointKind::HoldingRegister;
}

/**
 * @brief True for single-bit kinds (coil, discrete input).
 */
constexpr bool isBitKind(PointKind kind) {
    return kind == PointKind::Coil || kind == PointKind::DiscreteInput;
}

const char* toString(PointKind kind);
const char* toString(PointEncoding encoding);

/**
 * @brief Parse a native kind label ("coil", "input", "holding_register", ...).
 */
std::optional<PointKind> parsePointKind(const std::string& text);
std::optional<PointEncoding> parsePointEncoding(const std::string& text);

/**
 * @brief Drop write capability from read-only kinds.
 * @return true when a requested write capability was removed.
 */
bool demoteWriteCapability(CanonicalPoint& point);

/**
 * @brief Check address/length/unit ranges and bound ordering.
 *
 * Throws ConfigProcessingError naming the point on the first violation.
 */
void checkPointFields(const CanonicalPoint& point);

} // namespace mbc
