/**
 * @file function_code_map.hpp
 * @brief modbusconf source file.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>

#include "modbusconf/model/point_model.hpp"

namespace mbc {

/**
 * @brief Modbus function codes used as mapping keys.
 */
enum class FunctionCode : std::uint8_t {
    ReadCoils = 1,
    ReadDiscreteInputs = 2,
    ReadHoldingRegisters = 3,
    ReadInputRegisters = 4,
    WriteSingleCoil = 5,
    WriteSingleRegister = 6,
    WriteMultipleCoils = 15,
    WriteMultipleRegisters = 16,
};

/**
 * @brief Operation class of a function code.
 */
enum class PointAccess { Read, Write };

/**
 * @brief One row of the function code table.
 */
struct FunctionCodeEntry {
    FunctionCode code;
    PointKind kind;
    PointAccess access;
    /// True for the multi-object write variants (15, 16).
    bool multiple;
};

/**
 * @brief Result of mapping a raw function code back to a point kind.
 */
struct FunctionCodeMapping {
    PointKind kind;
    PointAccess access;
};

/**
 * @brief Static bidirectional mapping between function codes and
 *        {point kind, capability}.
 */
class FunctionCodeMap {
public:
    static constexpr std::array<FunctionCodeEntry, 8> kTable{{
        {FunctionCode::ReadCoils, PointKind::Coil, PointAccess::Read, false},
        {FunctionCode::ReadDiscreteInputs, PointKind::DiscreteInput, PointAccess::Read, false},
        {FunctionCode::ReadHoldingRegisters, PointKind::HoldingRegister, PointAccess::Read, false},
        {FunctionCode::ReadInputRegisters, PointKind::InputRegister, PointAccess::Read, false},
        {FunctionCode::WriteSingleCoil, PointKind::Coil, PointAccess::Write, false},
        {FunctionCode::WriteSingleRegister, PointKind::HoldingRegister, PointAccess::Write, false},
        {FunctionCode::WriteMultipleCoils, PointKind::Coil, PointAccess::Write, true},
        {FunctionCode::WriteMultipleRegisters, PointKind::HoldingRegister, PointAccess::Write, true},
    }};

    static constexpr std::optional<FunctionCodeMapping> lookup(int rawCode) {
        for (const auto& entry : kTable) {
            if (static_cast<int>(entry.code) == rawCode) {
                return FunctionCodeMapping{entry.kind, entry.access};
            }
        }
        return std::nullopt;
    }

    static constexpr FunctionCode readCode(PointKind kind) {
        for (const auto& entry : kTable) {
            if (entry.kind == kind && entry.access == PointAccess::Read) {
                return entry.code;
            }
        }
        // Unreachable for a complete table; verified below.
        return FunctionCode::ReadHoldingRegisters;
    }

    /**
     * @brief Write code for a kind, or empty for read-only kinds.
     *
     * The multiple-object variant is selected when @p count exceeds one.
     */
    static constexpr std::optional<FunctionCode> writeCode(PointKind kind, std::uint32_t count = 1U) {
        std::optional<FunctionCode> single;
        std::optional<FunctionCode> multiple;
        for (const auto& entry : kTable) {
            if (entry.kind != kind || entry.access != PointAccess::Write) {
                continue;
            }
            if (entry.multiple) {
                multiple = entry.code;
            } else {
                single = entry.code;
            }
        }
        if (count > 1U && multiple) {
            return multiple;
        }
        return single;
    }

    static constexpr bool hasReadCode(PointKind kind) {
        for (const auto& entry : kTable) {
            if (entry.kind == kind && entry.access == PointAccess::Read) {
                return true;
            }
        }
        return false;
    }

    static constexpr bool hasWriteCode(PointKind kind) {
        for (const auto& entry : kTable) {
            if (entry.kind == kind && entry.access == PointAccess::Write) {
                return true;
            }
        }
        return false;
    }

    static constexpr bool isComplete() {
        constexpr PointKind kinds[] = {PointKind::Coil, PointKind::DiscreteInput,
                                       PointKind::HoldingRegister, PointKind::InputRegister};
        for (const auto kind : kinds) {
            if (!hasReadCode(kind) || hasWriteCode(kind) != isWritableKind(kind)) {
                return false;
            }
        }
        return true;
    }
};

static_assert(FunctionCodeMap::isComplete(),
              "every kind needs a read code; exactly the writable kinds need write codes");
static_assert(FunctionCodeMap::readCode(PointKind::InputRegister) == FunctionCode::ReadInputRegisters);
static_assert(!FunctionCodeMap::writeCode(PointKind::DiscreteInput).has_value());

inline int toInt(FunctionCode code) { return static_cast<int>(code); }

} // namespace mbc
