/**
 * @file gateway_point_builder.hpp
 * @brief modbusconf source file.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <tuple>
#include <vector>

#include "modbusconf/codec/config_document.hpp"
#include "modbusconf/codec/format_codec.hpp"

namespace mbc {

/**
 * @brief Accumulates gateway section entries of one slave into points.
 *
 * Entries are keyed by (kind, address, unit id). Read sections (attributes,
 * timeseries) grant read capability, the rpc section grants write capability.
 * An rpc tag carrying the write prefix names the point once stripped. Points
 * materialize in order of first appearance.
 */
class GatewayPointBuilder {
public:
    GatewayPointBuilder(std::uint32_t unitId, std::string writeTagPrefix, std::uint32_t defaultLength);

    /**
     * @brief Fold one section entry into the builder.
     * @throws ConfigProcessingError naming the tag when the entry cannot be mapped.
     */
    void add(GatewaySection section, const GatewayEntry& entry);

    /**
     * @brief Keep an unmappable entry as a failed incoming point.
     */
    void addFailure(const std::string& tag, const std::string& reason);

    /**
     * @brief Materialize the accumulated points.
     *
     * Write capability requested for read-only kinds is dropped; the names of
     * affected points are appended to @p demoted.
     */
    std::vector<IncomingPoint> build(std::vector<std::string>& demoted) const;

    std::size_t size() const { return slots_.size(); }

private:
    using Key = std::tuple<int, std::uint32_t, std::uint32_t>;

    struct Slot {
        PointKind kind = PointKind::HoldingRegister;
        std::uint32_t address = 0;
        std::string readTag;
        std::string writeTag;
        bool writeTagPrefixed = false;
        PointEncoding encoding = PointEncoding::UInt16;
        bool encodingFromRead = false;
        std::uint32_t length = 1;
        bool lengthFromRead = false;
        bool readable = false;
        bool writable = false;
        std::string failureTag;
        std::string failure;
    };

    std::uint32_t unitId_;
    std::string writeTagPrefix_;
    std::uint32_t defaultLength_;
    std::vector<Slot> slots_;
    std::map<Key, std::size_t> indexByKey_;
};

} // namespace mbc
