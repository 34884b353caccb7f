/**
 * @file format_codec.hpp
 * @brief modbusconf source file.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "modbusconf/codec/config_document.hpp"
#include "modbusconf/config/codec_options.hpp"
#include "modbusconf/model/point_model.hpp"

namespace mbc {

/**
 * @brief One decoded point, or the reason it could not be mapped.
 */
struct IncomingPoint {
    /// Display name (tag or point name) used in reports.
    std::string name;
    std::optional<CanonicalPoint> point;
    std::string error;

    bool ok() const { return point.has_value(); }
    /**
     * @brief Return the point or raise ConfigProcessingError with the reason.
     */
    const CanonicalPoint& require() const;
};

/**
 * @brief Canonical controller plus its incoming points.
 */
struct DecodedConfig {
    CanonicalController controller;
    std::vector<IncomingPoint> points;
};

/**
 * @brief How decode() treats a point that cannot be mapped.
 */
enum class DecodePolicy {
    /// Raise ConfigProcessingError on the first unmappable point.
    Strict,
    /// Record the failure on the IncomingPoint and continue.
    Lenient,
};

/**
 * @brief Encodes canonical controllers/points into either dialect and decodes
 *        either dialect back.
 *
 * Native documents carry points as-is. Gateway documents split points into
 * attributes (bit kinds), timeseries (register kinds) and rpc (writable
 * kinds) sections per unit id; decode merges them back per
 * (kind, address, unit id).
 */
class FormatCodec {
public:
    explicit FormatCodec(CodecOptions options = CodecOptions{});

    /**
     * @brief Encode one controller and its points.
     *
     * Gateway output holds one slave block per distinct unit id (ascending).
     * @throws ConfigFormatError for an unsupported dialect value.
     */
    ConfigDocument encode(const CanonicalController& controller,
                          const std::vector<CanonicalPoint>& points,
                          ConfigDialect dialect,
                          const std::string& exportTime = std::string()) const;

    /**
     * @brief Decode a typed document into canonical form.
     *
     * @throws DuplicateError for a gateway document with more than one slave.
     * @throws ConfigProcessingError for an unmappable point under Strict.
     */
    DecodedConfig decode(const ConfigDocument& document,
                         DecodePolicy policy = DecodePolicy::Strict) const;

    const CodecOptions& options() const { return options_; }

private:
    NativeDocument encodeNative(const CanonicalController& controller,
                                const std::vector<CanonicalPoint>& points) const;
    GatewayDocument encodeGateway(const CanonicalController& controller,
                                  const std::vector<CanonicalPoint>& points) const;
    GatewaySlave encodeSlave(const CanonicalController& controller, std::uint32_t unitId,
                             const std::vector<const CanonicalPoint*>& points) const;

    DecodedConfig decodeNative(const NativeDocument& document, DecodePolicy policy) const;
    DecodedConfig decodeGateway(const GatewayDocument& document, DecodePolicy policy) const;

    CodecOptions options_;
};

} // namespace mbc
