/**
 * @file codec_options.hpp
 * @brief modbusconf source file.
 */

#pragma once

#include <cstdint>
#include <string>

namespace mbc {

/**
 * @brief Engine defaults and trace switches.
 *
 * Environment overrides (read by fromEnvironment()):
 * - MBC_DEFAULT_TIMEOUT_S
 * - MBC_DEFAULT_UNIT_ID
 * - MBC_GATEWAY_RETRIES
 * - MBC_GATEWAY_POLL_PERIOD_MS
 * - MBC_RPC_TAG_PREFIX
 * - MBC_TRACE_CODEC, MBC_TRACE_IMPORT, MBC_TRACE_EXPORT
 */
struct CodecOptions {
    /// Controller timeout used when a document omits it.
    int defaultTimeoutSeconds = 10;
    /// Unit id used when a document omits it.
    std::uint32_t defaultUnitId = 1;
    /// Point length used when a document omits it.
    std::uint32_t defaultLength = 1;
    /// Emitted into gateway slave blocks.
    int gatewayRetries = 3;
    int gatewayPollPeriodMs = 1000;
    /// Marker prepended to rpc tags of writable points.
    std::string writeTagPrefix = "set_";

    bool traceCodec = false;
    bool traceImport = false;
    bool traceExport = false;

    static CodecOptions fromEnvironment();
};

} // namespace mbc
