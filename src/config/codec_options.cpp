/**
 * @file codec_options.cpp
 * @brief modbusconf source file.
 */

#include "modbusconf/config/codec_options.hpp"

#include <cstdlib>
#include <stdexcept>
#include <type_traits>

namespace mbc {
namespace {

bool parseBoolEnv(const char* name, bool defaultValue) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return defaultValue;
    }
    const std::string text(value);
    if (text == "1" || text == "true" || text == "TRUE" || text == "on" || text == "ON") {
        return true;
    }
    if (text == "0" || text == "false" || text == "FALSE" || text == "off" || text == "OFF") {
        return false;
    }
    return defaultValue;
}

template <typename T>
T parseIntegralEnv(const char* name, T defaultValue) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return defaultValue;
    }
    try {
        if constexpr (std::is_signed<T>::value) {
            return static_cast<T>(std::stoll(value, nullptr, 0));
        } else {
            return static_cast<T>(std::stoull(value, nullptr, 0));
        }
    } catch (const std::logic_error&) {
        return defaultValue;
    }
}

std::string parseStringEnv(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return defaultValue;
    }
    return value;
}

} // namespace

CodecOptions CodecOptions::fromEnvironment() {
    CodecOptions options;
    options.defaultTimeoutSeconds =
        parseIntegralEnv<int>("MBC_DEFAULT_TIMEOUT_S", options.defaultTimeoutSeconds);
    options.defaultUnitId = parseIntegralEnv<std::uint32_t>("MBC_DEFAULT_UNIT_ID", options.defaultUnitId);
    options.gatewayRetries = parseIntegralEnv<int>("MBC_GATEWAY_RETRIES", options.gatewayRetries);
    options.gatewayPollPeriodMs =
        parseIntegralEnv<int>("MBC_GATEWAY_POLL_PERIOD_MS", options.gatewayPollPeriodMs);
    options.writeTagPrefix = parseStringEnv("MBC_RPC_TAG_PREFIX", options.writeTagPrefix);
    options.traceCodec = parseBoolEnv("MBC_TRACE_CODEC", options.traceCodec);
    options.traceImport = parseBoolEnv("MBC_TRACE_IMPORT", options.traceImport);
    options.traceExport = parseBoolEnv("MBC_TRACE_EXPORT", options.traceExport);

    if (options.defaultTimeoutSeconds <= 0) {
        options.defaultTimeoutSeconds = 10;
    }
    if (options.defaultUnitId > 0xFFU) {
        options.defaultUnitId = 1;
    }
    return options;
}

} // namespace mbc
