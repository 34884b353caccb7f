/**
 * @file config_errors.hpp
 * @brief modbusconf source file.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace mbc {

/**
 * @brief Base of every error raised by the configuration engine.
 *
 * Each error carries a stable code string and an HTTP-like status so that an
 * outer REST/CLI surface can map it without inspecting the message.
 */
class ConfigError : public std::runtime_error {
public:
    ConfigError(const std::string& message, std::string code, int status)
        : std::runtime_error(message), code_(std::move(code)), status_(status) {}

    const std::string& code() const { return code_; }
    int status() const { return status_; }

private:
    std::string code_;
    int status_;
};

/**
 * @brief Structurally invalid document for the declared dialect.
 */
class ConfigFormatError : public ConfigError {
public:
    explicit ConfigFormatError(const std::string& message)
        : ConfigError(message, "MODBUS_CONFIG_FORMAT_ERROR", 400) {}

protected:
    ConfigFormatError(const std::string& message, std::string code)
        : ConfigError(message, std::move(code), 400) {}
};

/**
 * @brief Document carries the fingerprint of the other dialect.
 */
class FormatMismatchError final : public ConfigFormatError {
public:
    FormatMismatchError(std::string expected, std::string detected)
        : ConfigFormatError("Configuration appears to be in " + detected +
                                " format, but " + expected +
                                " format was expected. Please select '" + detected +
                                "' format for this file.",
                            "MODBUS_CONFIG_FORMAT_MISMATCH"),
          expected_(std::move(expected)),
          detected_(std::move(detected)) {}

    const std::string& expected() const { return expected_; }
    const std::string& detected() const { return detected_; }

private:
    std::string expected_;
    std::string detected_;
};

/**
 * @brief One point could not be mapped into the canonical model.
 *
 * Downgraded to a point-level "error" result during import.
 */
class ConfigProcessingError final : public ConfigError {
public:
    explicit ConfigProcessingError(const std::string& message)
        : ConfigError(message, "MODBUS_CONFIG_PROCESSING_ERROR", 422) {}
};

/**
 * @brief Unique-constraint or single-controller constraint violation.
 */
class DuplicateError final : public ConfigError {
public:
    explicit DuplicateError(const std::string& message)
        : ConfigError(message, "MODBUS_DUPLICATE", 409) {}
};

class NotFoundError final : public ConfigError {
public:
    explicit NotFoundError(const std::string& message)
        : ConfigError(message, "MODBUS_NOT_FOUND", 404) {}
};

/**
 * @brief Unclassified failure wrapped with its original message.
 */
class ServerError final : public ConfigError {
public:
    explicit ServerError(const std::string& message)
        : ConfigError(message.empty() ? std::string("Server error") : message, "SERVER_ERROR", 500) {}
};

} // namespace mbc
