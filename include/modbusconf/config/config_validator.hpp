/**
 * @file config_validator.hpp
 * @brief modbusconf source file.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

#include "modbusconf/codec/config_document.hpp"

namespace mbc {

/**
 * @brief Severity level for configuration validation findings.
 */
enum class ValidationSeverity { Warning, Error };

/**
 * @brief One configuration validation finding.
 */
struct ValidationIssue {
    ValidationSeverity severity = ValidationSeverity::Error;
    std::string message;
    /// Set for violations of the single-controller-per-document constraint.
    bool singleController = false;
};

/**
 * @brief Outcome of validating one document.
 */
struct ValidationResult {
    std::vector<ValidationIssue> issues;

    bool isValid() const;
    std::vector<std::string> errors() const;
    std::vector<std::string> warnings() const;
    /**
     * @brief `{ "is_valid": bool, "errors": [...], "warnings": [...] }`
     */
    Json::Value toJson() const;
};

/**
 * @brief Validates a raw JSON document against a declared dialect.
 *
 * The dialect-identity check runs first: a document carrying the other
 * dialect's fingerprint raises FormatMismatchError regardless of its
 * required fields. The structural check then collects every finding with its
 * position (controller, point index, or slave/section/item index).
 */
class ConfigurationValidator {
public:
    /**
     * @brief Dialect whose structural fingerprint the document carries.
     *
     * Native: top-level `controller`+`points`, or `controllers`.
     * Gateway: `master.slaves`.
     */
    static std::optional<ConfigDialect> detectDialect(const Json::Value& root);

    /**
     * @brief Perform validation and return all findings.
     * @throws FormatMismatchError when the other dialect is detected.
     */
    static ValidationResult validate(const Json::Value& root, ConfigDialect expected);

    /**
     * @brief Raise on the first fatal finding.
     * @throws FormatMismatchError, DuplicateError (single-controller
     *         constraint) or ConfigFormatError.
     */
    static void requireValid(const Json::Value& root, ConfigDialect expected);

    /**
     * @brief Validate and convert into the typed dialect document.
     */
    static ConfigDocument parseDocument(const Json::Value& root, ConfigDialect expected);

    /**
     * @brief Convenience predicate to detect if any issue is fatal.
     */
    static bool hasErrors(const std::vector<ValidationIssue>& issues);
};

} // namespace mbc
