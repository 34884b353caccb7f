/**
 * @file config_exchange_service.cpp
 * @brief modbusconf source file.
 */

#include "modbusconf/service/config_exchange_service.hpp"

#include <exception>

#include "modbusconf/core/config_errors.hpp"

namespace mbc {

ConfigExchangeService::ConfigExchangeService(ICatalogStore& store, CodecOptions options)
    : store_(store), codec_(options), reconciler_(options), assembler_(options) {}

ValidationResult ConfigExchangeService::validate(const std::string& bytes, ConfigDialect dialect) const {
    const auto root = ConfigDocumentJson::parse(bytes);
    return ConfigurationValidator::validate(root, dialect);
}

ImportReport ConfigExchangeService::importDocument(const std::string& bytes, ConfigDialect dialect,
                                                   std::optional<ImportMode> mode) {
    try {
        const auto root = ConfigDocumentJson::parse(bytes);
        const auto document = ConfigurationValidator::parseDocument(root, dialect);
        const auto decoded = codec_.decode(document, DecodePolicy::Lenient);

        auto session = store_.beginSession();
        try {
            auto report = reconciler_.reconcile(*session, decoded, mode);
            session->commit();
            return report;
        } catch (...) {
            session->rollback();
            throw;
        }
    } catch (const ConfigError&) {
        throw;
    } catch (const std::exception& ex) {
        throw ServerError(std::string("Failed to import configuration: ") + ex.what());
    }
}

ExportArtifact ConfigExchangeService::exportController(const std::string& controllerId,
                                                       ConfigDialect dialect) {
    try {
        auto session = store_.beginSession();
        auto artifact = assembler_.assemble(*session, controllerId, dialect);
        session->rollback();
        return artifact;
    } catch (const ConfigError&) {
        throw;
    } catch (const std::exception& ex) {
        throw ServerError(std::string("Failed to export configuration: ") + ex.what());
    }
}

std::optional<ImportMode> ConfigExchangeService::requireImportMode(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    const auto mode = parseImportMode(text);
    if (!mode) {
        throw ConfigFormatError("Unsupported import mode: " + text);
    }
    return mode;
}

} // namespace mbc
