/**
 * @file config_exchange_service.hpp
 * @brief modbusconf source file.
 */

#pragma once

#include <optional>
#include <string>

#include "modbusconf/catalog/i_catalog_store.hpp"
#include "modbusconf/codec/config_document.hpp"
#include "modbusconf/codec/format_codec.hpp"
#include "modbusconf/config/codec_options.hpp"
#include "modbusconf/config/config_validator.hpp"
#include "modbusconf/export/export_assembler.hpp"
#include "modbusconf/reconcile/import_reconciler.hpp"
#include "modbusconf/reconcile/import_report.hpp"

namespace mbc {

/**
 * @brief Entry points for validating, importing and exporting configuration
 *        documents against one catalog store.
 *
 * Every import runs in its own catalog session: it commits on normal
 * completion, partial success included, and rolls back on any raised error.
 * ConfigError subclasses propagate unchanged; anything else is rethrown as
 * ServerError carrying the original message.
 */
class ConfigExchangeService {
public:
    explicit ConfigExchangeService(ICatalogStore& store, CodecOptions options = CodecOptions{});

    /**
     * @throws ConfigFormatError for malformed JSON.
     * @throws FormatMismatchError when the document is in the other dialect.
     */
    ValidationResult validate(const std::string& bytes, ConfigDialect dialect) const;

    ImportReport importDocument(const std::string& bytes, ConfigDialect dialect,
                                std::optional<ImportMode> mode = std::nullopt);

    /**
     * @throws NotFoundError for an unknown controller id.
     */
    ExportArtifact exportController(const std::string& controllerId, ConfigDialect dialect);

    /**
     * @brief Empty text means no mode.
     * @throws ConfigFormatError for an unknown mode name.
     */
    static std::optional<ImportMode> requireImportMode(const std::string& text);

private:
    ICatalogStore& store_;
    FormatCodec codec_;
    ImportReconciler reconciler_;
    ExportAssembler assembler_;
};

} // namespace mbc
