/**
 * @file export_assembler.hpp
 * @brief modbusconf source file.
 */

#pragma once

#include <string>

#include <json/json.h>

#include "modbusconf/catalog/i_catalog_store.hpp"
#include "modbusconf/codec/config_document.hpp"
#include "modbusconf/codec/format_codec.hpp"
#include "modbusconf/config/codec_options.hpp"

namespace mbc {

/**
 * @brief Rendered export of one controller.
 */
struct ExportArtifact {
    Json::Value document;
    std::string filename;
    /// Serialized document, ready to be written.
    std::string text;
};

class ExportAssembler {
public:
    explicit ExportAssembler(CodecOptions options = CodecOptions{});

    /**
     * @brief Load a controller and its points and render them in @p dialect.
     *
     * Points are ordered by (unit id, kind, address). An empty @p exportTime
     * is replaced by the current UTC time.
     * @throws NotFoundError when the controller does not exist.
     */
    ExportArtifact assemble(ICatalogSession& session, const std::string& controllerId,
                            ConfigDialect dialect,
                            const std::string& exportTime = std::string()) const;

    /**
     * @brief `modbus_<name>_<dialect>.json` with the name reduced to
     *        alphanumerics, '-' and '_'.
     */
    static std::string exportFilename(const std::string& controllerName, ConfigDialect dialect);

    /**
     * @brief Current UTC time as `YYYY-MM-DDTHH:MM:SSZ`.
     */
    static std::string currentExportTime();

private:
    FormatCodec codec_;
};

} // namespace mbc
