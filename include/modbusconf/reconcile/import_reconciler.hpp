/**
 * @file import_reconciler.hpp
 * @brief modbusconf source file.
 */

#pragma once

#include <optional>

#include "modbusconf/catalog/i_catalog_store.hpp"
#include "modbusconf/codec/format_codec.hpp"
#include "modbusconf/config/codec_options.hpp"
#include "modbusconf/reconcile/import_report.hpp"

namespace mbc {

/**
 * @brief Applies a decoded document to the catalog under an import mode.
 *
 * The controller is matched by (host, port), points by natural key
 * (controller, unit id, address, kind). Point-level processing and
 * unique-constraint failures become "error" results and the batch continues;
 * any other exception propagates so the caller can roll the session back.
 * The session is neither committed nor rolled back here.
 */
class ImportReconciler {
public:
    explicit ImportReconciler(CodecOptions options = CodecOptions{});

    /**
     * @throws DuplicateError when the controller exists and no mode is given.
     */
    ImportReport reconcile(ICatalogSession& session, const DecodedConfig& config,
                           std::optional<ImportMode> mode) const;

private:
    PointResult createPoint(ICatalogSession& session, const std::string& controllerId,
                            const IncomingPoint& incoming) const;
    PointResult mergePoint(ICatalogSession& session, const std::string& controllerId,
                           const IncomingPoint& incoming, bool overwrite) const;
    void aggregate(ImportReport& report) const;
    void tracePoint(const PointResult& result) const;

    CodecOptions options_;
};

} // namespace mbc
