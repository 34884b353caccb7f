/**
 * @file export_assembler.cpp
 * @brief modbusconf source file.
 */

#include "modbusconf/export/export_assembler.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iostream>
#include <map>
#include <tuple>
#include <utility>
#include <vector>

#include "modbusconf/core/config_errors.hpp"

namespace mbc {

ExportAssembler::ExportAssembler(CodecOptions options) : codec_(std::move(options)) {}

ExportArtifact ExportAssembler::assemble(ICatalogSession& session, const std::string& controllerId,
                                         ConfigDialect dialect,
                                         const std::string& exportTime) const {
    const auto controller = session.findControllerById(controllerId);
    if (!controller) {
        throw NotFoundError("Controller " + controllerId + " not found");
    }

    auto points = session.listPoints(controllerId);
    std::sort(points.begin(), points.end(), [](const CanonicalPoint& a, const CanonicalPoint& b) {
        return std::make_tuple(a.unitId, static_cast<int>(a.kind), a.address) <
               std::make_tuple(b.unitId, static_cast<int>(b.kind), b.address);
    });

    const std::string stamp = exportTime.empty() ? currentExportTime() : exportTime;
    ConfigDocument document;
    if (dialect == ConfigDialect::Gateway && !points.empty()) {
        std::map<std::uint32_t, std::vector<CanonicalPoint>> byUnit;
        for (const auto& point : points) {
            byUnit[point.unitId].push_back(point);
        }
        GatewayDocument merged;
        merged.exportTime = stamp;
        for (const auto& kv : byUnit) {
            auto part = std::get<GatewayDocument>(codec_.encode(*controller, kv.second, dialect, stamp));
            for (auto& slave : part.slaves) {
                merged.slaves.push_back(std::move(slave));
            }
        }
        document = std::move(merged);
    } else {
        document = codec_.encode(*controller, points, dialect, stamp);
    }

    ExportArtifact artifact;
    artifact.document = ConfigDocumentJson::toJson(document);
    artifact.filename = exportFilename(controller->name, dialect);
    artifact.text = ConfigDocumentJson::serialize(artifact.document);
    if (codec_.options().traceExport) {
        std::cerr << "[mbc-export] " << controller->name << ": " << points.size()
                  << " points -> " << artifact.filename << '\n';
    }
    return artifact;
}

std::string ExportAssembler::exportFilename(const std::string& controllerName, ConfigDialect dialect) {
    std::string safe;
    safe.reserve(controllerName.size());
    for (const char c : controllerName) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) != 0 || c == ' ' || c == '-' || c == '_') {
            safe.push_back(c);
        }
    }
    while (!safe.empty() && safe.back() == ' ') {
        safe.pop_back();
    }
    std::replace(safe.begin(), safe.end(), ' ', '_');
    if (safe.empty()) {
        safe = "controller";
    }
    return "modbus_" + safe + "_" + toString(dialect) + ".json";
}

std::string ExportAssembler::currentExportTime() {
    const std::time_t now = CatalogClock::to_time_t(CatalogClock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    char buffer[32];
    const auto written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buffer, written);
}

} // namespace mbc
