/**
 * @file import_reconciler.cpp
 * @brief modbusconf source file.
 */

#include "modbusconf/reconcile/import_reconciler.hpp"

#include <iostream>
#include <string>
#include <utility>

#include "modbusconf/core/config_errors.hpp"

namespace mbc {
namespace {

PointResult errorResult(const std::string& name, const std::string& reason) {
    PointResult result;
    result.name = name;
    result.status = PointStatus::Error;
    result.message = reason;
    return result;
}

// Fields an overwrite replaces; identity (natural key) and id stay.
void applyIncoming(CanonicalPoint& stored, const CanonicalPoint& incoming) {
    stored.name = incoming.name;
    stored.description = incoming.description;
    stored.encoding = incoming.encoding;
    stored.length = incoming.length;
    stored.formula = incoming.formula;
    stored.unit = incoming.unit;
    stored.minValue = incoming.minValue;
    stored.maxValue = incoming.maxValue;
    stored.capability = incoming.capability;
}

} // namespace

ImportReconciler::ImportReconciler(CodecOptions options) : options_(std::move(options)) {}

ImportReport ImportReconciler::reconcile(ICatalogSession& session, const DecodedConfig& config,
                                         std::optional<ImportMode> mode) const {
    ImportReport report;
    const auto& incoming = config.controller;
    const auto existing = session.findControllerByHostPort(incoming.host, incoming.port);

    if (!existing) {
        const auto created = session.createController(incoming);
        report.controller = {created.id, created.name, ControllerStatus::Success, "created"};
        if (options_.traceImport) {
            std::cerr << "[mbc-import] created controller " << created.name << " (" << created.host
                      << ":" << created.port << ")\n";
        }
        for (const auto& point : config.points) {
            report.points.push_back(createPoint(session, created.id, point));
        }
        aggregate(report);
        return report;
    }

    if (!mode) {
        throw DuplicateError("Controller with host " + incoming.host + " and port " +
                             std::to_string(incoming.port) + " already exists");
    }
    if (options_.traceImport) {
        std::cerr << "[mbc-import] controller " << existing->name << " (" << existing->host << ":"
                  << existing->port << ") exists, mode=" << toString(*mode) << '\n';
    }

    switch (*mode) {
    case ImportMode::SkipController:
        report.controller = {existing->id, existing->name, ControllerStatus::Skipped,
                             "controller already exists"};
        return report;

    case ImportMode::OverwriteController: {
        auto target = *existing;
        target.name = incoming.name;
        target.timeoutSeconds = incoming.timeoutSeconds;
        const auto updated = session.updateController(target);
        const auto removed = session.deletePoints(updated.id);
        if (options_.traceImport) {
            std::cerr << "[mbc-import] overwrite: removed " << removed << " points of "
                      << updated.name << '\n';
        }
        report.controller = {updated.id, updated.name, ControllerStatus::Success, "updated"};
        for (const auto& point : config.points) {
            report.points.push_back(createPoint(session, updated.id, point));
        }
        break;
    }

    case ImportMode::SkipDuplicatePoints:
    case ImportMode::OverwriteDuplicatePoints: {
        const bool overwrite = (*mode == ImportMode::OverwriteDuplicatePoints);
        report.controller = {existing->id, existing->name, ControllerStatus::Success,
                             "controller already exists"};
        for (const auto& point : config.points) {
            report.points.push_back(mergePoint(session, existing->id, point, overwrite));
        }
        break;
    }
    }

    aggregate(report);
    return report;
}

PointResult ImportReconciler::createPoint(ICatalogSession& session, const std::string& controllerId,
                                          const IncomingPoint& incoming) const {
    PointResult result;
    try {
        auto point = incoming.require();
        point.controllerId = controllerId;
        const auto stored = session.createPoint(point);
        result = {stored.id, stored.name, PointStatus::Success, "created"};
    } catch (const ConfigProcessingError& ex) {
        result = errorResult(incoming.name, ex.what());
    } catch (const DuplicateError& ex) {
        result = errorResult(incoming.name, ex.what());
    }
    tracePoint(result);
    return result;
}

PointResult ImportReconciler::mergePoint(ICatalogSession& session, const std::string& controllerId,
                                         const IncomingPoint& incoming, bool overwrite) const {
    PointResult result;
    try {
        auto point = incoming.require();
        point.controllerId = controllerId;
        auto match = session.findPointByNaturalKey(naturalKeyOf(point));
        if (!match) {
            const auto stored = session.createPoint(point);
            result = {stored.id, stored.name, PointStatus::Success, "created"};
        } else if (!overwrite) {
            result = {match->id, point.name, PointStatus::Skipped, "already exists"};
        } else {
            applyIncoming(*match, point);
            const auto stored = session.updatePoint(*match);
            result = {stored.id, stored.name, PointStatus::Success, "updated"};
        }
    } catch (const ConfigProcessingError& ex) {
        result = errorResult(incoming.name, ex.what());
    } catch (const DuplicateError& ex) {
        result = errorResult(incoming.name, ex.what());
    }
    tracePoint(result);
    return result;
}

void ImportReconciler::aggregate(ImportReport& report) const {
    if (report.points.empty()) {
        return;
    }
    const auto total = report.points.size();
    if (report.count(PointStatus::Success) > 0U) {
        report.controller.status = ControllerStatus::Success;
    } else if (report.count(PointStatus::Error) == total) {
        report.controller.status = ControllerStatus::Failed;
        report.controller.message = "all points failed";
    } else if (report.count(PointStatus::Skipped) == total) {
        report.controller.status = ControllerStatus::Failed;
        report.controller.message = "all points already exist";
    } else {
        report.controller.status = ControllerStatus::Success;
    }
    if (options_.traceImport) {
        std::cerr << "[mbc-import] controller " << report.controller.name << ": "
                  << toString(report.controller.status) << " ("
                  << report.count(PointStatus::Success) << " ok, "
                  << report.count(PointStatus::Skipped) << " skipped, "
                  << report.count(PointStatus::Error) << " failed)\n";
    }
}

void ImportReconciler::tracePoint(const PointResult& result) const {
    if (options_.traceImport && result.status == PointStatus::Error) {
        std::cerr << "[mbc-import] point " << result.name << " failed: " << result.message << '\n';
    }
}

} // namespace mbc
