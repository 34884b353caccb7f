/**
 * @file import_report.cpp
 * @brief modbusconf source file.
 */

#include "modbusconf/reconcile/import_report.hpp"

#include <algorithm>

namespace mbc {
namespace {

Json::Value idOrNull(const std::string& id) {
    return id.empty() ? Json::Value(Json::nullValue) : Json::Value(id);
}

} // namespace

const char* toString(ImportMode mode) {
    switch (mode) {
    case ImportMode::SkipController:
        return "skip_controller";
    case ImportMode::OverwriteController:
        return "overwrite_controller";
    case ImportMode::SkipDuplicatePoints:
        return "skip_duplicate_points";
    case ImportMode::OverwriteDuplicatePoints:
        return "overwrite_duplicate_points";
    }
    return "unknown";
}

std::optional<ImportMode> parseImportMode(const std::string& text) {
    if (text == "skip_controller") {
        return ImportMode::SkipController;
    }
    if (text == "overwrite_controller") {
        return ImportMode::OverwriteController;
    }
    if (text == "skip_duplicate_points") {
        return ImportMode::SkipDuplicatePoints;
    }
    if (text == "overwrite_duplicate_points") {
        return ImportMode::OverwriteDuplicatePoints;
    }
    return std::nullopt;
}

const char* toString(ControllerStatus status) {
    switch (status) {
    case ControllerStatus::Success:
        return "success";
    case ControllerStatus::Failed:
        return "failed";
    case ControllerStatus::Skipped:
        return "skipped";
    }
    return "unknown";
}

const char* toString(PointStatus status) {
    switch (status) {
    case PointStatus::Success:
        return "success";
    case PointStatus::Skipped:
        return "skipped";
    case PointStatus::Error:
        return "error";
    }
    return "unknown";
}

std::size_t ImportReport::count(PointStatus status) const {
    return static_cast<std::size_t>(std::count_if(points.begin(), points.end(),
        [status](const PointResult& result) { return result.status == status; }));
}

Json::Value ImportReport::toJson() const {
    Json::Value root(Json::objectValue);
    Json::Value& ctl = root["controller"];
    ctl["id"] = idOrNull(controller.id);
    ctl["name"] = controller.name;
    ctl["status"] = toString(controller.status);
    ctl["message"] = controller.message;

    Json::Value list(Json::arrayValue);
    for (const auto& result : points) {
        Json::Value item(Json::objectValue);
        item["id"] = idOrNull(result.id);
        item["name"] = result.name;
        item["status"] = toString(result.status);
        item["message"] = result.message;
        list.append(item);
    }
    root["points"] = list;
    root["total_points"] = static_cast<Json::UInt64>(totalPoints());
    return root;
}

} // namespace mbc
