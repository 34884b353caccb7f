/**
 * @file import_report.hpp
 * @brief modbusconf source file.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

namespace mbc {

/**
 * @brief Policy applied when the incoming controller already exists.
 */
enum class ImportMode {
    SkipController,
    OverwriteController,
    SkipDuplicatePoints,
    OverwriteDuplicatePoints,
};

const char* toString(ImportMode mode);
/**
 * @brief Parse `skip_controller`, `overwrite_controller`,
 *        `skip_duplicate_points` or `overwrite_duplicate_points`.
 */
std::optional<ImportMode> parseImportMode(const std::string& text);

enum class ControllerStatus { Success, Failed, Skipped };
enum class PointStatus { Success, Skipped, Error };

const char* toString(ControllerStatus status);
const char* toString(PointStatus status);

struct ControllerResult {
    std::string id;
    std::string name;
    ControllerStatus status = ControllerStatus::Success;
    std::string message;
};

struct PointResult {
    /// Empty when the point was never stored.
    std::string id;
    std::string name;
    PointStatus status = PointStatus::Success;
    std::string message;
};

/**
 * @brief Outcome of one import, including partial success.
 */
struct ImportReport {
    ControllerResult controller;
    std::vector<PointResult> points;

    std::size_t totalPoints() const { return points.size(); }
    std::size_t count(PointStatus status) const;

    /**
     * @brief `{controller:{id,name,status,message}, points:[...], total_points}`
     */
    Json::Value toJson() const;
};

} // namespace mbc
