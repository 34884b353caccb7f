/**
 * @file import_reconciler_tests.cpp
 * @brief modbusconf source file.
 */

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "modbusconf/catalog/memory_catalog_store.hpp"
#include "modbusconf/codec/format_codec.hpp"
#include "modbusconf/core/config_errors.hpp"
#include "modbusconf/reconcile/import_reconciler.hpp"

namespace {

struct Seeded {
    std::string controllerId;
    std::string pointId;
};

mbc::NativePoint nativePoint(const std::string& name, std::int64_t address) {
    mbc::NativePoint point;
    point.name = name;
    point.kind = mbc::PointKind::HoldingRegister;
    point.encoding = mbc::PointEncoding::UInt16;
    point.address = address;
    point.unitId = 1;
    return point;
}

mbc::DecodedConfig incoming(const std::vector<mbc::NativePoint>& points,
                            const std::string& name = "Boiler") {
    mbc::NativeDocument document;
    document.controller = {name, "10.0.0.5", 502, 30};
    document.points = points;
    return mbc::FormatCodec().decode(document, mbc::DecodePolicy::Lenient);
}

// C=(10.0.0.5:502) holding a single point P=(holding register, 100, unit 1, "temp").
Seeded seed(mbc::MemoryCatalogStore& store) {
    auto session = store.beginSession();
    mbc::CanonicalController controller;
    controller.name = "Boiler";
    controller.host = "10.0.0.5";
    controller.port = 502;
    const auto storedController = session->createController(controller);

    mbc::CanonicalPoint point;
    point.controllerId = storedController.id;
    point.name = "temp";
    point.kind = mbc::PointKind::HoldingRegister;
    point.address = 100;
    point.capability.writable = true;
    const auto storedPoint = session->createPoint(point);
    session->commit();
    return {storedController.id, storedPoint.id};
}

std::vector<mbc::CanonicalPoint> pointsOf(mbc::MemoryCatalogStore& store, const std::string& controllerId) {
    auto session = store.beginSession();
    return session->listPoints(controllerId);
}

mbc::ImportReport run(mbc::MemoryCatalogStore& store, const mbc::DecodedConfig& config,
                      std::optional<mbc::ImportMode> mode) {
    auto session = store.beginSession();
    auto report = mbc::ImportReconciler().reconcile(*session, config, mode);
    session->commit();
    return report;
}

void testFreshImportCreatesEverything() {
    mbc::MemoryCatalogStore store;
    const auto report = run(store, incoming({nativePoint("a", 1), nativePoint("b", 2)}), std::nullopt);
    assert(report.controller.status == mbc::ControllerStatus::Success);
    assert(!report.controller.id.empty());
    assert(report.points.size() == 2U);
    for (const auto& result : report.points) {
        assert(result.status == mbc::PointStatus::Success);
        assert(result.message == "created");
        assert(!result.id.empty());
    }
    assert(store.controllerCount() == 1U);
    assert(store.pointCount() == 2U);

    const auto json = report.toJson();
    assert(json["total_points"].asUInt64() == 2U);
    assert(json["controller"]["status"].asString() == "success");
    assert(json["points"][1]["name"].asString() == "b");
}

void testExistingControllerWithoutMode() {
    mbc::MemoryCatalogStore store;
    seed(store);
    auto session = store.beginSession();
    try {
        mbc::ImportReconciler().reconcile(*session, incoming({nativePoint("temp2", 100)}), std::nullopt);
        assert(false);
    } catch (const mbc::DuplicateError& ex) {
        assert(ex.status() == 409);
        assert(std::string(ex.what()).find("10.0.0.5") != std::string::npos);
    }
}

void testSkipController() {
    mbc::MemoryCatalogStore store;
    const auto seeded = seed(store);
    const auto report = run(store, incoming({nativePoint("temp2", 100)}, "Renamed"),
                            mbc::ImportMode::SkipController);
    assert(report.controller.status == mbc::ControllerStatus::Skipped);
    assert(report.controller.message == "controller already exists");
    assert(report.controller.id == seeded.controllerId);
    assert(report.points.empty());

    const auto points = pointsOf(store, seeded.controllerId);
    assert(points.size() == 1U);
    assert(points[0].name == "temp");
}

void testOverwriteController() {
    mbc::MemoryCatalogStore store;
    const auto seeded = seed(store);
    const auto report = run(store, incoming({nativePoint("temp2", 100)}, "Renamed"),
                            mbc::ImportMode::OverwriteController);
    assert(report.controller.status == mbc::ControllerStatus::Success);
    assert(report.controller.id == seeded.controllerId);
    assert(report.points.size() == 1U);
    assert(report.points[0].message == "created");

    const auto points = pointsOf(store, seeded.controllerId);
    assert(points.size() == 1U);
    assert(points[0].name == "temp2");
    assert(points[0].id != seeded.pointId);

    auto session = store.beginSession();
    const auto controller = session->findControllerById(seeded.controllerId);
    assert(controller.has_value());
    assert(controller->name == "Renamed");
    assert(controller->timeoutSeconds == 30);
}

void testSkipDuplicatePoints() {
    mbc::MemoryCatalogStore store;
    const auto seeded = seed(store);
    const auto report = run(store, incoming({nativePoint("temp2", 100)}), mbc::ImportMode::SkipDuplicatePoints);
    assert(report.points.size() == 1U);
    assert(report.points[0].status == mbc::PointStatus::Skipped);
    assert(report.points[0].message == "already exists");
    assert(report.controller.status == mbc::ControllerStatus::Failed);
    assert(report.controller.message == "all points already exist");

    const auto points = pointsOf(store, seeded.controllerId);
    assert(points.size() == 1U);
    assert(points[0].name == "temp");
}

void testOverwriteDuplicatePoints() {
    mbc::MemoryCatalogStore store;
    const auto seeded = seed(store);
    auto replacement = nativePoint("temp2", 100);
    replacement.encoding = mbc::PointEncoding::Float32;
    replacement.length = 2;
    replacement.unit = "C";
    const auto report = run(store, incoming({replacement, nativePoint("fresh", 101)}),
                            mbc::ImportMode::OverwriteDuplicatePoints);
    assert(report.controller.status == mbc::ControllerStatus::Success);
    assert(report.points.size() == 2U);
    assert(report.points[0].status == mbc::PointStatus::Success);
    assert(report.points[0].message == "updated");
    assert(report.points[0].id == seeded.pointId);
    assert(report.points[1].message == "created");

    auto session = store.beginSession();
    const auto updated = session->findPointByNaturalKey({seeded.controllerId, 1, 100, mbc::PointKind::HoldingRegister});
    assert(updated.has_value());
    assert(updated->id == seeded.pointId);
    assert(updated->name == "temp2");
    assert(updated->encoding == mbc::PointEncoding::Float32);
    assert(updated->length == 2U);
    assert(updated->unit == std::optional<std::string>("C"));
    assert(updated->updatedAt >= updated->createdAt);
}

void testMixedOutcomeStillSucceeds() {
    mbc::MemoryCatalogStore store;
    seed(store);
    const auto report = run(store,
                            incoming({nativePoint("temp", 100), nativePoint("fresh", 101),
                                      nativePoint("broken", 70000)}),
                            mbc::ImportMode::SkipDuplicatePoints);
    assert(report.points.size() == 3U);
    assert(report.count(mbc::PointStatus::Skipped) == 1U);
    assert(report.count(mbc::PointStatus::Success) == 1U);
    assert(report.count(mbc::PointStatus::Error) == 1U);
    assert(report.points[2].name == "broken");
    assert(report.points[2].id.empty());
    assert(report.controller.status == mbc::ControllerStatus::Success);
    assert(report.toJson()["total_points"].asUInt64() == 3U);
    assert(report.toJson()["points"][2]["id"].isNull());
}

void testAllPointsFailed() {
    mbc::MemoryCatalogStore store;
    const auto report = run(store, incoming({nativePoint("x", 70000), nativePoint("y", 80000)}), std::nullopt);
    assert(report.controller.status == mbc::ControllerStatus::Failed);
    assert(report.controller.message == "all points failed");
    assert(store.controllerCount() == 1U);
    assert(store.pointCount() == 0U);
}

void testDuplicateWithinDocumentIsPointError() {
    mbc::MemoryCatalogStore store;
    const auto report = run(store, incoming({nativePoint("first", 5), nativePoint("second", 5)}), std::nullopt);
    assert(report.points[0].status == mbc::PointStatus::Success);
    assert(report.points[1].status == mbc::PointStatus::Error);
    assert(report.points[1].message.find("already exists") != std::string::npos);
    assert(report.controller.status == mbc::ControllerStatus::Success);
    assert(store.pointCount() == 1U);
}

void testEmptyDocument() {
    mbc::MemoryCatalogStore store;
    const auto report = run(store, incoming({}), std::nullopt);
    assert(report.controller.status == mbc::ControllerStatus::Success);
    assert(report.totalPoints() == 0U);
}

void testSessionIsolation() {
    mbc::MemoryCatalogStore store;
    {
        auto session = store.beginSession();
        mbc::CanonicalController controller;
        controller.name = "scratch";
        controller.host = "10.0.0.7";
        const auto stored = session->createController(controller);
        assert(session->findControllerById(stored.id).has_value());
        assert(store.controllerCount() == 0U);
    }
    assert(store.controllerCount() == 0U);
    assert(store.commitCount() == 0U);

    const auto seeded = seed(store);
    auto session = store.beginSession();
    mbc::CanonicalController clash;
    clash.name = "clash";
    clash.host = "10.0.0.5";
    clash.port = 502;
    bool rejected = false;
    try {
        session->createController(clash);
    } catch (const mbc::DuplicateError&) {
        rejected = true;
    }
    assert(rejected);
    assert(session->deleteController(seeded.controllerId));
    assert(session->listPoints(seeded.controllerId).empty());
    session->rollback();
    assert(!session->active());
    assert(store.pointCount() == 1U);
}

mbc::CanonicalController controllerAt(const std::string& host) {
    mbc::CanonicalController controller;
    controller.name = host;
    controller.host = host;
    controller.port = 502;
    return controller;
}

void testInterleavedSessionsKeepEachOthersRows() {
    mbc::MemoryCatalogStore store;
    auto first = store.beginSession();
    auto second = store.beginSession();
    const auto a = first->createController(controllerAt("10.0.0.1"));
    const auto b = second->createController(controllerAt("10.0.0.2"));
    first->commit();
    second->commit();
    assert(store.controllerCount() == 2U);

    // Points on both controllers, written by two overlapping sessions.
    auto left = store.beginSession();
    auto right = store.beginSession();
    mbc::CanonicalPoint point;
    point.name = "p";
    point.controllerId = a.id;
    left->createPoint(point);
    point.controllerId = b.id;
    right->createPoint(point);
    right->commit();
    left->commit();
    assert(store.pointCount() == 2U);

    // Both claim the same host and port: the later commit is rejected.
    auto one = store.beginSession();
    auto two = store.beginSession();
    one->createController(controllerAt("10.0.0.3"));
    two->createController(controllerAt("10.0.0.3"));
    one->commit();
    bool rejected = false;
    try {
        two->commit();
    } catch (const mbc::DuplicateError&) {
        rejected = true;
    }
    assert(rejected);
    assert(store.controllerCount() == 3U);

    // A delete committed in between wins over a point added to that controller.
    auto adder = store.beginSession();
    auto remover = store.beginSession();
    point.controllerId = a.id;
    point.address = 9;
    adder->createPoint(point);
    const bool removed = remover->deleteController(a.id);
    assert(removed);
    remover->commit();
    bool orphaned = false;
    try {
        adder->commit();
    } catch (const mbc::NotFoundError&) {
        orphaned = true;
    }
    assert(orphaned);
    assert(store.controllerCount() == 2U);
    assert(store.pointCount() == 1U);
}

} // namespace

int main() {
    testFreshImportCreatesEverything();
    testExistingControllerWithoutMode();
    testSkipController();
    testOverwriteController();
    testSkipDuplicatePoints();
    testOverwriteDuplicatePoints();
    testMixedOutcomeStillSucceeds();
    testAllPointsFailed();
    testDuplicateWithinDocumentIsPointError();
    testEmptyDocument();
    testSessionIsolation();
    testInterleavedSessionsKeepEachOthersRows();

    std::cout << "import_reconciler_tests passed\n";
    return 0;
}
