/**
 * @file i_catalog_store.hpp
 * @brief modbusconf source file.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "modbusconf/model/point_model.hpp"

namespace mbc {

/**
 * @brief Unit of work over the controller/point catalog.
 *
 * Every read and write of one engine call goes through one session. Writes
 * become visible to other sessions only after commit(); a session destroyed
 * without commit() discards its changes. Implementations enforce the unique
 * constraints on (host, port) and on the point natural key by raising
 * DuplicateError, and raise NotFoundError when an update targets an unknown
 * id. The store owns ids and created/updated timestamps.
 */
class ICatalogSession {
public:
    virtual ~ICatalogSession() = default;

    virtual std::optional<CanonicalController> findControllerById(const std::string& id) = 0;
    virtual std::optional<CanonicalController> findControllerByHostPort(const std::string& host,
                                                                        std::uint16_t port) = 0;
    virtual std::vector<CanonicalController> listControllers() = 0;

    virtual std::vector<CanonicalPoint> listPoints(const std::string& controllerId) = 0;
    virtual std::optional<CanonicalPoint> findPointByNaturalKey(const PointNaturalKey& key) = 0;

    /**
     * @brief Insert a controller; id and timestamps are assigned by the store.
     * @return stored copy.
     */
    virtual CanonicalController createController(const CanonicalController& controller) = 0;
    virtual CanonicalController updateController(const CanonicalController& controller) = 0;
    /**
     * @brief Delete a controller together with its points.
     * @return false if no such controller exists.
     */
    virtual bool deleteController(const std::string& controllerId) = 0;

    virtual CanonicalPoint createPoint(const CanonicalPoint& point) = 0;
    virtual CanonicalPoint updatePoint(const CanonicalPoint& point) = 0;
    virtual bool deletePoint(const std::string& pointId) = 0;
    /**
     * @brief Delete every point of a controller.
     * @return number of deleted points.
     */
    virtual std::size_t deletePoints(const std::string& controllerId) = 0;

    virtual void commit() = 0;
    virtual void rollback() = 0;
    /**
     * @brief True until commit() or rollback() ends the session.
     */
    virtual bool active() const = 0;
};

/**
 * @brief Catalog store handing out one session per engine call.
 */
class ICatalogStore {
public:
    virtual ~ICatalogStore() = default;

    virtual std::unique_ptr<ICatalogSession> beginSession() = 0;
};

} // namespace mbc
