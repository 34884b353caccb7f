/**
 * @file memory_catalog_store.cpp
 * @brief modbusconf source file.
 */

#include "modbusconf/catalog/memory_catalog_store.hpp"

#include <cstdio>
#include <iterator>
#include <stdexcept>
#include <utility>

#include "modbusconf/core/config_errors.hpp"

namespace mbc {

class MemoryCatalogSession final : public ICatalogSession {
public:
    explicit MemoryCatalogSession(MemoryCatalogStore& store)
        : store_(store), working_(store.snapshot()) {}

    ~MemoryCatalogSession() override {
        if (active_) {
            rollback();
        }
    }

    std::optional<CanonicalController> findControllerById(const std::string& id) override {
        requireActive();
        const auto it = working_.controllers.find(id);
        if (it == working_.controllers.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<CanonicalController> findControllerByHostPort(const std::string& host,
                                                                std::uint16_t port) override {
        requireActive();
        for (const auto& kv : working_.controllers) {
            if (kv.second.host == host && kv.second.port == port) {
                return kv.second;
            }
        }
        return std::nullopt;
    }

    std::vector<CanonicalController> listControllers() override {
        requireActive();
        std::vector<CanonicalController> out;
        out.reserve(working_.controllers.size());
        for (const auto& kv : working_.controllers) {
            out.push_back(kv.second);
        }
        return out;
    }

    std::vector<CanonicalPoint> listPoints(const std::string& controllerId) override {
        requireActive();
        std::vector<CanonicalPoint> out;
        for (const auto& kv : working_.points) {
            if (kv.second.controllerId == controllerId) {
                out.push_back(kv.second);
            }
        }
        return out;
    }

    std::optional<CanonicalPoint> findPointByNaturalKey(const PointNaturalKey& key) override {
        requireActive();
        for (const auto& kv : working_.points) {
            if (naturalKeyOf(kv.second) == key) {
                return kv.second;
            }
        }
        return std::nullopt;
    }

    CanonicalController createController(const CanonicalController& controller) override {
        beginWrite();
        if (findControllerByHostPort(controller.host, controller.port)) {
            throw DuplicateError("Controller with host " + controller.host + " and port " +
                                 std::to_string(controller.port) + " already exists");
        }
        CanonicalController stored = controller;
        stored.id = store_.nextId("controller");
        stored.createdAt = CatalogClock::now();
        stored.updatedAt = stored.createdAt;
        working_.controllers[stored.id] = stored;
        changes_.controllers.insert(stored.id);
        return stored;
    }

    CanonicalController updateController(const CanonicalController& controller) override {
        beginWrite();
        const auto it = working_.controllers.find(controller.id);
        if (it == working_.controllers.end()) {
            throw NotFoundError("Controller " + controller.id + " not found");
        }
        const auto clash = findControllerByHostPort(controller.host, controller.port);
        if (clash && clash->id != controller.id) {
            throw DuplicateError("Controller with host " + controller.host + " and port " +
                                 std::to_string(controller.port) + " already exists");
        }
        CanonicalController stored = controller;
        stored.createdAt = it->second.createdAt;
        stored.updatedAt = CatalogClock::now();
        it->second = stored;
        changes_.controllers.insert(stored.id);
        return stored;
    }

    bool deleteController(const std::string& controllerId) override {
        beginWrite();
        if (working_.controllers.erase(controllerId) == 0U) {
            return false;
        }
        changes_.controllers.insert(controllerId);
        eraseAllPoints(controllerId);
        return true;
    }

    CanonicalPoint createPoint(const CanonicalPoint& point) override {
        beginWrite();
        if (working_.controllers.find(point.controllerId) == working_.controllers.end()) {
            throw NotFoundError("Controller " + point.controllerId + " not found");
        }
        if (findPointByNaturalKey(naturalKeyOf(point))) {
            throw DuplicateError(describeKey(point) + " already exists");
        }
        CanonicalPoint stored = point;
        stored.id = store_.nextId("point");
        stored.createdAt = CatalogClock::now();
        stored.updatedAt = stored.createdAt;
        working_.points[stored.id] = stored;
        changes_.points.insert(stored.id);
        return stored;
    }

    CanonicalPoint updatePoint(const CanonicalPoint& point) override {
        beginWrite();
        const auto it = working_.points.find(point.id);
        if (it == working_.points.end()) {
            throw NotFoundError("Point " + point.id + " not found");
        }
        const auto clash = findPointByNaturalKey(naturalKeyOf(point));
        if (clash && clash->id != point.id) {
            throw DuplicateError(describeKey(point) + " already exists");
        }
        CanonicalPoint stored = point;
        stored.createdAt = it->second.createdAt;
        stored.updatedAt = CatalogClock::now();
        it->second = stored;
        changes_.points.insert(stored.id);
        return stored;
    }

    bool deletePoint(const std::string& pointId) override {
        beginWrite();
        if (working_.points.erase(pointId) == 0U) {
            return false;
        }
        changes_.points.insert(pointId);
        return true;
    }

    std::size_t deletePoints(const std::string& controllerId) override {
        beginWrite();
        return eraseAllPoints(controllerId);
    }

    void commit() override {
        requireActive();
        store_.publish(working_, changes_);
        working_ = MemoryCatalogStore::State{};
        changes_ = MemoryCatalogStore::ChangeSet{};
        active_ = false;
    }

    void rollback() override {
        working_ = MemoryCatalogStore::State{};
        changes_ = MemoryCatalogStore::ChangeSet{};
        active_ = false;
    }

    bool active() const override { return active_; }

private:
    void requireActive() const {
        if (!active_) {
            throw std::logic_error("catalog session is no longer active");
        }
    }

    void beginWrite() {
        requireActive();
        if (store_.consumeWriteFailure()) {
            throw std::runtime_error("injected catalog write failure");
        }
    }

    std::size_t eraseAllPoints(const std::string& controllerId) {
        std::size_t removed = 0;
        for (auto it = working_.points.begin(); it != working_.points.end();) {
            if (it->second.controllerId == controllerId) {
                changes_.points.insert(it->first);
                it = working_.points.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    static std::string describeKey(const CanonicalPoint& point) {
        return std::string("Point ") + toString(point.kind) + "@" + std::to_string(point.address) +
               " (unit " + std::to_string(point.unitId) + ")";
    }

    MemoryCatalogStore& store_;
    MemoryCatalogStore::State working_;
    MemoryCatalogStore::ChangeSet changes_;
    bool active_ = true;
};

std::unique_ptr<ICatalogSession> MemoryCatalogStore::beginSession() {
    return std::make_unique<MemoryCatalogSession>(*this);
}

std::size_t MemoryCatalogStore::controllerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.controllers.size();
}

std::size_t MemoryCatalogStore::pointCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.points.size();
}

std::uint64_t MemoryCatalogStore::commitCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return commits_;
}

void MemoryCatalogStore::injectWriteFailures(std::size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    pendingWriteFailures_ = count;
}

MemoryCatalogStore::State MemoryCatalogStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void MemoryCatalogStore::publish(const State& working, const ChangeSet& changes) {
    std::lock_guard<std::mutex> lock(mutex_);
    State next = state_;

    for (const auto& id : changes.controllers) {
        next.controllers.erase(id);
        if (working.controllers.find(id) == working.controllers.end()) {
            // Deleted here: drop rows other sessions attached meanwhile.
            for (auto it = next.points.begin(); it != next.points.end();) {
                it = (it->second.controllerId == id) ? next.points.erase(it) : std::next(it);
            }
        }
    }
    for (const auto& id : changes.points) {
        next.points.erase(id);
    }

    for (const auto& id : changes.controllers) {
        const auto it = working.controllers.find(id);
        if (it == working.controllers.end()) {
            continue;
        }
        const auto& controller = it->second;
        for (const auto& kv : next.controllers) {
            if (kv.second.host == controller.host && kv.second.port == controller.port) {
                throw DuplicateError("Controller with host " + controller.host + " and port " +
                                     std::to_string(controller.port) + " already exists");
            }
        }
        next.controllers[id] = controller;
    }
    for (const auto& id : changes.points) {
        const auto it = working.points.find(id);
        if (it == working.points.end()) {
            continue;
        }
        const auto& point = it->second;
        if (next.controllers.find(point.controllerId) == next.controllers.end()) {
            throw NotFoundError("Controller " + point.controllerId + " not found");
        }
        const auto key = naturalKeyOf(point);
        for (const auto& kv : next.points) {
            if (naturalKeyOf(kv.second) == key) {
                throw DuplicateError(std::string("Point ") + toString(point.kind) + "@" +
                                     std::to_string(point.address) + " (unit " +
                                     std::to_string(point.unitId) + ") already exists");
            }
        }
        next.points[id] = point;
    }

    state_ = std::move(next);
    ++commits_;
}

bool MemoryCatalogStore::consumeWriteFailure() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pendingWriteFailures_ == 0U) {
        return false;
    }
    --pendingWriteFailures_;
    return true;
}

std::string MemoryCatalogStore::nextId(const char* prefix) {
    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "%s-%08llu", prefix,
                  static_cast<unsigned long long>(++idSequence_));
    return buffer;
}

} // namespace mbc
