/**
 * @file memory_catalog_store.hpp
 * @brief modbusconf source file.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "modbusconf/catalog/i_catalog_store.hpp"

namespace mbc {

class MemoryCatalogSession;

/**
 * @brief Transactional in-memory catalog.
 *
 * Each session works on a private copy of the committed state and records
 * which controller and point ids it touched. commit() replays only those rows
 * onto the current committed state under the store mutex, re-checking the
 * unique constraints, so sessions changing different controllers never lose
 * each other's rows. Two sessions updating the same row resolve as last
 * commit wins.
 */
class MemoryCatalogStore final : public ICatalogStore {
public:
    MemoryCatalogStore() = default;

    std::unique_ptr<ICatalogSession> beginSession() override;

    std::size_t controllerCount() const;
    std::size_t pointCount() const;
    std::uint64_t commitCount() const;

    /**
     * @brief Make the next @p count session writes fail with std::runtime_error.
     */
    void injectWriteFailures(std::size_t count);

private:
    friend class MemoryCatalogSession;

    struct State {
        std::map<std::string, CanonicalController> controllers;
        std::map<std::string, CanonicalPoint> points;
    };

    struct ChangeSet {
        std::set<std::string> controllers;
        std::set<std::string> points;
    };

    State snapshot() const;
    /**
     * @throws DuplicateError or NotFoundError when the change set no longer
     *         fits the committed state; nothing is applied then.
     */
    void publish(const State& working, const ChangeSet& changes);
    bool consumeWriteFailure();
    std::string nextId(const char* prefix);

    mutable std::mutex mutex_;
    State state_;
    std::size_t pendingWriteFailures_ = 0;
    std::uint64_t commits_ = 0;
    std::atomic<std::uint64_t> idSequence_{0};
};

} // namespace mbc
