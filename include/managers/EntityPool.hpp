/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_POOL_HPP
#define ENTITY_POOL_HPP

#include "core/Logger.hpp"
#include "entities/EntityRecords.hpp"

#include <boost/container/flat_set.hpp>
#include <cstddef>
#include <cstdint>
#include <format>
#include <memory>
#include <string>
#include <vector>

namespace PopEngine {

struct PoolStats {
    size_t total{0};      // records ever allocated
    size_t inUse{0};
    size_t available{0};
    size_t peakInUse{0};
};

/**
 * @brief Growable pool of reusable entity records.
 *
 * The pool owns every record it ever allocated. acquire() hands out a
 * reference that stays valid until the record is released; the caller's
 * live collections hold plain pointers. Records are only allocated when the
 * free list is empty, so total never exceeds the peak number in use.
 */
template <typename T>
class ObjectPool {
public:
    explicit ObjectPool(std::string idPrefix) : m_idPrefix(std::move(idPrefix)) {}

    ObjectPool(const ObjectPool&) = delete;
    ObjectPool& operator=(const ObjectPool&) = delete;

    T& acquire() {
        T* record = nullptr;
        if (m_free.empty()) {
            m_storage.push_back(std::make_unique<T>());
            record = m_storage.back().get();
        } else {
            record = m_free.back();
            m_free.pop_back();
            *record = T{};
        }

        record->id = std::format("{}_{}", m_idPrefix, ++m_nextId);
        m_inUse.insert(record);
        if (m_inUse.size() > m_peakInUse) {
            m_peakInUse = m_inUse.size();
        }
        return *record;
    }

    /**
     * @brief Return a record to the free list.
     * @return false when the record was already released or is not ours
     */
    bool release(const T& record) {
        auto it = m_inUse.find(&record);
        if (it == m_inUse.end()) {
            POOL_DEBUG(std::format("Ignoring release of {} ({} not in use)",
                                   record.id, m_idPrefix));
            return false;
        }
        T* owned = const_cast<T*>(*it);
        m_inUse.erase(it);
        m_free.push_back(owned);
        return true;
    }

    void releaseAll() {
        for (const T* record : m_inUse) {
            m_free.push_back(const_cast<T*>(record));
        }
        m_inUse.clear();
    }

    bool isInUse(const T& record) const { return m_inUse.find(&record) != m_inUse.end(); }

    PoolStats getStats() const {
        PoolStats stats;
        stats.total = m_storage.size();
        stats.inUse = m_inUse.size();
        stats.available = m_free.size();
        stats.peakInUse = m_peakInUse;
        return stats;
    }

private:
    std::string m_idPrefix;
    std::vector<std::unique_ptr<T>> m_storage;
    std::vector<T*> m_free;
    boost::container::flat_set<const T*> m_inUse;
    size_t m_peakInUse{0};
    uint64_t m_nextId{0};
};

/**
 * @brief The pools a simulation session needs. Owned by the driver.
 */
class EntityPools {
public:
    EntityPools();

    Enemy& acquireEnemy() { return m_enemies.acquire(); }
    Projectile& acquireProjectile() { return m_projectiles.acquire(); }

    bool release(const Enemy& enemy) { return m_enemies.release(enemy); }
    bool release(const Projectile& projectile) { return m_projectiles.release(projectile); }

    void releaseAll();

    PoolStats getEnemyStats() const { return m_enemies.getStats(); }
    PoolStats getProjectileStats() const { return m_projectiles.getStats(); }

private:
    ObjectPool<Enemy> m_enemies;
    ObjectPool<Projectile> m_projectiles;
};

} // namespace PopEngine

#endif // ENTITY_POOL_HPP
