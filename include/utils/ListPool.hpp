/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LIST_POOL_HPP
#define LIST_POOL_HPP

#include <boost/container/small_vector.hpp>
#include <cstddef>
#include <utility>
#include <vector>

namespace Traverse {

/**
 * @brief Cache of reusable list buffers for per-frame scratch work.
 *
 * obtain() hands out a Lease that owns a cleared buffer; the buffer goes back
 * to the cache when the Lease is destroyed, on every exit path. Buffers keep
 * their capacity between uses so steady-state frames do not allocate.
 *
 * Not thread-safe: a pool belongs to one owner on one thread.
 */
template <typename T, std::size_t InlineCapacity = 16>
class ListPool {
public:
    using List = boost::container::small_vector<T, InlineCapacity>;

    class Lease {
    public:
        Lease(Lease&& other) noexcept
            : m_pool(std::exchange(other.m_pool, nullptr)), m_list(std::move(other.m_list)) {}

        Lease& operator=(Lease&&) = delete;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        ~Lease() {
            if (m_pool) {
                m_pool->release(std::move(m_list));
            }
        }

        List& get() { return m_list; }
        const List& get() const { return m_list; }
        List& operator*() { return m_list; }
        List* operator->() { return &m_list; }

    private:
        friend class ListPool;
        Lease(ListPool* pool, List&& list) : m_pool(pool), m_list(std::move(list)) {}

        ListPool* m_pool;
        List m_list;
    };

    ListPool() = default;
    ListPool(const ListPool&) = delete;
    ListPool& operator=(const ListPool&) = delete;

    // Borrow an empty list; it is returned automatically when the Lease dies
    Lease obtain() {
        if (m_cache.empty()) {
            return Lease(this, List{});
        }
        List list = std::move(m_cache.back());
        m_cache.pop_back();
        list.clear();
        return Lease(this, std::move(list));
    }

    // Pre-creates buffers so the first frames do not allocate
    void warmCache(std::size_t count) {
        while (m_cache.size() < count) {
            m_cache.emplace_back();
        }
    }

    // Drops cached buffers beyond count
    void trimCache(std::size_t count) {
        if (m_cache.size() > count) {
            m_cache.resize(count);
        }
    }

    void clearCache() { m_cache.clear(); }

    std::size_t cachedCount() const { return m_cache.size(); }

private:
    void release(List&& list) {
        list.clear();
        m_cache.push_back(std::move(list));
    }

    std::vector<List> m_cache;
};

} // namespace Traverse

#endif // LIST_POOL_HPP
