#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

namespace agegraph {
namespace cache {

/**
 * Fixed-capacity key/value store with least-recently-used eviction.
 *
 * Recency is kept in a std::list (front = most recent) indexed by an
 * unordered_map, so get/put/erase are O(1). Any get() or put() marks the key
 * as most recently used; when a new key is inserted into a full cache the
 * entry at the back of the list is evicted first.
 *
 * Not thread-safe: callers sharing an instance across threads must serialise
 * access themselves.
 *
 * Usage:
 *   LruCache<std::string, int> cache(2);
 *   cache.put("a", 1);
 *   cache.put("b", 2);
 *   cache.get("a");          // "a" is now most recent
 *   cache.put("c", 3);       // evicts "b"
 */
template <typename K, typename V, typename Hash = std::hash<K>>
class LruCache {
public:
    using Entry = std::pair<K, V>;
    using Predicate = std::function<bool(const K&, const V&)>;

    /**
     * Called with every entry pushed out by capacity pressure. Entries removed
     * through clear(), erase() or replacement by put() are not reported.
     */
    using EvictionListener = std::function<void(const K&, V&)>;

    static constexpr size_t DEFAULT_MAX_SIZE = 100;

    explicit LruCache(size_t maxSize = DEFAULT_MAX_SIZE, EvictionListener onEvict = nullptr)
        : m_maxSize(maxSize)
        , m_onEvict(std::move(onEvict))
    {}

    /**
     * Returns the value and marks it most recently used.
     * std::nullopt if the key is absent.
     */
    std::optional<V> get(const K& key) {
        auto it = m_index.find(key);
        if (it == m_index.end()) {
            return std::nullopt;
        }
        m_entries.splice(m_entries.begin(), m_entries, it->second);
        return it->second->second;
    }

    /**
     * Insert or replace. A replaced key loses its previous recency.
     */
    void put(const K& key, V value) {
        auto it = m_index.find(key);
        if (it != m_index.end()) {
            m_entries.erase(it->second);
            m_index.erase(it);
        } else if (m_maxSize > 0 && m_index.size() >= m_maxSize) {
            evictLeastRecent();
        }

        if (m_maxSize == 0) {
            return;
        }

        m_entries.emplace_front(key, std::move(value));
        m_index[key] = m_entries.begin();
    }

    /**
     * Remove every entry.
     */
    void clear() {
        m_entries.clear();
        m_index.clear();
    }

    /**
     * Remove exactly the entries matching the predicate. The others keep
     * their relative recency order.
     */
    void clear(const Predicate& predicate) {
        if (!predicate) {
            clear();
            return;
        }
        for (auto it = m_entries.begin(); it != m_entries.end();) {
            if (predicate(it->first, it->second)) {
                m_index.erase(it->first);
                it = m_entries.erase(it);
            } else {
                ++it;
            }
        }
    }

    /**
     * Remove one key. Returns false if it was absent.
     */
    bool erase(const K& key) {
        auto it = m_index.find(key);
        if (it == m_index.end()) {
            return false;
        }
        m_entries.erase(it->second);
        m_index.erase(it);
        return true;
    }

    // Does not touch recency
    bool contains(const K& key) const { return m_index.find(key) != m_index.end(); }

    /**
     * Pointer to the value without touching recency, nullptr if absent.
     * Invalidated by any later put/erase/clear of that key.
     */
    const V* peek(const K& key) const {
        auto it = m_index.find(key);
        return it == m_index.end() ? nullptr : &it->second->second;
    }

    size_t size() const { return m_index.size(); }
    size_t maxSize() const { return m_maxSize; }
    bool empty() const { return m_index.empty(); }

    /**
     * Keys from most to least recently used.
     */
    std::list<K> keys() const {
        std::list<K> result;
        for (const auto& entry : m_entries) {
            result.push_back(entry.first);
        }
        return result;
    }

private:
    void evictLeastRecent() {
        if (m_entries.empty()) {
            return;
        }
        auto last = std::prev(m_entries.end());
        Entry evicted = std::move(*last);
        m_index.erase(evicted.first);
        m_entries.erase(last);

        if (m_onEvict) {
            m_onEvict(evicted.first, evicted.second);
        }
    }

    size_t m_maxSize;
    EvictionListener m_onEvict;
    std::list<Entry> m_entries;
    std::unordered_map<K, typename std::list<Entry>::iterator, Hash> m_index;
};

} // namespace cache
} // namespace agegraph
