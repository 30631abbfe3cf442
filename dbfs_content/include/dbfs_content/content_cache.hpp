#pragma once

#include <cstdint>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>

namespace dbfs_content {

constexpr uint64_t DEFAULT_CACHE_BYTES = 64ull * 1024 * 1024;  // 64MB

/**
 * ContentCache: Least Recently Used cache of committed content objects
 *
 * Eviction Policy:
 * - Bounded by total payload bytes, not entry count
 * - Evicts least recently used objects until the new object fits
 * - Objects larger than the whole capacity are never cached
 *
 * Committed objects are immutable, so entries are always clean and eviction
 * never writes anything back.
 *
 * Thread-safety:
 * - Internally thread-safe using mutex
 */
class ContentCache {
public:
    explicit ContentCache(uint64_t capacity_bytes = DEFAULT_CACHE_BYTES);

    bool Get(uint64_t object_id, std::string& out_data);

    /**
     * Insert or refresh an object
     * @return false if the object is larger than the cache capacity
     */
    bool Put(uint64_t object_id, const std::string& data);

    bool Remove(uint64_t object_id);
    bool Contains(uint64_t object_id) const;
    void Clear();

    struct CacheStats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t evictions = 0;
        uint64_t entries = 0;
        uint64_t bytes = 0;
    };

    CacheStats GetStats() const;
    void ResetStats();
    uint64_t GetCapacity() const { return capacity_bytes_; }

private:
    struct Entry {
        uint64_t object_id;
        std::string data;
    };

    uint64_t capacity_bytes_;
    uint64_t size_bytes_ = 0;

    // Front is most recently used
    std::list<Entry> lru_list_;
    std::unordered_map<uint64_t, std::list<Entry>::iterator> cache_map_;

    mutable std::mutex cache_mutex_;
    CacheStats stats_;

    void EraseLocked(std::unordered_map<uint64_t, std::list<Entry>::iterator>::iterator it);
    void EvictUntilFitsLocked(uint64_t incoming_bytes);
};

}  // namespace dbfs_content
