#include "dbfs_content/content_cache.hpp"
#include <iostream>

namespace dbfs_content {

ContentCache::ContentCache(uint64_t capacity_bytes)
    : capacity_bytes_(capacity_bytes) {
    std::cout << "ContentCache: Initialized with capacity " << capacity_bytes_
              << " bytes" << std::endl;
}

bool ContentCache::Get(uint64_t object_id, std::string& out_data) {
    std::lock_guard<std::mutex> lock(cache_mutex_);

    auto it = cache_map_.find(object_id);
    if (it == cache_map_.end()) {
        stats_.misses++;
        return false;
    }

    // Move to front (most recently used)
    lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
    out_data = it->second->data;
    stats_.hits++;
    return true;
}

bool ContentCache::Put(uint64_t object_id, const std::string& data) {
    std::lock_guard<std::mutex> lock(cache_mutex_);

    auto it = cache_map_.find(object_id);
    if (it != cache_map_.end()) {
        EraseLocked(it);
    }

    if (data.size() > capacity_bytes_) {
        return false;
    }

    EvictUntilFitsLocked(data.size());

    lru_list_.push_front(Entry{object_id, data});
    cache_map_[object_id] = lru_list_.begin();
    size_bytes_ += data.size();
    return true;
}

bool ContentCache::Remove(uint64_t object_id) {
    std::lock_guard<std::mutex> lock(cache_mutex_);

    auto it = cache_map_.find(object_id);
    if (it == cache_map_.end()) {
        return false;
    }
    EraseLocked(it);
    return true;
}

bool ContentCache::Contains(uint64_t object_id) const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_map_.find(object_id) != cache_map_.end();
}

void ContentCache::Clear() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    lru_list_.clear();
    cache_map_.clear();
    size_bytes_ = 0;
}

void ContentCache::EraseLocked(
    std::unordered_map<uint64_t, std::list<Entry>::iterator>::iterator it) {
    size_bytes_ -= it->second->data.size();
    lru_list_.erase(it->second);
    cache_map_.erase(it);
}

void ContentCache::EvictUntilFitsLocked(uint64_t incoming_bytes) {
    while (!lru_list_.empty() && size_bytes_ + incoming_bytes > capacity_bytes_) {
        // Evict the least recently used (back of the list)
        auto it = cache_map_.find(lru_list_.back().object_id);
        EraseLocked(it);
        stats_.evictions++;
    }
}

ContentCache::CacheStats ContentCache::GetStats() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    CacheStats stats = stats_;
    stats.entries = cache_map_.size();
    stats.bytes = size_bytes_;
    return stats;
}

void ContentCache::ResetStats() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    stats_.hits = 0;
    stats_.misses = 0;
    stats_.evictions = 0;
}

}  // namespace dbfs_content
