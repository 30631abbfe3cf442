#include "dbfs_content/content_store.hpp"
#include "dbfs_content/content_cache.hpp"
#include "dbfs_content/disk.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <openssl/sha.h>

using dbfs_common::Result;
using dbfs_common::Status;

namespace dbfs_content {

ContentStore::ContentStore(const std::string& objects_dir, bool cache_enabled,
                           uint64_t cache_bytes, bool sync)
    : cache_enabled_(cache_enabled), sync_(sync) {
    disk_ = std::make_unique<ObjectDisk>(objects_dir);
    cache_ = std::make_unique<ContentCache>(cache_bytes);

    LoadExistingObjects();

    std::cout << "ContentStore: Initialized at " << objects_dir << " ("
              << objects_.size() << " objects, cache "
              << (cache_enabled_ ? "enabled" : "disabled") << ")" << std::endl;
}

ContentStore::~ContentStore() {
    std::lock_guard<std::mutex> lock(store_mutex_);
    std::cout << "ContentStore: Destroyed. Holding " << objects_.size()
              << " objects." << std::endl;
}

std::string ContentStore::CalculateChecksum(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

void ContentStore::LoadExistingObjects() {
    std::lock_guard<std::mutex> lock(store_mutex_);

    for (uint64_t object_id : disk_->ListObjectIds()) {
        ObjectInfo info;
        info.size = disk_->GetObjectSize(object_id);

        if (!disk_->ReadChecksum(object_id, info.checksum)) {
            // Sidecar lost: trust the payload as found and re-seal it
            std::string data;
            if (!disk_->ReadObject(object_id, data)) {
                std::cerr << "ContentStore: Skipping unreadable object " << object_id
                          << std::endl;
                continue;
            }
            info.checksum = CalculateChecksum(data);
            if (!disk_->WriteChecksum(object_id, info.checksum, sync_)) {
                std::cerr << "ContentStore: Failed to rewrite checksum for object "
                          << object_id << std::endl;
            }
        }

        objects_[object_id] = info;
        next_object_id_ = std::max(next_object_id_, object_id + 1);
    }
}

Result<std::shared_ptr<FileStream>> ContentStore::Open(StreamMode mode,
                                                       uint64_t estimated_length,
                                                       uint64_t object_id,
                                                       const std::string& initial_data) {
    std::string data;
    if (object_id != 0) {
        std::lock_guard<std::mutex> lock(store_mutex_);
        Result<std::string> existing = ReadLocked(object_id);
        if (!existing.ok()) {
            return existing.status();
        }
        data = std::move(existing.value());
    } else if (mode == StreamMode::kRead) {
        return Status::NotFound("read stream requires a committed object id");
    }

    if (mode == StreamMode::kWrite) {
        data.append(initial_data);
    }

    return std::make_shared<FileStream>(mode, estimated_length, object_id, std::move(data));
}

Result<uint64_t> ContentStore::Commit(FileStream& stream) {
    std::string data;
    Status st = stream.BeginCommit(data);
    if (!st.ok()) {
        return st;
    }

    Result<uint64_t> stored = Store(data);
    if (!stored.ok()) {
        stream.AbortCommit();
        return stored.status();
    }

    stream.FinishCommit(stored.value());
    std::cout << "ContentStore: Committed stream " << stream.Handle() << " as object "
              << stored.value() << " (" << data.size() << " bytes)" << std::endl;
    return stored;
}

Result<uint64_t> ContentStore::Store(const std::string& data) {
    std::lock_guard<std::mutex> lock(store_mutex_);
    return StoreLocked(data);
}

Result<uint64_t> ContentStore::StoreLocked(const std::string& data) {
    uint64_t object_id = next_object_id_++;
    std::string checksum = CalculateChecksum(data);

    if (!disk_->WriteObject(object_id, data, sync_)) {
        return Status::IoError("failed to write object " + std::to_string(object_id));
    }
    if (!disk_->WriteChecksum(object_id, checksum, sync_)) {
        if (!disk_->DeleteObject(object_id)) {
            std::cerr << "ContentStore: Failed to remove unsealed object " << object_id
                      << std::endl;
        }
        return Status::IoError("failed to write checksum of object " +
                               std::to_string(object_id));
    }

    objects_[object_id] = ObjectInfo{data.size(), checksum};
    if (cache_enabled_) {
        cache_->Put(object_id, data);
    }
    return object_id;
}

Result<std::string> ContentStore::Read(uint64_t content_id) {
    std::lock_guard<std::mutex> lock(store_mutex_);
    return ReadLocked(content_id);
}

Result<std::string> ContentStore::ReadLocked(uint64_t content_id) {
    auto it = objects_.find(content_id);
    if (it == objects_.end()) {
        return Status::NotFound("unknown content object " + std::to_string(content_id));
    }

    std::string data;
    if (cache_enabled_ && cache_->Get(content_id, data)) {
        return data;
    }

    if (!disk_->ReadObject(content_id, data)) {
        return Status::IoError("failed to read object " + std::to_string(content_id));
    }

    if (CalculateChecksum(data) != it->second.checksum) {
        checksum_failures_++;
        std::cerr << "ContentStore: Checksum mismatch for object " << content_id
                  << std::endl;
        return Status::IoError("checksum mismatch for object " + std::to_string(content_id));
    }

    if (cache_enabled_) {
        cache_->Put(content_id, data);
    }
    return data;
}

Result<uint64_t> ContentStore::Duplicate(uint64_t content_id) {
    std::lock_guard<std::mutex> lock(store_mutex_);
    Result<std::string> data = ReadLocked(content_id);
    if (!data.ok()) {
        return data.status();
    }
    return StoreLocked(data.value());
}

Status ContentStore::Release(uint64_t content_id) {
    std::lock_guard<std::mutex> lock(store_mutex_);

    auto it = objects_.find(content_id);
    if (it == objects_.end()) {
        return Status::NotFound("unknown content object " + std::to_string(content_id));
    }

    cache_->Remove(content_id);
    objects_.erase(it);
    if (!disk_->DeleteObject(content_id)) {
        return Status::IoError("failed to delete object " + std::to_string(content_id));
    }
    return Status::OK();
}

bool ContentStore::Exists(uint64_t content_id) const {
    std::lock_guard<std::mutex> lock(store_mutex_);
    return objects_.find(content_id) != objects_.end();
}

uint64_t ContentStore::SizeOf(uint64_t content_id) const {
    std::lock_guard<std::mutex> lock(store_mutex_);
    auto it = objects_.find(content_id);
    return it == objects_.end() ? 0 : it->second.size;
}

std::vector<uint64_t> ContentStore::ListObjects() const {
    std::lock_guard<std::mutex> lock(store_mutex_);
    std::vector<uint64_t> ids;
    ids.reserve(objects_.size());
    for (const auto& pair : objects_) {
        ids.push_back(pair.first);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

size_t ContentStore::CollectGarbage(const std::unordered_set<uint64_t>& live_ids) {
    std::lock_guard<std::mutex> lock(store_mutex_);

    size_t removed = 0;
    for (auto it = objects_.begin(); it != objects_.end();) {
        if (live_ids.count(it->first) != 0) {
            ++it;
            continue;
        }
        cache_->Remove(it->first);
        if (!disk_->DeleteObject(it->first)) {
            std::cerr << "ContentStore: Failed to collect orphan object " << it->first
                      << std::endl;
            ++it;
            continue;
        }
        it = objects_.erase(it);
        removed++;
    }

    if (removed > 0) {
        std::cout << "ContentStore: Collected " << removed << " orphan objects" << std::endl;
    }
    return removed;
}

ContentStore::AccessStats ContentStore::GetAccessStats() const {
    std::lock_guard<std::mutex> lock(store_mutex_);

    AccessStats stats;
    stats.objects = objects_.size();
    for (const auto& pair : objects_) {
        stats.stored_bytes += pair.second.size;
    }
    auto disk_stats = disk_->GetAccessStats();
    stats.disk_reads = disk_stats.total_reads;
    stats.disk_writes = disk_stats.total_writes;
    auto cache_stats = cache_->GetStats();
    stats.cache_hits = cache_stats.hits;
    stats.cache_misses = cache_stats.misses;
    stats.checksum_failures = checksum_failures_;
    return stats;
}

}  // namespace dbfs_content
