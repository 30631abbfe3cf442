#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "dbfs_common/status.hpp"
#include "dbfs_content/file_stream.hpp"

namespace dbfs_content {

class ObjectDisk;
class ContentCache;

/**
 * ContentStore: maps opaque content ids to immutable byte payloads
 *
 * Responsibilities:
 * - Allocate FileStream handles (read snapshots or staged writes)
 * - Commit write streams into new immutable objects
 * - Serve object reads, cache-first, verifying SHA-256 on disk reads
 * - Duplicate and release objects on behalf of the tree engine
 * - Recover the object inventory from disk and collect orphans
 *
 * Architecture:
 *   ContentStore (ids, checksums, allocation)
 *       ├─> ContentCache (recently read objects)
 *       └─> ObjectDisk (one file per object)
 *
 * The tree engine never looks inside payloads; it only stores the ids
 * returned here.
 *
 * Thread-safety:
 * - All public methods are thread-safe (store_mutex_)
 * - FileStream writes do not touch the store until Commit
 */
class ContentStore {
public:
    /**
     * @param objects_dir Directory for object files
     * @param cache_enabled Keep recently read objects in memory
     * @param cache_bytes Cache capacity in bytes
     * @param sync fsync every object write
     */
    ContentStore(const std::string& objects_dir, bool cache_enabled,
                 uint64_t cache_bytes, bool sync);
    ~ContentStore();

    /**
     * Allocate a stream
     *
     * - kWrite, object_id=0: empty staged buffer (plus initial_data)
     * - kWrite, object_id=N: buffer pre-loaded with object N, then initial_data
     * - kRead: object_id must name a committed object
     *
     * @return NotFound if object_id is set but unknown
     */
    dbfs_common::Result<std::shared_ptr<FileStream>> Open(
        StreamMode mode, uint64_t estimated_length,
        uint64_t object_id = 0, const std::string& initial_data = "");

    /**
     * Finalize a write stream into a new immutable object
     * @return new content id; Invalid for read or already-committed streams
     */
    dbfs_common::Result<uint64_t> Commit(FileStream& stream);

    /**
     * Store bytes directly as a new object
     */
    dbfs_common::Result<uint64_t> Store(const std::string& data);

    /**
     * Full payload of an object
     * @return NotFound for unknown ids, IoError on read or checksum failure
     */
    dbfs_common::Result<std::string> Read(uint64_t content_id);

    /**
     * Copy an object's bytes into a new object
     */
    dbfs_common::Result<uint64_t> Duplicate(uint64_t content_id);

    /**
     * Drop an object from disk and cache
     */
    dbfs_common::Status Release(uint64_t content_id);

    bool Exists(uint64_t content_id) const;
    uint64_t SizeOf(uint64_t content_id) const;
    std::vector<uint64_t> ListObjects() const;

    /**
     * Delete every stored object whose id is not in live_ids
     * @return Number of objects removed
     */
    size_t CollectGarbage(const std::unordered_set<uint64_t>& live_ids);

    struct AccessStats {
        uint64_t objects = 0;
        uint64_t stored_bytes = 0;
        uint64_t disk_reads = 0;
        uint64_t disk_writes = 0;
        uint64_t cache_hits = 0;
        uint64_t cache_misses = 0;
        uint64_t checksum_failures = 0;
    };

    AccessStats GetAccessStats() const;

    static std::string CalculateChecksum(const std::string& data);

private:
    struct ObjectInfo {
        uint64_t size = 0;
        std::string checksum;
    };

    std::unique_ptr<ObjectDisk> disk_;
    std::unique_ptr<ContentCache> cache_;
    bool cache_enabled_;
    bool sync_;

    std::unordered_map<uint64_t, ObjectInfo> objects_;
    uint64_t next_object_id_ = 1;
    uint64_t checksum_failures_ = 0;
    mutable std::mutex store_mutex_;

    void LoadExistingObjects();
    dbfs_common::Result<uint64_t> StoreLocked(const std::string& data);
    dbfs_common::Result<std::string> ReadLocked(uint64_t content_id);
};

}  // namespace dbfs_content
