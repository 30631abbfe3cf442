#pragma once

#include <string>
#include <cstdint>
#include <vector>

namespace dbfs_content {

/**
 * ObjectDisk: Low-level disk I/O for content objects
 *
 * Responsibilities:
 * - One file per object: <objects_dir>/obj_<id>.dat
 * - Whole-object reads and writes (objects are immutable once written)
 * - fsync on write when durability is requested
 * - Enumerate stored objects for start-up recovery
 *
 * Thread-safety:
 * - NOT thread-safe internally; ContentStore serializes access
 *
 * Usage:
 *   ObjectDisk disk("/var/lib/dbfs/objects");
 *   disk.WriteObject(7, bytes, true);
 *   std::string bytes;
 *   disk.ReadObject(7, bytes);
 */
class ObjectDisk {
public:
    /**
     * Initialize ObjectDisk, creating the directory if needed
     * @param objects_dir Directory holding object files
     */
    explicit ObjectDisk(const std::string& objects_dir);

    /**
     * Write a whole object to disk
     *
     * Data is written to a temporary file first and renamed into place, so a
     * reader never sees a half-written object.
     *
     * @param object_id Object identifier
     * @param data Object payload
     * @param sync If true, fsync the file before renaming
     * @return true if successful, false on I/O error
     */
    bool WriteObject(uint64_t object_id, const std::string& data, bool sync);

    /**
     * Read a whole object from disk
     * @param object_id Object identifier
     * @param out_data [OUTPUT] Object payload
     * @return true if successful, false if missing or I/O error
     */
    bool ReadObject(uint64_t object_id, std::string& out_data);

    /**
     * Write the checksum sidecar of an object (obj_<id>.sha256)
     */
    bool WriteChecksum(uint64_t object_id, const std::string& checksum, bool sync);

    /**
     * Read the checksum sidecar of an object
     * @return true if the sidecar exists and was read
     */
    bool ReadChecksum(uint64_t object_id, std::string& out_checksum);

    /**
     * Delete an object and its sidecar
     * @return true if the object file existed and was removed
     */
    bool DeleteObject(uint64_t object_id);

    bool ObjectExists(uint64_t object_id) const;

    /**
     * @return Object size in bytes, or 0 if not found
     */
    uint64_t GetObjectSize(uint64_t object_id) const;

    /**
     * Scan the directory for obj_<id>.dat files
     * @return Ids of every stored object
     */
    std::vector<uint64_t> ListObjectIds() const;

    struct AccessStats {
        uint64_t total_reads = 0;
        uint64_t total_writes = 0;
        uint64_t total_bytes_read = 0;
        uint64_t total_bytes_written = 0;
    };

    AccessStats GetAccessStats() const;
    void ResetAccessStats();

private:
    std::string objects_dir_;
    AccessStats stats_;

    std::string GetObjectPath(uint64_t object_id) const;
    std::string GetChecksumPath(uint64_t object_id) const;
    bool WriteFileAtomically(const std::string& path, const std::string& data, bool sync);
};

}  // namespace dbfs_content
