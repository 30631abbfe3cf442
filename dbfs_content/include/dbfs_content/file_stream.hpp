#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include "dbfs_common/status.hpp"

namespace dbfs_content {

enum class StreamMode {
    kRead,
    kWrite
};

// Upper bound on the buffer reserved up front for an estimated length.
// The estimate is a hint; streams may grow past it.
constexpr uint64_t MAX_RESERVE_BYTES = 16ull * 1024 * 1024;

/**
 * FileStream: in-flight read or write of a content object
 *
 * A stream does nothing to the filesystem until it is injected (committed
 * through ContentStore and linked to a node). Its owner may write to it
 * without holding the filesystem lock; the per-stream mutex only guards
 * against the commit reading the buffer concurrently.
 *
 * Lifecycle: created -> written/read -> optionally committed -> discarded
 */
class FileStream {
public:
    FileStream(StreamMode mode, uint64_t estimated_length,
               uint64_t source_object_id, std::string initial_data);

    FileStream(const FileStream&) = delete;
    FileStream& operator=(const FileStream&) = delete;

    /**
     * Shared read-only sentinel returned by denied content reads
     */
    static std::shared_ptr<const FileStream> Empty();

    const std::string& Handle() const { return handle_; }
    StreamMode Mode() const { return mode_; }
    uint64_t EstimatedLength() const { return estimated_length_; }
    uint64_t SourceObjectId() const { return source_object_id_; }
    bool IsEmptySentinel() const { return empty_sentinel_; }

    /**
     * Append bytes at the end of the staged buffer
     * @return Invalid for read streams or committed streams
     */
    dbfs_common::Status Write(const std::string& data);

    /**
     * Overwrite bytes starting at offset; a gap past the end is zero-filled
     * @return Invalid for read streams, committed streams, or an offset more
     *         than MAX_RESERVE_BYTES past the end of the buffer
     */
    dbfs_common::Status WriteAt(uint64_t offset, const std::string& data);

    /**
     * Read a range of the buffer
     * - offset=0, length=0: everything
     * - offset=N, length=0: from N to the end
     * - offset past the end: empty result
     */
    void Read(uint64_t offset, uint64_t length, std::string& out_data) const;

    std::string ReadAll() const;
    uint64_t Size() const;

    bool Committed() const;
    uint64_t CommittedObjectId() const;

private:
    friend class ContentStore;

    struct SentinelTag {};
    explicit FileStream(SentinelTag);

    // Seals the stream and hands the staged bytes to the store. Writes after
    // this point fail; AbortCommit reopens the stream if persisting failed.
    dbfs_common::Status BeginCommit(std::string& out_data);
    void FinishCommit(uint64_t object_id);
    void AbortCommit();

    std::string handle_;
    StreamMode mode_;
    uint64_t estimated_length_;
    uint64_t source_object_id_;
    bool empty_sentinel_ = false;

    mutable std::mutex stream_mutex_;
    std::string buffer_;
    bool committed_ = false;
    uint64_t committed_object_id_ = 0;

    dbfs_common::Status CheckWritableLocked() const;
};

// Random 128-bit handle rendered as a lowercase UUID string.
std::string GenerateHandle();

}  // namespace dbfs_content
