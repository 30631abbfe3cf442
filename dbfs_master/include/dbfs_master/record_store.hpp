#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "dbfs_service/records.pb.h"

namespace dbfs_master {

/**
 * RecordStore: durable home of node records, keyed by node id
 *
 * The tree engine keeps its working copy in memory and writes every
 * mutation through as one RecordBatch. A batch lands completely or not at
 * all; Commit returns false and leaves the store unchanged on failure.
 */
class RecordStore {
public:
    virtual ~RecordStore() = default;

    virtual bool Commit(const dbfs_service::RecordBatch& batch) = 0;
    virtual bool Get(uint64_t id, dbfs_service::NodeRecord& out_record) const = 0;
    virtual std::vector<dbfs_service::NodeRecord> LoadAll() const = 0;
    virtual uint64_t BatchCount() const = 0;
    virtual std::string Name() const = 0;

    // Highest node id any committed batch has written, deleted ones included.
    virtual uint64_t HighestId() const = 0;
};

/**
 * MemoryRecordStore: map-backed store for tests and ephemeral servers
 */
class MemoryRecordStore : public RecordStore {
public:
    bool Commit(const dbfs_service::RecordBatch& batch) override;
    bool Get(uint64_t id, dbfs_service::NodeRecord& out_record) const override;
    std::vector<dbfs_service::NodeRecord> LoadAll() const override;
    uint64_t BatchCount() const override;
    std::string Name() const override { return "memory"; }
    uint64_t HighestId() const override;

    // Makes every following Commit fail, to exercise I/O error paths.
    void SetCommitFailure(bool fail);

private:
    mutable std::mutex records_mutex_;
    std::map<uint64_t, dbfs_service::NodeRecord> records_;
    uint64_t batch_count_ = 0;
    uint64_t highest_id_ = 0;
    bool fail_commits_ = false;
};

/**
 * JournalRecordStore: append-only journal of length-delimited RecordBatch
 * messages
 *
 * - Commit appends one batch and (if sync) fsyncs before acknowledging
 * - A torn trailing batch found on start-up is truncated away
 * - After compact_threshold batches the journal is rewritten as a single
 *   snapshot batch (temp file, fsync, rename)
 */
class JournalRecordStore : public RecordStore {
public:
    JournalRecordStore(const std::string& journal_path, bool sync, uint64_t compact_threshold);

    bool Commit(const dbfs_service::RecordBatch& batch) override;
    bool Get(uint64_t id, dbfs_service::NodeRecord& out_record) const override;
    std::vector<dbfs_service::NodeRecord> LoadAll() const override;
    uint64_t BatchCount() const override;
    std::string Name() const override { return "journal"; }
    uint64_t HighestId() const override;

    /**
     * Rewrite the journal as one snapshot batch
     * @return true if the snapshot replaced the journal
     */
    bool Compact();

    uint64_t JournalBytes() const;

private:
    std::string journal_path_;
    bool sync_;
    uint64_t compact_threshold_;

    mutable std::mutex records_mutex_;
    std::map<uint64_t, dbfs_service::NodeRecord> records_;
    uint64_t batch_count_ = 0;
    uint64_t batches_since_compact_ = 0;
    uint64_t next_sequence_ = 1;
    uint64_t highest_id_ = 0;
    uint64_t journal_bytes_ = 0;

    void Replay();
    bool AppendLocked(const dbfs_service::RecordBatch& batch);
    bool CompactLocked();
    void ApplyLocked(const dbfs_service::RecordBatch& batch);
};

}  // namespace dbfs_master
